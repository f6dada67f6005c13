#pragma once

#include <cstdint>
#include <string>
#include "core/errors/cuid_errors.hpp"

namespace cuid::fingerprint {

struct HostIdentity {
    std::uint64_t process_id = 0;
    std::string hostname;
};

// Where the process/host identity comes from. Tests inject fixed values.
class IdentitySource {
public:
    virtual ~IdentitySource() = default;
    virtual core::errors::Result<HostIdentity> read() const = 0;
};

// getpid() + gethostname().
class SystemIdentitySource final : public IdentitySource {
public:
    core::errors::Result<HostIdentity> read() const override;
};

class FixedIdentitySource final : public IdentitySource {
public:
    FixedIdentitySource(std::uint64_t process_id, std::string hostname);
    core::errors::Result<HostIdentity> read() const override;

private:
    HostIdentity identity_;
};

// (pid mod 36^2) * 36^2 + (byte sum + length + 36) mod 36^2, base-36 and
// padded to one block.
std::string derive_fingerprint(const HostIdentity& identity);

core::errors::Result<std::string> compute_fingerprint(const IdentitySource& source);

}  // namespace cuid::fingerprint
