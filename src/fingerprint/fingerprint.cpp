#include "fingerprint/fingerprint.hpp"

#include <cerrno>
#include <cstring>
#include <utility>
#include <unistd.h>
#include "core/logging/logger.hpp"
#include "encoding/base36.hpp"

namespace cuid::fingerprint {

using core::errors::CuidError;
using core::errors::ErrorCategory;

namespace {

constexpr std::uint64_t kOperator = encoding::kBase * encoding::kBase;
constexpr std::size_t kHostNameMax = 256;

}  // namespace

core::errors::Result<HostIdentity> SystemIdentitySource::read() const {
    const pid_t pid = ::getpid();
    if (pid <= 0) {
        return CuidError{ErrorCategory::Environment,
                         "Process id is not available.",
                         "process_id_unavailable"};
    }

    char buffer[kHostNameMax + 1] = {};
    if (::gethostname(buffer, kHostNameMax) != 0) {
        return CuidError{ErrorCategory::Environment,
                         std::string("gethostname failed: ") + std::strerror(errno),
                         "hostname_unavailable"};
    }

    HostIdentity identity;
    identity.process_id = static_cast<std::uint64_t>(pid);
    identity.hostname = buffer;
    if (identity.hostname.empty()) {
        return CuidError{ErrorCategory::Environment, "Hostname is empty.",
                         "hostname_unavailable",
                         "Configure a hostname for this machine."};
    }
    return identity;
}

FixedIdentitySource::FixedIdentitySource(const std::uint64_t process_id,
                                         std::string hostname) {
    identity_.process_id = process_id;
    identity_.hostname = std::move(hostname);
}

core::errors::Result<HostIdentity> FixedIdentitySource::read() const {
    if (identity_.hostname.empty()) {
        return CuidError{ErrorCategory::Environment, "Hostname is empty.",
                         "hostname_unavailable"};
    }
    return identity_;
}

std::string derive_fingerprint(const HostIdentity& identity) {
    const std::uint64_t process_component =
        (identity.process_id % kOperator) * kOperator;

    std::uint64_t char_sum = 0;
    for (const char c : identity.hostname) {
        char_sum += static_cast<unsigned char>(c);
    }
    const std::uint64_t host_component =
        (char_sum + identity.hostname.size() + encoding::kBase) % kOperator;

    return encoding::encode_block(process_component + host_component);
}

core::errors::Result<std::string> compute_fingerprint(const IdentitySource& source) {
    auto identity = source.read();
    if (core::errors::is_error(identity)) {
        const auto& err = core::errors::get_error(identity);
        LOG_ERROR("Fingerprint: cannot read host identity [" + err.code + "]: " +
                  err.message);
        return err;
    }

    const auto& value = core::errors::get_value(identity);
    std::string fingerprint = derive_fingerprint(value);
    LOG_DEBUG("Fingerprint: pid " + std::to_string(value.process_id) + " on host " +
              value.hostname + " -> " + fingerprint);
    return fingerprint;
}

}  // namespace cuid::fingerprint
