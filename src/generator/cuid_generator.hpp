#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "core/errors/cuid_errors.hpp"
#include "encoding/base36.hpp"
#include "entropy/sources.hpp"
#include "fingerprint/fingerprint.hpp"

namespace cuid::generator {

constexpr char kPrefix = 'c';
// Timestamps are reduced modulo 36^8 so they never exceed eight digits.
constexpr std::uint64_t kTimestampModulus =
    encoding::kDiscreteValues * encoding::kDiscreteValues;

// Unset members fall back to the system sources.
struct GeneratorOptions {
    std::shared_ptr<fingerprint::IdentitySource> identity_source;
    std::shared_ptr<entropy::Clock> clock;
    std::shared_ptr<entropy::RandomSource> random_source;
    // Skips identity lookup; must be one base-36 block.
    std::optional<std::string> fingerprint;
    // Reduced modulo 36^4.
    std::uint64_t initial_counter = 0;
};

class CuidGenerator {
public:
    static core::errors::Result<std::shared_ptr<CuidGenerator>> create(
        GeneratorOptions options = {});

    CuidGenerator(const CuidGenerator&) = delete;
    CuidGenerator& operator=(const CuidGenerator&) = delete;

    // "c" + timestamp + counter + fingerprint + two random blocks, lowercase.
    // On failure the counter is left untouched.
    core::errors::Result<std::string> generate();

    std::uint64_t counter() const;
    const std::string& fingerprint() const { return fingerprint_; }

private:
    CuidGenerator(std::string fingerprint, std::shared_ptr<entropy::Clock> clock,
                  std::shared_ptr<entropy::RandomSource> random_source,
                  std::uint64_t counter);

    const std::string fingerprint_;
    std::shared_ptr<entropy::Clock> clock_;
    std::shared_ptr<entropy::RandomSource> random_source_;

    mutable std::mutex mutex_;
    std::uint64_t counter_;
};

using GeneratorHandle = std::shared_ptr<CuidGenerator>;

core::errors::Result<GeneratorHandle> create_generator(GeneratorOptions options = {});
core::errors::Result<std::string> generate(const GeneratorHandle& handle);

}  // namespace cuid::generator
