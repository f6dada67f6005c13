#include "generator/cuid_generator.hpp"

#include <algorithm>
#include <cctype>
#include <utility>
#include "core/logging/logger.hpp"

namespace cuid::generator {

using core::errors::CuidError;
using core::errors::ErrorCategory;

namespace {

bool is_valid_fingerprint(const std::string& text) {
    if (text.size() != encoding::kBlockSize) {
        return false;
    }
    return std::all_of(text.begin(), text.end(), [](const char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0;
    });
}

}  // namespace

CuidGenerator::CuidGenerator(std::string fingerprint,
                             std::shared_ptr<entropy::Clock> clock,
                             std::shared_ptr<entropy::RandomSource> random_source,
                             const std::uint64_t counter)
    : fingerprint_(std::move(fingerprint)),
      clock_(std::move(clock)),
      random_source_(std::move(random_source)),
      counter_(counter) {}

core::errors::Result<std::shared_ptr<CuidGenerator>> CuidGenerator::create(
    GeneratorOptions options) {
    std::string fingerprint;
    if (options.fingerprint.has_value()) {
        if (!is_valid_fingerprint(options.fingerprint.value())) {
            return CuidError{ErrorCategory::Input,
                             "Fingerprint override must be " +
                                 std::to_string(encoding::kBlockSize) +
                                 " base-36 characters: " + options.fingerprint.value(),
                             "invalid_fingerprint"};
        }
        fingerprint = options.fingerprint.value();
        std::transform(fingerprint.begin(), fingerprint.end(), fingerprint.begin(),
                       [](const unsigned char c) { return std::tolower(c); });
    } else {
        if (!options.identity_source) {
            options.identity_source = std::make_shared<fingerprint::SystemIdentitySource>();
        }
        auto computed = fingerprint::compute_fingerprint(*options.identity_source);
        if (core::errors::is_error(computed)) {
            return core::errors::get_error(computed);
        }
        fingerprint = core::errors::get_value(computed);
    }

    if (!options.clock) {
        options.clock = std::make_shared<entropy::SystemClock>();
    }
    if (!options.random_source) {
        options.random_source = std::make_shared<entropy::SystemRandomSource>();
    }

    LOG_DEBUG("CuidGenerator: created with fingerprint " + fingerprint);
    return std::shared_ptr<CuidGenerator>(new CuidGenerator(
        std::move(fingerprint), std::move(options.clock),
        std::move(options.random_source),
        options.initial_counter % encoding::kDiscreteValues));
}

core::errors::Result<std::string> CuidGenerator::generate() {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::uint64_t timestamp = clock_->now_micros() % kTimestampModulus;

    std::uint64_t blocks[2] = {};
    for (auto& block : blocks) {
        auto drawn = random_source_->draw(1, encoding::kDiscreteValues - 1);
        if (core::errors::is_error(drawn)) {
            const auto& err = core::errors::get_error(drawn);
            LOG_ERROR("CuidGenerator: random block failed [" + err.code + "]: " +
                      err.message);
            return err;
        }
        block = core::errors::get_value(drawn);
    }

    std::string id;
    id.reserve(1 + 8 + 4 * encoding::kBlockSize);
    id.push_back(kPrefix);
    id += encoding::to_base36(timestamp);
    id += encoding::encode_block(counter_);
    id += fingerprint_;
    id += encoding::encode_block(blocks[0]);
    id += encoding::encode_block(blocks[1]);
    std::transform(id.begin(), id.end(), id.begin(),
                   [](const unsigned char c) { return std::tolower(c); });

    counter_ = (counter_ + 1) % encoding::kDiscreteValues;
    if (counter_ == 0) {
        LOG_WARN("CuidGenerator: counter wrapped around to 0");
    }
    return id;
}

std::uint64_t CuidGenerator::counter() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counter_;
}

core::errors::Result<GeneratorHandle> create_generator(GeneratorOptions options) {
    return CuidGenerator::create(std::move(options));
}

core::errors::Result<std::string> generate(const GeneratorHandle& handle) {
    if (!handle) {
        return CuidError{ErrorCategory::Input, "Generator handle is null.",
                         "invalid_handle", "Create one with create_generator()."};
    }
    return handle->generate();
}

}  // namespace cuid::generator
