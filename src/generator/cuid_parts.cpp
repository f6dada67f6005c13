#include "generator/cuid_parts.hpp"

#include "encoding/base36.hpp"
#include "generator/cuid_generator.hpp"

namespace cuid::generator {

using core::errors::CuidError;
using core::errors::ErrorCategory;

namespace {

constexpr std::size_t kFixedTail = 4 * encoding::kBlockSize;
constexpr std::size_t kMaxTimestampDigits = 8;
constexpr std::size_t kMinLength = 1 + 1 + kFixedTail;
constexpr std::size_t kMaxLength = 1 + kMaxTimestampDigits + kFixedTail;

CuidError invalid(const std::string& message) {
    return CuidError{ErrorCategory::Input, message, "invalid_cuid",
                     "Expected 'c' followed by 17 to 24 characters of [0-9a-z]."};
}

}  // namespace

core::errors::Result<CuidParts> decompose(const std::string_view id) {
    if (id.size() < kMinLength || id.size() > kMaxLength) {
        return invalid("Identifier has invalid length " + std::to_string(id.size()));
    }
    if (id.front() != kPrefix) {
        return invalid("Identifier must start with 'c'");
    }
    for (const char c : id) {
        const bool digit = c >= '0' && c <= '9';
        const bool lower = c >= 'a' && c <= 'z';
        if (!digit && !lower) {
            return invalid("Identifier contains invalid character '" +
                           std::string(1, c) + "'");
        }
    }

    const std::size_t timestamp_len = id.size() - 1 - kFixedTail;
    std::size_t pos = 1;
    auto take = [&id, &pos](const std::size_t len) {
        const std::string_view field = id.substr(pos, len);
        pos += len;
        return std::string(field);
    };

    CuidParts parts;
    parts.timestamp_text = take(timestamp_len);
    parts.counter_text = take(encoding::kBlockSize);
    parts.fingerprint = take(encoding::kBlockSize);
    parts.random_texts[0] = take(encoding::kBlockSize);
    parts.random_texts[1] = take(encoding::kBlockSize);

    auto timestamp = encoding::from_base36(parts.timestamp_text);
    if (core::errors::is_error(timestamp)) {
        return core::errors::get_error(timestamp);
    }
    parts.timestamp = core::errors::get_value(timestamp);

    auto counter = encoding::from_base36(parts.counter_text);
    if (core::errors::is_error(counter)) {
        return core::errors::get_error(counter);
    }
    parts.counter = core::errors::get_value(counter);

    for (std::size_t i = 0; i < parts.random_texts.size(); ++i) {
        auto value = encoding::from_base36(parts.random_texts[i]);
        if (core::errors::is_error(value)) {
            return core::errors::get_error(value);
        }
        parts.random_values[i] = core::errors::get_value(value);
    }

    return parts;
}

}  // namespace cuid::generator
