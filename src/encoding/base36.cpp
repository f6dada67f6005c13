#include "encoding/base36.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace cuid::encoding {

using core::errors::CuidError;
using core::errors::ErrorCategory;

namespace {

constexpr char kDigits[] = "0123456789abcdefghijklmnopqrstuvwxyz";

int digit_value(const char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'z') return c - 'a' + 10;
    if (c >= 'A' && c <= 'Z') return c - 'A' + 10;
    return -1;
}

}  // namespace

std::string to_base36(std::uint64_t value) {
    if (value == 0) {
        return "0";
    }

    std::string digits;
    while (value > 0) {
        digits.push_back(kDigits[value % kBase]);
        value /= kBase;
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

std::string pad_leading(std::string text, const std::size_t width,
                        const char fill) {
    if (text.size() >= width) {
        return text;
    }
    text.insert(text.begin(), width - text.size(), fill);
    return text;
}

std::string encode_block(const std::uint64_t value, const std::size_t width) {
    return pad_leading(to_base36(value), width);
}

core::errors::Result<std::uint64_t> from_base36(const std::string_view text) {
    if (text.empty()) {
        return CuidError{ErrorCategory::Input, "Cannot decode empty base-36 text.",
                         "invalid_base36"};
    }

    constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
    std::uint64_t value = 0;
    for (const char c : text) {
        const int digit = digit_value(c);
        if (digit < 0) {
            return CuidError{ErrorCategory::Input,
                             "Invalid base-36 character '" + std::string(1, c) + "'",
                             "invalid_base36"};
        }
        const auto d = static_cast<std::uint64_t>(digit);
        if (value > (kMax - d) / kBase) {
            return CuidError{ErrorCategory::Input,
                             "Base-36 value does not fit in 64 bits: " + std::string(text),
                             "base36_overflow"};
        }
        value = value * kBase + d;
    }
    return value;
}

}  // namespace cuid::encoding
