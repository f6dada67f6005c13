#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include "core/errors/cuid_errors.hpp"

namespace cuid::generator {

struct CuidParts {
    std::string timestamp_text;
    std::uint64_t timestamp = 0;
    std::string counter_text;
    std::uint64_t counter = 0;
    std::string fingerprint;
    std::array<std::string, 2> random_texts;
    std::array<std::uint64_t, 2> random_values = {};
};

// Splits an identifier into its fields. The four fixed blocks are taken from
// the right; whatever sits between the prefix and them is the timestamp.
core::errors::Result<CuidParts> decompose(std::string_view id);

}  // namespace cuid::generator
