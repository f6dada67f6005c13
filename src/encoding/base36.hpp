#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include "core/errors/cuid_errors.hpp"

namespace cuid::encoding {

constexpr std::uint64_t kBase = 36;
constexpr std::size_t kBlockSize = 4;
// Number of values a single block can hold: 36^4.
constexpr std::uint64_t kDiscreteValues = kBase * kBase * kBase * kBase;

// Lowercase base-36 digits of value; "0" for zero.
std::string to_base36(std::uint64_t value);

// Left-pads text with fill up to width. Longer text is returned unchanged.
std::string pad_leading(std::string text, std::size_t width, char fill = '0');

std::string encode_block(std::uint64_t value, std::size_t width = kBlockSize);

// Case-insensitive decode. Rejects empty input, non base-36 characters and
// values that do not fit in 64 bits.
core::errors::Result<std::uint64_t> from_base36(std::string_view text);

}  // namespace cuid::encoding
