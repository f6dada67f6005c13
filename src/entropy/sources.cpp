#include "entropy/sources.hpp"

#include <chrono>
#include <exception>
#include <string>

namespace cuid::entropy {

using core::errors::CuidError;
using core::errors::ErrorCategory;

std::uint64_t SystemClock::now_micros() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    const auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(now).count();
    return static_cast<std::uint64_t>(micros);
}

core::errors::Result<std::uint64_t> SystemRandomSource::draw(
    const std::uint64_t low, const std::uint64_t high) {
    if (low > high) {
        return CuidError{ErrorCategory::Internal, "Empty random range.",
                         "invalid_random_range"};
    }

    // std::random_device reports platform failures by throwing.
    try {
        if (!engine_.has_value()) {
            std::random_device rd;
            engine_.emplace(rd());
        }
        std::uniform_int_distribution<std::uint64_t> dis(low, high);
        return dis(*engine_);
    } catch (const std::exception& ex) {
        return CuidError{ErrorCategory::Entropy,
                         std::string("Random device failed: ") + ex.what(),
                         "random_source_failed"};
    }
}

ScriptedRandomSource::ScriptedRandomSource(std::vector<std::uint64_t> values)
    : values_(values.begin(), values.end()) {}

core::errors::Result<std::uint64_t> ScriptedRandomSource::draw(
    const std::uint64_t low, const std::uint64_t high) {
    if (values_.empty()) {
        return CuidError{ErrorCategory::Entropy, "Scripted random source exhausted.",
                         "random_source_failed"};
    }

    const std::uint64_t value = values_.front();
    if (value < low || value > high) {
        return CuidError{ErrorCategory::Entropy,
                         "Scripted value " + std::to_string(value) + " outside [" +
                             std::to_string(low) + ", " + std::to_string(high) + "]",
                         "random_source_failed"};
    }
    values_.pop_front();
    return value;
}

}  // namespace cuid::entropy
