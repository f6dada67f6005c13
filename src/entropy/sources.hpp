#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <random>
#include <vector>
#include "core/errors/cuid_errors.hpp"

namespace cuid::entropy {

// Wall-clock time in microseconds since the Unix epoch.
class Clock {
public:
    virtual ~Clock() = default;
    virtual std::uint64_t now_micros() = 0;
};

class SystemClock final : public Clock {
public:
    std::uint64_t now_micros() override;
};

class FixedClock final : public Clock {
public:
    explicit FixedClock(std::uint64_t micros) : micros_(micros) {}
    std::uint64_t now_micros() override { return micros_; }

private:
    std::uint64_t micros_;
};

// Uniform integer draws in [low, high], both inclusive.
class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual core::errors::Result<std::uint64_t> draw(std::uint64_t low,
                                                     std::uint64_t high) = 0;
};

// Mersenne Twister seeded from std::random_device on first use. Not
// cryptographically secure. Not thread-safe; callers serialize access.
class SystemRandomSource final : public RandomSource {
public:
    core::errors::Result<std::uint64_t> draw(std::uint64_t low,
                                             std::uint64_t high) override;

private:
    std::optional<std::mt19937_64> engine_;
};

// Replays a fixed list of values, then fails with an entropy error.
class ScriptedRandomSource final : public RandomSource {
public:
    explicit ScriptedRandomSource(std::vector<std::uint64_t> values);
    core::errors::Result<std::uint64_t> draw(std::uint64_t low,
                                             std::uint64_t high) override;
    std::size_t remaining() const { return values_.size(); }

private:
    std::deque<std::uint64_t> values_;
};

}  // namespace cuid::entropy
