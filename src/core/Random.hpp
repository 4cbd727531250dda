// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <memory>
#include <random>

namespace storyloom
{

/// @brief Source of randomness shared by token sampling and dice rolls.
///
/// Production code uses SeededRandom; tests substitute scripted sequences.
/// Instances are not thread-safe. Concurrent consumers take their own stream via fork().
class RandomSource
{
  public:
    virtual ~RandomSource() = default;

    /// @brief Returns a uniformly distributed value in [0, 1).
    [[nodiscard]] virtual auto nextUnit() -> double = 0;

    /// @brief Returns a uniformly distributed integer in [low, high].
    [[nodiscard]] virtual auto nextInt(int low, int high) -> int = 0;

    /// @brief Derives an independent stream from this one.
    ///
    /// Forking advances this source, so forking N streams in a fixed order
    /// is reproducible for a fixed seed.
    [[nodiscard]] virtual auto fork() -> std::unique_ptr<RandomSource> = 0;
};

/// @brief Mersenne twister backed random source.
class SeededRandom final: public RandomSource
{
  public:
    explicit SeededRandom(std::uint64_t seed);

    [[nodiscard]] auto nextUnit() -> double override;
    [[nodiscard]] auto nextInt(int low, int high) -> int override;
    [[nodiscard]] auto fork() -> std::unique_ptr<RandomSource> override;

  private:
    std::mt19937_64 _engine;
};

/// @brief Creates the process random source.
/// @param seed A fixed seed, or a negative value to seed from std::random_device.
[[nodiscard]] auto makeRandomSource(std::int64_t seed) -> std::unique_ptr<RandomSource>;

} // namespace storyloom
