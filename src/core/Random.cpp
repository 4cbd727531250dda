// SPDX-License-Identifier: Apache-2.0
#include "Random.hpp"

#include <core/Log.hpp>

namespace storyloom
{

SeededRandom::SeededRandom(std::uint64_t seed): _engine(seed)
{
}

auto SeededRandom::nextUnit() -> double
{
    auto dist = std::uniform_real_distribution<double>(0.0, 1.0);
    return dist(_engine);
}

auto SeededRandom::nextInt(int low, int high) -> int
{
    auto dist = std::uniform_int_distribution<int>(low, high);
    return dist(_engine);
}

auto SeededRandom::fork() -> std::unique_ptr<RandomSource>
{
    return std::make_unique<SeededRandom>(_engine());
}

auto makeRandomSource(std::int64_t seed) -> std::unique_ptr<RandomSource>
{
    if (seed >= 0)
        return std::make_unique<SeededRandom>(static_cast<std::uint64_t>(seed));

    auto device = std::random_device {};
    auto const generated = (static_cast<std::uint64_t>(device()) << 32) | device();
    log::debug("Random seed: {}", generated);
    return std::make_unique<SeededRandom>(generated);
}

} // namespace storyloom
