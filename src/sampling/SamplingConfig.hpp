// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <string_view>

namespace storyloom
{

/// @brief Parameters of one decoding run.
///
/// Built once from the configuration file and passed by value; a running
/// decode only ever sees its own copy.
struct SamplingConfig
{
    float temperature = 0.21f;
    float repetitionPenalty = 1.2f; ///< 1.0 disables the penalty.
    int repetitionWindow = 64;      ///< Trailing tokens considered for the penalty, 0 = all.
    int topK = 100;                 ///< 0 disables top-k truncation.
    float topP = 0.85f;             ///< 1.0 disables nucleus truncation.
    int maxNewTokens = 80;
    int minLength = 0; ///< Minimum trimmed length in characters of an accepted output.

    /// @brief Checks every field against its allowed range.
    /// @param section Config section used to qualify the offending key in the error.
    /// @return Success, or InvalidConfig naming the first offending key.
    [[nodiscard]] auto validate(std::string_view section) const -> VoidResult;
};

} // namespace storyloom
