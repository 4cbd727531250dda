// SPDX-License-Identifier: Apache-2.0
#include "SamplingConfig.hpp"

#include <core/JsonUtils.hpp>

#include <cmath>

namespace storyloom
{

auto SamplingConfig::validate(std::string_view section) const -> VoidResult
{
    auto const key = [section](std::string_view name) { return json::qualifiedKey(section, name); };

    if (!std::isfinite(temperature) || temperature <= 0.0f)
        return makeConfigError(key("temperature"), std::format("must be > 0 (got {})", temperature));
    if (!std::isfinite(repetitionPenalty) || repetitionPenalty < 0.0f)
        return makeConfigError(key("repetitionPenalty"), std::format("must be >= 0 (got {})", repetitionPenalty));
    if (repetitionWindow < 0)
        return makeConfigError(key("repetitionWindow"), std::format("must be >= 0 (got {})", repetitionWindow));
    if (topK < 0)
        return makeConfigError(key("topK"), std::format("must be >= 0 (got {})", topK));
    if (!std::isfinite(topP) || topP <= 0.0f || topP > 1.0f)
        return makeConfigError(key("topP"), std::format("must be in (0, 1] (got {})", topP));
    if (maxNewTokens < 1)
        return makeConfigError(key("maxNewTokens"), std::format("must be >= 1 (got {})", maxNewTokens));
    if (minLength < 0)
        return makeConfigError(key("minLength"), std::format("must be >= 0 (got {})", minLength));
    return {};
}

} // namespace storyloom
