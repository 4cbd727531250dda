// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace storyloom
{

namespace
{

    auto isSgrParameterString(std::string_view value) -> bool
    {
        if (value.empty())
            return false;
        for (auto const ch: value)
            if ((ch < '0' || ch > '9') && ch != ';')
                return false;
        return true;
    }

    auto validateColor(std::string_view key, std::string_view value) -> VoidResult
    {
        if (!isSgrParameterString(value))
            return makeConfigError(json::qualifiedKey("console.colors", key),
                                   "expected SGR parameters such as \"7;34\"");
        return {};
    }

    auto readModel(const nlohmann::json& root, LlamaModelConfig& model) -> VoidResult
    {
        auto section = json::section(root, "model");
        if (!section)
            return std::unexpected(section.error());
        if (!*section)
            return {};
        auto const& obj = **section;
        if (auto r = json::read(obj, "model", "modelPath", model.modelPath); !r)
            return r;
        if (auto r = json::read(obj, "model", "contextSize", model.contextSize); !r)
            return r;
        if (auto r = json::read(obj, "model", "gpuLayers", model.gpuLayers); !r)
            return r;
        if (auto r = json::read(obj, "model", "forceCpu", model.forceCpu); !r)
            return r;
        if (auto r = json::read(obj, "model", "threads", model.threads); !r)
            return r;
        return {};
    }

    auto readSampling(const nlohmann::json& root, AppConfig& config) -> VoidResult
    {
        auto section = json::section(root, "sampling");
        if (!section)
            return std::unexpected(section.error());
        if (!*section)
            return {};
        auto const& obj = **section;
        auto& sampling = config.sampling;
        if (auto r = json::read(obj, "sampling", "temperature", sampling.temperature); !r)
            return r;
        if (auto r = json::read(obj, "sampling", "repetitionPenalty", sampling.repetitionPenalty); !r)
            return r;
        if (auto r = json::read(obj, "sampling", "repetitionWindow", sampling.repetitionWindow); !r)
            return r;
        if (auto r = json::read(obj, "sampling", "topK", sampling.topK); !r)
            return r;
        if (auto r = json::read(obj, "sampling", "topP", sampling.topP); !r)
            return r;
        if (auto r = json::read(obj, "sampling", "maxNewTokens", sampling.maxNewTokens); !r)
            return r;
        if (auto r = json::read(obj, "sampling", "minLength", sampling.minLength); !r)
            return r;

        return json::read(obj, "sampling", "seed", config.seed);
    }

    auto readActions(const nlohmann::json& root, ActionsConfig& actions) -> VoidResult
    {
        auto section = json::section(root, "actions");
        if (!section)
            return std::unexpected(section.error());
        if (!*section)
            return {};
        auto const& obj = **section;
        if (auto r = json::read(obj, "actions", "diceEnabled", actions.diceEnabled); !r)
            return r;
        if (auto r = json::read(obj, "actions", "suggestionCount", actions.suggestionCount); !r)
            return r;
        if (auto r = json::read(obj, "actions", "suggestionMaxTokens", actions.suggestionMaxTokens); !r)
            return r;
        if (auto r = json::read(obj, "actions", "suggestionTemperature", actions.suggestionTemperature); !r)
            return r;
        if (auto r = json::read(obj, "actions", "suggestionMinLength", actions.suggestionMinLength); !r)
            return r;
        if (auto r = json::read(obj, "actions", "parallelSuggestions", actions.parallelSuggestions); !r)
            return r;
        return {};
    }

    auto readDice(const nlohmann::json& root, DiceConfig& dice) -> VoidResult
    {
        auto section = json::section(root, "dice");
        if (!section)
            return std::unexpected(section.error());
        if (!*section)
            return {};
        auto const& obj = **section;
        if (auto r = json::read(obj, "dice", "criticalFailureMax", dice.policy.criticalFailureMax); !r)
            return r;
        if (auto r = json::read(obj, "dice", "failureMax", dice.policy.failureMax); !r)
            return r;
        if (auto r = json::read(obj, "dice", "successMax", dice.policy.successMax); !r)
            return r;

        auto hints = json::section(obj, "hints");
        if (!hints)
            return makeConfigError("dice.hints", "expected an object");
        if (*hints)
        {
            auto const& h = **hints;
            if (auto r = json::read(h, "dice.hints", "criticalFailure", dice.hints.criticalFailure); !r)
                return r;
            if (auto r = json::read(h, "dice.hints", "failure", dice.hints.failure); !r)
                return r;
            if (auto r = json::read(h, "dice.hints", "success", dice.hints.success); !r)
                return r;
            if (auto r = json::read(h, "dice.hints", "criticalSuccess", dice.hints.criticalSuccess); !r)
                return r;
        }
        return {};
    }

    auto readConsole(const nlohmann::json& root, ConsoleConfig& console) -> VoidResult
    {
        auto section = json::section(root, "console");
        if (!section)
            return std::unexpected(section.error());
        if (!*section)
            return {};
        auto const& obj = **section;
        if (auto r = json::read(obj, "console", "bell", console.bell); !r)
            return r;
        if (auto r = json::read(obj, "console", "wrapWidth", console.wrapWidth); !r)
            return r;

        auto colors = json::section(obj, "colors");
        if (!colors)
            return makeConfigError("console.colors", "expected an object");
        if (*colors)
        {
            auto const& c = **colors;
            auto& out = console.colors;
            if (auto r = json::read(c, "console.colors", "default", out.defaultText); !r)
                return r;
            if (auto r = json::read(c, "console.colors", "error", out.error); !r)
                return r;
            if (auto r = json::read(c, "console.colors", "loading", out.loading); !r)
                return r;
            if (auto r = json::read(c, "console.colors", "message", out.message); !r)
                return r;
            if (auto r = json::read(c, "console.colors", "title", out.title); !r)
                return r;
            if (auto r = json::read(c, "console.colors", "menu", out.menu); !r)
                return r;
            if (auto r = json::read(c, "console.colors", "prompt", out.prompt); !r)
                return r;
            if (auto r = json::read(c, "console.colors", "userText", out.userText); !r)
                return r;
            if (auto r = json::read(c, "console.colors", "aiText", out.aiText); !r)
                return r;
            if (auto r = json::read(c, "console.colors", "suggestion", out.suggestion); !r)
                return r;
            if (auto r = json::read(c, "console.colors", "dice", out.dice); !r)
                return r;
        }
        return {};
    }

    auto readLogLevel(const nlohmann::json& root, log::Level& level) -> VoidResult
    {
        auto name = std::string(log::levelName(level));
        if (auto r = json::read(root, "", "logLevel", name); !r)
            return r;
        auto const parsed = log::parseLevel(name);
        if (!parsed)
            return makeConfigError("logLevel", "expected one of error, warning, info, debug, trace");
        level = *parsed;
        return {};
    }

} // namespace

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/storyloom";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/storyloom";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto validateConfig(const AppConfig& config) -> VoidResult
{
    auto const& model = config.model;
    if (model.contextSize < 16)
        return makeConfigError("model.contextSize", "must be at least 16");
    if (model.gpuLayers < -1)
        return makeConfigError("model.gpuLayers", "must be -1 (auto) or a layer count");
    if (model.threads < 0)
        return makeConfigError("model.threads", "must not be negative");

    if (auto r = config.sampling.validate("sampling"); !r)
        return r;
    if (config.sampling.maxNewTokens >= model.contextSize)
        return makeConfigError("sampling.maxNewTokens", "must be smaller than model.contextSize");

    auto const& actions = config.actions;
    if (actions.suggestionCount < 0)
        return makeConfigError("actions.suggestionCount", "must not be negative");
    if (actions.suggestionMaxTokens < 1)
        return makeConfigError("actions.suggestionMaxTokens", "must be at least 1");
    if (actions.suggestionMaxTokens >= model.contextSize)
        return makeConfigError("actions.suggestionMaxTokens", "must be smaller than model.contextSize");
    if (!std::isfinite(actions.suggestionTemperature) || actions.suggestionTemperature <= 0.0f)
        return makeConfigError("actions.suggestionTemperature", "must be a finite number greater than 0");
    if (actions.suggestionMinLength < 0)
        return makeConfigError("actions.suggestionMinLength", "must not be negative");

    if (auto r = config.dice.policy.validate("dice"); !r)
        return r;
    if (auto r = config.dice.hints.validate("dice.hints"); !r)
        return r;

    if (config.console.wrapWidth < 0)
        return makeConfigError("console.wrapWidth", "must not be negative");
    auto const& colors = config.console.colors;
    if (auto r = validateColor("default", colors.defaultText); !r)
        return r;
    if (auto r = validateColor("error", colors.error); !r)
        return r;
    if (auto r = validateColor("loading", colors.loading); !r)
        return r;
    if (auto r = validateColor("message", colors.message); !r)
        return r;
    if (auto r = validateColor("title", colors.title); !r)
        return r;
    if (auto r = validateColor("menu", colors.menu); !r)
        return r;
    if (auto r = validateColor("prompt", colors.prompt); !r)
        return r;
    if (auto r = validateColor("userText", colors.userText); !r)
        return r;
    if (auto r = validateColor("aiText", colors.aiText); !r)
        return r;
    if (auto r = validateColor("suggestion", colors.suggestion); !r)
        return r;
    if (auto r = validateColor("dice", colors.dice); !r)
        return r;
    return {};
}

auto parseConfig(std::string_view content) -> Result<AppConfig>
{
    auto parseResult = json::parse(content);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::InvalidConfig, "Config root must be a JSON object");

    auto config = AppConfig {};
    if (auto r = readModel(root, config.model); !r)
        return std::unexpected(r.error());
    if (auto r = readSampling(root, config); !r)
        return std::unexpected(r.error());
    if (auto r = readActions(root, config.actions); !r)
        return std::unexpected(r.error());
    if (auto r = readDice(root, config.dice); !r)
        return std::unexpected(r.error());
    if (auto r = readConsole(root, config.console); !r)
        return std::unexpected(r.error());
    if (auto r = readLogLevel(root, config.logLevel); !r)
        return std::unexpected(r.error());
    if (auto r = validateConfig(config); !r)
        return std::unexpected(r.error());
    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    return parseConfig(ss.str());
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    auto model = nlohmann::json::object();
    if (!config.model.modelPath.empty())
        model["modelPath"] = config.model.modelPath;
    model["contextSize"] = config.model.contextSize;
    model["gpuLayers"] = config.model.gpuLayers;
    model["forceCpu"] = config.model.forceCpu;
    model["threads"] = config.model.threads;
    root["model"] = std::move(model);

    auto sampling = nlohmann::json::object();
    sampling["temperature"] = config.sampling.temperature;
    sampling["repetitionPenalty"] = config.sampling.repetitionPenalty;
    sampling["repetitionWindow"] = config.sampling.repetitionWindow;
    sampling["topK"] = config.sampling.topK;
    sampling["topP"] = config.sampling.topP;
    sampling["maxNewTokens"] = config.sampling.maxNewTokens;
    sampling["minLength"] = config.sampling.minLength;
    sampling["seed"] = config.seed;
    root["sampling"] = std::move(sampling);

    auto actions = nlohmann::json::object();
    actions["diceEnabled"] = config.actions.diceEnabled;
    actions["suggestionCount"] = config.actions.suggestionCount;
    actions["suggestionMaxTokens"] = config.actions.suggestionMaxTokens;
    actions["suggestionTemperature"] = config.actions.suggestionTemperature;
    actions["suggestionMinLength"] = config.actions.suggestionMinLength;
    actions["parallelSuggestions"] = config.actions.parallelSuggestions;
    root["actions"] = std::move(actions);

    auto dice = nlohmann::json::object();
    dice["criticalFailureMax"] = config.dice.policy.criticalFailureMax;
    dice["failureMax"] = config.dice.policy.failureMax;
    dice["successMax"] = config.dice.policy.successMax;
    dice["hints"] = {
        { "criticalFailure", config.dice.hints.criticalFailure },
        { "failure", config.dice.hints.failure },
        { "success", config.dice.hints.success },
        { "criticalSuccess", config.dice.hints.criticalSuccess },
    };
    root["dice"] = std::move(dice);

    auto const& colors = config.console.colors;
    auto console = nlohmann::json::object();
    console["bell"] = config.console.bell;
    console["wrapWidth"] = config.console.wrapWidth;
    console["colors"] = {
        { "default", colors.defaultText }, { "error", colors.error },       { "loading", colors.loading },
        { "message", colors.message },     { "title", colors.title },       { "menu", colors.menu },
        { "prompt", colors.prompt },       { "userText", colors.userText }, { "aiText", colors.aiText },
        { "suggestion", colors.suggestion }, { "dice", colors.dice },
    };
    root["console"] = std::move(console);

    root["logLevel"] = std::string(log::levelName(config.logLevel));

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(ErrorCode::IoError,
                             std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

auto suggestionSampling(const AppConfig& config) -> SamplingConfig
{
    auto sampling = config.sampling;
    sampling.temperature = config.actions.suggestionTemperature;
    sampling.maxNewTokens = config.actions.suggestionMaxTokens;
    sampling.minLength = config.actions.suggestionMinLength;
    return sampling;
}

auto makeSessionConfig(const AppConfig& config) -> SessionConfig
{
    auto session = SessionConfig {};
    session.story = config.sampling;
    session.suggestions = suggestionSampling(config);
    session.suggestionCount = config.actions.suggestionCount;
    session.parallelSuggestions = config.actions.parallelSuggestions;
    session.diceEnabled = config.actions.diceEnabled;
    session.dicePolicy = config.dice.policy;
    session.diceHints = config.dice.hints;
    return session;
}

} // namespace storyloom
