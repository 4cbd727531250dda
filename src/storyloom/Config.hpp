// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>
#include <llm/LlamaModel.hpp>
#include <sampling/SamplingConfig.hpp>
#include <story/OutcomeResolver.hpp>
#include <story/StorySession.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace storyloom
{

/// @brief Action suggestion and dice section.
struct ActionsConfig
{
    bool diceEnabled = true;
    int suggestionCount = 5;
    int suggestionMaxTokens = 40;
    float suggestionTemperature = 0.65f;
    int suggestionMinLength = 2; ///< Suggestions shorter than this many characters are dropped.
    bool parallelSuggestions = true;
};

/// @brief Dice section: tier partition and the hint template of each tier.
struct DiceConfig
{
    DicePolicy policy;
    DiceHints hints;
};

/// @brief ECMA-48 SGR parameter strings ("7;34") per kind of console text.
struct ConsoleColors
{
    std::string defaultText = "0";
    std::string error = "7";
    std::string loading = "7;34";
    std::string message = "7;35";
    std::string title = "31";
    std::string menu = "36";
    std::string prompt = "34";
    std::string userText = "36";
    std::string aiText = "37";
    std::string suggestion = "35";
    std::string dice = "33";
};

/// @brief Console section.
struct ConsoleConfig
{
    bool bell = true;   ///< Rings the terminal bell when a response is ready.
    int wrapWidth = 120; ///< 0 disables wrapping.
    ConsoleColors colors;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    LlamaModelConfig model;
    SamplingConfig sampling;
    std::int64_t seed = -1; ///< Negative means a fresh random seed per run.
    ActionsConfig actions;
    DiceConfig dice;
    ConsoleConfig console;
    log::Level logLevel = log::Level::Warning;

    /// @brief Directory of prompt files (set via --prompts CLI flag).
    std::string promptsDir = "prompts";
};

/// @brief Checks every value of @p config against its allowed range.
/// @return Success, or InvalidConfig naming the first offending key as "section.key".
[[nodiscard]] auto validateConfig(const AppConfig& config) -> VoidResult;

/// @brief Parses and validates a configuration document.
/// @param content The JSON text.
/// @return The configuration, with defaults for every absent key, or InvalidConfig.
[[nodiscard]] auto parseConfig(std::string_view content) -> Result<AppConfig>;

/// @brief Loads the application configuration from the default config path.
/// @return The loaded configuration, defaults if there is no file, or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path.
/// $XDG_CONFIG_HOME/storyloom or ~/.config/storyloom
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Sampling used for action suggestions: the story sampling with the actions overrides.
[[nodiscard]] auto suggestionSampling(const AppConfig& config) -> SamplingConfig;

/// @brief Snapshot of the settings a story session runs with.
[[nodiscard]] auto makeSessionConfig(const AppConfig& config) -> SessionConfig;

} // namespace storyloom
