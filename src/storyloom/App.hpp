// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <storyloom/Config.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace storyloom
{

/// @brief A story opening: the context line and the passage the model continues.
struct PromptFile
{
    std::string context;
    std::string prompt;
};

/// @brief Splits a prompt file into its first line (context, newline kept) and the rest.
[[nodiscard]] auto parsePromptFile(std::string_view content) -> PromptFile;

/// @brief Reads and splits a prompt file.
/// @return The prompt or IoError.
[[nodiscard]] auto loadPromptFile(const std::filesystem::path& path) -> Result<PromptFile>;

/// @brief Turns a user-chosen name into a safe prompt file name ("My Story!" -> "My-Story.txt").
/// @return The file name, or std::nullopt if nothing usable remains.
[[nodiscard]] auto promptFileName(std::string_view name) -> std::optional<std::string>;

/// @brief Parses a menu choice.
/// @return The number, or std::nullopt if @p input is not a non-negative integer.
[[nodiscard]] auto parseChoice(std::string_view input) -> std::optional<std::size_t>;

/// @brief Console application: prompt selection, the turn loop, and its commands.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The application configuration.
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Loads the model and prepares the random source.
    /// @return Success or an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Runs the interactive loop until the player quits or input ends.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace storyloom
