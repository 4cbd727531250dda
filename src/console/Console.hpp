// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <atomic>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>

namespace storyloom::console
{

/// @brief Builds the escape sequence for an ECMA-48 SGR parameter string ("7;34" -> "\033[7;34m").
[[nodiscard]] auto sgrSequence(std::string_view parameters) -> std::string;

/// @brief Word-wraps @p text to @p width columns, keeping existing line breaks.
///
/// Words longer than a line are left unbroken. A width of 0 returns the text unchanged.
[[nodiscard]] auto wrapText(std::string_view text, int width) -> std::string;

/// @brief Line-oriented colored console output and input.
///
/// Output is buffered and written to stdout on flush() and before every read.
class Console
{
  public:
    /// @param wrapWidth Maximum line width for wrapped output, 0 disables wrapping.
    /// @param defaultSgr SGR parameters restored after every colored write.
    explicit Console(int wrapWidth = 0, std::string defaultSgr = "0");

    /// @brief Writes @p text in the color given by @p sgr, without wrapping.
    void write(std::string_view text, std::string_view sgr);

    /// @brief Writes wrapped @p text followed by a newline.
    void writeLine(std::string_view text, std::string_view sgr);

    /// @brief Rings the terminal bell.
    void bell();

    /// @brief Flushes the internal buffer to stdout.
    void flush();

    /// @brief Shows @p prompt and reads one line of input, typed in the @p inputSgr color.
    /// @return The line without its newline, or std::nullopt at end of input.
    [[nodiscard]] auto readLine(std::string_view prompt, std::string_view promptSgr, std::string_view inputSgr)
        -> std::optional<std::string>;

  private:
    std::string _buffer;
    std::string _defaultSgr;
    int _wrapWidth;
};

/// @brief Turns Ctrl-C into a stop request while alive.
///
/// Installs a SIGINT handler that only raises a flag; a watcher thread
/// forwards the flag to the stop source. The previous handler is restored
/// on destruction. Only one instance may be alive at a time.
class CancelOnInterrupt
{
  public:
    explicit CancelOnInterrupt(std::stop_source source);
    ~CancelOnInterrupt();

    CancelOnInterrupt(const CancelOnInterrupt&) = delete;
    auto operator=(const CancelOnInterrupt&) -> CancelOnInterrupt& = delete;
    CancelOnInterrupt(CancelOnInterrupt&&) = delete;
    auto operator=(CancelOnInterrupt&&) -> CancelOnInterrupt& = delete;

  private:
    std::jthread _watcher;
};

} // namespace storyloom::console
