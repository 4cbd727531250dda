// SPDX-License-Identifier: Apache-2.0
#include <chrono>
#include <csignal>
#include <format>
#include <iostream>
#include <utility>

#include <unistd.h>

#include <console/Console.hpp>

namespace storyloom::console
{

namespace
{
    volatile std::sig_atomic_t gInterrupted = 0; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
    struct sigaction gPrevSigint {};             // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

    void sigintHandler(int /*sig*/)
    {
        gInterrupted = 1;
    }

    constexpr auto InterruptPollInterval = std::chrono::milliseconds(50);

    void appendWrappedLine(std::string& out, std::string_view line, std::size_t width)
    {
        auto column = std::size_t { 0 };
        auto pos = std::size_t { 0 };
        while (pos < line.size())
        {
            auto const wordStart = line.find_first_not_of(' ', pos);
            if (wordStart == std::string_view::npos)
                break;
            auto wordEnd = line.find(' ', wordStart);
            if (wordEnd == std::string_view::npos)
                wordEnd = line.size();
            auto const word = line.substr(wordStart, wordEnd - wordStart);

            // Leading indentation is kept as is.
            auto const gap = column == 0 ? (pos == 0 ? wordStart : 0) : std::size_t { 1 };
            if (column > 0 && column + gap + word.size() > width)
            {
                out += '\n';
                column = 0;
            }
            else if (gap > 0)
            {
                out.append(gap, ' ');
                column += gap;
            }

            out.append(word);
            column += word.size();
            pos = wordEnd;
        }
    }
} // namespace

auto sgrSequence(std::string_view parameters) -> std::string
{
    return std::format("\033[{}m", parameters);
}

auto wrapText(std::string_view text, int width) -> std::string
{
    if (width <= 0)
        return std::string(text);

    auto out = std::string {};
    out.reserve(text.size() + text.size() / static_cast<std::size_t>(width));
    auto start = std::size_t { 0 };
    while (true)
    {
        auto const end = text.find('\n', start);
        appendWrappedLine(out, text.substr(start, end - start), static_cast<std::size_t>(width));
        if (end == std::string_view::npos)
            break;
        out += '\n';
        start = end + 1;
    }
    return out;
}

// --- Console ---

Console::Console(int wrapWidth, std::string defaultSgr): _defaultSgr(std::move(defaultSgr)), _wrapWidth(wrapWidth)
{
}

void Console::write(std::string_view text, std::string_view sgr)
{
    _buffer += sgrSequence(sgr);
    _buffer.append(text);
    _buffer += sgrSequence(_defaultSgr);
}

void Console::writeLine(std::string_view text, std::string_view sgr)
{
    write(wrapText(text, _wrapWidth), sgr);
    _buffer += '\n';
}

void Console::bell()
{
    _buffer += '\a';
}

void Console::flush()
{
    if (!_buffer.empty())
    {
        static_cast<void>(::write(STDOUT_FILENO, _buffer.data(), _buffer.size()));
        _buffer.clear();
    }
}

auto Console::readLine(std::string_view prompt, std::string_view promptSgr, std::string_view inputSgr)
    -> std::optional<std::string>
{
    write(prompt, promptSgr);
    _buffer += sgrSequence(inputSgr);
    flush();

    auto line = std::string {};
    auto const ok = static_cast<bool>(std::getline(std::cin, line));

    _buffer += sgrSequence(_defaultSgr);
    flush();

    if (!ok)
        return std::nullopt;
    return line;
}

// --- CancelOnInterrupt ---

CancelOnInterrupt::CancelOnInterrupt(std::stop_source source)
{
    gInterrupted = 0;
    struct sigaction sa {};
    sa.sa_handler = sigintHandler;
    sa.sa_flags = SA_RESTART;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, &gPrevSigint);

    _watcher = std::jthread([source = std::move(source)](const std::stop_token& token) mutable {
        while (!token.stop_requested())
        {
            if (gInterrupted != 0)
            {
                source.request_stop();
                return;
            }
            std::this_thread::sleep_for(InterruptPollInterval);
        }
    });
}

CancelOnInterrupt::~CancelOnInterrupt()
{
    _watcher.request_stop();
    if (_watcher.joinable())
        _watcher.join();
    sigaction(SIGINT, &gPrevSigint, nullptr);
}

} // namespace storyloom::console
