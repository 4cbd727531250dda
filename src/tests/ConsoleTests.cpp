// SPDX-License-Identifier: Apache-2.0
#include <console/Console.hpp>
#include <storyloom/App.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <stop_token>
#include <thread>

#include <signal.h>

using namespace storyloom;

namespace
{

volatile std::sig_atomic_t gCountedInterrupts = 0; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

void countInterrupt(int /*sig*/)
{
    gCountedInterrupts = gCountedInterrupts + 1;
}

/// @brief Installs countInterrupt for SIGINT and restores the previous handler on exit.
class CountingSigint
{
  public:
    CountingSigint()
    {
        gCountedInterrupts = 0;
        struct sigaction sa {};
        sa.sa_handler = countInterrupt;
        sigemptyset(&sa.sa_mask);
        sigaction(SIGINT, &sa, &_previous);
    }

    ~CountingSigint() { sigaction(SIGINT, &_previous, nullptr); }

    CountingSigint(const CountingSigint&) = delete;
    auto operator=(const CountingSigint&) -> CountingSigint& = delete;

  private:
    struct sigaction _previous {};
};

auto waitForStop(const std::stop_source& source) -> bool
{
    auto const deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!source.stop_requested() && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    return source.stop_requested();
}

} // namespace

TEST_CASE("sgrSequence wraps the parameters", "[console]")
{
    CHECK(console::sgrSequence("7;34") == "\033[7;34m");
    CHECK(console::sgrSequence("0") == "\033[0m");
}

TEST_CASE("wrapText breaks lines at word boundaries", "[console]")
{
    CHECK(console::wrapText("the quick brown fox jumps", 10) == "the quick\nbrown fox\njumps");
    CHECK(console::wrapText("one\ntwo three", 5) == "one\ntwo\nthree");
    CHECK(console::wrapText("  indented text", 40) == "  indented text");
    CHECK(console::wrapText("unbreakable-word here", 5) == "unbreakable-word\nhere");
}

TEST_CASE("wrapText with width 0 returns the text unchanged", "[console]")
{
    CHECK(console::wrapText("a  b\n\nc", 0) == "a  b\n\nc");
}

TEST_CASE("parsePromptFile splits context and prompt", "[console]")
{
    auto const prompt = parsePromptFile("You are a knight.\nYou stand at the gate.\nIt is night.\n");
    CHECK(prompt.context == "You are a knight.\n");
    CHECK(prompt.prompt == "You stand at the gate.\nIt is night.\n");

    auto const single = parsePromptFile("Only context");
    CHECK(single.context == "Only context\n");
    CHECK(single.prompt.empty());
}

TEST_CASE("loadPromptFile reads a prompt from disk", "[console]")
{
    auto const path = std::filesystem::temp_directory_path() / "storyloom_test_prompt.txt";
    {
        auto file = std::ofstream(path);
        file << "Context line\nPrompt line\n";
    }

    auto const prompt = loadPromptFile(path);
    REQUIRE(prompt.has_value());
    CHECK(prompt->context == "Context line\n");
    CHECK(prompt->prompt == "Prompt line\n");
    std::filesystem::remove(path);

    auto const missing = loadPromptFile("/nonexistent/prompt.txt");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == ErrorCode::IoError);
}

TEST_CASE("promptFileName keeps only safe characters", "[console]")
{
    CHECK(promptFileName("My Story!") == "My-Story.txt");
    CHECK(promptFileName("--knight_tale--") == "knight_tale.txt");
    CHECK(promptFileName("a / b") == "a-b.txt");
    CHECK_FALSE(promptFileName("").has_value());
    CHECK_FALSE(promptFileName("!!!").has_value());
}

TEST_CASE("parseChoice accepts non-negative integers only", "[console]")
{
    CHECK(parseChoice("3") == 3u);
    CHECK(parseChoice(" 0 ") == 0u);
    CHECK_FALSE(parseChoice("").has_value());
    CHECK_FALSE(parseChoice("two").has_value());
    CHECK_FALSE(parseChoice("-1").has_value());
    CHECK_FALSE(parseChoice("3 ways").has_value());
}

TEST_CASE("CancelOnInterrupt turns Ctrl-C into a stop request", "[console]")
{
    auto const counting = CountingSigint();
    auto source = std::stop_source {};
    {
        auto const guard = console::CancelOnInterrupt(source);
        REQUIRE(std::raise(SIGINT) == 0);
        CHECK(waitForStop(source));
    }
    CHECK(gCountedInterrupts == 0);

    // The handler that was installed before the guard is back.
    REQUIRE(std::raise(SIGINT) == 0);
    CHECK(gCountedInterrupts == 1);
}

TEST_CASE("CancelOnInterrupt leaves the stop source alone without Ctrl-C", "[console]")
{
    auto const counting = CountingSigint();
    auto source = std::stop_source {};
    {
        auto const guard = console::CancelOnInterrupt(source);
        std::this_thread::sleep_for(std::chrono::milliseconds(120));
    }
    CHECK_FALSE(source.stop_requested());
}
