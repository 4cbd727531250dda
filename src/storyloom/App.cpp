// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <console/Console.hpp>
#include <core/Log.hpp>
#include <core/Random.hpp>
#include <llm/LlamaModel.hpp>
#include <story/StorySession.hpp>

#include <algorithm>
#include <charconv>
#include <format>
#include <fstream>
#include <sstream>
#include <stop_token>
#include <utility>
#include <vector>

namespace storyloom
{

namespace
{

    constexpr auto HelpText = std::string_view {
        "Enter actions starting with a verb ex. \"go to the tavern\" or \"attack the orc\".\n"
        "To speak enter 'say \"(thing you want to say)\"' or just \"(thing you want to say)\".\n"
        "Enter a number to pick one of the suggested actions.\n"
        "Press Ctrl-C while the story is being generated to cancel the turn.\n"
        "The following commands can be entered for any action:\n"
        "  \"revert\"   Reverts the last action allowing you to pick a different action.\n"
        "  \"suggest\"  Generates a new set of suggested actions.\n"
        "  \"print\"    Prints the whole story so far.\n"
        "  \"restart\"  Starts a new game.\n"
        "  \"help\"     Shows this message.\n"
        "  \"quit\"     Quits the game.",
    };

    /// @brief Outcome of the turn loop of one story.
    enum class StoryEnd
    {
        Restart,
        Quit,
    };

    auto isAlnum(char ch) -> bool
    {
        return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9');
    }

    /// @brief Menu entries of a prompts directory: subdirectories and .txt files, sorted by name.
    auto listPromptEntries(const std::filesystem::path& dir) -> Result<std::vector<std::filesystem::directory_entry>>
    {
        auto ec = std::error_code {};
        auto it = std::filesystem::directory_iterator(dir, ec);
        if (ec)
            return makeError(ErrorCode::IoError,
                             std::format("Cannot read prompts directory '{}': {}", dir.string(), ec.message()));

        auto entries = std::vector<std::filesystem::directory_entry> {};
        for (const auto& entry: it)
        {
            if (entry.is_directory() || entry.path().extension() == ".txt")
                entries.push_back(entry);
        }
        std::ranges::sort(entries, {}, [](const auto& entry) { return entry.path().filename().string(); });
        return entries;
    }

} // namespace

auto parsePromptFile(std::string_view content) -> PromptFile
{
    auto const newline = content.find('\n');
    if (newline == std::string_view::npos)
        return PromptFile { .context = std::string(content) + "\n", .prompt = {} };
    return PromptFile {
        .context = std::string(content.substr(0, newline + 1)),
        .prompt = std::string(content.substr(newline + 1)),
    };
}

auto loadPromptFile(const std::filesystem::path& path) -> Result<PromptFile>
{
    auto file = std::ifstream(path);
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot open prompt file: {}", path.string()));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    return parsePromptFile(ss.str());
}

auto promptFileName(std::string_view name) -> std::optional<std::string>
{
    auto result = std::string {};
    for (auto const ch: name)
    {
        if (isAlnum(ch) || ch == '_' || ch == '-')
            result += ch;
        else if (!result.empty() && result.back() != '-')
            result += '-';
    }
    while (!result.empty() && result.front() == '-')
        result.erase(result.begin());
    while (!result.empty() && result.back() == '-')
        result.pop_back();
    if (result.empty())
        return std::nullopt;
    return result + ".txt";
}

auto parseChoice(std::string_view input) -> std::optional<std::size_t>
{
    while (!input.empty() && input.front() == ' ')
        input.remove_prefix(1);
    while (!input.empty() && input.back() == ' ')
        input.remove_suffix(1);
    if (input.empty())
        return std::nullopt;

    auto value = std::size_t { 0 };
    auto const [ptr, ec] = std::from_chars(input.data(), input.data() + input.size(), value);
    if (ec != std::errc {} || ptr != input.data() + input.size())
        return std::nullopt;
    return value;
}

struct App::Impl
{
    AppConfig config;
    console::Console console;
    LlamaModel model;
    std::unique_ptr<RandomSource> random;
    std::unique_ptr<StorySession> session;
    SuggestionSet suggestions;

    explicit Impl(AppConfig cfg):
        config(std::move(cfg)), console(config.console.wrapWidth, config.console.colors.defaultText)
    {
    }

    [[nodiscard]] auto colors() const -> const ConsoleColors& { return config.console.colors; }

    void print(std::string_view text, std::string_view sgr)
    {
        console.writeLine(text, sgr);
        console.flush();
    }

    void printError(std::string_view text) { print(text, colors().error); }

    /// @brief Asks for a number in [0, max]; blank input picks @p defaultChoice.
    /// @return The choice, or std::nullopt at end of input.
    auto readNumber(std::size_t max, std::size_t defaultChoice = 0) -> std::optional<std::size_t>
    {
        while (true)
        {
            auto line = console.readLine(std::format("Enter a number from above (default {}): ", defaultChoice),
                                         colors().prompt,
                                         colors().userText);
            if (!line)
                return std::nullopt;
            if (line->empty())
                return defaultChoice;
            if (auto const choice = parseChoice(*line); choice && *choice <= max)
                return choice;
            printError("Invalid choice.");
        }
    }

    /// @brief Walks the prompts directory tree until a prompt file is picked.
    auto selectPromptFile() -> std::optional<PromptFile>
    {
        auto dir = std::filesystem::path(config.promptsDir);
        while (true)
        {
            auto entries = listPromptEntries(dir);
            if (!entries)
            {
                printError(entries.error().message);
                return std::nullopt;
            }
            if (entries->empty())
            {
                printError(std::format("No prompts found in {}", dir.string()));
                return std::nullopt;
            }

            for (auto i = std::size_t { 0 }; i < entries->size(); ++i)
            {
                auto const& path = (*entries)[i].path();
                auto const name = (*entries)[i].is_directory() ? path.filename().string() + "/" : path.stem().string();
                print(std::format("{}: {}", i, name), colors().menu);
            }

            auto const choice = readNumber(entries->size() - 1);
            if (!choice)
                return std::nullopt;

            auto const& picked = (*entries)[*choice];
            if (picked.is_directory())
            {
                dir = picked.path();
                continue;
            }

            auto prompt = loadPromptFile(picked.path());
            if (!prompt)
            {
                printError(prompt.error().message);
                return std::nullopt;
            }
            return std::move(*prompt);
        }
    }

    /// @brief Reads a custom context and prompt, optionally saving them as a prompt file.
    auto readCustomPrompt() -> std::optional<PromptFile>
    {
        auto context = console.readLine("Context> ", colors().prompt, colors().userText);
        if (!context)
            return std::nullopt;
        auto prompt = console.readLine("Prompt> ", colors().prompt, colors().userText);
        if (!prompt)
            return std::nullopt;
        auto name = console.readLine(
            "Name to save prompt as? (Leave blank for no save): ", colors().prompt, colors().userText);
        if (!name)
            return std::nullopt;

        if (auto const fileName = promptFileName(*name))
        {
            auto const path = std::filesystem::path(config.promptsDir) / *fileName;
            auto file = std::ofstream(path);
            if (file.is_open())
                file << *context << '\n' << *prompt << '\n';
            else
                printError(std::format("Cannot save prompt to {}", path.string()));
        }

        return PromptFile { .context = *context + "\n", .prompt = std::move(*prompt) };
    }

    auto choosePrompt() -> std::optional<PromptFile>
    {
        print("0: Pick Prompt From File (Default if you type nothing)\n1: Write Custom Prompt", colors().menu);
        auto const choice = readNumber(1);
        if (!choice)
            return std::nullopt;
        if (*choice == 1)
            return readCustomPrompt();
        return selectPromptFile();
    }

    void ringBell()
    {
        if (config.console.bell)
        {
            console.bell();
            console.flush();
        }
    }

    void refreshSuggestions()
    {
        suggestions = {};
        if (config.actions.suggestionCount <= 0)
            return;

        print("Generating suggestions...", colors().loading);
        auto stop = std::stop_source {};
        auto const guard = console::CancelOnInterrupt(stop);
        suggestions = session->suggestActions(stop.get_token());

        if (suggestions.cancelled)
            print("Suggestions cancelled.", colors().message);
        if (suggestions.shortfall() > 0)
            log::info("Generated {} of {} suggestions ({} failed)",
                      suggestions.candidates.size(),
                      suggestions.requested,
                      suggestions.failed);

        for (auto i = std::size_t { 0 }; i < suggestions.candidates.size(); ++i)
            print(std::format("{}> {}", i, suggestions.candidates[i].text), colors().suggestion);
    }

    void printOutcome(const TurnResult& turn)
    {
        if (turn.outcome)
            print(std::format("You roll a {} ({})", turn.outcome->roll, diceTierName(turn.outcome->tier)),
                  colors().dice);
    }

    /// @brief Runs one action through the session and presents the result.
    /// @return The story end if the story is over, std::nullopt to keep playing.
    auto playAction(std::string_view action) -> std::optional<StoryEnd>
    {
        auto stop = std::stop_source {};
        auto turn = [&] {
            auto const guard = console::CancelOnInterrupt(stop);
            return session->act(action, stop.get_token());
        }();

        if (!turn)
        {
            printError(std::format("Generation failed: {}", turn.error().message));
            return std::nullopt;
        }

        printOutcome(*turn);
        switch (turn->status)
        {
            case TurnStatus::Cancelled: print("Turn cancelled.", colors().message); return std::nullopt;
            case TurnStatus::Empty:
                printError("The story could not be continued. Try a different action.");
                return std::nullopt;
            case TurnStatus::Looping:
                printError("Woops that action caused the model to start looping. Try a different action to prevent that.");
                return std::nullopt;
            case TurnStatus::Won:
                print(turn->text, colors().aiText);
                print("CONGRATS YOU WIN", colors().message);
                return StoryEnd::Restart;
            case TurnStatus::Died: {
                print(turn->text, colors().aiText);
                printError("YOU DIED. GAME OVER");
                print("\nOptions:\n0) Start a new game\n1) \"I'm not dead yet!\" (If you didn't actually die)",
                      colors().menu);
                auto const choice = readNumber(1);
                if (!choice)
                    return StoryEnd::Quit;
                if (*choice == 0)
                    return StoryEnd::Restart;
                print("Sorry about that...where were we?", colors().message);
                print(turn->text, colors().aiText);
                return std::nullopt;
            }
            case TurnStatus::Continued: print(turn->text, colors().aiText); return std::nullopt;
        }
        return std::nullopt;
    }

    auto playStory(const PromptFile& prompt) -> StoryEnd
    {
        print(HelpText, colors().message);
        print("\nGenerating story...", colors().loading);

        auto stop = std::stop_source {};
        auto opening = [&] {
            auto const guard = console::CancelOnInterrupt(stop);
            return session->start(prompt.context, prompt.prompt, stop.get_token());
        }();

        if (!opening)
        {
            printError(std::format("Generation failed: {}", opening.error().message));
            return StoryEnd::Restart;
        }
        if (opening->status == TurnStatus::Cancelled)
        {
            print("Story start cancelled.", colors().message);
            return StoryEnd::Restart;
        }

        print(std::format("\n{}", opening->text), colors().aiText);
        refreshSuggestions();

        while (true)
        {
            ringBell();
            auto input = console.readLine("> ", colors().prompt, colors().userText);
            if (!input)
                return StoryEnd::Quit;
            auto const& action = *input;

            if (action == "restart")
                return StoryEnd::Restart;
            if (action == "quit")
                return StoryEnd::Quit;
            if (action == "help")
            {
                print(HelpText, colors().message);
                continue;
            }
            if (action == "print")
            {
                print("\nPRINTING\n", colors().message);
                print(session->story().toString(), colors().aiText);
                continue;
            }
            if (action == "revert")
            {
                if (!session->revert())
                {
                    printError("You can't go back any farther.");
                    continue;
                }
                print("Last action reverted.", colors().message);
                print(session->story().latestResult(), colors().aiText);
                refreshSuggestions();
                continue;
            }
            if (action == "suggest")
            {
                refreshSuggestions();
                continue;
            }

            auto chosen = action;
            if (auto const index = parseChoice(action))
            {
                if (*index >= suggestions.candidates.size())
                {
                    printError(std::format("There is no suggestion {}.", *index));
                    continue;
                }
                chosen = suggestions.candidates[*index].text;
                print(std::format("> {}", chosen), colors().userText);
            }

            if (auto const end = playAction(chosen))
                return *end;
            refreshSuggestions();
        }
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
}

App::~App() = default;

auto App::initialize() -> VoidResult
{
    auto modelConfig = _impl->config.model;
    if (modelConfig.modelPath.empty())
        return makeConfigError("model.modelPath", "no model given; set it in the config file or pass --model");

    _impl->print("\nInitializing storyloom! (This might take a few minutes)\n", _impl->colors().loading);

    auto const& actions = _impl->config.actions;
    if (actions.parallelSuggestions && actions.suggestionCount > 1)
    {
        // One KV sequence per suggestion run plus the narration.
        modelConfig.sequences = actions.suggestionCount + 1;
        modelConfig.sequenceTokens = actions.suggestionMaxTokens;
    }

    auto loadResult = _impl->model.load(modelConfig);
    if (!loadResult)
        return loadResult;

    _impl->random = makeRandomSource(_impl->config.seed);
    _impl->session = std::make_unique<StorySession>(_impl->model, makeSessionConfig(_impl->config), *_impl->random);
    return {};
}

auto App::run() -> int
{
    if (!_impl->session)
    {
        log::error("App::run() called before a successful initialize()");
        return 1;
    }

    _impl->print("storyloom", _impl->colors().title);

    while (true)
    {
        _impl->print("\n", _impl->colors().defaultText);
        auto prompt = _impl->choosePrompt();
        if (!prompt)
            return 0;

        if (_impl->playStory(*prompt) == StoryEnd::Quit)
            return 0;
    }
}

} // namespace storyloom
