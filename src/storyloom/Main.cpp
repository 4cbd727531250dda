// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <storyloom/App.hpp>
#include <storyloom/Config.hpp>

#include <CLI/CLI.hpp>

#include <cstdint>
#include <optional>

int main(int argc, char** argv)
{
    auto app = CLI::App { "storyloom - Interactive fiction driven by a local language model" };

    auto modelPath = std::string {};
    auto configPath = std::string {};
    auto promptsDir = std::string {};
    auto seed = std::optional<std::int64_t> {};
    auto temperature = std::optional<float> {};
    auto noDice = false;
    auto verbose = false;

    app.add_option("-m,--model", modelPath, "Path to GGUF model file");
    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("-p,--prompts", promptsDir, "Directory of prompt files");
    app.add_option("--seed", seed, "Random seed (-1 = random)");
    app.add_option("--temperature", temperature, "Story sampling temperature");
    app.add_flag("--no-dice", noDice, "Disable d20 action outcomes");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    // Load config
    auto configResult = configPath.empty() ? storyloom::loadConfig() : storyloom::loadConfigFromFile(configPath);

    if (!configResult)
    {
        storyloom::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;
    storyloom::log::setLevel(verbose ? storyloom::log::Level::Debug : config.logLevel);

    // Apply CLI overrides
    if (!modelPath.empty())
        config.model.modelPath = modelPath;
    if (!promptsDir.empty())
        config.promptsDir = promptsDir;
    if (seed)
        config.seed = *seed;
    if (temperature)
        config.sampling.temperature = *temperature;
    if (noDice)
        config.actions.diceEnabled = false;

    if (auto validation = storyloom::validateConfig(config); !validation)
    {
        storyloom::log::error("{}", validation.error().message);
        return 1;
    }

    auto application = storyloom::App(std::move(config));
    auto initResult = application.initialize();
    if (!initResult)
    {
        storyloom::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run();
}
