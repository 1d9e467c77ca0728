#include "EvolveRunner.h"
#include "core/ConfigLoader.h"
#include "core/LoggingChannels.h"
#include "core/evolution/BinaryGenotype.h"
#include "core/evolution/EngineConfig.h"
#include <args.hxx>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include <random>
#include <spdlog/spdlog.h>
#include <string>

using namespace GenEvo;

namespace {

std::string getExamplesHelp()
{
    return "Examples:\n"
           "  genevo-cli onemax\n"
           "  genevo-cli onemax --generations 200 --seed 7 --print-every 50\n"
           "  genevo-cli onemax --config onemax.json --log-channels engine:debug\n"
           "  genevo-cli onemax --example\n"
           "  genevo-cli onemax --config-dir ./experiments\n"
           "  genevo-cli random --length 64\n";
}

Result<EngineConfig, std::string> resolveConfig(const std::string& configArg)
{
    if (configArg.empty()) {
        // Optional: pick up onemax.json from the standard search paths.
        auto found = ConfigLoader::load<EngineConfig>("onemax.json");
        if (found.isValue()) {
            return found;
        }
        SLOG_DEBUG("No onemax.json found, using defaults");
        return Result<EngineConfig, std::string>::okay(EngineConfig{});
    }

    // A path that exists is read directly, anything else goes through the search paths.
    if (std::filesystem::exists(configArg)) {
        return ConfigLoader::loadFromPath<EngineConfig>(configArg);
    }
    return ConfigLoader::load<EngineConfig>(configArg);
}

} // namespace

int main(int argc, char** argv)
{
    // Console logging goes to stderr so stdout carries only results.
    LoggingChannels::initialize(spdlog::level::info, spdlog::level::debug, "cli", true);

    args::ArgumentParser parser(
        "genevo CLI", "Run generational genetic algorithm experiments.\n\n" + getExamplesHelp());

    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::Flag verbose(parser, "verbose", "Enable debug logging", { 'v', "verbose" });
    args::Flag example(
        parser, "example", "Print default JSON config for the command and exit", { "example" });
    args::ValueFlag<std::string> configPath(
        parser,
        "config",
        "OneMax: JSON config file (path or name in config dirs)",
        { 'c', "config" });
    args::ValueFlag<int> generations(
        parser, "generations", "OneMax: override maxGenerations", { 'g', "generations" });
    args::ValueFlag<uint32_t> seed(
        parser, "seed", "OneMax: override RNG seed (0 = random)", { 's', "seed" });
    args::ValueFlag<int> printEvery(
        parser,
        "print-every",
        "OneMax: print the full population every N generations (default: never)",
        { "print-every" },
        0);
    args::Flag quiet(parser, "quiet", "OneMax: suppress per-generation progress", { 'q', "quiet" });
    args::ValueFlag<std::string> configDir(
        parser, "config-dir", "Directory searched first for config files", { "config-dir" });
    args::ValueFlag<std::string> logChannels(
        parser,
        "log-channels",
        "Channel levels, e.g. 'engine:debug,selection:trace' or '*:off'",
        { "log-channels" });
    args::ValueFlag<int> length(
        parser, "length", "Random: genotype length (default: 32)", { 'l', "length" }, 32);

    args::Positional<std::string> command(parser, "command", "Command: 'onemax' or 'random'");

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return 0;
    }
    catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    if (configDir) {
        ConfigLoader::setConfigDir(args::get(configDir));
    }

    // Optional logging.json replaces the built-in sink and channel setup.
    auto loggingConfig = ConfigLoader::load<LoggingConfig>("logging.json");
    if (loggingConfig.isValue()) {
        LoggingConfig config = loggingConfig.value();
        config.consoleToStderr = true;
        LoggingChannels::configure(config, "cli");
    }
    else if (ConfigLoader::findConfigFile("logging.json").has_value()) {
        std::cerr << "Ignoring logging.json: " << loggingConfig.errorValue() << std::endl;
    }

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        LoggingChannels::configureFromString("*:debug");
    }
    if (logChannels) {
        LoggingChannels::configureFromString(args::get(logChannels));
    }

    if (!command) {
        std::cerr << "Error: command is required ('onemax' or 'random')\n\n";
        std::cerr << parser;
        return 1;
    }

    const std::string commandName = args::get(command);

    if (commandName == "random") {
        const int bits = args::get(length);
        if (bits < 0) {
            std::cerr << "Error: --length must not be negative" << std::endl;
            return 1;
        }
        std::mt19937 rng(seed && args::get(seed) != 0 ? args::get(seed) : std::random_device{}());
        std::cout << BinaryGenotype::random(static_cast<size_t>(bits), rng) << std::endl;
        return 0;
    }

    if (commandName != "onemax") {
        std::cerr << "Error: unknown command '" << commandName << "'\n\n";
        std::cerr << parser;
        return 1;
    }

    if (example) {
        std::cout << nlohmann::json(EngineConfig{}).dump(2) << std::endl;
        return 0;
    }

    auto configResult = resolveConfig(configPath ? args::get(configPath) : "");
    if (configResult.isError()) {
        std::cerr << "Error loading config: " << configResult.errorValue() << std::endl;
        return 1;
    }

    Client::EvolveOptions options;
    options.printEvery = args::get(printEvery);
    options.printProgress = !quiet;
    if (generations) {
        options.generationsOverride = args::get(generations);
    }
    if (seed) {
        options.seedOverride = args::get(seed);
    }

    EngineConfig effective = configResult.value();
    if (options.generationsOverride.has_value()) {
        effective.maxGenerations = *options.generationsOverride;
    }
    if (options.seedOverride.has_value()) {
        effective.seed = *options.seedOverride;
    }
    const auto validation = effective.validate();
    if (validation.isError()) {
        std::cerr << "Invalid config: " << validation.errorValue() << std::endl;
        return 1;
    }

    Client::EvolveRunner runner;

    // Install SIGINT handler for graceful shutdown.
    // Note: Must use C-style function pointer, not lambda.
    static Client::EvolveRunner* g_runner = nullptr;
    static auto sigintHandler = +[](int) -> void {
        if (g_runner) {
            g_runner->requestStop();
        }
    };

    g_runner = &runner;
    auto oldHandler = std::signal(SIGINT, sigintHandler);

    const auto results = runner.run(configResult.value(), options, std::cout);

    std::signal(SIGINT, oldHandler);
    g_runner = nullptr;

    std::cout << nlohmann::json(results).dump() << std::endl;

    return results.completed ? 0 : 1;
}
