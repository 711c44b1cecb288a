/**
 * @file main.cpp
 * @brief Main entry point for the sandrun command-line runner
 *
 * Reads a Python snippet from a file or standard input, runs it in a
 * resource-limited child process and reports the classified outcome as
 * text or JSON.
 */

#include "cli_options.hpp"

#include "config/sandbox_config.hpp"
#include "isolated/runner.hpp"
#include "logging/core/logging_manager.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <iterator>
#include <string>

using sandrun::app::ExitCode;

namespace {

int toInt(ExitCode code) {
    return static_cast<int>(code);
}

}  // namespace

int main(int argc, char* argv[]) {
    auto options = sandrun::app::parseArguments(argc, argv);
    if (!options) {
        std::cerr << "sandrun: " << options.error() << "\n";
        sandrun::app::printUsage(std::cerr, argv[0]);
        return toInt(ExitCode::UsageError);
    }
    if (options->showHelp) {
        sandrun::app::printUsage(std::cout, argv[0]);
        return toInt(ExitCode::Success);
    }
    if (options->showVersion) {
        std::cout << "sandrun " << sandrun::app::SANDRUN_VERSION << "\n";
        return toInt(ExitCode::Success);
    }

    auto& logging = sandrun::logging::LoggingManager::getInstance();
    logging.initialize(sandrun::logging::LoggingConfig::createForCli(
        sandrun::logging::levelFromString(options->logLevel.value_or("warn"))));

    sandrun::config::SandboxConfig config;
    if (options->configPath) {
        auto loaded = sandrun::config::SandboxConfig::loadFromFile(*options->configPath);
        if (!loaded) {
            std::cerr << "sandrun: " << *options->configPath << ": "
                      << sandrun::config::configErrorToString(loaded.error()) << "\n";
            return toInt(ExitCode::UsageError);
        }
        config = *loaded;
    }
    if (auto applied = sandrun::app::applyOverrides(config, *options); !applied) {
        std::cerr << "sandrun: " << applied.error() << "\n";
        return toInt(ExitCode::UsageError);
    }
    logging.initialize(config.toLoggingConfig());

    spdlog::debug("Effective configuration: {}", config.toJson().dump());

    auto runner = sandrun::isolated::RunnerFactory::create(config.toRunnerConfig());

    try {
        sandrun::isolated::ExecutionOutcome outcome;
        if (options->file) {
            outcome = runner->executeFile(*options->file, options->stdinData);
        } else {
            sandrun::isolated::ExecutionRequest request;
            request.sourceText.assign(std::istreambuf_iterator<char>(std::cin),
                                      std::istreambuf_iterator<char>());
            if (request.sourceText.empty()) {
                std::cerr << "sandrun: no code provided on stdin and no file specified\n";
                logging.shutdown();
                return toInt(ExitCode::UsageError);
            }
            request.stdinData = options->stdinData;
            outcome = runner->execute(request);
        }

        if (options->json) {
            std::cout << sandrun::app::renderJson(outcome) << "\n";
        } else {
            sandrun::app::renderPlain(outcome, std::cout, std::cerr);
        }
        std::cout.flush();
        logging.shutdown();
        return toInt(sandrun::app::exitCodeFor(outcome));

    } catch (const sandrun::isolated::LaunchError& e) {
        std::cerr << "sandrun: " << e.what() << "\n";
        logging.shutdown();
        return toInt(ExitCode::LaunchFailure);
    }
}
