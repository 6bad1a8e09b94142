#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <stdexcept>
#include <utility>

#include "applier.hpp"
#include "cancellation.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "hook.hpp"
#include "http_applier.hpp"
#include "lifecycle.hpp"
#include "manifest.hpp"
#include "phase.hpp"
#include "signal_watcher.hpp"
#include "utils.hpp"

using namespace Hookstage;

namespace {

// Command line settings shared by every command
struct Options
{
    std::string configPath = defaultConfigPath;
    std::string writePath;
    std::string endpoint;
    long timeoutSeconds = 0;
    long pollIntervalMillis = 0;
    bool strict = false;
    bool dryRun = false;
    std::vector<std::string> positional;
};

void printHelp()
{
    std::cout << "Hookstage (x86_64)\n"
              << "Usage: hookstage command [arguments] [options]\n\n"
              << "Hookstage runs the lifecycle hooks declared in rendered release\n"
              << "manifests around the release operation itself.\n\n"
              << "Commands:\n"
              << "  install  <manifests>  - Run pre-install hooks, apply resources, run post-install hooks\n"
              << "  upgrade  <manifests>  - Same, with the upgrade phases\n"
              << "  rollback <manifests>  - Same, with the rollback phases\n"
              << "  delete   <manifests>  - Run pre-delete hooks, delete resources, run post-delete hooks\n"
              << "  hooks    <manifests>  - Show the hooks bound to each phase\n"
              << "  phases   [operation]  - Show the phase pair of an operation\n"
              << "  config                - Show the effective configuration\n\n"
              << "<manifests> is a YAML file, a directory, a .tar/.tar.gz/.tgz archive or '-' for stdin.\n\n"
              << "Options:\n"
              << "  --config <file>         Configuration file (default " << defaultConfigPath << ")\n"
              << "  --endpoint <url>        Control-plane endpoint\n"
              << "  --timeout <seconds>     Per-hook readiness deadline\n"
              << "  --poll-interval <ms>    Delay between readiness polls\n"
              << "  --strict                Reject unrecognized phase identifiers\n"
              << "  --dry-run               Log what would be applied instead of applying it\n"
              << "  --write <file>          (config) Save the effective configuration\n";
}

bool parseLong(const std::string& flag, const std::string& text, long& target)
{
    try {
        size_t consumed = 0;
        long value = std::stol(text, &consumed);
        if (consumed != text.size() || value <= 0) {
            throw std::invalid_argument(text);
        }
        target = value;
        return true;
    } catch (const std::exception&) {
        std::cerr << "Error: " << flag << " requires a positive number, got '" << text << "'.\n";
        return false;
    }
}

bool parseArguments(int argc, char* argv[], Options& options)
{
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        bool takesValue = (arg == "--config" || arg == "--endpoint" || arg == "--timeout" ||
                           arg == "--poll-interval" || arg == "--write");

        if (takesValue && i + 1 >= argc) {
            std::cerr << "Error: " << arg << " requires an argument.\n";
            return false;
        }

        if (arg == "--config") {
            options.configPath = argv[++i];
        }
        else if (arg == "--endpoint") {
            options.endpoint = argv[++i];
        }
        else if (arg == "--write") {
            options.writePath = argv[++i];
        }
        else if (arg == "--timeout") {
            if (!parseLong(arg, argv[++i], options.timeoutSeconds)) {
                return false;
            }
        }
        else if (arg == "--poll-interval") {
            if (!parseLong(arg, argv[++i], options.pollIntervalMillis)) {
                return false;
            }
        }
        else if (arg == "--strict") {
            options.strict = true;
        }
        else if (arg == "--dry-run") {
            options.dryRun = true;
        }
        else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
            std::cerr << "Error: Unknown option '" << arg << "'.\n";
            return false;
        }
        else {
            options.positional.push_back(arg);
        }
    }
    return true;
}

// Configuration file first, then command line overrides
Config effectiveConfig(const Options& options)
{
    Config config = Config::loadFromFile(options.configPath);
    if (!options.endpoint.empty()) {
        config.endpoint = options.endpoint;
    }
    if (options.timeoutSeconds > 0) {
        config.timeoutSeconds = options.timeoutSeconds;
    }
    if (options.pollIntervalMillis > 0) {
        config.pollIntervalMillis = options.pollIntervalMillis;
    }
    if (options.strict) {
        config.phasePolicy = PhasePolicy::Strict;
    }
    config.validate();
    return config;
}

StepResult applyResources(Applier& applier, const std::vector<Manifest>& resources)
{
    for (const auto& resource : resources) {
        SubmitResult submission = applier.submit(resource);
        if (!submission.accepted) {
            return StepResult::failure("failed to apply " + resource.displayName() + ": " +
                                       submission.error);
        }
        std::cout << "  applied " << resource.displayName() << "\n";
    }
    return StepResult::ok();
}

StepResult deleteResources(Applier& applier, const std::vector<Manifest>& resources)
{
    // Reverse discovery order
    for (auto it = resources.rbegin(); it != resources.rend(); ++it) {
        if (!applier.remove(*it)) {
            return StepResult::failure("failed to delete " + it->displayName());
        }
        std::cout << "  deleted " << it->displayName() << "\n";
    }
    return StepResult::ok();
}

int runOperation(Operation operation, const Options& options)
{
    if (options.positional.size() != 1) {
        std::cerr << "Usage: hookstage " << PhaseRegistry::operationName(operation)
                  << " <manifests> [options]\n";
        return 1;
    }

    Config config = effectiveConfig(options);
    std::vector<Manifest> manifests = ManifestLoader::load(options.positional[0]);

    std::unique_ptr<Applier> applier;
    if (options.dryRun) {
        applier = std::make_unique<DryRunApplier>();
    }
    else {
        applier = std::make_unique<HttpApplier>(config.endpoint, config.requestTimeoutSeconds);
    }

    CancellationToken cancellation;
    SignalWatcher watcher(cancellation);

    LifecycleCoordinator coordinator(*applier,
                                     config.makeExtractor(),
                                     config.makeExecutorOptions(&cancellation));

    Applier& target = *applier;
    OperationResult result = coordinator.perform(
        operation, manifests,
        [operation, &target](const std::vector<Manifest>& resources) {
            if (operation == Operation::Delete) {
                return deleteResources(target, resources);
            }
            return applyResources(target, resources);
        });

    if (!result.success) {
        std::cerr << "Error: " << result.describe() << "\n";
        return 1;
    }
    std::cout << result.describe() << "\n";
    return 0;
}

int showHooks(const Options& options)
{
    if (options.positional.size() != 1) {
        std::cerr << "Usage: hookstage hooks <manifests> [--strict] [--config <file>]\n";
        return 1;
    }

    Config config = effectiveConfig(options);
    std::vector<Manifest> manifests = ManifestLoader::load(options.positional[0]);
    HookSet::Assembly assembly = HookSet::assemble(manifests, config.makeExtractor());

    for (Phase phase : PhaseRegistry::allPhases()) {
        const std::vector<Hook>& hooks = assembly.hooks.hooksFor(phase);
        if (hooks.empty()) {
            continue;
        }
        std::cout << PhaseRegistry::phaseName(phase) << ":\n";
        for (const auto& hook : hooks) {
            std::cout << "  - " << hook.name() << " (" << hook.manifest.source << ")\n";
        }
    }

    std::cout << "resources:\n";
    for (const auto& resource : assembly.resources) {
        std::cout << "  - " << resource.displayName() << "\n";
    }
    return 0;
}

int showPhases(const Options& options)
{
    std::vector<Operation> operations;
    if (options.positional.empty()) {
        operations.assign(PhaseRegistry::allOperations().begin(),
                          PhaseRegistry::allOperations().end());
    }
    else {
        operations.push_back(PhaseRegistry::parseOperation(options.positional[0]));
    }

    for (Operation operation : operations) {
        std::pair<Phase, Phase> phases = PhaseRegistry::phasesFor(operation);
        std::cout << PhaseRegistry::operationName(operation) << ": "
                  << PhaseRegistry::phaseName(phases.first) << " -> "
                  << PhaseRegistry::operationName(operation) << " -> "
                  << PhaseRegistry::phaseName(phases.second) << "\n";
    }
    return 0;
}

int showConfig(const Options& options)
{
    Config config = effectiveConfig(options);
    config.print();
    if (!options.writePath.empty()) {
        config.saveToFile(options.writePath);
        log_message("Saved configuration to " + options.writePath);
    }
    return 0;
}

} // end anonymous namespace

int main(int argc, char* argv[])
{
    // If no command is supplied, show the help message
    if (argc < 2) {
        printHelp();
        return 0;
    }

    std::string command = argv[1];
    if (command == "help" || command == "--help" || command == "-h") {
        printHelp();
        return 0;
    }

    Options options;
    if (!parseArguments(argc, argv, options)) {
        return 1;
    }

    try {
        // -------------------------------------------------------------
        // Release operations
        // -------------------------------------------------------------
        if (command == "install" || command == "upgrade" ||
            command == "delete"  || command == "rollback") {
            return runOperation(PhaseRegistry::parseOperation(command), options);
        }
        // -------------------------------------------------------------
        // Hooks Command
        // -------------------------------------------------------------
        else if (command == "hooks") {
            return showHooks(options);
        }
        // -------------------------------------------------------------
        // Phases Command
        // -------------------------------------------------------------
        else if (command == "phases") {
            return showPhases(options);
        }
        // -------------------------------------------------------------
        // Config Command
        // -------------------------------------------------------------
        else if (command == "config") {
            return showConfig(options);
        }
        // -------------------------------------------------------------
        // Unknown Command
        // -------------------------------------------------------------
        else {
            std::cerr << "Unknown command '" << command << "'. Run 'hookstage help' for usage.\n";
            return 1;
        }
    } catch (const HookError& e) {
        log_error(std::string(errorKindName(e.kind())) + ": " + e.what());
        return 1;
    } catch (const std::exception& e) {
        log_error(e.what());
        return 1;
    }
}
