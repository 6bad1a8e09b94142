#include "config.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <iostream>
#include <fstream>
#include <filesystem>
#include <iterator>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace Hookstage {

    const char* const defaultConfigPath = "/etc/hookstage/hookstage.yaml";

    namespace {
        template <typename T>
        void readKey(const YAML::Node& root, const char* key, T& target) {
            const YAML::Node value = root[key];
            if (!value || value.IsNull()) {
                return;
            }
            try {
                target = value.as<T>();
            } catch (const YAML::Exception& e) {
                throw HookError(HookErrorKind::ConfigError,
                                "Invalid value for '" + std::string(key) + "': " + e.what());
            }
        }
    } // end anonymous namespace

    Config Config::loadFromString(const std::string& text) {
        Config config;

        YAML::Node root;
        try {
            root = YAML::Load(text);
        } catch (const YAML::Exception& e) {
            throw HookError(HookErrorKind::ConfigError,
                            std::string("Malformed configuration: ") + e.what());
        }

        // An empty document means "all defaults"
        if (root.IsNull()) {
            return config;
        }
        if (!root.IsMap()) {
            throw HookError(HookErrorKind::ConfigError, "Configuration must be a YAML map");
        }

        const YAML::Node& settings = root;
        readKey(settings, "endpoint", config.endpoint);
        readKey(settings, "annotation", config.annotation);
        readKey(settings, "timeout_seconds", config.timeoutSeconds);
        readKey(settings, "poll_interval_ms", config.pollIntervalMillis);
        readKey(settings, "request_timeout_seconds", config.requestTimeoutSeconds);

        std::string policy;
        readKey(settings, "phase_policy", policy);
        if (!policy.empty()) {
            config.phasePolicy = parsePhasePolicy(policy);
        }

        config.validate();
        return config;
    }

    Config Config::loadFromFile(const std::string& path) {
        if (!fs::exists(path)) {
            log_warning("Configuration file not found: " + path + " (using defaults)");
            return Config();
        }

        std::ifstream file(path);
        if (!file.is_open()) {
            throw HookError(HookErrorKind::ConfigError,
                            "Unable to open configuration file: " + path);
        }

        std::string text((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());
        file.close();

        try {
            return loadFromString(text);
        } catch (const HookError& e) {
            throw HookError(e.kind(), path + ": " + e.what());
        }
    }

    void Config::saveToFile(const std::string& path) const {
        YAML::Emitter out;
        out << YAML::BeginMap;
        out << YAML::Key << "endpoint" << YAML::Value << endpoint;
        out << YAML::Key << "annotation" << YAML::Value << annotation;
        out << YAML::Key << "phase_policy" << YAML::Value << phasePolicyName(phasePolicy);
        out << YAML::Key << "timeout_seconds" << YAML::Value << timeoutSeconds;
        out << YAML::Key << "poll_interval_ms" << YAML::Value << pollIntervalMillis;
        out << YAML::Key << "request_timeout_seconds" << YAML::Value << requestTimeoutSeconds;
        out << YAML::EndMap;

        std::ofstream file(path, std::ios::trunc);
        if (!file.is_open()) {
            throw HookError(HookErrorKind::ConfigError,
                            "Unable to open configuration file for writing: " + path);
        }

        file << "# Hookstage Configuration\n";
        file << "# Settings for running release-lifecycle hooks.\n\n";
        file << out.c_str() << "\n";
        if (!file) {
            throw HookError(HookErrorKind::ConfigError, "Failed to write configuration file: " + path);
        }
    }

    void Config::print() const {
        std::cout << "Hookstage Configuration:" << std::endl;
        std::cout << "  endpoint:                " << endpoint << std::endl;
        std::cout << "  annotation:              " << annotation << std::endl;
        std::cout << "  phase_policy:            " << phasePolicyName(phasePolicy) << std::endl;
        std::cout << "  timeout_seconds:         " << timeoutSeconds << std::endl;
        std::cout << "  poll_interval_ms:        " << pollIntervalMillis << std::endl;
        std::cout << "  request_timeout_seconds: " << requestTimeoutSeconds << std::endl;
    }

    void Config::validate() const {
        if (annotation.empty()) {
            throw HookError(HookErrorKind::ConfigError, "annotation must not be empty");
        }
        if (timeoutSeconds <= 0 || timeoutSeconds > maxTimeoutSeconds) {
            throw HookError(HookErrorKind::ConfigError,
                            "timeout_seconds must be between 1 and " +
                            std::to_string(maxTimeoutSeconds));
        }
        if (pollIntervalMillis <= 0 || pollIntervalMillis > maxPollIntervalMillis) {
            throw HookError(HookErrorKind::ConfigError,
                            "poll_interval_ms must be between 1 and " +
                            std::to_string(maxPollIntervalMillis));
        }
        if (requestTimeoutSeconds < 0 || requestTimeoutSeconds > maxTimeoutSeconds) {
            throw HookError(HookErrorKind::ConfigError,
                            "request_timeout_seconds must be between 0 and " +
                            std::to_string(maxTimeoutSeconds));
        }
    }

    AnnotationExtractor Config::makeExtractor() const {
        return AnnotationExtractor(annotation, phasePolicy);
    }

    ExecutorOptions Config::makeExecutorOptions(const CancellationToken* cancellation) const {
        ExecutorOptions options;
        options.timeout = std::chrono::seconds(timeoutSeconds);
        options.pollInterval = std::chrono::milliseconds(pollIntervalMillis);
        options.cancellation = cancellation;
        return options;
    }
}
