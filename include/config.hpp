#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include "annotation.hpp"
#include "phase_executor.hpp"

namespace Hookstage {

/**
 * @brief Default location of the configuration file.
 */
extern const char* const defaultConfigPath;

class Config
{
public:
    /** Upper bound for timeout_seconds and request_timeout_seconds (7 days). */
    static constexpr long maxTimeoutSeconds = 7L * 24 * 60 * 60;
    /** Upper bound for poll_interval_ms (1 hour). */
    static constexpr long maxPollIntervalMillis = 60L * 60 * 1000;

    /**
     * @brief Base URL of the control plane used by the HTTP applier.
     */
    std::string endpoint = "http://127.0.0.1:8080";

    /**
     * @brief Metadata annotation carrying the phase list.
     */
    std::string annotation = defaultHookAnnotation;

    /**
     * @brief Handling of unrecognized phase identifiers.
     */
    PhasePolicy phasePolicy = PhasePolicy::Permissive;

    /**
     * @brief Per-hook readiness deadline.
     */
    long timeoutSeconds = 300;

    /**
     * @brief Delay between readiness polls.
     */
    long pollIntervalMillis = 1000;

    /**
     * @brief Timeout of a single HTTP request to the control plane.
     */
    long requestTimeoutSeconds = 30;

    /**
     * @brief Loads configuration from a YAML file on disk.
     *
     * A missing file is not an error: it is reported and the defaults are
     * returned. Keys absent from the file keep their defaults.
     *
     * @param path Path to the configuration file.
     * @return A fully populated Config instance.
     * @throws HookError (ConfigError) if the file is malformed or holds invalid values.
     */
    static Config loadFromFile(const std::string& path);

    /**
     * @brief Parses configuration from YAML text.
     * @throws HookError (ConfigError) on malformed input or invalid values.
     */
    static Config loadFromString(const std::string& text);

    /**
     * @brief Saves the current configuration to a file.
     * @param path Path to the file where configuration should be saved.
     * @throws HookError (ConfigError) if the file cannot be written.
     */
    void saveToFile(const std::string& path) const;

    /**
     * @brief Prints the effective settings to standard output.
     */
    void print() const;

    /**
     * @brief Checks value ranges.
     * @throws HookError (ConfigError) for durations outside their bounds or an empty annotation key.
     */
    void validate() const;

    /**
     * @brief Builds the annotation extractor these settings describe.
     */
    AnnotationExtractor makeExtractor() const;

    /**
     * @brief Builds executor options (timeout and poll interval) from these settings.
     */
    ExecutorOptions makeExecutorOptions(const CancellationToken* cancellation = nullptr) const;
};

} // namespace Hookstage

#endif // CONFIG_HPP
