#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <iostream>
#include <vector>

// ANSI color codes for console output.
#define HOOKSTAGE_COLOR_RESET "\033[0m"
#define HOOKSTAGE_COLOR_INFO  "\033[32m"
#define HOOKSTAGE_COLOR_WARN  "\033[33m"
#define HOOKSTAGE_COLOR_ERROR "\033[31m"

namespace Hookstage {

/**
 * @brief Progress line on stderr, tagged [INFO] in green. Keeps stdout free
 *        for command output.
 */
inline void log_message(const std::string &message)
{
    std::cerr << HOOKSTAGE_COLOR_INFO << "[INFO] " << HOOKSTAGE_COLOR_RESET << message << std::endl;
}

/**
 * @brief Recoverable problem (skipped phase entry, retried status read), tagged [WARN].
 */
inline void log_warning(const std::string &message)
{
    std::cerr << HOOKSTAGE_COLOR_WARN << "[WARN] " << HOOKSTAGE_COLOR_RESET << message << std::endl;
}

/**
 * @brief Failed hook or operation, tagged [ERROR] in red.
 */
inline void log_error(const std::string &message)
{
    std::cerr << HOOKSTAGE_COLOR_ERROR << "[ERROR] " << HOOKSTAGE_COLOR_RESET << message << std::endl;
}

// ---------------------------------------------------------------------------
// String helpers
// ---------------------------------------------------------------------------

/**
 * @brief Removes leading and trailing whitespace from the given string.
 * @param s The string to be trimmed.
 */
void trim(std::string& s);

/**
 * @brief Splits a string on a delimiter, trimming each piece.
 *
 * Empty pieces (after trimming) are dropped, so "a,,b," yields {"a", "b"}.
 *
 * @param input     The string to split.
 * @param delimiter The separator character.
 * @return The trimmed, non-empty pieces in input order.
 */
std::vector<std::string> splitAndTrim(const std::string& input, char delimiter);

/**
 * @brief Joins strings with a separator.
 */
std::string join(const std::vector<std::string>& parts, const std::string& separator);

/**
 * @brief Checks whether `str` ends with `suffix`.
 */
bool endsWith(const std::string& str, const std::string& suffix);

/**
 * @brief CURLOPT_WRITEFUNCTION sink: appends the received bytes to the
 *        std::string passed as CURLOPT_WRITEDATA.
 * @return Bytes consumed; 0 makes libcurl abort the transfer.
 */
size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);

} // namespace Hookstage

#endif // UTILS_HPP
