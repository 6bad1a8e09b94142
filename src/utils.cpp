#include "utils.hpp"
#include <new>

namespace Hookstage {

/**
 * @brief Strips " \t\n\r\f\v" from both ends of `s` in place.
 */
void trim(std::string& s)
{
    const char* whitespace = " \t\n\r\f\v";
    s.erase(0, s.find_first_not_of(whitespace));
    s.erase(s.find_last_not_of(whitespace) + 1);
}

std::vector<std::string> splitAndTrim(const std::string& input, char delimiter)
{
    std::vector<std::string> pieces;
    size_t start = 0;

    while (start <= input.size()) {
        size_t end = input.find(delimiter, start);
        if (end == std::string::npos) {
            end = input.size();
        }

        std::string piece = input.substr(start, end - start);
        trim(piece);
        if (!piece.empty()) {
            pieces.push_back(piece);
        }
        start = end + 1;
    }
    return pieces;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator)
{
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

bool endsWith(const std::string& str, const std::string& suffix)
{
    if (str.size() < suffix.size()) {
        return false;
    }
    return (str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0);
}

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp)
{
    const size_t bytes = size * nmemb;
    std::string* body  = static_cast<std::string*>(userp);

    try {
        body->append(static_cast<const char*>(contents), bytes);
    } catch (const std::bad_alloc&) {
        log_error("Control-plane response too large to buffer");
        return 0;
    }
    return bytes;
}

} // namespace Hookstage
