#include "http_applier.hpp"
#include "utils.hpp"

#include <curl/curl.h>
#include <stdexcept>
#include <utility>

namespace Hookstage {

namespace {
    bool isSuccess(long status)
    {
        return status >= 200 && status < 300;
    }

    // Percent-encodes one path segment.
    std::string escapeSegment(CURL* curl, const std::string& segment)
    {
        char* escaped = curl_easy_escape(curl, segment.c_str(), static_cast<int>(segment.size()));
        if (!escaped) {
            throw std::runtime_error("Failed to URL-encode '" + segment + "'");
        }
        std::string result(escaped);
        curl_free(escaped);
        return result;
    }

    std::string escapePath(const std::string& path)
    {
        CURL* curl = curl_easy_init();
        if (!curl) {
            throw std::runtime_error("Failed to initialize libcurl");
        }

        std::string result;
        try {
            size_t start = 0;
            while (true) {
                size_t slash = path.find('/', start);
                size_t length = (slash == std::string::npos) ? std::string::npos : slash - start;
                result += escapeSegment(curl, path.substr(start, length));
                if (slash == std::string::npos) {
                    break;
                }
                result += '/';
                start = slash + 1;
            }
        } catch (...) {
            curl_easy_cleanup(curl);
            throw;
        }

        curl_easy_cleanup(curl);
        return result;
    }
} // end anonymous namespace

HttpApplier::HttpApplier(std::string endpoint, long requestTimeout)
    : endpoint_(std::move(endpoint)), requestTimeout_(requestTimeout)
{
    while (!endpoint_.empty() && endpoint_.back() == '/') {
        endpoint_.pop_back();
    }
}

std::string HttpApplier::resourceUrl(const std::string& suffix) const
{
    std::string url = endpoint_ + "/v1/resources";
    if (!suffix.empty()) {
        url += "/" + escapePath(suffix);
    }
    return url;
}

HttpApplier::Response HttpApplier::performRequest(const std::string& method,
                                                  const std::string& url,
                                                  const std::string* body) const
{
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("Failed to initialize libcurl");
    }

    Response response;
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/yaml");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (requestTimeout_ > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, requestTimeout_);
    }
    if (body) {
        headers = curl_slist_append(headers, "Content-Type: application/yaml");
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);
        throw std::runtime_error(method + " " + url + " failed: " +
                                 std::string(curl_easy_strerror(res)));
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return response;
}

SubmitResult HttpApplier::submit(const Manifest& manifest)
{
    SubmitResult result;
    Response response;

    try {
        response = performRequest("POST", resourceUrl(""), &manifest.raw);
    } catch (const std::exception& e) {
        result.error = e.what();
        return result;
    }

    if (!isSuccess(response.status)) {
        std::string reason = response.body;
        trim(reason);
        result.error = "control plane rejected " + manifest.displayName() +
                       " (HTTP " + std::to_string(response.status) + ")" +
                       (reason.empty() ? "" : ": " + reason);
        return result;
    }

    result.accepted = true;
    result.handle = manifest.kind + "/" + manifest.name;

    try {
        const YAML::Node reply = YAML::Load(response.body);
        if (reply.IsMap() && reply["handle"] && reply["handle"].IsScalar()) {
            result.handle = reply["handle"].Scalar();
        }
    } catch (const YAML::Exception& e) {
        log_warning("Unreadable apply response for " + manifest.displayName() +
                    ", using " + result.handle + " as handle: " + e.what());
    }
    return result;
}

YAML::Node HttpApplier::poll(const std::string& handle)
{
    Response response = performRequest("GET", resourceUrl(handle), nullptr);
    if (!isSuccess(response.status)) {
        throw std::runtime_error("Status query for " + handle + " returned HTTP " +
                                 std::to_string(response.status));
    }

    YAML::Node reply;
    try {
        reply = YAML::Load(response.body);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Malformed status for " + handle + ": " + e.what());
    }

    const YAML::Node& root = reply;
    if (!root.IsMap() || !root["status"]) {
        return YAML::Node();
    }
    return root["status"];
}

bool HttpApplier::remove(const Manifest& manifest)
{
    try {
        Response response = performRequest("DELETE",
                                           resourceUrl(manifest.kind + "/" + manifest.name),
                                           nullptr);
        if (isSuccess(response.status) || response.status == 404) {
            return true;
        }
        log_error("Failed to delete " + manifest.displayName() + ": HTTP " +
                  std::to_string(response.status));
    } catch (const std::exception& e) {
        log_error("Failed to delete " + manifest.displayName() + ": " + e.what());
    }
    return false;
}

} // namespace Hookstage
