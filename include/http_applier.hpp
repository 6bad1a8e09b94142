#ifndef HTTP_APPLIER_HPP
#define HTTP_APPLIER_HPP

#include <string>
#include "applier.hpp"

namespace Hookstage {

/**
 * @class HttpApplier
 * @brief Applier backed by a control-plane HTTP endpoint (libcurl).
 *
 * Wire contract:
 *   POST   {endpoint}/v1/resources              body: raw manifest (application/yaml)
 *          -> 2xx, YAML body with "handle"
 *   GET    {endpoint}/v1/resources/{handle}     -> YAML body with "status"
 *   DELETE {endpoint}/v1/resources/{kind}/{name} -> 2xx or 404
 */
class HttpApplier : public Applier
{
public:
    /**
     * @param endpoint       Base URL, e.g. "http://127.0.0.1:8080".
     * @param requestTimeout Per-request timeout in seconds (0 disables it).
     */
    explicit HttpApplier(std::string endpoint, long requestTimeout = 30);

    SubmitResult submit(const Manifest& manifest) override;
    YAML::Node poll(const std::string& handle) override;
    bool remove(const Manifest& manifest) override;

    const std::string& endpoint() const { return endpoint_; }

private:
    struct Response
    {
        long status = 0;
        std::string body;
    };

    /**
     * @brief Performs one request.
     * @throws std::runtime_error on transport failure (the HTTP status of a
     *         completed exchange is returned, never thrown).
     */
    Response performRequest(const std::string& method,
                            const std::string& url,
                            const std::string* body) const;

    std::string resourceUrl(const std::string& suffix) const;

    std::string endpoint_;
    long requestTimeout_;
};

} // namespace Hookstage

#endif // HTTP_APPLIER_HPP
