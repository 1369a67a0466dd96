#ifndef KOSTORE_HTTP_HPP
#define KOSTORE_HTTP_HPP

#include "utils.hpp"

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <functional>
#include <cstdint>
#include <utility>

namespace KoStore {

/**
 * @struct HttpRequest
 * @brief A GET request with optional extra headers and bounded timeouts.
 */
struct HttpRequest
{
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    long connectTimeoutSeconds = 15;
    long timeoutSeconds        = 60;
};

/**
 * @struct HttpResponse
 * @brief Status, body and headers of a completed request. Header names are
 *        stored lower-cased.
 */
struct HttpResponse
{
    long status = 0;
    std::string body;
    std::map<std::string, std::string> headers;

    /**
     * @brief Case-insensitive header lookup; empty string when absent.
     */
    std::string header(const std::string& name) const;
};

/**
 * @brief Download progress callback. Receives the bytes written so far and
 *        the expected total if the server announced one. Returning false
 *        aborts the transfer.
 */
using ProgressCallback = std::function<bool(std::uint64_t received,
                                            std::optional<std::uint64_t> total)>;

/**
 * @class HttpClient
 * @brief Network seam used by the repository client and the install worker.
 *
 * Implementations must be safe to call from several threads at once.
 */
class HttpClient
{
public:
    virtual ~HttpClient() = default;

    /**
     * @brief Performs a GET and returns whatever status the server sent.
     *
     * @throws NetworkError on transport failures (DNS, connect, timeout...).
     */
    virtual HttpResponse get(const HttpRequest& request) = 0;

    /**
     * @brief Streams the response body into destPath.
     *
     * @throws NetworkError on transport failures or HTTP status >= 400.
     * @throws CancellationError if progress returned false.
     */
    virtual void download(const HttpRequest& request,
                          const fs::path& destPath,
                          const ProgressCallback& progress) = 0;
};

/**
 * @class CurlHttpClient
 * @brief HttpClient backed by libcurl easy handles (one per request).
 */
class CurlHttpClient : public HttpClient
{
public:
    CurlHttpClient();

    HttpResponse get(const HttpRequest& request) override;

    void download(const HttpRequest& request,
                  const fs::path& destPath,
                  const ProgressCallback& progress) override;
};

/**
 * @brief Whether an HTTP status should be retried (5xx and 429).
 */
bool isTransientStatus(long status);

/**
 * @brief Extracts the rel="next" target from a Link header, if any.
 */
std::optional<std::string> nextLinkFromHeader(const std::string& linkHeader);

} // namespace KoStore

#endif // KOSTORE_HTTP_HPP
