#ifndef IGDPP_HTTP_CLIENT_HEADER
#define IGDPP_HTTP_CLIENT_HEADER

#include "../error.hpp"
#include "../url.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/streambuf.hpp>

namespace igd {
namespace detail {

using http_headers = std::vector<std::pair<std::string, std::string>>;

struct http_response
{
    int status = 0;
    http_headers headers;
    std::string body;

    /** Returns the value of the first header named @p name, ignoring case. */
    const std::string* header(const std::string& name) const;
};

/**
 * Serializes a request for @p target. `Host`, `Content-Length` (if there is a
 * body) and `Connection: close` are added to @p headers.
 */
std::string make_http_request(const std::string& method, const url& target,
        const http_headers& headers, const std::string& body);

/**
 * @brief Parses a complete HTTP/1.x response, as read until the peer closed
 * the connection or until `Content-Length` bytes of body arrived.
 *
 * Chunked bodies are decoded.
 *
 * @param error Set to `error::client::malformed_response` if @p raw is not a
 * response.
 */
http_response parse_http_response(const std::string& raw, error_code& error);

/**
 * @brief Performs a single request/response exchange with the host of
 * @p target_url.
 *
 * The whole exchange, name resolution included, is bounded by @p timeout,
 * after which it is abandoned and @p error is set to
 * `asio::error::timed_out`. Each call uses its own socket and event loop, so
 * calls from different threads share no state.
 *
 * @return The response, whatever its status code, if no error occurred.
 */
http_response http_request(const std::string& method,
        const std::string& target_url, const http_headers& headers,
        const std::string& body, std::chrono::milliseconds timeout,
        error_code& error);

/**
 * Drives one request through resolve, connect, write and read on
 * @p io_context. The owner runs the context and checks `done()`.
 */
class http_exchange
{
    asio::ip::tcp::resolver resolver_;
    asio::ip::tcp::socket socket_;
    std::string host_;
    std::string port_;
    std::string request_;
    asio::streambuf response_;
    error_code error_;
    bool done_ = false;

public:
    http_exchange(asio::io_context& io_context, const url& target, std::string request);

    void start();

    bool done() const noexcept { return done_; }
    const error_code& error() const noexcept { return error_; }

    /** Returns everything read from the peer so far. */
    std::string data() const;

private:
    void on_resolve(const error_code& error,
            const asio::ip::tcp::resolver::results_type& endpoints);
    void on_connect(const error_code& error);
    void on_write(const error_code& error);
    void on_header(const error_code& error, std::size_t header_size);
    void on_body(const error_code& error);
    void finish(const error_code& error);
};

} // detail
} // igd

#include "impl/http_client.ipp"

#endif // IGDPP_HTTP_CLIENT_HEADER
