#ifndef IGDPP_HTTP_CLIENT_IMPL
#define IGDPP_HTTP_CLIENT_IMPL

#include "../http_client.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <iterator>

#include <asio/buffer.hpp>
#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/read_until.hpp>
#include <asio/write.hpp>
#include <spdlog/spdlog.h>

namespace igd {
namespace detail {

inline bool iequals(const std::string& a, const std::string& b) noexcept
{
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(),
            [](unsigned char x, unsigned char y) { return std::tolower(x) == std::tolower(y); });
}

inline const std::string* http_response::header(const std::string& name) const
{
    for(const auto& h : headers) {
        if(iequals(h.first, name)) {
            return &h.second;
        }
    }
    return nullptr;
}

inline std::string make_http_request(const std::string& method, const url& target,
        const http_headers& headers, const std::string& body)
{
    std::string request = method + ' ' + target.path + " HTTP/1.1\r\n";
    // Some gateways reject a Host header that names the default port.
    request += "Host: " + target.host;
    if(target.port != 80) {
        request += ':' + std::to_string(target.port);
    }
    request += "\r\n";
    for(const auto& h : headers) {
        request += h.first + ": " + h.second + "\r\n";
    }
    if(!body.empty()) {
        request += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    }
    request += "Connection: close\r\n\r\n";
    request += body;
    return request;
}

// Reads a line ending in "\n" or "\r\n" starting at @p pos and advances @p pos
// past it.
inline std::string next_line(const std::string& s, std::string::size_type& pos)
{
    const auto end = s.find('\n', pos);
    std::string line = s.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
    pos = end == std::string::npos ? s.size() : end + 1;
    if(!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

inline bool decode_chunked(const std::string& body, std::string& decoded)
{
    decoded.clear();
    std::string::size_type pos = 0;
    while(pos < body.size()) {
        auto size_line = next_line(body, pos);
        // Chunk extensions are not interesting.
        size_line = size_line.substr(0, size_line.find(';'));
        std::size_t chunk_size = 0;
        const char* first = size_line.data();
        const char* last = first + size_line.size();
        while(first != last && std::isspace(static_cast<unsigned char>(*first))) {
            ++first;
        }
        const auto res = std::from_chars(first, last, chunk_size, 16);
        if(res.ec != std::errc()) {
            return false;
        }
        if(chunk_size == 0) {
            return true;
        }
        if(body.size() - pos < chunk_size) {
            return false;
        }
        decoded.append(body, pos, chunk_size);
        pos += chunk_size;
        // Skip the CRLF trailing the chunk data.
        next_line(body, pos);
    }
    // The terminating zero sized chunk is missing, but take what arrived.
    return !decoded.empty();
}

inline http_response parse_http_response(const std::string& raw, error_code& error)
{
    error = error_code();
    http_response response;
    std::string::size_type pos = 0;

    const auto status_line = next_line(raw, pos);
    if(status_line.compare(0, 7, "HTTP/1.") != 0) {
        error = make_error_code(error::client::malformed_response);
        return {};
    }
    const auto status_begin = status_line.find(' ');
    if(status_begin == std::string::npos) {
        error = make_error_code(error::client::malformed_response);
        return {};
    }
    const char* first = status_line.data() + status_begin + 1;
    const char* last = status_line.data() + status_line.size();
    const auto res = std::from_chars(first, last, response.status);
    if(res.ec != std::errc() || response.status < 100 || response.status > 999) {
        error = make_error_code(error::client::malformed_response);
        return {};
    }

    while(pos < raw.size()) {
        const auto line = next_line(raw, pos);
        if(line.empty()) {
            break;
        }
        const auto colon = line.find(':');
        if(colon == std::string::npos || colon == 0) {
            // Garbage lines are skipped rather than failing the whole message.
            continue;
        }
        auto value = line.substr(colon + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t") + 1);
        response.headers.emplace_back(line.substr(0, colon), std::move(value));
    }
    response.body = raw.substr(std::min(pos, raw.size()));

    const auto* transfer_encoding = response.header("Transfer-Encoding");
    if(transfer_encoding && iequals(*transfer_encoding, "chunked")) {
        std::string decoded;
        if(!decode_chunked(response.body, decoded)) {
            error = make_error_code(error::client::malformed_response);
            return {};
        }
        response.body = std::move(decoded);
    } else if(const auto* content_length = response.header("Content-Length")) {
        const auto length = std::strtoull(content_length->c_str(), nullptr, 10);
        if(response.body.size() < length) {
            error = make_error_code(error::client::malformed_response);
            return {};
        }
        response.body.resize(length);
    }
    return response;
}

inline http_exchange::http_exchange(asio::io_context& io_context,
        const url& target, std::string request)
    : resolver_(io_context)
    , socket_(io_context)
    , host_(target.host)
    , port_(std::to_string(target.port))
    , request_(std::move(request))
{}

inline void http_exchange::start()
{
    resolver_.async_resolve(host_, port_,
            [this](const error_code& error,
                   const asio::ip::tcp::resolver::results_type& endpoints)
            { on_resolve(error, endpoints); });
}

inline std::string http_exchange::data() const
{
    const auto bufs = response_.data();
    return std::string(asio::buffers_begin(bufs), asio::buffers_end(bufs));
}

inline void http_exchange::on_resolve(const error_code& error,
        const asio::ip::tcp::resolver::results_type& endpoints)
{
    if(error) {
        finish(error);
        return;
    }
    asio::async_connect(socket_, endpoints,
            [this](const error_code& error, const asio::ip::tcp::endpoint&)
            { on_connect(error); });
}

inline void http_exchange::on_connect(const error_code& error)
{
    if(error) {
        finish(error);
        return;
    }
    asio::async_write(socket_, asio::buffer(request_),
            [this](const error_code& error, std::size_t) { on_write(error); });
}

inline void http_exchange::on_write(const error_code& error)
{
    if(error) {
        finish(error);
        return;
    }
    asio::async_read_until(socket_, response_, "\r\n\r\n",
            [this](const error_code& error, std::size_t header_size)
            { on_header(error, header_size); });
}

inline void http_exchange::on_header(const error_code& error, std::size_t header_size)
{
    if(error == asio::error::eof) {
        // The peer closed before completing its header; hand over whatever
        // arrived and let the parser judge it.
        finish(error_code());
        return;
    } else if(error) {
        finish(error);
        return;
    }

    const auto head = data().substr(0, header_size);
    const auto already_read = response_.size() - header_size;
    std::string::size_type pos = 0;
    long long content_length = -1;
    bool chunked = false;
    next_line(head, pos);
    while(pos < head.size()) {
        const auto line = next_line(head, pos);
        const auto colon = line.find(':');
        if(colon == std::string::npos) {
            continue;
        }
        const auto name = line.substr(0, colon);
        if(iequals(name, "Content-Length")) {
            content_length = std::strtoll(line.c_str() + colon + 1, nullptr, 10);
        } else if(iequals(name, "Transfer-Encoding")) {
            chunked = line.find("chunked", colon) != std::string::npos;
        }
    }

    if(content_length >= 0 && !chunked) {
        const auto wanted = static_cast<std::size_t>(content_length);
        if(already_read >= wanted) {
            finish(error_code());
            return;
        }
        asio::async_read(socket_, response_, asio::transfer_exactly(wanted - already_read),
                [this](const error_code& error, std::size_t) { on_body(error); });
    } else {
        // We asked for the connection to be closed, so the end of the body is
        // the end of the stream.
        asio::async_read(socket_, response_, asio::transfer_all(),
                [this](const error_code& error, std::size_t) { on_body(error); });
    }
}

inline void http_exchange::on_body(const error_code& error)
{
    finish(error == asio::error::eof ? error_code() : error);
}

inline void http_exchange::finish(const error_code& error)
{
    error_ = error;
    done_ = true;
    error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
}

inline http_response http_request(const std::string& method,
        const std::string& target_url, const http_headers& headers,
        const std::string& body, std::chrono::milliseconds timeout,
        error_code& error)
{
    error = error_code();
    const auto target = parse_url(target_url, error);
    if(error) {
        return {};
    }

    asio::io_context io_context;
    http_exchange exchange(io_context, target,
            make_http_request(method, target, headers, body));
    exchange.start();
    io_context.run_for(timeout);

    if(!exchange.done()) {
        spdlog::debug("igd: {} {} timed out after {}ms", method, target_url, timeout.count());
        error = make_error_code(asio::error::timed_out);
        return {};
    }
    if(exchange.error()) {
        spdlog::debug("igd: {} {} failed: {}", method, target_url, exchange.error().message());
        error = exchange.error();
        return {};
    }

    auto response = parse_http_response(exchange.data(), error);
    if(error) {
        spdlog::debug("igd: {} {} returned a malformed response", method, target_url);
        return {};
    }
    spdlog::debug("igd: {} {} -> {}", method, target_url, response.status);
    return response;
}

} // detail
} // igd

#endif // IGDPP_HTTP_CLIENT_IMPL
