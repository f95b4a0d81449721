#ifndef IGDPP_URL_IMPL
#define IGDPP_URL_IMPL

#include "../url.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace igd {

inline std::string url::origin() const
{
    return scheme + "://" + host + ':' + std::to_string(port);
}

inline url parse_url(const std::string& s, error_code& error)
{
    error = error_code();
    url result;

    const auto scheme_end = s.find("://");
    if(scheme_end == std::string::npos || scheme_end == 0) {
        error = make_error_code(error::client::invalid_argument);
        return {};
    }
    result.scheme = s.substr(0, scheme_end);
    std::transform(result.scheme.begin(), result.scheme.end(),
            result.scheme.begin(), [](unsigned char c) { return std::tolower(c); });
    if(result.scheme != "http") {
        error = make_error_code(error::client::invalid_argument);
        return {};
    }

    const auto authority_begin = scheme_end + 3;
    const auto path_begin = s.find_first_of("/?", authority_begin);
    const auto authority = s.substr(authority_begin,
            path_begin == std::string::npos ? std::string::npos
                                            : path_begin - authority_begin);
    if(path_begin != std::string::npos) {
        result.path = s.substr(path_begin);
        if(result.path.front() == '?') {
            result.path.insert(result.path.begin(), '/');
        }
    }

    // A bracketed host is a literal IPv6 address, whose colons are not port
    // separators.
    std::string::size_type port_sep;
    if(!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if(close == std::string::npos) {
            error = make_error_code(error::client::invalid_argument);
            return {};
        }
        result.host = authority.substr(1, close - 1);
        port_sep = authority.find(':', close);
    } else {
        port_sep = authority.find(':');
        result.host = authority.substr(0, port_sep);
    }
    if(result.host.empty()) {
        error = make_error_code(error::client::invalid_argument);
        return {};
    }

    if(port_sep != std::string::npos) {
        const char* first = authority.data() + port_sep + 1;
        const char* last = authority.data() + authority.size();
        unsigned port = 0;
        const auto res = std::from_chars(first, last, port);
        if(first == last || res.ec != std::errc() || res.ptr != last
                || port == 0 || port > 65535) {
            error = make_error_code(error::client::invalid_argument);
            return {};
        }
        result.port = static_cast<uint16_t>(port);
    }
    return result;
}

namespace detail {

inline bool is_absolute_url(const std::string& s)
{
    const auto sep = s.find("://");
    if(sep == std::string::npos || sep == 0) {
        return false;
    }
    return std::all_of(s.begin(), s.begin() + sep,
            [](unsigned char c) { return std::isalpha(c); });
}

} // detail

inline std::string resolve_url(const std::string& base, const std::string& reference)
{
    if(detail::is_absolute_url(reference)) {
        return reference;
    }
    if(!reference.empty() && reference.front() == '/') {
        error_code ec;
        const auto parsed = parse_url(base, ec);
        if(!ec) {
            return parsed.origin() + reference;
        }
    }
    std::string result = base;
    while(!result.empty() && result.back() == '/') {
        result.pop_back();
    }
    auto first = reference.begin();
    while(first != reference.end() && *first == '/') {
        ++first;
    }
    result += '/';
    result.append(first, reference.end());
    return result;
}

} // igd

#endif // IGDPP_URL_IMPL
