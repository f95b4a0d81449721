#ifndef IGDPP_SOAP_IMPL
#define IGDPP_SOAP_IMPL

#include "../soap.hpp"
#include "../detail/http_client.hpp"
#include "../detail/xml.hpp"

#include <charconv>

#include <spdlog/spdlog.h>

namespace igd {

inline const std::string* find_argument(const soap_arguments& args, const std::string& name)
{
    for(const auto& arg : args) {
        if(arg.first == name) {
            return &arg.second;
        }
    }
    return nullptr;
}

inline std::string make_soap_envelope(const std::string& service_type,
        const std::string& action, const soap_arguments& args)
{
    std::string body =
        "<?xml version=\"1.0\"?>\r\n"
        "<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\" "
        "s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\">"
        "<s:Body>";
    body += "<u:" + action + " xmlns:u=\"" + detail::escape_xml(service_type) + "\">";
    for(const auto& arg : args) {
        body += '<' + arg.first + '>' + detail::escape_xml(arg.second)
            + "</" + arg.first + '>';
    }
    body += "</u:" + action + '>';
    body += "</s:Body></s:Envelope>\r\n";
    return body;
}

inline soap_arguments parse_soap_response(const std::string& body,
        const std::string& action, error_code& error)
{
    error = error_code();
    const auto doc = detail::parse_xml(body, false);
    if(!doc) {
        error = make_error_code(error::client::malformed_response);
        return {};
    }

    auto* soap_body = detail::find_descendant(xmlDocGetRootElement(doc.get()), "Body");
    auto* result = detail::first_element(soap_body);
    if(!result) {
        error = make_error_code(error::client::malformed_response);
        return {};
    }

    if(detail::is_element(result, "Fault")) {
        const auto code = detail::trim(detail::text_of(
                detail::find_descendant(result, "errorCode")));
        int value = 0;
        const auto res = std::from_chars(code.data(), code.data() + code.size(), value);
        if(code.empty() || res.ec != std::errc() || res.ptr != code.data() + code.size()) {
            error = make_error_code(error::client::malformed_response);
            return {};
        }
        error = make_soap_fault(value);
        return {};
    }

    const auto expected = action + "Response";
    if(!detail::is_element(result, expected.c_str())) {
        error = make_error_code(error::client::malformed_response);
        return {};
    }

    soap_arguments values;
    for(auto* child = result->children; child; child = child->next) {
        if(child->type == XML_ELEMENT_NODE) {
            values.emplace_back(reinterpret_cast<const char*>(child->name),
                    detail::text_of(child));
        }
    }
    return values;
}

inline soap_arguments invoke(const std::string& control_url, const std::string& service_type,
        const std::string& action, const soap_arguments& args,
        std::chrono::milliseconds timeout, error_code& error)
{
    spdlog::debug("igd: invoking {}#{} at {}", service_type, action, control_url);

    const detail::http_headers headers = {
        {"Content-Type", "text/xml; charset=\"utf-8\""},
        {"SOAPAction", '"' + service_type + '#' + action + '"'},
        {"Cache-Control", "no-cache"},
        {"Pragma", "no-cache"},
    };
    const auto response = detail::http_request("POST", control_url, headers,
            make_soap_envelope(service_type, action, args), timeout, error);
    if(error) {
        return {};
    }

    auto values = parse_soap_response(response.body, action, error);
    if(is_soap_fault(error)) {
        spdlog::debug("igd: {} rejected: {}", action, error.message());
        return {};
    }
    if(response.status != 200) {
        // Not a fault either, so whatever the gateway sent is no SOAP reply.
        error = make_error_code(error::client::http_error);
        return {};
    }
    if(error) {
        return {};
    }
    return values;
}

inline soap_arguments invoke(const control_session& session, service which,
        const std::string& action, const soap_arguments& args,
        std::chrono::milliseconds timeout, error_code& error)
{
    return igd::invoke(session.control_url_of(which), session.service_type_of(which),
            action, args, timeout, error);
}

} // igd

#endif // IGDPP_SOAP_IMPL
