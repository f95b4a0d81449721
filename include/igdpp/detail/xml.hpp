#ifndef IGDPP_XML_HEADER
#define IGDPP_XML_HEADER

#include <cstring>
#include <memory>
#include <mutex>
#include <string>

#include <libxml/parser.h>
#include <libxml/tree.h>

namespace igd {
namespace detail {

struct xml_document_deleter
{
    void operator()(xmlDoc* doc) const noexcept { xmlFreeDoc(doc); }
};

using xml_document = std::unique_ptr<xmlDoc, xml_document_deleter>;

/**
 * @brief Parses @p text into a document tree.
 *
 * Network access (external entities) is never attempted and libxml2's own
 * diagnostics are suppressed.
 *
 * @param recover Whether to accept documents that are not well-formed, as far
 * as libxml2 can make sense of them.
 *
 * @return The document, or null if @p text could not be parsed.
 */
inline xml_document parse_xml(const std::string& text, bool recover)
{
    static std::once_flag init;
    std::call_once(init, [] { xmlInitParser(); });

    int options = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING;
    if(recover) {
        options |= XML_PARSE_RECOVER;
    }
    return xml_document(xmlReadMemory(text.data(), static_cast<int>(text.size()),
            nullptr, nullptr, options));
}

inline bool is_element(const xmlNode* node, const char* local_name) noexcept
{
    return node && node->type == XML_ELEMENT_NODE
        && std::strcmp(reinterpret_cast<const char*>(node->name), local_name) == 0;
}

/** Returns the first element child of @p parent, whatever its name. */
inline xmlNode* first_element(xmlNode* parent) noexcept
{
    if(!parent) {
        return nullptr;
    }
    for(auto* child = parent->children; child; child = child->next) {
        if(child->type == XML_ELEMENT_NODE) {
            return child;
        }
    }
    return nullptr;
}

/** Returns the first element child of @p parent named @p local_name. */
inline xmlNode* find_child(xmlNode* parent, const char* local_name) noexcept
{
    if(!parent) {
        return nullptr;
    }
    for(auto* child = parent->children; child; child = child->next) {
        if(is_element(child, local_name)) {
            return child;
        }
    }
    return nullptr;
}

/**
 * Returns the first element named @p local_name in the subtree of @p root,
 * @p root included, in document order.
 */
inline xmlNode* find_descendant(xmlNode* root, const char* local_name) noexcept
{
    if(!root) {
        return nullptr;
    }
    if(is_element(root, local_name)) {
        return root;
    }
    for(auto* child = root->children; child; child = child->next) {
        if(auto* match = find_descendant(child, local_name)) {
            return match;
        }
    }
    return nullptr;
}

/** Returns the concatenated text content of @p node. */
inline std::string text_of(const xmlNode* node)
{
    if(!node) {
        return {};
    }
    std::string result;
    if(xmlChar* content = xmlNodeGetContent(node)) {
        result = reinterpret_cast<const char*>(content);
        xmlFree(content);
    }
    return result;
}

inline std::string trim(const std::string& s)
{
    const auto first = s.find_first_not_of(" \t\r\n");
    if(first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

/** Returns the trimmed text of the child of @p parent named @p local_name. */
inline std::string child_text(xmlNode* parent, const char* local_name)
{
    return trim(text_of(find_child(parent, local_name)));
}

/** Escapes @p s for use as element content or an attribute value. */
inline std::string escape_xml(const std::string& s)
{
    std::string result;
    result.reserve(s.size());
    for(const char c : s) {
        switch(c) {
        case '&': result += "&amp;"; break;
        case '<': result += "&lt;"; break;
        case '>': result += "&gt;"; break;
        case '"': result += "&quot;"; break;
        case '\'': result += "&apos;"; break;
        default: result += c;
        }
    }
    return result;
}

} // detail
} // igd

#endif // IGDPP_XML_HEADER
