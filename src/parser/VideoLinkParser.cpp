#include "VideoLinkParser.hpp"
#include "../utils/UrlUtil.hpp"
#include <lexbor/html/html.h>
#include <lexbor/dom/dom.h>
#include <cstring>
#include <unordered_set>

namespace {

std::string to_std_string(const lxb_char_t* lxb_str, size_t len) {
    if (lxb_str && len > 0) {
        return std::string(reinterpret_cast<const char*>(lxb_str), len);
    }
    return "";
}

std::string get_attribute_value(lxb_dom_element_t* element, const char* key) {
    size_t len = 0;
    const lxb_char_t* value = lxb_dom_element_get_attribute(element, reinterpret_cast<const lxb_char_t*>(key), strlen(key), &len);
    return to_std_string(value, len);
}

} // anonymous namespace

namespace ClipRelay {

std::vector<std::string> VideoLinkParser::Parse(const std::string& html_content) {
    std::vector<std::string> links;

    lxb_html_document_t* document = lxb_html_document_create();
    if (!document) return links;

    lxb_status_t status = lxb_html_document_parse(document,
        reinterpret_cast<const lxb_char_t*>(html_content.c_str()),
        html_content.length());
    if (status != LXB_STATUS_OK) {
        lxb_html_document_destroy(document);
        return links;
    }

    lxb_dom_document_t* dom_doc = lxb_html_document_original_ref(document);
    lxb_dom_collection_t* col = lxb_dom_collection_make(dom_doc, 128);
    if (col != nullptr) {
        lxb_dom_element_t* root = lxb_dom_document_element(dom_doc);
        if (root != nullptr) {
            (void) lxb_dom_elements_by_tag_name(root, col, reinterpret_cast<const lxb_char_t*>("a"), 1);
        }

        std::unordered_set<std::string> seen;
        const size_t count = lxb_dom_collection_length(col);
        for (size_t i = 0; i < count; ++i) {
            lxb_dom_element_t* el = lxb_dom_collection_element(col, i);
            if (!el) continue;

            std::string href = get_attribute_value(el, "href");
            if (href.empty() || !UrlUtil::IsVideoLink(href)) continue;
            if (seen.insert(href).second) links.push_back(std::move(href));
        }

        lxb_dom_collection_destroy(col, true);
    }

    lxb_html_document_destroy(document);
    return links;
}

}
