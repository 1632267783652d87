/*
 * Copyright 2022 Jussi Pakkanen
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <normalizer.hpp>
#include <utils.hpp>

#include <lexbor/html/html.h>

#include <memory>
#include <stdexcept>
#include <unordered_set>

namespace {

struct HtmlDocumentCloser {
    void operator()(lxb_html_document_t *d) const noexcept { lxb_html_document_destroy(d); }
};

const std::unordered_set<std::string_view> void_elements{"area",
                                                         "base",
                                                         "br",
                                                         "col",
                                                         "embed",
                                                         "hr",
                                                         "img",
                                                         "input",
                                                         "keygen",
                                                         "link",
                                                         "meta",
                                                         "param",
                                                         "source",
                                                         "track",
                                                         "wbr"};

// Children of these are written out without escaping.
const std::unordered_set<std::string_view> raw_text_elements{
    "iframe", "noembed", "noframes", "plaintext", "script", "style", "xmp"};

std::string_view as_view(const lxb_char_t *s, size_t len) {
    return std::string_view(reinterpret_cast<const char *>(s), len);
}

std::string_view character_data(lxb_dom_node_t *node) {
    auto cd = lxb_dom_interface_character_data(node);
    return as_view(cd->data.data, cd->data.length);
}

bool is_newline_run(std::string_view text) {
    return text.size() >= 2 && text.find_first_not_of('\n') == std::string_view::npos;
}

void serialize_node(lxb_dom_node_t *node, bool raw_text, std::string &out);

void serialize_children(lxb_dom_node_t *node, bool raw_text, std::string &out) {
    for(auto child = lxb_dom_node_first_child(node); child; child = lxb_dom_node_next(child)) {
        serialize_node(child, raw_text, out);
    }
}

void serialize_element(lxb_dom_element_t *element, std::string &out) {
    size_t len = 0;
    const auto name = as_view(lxb_dom_element_qualified_name(element, &len), len);
    out += '<';
    out += name;
    for(auto attr = lxb_dom_element_first_attribute(element); attr;
        attr = lxb_dom_element_next_attribute(attr)) {
        out += ' ';
        out += as_view(lxb_dom_attr_qualified_name(attr, &len), len);
        out += "=\"";
        const lxb_char_t *value = lxb_dom_attr_value(attr, &len);
        if(value) {
            out += xml_escape(as_view(value, len));
        }
        out += '"';
    }
    if(void_elements.contains(name)) {
        out += "/>";
        return;
    }
    out += '>';
    auto node = lxb_dom_interface_node(element);
    // The parser eats one newline right after these start tags.
    if(name == "pre" || name == "listing" || name == "textarea") {
        auto first = lxb_dom_node_first_child(node);
        if(first && first->type == LXB_DOM_NODE_TYPE_TEXT &&
           character_data(first).starts_with('\n')) {
            out += '\n';
        }
    }
    serialize_children(node, raw_text_elements.contains(name), out);
    out += "</";
    out += name;
    out += '>';
}

void serialize_node(lxb_dom_node_t *node, bool raw_text, std::string &out) {
    switch(node->type) {
    case LXB_DOM_NODE_TYPE_ELEMENT:
        serialize_element(lxb_dom_interface_element(node), out);
        break;
    case LXB_DOM_NODE_TYPE_TEXT:
        if(raw_text) {
            out += character_data(node);
        } else {
            out += xml_escape(character_data(node));
        }
        break;
    case LXB_DOM_NODE_TYPE_COMMENT:
        out += "<!--";
        out += character_data(node);
        out += "-->";
        break;
    default:
        break;
    }
}

} // namespace

void normalize_markup(std::string_view raw, std::string &out) {
    if(raw.empty()) {
        return;
    }
    std::unique_ptr<lxb_html_document_t, HtmlDocumentCloser> document(lxb_html_document_create());
    if(!document) {
        throw std::runtime_error("Could not create HTML document.");
    }
    const lxb_char_t empty[] = "";
    if(lxb_html_document_parse(document.get(), empty, 0) != LXB_STATUS_OK) {
        throw std::runtime_error("Could not initialize HTML document.");
    }
    auto body = lxb_html_interface_element(lxb_html_document_body_element(document.get()));
    if(!body || !lxb_html_element_inner_html_set(
                    body, reinterpret_cast<const lxb_char_t *>(raw.data()), raw.size())) {
        throw std::runtime_error("Could not parse generated markup.");
    }
    auto root = lxb_dom_interface_node(body);
    for(auto node = lxb_dom_node_first_child(root); node; node = lxb_dom_node_next(node)) {
        if(node->type == LXB_DOM_NODE_TYPE_TEXT && is_newline_run(character_data(node))) {
            out += '\n';
            continue;
        }
        serialize_node(node, false, out);
    }
}

std::string normalize_markup(std::string_view raw) {
    std::string out;
    normalize_markup(raw, out);
    return out;
}
