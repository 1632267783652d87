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

#include <markdown.hpp>
#include <md4c-html.h>

#include <stdexcept>

namespace {

const unsigned parser_flags = MD_DIALECT_GITHUB;
const unsigned renderer_flags = MD_HTML_FLAG_XHTML;

void append_output(const MD_CHAR *text, MD_SIZE size, void *userdata) {
    static_cast<std::string *>(userdata)->append(text, size);
}

} // namespace

std::string markdown_to_xhtml(std::string_view markdown) {
    std::string html;
    html.reserve(markdown.size() + markdown.size() / 4);
    const int rc = md_html(markdown.data(),
                           static_cast<MD_SIZE>(markdown.size()),
                           append_output,
                           &html,
                           parser_flags,
                           renderer_flags);
    if(rc != 0) {
        throw std::runtime_error("Markdown conversion failed.");
    }
    return html;
}
