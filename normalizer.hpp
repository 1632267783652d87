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

#pragma once

#include <string>
#include <string_view>

/*
 * Brings a converted markdown fragment to canonical form. Top-level text
 * nodes that consist of nothing but two or more newlines become a single
 * newline. Everything else is written out as is.
 *
 * The input is parsed as an HTML fragment, so raw HTML such as <br> or bare
 * attributes is accepted. The output is serialized with XML syntax (void
 * elements self-closed, all attributes with values) to be usable in XHTML.
 *
 * Only the top level is looked at, blank line runs inside of elements are
 * kept.
 */
void normalize_markup(std::string_view raw, std::string &out);

std::string normalize_markup(std::string_view raw);
