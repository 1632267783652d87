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

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

// Splits on spaces, tabs, newlines and commas. Empty items are dropped.
std::vector<std::string> split_to_words(std::string_view in_text);

std::string read_file(const std::filesystem::path &p);

bool is_valid_utf8(std::string_view text);

// Case-insensitive glob match of name against any of the patterns.
bool matches_any(const std::string &name, const std::vector<std::string> &patterns);

std::string xml_escape(std::string_view text);

// Percent-encodes a relative path for use in href attributes. Slashes are kept.
std::string uri_escape(const std::string &path);

std::string base_name(const std::string &relpath);

// ISO 8601 UTC timestamp without fractions, as required by dcterms:modified.
std::string current_timestamp();

std::string random_uuid();
