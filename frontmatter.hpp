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

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

/*
 * A source document looks like this:
 *
 * ---
 * {"title": "Chapter one", "level": 1}
 * ---
 * Markdown text follows.
 *
 * The part between the two fence lines must be a JSON object. A file
 * that does not start with a fence line has no front matter.
 */

typedef nlohmann::json FileMetadata;

struct SourceText {
    FileMetadata meta = FileMetadata::object();
    std::string body;
};

SourceText split_front_matter(std::string_view text, const std::string &origin);

SourceText read_front_matter(const std::filesystem::path &path);

// These return an empty value when the key is missing and throw when the
// value has the wrong type.
std::string meta_string(const FileMetadata &m, const char *key);
bool meta_bool(const FileMetadata &m, const char *key);
int meta_int(const FileMetadata &m, const char *key);
std::vector<std::string> meta_quick_list(const FileMetadata &m, const char *key);
