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

#include <frontmatter.hpp>
#include <utils.hpp>

#include <cstdint>
#include <limits>
#include <stdexcept>

namespace {

const char fence[] = "---";
const char bom[] = "\xEF\xBB\xBF";

std::string_view strip_line(std::string_view line) {
    while(!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
        line.remove_suffix(1);
    }
    return line;
}

// Returns the line starting at offset and moves offset past its newline.
std::string_view next_line(std::string_view text, size_t &offset) {
    const auto end = text.find('\n', offset);
    std::string_view line;
    if(end == std::string_view::npos) {
        line = text.substr(offset);
        offset = text.size();
    } else {
        line = text.substr(offset, end - offset);
        offset = end + 1;
    }
    return line;
}

bool is_blank(std::string_view text) {
    return text.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

std::runtime_error type_error(const char *key, const char *expected) {
    return std::runtime_error(std::string("Front matter key ") + key + " must be " + expected +
                              ".");
}

} // namespace

SourceText split_front_matter(std::string_view text, const std::string &origin) {
    SourceText result;
    if(text.substr(0, 3) == bom) {
        text.remove_prefix(3);
    }
    size_t offset = 0;
    if(text.empty() || strip_line(next_line(text, offset)) != fence) {
        result.body = std::string(text);
        return result;
    }
    const size_t meta_start = offset;
    while(offset < text.size()) {
        const size_t line_start = offset;
        const auto line = next_line(text, offset);
        if(strip_line(line) == fence) {
            const auto metatext = text.substr(meta_start, line_start - meta_start);
            if(!is_blank(metatext)) {
                result.meta = FileMetadata::parse(metatext);
                if(!result.meta.is_object()) {
                    throw std::runtime_error("Front matter in " + origin +
                                             " is not a JSON object.");
                }
            }
            result.body = std::string(text.substr(offset));
            return result;
        }
    }
    throw std::runtime_error("Front matter in " + origin + " is not terminated.");
}

SourceText read_front_matter(const std::filesystem::path &path) {
    const auto text = read_file(path);
    if(!is_valid_utf8(text)) {
        throw std::runtime_error("Invalid UTF-8 in " + path.generic_string() + ".");
    }
    return split_front_matter(text, path.generic_string());
}

std::string meta_string(const FileMetadata &m, const char *key) {
    auto it = m.find(key);
    if(it == m.end() || it->is_null()) {
        return std::string{};
    }
    if(!it->is_string()) {
        throw type_error(key, "a string");
    }
    return it->get<std::string>();
}

bool meta_bool(const FileMetadata &m, const char *key) {
    auto it = m.find(key);
    if(it == m.end() || it->is_null()) {
        return false;
    }
    if(it->is_boolean()) {
        return it->get<bool>();
    }
    if(it->is_string()) {
        const auto &s = it->get_ref<const std::string &>();
        if(s == "true" || s == "yes") {
            return true;
        }
        if(s == "false" || s == "no") {
            return false;
        }
    }
    throw type_error(key, "a boolean");
}

int meta_int(const FileMetadata &m, const char *key) {
    auto it = m.find(key);
    if(it == m.end() || it->is_null()) {
        return 0;
    }
    if(it->is_number_unsigned()) {
        if(it->get<uint64_t>() > (uint64_t)std::numeric_limits<int>::max()) {
            throw type_error(key, "an integer that fits in an int");
        }
        return it->get<int>();
    }
    if(!it->is_number_integer()) {
        throw type_error(key, "an integer");
    }
    const auto value = it->get<int64_t>();
    if(value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw type_error(key, "an integer that fits in an int");
    }
    return (int)value;
}

std::vector<std::string> meta_quick_list(const FileMetadata &m, const char *key) {
    std::vector<std::string> result;
    auto it = m.find(key);
    if(it == m.end() || it->is_null()) {
        return result;
    }
    if(it->is_string()) {
        return split_to_words(it->get_ref<const std::string &>());
    }
    if(!it->is_array()) {
        throw type_error(key, "a string or an array of strings");
    }
    for(const auto &e : *it) {
        if(!e.is_string()) {
            throw type_error(key, "a string or an array of strings");
        }
        result.push_back(e.get<std::string>());
    }
    return result;
}
