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

#include <metadata.hpp>
#include <utils.hpp>
#include <nlohmann/json.hpp>

#include <stdexcept>

using json = nlohmann::json;

namespace {

json parse_json_file(const std::filesystem::path &path) {
    const auto text = read_file(path);
    if(!is_valid_utf8(text)) {
        throw std::runtime_error("Invalid UTF-8 in " + path.string() + ".");
    }
    json data = json::parse(text);
    if(!data.is_object()) {
        throw std::runtime_error("Top level of " + path.string() + " must be an object.");
    }
    return data;
}

std::string get_string(const json &data, const char *key) {
    if(!data.contains(key)) {
        throw std::runtime_error(std::string("Missing required key ") + key + ".");
    }
    const auto &value = data[key];
    if(!value.is_string()) {
        throw std::runtime_error(std::string("Element ") + key + " is not a string.");
    }
    return value.get<std::string>();
}

std::string get_optional_string(const json &data, const char *key) {
    if(!data.contains(key)) {
        return std::string{};
    }
    return get_string(data, key);
}

// Accepts either a single string or an array of strings.
std::vector<std::string> extract_stringarray(const json &data, const char *entryname) {
    std::vector<std::string> result;
    if(!data.contains(entryname)) {
        return result;
    }
    const auto &arr = data[entryname];
    if(arr.is_string()) {
        result.push_back(arr.get<std::string>());
        return result;
    }
    if(!arr.is_array()) {
        throw std::runtime_error(std::string(entryname) + " must be an array of strings.");
    }
    for(const auto &e : arr) {
        if(!e.is_string()) {
            throw std::runtime_error(std::string("Array ") + entryname +
                                     " has an entry that is not a string.");
        }
        result.push_back(e.get<std::string>());
    }
    return result;
}

} // namespace

Config load_config_json(const std::filesystem::path &path, Config defaults) {
    Config c = std::move(defaults);
    const json data = parse_json_file(path);
    if(data.contains("markdown")) {
        c.markdown = extract_stringarray(data, "markdown");
    }
    if(data.contains("covers")) {
        c.covers = extract_stringarray(data, "covers");
    }
    if(data.contains("metadata")) {
        c.metadata = get_string(data, "metadata");
    }
    if(data.contains("stylesheet")) {
        c.stylesheet = get_string(data, "stylesheet");
    }
    if(data.contains("templates")) {
        c.templates = get_string(data, "templates");
    }
    if(data.contains("toc_title")) {
        c.toc_title = get_string(data, "toc_title");
    }
    return c;
}

PublicationMetadata load_publication_json(const std::filesystem::path &path) {
    PublicationMetadata m;
    const json data = parse_json_file(path);
    m.title = get_string(data, "title");
    if(!data.contains("language")) {
        throw std::runtime_error("Missing required key language.");
    }
    m.languages = extract_stringarray(data, "language");
    if(m.languages.empty()) {
        throw std::runtime_error("At least one publication language must be given.");
    }
    m.identifier = get_optional_string(data, "identifier");
    if(m.identifier.empty()) {
        m.identifier = "urn:uuid:" + random_uuid();
    }
    m.subtitle = get_optional_string(data, "subtitle");
    m.creators = extract_stringarray(data, "creator");
    m.publisher = get_optional_string(data, "publisher");
    m.description = get_optional_string(data, "description");
    m.date = get_optional_string(data, "date");
    m.rights = get_optional_string(data, "rights");
    m.subjects = extract_stringarray(data, "subject");
    return m;
}
