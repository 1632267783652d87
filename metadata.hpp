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
#include <vector>

struct Config {
    // Patterns are matched against the extension, including the dot.
    std::vector<std::string> markdown{".md", ".markdown", ".mdown", ".mkd"};
    // Patterns are matched against the base name of media files.
    std::vector<std::string> covers{"cover.*", "*-cover.*", "*_cover.*"};
    std::string metadata = "metadata.json";
    std::string stylesheet = "style.css";
    std::string templates = ".templates";
    std::string toc_title = "Оглавление";
    bool verbose = false;
};

struct PublicationMetadata {
    std::string identifier;
    std::string title;
    std::string subtitle;
    // The first one is the language of the publication.
    std::vector<std::string> languages;
    std::vector<std::string> creators;
    std::string publisher;
    std::string description;
    std::string date;
    std::string rights;
    std::vector<std::string> subjects;

    const std::string &language() const { return languages.front(); }
};

// Overlays the keys found in the file on top of the defaults.
Config load_config_json(const std::filesystem::path &path, Config defaults = Config{});

PublicationMetadata load_publication_json(const std::filesystem::path &path);
