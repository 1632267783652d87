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

#include <metadata.hpp>
#include <tinyxml2.h>
#include <zip.h>

#include <filesystem>
#include <list>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

enum class ContentType : int {
    Primary,   // Part of the linear reading order.
    Auxiliary, // In the spine, but not linear.
    Media,     // Manifest only.
};

const char *content_type_name(ContentType ct);

std::string media_type_for(const std::string &name);

/*
 * Writes an EPUB 3 container. Entries are collected as they are added and
 * the package document is written when the writer is closed. Set metadata
 * before adding anything.
 *
 * If the writer is destroyed without being closed, it is closed then and
 * any failure is only reported on stderr.
 */
class EpubWriter {
public:
    explicit EpubWriter(const std::filesystem::path &ofilename);
    ~EpubWriter();

    EpubWriter(const EpubWriter &) = delete;
    EpubWriter &operator=(const EpubWriter &) = delete;

    void add(const std::string &name,
             ContentType ct,
             std::string_view data,
             const std::vector<std::string> &properties = {});
    void add_file(const std::filesystem::path &source,
                  const std::string &name,
                  ContentType ct,
                  const std::vector<std::string> &properties = {});

    void close();

    bool is_open() const { return archive != nullptr; }

    PublicationMetadata metadata;

    static constexpr const char *content_dir = "OEBPS/";

private:
    struct ManifestItem {
        std::string id;
        std::string href;
        std::string media_type;
        ContentType ct;
        std::vector<std::string> properties;
    };

    void register_item(const std::string &name,
                       ContentType ct,
                       const std::vector<std::string> &properties);
    void store_buffer(const std::string &entryname, std::string data, bool compress);
    void store(const std::string &entryname, zip_source_t *source, bool compress);

    std::string generate_opf() const;
    void write_metadata(tinyxml2::XMLElement *metadata_node) const;
    void generate_manifest(tinyxml2::XMLElement *manifest) const;
    void generate_spine(tinyxml2::XMLElement *spine) const;
    void generate_guide(tinyxml2::XMLElement *package) const;

    zip_t *archive = nullptr;
    std::filesystem::path ofname;
    std::vector<ManifestItem> items;
    std::unordered_set<std::string> names;
    // libzip reads buffers only when the archive is closed.
    std::list<std::string> payloads;
};
