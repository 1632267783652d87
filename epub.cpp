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

#include <epub.hpp>
#include <utils.hpp>

#include <cstdio>
#include <stdexcept>
#include <unordered_map>

namespace fs = std::filesystem;

namespace {

// The contents of these files is always the same.

const char mimetext[] = "application/epub+zip";

const char containertext[] = R"(<?xml version="1.0" encoding="UTF-8"?>
<container xmlns="urn:oasis:names:tc:opendocument:xmlns:container" version="1.0">
  <rootfiles>
    <rootfile full-path="OEBPS/content.opf" media-type="application/oebps-package+xml"/>
  </rootfiles>
</container>
)";

const std::unordered_map<std::string, std::string> media_types{
    {".xhtml", "application/xhtml+xml"},
    {".html", "application/xhtml+xml"},
    {".htm", "application/xhtml+xml"},
    {".css", "text/css"},
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".png", "image/png"},
    {".gif", "image/gif"},
    {".svg", "image/svg+xml"},
    {".webp", "image/webp"},
    {".ttf", "font/ttf"},
    {".otf", "font/otf"},
    {".woff", "font/woff"},
    {".woff2", "font/woff2"},
    {".js", "application/javascript"},
    {".mp3", "audio/mpeg"},
    {".m4a", "audio/mp4"},
    {".ogg", "audio/ogg"},
    {".mp4", "video/mp4"},
    {".ncx", "application/x-dtbncx+xml"},
    {".smil", "application/smil+xml"},
    {".pls", "application/pls+xml"},
    {".txt", "text/plain"},
};

// Already compressed formats are stored as is.
const std::unordered_set<std::string> stored_media{
    "image/jpeg", "image/png", "image/gif", "image/webp", "font/woff", "font/woff2",
    "audio/mpeg", "audio/mp4", "audio/ogg", "video/mp4"};

std::string lowercase_extension(const std::string &name) {
    std::string ext = fs::path(name).extension().string();
    for(auto &c : ext) {
        if(c >= 'A' && c <= 'Z') {
            c = c - 'A' + 'a';
        }
    }
    return ext;
}

void check_entry_name(const std::string &name) {
    if(name.empty()) {
        throw std::runtime_error("Archive entry name is empty.");
    }
    const fs::path p(name);
    if(p.is_absolute()) {
        throw std::runtime_error("Archive entry name " + name + " is absolute.");
    }
    for(const auto &component : p) {
        if(component == "..") {
            throw std::runtime_error("Archive entry name " + name + " points outside the book.");
        }
    }
}

std::string zip_error_message(int code) {
    zip_error_t ze;
    zip_error_init_with_code(&ze, code);
    std::string msg = zip_error_strerror(&ze);
    zip_error_fini(&ze);
    return msg;
}

tinyxml2::XMLElement *
add_text_element(tinyxml2::XMLElement *parent, const char *tag, const std::string &text) {
    auto node = parent->GetDocument()->NewElement(tag);
    parent->InsertEndChild(node);
    node->SetText(text.c_str());
    return node;
}

std::string join_properties(const std::vector<std::string> &properties) {
    std::string result;
    for(const auto &p : properties) {
        // Documents marked as cover pages go to the guide instead.
        if(p == "cover") {
            continue;
        }
        if(!result.empty()) {
            result += ' ';
        }
        result += p;
    }
    return result;
}

bool has_property(const std::vector<std::string> &properties, const char *property) {
    for(const auto &p : properties) {
        if(p == property) {
            return true;
        }
    }
    return false;
}

} // namespace

const char *content_type_name(ContentType ct) {
    switch(ct) {
    case ContentType::Primary:
        return "primary";
    case ContentType::Auxiliary:
        return "auxiliary";
    case ContentType::Media:
        return "media";
    }
    return "unknown";
}

std::string media_type_for(const std::string &name) {
    auto it = media_types.find(lowercase_extension(name));
    if(it == media_types.end()) {
        return "application/octet-stream";
    }
    return it->second;
}

EpubWriter::EpubWriter(const fs::path &ofilename) : ofname(ofilename) {
    int errcode = 0;
    archive = zip_open(ofname.c_str(), ZIP_CREATE | ZIP_TRUNCATE, &errcode);
    if(!archive) {
        throw std::runtime_error("Could not create " + ofname.string() + ": " +
                                 zip_error_message(errcode));
    }
    try {
        // The mimetype must be the first entry and it must not be compressed.
        store_buffer("mimetype", mimetext, false);
        store_buffer("META-INF/container.xml", containertext, true);
    } catch(...) {
        zip_discard(archive);
        archive = nullptr;
        throw;
    }
}

EpubWriter::~EpubWriter() {
    if(!archive) {
        return;
    }
    try {
        close();
    } catch(const std::exception &e) {
        fprintf(stderr, "Closing %s failed: %s\n", ofname.c_str(), e.what());
    }
}

void EpubWriter::add(const std::string &name,
                     ContentType ct,
                     std::string_view data,
                     const std::vector<std::string> &properties) {
    register_item(name, ct, properties);
    const bool compress = !stored_media.contains(items.back().media_type);
    store_buffer(content_dir + name, std::string(data), compress);
}

void EpubWriter::add_file(const fs::path &source,
                          const std::string &name,
                          ContentType ct,
                          const std::vector<std::string> &properties) {
    // The file is read when the archive is closed, by which time the working
    // directory may have changed.
    const auto abspath = fs::absolute(source);
    std::error_code ec;
    if(!fs::is_regular_file(abspath, ec)) {
        throw std::runtime_error("Could not read file " + source.generic_string() + ".");
    }
    register_item(name, ct, properties);
    const bool compress = !stored_media.contains(items.back().media_type);
    zip_source_t *src = zip_source_file(archive, abspath.c_str(), 0, -1);
    if(!src) {
        throw std::runtime_error("Could not read file " + source.generic_string() + ": " +
                                 zip_strerror(archive));
    }
    store(content_dir + name, src, compress);
}

void EpubWriter::close() {
    if(!archive) {
        throw std::runtime_error("Archive has already been closed.");
    }
    store_buffer(std::string(content_dir) + "content.opf", generate_opf(), true);
    zip_t *a = archive;
    archive = nullptr;
    if(zip_close(a) != 0) {
        std::string msg = zip_strerror(a);
        zip_discard(a);
        payloads.clear();
        throw std::runtime_error("Could not write " + ofname.string() + ": " + msg);
    }
    payloads.clear();
}

void EpubWriter::register_item(const std::string &name,
                               ContentType ct,
                               const std::vector<std::string> &properties) {
    if(!archive) {
        throw std::runtime_error("Archive has already been closed.");
    }
    check_entry_name(name);
    if(name == "content.opf" || names.contains(name)) {
        throw std::runtime_error("Duplicate archive entry " + name + ".");
    }
    char buf[32];
    snprintf(buf, sizeof(buf), "item%d", (int)items.size() + 1);
    names.insert(name);
    items.push_back(ManifestItem{buf, name, media_type_for(name), ct, properties});
}

void EpubWriter::store_buffer(const std::string &entryname, std::string data, bool compress) {
    payloads.emplace_back(std::move(data));
    const auto &payload = payloads.back();
    zip_source_t *src = zip_source_buffer(archive, payload.data(), payload.size(), 0);
    if(!src) {
        throw std::runtime_error("Could not create archive entry " + entryname + ": " +
                                 zip_strerror(archive));
    }
    store(entryname, src, compress);
}

void EpubWriter::store(const std::string &entryname, zip_source_t *source, bool compress) {
    const zip_int64_t index = zip_file_add(archive, entryname.c_str(), source, ZIP_FL_ENC_UTF_8);
    if(index < 0) {
        zip_source_free(source);
        throw std::runtime_error("Could not add " + entryname + " to archive: " +
                                 zip_strerror(archive));
    }
    if(!compress && zip_set_file_compression(archive, index, ZIP_CM_STORE, 0) != 0) {
        throw std::runtime_error("Could not store " + entryname + " uncompressed: " +
                                 zip_strerror(archive));
    }
}

std::string EpubWriter::generate_opf() const {
    if(metadata.languages.empty()) {
        throw std::runtime_error("Publication language is not set.");
    }
    tinyxml2::XMLDocument opf;

    auto decl = opf.NewDeclaration(nullptr);
    opf.InsertFirstChild(decl);
    auto package = opf.NewElement("package");
    opf.InsertEndChild(package);
    package->SetAttribute("xmlns", "http://www.idpf.org/2007/opf");
    package->SetAttribute("version", "3.0");
    package->SetAttribute("unique-identifier", "pub-id");
    package->SetAttribute("xml:lang", metadata.language().c_str());

    auto metadata_node = opf.NewElement("metadata");
    package->InsertEndChild(metadata_node);
    metadata_node->SetAttribute("xmlns:dc", "http://purl.org/dc/elements/1.1/");
    write_metadata(metadata_node);

    auto manifest = opf.NewElement("manifest");
    package->InsertEndChild(manifest);
    generate_manifest(manifest);

    auto spine = opf.NewElement("spine");
    package->InsertEndChild(spine);
    generate_spine(spine);

    generate_guide(package);

    tinyxml2::XMLPrinter printer;
    opf.Print(&printer);
    return std::string(printer.CStr());
}

void EpubWriter::write_metadata(tinyxml2::XMLElement *metadata_node) const {
    auto opf = metadata_node->GetDocument();

    add_text_element(metadata_node, "dc:identifier", metadata.identifier)
        ->SetAttribute("id", "pub-id");
    add_text_element(metadata_node, "dc:title", metadata.title)->SetAttribute("id", "title");
    auto meta = add_text_element(metadata_node, "meta", "main");
    meta->SetAttribute("refines", "#title");
    meta->SetAttribute("property", "title-type");
    if(!metadata.subtitle.empty()) {
        add_text_element(metadata_node, "dc:title", metadata.subtitle)
            ->SetAttribute("id", "subtitle");
        meta = add_text_element(metadata_node, "meta", "subtitle");
        meta->SetAttribute("refines", "#subtitle");
        meta->SetAttribute("property", "title-type");
    }
    for(const auto &lang : metadata.languages) {
        add_text_element(metadata_node, "dc:language", lang);
    }
    int creator_num = 1;
    for(const auto &creator : metadata.creators) {
        char buf[32];
        snprintf(buf, sizeof(buf), "creator%d", creator_num++);
        add_text_element(metadata_node, "dc:creator", creator)->SetAttribute("id", buf);
    }
    if(!metadata.publisher.empty()) {
        add_text_element(metadata_node, "dc:publisher", metadata.publisher);
    }
    if(!metadata.description.empty()) {
        add_text_element(metadata_node, "dc:description", metadata.description);
    }
    if(!metadata.date.empty()) {
        add_text_element(metadata_node, "dc:date", metadata.date);
    }
    if(!metadata.rights.empty()) {
        add_text_element(metadata_node, "dc:rights", metadata.rights);
    }
    for(const auto &subject : metadata.subjects) {
        add_text_element(metadata_node, "dc:subject", subject);
    }
    add_text_element(metadata_node, "meta", current_timestamp())
        ->SetAttribute("property", "dcterms:modified");

    // For EPUB 2 readers.
    for(const auto &item : items) {
        if(has_property(item.properties, "cover-image")) {
            auto cover = opf->NewElement("meta");
            metadata_node->InsertEndChild(cover);
            cover->SetAttribute("name", "cover");
            cover->SetAttribute("content", item.id.c_str());
            break;
        }
    }
}

void EpubWriter::generate_manifest(tinyxml2::XMLElement *manifest) const {
    auto opf = manifest->GetDocument();
    for(const auto &item : items) {
        auto node = opf->NewElement("item");
        manifest->InsertEndChild(node);
        node->SetAttribute("id", item.id.c_str());
        node->SetAttribute("href", uri_escape(item.href).c_str());
        node->SetAttribute("media-type", item.media_type.c_str());
        const auto properties = join_properties(item.properties);
        if(!properties.empty()) {
            node->SetAttribute("properties", properties.c_str());
        }
    }
}

void EpubWriter::generate_spine(tinyxml2::XMLElement *spine) const {
    auto opf = spine->GetDocument();
    for(const auto &item : items) {
        if(item.ct == ContentType::Media) {
            continue;
        }
        auto node = opf->NewElement("itemref");
        spine->InsertEndChild(node);
        node->SetAttribute("idref", item.id.c_str());
        if(item.ct == ContentType::Auxiliary) {
            node->SetAttribute("linear", "no");
        }
    }
}

void EpubWriter::generate_guide(tinyxml2::XMLElement *package) const {
    auto opf = package->GetDocument();
    for(const auto &item : items) {
        if(item.ct == ContentType::Media || !has_property(item.properties, "cover")) {
            continue;
        }
        auto guide = opf->NewElement("guide");
        package->InsertEndChild(guide);
        auto reference = opf->NewElement("reference");
        guide->InsertEndChild(reference);
        reference->SetAttribute("type", "cover");
        reference->SetAttribute("title", "Cover");
        reference->SetAttribute("href", uri_escape(item.href).c_str());
        return;
    }
}
