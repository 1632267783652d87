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

#include <compiler.hpp>
#include <frontmatter.hpp>
#include <markdown.hpp>
#include <normalizer.hpp>
#include <utils.hpp>

#include <cstdio>
#include <stdexcept>

namespace fs = std::filesystem;

const char toc_filename[] = "_toc.xhtml";
const char untitled_title[] = "* * *";
const char stylesheet_key[] = "global_css";

namespace {

const char xml_header[] = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";

class WorkingDirectory {
public:
    explicit WorkingDirectory(const fs::path &dir) : previous(fs::current_path()) {
        fs::current_path(dir);
    }

    ~WorkingDirectory() {
        std::error_code ec;
        fs::current_path(previous, ec);
        if(ec) {
            fprintf(stderr,
                    "Could not return to directory %s: %s\n",
                    previous.c_str(),
                    ec.message().c_str());
        }
    }

    WorkingDirectory(const WorkingDirectory &) = delete;
    WorkingDirectory &operator=(const WorkingDirectory &) = delete;

private:
    fs::path previous;
};

} // namespace

std::string relative_to_document(const std::string &target, const std::string &docpath) {
    const auto rel = fs::path(target).lexically_relative(fs::path(docpath).parent_path());
    if(rel.empty()) {
        throw std::runtime_error("Can not express " + target + " relative to " + docpath + ".");
    }
    return rel.generic_string();
}

void DocumentProcessor::process(const std::string &relpath) {
    auto src = read_front_matter(relpath);
    auto &meta = src.meta;

    auto lang = meta_string(meta, "lang");
    if(lang.empty()) {
        lang = state.language;
    }
    meta["lang"] = lang;
    auto title = meta_string(meta, "title");
    if(title.empty()) {
        title = untitled_title;
    }
    meta["title"] = title;
    const auto subtitle = meta_string(meta, "subtitle");
    const int level = meta_int(meta, "level");
    const ContentType ct = meta_bool(meta, "hidden") ? ContentType::Auxiliary : ContentType::Primary;

    if(state.stylesheet) {
        meta[stylesheet_key] = uri_escape(relative_to_document(*state.stylesheet, relpath));
    }

    {
        auto canonical = pool.checkout();
        normalize_markup(markdown_to_xhtml(src.body), *canonical);
        meta["content"] = *canonical;
    }

    const char *template_name = "page";
    auto properties = meta_quick_list(meta, "properties");
    for(auto &property : properties) {
        if(property == "nav") {
            template_name = "nav";
            state.nav.declare_nav_document();
        } else if(property == "cover-image") {
            // Only valid for images, documents get the guide entry instead.
            property = "cover";
        }
    }

    auto page = pool.checkout();
    page->append(xml_header);
    page->append(templates.render(template_name, meta));

    const auto ofname = fs::path(relpath).replace_extension(".xhtml").generic_string();
    state.nav.append(NavigationItem{title, subtitle, level, ofname, ct});
    if(config.verbose) {
        printf("Adding %s as %s (%s).\n", relpath.c_str(), ofname.c_str(), template_name);
    }
    writer.add(ofname, ct, *page, properties);
}

void MediaProcessor::process(const std::string &relpath) {
    std::vector<std::string> properties;
    if(state.cover == CoverState::Unassigned && matches_any(base_name(relpath), config.covers)) {
        properties.emplace_back("cover-image");
        state.cover = CoverState::Assigned;
        state.cover_file = relpath;
    }
    if(config.verbose) {
        printf("Adding %s%s.\n", relpath.c_str(), properties.empty() ? "" : " as cover image");
    }
    writer.add_file(relpath, relpath, ContentType::Media, properties);
}

EpubCompiler::EpubCompiler(const Config &c,
                           const PublicationMetadata &pubmeta,
                           TemplateSet &t,
                           EpubWriter &w)
    : config(c), templates(t), writer(w), classifier(c), documents(c, state, t, w, pool),
      media(c, state, w) {
    state.language = pubmeta.language();
    std::error_code ec;
    if(!config.stylesheet.empty() && fs::exists(config.stylesheet, ec)) {
        state.stylesheet = fs::path(config.stylesheet).lexically_normal().generic_string();
    }
}

void EpubCompiler::run() {
    walk_tree(".", [this](const std::string &relpath, bool is_directory) {
        return visit(relpath, is_directory);
    });
    state.nav.freeze();
    if(state.nav.needs_fallback()) {
        write_fallback_toc();
    }
}

CompileSummary EpubCompiler::summary() const {
    return CompileSummary{state.nav.items(), state.cover_file, generated_toc};
}

WalkResult EpubCompiler::visit(const std::string &relpath, bool is_directory) {
    switch(classifier.classify(relpath, is_directory)) {
    case EntryKind::SkipSubtree:
        return WalkResult::SkipSubtree;
    case EntryKind::Skip:
        return WalkResult::SkipEntry;
    case EntryKind::Document:
        documents.process(relpath);
        return WalkResult::Continue;
    case EntryKind::Media:
        media.process(relpath);
        return WalkResult::Continue;
    }
    return WalkResult::SkipEntry;
}

void EpubCompiler::write_fallback_toc() {
    nlohmann::json data{
        {"lang", state.language}, {"title", config.toc_title}, {"toc", state.nav.to_json()}};
    if(state.stylesheet) {
        // The table of contents is in the top directory.
        data[stylesheet_key] = uri_escape(*state.stylesheet);
    }
    auto page = pool.checkout();
    page->append(xml_header);
    page->append(templates.render("toc", data));
    if(config.verbose) {
        printf("Adding generated table of contents %s.\n", toc_filename);
    }
    writer.add(toc_filename, ContentType::Auxiliary, *page, {"nav"});
    generated_toc = true;
}

CompileSummary compile(const fs::path &source, const fs::path &output, const Config &config) {
    const auto ofname = fs::absolute(output);
    WorkingDirectory workdir(source);
    const auto pubmeta = load_publication_json(config.metadata);
    TemplateSet templates;
    if(!config.templates.empty()) {
        templates.load_overrides(config.templates);
    }
    EpubWriter writer(ofname);
    writer.metadata = pubmeta;
    EpubCompiler compiler(config, pubmeta, templates, writer);
    compiler.run();
    writer.close();
    return compiler.summary();
}
