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

#include <bufferpool.hpp>
#include <classifier.hpp>
#include <epub.hpp>
#include <metadata.hpp>
#include <navigation.hpp>
#include <templates.hpp>
#include <treewalker.hpp>

#include <filesystem>
#include <optional>
#include <string>

enum class CoverState : int {
    Unassigned,
    Assigned,
};

// State shared by all processors during one traversal.
struct CompilerState {
    std::optional<std::string> stylesheet;
    std::string language;
    CoverState cover = CoverState::Unassigned;
    std::string cover_file;
    NavigationBuilder nav;
};

struct CompileSummary {
    Navigation navigation;
    std::string cover_file;
    bool generated_toc;
};

extern const char toc_filename[];
extern const char untitled_title[];
extern const char stylesheet_key[];

class DocumentProcessor {
public:
    DocumentProcessor(const Config &c,
                      CompilerState &s,
                      TemplateSet &t,
                      EpubWriter &w,
                      BufferPool &p)
        : config(c), state(s), templates(t), writer(w), pool(p) {}

    void process(const std::string &relpath);

private:
    const Config &config;
    CompilerState &state;
    TemplateSet &templates;
    EpubWriter &writer;
    BufferPool &pool;
};

class MediaProcessor {
public:
    MediaProcessor(const Config &c, CompilerState &s, EpubWriter &w)
        : config(c), state(s), writer(w) {}

    void process(const std::string &relpath);

private:
    const Config &config;
    CompilerState &state;
    EpubWriter &writer;
};

/*
 * Walks the current directory, which must be the root of the book sources,
 * and feeds everything into the writer. Lives for exactly one traversal.
 */
class EpubCompiler {
public:
    EpubCompiler(const Config &c,
                 const PublicationMetadata &pubmeta,
                 TemplateSet &t,
                 EpubWriter &w);

    void run();

    CompileSummary summary() const;

private:
    WalkResult visit(const std::string &relpath, bool is_directory);
    void write_fallback_toc();

    const Config &config;
    TemplateSet &templates;
    EpubWriter &writer;
    CompilerState state;
    BufferPool pool;
    Classifier classifier;
    DocumentProcessor documents;
    MediaProcessor media;
    bool generated_toc = false;
};

// Relative path of target as seen from the directory of the document docpath.
std::string relative_to_document(const std::string &target, const std::string &docpath);

CompileSummary compile(const std::filesystem::path &source,
                       const std::filesystem::path &output,
                       const Config &config);
