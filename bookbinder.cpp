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
#include <metadata.hpp>

#include <glib.h>
#include <cstdio>
#include <memory>

namespace fs = std::filesystem;

namespace {

struct OptionContextCloser {
    void operator()(GOptionContext *c) const noexcept { g_option_context_free(c); }
};

struct GStrvCloser {
    void operator()(gchar **v) const noexcept { g_strfreev(v); }
};

struct GFreer {
    void operator()(gchar *p) const noexcept { g_free(p); }
};

fs::path default_output(const fs::path &source) {
    auto dir = fs::absolute(source).lexically_normal();
    if(!dir.has_filename()) {
        dir = dir.parent_path();
    }
    auto name = dir.filename().string();
    if(name.empty() || name == "/") {
        name = "book";
    }
    return fs::path(name + ".epub");
}

} // namespace

int main(int argc, char **argv) {
    gchar *output_arg = nullptr;
    gchar *config_arg = nullptr;
    gboolean verbose = FALSE;
    gchar **remaining_arg = nullptr;
    GOptionEntry entries[] = {
        {"output", 'o', 0, G_OPTION_ARG_FILENAME, &output_arg, "Output file", "FILE"},
        {"config", 'c', 0, G_OPTION_ARG_FILENAME, &config_arg, "Configuration file", "FILE"},
        {"verbose", 'v', 0, G_OPTION_ARG_NONE, &verbose, "Print every file added", nullptr},
        {G_OPTION_REMAINING,
         0,
         0,
         G_OPTION_ARG_FILENAME_ARRAY,
         &remaining_arg,
         nullptr,
         "SOURCE_DIR"},
        {nullptr, 0, 0, G_OPTION_ARG_NONE, nullptr, nullptr, nullptr}};

    std::unique_ptr<GOptionContext, OptionContextCloser> context(
        g_option_context_new("SOURCE_DIR - compile a directory of markdown files into an EPUB"));
    g_option_context_add_main_entries(context.get(), entries, nullptr);
    GError *err = nullptr;
    const bool parsed = g_option_context_parse(context.get(), &argc, &argv, &err);
    std::unique_ptr<gchar, GFreer> output(output_arg);
    std::unique_ptr<gchar, GFreer> config_file(config_arg);
    std::unique_ptr<gchar *, GStrvCloser> remaining(remaining_arg);
    if(!parsed) {
        fprintf(stderr, "%s\n", err->message);
        g_error_free(err);
        return 1;
    }
    if(!remaining || !remaining.get()[0] || remaining.get()[1]) {
        fprintf(stderr, "%s [-o OUTPUT] [-c CONFIG] [-v] SOURCE_DIR\n", argv[0]);
        return 1;
    }
    const fs::path source(remaining.get()[0]);

    try {
        Config config = config_file ? load_config_json(config_file.get()) : Config{};
        config.verbose = verbose;
        const fs::path ofname = output ? fs::path(output.get()) : default_output(source);
        const auto summary = compile(source, ofname, config);
        if(config.verbose) {
            printf("Wrote %s with %d documents.\n",
                   ofname.c_str(),
                   (int)summary.navigation.size());
        }
    } catch(const std::exception &e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
    return 0;
}
