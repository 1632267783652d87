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

#include <utils.hpp>
#include <glib.h>

#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <time.h>

namespace {

struct GFreer {
    void operator()(gchar *p) const noexcept { g_free(p); }
};

std::string take_gstring(gchar *s) {
    std::unique_ptr<gchar, GFreer> holder(s);
    return std::string(holder.get());
}

} // namespace

std::vector<std::string> split_to_words(std::string_view in_text) {
    std::vector<std::string> words;
    std::string val;
    for(char c : in_text) {
        if(c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == ',') {
            if(!val.empty()) {
                words.emplace_back(std::move(val));
                val.clear();
            }
        } else {
            val.push_back(c);
        }
    }
    if(!val.empty()) {
        words.emplace_back(std::move(val));
    }
    return words;
}

std::string read_file(const std::filesystem::path &p) {
    std::ifstream input(p, std::ios::in | std::ios::binary);
    if(input.fail()) {
        throw std::runtime_error("Could not open file " + p.string() + ".");
    }
    std::string contents((std::istreambuf_iterator<char>(input)),
                         std::istreambuf_iterator<char>());
    if(input.bad()) {
        throw std::runtime_error("Could not read file " + p.string() + ".");
    }
    return contents;
}

bool is_valid_utf8(std::string_view text) {
    return g_utf8_validate(text.data(), text.size(), nullptr);
}

bool matches_any(const std::string &name, const std::vector<std::string> &patterns) {
    const auto lowered = take_gstring(g_ascii_strdown(name.c_str(), name.size()));
    for(const auto &pattern : patterns) {
        const auto lowpat = take_gstring(g_ascii_strdown(pattern.c_str(), pattern.size()));
        if(g_pattern_match_simple(lowpat.c_str(), lowered.c_str())) {
            return true;
        }
    }
    return false;
}

std::string xml_escape(std::string_view text) {
    return take_gstring(g_markup_escape_text(text.data(), text.size()));
}

std::string uri_escape(const std::string &path) {
    return take_gstring(g_uri_escape_string(path.c_str(), "/", TRUE));
}

std::string base_name(const std::string &relpath) {
    const auto p = relpath.rfind('/');
    if(p == std::string::npos) {
        return relpath;
    }
    return relpath.substr(p + 1);
}

std::string current_timestamp() {
    char buf[200];
    time_t t;
    struct tm tmp;
    t = time(NULL);
    if(gmtime_r(&t, &tmp) == NULL) {
        throw std::runtime_error("Could not get current time.");
    }

    if(strftime(buf, 200, "%Y-%m-%dT%H:%M:%SZ", &tmp) == 0) {
        throw std::runtime_error("Could not format current time.");
    }
    return std::string{buf};
}

std::string random_uuid() { return take_gstring(g_uuid_string_random()); }
