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

#include <templates.hpp>
#include <utils.hpp>

#include <array>
#include <stdexcept>

namespace {

const char page_template[] = R"tmpl(<!DOCTYPE html>
<html xmlns="http://www.w3.org/1999/xhtml" xmlns:epub="http://www.idpf.org/2007/ops" xml:lang="{{ escape(lang) }}" lang="{{ escape(lang) }}">
<head>
<meta charset="utf-8" />
<title>{{ escape(title) }}</title>
{% if exists("global_css") %}
<link rel="stylesheet" type="text/css" href="{{ escape(global_css) }}" />
{% endif %}
</head>
<body>
{{ content }}
</body>
</html>
)tmpl";

const char nav_template[] = R"tmpl(<!DOCTYPE html>
<html xmlns="http://www.w3.org/1999/xhtml" xmlns:epub="http://www.idpf.org/2007/ops" xml:lang="{{ escape(lang) }}" lang="{{ escape(lang) }}">
<head>
<meta charset="utf-8" />
<title>{{ escape(title) }}</title>
{% if exists("global_css") %}
<link rel="stylesheet" type="text/css" href="{{ escape(global_css) }}" />
{% endif %}
</head>
<body>
<nav epub:type="toc" id="toc">
{{ content }}
</nav>
</body>
</html>
)tmpl";

const char toc_template[] = R"tmpl(<!DOCTYPE html>
<html xmlns="http://www.w3.org/1999/xhtml" xmlns:epub="http://www.idpf.org/2007/ops" xml:lang="{{ escape(lang) }}" lang="{{ escape(lang) }}">
<head>
<meta charset="utf-8" />
<title>{{ escape(title) }}</title>
{% if exists("global_css") %}
<link rel="stylesheet" type="text/css" href="{{ escape(global_css) }}" />
{% endif %}
</head>
<body>
<nav epub:type="toc" id="toc">
<h1>{{ escape(title) }}</h1>
<ol>
{% for item in toc %}
<li class="toc-level-{{ item.level }} toc-{{ item.type }}"><a href="{{ escape(item.href) }}">{{ escape(item.title) }}</a>{% if item.subtitle != "" %} <span class="subtitle">{{ escape(item.subtitle) }}</span>{% endif %}</li>
{% endfor %}
</ol>
</nav>
</body>
</html>
)tmpl";

const std::array<std::pair<const char *, const char *>, 3> builtin_templates{
    {{"page", page_template}, {"nav", nav_template}, {"toc", toc_template}}};

} // namespace

TemplateSet::TemplateSet() {
    env.set_trim_blocks(true);
    env.set_lstrip_blocks(true);
    env.add_callback("escape", 1, [](inja::Arguments &args) {
        return xml_escape(args.at(0)->get<std::string>());
    });
    for(const auto &[name, source] : builtin_templates) {
        set(name, source);
    }
}

void TemplateSet::load_overrides(const std::filesystem::path &dir) {
    std::error_code ec;
    if(!std::filesystem::is_directory(dir, ec)) {
        return;
    }
    for(const auto &entry : builtin_templates) {
        const auto fname = dir / (std::string(entry.first) + ".xhtml");
        if(std::filesystem::exists(fname, ec)) {
            set(entry.first, read_file(fname));
        }
    }
}

void TemplateSet::set(const std::string &name, std::string_view source) {
    templates.insert_or_assign(name, env.parse(source));
}

std::string TemplateSet::render(const std::string &name, const nlohmann::json &data) {
    auto it = templates.find(name);
    if(it == templates.end()) {
        throw std::runtime_error("Unknown template " + name + ".");
    }
    return env.render(it->second, data);
}
