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

#include <nlohmann/json.hpp>
#include <inja/inja.hpp>

#include <filesystem>
#include <string>
#include <unordered_map>

/*
 * The page, nav and toc templates. Built in versions are always available,
 * a file called <name>.xhtml in the override directory replaces the
 * corresponding built in one.
 *
 * Templates can call escape(text) to get text escaped for XML.
 */
class TemplateSet {
public:
    TemplateSet();

    void load_overrides(const std::filesystem::path &dir);
    void set(const std::string &name, std::string_view source);

    bool has(const std::string &name) const { return templates.contains(name); }

    std::string render(const std::string &name, const nlohmann::json &data);

private:
    inja::Environment env;
    std::unordered_map<std::string, inja::Template> templates;
};
