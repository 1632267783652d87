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

#include <epub.hpp>
#include <nlohmann/json.hpp>

#include <string>
#include <vector>

struct NavigationItem {
    std::string title;
    std::string subtitle;
    int level;
    std::string filename;
    ContentType ct;
};

typedef std::vector<NavigationItem> Navigation;

enum class TocState : int {
    Pending,   // No document has declared itself as the navigation page.
    Satisfied, // One has, no table of contents needs to be generated.
};

/*
 * Collects the table of contents in the order documents are found. The
 * order is never changed afterwards.
 */
class NavigationBuilder {
public:
    void append(NavigationItem item);
    void declare_nav_document() { state = TocState::Satisfied; }

    // No more items can be added after this.
    void freeze() { frozen = true; }

    bool needs_fallback() const { return state == TocState::Pending; }
    TocState toc_state() const { return state; }
    const Navigation &items() const { return nav; }

    nlohmann::json to_json() const;

private:
    Navigation nav;
    TocState state = TocState::Pending;
    bool frozen = false;
};
