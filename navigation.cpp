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

#include <navigation.hpp>
#include <utils.hpp>

#include <stdexcept>

void NavigationBuilder::append(NavigationItem item) {
    if(frozen) {
        throw std::logic_error("Navigation can not be changed after traversal.");
    }
    nav.emplace_back(std::move(item));
}

nlohmann::json NavigationBuilder::to_json() const {
    auto result = nlohmann::json::array();
    for(const auto &item : nav) {
        result.push_back({{"title", item.title},
                          {"subtitle", item.subtitle},
                          {"level", item.level},
                          {"filename", item.filename},
                          {"href", uri_escape(item.filename)},
                          {"type", content_type_name(item.ct)}});
    }
    return result;
}
