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

#include <classifier.hpp>
#include <utils.hpp>

#include <filesystem>

EntryKind Classifier::classify(const std::string &relpath, bool is_directory) const {
    const auto name = base_name(relpath);
    if(name.empty()) {
        return EntryKind::Skip;
    }
    if(is_directory) {
        if(name[0] == '.' && relpath != ".") {
            return EntryKind::SkipSubtree;
        }
        return EntryKind::Skip;
    }
    if(name[0] == '.' || name[0] == '~') {
        return EntryKind::Skip;
    }
    if(matches_any(relpath, {config.metadata})) {
        return EntryKind::Skip;
    }
    const auto ext = std::filesystem::path(name).extension().string();
    if(!ext.empty() && matches_any(ext, config.markdown)) {
        return EntryKind::Document;
    }
    return EntryKind::Media;
}
