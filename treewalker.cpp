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

#include <treewalker.hpp>

#include <algorithm>
#include <vector>

namespace fs = std::filesystem;

namespace {

std::vector<std::string> list_directory(const fs::path &dir) {
    std::vector<std::string> names;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    for(; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        names.push_back(it->path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

void walk_directory(const fs::path &dir, const std::string &prefix, const WalkVisitor &visitor) {
    for(const auto &name : list_directory(dir)) {
        const auto path = dir / name;
        const auto relpath = prefix.empty() ? name : prefix + '/' + name;
        std::error_code ec;
        auto st = fs::symlink_status(path, ec);
        if(ec) {
            continue;
        }
        if(fs::is_symlink(st)) {
            st = fs::status(path, ec);
            if(ec || fs::is_directory(st)) {
                continue;
            }
        }
        const bool is_dir = fs::is_directory(st);
        const auto result = visitor(relpath, is_dir);
        if(result == WalkResult::SkipSubtree || !is_dir) {
            continue;
        }
        walk_directory(path, relpath, visitor);
    }
}

} // namespace

void walk_tree(const fs::path &root, const WalkVisitor &visitor) {
    walk_directory(root, std::string{}, visitor);
}
