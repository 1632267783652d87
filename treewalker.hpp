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

#include <filesystem>
#include <functional>
#include <string>

enum class WalkResult : int {
    Continue,
    SkipEntry,   // Ignore this entry. Directories are still descended into.
    SkipSubtree, // Ignore this entry and everything below it.
};

typedef std::function<WalkResult(const std::string &relpath, bool is_directory)> WalkVisitor;

/*
 * Depth first walk below root. The entries of every directory are visited
 * in byte order of their names. Paths given to the visitor are relative to
 * root and use forward slashes.
 *
 * Entries that can not be stat'ed and directories that can not be read are
 * silently skipped. Symbolic links to directories are not followed.
 * Exceptions thrown by the visitor end the walk.
 */
void walk_tree(const std::filesystem::path &root, const WalkVisitor &visitor);
