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

#include <metadata.hpp>

#include <string>

enum class EntryKind : int {
    SkipSubtree,
    Skip,
    Document,
    Media,
};

class Classifier {
public:
    explicit Classifier(const Config &c) : config(c) {}

    // relpath uses forward slashes and is relative to the source root, which
    // itself is ".".
    EntryKind classify(const std::string &relpath, bool is_directory) const;

private:
    const Config &config;
};
