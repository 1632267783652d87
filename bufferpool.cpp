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

#include <bufferpool.hpp>

BufferPool::Lease BufferPool::checkout() {
    if(idle.empty()) {
        return Lease(*this, std::make_unique<std::string>());
    }
    auto b = std::move(idle.back());
    idle.pop_back();
    b->clear();
    return Lease(*this, std::move(b));
}

void BufferPool::give_back(std::unique_ptr<std::string> b) {
    if(b && idle.size() < max_retained) {
        idle.push_back(std::move(b));
    }
}
