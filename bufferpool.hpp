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

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

/*
 * Keeps a few output buffers around so that every page does not have to
 * grow a fresh one. Not thread safe.
 */
class BufferPool {
public:
    class Lease {
    public:
        Lease(BufferPool &p, std::unique_ptr<std::string> b) : pool(p), buf(std::move(b)) {}
        ~Lease() { pool.give_back(std::move(buf)); }

        Lease(const Lease &) = delete;
        Lease &operator=(const Lease &) = delete;

        std::string &operator*() { return *buf; }
        std::string *operator->() { return buf.get(); }

    private:
        BufferPool &pool;
        std::unique_ptr<std::string> buf;
    };

    explicit BufferPool(size_t max_retained_ = 4) : max_retained(max_retained_) {}

    // The returned buffer is always empty.
    Lease checkout();

    size_t num_idle() const { return idle.size(); }

private:
    void give_back(std::unique_ptr<std::string> b);

    size_t max_retained;
    std::vector<std::unique_ptr<std::string>> idle;
};
