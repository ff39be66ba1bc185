// Copyright 2021 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once
#include <pagedread/mod.hpp>
#include <pagedread/reader/buffered.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace pagedread
{

struct Args
{
    enum class Op
    {
        Read,
        Verify,
        Bench,
    };
    Op op;
    std::optional<ModArgs> source;
    std::optional<std::string> file;
    size_t capacity = reader::Buffered::defaultCapacity;
    uint64_t offset = 0;
    uint64_t max_size = std::numeric_limits<uint64_t>::max();
    size_t stride = 64;
    uint8_t verbose = 0;

    Args(int argc, char* argv[]);

    static void printHelp(const char* arg0);
    static Args argsOrHelp(int argc, char* argv[]);
};

} // namespace pagedread
