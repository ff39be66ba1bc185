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
#include <fmt/format.h>

#include <stdplus/exception.hpp>
#include <stdplus/types.hpp>

#include <cstdint>
#include <utility>

namespace pagedread
{

/** @brief Repeats a positional read until data is filled.
 *  @throws stdplus::exception::Eof if a read returns no bytes first
 */
template <typename Func, typename Obj, typename... Args>
static void readAtExactWith(const char* name, Func&& func, Obj& obj,
                            stdplus::span<std::byte> data, uint64_t offset,
                            Args&&... args)
{
    while (data.size() > 0)
    {
        auto ret = (obj.*func)(data, offset, std::forward<Args>(args)...);
        if (ret.size() == 0)
        {
            throw stdplus::exception::Eof(
                fmt::format("{} missing {}B at {}", name, data.size(), offset));
        }
        offset += ret.size();
        data = data.subspan(ret.size());
    }
}

} // namespace pagedread
