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

#include <pagedread/source/counting.hpp>

namespace pagedread
{
namespace source
{

Counting::Counting(const Source& inner) : inner(&inner)
{}

stdplus::span<std::byte> Counting::readAt(stdplus::span<std::byte> buf,
                                          uint64_t offset) const
{
    reads.fetch_add(1, std::memory_order_relaxed);
    auto ret = inner->readAt(buf, offset);
    bytes.fetch_add(ret.size(), std::memory_order_relaxed);
    return ret;
}

void Counting::reset()
{
    reads.store(0, std::memory_order_relaxed);
    bytes.store(0, std::memory_order_relaxed);
}

} // namespace source
} // namespace pagedread
