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

#include <pagedread/logging.hpp>
#include <pagedread/reader/buffered.hpp>

#include <cstring>
#include <utility>

namespace pagedread
{
namespace reader
{

Buffered::Buffered(const Source& source, size_t capacity) :
    source(&source), page(capacity), spare(capacity)
{}

bool Buffered::contains(const Range& r) const
{
    return range.intersect(r) == r;
}

void Buffered::invalidate()
{
    range = Range();
}

void Buffered::loadPage(uint64_t offset)
{
    auto ret = source->readAt(spare, offset);
    std::swap(page, spare);
    range = Range::at(offset, ret.size());
    log(LogLevel::Debug, "Page load @{}#{} got {}B\n", offset, page.size(),
        ret.size());
}

stdplus::span<std::byte> Buffered::readAt(stdplus::span<std::byte> buf,
                                          uint64_t offset)
{
    if (buf.size() > capacity())
    {
        log(LogLevel::Debug, "Page bypass @{}#{}\n", offset, buf.size());
        return source->readAt(buf, offset);
    }

    const auto requested = Range::at(offset, buf.size());
    auto available = range.intersect(requested);
    if (available.size() < buf.size())
    {
        loadPage(offset);
        available = range.intersect(requested);
    }
    if (available.empty())
    {
        return buf.subspan(0, 0);
    }

    const auto src = available.shiftLeft(range.start());
    const auto dst = available.shiftLeft(requested.start());
    std::memcpy(buf.data() + dst.start(), page.data() + src.start(),
                available.size());
    return buf.subspan(dst.start(), dst.size());
}

BufferedOwning::BufferedOwning(std::unique_ptr<Source>&& source,
                               size_t capacity) :
    Buffered(*source, capacity),
    source(std::move(source))
{}

} // namespace reader
} // namespace pagedread
