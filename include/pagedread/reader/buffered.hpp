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
#include <pagedread/range.hpp>
#include <pagedread/reader.hpp>
#include <pagedread/source.hpp>

#include <cstddef>
#include <memory>
#include <vector>

namespace pagedread
{
namespace reader
{

/** @brief Positional reader with a single page of cache.
 *
 *  Any request not fully resident reloads the whole page starting at the
 *  requested offset. Requests larger than the page bypass it. Forward reads
 *  no larger than the page reload roughly once per capacity() bytes.
 *
 *  The cache is never refreshed on its own; call invalidate() after the
 *  source changes. Not safe for concurrent use, but any number of Buffered
 *  readers may share one source.
 */
class Buffered : public Reader
{
  public:
    static constexpr size_t defaultCapacity = 8 * 1024;

    explicit Buffered(const Source& source,
                      size_t capacity = defaultCapacity);

    /** @brief Reads up to buf.size() bytes at offset.
     *
     *  @return The filled prefix of buf, shorter than buf only at
     *          end-of-source.
     *  @throws Whatever the source throws. A failed reload leaves the
     *          resident page as it was.
     */
    stdplus::span<std::byte> readAt(stdplus::span<std::byte> buf,
                                    uint64_t offset) override;

    inline size_t capacity() const
    {
        return page.size();
    }

    /** @brief Whether all of r is currently resident. */
    bool contains(const Range& r) const;

    inline const Range& resident() const
    {
        return range;
    }

    void invalidate();

  private:
    const Source* source;
    Range range;
    std::vector<std::byte> page;
    /** @brief Reload target, swapped with page once the read succeeds. */
    std::vector<std::byte> spare;

    void loadPage(uint64_t offset);
};

class BufferedOwning : public Buffered
{
  public:
    BufferedOwning(std::unique_ptr<Source>&& source,
                   size_t capacity = defaultCapacity);

  private:
    std::unique_ptr<Source> source;
};

} // namespace reader
} // namespace pagedread
