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
#include <algorithm>
#include <cstdint>

namespace pagedread
{

/** @brief Half-open interval [start, end) of byte offsets.
 *
 *  Any interval with end <= start is stored as 0..0, so all empty ranges
 *  compare equal.
 */
class Range
{
  public:
    constexpr Range() noexcept = default;
    constexpr Range(uint64_t start, uint64_t end) noexcept :
        start_(end <= start ? 0 : start), end_(end <= start ? 0 : end)
    {}

    static constexpr Range at(uint64_t offset, uint64_t size) noexcept
    {
        return Range(offset, offset + size);
    }

    constexpr uint64_t start() const noexcept
    {
        return start_;
    }
    constexpr uint64_t end() const noexcept
    {
        return end_;
    }
    constexpr uint64_t size() const noexcept
    {
        return end_ - start_;
    }
    constexpr bool empty() const noexcept
    {
        return start_ >= end_;
    }

    constexpr Range intersect(const Range& other) const noexcept
    {
        return Range(std::max(start_, other.start_),
                     std::min(end_, other.end_));
    }

    /** @brief Translates the range down by n.
     *  @throws std::invalid_argument if n > start()
     */
    Range shiftLeft(uint64_t n) const;
    Range shiftRight(uint64_t n) const noexcept;

    constexpr bool operator==(const Range& other) const noexcept
    {
        return start_ == other.start_ && end_ == other.end_;
    }
    constexpr bool operator!=(const Range& other) const noexcept
    {
        return !(*this == other);
    }

  private:
    uint64_t start_ = 0;
    uint64_t end_ = 0;
};

} // namespace pagedread
