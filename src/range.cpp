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

#include <fmt/format.h>

#include <pagedread/range.hpp>

#include <stdexcept>

namespace pagedread
{

Range Range::shiftLeft(uint64_t n) const
{
    if (empty())
    {
        return Range();
    }
    if (n > start_)
    {
        throw std::invalid_argument(fmt::format(
            "Shift {} past range start {}..{}", n, start_, end_));
    }
    return Range(start_ - n, end_ - n);
}

Range Range::shiftRight(uint64_t n) const noexcept
{
    if (empty())
    {
        return Range();
    }
    return Range(start_ + n, end_ + n);
}

} // namespace pagedread
