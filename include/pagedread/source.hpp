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
#include <stdplus/types.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>

namespace pagedread
{

/** @brief Random-access byte provider with positional reads only.
 *
 *  readAt() must not depend on or mutate any cursor state, and must be
 *  callable concurrently through a shared reference.
 */
class Source
{
  public:
    virtual ~Source() = default;

    /** @brief Reads up to buf.size() bytes starting at offset.
     *  @return The filled prefix of buf. Empty at or past end-of-source.
     */
    virtual stdplus::span<std::byte> readAt(stdplus::span<std::byte> buf,
                                            uint64_t offset) const = 0;

    void readAtExact(stdplus::span<std::byte> data, uint64_t offset) const;
};

class SourceType : public ModType<Source>
{
  public:
    virtual std::unique_ptr<Source> open(const ModArgs& args) = 0;
};

extern ModTypeMap<SourceType> sourceTypes;
std::unique_ptr<Source> openSource(ModArgs& args);

} // namespace pagedread
