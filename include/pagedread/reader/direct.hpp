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
#include <pagedread/reader.hpp>
#include <pagedread/source.hpp>

namespace pagedread
{
namespace reader
{

/** @brief Unbuffered reader, every request goes to the source. */
class Direct : public Reader
{
  public:
    explicit Direct(const Source& source);

    stdplus::span<std::byte> readAt(stdplus::span<std::byte> buf,
                                    uint64_t offset) override;

  private:
    const Source* source;
};

} // namespace reader
} // namespace pagedread
