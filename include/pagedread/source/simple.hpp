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
#include <pagedread/source.hpp>
#include <stdplus/fd/managed.hpp>

namespace pagedread
{
namespace source
{

/** @brief File source backed by pread(2). The fd's own offset is never
 *         used, so the fd may be shared with other users.
 */
class Simple : public Source
{
  public:
    explicit Simple(stdplus::ManagedFd&& fd);

    stdplus::span<std::byte> readAt(stdplus::span<std::byte> buf,
                                    uint64_t offset) const override;

  private:
    stdplus::ManagedFd fd;
};

} // namespace source
} // namespace pagedread
