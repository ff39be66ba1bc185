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

#include <pagedread/source/memory.hpp>
#include <pagedread/source/simple.hpp>
#include <stdplus/fd/create.hpp>

#include <algorithm>
#include <cstring>
#include <utility>

namespace pagedread
{
namespace source
{

Memory::Memory(std::vector<std::byte>&& data) : data(std::move(data))
{}

stdplus::span<std::byte> Memory::readAt(stdplus::span<std::byte> buf,
                                        uint64_t offset) const
{
    if (offset >= data.size())
    {
        return buf.subspan(0, 0);
    }
    auto ret = buf.subspan(0, std::min<uint64_t>(buf.size(),
                                                 data.size() - offset));
    std::memcpy(ret.data(), &data[offset], ret.size());
    return ret;
}

class MemoryType : public SourceType
{
  public:
    std::unique_ptr<Source> open(const ModArgs& args) override
    {
        if (args.arr.size() != 2)
        {
            throw std::invalid_argument("Requires a single file argument");
        }
        Simple file(stdplus::fd::open(
            args.arr[1].c_str(),
            stdplus::fd::OpenFlags(stdplus::fd::OpenAccess::ReadOnly),
            0644));
        std::vector<std::byte> data;
        uint64_t offset = 0;
        while (true)
        {
            data.resize(offset + loadChunk);
            auto ret = file.readAt(
                stdplus::span<std::byte>(data).subspan(offset), offset);
            offset += ret.size();
            if (ret.size() == 0)
            {
                break;
            }
        }
        data.resize(offset);
        return std::make_unique<Memory>(std::move(data));
    }

    void printHelp() const override
    {
        fmt::print(stderr, "  `memory` source\n");
        fmt::print(stderr, "    FILENAME         required  file loaded into "
                           "memory at open\n");
    }

  private:
    static constexpr size_t loadChunk = 64 * 1024;
};

void registerMemory() __attribute__((constructor));
void registerMemory()
{
    sourceTypes.emplace("memory", std::make_unique<MemoryType>());
}

void unregisterMemory() __attribute__((destructor));
void unregisterMemory()
{
    sourceTypes.erase("memory");
}

} // namespace source
} // namespace pagedread
