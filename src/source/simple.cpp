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

#include <unistd.h>

#include <fmt/format.h>

#include <pagedread/source/simple.hpp>
#include <stdplus/fd/create.hpp>
#include <stdplus/util/cexec.hpp>

#include <memory>
#include <utility>

namespace pagedread
{
namespace source
{

Simple::Simple(stdplus::ManagedFd&& fd) : fd(std::move(fd))
{}

stdplus::span<std::byte> Simple::readAt(stdplus::span<std::byte> buf,
                                        uint64_t offset) const
{
    auto ret = CHECK_ERRNO(
        ::pread(fd.get(), buf.data(), buf.size(), static_cast<off_t>(offset)),
        "pread");
    return buf.subspan(0, ret);
}

class SimpleType : public SourceType
{
  public:
    std::unique_ptr<Source> open(const ModArgs& args) override
    {
        if (args.arr.size() != 2)
        {
            throw std::invalid_argument("Requires a single file argument");
        }
        return std::make_unique<Simple>(stdplus::fd::open(
            args.arr[1].c_str(),
            stdplus::fd::OpenFlags(stdplus::fd::OpenAccess::ReadOnly),
            0644));
    }

    void printHelp() const override
    {
        fmt::print(stderr, "  `simple` source\n");
        fmt::print(stderr, "    FILENAME         required  file read with "
                           "pread\n");
    }
};

void registerSimple() __attribute__((constructor));
void registerSimple()
{
    sourceTypes.emplace("simple", std::make_unique<SimpleType>());
}

void unregisterSimple() __attribute__((destructor));
void unregisterSimple()
{
    sourceTypes.erase("simple");
}

} // namespace source
} // namespace pagedread
