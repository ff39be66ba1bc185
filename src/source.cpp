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

#include <pagedread/source.hpp>
#include <pagedread/util.hpp>

namespace pagedread
{

void Source::readAtExact(stdplus::span<std::byte> data, uint64_t offset) const
{
    readAtExactWith("Source readAtExact", &Source::readAt, *this, data,
                    offset);
}

ModTypeMap<SourceType> sourceTypes;

std::unique_ptr<Source> openSource(ModArgs& args)
{
    if (args.arr.size() == 1)
    {
        args.arr.insert(args.arr.begin(), "simple");
    }
    return openMod<Source>(sourceTypes, args);
}

} // namespace pagedread
