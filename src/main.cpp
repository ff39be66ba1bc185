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

#include <pagedread/args.hpp>
#include <pagedread/logging.hpp>
#include <pagedread/ops.hpp>
#include <pagedread/reader/buffered.hpp>
#include <pagedread/reader/direct.hpp>
#include <pagedread/source.hpp>
#include <stdplus/fd/create.hpp>

#include <chrono>
#include <stdexcept>

namespace pagedread
{

void printBench(const char* name, const ops::BenchResult& r)
{
    fmt::print("{:<9} requests={} bytes={} source_reads={} source_bytes={} "
               "elapsed={}us\n",
               name, r.requests, r.bytes, r.source_reads, r.source_bytes,
               std::chrono::duration_cast<std::chrono::microseconds>(r.elapsed)
                   .count());
}

void main_wrapped(int argc, char* argv[])
{
    using stdplus::fd::OpenAccess;
    using stdplus::fd::OpenFlag;
    using stdplus::fd::OpenFlags;

    auto args = Args::argsOrHelp(argc, argv);
    reinterpret_cast<uint8_t&>(logLevel) += args.verbose;

    auto source = openSource(*args.source);
    switch (args.op)
    {
        case Args::Op::Read:
        {
            auto out = stdplus::fd::open(args.file->c_str(),
                                         OpenFlags(OpenAccess::WriteOnly)
                                             .set(OpenFlag::Create)
                                             .set(OpenFlag::Trunc),
                                         0644);
            reader::Buffered buffered(*source, args.capacity);
            auto copied = ops::read(buffered, args.offset, out, args.max_size,
                                    args.stride);
            log(LogLevel::Notice, "Copied {}B from {}\n", copied,
                args.source->arr.back());
        }
        break;
        case Args::Op::Verify:
        {
            reader::Direct direct(*source);
            reader::Buffered buffered(*source, args.capacity);
            ops::verify(direct, buffered, args.offset, args.max_size,
                        args.stride);
        }
        break;
        case Args::Op::Bench:
        {
            printBench("direct", ops::bench(*source, 0, args.offset,
                                            args.max_size, args.stride));
            printBench("buffered",
                       ops::bench(*source, args.capacity, args.offset,
                                  args.max_size, args.stride));
        }
        break;
    }
}

int main(int argc, char* argv[])
{
    try
    {
        main_wrapped(argc, argv);
        return 0;
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "ERROR: {}\n", e.what());
        return 1;
    }
}

} // namespace pagedread

int main(int argc, char* argv[])
{
    return pagedread::main(argc, argv);
}
