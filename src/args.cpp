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
#include <getopt.h>

#include <pagedread/args.hpp>
#include <pagedread/convert.hpp>
#include <pagedread/source.hpp>

#include <map>
#include <stdexcept>
#include <string>
#include <string_view>

namespace pagedread
{

const std::map<std::string_view, Args::Op> string_to_op = {
    {"read", Args::Op::Read},
    {"verify", Args::Op::Verify},
    {"bench", Args::Op::Bench},
};

Args::Args(int argc, char* argv[])
{
    static const char opts[] = ":c:o:s:S:v";
    static const struct option longopts[] = {
        {"capacity", required_argument, nullptr, 'c'},
        {"offset", required_argument, nullptr, 'o'},
        {"size", required_argument, nullptr, 's'},
        {"stride", required_argument, nullptr, 'S'},
        {"verbose", no_argument, nullptr, 'v'},
        {nullptr, 0, nullptr, 0},
    };
    int c;
    optind = 0;
    while ((c = getopt_long(argc, argv, opts, longopts, nullptr)) > 0)
    {
        switch (c)
        {
            case 'c':
                capacity = toUint64(optarg);
                break;
            case 'o':
                offset = toUint64(optarg);
                break;
            case 's':
                max_size = toUint64(optarg);
                break;
            case 'S':
                stride = toUint64(optarg);
                if (stride == 0)
                {
                    throw std::runtime_error("Stride cannot be 0");
                }
                break;
            case 'v':
                verbose++;
                break;
            case ':':
                throw std::runtime_error(
                    fmt::format("Missing argument for `{}`", argv[optind - 1]));
                break;
            default:
                throw std::runtime_error(fmt::format(
                    "Invalid command line argument `{}`", argv[optind - 1]));
        }
    }

    if (optind == argc)
    {
        throw std::runtime_error("Missing pagedread operation");
    }
    auto it = string_to_op.find(argv[optind]);
    if (it == string_to_op.end())
    {
        throw std::runtime_error(
            fmt::format("Invalid operation: {}", argv[optind]));
    }
    optind++;
    op = it->second;
    switch (op)
    {
        case Args::Op::Read:
            if (optind + 2 != argc)
            {
                throw std::runtime_error("Must specify SOURCE and FILE");
            }
            source.emplace(argv[optind]);
            file.emplace(argv[optind + 1]);
            break;
        case Args::Op::Verify:
        case Args::Op::Bench:
            if (optind + 1 != argc)
            {
                throw std::runtime_error("Must specify SOURCE");
            }
            source.emplace(argv[optind]);
            break;
    }
}

void Args::printHelp(const char* arg0)
{
    fmt::print(stderr, "Usage: {} [OPTION]... read SOURCE FILE\n", arg0);
    fmt::print(stderr, "   or: {} [OPTION]... verify SOURCE\n", arg0);
    fmt::print(stderr, "   or: {} [OPTION]... bench SOURCE\n", arg0);
    fmt::print(stderr, "\n");
    fmt::print(stderr, "Optional Arguments:\n");
    fmt::print(stderr,
               "  -c, --capacity[=SIZE]        Bytes held by the page cache "
               "(default {})\n",
               reader::Buffered::defaultCapacity);
    fmt::print(stderr,
               "  -o, --offset[=OFFSET]        The source offset starting "
               "point\n");
    fmt::print(stderr,
               "  -s, --size[=SIZE]            The max number of bytes to "
               "read\n");
    fmt::print(stderr,
               "  -S, --stride[=SIZE]          The number of bytes per read "
               "request (default 64)\n");
    fmt::print(stderr, "  -v, --verbose                Increases the verbosity "
                       "level of error message output\n");
    fmt::print(stderr, "\n");

    fmt::print(stderr,
               "SOURCE options (separated by ,) (simple is the default):\n");
    for (const auto& [_, type] : sourceTypes)
    {
        type->printHelp();
    }
    fmt::print(stderr, "\n");

    fmt::print(stderr, "Ex: {} -c 4096 -S 512 read data.bin out.bin\n", arg0);
    fmt::print(stderr, "Ex: {} -S 16 bench memory,data.bin\n", arg0);
    fmt::print(stderr, "\n");
}

Args Args::argsOrHelp(int argc, char* argv[])
{
    try
    {
        return Args(argc, argv);
    }
    catch (...)
    {
        printHelp(argv[0]);
        throw;
    }
}

} // namespace pagedread
