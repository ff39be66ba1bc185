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

#include <pagedread/logging.hpp>
#include <pagedread/ops.hpp>
#include <pagedread/reader/buffered.hpp>
#include <pagedread/reader/direct.hpp>
#include <pagedread/source/counting.hpp>
#include <stdplus/fd/ops.hpp>

#include <algorithm>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <vector>

namespace pagedread
{
namespace ops
{

namespace
{

void checkStride(size_t stride)
{
    if (stride == 0)
    {
        throw std::invalid_argument("Stride cannot be 0");
    }
}

} // namespace

uint64_t read(Reader& reader, uint64_t offset, stdplus::Fd& out,
              uint64_t max_size, size_t stride)
{
    checkStride(stride);
    std::vector<std::byte> buf_v(stride);
    const stdplus::span<std::byte> buf(buf_v);
    uint64_t copied = 0;
    while (copied < max_size)
    {
        const size_t want = std::min<uint64_t>(stride, max_size - copied);
        auto ret = reader.readAt(buf.subspan(0, want), offset + copied);
        log(LogLevel::Info, " RD@{}#{}", offset + copied, ret.size());
        if (ret.size() == 0)
        {
            break;
        }
        stdplus::fd::writeExact(out, ret);
        copied += ret.size();
    }
    log(LogLevel::Info, "\n");
    return copied;
}

void verify(Reader& expected, Reader& actual, uint64_t offset,
            uint64_t max_size, size_t stride)
{
    checkStride(stride);
    std::vector<std::byte> expected_v(stride), actual_v(stride);
    const stdplus::span<std::byte> expected_buf(expected_v),
        actual_buf(actual_v);
    uint64_t done = 0;
    while (done < max_size)
    {
        const size_t want = std::min<uint64_t>(stride, max_size - done);
        auto e = expected.readAt(expected_buf.subspan(0, want), offset + done);
        auto a = actual.readAt(actual_buf.subspan(0, want), offset + done);
        log(LogLevel::Info, " VF@{}#{}/{}", offset + done, e.size(),
            a.size());
        auto compared = std::min(e.size(), a.size());
        auto mismatch = std::mismatch(e.begin(), e.begin() + compared,
                                      a.begin());
        if (mismatch.first != e.begin() + compared)
        {
            log(LogLevel::Info, "\n");
            throw std::runtime_error(fmt::format(
                "Byte mismatch at {}",
                offset + done + (mismatch.first - e.begin())));
        }
        if (e.size() != a.size())
        {
            log(LogLevel::Info, "\n");
            throw std::runtime_error(
                fmt::format("Length mismatch at {}: {}B != {}B",
                            offset + done, e.size(), a.size()));
        }
        if (e.size() == 0)
        {
            break;
        }
        done += e.size();
    }
    log(LogLevel::Info, "\n");
}

BenchResult bench(const Source& source, size_t capacity, uint64_t offset,
                  uint64_t max_size, size_t stride)
{
    checkStride(stride);
    source::Counting counting(source);
    std::unique_ptr<Reader> rd;
    if (capacity == 0)
    {
        rd = std::make_unique<reader::Direct>(counting);
    }
    else
    {
        rd = std::make_unique<reader::Buffered>(counting, capacity);
    }

    BenchResult ret;
    std::vector<std::byte> buf_v(stride);
    const stdplus::span<std::byte> buf(buf_v);
    const auto start = std::chrono::steady_clock::now();
    while (ret.bytes < max_size)
    {
        const size_t want = std::min<uint64_t>(stride, max_size - ret.bytes);
        auto n = rd->readAt(buf.subspan(0, want), offset + ret.bytes);
        ret.requests++;
        if (n.size() == 0)
        {
            break;
        }
        ret.bytes += n.size();
    }
    ret.elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start);
    ret.source_reads = counting.getReads();
    ret.source_bytes = counting.getBytes();
    log(LogLevel::Info, "Bench cap={} requests={} source_reads={}\n", capacity,
        ret.requests, ret.source_reads);
    return ret;
}

} // namespace ops
} // namespace pagedread
