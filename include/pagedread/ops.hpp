#pragma once
#include <pagedread/reader.hpp>
#include <pagedread/source.hpp>
#include <stdplus/fd/intf.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace pagedread
{
namespace ops
{

/** @brief Copies up to max_size bytes starting at offset into out,
 *         stride bytes per request. Stops early at end-of-source.
 *  @return Number of bytes copied
 */
uint64_t read(Reader& reader, uint64_t offset, stdplus::Fd& out,
              uint64_t max_size, size_t stride);

/** @brief Checks that actual returns the same bytes as expected over the
 *         range, stride bytes per request.
 *  @throws std::runtime_error on the first mismatch
 */
void verify(Reader& expected, Reader& actual, uint64_t offset,
            uint64_t max_size, size_t stride);

struct BenchResult
{
    uint64_t requests = 0;
    uint64_t bytes = 0;
    uint64_t source_reads = 0;
    uint64_t source_bytes = 0;
    std::chrono::nanoseconds elapsed{0};
};

/** @brief Sequentially reads the range through a direct reader
 *         (capacity == 0) or a buffered reader of the given capacity,
 *         counting the reads that reach source.
 */
BenchResult bench(const Source& source, size_t capacity, uint64_t offset,
                  uint64_t max_size, size_t stride);

} // namespace ops
} // namespace pagedread
