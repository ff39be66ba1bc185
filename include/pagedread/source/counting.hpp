#pragma once
#include <pagedread/source.hpp>

#include <atomic>
#include <cstdint>

namespace pagedread
{
namespace source
{

/** @brief Forwards to another source while counting primitive reads. */
class Counting : public Source
{
  public:
    explicit Counting(const Source& inner);

    stdplus::span<std::byte> readAt(stdplus::span<std::byte> buf,
                                    uint64_t offset) const override;

    inline uint64_t getReads() const
    {
        return reads.load(std::memory_order_relaxed);
    }
    inline uint64_t getBytes() const
    {
        return bytes.load(std::memory_order_relaxed);
    }
    void reset();

  private:
    const Source* inner;
    mutable std::atomic<uint64_t> reads = 0;
    mutable std::atomic<uint64_t> bytes = 0;
};

} // namespace source
} // namespace pagedread
