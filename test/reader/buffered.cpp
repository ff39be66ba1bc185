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

#include <pagedread/reader/buffered.hpp>
#include <pagedread/source/counting.hpp>
#include <pagedread/source/memory.hpp>
#include <pagedread/source/mock.hpp>
#include <stdplus/exception.hpp>

#include <algorithm>
#include <array>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace pagedread
{
namespace reader
{

using testing::_;
using testing::ElementsAre;
using testing::ElementsAreArray;
using testing::Invoke;
using testing::Return;
using testing::SizeIs;

constexpr std::byte operator""_b(unsigned long long t)
{
    return static_cast<std::byte>(t);
}

std::vector<std::byte> makeData(size_t size)
{
    std::vector<std::byte> ret(size);
    for (size_t i = 0; i < size; ++i)
    {
        ret[i] = static_cast<std::byte>(i);
    }
    return ret;
}

class BufferedTest : public testing::Test
{
  protected:
    BufferedTest() : mem(makeData(200)), counting(mem), r(counting, 64)
    {}

    source::Memory mem;
    source::Counting counting;
    Buffered r;
    std::array<std::byte, 4> tmp = {111_b, 111_b, 111_b, 111_b};
};

TEST_F(BufferedTest, Initial)
{
    EXPECT_EQ(r.capacity(), 64);
    EXPECT_EQ(r.resident(), Range());
    EXPECT_FALSE(r.contains(Range(0, 1)));
    EXPECT_TRUE(r.contains(Range()));
}

TEST_F(BufferedTest, DefaultCapacity)
{
    Buffered d(mem);
    EXPECT_EQ(d.capacity(), 8192);
}

TEST_F(BufferedTest, ForwardReads)
{
    EXPECT_THAT(r.readAt(tmp, 0), ElementsAre(0_b, 1_b, 2_b, 3_b));
    EXPECT_EQ(counting.getReads(), 1);
    EXPECT_EQ(r.resident(), Range(0, 64));

    EXPECT_TRUE(r.contains(Range(40, 50)));
    EXPECT_FALSE(r.contains(Range(66, 70)));
    EXPECT_FALSE(r.contains(Range(60, 68)));

    EXPECT_THAT(r.readAt(tmp, 65), ElementsAre(65_b, 66_b, 67_b, 68_b));
    EXPECT_EQ(counting.getReads(), 2);
    EXPECT_EQ(r.resident(), Range(65, 129));
    EXPECT_TRUE(r.contains(Range(70, 74)));

    EXPECT_THAT(r.readAt(tmp, 70), ElementsAre(70_b, 71_b, 72_b, 73_b));
    EXPECT_EQ(counting.getReads(), 2);

    EXPECT_FALSE(r.contains(Range(0, 4)));
    EXPECT_THAT(r.readAt(tmp, 0), ElementsAre(0_b, 1_b, 2_b, 3_b));
    EXPECT_EQ(counting.getReads(), 3);
}

TEST_F(BufferedTest, HitsWithinFirstPage)
{
    r.readAt(tmp, 0);
    ASSERT_EQ(counting.getReads(), 1);
    for (uint64_t off = 0; off + tmp.size() <= 64; ++off)
    {
        ASSERT_TRUE(r.contains(Range::at(off, tmp.size())));
        EXPECT_THAT(r.readAt(tmp, off),
                    ElementsAre(std::byte(off), std::byte(off + 1),
                                std::byte(off + 2), std::byte(off + 3)));
    }
    std::array<std::byte, 64> page;
    EXPECT_THAT(r.readAt(page, 0), ElementsAreArray(makeData(64)));
    EXPECT_EQ(counting.getReads(), 1);
}

TEST_F(BufferedTest, RepeatReadIdempotent)
{
    std::array<std::byte, 8> a, b;
    EXPECT_THAT(r.readAt(a, 10), SizeIs(8));
    const auto resident = r.resident();
    EXPECT_THAT(r.readAt(b, 10), SizeIs(8));
    EXPECT_EQ(a, b);
    EXPECT_EQ(r.resident(), resident);
    EXPECT_EQ(counting.getReads(), 1);
}

TEST_F(BufferedTest, PartialOverlapReloads)
{
    r.readAt(tmp, 0);
    EXPECT_THAT(r.readAt(tmp, 62), ElementsAre(62_b, 63_b, 64_b, 65_b));
    EXPECT_EQ(counting.getReads(), 2);
    EXPECT_EQ(r.resident(), Range(62, 126));
}

TEST_F(BufferedTest, EndOfSource)
{
    auto ret = r.readAt(tmp, 197);
    EXPECT_THAT(ret, ElementsAre(197_b, 198_b, 199_b));
    EXPECT_EQ(tmp[3], 111_b);
    EXPECT_EQ(r.resident(), Range(197, 200));

    EXPECT_THAT(r.readAt(tmp, 200), SizeIs(0));
    EXPECT_EQ(r.resident(), Range());
    EXPECT_THAT(r.readAt(tmp, 1000), SizeIs(0));
}

TEST_F(BufferedTest, ShortPageStillServesHits)
{
    r.readAt(tmp, 180);
    EXPECT_EQ(r.resident(), Range(180, 200));
    EXPECT_THAT(r.readAt(tmp, 190), ElementsAre(190_b, 191_b, 192_b, 193_b));
    EXPECT_EQ(counting.getReads(), 1);
    // Crossing the end is never fully resident, so it reloads
    EXPECT_THAT(r.readAt(tmp, 198), ElementsAre(198_b, 199_b));
    EXPECT_EQ(counting.getReads(), 2);
}

TEST_F(BufferedTest, OversizedBypass)
{
    r.readAt(tmp, 0);
    ASSERT_EQ(r.resident(), Range(0, 64));

    std::vector<std::byte> big(100);
    auto ret = r.readAt(big, 100);
    EXPECT_EQ(ret.size(), 100);
    EXPECT_EQ(std::vector<std::byte>(ret.begin(), ret.end()),
              std::vector<std::byte>(mem.data.begin() + 100, mem.data.end()));
    EXPECT_EQ(r.resident(), Range(0, 64));
    EXPECT_FALSE(r.contains(Range::at(100, 100)));
    EXPECT_EQ(counting.getReads(), 2);
    EXPECT_EQ(counting.getBytes(), 164);

    std::vector<std::byte> tail(65);
    EXPECT_THAT(r.readAt(tail, 150), SizeIs(50));
    EXPECT_EQ(r.resident(), Range(0, 64));
}

TEST_F(BufferedTest, ExactlyCapacityIsCached)
{
    std::array<std::byte, 64> page;
    EXPECT_THAT(r.readAt(page, 10), SizeIs(64));
    EXPECT_EQ(r.resident(), Range(10, 74));
}

TEST_F(BufferedTest, EmptyRequest)
{
    EXPECT_THAT(r.readAt(stdplus::span<std::byte>(), 50), SizeIs(0));
    EXPECT_EQ(counting.getReads(), 0);
}

TEST_F(BufferedTest, StaleUntilInvalidated)
{
    EXPECT_THAT(r.readAt(tmp, 0), ElementsAre(0_b, 1_b, 2_b, 3_b));
    std::fill_n(mem.data.begin(), 4, 100_b);

    EXPECT_TRUE(r.contains(Range(0, 4)));
    EXPECT_THAT(r.readAt(tmp, 0), ElementsAre(0_b, 1_b, 2_b, 3_b));

    r.invalidate();
    EXPECT_FALSE(r.contains(Range(0, 4)));
    EXPECT_EQ(r.resident(), Range());
    EXPECT_THAT(r.readAt(tmp, 0), ElementsAre(100_b, 100_b, 100_b, 100_b));
}

TEST_F(BufferedTest, GrowingSource)
{
    EXPECT_THAT(r.readAt(tmp, 210), SizeIs(0));
    auto more = makeData(200);
    mem.data.insert(mem.data.end(), more.begin(), more.end());
    EXPECT_THAT(r.readAt(tmp, 210), ElementsAre(10_b, 11_b, 12_b, 13_b));
}

TEST_F(BufferedTest, ReadAtExact)
{
    std::array<std::byte, 4> out;
    r.readAtExact(out, 196);
    EXPECT_THAT(out, ElementsAre(196_b, 197_b, 198_b, 199_b));
    EXPECT_THROW(r.readAtExact(out, 198), stdplus::exception::Eof);
}

TEST(BufferedZeroCapacity, PassThrough)
{
    source::Memory mem(makeData(16));
    source::Counting counting(mem);
    Buffered r(counting, 0);
    EXPECT_EQ(r.capacity(), 0);

    std::array<std::byte, 2> tmp;
    EXPECT_THAT(r.readAt(tmp, 3), ElementsAre(3_b, 4_b));
    EXPECT_THAT(r.readAt(tmp, 3), ElementsAre(3_b, 4_b));
    EXPECT_EQ(counting.getReads(), 2);
    EXPECT_EQ(r.resident(), Range());
    EXPECT_THAT(r.readAt(stdplus::span<std::byte>(), 3), SizeIs(0));
    EXPECT_EQ(counting.getReads(), 2);
}

TEST(BufferedMock, ReloadReadsFullPageAtOffset)
{
    testing::StrictMock<source::Mock> mock;
    Buffered r(mock, 8);
    std::array<std::byte, 2> tmp;

    EXPECT_CALL(mock, readAt(SizeIs(8), 5))
        .WillOnce(Invoke([](stdplus::span<std::byte> buf, uint64_t offset) {
            for (size_t i = 0; i < buf.size(); ++i)
            {
                buf[i] = static_cast<std::byte>(offset + i);
            }
            return buf;
        }));
    EXPECT_THAT(r.readAt(tmp, 5), ElementsAre(5_b, 6_b));
    EXPECT_THAT(r.readAt(tmp, 11), ElementsAre(11_b, 12_b));
    EXPECT_TRUE(r.contains(Range(5, 13)));
}

TEST(BufferedMock, BypassForwardsCallerBuffer)
{
    testing::StrictMock<source::Mock> mock;
    Buffered r(mock, 4);
    std::array<std::byte, 6> tmp;

    EXPECT_CALL(mock, readAt(SizeIs(6), 40))
        .WillOnce(Invoke([](stdplus::span<std::byte> buf, uint64_t) {
            return buf.subspan(0, 3);
        }));
    EXPECT_THAT(r.readAt(tmp, 40), SizeIs(3));
    EXPECT_EQ(r.resident(), Range());
}

TEST(BufferedMock, FailedReloadKeepsPage)
{
    testing::StrictMock<source::Mock> mock;
    Buffered r(mock, 4);
    std::array<std::byte, 2> tmp;

    testing::InSequence seq;
    EXPECT_CALL(mock, readAt(SizeIs(4), 0))
        .WillOnce(Invoke([](stdplus::span<std::byte> buf, uint64_t) {
            std::fill(buf.begin(), buf.end(), 7_b);
            return buf;
        }));
    EXPECT_CALL(mock, readAt(SizeIs(4), 20))
        .WillOnce(Invoke([](stdplus::span<std::byte> buf, uint64_t) {
            std::fill(buf.begin(), buf.end(), 9_b);
            throw std::system_error(EIO, std::generic_category(), "pread");
            return buf;
        }));

    EXPECT_THAT(r.readAt(tmp, 0), ElementsAre(7_b, 7_b));
    EXPECT_THROW(r.readAt(tmp, 20), std::system_error);
    EXPECT_EQ(r.resident(), Range(0, 4));
    EXPECT_THAT(r.readAt(tmp, 2), ElementsAre(7_b, 7_b));
}

TEST(BufferedMock, FailedBypassPropagates)
{
    testing::StrictMock<source::Mock> mock;
    Buffered r(mock, 1);
    std::array<std::byte, 2> tmp;

    EXPECT_CALL(mock, readAt(_, 0))
        .WillOnce(testing::Throw(
            std::system_error(EIO, std::generic_category(), "pread")));
    EXPECT_THROW(r.readAt(tmp, 0), std::system_error);
    EXPECT_EQ(r.resident(), Range());
}

TEST(BufferedOwning, HoldsSource)
{
    BufferedOwning r(std::make_unique<source::Memory>(makeData(10)), 4);
    std::array<std::byte, 3> tmp;
    EXPECT_THAT(r.readAt(tmp, 8), ElementsAre(8_b, 9_b));
    EXPECT_EQ(r.capacity(), 4);
}

TEST(BufferedShared, IndependentReadersConcurrently)
{
    const source::Memory mem(makeData(4096));
    std::vector<std::thread> threads;
    std::array<bool, 4> ok = {};
    for (size_t t = 0; t < ok.size(); ++t)
    {
        threads.emplace_back([&, t] {
            Buffered r(mem, 64 * (t + 1));
            std::array<std::byte, 16> tmp;
            bool good = true;
            for (uint64_t off = t; off + tmp.size() <= 4096; off += 16)
            {
                auto ret = r.readAt(tmp, off);
                good &= ret.size() == tmp.size();
                for (size_t i = 0; i < ret.size(); ++i)
                {
                    good &= ret[i] == static_cast<std::byte>(off + i);
                }
            }
            ok[t] = good;
        });
    }
    for (auto& thread : threads)
    {
        thread.join();
    }
    EXPECT_THAT(ok, testing::Each(true));
}

} // namespace reader
} // namespace pagedread
