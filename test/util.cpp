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

#include <pagedread/util.hpp>
#include <stdplus/types.hpp>

#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace pagedread
{

using testing::ElementsAre;
using testing::Return;

constexpr std::byte operator""_b(unsigned long long t)
{
    return static_cast<std::byte>(t);
}

struct Op
{
    MOCK_METHOD(stdplus::span<std::byte>, op,
                (stdplus::span<std::byte>, uint64_t offset), ());
};

TEST(ReadAtExactWith, NoData)
{
    testing::StrictMock<Op> op;
    auto data = std::vector{1_b};
    EXPECT_CALL(op, op(ElementsAre(1_b), 0))
        .WillOnce(Return(stdplus::span<std::byte>{}));
    EXPECT_THROW(readAtExactWith("op", &Op::op, op,
                                 stdplus::span<std::byte>(data), 0),
                 stdplus::exception::Eof);
}

TEST(ReadAtExactWith, FillSingle)
{
    testing::StrictMock<Op> op;
    auto data = std::vector{1_b};
    auto data_s = stdplus::span<std::byte>(data);
    EXPECT_CALL(op, op(ElementsAre(1_b), 3)).WillOnce(Return(data_s));
    readAtExactWith("op", &Op::op, op, data_s, 3);
}

TEST(ReadAtExactWith, FillMulti)
{
    testing::StrictMock<Op> op;
    testing::InSequence seq;
    auto data = std::vector{1_b, 2_b};
    auto data_s = stdplus::span<std::byte>(data);
    EXPECT_CALL(op, op(ElementsAre(1_b, 2_b), 3))
        .WillOnce(Return(data_s.subspan(0, 1)));
    EXPECT_CALL(op, op(ElementsAre(2_b), 4))
        .WillOnce(Return(data_s.subspan(0, 1)));
    readAtExactWith("op", &Op::op, op, data_s, 3);
}

TEST(ReadAtExactWith, ShortThenEnd)
{
    testing::StrictMock<Op> op;
    testing::InSequence seq;
    auto data = std::vector{1_b, 2_b};
    auto data_s = stdplus::span<std::byte>(data);
    EXPECT_CALL(op, op(ElementsAre(1_b, 2_b), 0))
        .WillOnce(Return(data_s.subspan(0, 1)));
    EXPECT_CALL(op, op(ElementsAre(2_b), 1))
        .WillOnce(Return(data_s.subspan(0, 0)));
    EXPECT_THROW(readAtExactWith("op", &Op::op, op, data_s, 0),
                 stdplus::exception::Eof);
}

TEST(ReadAtExactWith, Empty)
{
    testing::StrictMock<Op> op;
    readAtExactWith("op", &Op::op, op, stdplus::span<std::byte>(), 9);
}

} // namespace pagedread
