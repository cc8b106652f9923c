/*
 * Copyright (C) Canonical, Ltd.
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; version 3.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#include "common.h"

#include <weaver/exceptions/invalid_memory_size_exception.h>
#include <weaver/memory_size.h>

#include <string>

namespace wv = weaver;

using namespace testing;

namespace
{
constexpr auto kilo = 1024LL;
constexpr auto mega = kilo * kilo;
constexpr auto giga = kilo * mega;

using size_repr = std::tuple<std::string, long long>;
struct TestGoodMemorySizeFormats : public TestWithParam<size_repr>
{
};

struct TestBadMemorySizeFormats : public TestWithParam<std::string>
{
};
} // namespace

TEST_P(TestGoodMemorySizeFormats, interpretsValidFormats)
{
    const auto& [repr, bytes] = GetParam();
    EXPECT_EQ(wv::MemorySize{repr}.in_bytes(), bytes);
}

TEST_P(TestBadMemorySizeFormats, rejectsBadFormats)
{
    EXPECT_THROW(wv::MemorySize{GetParam()}, wv::InvalidMemorySizeException);
}

INSTANTIATE_TEST_SUITE_P(MemorySize, TestGoodMemorySizeFormats,
                         Values(size_repr{"0", 0LL}, size_repr{"42", 42LL}, size_repr{"42B", 42LL},
                                size_repr{"1k", kilo}, size_repr{"1KiB", kilo}, size_repr{"512M", 512 * mega},
                                size_repr{"1024MB", giga}, size_repr{"2G", 2 * giga}, size_repr{"2gb", 2 * giga},
                                size_repr{" 64K ", 64 * kilo}));
INSTANTIATE_TEST_SUITE_P(MemorySize, TestBadMemorySizeFormats,
                         Values("321BB", "1024MM", "K", "", "123.321", "54Mi", "-2345", "-5MiB", "4GM", "256.M",
                                ".5g", "4.2B", "42.", " 268. "));

TEST(MemorySize, defaultConstructsToZero)
{
    EXPECT_EQ(wv::MemorySize{}.in_bytes(), 0LL);
}

TEST(MemorySize, convertsByFlooring)
{
    EXPECT_EQ(wv::MemorySize{"5555K"}.in_megabytes(), 5);
    EXPECT_EQ(wv::MemorySize{"2047M"}.in_gigabytes(), 1);
    EXPECT_EQ(wv::MemorySize{"512K"}.in_megabytes(), 0);
}

TEST(MemorySize, acceptsTebibytes)
{
    EXPECT_EQ(wv::MemorySize{"1T"}.in_gigabytes(), kilo);
}

TEST(MemorySize, rejectsValuesTooLargeToRepresent)
{
    EXPECT_THROW(wv::MemorySize{"99999999999T"}, wv::InvalidMemorySizeException);
    EXPECT_THROW(wv::MemorySize{"99999999999999999999"}, wv::InvalidMemorySizeException);
}

TEST(MemorySize, formatsQemuArgumentInMebibytes)
{
    EXPECT_EQ(wv::MemorySize{"2G"}.as_qemu_argument(), "2048M");
    EXPECT_EQ(wv::MemorySize{"1536MiB"}.as_qemu_argument(), "1536M");
    EXPECT_EQ(wv::MemorySize{"1048577"}.as_qemu_argument(), "1M");
}

TEST(MemorySize, canCompare)
{
    EXPECT_EQ(wv::MemorySize{"2g"}, wv::MemorySize{"2048M"});
    EXPECT_EQ(wv::MemorySize{"1K"}, wv::MemorySize{"1024B"});
    EXPECT_NE(wv::MemorySize{"1536M"}, wv::MemorySize{"1535M"});
}
