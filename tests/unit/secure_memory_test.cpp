#include "joplinreader/security/SecureBuffer.hpp"
#include "joplinreader/security/SecureMemory.hpp"
#include "joplinreader/security/SecureRandom.hpp"

#include <algorithm>
#include <array>
#include <gtest/gtest.h>
#include <limits>
#include <new>
#include <string>
#include <vector>

TEST(SecureMemory, WipeZeroesEveryByte)
{
    std::array<std::uint8_t, 16U> bytes{};
    bytes.fill(0xA5U);
    joplinreader::security::secureWipe(std::span<std::uint8_t>{ bytes });
    EXPECT_TRUE(std::all_of(bytes.begin(), bytes.end(), [](std::uint8_t b) { return b == 0U; }));
}

TEST(SecureMemory, WipeEmptySpanIsNoOp)
{
    joplinreader::security::secureWipe(std::span<std::byte>{});
    SUCCEED();
}

TEST(ZeroAllocator, BacksGrowingContainers)
{
    std::vector<int, joplinreader::security::ZeroAllocator<int>> values{};
    values.push_back(1);
    values.push_back(2);
    // reallocation hands the old block back through deallocate
    values.resize(1000U, 7);
    EXPECT_EQ(values.size(), 1000U);
    EXPECT_EQ(values[1], 2);
    EXPECT_EQ(values.back(), 7);
}

TEST(ZeroAllocator, AllInstancesCompareEqual)
{
    const joplinreader::security::ZeroAllocator<char> a{};
    const joplinreader::security::ZeroAllocator<std::uint8_t> b{ a };
    EXPECT_TRUE(a == b);
}

TEST(ZeroAllocator, ZeroAndOversizedRequests)
{
    joplinreader::security::ZeroAllocator<std::uint64_t> alloc{};
    EXPECT_EQ(alloc.allocate(0U), nullptr);
    EXPECT_THROW({ [[maybe_unused]] auto* p = alloc.allocate(std::numeric_limits<std::size_t>::max()); },
                 std::bad_array_new_length);
    alloc.deallocate(nullptr, 4U);
}

TEST(SecureString, ConvertsToAndFromText)
{
    const auto s{ joplinreader::security::secureStringFrom("master key") };
    EXPECT_EQ(joplinreader::security::asStringView(s), "master key");
    EXPECT_EQ(joplinreader::security::asBytes(s).size(), 10U);
    EXPECT_EQ(joplinreader::security::asStringView(joplinreader::security::SecureString{}), "");
}

TEST(SecureString, FromBufferCopiesBytes)
{
    joplinreader::security::SecureBuffer buffer{ 'a', 'b', 'c' };
    const auto s{ joplinreader::security::toSecureString(buffer) };
    EXPECT_EQ(joplinreader::security::asStringView(s), "abc");
    EXPECT_EQ(joplinreader::security::asStringView(buffer), "abc");
}

TEST(SecureString, ReleaseEmptiesAndFreesStorage)
{
    auto s{ joplinreader::security::secureStringFrom("secret") };
    joplinreader::security::secureRelease(s);
    EXPECT_TRUE(s.empty());
    EXPECT_EQ(s.capacity(), 0U);

    joplinreader::security::SecureBuffer b{ 1U, 2U, 3U };
    joplinreader::security::secureRelease(b);
    EXPECT_TRUE(b.empty());
    EXPECT_EQ(b.capacity(), 0U);
}

TEST(SecureRandom, FillsRequestedBytes)
{
    std::array<std::uint8_t, 0U> none{};
    EXPECT_TRUE(joplinreader::security::secureRandomFill(std::span{ none }));

    std::array<std::uint8_t, 32U> a{};
    std::array<std::uint8_t, 32U> b{};
    ASSERT_TRUE(joplinreader::security::secureRandomFill(std::span{ a }));
    ASSERT_TRUE(joplinreader::security::secureRandomFill(std::span{ b }));
    EXPECT_NE(a, b);
}
