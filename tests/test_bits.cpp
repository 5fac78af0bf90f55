#include <gtest/gtest.h>
#include "core/bits.h"

#include <random>

namespace rvnum {

class BitsTest : public ::testing::Test {
protected:
    // 辅助函数：构造LSB在前的位向量
    static Bits fromMsbString(const std::string& text) {
        Bits out;
        for (auto it = text.rbegin(); it != text.rend(); ++it) {
            out.push_back(*it == '1' ? 1 : 0);
        }
        return out;
    }
};

// ========== 转换测试 ==========

TEST_F(BitsTest, FromUnsignedPlacesLsbAtIndexZero) {
    Bits b = bits::fromUnsigned(0x00000005);
    ASSERT_EQ(b.size(), 32u);
    EXPECT_EQ(b[0], 1);
    EXPECT_EQ(b[1], 0);
    EXPECT_EQ(b[2], 1);
    for (int i = 3; i < 32; ++i) {
        EXPECT_EQ(b[i], 0) << "第 " << i << " 位应该为0";
    }
}

TEST_F(BitsTest, FromUnsignedRejectsOutOfRange) {
    EXPECT_THROW(bits::fromUnsigned(-1), RangeError);
    EXPECT_THROW(bits::fromUnsigned(0x100000000LL), RangeError);
    EXPECT_NO_THROW(bits::fromUnsigned(0xFFFFFFFFLL));
}

TEST_F(BitsTest, ToUnsignedInvertsFromUnsigned) {
    std::mt19937 rng(20240101);
    std::uniform_int_distribution<uint32_t> dist;
    for (int i = 0; i < 200; ++i) {
        const uint32_t v = dist(rng);
        EXPECT_EQ(bits::toUnsigned(bits::fromUnsigned(v)), v);
    }
    EXPECT_EQ(bits::toUnsigned(bits::fromUnsigned(0)), 0u);
    EXPECT_EQ(bits::toUnsigned(bits::fromUnsigned(0xFFFFFFFFLL)), 0xFFFFFFFFu);
}

TEST_F(BitsTest, ToUnsignedRejectsMalformedVectors) {
    EXPECT_THROW(bits::toUnsigned(Bits(31, 0)), FormatError) << "长度为31应该报格式错误";
    EXPECT_THROW(bits::toUnsigned(Bits(33, 0)), FormatError);

    Bits bad(32, 0);
    bad[7] = 2;
    EXPECT_THROW(bits::toUnsigned(bad), FormatError) << "元素值2应该报格式错误";
}

TEST_F(BitsTest, ToUnsignedWideHandlesOtherWidths) {
    EXPECT_EQ(bits::toUnsignedWide(fromMsbString("101")), 5u);
    EXPECT_EQ(bits::toUnsignedWide(Bits(64, 1)), 0xFFFFFFFFFFFFFFFFULL);
    EXPECT_THROW(bits::toUnsignedWide(Bits(65, 0)), FormatError);
    EXPECT_THROW(bits::toUnsignedWide(Bits{}), FormatError);
}

// ========== 格式化测试 ==========

TEST_F(BitsTest, GroupedBinaryOfZero) {
    EXPECT_EQ(bits::toGroupedBinary(bits::fromUnsigned(0)),
              "00000000_00000000_00000000_00000000");
}

TEST_F(BitsTest, GroupedBinaryIsMsbFirst) {
    EXPECT_EQ(bits::toGroupedBinary(bits::fromUnsigned(0x80000001)),
              "10000000_00000000_00000000_00000001");
    EXPECT_EQ(bits::toGroupedBinary(bits::fromUnsigned(0x0000000D), ' '),
              "00000000 00000000 00000000 00001101");
}

TEST_F(BitsTest, HexIsUppercaseWithPrefix) {
    EXPECT_EQ(bits::toHex(bits::fromUnsigned(0xDEADBEEF)), "0xDEADBEEF");
    EXPECT_EQ(bits::toHex(bits::fromUnsigned(0)), "0x00000000");
    EXPECT_EQ(bits::toHex(bits::fromUnsigned(0x0000000D)), "0x0000000D");
}

TEST_F(BitsTest, FormattingRejectsWrongWidth) {
    EXPECT_THROW(bits::toHex(Bits(8, 0)), FormatError);
    EXPECT_THROW(bits::toGroupedBinary(Bits(16, 1)), FormatError);
}

// ========== 辅助操作 ==========

TEST_F(BitsTest, BitwiseNotFlipsEveryBit) {
    EXPECT_EQ(bits::toUnsigned(bits::bitwiseNot(bits::fromUnsigned(0x0F0F0F0F))), 0xF0F0F0F0u);
    EXPECT_EQ(bits::bitwiseNot(fromMsbString("100")), fromMsbString("011"));
}

TEST_F(BitsTest, IsZero) {
    EXPECT_TRUE(bits::isZero(bits::fromUnsigned(0)));
    EXPECT_FALSE(bits::isZero(bits::fromUnsigned(0x80000000)));
}

TEST_F(BitsTest, SliceExtractsRange) {
    Bits word = bits::fromUnsigned(0xABCD1234);
    EXPECT_EQ(bits::toUnsignedWide(bits::slice(word, 16, 16)), 0xABCDu);
    EXPECT_EQ(bits::toUnsignedWide(bits::slice(word, 0, 4)), 0x4u);
    EXPECT_THROW(bits::slice(word, 30, 4), RangeError);
    EXPECT_THROW(bits::slice(word, -1, 2), RangeError);
    EXPECT_THROW(bits::slice(word, 0, 0), RangeError);
}

} // namespace rvnum
