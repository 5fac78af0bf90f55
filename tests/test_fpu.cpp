#include <gtest/gtest.h>
#include "core/bits.h"
#include "core/fpu.h"

#include <cfloat>
#include <cmath>
#include <cstring>
#include <random>

namespace rvnum {

/**
 * FPU模块单元测试
 * 打包/解包、分类、加减乘及标志位
 */
class FpuTest : public ::testing::Test {
protected:
    static Bits word(uint32_t v) {
        return bits::fromUnsigned(v);
    }

    static uint32_t packed(double value) {
        return bits::toUnsigned(FPU::pack(value).bits);
    }

    static uint32_t hostBits(float value) {
        uint32_t out = 0;
        std::memcpy(&out, &value, sizeof(out));
        return out;
    }

    static float hostFloat(uint32_t bits) {
        float out = 0.0f;
        std::memcpy(&out, &bits, sizeof(out));
        return out;
    }
};

// ========== 打包 ==========

TEST_F(FpuTest, PackSimpleValues) {
    EXPECT_EQ(packed(1.0), 0x3F800000u);
    EXPECT_EQ(packed(-2.5), 0xC0200000u);
    EXPECT_EQ(packed(0.15625), 0x3E200000u);
    EXPECT_EQ(packed(-0.75), 0xBF400000u);
    EXPECT_EQ(packed(3.75), 0x40700000u);
}

TEST_F(FpuTest, PackRoundsToNearestEven) {
    EXPECT_EQ(packed(0.1), 0x3DCCCCCDu);
    EXPECT_EQ(packed(0.2), 0x3E4CCCCDu);
    EXPECT_EQ(packed(1.0 + std::ldexp(1.0, -24)), 0x3F800000u) << "正好一半时取偶";
    EXPECT_EQ(packed(1.0 + std::ldexp(1.0, -24) + std::ldexp(1.0, -50)), 0x3F800001u) << "超过一半时进位";
    EXPECT_EQ(packed(1.0 + 3 * std::ldexp(1.0, -24)), 0x3F800002u) << "平局且末位为1时进位";
}

TEST_F(FpuTest, PackExtremes) {
    EXPECT_EQ(packed(FLT_MAX), 0x7F7FFFFFu);
    EXPECT_EQ(packed(1e38), 0x7E967699u);
    EXPECT_EQ(packed(1e39), 0x7F800000u) << "超出范围饱和为无穷";
    EXPECT_EQ(packed(-1e39), 0xFF800000u);
    EXPECT_EQ(packed(std::ldexp(1.0, -126)), 0x00800000u);
    EXPECT_EQ(packed(std::ldexp(1.0, -127)), 0x00400000u);
    EXPECT_EQ(packed(std::ldexp(1.0, -149)), 0x00000001u);
    EXPECT_EQ(packed(1e-38), 0x006CE3EEu);
    EXPECT_EQ(packed(std::ldexp(1.0, -150)), 0x00000000u) << "2^-150 平局舍入到0";
    EXPECT_EQ(packed(std::ldexp(3.0, -151)), 0x00000001u);
}

TEST_F(FpuTest, PackSpecialValues) {
    EXPECT_EQ(packed(0.0), 0x00000000u);
    EXPECT_EQ(packed(-0.0), 0x80000000u);
    EXPECT_EQ(packed(INFINITY), 0x7F800000u);
    EXPECT_EQ(packed(-INFINITY), 0xFF800000u);
    EXPECT_EQ(packed(NAN), FPU::kCanonicalNaN);
}

TEST_F(FpuTest, PackFieldsMatchBits) {
    auto p = FPU::pack(-2.5);
    EXPECT_EQ(p.fields.sign, 1);
    EXPECT_EQ(bits::toUnsignedWide(p.fields.exponent), 128u);
    EXPECT_EQ(bits::toUnsignedWide(p.fields.fraction), 0x200000u);
    EXPECT_EQ(FPU::compose(p.fields), p.bits);
}

TEST_F(FpuTest, PackMatchesHostConversion) {
    std::mt19937_64 rng(77);
    std::uniform_real_distribution<double> mantissa(-1.0, 1.0);
    std::uniform_int_distribution<int> exponent(-160, 127);
    for (int i = 0; i < 500; ++i) {
        const double v = std::ldexp(mantissa(rng), exponent(rng));
        EXPECT_EQ(packed(v), hostBits(static_cast<float>(v))) << "value=" << v;
    }
}

// ========== 解包与分类 ==========

TEST_F(FpuTest, UnpackClassifies) {
    auto one = FPU::unpack(word(0x3F800000));
    EXPECT_EQ(one.value, 1.0);
    EXPECT_EQ(one.cls, FpClass::NORMAL);

    auto tiny = FPU::unpack(word(0x00000001));
    EXPECT_EQ(tiny.value, std::ldexp(1.0, -149));
    EXPECT_EQ(tiny.cls, FpClass::SUBNORMAL);

    auto negZero = FPU::unpack(word(0x80000000));
    EXPECT_EQ(negZero.cls, FpClass::ZERO);
    EXPECT_TRUE(std::signbit(negZero.value));

    auto negInf = FPU::unpack(word(0xFF800000));
    EXPECT_EQ(negInf.cls, FpClass::INF);
    EXPECT_TRUE(std::isinf(negInf.value));
    EXPECT_LT(negInf.value, 0.0);

    auto nan = FPU::unpack(word(0x7FC00000));
    EXPECT_EQ(nan.cls, FpClass::NAN_VALUE);
    EXPECT_TRUE(std::isnan(nan.value));

    EXPECT_EQ(FPU::classify(word(0x7F800001)), FpClass::NAN_VALUE);
    EXPECT_STREQ(toString(FpClass::SUBNORMAL), "subnormal");
    EXPECT_STREQ(toString(FpClass::INF), "inf");
}

TEST_F(FpuTest, UnpackPackRoundTrip) {
    auto roundTrip = [](uint32_t w) {
        const double value = FPU::unpack(word(w)).value;
        const PackResult back = FPU::pack(value);
        EXPECT_EQ(bits::toUnsigned(back.bits), w) << std::hex << "w=0x" << w;
        EXPECT_EQ(FPU::unpack(back.bits).value, value) << std::hex << "w=0x" << w;
    };

    for (uint32_t w : {0x00000000u, 0x80000000u, 0x00000001u, 0x807FFFFFu,
                       0x00800000u, 0x7F7FFFFFu, 0x7F800000u, 0xFF800000u}) {
        roundTrip(w);
    }

    // 符号、阶码、尾数分别随机，阶码0与255单独抽取以覆盖次正规数与无穷
    std::mt19937 rng(2024);
    std::uniform_int_distribution<uint32_t> fraction(0, 0x7FFFFF);
    std::uniform_int_distribution<uint32_t> exponent(1, 254);
    std::uniform_int_distribution<int> kind(0, 9);
    for (int i = 0; i < 2000; ++i) {
        const uint32_t sign = (rng() & 1u) << 31;
        const int k = kind(rng);
        uint32_t w = 0;
        if (k == 0) {
            w = sign | fraction(rng);                  // 零或次正规数
        } else if (k == 1) {
            w = sign | 0x7F800000u;                    // 无穷
        } else {
            w = sign | (exponent(rng) << 23) | fraction(rng);
        }
        roundTrip(w);
    }
}

TEST_F(FpuTest, SplitAndCompose) {
    auto fields = FPU::split(word(0x40700000));
    EXPECT_EQ(fields.sign, 0);
    EXPECT_EQ(fields.exponent.size(), 8u);
    EXPECT_EQ(fields.fraction.size(), 23u);
    EXPECT_EQ(bits::toUnsignedWide(fields.exponent), 128u);
    EXPECT_EQ(bits::toUnsigned(FPU::compose(fields)), 0x40700000u);

    fields.fraction.pop_back();
    EXPECT_THROW(FPU::compose(fields), FormatError);
    EXPECT_THROW(FPU::split(Bits(16, 0)), FormatError);
}

// ========== 加减法 ==========

TEST_F(FpuTest, AddExact) {
    auto r = FPU::add(FPU::pack(1.5).bits, FPU::pack(2.25).bits);
    EXPECT_EQ(bits::toHex(r.result), "0x40700000");
    EXPECT_FALSE(r.flags.overflow);
    EXPECT_FALSE(r.flags.underflow);
    EXPECT_FALSE(r.flags.invalid);
}

TEST_F(FpuTest, AddPointOnePointTwo) {
    auto r = FPU::add(FPU::pack(0.1).bits, FPU::pack(0.2).bits);
    EXPECT_EQ(bits::toHex(r.result), "0x3E99999A");
    EXPECT_NEAR(FPU::unpack(r.result).value, 0.3, 1e-7);
}

TEST_F(FpuTest, SubtractCancellation) {
    auto r = FPU::sub(FPU::pack(2.25).bits, FPU::pack(1.5).bits);
    EXPECT_EQ(bits::toUnsigned(r.result), 0x3F400000u);

    auto zero = FPU::sub(FPU::pack(1.5).bits, FPU::pack(1.5).bits);
    EXPECT_EQ(bits::toUnsigned(zero.result), 0x00000000u) << "x - x 为 +0";
    EXPECT_TRUE(zero.flags.underflow) << "非零操作数得到零结果记为下溢";
}

TEST_F(FpuTest, AddSignedZeros) {
    EXPECT_EQ(bits::toUnsigned(FPU::add(word(0x80000000), word(0x80000000)).result), 0x80000000u);
    EXPECT_EQ(bits::toUnsigned(FPU::add(word(0x80000000), word(0x00000000)).result), 0x00000000u);
    auto r = FPU::add(word(0x00000000), FPU::pack(-3.0).bits);
    EXPECT_EQ(bits::toUnsigned(r.result), packed(-3.0));
    EXPECT_FALSE(r.flags.underflow);
}

TEST_F(FpuTest, AddOverflowToInfinity) {
    auto r = FPU::add(word(0x7F7FFFFF), word(0x7F7FFFFF));
    EXPECT_EQ(bits::toUnsigned(r.result), FPU::kPositiveInfinity);
    EXPECT_TRUE(r.flags.overflow);
}

TEST_F(FpuTest, AddInfinities) {
    auto same = FPU::add(word(0x7F800000), word(0x7F800000));
    EXPECT_EQ(bits::toUnsigned(same.result), 0x7F800000u);
    EXPECT_FALSE(same.flags.overflow) << "输入已是无穷，不算上溢";

    auto opposite = FPU::add(word(0x7F800000), word(0xFF800000));
    EXPECT_EQ(bits::toUnsigned(opposite.result), FPU::kCanonicalNaN);
    EXPECT_TRUE(opposite.flags.invalid);

    auto sub = FPU::sub(word(0x7F800000), word(0x7F800000));
    EXPECT_TRUE(sub.flags.invalid) << "inf - inf 无效";
}

TEST_F(FpuTest, NaNPropagatesWithoutInvalid) {
    auto r = FPU::add(word(0x7FC00000), FPU::pack(1.0).bits);
    EXPECT_EQ(bits::toUnsigned(r.result), FPU::kCanonicalNaN);
    EXPECT_FALSE(r.flags.invalid);
}

TEST_F(FpuTest, AddFarApartExponents) {
    // 1 + 2^-60 舍入回 1，最大正规数加最小次正规数不变
    EXPECT_EQ(bits::toUnsigned(FPU::add(FPU::pack(1.0).bits, FPU::pack(std::ldexp(1.0, -60)).bits).result),
              0x3F800000u);
    EXPECT_EQ(bits::toUnsigned(FPU::add(word(0x7F7FFFFF), word(0x00000001)).result), 0x7F7FFFFFu);
    EXPECT_EQ(bits::toUnsigned(FPU::sub(FPU::pack(1.0).bits, word(0x00000001)).result), 0x3F800000u)
        << "1 - 2^-149 舍入回 1";
}

// ========== 乘法 ==========

TEST_F(FpuTest, MultiplyExact) {
    auto r = FPU::mul(FPU::pack(1.5).bits, FPU::pack(2.25).bits);
    EXPECT_EQ(bits::toHex(r.result), "0x40580000");
}

TEST_F(FpuTest, MultiplyRounds) {
    EXPECT_EQ(bits::toUnsigned(FPU::mul(FPU::pack(0.1).bits, FPU::pack(3.0).bits).result), 0x3E99999Au);
    EXPECT_EQ(bits::toUnsigned(FPU::mul(FPU::pack(1e30).bits, FPU::pack(1e-30).bits).result), 0x3F800000u);
}

TEST_F(FpuTest, MultiplyOverflow) {
    auto r = FPU::mul(FPU::pack(1e38).bits, FPU::pack(10.0).bits);
    EXPECT_EQ(FPU::classify(r.result), FpClass::INF);
    EXPECT_TRUE(r.flags.overflow);
    EXPECT_FALSE(r.flags.underflow);
}

TEST_F(FpuTest, MultiplyUnderflowToSubnormal) {
    auto r = FPU::mul(FPU::pack(1e-38).bits, FPU::pack(1e-2).bits);
    EXPECT_EQ(FPU::classify(r.result), FpClass::SUBNORMAL);
    EXPECT_EQ(bits::toUnsigned(r.result), 0x000116C2u);
    EXPECT_TRUE(r.flags.underflow);
    EXPECT_FALSE(r.flags.overflow);
}

TEST_F(FpuTest, MultiplySpecialOperands) {
    auto invalid = FPU::mul(word(0x7F800000), word(0x00000000));
    EXPECT_EQ(bits::toUnsigned(invalid.result), FPU::kCanonicalNaN);
    EXPECT_TRUE(invalid.flags.invalid);

    auto inf = FPU::mul(word(0xFF800000), FPU::pack(2.0).bits);
    EXPECT_EQ(bits::toUnsigned(inf.result), 0xFF800000u);
    EXPECT_FALSE(inf.flags.overflow);

    auto negZero = FPU::mul(word(0x80000000), FPU::pack(5.0).bits);
    EXPECT_EQ(bits::toUnsigned(negZero.result), 0x80000000u);
    EXPECT_FALSE(negZero.flags.underflow) << "零操作数不算下溢";
}

// ========== 轨迹与宿主对照 ==========

TEST_F(FpuTest, TraceHasSingleEntry) {
    auto r = FPU::sub(FPU::pack(2.25).bits, FPU::pack(1.5).bits);
    ASSERT_EQ(r.trace.size(), 1u);
    EXPECT_EQ(r.trace[0].op, "fsub");
    EXPECT_EQ(r.trace[0].a, 0x40100000u);
    EXPECT_EQ(r.trace[0].b, 0x3FC00000u);
    EXPECT_EQ(r.trace[0].result, 0x3F400000u);

    EXPECT_EQ(FPU::add(word(0), word(0)).trace[0].op, "fadd");
    EXPECT_EQ(FPU::mul(word(0), word(0)).trace[0].op, "fmul");
}

TEST_F(FpuTest, ArithmeticMatchesHostFloat) {
    std::mt19937 rng(555);
    std::uniform_int_distribution<uint32_t> dist;
    int checked = 0;
    while (checked < 400) {
        const uint32_t a = dist(rng);
        const uint32_t b = dist(rng);
        const float fa = hostFloat(a);
        const float fb = hostFloat(b);
        if (!std::isfinite(fa) || !std::isfinite(fb)) {
            continue;
        }
        ++checked;

        EXPECT_EQ(bits::toUnsigned(FPU::add(word(a), word(b)).result), hostBits(fa + fb))
            << std::hex << a << " + " << b;
        EXPECT_EQ(bits::toUnsigned(FPU::sub(word(a), word(b)).result), hostBits(fa - fb));
        EXPECT_EQ(bits::toUnsigned(FPU::mul(word(a), word(b)).result), hostBits(fa * fb));
    }
}

} // namespace rvnum
