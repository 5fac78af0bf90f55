#include "core/fpu.h"
#include "core/bits.h"
#include "common/debug_types.h"

#include <cmath>
#include <limits>
#include <fmt/format.h>

namespace rvnum {

namespace {

constexpr uint32_t kSignMask = 0x80000000U;
constexpr uint64_t kHiddenBit = uint64_t{1} << 23;
constexpr int kMaxBiasedExponent = 255;
constexpr int kMinExponent = 1 - 127 - 23;      // 次正规数的有效位权重 2^-149
constexpr int kAlignLimit = 40;                 // 对阶时较大操作数最多左移的位数

int highestSetBit(uint64_t value) {
    int index = -1;
    while (value != 0) {
        value >>= 1;
        ++index;
    }
    return index;
}

bool isFinite(FpClass cls) {
    return cls != FpClass::INF && cls != FpClass::NAN_VALUE;
}

} // namespace

const char* toString(FpClass cls) {
    switch (cls) {
        case FpClass::ZERO: return "zero";
        case FpClass::SUBNORMAL: return "subnormal";
        case FpClass::NORMAL: return "normal";
        case FpClass::INF: return "inf";
        case FpClass::NAN_VALUE: return "nan";
        default: return "unknown";
    }
}

PackResult FPU::pack(double value) {
    uint32_t word = 0;
    if (std::isnan(value)) {
        word = kCanonicalNaN;
    } else {
        const uint8_t sign = std::signbit(value) ? 1 : 0;
        if (std::isinf(value)) {
            word = (sign ? kSignMask : 0U) | kPositiveInfinity;
        } else if (value == 0.0) {
            word = sign ? kSignMask : 0U;
        } else {
            // |value| = m * 2^e, m ∈ [0.5, 1)；m * 2^53 是精确整数
            int e = 0;
            const double m = std::frexp(std::fabs(value), &e);
            const uint64_t significand = static_cast<uint64_t>(std::ldexp(m, 53));
            word = roundAndPack(sign, significand, e - 53);
        }
    }

    PackResult result;
    result.bits = bits::fromUnsigned(word);
    result.fields = split(result.bits);
    LOG_DEBUG(FPU, "pack %.9g -> %s", value, bits::toHex(result.bits));
    return result;
}

UnpackResult FPU::unpack(const Bits& bits) {
    const Operand op = decompose(bits);
    UnpackResult result;
    result.cls = op.cls;

    switch (op.cls) {
        case FpClass::NAN_VALUE:
            result.value = std::numeric_limits<double>::quiet_NaN();
            break;
        case FpClass::INF:
            result.value = op.sign ? -std::numeric_limits<double>::infinity()
                                   : std::numeric_limits<double>::infinity();
            break;
        default: {
            const double magnitude = std::ldexp(static_cast<double>(op.significand), op.exponent);
            result.value = op.sign ? -magnitude : magnitude;
            break;
        }
    }
    return result;
}

FpClass FPU::classify(const Bits& bits) {
    return decompose(bits).cls;
}

Float32Fields FPU::split(const Bits& bits) {
    bits::validateWord(bits);
    Float32Fields fields;
    fields.sign = bits[kWordBits - 1];
    fields.exponent = bits::slice(bits, kFractionBits, kExponentBits);
    fields.fraction = bits::slice(bits, 0, kFractionBits);
    return fields;
}

Bits FPU::compose(const Float32Fields& fields) {
    if (fields.sign > 1 ||
        fields.exponent.size() != static_cast<size_t>(kExponentBits) ||
        fields.fraction.size() != static_cast<size_t>(kFractionBits)) {
        throw FormatError("浮点字段宽度必须为 1/8/23 位");
    }
    Bits out(fields.fraction);
    out.insert(out.end(), fields.exponent.begin(), fields.exponent.end());
    out.push_back(fields.sign);
    bits::validateWord(out);
    return out;
}

FpResult FPU::add(const Bits& a, const Bits& b) {
    const Operand x = decompose(a);
    const Operand y = decompose(b);
    return finish("fadd", a, b, addMagnitudes(x, y));
}

FpResult FPU::sub(const Bits& a, const Bits& b) {
    const Operand x = decompose(a);
    Operand y = decompose(b);
    // a - b = a + (-b)
    y.sign ^= 1;
    return finish("fsub", a, b, addMagnitudes(x, y));
}

FpResult FPU::mul(const Bits& a, const Bits& b) {
    const Operand x = decompose(a);
    const Operand y = decompose(b);
    return finish("fmul", a, b, multiplyOperands(x, y));
}

FPU::Operand FPU::decompose(const Bits& bits) {
    const Float32Fields fields = split(bits);
    const int exponent = static_cast<int>(bits::toUnsignedWide(fields.exponent));
    const uint64_t fraction = bits::toUnsignedWide(fields.fraction);

    Operand op;
    op.sign = fields.sign;
    if (exponent == kMaxBiasedExponent) {
        op.cls = fraction == 0 ? FpClass::INF : FpClass::NAN_VALUE;
    } else if (exponent == 0) {
        op.cls = fraction == 0 ? FpClass::ZERO : FpClass::SUBNORMAL;
        op.significand = fraction;
        op.exponent = kMinExponent;
    } else {
        op.cls = FpClass::NORMAL;
        op.significand = fraction | kHiddenBit;
        op.exponent = exponent - kExponentBias - kFractionBits;
    }
    return op;
}

uint32_t FPU::roundAndPack(uint8_t sign, uint64_t significand, int exponent) {
    const uint32_t sign_bits = sign ? kSignMask : 0U;
    if (significand == 0) {
        return sign_bits;
    }

    const int msb = highestSetBit(significand);
    int biased = msb + exponent + kExponentBias;

    // 需要丢弃的低位数：正规数保留24位有效位，次正规数额外右移 1 - biased 位
    int shift = msb - kFractionBits;
    const bool subnormal = biased <= 0;
    if (subnormal) {
        shift += 1 - biased;
    }

    uint64_t mantissa = 0;
    uint8_t guard = 0;
    uint8_t round = 0;
    bool sticky = false;

    if (shift <= 0) {
        mantissa = significand << (-shift);
    } else if (shift > msb + 1) {
        // 整个有效位都落在 guard 位以下
        sticky = true;
    } else {
        mantissa = shift >= 64 ? 0 : significand >> shift;
        guard = static_cast<uint8_t>((significand >> (shift - 1)) & 1U);
        if (shift >= 2) {
            round = static_cast<uint8_t>((significand >> (shift - 2)) & 1U);
            const uint64_t below = (uint64_t{1} << (shift - 2)) - 1;
            sticky = (significand & below) != 0;
        }
    }

    // RNE：guard=1 且 (round|sticky|lsb) 时进位
    if (guard && (round || sticky || (mantissa & 1U))) {
        ++mantissa;
    }

    if (subnormal) {
        // 进位到 2^23 时自然成为最小正规数（指数字段为1）
        return sign_bits | static_cast<uint32_t>(mantissa);
    }

    if (mantissa == (kHiddenBit << 1)) {
        mantissa >>= 1;
        ++biased;
    }
    if (biased >= kMaxBiasedExponent) {
        return sign_bits | kPositiveInfinity;
    }
    return sign_bits | (static_cast<uint32_t>(biased) << kFractionBits) |
           static_cast<uint32_t>(mantissa & (kHiddenBit - 1));
}

uint32_t FPU::addMagnitudes(const Operand& a, const Operand& b) {
    if (a.cls == FpClass::NAN_VALUE || b.cls == FpClass::NAN_VALUE) {
        return kCanonicalNaN;
    }
    if (a.cls == FpClass::INF && b.cls == FpClass::INF) {
        if (a.sign != b.sign) {
            return kCanonicalNaN;
        }
        return (a.sign ? kSignMask : 0U) | kPositiveInfinity;
    }
    if (a.cls == FpClass::INF) {
        return (a.sign ? kSignMask : 0U) | kPositiveInfinity;
    }
    if (b.cls == FpClass::INF) {
        return (b.sign ? kSignMask : 0U) | kPositiveInfinity;
    }
    if (a.cls == FpClass::ZERO && b.cls == FpClass::ZERO) {
        // 只有 (-0) + (-0) 得到 -0
        return (a.sign && b.sign) ? kSignMask : 0U;
    }

    // 令 big 的指数不小于 small
    const Operand& big = a.exponent >= b.exponent ? a : b;
    const Operand& small = a.exponent >= b.exponent ? b : a;
    const int distance = big.exponent - small.exponent;

    uint64_t big_aligned = 0;
    uint64_t small_aligned = 0;
    int exponent = 0;
    if (distance <= kAlignLimit) {
        big_aligned = big.significand << distance;
        small_aligned = small.significand;
        exponent = small.exponent;
    } else {
        // 较小操作数右移对齐，移出的位并入最低位作为 sticky
        const int excess = distance - kAlignLimit;
        big_aligned = big.significand << kAlignLimit;
        exponent = big.exponent - kAlignLimit;
        if (excess >= 64) {
            small_aligned = small.significand != 0 ? 1 : 0;
        } else {
            const uint64_t lost = small.significand & ((uint64_t{1} << excess) - 1);
            small_aligned = (small.significand >> excess) | (lost != 0 ? 1 : 0);
        }
    }

    if (big.sign == small.sign) {
        return roundAndPack(big.sign, big_aligned + small_aligned, exponent);
    }
    if (big_aligned == small_aligned) {
        return 0U;
    }
    if (big_aligned > small_aligned) {
        return roundAndPack(big.sign, big_aligned - small_aligned, exponent);
    }
    return roundAndPack(small.sign, small_aligned - big_aligned, exponent);
}

uint32_t FPU::multiplyOperands(const Operand& a, const Operand& b) {
    if (a.cls == FpClass::NAN_VALUE || b.cls == FpClass::NAN_VALUE) {
        return kCanonicalNaN;
    }
    const uint8_t sign = a.sign ^ b.sign;
    const uint32_t sign_bits = sign ? kSignMask : 0U;
    const bool a_inf = a.cls == FpClass::INF;
    const bool b_inf = b.cls == FpClass::INF;
    const bool a_zero = a.cls == FpClass::ZERO;
    const bool b_zero = b.cls == FpClass::ZERO;

    if ((a_inf && b_zero) || (a_zero && b_inf)) {
        return kCanonicalNaN;
    }
    if (a_inf || b_inf) {
        return sign_bits | kPositiveInfinity;
    }
    if (a_zero || b_zero) {
        return sign_bits;
    }

    // 两个24位有效位的乘积最多48位，精确
    return roundAndPack(sign, a.significand * b.significand, a.exponent + b.exponent);
}

FpResult FPU::finish(const char* op, const Bits& a, const Bits& b, uint32_t result) {
    const FpClass a_cls = classify(a);
    const FpClass b_cls = classify(b);

    FpResult out;
    out.result = bits::fromUnsigned(result);
    const FpClass r_cls = classify(out.result);

    const bool both_finite = isFinite(a_cls) && isFinite(b_cls);
    const bool both_nonzero = a_cls != FpClass::ZERO && b_cls != FpClass::ZERO;
    out.flags.overflow = both_finite && r_cls == FpClass::INF;
    out.flags.underflow = both_finite && both_nonzero &&
                          (r_cls == FpClass::ZERO || r_cls == FpClass::SUBNORMAL);
    out.flags.invalid = r_cls == FpClass::NAN_VALUE &&
                        a_cls != FpClass::NAN_VALUE && b_cls != FpClass::NAN_VALUE;

    out.trace.push_back(FpTraceEntry{op, bits::toUnsigned(a), bits::toUnsigned(b), result});

    LOG_DEBUG(FPU, "%s %s, %s -> %s (%s) overflow=%d underflow=%d invalid=%d",
              op, bits::toHex(a), bits::toHex(b), bits::toHex(out.result), toString(r_cls),
              out.flags.overflow ? 1 : 0, out.flags.underflow ? 1 : 0, out.flags.invalid ? 1 : 0);
    return out;
}

} // namespace rvnum
