#include "core/mdu.h"
#include "core/alu.h"
#include "core/bits.h"
#include "core/shifter.h"
#include "core/twos_complement.h"
#include "common/debug_types.h"

namespace rvnum {

namespace {

constexpr int kRemainderBits = kWordBits + 1;

Bits concat(const Bits& low, const Bits& high) {
    Bits out(low);
    out.insert(out.end(), high.begin(), high.end());
    return out;
}

Bits allOnes() {
    return Bits(kWordBits, 1);
}

bool isIntMin(const Bits& word) {
    for (int i = 0; i < kWordBits - 1; ++i) {
        if (word[i]) {
            return false;
        }
    }
    return word[kWordBits - 1] == 1;
}

bool isMinusOne(const Bits& word) {
    for (uint8_t b : word) {
        if (!b) {
            return false;
        }
    }
    return true;
}

} // namespace

MulResult MDU::multiply(const Bits& rs1, const Bits& rs2, bool trace) {
    bits::validateWord(rs1);
    bits::validateWord(rs2);

    Bits multiplicand = twos::signExtend(rs1, kWordBits, kDoubleWordBits);
    Bits acc(kDoubleWordBits, 0);
    std::vector<MulTraceStep> steps;

    for (int i = 0; i < kWordBits; ++i) {
        const uint8_t bit = rs2[i];
        if (bit) {
            acc = ALU::rippleAdd(acc, multiplicand, 0).sum;
        }
        if (trace) {
            steps.push_back(snapshot(i, bit, bit == 1, acc));
        }
        multiplicand = shiftDoubleWordLeft(multiplicand);
    }

    MulResult result;
    result.result = bits::slice(acc, 0, kWordBits);

    // 高32位任一位与结果符号位不同，说明乘积无法用有符号32位表示
    const uint8_t sign = acc[kWordBits - 1];
    for (int i = kWordBits; i < kDoubleWordBits; ++i) {
        if (acc[i] != sign) {
            result.overflow = true;
            break;
        }
    }
    if (trace) {
        result.trace = std::move(steps);
    }

    LOG_DEBUG(MDU, "mul %s * %s -> %s overflow=%d",
              bits::toHex(rs1), bits::toHex(rs2), bits::toHex(result.result),
              result.overflow ? 1 : 0);
    return result;
}

MulResult MDU::multiplyHigh(const Bits& rs1, const Bits& rs2,
                            MulSignedness signedness, bool trace) {
    bits::validateWord(rs1);
    bits::validateWord(rs2);

    const bool rs1_signed = signedness != MulSignedness::UNSIGNED_UNSIGNED;
    const bool rs2_signed = signedness == MulSignedness::SIGNED_SIGNED;

    Bits multiplicand = rs1_signed ? twos::signExtend(rs1, kWordBits, kDoubleWordBits)
                                   : twos::zeroExtend(rs1, kWordBits, kDoubleWordBits);
    const Bits multiplier = rs2_signed ? twos::signExtend(rs2, kWordBits, kDoubleWordBits)
                                       : twos::zeroExtend(rs2, kWordBits, kDoubleWordBits);
    Bits acc(kDoubleWordBits, 0);
    std::vector<MulTraceStep> steps;

    // 扩展后的乘数共64位，乘积对2^64取模即为完整的64位乘积
    for (int i = 0; i < kDoubleWordBits; ++i) {
        const uint8_t bit = multiplier[i];
        if (bit) {
            acc = ALU::rippleAdd(acc, multiplicand, 0).sum;
        }
        if (trace) {
            steps.push_back(snapshot(i, bit, bit == 1, acc));
        }
        multiplicand = shiftDoubleWordLeft(multiplicand);
    }

    MulResult result;
    result.result = bits::slice(acc, kWordBits, kWordBits);
    if (trace) {
        result.trace = std::move(steps);
    }

    LOG_DEBUG(MDU, "mulh(%d) %s * %s -> %s", static_cast<int>(signedness),
              bits::toHex(rs1), bits::toHex(rs2), bits::toHex(result.result));
    return result;
}

DivResult MDU::divideRestoring(const Bits& dividend, const Bits& divisor,
                               bool is_signed, bool trace) {
    bits::validateWord(dividend);
    bits::validateWord(divisor);

    DivResult result;
    DivTrace div_trace;
    div_trace.start.dividend = bits::toUnsigned(dividend);
    div_trace.start.divisor = bits::toUnsigned(divisor);
    div_trace.start.is_signed = is_signed;

    auto finish = [&]() {
        if (trace) {
            div_trace.finish.quotient = bits::toUnsigned(result.quotient);
            div_trace.finish.remainder = bits::toUnsigned(result.remainder);
            div_trace.finish.flags = result.flags;
            result.trace = std::move(div_trace);
        }
        LOG_DEBUG(MDU, "div%s %s / %s -> q=%s r=%s div_by_zero=%d overflow=%d",
                  is_signed ? "" : "u", bits::toHex(dividend), bits::toHex(divisor),
                  bits::toHex(result.quotient), bits::toHex(result.remainder),
                  result.flags.div_by_zero ? 1 : 0, result.flags.overflow ? 1 : 0);
        return result;
    };

    // 除零：商全1，余数为被除数
    if (bits::isZero(divisor)) {
        result.quotient = allOnes();
        result.remainder = dividend;
        result.flags.div_by_zero = true;
        return finish();
    }

    // 唯一的有符号溢出情况
    if (is_signed && isIntMin(dividend) && isMinusOne(divisor)) {
        result.quotient = dividend;
        result.remainder = Bits(kWordBits, 0);
        result.flags.overflow = true;
        return finish();
    }

    const bool dividend_negative = is_signed && dividend[kWordBits - 1] == 1;
    const bool divisor_negative = is_signed && divisor[kWordBits - 1] == 1;
    const bool quotient_negative = dividend_negative != divisor_negative;
    div_trace.start.quotient_negative = quotient_negative;

    // INT32_MIN 取负后仍是 0x80000000，按无符号解读正好是 2^31
    Bits quotient = dividend_negative ? ALU::negate(dividend) : dividend;
    const Bits magnitude = divisor_negative ? ALU::negate(divisor) : divisor;
    const Bits divisor_inverted = bits::bitwiseNot(twos::zeroExtend(magnitude, kWordBits, kRemainderBits));
    Bits remainder(kRemainderBits, 0);

    for (int i = 0; i < kWordBits; ++i) {
        // (余数, 商) 整体左移一位，商的最高位移入余数最低位
        const uint8_t top = quotient[kWordBits - 1];
        remainder = shiftRemainderLeft(remainder, top);
        quotient = Shifter::shiftLeftLogical(quotient, 1);

        // 试减：remainder - divisor = remainder + ~divisor + 1
        const RippleResult trial = ALU::rippleAdd(remainder, divisor_inverted, 1);
        const bool borrow = trial.carry_out == 0;
        if (borrow) {
            quotient[0] = 0;
        } else {
            remainder = trial.sum;
            quotient[0] = 1;
        }

        if (trace) {
            DivTraceStep step;
            step.iteration = i;
            step.quotient_bit = quotient[0];
            step.restored = borrow;
            step.remainder = bits::toUnsignedWide(remainder);
            step.quotient = bits::toUnsigned(quotient);
            div_trace.steps.push_back(step);
        }
    }

    Bits final_remainder = bits::slice(remainder, 0, kWordBits);
    if (quotient_negative) {
        quotient = ALU::negate(quotient);
    }
    // 余数符号跟随被除数
    if (dividend_negative && !bits::isZero(final_remainder)) {
        final_remainder = ALU::negate(final_remainder);
    }

    result.quotient = std::move(quotient);
    result.remainder = std::move(final_remainder);
    return finish();
}

Bits MDU::shiftDoubleWordLeft(const Bits& value) {
    // 64位值拆成两个32位字，各自经过移位器，低字最高位补入高字最低位
    const Bits low = bits::slice(value, 0, kWordBits);
    const Bits high = bits::slice(value, kWordBits, kWordBits);
    const uint8_t carry = low[kWordBits - 1];

    Bits shifted_low = Shifter::shiftLeftLogical(low, 1);
    Bits shifted_high = Shifter::shiftLeftLogical(high, 1);
    shifted_high[0] = carry;
    return concat(shifted_low, shifted_high);
}

Bits MDU::shiftRemainderLeft(const Bits& remainder, uint8_t fill) {
    Bits out(remainder.size(), 0);
    out[0] = fill;
    for (size_t i = 1; i < remainder.size(); ++i) {
        out[i] = remainder[i - 1];
    }
    return out;
}

MulTraceStep MDU::snapshot(int step, uint8_t multiplier_bit, bool added, const Bits& acc) {
    MulTraceStep entry;
    entry.step = step;
    entry.multiplier_bit = multiplier_bit;
    entry.added = added;
    entry.acc_low = bits::toUnsigned(bits::slice(acc, 0, kWordBits));
    entry.acc_high = bits::toUnsigned(bits::slice(acc, kWordBits, kWordBits));
    return entry;
}

} // namespace rvnum
