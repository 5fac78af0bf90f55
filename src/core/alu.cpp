#include "core/alu.h"
#include "core/bits.h"
#include "common/debug_types.h"

#include <fmt/format.h>

namespace rvnum {

AluResult ALU::add(const Bits& a, const Bits& b, bool trace) {
    validateOperands(a, b);
    AluResult result = addWithCarry(a, b, 0, trace);
    LOG_DEBUG(ALU, "add %s + %s -> %s N=%d Z=%d C=%d V=%d",
              bits::toHex(a), bits::toHex(b), bits::toHex(result.result),
              static_cast<int>(result.flags.n), static_cast<int>(result.flags.z),
              static_cast<int>(result.flags.c), static_cast<int>(result.flags.v));
    return result;
}

AluResult ALU::sub(const Bits& a, const Bits& b, bool trace) {
    validateOperands(a, b);
    AluResult result = addWithCarry(a, bits::bitwiseNot(b), 1, trace);
    LOG_DEBUG(ALU, "sub %s - %s -> %s N=%d Z=%d C=%d V=%d",
              bits::toHex(a), bits::toHex(b), bits::toHex(result.result),
              static_cast<int>(result.flags.n), static_cast<int>(result.flags.z),
              static_cast<int>(result.flags.c), static_cast<int>(result.flags.v));
    return result;
}

Bits ALU::and_(const Bits& a, const Bits& b) {
    validateOperands(a, b);
    Bits out(kWordBits, 0);
    for (int i = 0; i < kWordBits; ++i) {
        out[i] = a[i] & b[i];
    }
    return out;
}

Bits ALU::or_(const Bits& a, const Bits& b) {
    validateOperands(a, b);
    Bits out(kWordBits, 0);
    for (int i = 0; i < kWordBits; ++i) {
        out[i] = a[i] | b[i];
    }
    return out;
}

Bits ALU::xor_(const Bits& a, const Bits& b) {
    validateOperands(a, b);
    Bits out(kWordBits, 0);
    for (int i = 0; i < kWordBits; ++i) {
        out[i] = a[i] ^ b[i];
    }
    return out;
}

Bits ALU::slt(const Bits& a, const Bits& b) {
    // a < b (有符号) 当且仅当 a - b 的 N != V
    const AluFlags flags = sub(a, b).flags;
    Bits out(kWordBits, 0);
    out[0] = flags.n != flags.v ? 1 : 0;
    return out;
}

Bits ALU::sltu(const Bits& a, const Bits& b) {
    // 无符号比较：产生借位（C=0）即 a < b
    const AluFlags flags = sub(a, b).flags;
    Bits out(kWordBits, 0);
    out[0] = flags.c ? 0 : 1;
    return out;
}

RippleResult ALU::rippleAdd(const Bits& a, const Bits& b, uint8_t carry_in) {
    bits::validateBits(a);
    bits::validateBits(b);
    if (a.size() != b.size()) {
        throw FormatError(fmt::format("加数宽度不一致: {} 与 {}", a.size(), b.size()));
    }
    if (carry_in > 1) {
        throw RangeError("初始进位只能是0或1");
    }
    return rippleChain(a, b, carry_in, nullptr);
}

Bits ALU::negate(const Bits& bits) {
    const Bits inverted = bits::bitwiseNot(bits);
    const Bits zero(bits.size(), 0);
    return rippleChain(inverted, zero, 1, nullptr).sum;
}

AluResult ALU::addWithCarry(const Bits& a, const Bits& b, uint8_t carry_in, bool trace) {
    AluResult result;
    std::vector<AluTraceStep> steps;
    if (trace) {
        steps.reserve(kWordBits);
    }

    const RippleResult ripple = rippleChain(a, b, carry_in, trace ? &steps : nullptr);

    result.result = ripple.sum;
    result.flags.n = ripple.sum[kWordBits - 1] == 1;
    result.flags.z = bits::isZero(ripple.sum);
    result.flags.c = ripple.carry_out == 1;
    result.flags.v = ripple.carry_into_msb != ripple.carry_out;

    if (trace) {
        AluTrace alu_trace;
        alu_trace.start.a = bits::toUnsigned(a);
        alu_trace.start.b = bits::toUnsigned(b);
        alu_trace.start.carry_in = carry_in;
        alu_trace.steps = std::move(steps);
        alu_trace.finish.result = bits::toUnsigned(ripple.sum);
        alu_trace.finish.flags = result.flags;
        result.trace = std::move(alu_trace);
    }
    return result;
}

RippleResult ALU::rippleChain(const Bits& a, const Bits& b, uint8_t carry_in,
                              std::vector<AluTraceStep>* steps) {
    const int width = static_cast<int>(a.size());
    RippleResult out;
    out.sum.assign(width, 0);

    uint8_t carry = carry_in;
    for (int i = 0; i < width; ++i) {
        const uint8_t ai = a[i];
        const uint8_t bi = b[i];
        const uint8_t axb = ai ^ bi;
        const uint8_t sum = axb ^ carry;
        const uint8_t carry_out = (ai & bi) | (carry & axb);
        out.sum[i] = sum;

        if (i == width - 1) {
            out.carry_into_msb = carry;
        }
        if (steps) {
            steps->push_back(AluTraceStep{i, ai, bi, carry, sum, carry_out});
        }
        carry = carry_out;
    }
    out.carry_out = carry;
    return out;
}

void ALU::validateOperands(const Bits& a, const Bits& b) {
    bits::validateWord(a);
    bits::validateWord(b);
}

} // namespace rvnum
