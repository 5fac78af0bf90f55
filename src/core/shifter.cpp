#include "core/shifter.h"
#include "core/bits.h"
#include "common/debug_types.h"

#include <array>
#include <fmt/format.h>

namespace rvnum {

namespace {

constexpr std::array<int, 5> kStageDistances = {1, 2, 4, 8, 16};

} // namespace

Bits Shifter::shiftLeftLogical(const Bits& bits, int amount) {
    bits::validateWord(bits);
    validateAmount(amount);
    Bits out = barrel(bits, amount, Direction::LEFT, 0);
    LOG_DEBUG(SHIFT, "sll %s by %d -> %s", bits::toHex(bits), amount, bits::toHex(out));
    return out;
}

Bits Shifter::shiftRightLogical(const Bits& bits, int amount) {
    bits::validateWord(bits);
    validateAmount(amount);
    Bits out = barrel(bits, amount, Direction::RIGHT, 0);
    LOG_DEBUG(SHIFT, "srl %s by %d -> %s", bits::toHex(bits), amount, bits::toHex(out));
    return out;
}

Bits Shifter::shiftRightArithmetic(const Bits& bits, int amount) {
    bits::validateWord(bits);
    validateAmount(amount);
    // 各级都用移位前的符号位填充
    const uint8_t sign = bits[kWordBits - 1];
    Bits out = barrel(bits, amount, Direction::RIGHT, sign);
    LOG_DEBUG(SHIFT, "sra %s by %d -> %s", bits::toHex(bits), amount, bits::toHex(out));
    return out;
}

void Shifter::validateAmount(int amount) {
    if (amount < 0 || amount > kWordBits - 1) {
        throw RangeError(fmt::format("移位量必须在 0..31 之间，实际为{}", amount));
    }
}

Bits Shifter::barrel(const Bits& bits, int amount, Direction direction, uint8_t fill) {
    Bits out = bits;
    int remaining = amount;
    for (int distance : kStageDistances) {
        // 移位量的当前最低位决定本级是否生效
        if (remaining % 2 == 1) {
            out = stage(out, distance, direction, fill);
        }
        remaining /= 2;
    }
    return out;
}

Bits Shifter::stage(const Bits& src, int distance, Direction direction, uint8_t fill) {
    Bits out(kWordBits, fill);
    for (int i = 0; i < kWordBits; ++i) {
        if (direction == Direction::LEFT) {
            if (i >= distance) {
                out[i] = src[i - distance];
            }
        } else {
            if (i + distance < kWordBits) {
                out[i] = src[i + distance];
            }
        }
    }
    return out;
}

} // namespace rvnum
