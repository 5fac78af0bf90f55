#include "core/bits.h"
#include "common/debug_types.h"

#include <fmt/format.h>

namespace rvnum::bits {

namespace {

constexpr char kHexDigits[] = "0123456789ABCDEF";

void validateElements(const Bits& bits) {
    for (uint8_t b : bits) {
        if (b > 1) {
            throw FormatError("位向量只能包含0或1");
        }
    }
}

} // namespace

void validateWord(const Bits& bits) {
    if (bits.size() != static_cast<size_t>(kWordBits)) {
        throw FormatError(fmt::format("位向量必须恰好包含32个元素，实际为{}", bits.size()));
    }
    validateElements(bits);
}

void validateBits(const Bits& bits) {
    if (bits.empty()) {
        throw FormatError("位向量不能为空");
    }
    validateElements(bits);
}

Bits fromUnsigned(int64_t value) {
    if (value < 0 || value > kUint32Max) {
        throw RangeError(fmt::format("值 {} 不在 0..0xFFFFFFFF 范围内", value));
    }

    const uint64_t u = static_cast<uint64_t>(value);
    Bits bits(kWordBits, 0);
    for (int i = 0; i < kWordBits; ++i) {
        bits[i] = static_cast<uint8_t>((u >> i) & 1U);
    }
    LOG_DEBUG(BITS, "fromUnsigned 0x%08llx", static_cast<unsigned long long>(u));
    return bits;
}

uint32_t toUnsigned(const Bits& bits) {
    validateWord(bits);
    uint32_t value = 0;
    for (int i = 0; i < kWordBits; ++i) {
        if (bits[i]) {
            value |= (1U << i);
        }
    }
    return value;
}

uint64_t toUnsignedWide(const Bits& bits) {
    validateBits(bits);
    if (bits.size() > static_cast<size_t>(kDoubleWordBits)) {
        throw FormatError("位向量超过64位，无法转换为整数");
    }
    uint64_t value = 0;
    for (size_t i = 0; i < bits.size(); ++i) {
        if (bits[i]) {
            value |= (uint64_t{1} << i);
        }
    }
    return value;
}

std::string toGroupedBinary(const Bits& bits, char delimiter) {
    validateWord(bits);
    std::string out;
    out.reserve(kWordBits + 3);
    for (int i = kWordBits - 1; i >= 0; --i) {
        out.push_back(bits[i] ? '1' : '0');
        if (i % 8 == 0 && i != 0) {
            out.push_back(delimiter);
        }
    }
    return out;
}

std::string toHex(const Bits& bits) {
    validateWord(bits);
    // 从MSB开始每4位组成一个半字节
    std::string out = "0x";
    for (int nibble = 7; nibble >= 0; --nibble) {
        const int base = nibble * 4;
        const int digit = bits[base] + 2 * bits[base + 1] + 4 * bits[base + 2] + 8 * bits[base + 3];
        out.push_back(kHexDigits[digit]);
    }
    return out;
}

Bits bitwiseNot(const Bits& bits) {
    validateBits(bits);
    Bits out(bits.size(), 0);
    for (size_t i = 0; i < bits.size(); ++i) {
        out[i] = bits[i] ? 0 : 1;
    }
    return out;
}

bool isZero(const Bits& bits) {
    for (uint8_t b : bits) {
        if (b) {
            return false;
        }
    }
    return true;
}

Bits slice(const Bits& bits, int low, int width) {
    if (low < 0 || width < 1 || static_cast<size_t>(low + width) > bits.size()) {
        throw RangeError(fmt::format("切片 [{}, {}) 超出位向量长度 {}", low, low + width, bits.size()));
    }
    LOG_DEBUG(BITS, "slice [%d, %d) of %d bits", low, low + width, static_cast<int>(bits.size()));
    return Bits(bits.begin() + low, bits.begin() + low + width);
}

} // namespace rvnum::bits
