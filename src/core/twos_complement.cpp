#include "core/twos_complement.h"
#include "core/bits.h"
#include "common/debug_types.h"

#include <fmt/format.h>
#include <cctype>
#include <limits>

namespace rvnum::twos {

namespace {

constexpr int64_t kModulus = int64_t{1} << 32;

void checkWidths(const Bits& bits, int fromWidth, int toWidth) {
    bits::validateBits(bits);
    if (fromWidth < 1 || static_cast<size_t>(fromWidth) > bits.size()) {
        throw RangeError(fmt::format("fromWidth 必须在 1..{} 之间，实际为{}", bits.size(), fromWidth));
    }
    if (toWidth < fromWidth) {
        throw RangeError(fmt::format("toWidth ({}) 不能小于 fromWidth ({})", toWidth, fromWidth));
    }
}

int32_t reinterpretSigned(uint32_t u) {
    // 符号位为1时减去2^32
    const int64_t wide = (u & 0x80000000U) ? static_cast<int64_t>(u) - kModulus
                                            : static_cast<int64_t>(u);
    return static_cast<int32_t>(wide);
}

} // namespace

EncodeResult encode(int64_t value) {
    EncodeResult result;
    result.overflow = value < kInt32Min || value > kInt32Max;

    // 按模2^32回绕，与硬件行为一致
    int64_t wrapped = value % kModulus;
    if (wrapped < 0) {
        wrapped += kModulus;
    }

    result.bits = bits::fromUnsigned(wrapped);
    result.bin = bits::toGroupedBinary(result.bits);
    result.hex = bits::toHex(result.bits);

    LOG_DEBUG(TWOS, "encode %lld -> %s overflow=%d",
              static_cast<long long>(value), result.hex, result.overflow ? 1 : 0);
    return result;
}

int32_t decode(const std::string& binary) {
    std::string cleaned;
    cleaned.reserve(binary.size());
    for (char ch : binary) {
        if (ch == '_' || ch == ' ' || ch == '\t') {
            continue;
        }
        cleaned.push_back(ch);
    }

    if (cleaned.size() != static_cast<size_t>(kWordBits)) {
        throw FormatError(fmt::format("二进制串必须是32个'0'/'1'字符，实际为{}个", cleaned.size()));
    }

    // 字符串MSB在前，位向量LSB在前，需要翻转
    Bits word(kWordBits, 0);
    for (int i = 0; i < kWordBits; ++i) {
        const char ch = cleaned[kWordBits - 1 - i];
        if (ch != '0' && ch != '1') {
            throw FormatError(fmt::format("二进制串包含非法字符 '{}'", ch));
        }
        word[i] = ch == '1' ? 1 : 0;
    }
    return decode(word);
}

int32_t decode(int64_t value) {
    if (value < 0 || value > kUint32Max) {
        throw FormatError(fmt::format("整数输入 {} 不在 0..0xFFFFFFFF 范围内", value));
    }
    return reinterpretSigned(static_cast<uint32_t>(value));
}

int32_t decode(const Bits& bits) {
    const int32_t value = reinterpretSigned(bits::toUnsigned(bits));
    LOG_DEBUG(TWOS, "decode %s -> %d", bits::toHex(bits), value);
    return value;
}

int64_t parseLiteral(const std::string& text) {
    size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        negative = text[pos] == '-';
        ++pos;
    }

    int base = 10;
    if (text.size() - pos >= 2 && text[pos] == '0' && (text[pos + 1] == 'x' || text[pos + 1] == 'X')) {
        base = 16;
        pos += 2;
    }

    const std::string digits = text.substr(pos);
    if (digits.empty()) {
        throw FormatError(fmt::format("无法解析整数字面量 '{}'", text));
    }
    for (unsigned char ch : digits) {
        if (base == 16 ? !std::isxdigit(ch) : !std::isdigit(ch)) {
            throw FormatError(fmt::format("整数字面量 '{}' 包含非法字符 '{}'", text, static_cast<char>(ch)));
        }
    }

    uint64_t magnitude = 0;
    try {
        magnitude = std::stoull(digits, nullptr, base);
    } catch (const std::out_of_range&) {
        throw RangeError(fmt::format("整数字面量 '{}' 超出64位范围", text));
    }
    if (magnitude > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw RangeError(fmt::format("整数字面量 '{}' 超出64位范围", text));
    }

    const int64_t value = static_cast<int64_t>(magnitude);
    return negative ? -value : value;
}

Bits signExtend(const Bits& bits, int fromWidth, int toWidth) {
    checkWidths(bits, fromWidth, toWidth);
    const uint8_t sign = bits[fromWidth - 1];
    Bits out(bits.begin(), bits.begin() + fromWidth);
    out.resize(toWidth, sign);
    return out;
}

Bits zeroExtend(const Bits& bits, int fromWidth, int toWidth) {
    checkWidths(bits, fromWidth, toWidth);
    Bits out(bits.begin(), bits.begin() + fromWidth);
    out.resize(toWidth, 0);
    return out;
}

} // namespace rvnum::twos
