#pragma once

#include "common/types.h"
#include <string>

namespace rvnum::twos {

/**
 * 补码编码结果
 * overflow 只表示原值超出有符号32位范围，位模式照常按模2^32回绕生成
 */
struct EncodeResult {
    Bits bits;
    std::string bin;    // 分组二进制，MSB在左
    std::string hex;    // 0x前缀的8位十六进制
    bool overflow = false;
};

// 将任意有符号整数编码为32位补码
EncodeResult encode(int64_t value);

// 32字符二进制串（MSB在左，允许'_'分组）解码为有符号值
int32_t decode(const std::string& binary);

// [0, 2^32-1] 范围内的无符号整数按补码解读
int32_t decode(int64_t value);

// 位向量按补码解读
int32_t decode(const Bits& bits);

// 解析整数字面量：可带 +/- 号的十进制，或 0x/0X 前缀的十六进制
// 前导零仍按十进制处理
int64_t parseLiteral(const std::string& text);

// 复制第 fromWidth-1 位（符号位）扩展到 toWidth
Bits signExtend(const Bits& bits, int fromWidth, int toWidth);

// 高位补零扩展到 toWidth
Bits zeroExtend(const Bits& bits, int fromWidth, int toWidth);

} // namespace rvnum::twos
