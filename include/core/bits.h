#pragma once

#include "common/types.h"
#include <string>

namespace rvnum::bits {

/**
 * 位向量工具
 *
 * 在32位无符号整数与32元素位向量（LSB在下标0）之间转换，并提供
 * 十六进制/分组二进制格式化。宿主机的移位与按位与只在这里用于转换和格式化，
 * 运算单元本身只在位向量上工作。
 */

// 校验32位字：长度为32且只含0/1，否则抛出FormatError
void validateWord(const Bits& bits);

// 校验任意宽度的位向量：长度 >= 1 且只含0/1
void validateBits(const Bits& bits);

// value 必须在 [0, 2^32-1]，否则抛出RangeError
Bits fromUnsigned(int64_t value);
uint32_t toUnsigned(const Bits& bits);

// 任意宽度（<= 64）位向量转为整数，仅用于快照与格式化
uint64_t toUnsignedWide(const Bits& bits);

// 00000000_00000000_00000000_00000000 形式，MSB在左
std::string toGroupedBinary(const Bits& bits, char delimiter = '_');

// 0xDEADBEEF 形式，8位大写十六进制
std::string toHex(const Bits& bits);

// 按位取反
Bits bitwiseNot(const Bits& bits);

// 全零判断
bool isZero(const Bits& bits);

// 截取 [low, low + width) 段，返回新向量
Bits slice(const Bits& bits, int low, int width);

} // namespace rvnum::bits
