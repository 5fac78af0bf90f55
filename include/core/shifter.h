#pragma once

#include "common/types.h"

namespace rvnum {

/**
 * 桶形移位器
 * 移位量按 1/2/4/8/16 五级分解，每级按移位量对应位决定是否生效。
 * 不使用宿主机的多位移位运算符。
 */
class Shifter {
public:
    static Bits shiftLeftLogical(const Bits& bits, int amount);      // SLL，低位补0
    static Bits shiftRightLogical(const Bits& bits, int amount);     // SRL，高位补0
    static Bits shiftRightArithmetic(const Bits& bits, int amount);  // SRA，高位补原符号位

private:
    enum class Direction { LEFT, RIGHT };

    static void validateAmount(int amount);
    static Bits barrel(const Bits& bits, int amount, Direction direction, uint8_t fill);
    static Bits stage(const Bits& src, int distance, Direction direction, uint8_t fill);
};

} // namespace rvnum
