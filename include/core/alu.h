#pragma once

#include "common/types.h"
#include <optional>
#include <vector>

namespace rvnum {

// 行波进位链的起始记录：进入进位链的两个操作数与初始进位
struct AluTraceStart {
    uint32_t a = 0;
    uint32_t b = 0;
    uint8_t carry_in = 0;
};

// 单个全加器位置的记录
struct AluTraceStep {
    int bit = 0;
    uint8_t a_bit = 0;
    uint8_t b_bit = 0;
    uint8_t carry_in = 0;
    uint8_t sum_bit = 0;
    uint8_t carry_out = 0;
};

struct AluTraceFinish {
    uint32_t result = 0;
    AluFlags flags;
};

/**
 * ALU执行轨迹
 * 只做观察用途，不参与运算
 */
struct AluTrace {
    AluTraceStart start;
    std::vector<AluTraceStep> steps;
    AluTraceFinish finish;
};

struct AluResult {
    Bits result;
    AluFlags flags;
    std::optional<AluTrace> trace;
};

// 任意宽度行波进位加法的输出
struct RippleResult {
    Bits sum;
    uint8_t carry_into_msb = 0;
    uint8_t carry_out = 0;
};

/**
 * 算术逻辑单元
 * ADD 与 SUB 共用一条32位行波进位链：SUB = a + ~b + 1
 */
class ALU {
public:
    // 算术运算
    static AluResult add(const Bits& a, const Bits& b, bool trace = false);
    static AluResult sub(const Bits& a, const Bits& b, bool trace = false);

    // 逻辑运算
    static Bits and_(const Bits& a, const Bits& b);
    static Bits or_(const Bits& a, const Bits& b);
    static Bits xor_(const Bits& a, const Bits& b);

    // 比较运算，结果为0或1
    static Bits slt(const Bits& a, const Bits& b);     // 有符号小于
    static Bits sltu(const Bits& a, const Bits& b);    // 无符号小于

    // 任意等宽行波进位加法，供MDU的33/64位寄存器使用
    static RippleResult rippleAdd(const Bits& a, const Bits& b, uint8_t carry_in);

    // 补码取负：~x + 1，宽度不变
    static Bits negate(const Bits& bits);

private:
    static AluResult addWithCarry(const Bits& a, const Bits& b, uint8_t carry_in, bool trace);
    static RippleResult rippleChain(const Bits& a, const Bits& b, uint8_t carry_in,
                                    std::vector<AluTraceStep>* steps);
    static void validateOperands(const Bits& a, const Bits& b);
};

} // namespace rvnum
