#pragma once

#include "common/types.h"
#include <optional>
#include <vector>

namespace rvnum {

// 乘法每一步：乘数位、是否累加，以及累加器高低32位快照
struct MulTraceStep {
    int step = 0;
    uint8_t multiplier_bit = 0;
    bool added = false;
    uint32_t acc_low = 0;
    uint32_t acc_high = 0;
};

struct MulResult {
    Bits result;                // 64位累加器的低32位（MULH系列为高32位）
    bool overflow = false;
    std::optional<std::vector<MulTraceStep>> trace;
};

// MULH / MULHSU / MULHU 的操作数符号性
enum class MulSignedness {
    SIGNED_SIGNED,
    SIGNED_UNSIGNED,
    UNSIGNED_UNSIGNED
};

struct DivFlags {
    bool div_by_zero = false;
    bool overflow = false;

    bool operator==(const DivFlags& other) const {
        return div_by_zero == other.div_by_zero && overflow == other.overflow;
    }
};

struct DivTraceStart {
    uint32_t dividend = 0;
    uint32_t divisor = 0;
    bool is_signed = true;
    bool quotient_negative = false;
};

// 每次迭代后的寄存器快照；remainder 为33位
struct DivTraceStep {
    int iteration = 0;
    uint8_t quotient_bit = 0;
    bool restored = false;
    uint64_t remainder = 0;
    uint32_t quotient = 0;
};

struct DivTraceFinish {
    uint32_t quotient = 0;
    uint32_t remainder = 0;
    DivFlags flags;
};

struct DivTrace {
    DivTraceStart start;
    std::vector<DivTraceStep> steps;
    DivTraceFinish finish;
};

struct DivResult {
    Bits quotient;
    Bits remainder;
    DivFlags flags;
    std::optional<DivTrace> trace;
};

/**
 * 乘除法单元（RV32M）
 *
 * 乘法：rs1 符号扩展到64位，按 rs2 的32个位从低到高移位累加，
 * 加法全部经过 ALU 的行波进位链。
 * 除法：33位余数/32位商的恢复余数法，共32次迭代。
 * 除零与 INT32_MIN / -1 按 RISC-V M 规定给出结果并置标志，不抛异常。
 */
class MDU {
public:
    static MulResult multiply(const Bits& rs1, const Bits& rs2, bool trace = false);

    // 64位完整乘积的高32位；overflow 恒为false
    static MulResult multiplyHigh(const Bits& rs1, const Bits& rs2,
                                  MulSignedness signedness, bool trace = false);

    static DivResult divideRestoring(const Bits& dividend, const Bits& divisor,
                                     bool is_signed = true, bool trace = false);

private:
    static Bits shiftDoubleWordLeft(const Bits& value);
    static Bits shiftRemainderLeft(const Bits& remainder, uint8_t fill);
    static MulTraceStep snapshot(int step, uint8_t multiplier_bit, bool added, const Bits& acc);
};

} // namespace rvnum
