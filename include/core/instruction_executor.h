#pragma once

#include "common/types.h"

namespace rvnum {

// RV32I/M 整数运算
enum class IntOp {
    ADD, SUB,
    AND, OR, XOR,
    SLT, SLTU,
    SLL, SRL, SRA,
    MUL, MULH, MULHSU, MULHU,
    DIV, DIVU, REM, REMU
};

// RV32F 运算（本单元只实现加减乘）
enum class FpOp {
    FADD_S,
    FSUB_S,
    FMUL_S
};

// fflags 位定义，位置与 fcsr 低5位一致，只产生以下三种
namespace FFlags {
    constexpr uint8_t UF = 0x02;    // 下溢
    constexpr uint8_t OF = 0x04;    // 上溢
    constexpr uint8_t NV = 0x10;    // 无效操作
    constexpr uint8_t ALL = UF | OF | NV;
}

struct FpExecuteResult {
    uint32_t value = 0;
    uint8_t fflags = 0;
};

/**
 * 指令执行引擎
 *
 * ISA模拟器调用算术单元的入口：接收寄存器值（32位字），
 * 转成位向量交给 ALU/Shifter/MDU/FPU，再转回字。
 * 没有译码、寄存器堆和内存，所有方法都是静态纯函数。
 */
class InstructionExecutor {
public:
    static uint32_t executeInteger(IntOp op, uint32_t rs1_val, uint32_t rs2_val);
    static FpExecuteResult executeFloat(FpOp op, uint32_t rs1_val, uint32_t rs2_val);

    static const char* opName(IntOp op);
    static const char* opName(FpOp op);

private:
    static uint32_t performShiftOperation(IntOp op, uint32_t value, uint32_t shift_amount);
    static uint32_t performMExtension(IntOp op, uint32_t rs1_val, uint32_t rs2_val);
};

} // namespace rvnum
