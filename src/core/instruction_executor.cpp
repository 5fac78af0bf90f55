#include "core/instruction_executor.h"
#include "core/alu.h"
#include "core/bits.h"
#include "core/fpu.h"
#include "core/mdu.h"
#include "core/shifter.h"
#include "common/debug_types.h"

namespace rvnum {

namespace {

Bits toBits(uint32_t value) {
    return bits::fromUnsigned(static_cast<int64_t>(value));
}

} // namespace

uint32_t InstructionExecutor::executeInteger(IntOp op, uint32_t rs1_val, uint32_t rs2_val) {
    const Bits a = toBits(rs1_val);
    const Bits b = toBits(rs2_val);
    uint32_t result = 0;

    switch (op) {
        case IntOp::ADD:
            result = bits::toUnsigned(ALU::add(a, b).result);
            break;
        case IntOp::SUB:
            result = bits::toUnsigned(ALU::sub(a, b).result);
            break;
        case IntOp::AND:
            result = bits::toUnsigned(ALU::and_(a, b));
            break;
        case IntOp::OR:
            result = bits::toUnsigned(ALU::or_(a, b));
            break;
        case IntOp::XOR:
            result = bits::toUnsigned(ALU::xor_(a, b));
            break;
        case IntOp::SLT:
            result = bits::toUnsigned(ALU::slt(a, b));
            break;
        case IntOp::SLTU:
            result = bits::toUnsigned(ALU::sltu(a, b));
            break;
        case IntOp::SLL:
        case IntOp::SRL:
        case IntOp::SRA:
            // 移位量取 rs2 低5位
            result = performShiftOperation(op, rs1_val, rs2_val & 0x1F);
            break;
        default:
            result = performMExtension(op, rs1_val, rs2_val);
            break;
    }

    LOG_DEBUG(EXEC, "%s 0x%08x, 0x%08x -> 0x%08x", opName(op), rs1_val, rs2_val, result);
    return result;
}

FpExecuteResult InstructionExecutor::executeFloat(FpOp op, uint32_t rs1_val, uint32_t rs2_val) {
    const Bits a = toBits(rs1_val);
    const Bits b = toBits(rs2_val);

    FpResult fp;
    switch (op) {
        case FpOp::FADD_S:
            fp = FPU::add(a, b);
            break;
        case FpOp::FSUB_S:
            fp = FPU::sub(a, b);
            break;
        case FpOp::FMUL_S:
            fp = FPU::mul(a, b);
            break;
    }

    FpExecuteResult result;
    result.value = bits::toUnsigned(fp.result);
    if (fp.flags.invalid) result.fflags |= FFlags::NV;
    if (fp.flags.overflow) result.fflags |= FFlags::OF;
    if (fp.flags.underflow) result.fflags |= FFlags::UF;

    LOG_DEBUG(EXEC, "%s 0x%08x, 0x%08x -> 0x%08x fflags=0x%02x",
              opName(op), rs1_val, rs2_val, result.value, static_cast<unsigned>(result.fflags));
    return result;
}

uint32_t InstructionExecutor::performShiftOperation(IntOp op, uint32_t value, uint32_t shift_amount) {
    const Bits a = toBits(value);
    const int amount = static_cast<int>(shift_amount);
    switch (op) {
        case IntOp::SLL:
            return bits::toUnsigned(Shifter::shiftLeftLogical(a, amount));
        case IntOp::SRL:
            return bits::toUnsigned(Shifter::shiftRightLogical(a, amount));
        case IntOp::SRA:
            return bits::toUnsigned(Shifter::shiftRightArithmetic(a, amount));
        default:
            throw RangeError("不是移位操作");
    }
}

uint32_t InstructionExecutor::performMExtension(IntOp op, uint32_t rs1_val, uint32_t rs2_val) {
    const Bits a = toBits(rs1_val);
    const Bits b = toBits(rs2_val);
    switch (op) {
        case IntOp::MUL:
            return bits::toUnsigned(MDU::multiply(a, b).result);
        case IntOp::MULH:
            return bits::toUnsigned(MDU::multiplyHigh(a, b, MulSignedness::SIGNED_SIGNED).result);
        case IntOp::MULHSU:
            return bits::toUnsigned(MDU::multiplyHigh(a, b, MulSignedness::SIGNED_UNSIGNED).result);
        case IntOp::MULHU:
            return bits::toUnsigned(MDU::multiplyHigh(a, b, MulSignedness::UNSIGNED_UNSIGNED).result);
        case IntOp::DIV:
            return bits::toUnsigned(MDU::divideRestoring(a, b, true).quotient);
        case IntOp::DIVU:
            return bits::toUnsigned(MDU::divideRestoring(a, b, false).quotient);
        case IntOp::REM:
            return bits::toUnsigned(MDU::divideRestoring(a, b, true).remainder);
        case IntOp::REMU:
            return bits::toUnsigned(MDU::divideRestoring(a, b, false).remainder);
        default:
            throw RangeError("不是M扩展操作");
    }
}

const char* InstructionExecutor::opName(IntOp op) {
    switch (op) {
        case IntOp::ADD: return "add";
        case IntOp::SUB: return "sub";
        case IntOp::AND: return "and";
        case IntOp::OR: return "or";
        case IntOp::XOR: return "xor";
        case IntOp::SLT: return "slt";
        case IntOp::SLTU: return "sltu";
        case IntOp::SLL: return "sll";
        case IntOp::SRL: return "srl";
        case IntOp::SRA: return "sra";
        case IntOp::MUL: return "mul";
        case IntOp::MULH: return "mulh";
        case IntOp::MULHSU: return "mulhsu";
        case IntOp::MULHU: return "mulhu";
        case IntOp::DIV: return "div";
        case IntOp::DIVU: return "divu";
        case IntOp::REM: return "rem";
        case IntOp::REMU: return "remu";
        default: return "unknown";
    }
}

const char* InstructionExecutor::opName(FpOp op) {
    switch (op) {
        case FpOp::FADD_S: return "fadd.s";
        case FpOp::FSUB_S: return "fsub.s";
        case FpOp::FMUL_S: return "fmul.s";
        default: return "unknown";
    }
}

} // namespace rvnum
