#pragma once

#include "common/types.h"
#include <string>
#include <vector>

namespace rvnum {

// binary32 分类
enum class FpClass {
    ZERO,
    SUBNORMAL,
    NORMAL,
    INF,
    NAN_VALUE
};

const char* toString(FpClass cls);

// 打包后的三个字段，exponent/fraction 均为LSB在前
struct Float32Fields {
    uint8_t sign = 0;
    Bits exponent;      // 8位
    Bits fraction;      // 23位
};

struct PackResult {
    Bits bits;
    Float32Fields fields;
};

struct UnpackResult {
    double value = 0.0;
    FpClass cls = FpClass::ZERO;
};

// 浮点运算只记录一条：两个操作数与结果的位模式
struct FpTraceEntry {
    std::string op;
    uint32_t a = 0;
    uint32_t b = 0;
    uint32_t result = 0;
};

struct FpResult {
    Bits result;
    FpFlags flags;
    std::vector<FpTraceEntry> trace;
};

/**
 * IEEE-754 binary32 浮点单元
 *
 * pack 与 add/sub/mul 共用同一套 guard/round/sticky 舍入（RNE，就近舍入、平局取偶）。
 * add/sub/mul 在拆开的符号/指数/有效位整数上完成对阶、求和或相乘，
 * 再规格化并舍入，结果等于实数运算结果正确舍入到 binary32。
 */
class FPU {
public:
    static constexpr uint32_t kCanonicalNaN = 0x7FC00000U;
    static constexpr uint32_t kPositiveInfinity = 0x7F800000U;
    static constexpr int kExponentBias = 127;
    static constexpr int kFractionBits = 23;
    static constexpr int kExponentBits = 8;

    static PackResult pack(double value);
    static UnpackResult unpack(const Bits& bits);

    static FpClass classify(const Bits& bits);
    static Float32Fields split(const Bits& bits);
    static Bits compose(const Float32Fields& fields);

    static FpResult add(const Bits& a, const Bits& b);
    static FpResult sub(const Bits& a, const Bits& b);
    static FpResult mul(const Bits& a, const Bits& b);

private:
    // value = (-1)^sign * significand * 2^exponent
    struct Operand {
        uint8_t sign = 0;
        uint64_t significand = 0;
        int exponent = 0;
        FpClass cls = FpClass::ZERO;
    };

    static Operand decompose(const Bits& bits);
    static uint32_t roundAndPack(uint8_t sign, uint64_t significand, int exponent);
    static uint32_t addMagnitudes(const Operand& a, const Operand& b);
    static uint32_t multiplyOperands(const Operand& a, const Operand& b);
    static FpResult finish(const char* op, const Bits& a, const Bits& b, uint32_t result);
};

} // namespace rvnum
