#include "system/expectations.h"
#include "core/alu.h"
#include "core/bits.h"
#include "core/fpu.h"
#include "core/mdu.h"
#include "core/trace_format.h"
#include "core/twos_complement.h"

#include <fmt/format.h>

namespace rvnum {

namespace {

Bits word(uint32_t value) {
    return bits::fromUnsigned(static_cast<int64_t>(value));
}

std::string flagLine(const AluFlags& f) {
    return fmt::format("V={}; C={}; N={}; Z={}", int{f.v}, int{f.c}, int{f.n}, int{f.z});
}

} // namespace

void ExpectationReport::run() {
    separator();
    printAluEdgeCases();
    separator();
    printTwosComplement();
    separator();
    printAddSubTraces();
    separator();
    printMultiply();
    separator();
    printDivide();
    separator();
    printFloat32();
}

void ExpectationReport::separator() {
    out_ << "----------------------------------------\n";
}

void ExpectationReport::printAluEdgeCases() {
    out_ << "ALU 边界期望:\n";

    const AluResult r1 = ALU::add(word(0x7FFFFFFF), word(0x00000001));
    out_ << "  期望 0x7FFFFFFF + 0x00000001 -> 0x80000000; V=1; C=0; N=1; Z=0\n";
    out_ << fmt::format("  实际 0x7FFFFFFF + 0x00000001 -> {}; {}\n",
                        bits::toHex(r1.result), flagLine(r1.flags));

    const AluResult r2 = ALU::sub(word(0x80000000), word(0x00000001));
    out_ << "  期望 0x80000000 - 0x00000001 -> 0x7FFFFFFF; V=1; C=1; N=0; Z=0\n";
    out_ << fmt::format("  实际 0x80000000 - 0x00000001 -> {}; {}\n",
                        bits::toHex(r2.result), flagLine(r2.flags));

    const AluResult r3 = ALU::add(word(0xFFFFFFFF), word(0xFFFFFFFF));
    out_ << "  期望 -1 + -1 -> 0xFFFFFFFE; V=0; C=1; N=1; Z=0\n";
    out_ << fmt::format("  实际 -1 + -1 -> {}; {}\n", bits::toHex(r3.result), flagLine(r3.flags));
}

void ExpectationReport::printTwosComplement() {
    out_ << "补码编码期望 (width=32):\n";
    const int64_t samples[] = {13, -13, int64_t{1} << 31};
    for (int64_t value : samples) {
        const twos::EncodeResult enc = twos::encode(value);
        out_ << fmt::format("  {} -> bin {}; hex {}; overflow={}\n",
                            value, enc.bin, enc.hex, enc.overflow ? 1 : 0);
    }
}

void ExpectationReport::printAddSubTraces() {
    out_ << "ALU 行波进位轨迹:\n";

    const AluResult add = ALU::add(word(0x7FFFFFFF), word(0x00000001), true);
    out_ << "ADD 0x7FFFFFFF + 0x00000001:\n";
    out_ << formatTrace(*add.trace);

    const AluResult sub = ALU::sub(word(0x80000000), word(0x00000001), true);
    out_ << "SUB 0x80000000 - 0x00000001:\n";
    out_ << formatTrace(*sub.trace);
}

void ExpectationReport::printMultiply() {
    out_ << "乘法期望:\n";
    const Bits rs1 = twos::encode(12345678).bits;
    const Bits rs2 = twos::encode(-87654321).bits;

    const MulResult mul = MDU::multiply(rs1, rs2, true);
    out_ << "  期望 MUL 12345678 * -87654321 -> 0xD91D0712; overflow=1\n";
    out_ << fmt::format("  实际 MUL 12345678 * -87654321 -> {}; overflow={}\n",
                        bits::toHex(mul.result), mul.overflow ? 1 : 0);
    out_ << formatTrace(*mul.trace);

    const MulResult mulh = MDU::multiplyHigh(rs1, rs2, MulSignedness::SIGNED_SIGNED);
    out_ << "  期望 MULH 12345678 * -87654321 -> 0xFFFC27C9\n";
    out_ << fmt::format("  实际 MULH 12345678 * -87654321 -> {}\n", bits::toHex(mulh.result));
}

void ExpectationReport::printDivide() {
    out_ << "除法期望:\n";

    const DivResult div = MDU::divideRestoring(word(0xFFFFFFF9), word(3), true, true);
    out_ << "  期望 DIV -7 / 3 -> q=0xFFFFFFFE; r=0xFFFFFFFF\n";
    out_ << fmt::format("  实际 DIV -7 / 3 -> q={}; r={}\n",
                        bits::toHex(div.quotient), bits::toHex(div.remainder));
    out_ << formatTrace(*div.trace);

    const DivResult divu = MDU::divideRestoring(word(0x80000000), word(3), false);
    out_ << "  期望 DIVU 0x80000000 / 3 -> q=0x2AAAAAAA; r=0x00000002\n";
    out_ << fmt::format("  实际 DIVU 0x80000000 / 3 -> q={}; r={}\n",
                        bits::toHex(divu.quotient), bits::toHex(divu.remainder));
}

void ExpectationReport::printFloat32() {
    out_ << "Float32 期望:\n";

    const FpResult sum = FPU::add(FPU::pack(1.5).bits, FPU::pack(2.25).bits);
    out_ << fmt::format("  1.5 + 2.25 = 3.75 -> {} (期望 0x40700000)\n", bits::toHex(sum.result));

    const FpResult tie = FPU::add(FPU::pack(0.1).bits, FPU::pack(0.2).bits);
    out_ << fmt::format("  0.1 + 0.2 ~ {:.10f} -> {} (期望 0x3E99999A)\n",
                        FPU::unpack(tie.result).value, bits::toHex(tie.result));

    const FpResult big = FPU::mul(FPU::pack(1e38).bits, FPU::pack(10.0).bits);
    out_ << fmt::format("  1e38 * 10 -> {} ({}); overflow={} (期望 inf, overflow=1)\n",
                        bits::toHex(big.result), toString(FPU::classify(big.result)),
                        big.flags.overflow ? 1 : 0);

    const FpResult tiny = FPU::mul(FPU::pack(1e-38).bits, FPU::pack(1e-2).bits);
    out_ << fmt::format("  1e-38 * 1e-2 -> {} ({}); underflow={} (期望 subnormal, underflow=1)\n",
                        bits::toHex(tiny.result), toString(FPU::classify(tiny.result)),
                        tiny.flags.underflow ? 1 : 0);
}

} // namespace rvnum
