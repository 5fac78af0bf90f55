#include "core/trace_format.h"

#include <fmt/format.h>

namespace rvnum {

std::string hex32(uint32_t value) {
    return fmt::format("0x{:08X}", value);
}

std::string formatTrace(const AluTrace& trace) {
    std::string out = fmt::format("  start: a={} b={} cin={}\n",
                                  hex32(trace.start.a), hex32(trace.start.b), trace.start.carry_in);
    out += "  step  ai bi cin -> s cout   partial_low32_hex\n";

    // 逐位累积和位，展示进位链推进过程
    uint32_t partial = 0;
    for (const auto& step : trace.steps) {
        if (step.sum_bit) {
            partial |= (1U << step.bit);
        }
        out += fmt::format("  {:>3}   {}  {}  {}   -> {}   {}    {}\n",
                           step.bit, step.a_bit, step.b_bit, step.carry_in,
                           step.sum_bit, step.carry_out, hex32(partial));
    }

    const AluFlags& f = trace.finish.flags;
    out += fmt::format("  finish: result={} N={} Z={} C={} V={}\n",
                       hex32(trace.finish.result), int{f.n}, int{f.z}, int{f.c}, int{f.v});
    return out;
}

std::string formatTrace(const std::vector<MulTraceStep>& trace) {
    std::string out = "  step  mul_bit  added  acc_hi32     acc_low32\n";
    for (const auto& step : trace) {
        out += fmt::format("  {:4d}     {}        {}    {}  {}\n",
                           step.step, step.multiplier_bit, step.added ? 1 : 0,
                           hex32(step.acc_high), hex32(step.acc_low));
    }
    return out;
}

std::string formatTrace(const DivTrace& trace) {
    std::string out = fmt::format("  start: dividend={} divisor={} {} quotient_negative={}\n",
                                  hex32(trace.start.dividend), hex32(trace.start.divisor),
                                  trace.start.is_signed ? "signed" : "unsigned",
                                  trace.start.quotient_negative ? 1 : 0);
    out += "  iter  q_bit  restored  remainder33    quotient\n";
    for (const auto& step : trace.steps) {
        out += fmt::format("  {:4d}    {}       {}      0x{:09X}  {}\n",
                           step.iteration, step.quotient_bit, step.restored ? 1 : 0,
                           step.remainder, hex32(step.quotient));
    }
    out += fmt::format("  finish: q={} r={} div_by_zero={} overflow={}\n",
                       hex32(trace.finish.quotient), hex32(trace.finish.remainder),
                       trace.finish.flags.div_by_zero ? 1 : 0,
                       trace.finish.flags.overflow ? 1 : 0);
    return out;
}

std::string formatTrace(const std::vector<FpTraceEntry>& trace) {
    std::string out;
    for (const auto& entry : trace) {
        out += fmt::format("  {}: a={} b={} -> {}\n",
                           entry.op, hex32(entry.a), hex32(entry.b), hex32(entry.result));
    }
    return out;
}

} // namespace rvnum
