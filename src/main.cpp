#include "common/debug_types.h"
#include "core/alu.h"
#include "core/bits.h"
#include "core/fpu.h"
#include "core/mdu.h"
#include "core/shifter.h"
#include "core/trace_format.h"
#include "core/twos_complement.h"
#include "system/expectations.h"

#include <fmt/format.h>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

using namespace rvnum;

namespace {

void printUsage(const char* programName) {
    std::cout << "用法: " << programName << " [选项] <命令> [操作数...]\n";
    std::cout << "命令:\n";
    std::cout << "  add|sub A B                  32位加减法，输出结果与 N/Z/C/V\n";
    std::cout << "  sll|srl|sra A SHAMT          移位，SHAMT 取 0..31\n";
    std::cout << "  mul A B                      移位累加乘法（低32位与溢出标志）\n";
    std::cout << "  mulh A B                     有符号乘法高32位\n";
    std::cout << "  div A B                      恢复余数除法（配合 --unsigned）\n";
    std::cout << "  fadd|fsub|fmul X Y           binary32 浮点运算，X/Y 为十进制实数\n";
    std::cout << "  encode V                     有符号整数编码为32位补码\n";
    std::cout << "  decode BITS|U32              32位二进制串或无符号整数按补码解读\n";
    std::cout << "  pack X                       实数打包为 binary32\n";
    std::cout << "  unpack U32                   binary32 位模式解包\n";
    std::cout << "  report                       打印样例期望报告\n";
    std::cout << "\n";
    std::cout << "选项:\n";
    std::cout << "  -h, --help                   显示此帮助信息\n";
    std::cout << "  -t, --trace                  输出逐步执行轨迹\n";
    std::cout << "  -u, --unsigned               div 使用无符号语义\n";
    std::cout << "  -d, --debug                  调试模式（输出所有分类）\n";
    std::cout << "  --debug-flags=<flags>        指定调试分类（用逗号分隔）\n";
    std::cout << "  --debug-preset=<preset>      使用预设调试配置\n";
    std::cout << "  --debug-file=<file>          调试日志输出到文件\n";
    std::cout << "  --debug-no-console           禁用控制台输出（仅文件输出）\n";
    std::cout << "\n";
    std::cout << "可用的调试预设:\n";
    std::cout << "  integer    整数运算 (alu, shift, mdu)\n";
    std::cout << "  float      浮点运算 (fpu)\n";
    std::cout << "  conversion 位向量与补码转换 (bits, twos)\n";
    std::cout << "  detailed   所有调试信息\n";
    std::cout << "  minimal    指令级执行 (exec)\n";
    std::cout << "\n";
    std::cout << "示例:\n";
    std::cout << "  " << programName << " add 0x7FFFFFFF 1 --trace\n";
    std::cout << "  " << programName << " div -7 3\n";
    std::cout << "  " << programName << " --debug-preset=float fmul 1e38 10\n";
}

// 十进制（可为负）或 0x 十六进制，前导零不按八进制解释
int64_t parseInteger(const std::string& text) {
    return twos::parseLiteral(text);
}

// 范围 [-2^31, 2^32-1]
Bits parseWord(const std::string& text) {
    const int64_t value = parseInteger(text);
    if (value < kInt32Min || value > kUint32Max) {
        throw RangeError("整数操作数超出32位范围: " + text);
    }
    return twos::encode(value).bits;
}

double parseReal(const std::string& text) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::exception&) {
        throw FormatError("无法解析实数操作数: " + text);
    }
    if (consumed != text.size()) {
        throw FormatError("无法解析实数操作数: " + text);
    }
    return value;
}

int parseAmount(const std::string& text) {
    const int64_t value = parseInteger(text);
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw RangeError("移位量超出范围: " + text);
    }
    return static_cast<int>(value);
}

void requireOperands(const std::string& command, const std::vector<std::string>& operands, size_t count) {
    if (operands.size() != count) {
        throw RangeError(fmt::format("命令 {} 需要 {} 个操作数，实际为 {}", command, count, operands.size()));
    }
}

void printAlu(const AluResult& result, bool trace) {
    std::cout << fmt::format("result={} ({}) N={} Z={} C={} V={}\n",
                             bits::toHex(result.result), bits::toGroupedBinary(result.result),
                             int{result.flags.n}, int{result.flags.z},
                             int{result.flags.c}, int{result.flags.v});
    if (trace && result.trace) {
        std::cout << formatTrace(*result.trace);
    }
}

void printFloat(const FpResult& result, bool trace) {
    const UnpackResult value = FPU::unpack(result.result);
    std::cout << fmt::format("result={} value={} class={} overflow={} underflow={} invalid={}\n",
                             bits::toHex(result.result), value.value, toString(value.cls),
                             result.flags.overflow ? 1 : 0, result.flags.underflow ? 1 : 0,
                             result.flags.invalid ? 1 : 0);
    if (trace) {
        std::cout << formatTrace(result.trace);
    }
}

int runCommand(const std::string& command, const std::vector<std::string>& operands,
               bool trace, bool isSigned) {
    if (command == "add" || command == "sub") {
        requireOperands(command, operands, 2);
        const Bits a = parseWord(operands[0]);
        const Bits b = parseWord(operands[1]);
        printAlu(command == "add" ? ALU::add(a, b, trace) : ALU::sub(a, b, trace), trace);
    } else if (command == "sll" || command == "srl" || command == "sra") {
        requireOperands(command, operands, 2);
        const Bits a = parseWord(operands[0]);
        const int amount = parseAmount(operands[1]);
        const Bits out = command == "sll" ? Shifter::shiftLeftLogical(a, amount)
                       : command == "srl" ? Shifter::shiftRightLogical(a, amount)
                                          : Shifter::shiftRightArithmetic(a, amount);
        std::cout << fmt::format("result={} ({})\n", bits::toHex(out), bits::toGroupedBinary(out));
    } else if (command == "mul") {
        requireOperands(command, operands, 2);
        const MulResult result = MDU::multiply(parseWord(operands[0]), parseWord(operands[1]), trace);
        std::cout << fmt::format("result={} overflow={}\n", bits::toHex(result.result), result.overflow ? 1 : 0);
        if (result.trace) {
            std::cout << formatTrace(*result.trace);
        }
    } else if (command == "mulh") {
        requireOperands(command, operands, 2);
        const MulResult result = MDU::multiplyHigh(parseWord(operands[0]), parseWord(operands[1]),
                                                   MulSignedness::SIGNED_SIGNED, trace);
        std::cout << fmt::format("result={}\n", bits::toHex(result.result));
        if (result.trace) {
            std::cout << formatTrace(*result.trace);
        }
    } else if (command == "div") {
        requireOperands(command, operands, 2);
        const DivResult result = MDU::divideRestoring(parseWord(operands[0]), parseWord(operands[1]),
                                                      isSigned, trace);
        std::cout << fmt::format("quotient={} remainder={} div_by_zero={} overflow={}\n",
                                 bits::toHex(result.quotient), bits::toHex(result.remainder),
                                 result.flags.div_by_zero ? 1 : 0, result.flags.overflow ? 1 : 0);
        if (result.trace) {
            std::cout << formatTrace(*result.trace);
        }
    } else if (command == "fadd" || command == "fsub" || command == "fmul") {
        requireOperands(command, operands, 2);
        const Bits x = FPU::pack(parseReal(operands[0])).bits;
        const Bits y = FPU::pack(parseReal(operands[1])).bits;
        printFloat(command == "fadd" ? FPU::add(x, y)
                   : command == "fsub" ? FPU::sub(x, y)
                                       : FPU::mul(x, y), trace);
    } else if (command == "encode") {
        requireOperands(command, operands, 1);
        const twos::EncodeResult enc = twos::encode(parseInteger(operands[0]));
        std::cout << fmt::format("bin={} hex={} overflow={}\n", enc.bin, enc.hex, enc.overflow ? 1 : 0);
    } else if (command == "decode") {
        requireOperands(command, operands, 1);
        const std::string& text = operands[0];
        const bool isBinary = text.find_first_not_of("01_") == std::string::npos && text.size() >= 32;
        const int32_t value = isBinary ? twos::decode(text)
                                       : twos::decode(parseInteger(text));
        std::cout << fmt::format("value={}\n", value);
    } else if (command == "pack") {
        requireOperands(command, operands, 1);
        const PackResult packed = FPU::pack(parseReal(operands[0]));
        std::cout << fmt::format("bits={} ({}) sign={} exponent={} fraction={}\n",
                                 bits::toHex(packed.bits), bits::toGroupedBinary(packed.bits),
                                 packed.fields.sign,
                                 bits::toUnsignedWide(packed.fields.exponent),
                                 bits::toUnsignedWide(packed.fields.fraction));
    } else if (command == "unpack") {
        requireOperands(command, operands, 1);
        const UnpackResult value = FPU::unpack(parseWord(operands[0]));
        std::cout << fmt::format("value={} class={}\n", value.value, toString(value.cls));
    } else if (command == "report") {
        ExpectationReport report(std::cout);
        report.run();
    } else {
        std::cerr << "未知命令: " << command << "\n";
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string command;
    std::vector<std::string> operands;
    bool trace = false;
    bool isSigned = true;
    bool debugMode = false;
    bool debugNoConsole = false;
    std::string debugCategories;
    std::string debugPreset;

    auto& debugManager = DebugManager::getInstance();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "-t" || arg == "--trace") {
            trace = true;
        } else if (arg == "-u" || arg == "--unsigned") {
            isSigned = false;
        } else if (arg == "-d" || arg == "--debug") {
            debugMode = true;
        } else if (arg.find("--debug-flags=") == 0) {
            debugCategories = arg.substr(14);  // 去掉 "--debug-flags=" 前缀
            debugMode = true;
        } else if (arg.find("--debug-preset=") == 0) {
            debugPreset = arg.substr(15);  // 去掉 "--debug-preset=" 前缀
            debugMode = true;
        } else if (arg.find("--debug-file=") == 0) {
            std::string logFile = arg.substr(13);  // 去掉 "--debug-file=" 前缀
            debugManager.setLogFile(logFile);
            debugManager.setOutputToFile(true);
            debugNoConsole = true;
            debugMode = true;
            std::cout << "调试日志将输出到文件: " << logFile << "\n";
        } else if (arg == "--debug-no-console") {
            debugNoConsole = true;
            debugMode = true;
        } else if (command.empty()) {
            command = arg;
        } else {
            operands.push_back(arg);
        }
    }

    if (command.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    // 配置调试系统
    if (debugMode) {
        debugManager.setOutputToConsole(!debugNoConsole);
        if (!debugPreset.empty()) {
            debugManager.setPreset(debugPreset);
            std::cout << "使用调试预设: " << debugPreset << "\n";
        } else if (!debugCategories.empty()) {
            debugManager.setCategories(debugCategories);
            std::cout << "使用调试分类: " << debugCategories << "\n";
        }
        std::cout << debugManager.getConfigInfo() << "\n\n";
    }

    try {
        const int status = runCommand(command, operands, trace, isSigned);
        debugManager.closeLogFile();
        return status;
    } catch (const NumericException& e) {
        std::cerr << "错误: " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "错误: " << e.what() << "\n";
    }
    debugManager.closeLogFile();
    return 1;
}
