#include "common/debug_types.h"

namespace rvnum {

// 定义调试预设配置
const std::unordered_map<std::string, std::vector<std::string>> LogPresets::presets = {
    // 整数预设：加法器、移位器与乘除单元
    {"integer", {
        "ALU", "SHIFT", "MDU"
    }},

    // 浮点预设
    {"float", {
        "FPU"
    }},

    // 转换预设：位向量与补码编解码
    {"conversion", {
        "BITS", "TWOS"
    }},

    // 详细预设：所有调试信息
    {"detailed", {
        "BITS", "TWOS", "SHIFT", "ALU", "MDU", "FPU", "EXEC"
    }},

    // 最小预设：只看指令级执行结果
    {"minimal", {
        "EXEC"
    }}
};

} // namespace rvnum
