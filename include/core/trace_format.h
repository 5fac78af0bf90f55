#pragma once

#include "core/alu.h"
#include "core/fpu.h"
#include "core/mdu.h"
#include <string>
#include <vector>

namespace rvnum {

// 将执行轨迹渲染成文本表格，每行以换行结尾
std::string formatTrace(const AluTrace& trace);
std::string formatTrace(const std::vector<MulTraceStep>& trace);
std::string formatTrace(const DivTrace& trace);
std::string formatTrace(const std::vector<FpTraceEntry>& trace);

// 0x%08X
std::string hex32(uint32_t value);

} // namespace rvnum
