#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <stdexcept>

namespace rvnum {

// 基本数据类型定义
using uint64_t = std::uint64_t;
using int64_t = std::int64_t;
using uint32_t = std::uint32_t;
using int32_t = std::int32_t;
using uint8_t = std::uint8_t;

// 位向量：下标0为最低位（LSB），每个元素只能是0或1
using Bits = std::vector<uint8_t>;

// 机器字宽度
constexpr int kWordBits = 32;
constexpr int kDoubleWordBits = 64;

// 有符号32位范围
constexpr int64_t kInt32Min = -(int64_t{1} << 31);
constexpr int64_t kInt32Max = (int64_t{1} << 31) - 1;
constexpr int64_t kUint32Max = 0xFFFFFFFFLL;

// 整数运算标志位
struct AluFlags {
    bool n = false;     // 结果符号位
    bool z = false;     // 结果全零
    bool c = false;     // 最高位进位
    bool v = false;     // 有符号溢出

    bool operator==(const AluFlags& other) const {
        return n == other.n && z == other.z && c == other.c && v == other.v;
    }
    bool operator!=(const AluFlags& other) const { return !(*this == other); }
};

// 浮点运算标志位（用于检查/评分，并非完整的IEEE异常模型）
struct FpFlags {
    bool overflow = false;
    bool underflow = false;
    bool invalid = false;
};

// 异常类型
class NumericException : public std::runtime_error {
public:
    explicit NumericException(const std::string& message) : std::runtime_error(message) {}
};

// 位向量格式错误：长度不对或含有0/1以外的元素
class FormatError : public NumericException {
public:
    explicit FormatError(const std::string& message)
        : NumericException("格式错误: " + message) {}
};

// 标量参数超出定义域
class RangeError : public NumericException {
public:
    explicit RangeError(const std::string& message)
        : NumericException("范围错误: " + message) {}
};

} // namespace rvnum
