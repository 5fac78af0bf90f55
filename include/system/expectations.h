#pragma once

#include <ostream>

namespace rvnum {

/**
 * 样例期望报告
 * 按固定输入运行各运算单元，打印结果与期望值供人工核对
 */
class ExpectationReport {
public:
    explicit ExpectationReport(std::ostream& out) : out_(out) {}

    void run();

    void printAluEdgeCases();
    void printTwosComplement();
    void printAddSubTraces();
    void printMultiply();
    void printDivide();
    void printFloat32();

private:
    std::ostream& out_;

    void separator();
};

} // namespace rvnum
