#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "evaluator/python_evaluator.hpp"
#include "sandbox/sandbox.hpp"

namespace arena::battle {

/**
 * @brief 对战中调用选手函数的方式
 */
struct solution_runner {
    virtual ~solution_runner();

    /**
     * @brief 以 args 为参数调用选手代码中的 entry_point
     * @return 函数的返回值
     * @throw evaluation_error 代码出错、超时或者结果无法解析
     * @throw validation_error 代码或参数不合法
     */
    virtual nlohmann::json call(const std::string &language, const std::string &code,
                                const std::string &entry_point, const nlohmann::json &args) = 0;
};

/**
 * @brief 使用嵌入的 Python 解释器在进程内执行，只支持 python
 */
class in_process_runner : public solution_runner {
public:
    explicit in_process_runner(const evaluator::python_evaluator &evaluator);

    nlohmann::json call(const std::string &language, const std::string &code,
                        const std::string &entry_point, const nlohmann::json &args) override;

private:
    const evaluator::python_evaluator &evaluator;
};

/**
 * @brief 在容器沙箱中执行，代码后附加语言的调用模板
 * 模板从标准输入读取参数，并将结果以 JSON 输出到最后一行
 */
class sandbox_runner : public solution_runner {
public:
    explicit sandbox_runner(sandbox::sandbox &box);

    nlohmann::json call(const std::string &language, const std::string &code,
                        const std::string &entry_point, const nlohmann::json &args) override;

private:
    sandbox::sandbox &box;
};

}  // namespace arena::battle
