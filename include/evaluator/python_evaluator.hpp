#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "config.hpp"

namespace arena::evaluator {

/**
 * @brief 在嵌入的 CPython 解释器中执行用户的 Python 函数
 * 
 * 用于对战中的测试用例检查，比容器沙箱快得多，但隔离性更弱：
 * - 用户代码的全局作用域只包含一个白名单的 __builtins__，没有文件、进程、
 *   计时器等能力，import 只能导入少数纯计算的标准库模块；
 * - 访问解释器内部的双下划线属性、以下划线开头的属性在编译前就会被拒绝，
 *   collections、functools、string 只能导入其中的部分对象；
 * - 超时由解释器自己强制：看门狗线程会向执行线程注入 TimeoutError。
 * 
 * 只能用于执行 Python 代码，调用者必须持有已经初始化的解释器（不需要持有 GIL）。
 */
class python_evaluator {
public:
    explicit python_evaluator(const evaluator_config &config);

    /**
     * @brief 执行用户代码并调用入口函数
     * 入口函数的查找顺序：顶层函数 entry_point；顶层 Solution 类的同名方法；代码中第一个顶层函数
     * @param code 用户代码
     * @param entry_point 入口函数名
     * @param args 参数列表，必须是 JSON 数组
     * @param timeout_ms 整个执行（包括模块顶层代码）的时间限制
     * @return 入口函数的返回值
     * @throw validation_error 参数过大或者代码访问了被禁止的属性
     * @throw evaluation_timeout 执行超时
     * @throw evaluation_error 用户代码抛出异常或返回值无法转换
     */
    nlohmann::json run(const std::string &code, const std::string &entry_point,
                       const nlohmann::json &args, int timeout_ms) const;

    nlohmann::json run(const std::string &code, const std::string &entry_point,
                       const nlohmann::json &args) const;

private:
    evaluator_config config;
};

/**
 * @brief 注册审计钩子，拒绝创建进程、加载动态库、建立连接等事件
 * 必须在 Py_Initialize 之前调用一次。
 */
void install_audit_hook();

}  // namespace arena::evaluator
