#pragma once

#include <string>
#include <vector>

namespace arena::sandbox {

/**
 * @brief 静态检查的结果
 */
struct validation_result {
    bool ok = true;

    /**
     * @brief 所有违规项的说明，ok 为真时为空
     */
    std::vector<std::string> violations;
};

/**
 * @brief 在分配任何执行资源之前检查代码
 * 
 * 检查代码长度、空字符和控制字符、UTF-8 编码以及语言的黑名单。
 * 黑名单基于正则表达式，不可能完备，只作为快速的预过滤，
 * 执行的安全性依赖于容器隔离（或者进程内求值器的白名单上下文）。
 * 
 * 这是一个纯函数，没有任何副作用。
 */
class validator {
public:
    explicit validator(size_t max_code_size);

    validation_result validate(const std::string &code, const std::string &language) const;

    size_t max_size() const;

private:
    size_t max_code_size;
};

}  // namespace arena::sandbox
