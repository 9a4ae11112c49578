#pragma once

namespace arena {

/**
 * @brief 表示一次代码执行没有正常完成的原因
 * 沙箱会把所有这些错误转换为结构化的执行结果，而不是抛出异常
 */
enum class error_type {
    /**
     * @brief 程序正常运行结束（返回值为 0）
     */
    NONE = 0,

    /**
     * @brief 代码过长、含有非法字符或者命中了语言的黑名单
     * 在分配任何执行资源之前就会被拒绝，不会重试
     */
    VALIDATION_ERROR = 1,

    /**
     * @brief 程序运行时间超出限制
     * 容器会被强制终止并删除，返回超时之前已经收集到的输出
     */
    TIME_LIMIT_EXCEEDED = 2,

    /**
     * @brief 程序因为内存超限被 OOM killer 杀死
     */
    MEMORY_LIMIT_EXCEEDED = 3,

    /**
     * @brief 程序以非零返回值退出，或者被信号终止
     * 此时 stderr 通常包含了错误信息
     */
    CRASHED = 4,

    /**
     * @brief 执行环境本身无法准备好（镜像拉取失败、容器无法创建）
     * 这表示基础设施出了问题，而不是用户代码的问题
     */
    PROVISIONING_ERROR = 5
};

/**
 * @brief 返回错误类型在接口中的名称，比如 TimeoutError
 */
const char *get_display_message(error_type);

}  // namespace arena
