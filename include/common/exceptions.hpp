#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <boost/throw_exception.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace arena {

struct arena_exception : std::exception {
    arena_exception();
    explicit arena_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const arena_exception &ex);

    template <typename T>
    arena_exception operator<<(const T &t) const {
        return arena_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示请求本身不合法
 * 代码过长、含有黑名单中的语句、参数格式错误等，这类错误不会重试
 */
struct validation_error : public arena_exception {
    validation_error();
    explicit validation_error(const std::string &message);
};

/**
 * @brief 找不到房间、房间码或题目
 */
struct not_found_error : public arena_exception {
    not_found_error();
    explicit not_found_error(const std::string &message);
};

/**
 * @brief 调用者没有权限执行该操作，比如非房主开始对战
 */
struct forbidden_error : public arena_exception {
    forbidden_error();
    explicit forbidden_error(const std::string &message);
};

/**
 * @brief 操作与对战当前所处的阶段冲突，比如对战结束后提交
 */
struct conflict_error : public arena_exception {
    conflict_error();
    explicit conflict_error(const std::string &message);
};

/**
 * @brief 无法准备执行环境（镜像拉取失败等）
 */
struct provisioning_error : public arena_exception {
    provisioning_error();
    explicit provisioning_error(const std::string &message);
};

/**
 * @brief 与容器守护进程通信失败，通常由 CURL 产生
 */
struct docker_error : public arena_exception {
    docker_error();
    explicit docker_error(const std::string &message);
};

/**
 * @brief 表示数据库查询错误
 */
struct database_error : public arena_exception {
    database_error();
    explicit database_error(const std::string &message);
};

/**
 * @brief 进程内求值器执行用户代码失败
 * 用户代码抛出异常、找不到入口函数、参数或返回值过大
 */
struct evaluation_error : public arena_exception {
    evaluation_error();
    explicit evaluation_error(const std::string &message);
};

/**
 * @brief 进程内求值器执行超时
 */
struct evaluation_timeout : public evaluation_error {
    explicit evaluation_timeout(const std::string &message);
};

}  // namespace arena
