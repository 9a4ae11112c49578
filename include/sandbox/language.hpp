#pragma once

#include <map>
#include <regex>
#include <string>
#include <vector>

namespace arena::sandbox {

/**
 * @brief 黑名单中的一项
 */
struct denylist_entry {
    /**
     * @brief 匹配代码的正则表达式
     */
    std::regex pattern;

    /**
     * @brief 违规时返回给调用者的说明
     */
    std::string description;
};

/**
 * @brief 描述一种可以在沙箱中执行的语言
 * 
 * 容器内的命令由 shell 执行：先把环境变量 ARENA_CODE 写入 /tmp/source_file，
 * 然后执行 compile_command（如果有），最后把 ARENA_INPUT 作为标准输入执行 run_command
 */
struct language {
    /**
     * @brief 语言 id，请求中的 language 字段
     */
    std::string id;

    std::string display_name;

    /**
     * @brief 执行所用的容器镜像
     */
    std::string image;

    /**
     * @brief 源代码文件名，位于 /tmp 下
     */
    std::string source_file;

    /**
     * @brief 编译命令，为空表示解释执行
     */
    std::string compile_command;

    std::string run_command;

    /**
     * @brief 容器中额外的环境变量
     */
    std::map<std::string, std::string> env;

    /**
     * @brief 该语言的黑名单，只是快速的预检查，真正的安全边界是容器隔离
     */
    std::vector<denylist_entry> denylist;

    /**
     * @brief 对战评测时拼接在用户代码之后的驱动代码
     * 驱动代码从标准输入读取 JSON 数组作为参数，调用 %ENTRY% 函数，
     * 并将返回值以 JSON 格式输出在最后一行。为空表示不支持在容器中评测对战题目。
     */
    std::string harness;
};

/**
 * @brief 支持的语言列表
 */
const std::vector<language> &supported_languages();

/**
 * @brief 根据 id 查找语言
 * @return 找不到时返回 nullptr
 */
const language *find_language(const std::string &id);

/**
 * @brief 生成容器内执行的 shell 脚本
 */
std::string build_command(const language &lang);

/**
 * @brief 将驱动代码中的入口函数名替换为 entry_point
 */
std::string build_harness(const language &lang, const std::string &entry_point);

}  // namespace arena::sandbox
