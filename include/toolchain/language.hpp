#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

/**
 * 这个头文件包含编程语言的编译、运行命令表
 * 每种语言都是表中的一项数据，新增语言只需要新增一项，不需要新增类型。
 *
 * 命令模板中可以使用以下占位符：
 * {source}   源代码文件名，比如 main.cpp
 * {artifact} 编译产物文件名，比如 main
 * {workdir}  沙箱中的工作路径，比如 /w
 */
namespace arbiter {

/**
 * @brief 命令模板中占位符的取值
 */
struct command_paths {
    std::string source;
    std::string artifact;
    std::string workdir;
};

/**
 * @brief 将命令模板中的占位符替换成实际路径
 */
std::vector<std::string> expand_command(const std::vector<std::string> &command, const command_paths &paths);

/**
 * @brief language::adjust_time 的上限（24 小时）
 * 调整后的时间会换算成纳秒发给沙箱，这个上限保证换算时不会溢出
 */
extern const std::chrono::milliseconds MAX_ADJUSTED_TIME;

/**
 * @brief language::adjust_memory 的上限（1TB）
 */
extern const std::uint64_t MAX_ADJUSTED_MEMORY;

/**
 * @brief 表示一种编程语言的工具链
 */
struct language {
    /**
     * @brief 语言 id，比如 cpp, python3
     */
    std::string id;

    /**
     * @brief 选手代码在沙箱工作目录中的文件名
     */
    std::string source_name;

    /**
     * @brief 编译产物的文件名，解释型语言为空
     */
    std::string artifact_name;

    /**
     * @brief 编译命令模板，解释型语言为空
     */
    std::vector<std::string> compile_command;

    /**
     * @brief 运行命令模板
     */
    std::vector<std::string> run_command;

    /**
     * @brief 编译和运行时的环境变量，格式为 KEY=VALUE
     */
    std::vector<std::string> env;

    /**
     * @brief 编译时间限制，与提交的运行时间限制无关
     */
    std::chrono::milliseconds compile_time_limit{10000};

    /**
     * @brief 编译内存限制（单位为字节）
     */
    std::uint64_t compile_memory_limit = 512ull << 20;

    /**
     * @brief 运行时间限制 = 题目时间限制 * time_multiplier + time_offset
     * 对于 Java 这类启动较慢的语言需要放宽时间限制
     */
    double time_multiplier = 1;
    std::chrono::milliseconds time_offset{0};

    /**
     * @brief 运行内存限制 = 题目内存限制 * memory_multiplier + memory_offset
     * 对于 JVM、Node.js、Python 这类带运行时的语言，运行时本身要占用内存，
     * 因此需要在题目的内存限制之上给出额外的空间
     */
    double memory_multiplier = 1;
    std::uint64_t memory_offset = 0;

    /**
     * @return 是否需要编译
     */
    bool compiled() const;

    std::vector<std::string> compile_args(const std::string &workdir) const;

    std::vector<std::string> run_args(const std::string &workdir) const;

    /**
     * @brief 计算该语言实际的运行时间限制
     * @param limit 题目的时间限制
     */
    std::chrono::milliseconds adjust_time(std::chrono::milliseconds limit) const;

    /**
     * @brief 计算该语言实际的内存限制
     * @param limit 题目的内存限制（单位为字节）
     */
    std::uint64_t adjust_memory(std::uint64_t limit) const;
};

/**
 * @brief 用 JSON 中出现的字段覆盖 lang 中的对应项，没有出现的字段保持不变
 * @code{.json}
 * {"compile": ["/usr/bin/g++", "-O2", "-o", "{artifact}", "{source}"], "memory_offset": 0}
 * @endcode
 */
void apply_override(const nlohmann::json &j, language &lang);

/**
 * @brief 语言 id 到工具链的映射表
 * 在进程启动时构造，之后只读，可以在多个评测流程之间共享
 */
struct language_registry {
    explicit language_registry(std::map<std::string, language> languages);

    /**
     * @brief 内置的语言表，与部署镜像中安装的工具链一致
     */
    static std::map<std::string, language> builtin_languages();

    /**
     * @brief 在内置语言表的基础上应用覆盖配置
     * @param overrides 以语言 id 为键的对象，未知的 id 表示新增语言，此时必须给出完整的配置
     */
    static language_registry load(const nlohmann::json &overrides);

    static language_registry builtin();

    /**
     * @brief 查找语言
     * @throw client_error 未知的语言 id
     */
    const language &find(const std::string &id) const;

    bool contains(const std::string &id) const;

    std::vector<std::string> ids() const;

private:
    std::map<std::string, language> languages;
};

}  // namespace arbiter
