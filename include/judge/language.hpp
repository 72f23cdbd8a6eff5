#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "sandbox/sandbox.hpp"

namespace grader {

/**
 * @brief 写入源代码之后可以直接交给沙箱执行的程序
 */
struct prepared_program {
    std::filesystem::path source_path;

    /**
     * @brief 编译命令，解释型语言没有编译命令
     */
    std::optional<sandbox::command> build;

    /**
     * @brief 运行命令，从标准输入读入数据，向标准输出写出答案
     */
    sandbox::command run;

    /**
     * @brief 是否可以使用 RLIMIT_AS 来限制内存
     */
    bool limit_address_space = true;
};

/**
 * @brief 表示一种编程语言的编译和运行方式
 * 命令以 argv 的形式给出，不经过 shell 解析。每一项都是一个 fmt 格式串，
 * 可以使用 {dir} 表示源代码所在目录，{source} 表示源代码的完整路径。
 * 比如 C++ 的编译命令是 ["g++", "-std=c++17", "-O2", "-Wall", "-o", "{dir}/solution", "{source}"]
 */
struct language {
    /**
     * @brief 语言标识，如 cpp、python、java
     */
    std::string tag;

    /**
     * @brief 源代码的文件名，如 solution.cpp、Solution.java
     */
    std::string source_name;

    /**
     * @brief 编译命令模板，为空表示不需要编译
     */
    std::vector<std::string> build_template;

    /**
     * @brief 运行命令模板
     */
    std::vector<std::string> run_template;

    /**
     * @brief JVM、Node.js 在启动时会保留大量虚拟内存，对这些语言不能使用地址空间限制
     */
    bool limit_address_space = true;

    /**
     * @brief 编译和运行时额外设置的环境变量
     */
    std::map<std::string, std::string> env;

    /**
     * @brief 将源代码写入 dir 目录，并生成编译命令和运行命令
     * 除了写入源代码文件以外没有任何副作用，不会执行任何命令
     * @param dir 源代码目录，必须已经存在
     * @param code 选手的源代码，原样写入
     * @throw internal_error 源代码无法写入
     */
    prepared_program prepare(const std::filesystem::path &dir, const std::string &code) const;
};

/**
 * @brief 语言标识到编译运行方式的映射
 * 注册只在启动时进行，之后只读，因此可以在多个评测线程中共享
 */
struct language_registry {
    /**
     * @brief 注册一种语言，若标识已存在则覆盖
     * @throw configuration_error 语言的配置不合法，比如缺少运行命令、命令模板无法格式化
     */
    void register_language(const language &lang);

    /**
     * @brief 根据语言标识查找语言
     * @throw unsupported_language 语言没有注册
     */
    const language &resolve(const std::string &tag) const;

    bool contains(const std::string &tag) const;

    std::vector<std::string> tags() const;

    /**
     * @brief 从 JSON 文件中读取语言配置，添加或覆盖已有的语言
     * 文件内容为语言配置的数组，如：
     * [{"tag": "cpp", "source": "solution.cpp",
     *   "build": ["g++", "-O2", "-o", "{dir}/solution", "{source}"],
     *   "run": ["{dir}/solution"]}]
     * @throw configuration_error 文件格式不正确
     */
    void load(const std::filesystem::path &path);

    /**
     * @brief 内置的语言：cpp、c、python、java、javascript
     */
    static language_registry defaults();

private:
    std::map<std::string, language> languages;
};

}  // namespace grader
