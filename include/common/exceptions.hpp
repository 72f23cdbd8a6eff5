#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace grader {

struct grader_exception : std::exception {
    grader_exception();
    explicit grader_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const grader_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 一般是评测机环境的问题，比如无法创建目录、写入文件
 */
struct internal_error : public grader_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示沙箱无法启动或监控选手程序
 * 比如无法创建工作目录、无法创建管道、fork 失败、exec 失败、子进程无法设置资源限制。
 * 选手程序自身的异常行为（非零返回值、被信号终止、超时）不会产生这个异常。
 */
struct sandbox_error : public grader_exception {
    sandbox_error();
    explicit sandbox_error(const std::string &message);
    sandbox_error(int err, const std::string &message);

    /**
     * @brief 导致错误的 errno，不存在时为 0
     */
    int code() const noexcept;

private:
    int err = 0;
};

/**
 * @brief 表示评测请求的配置不正确
 * 比如题目缺少时间限制、内存限制，或者题目不允许该语言。
 * 这类错误在启动任何进程之前就会被拒绝
 */
struct configuration_error : public grader_exception {
    configuration_error();
    explicit configuration_error(const std::string &message);
};

/**
 * @brief 表示提交使用的语言不被支持
 */
struct unsupported_language : public configuration_error {
    explicit unsupported_language(const std::string &language);

    const std::string language;
};

/**
 * @brief 表示该提交已经在评测中
 * 同一个提交同时至多只能有一个评测过程
 */
struct already_in_progress : public grader_exception {
    explicit already_in_progress(const std::string &sub_id);

    const std::string sub_id;
};

}  // namespace grader
