#pragma once

#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw internal_error 文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将文本原样写入文件，文件已存在则覆盖
 * @param path 文件路径
 * @param content 文件内容
 * @throw internal_error 文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 这里用于确保计算目录时不会出现目录遍历攻击，提交编号、题目编号
 * 都会被拼接进路径，如果包含 "../" 或 "/"，那么最后有可能导致
 * 评测目录以外的文件被覆盖或删除。
 * @param subpath 被检查的文件名
 * @throw std::runtime_error subpath 不安全
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 生成一个随机的 UUID 字符串
 */
std::string random_uuid();

/**
 * @brief 表示一个临时目录，析构时递归删除整个目录
 * 评测过程中产生的所有文件都必须放在 scoped_directory 中，
 * 这样无论是正常结束、超时、崩溃还是抛出异常，目录都会被清理掉。
 */
struct scoped_directory {
    scoped_directory();

    /**
     * @brief 创建目录 parent / (prefix + "-" + uuid)
     * @param parent 父目录，不存在时会被创建
     * @param prefix 目录名前缀
     * @param keep 若为真，析构时不删除目录，供调试时检查评测产生的文件
     * @throw internal_error 目录无法创建
     */
    scoped_directory(const std::filesystem::path &parent, const std::string &prefix, bool keep = false);
    scoped_directory(scoped_directory &&other) noexcept;
    ~scoped_directory();

    scoped_directory(const scoped_directory &) = delete;
    scoped_directory &operator=(const scoped_directory &) = delete;
    scoped_directory &operator=(scoped_directory &&other) noexcept;

    const std::filesystem::path &path() const;

    /**
     * @brief 立即删除目录，删除失败时只记录日志
     */
    void release() noexcept;

private:
    std::filesystem::path dir;
    bool keep = false;
};

}  // namespace grader
