#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace grader {

/**
 * @brief 评测运行的根目录
 * 每次评测都会在 RUN_DIR 下创建一个独立的目录，评测结束后（无论结果如何）都会被删除。
 * RUN_DIR 的文件结构如下：
 *
 * RUN_DIR
 * ├── 5f1a...-[uuid] // 一次评测的目录，名称为提交编号加随机 uuid
 * │   ├── compile // 选手程序的代码和编译目录
 * │   │   ├── solution.cpp // 选手程序的源代码，文件名由语言决定
 * │   │   └── solution // 编译产物
 * │   ├── input // 测试点的输入数据，每个测试点运行时写入，运行结束后删除
 * │   │   └── 0.in
 * │   └── sandbox-[uuid] // 沙箱为每个进程创建的工作目录，进程结束后删除
 * └── ...
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，评测系统不会删除评测目录，以便手动检查评测产生的文件内容是否符合预期。
 */
extern bool DEBUG;

/**
 * @brief 时间限制之外额外等待的时间，单位为秒
 * 程序运行时间超过时间限制即判为超时，但沙箱会等到时间限制加上该值后才强制终止进程
 */
extern double GRACE_PERIOD;

/**
 * @brief 编译的时间限制，单位为秒
 */
extern double BUILD_TIME_LIMIT;

/**
 * @brief 编译的内存限制，单位为字节
 */
extern int64_t BUILD_MEMORY_LIMIT;

/**
 * @brief 选手程序标准输出最多保留多少字节，超出部分会被丢弃
 */
extern std::size_t OUTPUT_LIMIT;

/**
 * @brief 选手程序标准错误输出最多保留多少字节，超出部分会被丢弃
 */
extern std::size_t ERROR_LIMIT;

/**
 * @brief 选手程序最多可以写入磁盘的文件大小，单位为字节，小于 0 表示不限制
 */
extern int64_t FILE_LIMIT;

/**
 * @brief 选手程序所属用户最多同时存在的进程数，小于 0 表示不限制
 */
extern int PROCESS_LIMIT;

/**
 * @brief 一个提交内同时运行的测试点数量
 * 为 1 时按顺序运行测试点
 */
extern std::size_t TEST_WORKERS;

/**
 * @brief 是否使用 cgroup 限制内存、统计内存使用以及清理进程树
 * 需要 root 权限以及挂载好的 cgroup v1 memory 控制器
 */
extern bool USE_CGROUP;

/**
 * @brief 是否为选手程序加载 seccomp 过滤器，禁止系统管理类的系统调用
 */
extern bool USE_SECCOMP;

}  // namespace grader
