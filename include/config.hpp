#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>

namespace atst {

/**
 * @brief 测试点的默认运行时间限制
 * 如果项目配置没有给出 timeout，则使用这个值
 */
extern std::chrono::milliseconds DEFAULT_TEST_TIMEOUT;

/**
 * @brief 编译器单次调用的时间限制
 * 编译和链接分别计时
 */
extern std::chrono::milliseconds COMPILE_TIMEOUT;

/**
 * @brief 自定义脚本的运行时间限制
 */
extern std::chrono::milliseconds SCRIPT_TIMEOUT;

/**
 * @brief 每个输出流最多捕获多少字节
 * 超出部分会被读出并丢弃，避免无限输出的程序耗尽内存。
 * 小于 0 表示不限制。
 */
extern long long STREAM_SIZE_LIMIT;

/**
 * @brief 选手程序编译及运行的根目录
 * 每个选手提交在这里拥有一个独立的临时文件夹，评测结束后删除
 *
 * WORK_DIR
 * ├── xideal-AbC123 // 提交名 + mkdtemp 生成的后缀
 * │   ├── proj.o // 编译生成的目标文件
 * │   └── proj // 链接生成的可执行文件，同时也是测试点的运行目录
 * └── ...
 */
extern std::filesystem::path WORK_DIR;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，评测结束后不会删除 WORK_DIR 下的提交目录，
 * 以便手动检查编译产物。
 */
extern bool DEBUG;

}  // namespace atst
