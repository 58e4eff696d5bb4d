#pragma once

#include <filesystem>
#include <string>

namespace atst {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw std::system_error 文件无法打开时
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将 content 写入文件，覆盖原有内容
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 配置文件中的 "<input" 和脚本路径都相对于项目文件夹，
 * 如果文件名包含 "../"，就可能读到项目以外的文件。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 临时文件夹，离开作用域时删除
 * 每个提交的编译产物和测试运行目录都在自己的临时文件夹中，
 * 因此并行评测的提交之间不会互相覆盖文件。
 * 若 DEBUG 为真，则保留文件夹以便调试。
 */
struct scoped_temp_directory {
    scoped_temp_directory();

    /**
     * @brief 在 parent 下创建形如 prefix-XXXXXX 的文件夹
     * @throw environment_error 无法创建文件夹时
     */
    scoped_temp_directory(const std::filesystem::path &parent, const std::string &prefix);
    scoped_temp_directory(scoped_temp_directory &&);
    scoped_temp_directory(const scoped_temp_directory &) = delete;
    ~scoped_temp_directory();

    scoped_temp_directory &operator=(scoped_temp_directory &&);
    scoped_temp_directory &operator=(const scoped_temp_directory &) = delete;

    const std::filesystem::path &path() const;

    void release();

private:
    std::filesystem::path dir;
};

}  // namespace atst
