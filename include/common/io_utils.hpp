#pragma once

#include <filesystem>
#include <string>

namespace arbiter {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw std::system_error 文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 断言 name 是一个沙箱工作目录下的普通文件名
 * 文件名会被原样拷贝进沙箱，如果包含 "/" 或者 ".."，
 * 那么文件可能会被放到工作目录以外的地方。
 * @param name 被检查的文件名
 * @return name 本身
 */
std::string assert_safe_path(const std::string &name);

}  // namespace arbiter
