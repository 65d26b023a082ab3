#pragma once

#include <filesystem>
#include <string>

namespace orbit {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 创建新文件并写入全部内容，然后将文件权限设置为 perms
 * 文件必须不存在，以避免两个并发的调用者写同一个文件。
 * @param path 文件路径
 * @param content 要写入的内容
 * @param perms 写入完成后文件的权限，比如只读
 */
void write_file_content(const std::filesystem::path &path, const std::string &content, std::filesystem::perms perms);

/**
 * @brief 统计文件夹内的文件数量（不递归统计）
 * @return 文件夹不存在时返回 0
 */
std::size_t count_files_in_directory(const std::filesystem::path &dir);

}  // namespace orbit
