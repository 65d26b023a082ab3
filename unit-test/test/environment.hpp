#pragma once

#include <filesystem>
#include <string>

/**
 * 测试用的运行环境
 */
namespace orbit::test {

/**
 * @brief PATH 中是否有 python3 解释器，没有时需要真实运行代码的测试会被跳过
 */
bool python3_available();

/**
 * @brief 创建一个空的临时文件夹，已经存在时先清空
 * @param name 文件夹名，位于系统临时目录下的 orbit-test 文件夹内
 */
std::filesystem::path make_test_directory(const std::string &name);

}  // namespace orbit::test
