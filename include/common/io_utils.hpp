#pragma once

#include <filesystem>
#include <string>

namespace codejudge {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 将内容写入文件，文件已存在时覆盖
 * @throws std::system_error 若文件无法打开或写入失败
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 将过长的文本截断到 limit 字节以内
 * 截断位置会回退到 UTF-8 字符边界，截断后追加提示
 * @param text 要截断的文本，一般是选手程序的 stderr
 * @param limit 最多保留的字节数
 */
std::string truncate_message(const std::string &text, std::size_t limit);

/**
 * @brief 统计文件夹内有多少个直接子项（不递归统计）
 * @param dir 要被统计的文件夹
 * @return 子项数量，若文件夹不存在返回 -1
 */
int count_entries_in_directory(const std::filesystem::path &dir);

}  // namespace codejudge
