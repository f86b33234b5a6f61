#pragma once

#include <filesystem>
#include <string>

namespace coderun {

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
std::string read_file_content(const std::filesystem::path &path, const std::string &def);

/**
 * @brief 将文本写入文件，文件已存在时覆盖
 * @throw std::system_error 无法打开或者写入文件
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 将不合法的 UTF-8 字节替换为 '?'
 * 用户程序的输出可能是任意字节，写入 JSON 或者数据库前需要先清洗
 */
std::string sanitize_utf8(const std::string &string);

/**
 * @brief 截断过长的输出，保留前 limit 个字节，末尾附加被截断的字节数
 * 截断位置会向前调整到 UTF-8 字符的边界
 */
std::string truncate_output(const std::string &s, std::size_t limit);

/**
 * @brief 在 root 下创建一个以随机 uuid 命名的空文件夹
 * @return 新文件夹的路径
 */
std::filesystem::path create_unique_directory(const std::filesystem::path &root);

/**
 * @brief 删除文件夹，失败时只记录日志不抛出异常
 * @return 是否删除成功
 */
bool remove_directory_quietly(const std::filesystem::path &dir) noexcept;

}  // namespace coderun
