#ifndef UTILS_HPP
#define UTILS_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace Utils {

std::filesystem::path utf8_to_path(const std::string& value);
std::string path_to_utf8(const std::filesystem::path& path);

std::string to_lower_copy(std::string_view value);
bool contains_case_insensitive(std::string_view haystack, std::string_view needle);

/**
 * @brief Lowercase extension including the leading dot ("" when absent).
 */
std::string lowercase_extension(const std::filesystem::path& path);

/**
 * @brief Splits a comma-separated list, trimming blanks and dropping empty items.
 */
std::vector<std::string> split_list(const std::string& value);
std::string join_list(const std::vector<std::string>& items);

/**
 * @brief True when @p path equals @p ancestor or lies underneath it (lexical check).
 */
bool is_within(const std::filesystem::path& path, const std::filesystem::path& ancestor);

/**
 * @brief Canonical form of a directory the engines will work under.
 * @throws ErrorCodes::AppException (ROOT_NOT_FOUND, ROOT_NOT_DIRECTORY, ROOT_UNREADABLE).
 */
std::filesystem::path require_directory(const std::filesystem::path& root);

/**
 * @brief English month name for 1..12; empty string otherwise.
 */
std::string month_name(int month);

}

#endif
