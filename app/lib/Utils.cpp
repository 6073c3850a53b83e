#include "Utils.hpp"
#include "AppException.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <iterator>
#include <sstream>
#include <system_error>

namespace Utils {

std::filesystem::path utf8_to_path(const std::string& value)
{
    return std::filesystem::path(std::u8string(value.begin(), value.end()));
}


std::string path_to_utf8(const std::filesystem::path& path)
{
    const std::u8string utf8 = path.u8string();
    return std::string(utf8.begin(), utf8.end());
}


std::string to_lower_copy(std::string_view value)
{
    std::string result(value);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return result;
}


bool contains_case_insensitive(std::string_view haystack, std::string_view needle)
{
    return to_lower_copy(haystack).find(to_lower_copy(needle)) != std::string::npos;
}


std::string lowercase_extension(const std::filesystem::path& path)
{
    return to_lower_copy(path_to_utf8(path.extension()));
}


std::vector<std::string> split_list(const std::string& value)
{
    std::vector<std::string> result;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
        item.erase(item.begin(), std::find_if(item.begin(), item.end(), not_space));
        item.erase(std::find_if(item.rbegin(), item.rend(), not_space).base(), item.end());
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}


std::string join_list(const std::vector<std::string>& items)
{
    std::ostringstream oss;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << ",";
        }
        oss << items[i];
    }
    return oss.str();
}


bool is_within(const std::filesystem::path& path, const std::filesystem::path& ancestor)
{
    const auto normalized_path = path.lexically_normal();
    const auto normalized_ancestor = ancestor.lexically_normal();
    auto path_it = normalized_path.begin();
    for (auto it = normalized_ancestor.begin(); it != normalized_ancestor.end(); ++it) {
        if (it->empty() && std::next(it) == normalized_ancestor.end()) {
            break; // trailing separator
        }
        if (path_it == normalized_path.end() || *path_it != *it) {
            return false;
        }
        ++path_it;
    }
    return true;
}


std::string month_name(int month)
{
    static const std::array<const char*, 12> names = {
        "January", "February", "March", "April", "May", "June",
        "July", "August", "September", "October", "November", "December"
    };
    if (month < 1 || month > 12) {
        return {};
    }
    return names[static_cast<size_t>(month - 1)];
}


std::filesystem::path require_directory(const std::filesystem::path& root)
{
    std::error_code ec;
    const auto status = std::filesystem::status(root, ec);
    if (!std::filesystem::exists(status)) {
        THROW_APP_ERROR(ErrorCodes::Code::ROOT_NOT_FOUND, path_to_utf8(root));
    }
    if (!std::filesystem::is_directory(status)) {
        THROW_APP_ERROR(ErrorCodes::Code::ROOT_NOT_DIRECTORY, path_to_utf8(root));
    }

    std::filesystem::directory_iterator listing(root, ec);
    if (ec) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::ROOT_UNREADABLE,
                            "The folder to organize could not be read: " + ec.message(),
                            path_to_utf8(root));
    }

    std::filesystem::path canonical = std::filesystem::canonical(root, ec);
    if (ec) {
        canonical = std::filesystem::absolute(root, ec).lexically_normal();
    }
    return canonical;
}

}
