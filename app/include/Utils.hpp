#ifndef UTILS_HPP
#define UTILS_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Utils {

double now_ts();

std::string to_lower_copy(std::string value);
std::string trim_copy(std::string value);
std::string collapse_whitespace(std::string_view value);

/**
 * @brief Cuts the string to at most max_bytes without splitting a UTF-8 sequence.
 */
std::string truncate_utf8(const std::string& value, std::size_t max_bytes);

/**
 * @brief Maps an arbitrary label onto a portable file name: characters outside
 * [A-Za-z0-9._ -] become '_', whitespace runs collapse to one space, the
 * result is trimmed and capped at max_len bytes. Never returns an empty string.
 */
std::string safe_filename(const std::string& name, std::size_t max_len = 160);

std::optional<std::string> home_directory();
std::filesystem::path expand_user(const std::string& value);

/**
 * @brief Replaces the home directory prefix with "~" so user names do not leak.
 */
std::string abbreviate_user_path(const std::string& path,
                                 const std::optional<std::string>& home = home_directory());

std::filesystem::path resolve_path(const std::filesystem::path& path);
bool is_under(const std::filesystem::path& path, const std::filesystem::path& prefix);

std::vector<std::filesystem::path> dedupe_keep_order(const std::vector<std::filesystem::path>& items);

void ensure_dir(const std::filesystem::path& path);

/**
 * @brief Removes every entry directly below dir_path. Real directories are removed
 * recursively, files and symlinks individually. A missing directory is a no-op.
 */
void remove_tree_contents(const std::filesystem::path& dir_path);

std::string random_hex(std::size_t length);

std::optional<std::string> getenv_string(const char* key);

/**
 * @brief Resolves an executable name against PATH, like `which`.
 */
std::optional<std::filesystem::path> find_executable(const std::string& name);

} // namespace Utils

#endif
