#include "Utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <random>
#include <sstream>
#include <system_error>
#include <unordered_set>

#include <unistd.h>

namespace fs = std::filesystem;

namespace Utils {

namespace {
bool is_safe_filename_char(unsigned char ch) {
    return std::isalnum(ch) || ch == '.' || ch == '_' || ch == ' ' || ch == '-';
}
}

double now_ts() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

std::string to_lower_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string trim_copy(std::string value) {
    auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    return value;
}

std::string collapse_whitespace(std::string_view value) {
    std::string result;
    result.reserve(value.size());
    bool pending_space = false;
    for (unsigned char ch : value) {
        if (std::isspace(ch)) {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result.push_back(' ');
            pending_space = false;
        }
        result.push_back(static_cast<char>(ch));
    }
    return result;
}

std::string truncate_utf8(const std::string& value, std::size_t max_bytes) {
    if (value.size() <= max_bytes) {
        return value;
    }
    std::size_t cut = max_bytes;
    // Step back over continuation bytes so the cut lands on a code point boundary.
    while (cut > 0 && (static_cast<unsigned char>(value[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return value.substr(0, cut);
}

std::string safe_filename(const std::string& name, std::size_t max_len) {
    std::string cleaned;
    cleaned.reserve(name.size());
    for (char ch : trim_copy(name)) {
        if (ch != '\0') {
            cleaned.push_back(ch);
        }
    }

    std::string replaced;
    replaced.reserve(cleaned.size());
    bool in_bad_run = false;
    for (unsigned char ch : cleaned) {
        if (is_safe_filename_char(ch)) {
            replaced.push_back(static_cast<char>(ch));
            in_bad_run = false;
        } else if (!in_bad_run) {
            replaced.push_back('_');
            in_bad_run = true;
        }
    }

    std::string result = collapse_whitespace(replaced);
    if (result.empty()) {
        result = "untitled";
    }
    if (result.size() > max_len) {
        result = trim_copy(result.substr(0, max_len));
    }
    return result;
}

std::optional<std::string> home_directory() {
    return getenv_string("HOME");
}

fs::path expand_user(const std::string& value) {
    if (value == "~" || value.rfind("~/", 0) == 0) {
        if (auto home = home_directory()) {
            if (value.size() <= 2) {
                return fs::path(*home);
            }
            return fs::path(*home) / value.substr(2);
        }
    }
    return fs::path(value);
}

std::string abbreviate_user_path(const std::string& path, const std::optional<std::string>& home) {
    if (!home || home->empty()) {
        return path;
    }
    std::string prefix = *home;
    while (prefix.size() > 1 && prefix.back() == '/') {
        prefix.pop_back();
    }
    if (path.size() > prefix.size() && path.compare(0, prefix.size(), prefix) == 0 &&
        path[prefix.size()] == '/') {
        return "~" + path.substr(prefix.size());
    }
    return path;
}

fs::path resolve_path(const fs::path& path) {
    std::error_code ec;
    auto resolved = fs::weakly_canonical(expand_user(path.string()), ec);
    if (ec) {
        return fs::absolute(path, ec).lexically_normal();
    }
    return resolved;
}

bool is_under(const fs::path& path, const fs::path& prefix) {
    const fs::path path_r = resolve_path(path);
    const fs::path prefix_r = resolve_path(prefix);
    if (path_r == prefix_r) {
        return true;
    }
    auto p_it = path_r.begin();
    for (auto it = prefix_r.begin(); it != prefix_r.end(); ++it, ++p_it) {
        if (it->empty()) {
            continue;
        }
        if (p_it == path_r.end() || *p_it != *it) {
            return false;
        }
    }
    return true;
}

std::vector<fs::path> dedupe_keep_order(const std::vector<fs::path>& items) {
    std::vector<fs::path> out;
    std::unordered_set<std::string> seen;
    for (const auto& item : items) {
        if (seen.insert(item.string()).second) {
            out.push_back(item);
        }
    }
    return out;
}

void ensure_dir(const fs::path& path) {
    fs::create_directories(path);
}

void remove_tree_contents(const fs::path& dir_path) {
    std::error_code ec;
    if (!fs::exists(dir_path, ec)) {
        return;
    }
    std::vector<fs::path> children;
    for (const auto& child : fs::directory_iterator(dir_path)) {
        children.push_back(child.path());
    }
    for (const auto& child : children) {
        const auto status = fs::symlink_status(child);
        if (fs::is_directory(status)) {
            fs::remove_all(child);
        } else {
            fs::remove(child);
        }
    }
}

std::string random_hex(std::size_t length) {
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    static constexpr char kDigits[] = "0123456789abcdef";
    std::uniform_int_distribution<int> dist(0, 15);
    std::string out;
    out.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        out.push_back(kDigits[dist(engine)]);
    }
    return out;
}

std::optional<std::string> getenv_string(const char* key) {
    const char* value = std::getenv(key);
    if (!value || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

std::optional<fs::path> find_executable(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        if (::access(name.c_str(), X_OK) == 0) {
            return fs::path(name);
        }
        return std::nullopt;
    }
    const auto path_env = getenv_string("PATH");
    if (!path_env) {
        return std::nullopt;
    }
    std::istringstream iss(*path_env);
    std::string dir;
    while (std::getline(iss, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        const fs::path candidate = fs::path(dir) / name;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

} // namespace Utils
