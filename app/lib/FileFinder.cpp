#include "FileFinder.hpp"

#include "Logger.hpp"
#include "Utils.hpp"

#include <string>
#include <system_error>
#include <unordered_set>

namespace fs = std::filesystem;

namespace {

bool has_pdf_extension(const fs::path& path)
{
    const std::string name = Utils::to_lower_copy(path.filename().string());
    return name.size() > 4 && name.compare(name.size() - 4, 4, ".pdf") == 0;
}

} // namespace

FilesystemWalkFinder::FilesystemWalkFinder(std::vector<fs::path> roots,
                                           std::vector<fs::path> excludes,
                                           std::optional<std::size_t> limit)
    : roots(std::move(roots)),
      limit(limit)
{
    for (const auto& exclude : excludes) {
        this->excludes.push_back(Utils::resolve_path(exclude));
    }
}

std::vector<fs::path> FilesystemWalkFinder::default_roots()
{
    const auto home = Utils::home_directory();
    if (!home) {
        return {};
    }
    const fs::path home_path(*home);
    std::vector<fs::path> candidates{home_path / "Desktop", home_path / "Documents", home_path / "Downloads"};

    std::vector<fs::path> existing;
    std::error_code ec;
    for (const auto& candidate : candidates) {
        if (fs::is_directory(candidate, ec)) {
            existing.push_back(candidate);
        }
    }
    existing.push_back(home_path);
    return Utils::dedupe_keep_order(existing);
}

std::vector<fs::path> FilesystemWalkFinder::default_excludes()
{
    std::vector<fs::path> excludes;
    if (const auto home = Utils::home_directory()) {
        const fs::path home_path(*home);
        excludes.push_back(home_path / ".Trash");
        excludes.push_back(home_path / ".cache");
        excludes.push_back(home_path / ".local" / "share" / "Trash");
    }
    for (const char* system_dir : {"/proc", "/sys", "/dev", "/usr", "/bin", "/sbin"}) {
        excludes.emplace_back(system_dir);
    }
    return excludes;
}

bool FilesystemWalkFinder::is_excluded(const fs::path& path) const
{
    for (const auto& exclude : excludes) {
        if (Utils::is_under(path, exclude)) {
            return true;
        }
    }
    return false;
}

void FilesystemWalkFinder::for_each(const Visitor& visitor)
{
    std::unordered_set<std::string> seen;
    std::size_t yielded = 0;
    auto logger = Logger::get_logger(Logger::kCoreLogger);

    for (const auto& raw_root : roots) {
        const fs::path root = Utils::resolve_path(raw_root);
        std::error_code ec;
        if (!fs::is_directory(root, ec) || is_excluded(root)) {
            continue;
        }

        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            if (logger) {
                logger->warn("Cannot walk {}: {}", root.string(), ec.message());
            }
            continue;
        }

        for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
            if (ec) {
                if (logger) {
                    logger->debug("Walk error below {}: {}", root.string(), ec.message());
                }
                ec.clear();
                continue;
            }
            const fs::directory_entry& entry = *it;
            const fs::path& path = entry.path();

            std::error_code type_ec;
            if (entry.is_directory(type_ec)) {
                if (entry.is_symlink(type_ec) || is_excluded(path)) {
                    it.disable_recursion_pending();
                }
                continue;
            }
            if (!has_pdf_extension(path)) {
                continue;
            }
            if (!seen.insert(path.string()).second) {
                continue;
            }
            if (is_excluded(path) || !entry.is_regular_file(type_ec)) {
                continue;
            }

            visitor(path);
            ++yielded;
            if (limit && yielded >= *limit) {
                return;
            }
        }
    }
}
