#ifndef FILE_FINDER_HPP
#define FILE_FINDER_HPP

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <vector>

// Enumerates candidate PDF files below a set of roots.
class IFileFinder {
public:
    using Visitor = std::function<void(const std::filesystem::path&)>;

    virtual ~IFileFinder() = default;

    // Calls visitor once per discovered file, at most limit times when a limit is set.
    virtual void for_each(const Visitor& visitor) = 0;
};

/**
 * @brief Recursive directory walk. Excluded prefixes are pruned before descent,
 * names ending in ".pdf" (any case) that are regular files are reported, and a
 * path reachable from two roots is reported once.
 */
class FilesystemWalkFinder : public IFileFinder {
public:
    FilesystemWalkFinder(std::vector<std::filesystem::path> roots,
                         std::vector<std::filesystem::path> excludes,
                         std::optional<std::size_t> limit);

    void for_each(const Visitor& visitor) override;

    static std::vector<std::filesystem::path> default_roots();
    static std::vector<std::filesystem::path> default_excludes();

private:
    bool is_excluded(const std::filesystem::path& path) const;

    std::vector<std::filesystem::path> roots;
    std::vector<std::filesystem::path> excludes;
    std::optional<std::size_t> limit;
};

#endif
