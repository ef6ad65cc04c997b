#ifndef LIBRARY_HPP
#define LIBRARY_HPP

#include <filesystem>
#include <string>

/**
 * @brief On-disk layout of one library. Every persistent artifact lives below root():
 *
 *   vault/<aa>/<bb>/<digest>.pdf   content-addressed blobs
 *   categorized/<Category>/...     derived view
 *   .docvault_tmp/                 scratch area for in-flight copies
 *   manifest.sqlite3               manifest database
 *   categories.json                rule set
 *   logs/                          rotating log files
 *
 * The layout is a stable contract; new entries may be added, existing ones keep their meaning.
 */
class Library {
public:
    explicit Library(std::filesystem::path root);

    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path vault_dir() const { return root_ / "vault"; }
    std::filesystem::path categorized_dir() const { return root_ / "categorized"; }
    std::filesystem::path tmp_dir() const { return root_ / ".docvault_tmp"; }
    std::filesystem::path db_path() const { return root_ / "manifest.sqlite3"; }
    std::filesystem::path categories_config_path() const { return root_ / "categories.json"; }
    std::filesystem::path log_dir() const { return root_ / "logs"; }

    /**
     * @brief Creates the directory skeleton and writes the default rule set when
     * none exists yet. An operator-edited categories.json is never overwritten.
     */
    void ensure_initialized() const;

    std::filesystem::path vault_path_for_digest(const std::string& digest) const;
    std::string relative_to_root(const std::filesystem::path& path) const;

    static std::filesystem::path default_root();

private:
    std::filesystem::path root_;
};

#endif
