#ifndef VIEW_BUILDER_HPP
#define VIEW_BUILDER_HPP

#include "Types.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>

class Library;

/**
 * @brief Builds categorized/<Category>/<name>__<digest8>.pdf entries pointing at the vault.
 *
 * The view is derived state: with refresh set, everything under categorized/ is
 * removed first. Name collisions get "__2", "__3", ... appended, so the result is
 * deterministic for a given document order. A hard link that fails across
 * filesystems falls back to a relative symlink for that entry; any other link
 * failure raises LinkError.
 */
class ViewBuilder {
public:
    using NameResolver = std::function<std::string(const Document&)>;

    static constexpr const char* kTotalLinksKey = "_total_links";

    explicit ViewBuilder(const Library& library);

    std::map<std::string, int> rebuild(const std::vector<Document>& documents,
                                       LinkMode link_mode,
                                       const NameResolver& name_resolver,
                                       bool refresh,
                                       const std::string& default_category) const;

    static std::string link_stem(const std::string& display_name);

private:
    std::filesystem::path next_free_path(const std::filesystem::path& category_dir,
                                         const std::string& stem,
                                         const std::string& digest) const;
    void create_entry(const std::filesystem::path& target,
                      const std::filesystem::path& link_path,
                      LinkMode link_mode) const;

    static void remove_existing(const std::filesystem::path& link_path);
    static void make_relative_symlink(const std::filesystem::path& target, const std::filesystem::path& link_path);
    static void make_copy(const std::filesystem::path& target, const std::filesystem::path& link_path);

    const Library& library;
};

#endif
