#include "ViewBuilder.hpp"

#include "Errors.hpp"
#include "Library.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <fmt/format.h>

#include <system_error>

namespace fs = std::filesystem;

namespace {

bool ends_with_pdf(const std::string& name)
{
    const std::string lower = Utils::to_lower_copy(name);
    return lower.size() >= 4 && lower.compare(lower.size() - 4, 4, ".pdf") == 0;
}

bool path_taken(const fs::path& path)
{
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}

} // namespace

ViewBuilder::ViewBuilder(const Library& library)
    : library(library) {}

std::string ViewBuilder::link_stem(const std::string& display_name)
{
    std::string base = Utils::safe_filename(display_name);
    if (!ends_with_pdf(base)) {
        base += ".pdf";
    }
    return base.substr(0, base.size() - 4);
}

fs::path ViewBuilder::next_free_path(const fs::path& category_dir,
                                     const std::string& stem,
                                     const std::string& digest) const
{
    const std::string short_digest = digest.substr(0, 8);
    fs::path candidate = category_dir / fmt::format("{}__{}.pdf", stem, short_digest);
    for (int n = 2; path_taken(candidate); ++n) {
        candidate = category_dir / fmt::format("{}__{}__{}.pdf", stem, short_digest, n);
    }
    return candidate;
}

void ViewBuilder::remove_existing(const fs::path& link_path)
{
    std::error_code ec;
    fs::remove(link_path, ec);
    if (ec) {
        throw LinkError(fmt::format("Cannot replace {}: {}", link_path.string(), ec.message()));
    }
}

void ViewBuilder::make_relative_symlink(const fs::path& target, const fs::path& link_path)
{
    remove_existing(link_path);
    const fs::path relative = target.lexically_relative(link_path.parent_path());
    std::error_code ec;
    fs::create_symlink(relative, link_path, ec);
    if (ec) {
        throw LinkError(fmt::format("Cannot symlink {} -> {}: {}", link_path.string(), relative.string(), ec.message()));
    }
}

void ViewBuilder::make_copy(const fs::path& target, const fs::path& link_path)
{
    remove_existing(link_path);
    std::error_code ec;
    fs::copy_file(target, link_path, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw LinkError(fmt::format("Cannot copy {} to {}: {}", target.string(), link_path.string(), ec.message()));
    }
    // Keep the vault timestamps and permission bits on the copy.
    const auto mtime = fs::last_write_time(target, ec);
    if (!ec) {
        fs::last_write_time(link_path, mtime, ec);
    }
    const auto status = fs::status(target, ec);
    if (!ec) {
        fs::permissions(link_path, status.permissions(), ec);
    }
}

void ViewBuilder::create_entry(const fs::path& target, const fs::path& link_path, LinkMode link_mode) const
{
    switch (link_mode) {
    case LinkMode::Symlink:
        make_relative_symlink(target, link_path);
        return;
    case LinkMode::Copy:
        make_copy(target, link_path);
        return;
    case LinkMode::Hardlink:
        break;
    }

    remove_existing(link_path);
    std::error_code ec;
    fs::create_hard_link(target, link_path, ec);
    if (!ec) {
        return;
    }
    if (ec == std::errc::cross_device_link) {
        if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
            logger->debug("Hard link across filesystems for {}; using a symlink", link_path.string());
        }
        make_relative_symlink(target, link_path);
        return;
    }
    throw LinkError(fmt::format("Cannot hard link {} -> {}: {}", link_path.string(), target.string(), ec.message()));
}

std::map<std::string, int> ViewBuilder::rebuild(const std::vector<Document>& documents,
                                                LinkMode link_mode,
                                                const NameResolver& name_resolver,
                                                bool refresh,
                                                const std::string& default_category) const
{
    const fs::path view_root = library.categorized_dir();
    std::error_code ec;
    fs::create_directories(view_root, ec);
    if (ec) {
        throw LinkError(fmt::format("Cannot create {}: {}", view_root.string(), ec.message()));
    }

    if (refresh) {
        try {
            Utils::remove_tree_contents(view_root);
        } catch (const fs::filesystem_error& ex) {
            throw LinkError(fmt::format("Cannot clear {}: {}", view_root.string(), ex.what()));
        }
    }

    std::map<std::string, int> counts;
    int created = 0;

    for (const auto& doc : documents) {
        std::string category = Utils::trim_copy(doc.category.value_or(default_category));
        if (category.empty()) {
            category = default_category;
        }

        const fs::path category_dir = view_root / Utils::safe_filename(category);
        fs::create_directories(category_dir, ec);
        if (ec) {
            throw LinkError(fmt::format("Cannot create {}: {}", category_dir.string(), ec.message()));
        }

        const std::string stem = link_stem(name_resolver(doc));
        const fs::path link_path = next_free_path(category_dir, stem, doc.digest);
        create_entry(library.root() / doc.store_relative_path, link_path, link_mode);

        ++created;
        ++counts[category];
    }

    counts[kTotalLinksKey] = created;
    if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
        logger->info("View rebuilt: {} entries in {} categories ({})",
                     created, counts.size() - 1, to_string(link_mode));
    }
    return counts;
}
