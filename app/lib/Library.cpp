#include "Library.hpp"

#include "CategoryConfig.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <fmt/format.h>

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

Library::Library(fs::path root)
    : root_(std::move(root)) {}

void Library::ensure_initialized() const
{
    std::error_code ec;
    for (const auto& dir : {root_, vault_dir(), categorized_dir(), tmp_dir()}) {
        fs::create_directories(dir, ec);
        if (ec) {
            throw StoreError(fmt::format("Cannot create library directory '{}': {}", dir.string(), ec.message()));
        }
    }

    const fs::path config_path = categories_config_path();
    if (fs::exists(config_path, ec)) {
        return;
    }

    std::ofstream out(config_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw StoreError(fmt::format("Cannot write default rule set to '{}'", config_path.string()));
    }
    out << CategoryConfig::default_config_json();
    out.close();
    if (!out) {
        throw StoreError(fmt::format("Failed to finish writing '{}'", config_path.string()));
    }
    if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
        logger->info("Wrote default rule set to {}", config_path.string());
    }
}

fs::path Library::vault_path_for_digest(const std::string& digest) const
{
    if (digest.size() < 4) {
        throw StoreError(fmt::format("Digest '{}' is too short for the vault fan-out", digest));
    }
    return vault_dir() / digest.substr(0, 2) / digest.substr(2, 2) / (digest + ".pdf");
}

std::string Library::relative_to_root(const fs::path& path) const
{
    return path.lexically_relative(root_).generic_string();
}

fs::path Library::default_root()
{
    if (auto from_env = Utils::getenv_string("DOCVAULT_LIBRARY")) {
        return Utils::expand_user(*from_env);
    }
    return Utils::expand_user("~/DocVault");
}
