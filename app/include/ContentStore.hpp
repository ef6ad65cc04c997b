#ifndef CONTENT_STORE_HPP
#define CONTENT_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <string>

class Library;

struct IngestResult {
    std::string digest;
    std::string store_relative_path;
    std::int64_t bytes_written = 0;
    bool was_new_copy = false;
};

/**
 * @brief Digest-addressed, write-once blob store.
 *
 * ingest() streams the source into the scratch area while hashing it, then
 * either discards the scratch copy (the digest is already stored) or links
 * it into vault/<aa>/<bb>/<digest>.pdf without replacing an existing blob. Nothing is ever written directly at the
 * canonical path, so an interrupted ingest leaves at most a stray scratch file.
 * Throws StoreError when the source cannot be read or the destination cannot
 * be created.
 */
class ContentStore {
public:
    explicit ContentStore(const Library& library);

    IngestResult ingest(const std::filesystem::path& source) const;

    bool contains(const std::string& digest) const;

    /// Links the scratch file at the canonical path. Returns false when another
    /// ingest stored the same digest first; the scratch file is left in place.
    static bool publish(const std::filesystem::path& scratch,
                        const std::filesystem::path& destination);

private:
    struct ScratchCopy {
        std::filesystem::path path;
        std::string digest;
        std::int64_t bytes_written = 0;
    };

    ScratchCopy copy_to_scratch_and_hash(const std::filesystem::path& source) const;
    static void copy_timestamps(const std::filesystem::path& source,
                                const std::filesystem::path& destination);

    const Library& library;
};

#endif
