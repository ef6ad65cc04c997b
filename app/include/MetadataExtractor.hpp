#ifndef METADATA_EXTRACTOR_HPP
#define METADATA_EXTRACTOR_HPP

#include "Types.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Source of document metadata and a bounded text sample for a stored PDF.
class IMetadataExtractor {
public:
    virtual ~IMetadataExtractor() = default;

    // Everything except text_sample; fields the tool does not report stay empty.
    virtual DocumentMetadata read_metadata(const std::filesystem::path& pdf) = 0;

    virtual std::optional<std::string> read_text_sample(const std::filesystem::path& pdf,
                                                        std::size_t max_bytes) = 0;
};

/**
 * @brief Metadata via poppler-utils: `pdfinfo` for the info dictionary and page count,
 * `pdftotext` for the text sample. Both run as child processes without a shell and
 * their stdout is read up to a byte bound, after which the child is terminated.
 * When a tool is missing the corresponding results are empty.
 */
class PopplerMetadataExtractor : public IMetadataExtractor {
public:
    static constexpr std::size_t kMaxInfoBytes = 64 * 1024;

    PopplerMetadataExtractor();

    DocumentMetadata read_metadata(const std::filesystem::path& pdf) override;
    std::optional<std::string> read_text_sample(const std::filesystem::path& pdf,
                                                std::size_t max_bytes) override;

    bool available() const { return pdfinfo_path.has_value(); }
    bool text_available() const { return pdftotext_path.has_value(); }

    // Parses "Key:   value" lines as printed by pdfinfo.
    static DocumentMetadata parse_pdfinfo_output(const std::string& output);

private:
    std::optional<std::filesystem::path> pdfinfo_path;
    std::optional<std::filesystem::path> pdftotext_path;
};

struct LimitedOutput {
    std::string output;
    bool exited_cleanly = false;
};

/**
 * @brief Runs argv[0] (an absolute executable path) with stdout captured and stderr
 * discarded. Reads at most limit_bytes, then terminates the child if still running.
 */
LimitedOutput run_with_output_limit(const std::vector<std::string>& argv, std::size_t limit_bytes);

#endif
