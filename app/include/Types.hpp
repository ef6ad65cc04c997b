#ifndef TYPES_HPP
#define TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class SourceStatus {
    Ok,
    Error,
    Unreadable
};

enum class LinkMode {
    Symlink,
    Hardlink,
    Copy
};

enum class PathDisclosureMode {
    Basename,
    Tail,
    Full
};

enum class LLMMode {
    Fallback,
    Always
};

enum class LLMProvider {
    Off,
    Http
};

struct DocumentMetadata {
    std::optional<int> page_count;
    std::optional<std::string> title;
    std::optional<std::string> authors;
    std::optional<std::string> subject;
    std::optional<std::string> keywords;
    std::optional<std::string> text_sample;
    std::optional<std::string> raw_metadata_json;
};

// One row per distinct content, keyed by the SHA-256 digest.
struct Document {
    std::string digest;
    std::string store_relative_path;
    std::int64_t byte_size = 0;
    double first_seen_at = 0.0;
    double last_seen_at = 0.0;

    DocumentMetadata metadata;

    std::optional<std::string> category;
    std::optional<double> category_score;
    std::optional<std::string> category_reason;
    std::optional<double> categorized_at;
};

// One row per absolute source path observed by a scan.
struct SourceRecord {
    std::string path;
    std::string basename;
    std::optional<std::int64_t> size;
    std::optional<double> modified_time;
    std::optional<std::string> digest;
    double first_seen_at = 0.0;
    double last_seen_at = 0.0;
    SourceStatus status = SourceStatus::Ok;
    std::optional<std::string> error;
};

struct CategoryRule {
    std::string name;
    double priority = 0.0;
    std::optional<int> min_pages;
    std::optional<int> max_pages;
    std::vector<std::string> path_keywords;
    std::vector<std::string> filename_keywords;
    std::vector<std::string> metadata_keywords;
    std::vector<std::string> text_keywords;
};

struct RuleSet {
    std::string default_category = "Unsorted";
    double min_score = 4.0;
    std::vector<CategoryRule> rules;

    std::vector<std::string> category_names() const;
    bool uses_text() const;
};

struct Categorization {
    std::string category;
    double score = 0.0;
    std::string reason;

    bool operator==(const Categorization& other) const = default;
};

// Everything the scorer and the classifier may look at for one document.
struct DocumentAttributes {
    std::optional<std::string> source_path;
    std::optional<std::string> source_basename;
    std::optional<std::string> title;
    std::optional<std::string> subject;
    std::optional<std::string> keywords;
    std::optional<std::string> authors;
    std::optional<std::string> text_sample;
    std::optional<int> page_count;
};

struct LatestSource {
    std::string path;
    std::string basename;
};

std::string to_string(SourceStatus status);
std::optional<SourceStatus> source_status_from_string(const std::string& value);
std::string to_string(LinkMode mode);
std::string to_string(PathDisclosureMode mode);
std::string to_string(LLMMode mode);
std::string to_string(LLMProvider provider);

#endif
