#include "CategoryConfig.hpp"

#include "Errors.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <fmt/format.h>
#include <json/json.h>

#include <cmath>
#include <cstdio>
#include <fstream>
#include <memory>
#include <sstream>

namespace {

void warn(const std::string& message)
{
    if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
        logger->warn("{}", message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

std::vector<std::string> read_keywords(const Json::Value& category,
                                       const char* key,
                                       const std::string& where)
{
    std::vector<std::string> keywords;
    if (!category.isMember(key) || category[key].isNull()) {
        return keywords;
    }
    const Json::Value& list = category[key];
    if (!list.isArray()) {
        throw ConfigError(fmt::format("{}: '{}' must be an array of strings", where, key));
    }
    for (const auto& entry : list) {
        if (!entry.isString()) {
            throw ConfigError(fmt::format("{}: '{}' must contain only strings", where, key));
        }
        keywords.push_back(entry.asString());
    }
    return keywords;
}

std::optional<int> read_page_bound(const Json::Value& category, const char* key, const std::string& where)
{
    if (!category.isMember(key) || category[key].isNull()) {
        return std::nullopt;
    }
    const Json::Value& value = category[key];
    if (!value.isIntegral() || value.isBool()) {
        throw ConfigError(fmt::format("{}: '{}' must be an integer", where, key));
    }
    if (!value.isInt()) {
        throw ConfigError(fmt::format("{}: '{}' must be an integer within range", where, key));
    }
    return value.asInt();
}

double read_number(const Json::Value& object, const char* key, double fallback, const std::string& where)
{
    if (!object.isMember(key) || object[key].isNull()) {
        return fallback;
    }
    const Json::Value& value = object[key];
    if (!value.isNumeric() || value.isBool()) {
        throw ConfigError(fmt::format("{}: '{}' must be a number", where, key));
    }
    const double number = value.asDouble();
    if (!std::isfinite(number)) {
        throw ConfigError(fmt::format("{}: '{}' must be finite", where, key));
    }
    return number;
}

} // namespace

RuleSet CategoryConfig::load_file(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ConfigError(fmt::format("Cannot read rule set '{}'", path.string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse(buffer.str(), path.string());
}

RuleSet CategoryConfig::parse(const std::string& json_text, const std::string& origin)
{
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["failIfExtra"] = true;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(json_text.data(), json_text.data() + json_text.size(), &root, &errors)) {
        throw ConfigError(fmt::format("{}: invalid JSON: {}", origin, Utils::trim_copy(errors)));
    }
    if (!root.isObject()) {
        throw ConfigError(fmt::format("{}: top level must be an object", origin));
    }

    RuleSet rules;
    if (root.isMember("default_category") && !root["default_category"].isNull()) {
        if (!root["default_category"].isString()) {
            throw ConfigError(fmt::format("{}: 'default_category' must be a string", origin));
        }
        const std::string value = Utils::trim_copy(root["default_category"].asString());
        if (!value.empty()) {
            rules.default_category = value;
        }
    }
    rules.min_score = read_number(root, "min_score", rules.min_score, origin);

    if (!root.isMember("categories") || root["categories"].isNull()) {
        return rules;
    }
    const Json::Value& categories = root["categories"];
    if (!categories.isArray()) {
        throw ConfigError(fmt::format("{}: 'categories' must be an array", origin));
    }

    for (Json::ArrayIndex i = 0; i < categories.size(); ++i) {
        const Json::Value& entry = categories[i];
        const std::string where = fmt::format("{}: categories[{}]", origin, i);
        if (!entry.isObject()) {
            throw ConfigError(fmt::format("{} must be an object", where));
        }

        CategoryRule rule;
        if (entry.isMember("name") && entry["name"].isString()) {
            rule.name = Utils::trim_copy(entry["name"].asString());
        } else if (entry.isMember("name") && !entry["name"].isNull()) {
            throw ConfigError(fmt::format("{}: 'name' must be a string", where));
        }
        if (rule.name.empty()) {
            warn(fmt::format("{} has no name; skipped", where));
            continue;
        }

        rule.priority = read_number(entry, "priority", 0.0, where);
        rule.min_pages = read_page_bound(entry, "min_pages", where);
        rule.max_pages = read_page_bound(entry, "max_pages", where);
        rule.path_keywords = read_keywords(entry, "path_keywords_any", where);
        rule.filename_keywords = read_keywords(entry, "filename_keywords_any", where);
        rule.metadata_keywords = read_keywords(entry, "metadata_keywords_any", where);
        rule.text_keywords = read_keywords(entry, "text_keywords_any", where);
        rules.rules.push_back(std::move(rule));
    }
    return rules;
}

const std::string& CategoryConfig::default_config_json()
{
    static const std::string kDefault = R"json({
  "default_category": "Unsorted",
  "min_score": 4,
  "categories": [
    {
      "name": "Receipts & Invoices",
      "priority": 60,
      "max_pages": 10,
      "path_keywords_any": ["receipts", "invoices"],
      "filename_keywords_any": ["invoice", "receipt", "bill", "order"],
      "metadata_keywords_any": ["invoice", "receipt"],
      "text_keywords_any": ["invoice number", "amount due", "total due", "receipt", "subtotal"]
    },
    {
      "name": "Bank & Finance",
      "priority": 55,
      "path_keywords_any": ["bank", "finance", "statements"],
      "filename_keywords_any": ["statement", "bank", "brokerage", "401k", "ira"],
      "metadata_keywords_any": ["statement", "account summary"],
      "text_keywords_any": ["account number", "statement period", "opening balance", "closing balance"]
    },
    {
      "name": "Taxes",
      "priority": 58,
      "path_keywords_any": ["tax", "taxes"],
      "filename_keywords_any": ["tax", "w-2", "w2", "1099", "1040"],
      "metadata_keywords_any": ["tax return", "internal revenue"],
      "text_keywords_any": ["internal revenue service", "taxable income", "form 1040", "form w-2"]
    },
    {
      "name": "Medical",
      "priority": 50,
      "path_keywords_any": ["medical", "health"],
      "filename_keywords_any": ["medical", "lab", "prescription", "insurance", "eob"],
      "metadata_keywords_any": ["patient", "clinic", "hospital"],
      "text_keywords_any": ["patient name", "diagnosis", "explanation of benefits", "prescription"]
    },
    {
      "name": "Legal & Contracts",
      "priority": 45,
      "path_keywords_any": ["legal", "contracts"],
      "filename_keywords_any": ["contract", "agreement", "lease", "nda", "terms"],
      "metadata_keywords_any": ["agreement", "contract"],
      "text_keywords_any": ["hereinafter", "this agreement", "governing law", "in witness whereof"]
    },
    {
      "name": "Manuals & Guides",
      "priority": 40,
      "path_keywords_any": ["manuals", "guides"],
      "filename_keywords_any": ["manual", "guide", "handbook", "instructions", "quickstart"],
      "metadata_keywords_any": ["manual", "user guide"],
      "text_keywords_any": ["user manual", "safety instructions", "troubleshooting", "warranty"]
    },
    {
      "name": "Travel",
      "priority": 35,
      "path_keywords_any": ["travel", "trips"],
      "filename_keywords_any": ["boarding", "itinerary", "ticket", "reservation", "booking"],
      "metadata_keywords_any": ["itinerary", "boarding pass"],
      "text_keywords_any": ["boarding pass", "confirmation number", "departure", "check-in"]
    },
    {
      "name": "Academic Papers",
      "priority": 30,
      "min_pages": 3,
      "path_keywords_any": ["papers", "research", "arxiv"],
      "filename_keywords_any": ["arxiv", "paper", "thesis", "preprint"],
      "metadata_keywords_any": ["arxiv", "journal", "proceedings", "latex"],
      "text_keywords_any": ["abstract", "references", "introduction", "related work"]
    },
    {
      "name": "Books",
      "priority": 20,
      "min_pages": 80,
      "path_keywords_any": ["books", "ebooks"],
      "filename_keywords_any": ["book", "edition"],
      "metadata_keywords_any": ["isbn", "publisher"],
      "text_keywords_any": ["isbn", "all rights reserved", "table of contents"]
    }
  ]
}
)json";
    return kDefault;
}
