#include "MetadataExtractor.hpp"

#include "Logger.hpp"
#include "Utils.hpp"

#include <fmt/format.h>
#include <json/json.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

void log_warn(const std::string& message)
{
    if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
        logger->warn("{}", message);
    }
}

std::optional<int> parse_int(const std::string& value)
{
    const std::string text = Utils::trim_copy(value);
    if (text.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    errno = 0;
    const long parsed = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0' || parsed < 0 ||
        parsed > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(parsed);
}

std::optional<std::string> non_empty(const std::string& value)
{
    std::string trimmed = Utils::trim_copy(value);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    return trimmed;
}

} // namespace

LimitedOutput run_with_output_limit(const std::vector<std::string>& argv, std::size_t limit_bytes)
{
    LimitedOutput result;
    if (argv.empty() || limit_bytes == 0) {
        return result;
    }

    int stdout_pipe[2];
    if (::pipe2(stdout_pipe, O_CLOEXEC) < 0) {
        throw std::system_error(errno, std::generic_category(), "pipe2");
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        ::close(stdout_pipe[0]);
        ::close(stdout_pipe[1]);
        throw std::system_error(err, std::generic_category(), "fork");
    }

    if (pid == 0) {
        ::dup2(stdout_pipe[1], STDOUT_FILENO);
        const int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDERR_FILENO);
        }
        ::execv(args[0], args.data());
        ::_exit(127);
    }

    ::close(stdout_pipe[1]);

    std::string buffer(4096, '\0');
    bool reached_eof = false;
    while (result.output.size() < limit_bytes) {
        const std::size_t want = std::min(buffer.size(), limit_bytes - result.output.size());
        const ssize_t n = ::read(stdout_pipe[0], buffer.data(), want);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (n == 0) {
            reached_eof = true;
            break;
        }
        result.output.append(buffer.data(), static_cast<std::size_t>(n));
    }
    ::close(stdout_pipe[0]);

    if (!reached_eof) {
        ::kill(pid, SIGTERM);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return result;
        }
    }
    result.exited_cleanly = reached_eof && WIFEXITED(status) && WEXITSTATUS(status) == 0;
    return result;
}

PopplerMetadataExtractor::PopplerMetadataExtractor()
    : pdfinfo_path(Utils::find_executable("pdfinfo")),
      pdftotext_path(Utils::find_executable("pdftotext"))
{
    if (!pdfinfo_path) {
        log_warn("pdfinfo not found on PATH; document metadata will be empty");
    }
}

DocumentMetadata PopplerMetadataExtractor::parse_pdfinfo_output(const std::string& output)
{
    DocumentMetadata metadata;
    Json::Value raw(Json::objectValue);

    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        const auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            continue;
        }
        const std::string key = Utils::trim_copy(line.substr(0, colon));
        const auto value = non_empty(line.substr(colon + 1));
        if (key.empty() || !value) {
            continue;
        }
        raw[key] = *value;

        if (key == "Title") {
            metadata.title = value;
        } else if (key == "Author") {
            metadata.authors = value;
        } else if (key == "Subject") {
            metadata.subject = value;
        } else if (key == "Keywords") {
            metadata.keywords = value;
        } else if (key == "Pages") {
            metadata.page_count = parse_int(*value);
        }
    }

    if (!raw.empty()) {
        Json::StreamWriterBuilder writer;
        writer["indentation"] = "";
        writer["emitUTF8"] = true;
        metadata.raw_metadata_json = Json::writeString(writer, raw);
    }
    return metadata;
}

DocumentMetadata PopplerMetadataExtractor::read_metadata(const std::filesystem::path& pdf)
{
    if (!pdfinfo_path) {
        return DocumentMetadata{};
    }
    try {
        const auto out = run_with_output_limit({pdfinfo_path->string(), "-enc", "UTF-8", pdf.string()},
                                               kMaxInfoBytes);
        if (!out.exited_cleanly) {
            log_warn(fmt::format("pdfinfo failed for {}", pdf.string()));
            return DocumentMetadata{};
        }
        return parse_pdfinfo_output(out.output);
    } catch (const std::system_error& ex) {
        log_warn(fmt::format("Could not run pdfinfo for {}: {}", pdf.string(), ex.what()));
        return DocumentMetadata{};
    }
}

std::optional<std::string> PopplerMetadataExtractor::read_text_sample(const std::filesystem::path& pdf,
                                                                      std::size_t max_bytes)
{
    if (!pdftotext_path || max_bytes == 0) {
        return std::nullopt;
    }
    try {
        const auto out = run_with_output_limit(
            {pdftotext_path->string(), "-q", "-enc", "UTF-8", pdf.string(), "-"}, max_bytes);
        auto text = non_empty(Utils::truncate_utf8(out.output, max_bytes));
        return text;
    } catch (const std::system_error& ex) {
        log_warn(fmt::format("Could not run pdftotext for {}: {}", pdf.string(), ex.what()));
        return std::nullopt;
    }
}
