#include "sandbox/file_index.hpp"

#include <algorithm>
#include <fnmatch.h>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "utils/logging.hpp"

namespace rlm::sandbox {
namespace {

constexpr std::size_t kProbeBytes = 4096;

bool IsSkippedName(const std::string& name) {
    return (!name.empty() && name.front() == '.') ||
        name == "__pycache__" ||
        name == "node_modules";
}

bool Matches(const std::string& pattern, const std::string& value) {
    return ::fnmatch(pattern.c_str(), value.c_str(), 0) == 0;
}

}  // namespace

std::string ClassifyFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return "unknown";
    }
    char buffer[kProbeBytes];
    input.read(buffer, sizeof(buffer));
    const auto count = input.gcount();
    return std::find(buffer, buffer + count, '\0') == buffer + count ? "text" : "binary";
}

FileIndex::FileIndex(std::filesystem::path root)
    : root_(std::move(root)) {}

int FileIndex::Rebuild() {
    entries_.clear();
    std::error_code ec;
    if (root_.empty() || !std::filesystem::is_directory(root_, ec)) {
        return 0;
    }

    std::filesystem::recursive_directory_iterator it(
        root_,
        std::filesystem::directory_options::skip_permission_denied,
        ec);
    const std::filesystem::recursive_directory_iterator end;
    while (!ec && it != end) {
        const auto& entry = *it;
        const auto name = entry.path().filename().string();
        std::error_code entry_ec;
        if (IsSkippedName(name)) {
            if (entry.is_directory(entry_ec)) {
                it.disable_recursion_pending();
            }
        } else if (entry.is_regular_file(entry_ec)) {
            FileIndexEntry item{};
            item.path = entry.path().lexically_relative(root_).generic_string();
            item.size = entry.file_size(entry_ec);
            item.type = ClassifyFile(entry.path());
            entries_.push_back(std::move(item));
        }
        it.increment(ec);
    }
    if (ec) {
        rlm::utils::LogWarn("index", "walk of " + root_.string() + " stopped early: " + ec.message());
    }

    std::sort(entries_.begin(), entries_.end(), [](const FileIndexEntry& lhs, const FileIndexEntry& rhs) {
        return lhs.path < rhs.path;
    });
    rlm::utils::LogInfo("index", "indexed " + std::to_string(entries_.size()) + " files under " + root_.string());
    return static_cast<int>(entries_.size());
}

std::uintmax_t FileIndex::TotalBytes() const {
    std::uintmax_t total = 0;
    for (const auto& entry : entries_) {
        total += entry.size;
    }
    return total;
}

std::vector<std::string> FileIndex::ListFiles(const std::string& pattern) const {
    const auto effective = pattern.empty() ? std::string("*") : pattern;
    std::vector<std::string> files;
    for (const auto& entry : entries_) {
        const auto name = std::filesystem::path(entry.path).filename().string();
        if (Matches(effective, entry.path) || Matches(effective, name)) {
            files.push_back(entry.path);
        }
    }
    return files;
}

std::optional<std::string> FileIndex::ReadFile(const std::string& relative_path) const {
    if (root_.empty()) {
        return std::nullopt;
    }
    std::error_code ec;
    const auto root = std::filesystem::weakly_canonical(root_, ec);
    if (ec) {
        return std::nullopt;
    }
    const auto target = std::filesystem::weakly_canonical(root / relative_path, ec);
    if (ec) {
        return std::nullopt;
    }
    const auto relative = target.lexically_relative(root);
    if (relative.empty() || *relative.begin() == "..") {
        rlm::utils::LogWarn("index", "refusing to read outside the data root: " + relative_path);
        return std::nullopt;
    }
    if (!std::filesystem::is_regular_file(target, ec)) {
        return std::nullopt;
    }
    std::ifstream input(target, std::ios::binary);
    if (!input.is_open()) {
        return std::nullopt;
    }
    std::ostringstream content;
    content << input.rdbuf();
    return content.str();
}

std::string FileIndex::Summary(std::size_t max_files, std::size_t max_chars) const {
    if (entries_.empty()) {
        return std::string();
    }
    std::ostringstream oss;
    oss << "Available files (" << entries_.size() << " total):\n";
    std::size_t listed = 0;
    for (const auto& entry : entries_) {
        if (listed == max_files) {
            break;
        }
        std::ostringstream line;
        line << "- " << entry.path << " (" << entry.size << " bytes, " << entry.type << ")\n";
        if (static_cast<std::size_t>(oss.tellp()) + line.str().size() > max_chars) {
            break;
        }
        oss << line.str();
        ++listed;
    }
    if (listed < entries_.size()) {
        oss << "... and " << (entries_.size() - listed) << " more\n";
    }
    return oss.str();
}

}  // namespace rlm::sandbox
