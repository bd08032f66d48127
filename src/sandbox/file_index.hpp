#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "sandbox/execution_result.hpp"

namespace rlm::sandbox {

// Snapshot of the regular files under a data directory, keyed by path
// relative to the root. Hidden entries and cache directories are skipped.
class FileIndex {
public:
    FileIndex() = default;
    explicit FileIndex(std::filesystem::path root);

    int Rebuild();

    const std::filesystem::path& Root() const { return root_; }
    const std::vector<FileIndexEntry>& Entries() const { return entries_; }
    std::size_t Size() const { return entries_.size(); }
    bool Empty() const { return entries_.empty(); }
    std::uintmax_t TotalBytes() const;

    // fnmatch(3) against the relative path or the bare file name.
    std::vector<std::string> ListFiles(const std::string& pattern) const;
    // std::nullopt for unknown files and paths that leave the root.
    std::optional<std::string> ReadFile(const std::string& relative_path) const;
    // "Available files (N total):" followed by one line per file, capped.
    std::string Summary(std::size_t max_files, std::size_t max_chars) const;

private:
    std::filesystem::path root_;
    std::vector<FileIndexEntry> entries_;
};

std::string ClassifyFile(const std::filesystem::path& path);

}  // namespace rlm::sandbox
