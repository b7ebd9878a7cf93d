#include "source.hpp"

#include <algorithm>

namespace kir {

static std::vector<std::uint32_t> compute_line_starts(const std::string& text) {
    std::vector<std::uint32_t> starts{0};
    for (size_t i = 0; i < text.size(); i++) {
        if (text[i] == '\n') starts.push_back(static_cast<std::uint32_t>(i + 1));
    }
    return starts;
}

FileId SourceManager::add_file(std::string path, std::string text) {
    if (auto it = by_path_.find(path); it != by_path_.end()) return it->second;

    FileId id = static_cast<FileId>(files_.size());
    SourceFile f{.id = id, .path = std::move(path), .text = std::move(text)};
    f.line_starts = compute_line_starts(f.text);
    files_.push_back(std::move(f));
    by_path_.insert({files_.back().path, id});
    return id;
}

std::optional<FileId> SourceManager::find_file(std::string_view path) const {
    if (auto it = by_path_.find(std::string(path)); it != by_path_.end())
        return it->second;
    return std::nullopt;
}

const SourceFile& SourceManager::file(FileId id) const {
    return files_.at(static_cast<size_t>(id));
}

const std::string& SourceManager::path(FileId id) const {
    return file(id).path;
}

SourceLoc SourceManager::location(FileId id, std::int32_t offset) const {
    if (offset < 0) return SourceLoc{};
    const SourceFile& f = file(id);
    const auto off = static_cast<std::uint32_t>(offset);
    auto it = std::upper_bound(f.line_starts.begin(), f.line_starts.end(), off);
    size_t line_index = static_cast<size_t>(it - f.line_starts.begin()) - 1;
    return SourceLoc{
        .line = static_cast<std::uint32_t>(line_index + 1),
        .column = off - f.line_starts[line_index] + 1,
    };
}

}  // namespace kir
