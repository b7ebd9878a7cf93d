#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kir {

using FileId = std::uint32_t;

struct SourceLoc {
    std::uint32_t line = 1;
    std::uint32_t column = 1;
};

struct SourceFile {
    FileId id = 0;
    std::string path{};
    std::string text{};

    // Byte offset of the first character of every line.
    std::vector<std::uint32_t> line_starts{};
};

class SourceManager {
   public:
    FileId add_file(std::string path, std::string text = {});
    std::optional<FileId> find_file(std::string_view path) const;

    const SourceFile& file(FileId id) const;
    const std::string& path(FileId id) const;

    // Maps a byte offset to a 1-based line/column. Offsets past the end of the
    // file clamp to the last line.
    SourceLoc location(FileId id, std::int32_t offset) const;

   private:
    std::vector<SourceFile> files_{};
    std::unordered_map<std::string, FileId> by_path_{};
};

}  // namespace kir
