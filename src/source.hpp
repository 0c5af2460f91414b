#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace protodesc {

using FileId = std::uint32_t;

inline constexpr FileId kNoFile = std::numeric_limits<FileId>::max();

struct SourceFile {
  FileId id = 0;
  std::string path{};
  std::string text{};
  bool loaded = false;
};

class SourceManager {
 public:
  FileId add_file(std::string path);
  std::optional<FileId> find_file(std::string_view path) const;

  void set_text(FileId id, std::string text);

  const SourceFile& file(FileId id) const;
  const std::string& path(FileId id) const;
  const std::string& text(FileId id) const;

  std::size_t size() const { return files_.size(); }

 private:
  std::vector<SourceFile> files_{};
  std::unordered_map<std::string, FileId> by_path_{};
};

}  // namespace protodesc
