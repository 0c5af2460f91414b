#include "source.hpp"

#include <utility>

namespace protodesc {

FileId SourceManager::add_file(std::string path) {
    if (auto it = by_path_.find(path); it != by_path_.end()) return it->second;

    FileId id = static_cast<FileId>(files_.size());
    files_.push_back(SourceFile{.id = id, .path = std::move(path)});
    by_path_.insert({files_.back().path, id});
    return id;
}

std::optional<FileId> SourceManager::find_file(std::string_view path) const {
    if (auto it = by_path_.find(std::string(path)); it != by_path_.end())
        return it->second;
    return std::nullopt;
}

void SourceManager::set_text(FileId id, std::string text) {
    SourceFile& f = files_.at(static_cast<size_t>(id));
    f.text = std::move(text);
    f.loaded = true;
}

const SourceFile& SourceManager::file(FileId id) const {
    return files_.at(static_cast<size_t>(id));
}

const std::string& SourceManager::path(FileId id) const {
    return file(id).path;
}

const std::string& SourceManager::text(FileId id) const {
    return file(id).text;
}

}  // namespace protodesc
