#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "descriptor.hpp"
#include "session.hpp"

namespace protodesc {

// Finds schema files on the search paths, parses each one once and follows
// its imports depth-first.
class Loader {
   public:
    Loader(Session& session, std::filesystem::path base_dir);

    // Relative entries are taken relative to the base directory.
    void set_search_paths(std::vector<std::filesystem::path> paths);
    void add_search_path(std::filesystem::path path);
    const std::vector<std::filesystem::path>& search_paths() const { return search_paths_; }

    // Loads `name` and everything it imports. Returns the file for `name`,
    // or null when it could not be found, read or parsed. Problems in
    // imported files are reported but do not null the result.
    ProtoFile* load(std::string_view name, Span from = {});

    // Maps `name` to a path through the search paths without reporting.
    std::optional<std::filesystem::path> locate(std::string_view name) const;

    // Every loaded file in discovery order: a file comes before its imports.
    const std::vector<ProtoFile*>& files() const { return files_; }

    // The already loaded file `name` resolves to, if any.
    ProtoFile* find_loaded(std::string_view name) const;

   private:
    Session& session_;
    std::filesystem::path base_dir_{};
    std::vector<std::filesystem::path> search_paths_{};
    std::vector<ProtoFile*> files_{};

    std::vector<std::filesystem::path> candidates(std::string_view name) const;
    std::optional<std::string> read_file(const std::filesystem::path& path, Span from);
    void load_imports(ProtoFile* file);
};

}  // namespace protodesc
