#include "loader.hpp"

#include <memory>
#include <system_error>
#include <utility>

#include <llvm/Support/ErrorOr.h>
#include <llvm/Support/MemoryBuffer.h>

namespace protodesc {

Loader::Loader(Session& session, std::filesystem::path base_dir)
    : session_(session), base_dir_(normalize_path(std::move(base_dir))) {
    search_paths_.push_back(base_dir_);
}

void Loader::set_search_paths(std::vector<std::filesystem::path> paths) {
    search_paths_.clear();
    for (auto& p : paths) add_search_path(std::move(p));
}

void Loader::add_search_path(std::filesystem::path path) {
    if (path.is_relative()) path = base_dir_ / path;
    search_paths_.push_back(normalize_path(std::move(path)));
}

std::vector<std::filesystem::path> Loader::candidates(std::string_view name) const {
    std::filesystem::path rel{std::string(name)};
    if (rel.is_absolute()) return {normalize_path(rel)};

    std::vector<std::filesystem::path> out{};
    out.reserve(search_paths_.size());
    for (const auto& dir : search_paths_) out.push_back(normalize_path(dir / rel));
    return out;
}

std::optional<std::filesystem::path> Loader::locate(std::string_view name) const {
    for (auto& candidate : candidates(name)) {
        std::error_code ec{};
        if (std::filesystem::is_regular_file(candidate, ec)) return candidate;
    }
    return std::nullopt;
}

ProtoFile* Loader::find_loaded(std::string_view name) const {
    auto path = locate(name);
    if (!path) return nullptr;
    auto id = session_.sources.find_file(path->string());
    if (!id) return nullptr;
    ParseState* parsed = session_.parsed(*id);
    return parsed ? parsed->root : nullptr;
}

std::optional<std::string> Loader::read_file(const std::filesystem::path& path, Span from) {
    llvm::ErrorOr<std::unique_ptr<llvm::MemoryBuffer>> buffer =
        llvm::MemoryBuffer::getFile(path.string());
    if (std::error_code ec = buffer.getError()) {
        session_.error(DiagCode::Io, from,
                       "could not read `" + path.string() + "`: " + ec.message());
        return std::nullopt;
    }
    return (*buffer)->getBuffer().str();
}

ProtoFile* Loader::load(std::string_view name, Span from) {
    auto path = locate(name);
    if (!path) {
        std::string tried{};
        for (const auto& c : candidates(name)) {
            if (!tried.empty()) tried += ", ";
            tried += "`" + c.string() + "`";
        }
        session_.error(DiagCode::UnresolvedImport, from,
                       "file `" + std::string(name) +
                           "` could not be found on the search paths (tried " + tried + ")");
        return nullptr;
    }

    // A file seen before, even one still loading further up the stack, is
    // returned as is. This is what makes import cycles terminate.
    FileId id = session_.add_file(*path);
    if (ParseState* parsed = session_.parsed(id)) return parsed->root;

    if (!session_.sources.file(id).loaded) {
        auto text = read_file(*path, from);
        if (!text) return nullptr;
        session_.sources.set_text(id, std::move(*text));
    }

    ParseState* parsed = session_.parse(id);
    if (!parsed || !parsed->root) return nullptr;

    files_.push_back(parsed->root);
    load_imports(parsed->root);
    return parsed->root;
}

void Loader::load_imports(ProtoFile* file) {
    for (Import& import : file->imports) {
        import.file = load(import.name, import.span);
    }
}

}  // namespace protodesc
