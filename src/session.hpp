#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "diag.hpp"
#include "parse_state.hpp"
#include "source.hpp"

namespace protodesc {

std::filesystem::path normalize_path(std::filesystem::path path);

struct Session {
    SourceManager sources{};
    std::vector<Diagnostic> diags{};

    // Registers `path` (normalized). Adding the same file twice returns the id
    // it already has.
    FileId add_file(std::filesystem::path path);

    // Parses the text stored for `file`. Parsed once; later calls return the
    // cached state. Diagnostics move into `diags`.
    ParseState* parse(FileId file);
    ParseState* parsed(FileId file) const;

    void error(DiagCode code, Span span, std::string message);
    bool has_errors() const;
    std::size_t error_count() const;

   private:
    std::vector<std::unique_ptr<ParseState>> parsed_{};
};

}  // namespace protodesc
