#pragma once

#include <iosfwd>
#include <string_view>

#include "parse_state.hpp"

namespace protodesc {

// Parses `text` as the contents of `path`. The file system is not touched.
// On any error `root` is null and `diags` says why.
ParseState parse_source(FileId file, std::string_view path, std::string_view text);
void dump_tokens(FileId file, std::string_view text, std::ostream& os);

}  // namespace protodesc
