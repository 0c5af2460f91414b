#pragma once

#include <string_view>
#include <vector>

#include "descriptor.hpp"
#include "session.hpp"
#include "symbols.hpp"

namespace protodesc {

// Pass A: assigns scope and full names to every message, enum and service in
// `files` and registers messages and enums in `symbols`. Returns false when a
// fully qualified name was defined twice.
bool index_types(Session& session, SymbolTable& symbols, const std::vector<ProtoFile*>& files);

// Pass B: binds every field and method type that is not a scalar. Stops at
// the first reference that cannot be bound and returns false.
bool resolve_types(Session& session, const SymbolTable& symbols,
                   const std::vector<ProtoFile*>& files);

// Looks `name` up from inside `scope`, innermost scope first. A leading `.`
// makes `name` fully qualified.
const TypeDecl* lookup_type(const SymbolTable& symbols, std::string_view scope,
                            std::string_view name);

}  // namespace protodesc
