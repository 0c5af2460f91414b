#include "symbols.hpp"

namespace protodesc {

const TypeDecl* SymbolTable::insert(const TypeDecl* decl) {
    auto [it, inserted] = by_name_.insert({decl->full_name, decl});
    if (inserted || it->second == decl) return nullptr;
    return it->second;
}

const TypeDecl* SymbolTable::find(std::string_view full_name) const {
    if (!full_name.empty() && full_name.front() == '.') full_name.remove_prefix(1);
    if (auto it = by_name_.find(std::string(full_name)); it != by_name_.end())
        return it->second;
    return nullptr;
}

}  // namespace protodesc
