#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

#include "descriptor.hpp"

namespace protodesc {

// Fully qualified name -> message or enum. One table per project.
class SymbolTable {
   public:
    // Returns the decl already registered under `decl->full_name`, or null
    // when `decl` was inserted.
    const TypeDecl* insert(const TypeDecl* decl);
    const TypeDecl* find(std::string_view full_name) const;

    std::size_t size() const { return by_name_.size(); }
    void clear() { by_name_.clear(); }

   private:
    std::unordered_map<std::string, const TypeDecl*> by_name_{};
};

}  // namespace protodesc
