#pragma once

#include <string>
#include <string_view>

namespace protodesc {

// `package` + "." + `name`, or just `name` when the package is empty.
std::string join_scope(std::string_view scope, std::string_view name);

// Drops the last dotted component: `a.b.c` -> `a.b`, `a` -> ``.
std::string_view parent_scope(std::string_view scope);

// Derived display names. None of these are stored on descriptors.
std::string camel_case(std::string_view name);           // lace_shoe, LaceShoe -> laceShoe
std::string pascal_case(std::string_view name);          // shoe_id -> ShoeId
std::string constant_title_case(std::string_view name);  // WORK_FAX -> WorkFax
std::string upper_snake_case(std::string_view name);     // LaceShoe, shoeId -> LACE_SHOE, SHOE_ID

}  // namespace protodesc
