#include "names.hpp"

#include <cctype>

namespace protodesc {
namespace {

char to_upper(char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

char to_lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool is_upper(char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; }

bool is_lower_or_digit(char c) {
    return std::islower(static_cast<unsigned char>(c)) != 0 ||
           std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::string to_camel(std::string_view name, bool lower_first) {
    bool capitalize_next = !lower_first;
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (c == '_') {
            capitalize_next = true;
        } else if (capitalize_next) {
            out.push_back(to_upper(c));
            capitalize_next = false;
        } else {
            out.push_back(c);
        }
    }
    if (lower_first && !out.empty()) out[0] = to_lower(out[0]);
    return out;
}

}  // namespace

std::string join_scope(std::string_view scope, std::string_view name) {
    if (scope.empty()) return std::string(name);
    std::string out;
    out.reserve(scope.size() + 1 + name.size());
    out.append(scope);
    out.push_back('.');
    out.append(name);
    return out;
}

std::string_view parent_scope(std::string_view scope) {
    size_t dot = scope.rfind('.');
    if (dot == std::string_view::npos) return {};
    return scope.substr(0, dot);
}

std::string camel_case(std::string_view name) { return to_camel(name, true); }

std::string pascal_case(std::string_view name) { return to_camel(name, false); }

std::string constant_title_case(std::string_view name) {
    bool next_upper = true;
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (c == '_') {
            next_upper = true;
        } else if (next_upper) {
            out.push_back(to_upper(c));
            next_upper = false;
        } else {
            out.push_back(to_lower(c));
        }
    }
    return out;
}

std::string upper_snake_case(std::string_view name) {
    std::string out;
    out.reserve(name.size() + 4);
    for (size_t i = 0; i < name.size(); i++) {
        char c = name[i];
        if (c == '_') {
            if (!out.empty() && out.back() != '_') out.push_back('_');
            continue;
        }
        if (is_upper(c) && i > 0 && !out.empty() && out.back() != '_') {
            char prev = name[i - 1];
            bool next_lower = i + 1 < name.size() &&
                              std::islower(static_cast<unsigned char>(name[i + 1])) != 0;
            // `laceShoe` -> LACE_SHOE, `HTTPServer` -> HTTP_SERVER
            if (is_lower_or_digit(prev) || (is_upper(prev) && next_lower))
                out.push_back('_');
        }
        out.push_back(to_upper(c));
    }
    return out;
}

}  // namespace protodesc
