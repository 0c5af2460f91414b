#include "parse.hpp"

#include <cctype>
#include <ostream>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "parser.hpp"

int yyparse(void);
int yylex(void);

extern YYSTYPE yylval;
extern YYLTYPE yylloc;

namespace protodesc {

void lex_begin(const char* data, std::size_t len);
void lex_end();

namespace {

void duplicate(Span span, std::string message) {
    push_error(span, std::move(message), DiagCode::DuplicateDefinition);
}

// Messages, enums and services declared side by side share one namespace.
void check_type_names(const std::vector<Message*>& messages,
                      const std::vector<Enum*>& enums,
                      const std::vector<Service*>& services,
                      const std::string& where) {
    std::unordered_set<std::string> seen{};
    for (const Message* m : messages) {
        if (!seen.insert(m->name).second)
            duplicate(m->span, "duplicate type name `" + m->name + "` in " + where);
    }
    for (const Enum* e : enums) {
        if (!seen.insert(e->name).second)
            duplicate(e->span, "duplicate type name `" + e->name + "` in " + where);
    }
    for (const Service* s : services) {
        if (!seen.insert(s->name).second)
            duplicate(s->span, "duplicate service name `" + s->name + "` in " + where);
    }
}

void check_enum(const Enum& e) {
    std::unordered_set<std::string> names{};
    std::unordered_map<std::int32_t, const EnumValue*> numbers{};
    const bool allow_alias = e.allow_alias();
    for (const EnumValue& v : e.values) {
        if (!names.insert(v.name).second)
            duplicate(v.span, "duplicate value `" + v.name + "` in enum `" + e.name + "`");
        auto [it, inserted] = numbers.insert({v.number, &v});
        if (!inserted && !allow_alias) {
            duplicate(v.span, "`" + v.name + "` uses the same number (" +
                                  std::to_string(v.number) + ") as `" + it->second->name +
                                  "` in enum `" + e.name +
                                  "`; set `option allow_alias = true;` to allow this");
        }
    }
}

void check_fields(const std::vector<Field*>& fields, const std::string& where) {
    std::unordered_set<std::string> names{};
    std::unordered_map<std::int32_t, const Field*> numbers{};
    for (const Field* f : fields) {
        if (!names.insert(f->name).second)
            duplicate(f->span, "duplicate field `" + f->name + "` in " + where);
        if (f->number == 0) continue;  // already reported as out of range
        auto [it, inserted] = numbers.insert({f->number, f});
        if (!inserted) {
            duplicate(f->span, "field number " + std::to_string(f->number) +
                                   " of `" + f->name + "` is already used by `" +
                                   it->second->name + "` in " + where);
        }
    }
}

void check_message(const Message& m) {
    const std::string where = "message `" + m.name + "`";
    check_type_names(m.messages, m.enums, {}, where);
    check_fields(m.fields, where);
    for (const Message* nested : m.messages) check_message(*nested);
    for (const Enum* e : m.enums) check_enum(*e);
    for (const Extend* ext : m.extends)
        check_fields(ext->fields, "extend `" + ext->target + "`");
}

void check_file(const ProtoFile& f) {
    check_type_names(f.messages, f.enums, f.services, "file `" + f.name() + "`");
    for (const Message* m : f.messages) check_message(*m);
    for (const Enum* e : f.enums) check_enum(*e);
    for (const Service* s : f.services) {
        std::unordered_set<std::string> methods{};
        for (const Method* m : s->methods) {
            if (!methods.insert(m->name).second)
                duplicate(m->span, "duplicate method `" + m->name + "` in service `" +
                                       s->name + "`");
        }
    }
    for (const Extend* ext : f.extends)
        check_fields(ext->fields, "extend `" + ext->target + "`");
}

}  // namespace

ParseState parse_source(FileId file_id, std::string_view path, std::string_view text) {
    ParseState state{};
    state.file = file_id;
    g_parse_state = &state;
    state.root = state.arena.make<ProtoFile>(Span{.file = file_id}, std::string(path));

    lex_begin(text.data(), text.size());
    int rc = yyparse();
    lex_end();

    if (rc == 2) push_error(Span{.file = file_id}, "parser stack exhausted");
    if (rc == 0 && !state.has_errors()) check_file(*state.root);
    g_parse_state = nullptr;

    if (rc != 0 || state.has_errors()) state.root = nullptr;
    return state;
}

static const char* token_name(int tok) {
    switch (tok) {
        case 0:
            return "EOF";
        case IDENT:
            return "IDENT";
        case STRING:
            return "STRING";
        case FLOAT:
            return "FLOAT";
        case INT:
            return "INT";

        case KW_SYNTAX:
            return "syntax";
        case KW_PACKAGE:
            return "package";
        case KW_IMPORT:
            return "import";
        case KW_PUBLIC:
            return "public";
        case KW_WEAK:
            return "weak";
        case KW_OPTION:
            return "option";
        case KW_MESSAGE:
            return "message";
        case KW_ENUM:
            return "enum";
        case KW_SERVICE:
            return "service";
        case KW_RPC:
            return "rpc";
        case KW_RETURNS:
            return "returns";
        case KW_STREAM:
            return "stream";
        case KW_EXTEND:
            return "extend";
        case KW_EXTENSIONS:
            return "extensions";
        case KW_RESERVED:
            return "reserved";
        case KW_TO:
            return "to";
        case KW_MAX:
            return "max";
        case KW_ONEOF:
            return "oneof";
        case KW_REQUIRED:
            return "required";
        case KW_OPTIONAL:
            return "optional";
        case KW_REPEATED:
            return "repeated";
    }
    return nullptr;
}

static void dump_string_lit(std::ostream& os, std::string_view s) {
    os << '"';
    for (unsigned char c : s) {
        switch (c) {
            case '\n':
                os << "\\n";
                break;
            case '\r':
                os << "\\r";
                break;
            case '\t':
                os << "\\t";
                break;
            case '"':
                os << "\\\"";
                break;
            case '\\':
                os << "\\\\";
                break;
            default:
                if (c >= 32 && c < 127) {
                    os << static_cast<char>(c);
                } else {
                    static constexpr char kHex[] = "0123456789abcdef";
                    os << "\\x" << kHex[(c >> 4) & 0xf] << kHex[c & 0xf];
                }
                break;
        }
    }
    os << '"';
}

void dump_tokens(FileId file_id, std::string_view text, std::ostream& os) {
    ParseState state{};
    state.file = file_id;
    g_parse_state = &state;

    lex_begin(text.data(), text.size());
    while (true) {
        int tok = yylex();
        if (tok == 0) break;

        os << yylloc.first_line << ":" << yylloc.first_column << " ";
        if (const char* name = token_name(tok)) {
            os << name;
        } else if (tok >= 0 && tok < 128 && std::isprint(tok)) {
            os << "'" << static_cast<char>(tok) << "'";
        } else {
            os << "<tok " << tok << ">";
        }

        switch (tok) {
            case IDENT:
                os << " ";
                dump_string_lit(os, take_str(yylval.cstr));
                break;
            case STRING:
            case FLOAT:
                os << " ";
                dump_string_lit(os, take_string(yylval.str_lit));
                break;
            case INT:
                os << " " << yylval.int_val;
                break;
            default:
                break;
        }
        os << "\n";
    }
    lex_end();

    for (const auto& d : state.diags) os << d.message << "\n";
    g_parse_state = nullptr;
}

}  // namespace protodesc
