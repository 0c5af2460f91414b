#include "resolve.hpp"

#include <string>
#include <utility>

#include "diag.hpp"
#include "names.hpp"

namespace protodesc {
namespace {

class Indexer {
   public:
    Indexer(Session& session, SymbolTable& symbols) : session_(session), symbols_(symbols) {}

    bool run(const std::vector<ProtoFile*>& files) {
        std::size_t errors = session_.error_count();
        for (ProtoFile* f : files) index_file(*f);
        return session_.error_count() == errors;
    }

   private:
    Session& session_;
    SymbolTable& symbols_;

    void error(Span span, std::string message) {
        session_.error(DiagCode::DuplicateDefinition, span, std::move(message));
    }

    void index_file(ProtoFile& f) {
        for (Message* m : f.messages) index_message(*m, f.package, f.package, nullptr);
        for (Enum* e : f.enums) index_decl(*e, f.package, f.package, nullptr);
        for (Service* s : f.services) {
            s->package = f.package;
            s->full_name = join_scope(f.package, s->name);
        }
        for (Extend* e : f.extends) e->package = f.package;
    }

    void index_decl(TypeDecl& d, const std::string& package, const std::string& scope,
                    const Message* parent) {
        d.package = package;
        d.scope = scope;
        d.full_name = join_scope(scope, d.name);
        d.parent = parent;

        if (const TypeDecl* prev = symbols_.insert(&d)) {
            std::string where{};
            if (prev->span.has_file() && prev->span.file < session_.sources.size())
                where = " (first defined in `" + session_.sources.path(prev->span.file) + "`)";
            error(d.span, "`" + d.full_name + "` is already defined" + where);
        }
    }

    void index_message(Message& m, const std::string& package, const std::string& scope,
                       const Message* parent) {
        index_decl(m, package, scope, parent);
        for (Message* nested : m.messages) index_message(*nested, package, m.full_name, &m);
        for (Enum* e : m.enums) index_decl(*e, package, m.full_name, &m);
        for (Extend* e : m.extends) e->package = package;
    }
};

class TypeResolver {
   public:
    TypeResolver(Session& session, const SymbolTable& symbols)
        : session_(session), symbols_(symbols) {}

    bool run(const std::vector<ProtoFile*>& files) {
        for (ProtoFile* f : files) {
            if (!resolve_file(*f)) return false;
        }
        return true;
    }

   private:
    Session& session_;
    const SymbolTable& symbols_;

    void error(Span span, std::string message) {
        session_.error(DiagCode::UnresolvedType, span, std::move(message));
    }

    // Names nested directly in `local` shadow everything else.
    const TypeDecl* find(const Message* local, std::string_view scope, const std::string& raw) {
        if (local) {
            if (const TypeDecl* d = local->find_nested_type(raw)) return d;
        }
        return lookup_type(symbols_, scope, raw);
    }

    bool resolve_field(Field& f, const Message* local, std::string_view scope,
                       const std::string& owner) {
        if (f.type.is_resolved()) return true;
        const TypeDecl* d = find(local, scope, f.type.raw());
        if (!d) {
            error(f.span, "could not resolve type of field `" + f.name + "` on " + owner +
                              ": `" + f.type.raw() + "`");
            return false;
        }
        f.type.bind(d);
        return true;
    }

    bool resolve_extend(Extend& e) {
        std::string_view scope = e.scope ? std::string_view(e.scope->full_name)
                                         : std::string_view(e.package);
        for (Field* f : e.fields) {
            if (!resolve_field(*f, e.scope, scope, "extend `" + e.target + "`")) return false;
        }
        return true;
    }

    bool resolve_message(Message& m) {
        const std::string owner = "message `" + m.name + "`";
        for (Field* f : m.fields) {
            if (!resolve_field(*f, &m, m.full_name, owner)) return false;
        }
        for (Message* nested : m.messages) {
            if (!resolve_message(*nested)) return false;
        }
        for (Extend* e : m.extends) {
            if (!resolve_extend(*e)) return false;
        }
        return true;
    }

    bool resolve_method_type(TypeRef& ref, const Method& method, const Service& service,
                             std::string_view which) {
        if (ref.is_resolved()) return true;
        const TypeDecl* d = lookup_type(symbols_, service.package, ref.raw());
        if (!d) {
            error(method.span, "could not resolve " + std::string(which) + " type of method `" +
                                   method.name + "` on service `" + service.name + "`: `" +
                                   ref.raw() + "`");
            return false;
        }
        ref.bind(d);
        return true;
    }

    bool resolve_file(ProtoFile& f) {
        for (Message* m : f.messages) {
            if (!resolve_message(*m)) return false;
        }
        for (Extend* e : f.extends) {
            if (!resolve_extend(*e)) return false;
        }
        for (Service* s : f.services) {
            for (Method* m : s->methods) {
                if (!resolve_method_type(m->input, *m, *s, "input")) return false;
                if (!resolve_method_type(m->output, *m, *s, "output")) return false;
            }
        }
        return true;
    }
};

}  // namespace

const TypeDecl* lookup_type(const SymbolTable& symbols, std::string_view scope,
                            std::string_view name) {
    if (!name.empty() && name.front() == '.') return symbols.find(name);

    while (true) {
        if (const TypeDecl* d = symbols.find(join_scope(scope, name))) return d;
        if (scope.empty()) return nullptr;
        scope = parent_scope(scope);
    }
}

bool index_types(Session& session, SymbolTable& symbols, const std::vector<ProtoFile*>& files) {
    return Indexer(session, symbols).run(files);
}

bool resolve_types(Session& session, const SymbolTable& symbols,
                   const std::vector<ProtoFile*>& files) {
    return TypeResolver(session, symbols).run(files);
}

}  // namespace protodesc
