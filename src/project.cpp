#include "project.hpp"

#include <utility>

#include "extend.hpp"
#include "resolve.hpp"

namespace protodesc {

const std::vector<ProtoFile*>& Schema::files() const { return project_.loader_.files(); }

const ProtoFile* Schema::proto(std::string_view name) const {
    return project_.loader_.find_loaded(name);
}

const TypeDecl* Schema::find_type(std::string_view full_name) const {
    return project_.symbols_.find(full_name);
}

const std::vector<Job>& Schema::jobs() const { return project_.jobs_; }

const SymbolTable& Schema::symbols() const { return project_.symbols_; }

Project::Project(std::filesystem::path base_dir) : loader_(session_, std::move(base_dir)) {}

bool Project::check_mutable(std::string_view what) {
    if (!frozen()) return true;
    session_.error(DiagCode::State, Span{},
                   "cannot " + std::string(what) + " after the project has been resolved");
    return false;
}

bool Project::add_proto(std::string_view name) {
    if (!check_mutable("add `" + std::string(name) + "`")) return false;
    std::size_t errors = session_.error_count();
    ProtoFile* file = loader_.load(name);
    if (file && session_.error_count() == errors) return true;
    load_failed_ = true;
    return false;
}

bool Project::add_job(std::string_view proto, std::string template_name, std::string suffix) {
    if (!add_proto(proto)) return false;
    jobs_.push_back(Job{.proto = std::string(proto),
                        .path = loader_.locate(proto).value_or(std::filesystem::path{}),
                        .template_name = std::move(template_name),
                        .suffix = std::move(suffix)});
    return true;
}

void Project::set_search_paths(std::vector<std::filesystem::path> paths) {
    if (!check_mutable("change the search paths")) return;
    loader_.set_search_paths(std::move(paths));
}

void Project::add_search_path(std::filesystem::path path) {
    if (!check_mutable("change the search paths")) return;
    loader_.add_search_path(std::move(path));
}

ProtoFile* Project::proto(std::string_view name) {
    if (ProtoFile* f = loader_.find_loaded(name)) return f;
    session_.error(DiagCode::UnresolvedImport, Span{},
                   "unknown proto file `" + std::string(name) + "`");
    return nullptr;
}

const TypeDecl* Project::find_type(std::string_view full_name) const {
    for (const ProtoFile* f : loader_.files()) {
        if (const TypeDecl* d = f->find_type(full_name)) return d;
    }
    return nullptr;
}

Field* Project::add_synthetic_field(Message& message, ScalarType type, std::string name,
                                    std::int32_t number, Cardinality cardinality) {
    if (!check_mutable("add field `" + name + "`")) return nullptr;
    if (number < 1 || number > kMaxFieldNumber) {
        session_.error(DiagCode::State, message.span,
                       "field number " + std::to_string(number) + " of `" + name +
                           "` is out of range");
        return nullptr;
    }

    ParseState* owner = message.span.has_file() ? session_.parsed(message.span.file) : nullptr;
    if (!owner) {
        session_.error(DiagCode::State, message.span,
                       "message `" + message.name + "` does not belong to this project");
        return nullptr;
    }

    Field* field = owner->arena.make<Field>(Span{.file = message.span.file}, cardinality,
                                            TypeRef::scalar(type), std::move(name), number);
    field->synthetic = true;
    message.add_field(field);
    return field;
}

Field* Project::add_synthetic_field(Message& message, std::string_view type, std::string name,
                                    std::int32_t number, Cardinality cardinality) {
    auto scalar = parse_scalar_type(type);
    if (!scalar) {
        session_.error(DiagCode::State, message.span,
                       "synthetic field `" + name + "` must have a scalar type, not `" +
                           std::string(type) + "`");
        return nullptr;
    }
    return add_synthetic_field(message, *scalar, std::move(name), number, cardinality);
}

bool Project::remove_field(Message& message, std::string_view name) {
    if (!check_mutable("remove field `" + std::string(name) + "`")) return false;
    message.remove_field(name);
    return true;
}

const Schema* Project::resolve() {
    if (schema_) return &*schema_;
    if (failed_) return nullptr;

    // Anything that went wrong while loading leaves nothing worth resolving.
    if (load_failed_ || !index_types(session_, symbols_, loader_.files()) ||
        !resolve_types(session_, symbols_, loader_.files())) {
        failed_ = true;
        return nullptr;
    }
    merge_extensions(loader_.files());

    schema_.emplace(Schema(*this));
    return &*schema_;
}

}  // namespace protodesc
