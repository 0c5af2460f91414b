#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "descriptor.hpp"
#include "loader.hpp"
#include "session.hpp"
#include "symbols.hpp"

namespace protodesc {

struct Job {
    std::string proto{};
    std::filesystem::path path{};
    std::string template_name{};
    std::string suffix{};
};

class Project;

// Read-only view of a project whose types are all resolved and whose
// extensions are merged. Only Project::resolve() hands one out.
class Schema {
   public:
    const std::vector<ProtoFile*>& files() const;
    const ProtoFile* proto(std::string_view name) const;
    const TypeDecl* find_type(std::string_view full_name) const;
    const std::vector<Job>& jobs() const;
    const SymbolTable& symbols() const;

   private:
    friend class Project;
    explicit Schema(const Project& project) : project_(project) {}

    const Project& project_;
};

class Project {
   public:
    explicit Project(std::filesystem::path base_dir = std::filesystem::current_path());

    Project(const Project&) = delete;
    Project& operator=(const Project&) = delete;

    // Loads `name` and its imports. Returns false when anything went wrong.
    bool add_proto(std::string_view name);
    bool add_job(std::string_view proto, std::string template_name, std::string suffix = {});

    void set_search_paths(std::vector<std::filesystem::path> paths);
    void add_search_path(std::filesystem::path path);
    const std::vector<std::filesystem::path>& search_paths() const {
        return loader_.search_paths();
    }

    // All loaded files in discovery order.
    const std::vector<ProtoFile*>& protos() const { return loader_.files(); }
    // The loaded file `name` resolves to. Reports an error when there is none.
    ProtoFile* proto(std::string_view name);
    const TypeDecl* find_type(std::string_view full_name) const;

    // Appends a scalar field built outside the parser. Rejected once frozen.
    Field* add_synthetic_field(Message& message, ScalarType type, std::string name,
                               std::int32_t number,
                               Cardinality cardinality = Cardinality::Optional);
    Field* add_synthetic_field(Message& message, std::string_view type, std::string name,
                               std::int32_t number,
                               Cardinality cardinality = Cardinality::Optional);
    // Removes the first field called `name`; absent names are not an error.
    // Rejected once frozen.
    bool remove_field(Message& message, std::string_view name);

    // Indexes, resolves and merges extensions. On success the project is
    // frozen and the same view is returned on every later call. On failure
    // returns null, now and on every later call.
    const Schema* resolve();
    bool frozen() const { return schema_.has_value(); }

    const std::vector<Job>& jobs() const { return jobs_; }
    const SymbolTable& symbols() const { return symbols_; }

    Session& session() { return session_; }
    const Session& session() const { return session_; }
    bool has_errors() const { return session_.has_errors(); }

   private:
    friend class Schema;

    Session session_{};
    Loader loader_;
    SymbolTable symbols_{};
    std::vector<Job> jobs_{};
    std::optional<Schema> schema_{};
    bool load_failed_ = false;
    bool failed_ = false;

    bool check_mutable(std::string_view what);
};

}  // namespace protodesc
