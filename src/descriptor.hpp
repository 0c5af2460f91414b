#pragma once

#include "span.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace protodesc {

enum class NodeKind : std::uint8_t {
  File,
  Message,
  Enum,
  Field,
  Service,
  Method,
  Extend,
};

struct Node {
  NodeKind kind{};
  Span span{};

  Node(NodeKind kind, Span span) : kind(kind), span(span) {}
  virtual ~Node() = default;
};

class DescriptorArena {
 public:
  template <typename T, typename... Args>
  T* make(Args&&... args) {
    auto node = std::make_unique<T>(std::forward<Args>(args)...);
    T* raw = node.get();
    nodes_.push_back(std::move(node));
    return raw;
  }

  std::size_t size() const { return nodes_.size(); }

 private:
  std::vector<std::unique_ptr<Node>> nodes_{};
};

// ---- Options ----

enum class OptionValueKind : std::uint8_t { Identifier, String, Int, Float, Bool };

struct OptionValue {
  OptionValueKind kind = OptionValueKind::Identifier;
  std::string text{};  // identifier or decoded string; source spelling otherwise
  std::int64_t int_value = 0;
  double float_value = 0.0;
  bool bool_value = false;
};

struct Option {
  std::string name{};
  OptionValue value{};
  Span span{};
};

using OptionList = std::vector<Option>;

const OptionValue* find_option(const OptionList& options, std::string_view name);

// ---- Types ----

enum class ScalarType : std::uint8_t {
  Double,
  Float,
  Int32,
  Int64,
  UInt32,
  UInt64,
  SInt32,
  SInt64,
  Fixed32,
  Fixed64,
  SFixed32,
  SFixed64,
  Bool,
  String,
  Bytes,
};

std::optional<ScalarType> parse_scalar_type(std::string_view name);
std::string_view scalar_type_name(ScalarType type);

struct Message;

// Common part of messages and enums: everything a field or method can name.
struct TypeDecl : Node {
  std::string name{};
  // Set while indexing: the declaring file's package, the enclosing scope
  // (package plus enclosing message names) and `scope.name`.
  std::string package{};
  std::string scope{};
  std::string full_name{};
  const Message* parent = nullptr;

  explicit TypeDecl(NodeKind kind, Span span, std::string name)
      : Node(kind, span), name(std::move(name)) {}
};

enum class TypeRefState : std::uint8_t { Unresolved, Scalar, Decl };

// The type of a field or method argument. Starts out as the raw text from the
// source; the parser settles scalars and the type resolver binds the rest.
class TypeRef {
 public:
  TypeRef() = default;
  explicit TypeRef(std::string raw);

  static TypeRef scalar(ScalarType type);

  const std::string& raw() const { return raw_; }
  TypeRefState state() const;

  bool is_native() const { return state() == TypeRefState::Scalar; }
  bool is_resolved() const { return state() != TypeRefState::Unresolved; }

  std::optional<ScalarType> scalar_type() const;
  const TypeDecl* decl() const;

  void bind(const TypeDecl* decl);

 private:
  std::string raw_{};
  std::variant<std::monostate, ScalarType, const TypeDecl*> state_{};
};

// ---- Decls ----

enum class Cardinality : std::uint8_t { Singular, Optional, Required, Repeated };

struct Field final : Node {
  Cardinality cardinality = Cardinality::Singular;
  TypeRef type{};
  std::string name{};
  std::int32_t number = 0;
  OptionList options{};
  std::string oneof{};  // empty when the field is not part of a oneof
  bool synthetic = false;

  explicit Field(Span span, Cardinality cardinality, TypeRef type, std::string name,
                 std::int32_t number, OptionList options = {})
      : Node(NodeKind::Field, span),
        cardinality(cardinality),
        type(std::move(type)),
        name(std::move(name)),
        number(number),
        options(std::move(options)) {}
};

struct EnumValue {
  std::string name{};
  std::int32_t number = 0;
  OptionList options{};
  Span span{};
};

struct Enum final : TypeDecl {
  std::vector<EnumValue> values{};
  OptionList options{};
  std::vector<std::string> reserved_names{};

  explicit Enum(Span span, std::string name = {})
      : TypeDecl(NodeKind::Enum, span, std::move(name)) {}

  bool allow_alias() const;
  const EnumValue* find_value(std::string_view name) const;
};

// Inclusive on both ends; `max` is stored as kMaxFieldNumber. Kept trivial so
// the grammar can carry it in its semantic value union.
struct NumberRange {
  std::int32_t start;
  std::int32_t end;
};

inline constexpr std::int32_t kMaxFieldNumber = 536870911;

struct Extend;

struct Message final : TypeDecl {
  std::vector<Field*> fields{};
  std::vector<Message*> messages{};
  std::vector<Enum*> enums{};
  std::vector<Extend*> extends{};
  std::vector<NumberRange> extension_ranges{};
  std::vector<NumberRange> reserved_ranges{};
  std::vector<std::string> reserved_names{};
  OptionList options{};

  explicit Message(Span span, std::string name = {})
      : TypeDecl(NodeKind::Message, span, std::move(name)) {}

  Field* find_field(std::string_view name) const;
  Message* find_message(std::string_view name) const;
  Enum* find_enum(std::string_view name) const;
  // A message or enum declared directly inside this message.
  const TypeDecl* find_nested_type(std::string_view name) const;

  void add_field(Field* field);
  // Removes the first field called `name`. Returns false when there is none.
  bool remove_field(std::string_view name);
};

struct Method final : Node {
  std::string name{};
  TypeRef input{};
  TypeRef output{};
  bool client_streaming = false;
  bool server_streaming = false;
  OptionList options{};

  explicit Method(Span span, std::string name, TypeRef input, TypeRef output)
      : Node(NodeKind::Method, span),
        name(std::move(name)),
        input(std::move(input)),
        output(std::move(output)) {}
};

struct Service final : Node {
  std::string name{};
  std::string package{};
  std::string full_name{};
  std::vector<Method*> methods{};
  OptionList options{};

  explicit Service(Span span, std::string name = {})
      : Node(NodeKind::Service, span), name(std::move(name)) {}

  Method* find_method(std::string_view name) const;
};

struct Extend final : Node {
  std::string target{};   // as written; may be partially qualified
  std::string package{};  // declaring file's package, set while indexing
  const Message* scope = nullptr;  // enclosing message for nested `extend`
  std::vector<Field*> fields{};
  bool merged = false;

  explicit Extend(Span span, std::string target = {})
      : Node(NodeKind::Extend, span), target(std::move(target)) {}
};

enum class ImportKind : std::uint8_t { Default, Public, Weak };

struct ProtoFile;

struct Import {
  std::string name{};
  ImportKind kind = ImportKind::Default;
  Span span{};
  ProtoFile* file = nullptr;  // set by the loader; shared, not owned
};

struct ProtoFile final : Node {
  std::string path{};
  std::string syntax = "proto2";
  std::string package{};
  std::vector<Import> imports{};
  std::vector<Message*> messages{};
  std::vector<Enum*> enums{};
  std::vector<Service*> services{};
  std::vector<Extend*> extends{};
  OptionList options{};

  explicit ProtoFile(Span span, std::string path)
      : Node(NodeKind::File, span), path(std::move(path)) {}

  // File name without directories, e.g. `person.proto`.
  std::string name() const;

  Message* find_message(std::string_view name) const;
  Enum* find_enum(std::string_view name) const;
  Service* find_service(std::string_view name) const;
  const OptionValue* option(std::string_view name) const;

  // Walks the declarations of this file looking for `full_name`. Does not
  // depend on indexing having run.
  const TypeDecl* find_type(std::string_view full_name) const;
};

std::string_view node_kind_name(NodeKind kind);
std::string_view cardinality_name(Cardinality cardinality);
void dump_descriptors(std::ostream& os, const Node* node, int indent = 0);

}  // namespace protodesc
