#include "descriptor.hpp"

#include <algorithm>

#include "names.hpp"

namespace protodesc {

const OptionValue* find_option(const OptionList& options, std::string_view name) {
  for (const Option& o : options) {
    if (o.name == name) return &o.value;
  }
  return nullptr;
}

std::optional<ScalarType> parse_scalar_type(std::string_view name) {
  if (name == "double") return ScalarType::Double;
  if (name == "float") return ScalarType::Float;
  if (name == "int32") return ScalarType::Int32;
  if (name == "int64") return ScalarType::Int64;
  if (name == "uint32") return ScalarType::UInt32;
  if (name == "uint64") return ScalarType::UInt64;
  if (name == "sint32") return ScalarType::SInt32;
  if (name == "sint64") return ScalarType::SInt64;
  if (name == "fixed32") return ScalarType::Fixed32;
  if (name == "fixed64") return ScalarType::Fixed64;
  if (name == "sfixed32") return ScalarType::SFixed32;
  if (name == "sfixed64") return ScalarType::SFixed64;
  if (name == "bool") return ScalarType::Bool;
  if (name == "string") return ScalarType::String;
  if (name == "bytes") return ScalarType::Bytes;
  return std::nullopt;
}

std::string_view scalar_type_name(ScalarType type) {
  switch (type) {
    case ScalarType::Double:
      return "double";
    case ScalarType::Float:
      return "float";
    case ScalarType::Int32:
      return "int32";
    case ScalarType::Int64:
      return "int64";
    case ScalarType::UInt32:
      return "uint32";
    case ScalarType::UInt64:
      return "uint64";
    case ScalarType::SInt32:
      return "sint32";
    case ScalarType::SInt64:
      return "sint64";
    case ScalarType::Fixed32:
      return "fixed32";
    case ScalarType::Fixed64:
      return "fixed64";
    case ScalarType::SFixed32:
      return "sfixed32";
    case ScalarType::SFixed64:
      return "sfixed64";
    case ScalarType::Bool:
      return "bool";
    case ScalarType::String:
      return "string";
    case ScalarType::Bytes:
      return "bytes";
  }
  return "unknown";
}

// ---- TypeRef ----

TypeRef::TypeRef(std::string raw) : raw_(std::move(raw)) {
  if (auto scalar = parse_scalar_type(raw_)) state_ = *scalar;
}

TypeRef TypeRef::scalar(ScalarType type) {
  TypeRef ref{};
  ref.raw_ = std::string(scalar_type_name(type));
  ref.state_ = type;
  return ref;
}

TypeRefState TypeRef::state() const {
  if (std::holds_alternative<ScalarType>(state_)) return TypeRefState::Scalar;
  if (std::holds_alternative<const TypeDecl*>(state_)) return TypeRefState::Decl;
  return TypeRefState::Unresolved;
}

std::optional<ScalarType> TypeRef::scalar_type() const {
  if (auto* s = std::get_if<ScalarType>(&state_)) return *s;
  return std::nullopt;
}

const TypeDecl* TypeRef::decl() const {
  if (auto* d = std::get_if<const TypeDecl*>(&state_)) return *d;
  return nullptr;
}

void TypeRef::bind(const TypeDecl* decl) {
  if (decl) state_ = decl;
}

// ---- Enum ----

bool Enum::allow_alias() const {
  const OptionValue* v = find_option(options, "allow_alias");
  return v && v->kind == OptionValueKind::Bool && v->bool_value;
}

const EnumValue* Enum::find_value(std::string_view value_name) const {
  for (const EnumValue& v : values) {
    if (v.name == value_name) return &v;
  }
  return nullptr;
}

// ---- Message ----

Field* Message::find_field(std::string_view field_name) const {
  for (Field* f : fields) {
    if (f->name == field_name) return f;
  }
  return nullptr;
}

Message* Message::find_message(std::string_view message_name) const {
  for (Message* m : messages) {
    if (m->name == message_name) return m;
  }
  return nullptr;
}

Enum* Message::find_enum(std::string_view enum_name) const {
  for (Enum* e : enums) {
    if (e->name == enum_name) return e;
  }
  return nullptr;
}

const TypeDecl* Message::find_nested_type(std::string_view type_name) const {
  if (const Message* m = find_message(type_name)) return m;
  if (const Enum* e = find_enum(type_name)) return e;
  return nullptr;
}

void Message::add_field(Field* field) {
  if (field) fields.push_back(field);
}

bool Message::remove_field(std::string_view field_name) {
  auto it = std::find_if(fields.begin(), fields.end(),
                         [&](const Field* f) { return f->name == field_name; });
  if (it == fields.end()) return false;
  fields.erase(it);
  return true;
}

Method* Service::find_method(std::string_view method_name) const {
  for (Method* m : methods) {
    if (m->name == method_name) return m;
  }
  return nullptr;
}

// ---- ProtoFile ----

std::string ProtoFile::name() const {
  size_t slash = path.find_last_of("/\\");
  if (slash == std::string::npos) return path;
  return path.substr(slash + 1);
}

Message* ProtoFile::find_message(std::string_view message_name) const {
  for (Message* m : messages) {
    if (m->name == message_name) return m;
  }
  return nullptr;
}

Enum* ProtoFile::find_enum(std::string_view enum_name) const {
  for (Enum* e : enums) {
    if (e->name == enum_name) return e;
  }
  return nullptr;
}

Service* ProtoFile::find_service(std::string_view service_name) const {
  for (Service* s : services) {
    if (s->name == service_name) return s;
  }
  return nullptr;
}

const OptionValue* ProtoFile::option(std::string_view option_name) const {
  return find_option(options, option_name);
}

static const TypeDecl* find_in_message(const Message* m, const std::string& scope,
                                       std::string_view full_name) {
  std::string name = join_scope(scope, m->name);
  if (name == full_name) return m;
  // Only descend when `full_name` lies inside this message.
  if (full_name.size() <= name.size() || full_name.substr(0, name.size()) != name ||
      full_name[name.size()] != '.')
    return nullptr;
  for (const Enum* e : m->enums) {
    if (join_scope(name, e->name) == full_name) return e;
  }
  for (const Message* nested : m->messages) {
    if (const TypeDecl* d = find_in_message(nested, name, full_name)) return d;
  }
  return nullptr;
}

const TypeDecl* ProtoFile::find_type(std::string_view full_name) const {
  if (!full_name.empty() && full_name.front() == '.') full_name.remove_prefix(1);
  for (const Enum* e : enums) {
    if (join_scope(package, e->name) == full_name) return e;
  }
  for (const Message* m : messages) {
    if (const TypeDecl* d = find_in_message(m, package, full_name)) return d;
  }
  return nullptr;
}

// ---- Debug output ----

std::string_view node_kind_name(NodeKind kind) {
  switch (kind) {
    case NodeKind::File:
      return "File";
    case NodeKind::Message:
      return "Message";
    case NodeKind::Enum:
      return "Enum";
    case NodeKind::Field:
      return "Field";
    case NodeKind::Service:
      return "Service";
    case NodeKind::Method:
      return "Method";
    case NodeKind::Extend:
      return "Extend";
  }
  return "Unknown";
}

std::string_view cardinality_name(Cardinality cardinality) {
  switch (cardinality) {
    case Cardinality::Singular:
      return "singular";
    case Cardinality::Optional:
      return "optional";
    case Cardinality::Required:
      return "required";
    case Cardinality::Repeated:
      return "repeated";
  }
  return "singular";
}

static void indent_to(std::ostream& os, int indent) {
  for (int i = 0; i < indent; i++) os << "  ";
}

static void dump_type_ref(std::ostream& os, const TypeRef& ref) {
  os << ref.raw();
  if (const TypeDecl* d = ref.decl()) os << " -> " << d->full_name;
}

static void dump_options(std::ostream& os, const OptionList& options, int indent) {
  for (const Option& o : options) {
    indent_to(os, indent);
    os << "option " << o.name << " = " << o.value.text << '\n';
  }
}

void dump_descriptors(std::ostream& os, const Node* node, int indent) {
  if (!node) {
    indent_to(os, indent);
    os << "<null>\n";
    return;
  }

  indent_to(os, indent);
  os << node_kind_name(node->kind);
  switch (node->kind) {
    case NodeKind::File: {
      auto* f = static_cast<const ProtoFile*>(node);
      os << " \"" << f->name() << "\" package=" << f->package << '\n';
      for (const Import& i : f->imports) {
        indent_to(os, indent + 1);
        os << "import \"" << i.name << '"' << (i.file ? "" : " (unloaded)") << '\n';
      }
      dump_options(os, f->options, indent + 1);
      for (const Message* m : f->messages) dump_descriptors(os, m, indent + 1);
      for (const Enum* e : f->enums) dump_descriptors(os, e, indent + 1);
      for (const Service* s : f->services) dump_descriptors(os, s, indent + 1);
      for (const Extend* e : f->extends) dump_descriptors(os, e, indent + 1);
      return;
    }
    case NodeKind::Message: {
      auto* m = static_cast<const Message*>(node);
      os << ' ' << (m->full_name.empty() ? m->name : m->full_name) << '\n';
      dump_options(os, m->options, indent + 1);
      for (const Field* f : m->fields) dump_descriptors(os, f, indent + 1);
      for (const Message* nested : m->messages) dump_descriptors(os, nested, indent + 1);
      for (const Enum* e : m->enums) dump_descriptors(os, e, indent + 1);
      for (const Extend* e : m->extends) dump_descriptors(os, e, indent + 1);
      return;
    }
    case NodeKind::Enum: {
      auto* e = static_cast<const Enum*>(node);
      os << ' ' << (e->full_name.empty() ? e->name : e->full_name) << '\n';
      for (const EnumValue& v : e->values) {
        indent_to(os, indent + 1);
        os << v.name << " = " << v.number << '\n';
      }
      return;
    }
    case NodeKind::Field: {
      auto* f = static_cast<const Field*>(node);
      os << ' ' << cardinality_name(f->cardinality) << ' ';
      dump_type_ref(os, f->type);
      os << ' ' << f->name << " = " << f->number;
      if (!f->oneof.empty()) os << " oneof=" << f->oneof;
      os << '\n';
      return;
    }
    case NodeKind::Service: {
      auto* s = static_cast<const Service*>(node);
      os << ' ' << (s->full_name.empty() ? s->name : s->full_name) << '\n';
      for (const Method* m : s->methods) dump_descriptors(os, m, indent + 1);
      return;
    }
    case NodeKind::Method: {
      auto* m = static_cast<const Method*>(node);
      os << ' ' << m->name << " (" << (m->client_streaming ? "stream " : "");
      dump_type_ref(os, m->input);
      os << ") returns (" << (m->server_streaming ? "stream " : "");
      dump_type_ref(os, m->output);
      os << ")\n";
      return;
    }
    case NodeKind::Extend: {
      auto* e = static_cast<const Extend*>(node);
      os << ' ' << e->target << (e->merged ? " (merged)" : "") << '\n';
      for (const Field* f : e->fields) dump_descriptors(os, f, indent + 1);
      return;
    }
  }
  os << '\n';
}

}  // namespace protodesc
