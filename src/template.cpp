#include "template.hpp"

#include <algorithm>

#include <llvm/Support/FormatVariadic.h>

#include "names.hpp"

namespace protodesc {

llvm::json::Value option_value(const OptionValue& v) {
    switch (v.kind) {
        case OptionValueKind::Int:
            return v.int_value;
        case OptionValueKind::Float:
            return v.float_value;
        case OptionValueKind::Bool:
            return v.bool_value;
        case OptionValueKind::Identifier:
        case OptionValueKind::String:
            return v.text;
    }
    return v.text;
}

llvm::json::Object options_object(const OptionList& options) {
    llvm::json::Object out{};
    for (const Option& o : options) {
        llvm::json::Value* seen = out.get(o.name);
        if (!seen) {
            out[o.name] = option_value(o.value);
        } else if (llvm::json::Array* values = seen->getAsArray()) {
            values->push_back(option_value(o.value));
        } else {
            *seen = llvm::json::Array{std::move(*seen), option_value(o.value)};
        }
    }
    return out;
}

static llvm::json::Array ranges_array(const std::vector<NumberRange>& ranges) {
    llvm::json::Array out{};
    for (const NumberRange& r : ranges)
        out.push_back(llvm::json::Object{{"start", r.start}, {"end", r.end}});
    return out;
}

static llvm::json::Array names_array(const std::vector<std::string>& names) {
    llvm::json::Array out{};
    for (const std::string& n : names) out.push_back(n);
    return out;
}

bool TemplateBuilder::on_stack(const Message* m) const {
    return std::find(stack_.begin(), stack_.end(), m) != stack_.end();
}

llvm::json::Value TemplateBuilder::file(const ProtoFile& f) {
    llvm::json::Array imports{};
    for (const Import& i : f.imports) {
        llvm::json::Object o{{"name", i.name},
                             {"isPublic", i.kind == ImportKind::Public},
                             {"isWeak", i.kind == ImportKind::Weak}};
        if (i.file) {
            o["fileName"] = i.file->name();
            o["filePath"] = i.file->path;
            o["package"] = i.file->package;
        }
        imports.push_back(std::move(o));
    }

    llvm::json::Array messages{};
    for (const Message* m : f.messages) messages.push_back(message(*m));
    llvm::json::Array enums{};
    for (const Enum* e : f.enums) enums.push_back(enumeration(*e));
    llvm::json::Array services{};
    for (const Service* s : f.services) services.push_back(service(*s));

    return llvm::json::Object{{"name", f.name()},
                              {"filePath", f.path},
                              {"package", f.package},
                              {"syntax", f.syntax},
                              {"imports", std::move(imports)},
                              {"messages", std::move(messages)},
                              {"enums", std::move(enums)},
                              {"services", std::move(services)},
                              {"options", options_object(f.options)}};
}

llvm::json::Value TemplateBuilder::file(std::string_view name) {
    if (const ProtoFile* f = schema_.proto(name)) return file(*f);
    return nullptr;
}

llvm::json::Value TemplateBuilder::files() {
    llvm::json::Array out{};
    for (const ProtoFile* f : schema_.files()) out.push_back(file(*f));
    return llvm::json::Value(std::move(out));
}

llvm::json::Value TemplateBuilder::message(const Message& m) {
    if (on_stack(&m)) {
        return llvm::json::Object{{"name", m.name},
                                  {"fullName", m.full_name},
                                  {"package", m.package},
                                  {"isMessage", true},
                                  {"isRecursive", true}};
    }

    stack_.push_back(&m);
    llvm::json::Array fields{};
    for (const Field* f : m.fields) fields.push_back(field(*f));
    llvm::json::Array messages{};
    for (const Message* nested : m.messages) messages.push_back(message(*nested));
    llvm::json::Array enums{};
    for (const Enum* e : m.enums) enums.push_back(enumeration(*e));
    stack_.pop_back();

    return llvm::json::Object{{"name", m.name},
                              {"fullName", m.full_name},
                              {"package", m.package},
                              {"isMessage", true},
                              {"fields", std::move(fields)},
                              {"messages", std::move(messages)},
                              {"enums", std::move(enums)},
                              {"options", options_object(m.options)},
                              {"extensionRanges", ranges_array(m.extension_ranges)},
                              {"reservedNames", names_array(m.reserved_names)}};
}

llvm::json::Value TemplateBuilder::enumeration(const Enum& e) {
    llvm::json::Array values{};
    for (const EnumValue& v : e.values) {
        values.push_back(llvm::json::Object{
            {"name", v.name}, {"titleName", constant_title_case(v.name)}, {"number", v.number}});
    }
    return llvm::json::Object{{"name", e.name},
                              {"values", std::move(values)},
                              {"isEnum", true},
                              {"fullName", e.full_name}};
}

llvm::json::Value TemplateBuilder::decl(const TypeDecl& d) {
    if (d.kind == NodeKind::Enum) return enumeration(static_cast<const Enum&>(d));
    const auto& m = static_cast<const Message&>(d);
    if (on_stack(&m) || inline_depth_ < max_inline_depth_) {
        inline_depth_++;
        llvm::json::Value out = message(m);
        inline_depth_--;
        return out;
    }
    return llvm::json::Object{{"name", m.name},
                              {"fullName", m.full_name},
                              {"package", m.package},
                              {"isMessage", true}};
}

llvm::json::Value TemplateBuilder::field(const Field& f) {
    llvm::json::Object out{{"name", f.name},
                           {"camelName", camel_case(f.name)},
                           {"titleName", pascal_case(f.name)},
                           {"upperUnderscoreName", upper_snake_case(f.name)},
                           {"number", f.number},
                           {"type", f.type.raw()},
                           {"isNative", f.type.is_native()},
                           {"isRepeated", f.cardinality == Cardinality::Repeated},
                           {"isOptional", f.cardinality == Cardinality::Optional},
                           {"isRequired", f.cardinality == Cardinality::Required},
                           {"isSynthetic", f.synthetic},
                           {"options", options_object(f.options)}};
    if (!f.oneof.empty()) out["oneof"] = f.oneof;
    if (const OptionValue* v = find_option(f.options, "default"))
        out["defaultValue"] = option_value(*v);
    if (const TypeDecl* d = f.type.decl()) out["typeDescriptor"] = decl(*d);
    return llvm::json::Value(std::move(out));
}

llvm::json::Value TemplateBuilder::service(const Service& s) {
    llvm::json::Array methods{};
    for (const Method* m : s.methods) methods.push_back(method(*m));
    return llvm::json::Object{{"name", s.name},
                              {"fullName", s.full_name},
                              {"package", s.package},
                              {"methods", std::move(methods)},
                              {"options", options_object(s.options)}};
}

llvm::json::Value TemplateBuilder::method(const Method& m) {
    llvm::json::Object out{{"name", m.name},
                           {"camelName", camel_case(m.name)},
                           {"upperUnderscoreName", upper_snake_case(m.name)},
                           {"inputType", m.input.raw()},
                           {"outputType", m.output.raw()},
                           {"clientStreaming", m.client_streaming},
                           {"serverStreaming", m.server_streaming},
                           {"options", options_object(m.options)}};
    if (const TypeDecl* d = m.input.decl()) out["inputTypeDescriptor"] = decl(*d);
    if (const TypeDecl* d = m.output.decl()) out["outputTypeDescriptor"] = decl(*d);
    return llvm::json::Value(std::move(out));
}

void print_json(llvm::raw_ostream& os, const llvm::json::Value& value, bool pretty) {
    if (pretty)
        os << llvm::formatv("{0:2}", value);
    else
        os << value;
}

std::string to_json(const llvm::json::Value& value, bool pretty) {
    std::string out{};
    llvm::raw_string_ostream os(out);
    print_json(os, value, pretty);
    os.flush();
    return out;
}

}  // namespace protodesc
