#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <llvm/Support/JSON.h>
#include <llvm/Support/raw_ostream.h>

#include "descriptor.hpp"
#include "project.hpp"

namespace protodesc {

// Builds the plain JSON view of resolved descriptors that a renderer
// consumes. Referenced messages and enums are inlined; a message that is
// already being rendered further up is replaced by a stub carrying
// `isRecursive: true`. At most `max_inline_depth` referenced messages are
// inlined inside one another; deeper references become `{name, fullName,
// package, isMessage}` stubs.
class TemplateBuilder {
   public:
    static constexpr int kDefaultInlineDepth = 2;

    explicit TemplateBuilder(const Schema& schema, int max_inline_depth = kDefaultInlineDepth)
        : schema_(schema), max_inline_depth_(max_inline_depth) {}

    llvm::json::Value file(const ProtoFile& f);
    // Null when `name` is not loaded.
    llvm::json::Value file(std::string_view name);
    llvm::json::Value message(const Message& m);
    llvm::json::Value enumeration(const Enum& e);
    llvm::json::Value field(const Field& f);
    llvm::json::Value service(const Service& s);
    llvm::json::Value method(const Method& m);

    // Every loaded file, in discovery order.
    llvm::json::Value files();

   private:
    const Schema& schema_;
    int max_inline_depth_;
    int inline_depth_ = 0;
    std::vector<const Message*> stack_{};

    bool on_stack(const Message* m) const;
    // Renders the type a field or method refers to.
    llvm::json::Value decl(const TypeDecl& d);
};

llvm::json::Value option_value(const OptionValue& v);
// Repeated option names collect their values into an array.
llvm::json::Object options_object(const OptionList& options);

void print_json(llvm::raw_ostream& os, const llvm::json::Value& value, bool pretty = true);
std::string to_json(const llvm::json::Value& value, bool pretty = true);

}  // namespace protodesc
