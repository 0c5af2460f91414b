#include "extend.hpp"

#include <string>
#include <unordered_map>

#include "names.hpp"

namespace protodesc {
namespace {

using MessageIndex = std::unordered_map<std::string, Message*>;

void index_messages(MessageIndex& index, const std::vector<Message*>& messages,
                    const std::string& scope) {
    for (Message* m : messages) {
        std::string name = join_scope(scope, m->name);
        index_messages(index, m->messages, name);
        index.insert({std::move(name), m});
    }
}

void collect_nested(std::vector<Extend*>& out, const std::vector<Message*>& messages) {
    for (const Message* m : messages) {
        for (Extend* e : m->extends) out.push_back(e);
        collect_nested(out, m->messages);
    }
}

std::string target_name(const Extend& e) {
    if (!e.target.empty() && e.target.front() == '.') return e.target.substr(1);
    return join_scope(e.package, e.target);
}

}  // namespace

std::size_t merge_extensions(const std::vector<ProtoFile*>& files) {
    MessageIndex index{};
    for (const ProtoFile* f : files) index_messages(index, f->messages, f->package);

    std::vector<Extend*> extends{};
    for (const ProtoFile* f : files) {
        for (Extend* e : f->extends) extends.push_back(e);
    }
    for (const ProtoFile* f : files) collect_nested(extends, f->messages);

    std::size_t merged = 0;
    for (Extend* e : extends) {
        if (e->merged) continue;
        auto it = index.find(target_name(*e));
        if (it == index.end()) continue;
        for (Field* f : e->fields) it->second->add_field(f);
        e->merged = true;
        merged++;
    }
    return merged;
}

}  // namespace protodesc
