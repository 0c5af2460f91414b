#pragma once

#include "descriptor.hpp"
#include "diag.hpp"

#include <string>
#include <utility>
#include <vector>

namespace protodesc {

struct ParseState {
  FileId file = 0;
  DescriptorArena arena{};
  ProtoFile* root = nullptr;
  std::vector<Diagnostic> diags{};

  bool has_errors() const;
};

extern ParseState* g_parse_state;

std::string take_str(char* s);  // takes ownership and frees
std::string take_string(std::string* s);  // takes ownership and deletes
void push_error(Span span, std::string message, DiagCode code = DiagCode::Syntax);

template <typename T>
std::vector<T> take_vec(std::vector<T>* v) {  // takes ownership and deletes
  if (!v) return {};
  std::vector<T> out = std::move(*v);
  delete v;
  return out;
}

template <typename T, typename... Args>
T* mk(Span span, Args&&... args) {
  if (!g_parse_state) return nullptr;
  return g_parse_state->arena.make<T>(std::move(span), std::forward<Args>(args)...);
}

}  // namespace protodesc
