#include "session.hpp"

#include <utility>

#include "parse.hpp"

namespace protodesc {

std::filesystem::path normalize_path(std::filesystem::path path) {
  std::error_code ec{};
  std::filesystem::path abs = std::filesystem::absolute(path, ec);
  if (ec) abs = std::move(path);
  return abs.lexically_normal();
}

FileId Session::add_file(std::filesystem::path path) {
  std::filesystem::path normalized = normalize_path(std::move(path));
  return sources.add_file(normalized.string());
}

ParseState* Session::parse(FileId file) {
  if (file >= parsed_.size()) parsed_.resize(static_cast<size_t>(file) + 1);
  if (parsed_[file]) return parsed_[file].get();

  auto state = std::make_unique<ParseState>(
      parse_source(file, sources.path(file), sources.text(file)));
  for (auto& d : state->diags) diags.push_back(std::move(d));
  state->diags.clear();
  parsed_[file] = std::move(state);
  return parsed_[file].get();
}

ParseState* Session::parsed(FileId file) const {
  if (file >= parsed_.size()) return nullptr;
  return parsed_[file].get();
}

void Session::error(DiagCode code, Span span, std::string message) {
  diags.push_back(Diagnostic{.severity = Severity::Error,
                             .code = code,
                             .span = span,
                             .message = std::move(message)});
}

bool Session::has_errors() const { return error_count() > 0; }

std::size_t Session::error_count() const {
  std::size_t n = 0;
  for (const auto& d : diags) {
    if (d.severity == Severity::Error) n++;
  }
  return n;
}

}  // namespace protodesc
