#pragma once

#include "source.hpp"
#include "span.hpp"

#include <string>

namespace protodesc {

enum class Severity : std::uint8_t { Error, Warning, Note };

enum class DiagCode : std::uint8_t {
  Syntax,
  UnresolvedImport,
  UnresolvedType,
  DuplicateDefinition,
  Io,
  State,
};

struct Diagnostic {
  Severity severity = Severity::Error;
  DiagCode code = DiagCode::Syntax;
  Span span{};
  std::string message{};
};

const char* diag_code_name(DiagCode code);
std::string format_diagnostic(const SourceManager& sm, const Diagnostic& d);

}  // namespace protodesc
