#include "diag.hpp"

#include <sstream>

namespace protodesc {

static const char* severity_name(Severity s) {
  switch (s) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Note:
      return "note";
  }
  return "error";
}

const char* diag_code_name(DiagCode code) {
  switch (code) {
    case DiagCode::Syntax:
      return "syntax";
    case DiagCode::UnresolvedImport:
      return "unresolved-import";
    case DiagCode::UnresolvedType:
      return "unresolved-type";
    case DiagCode::DuplicateDefinition:
      return "duplicate-definition";
    case DiagCode::Io:
      return "io";
    case DiagCode::State:
      return "state";
  }
  return "unknown";
}

std::string format_diagnostic(const SourceManager& sm, const Diagnostic& d) {
  std::ostringstream out;
  if (d.span.has_file() && d.span.file < sm.size()) {
    out << sm.path(d.span.file) << ":" << d.span.begin.line << ":" << d.span.begin.column
        << ": ";
  }
  out << severity_name(d.severity) << ": " << d.message << " [" << diag_code_name(d.code)
      << "]";
  return out.str();
}

}  // namespace protodesc
