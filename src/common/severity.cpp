#include "common/severity.hpp"

const char* SeverityName(Severity severity) {
  switch (severity) {
    case Severity::Verbose: return "Verbose";
    case Severity::Debug: return "Debug";
    case Severity::Info: return "Info";
    case Severity::Warn: return "Warn";
    case Severity::Error: return "Error";
  }
  return "Unknown";
}
