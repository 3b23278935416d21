// Implementation of enum-to-string conversions and error helpers.

#include "core/basic_types.h"

namespace stylec {

const char* errorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:                 return "None";
    case ErrorKind::UnknownDuration:      return "UnknownDuration";
    case ErrorKind::UnknownPitch:         return "UnknownPitch";
    case ErrorKind::UnresolvedInstrument: return "UnresolvedInstrument";
    case ErrorKind::MalformedDescriptor:  return "MalformedDescriptor";
    case ErrorKind::ChannelsExhausted:    return "ChannelsExhausted";
    case ErrorKind::IoError:              return "IoError";
    case ErrorKind::InvalidConfig:        return "InvalidConfig";
    case ErrorKind::TimelineTooLong:      return "TimelineTooLong";
  }
  return "Unknown";
}

bool fail(CompileError& error, ErrorKind kind, const std::string& message) {
  error.kind = kind;
  error.message = message;
  return false;
}

}  // namespace stylec
