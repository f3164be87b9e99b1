#include "Errors.hpp"

namespace ClipRelay {

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:      return "None";
        case ErrorKind::NotFound:  return "NotFound";
        case ErrorKind::Timeout:   return "Timeout";
        case ErrorKind::Rejected:  return "Rejected";
        case ErrorKind::Transient: return "Transient";
        case ErrorKind::Fatal:     return "Fatal";
    }
    return "Unknown";
}

}
