#include "util/result.hpp"

namespace extupd {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:              return "none";
        case ErrorKind::IOFailure:         return "io";
        case ErrorKind::TransportFailure:  return "transport";
        case ErrorKind::Cancelled:         return "cancelled";
        case ErrorKind::ValidationFailure: return "validation";
    }
    return "unknown";
}

} // namespace extupd
