#include "sigvad/errors.hpp"

namespace sigvad {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidInput:         return "InvalidInput";
        case ErrorKind::InvalidConfiguration: return "InvalidConfiguration";
        case ErrorKind::StreamClosed:         return "StreamClosed";
    }
    return "Unknown";
}

} // namespace sigvad
