#include "twinpane/SftpTypes.hpp"

namespace twinpane {

const char *errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::Transport:
        return "Transport";
    case ErrorKind::Remote:
        return "Remote";
    case ErrorKind::LocalIO:
        return "LocalIO";
    case ErrorKind::Cancelled:
        return "Cancelled";
    case ErrorKind::Internal:
        return "Internal";
    }
    return "Unknown";
}

} // namespace twinpane
