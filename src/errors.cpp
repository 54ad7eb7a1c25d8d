#include "errors.h"

namespace neurax {

std::string error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CONNECTION: return "ConnectionError";
        case ErrorKind::CONNECTION_TIMEOUT: return "ConnectionTimeoutError";
        case ErrorKind::KEY_EXCHANGE: return "KeyExchangeError";
        case ErrorKind::INTEGRITY: return "IntegrityError";
        case ErrorKind::DECODE: return "DecodeError";
        case ErrorKind::NOT_READY: return "NotReadyError";
        case ErrorKind::PROTOCOL: return "ProtocolError";
        case ErrorKind::SANDBOX_UNAVAILABLE: return "SandboxUnavailableError";
        case ErrorKind::EXECUTION_TIMEOUT: return "ExecutionTimeoutError";
    }
    return "Error";
}

} // namespace neurax
