#include "store/graph_store.hpp"

namespace netmap {

std::string store_error_code_to_string(StoreErrorCode code) {
    switch (code) {
        case StoreErrorCode::OK: return "ok";
        case StoreErrorCode::NotFound: return "not_found";
        case StoreErrorCode::ConstraintViolation: return "constraint_violation";
        case StoreErrorCode::Busy: return "busy";
        case StoreErrorCode::IOError: return "io_error";
        case StoreErrorCode::Unavailable: return "unavailable";
        case StoreErrorCode::InternalError: return "internal_error";
        default: return "unknown";
    }
}

} // namespace netmap
