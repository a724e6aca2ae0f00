#include "capsync/errors.hpp"

namespace capsync {

const char* to_string(error_code code) {
    switch (code) {
        case error_code::download_failed: return "DOWNLOAD_FAILED";
        case error_code::corrupt_image: return "CORRUPT_IMAGE";
        case error_code::lock_denied: return "LOCK_DENIED";
        case error_code::permission_denied: return "PERMISSION_DENIED";
        case error_code::sync_failed: return "SYNC_FAILED";
        case error_code::query_failed: return "QUERY_FAILED";
        case error_code::apply_changes_failed: return "APPLY_CHANGES_FAILED";
    }
    return "UNKNOWN";
}

std::string describe(const std::exception_ptr& error) {
    if (!error) return "";
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

} // namespace capsync
