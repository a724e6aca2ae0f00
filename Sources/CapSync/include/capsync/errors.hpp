#pragma once

#include <stdexcept>
#include <string>
#include <exception>

namespace capsync {

enum class error_code : int {
    download_failed,
    corrupt_image,
    lock_denied,
    permission_denied,
    sync_failed,
    query_failed,
    apply_changes_failed
};

const char* to_string(error_code code);

/// Base of every error the library reports.
class database_error : public std::runtime_error {
public:
    database_error(error_code code, const std::string& msg, bool recoverable)
        : std::runtime_error(msg), code_(code), recoverable_(recoverable) {}

    error_code code() const noexcept { return code_; }

    /// True when retrying (or waiting) can succeed without user action.
    bool recoverable() const noexcept { return recoverable_; }

private:
    error_code code_;
    bool recoverable_;
};

/// Network/storage failure after retries were exhausted.
class download_error : public database_error {
public:
    explicit download_error(const std::string& cause)
        : database_error(error_code::download_failed, "Download failed: " + cause, true)
        , cause_(cause) {}

    const std::string& cause() const noexcept { return cause_; }

private:
    std::string cause_;
};

class corrupt_image_error : public database_error {
public:
    explicit corrupt_image_error(const std::string& msg)
        : database_error(error_code::corrupt_image, "Corrupt database image: " + msg, false) {}
};

/// Lock acquisition denied or revoked.
class lock_error : public database_error {
public:
    explicit lock_error(const std::string& msg)
        : database_error(error_code::lock_denied, msg, true) {}
};

/// exec attempted without canEdit.
class permission_error : public database_error {
public:
    explicit permission_error(const std::string& msg)
        : database_error(error_code::permission_denied, msg, false) {}
};

class sync_error : public database_error {
public:
    explicit sync_error(const std::string& msg)
        : database_error(error_code::sync_failed, msg, true) {}
};

class query_error : public database_error {
public:
    explicit query_error(const std::string& msg)
        : database_error(error_code::query_failed, msg, false) {}
};

class apply_changes_error : public database_error {
public:
    explicit apply_changes_error(const std::string& msg)
        : database_error(error_code::apply_changes_failed, msg, true) {}
};

/// Message of an exception_ptr, for logging at completion boundaries.
std::string describe(const std::exception_ptr& error);

} // namespace capsync
