#pragma once

#include <string>
#include <system_error>
#include <utility>

namespace unitsync {

/**
 * @brief Category of a failure, used to tell skip-and-continue cases from aborts
 */
enum class ErrorKind {
    Listing,          ///< Source directory could not be listed (aborts a pass)
    Read,             ///< Unit file could not be read or fingerprinted
    Copy,             ///< Destination record could not be written
    Remove,           ///< Destination record could not be removed
    ControlInterface, ///< Service manager call failed or timed out
    Config,           ///< Bad command line or configuration file
    Fatal             ///< Notification source failure, ends the process
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Listing: return "listing";
        case ErrorKind::Read: return "read";
        case ErrorKind::Copy: return "copy";
        case ErrorKind::Remove: return "remove";
        case ErrorKind::ControlInterface: return "control";
        case ErrorKind::Config: return "config";
        case ErrorKind::Fatal: return "fatal";
    }
    return "unknown";
}

struct Error {
    ErrorKind kind = ErrorKind::Fatal;
    std::string unit;      ///< Offending unit name, empty when not unit specific
    std::string message;
    std::error_code cause; ///< Underlying OS error, if any

    Error() = default;

    Error(ErrorKind k, std::string u, std::string msg, std::error_code ec = {})
        : kind(k), unit(std::move(u)), message(std::move(msg)), cause(ec) {}

    bool is_not_found() const noexcept {
        return cause == std::errc::no_such_file_or_directory;
    }

    std::string to_string() const {
        std::string text = unitsync::to_string(kind);
        text += " error";
        if (!unit.empty()) {
            text += " for unit '" + unit + "'";
        }
        text += ": " + message;
        if (cause) {
            text += " (" + cause.message() + ")";
        }
        return text;
    }
};

} // namespace unitsync
