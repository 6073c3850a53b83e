#ifndef ERRORCODE_HPP
#define ERRORCODE_HPP

#include <string>
#include <utility>

namespace ErrorCodes {

// Error code ranges:
//   Input (1000-1099), Configuration (1200-1299)
enum class Code {
    ROOT_NOT_FOUND = 1000,
    ROOT_NOT_DIRECTORY = 1001,
    ROOT_UNREADABLE = 1002,

    CONFIG_INVALID = 1200,

    UNKNOWN_ERROR = 9999
};

struct ErrorInfo {
    Code code{Code::UNKNOWN_ERROR};
    std::string message;
    std::string resolution;
    std::string context;

    ErrorInfo() = default;
    ErrorInfo(Code code, std::string message, std::string resolution, std::string context = "")
        : code(code),
          message(std::move(message)),
          resolution(std::move(resolution)),
          context(std::move(context)) {}

    std::string get_user_message() const {
        if (resolution.empty()) {
            return message;
        }
        return message + "\n" + resolution;
    }

    std::string get_full_details() const {
        std::string details = "Error " + std::to_string(static_cast<int>(code)) + ": " + message;
        if (!context.empty()) {
            details += "\nDetails: " + context;
        }
        if (!resolution.empty()) {
            details += "\nResolution: " + resolution;
        }
        return details;
    }
};

class ErrorCatalog {
public:
    static ErrorInfo get_error_info(Code code, const std::string& context = "") {
        switch (code) {
            case Code::ROOT_NOT_FOUND:
                return {code, "The folder to organize does not exist.",
                        "Check the --root argument or the SortFolder setting.", context};
            case Code::ROOT_NOT_DIRECTORY:
                return {code, "The path to organize is not a folder.",
                        "Point --root at a directory.", context};
            case Code::ROOT_UNREADABLE:
                return {code, "The folder to organize could not be read.",
                        "Check the folder permissions.", context};
            case Code::CONFIG_INVALID:
                return {code, "The configuration file contains an invalid value.",
                        "Fix or remove the offending entry in config.ini.", context};
            case Code::UNKNOWN_ERROR:
            default:
                return {Code::UNKNOWN_ERROR, "An unexpected error occurred.", "", context};
        }
    }
};

} // namespace ErrorCodes

#endif // ERRORCODE_HPP
