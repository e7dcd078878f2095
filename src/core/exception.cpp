#include "posecheck/core/exception.h"

namespace posecheck {
namespace core {

// "Unknown joint 'Tail' in frame 3 [ERROR_INVALID_PARAMETER] at SnapshotReader.cpp:52"
std::string Exception::formatMessage(ResultCode code,
                                     const std::string& message,
                                     const std::string& context) {
    std::string text = message + " [" + resultCodeToString(code) + "]";
    if (!context.empty()) {
        const std::string::size_type slash = context.find_last_of('/');
        text += " at " + (slash == std::string::npos ? context : context.substr(slash + 1));
    }
    return text;
}

std::string resultCodeToString(ResultCode code) {
    switch (code) {
        case ResultCode::SUCCESS:                 return "SUCCESS";
        case ResultCode::ERROR_GENERIC:           return "ERROR_GENERIC";
        case ResultCode::ERROR_INVALID_PARAMETER: return "ERROR_INVALID_PARAMETER";
        case ResultCode::ERROR_NOT_INITIALIZED:   return "ERROR_NOT_INITIALIZED";
        case ResultCode::ERROR_FILE_NOT_FOUND:    return "ERROR_FILE_NOT_FOUND";
        case ResultCode::ERROR_FILE_IO:           return "ERROR_FILE_IO";
        case ResultCode::ERROR_CONFIGURATION:     return "ERROR_CONFIGURATION";
    }
    return "UNKNOWN_ERROR";
}

} // namespace core
} // namespace posecheck
