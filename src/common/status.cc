#include "common/status.h"

#include <cerrno>
#include <cstring>

namespace dfsio {

const char* to_string(StatusCode code) {
    switch (code) {
    case StatusCode::kOk:                   return "OK";
    case StatusCode::kSessionError:         return "SessionError";
    case StatusCode::kSessionClosed:        return "SessionClosed";
    case StatusCode::kSessionBusy:          return "SessionBusy";
    case StatusCode::kStreamClosed:         return "StreamClosed";
    case StatusCode::kUnsupportedMode:      return "UnsupportedMode";
    case StatusCode::kUnsupportedOperation: return "UnsupportedOperation";
    case StatusCode::kNotFound:             return "NotFound";
    case StatusCode::kPermissionDenied:     return "PermissionDenied";
    case StatusCode::kAlreadyExists:        return "AlreadyExists";
    case StatusCode::kIsADirectory:         return "IsADirectory";
    case StatusCode::kNotADirectory:        return "NotADirectory";
    case StatusCode::kPathOther:            return "PathError";
    case StatusCode::kInvalidSeek:          return "InvalidSeek";
    case StatusCode::kShortWrite:           return "ShortWrite";
    case StatusCode::kInvalidArgument:      return "InvalidArgument";
    case StatusCode::kInvalidData:          return "InvalidData";
    }
    return "Unknown";
}

std::string Status::to_string() const {
    if (ok()) return "OK";
    std::string s = dfsio::to_string(code_);
    s += ": ";
    s += msg_;
    if (native_errno_ != 0) {
        s += " (errno=" + std::to_string(native_errno_) + ")";
    }
    return s;
}

Status status_from_native(long rc, const std::string& context) {
    if (rc >= 0) return Status::OK();

    int err = static_cast<int>(-rc);
    std::string msg = context + ": " + std::strerror(err);

    StatusCode code;
    switch (err) {
    case ENOENT:
        code = StatusCode::kNotFound;
        break;
    case EACCES:
    case EPERM:
    case EROFS:
        code = StatusCode::kPermissionDenied;
        break;
    case EEXIST:
        code = StatusCode::kAlreadyExists;
        break;
    case EISDIR:
        code = StatusCode::kIsADirectory;
        break;
    case ENOTDIR:
        code = StatusCode::kNotADirectory;
        break;
    default:
        code = StatusCode::kPathOther;
        break;
    }
    return Status::Error(code, msg, err);
}

} // namespace dfsio
