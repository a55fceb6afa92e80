#pragma once

#include <string>

namespace dfsio {

enum class StatusCode {
    kOk = 0,
    kSessionError,          // mount 失败或 runtime 未初始化
    kSessionClosed,
    kSessionBusy,           // 仍有未关闭的 FileHandle
    kStreamClosed,
    kUnsupportedMode,       // 原生客户端不支持的模式组合，如 rb+ / ab+
    kUnsupportedOperation,  // 对只读流写、对只写流读
    kNotFound,
    kPermissionDenied,
    kAlreadyExists,
    kIsADirectory,
    kNotADirectory,
    kPathOther,             // 其余原生错误，errno 保存在 native_errno()
    kInvalidSeek,
    kShortWrite,
    kInvalidArgument,
    kInvalidData,           // 文本解码/编码失败
};

const char* to_string(StatusCode code);

class Status {
public:
    static Status OK() { return Status(); }
    static Status Error(StatusCode code, const std::string& msg,
                        int native_errno = 0) {
        return Status(code, msg, native_errno);
    }

    static Status SessionError(const std::string& msg, int native_errno = 0) {
        return Status(StatusCode::kSessionError, msg, native_errno);
    }
    static Status SessionClosed(const std::string& msg = "session closed") {
        return Status(StatusCode::kSessionClosed, msg, 0);
    }
    static Status StreamClosed(const std::string& msg = "I/O operation on closed stream") {
        return Status(StatusCode::kStreamClosed, msg, 0);
    }
    static Status UnsupportedMode(const std::string& msg) {
        return Status(StatusCode::kUnsupportedMode, msg, 0);
    }
    static Status UnsupportedOperation(const std::string& msg) {
        return Status(StatusCode::kUnsupportedOperation, msg, 0);
    }
    static Status NotFound(const std::string& msg = "Not found") {
        return Status(StatusCode::kNotFound, msg, 0);
    }
    static Status AlreadyExists(const std::string& msg) {
        return Status(StatusCode::kAlreadyExists, msg, 0);
    }
    static Status InvalidSeek(const std::string& msg) {
        return Status(StatusCode::kInvalidSeek, msg, 0);
    }
    static Status ShortWrite(const std::string& msg) {
        return Status(StatusCode::kShortWrite, msg, 0);
    }
    static Status InvalidArgument(const std::string& msg) {
        return Status(StatusCode::kInvalidArgument, msg, 0);
    }
    static Status InvalidData(const std::string& msg) {
        return Status(StatusCode::kInvalidData, msg, 0);
    }

    bool ok() const { return code_ == StatusCode::kOk; }
    StatusCode code() const { return code_; }
    const std::string& message() const { return msg_; }
    // 对应的原生 errno（正数），非原生错误时为 0
    int native_errno() const { return native_errno_; }

    // PathError 家族：由原生错误码映射而来
    bool is_path_error() const {
        return code_ == StatusCode::kNotFound ||
               code_ == StatusCode::kPermissionDenied ||
               code_ == StatusCode::kAlreadyExists ||
               code_ == StatusCode::kIsADirectory ||
               code_ == StatusCode::kNotADirectory ||
               code_ == StatusCode::kPathOther;
    }

    std::string to_string() const;

    bool operator==(const Status& other) const {
        return code_ == other.code_ && msg_ == other.msg_;
    }

    bool operator!=(const Status& other) const {
        return !(*this == other);
    }

private:
    StatusCode code_ {StatusCode::kOk};
    std::string msg_;
    int native_errno_ {0};

    Status() = default;
    Status(StatusCode c, std::string m, int e)
        : code_(c), msg_(std::move(m)), native_errno_(e) {}
};

/**
 * 把原生调用返回的 -errno 映射为 Status。
 * rc >= 0 返回 OK；context 一般是 "open /a/b" 之类的调用描述。
 */
Status status_from_native(long rc, const std::string& context);

} // namespace dfsio
