#include "core/session/session.h"
#include "common/logging.h"

#include <cerrno>
#include <uuid/uuid.h>

namespace dfsio {

namespace {

std::string make_session_id() {
    uuid_t uu;
    uuid_generate(uu);
    char buf[37] = {0};
    uuid_unparse_lower(uu, buf);
    return buf;
}

} // namespace

const char* to_string(SessionState s) {
    switch (s) {
    case SessionState::kUninitialized: return "Uninitialized";
    case SessionState::kActive:        return "Active";
    case SessionState::kClosed:        return "Closed";
    }
    return "Unknown";
}

Session::Session(MountConfig cfg, std::shared_ptr<INativeClient> client)
    : cfg_(std::move(cfg)),
      client_(std::move(client)),
      id_(make_session_id()) {}

Session::~Session() {
    bool active = false;
    {
        std::lock_guard<std::mutex> g(mu_);
        active = state_ == SessionState::kActive;
    }
    if (active) {
        Status st = close();
        if (!st.ok()) {
            log(LogLevel::ERROR, "Session %s (%s) close on destruction failed: %s",
                name().c_str(), id_.c_str(), st.to_string().c_str());
        }
    }
}

Status Session::mount() {
    std::lock_guard<std::mutex> g(mu_);
    if (state_ == SessionState::kActive) {
        return Status::OK();
    }
    if (state_ == SessionState::kClosed) {
        return Status::SessionClosed("session " + name() + " already closed");
    }
    if (!client_) {
        return Status::SessionError("native runtime not initialized");
    }

    MountHandle h = client_->mount(cfg_.name(), cfg_);
    if (h <= 0) {
        int err = h < 0 ? static_cast<int>(-h) : EIO;
        Status st = status_from_native(-err, "mount " + name());
        log(LogLevel::ERROR, "Session %s mount failed: %s", name().c_str(),
            st.message().c_str());
        // 挂载失败之后这个 Session 不能再用
        state_ = SessionState::kClosed;
        return Status::SessionError(st.message(), err);
    }

    handle_ = h;
    state_ = SessionState::kActive;
    log(LogLevel::INFO, "Session %s mounted id=%s meta=%s",
        name().c_str(), id_.c_str(), cfg_.meta().c_str());
    return Status::OK();
}

Status Session::close() {
    std::lock_guard<std::mutex> g(mu_);
    if (state_ == SessionState::kClosed) {
        return Status::OK();
    }
    if (state_ == SessionState::kUninitialized) {
        state_ = SessionState::kClosed;
        return Status::OK();
    }

    size_t outstanding = open_handles_.load();
    if (outstanding > 0) {
        log(LogLevel::ERROR, "Session %s close refused: %zu file handle(s) still open",
            name().c_str(), outstanding);
        return Status::Error(StatusCode::kSessionBusy,
                             "session " + name() + " has " +
                                 std::to_string(outstanding) + " open file handle(s)");
    }

    // 不论 umount 结果如何都只执行这一次
    int rc = client_->umount(handle_);
    state_ = SessionState::kClosed;
    handle_ = kInvalidMountHandle;
    if (rc < 0) {
        Status st = status_from_native(rc, "umount " + name());
        log(LogLevel::ERROR, "Session %s umount failed: %s", name().c_str(),
            st.message().c_str());
        return Status::SessionError(st.message(), st.native_errno());
    }
    log(LogLevel::INFO, "Session %s closed id=%s", name().c_str(), id_.c_str());
    return Status::OK();
}

Status Session::check_active() const {
    std::lock_guard<std::mutex> g(mu_);
    switch (state_) {
    case SessionState::kActive:
        return Status::OK();
    case SessionState::kClosed:
        return Status::SessionClosed("session " + name() + " is closed");
    case SessionState::kUninitialized:
        break;
    }
    return Status::SessionError("session " + name() + " is not mounted");
}

Status Session::acquire_handle() {
    std::lock_guard<std::mutex> g(mu_);
    if (state_ != SessionState::kActive) {
        return state_ == SessionState::kClosed
                   ? Status::SessionClosed("session " + name() + " is closed")
                   : Status::SessionError("session " + name() + " is not mounted");
    }
    ++open_handles_;
    return Status::OK();
}

SessionState Session::state() const {
    std::lock_guard<std::mutex> g(mu_);
    return state_;
}

MountHandle Session::handle() const {
    std::lock_guard<std::mutex> g(mu_);
    return handle_;
}

} // namespace dfsio
