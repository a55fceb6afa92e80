#include "core/session/session_manager.h"
#include "core/runtime/native_runtime.h"
#include "common/logging.h"

#include <google/protobuf/util/message_differencer.h>

namespace dfsio {

SessionManager& SessionManager::instance() {
    static SessionManager mgr;
    return mgr;
}

Status SessionManager::open_session(const MountConfig& cfg,
                                    std::shared_ptr<Session>& out) {
    MountConfig resolved = cfg;
    Status st = resolve_mount_config(resolved);
    if (!st.ok()) {
        log(LogLevel::ERROR, "open_session: %s", st.to_string().c_str());
        return st;
    }

    std::lock_guard<std::mutex> g(mu_);
    auto it = sessions_.find(resolved.name());
    if (it != sessions_.end()) {
        if (it->second->state() == SessionState::kActive) {
            if (!google::protobuf::util::MessageDifferencer::Equals(
                    it->second->config(), resolved)) {
                log(LogLevel::WARN,
                    "open_session: %s already mounted with a different config, reusing it",
                    resolved.name().c_str());
            }
            out = it->second;
            return Status::OK();
        }
        sessions_.erase(it);
    }

    auto client = NativeRuntime::client();
    if (!client) {
        log(LogLevel::ERROR, "open_session %s: native runtime not initialized",
            resolved.name().c_str());
        return Status::SessionError("native runtime not initialized");
    }

    log(LogLevel::DEBUG, "open_session config=%s",
        describe_mount_config(resolved).c_str());

    auto session = std::make_shared<Session>(resolved, std::move(client));
    st = session->mount();
    if (!st.ok()) {
        return st;
    }

    // 日志级别是进程级的，只在新挂载时生效，复用已有 Session 不会改变它
    if (!resolved.log_level().empty()) {
        LogLevel level;
        if (parse_log_level(resolved.log_level(), level) && level != log_level()) {
            log(LogLevel::INFO, "open_session %s: log level set to %s",
                resolved.name().c_str(), resolved.log_level().c_str());
            set_log_level(level);
        }
    }

    sessions_[resolved.name()] = session;
    out = std::move(session);
    return Status::OK();
}

Status SessionManager::open_session(const std::string& name,
                                    const std::map<std::string, std::string>& kv,
                                    std::shared_ptr<Session>& out) {
    MountConfig cfg;
    Status st = mount_config_from_map(name, kv, cfg);
    if (!st.ok()) {
        return st;
    }
    return open_session(cfg, out);
}

Status SessionManager::close_session(const std::shared_ptr<Session>& session) {
    if (!session) {
        return Status::InvalidArgument("null session");
    }
    Status st = session->close();
    if (!st.ok() && st.code() == StatusCode::kSessionBusy) {
        return st;
    }

    // umount 失败时 Session 也已经是 Closed，从登记表里移除
    std::lock_guard<std::mutex> g(mu_);
    auto it = sessions_.find(session->name());
    if (it != sessions_.end() && it->second == session) {
        sessions_.erase(it);
    }
    return st;
}

Status SessionManager::close_session(const std::string& name) {
    auto session = find(name);
    if (!session) {
        return Status::NotFound("no session named " + name);
    }
    return close_session(session);
}

Status SessionManager::close_all() {
    std::unordered_map<std::string, std::shared_ptr<Session>> snapshot;
    {
        std::lock_guard<std::mutex> g(mu_);
        snapshot = sessions_;
    }

    Status first = Status::OK();
    for (auto& [name, session] : snapshot) {
        Status st = close_session(session);
        if (!st.ok()) {
            log(LogLevel::ERROR, "close_all: session %s: %s", name.c_str(),
                st.to_string().c_str());
            if (first.ok()) first = st;
        }
    }
    return first;
}

std::shared_ptr<Session> SessionManager::find(const std::string& name) const {
    std::lock_guard<std::mutex> g(mu_);
    auto it = sessions_.find(name);
    return it == sessions_.end() ? nullptr : it->second;
}

size_t SessionManager::active_count() const {
    std::lock_guard<std::mutex> g(mu_);
    size_t n = 0;
    for (const auto& [name, session] : sessions_) {
        (void)name;
        if (session->state() == SessionState::kActive) ++n;
    }
    return n;
}

Status open_session(const MountConfig& cfg, std::shared_ptr<Session>& out) {
    return SessionManager::instance().open_session(cfg, out);
}

Status open_session(const std::string& name,
                    const std::map<std::string, std::string>& kv,
                    std::shared_ptr<Session>& out) {
    return SessionManager::instance().open_session(name, kv, out);
}

Status close_session(const std::shared_ptr<Session>& session) {
    return SessionManager::instance().close_session(session);
}

} // namespace dfsio
