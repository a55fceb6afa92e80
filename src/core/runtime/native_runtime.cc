#include "core/runtime/native_runtime.h"
#include "core/session/session_manager.h"
#include "common/logging.h"

#include <mutex>

namespace dfsio {

namespace {
std::mutex g_mu;
std::shared_ptr<INativeClient> g_client;
}

Status NativeRuntime::init(std::shared_ptr<INativeClient> client) {
    if (!client) {
        return Status::InvalidArgument("native client must not be null");
    }
    std::lock_guard<std::mutex> g(g_mu);
    if (g_client) {
        log(LogLevel::WARN, "NativeRuntime::init called twice");
        return Status::AlreadyExists("native runtime already initialized");
    }
    init_log_level_from_env();
    g_client = std::move(client);
    log(LogLevel::INFO, "NativeRuntime initialized");
    return Status::OK();
}

Status NativeRuntime::shutdown() {
    {
        std::lock_guard<std::mutex> g(g_mu);
        if (!g_client) return Status::OK();
    }

    // 先关 Session，失败时保持 runtime 可用，避免留下无法卸载的挂载
    Status st = SessionManager::instance().close_all();
    if (!st.ok()) {
        log(LogLevel::ERROR, "NativeRuntime::shutdown aborted: %s", st.to_string().c_str());
        return st;
    }

    std::lock_guard<std::mutex> g(g_mu);
    g_client.reset();
    log(LogLevel::INFO, "NativeRuntime shutdown");
    return Status::OK();
}

bool NativeRuntime::initialized() {
    std::lock_guard<std::mutex> g(g_mu);
    return g_client != nullptr;
}

std::shared_ptr<INativeClient> NativeRuntime::client() {
    std::lock_guard<std::mutex> g(g_mu);
    return g_client;
}

} // namespace dfsio
