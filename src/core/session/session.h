#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "common/status.h"
#include "common/types.h"
#include "config/config_loader.h"
#include "fsal/native_client.h"

namespace dfsio {

enum class SessionState {
    kUninitialized,
    kActive,
    kClosed,
};

const char* to_string(SessionState s);

/**
 * 一个已挂载的文件系统实例。
 *
 * - mount 最多调用一次原生 mount；
 * - close 幂等，原生 umount 只执行一次；
 * - 还有 FileHandle 未关闭时 close 返回 kSessionBusy，Session 保持 Active。
 *
 * 元数据操作可以在多个线程上共享同一个 Session。
 */
class Session {
public:
    Session(MountConfig cfg, std::shared_ptr<INativeClient> client);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    Status mount();
    Status close();

    // Active 时返回 OK，否则返回 kSessionClosed / kSessionError
    Status check_active() const;

    SessionState state() const;
    const std::string& name() const { return cfg_.name(); }
    const std::string& id() const { return id_; }
    const MountConfig& config() const { return cfg_; }
    bool read_only() const { return cfg_.read_only(); }

    MountHandle handle() const;
    INativeClient& native() const { return *client_; }

    size_t open_handles() const { return open_handles_.load(); }

private:
    friend class FileHandle;

    // 在 mu_ 下检查 Active 并占用一个句柄计数，需在原生 open 之前调用；
    // 之后的 open 失败时必须 release_handle
    Status acquire_handle();
    void release_handle() { --open_handles_; }

    MountConfig cfg_;
    std::shared_ptr<INativeClient> client_;
    std::string id_;

    mutable std::mutex mu_;
    SessionState state_ {SessionState::kUninitialized};
    MountHandle handle_ {kInvalidMountHandle};
    std::atomic<size_t> open_handles_ {0};
};

} // namespace dfsio
