#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "common/status.h"
#include "core/session/session.h"

namespace dfsio {

/**
 * 按挂载名登记 Session。
 * 同名且仍为 Active 的 Session 直接复用，原生 mount 不会重复执行。
 */
class SessionManager {
public:
    static SessionManager& instance();

    Status open_session(const MountConfig& cfg, std::shared_ptr<Session>& out);
    Status open_session(const std::string& name,
                        const std::map<std::string, std::string>& kv,
                        std::shared_ptr<Session>& out);

    Status close_session(const std::shared_ptr<Session>& session);
    Status close_session(const std::string& name);

    // 关闭全部 Session，返回遇到的第一个错误；其余 Session 仍然尝试关闭
    Status close_all();

    std::shared_ptr<Session> find(const std::string& name) const;
    size_t active_count() const;

private:
    SessionManager() = default;

    mutable std::mutex mu_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
};

// 便捷入口，等价于 SessionManager::instance() 上的同名方法
Status open_session(const MountConfig& cfg, std::shared_ptr<Session>& out);
Status open_session(const std::string& name,
                    const std::map<std::string, std::string>& kv,
                    std::shared_ptr<Session>& out);
Status close_session(const std::shared_ptr<Session>& session);

} // namespace dfsio
