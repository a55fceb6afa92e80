#pragma once

#include <memory>

#include "common/status.h"
#include "fsal/native_client.h"

namespace dfsio {

/**
 * 进程级的原生客户端实例。
 * 必须先 init 再创建 Session；shutdown 会先关闭所有已登记的 Session。
 * init 只能成功一次，shutdown 之后可以重新 init。
 */
class NativeRuntime {
public:
    static Status init(std::shared_ptr<INativeClient> client);
    static Status shutdown();

    static bool initialized();
    // 未初始化时返回 nullptr
    static std::shared_ptr<INativeClient> client();
};

} // namespace dfsio
