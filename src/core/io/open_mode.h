#pragma once

#include <string>

#include "common/status.h"

namespace dfsio {

enum class AccessMode {
    kRead,       // r：只读
    kWrite,      // w：创建或截断
    kAppend,     // a：创建或追加
    kExclusive,  // x：独占创建，已存在时失败
};

/**
 * open() 的模式。只有四种访问方式 × 二进制/文本，
 * 读写混合（"+"）是原生客户端不支持的组合，在解析阶段就被拒绝。
 */
struct OpenMode {
    AccessMode access {AccessMode::kRead};
    bool binary {true};

    static OpenMode ReadBinary() { return {AccessMode::kRead, true}; }
    static OpenMode WriteBinary() { return {AccessMode::kWrite, true}; }
    static OpenMode AppendBinary() { return {AccessMode::kAppend, true}; }

    bool readable() const { return access == AccessMode::kRead; }
    bool writable() const { return access != AccessMode::kRead; }
    bool appending() const { return access == AccessMode::kAppend; }

    int native_flags() const;
    // "rb" / "wb" / "ab" / "xb"，文本模式不带 b
    std::string to_string() const;
};

/**
 * 解析 "rb"、"w"、"at" 之类的模式字符串。
 *   - 非法字符、重复字符、缺少访问方式、同时出现 b 和 t：kInvalidArgument
 *   - 带 "+" 的读写组合（rb+ / wb+ / ab+ / xb+）：kUnsupportedMode
 */
Status parse_open_mode(const std::string& mode, OpenMode& out);

} // namespace dfsio
