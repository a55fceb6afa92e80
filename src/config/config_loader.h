#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "common/status.h"
#include "mount_config.pb.h" // 由 config/mount_config.proto 生成

namespace dfsio {

using config::MountConfig;

inline constexpr const char* kDefaultMetaEndpoint = "127.0.0.1:6789";
inline constexpr const char* kDefaultMountRoot = "/";
inline constexpr std::uint64_t kDefaultCacheSizeMb = 100;

// 读取 protobuf 文本格式的配置文件
Status load_mount_config(const std::string& file, MountConfig& out);

/**
 * 从 key/value 映射构造配置。
 * 识别的 key: meta, user, keyring, root, cache_dir, cache_size,
 * read_only, log_level；其余 key 原样放入 options 透传给原生客户端。
 */
Status mount_config_from_map(const std::string& name,
                             const std::map<std::string, std::string>& kv,
                             MountConfig& out);

// 填充默认值并做基本校验，Session 挂载前调用且只调用一次；没有副作用
Status resolve_mount_config(MountConfig& cfg);

// 用于日志输出的 JSON，keyring 被隐去
std::string describe_mount_config(const MountConfig& cfg);

} // namespace dfsio
