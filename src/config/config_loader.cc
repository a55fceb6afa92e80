#include "config/config_loader.h"
#include "common/logging.h"

#include <fstream>
#include <optional>
#include <sstream>

#include <google/protobuf/text_format.h>
#include <google/protobuf/util/json_util.h>

namespace dfsio {

namespace {

std::optional<bool> parse_bool(const std::string& v) {
    if (v == "1" || v == "true" || v == "True" || v == "yes") return true;
    if (v == "0" || v == "false" || v == "False" || v == "no" || v.empty()) return false;
    return std::nullopt;
}

std::optional<std::uint64_t> parse_u64(const std::string& v) {
    if (v.empty()) return std::nullopt;
    try {
        size_t processed = 0;
        unsigned long long val = std::stoull(v, &processed, 10);
        if (processed != v.size()) {
            return std::nullopt;
        }
        return static_cast<std::uint64_t>(val);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

Status load_mount_config(const std::string& file, MountConfig& out) {
    std::ifstream in(file);
    if (!in) {
        log(LogLevel::ERROR, "load_mount_config: cannot open %s", file.c_str());
        return Status::NotFound("config file not found: " + file);
    }
    std::ostringstream oss;
    oss << in.rdbuf();

    MountConfig cfg;
    if (!google::protobuf::TextFormat::ParseFromString(oss.str(), &cfg)) {
        log(LogLevel::ERROR, "load_mount_config: invalid text format in %s",
            file.c_str());
        return Status::InvalidArgument("invalid mount config: " + file);
    }
    out = std::move(cfg);
    return Status::OK();
}

Status mount_config_from_map(const std::string& name,
                             const std::map<std::string, std::string>& kv,
                             MountConfig& out) {
    MountConfig cfg;
    cfg.set_name(name);

    for (const auto& [key, value] : kv) {
        if (key == "meta") {
            cfg.set_meta(value);
        } else if (key == "user") {
            cfg.set_user(value);
        } else if (key == "keyring") {
            cfg.set_keyring(value);
        } else if (key == "root") {
            cfg.set_root(value);
        } else if (key == "cache_dir") {
            cfg.set_cache_dir(value);
        } else if (key == "cache_size") {
            auto v = parse_u64(value);
            if (!v) {
                return Status::InvalidArgument("cache_size must be an unsigned integer: " + value);
            }
            cfg.set_cache_size_mb(*v);
        } else if (key == "read_only") {
            auto v = parse_bool(value);
            if (!v) {
                return Status::InvalidArgument("read_only must be a boolean: " + value);
            }
            cfg.set_read_only(*v);
        } else if (key == "log_level") {
            cfg.set_log_level(value);
        } else {
            (*cfg.mutable_options())[key] = value;
        }
    }

    out = std::move(cfg);
    return Status::OK();
}

Status resolve_mount_config(MountConfig& cfg) {
    if (cfg.name().empty()) {
        return Status::InvalidArgument("mount name must not be empty");
    }
    if (cfg.meta().empty()) {
        cfg.set_meta(kDefaultMetaEndpoint);
    }
    if (cfg.root().empty()) {
        cfg.set_root(kDefaultMountRoot);
    } else if (cfg.root()[0] != '/') {
        cfg.set_root("/" + cfg.root());
    }
    if (cfg.cache_size_mb() == 0) {
        cfg.set_cache_size_mb(kDefaultCacheSizeMb);
    }
    if (!cfg.log_level().empty()) {
        LogLevel level;
        if (!parse_log_level(cfg.log_level(), level)) {
            return Status::InvalidArgument("invalid log_level: " + cfg.log_level());
        }
    }
    return Status::OK();
}

std::string describe_mount_config(const MountConfig& cfg) {
    MountConfig redacted = cfg;
    if (!redacted.keyring().empty()) {
        redacted.set_keyring("***");
    }

    google::protobuf::util::JsonPrintOptions opts;
    opts.preserve_proto_field_names = true;
    opts.always_print_primitive_fields = true;

    std::string json;
    auto st = google::protobuf::util::MessageToJsonString(redacted, &json, opts);
    if (!st.ok()) {
        return redacted.ShortDebugString();
    }
    return json;
}

} // namespace dfsio
