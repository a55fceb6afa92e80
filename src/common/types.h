#pragma once

#include <cstdint>
#include <cstdio>
#include <string>
#include <sys/stat.h>

namespace dfsio {

// 原生挂载句柄，> 0 有效
using MountHandle = std::int64_t;
inline constexpr MountHandle kInvalidMountHandle = 0;

inline constexpr std::uint32_t kDefaultFileMode = 0644;
inline constexpr std::uint32_t kDefaultDirMode  = 0755;

enum class Whence {
    kFromStart,
    kFromCurrent,
    kFromEnd,
};

inline int to_native_whence(Whence w) {
    switch (w) {
    case Whence::kFromStart:   return SEEK_SET;
    case Whence::kFromCurrent: return SEEK_CUR;
    case Whence::kFromEnd:     return SEEK_END;
    }
    return SEEK_SET;
}

enum class FileKind {
    kFile,
    kDirectory,
    kSymlink,
    kOther,
};

const char* to_string(FileKind kind);

struct FileStat {
    std::uint32_t mode {0};     // 包含类型位的 st_mode
    std::uint64_t size {0};
    std::uint32_t uid {0};
    std::uint32_t gid {0};
    std::uint64_t nlink {0};
    std::uint64_t ino {0};
    std::uint64_t atime_ms {0};
    std::uint64_t mtime_ms {0};
    std::uint64_t ctime_ms {0};

    bool is_dir() const { return S_ISDIR(mode); }
    bool is_file() const { return S_ISREG(mode); }
    bool is_symlink() const { return S_ISLNK(mode); }
    std::uint32_t permissions() const { return mode & 07777; }

    FileKind kind() const {
        if (is_file()) return FileKind::kFile;
        if (is_dir()) return FileKind::kDirectory;
        if (is_symlink()) return FileKind::kSymlink;
        return FileKind::kOther;
    }
};

// 目录项：name 不含路径分隔符，stat 来自 listdir 本身（不跟随符号链接）
struct DirEntry {
    std::string name;
    FileKind kind {FileKind::kOther};
    FileStat stat;
};

struct StatVfs {
    std::uint64_t block_size {0};
    std::uint64_t blocks {0};
    std::uint64_t blocks_free {0};
    std::uint64_t blocks_avail {0};
    std::uint64_t files {0};
    std::uint64_t files_free {0};
    std::uint64_t name_max {255};
};

struct DirSummary {
    std::uint64_t size {0};
    std::uint64_t files {0};
    std::uint64_t dirs {0};
};

} // namespace dfsio
