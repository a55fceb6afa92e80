#include "core/io/open_mode.h"

#include <fcntl.h>

namespace dfsio {

int OpenMode::native_flags() const {
    switch (access) {
    case AccessMode::kRead:      return O_RDONLY;
    case AccessMode::kWrite:     return O_WRONLY | O_CREAT | O_TRUNC;
    case AccessMode::kAppend:    return O_WRONLY | O_CREAT | O_APPEND;
    case AccessMode::kExclusive: return O_WRONLY | O_CREAT | O_EXCL;
    }
    return O_RDONLY;
}

std::string OpenMode::to_string() const {
    std::string s;
    switch (access) {
    case AccessMode::kRead:      s = "r"; break;
    case AccessMode::kWrite:     s = "w"; break;
    case AccessMode::kAppend:    s = "a"; break;
    case AccessMode::kExclusive: s = "x"; break;
    }
    if (binary) s += "b";
    return s;
}

Status parse_open_mode(const std::string& mode, OpenMode& out) {
    int accesses = 0;
    bool seen_b = false, seen_t = false, seen_plus = false;
    OpenMode m;

    for (char c : mode) {
        switch (c) {
        case 'r': case 'w': case 'a': case 'x':
            ++accesses;
            m.access = c == 'r' ? AccessMode::kRead
                     : c == 'w' ? AccessMode::kWrite
                     : c == 'a' ? AccessMode::kAppend
                                : AccessMode::kExclusive;
            break;
        case 'b':
            if (seen_b) return Status::InvalidArgument("invalid mode: " + mode);
            seen_b = true;
            break;
        case 't':
            if (seen_t) return Status::InvalidArgument("invalid mode: " + mode);
            seen_t = true;
            break;
        case '+':
            if (seen_plus) return Status::InvalidArgument("invalid mode: " + mode);
            seen_plus = true;
            break;
        default:
            return Status::InvalidArgument("invalid mode: " + mode);
        }
    }

    if (accesses != 1) {
        return Status::InvalidArgument(
            "mode must have exactly one of read/write/append/create: " + mode);
    }
    if (seen_b && seen_t) {
        return Status::InvalidArgument("can't have text and binary mode at once: " + mode);
    }
    if (seen_plus) {
        return Status::UnsupportedMode(
            m.access == AccessMode::kRead
                ? "read-write mode is not supported: " + mode
                : "combined write and read mode is not supported: " + mode);
    }

    m.binary = seen_b;
    out = m;
    return Status::OK();
}

} // namespace dfsio
