#include "common/types.h"

namespace dfsio {

const char* to_string(FileKind kind) {
    switch (kind) {
    case FileKind::kFile:      return "file";
    case FileKind::kDirectory: return "directory";
    case FileKind::kSymlink:   return "symlink";
    case FileKind::kOther:     return "other";
    }
    return "other";
}

} // namespace dfsio
