#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "common/status.h"
#include "common/types.h"
#include "core/session/session.h"

namespace dfsio {

inline constexpr size_t kDefaultListPageSize = 1024;

/**
 * 惰性的目录遍历器。每次本地页用完才向原生层请求下一页，
 * 不假设整个目录能在一次 listdir 调用里返回。
 */
class DirReader {
public:
    // path 需要已经规范化
    DirReader(std::shared_ptr<Session> session, std::string path,
              size_t page_size = kDefaultListPageSize);

    DirReader(const DirReader&) = delete;
    DirReader& operator=(const DirReader&) = delete;

    // done 为 true 时 entry 无效，之后继续调用仍然返回 done
    Status next(DirEntry& entry, bool& done);

    const std::string& path() const { return path_; }

private:
    Status fetch_page();

    std::shared_ptr<Session> session_;
    std::string path_;
    size_t page_size_;

    std::vector<DirEntry> page_;
    size_t idx_ {0};
    std::uint64_t cookie_ {0};
    bool exhausted_ {false};
};

} // namespace dfsio
