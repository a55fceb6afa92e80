#include "core/namespace/dir_reader.h"
#include "common/logging.h"

namespace dfsio {

DirReader::DirReader(std::shared_ptr<Session> session, std::string path,
                     size_t page_size)
    : session_(std::move(session)),
      path_(std::move(path)),
      page_size_(page_size) {}

Status DirReader::fetch_page() {
    Status st = session_->check_active();
    if (!st.ok()) return st;

    std::uint64_t next_cookie = 0;
    int rc = session_->native().listdir(session_->handle(), path_, cookie_,
                                        page_size_, page_, next_cookie);
    if (rc < 0) {
        page_.clear();
        return status_from_native(rc, "listdir " + path_);
    }

    log(LogLevel::DEBUG, "listdir page path=%s cookie=%llu entries=%d next=%llu",
        path_.c_str(), static_cast<unsigned long long>(cookie_), rc,
        static_cast<unsigned long long>(next_cookie));

    idx_ = 0;
    cookie_ = next_cookie;
    if (next_cookie == 0) {
        exhausted_ = true;
    }
    return Status::OK();
}

Status DirReader::next(DirEntry& entry, bool& done) {
    done = false;
    while (idx_ >= page_.size()) {
        if (exhausted_) {
            done = true;
            return Status::OK();
        }
        Status st = fetch_page();
        if (!st.ok()) return st;
    }
    entry = std::move(page_[idx_++]);
    return Status::OK();
}

} // namespace dfsio
