#include "core/namespace/path_util.h"

#include <vector>

namespace dfsio {
namespace path {

Status normalize(const std::string& in, std::string& out) {
    if (in.empty()) {
        return Status::InvalidArgument("empty path");
    }
    if (in.find('\0') != std::string::npos) {
        return Status::InvalidArgument("path contains NUL byte");
    }

    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= in.size()) {
        size_t pos = in.find('/', start);
        if (pos == std::string::npos) pos = in.size();
        std::string comp = in.substr(start, pos - start);
        start = pos + 1;

        if (comp.empty() || comp == ".") {
            continue;
        }
        if (comp == "..") {
            if (!parts.empty()) parts.pop_back();
            continue;
        }
        parts.push_back(std::move(comp));
    }

    std::string res;
    for (const auto& p : parts) {
        res += "/";
        res += p;
    }
    out = res.empty() ? "/" : res;
    return Status::OK();
}

std::string join(const std::string& a, const std::string& b) {
    if (!b.empty() && b[0] == '/') return b;
    if (a.empty()) return b;
    if (b.empty()) return a;
    if (a.back() == '/') return a + b;
    return a + "/" + b;
}

std::string dirname(const std::string& p) {
    size_t pos = p.rfind('/');
    if (pos == std::string::npos) return "";
    if (pos == 0) return "/";
    return p.substr(0, pos);
}

std::string basename(const std::string& p) {
    size_t pos = p.rfind('/');
    if (pos == std::string::npos) return p;
    return p.substr(pos + 1);
}

std::pair<std::string, std::string> split(const std::string& p) {
    return {dirname(p), basename(p)};
}

bool is_root(const std::string& p) {
    return p == "/";
}

} // namespace path
} // namespace dfsio
