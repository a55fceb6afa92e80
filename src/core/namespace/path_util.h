#pragma once

#include <string>
#include <utility>

#include "common/status.h"

namespace dfsio {
namespace path {

/**
 * 规范化为挂载内的绝对路径：
 *   "a//b/./c/../d/" -> "/a/b/d"
 * 相对路径按 "/" 解析，根目录之上的 ".." 停留在根目录。
 * 空路径或包含 '\0' 返回 kInvalidArgument。
 */
Status normalize(const std::string& in, std::string& out);

// b 为绝对路径时返回 b；不做规范化
std::string join(const std::string& a, const std::string& b);

// 以下函数要求输入已经规范化
std::string dirname(const std::string& p);   // "/a/b" -> "/a", "/a" -> "/"
std::string basename(const std::string& p);  // "/a/b" -> "b", "/" -> ""
std::pair<std::string, std::string> split(const std::string& p);

bool is_root(const std::string& p);

} // namespace path
} // namespace dfsio
