#pragma once

#include <cstddef>
#include <string>

#include "common/status.h"

namespace dfsio {

enum class Encoding {
    kUtf8,
    kLatin1,
};

const char* to_string(Encoding e);

// 接受 "utf-8" / "utf8" / "latin-1" / "latin1" / "iso-8859-1"，大小写不敏感
Status parse_encoding(const std::string& name, Encoding& out);

/**
 * 增量解码器。输出统一是 UTF-8 字符串。
 *
 * 分块读取时，末尾不完整的多字节序列保存在 residual 里（最多 3 字节），
 * 下一次 decode 时先补全它。residual 在 seek 之后必须 reset。
 */
class TextDecoder {
public:
    explicit TextDecoder(Encoding enc) : enc_(enc) {}

    /**
     * 从 data 中最多解码 max_chars 个字符，追加到 out。
     * consumed 为用掉的字节数（包括转入 residual 的字节），chars 为解码出的字符数。
     * 非法字节序列返回 kInvalidData。
     */
    Status decode(const char* data, size_t len, size_t max_chars,
                  std::string& out, size_t& consumed, size_t& chars);

    // 流结束时调用：还有残留字节说明序列被截断
    Status finish() const;

    size_t pending() const { return residual_.size(); }
    void reset() { residual_.clear(); }
    Encoding encoding() const { return enc_; }

private:
    Encoding enc_;
    std::string residual_;
};

// 把 UTF-8 文本编码成目标编码的字节；utf-8 只做校验
Status encode_text(Encoding enc, const std::string& text, std::string& out);

} // namespace dfsio
