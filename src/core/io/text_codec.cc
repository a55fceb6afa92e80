#include "core/io/text_codec.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>

namespace dfsio {

namespace {

// 由首字节得到序列长度，非法首字节返回 0
size_t utf8_sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 0;
}

// 校验 s[0..n) 是否是一个完整且最短编码的 UTF-8 序列，返回码点
bool utf8_decode_one(const unsigned char* s, size_t n, std::uint32_t& cp) {
    if (n == 1) {
        cp = s[0];
        return true;
    }
    for (size_t i = 1; i < n; ++i) {
        if ((s[i] & 0xC0) != 0x80) return false;
    }
    if (n == 2) {
        cp = ((s[0] & 0x1Fu) << 6) | (s[1] & 0x3Fu);
        return true;
    }
    if (n == 3) {
        cp = ((s[0] & 0x0Fu) << 12) | ((s[1] & 0x3Fu) << 6) | (s[2] & 0x3Fu);
        // 过长编码和代理区
        return cp >= 0x800 && (cp < 0xD800 || cp > 0xDFFF);
    }
    cp = ((s[0] & 0x07u) << 18) | ((s[1] & 0x3Fu) << 12) |
         ((s[2] & 0x3Fu) << 6) | (s[3] & 0x3Fu);
    return cp >= 0x10000 && cp <= 0x10FFFF;
}

// 已知前缀 s[0..n) 是否可能成为合法序列的开头
bool utf8_valid_prefix(const unsigned char* s, size_t n) {
    for (size_t i = 1; i < n; ++i) {
        if ((s[i] & 0xC0) != 0x80) return false;
    }
    if (n >= 2) {
        if (s[0] == 0xE0 && s[1] < 0xA0) return false;
        if (s[0] == 0xED && s[1] > 0x9F) return false;
        if (s[0] == 0xF0 && s[1] < 0x90) return false;
        if (s[0] == 0xF4 && s[1] > 0x8F) return false;
    }
    return true;
}

void append_utf8(std::uint32_t cp, std::string& out) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

Status invalid_byte(const char* what, unsigned char b) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%s: invalid byte 0x%02x", what, b);
    return Status::InvalidData(buf);
}

} // namespace

const char* to_string(Encoding e) {
    switch (e) {
    case Encoding::kUtf8:   return "utf-8";
    case Encoding::kLatin1: return "latin-1";
    }
    return "unknown";
}

Status parse_encoding(const std::string& name, Encoding& out) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(n.begin(), n.end(), '_', '-');

    if (n == "utf-8" || n == "utf8") {
        out = Encoding::kUtf8;
        return Status::OK();
    }
    if (n == "latin-1" || n == "latin1" || n == "iso-8859-1") {
        out = Encoding::kLatin1;
        return Status::OK();
    }
    return Status::InvalidArgument("unknown encoding: " + name);
}

Status TextDecoder::decode(const char* data, size_t len, size_t max_chars,
                           std::string& out, size_t& consumed, size_t& chars) {
    consumed = 0;
    chars = 0;
    const unsigned char* p = reinterpret_cast<const unsigned char*>(data);

    if (enc_ == Encoding::kLatin1) {
        size_t n = std::min(len, max_chars);
        for (size_t i = 0; i < n; ++i) {
            append_utf8(p[i], out);
        }
        consumed = n;
        chars = n;
        return Status::OK();
    }

    // 先补全上次留下的残余序列
    if (!residual_.empty() && chars < max_chars) {
        size_t need = utf8_sequence_length(
            static_cast<unsigned char>(residual_[0])) - residual_.size();
        size_t take = std::min(need, len);
        residual_.append(data, take);
        consumed += take;
        const unsigned char* r = reinterpret_cast<const unsigned char*>(residual_.data());
        if (!utf8_valid_prefix(r, residual_.size())) {
            return invalid_byte("utf-8 decode", r[residual_.size() - 1]);
        }
        if (take < need) {
            return Status::OK();
        }
        std::uint32_t cp = 0;
        if (!utf8_decode_one(r, residual_.size(), cp)) {
            return invalid_byte("utf-8 decode", r[0]);
        }
        out.append(residual_);
        residual_.clear();
        ++chars;
    }

    while (consumed < len && chars < max_chars) {
        size_t n = utf8_sequence_length(p[consumed]);
        if (n == 0) {
            return invalid_byte("utf-8 decode", p[consumed]);
        }
        size_t avail = len - consumed;
        if (avail < n) {
            if (!utf8_valid_prefix(p + consumed, avail)) {
                return invalid_byte("utf-8 decode", p[consumed + avail - 1]);
            }
            residual_.assign(data + consumed, avail);
            consumed = len;
            break;
        }
        std::uint32_t cp = 0;
        if (!utf8_decode_one(p + consumed, n, cp)) {
            return invalid_byte("utf-8 decode", p[consumed]);
        }
        out.append(data + consumed, n);
        consumed += n;
        ++chars;
    }
    return Status::OK();
}

Status TextDecoder::finish() const {
    if (!residual_.empty()) {
        return Status::InvalidData("utf-8 decode: truncated sequence of " +
                                   std::to_string(residual_.size()) +
                                   " bytes at end of stream");
    }
    return Status::OK();
}

Status encode_text(Encoding enc, const std::string& text, std::string& out) {
    out.clear();
    const unsigned char* p = reinterpret_cast<const unsigned char*>(text.data());
    size_t i = 0;
    out.reserve(text.size());

    while (i < text.size()) {
        size_t n = utf8_sequence_length(p[i]);
        if (n == 0 || i + n > text.size()) {
            return invalid_byte("utf-8 encode", p[i]);
        }
        std::uint32_t cp = 0;
        if (!utf8_decode_one(p + i, n, cp)) {
            return invalid_byte("utf-8 encode", p[i]);
        }
        if (enc == Encoding::kLatin1) {
            if (cp > 0xFF) {
                char buf[64];
                std::snprintf(buf, sizeof(buf),
                              "latin-1 encode: code point U+%04X out of range", cp);
                return Status::InvalidData(buf);
            }
            out.push_back(static_cast<char>(cp));
        } else {
            out.append(text, i, n);
        }
        i += n;
    }
    return Status::OK();
}

} // namespace dfsio
