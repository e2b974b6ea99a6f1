#include "cardkit/encoding.hpp"

#include <cctype>

#include <openssl/evp.h>

namespace cardkit {

// ============================================================================
// Base64 (OpenSSL EVP block codec)
// ============================================================================

std::optional<std::vector<uint8_t>> base64_decode(const std::string& text) {
    std::string clean;
    clean.reserve(text.size() + 2);
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        // URL-safe alphabet is accepted as well
        if (c == '-') c = '+';
        else if (c == '_') c = '/';
        clean.push_back(c);
    }

    size_t end = clean.size();
    while (end > 0 && clean[end - 1] == '=') --end;
    if (clean.size() - end > 2) {
        return std::nullopt;
    }
    // '=' is only legal as trailing padding
    if (clean.find('=') < end) {
        return std::nullopt;
    }
    if (end == 0) {
        if (clean.empty()) return std::vector<uint8_t>{};
        return std::nullopt;
    }

    // Re-pad from the payload length so missing padding is tolerated
    clean.resize(end);
    size_t padding = 0;
    switch (clean.size() % 4) {
        case 0: break;
        case 2: padding = 2; break;
        case 3: padding = 1; break;
        default: return std::nullopt;
    }
    clean.append(padding, '=');

    std::vector<uint8_t> out(clean.size() / 4 * 3);
    int n = EVP_DecodeBlock(out.data(),
                            reinterpret_cast<const unsigned char*>(clean.data()),
                            static_cast<int>(clean.size()));
    if (n < 0 || static_cast<size_t>(n) < padding) {
        return std::nullopt;
    }
    // EVP_DecodeBlock counts padding as zero bytes
    out.resize(static_cast<size_t>(n) - padding);
    return out;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    if (data.empty()) return {};
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            data.data(), static_cast<int>(data.size()));
    out.resize(n > 0 ? static_cast<size_t>(n) : 0);
    return out;
}

std::string base64_encode(const std::string& data) {
    return base64_encode(std::vector<uint8_t>(data.begin(), data.end()));
}

// ============================================================================
// Latin-1 <-> UTF-8
// ============================================================================

std::string latin1_to_utf8(const std::string& latin1) {
    std::string out;
    out.reserve(latin1.size());
    for (char ch : latin1) {
        auto c = static_cast<unsigned char>(ch);
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back(static_cast<char>(0xC0 | (c >> 6)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
    }
    return out;
}

std::string utf8_to_latin1(const std::string& utf8) {
    std::string out;
    out.reserve(utf8.size());
    size_t i = 0;
    while (i < utf8.size()) {
        auto c = static_cast<unsigned char>(utf8[i]);
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
            ++i;
            continue;
        }

        size_t len = 0;
        if ((c & 0xE0) == 0xC0) len = 2;
        else if ((c & 0xF0) == 0xE0) len = 3;
        else if ((c & 0xF8) == 0xF0) len = 4;

        bool valid = len != 0 && i + len <= utf8.size();
        for (size_t k = 1; valid && k < len; ++k) {
            valid = (static_cast<unsigned char>(utf8[i + k]) & 0xC0) == 0x80;
        }
        if (!valid) {
            out.push_back('?');
            ++i;
            continue;
        }

        if (len == 2) {
            uint32_t cp = ((c & 0x1Fu) << 6) | (static_cast<unsigned char>(utf8[i + 1]) & 0x3Fu);
            out.push_back(cp <= 0xFF ? static_cast<char>(cp) : '?');
        } else {
            out.push_back('?');
        }
        i += len;
    }
    return out;
}

// ============================================================================
// UTF-8 decoding
// ============================================================================

std::string utf8_decode_lossy(const std::string& bytes) {
    static const char REPLACEMENT[] = "\xEF\xBF\xBD";

    std::string out;
    out.reserve(bytes.size());
    const size_t n = bytes.size();
    size_t i = 0;

    while (i < n) {
        auto c = static_cast<unsigned char>(bytes[i]);
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
            ++i;
            continue;
        }

        // Sequence length and the allowed range of the second byte
        size_t len = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c == 0xE0) {
            len = 3;
            lo = 0xA0;
        } else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) {
            len = 3;
        } else if (c == 0xED) {
            len = 3;
            hi = 0x9F;
        } else if (c == 0xF0) {
            len = 4;
            lo = 0x90;
        } else if (c >= 0xF1 && c <= 0xF3) {
            len = 4;
        } else if (c == 0xF4) {
            len = 4;
            hi = 0x8F;
        } else {
            out += REPLACEMENT;
            ++i;
            continue;
        }

        size_t k = 1;
        while (k < len && i + k < n) {
            auto b = static_cast<unsigned char>(bytes[i + k]);
            unsigned char min = k == 1 ? lo : 0x80;
            unsigned char max = k == 1 ? hi : 0xBF;
            if (b < min || b > max) break;
            ++k;
        }

        if (k == len) {
            out.append(bytes, i, len);
        } else {
            out += REPLACEMENT;
        }
        i += k;
    }
    return out;
}

// ============================================================================
// SHA-256 (OpenSSL EVP digest API)
// ============================================================================

namespace {

// RAII wrapper for EVP_MD_CTX
class EvpMdCtx {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() { if (ctx_) EVP_MD_CTX_free(ctx_); }

    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

std::string bytes_to_hex(const unsigned char* data, size_t len) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    return result;
}

} // namespace

HashResult compute_sha256(const std::vector<uint8_t>& data) {
    HashResult result;

    EvpMdCtx ctx;
    if (!ctx) {
        result.error = "EVP_MD_CTX_new failed";
        return result;
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        result.error = "EVP_DigestInit_ex failed";
        return result;
    }

    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        result.error = "EVP_DigestUpdate failed";
        return result;
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        result.error = "EVP_DigestFinal_ex failed";
        return result;
    }

    result.hex_digest = bytes_to_hex(hash, hash_len);
    result.ok = true;
    return result;
}

} // namespace cardkit
