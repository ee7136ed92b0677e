/*
 * url_cipher.cpp
 *
 * The decryption API returns {timestamp, url}, where url is base64 of the real asset URL
 * XOR-ed with "SECRET_KEY_<hour bucket>". Output must be bit-exact with the host's own
 * player, including how invalid UTF-8 is dropped.
 *
 * Base64 goes through OpenSSL's EVP block coder.
 */

#include <bunkget/downloader/url_cipher.hpp>

#include <openssl/evp.h>

#include <cctype>
#include <cmath>

namespace bunkget::downloader::cipher {

std::string keyFor(double timestamp) {
    const auto bucket = static_cast<std::int64_t>(std::floor(timestamp / kKeyBucketSeconds));
    return "SECRET_KEY_" + std::to_string(bucket);
}

std::vector<std::byte> xorCycle(std::span<const std::byte> data, std::string_view key) {
    std::vector<std::byte> out(data.begin(), data.end());
    if (key.empty())
        return out;
    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i] ^= static_cast<std::byte>(static_cast<unsigned char>(key[i % key.size()]));
    }
    return out;
}

std::vector<std::byte> encrypt(std::span<const std::byte> plain, double timestamp) {
    return xorCycle(plain, keyFor(timestamp));
}

std::vector<std::byte> decrypt(std::span<const std::byte> cipher, double timestamp) {
    return xorCycle(cipher, keyFor(timestamp));
}

Expected<std::vector<std::byte>> base64Decode(std::string_view encoded) {
    std::string compact;
    compact.reserve(encoded.size());
    for (unsigned char c : encoded) {
        if (!std::isspace(c))
            compact.push_back(static_cast<char>(c));
    }
    if (compact.empty())
        return std::vector<std::byte>{};
    if (compact.size() % 4 != 0)
        return Error{ErrorCode::ResolutionFailed, "base64 payload has invalid length"};

    std::vector<unsigned char> buf(compact.size() / 4 * 3);
    const int n = EVP_DecodeBlock(buf.data(), reinterpret_cast<const unsigned char*>(compact.data()),
                                  static_cast<int>(compact.size()));
    if (n < 0)
        return Error{ErrorCode::ResolutionFailed, "base64 payload is malformed"};

    // EVP_DecodeBlock keeps the zero bytes produced by padding; drop them.
    std::size_t len = static_cast<std::size_t>(n);
    if (compact.back() == '=')
        --len;
    if (compact.size() >= 2 && compact[compact.size() - 2] == '=')
        --len;

    std::vector<std::byte> out(len);
    for (std::size_t i = 0; i < len; ++i)
        out[i] = static_cast<std::byte>(buf[i]);
    return out;
}

std::string base64Encode(std::span<const std::byte> data) {
    if (data.empty())
        return {};
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  reinterpret_cast<const unsigned char*>(data.data()),
                                  static_cast<int>(data.size()));
    out.resize(n > 0 ? static_cast<std::size_t>(n) : 0);
    return out;
}

namespace {

// Length of the valid UTF-8 sequence at bytes[i], or the length of the maximal invalid
// subpart (negated) when the sequence is broken.
int utf8SequenceAt(const unsigned char* bytes, std::size_t size, std::size_t i) {
    const unsigned char lead = bytes[i];
    if (lead < 0x80)
        return 1;

    int need = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        need = 1;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        need = 2;
        if (lead == 0xE0)
            lo = 0xA0;
        else if (lead == 0xED)
            hi = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        need = 3;
        if (lead == 0xF0)
            lo = 0x90;
        else if (lead == 0xF4)
            hi = 0x8F;
    } else {
        return -1;
    }

    for (int k = 1; k <= need; ++k) {
        if (i + static_cast<std::size_t>(k) >= size)
            return -k;
        const unsigned char c = bytes[i + static_cast<std::size_t>(k)];
        const unsigned char min = k == 1 ? lo : 0x80;
        const unsigned char max = k == 1 ? hi : 0xBF;
        if (c < min || c > max)
            return -k;
    }
    return need + 1;
}

} // namespace

std::string decodeUtf8Lossy(std::span<const std::byte> bytes) {
    const auto* data = reinterpret_cast<const unsigned char*>(bytes.data());
    std::string out;
    out.reserve(bytes.size());
    std::size_t i = 0;
    while (i < bytes.size()) {
        const int len = utf8SequenceAt(data, bytes.size(), i);
        if (len > 0) {
            out.append(reinterpret_cast<const char*>(data + i), static_cast<std::size_t>(len));
            i += static_cast<std::size_t>(len);
        } else {
            i += static_cast<std::size_t>(-len);
        }
    }
    return out;
}

bool isValidUtf8(std::string_view text) {
    const auto* data = reinterpret_cast<const unsigned char*>(text.data());
    std::size_t i = 0;
    while (i < text.size()) {
        const int len = utf8SequenceAt(data, text.size(), i);
        if (len <= 0)
            return false;
        i += static_cast<std::size_t>(len);
    }
    return true;
}

Expected<std::string> decryptUrl(double timestamp, std::string_view base64Cipher) {
    auto cipherBytes = base64Decode(base64Cipher);
    if (!cipherBytes.ok())
        return cipherBytes.error();
    auto plain = decrypt(cipherBytes.value(), timestamp);
    return decodeUtf8Lossy(plain);
}

std::string repairLatin1Mojibake(std::string_view text) {
    if (!isValidUtf8(text))
        return std::string(text);

    // Collapse every code point to one byte; bail out if any is beyond Latin-1.
    std::string bytes;
    bytes.reserve(text.size());
    bool sawHighByte = false;
    const auto* data = reinterpret_cast<const unsigned char*>(text.data());
    std::size_t i = 0;
    while (i < text.size()) {
        const unsigned char lead = data[i];
        if (lead < 0x80) {
            bytes.push_back(static_cast<char>(lead));
            ++i;
        } else if (lead == 0xC2 || lead == 0xC3) {
            const unsigned cp = ((lead & 0x1Fu) << 6) | (data[i + 1] & 0x3Fu);
            bytes.push_back(static_cast<char>(cp));
            sawHighByte = true;
            i += 2;
        } else {
            return std::string(text);
        }
    }

    if (!sawHighByte || !isValidUtf8(bytes))
        return std::string(text);
    return bytes;
}

} // namespace bunkget::downloader::cipher
