#pragma once

#include <bunkget/downloader/downloader.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bunkget::downloader::cipher {

// Key rotation period of the decryption API.
inline constexpr std::int64_t kKeyBucketSeconds = 3600;

// "SECRET_KEY_" + floor(timestamp / 3600)
[[nodiscard]] std::string keyFor(double timestamp);

// XOR data with key repeated cyclically. Symmetric: applying it twice restores the input.
[[nodiscard]] std::vector<std::byte> xorCycle(std::span<const std::byte> data,
                                              std::string_view key);

[[nodiscard]] std::vector<std::byte> encrypt(std::span<const std::byte> plain, double timestamp);
[[nodiscard]] std::vector<std::byte> decrypt(std::span<const std::byte> cipher, double timestamp);

// Standard alphabet with padding. ASCII whitespace is ignored.
[[nodiscard]] Expected<std::vector<std::byte>> base64Decode(std::string_view encoded);
[[nodiscard]] std::string base64Encode(std::span<const std::byte> data);

// UTF-8 decode that drops invalid sequences (maximal invalid subparts are skipped).
[[nodiscard]] std::string decodeUtf8Lossy(std::span<const std::byte> bytes);
[[nodiscard]] bool isValidUtf8(std::string_view text);

// base64 -> XOR with the time-bucketed key -> lossy UTF-8.
[[nodiscard]] Expected<std::string> decryptUrl(double timestamp, std::string_view base64Cipher);

// Undo Latin-1-read-as-UTF-8 mojibake ("Ã©" -> "é"). Text that is not mojibake is returned
// unchanged.
[[nodiscard]] std::string repairLatin1Mojibake(std::string_view text);

} // namespace bunkget::downloader::cipher
