#include <gtest/gtest.h>
#include <bunkget/downloader/url_cipher.hpp>

#include <cstddef>
#include <random>
#include <string>
#include <vector>

using namespace bunkget::downloader;

namespace {

std::vector<std::byte> bytesOf(std::string_view s) {
    std::vector<std::byte> out;
    for (unsigned char c : s)
        out.push_back(static_cast<std::byte>(c));
    return out;
}

} // namespace

TEST(UrlCipherTest, KeyUsesHourBucket) {
    EXPECT_EQ(cipher::keyFor(0), "SECRET_KEY_0");
    EXPECT_EQ(cipher::keyFor(3599.9), "SECRET_KEY_0");
    EXPECT_EQ(cipher::keyFor(3600), "SECRET_KEY_1");
    EXPECT_EQ(cipher::keyFor(1700000000), "SECRET_KEY_472222");
}

TEST(UrlCipherTest, DecryptsKnownPayload) {
    auto url = cipher::decryptUrl(1700000000, "OzE3IjZucGQuPD1VVRxQR1w4N20gMHspIiE8MBpaQgY=");
    ASSERT_TRUE(url.ok()) << url.error().message;
    EXPECT_EQ(url.value(), "https://kebab.bunkr.ru/video.mp4");
}

TEST(UrlCipherTest, SameBucketSameResult) {
    const std::string payload = "OzE3IjZucGQuPD1VVRxQR1w4N20gMHspIiE8MBpaQgY=";
    auto a = cipher::decryptUrl(1700000000, payload);
    auto b = cipher::decryptUrl(1700000000 + 1, payload);
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    EXPECT_EQ(a.value(), b.value());
}

TEST(UrlCipherTest, InvalidUtf8IsDropped) {
    auto url = cipher::decryptUrl(1700000000, "OzE3IjZucGQ9dqDKWFk=");
    ASSERT_TRUE(url.ok());
    EXPECT_EQ(url.value(), "https://x/ok");
}

TEST(UrlCipherTest, DecryptInvertsEncryptForArbitraryBytes) {
    std::mt19937 rng(42);
    std::uniform_int_distribution<int> byte(0, 255);
    std::uniform_int_distribution<int> len(0, 300);
    for (int round = 0; round < 50; ++round) {
        std::vector<std::byte> plain(static_cast<std::size_t>(len(rng)));
        for (auto& b : plain)
            b = static_cast<std::byte>(byte(rng));
        const double ts = 1.6e9 + round * 4321.5;
        EXPECT_EQ(cipher::decrypt(cipher::encrypt(plain, ts), ts), plain);
    }
}

TEST(UrlCipherTest, XorWithEmptyKeyIsIdentity) {
    auto data = bytesOf("abc");
    EXPECT_EQ(cipher::xorCycle(data, ""), data);
}

TEST(UrlCipherTest, Base64RoundTripAndWhitespace) {
    auto data = bytesOf("hello, world!");
    auto encoded = cipher::base64Encode(data);
    EXPECT_EQ(encoded, "aGVsbG8sIHdvcmxkIQ==");

    auto decoded = cipher::base64Decode("aGVs bG8s\nIHdv cmxk IQ==");
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.value(), data);

    auto one = cipher::base64Decode("YQ==");
    ASSERT_TRUE(one.ok());
    EXPECT_EQ(one.value(), bytesOf("a"));
}

TEST(UrlCipherTest, Base64RejectsMalformedInput) {
    auto badLength = cipher::base64Decode("abc");
    ASSERT_FALSE(badLength.ok());
    EXPECT_EQ(badLength.error().code, ErrorCode::ResolutionFailed);

    EXPECT_FALSE(cipher::base64Decode("ab!d").ok());
    EXPECT_FALSE(cipher::decryptUrl(0, "%%%%").ok());
}

TEST(UrlCipherTest, LossyDecodeSkipsMaximalInvalidSubparts) {
    // E2 82 is a truncated 3-byte sequence; both bytes go, 'A' stays.
    auto bytes = bytesOf("x\xE2\x82"
                         "A\xC3\xA9\x80");
    EXPECT_EQ(cipher::decodeUtf8Lossy(bytes), "xA\xC3\xA9");
    EXPECT_TRUE(cipher::isValidUtf8("caf\xC3\xA9"));
    EXPECT_FALSE(cipher::isValidUtf8("\xED\xA0\x80")); // surrogate
}

TEST(UrlCipherTest, RepairsLatin1Mojibake) {
    EXPECT_EQ(cipher::repairLatin1Mojibake("caf\xC3\x83\xC2\xA9"), "caf\xC3\xA9");
    // Already correct text stays as-is
    EXPECT_EQ(cipher::repairLatin1Mojibake("caf\xC3\xA9"), "caf\xC3\xA9");
    EXPECT_EQ(cipher::repairLatin1Mojibake("plain.mp4"), "plain.mp4");
    EXPECT_EQ(cipher::repairLatin1Mojibake("\xE6\x97\xA5\xE6\x9C\xAC"), "\xE6\x97\xA5\xE6\x9C\xAC");
}
