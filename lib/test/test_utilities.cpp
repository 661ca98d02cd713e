#include "Utilities.h"
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>

namespace dpos {
namespace utl {

namespace {

std::string tempPath(const std::string &name) {
  return (std::filesystem::temp_directory_path() / name).string();
}

} // namespace

// SHA-256 tests
TEST(Sha256Test, EmptyStringProducesKnownHash) {
  EXPECT_EQ(sha256(""),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Sha256Test, HelloWorldProducesKnownHash) {
  EXPECT_EQ(sha256("hello world"),
            "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

TEST(Sha256Test, OutputIsHexadecimal64Characters) {
  std::string hash = sha256("test");
  EXPECT_EQ(hash.size(), 64u);
  for (char c : hash) {
    EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'));
  }
}

// Hex tests
TEST(HexTest, EncodeProducesLowercasePairs) {
  EXPECT_EQ(hexEncode(std::string("\x00\xff\x10", 3)), "00ff10");
  EXPECT_EQ(hexEncode(""), "");
}

TEST(HexTest, DecodeAcceptsBothCases) {
  EXPECT_EQ(hexDecode("00FF10"), std::string("\x00\xff\x10", 3));
  EXPECT_EQ(hexDecode("abcd"), hexDecode("ABCD"));
}

TEST(HexTest, DecodeRejectsMalformedInput) {
  EXPECT_EQ(hexDecode("abc"), "");
  EXPECT_EQ(hexDecode("zz"), "");
}

TEST(TimeTest, MillisecondsAreUnixEpoch) {
  int64_t before = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                       .count();
  int64_t millis = getCurrentTimeMs();
  EXPECT_GE(millis, before);
  EXPECT_LT(millis - before, 1000);
}

// Ed25519 tests
TEST(Ed25519Test, GenerateReturnsValidKeyPair) {
  auto pair = ed25519Generate();
  ASSERT_TRUE(pair.isOk()) << (pair.isError() ? pair.error().message : "");
  EXPECT_EQ(pair->publicKey.size(), 32u);
  EXPECT_EQ(pair->privateKey.size(), 32u);
}

TEST(Ed25519Test, FromPrivateKeyReproducesPublicKey) {
  auto pair = ed25519Generate();
  ASSERT_TRUE(pair.isOk());
  auto derived = ed25519FromPrivateKey(pair->privateKey);
  ASSERT_TRUE(derived.isOk());
  EXPECT_EQ(derived->publicKey, pair->publicKey);

  EXPECT_TRUE(ed25519FromPrivateKey("short").isError());
}

TEST(Ed25519Test, VerifyValidSignatureReturnsTrue) {
  auto pair = ed25519Generate();
  ASSERT_TRUE(pair.isOk());
  auto sig = ed25519Sign(pair->privateKey, "test message");
  ASSERT_TRUE(sig.isOk());
  EXPECT_EQ(sig->size(), 64u);
  EXPECT_TRUE(ed25519Verify(pair->publicKey, "test message", *sig));
}

TEST(Ed25519Test, VerifyWrongMessageReturnsFalse) {
  auto pair = ed25519Generate();
  ASSERT_TRUE(pair.isOk());
  auto sig = ed25519Sign(pair->privateKey, "original");
  ASSERT_TRUE(sig.isOk());
  EXPECT_FALSE(ed25519Verify(pair->publicKey, "tampered", *sig));
}

TEST(Ed25519Test, VerifyWrongPublicKeyReturnsFalse) {
  auto pair = ed25519Generate();
  auto other = ed25519Generate();
  ASSERT_TRUE(pair.isOk() && other.isOk());
  auto sig = ed25519Sign(pair->privateKey, "message");
  ASSERT_TRUE(sig.isOk());
  EXPECT_FALSE(ed25519Verify(other->publicKey, "message", *sig));
}

TEST(Ed25519Test, SignWithWrongPrivateKeySizeReturnsError) {
  auto sig = ed25519Sign(std::string(16, '\0'), "msg");
  EXPECT_TRUE(sig.isError());
  EXPECT_EQ(sig.error().code, 1);
}

TEST(Ed25519Test, VerifyRejectsWrongSignatureSize) {
  auto pair = ed25519Generate();
  ASSERT_TRUE(pair.isOk());
  EXPECT_FALSE(ed25519Verify(pair->publicKey, "msg", std::string(32, '\0')));
  EXPECT_FALSE(ed25519Verify(pair->publicKey, "msg", std::string(128, '\0')));
}

// Key and file helpers
TEST(ReadPrivateKeyTest, AcceptsInlineHexWithPrefix) {
  auto pair = ed25519Generate();
  ASSERT_TRUE(pair.isOk());
  std::string hex = hexEncode(pair->privateKey);

  auto plain = readPrivateKey(hex);
  ASSERT_TRUE(plain.isOk());
  EXPECT_EQ(plain.value(), pair->privateKey);

  auto prefixed = readPrivateKey("0x" + hex);
  ASSERT_TRUE(prefixed.isOk());
  EXPECT_EQ(prefixed.value(), pair->privateKey);
}

TEST(ReadPrivateKeyTest, ReadsKeyFile) {
  auto pair = ed25519Generate();
  ASSERT_TRUE(pair.isOk());
  std::string path = tempPath("dpos-ledger-test.key");
  {
    std::ofstream out(path);
    out << hexEncode(pair->privateKey) << "\n";
  }
  auto key = readPrivateKey(path);
  std::filesystem::remove(path);
  ASSERT_TRUE(key.isOk()) << key.error().message;
  EXPECT_EQ(key.value(), pair->privateKey);
}

TEST(ReadPrivateKeyTest, RejectsBadInput) {
  EXPECT_EQ(readPrivateKey("").error().code, 1);
  EXPECT_EQ(readPrivateKey("abcd").error().code, 3);
}

TEST(FileTest, WriteToNewFileRefusesToOverwrite) {
  std::string path = tempPath("dpos-ledger-write-test/out.json");
  std::filesystem::remove_all(tempPath("dpos-ledger-write-test"));

  auto first = writeToNewFile(path, "{\"a\": 1}");
  ASSERT_TRUE(first.isOk()) << first.error().message;
  auto second = writeToNewFile(path, "{}");
  ASSERT_TRUE(second.isError());
  EXPECT_EQ(second.error().code, 1);

  auto loaded = loadJsonFile(path);
  ASSERT_TRUE(loaded.isOk());
  EXPECT_EQ(loaded.value()["a"], 1);
  std::filesystem::remove_all(tempPath("dpos-ledger-write-test"));
}

TEST(FileTest, LoadJsonFileReportsErrors) {
  auto missing = loadJsonFile(tempPath("dpos-ledger-does-not-exist.json"));
  ASSERT_TRUE(missing.isError());
  EXPECT_EQ(missing.error().code, 1);

  std::string path = tempPath("dpos-ledger-bad.json");
  {
    std::ofstream out(path);
    out << "{ not json";
  }
  auto bad = loadJsonFile(path);
  std::filesystem::remove(path);
  ASSERT_TRUE(bad.isError());
  EXPECT_EQ(bad.error().code, 3);
}

} // namespace utl
} // namespace dpos
