#include "Utilities.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sodium.h>
#include <sstream>
#include <stdexcept>

namespace dpos {
namespace utl {

// Initialize libsodium (safe to call multiple times)
namespace {
struct SodiumInitializer {
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};
static SodiumInitializer sodium_initializer;

constexpr size_t ED25519_PRIVATE_KEY_SIZE = 32;
constexpr size_t ED25519_PUBLIC_KEY_SIZE = 32;
constexpr size_t ED25519_SIGNATURE_SIZE = 64;

std::string trimWhitespace(const std::string &s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

} // namespace

int64_t getCurrentTimeMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

Roe<nlohmann::json> loadJsonFile(const std::string &configPath) {
  if (!std::filesystem::exists(configPath)) {
    return Error(1, "Configuration file not found: " + configPath);
  }

  std::ifstream configFile(configPath);
  if (!configFile.is_open()) {
    return Error(2, "Failed to open configuration file: " + configPath);
  }

  std::string content((std::istreambuf_iterator<char>(configFile)),
                      std::istreambuf_iterator<char>());

  nlohmann::json config;
  try {
    config = nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(3, "Failed to parse JSON: " + std::string(e.what()));
  }

  return config;
}

std::string sha256(const std::string &input) {
  unsigned char hash[crypto_hash_sha256_BYTES];

  if (crypto_hash_sha256(hash,
                         reinterpret_cast<const unsigned char *>(input.data()),
                         input.size()) != 0) {
    throw std::runtime_error("crypto_hash_sha256 failed");
  }

  return hexEncode(
      std::string(reinterpret_cast<const char *>(hash), sizeof(hash)));
}

std::string hexEncode(const std::string &data) {
  std::stringstream ss;
  for (unsigned char c : data) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
  }
  return ss.str();
}

std::string hexDecode(const std::string &hex) {
  if (hex.size() % 2 != 0) {
    return {};
  }
  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };
  std::string out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = nibble(hex[i]);
    int lo = nibble(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      return {};
    }
    out.push_back(static_cast<char>((hi << 4) | lo));
  }
  return out;
}

Roe<void> writeToNewFile(const std::string &filePath,
                         const std::string &content) {
  if (std::filesystem::exists(filePath)) {
    return Error(1, "File already exists: " + filePath);
  }

  std::filesystem::path path(filePath);
  std::filesystem::path parentDir = path.parent_path();
  if (!parentDir.empty() && !std::filesystem::exists(parentDir)) {
    std::error_code ec;
    std::filesystem::create_directories(parentDir, ec);
    if (ec) {
      return Error(2, "Failed to create parent directories for " + filePath +
                          ": " + ec.message());
    }
  }

  std::ofstream file(filePath);
  if (!file.is_open()) {
    return Error(3, "Failed to open file for writing: " + filePath);
  }

  file << content;
  file.close();

  if (!file.good()) {
    return Error(4, "Failed to write content to file: " + filePath);
  }

  return {};
}

// --- Ed25519

Roe<Ed25519KeyPair> ed25519Generate() {
  std::string seed(ED25519_PRIVATE_KEY_SIZE, '\0');
  randombytes_buf(seed.data(), seed.size());
  return ed25519FromPrivateKey(seed);
}

Roe<Ed25519KeyPair> ed25519FromPrivateKey(const std::string &privateKey) {
  if (privateKey.size() != ED25519_PRIVATE_KEY_SIZE) {
    return Error(1, "ed25519: private key must be 32 bytes");
  }

  // Libsodium's secret key is 64 bytes (32 seed + 32 public), we keep the seed
  std::vector<unsigned char> sk(crypto_sign_SECRETKEYBYTES);
  Ed25519KeyPair pair;
  pair.publicKey.resize(crypto_sign_PUBLICKEYBYTES);
  pair.privateKey = privateKey;

  if (crypto_sign_seed_keypair(
          reinterpret_cast<unsigned char *>(pair.publicKey.data()), sk.data(),
          reinterpret_cast<const unsigned char *>(privateKey.data())) != 0) {
    return Error(2, "crypto_sign_seed_keypair failed");
  }
  sodium_memzero(sk.data(), sk.size());
  return pair;
}

Roe<std::string> ed25519Sign(const std::string &privateKey,
                             const std::string &message) {
  if (privateKey.size() != ED25519_PRIVATE_KEY_SIZE) {
    return Error(1, "ed25519Sign: private key must be 32 bytes");
  }

  std::vector<unsigned char> pk(crypto_sign_PUBLICKEYBYTES);
  std::vector<unsigned char> sk(crypto_sign_SECRETKEYBYTES);

  if (crypto_sign_seed_keypair(
          pk.data(), sk.data(),
          reinterpret_cast<const unsigned char *>(privateKey.data())) != 0) {
    return Error(2, "crypto_sign_seed_keypair failed");
  }

  std::string signature(crypto_sign_BYTES, '\0');
  unsigned long long sigLen = 0;

  int rc = crypto_sign_detached(
      reinterpret_cast<unsigned char *>(signature.data()), &sigLen,
      reinterpret_cast<const unsigned char *>(message.data()), message.size(),
      sk.data());
  sodium_memzero(sk.data(), sk.size());
  if (rc != 0) {
    return Error(3, "crypto_sign_detached failed");
  }

  if (sigLen != ED25519_SIGNATURE_SIZE) {
    return Error(4, "unexpected signature size");
  }

  return signature;
}

bool ed25519Verify(const std::string &publicKey, const std::string &message,
                   const std::string &signature) {
  if (publicKey.size() != ED25519_PUBLIC_KEY_SIZE ||
      signature.size() != ED25519_SIGNATURE_SIZE) {
    return false;
  }

  int result = crypto_sign_verify_detached(
      reinterpret_cast<const unsigned char *>(signature.data()),
      reinterpret_cast<const unsigned char *>(message.data()), message.size(),
      reinterpret_cast<const unsigned char *>(publicKey.data()));

  return result == 0;
}

Roe<std::string> readPrivateKey(const std::string &keyOrPath) {
  if (keyOrPath.empty()) {
    return Error(1, "Key path or value cannot be empty");
  }

  std::string content = keyOrPath;
  if (std::filesystem::exists(keyOrPath)) {
    std::ifstream file(keyOrPath);
    if (!file.is_open()) {
      return Error(2, "Failed to read key from: " + keyOrPath);
    }
    content = std::string((std::istreambuf_iterator<char>(file)),
                          std::istreambuf_iterator<char>());
  }
  content = trimWhitespace(content);

  if (content.size() >= 2 && content[0] == '0' &&
      (content[1] == 'x' || content[1] == 'X')) {
    content = content.substr(2);
  }

  std::string raw = hexDecode(content);
  if (raw.size() != ED25519_PRIVATE_KEY_SIZE) {
    return Error(3, "Private key must be 64 hex characters, got " +
                        std::to_string(content.size()));
  }
  return raw;
}

} // namespace utl
} // namespace dpos
