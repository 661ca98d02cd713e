#ifndef DPOS_LEDGER_UTILITIES_H
#define DPOS_LEDGER_UTILITIES_H

#include "ResultOrError.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace dpos {

// Error type for utility functions
struct Error : public RoeErrorBase {
  using RoeErrorBase::RoeErrorBase;
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Get the current time in milliseconds since the epoch.
 * Ledger timestamps, block times and unstaking maturity use this unit.
 */
int64_t getCurrentTimeMs();

/**
 * Load and parse a JSON configuration file
 * @param configPath Path to the JSON configuration file
 * @return Parsed JSON document or error
 */
Roe<nlohmann::json> loadJsonFile(const std::string &configPath);

/**
 * Compute SHA-256 hash using Libsodium
 * @param input Input string to hash
 * @return Hexadecimal string representation of the SHA-256 hash
 * @throws std::runtime_error if hash computation fails
 */
std::string sha256(const std::string &input);

/**
 * Encode binary data as hex string (e.g. for JSON-safe transport)
 * @param data Raw bytes
 * @return Lowercase hex string (two chars per byte)
 */
std::string hexEncode(const std::string &data);

/**
 * Decode hex string back to binary
 * @param hex Hex string (even length, 0-9a-fA-F)
 * @return Decoded bytes, or empty string if input is invalid
 */
std::string hexDecode(const std::string &hex);

/**
 * Write a string to a non-existent file
 * Creates parent directories if needed. Fails if the file already exists.
 * @param filePath Path to the file to write
 * @param content String content to write to the file
 */
Roe<void> writeToNewFile(const std::string &filePath,
                         const std::string &content);

// --- Ed25519 (raw binary: 32-byte public key, 32-byte private key, 64-byte signature)

/** Ed25519 key pair: publicKey (32 bytes), privateKey (32 bytes) */
struct Ed25519KeyPair {
  std::string publicKey;
  std::string privateKey;
};

/**
 * Generate a new Ed25519 key pair
 * @return Roe<Ed25519KeyPair>: publicKey and privateKey as 32-byte binary strings, or error
 */
Roe<Ed25519KeyPair> ed25519Generate();

/**
 * Derive the key pair belonging to a 32-byte private key (seed)
 */
Roe<Ed25519KeyPair> ed25519FromPrivateKey(const std::string &privateKey);

/**
 * Sign a message with an Ed25519 private key
 * @param privateKey 32-byte raw private key (from ed25519Generate or equivalent)
 * @param message Message to sign (arbitrary bytes)
 * @return Roe<std::string>: 64-byte signature, or error
 */
Roe<std::string> ed25519Sign(const std::string &privateKey,
                             const std::string &message);

/**
 * Verify an Ed25519 signature
 * @param publicKey 32-byte raw public key
 * @param message Message that was signed
 * @param signature 64-byte signature
 * @return true if signature is valid, false if invalid or bad key/signature format
 */
bool ed25519Verify(const std::string &publicKey, const std::string &message,
                   const std::string &signature);

/**
 * Read a hex-encoded private key given inline or as a path to a key file.
 * An optional "0x" prefix is accepted.
 * @return 32-byte raw private key
 */
Roe<std::string> readPrivateKey(const std::string &keyOrPath);

} // namespace utl
} // namespace dpos

#endif // DPOS_LEDGER_UTILITIES_H
