#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fleetwatch::infra {

/**
 * @brief Symmetric encryption of configuration secrets with libsodium secretbox.
 *
 * The key lives in a file next to the configuration and is created on first
 * use with owner-only permissions. Sealed values are Base64 text with the
 * nonce prepended, so they can be stored in JSON.
 *
 * @note This class is non-copyable.
 */
class SecretBox {
public:
    /**
     * @param keyPath Key file; created if missing or unreadable.
     * @throws core::ConfigurationError if libsodium cannot be initialized or
     *         the key file cannot be written.
     */
    explicit SecretBox(const std::filesystem::path& keyPath);

    /**
     * @brief Zeroes the key material.
     */
    ~SecretBox();

    SecretBox(const SecretBox&) = delete;
    SecretBox& operator=(const SecretBox&) = delete;

    /**
     * @brief Encrypts @p plaintext under a fresh random nonce.
     */
    std::string seal(const std::string& plaintext) const;

    /**
     * @brief Decrypts a value produced by seal().
     * @return std::nullopt if the value is malformed or was sealed with another key.
     */
    std::optional<std::string> open(const std::string& sealed) const;

private:
    void loadOrGenerateKey();

    std::filesystem::path keyPath_;
    std::vector<unsigned char> key_;
};

std::string base64Encode(const std::string& data);

std::string base64Encode(const std::vector<unsigned char>& data);

std::vector<unsigned char> base64Decode(const std::string& encoded);

/**
 * @brief Compares two secrets in time independent of where they differ.
 */
bool constantTimeEquals(const std::string& a, const std::string& b);

} // namespace fleetwatch::infra
