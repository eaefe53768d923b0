#include "infrastructure/crypto/SecretBox.hpp"

#include "core/types/Errors.hpp"

#include <sodium.h>
#include <spdlog/spdlog.h>

#include <fstream>

namespace fleetwatch::infra {

namespace {

constexpr size_t KEY_SIZE = crypto_secretbox_KEYBYTES;
constexpr size_t NONCE_SIZE = crypto_secretbox_NONCEBYTES;
constexpr size_t MAC_SIZE = crypto_secretbox_MACBYTES;

} // namespace

SecretBox::SecretBox(const std::filesystem::path& keyPath) : keyPath_(keyPath) {
    if (sodium_init() < 0) {
        throw core::ConfigurationError("Failed to initialize libsodium");
    }

    key_.resize(KEY_SIZE);
    loadOrGenerateKey();
}

SecretBox::~SecretBox() {
    if (!key_.empty()) {
        sodium_memzero(key_.data(), key_.size());
    }
}

void SecretBox::loadOrGenerateKey() {
    std::error_code ec;
    if (std::filesystem::exists(keyPath_, ec)) {
        std::ifstream file(keyPath_, std::ios::binary);
        file.read(reinterpret_cast<char*>(key_.data()), static_cast<std::streamsize>(KEY_SIZE));
        if (file.gcount() == static_cast<std::streamsize>(KEY_SIZE)) {
            spdlog::debug("Loaded secret key from {}", keyPath_.string());
            return;
        }
        spdlog::warn("Secret key at {} is unreadable, generating a new one", keyPath_.string());
    }

    randombytes_buf(key_.data(), KEY_SIZE);

    auto parent = keyPath_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    std::ofstream file(keyPath_, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw core::ConfigurationError("Cannot create key file " + keyPath_.string());
    }
    file.write(reinterpret_cast<const char*>(key_.data()), static_cast<std::streamsize>(KEY_SIZE));
    file.close();

    std::filesystem::permissions(keyPath_,
                                 std::filesystem::perms::owner_read |
                                     std::filesystem::perms::owner_write,
                                 ec);
    if (ec) {
        spdlog::warn("Cannot restrict permissions of {}: {}", keyPath_.string(), ec.message());
    }

    spdlog::info("Generated new secret key at {}", keyPath_.string());
}

std::string SecretBox::seal(const std::string& plaintext) const {
    std::vector<unsigned char> combined(NONCE_SIZE + MAC_SIZE + plaintext.size());
    unsigned char* nonce = combined.data();
    randombytes_buf(nonce, NONCE_SIZE);

    crypto_secretbox_easy(combined.data() + NONCE_SIZE,
                          reinterpret_cast<const unsigned char*>(plaintext.data()),
                          plaintext.size(), nonce, key_.data());

    return base64Encode(combined);
}

std::optional<std::string> SecretBox::open(const std::string& sealed) const {
    auto combined = base64Decode(sealed);
    if (combined.size() < NONCE_SIZE + MAC_SIZE) {
        return std::nullopt;
    }

    const unsigned char* nonce = combined.data();
    const unsigned char* cipher = combined.data() + NONCE_SIZE;
    size_t cipherLen = combined.size() - NONCE_SIZE;

    std::string plaintext(cipherLen - MAC_SIZE, '\0');
    if (crypto_secretbox_open_easy(reinterpret_cast<unsigned char*>(plaintext.data()), cipher,
                                   cipherLen, nonce, key_.data()) != 0) {
        return std::nullopt;
    }
    return plaintext;
}

std::string base64Encode(const std::string& data) {
    return base64Encode(std::vector<unsigned char>(data.begin(), data.end()));
}

std::string base64Encode(const std::vector<unsigned char>& data) {
    if (data.empty()) {
        return {};
    }

    size_t encodedLen = sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string encoded(encodedLen, '\0');

    sodium_bin2base64(encoded.data(), encodedLen, data.data(), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);

    while (!encoded.empty() && encoded.back() == '\0') {
        encoded.pop_back();
    }

    return encoded;
}

std::vector<unsigned char> base64Decode(const std::string& encoded) {
    if (encoded.empty()) {
        return {};
    }

    std::vector<unsigned char> decoded(encoded.size());
    size_t decodedLen = 0;

    if (sodium_base642bin(decoded.data(), decoded.size(), encoded.c_str(), encoded.size(),
                          nullptr, &decodedLen, nullptr, sodium_base64_VARIANT_ORIGINAL) != 0) {
        return {};
    }

    decoded.resize(decodedLen);
    return decoded;
}

bool constantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace fleetwatch::infra
