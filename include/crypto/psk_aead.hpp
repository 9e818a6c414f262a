#pragma once
#include <array>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string_view>
#include <vector>

#include "crypto/cipher.hpp"

namespace aead
{

constexpr std::size_t KEY_SIZE   = 32;  // crypto_aead_xchacha20poly1305_ietf_KEYBYTES
constexpr std::size_t NONCE_SIZE = 24;  // crypto_aead_xchacha20poly1305_ietf_NPUBBYTES
constexpr std::size_t TAG_SIZE   = 16;  // crypto_aead_xchacha20poly1305_ietf_ABYTES

// Associated data bound into every envelope tag
inline constexpr std::uint8_t AAD[] = {'A', 'G', '1'};

class NoopPskAead final : public EncryptorDecryptor
{
  public:
    bool encrypt(const std::vector<std::uint8_t> &in, std::vector<std::uint8_t> &out) override
    {
        // same layout as XChaCha20-Poly1305 so frame counts match the real cipher
        // format is [NONCE (24 bytes)][PLAINTEXT][TAG (16 bytes)], nonce and tag zeroed
        out.resize(NONCE_SIZE + in.size() + TAG_SIZE);
        std::memset(out.data(), 0, NONCE_SIZE);
        if (!in.empty())
            std::memcpy(out.data() + NONCE_SIZE, in.data(), in.size());
        std::memset(out.data() + NONCE_SIZE + in.size(), 0, TAG_SIZE);
        return true;
    }

    bool decrypt(const std::vector<std::uint8_t> &in, std::vector<std::uint8_t> &out) override
    {
        if (in.size() < NONCE_SIZE + TAG_SIZE)
            return false;
        out.assign(in.begin() + NONCE_SIZE, in.end() - TAG_SIZE);
        return true;
    }
};

// libsodium-based implementation, pre-shared key
class SodiumPskAead final : public EncryptorDecryptor
{
  public:
    explicit SodiumPskAead(const std::array<std::uint8_t, KEY_SIZE> &key) : key_(key) {}
    ~SodiumPskAead() override;

    SodiumPskAead(const SodiumPskAead &)            = default;
    SodiumPskAead &operator=(const SodiumPskAead &) = default;

    // output = [NONCE][ciphertext || TAG], fresh random nonce per call
    bool encrypt(const std::vector<std::uint8_t> &in, std::vector<std::uint8_t> &out) override;
    bool decrypt(const std::vector<std::uint8_t> &in, std::vector<std::uint8_t> &out) override;

    // Key as 64 hex chars. nullopt on missing/invalid input.
    static std::optional<SodiumPskAead> FromHex(std::string_view hex);
    static std::optional<SodiumPskAead> CheckAndInitFromEnv(const char *env_var);

  private:
    std::array<std::uint8_t, KEY_SIZE> key_{};
};

}  // namespace aead
