#include <array>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <sodium.h>

#include "crypto/psk_aead.hpp"
#include "util/log.hpp"

namespace aead
{

static_assert(aead::KEY_SIZE == crypto_aead_xchacha20poly1305_ietf_KEYBYTES, "key size mismatch");
static_assert(aead::NONCE_SIZE == crypto_aead_xchacha20poly1305_ietf_NPUBBYTES,
              "nonce size mismatch");
static_assert(aead::TAG_SIZE == crypto_aead_xchacha20poly1305_ietf_ABYTES, "tag size mismatch");

static bool ensure_sodium_init()
{
    static int ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

SodiumPskAead::~SodiumPskAead()
{
    sodium_memzero(key_.data(), key_.size());
}

std::optional<SodiumPskAead> SodiumPskAead::FromHex(std::string_view hex)
{
    if (!ensure_sodium_init())
    {
        LOG_ERROR("sodium_init failed");
        return std::nullopt;
    }
    std::array<std::uint8_t, KEY_SIZE> key;
    std::size_t                        out_len = 0;
    const char                        *end     = nullptr;
    if (sodium_hex2bin(key.data(), key.size(), hex.data(), hex.size(), nullptr, &out_len, &end) !=
            0 ||
        out_len != key.size() || end != hex.data() + hex.size())
    {
        sodium_memzero(key.data(), key.size());
        return std::nullopt;
    }
    SodiumPskAead aead{key};
    sodium_memzero(key.data(), key.size());
    return aead;
}

std::optional<SodiumPskAead> SodiumPskAead::CheckAndInitFromEnv(const char *env_var)
{
    if (!env_var)
        return std::nullopt;

    const char *s = std::getenv(env_var);
    if (!s)
        return std::nullopt;
    return FromHex(std::string_view{s});
}

bool SodiumPskAead::encrypt(const std::vector<std::uint8_t> &in, std::vector<std::uint8_t> &out)
{
    if (!ensure_sodium_init())
        return false;

    // output format = [NONCE | c] (c = mlen + TAG_SIZE)
    const std::size_t mlen = in.size();
    out.resize(NONCE_SIZE + mlen + TAG_SIZE);

    unsigned char     *npub = out.data();               // [0...NONCE_SIZE)
    unsigned char     *c    = out.data() + NONCE_SIZE;  // [NONCE_SIZE...)
    unsigned long long clen = 0;

    randombytes_buf(npub, NONCE_SIZE);
    const int rc = crypto_aead_xchacha20poly1305_ietf_encrypt(
        c, &clen, in.data(), mlen, AAD, sizeof(AAD), /*nsec=*/nullptr, npub, key_.data());
    if (rc != 0)
    {
        out.clear();
        return false;
    }
    out.resize(NONCE_SIZE + static_cast<std::size_t>(clen));
    return true;
}

bool SodiumPskAead::decrypt(const std::vector<std::uint8_t> &in, std::vector<std::uint8_t> &out)
{
    if (!ensure_sodium_init())
        return false;
    // [npub (NONCE_SIZE)] [c (ciphertext || tag)]
    if (in.size() < NONCE_SIZE + TAG_SIZE)
        return false;

    const unsigned char     *npub = in.data();
    const unsigned char     *c    = in.data() + NONCE_SIZE;
    const unsigned long long clen = in.size() - NONCE_SIZE;
    unsigned long long       mlen = 0;

    std::vector<std::uint8_t> plain(clen - TAG_SIZE);
    const int rc = crypto_aead_xchacha20poly1305_ietf_decrypt(
        plain.data(), &mlen, /*nsec=*/nullptr, c, clen, AAD, sizeof(AAD), npub, key_.data());
    if (rc != 0)
        return false;

    plain.resize(mlen);
    out = std::move(plain);
    return true;
}

}  // namespace aead
