#pragma once
#include <cstdint>
#include <vector>

namespace aead
{

// Encrypts one whole envelope before it is compressed and chunked.
struct Encryptor
{
    virtual bool encrypt(const std::vector<std::uint8_t> &in, std::vector<std::uint8_t> &out) = 0;
    virtual ~Encryptor() = default;
};

// Inverse of Encryptor, applied to the reassembled and decompressed blob.
struct Decryptor
{
    virtual bool decrypt(const std::vector<std::uint8_t> &in, std::vector<std::uint8_t> &out) = 0;
    virtual ~Decryptor() = default;
};

struct EncryptorDecryptor : Encryptor, Decryptor
{
};

}  // namespace aead
