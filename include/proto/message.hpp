#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "crypto/cipher.hpp"
#include "proto/chunks.hpp"
#include "util/error.hpp"

namespace airgap
{

// --- Envelope layout ---
inline constexpr std::uint8_t VERSION_DEFAULT   = 1;
inline constexpr std::size_t  INSTANCE_ID_SIZE  = 33;  // compressed secp256k1 public key
inline constexpr std::size_t  ENVELOPE_HDR_SIZE = 1 + INSTANCE_ID_SIZE;  // version(1) + id(33)
inline constexpr std::size_t  OP_HDR_SIZE       = 6;   // op_code(2) + size(4), big-endian

using InstanceId = std::array<std::uint8_t, INSTANCE_ID_SIZE>;

// One typed unit of application data. size == data.size().
struct OpPayload
{
    std::uint16_t             op_code{0};
    std::uint32_t             size{0};
    std::vector<std::uint8_t> data;

    bool operator==(const OpPayload &o) const
    {
        return op_code == o.op_code && size == o.size && data == o.data;
    }
};

// An envelope under construction or as decoded. Each Message owns its
// operations; copies never share state.
class Message
{
  public:
    Message() = default;

    Message &add_operation(std::uint16_t op_code, std::vector<std::uint8_t> data);
    Message &add_operation(std::uint16_t op_code, std::string_view data);

    // version || instance_id || records, encrypted when an encryptor is bound
    Error marshal(std::vector<std::uint8_t> &out) const;
    // marshal, compress, split and base64 every chunk
    Error marshal_chunks(std::vector<std::string> &out) const;

    std::uint8_t                  version() const { return version_; }
    const InstanceId             &instance_id() const { return instance_id_; }
    const std::vector<OpPayload> &payload() const { return payload_; }
    std::size_t                   chunk_size() const { return chunk_size_; }
    // First error hit while building, Ok otherwise
    Error                         status() const { return status_; }

  private:
    friend class AirGap;

    std::uint8_t           version_{VERSION_DEFAULT};
    InstanceId             instance_id_{};
    std::vector<OpPayload> payload_;
    std::size_t            chunk_size_{chunk::DEFAULT_CHUNK_SIZE};
    aead::Encryptor       *enc_{nullptr};  // not owned
    Error                  status_{Error::Ok};
};

// Protocol context for one paired counterpart: expected version, instance id,
// chunk size and an optional cipher.
class AirGap
{
  public:
    static Error create(std::uint8_t                     version,
                        const std::vector<std::uint8_t> &instance_id,
                        std::optional<AirGap>           &out);

    // cipher is not owned and must outlive every Message created afterwards;
    // nullptr sends and expects plaintext envelopes.
    AirGap &set_cipher(aead::EncryptorDecryptor *cipher)
    {
        cipher_ = cipher;
        return *this;
    }
    void  set_version(std::uint8_t version) { version_ = version; }
    Error set_chunk_size(std::size_t chunk_size);

    std::uint8_t      version() const { return version_; }
    const InstanceId &instance_id() const { return instance_id_; }
    std::size_t       chunk_size() const { return chunk_size_; }

    Message create_message() const;

    Error unmarshal(const std::vector<std::uint8_t> &data, Message &out) const;
    Error unmarshal_chunks(const chunk::Buffer &chunks, Message &out) const;

  private:
    AirGap(std::uint8_t version, const InstanceId &instance_id)
        : version_(version), instance_id_(instance_id)
    {
    }

    std::uint8_t              version_{VERSION_DEFAULT};
    InstanceId                instance_id_{};
    std::size_t               chunk_size_{chunk::DEFAULT_CHUNK_SIZE};
    aead::EncryptorDecryptor *cipher_{nullptr};
};

}  // namespace airgap
