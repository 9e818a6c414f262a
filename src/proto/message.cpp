#include <algorithm>
#include <cstdint>
#include <cstring>

#include "proto/chunks.hpp"
#include "proto/message.hpp"
#include "util/log.hpp"

namespace airgap
{

Error AirGap::create(std::uint8_t                     version,
                     const std::vector<std::uint8_t> &instance_id,
                     std::optional<AirGap>           &out)
{
    out.reset();
    if (instance_id.size() != INSTANCE_ID_SIZE)
    {
        LOG_ERROR("instance id must be %zu bytes (got %zu)", INSTANCE_ID_SIZE, instance_id.size());
        return Error::InvalidInstanceId;
    }
    InstanceId id;
    std::copy(instance_id.begin(), instance_id.end(), id.begin());
    out = AirGap(version, id);
    return Error::Ok;
}

Error AirGap::set_chunk_size(std::size_t chunk_size)
{
    if (auto err = chunk::validate_chunk_size(chunk_size); err != Error::Ok)
        return err;
    chunk_size_ = chunk_size;
    return Error::Ok;
}

Message AirGap::create_message() const
{
    Message m;
    m.version_     = version_;
    m.instance_id_ = instance_id_;
    m.chunk_size_  = chunk_size_;
    m.enc_         = cipher_;
    return m;
}

Message &Message::add_operation(std::uint16_t op_code, std::vector<std::uint8_t> data)
{
    if (data.size() > UINT32_MAX)
    {
        LOG_ERROR("operation %u too large (%zu bytes)", op_code, data.size());
        if (status_ == Error::Ok)
            status_ = Error::PayloadTooLarge;
        return *this;
    }
    OpPayload op;
    op.op_code = op_code;
    op.size    = static_cast<std::uint32_t>(data.size());
    op.data    = std::move(data);
    payload_.push_back(std::move(op));
    return *this;
}

Message &Message::add_operation(std::uint16_t op_code, std::string_view data)
{
    return add_operation(op_code, std::vector<std::uint8_t>(data.begin(), data.end()));
}

Error Message::marshal(std::vector<std::uint8_t> &out) const
{
    out.clear();
    if (status_ != Error::Ok)
        return status_;

    std::size_t total = ENVELOPE_HDR_SIZE;
    for (const auto &op : payload_)
        total += OP_HDR_SIZE + op.data.size();

    std::vector<std::uint8_t> env;
    env.reserve(total);
    env.push_back(version_);
    env.insert(env.end(), instance_id_.begin(), instance_id_.end());
    for (const auto &op : payload_)
    {
        // explicit big-endian
        env.push_back(static_cast<std::uint8_t>(op.op_code >> 8));
        env.push_back(static_cast<std::uint8_t>(op.op_code & 0xFF));
        env.push_back(static_cast<std::uint8_t>((op.size >> 24) & 0xFF));
        env.push_back(static_cast<std::uint8_t>((op.size >> 16) & 0xFF));
        env.push_back(static_cast<std::uint8_t>((op.size >> 8) & 0xFF));
        env.push_back(static_cast<std::uint8_t>(op.size & 0xFF));
        env.insert(env.end(), op.data.begin(), op.data.end());
    }

    if (!enc_)
    {
        out = std::move(env);
        return Error::Ok;
    }
    if (!enc_->encrypt(env, out))
    {
        LOG_ERROR("encryptor failed (%zu byte envelope)", env.size());
        out.clear();
        return Error::EncryptionError;
    }
    return Error::Ok;
}

Error Message::marshal_chunks(std::vector<std::string> &out) const
{
    out.clear();

    std::vector<std::uint8_t> blob;
    if (auto err = marshal(blob); err != Error::Ok)
        return err;

    chunk::Buffer chunks;
    if (auto err = chunk::Buffer::from_data(blob, chunk_size_, chunks); err != Error::Ok)
        return err;

    out = chunks.serialize();
    LOG_DEBUG("%zu operations -> %zu frames", payload_.size(), out.size());
    return Error::Ok;
}

Error AirGap::unmarshal(const std::vector<std::uint8_t> &data, Message &out) const
{
    out = Message{};

    std::vector<std::uint8_t> plain;
    const std::vector<std::uint8_t> *env = &data;
    if (cipher_)
    {
        if (!cipher_->decrypt(data, plain))
        {
            LOG_WARN("decryptor failed (key mismatch?)");
            return Error::DecryptionError;
        }
        env = &plain;
    }

    const std::uint8_t *buf = env->data();
    const std::size_t   len = env->size();
    if (len < ENVELOPE_HDR_SIZE)
    {
        LOG_WARN("envelope too short (%zu)", len);
        return Error::TruncatedEnvelope;
    }

    const std::uint8_t version = buf[0];
    if (version < version_)
    {
        LOG_WARN("message version %u older than supported %u", version, version_);
        return Error::VersionTooOld;
    }
    if (version > version_)
    {
        LOG_WARN("message version %u newer than supported %u", version, version_);
        return Error::VersionTooNew;
    }
    if (std::memcmp(buf + 1, instance_id_.data(), INSTANCE_ID_SIZE) != 0)
    {
        LOG_WARN("message addressed to another instance");
        return Error::InstanceMismatch;
    }

    Message m = create_message();
    std::size_t i = ENVELOPE_HDR_SIZE;
    while (i < len)
    {
        if (len - i < OP_HDR_SIZE)
        {
            LOG_WARN("truncated operation header at offset %zu", i);
            return Error::TruncatedOperation;
        }
        const std::uint16_t op_code = static_cast<std::uint16_t>((buf[i] << 8) | buf[i + 1]);
        const std::uint32_t size =
            (std::uint32_t)buf[i + 2] << 24 | (std::uint32_t)buf[i + 3] << 16 |
            (std::uint32_t)buf[i + 4] << 8 | (std::uint32_t)buf[i + 5];
        i += OP_HDR_SIZE;
        if (size > len - i)
        {
            LOG_WARN("operation %u declares %u bytes, %zu left", op_code, size, len - i);
            return Error::TruncatedOperation;
        }
        m.add_operation(op_code, std::vector<std::uint8_t>(buf + i, buf + i + size));
        i += size;
    }

    out = std::move(m);
    return Error::Ok;
}

Error AirGap::unmarshal_chunks(const chunk::Buffer &chunks, Message &out) const
{
    std::vector<std::uint8_t> data;
    if (auto err = chunks.data(data); err != Error::Ok)
    {
        out = Message{};
        return err;
    }
    return unmarshal(data, out);
}

}  // namespace airgap
