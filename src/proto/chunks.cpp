#include <algorithm>
#include <cstdint>
#include <cstring>
#include <mutex>

#include "proto/chunks.hpp"
#include "proto/compress.hpp"
#include "util/encoding.hpp"
#include "util/log.hpp"

namespace chunk
{

using airgap::Error;

static constexpr std::size_t MAX_PAYLOAD = MAX_CHUNK_SIZE - HDR_SIZE;

Error validate_chunk_size(std::size_t chunk_size)
{
    if (chunk_size < MIN_CHUNK_SIZE)
    {
        LOG_ERROR("chunk size %zu below minimum %zu", chunk_size, MIN_CHUNK_SIZE);
        return Error::ChunkSizeTooSmall;
    }
    if (chunk_size > MAX_CHUNK_SIZE)
    {
        LOG_ERROR("chunk size %zu above maximum %zu", chunk_size, MAX_CHUNK_SIZE);
        return Error::ChunkSizeTooLarge;
    }
    return Error::Ok;
}

Error split(const std::vector<std::uint8_t> &blob, std::size_t chunk_size, std::vector<Chunk> &out)
{
    out.clear();
    if (auto err = validate_chunk_size(chunk_size); err != Error::Ok)
        return err;

    std::vector<std::uint8_t> compressed;
    if (auto err = zip::compress(blob, compressed); err != Error::Ok)
        return err;

    const std::size_t window = chunk_size - HDR_SIZE;
    if (compressed.empty())
    {
        Chunk c;
        c.hdr.index = 0;
        c.hdr.count = 1;
        c.hdr.len   = 0;
        out.push_back(std::move(c));
        return Error::Ok;
    }
    if (window == 0)
    {
        LOG_ERROR("chunk size %zu leaves no room for payload", chunk_size);
        return Error::PayloadTooLarge;
    }

    const std::size_t num_chunks = (compressed.size() + window - 1) / window;
    if (num_chunks > MAX_CHUNKS)
    {
        LOG_ERROR("payload too large (%zu compressed bytes, needs %zu chunks)", compressed.size(),
                  num_chunks);
        return Error::PayloadTooLarge;
    }

    out.reserve(num_chunks);
    for (std::size_t i = 0; i < num_chunks; i++)
    {
        std::size_t start = i * window;
        std::size_t take  = std::min(window, compressed.size() - start);
        Chunk       c;
        c.hdr.index = static_cast<std::uint16_t>(i);
        c.hdr.count = static_cast<std::uint16_t>(num_chunks);
        c.hdr.len   = static_cast<std::uint16_t>(take);
        c.payload.assign(compressed.begin() + start, compressed.begin() + start + take);
        out.push_back(std::move(c));
    }

    LOG_DEBUG("%zu bytes -> %zu compressed -> %zu chunks of <= %zu", blob.size(),
              compressed.size(), num_chunks, window);
    return Error::Ok;
}

void pack_header(const Header &in, std::uint8_t out[HDR_SIZE])
{
    out[0] = static_cast<std::uint8_t>(in.index & 0xFF);
    out[1] = static_cast<std::uint8_t>(in.index >> 8);
    out[2] = static_cast<std::uint8_t>(in.count & 0xFF);
    out[3] = static_cast<std::uint8_t>(in.count >> 8);
    out[4] = static_cast<std::uint8_t>(in.len & 0xFF);
    out[5] = static_cast<std::uint8_t>(in.len >> 8);
}

void unpack_header(const std::uint8_t in[HDR_SIZE], Header &out)
{
    out.index = static_cast<std::uint16_t>(in[0] | (in[1] << 8));
    out.count = static_cast<std::uint16_t>(in[2] | (in[3] << 8));
    out.len   = static_cast<std::uint16_t>(in[4] | (in[5] << 8));
}

Error Buffer::from_data(const std::vector<std::uint8_t> &blob, std::size_t chunk_size, Buffer &out)
{
    std::vector<Chunk> chunks;
    if (auto err = split(blob, chunk_size, chunks); err != Error::Ok)
        return err;

    std::unique_lock<std::shared_mutex> lk(out.mu_);
    out.count_    = static_cast<std::uint16_t>(chunks.size());
    out.size_     = static_cast<std::uint16_t>(chunk_size - HDR_SIZE);
    out.received_ = out.count_;
    out.parts_.clear();
    out.parts_.reserve(chunks.size());
    for (auto &c : chunks)
        out.parts_.push_back(std::move(c.payload));
    out.have_.assign(out.count_, true);
    return Error::Ok;
}

Error Buffer::read_chunk(std::string_view frame, bool *was_added)
{
    if (was_added)
        *was_added = false;

    // validate everything before touching state
    std::vector<std::uint8_t> raw;
    if (!encoding::b64_decode(frame, raw))
    {
        LOG_WARN("frame is not valid base64 (%zu chars)", frame.size());
        return Error::MalformedFrame;
    }
    if (raw.size() < HDR_SIZE)
    {
        LOG_WARN("frame too short! (%zu)", raw.size());
        return Error::MalformedFrame;
    }

    Header h{};
    unpack_header(raw.data(), h);
    if (h.count == 0 || h.len > MAX_PAYLOAD)
    {
        LOG_WARN("invalid header (index=%u count=%u len=%u)", h.index, h.count, h.len);
        return Error::MalformedFrame;
    }
    if (raw.size() < HDR_SIZE + h.len)
    {
        LOG_WARN("size mismatch (got %zu, expect >= %zu)", raw.size(), HDR_SIZE + h.len);
        return Error::MalformedFrame;
    }

    std::unique_lock<std::shared_mutex> lk(mu_);

    if (count_ != 0 && h.count != count_)
    {
        LOG_WARN("frame declares %u chunks, buffer holds %u", h.count, count_);
        return Error::CountMismatch;
    }
    if (h.index >= h.count)
    {
        LOG_WARN("chunk index %u out of range (count=%u)", h.index, h.count);
        return Error::ChunkIndexOutOfRange;
    }

    if (count_ == 0)
    {
        // first frame fixes the shape of the message
        count_    = h.count;
        received_ = 0;
        parts_.assign(count_, {});
        have_.assign(count_, false);
        size_ = static_cast<std::uint16_t>(std::min(raw.size() - HDR_SIZE, MAX_PAYLOAD));
    }

    if (have_[h.index])
    {
        LOG_DEBUG("duplicate chunk (index=%u, count=%u)", h.index, count_);
        return Error::Ok;
    }

    parts_[h.index].assign(raw.begin() + HDR_SIZE, raw.begin() + HDR_SIZE + h.len);
    have_[h.index] = true;
    received_++;
    size_ = std::max(size_, h.len);
    if (was_added)
        *was_added = true;

    LOG_DEBUG("chunk %u/%u stored (%u bytes, %u received)", h.index + 1, count_, h.len,
              received_);
    return Error::Ok;
}

bool Buffer::is_complete() const
{
    std::shared_lock<std::shared_mutex> lk(mu_);
    return count_ != 0 && received_ == count_;
}

Error Buffer::data(std::vector<std::uint8_t> &out) const
{
    out.clear();
    std::shared_lock<std::shared_mutex> lk(mu_);

    if (count_ == 0 || received_ != count_)
    {
        LOG_WARN("message incomplete (%u of %u chunks)", received_, count_);
        return Error::IncompleteMessage;
    }

    std::size_t total = 0;
    for (const auto &part : parts_)
        total += part.size();

    std::vector<std::uint8_t> joined;
    joined.reserve(total);
    for (std::uint16_t i = 0; i < count_; i++)
    {
        const auto &part = parts_[i];
        joined.insert(joined.end(), part.begin(), part.end());
    }
    return zip::decompress(joined, out);
}

std::vector<std::uint8_t> Buffer::frame_bytes(std::uint16_t index) const
{
    const auto       &part = parts_[index];
    const std::size_t room = std::max<std::size_t>(size_, part.size());

    // zero padded so every frame of one message has the same length
    std::vector<std::uint8_t> out(HDR_SIZE + room, 0);
    Header                    h{index, count_, static_cast<std::uint16_t>(part.size())};
    pack_header(h, out.data());
    if (!part.empty())
        std::memcpy(out.data() + HDR_SIZE, part.data(), part.size());
    return out;
}

std::vector<std::string> Buffer::serialize() const
{
    std::shared_lock<std::shared_mutex> lk(mu_);

    std::vector<std::string> frames;
    frames.reserve(count_);
    for (std::uint16_t i = 0; i < count_; i++)
    {
        if (!have_[i])
            continue;
        auto bytes = frame_bytes(i);
        frames.push_back(encoding::b64_encode(bytes.data(), bytes.size()));
    }
    return frames;
}

std::uint16_t Buffer::count() const
{
    std::shared_lock<std::shared_mutex> lk(mu_);
    return count_;
}

std::uint16_t Buffer::received() const
{
    std::shared_lock<std::shared_mutex> lk(mu_);
    return received_;
}

std::uint16_t Buffer::chunk_payload_size() const
{
    std::shared_lock<std::shared_mutex> lk(mu_);
    return size_;
}

std::vector<std::uint16_t> Buffer::missing() const
{
    std::shared_lock<std::shared_mutex> lk(mu_);
    std::vector<std::uint16_t> out;
    for (std::uint16_t i = 0; i < count_; i++)
    {
        if (!have_[i])
            out.push_back(i);
    }
    return out;
}

}  // namespace chunk
