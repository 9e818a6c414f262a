#pragma once
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "util/error.hpp"

/*
TX:
Message::marshal() = envelope bytes [encrypted]
  -> split(bytes, chunk_size)
       -> zip::compress(bytes)
       -> windows of (chunk_size - HDR_SIZE) bytes -> Chunk {hdr, payload}
  -> Buffer::serialize()   // [6B header][payload][zero pad] -> base64 text, one per QR frame

RX:
scanner frame (base64 text)
  -> Buffer::read_chunk(frame)   // decode, validate, store by index (first write wins)
  -> Buffer::is_complete() ?
       -> Buffer::data()          // concat in index order -> zip::decompress
            -> AirGap::unmarshal(...)
*/

namespace chunk
{

// --- Protocol constants ---
inline constexpr std::size_t HDR_SIZE           = 6;  // index(2) + count(2) + len(2)
inline constexpr std::size_t MIN_CHUNK_SIZE     = HDR_SIZE;
inline constexpr std::size_t MAX_CHUNK_SIZE     = UINT16_MAX;
inline constexpr std::size_t DEFAULT_CHUNK_SIZE = 192;  // fits a terminal-rendered QR code
inline constexpr std::size_t MAX_CHUNKS         = UINT16_MAX;

// On-wire chunk header, every field little-endian
struct Header
{
    std::uint16_t index{0};  // 2B
    std::uint16_t count{0};  // 2B
    std::uint16_t len{0};    // 2B, payload bytes actually carried
};

struct Chunk
{
    Header                    hdr;
    std::vector<std::uint8_t> payload;
};

airgap::Error validate_chunk_size(std::size_t chunk_size);

// TX
airgap::Error split(const std::vector<std::uint8_t> &blob,
                    std::size_t                      chunk_size,
                    std::vector<Chunk>              &out);
void          pack_header(const Header &in, std::uint8_t out[HDR_SIZE]);
// RX
void          unpack_header(const std::uint8_t in[HDR_SIZE], Header &out);

// Reassembly buffer for exactly one message. The first header observed fixes
// count for the lifetime of the buffer. Safe to feed from several threads.
class Buffer
{
  public:
    Buffer() = default;

    // Sender side: compress and split blob into a fully populated buffer.
    static airgap::Error from_data(const std::vector<std::uint8_t> &blob,
                                   std::size_t                      chunk_size,
                                   Buffer                          &out);

    // Feed one base64 frame. was_added is false for a duplicate index, which
    // is not an error. On any error the buffer is left untouched.
    airgap::Error read_chunk(std::string_view frame, bool *was_added = nullptr);

    bool          is_complete() const;
    airgap::Error data(std::vector<std::uint8_t> &out) const;

    // One base64 frame per index, in order, ready to render as QR frames.
    std::vector<std::string> serialize() const;

    std::uint16_t              count() const;
    std::uint16_t              received() const;
    std::uint16_t              chunk_payload_size() const;
    std::vector<std::uint16_t> missing() const;

  private:
    std::vector<std::uint8_t> frame_bytes(std::uint16_t index) const;

    mutable std::shared_mutex              mu_;
    std::uint16_t                          count_    = 0;
    std::uint16_t                          size_     = 0;  // payload capacity per chunk
    std::uint16_t                          received_ = 0;
    std::vector<std::vector<std::uint8_t>> parts_;  // size == count_
    std::vector<bool>                      have_;   // size == count_
};

}  // namespace chunk
