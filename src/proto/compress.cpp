#include <cstring>
#include <zlib.h>

#include "proto/compress.hpp"
#include "util/log.hpp"

namespace zip
{

using airgap::Error;

// 15 = 32K window, +16 selects the gzip wrapper instead of raw zlib
static constexpr int GZIP_WINDOW_BITS = 15 + 16;
static constexpr int MEM_LEVEL        = 8;
static constexpr std::size_t STEP     = 16 * 1024;

Error compress(const std::vector<std::uint8_t> &in, std::vector<std::uint8_t> &out)
{
    out.clear();

    z_stream zs;
    std::memset(&zs, 0, sizeof zs);
    int rc = deflateInit2(&zs, Z_BEST_COMPRESSION, Z_DEFLATED, GZIP_WINDOW_BITS, MEM_LEVEL,
                          Z_DEFAULT_STRATEGY);
    if (rc != Z_OK)
    {
        LOG_ERROR("deflateInit2 failed (%d)", rc);
        return Error::CompressionError;
    }

    std::vector<std::uint8_t> buf(deflateBound(&zs, static_cast<uLong>(in.size())));
    zs.next_in   = const_cast<Bytef *>(in.data());
    zs.avail_in  = static_cast<uInt>(in.size());
    zs.next_out  = buf.data();
    zs.avail_out = static_cast<uInt>(buf.size());

    // deflateBound guarantees a single Z_FINISH pass fits
    rc = deflate(&zs, Z_FINISH);
    const std::size_t produced = buf.size() - zs.avail_out;
    deflateEnd(&zs);
    if (rc != Z_STREAM_END)
    {
        LOG_ERROR("deflate did not finish (%d)", rc);
        return Error::CompressionError;
    }

    buf.resize(produced);
    out = std::move(buf);
    return Error::Ok;
}

Error decompress(const std::vector<std::uint8_t> &in, std::vector<std::uint8_t> &out)
{
    out.clear();
    if (in.empty())
    {
        LOG_ERROR("empty input");
        return Error::CompressionError;
    }

    z_stream zs;
    std::memset(&zs, 0, sizeof zs);
    int rc = inflateInit2(&zs, GZIP_WINDOW_BITS);
    if (rc != Z_OK)
    {
        LOG_ERROR("inflateInit2 failed (%d)", rc);
        return Error::CompressionError;
    }

    std::vector<std::uint8_t> buf;
    zs.next_in  = const_cast<Bytef *>(in.data());
    zs.avail_in = static_cast<uInt>(in.size());

    do
    {
        const std::size_t have = buf.size();
        buf.resize(have + STEP);
        zs.next_out  = buf.data() + have;
        zs.avail_out = static_cast<uInt>(STEP);

        rc = inflate(&zs, Z_NO_FLUSH);
        buf.resize(have + (STEP - zs.avail_out));

        if (rc == Z_BUF_ERROR && zs.avail_in == 0)
            break;  // input exhausted before the end of the stream
        if (rc != Z_OK && rc != Z_STREAM_END)
        {
            LOG_ERROR("inflate failed (%d: %s)", rc, zs.msg ? zs.msg : "no message");
            inflateEnd(&zs);
            return Error::CompressionError;
        }
    } while (rc != Z_STREAM_END);

    const uInt trailing = zs.avail_in;
    inflateEnd(&zs);

    if (rc != Z_STREAM_END)
    {
        LOG_ERROR("truncated gzip stream (%zu bytes in)", in.size());
        return Error::CompressionError;
    }
    if (trailing != 0)
    {
        LOG_ERROR("%u trailing bytes after gzip stream", static_cast<unsigned>(trailing));
        return Error::CompressionError;
    }

    out = std::move(buf);
    return Error::Ok;
}

}  // namespace zip
