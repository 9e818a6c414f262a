#include <sodium.h>

#include "util/encoding.hpp"

namespace encoding
{

static constexpr int B64_VARIANT = sodium_base64_VARIANT_ORIGINAL;

std::string b64_encode(const std::uint8_t *data, std::size_t len)
{
    // encoded_len includes the trailing NUL
    const std::size_t encoded_len = sodium_base64_ENCODED_LEN(len, B64_VARIANT);
    std::string       out(encoded_len, '\0');
    sodium_bin2base64(out.data(), out.size(), data, len, B64_VARIANT);
    out.resize(encoded_len - 1);
    return out;
}

bool b64_decode(std::string_view text, std::vector<std::uint8_t> &out)
{
    out.clear();
    if (text.empty())
        return true;

    // 3 bytes per 4 chars is an upper bound
    std::vector<std::uint8_t> buf(text.size() / 4 * 3 + 3);
    std::size_t               bin_len = 0;
    const char               *end     = nullptr;
    if (sodium_base642bin(buf.data(), buf.size(), text.data(), text.size(), /*ignore=*/nullptr,
                          &bin_len, &end, B64_VARIANT) != 0)
    {
        return false;
    }
    // trailing garbage after a valid prefix
    if (end != text.data() + text.size())
        return false;
    buf.resize(bin_len);
    out = std::move(buf);
    return true;
}

std::string hex_encode(const std::uint8_t *data, std::size_t len)
{
    std::string out(len * 2 + 1, '\0');
    sodium_bin2hex(out.data(), out.size(), data, len);
    out.resize(len * 2);
    return out;
}

bool hex_decode(std::string_view text, std::vector<std::uint8_t> &out)
{
    out.clear();
    if (text.size() % 2 != 0)
        return false;

    std::vector<std::uint8_t> buf(text.size() / 2);
    std::size_t               bin_len = 0;
    const char               *end     = nullptr;
    if (sodium_hex2bin(buf.data(), buf.size(), text.data(), text.size(), nullptr, &bin_len,
                       &end) != 0 ||
        end != text.data() + text.size() || bin_len != buf.size())
    {
        return false;
    }
    out = std::move(buf);
    return true;
}

}  // namespace encoding
