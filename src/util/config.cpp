#include <cerrno>
#include <cstdlib>
#include <string>

#include "crypto/psk_aead.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/encoding.hpp"
#include "util/log.hpp"

namespace airgap
{

static bool parse_ulong(std::string_view text, unsigned long &out)
{
    if (text.empty() || text.front() == '-' || text.front() == '+')
        return false;
    const std::string s(text);
    char             *p = nullptr;
    errno               = 0;
    unsigned long v     = std::strtoul(s.c_str(), &p, 10);
    if (errno != 0 || !p || *p != '\0')
        return false;
    out = v;
    return true;
}

Error parse_version(std::string_view text, Config &cfg)
{
    unsigned long v = 0;
    if (!parse_ulong(text, v) || v > UINT8_MAX)
    {
        LOG_ERROR("invalid version '%.*s' (expect 0..255)", (int)text.size(), text.data());
        return Error::InvalidNumber;
    }
    cfg.version = static_cast<std::uint8_t>(v);
    return Error::Ok;
}

Error parse_instance_id(std::string_view hex, Config &cfg)
{
    std::vector<std::uint8_t> id;
    if (!encoding::hex_decode(hex, id) || id.size() != INSTANCE_ID_SIZE)
    {
        LOG_ERROR("instance id must be %zu hex-encoded bytes", INSTANCE_ID_SIZE);
        return Error::InvalidInstanceId;
    }
    cfg.instance_id = std::move(id);
    return Error::Ok;
}

Error parse_chunk_size(std::string_view text, Config &cfg)
{
    unsigned long v = 0;
    if (!parse_ulong(text, v))
    {
        LOG_ERROR("invalid chunk size '%.*s'", (int)text.size(), text.data());
        return Error::InvalidNumber;
    }
    if (auto err = chunk::validate_chunk_size(v); err != Error::Ok)
        return err;
    cfg.chunk_size = static_cast<std::size_t>(v);
    return Error::Ok;
}

Error parse_psk(std::string_view hex, Config &cfg)
{
    std::vector<std::uint8_t> key;
    const bool ok = encoding::hex_decode(hex, key) && key.size() == aead::KEY_SIZE;
    if (!ok)
    {
        LOG_ERROR("pre-shared key must be %zu hex-encoded bytes", aead::KEY_SIZE);
        return Error::InvalidKey;
    }
    cfg.psk_hex = std::string(hex);
    return Error::Ok;
}

Error load_config_from_env(Config &cfg)
{
    Config next = cfg;
    if (const char *v = std::getenv(constants::ENV_VERSION); v && *v)
    {
        if (auto err = parse_version(v, next); err != Error::Ok)
            return err;
    }
    if (const char *v = std::getenv(constants::ENV_INSTANCE_ID); v && *v)
    {
        if (auto err = parse_instance_id(v, next); err != Error::Ok)
            return err;
    }
    if (const char *v = std::getenv(constants::ENV_CHUNK_SIZE); v && *v)
    {
        if (auto err = parse_chunk_size(v, next); err != Error::Ok)
            return err;
    }
    if (const char *v = std::getenv(constants::ENV_PSK); v && *v)
    {
        if (auto err = parse_psk(v, next); err != Error::Ok)
            return err;
    }
    cfg = std::move(next);
    return Error::Ok;
}

}  // namespace airgap
