#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "proto/chunks.hpp"
#include "proto/message.hpp"
#include "util/error.hpp"

namespace airgap
{

struct Config
{
    std::uint8_t              version    = VERSION_DEFAULT;
    std::vector<std::uint8_t> instance_id;  // empty until configured
    std::size_t               chunk_size = chunk::DEFAULT_CHUNK_SIZE;
    std::string               psk_hex;  // empty: no encryption
};

// Each parser leaves cfg untouched on error.
Error parse_version(std::string_view text, Config &cfg);
Error parse_instance_id(std::string_view hex, Config &cfg);
Error parse_chunk_size(std::string_view text, Config &cfg);
Error parse_psk(std::string_view hex, Config &cfg);

// Reads AIRGAP_VERSION, AIRGAP_INSTANCE_ID, AIRGAP_CHUNK_SIZE and AIRGAP_PSK.
// Unset variables keep their defaults; the first invalid one is returned.
Error load_config_from_env(Config &cfg);

}  // namespace airgap
