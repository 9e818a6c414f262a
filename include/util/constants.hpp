#pragma once

namespace constants
{
// Environment variables read by airgapctl
inline constexpr const char *ENV_LOG_LEVEL   = "AIRGAP_LOG_LEVEL";
inline constexpr const char *ENV_VERSION     = "AIRGAP_VERSION";
inline constexpr const char *ENV_INSTANCE_ID = "AIRGAP_INSTANCE_ID";  // 66 hex chars
inline constexpr const char *ENV_CHUNK_SIZE  = "AIRGAP_CHUNK_SIZE";
inline constexpr const char *ENV_PSK         = "AIRGAP_PSK";  // 64 hex chars, optional

}  // namespace constants
