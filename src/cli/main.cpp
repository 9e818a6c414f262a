#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "crypto/psk_aead.hpp"
#include "proto/chunks.hpp"
#include "proto/message.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/encoding.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

using airgap::Error;

static std::string trim(const std::string &s)
{
    auto l = s.find_first_not_of(" \t\r\n");
    auto r = s.find_last_not_of(" \t\r\n");
    if (l == std::string::npos)
        return {};
    return s.substr(l, r - l + 1);
}

static bool is_printable(const std::vector<std::uint8_t> &data)
{
    for (auto c : data)
    {
        if (!std::isprint(c))
            return false;
    }
    return true;
}

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  airgapctl [--chunk-size N] [--version V] [--instance HEX] <command> [args]\n"
                         "\n"
                         "Commands:\n"
                         "  encode <opcode>:<text>...   print one base64 frame per line\n"
                         "  decode                      read frames from stdin, print operations\n"
                         "  info                        print effective configuration\n"
                         "\n"
                         "Environment:\n"
                         "  AIRGAP_INSTANCE_ID  66 hex chars (required for encode/decode)\n"
                         "  AIRGAP_VERSION      protocol version, default 1\n"
                         "  AIRGAP_CHUNK_SIZE   6..65535, default 192\n"
                         "  AIRGAP_PSK          64 hex chars, enables encryption\n"
                         "  AIRGAP_LOG_LEVEL    debug|info|warn|error|quiet\n");
}

static bool parse_op(const std::string &arg, std::uint16_t &op_code, std::string &text)
{
    auto colon = arg.find(':');
    if (colon == std::string::npos || colon == 0 || colon > 5)
        return false;
    unsigned long v = 0;
    for (std::size_t i = 0; i < colon; ++i)
    {
        if (!std::isdigit(static_cast<unsigned char>(arg[i])))
            return false;
        v = v * 10 + static_cast<unsigned long>(arg[i] - '0');
    }
    if (v > UINT16_MAX)
        return false;
    op_code = static_cast<std::uint16_t>(v);
    text    = arg.substr(colon + 1);
    return true;
}

struct Session
{
    std::optional<airgap::AirGap>        ctx;
    std::unique_ptr<aead::SodiumPskAead> cipher;
};

static int open_session(const airgap::Config &cfg, Session &s)
{
    if (auto err = airgap::AirGap::create(cfg.version, cfg.instance_id, s.ctx);
        err != Error::Ok)
    {
        std::fprintf(stderr, "error: %s (set %s or pass --instance)\n", airgap::error_name(err),
                     constants::ENV_INSTANCE_ID);
        return exitc::bad_config;
    }
    if (auto err = s.ctx->set_chunk_size(cfg.chunk_size); err != Error::Ok)
    {
        std::fprintf(stderr, "error: %s\n", airgap::error_name(err));
        return exitc::bad_config;
    }
    if (!cfg.psk_hex.empty())
    {
        auto c = aead::SodiumPskAead::FromHex(cfg.psk_hex);
        if (!c)
        {
            std::fprintf(stderr, "error: %s\n", airgap::error_name(Error::InvalidKey));
            return exitc::bad_config;
        }
        s.cipher = std::make_unique<aead::SodiumPskAead>(*c);
        s.ctx->set_cipher(s.cipher.get());
        LOG_INFO("Using SodiumPskAead (key from %s)", constants::ENV_PSK);
    }
    else
    {
        LOG_WARN("No %s set, envelopes are not encrypted", constants::ENV_PSK);
    }
    return exitc::ok;
}

static int cmd_encode(const airgap::Config &cfg, const std::vector<std::string> &args)
{
    if (args.size() < 2)
    {
        print_usage();
        return exitc::bad_args;
    }

    Session s;
    if (int rc = open_session(cfg, s); rc != exitc::ok)
        return rc;

    airgap::Message msg = s.ctx->create_message();
    for (std::size_t i = 1; i < args.size(); ++i)
    {
        std::uint16_t op_code = 0;
        std::string   text;
        if (!parse_op(args[i], op_code, text))
        {
            std::fprintf(stderr, "error: expected <opcode>:<text>, got '%s'\n", args[i].c_str());
            return exitc::bad_args;
        }
        msg.add_operation(op_code, std::string_view{text});
    }

    std::vector<std::string> frames;
    if (auto err = msg.marshal_chunks(frames); err != Error::Ok)
    {
        std::fprintf(stderr, "error: encode failed: %s\n", airgap::error_name(err));
        return exitc::encode_failed;
    }
    for (const auto &f : frames)
        std::printf("%s\n", f.c_str());
    LOG_INFO("%zu operations in %zu frames", msg.payload().size(), frames.size());
    return exitc::ok;
}

static int cmd_decode(const airgap::Config &cfg)
{
    Session s;
    if (int rc = open_session(cfg, s); rc != exitc::ok)
        return rc;

    chunk::Buffer buffer;
    std::string   line;
    std::size_t   rejected = 0;
    while (!buffer.is_complete() && std::getline(std::cin, line))
    {
        line = trim(line);
        if (line.empty())
            continue;
        bool added = false;
        if (auto err = buffer.read_chunk(line, &added); err != Error::Ok)
        {
            // operator rescans; one bad frame never ends the session
            LOG_WARN("frame rejected: %s", airgap::error_name(err));
            rejected++;
            continue;
        }
        if (added)
            LOG_INFO("frame %u/%u", buffer.received(), buffer.count());
    }

    if (!buffer.is_complete())
    {
        std::fprintf(stderr, "error: incomplete message (%u of %u frames, %zu rejected)\n",
                     buffer.received(), buffer.count(), rejected);
        for (auto idx : buffer.missing())
            std::fprintf(stderr, "missing frame %u\n", idx);
        return exitc::incomplete;
    }

    airgap::Message msg;
    if (auto err = s.ctx->unmarshal_chunks(buffer, msg); err != Error::Ok)
    {
        std::fprintf(stderr, "error: decode failed: %s\n", airgap::error_name(err));
        return exitc::decode_failed;
    }

    for (const auto &op : msg.payload())
    {
        if (is_printable(op.data))
            std::printf("op=%u size=%u text=%.*s\n", op.op_code, op.size, (int)op.data.size(),
                        reinterpret_cast<const char *>(op.data.data()));
        else
            std::printf("op=%u size=%u hex=%s\n", op.op_code, op.size,
                        encoding::hex_encode(op.data.data(), op.data.size()).c_str());
    }
    return exitc::ok;
}

static int cmd_info(const airgap::Config &cfg)
{
    std::printf("version=%u\n", cfg.version);
    std::printf("instance=%s\n",
                cfg.instance_id.empty()
                    ? "(unset)"
                    : encoding::hex_encode(cfg.instance_id.data(), cfg.instance_id.size()).c_str());
    std::printf("chunk_size=%zu\n", cfg.chunk_size);
    std::printf("encryption=%s\n", cfg.psk_hex.empty() ? "off" : "xchacha20poly1305");
    return exitc::ok;
}

static int run_cmd(const std::string &cmd, const std::vector<std::string> &args,
                   const airgap::Config &cfg)
{
    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"encode", [&]() -> int { return cmd_encode(cfg, args); }},
        {"decode",
         [&]() -> int {
             if (args.size() != 1)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             return cmd_decode(cfg);
         }},
        {"info", [&]() -> int { return cmd_info(cfg); }},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }

    if (const char *log_level = std::getenv(constants::ENV_LOG_LEVEL))
        airgap::set_log_level_by_name(log_level);

    // environment first, then CLI options override it
    airgap::Config cfg;
    if (auto err = airgap::load_config_from_env(cfg); err != Error::Ok)
    {
        std::fprintf(stderr, "error: bad environment: %s\n", airgap::error_name(err));
        return exitc::bad_config;
    }

    std::vector<std::string> args;
    args.reserve(argc - 1);

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        Error       err = Error::Ok;
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--chunk-size" && i + 1 < argc)
            err = airgap::parse_chunk_size(argv[++i], cfg);
        else if (a == "--version" && i + 1 < argc)
            err = airgap::parse_version(argv[++i], cfg);
        else if (a == "--instance" && i + 1 < argc)
            err = airgap::parse_instance_id(argv[++i], cfg);
        else
            args.push_back(std::move(a));

        if (err != Error::Ok)
        {
            std::fprintf(stderr, "error: %s\n", airgap::error_name(err));
            return exitc::bad_args;
        }
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }

    return run_cmd(args[0], args, cfg);
}
