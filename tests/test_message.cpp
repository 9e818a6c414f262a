// tests/test_message.cpp
#include <algorithm>
#include <cstdint>
#include <gtest/gtest.h>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "crypto/psk_aead.hpp"
#include "proto/chunks.hpp"
#include "proto/message.hpp"

using namespace airgap;

namespace
{
constexpr std::uint16_t OP_TEST_1 = 1;
constexpr std::uint16_t OP_TEST_2 = 1000;
constexpr std::uint16_t OP_TEST_3 = 65535;

const char *const TEST_KEY = "00112233445566778899aabbccddeeff00112233445566778899aabbccddeeff";

std::vector<std::uint8_t> make_instance_id(std::uint8_t seed)
{
    // shaped like a compressed public key: 0x02/0x03 prefix + 32 bytes
    std::vector<std::uint8_t> id(INSTANCE_ID_SIZE);
    id[0] = 0x02;
    for (std::size_t i = 1; i < id.size(); ++i)
        id[i] = static_cast<std::uint8_t>(seed + i * 7);
    return id;
}

AirGap make_airgap(std::uint8_t version = VERSION_DEFAULT, std::uint8_t seed = 1)
{
    std::optional<AirGap> ag;
    EXPECT_EQ(AirGap::create(version, make_instance_id(seed), ag), Error::Ok);
    return *ag;
}

std::vector<std::uint8_t> bytes_of(std::string_view s)
{
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

// Reassembles frames into the blob AirGap::unmarshal expects
std::vector<std::uint8_t> reassemble(std::vector<std::string> frames)
{
    std::mt19937 rng(42);
    std::shuffle(frames.begin(), frames.end(), rng);
    chunk::Buffer rx;
    for (const auto &f : frames)
        EXPECT_EQ(rx.read_chunk(f), Error::Ok);
    EXPECT_TRUE(rx.is_complete());
    std::vector<std::uint8_t> out;
    EXPECT_EQ(rx.data(out), Error::Ok);
    return out;
}

std::vector<OpPayload> expected_ops()
{
    return {
        {OP_TEST_1, 1, bytes_of("a")},
        {OP_TEST_2, 2, bytes_of("bb")},
        {OP_TEST_3, 3, bytes_of("ccc")},
    };
}

struct FailingCipher : aead::EncryptorDecryptor
{
    bool encrypt(const std::vector<std::uint8_t> &, std::vector<std::uint8_t> &) override
    {
        return false;
    }
    bool decrypt(const std::vector<std::uint8_t> &, std::vector<std::uint8_t> &) override
    {
        return false;
    }
};
}  // namespace

TEST(AirGap, Create_RejectsBadInstanceId)
{
    std::optional<AirGap> ag;
    EXPECT_EQ(AirGap::create(VERSION_DEFAULT, {}, ag), Error::InvalidInstanceId);
    EXPECT_FALSE(ag.has_value());
    EXPECT_EQ(AirGap::create(VERSION_DEFAULT, std::vector<std::uint8_t>(32, 1), ag),
              Error::InvalidInstanceId);
    EXPECT_EQ(AirGap::create(VERSION_DEFAULT, std::vector<std::uint8_t>(34, 1), ag),
              Error::InvalidInstanceId);
    EXPECT_EQ(error_kind(Error::InvalidInstanceId), ErrorKind::Config);
    EXPECT_FALSE(ag.has_value());
}

TEST(AirGap, SetChunkSize_ValidatesEagerly)
{
    AirGap ag = make_airgap();
    EXPECT_EQ(ag.chunk_size(), chunk::DEFAULT_CHUNK_SIZE);
    EXPECT_EQ(ag.set_chunk_size(5), Error::ChunkSizeTooSmall);
    EXPECT_EQ(ag.set_chunk_size(65536), Error::ChunkSizeTooLarge);
    EXPECT_EQ(ag.chunk_size(), chunk::DEFAULT_CHUNK_SIZE);
    EXPECT_EQ(ag.set_chunk_size(6), Error::Ok);
    EXPECT_EQ(ag.set_chunk_size(65535), Error::Ok);
    EXPECT_EQ(ag.chunk_size(), 65535u);
}

TEST(Message, Marshal_Layout)
{
    AirGap  ag  = make_airgap(3);
    Message msg = ag.create_message();
    msg.add_operation(0x0102, bytes_of("xyz"));

    std::vector<std::uint8_t> out;
    ASSERT_EQ(msg.marshal(out), Error::Ok);
    ASSERT_EQ(out.size(), ENVELOPE_HDR_SIZE + OP_HDR_SIZE + 3);
    EXPECT_EQ(out[0], 3);
    EXPECT_TRUE(std::equal(ag.instance_id().begin(), ag.instance_id().end(), out.begin() + 1));

    const std::uint8_t *op = out.data() + ENVELOPE_HDR_SIZE;
    EXPECT_EQ(op[0], 0x01);  // op_code, big-endian
    EXPECT_EQ(op[1], 0x02);
    EXPECT_EQ(op[2], 0x00);  // size, big-endian
    EXPECT_EQ(op[3], 0x00);
    EXPECT_EQ(op[4], 0x00);
    EXPECT_EQ(op[5], 0x03);
    EXPECT_EQ(op[6], 'x');
    EXPECT_EQ(op[8], 'z');
}

TEST(Message, BuildersDoNotAlias)
{
    AirGap  ag = make_airgap();
    Message a  = ag.create_message();
    Message b  = ag.create_message();
    a.add_operation(OP_TEST_1, "only in a");
    EXPECT_EQ(a.payload().size(), 1u);
    EXPECT_TRUE(b.payload().empty());

    Message c = a;
    c.add_operation(OP_TEST_2, "only in c");
    EXPECT_EQ(a.payload().size(), 1u);
    EXPECT_EQ(c.payload().size(), 2u);
}

TEST(Message, Roundtrip_Plain)
{
    AirGap  ag  = make_airgap();
    Message msg = ag.create_message();
    msg.add_operation(OP_TEST_1, "a").add_operation(OP_TEST_2, "bb").add_operation(OP_TEST_3, "ccc");

    std::vector<std::string> frames;
    ASSERT_EQ(msg.marshal_chunks(frames), Error::Ok);
    ASSERT_FALSE(frames.empty());

    Message got;
    ASSERT_EQ(ag.unmarshal(reassemble(frames), got), Error::Ok);
    EXPECT_EQ(got.version(), VERSION_DEFAULT);
    EXPECT_EQ(got.instance_id(), ag.instance_id());
    EXPECT_EQ(got.payload(), expected_ops());
}

TEST(Message, Roundtrip_Sodium)
{
    auto cipher = aead::SodiumPskAead::FromHex(TEST_KEY);
    ASSERT_TRUE(cipher.has_value());

    AirGap ag = make_airgap();
    ag.set_cipher(&*cipher);
    ASSERT_EQ(ag.set_chunk_size(32), Error::Ok);

    Message msg = ag.create_message();
    msg.add_operation(OP_TEST_1, "a").add_operation(OP_TEST_2, "bb").add_operation(OP_TEST_3, "ccc");

    std::vector<std::string> frames, frames2;
    ASSERT_EQ(msg.marshal_chunks(frames), Error::Ok);
    ASSERT_EQ(msg.marshal_chunks(frames2), Error::Ok);
    ASSERT_GT(frames.size(), 1u);
    // fresh nonce per marshal
    EXPECT_NE(frames, frames2);

    Message got;
    ASSERT_EQ(ag.unmarshal(reassemble(frames), got), Error::Ok);
    EXPECT_EQ(got.payload(), expected_ops());
    ASSERT_EQ(ag.unmarshal(reassemble(frames2), got), Error::Ok);
    EXPECT_EQ(got.payload(), expected_ops());
}

TEST(Message, MarshalChunks_IdempotentWithDeterministicCipher)
{
    aead::NoopPskAead noop;
    AirGap            ag = make_airgap();
    ag.set_cipher(&noop);

    Message msg = ag.create_message();
    msg.add_operation(OP_TEST_1, "a").add_operation(OP_TEST_2, "bb").add_operation(OP_TEST_3, "ccc");

    std::vector<std::string> frames, frames2;
    ASSERT_EQ(msg.marshal_chunks(frames), Error::Ok);
    ASSERT_EQ(msg.marshal_chunks(frames2), Error::Ok);
    EXPECT_EQ(frames, frames2);

    Message got;
    ASSERT_EQ(ag.unmarshal(reassemble(frames), got), Error::Ok);
    EXPECT_EQ(got.payload(), expected_ops());
}

TEST(Message, UnmarshalChunks_FromBuffer)
{
    AirGap  ag  = make_airgap();
    Message msg = ag.create_message();
    msg.add_operation(7, std::vector<std::uint8_t>{0x00, 0xFF, 0x10});

    std::vector<std::string> frames;
    ASSERT_EQ(msg.marshal_chunks(frames), Error::Ok);

    chunk::Buffer rx;
    Message       got;
    EXPECT_EQ(ag.unmarshal_chunks(rx, got), Error::IncompleteMessage);

    for (const auto &f : frames)
        ASSERT_EQ(rx.read_chunk(f), Error::Ok);
    ASSERT_EQ(ag.unmarshal_chunks(rx, got), Error::Ok);
    ASSERT_EQ(got.payload().size(), 1u);
    EXPECT_EQ(got.payload()[0].op_code, 7u);
    EXPECT_EQ(got.payload()[0].data, (std::vector<std::uint8_t>{0x00, 0xFF, 0x10}));
}

TEST(Message, EmptyOperationsAndEmptyData)
{
    AirGap                    ag = make_airgap();
    std::vector<std::uint8_t> env;
    Message                   got;

    ASSERT_EQ(ag.create_message().marshal(env), Error::Ok);
    EXPECT_EQ(env.size(), ENVELOPE_HDR_SIZE);
    ASSERT_EQ(ag.unmarshal(env, got), Error::Ok);
    EXPECT_TRUE(got.payload().empty());

    Message msg = ag.create_message();
    msg.add_operation(9, "");
    ASSERT_EQ(msg.marshal(env), Error::Ok);
    ASSERT_EQ(ag.unmarshal(env, got), Error::Ok);
    ASSERT_EQ(got.payload().size(), 1u);
    EXPECT_EQ(got.payload()[0].size, 0u);
}

TEST(Message, Unmarshal_VersionRejection)
{
    AirGap                    receiver = make_airgap(2);
    std::vector<std::uint8_t> env;
    Message                   got;

    ASSERT_EQ(make_airgap(1).create_message().add_operation(1, "x").marshal(env), Error::Ok);
    EXPECT_EQ(receiver.unmarshal(env, got), Error::VersionTooOld);

    ASSERT_EQ(make_airgap(3).create_message().add_operation(1, "x").marshal(env), Error::Ok);
    EXPECT_EQ(receiver.unmarshal(env, got), Error::VersionTooNew);
    EXPECT_EQ(error_kind(Error::VersionTooNew), ErrorKind::Negotiation);

    ASSERT_EQ(make_airgap(2).create_message().add_operation(1, "x").marshal(env), Error::Ok);
    EXPECT_EQ(receiver.unmarshal(env, got), Error::Ok);
}

TEST(Message, Unmarshal_InstanceMismatch)
{
    AirGap                    receiver = make_airgap(VERSION_DEFAULT, 1);
    AirGap                    other    = make_airgap(VERSION_DEFAULT, 2);
    std::vector<std::uint8_t> env;
    Message                   got;

    ASSERT_EQ(other.create_message().add_operation(1, "x").marshal(env), Error::Ok);
    EXPECT_EQ(receiver.unmarshal(env, got), Error::InstanceMismatch);
    EXPECT_TRUE(got.payload().empty());
}

TEST(Message, Unmarshal_Truncated)
{
    AirGap                    ag = make_airgap();
    std::vector<std::uint8_t> env;
    Message                   got;

    ASSERT_EQ(ag.create_message().add_operation(1, "hello").marshal(env), Error::Ok);

    // declared size runs past the end
    auto cut = env;
    cut.pop_back();
    EXPECT_EQ(ag.unmarshal(cut, got), Error::TruncatedOperation);

    // partial record header
    cut.assign(env.begin(), env.begin() + ENVELOPE_HDR_SIZE + 3);
    EXPECT_EQ(ag.unmarshal(cut, got), Error::TruncatedOperation);

    cut.assign(env.begin(), env.begin() + ENVELOPE_HDR_SIZE - 1);
    EXPECT_EQ(ag.unmarshal(cut, got), Error::TruncatedEnvelope);
    EXPECT_EQ(ag.unmarshal({}, got), Error::TruncatedEnvelope);
}

TEST(Message, CipherFailuresPropagate)
{
    FailingCipher bad;
    AirGap        ag = make_airgap();
    ag.set_cipher(&bad);

    std::vector<std::uint8_t> env;
    std::vector<std::string>  frames;
    Message                   msg = ag.create_message();
    msg.add_operation(1, "x");
    EXPECT_EQ(msg.marshal(env), Error::EncryptionError);
    EXPECT_EQ(msg.marshal_chunks(frames), Error::EncryptionError);
    EXPECT_TRUE(frames.empty());

    Message got;
    EXPECT_EQ(ag.unmarshal(std::vector<std::uint8_t>(64, 0), got), Error::DecryptionError);
}

TEST(Message, Unmarshal_WrongKey)
{
    auto k1 = aead::SodiumPskAead::FromHex(TEST_KEY);
    auto k2 = aead::SodiumPskAead::FromHex(
        "ffeeddccbbaa99887766554433221100ffeeddccbbaa99887766554433221100");
    ASSERT_TRUE(k1 && k2);

    AirGap sender = make_airgap();
    sender.set_cipher(&*k1);
    AirGap receiver = make_airgap();
    receiver.set_cipher(&*k2);

    std::vector<std::string> frames;
    ASSERT_EQ(sender.create_message().add_operation(1, "secret").marshal_chunks(frames),
              Error::Ok);

    Message got;
    EXPECT_EQ(receiver.unmarshal(reassemble(frames), got), Error::DecryptionError);
    EXPECT_EQ(error_kind(Error::DecryptionError), ErrorKind::Crypto);
}
