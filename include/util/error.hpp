#pragma once
#include <cstdint>

namespace airgap
{

// Stable error identifiers, reported by name through error_name().
enum class Error : std::uint8_t
{
    Ok = 0,
    // configuration
    ChunkSizeTooSmall,
    ChunkSizeTooLarge,
    InvalidInstanceId,
    InvalidKey,
    InvalidNumber,
    // frames
    MalformedFrame,
    ChunkIndexOutOfRange,
    CountMismatch,
    // compression
    CompressionError,
    // crypto capability
    EncryptionError,
    DecryptionError,
    // negotiation
    VersionTooOld,
    VersionTooNew,
    InstanceMismatch,
    // structure
    TruncatedEnvelope,
    TruncatedOperation,
    IncompleteMessage,
    PayloadTooLarge,
};

enum class ErrorKind : std::uint8_t
{
    None,
    Config,
    Frame,
    Compression,
    Crypto,
    Negotiation,
    Structure,
};

inline const char *error_name(Error e)
{
    switch (e)
    {
        case Error::Ok:
            return "Ok";
        case Error::ChunkSizeTooSmall:
            return "ChunkSizeTooSmall";
        case Error::ChunkSizeTooLarge:
            return "ChunkSizeTooLarge";
        case Error::InvalidInstanceId:
            return "InvalidInstanceId";
        case Error::InvalidKey:
            return "InvalidKey";
        case Error::InvalidNumber:
            return "InvalidNumber";
        case Error::MalformedFrame:
            return "MalformedFrame";
        case Error::ChunkIndexOutOfRange:
            return "ChunkIndexOutOfRange";
        case Error::CountMismatch:
            return "CountMismatch";
        case Error::CompressionError:
            return "CompressionError";
        case Error::EncryptionError:
            return "EncryptionError";
        case Error::DecryptionError:
            return "DecryptionError";
        case Error::VersionTooOld:
            return "VersionTooOld";
        case Error::VersionTooNew:
            return "VersionTooNew";
        case Error::InstanceMismatch:
            return "InstanceMismatch";
        case Error::TruncatedEnvelope:
            return "TruncatedEnvelope";
        case Error::TruncatedOperation:
            return "TruncatedOperation";
        case Error::IncompleteMessage:
            return "IncompleteMessage";
        case Error::PayloadTooLarge:
            return "PayloadTooLarge";
    }
    return "?";
}

inline ErrorKind error_kind(Error e)
{
    switch (e)
    {
        case Error::Ok:
            return ErrorKind::None;
        case Error::ChunkSizeTooSmall:
        case Error::ChunkSizeTooLarge:
        case Error::InvalidInstanceId:
        case Error::InvalidKey:
        case Error::InvalidNumber:
            return ErrorKind::Config;
        case Error::MalformedFrame:
        case Error::ChunkIndexOutOfRange:
        case Error::CountMismatch:
            return ErrorKind::Frame;
        case Error::CompressionError:
            return ErrorKind::Compression;
        case Error::EncryptionError:
        case Error::DecryptionError:
            return ErrorKind::Crypto;
        case Error::VersionTooOld:
        case Error::VersionTooNew:
        case Error::InstanceMismatch:
            return ErrorKind::Negotiation;
        case Error::TruncatedEnvelope:
        case Error::TruncatedOperation:
        case Error::IncompleteMessage:
        case Error::PayloadTooLarge:
            return ErrorKind::Structure;
    }
    return ErrorKind::None;
}

}  // namespace airgap
