// TransferProtocol.h — Формат кадров и сообщений передачи файлов

#pragma once

#include "../export.h"
#include "../Models.h"
#include "../Transfer/ChunkCodec.h"
#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace Innerocket {

// ═══════════════════════════════════════════════════════════
// Константы протокола
// ═══════════════════════════════════════════════════════════

constexpr uint32_t PROTOCOL_MAGIC = 0x49524B54;             // "IRKT" in big-endian
constexpr size_t MAX_MESSAGE_SIZE = 64 * 1024 * 1024;       // 64 MB max
constexpr size_t FRAME_HEADER_SIZE = 4 + 4 + 1 + 1;
constexpr size_t MAX_TRANSFER_ID_LENGTH = 255;              // IdLen:1

/// Причина file-reject для повторного file-request с уже известным id.
/// Отправитель такой reject игнорирует: первый запрос остаётся в силе.
constexpr const char* REJECT_REASON_DUPLICATE = "duplicate";

/// Отправитель отозвал запрос или отменил передачу
constexpr const char* REJECT_REASON_WITHDRAWN = "withdrawn";

// ═══════════════════════════════════════════════════════════
// MessageKind — типы сообщений
// ═══════════════════════════════════════════════════════════

enum class MessageKind : uint8_t {
    FileRequest = 0x30,
    FileAccept = 0x31,
    FileReject = 0x32,
    FileChunk = 0x33,
    FileComplete = 0x34,
};

IR_API const char* messageKindName(MessageKind kind);
IR_API bool isKnownMessageKind(uint8_t code);

// ═══════════════════════════════════════════════════════════
// Message — кадр протокола
// ═══════════════════════════════════════════════════════════

struct IR_API Message {
    MessageKind kind;
    std::string transferId;
    std::vector<uint8_t> payload;   // JSON или бинарный chunk

    Message() : kind(MessageKind::FileRequest) {}
    Message(MessageKind k, const std::string& id) : kind(k), transferId(id) {}

    void setJsonPayload(const std::string& json);
    std::string getJsonPayload() const;
};

// ═══════════════════════════════════════════════════════════
// MessageSerializer — сериализация/десериализация кадров
// ═══════════════════════════════════════════════════════════

class IR_API MessageSerializer {
public:
    /// Формат: [Magic:4][Length:4][Kind:1][IdLen:1][TransferId:N][Payload:M]
    static std::vector<uint8_t> serialize(const Message& msg);

    /// @return Message или nullopt при ошибке (код kind не проверяется)
    static std::optional<Message> deserialize(const uint8_t* data, size_t size);
    static std::optional<Message> deserialize(const std::vector<uint8_t>& data);

    /// Размер кадра в начале буфера или 0, если заголовок неполный/некорректный
    static size_t getMessageSize(const uint8_t* data, size_t available);
};

// ═══════════════════════════════════════════════════════════
// Payload'ы сообщений
// ═══════════════════════════════════════════════════════════

/// file-request: {metadata, from:{id,name}}
struct IR_API FileRequestPayload {
    FileMetadata metadata;
    PeerInfo from;

    std::string toJson() const;
    static std::optional<FileRequestPayload> fromJson(const std::string& json);
};

/// file-accept: {metadata}
struct IR_API FileAcceptPayload {
    FileMetadata metadata;

    std::string toJson() const;
    static std::optional<FileAcceptPayload> fromJson(const std::string& json);
};

/// file-reject: {metadata, reason?}
struct IR_API FileRejectPayload {
    FileMetadata metadata;
    std::string reason;             // Пустая = отказ пользователя

    std::string toJson() const;
    static std::optional<FileRejectPayload> fromJson(const std::string& json);
};

/// file-complete: {transferId, checksum, compressionSavings?}
struct IR_API FileCompletePayload {
    std::string transferId;
    std::string checksum;
    CompressionSavings compressionSavings;

    std::string toJson() const;
    static std::optional<FileCompletePayload> fromJson(const std::string& json);
};

/// Бинарный заголовок file-chunk (всё big-endian), за ним байты chunk'а
struct IR_API FileChunkHeader {
    static constexpr size_t HEADER_SIZE =
        4 + 4 + 1 + 4 + 4 + 8 + 4 + 8 + 8 + 4 + 4 + 4 + 4 + 1 + 4;  // 66

    static std::vector<uint8_t> serialize(const ChunkMessage& chunk);

    /// Разобрать заголовок и payload; transferId берётся из кадра
    static std::optional<ChunkMessage> deserialize(const std::string& transferId,
                                                   const uint8_t* data, size_t size);
};

/// Наибольший несжатый chunk, который помещается в один кадр
constexpr size_t MAX_CHUNK_PAYLOAD_SIZE =
    MAX_MESSAGE_SIZE - FRAME_HEADER_SIZE - MAX_TRANSFER_ID_LENGTH - FileChunkHeader::HEADER_SIZE;

/// FileMetadata <-> JSON (ключи id, name, size, mimeType, checksum, useFEC, fecParityRatio)
IR_API std::string fileMetadataToJson(const FileMetadata& metadata);
IR_API std::optional<FileMetadata> fileMetadataFromJson(const std::string& json);

// ═══════════════════════════════════════════════════════════
// ProtocolMessage — типизированное сообщение
// ═══════════════════════════════════════════════════════════

using ProtocolMessage = std::variant<FileRequestPayload,
                                     FileAcceptPayload,
                                     FileRejectPayload,
                                     ChunkMessage,
                                     FileCompletePayload>;

IR_API MessageKind messageKindOf(const ProtocolMessage& message);
IR_API std::string transferIdOf(const ProtocolMessage& message);

class IR_API ProtocolCodec {
public:
    static Message toMessage(const ProtocolMessage& message);
    static std::optional<ProtocolMessage> fromMessage(const Message& message);

    /// Сообщение -> готовый кадр
    static std::vector<uint8_t> encode(const ProtocolMessage& message);

    /// Кадр -> сообщение; nullopt для неизвестного kind или битого payload
    static std::optional<ProtocolMessage> decode(const uint8_t* data, size_t size);
    static std::optional<ProtocolMessage> decode(const std::vector<uint8_t>& data) {
        return decode(data.data(), data.size());
    }
};

} // namespace Innerocket
