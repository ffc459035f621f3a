// TransferProtocol.cpp — Frame and message codec

#include "innerocket/Network/TransferProtocol.h"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace Innerocket {

using json = nlohmann::json;

namespace {

void writeU32(uint8_t*& ptr, uint32_t value) {
    ptr[0] = (value >> 24) & 0xFF;
    ptr[1] = (value >> 16) & 0xFF;
    ptr[2] = (value >> 8) & 0xFF;
    ptr[3] = value & 0xFF;
    ptr += 4;
}

void writeU64(uint8_t*& ptr, uint64_t value) {
    for (int i = 7; i >= 0; --i) {
        *ptr++ = (value >> (i * 8)) & 0xFF;
    }
}

uint32_t readU32(const uint8_t*& ptr) {
    uint32_t value = (static_cast<uint32_t>(ptr[0]) << 24) |
                     (static_cast<uint32_t>(ptr[1]) << 16) |
                     (static_cast<uint32_t>(ptr[2]) << 8) |
                     static_cast<uint32_t>(ptr[3]);
    ptr += 4;
    return value;
}

uint64_t readU64(const uint8_t*& ptr) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | *ptr++;
    }
    return value;
}

json metadataToJsonObject(const FileMetadata& m) {
    json j = {
        {"id", m.id},
        {"name", m.name},
        {"size", m.size},
        {"mimeType", m.mimeType},
        {"useFEC", m.useFEC},
        {"fecParityRatio", m.fecParityRatio}
    };
    j["checksum"] = m.checksum ? json(*m.checksum) : json(nullptr);
    return j;
}

// Throws nlohmann::json exceptions on missing/ill-typed required keys
FileMetadata metadataFromJsonObject(const json& j) {
    FileMetadata m;
    m.id = j.at("id").get<std::string>();
    m.name = j.at("name").get<std::string>();
    m.size = j.at("size").get<int64_t>();
    m.mimeType = j.value("mimeType", "");
    if (j.contains("checksum") && j["checksum"].is_string()) {
        m.checksum = j["checksum"].get<std::string>();
    }
    m.useFEC = j.value("useFEC", false);
    m.fecParityRatio = j.value("fecParityRatio", 0.0);
    if (m.id.empty()) {
        throw std::invalid_argument("empty transfer id");
    }
    return m;
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════
// MessageKind names
// ═══════════════════════════════════════════════════════════

const char* messageKindName(MessageKind kind) {
    switch (kind) {
        case MessageKind::FileRequest: return "file-request";
        case MessageKind::FileAccept: return "file-accept";
        case MessageKind::FileReject: return "file-reject";
        case MessageKind::FileChunk: return "file-chunk";
        case MessageKind::FileComplete: return "file-complete";
        default: return "unknown";
    }
}

bool isKnownMessageKind(uint8_t code) {
    return code >= static_cast<uint8_t>(MessageKind::FileRequest) &&
           code <= static_cast<uint8_t>(MessageKind::FileComplete);
}

// ═══════════════════════════════════════════════════════════
// Message
// ═══════════════════════════════════════════════════════════

void Message::setJsonPayload(const std::string& json) {
    payload.assign(json.begin(), json.end());
}

std::string Message::getJsonPayload() const {
    return std::string(payload.begin(), payload.end());
}

// ═══════════════════════════════════════════════════════════
// MessageSerializer
// ═══════════════════════════════════════════════════════════

std::vector<uint8_t> MessageSerializer::serialize(const Message& msg) {
    size_t idLen = std::min(msg.transferId.size(), size_t(255));
    size_t totalSize = FRAME_HEADER_SIZE + idLen + msg.payload.size();

    std::vector<uint8_t> result(totalSize);
    uint8_t* ptr = result.data();

    writeU32(ptr, PROTOCOL_MAGIC);
    writeU32(ptr, static_cast<uint32_t>(totalSize));

    *ptr++ = static_cast<uint8_t>(msg.kind);
    *ptr++ = static_cast<uint8_t>(idLen);
    if (idLen > 0) {
        memcpy(ptr, msg.transferId.data(), idLen);
        ptr += idLen;
    }

    if (!msg.payload.empty()) {
        memcpy(ptr, msg.payload.data(), msg.payload.size());
    }

    return result;
}

std::optional<Message> MessageSerializer::deserialize(const uint8_t* data, size_t size) {
    if (!data || size < FRAME_HEADER_SIZE) {
        return std::nullopt;
    }

    const uint8_t* ptr = data;
    uint32_t magic = readU32(ptr);
    if (magic != PROTOCOL_MAGIC) {
        spdlog::debug("Protocol: Invalid magic 0x{:08X}", magic);
        return std::nullopt;
    }

    uint32_t len = readU32(ptr);
    if (len < FRAME_HEADER_SIZE || len > MAX_MESSAGE_SIZE || len > size) {
        spdlog::debug("Protocol: Invalid length {}", len);
        return std::nullopt;
    }

    Message msg;
    msg.kind = static_cast<MessageKind>(*ptr++);

    uint8_t idLen = *ptr++;
    if (idLen > 0) {
        if (ptr + idLen > data + len) {
            return std::nullopt;
        }
        msg.transferId.assign(reinterpret_cast<const char*>(ptr), idLen);
        ptr += idLen;
    }

    size_t payloadSize = static_cast<size_t>((data + len) - ptr);
    if (payloadSize > 0) {
        msg.payload.assign(ptr, ptr + payloadSize);
    }

    return msg;
}

std::optional<Message> MessageSerializer::deserialize(const std::vector<uint8_t>& data) {
    return deserialize(data.data(), data.size());
}

size_t MessageSerializer::getMessageSize(const uint8_t* data, size_t available) {
    if (available < 8) {
        return 0;
    }

    const uint8_t* ptr = data;
    if (readU32(ptr) != PROTOCOL_MAGIC) {
        return 0;
    }

    uint32_t len = readU32(ptr);
    if (len < FRAME_HEADER_SIZE || len > MAX_MESSAGE_SIZE) {
        return 0;
    }
    return len;
}

// ═══════════════════════════════════════════════════════════
// FileMetadata JSON
// ═══════════════════════════════════════════════════════════

std::string fileMetadataToJson(const FileMetadata& metadata) {
    return metadataToJsonObject(metadata).dump();
}

std::optional<FileMetadata> fileMetadataFromJson(const std::string& jsonStr) {
    try {
        return metadataFromJsonObject(json::parse(jsonStr));
    } catch (const std::exception& e) {
        spdlog::warn("Protocol: Invalid metadata JSON: {}", e.what());
        return std::nullopt;
    }
}

// ═══════════════════════════════════════════════════════════
// FileRequestPayload
// ═══════════════════════════════════════════════════════════

std::string FileRequestPayload::toJson() const {
    json j = {
        {"metadata", metadataToJsonObject(metadata)},
        {"from", {{"id", from.id}, {"name", from.name}}}
    };
    return j.dump();
}

std::optional<FileRequestPayload> FileRequestPayload::fromJson(const std::string& jsonStr) {
    try {
        auto j = json::parse(jsonStr);
        FileRequestPayload p;
        p.metadata = metadataFromJsonObject(j.at("metadata"));
        if (j.contains("from") && j["from"].is_object()) {
            p.from.id = j["from"].value("id", "");
            p.from.name = j["from"].value("name", "");
        }
        return p;
    } catch (const std::exception& e) {
        spdlog::warn("Protocol: Failed to parse file-request: {}", e.what());
        return std::nullopt;
    }
}

// ═══════════════════════════════════════════════════════════
// FileAcceptPayload / FileRejectPayload
// ═══════════════════════════════════════════════════════════

std::string FileAcceptPayload::toJson() const {
    json j = {{"metadata", metadataToJsonObject(metadata)}};
    return j.dump();
}

std::optional<FileAcceptPayload> FileAcceptPayload::fromJson(const std::string& jsonStr) {
    try {
        auto j = json::parse(jsonStr);
        FileAcceptPayload p;
        p.metadata = metadataFromJsonObject(j.at("metadata"));
        return p;
    } catch (const std::exception& e) {
        spdlog::warn("Protocol: Failed to parse file-accept: {}", e.what());
        return std::nullopt;
    }
}

std::string FileRejectPayload::toJson() const {
    json j = {{"metadata", metadataToJsonObject(metadata)}};
    if (!reason.empty()) {
        j["reason"] = reason;
    }
    return j.dump();
}

std::optional<FileRejectPayload> FileRejectPayload::fromJson(const std::string& jsonStr) {
    try {
        auto j = json::parse(jsonStr);
        FileRejectPayload p;
        p.metadata = metadataFromJsonObject(j.at("metadata"));
        p.reason = j.value("reason", "");
        return p;
    } catch (const std::exception& e) {
        spdlog::warn("Protocol: Failed to parse file-reject: {}", e.what());
        return std::nullopt;
    }
}

// ═══════════════════════════════════════════════════════════
// FileCompletePayload
// ═══════════════════════════════════════════════════════════

std::string FileCompletePayload::toJson() const {
    json j = {
        {"transferId", transferId},
        {"checksum", checksum}
    };
    if (compressionSavings.savedBytes > 0) {
        j["compressionSavings"] = {
            {"savedBytes", compressionSavings.savedBytes},
            {"savedPercentage", compressionSavings.savedPercentage}
        };
    }
    return j.dump();
}

std::optional<FileCompletePayload> FileCompletePayload::fromJson(const std::string& jsonStr) {
    try {
        auto j = json::parse(jsonStr);
        FileCompletePayload p;
        p.transferId = j.at("transferId").get<std::string>();
        p.checksum = j.value("checksum", "");
        if (j.contains("compressionSavings") && j["compressionSavings"].is_object()) {
            const auto& savings = j["compressionSavings"];
            p.compressionSavings.savedBytes = savings.value("savedBytes", int64_t(0));
            p.compressionSavings.savedPercentage = savings.value("savedPercentage", 0.0);
        }
        return p;
    } catch (const std::exception& e) {
        spdlog::warn("Protocol: Failed to parse file-complete: {}", e.what());
        return std::nullopt;
    }
}

// ═══════════════════════════════════════════════════════════
// FileChunkHeader
// ═══════════════════════════════════════════════════════════

std::vector<uint8_t> FileChunkHeader::serialize(const ChunkMessage& chunk) {
    std::vector<uint8_t> result(HEADER_SIZE + chunk.payload.size());
    uint8_t* ptr = result.data();

    writeU32(ptr, chunk.index);
    writeU32(ptr, chunk.totalChunks);
    *ptr++ = chunk.isParityChunk ? 1 : 0;
    writeU32(ptr, chunk.parityIndex);
    writeU32(ptr, chunk.totalParityChunks);
    writeU64(ptr, static_cast<uint64_t>(chunk.blockOffset));
    writeU32(ptr, chunk.blockSize);
    writeU64(ptr, chunk.chunkMap);
    writeU64(ptr, static_cast<uint64_t>(chunk.offset));
    writeU32(ptr, chunk.blockFirstIndex);
    writeU32(ptr, chunk.blockChunkCount);
    writeU32(ptr, chunk.blockChunkSize);
    writeU32(ptr, chunk.crc32);
    *ptr++ = chunk.isCompressed ? 1 : 0;
    writeU32(ptr, chunk.originalSize);

    if (!chunk.payload.empty()) {
        memcpy(ptr, chunk.payload.data(), chunk.payload.size());
    }
    return result;
}

std::optional<ChunkMessage> FileChunkHeader::deserialize(const std::string& transferId,
                                                         const uint8_t* data, size_t size) {
    if (!data || size < HEADER_SIZE) {
        return std::nullopt;
    }

    ChunkMessage c;
    c.transferId = transferId;
    const uint8_t* ptr = data;

    c.index = readU32(ptr);
    c.totalChunks = readU32(ptr);
    c.isParityChunk = (*ptr++ != 0);
    c.parityIndex = readU32(ptr);
    c.totalParityChunks = readU32(ptr);
    c.blockOffset = static_cast<int64_t>(readU64(ptr));
    c.blockSize = readU32(ptr);
    c.chunkMap = readU64(ptr);
    c.offset = static_cast<int64_t>(readU64(ptr));
    c.blockFirstIndex = readU32(ptr);
    c.blockChunkCount = readU32(ptr);
    c.blockChunkSize = readU32(ptr);
    c.crc32 = readU32(ptr);
    c.isCompressed = (*ptr++ != 0);
    c.originalSize = readU32(ptr);

    if (c.blockChunkCount == 0 || c.blockChunkCount > MAX_FEC_BLOCK_CHUNKS ||
        c.totalParityChunks > c.blockChunkCount) {
        spdlog::debug("Protocol: Bad block geometry ({} data, {} parity)",
                      c.blockChunkCount, c.totalParityChunks);
        return std::nullopt;
    }

    if (c.isCompressed && (c.originalSize == 0 || c.originalSize > MAX_CHUNK_PAYLOAD_SIZE)) {
        spdlog::debug("Protocol: Bad compressed chunk length {}", c.originalSize);
        return std::nullopt;
    }

    c.payload.assign(ptr, data + size);
    return c;
}

// ═══════════════════════════════════════════════════════════
// ProtocolCodec
// ═══════════════════════════════════════════════════════════

namespace {

struct KindVisitor {
    MessageKind operator()(const FileRequestPayload&) const { return MessageKind::FileRequest; }
    MessageKind operator()(const FileAcceptPayload&) const { return MessageKind::FileAccept; }
    MessageKind operator()(const FileRejectPayload&) const { return MessageKind::FileReject; }
    MessageKind operator()(const ChunkMessage&) const { return MessageKind::FileChunk; }
    MessageKind operator()(const FileCompletePayload&) const { return MessageKind::FileComplete; }
};

struct TransferIdVisitor {
    std::string operator()(const FileRequestPayload& p) const { return p.metadata.id; }
    std::string operator()(const FileAcceptPayload& p) const { return p.metadata.id; }
    std::string operator()(const FileRejectPayload& p) const { return p.metadata.id; }
    std::string operator()(const ChunkMessage& c) const { return c.transferId; }
    std::string operator()(const FileCompletePayload& p) const { return p.transferId; }
};

struct PayloadVisitor {
    std::vector<uint8_t> operator()(const ChunkMessage& c) const {
        return FileChunkHeader::serialize(c);
    }

    template<typename JsonPayload>
    std::vector<uint8_t> operator()(const JsonPayload& p) const {
        std::string s = p.toJson();
        return std::vector<uint8_t>(s.begin(), s.end());
    }
};

} // anonymous namespace

MessageKind messageKindOf(const ProtocolMessage& message) {
    return std::visit(KindVisitor{}, message);
}

std::string transferIdOf(const ProtocolMessage& message) {
    return std::visit(TransferIdVisitor{}, message);
}

Message ProtocolCodec::toMessage(const ProtocolMessage& message) {
    Message msg(messageKindOf(message), transferIdOf(message));
    msg.payload = std::visit(PayloadVisitor{}, message);
    return msg;
}

std::optional<ProtocolMessage> ProtocolCodec::fromMessage(const Message& message) {
    auto body = message.getJsonPayload();

    switch (message.kind) {
        case MessageKind::FileRequest:
            if (auto p = FileRequestPayload::fromJson(body)) return ProtocolMessage(std::move(*p));
            break;
        case MessageKind::FileAccept:
            if (auto p = FileAcceptPayload::fromJson(body)) return ProtocolMessage(std::move(*p));
            break;
        case MessageKind::FileReject:
            if (auto p = FileRejectPayload::fromJson(body)) return ProtocolMessage(std::move(*p));
            break;
        case MessageKind::FileChunk:
            if (auto c = FileChunkHeader::deserialize(message.transferId,
                                                      message.payload.data(),
                                                      message.payload.size())) {
                return ProtocolMessage(std::move(*c));
            }
            break;
        case MessageKind::FileComplete:
            if (auto p = FileCompletePayload::fromJson(body)) return ProtocolMessage(std::move(*p));
            break;
        default:
            spdlog::warn("Protocol: Unknown message kind 0x{:02X}",
                         static_cast<int>(message.kind));
            return std::nullopt;
    }

    spdlog::warn("Protocol: Malformed {} payload for {}",
                 messageKindName(message.kind), message.transferId);
    return std::nullopt;
}

std::vector<uint8_t> ProtocolCodec::encode(const ProtocolMessage& message) {
    return MessageSerializer::serialize(toMessage(message));
}

std::optional<ProtocolMessage> ProtocolCodec::decode(const uint8_t* data, size_t size) {
    auto msg = MessageSerializer::deserialize(data, size);
    if (!msg) {
        spdlog::warn("Protocol: Dropping malformed frame ({} bytes)", size);
        return std::nullopt;
    }
    return fromMessage(*msg);
}

} // namespace Innerocket
