#pragma once

#include "Types.h"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace Innerocket {

// ═══════════════════════════════════════════════════════════
// Метаданные передаваемого файла
// ═══════════════════════════════════════════════════════════

struct FileMetadata {
    std::string id;                         // Уникален для каждой передачи
    std::string name;
    int64_t size = 0;                       // Байты, > 0
    std::string mimeType;
    std::optional<std::string> checksum;    // SHA-256 hex, заполняется отправителем после хеширования
    bool useFEC = false;
    double fecParityRatio = 0.0;            // Доля parity chunk'ов на блок (0.0–1.0)
};

// ═══════════════════════════════════════════════════════════
// Подключённый пир
// ═══════════════════════════════════════════════════════════

struct PeerInfo {
    std::string id;
    std::string name;                       // Может быть пустым
    int64_t connectedAt = 0;                // Unix timestamp (ms)
};

// ═══════════════════════════════════════════════════════════
// Входящий запрос на передачу
// ═══════════════════════════════════════════════════════════

struct FileTransferRequest {
    FileMetadata metadata;
    PeerInfo from;
};

// ═══════════════════════════════════════════════════════════
// Экономия от сжатия chunk'ов (только по сжатым chunk'ам)
// ═══════════════════════════════════════════════════════════

struct CompressionSavings {
    int64_t savedBytes = 0;
    double savedPercentage = 0.0;           // 0–100, два знака
};

// ═══════════════════════════════════════════════════════════
// Запись о передаче — снимок состояния TransferSession
// ═══════════════════════════════════════════════════════════

struct TransferRecord {
    std::string id;
    std::string fileName;
    int64_t fileSize = 0;
    std::string fileType;
    std::string sender;                     // PeerId отправителя ("" = мы)
    std::string receiver;                   // PeerId получателя ("" = мы)
    int32_t progress = 0;                   // 0–100
    TransferStatus status = TransferStatus::Pending;
    TransferDirection direction = TransferDirection::Receive;
    int64_t createdAt = 0;                  // Unix timestamp (ms)
    std::optional<std::string> checksum;
    double transferSpeed = 0.0;             // Байт/сек, сглаженная
    int64_t chunkSize = 0;                  // Текущий размер chunk'а
    int64_t bytesTransferred = 0;
    bool useFEC = false;
    CompressionSavings compressionSavings;
    TransferErrorKind errorKind = TransferErrorKind::None;
    std::string error;

    bool isTerminal() const { return isTerminalStatus(status); }
};

} // namespace Innerocket
