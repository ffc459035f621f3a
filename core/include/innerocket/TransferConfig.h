// TransferConfig.h — Настройки движка передачи файлов

#pragma once

#include "export.h"
#include <string>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace Innerocket {

// ═══════════════════════════════════════════════════════════
// Константы по умолчанию
// ═══════════════════════════════════════════════════════════

constexpr size_t DEFAULT_CHUNK_SIZE = 1024 * 1024;         // 1 MB
constexpr size_t MIN_CHUNK_SIZE = 256 * 1024;              // 256 KB
constexpr size_t MAX_CHUNK_SIZE = 4 * 1024 * 1024;         // 4 MB
constexpr size_t MAX_FEC_BLOCK_CHUNKS = 64;                // Ширина chunkMap
constexpr size_t DEFAULT_FEC_BLOCK_CHUNKS = 10;
constexpr int64_t DEFAULT_MAX_FILE_SIZE = 2LL * 1024 * 1024 * 1024;  // 2 GB
constexpr size_t DEFAULT_MAX_BUFFERED_BYTES = 16 * 1024 * 1024;      // 16 MB
constexpr size_t DEFAULT_COMPRESSION_MIN_SIZE = 1024;                // 1 KB
constexpr int64_t DEFAULT_IDLE_TIMEOUT_MS = 60 * 1000;

// ═══════════════════════════════════════════════════════════
// TransferConfig
// ═══════════════════════════════════════════════════════════

struct IR_API TransferConfig {
    // Размеры chunk'ов
    size_t defaultChunkSize = DEFAULT_CHUNK_SIZE;
    size_t minChunkSize = MIN_CHUNK_SIZE;
    size_t maxChunkSize = MAX_CHUNK_SIZE;
    bool adaptiveChunkSize = true;

    // AdaptiveRateController
    double fastThresholdMBps = 8.0;
    double slowThresholdMBps = 1.0;
    size_t rateWindow = 5;

    // FEC
    bool useFEC = false;
    double defaultParityRatio = 0.0;
    size_t fecBlockChunks = DEFAULT_FEC_BLOCK_CHUNKS;

    // Сжатие chunk'ов (только для текстовых типов файлов)
    bool enableCompression = true;
    size_t compressionMinSize = DEFAULT_COMPRESSION_MIN_SIZE;
    double maxCompressionRatio = 0.95;     // Сжатый chunk не меньше этой доли -> без сжатия

    // Лимиты и flow control
    int64_t maxFileSize = DEFAULT_MAX_FILE_SIZE;
    size_t maxBufferedBytes = DEFAULT_MAX_BUFFERED_BYTES;
    int64_t progressIntervalMs = 100;

    /// Получатель без новых данных дольше этого срока -> failed (Timeout); 0 = без срока
    int64_t idleTimeoutMs = DEFAULT_IDLE_TIMEOUT_MS;

    // Логирование: trace/debug/info/warn/error/off
    std::string logLevel = "info";

    /// Проверить согласованность значений
    /// @throws std::invalid_argument при некорректной конфигурации
    void validate() const;

    std::string toJson() const;

    /// Разобрать JSON; отсутствующие ключи берутся по умолчанию
    /// @return конфигурация или nullopt при ошибке разбора/валидации
    static std::optional<TransferConfig> fromJson(const std::string& json);

    /// Загрузить из JSON-файла
    static std::optional<TransferConfig> loadFromFile(const std::string& path);
};

} // namespace Innerocket
