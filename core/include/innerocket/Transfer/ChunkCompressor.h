// ChunkCompressor.h — Сжатие chunk'ов перед отправкой (zlib deflate)

#pragma once

#include "../export.h"
#include "../Models.h"
#include "../TransferConfig.h"
#include "../Types.h"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace Innerocket {

// ═══════════════════════════════════════════════════════════
// ChunkCompressor
// ═══════════════════════════════════════════════════════════

/// Сжимается только payload на проводе: CRC, FEC и SHA-256 всегда
/// считаются по несжатым байтам.
class IR_API ChunkCompressor {
public:
    /// Стоит ли сжимать файл: текстовые MIME типы, кроме уже сжатых форматов
    static bool shouldCompress(const std::string& fileName, const std::string& mimeType,
                               int64_t fileSize, const TransferConfig& config);

    /// Уровень deflate по качеству соединения
    static int levelFor(ConnectionQuality quality);

    /// Сжать chunk
    /// @return сжатые байты или nullopt, если chunk меньше порога
    ///         или сжатие экономит меньше, чем требует maxCompressionRatio
    static std::optional<std::vector<uint8_t>> compress(const uint8_t* data, size_t size,
                                                        int level, const TransferConfig& config);
    static std::optional<std::vector<uint8_t>> compress(const std::vector<uint8_t>& data,
                                                        int level, const TransferConfig& config) {
        return compress(data.data(), data.size(), level, config);
    }

    /// Распаковать ровно originalSize байт
    /// @return nullopt для повреждённых данных или другой длины
    static std::optional<std::vector<uint8_t>> decompress(const uint8_t* data, size_t size,
                                                          size_t originalSize);

    static CompressionSavings savings(int64_t originalBytes, int64_t compressedBytes);
};

} // namespace Innerocket
