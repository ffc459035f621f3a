// Checksum.h — Контрольные суммы: SHA-256 файла и CRC32 chunk'а

#pragma once

#include "export.h"
#include <string>
#include <vector>
#include <memory>
#include <cstdint>
#include <cstddef>

namespace Innerocket {

class FileSource;

// ═══════════════════════════════════════════════════════════
// Sha256Hasher — потоковый SHA-256 (OpenSSL EVP)
// ═══════════════════════════════════════════════════════════

class IR_API Sha256Hasher {
public:
    Sha256Hasher();
    ~Sha256Hasher();

    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;

    /// Добавить данные
    /// @return false если EVP вернул ошибку (hasher становится невалидным)
    bool update(const uint8_t* data, size_t size);
    bool update(const std::vector<uint8_t>& data) { return update(data.data(), data.size()); }

    /// Завершить и вернуть hex digest (64 символа)
    /// @return пустая строка при ошибке или повторном вызове
    std::string finalizeHex();

    bool isValid() const;

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

/// SHA-256 буфера целиком (hex)
IR_API std::string computeChecksum(const uint8_t* data, size_t size);
IR_API std::string computeChecksum(const std::vector<uint8_t>& data);

/// SHA-256 содержимого источника, читается слайсами
/// @return hex digest или пустая строка при ошибке чтения
IR_API std::string computeChecksum(FileSource& source, size_t sliceSize = 2 * 1024 * 1024);

/// CRC32 (IEEE 802.3) для проверки отдельных chunk'ов
IR_API uint32_t crc32(const uint8_t* data, size_t size);

/// Сгенерировать ID передачи (UUID v4 формат)
IR_API std::string generateTransferId();

} // namespace Innerocket
