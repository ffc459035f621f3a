// FileSource.h — Доступ к байтам отправляемого файла

#pragma once

#include "export.h"
#include <string>
#include <vector>
#include <optional>
#include <mutex>
#include <fstream>
#include <cstdint>
#include <cstddef>

namespace Innerocket {

// ═══════════════════════════════════════════════════════════
// FileSource — источник байтов (внешний коллаборатор)
// ═══════════════════════════════════════════════════════════

/// Ядро не работает с файловой системой напрямую: отправитель читает
/// файл слайсами через этот интерфейс. Реализации должны допускать
/// вызов readSlice из фонового потока.
class IR_API FileSource {
public:
    virtual ~FileSource() = default;

    virtual std::string name() const = 0;
    virtual std::string mimeType() const = 0;
    virtual int64_t size() const = 0;

    /// Прочитать [offset, offset + length)
    /// @return байты (последний слайс может быть короче) или nullopt при ошибке
    virtual std::optional<std::vector<uint8_t>> readSlice(int64_t offset, size_t length) = 0;
};

// ═══════════════════════════════════════════════════════════
// LocalFileSource — файл на диске
// ═══════════════════════════════════════════════════════════

class IR_API LocalFileSource : public FileSource {
public:
    /// @param path Путь к файлу
    /// @param mimeType MIME тип (пустой = определить по расширению)
    explicit LocalFileSource(const std::string& path, const std::string& mimeType = "");

    /// Файл открыт и имеет ненулевой размер
    bool isOpen() const;

    std::string name() const override { return m_name; }
    std::string mimeType() const override { return m_mimeType; }
    int64_t size() const override { return m_size; }
    std::optional<std::vector<uint8_t>> readSlice(int64_t offset, size_t length) override;

    /// MIME тип по расширению имени файла
    static std::string guessMimeType(const std::string& fileName);

private:
    std::string m_path;
    std::string m_name;
    std::string m_mimeType;
    int64_t m_size = 0;
    std::ifstream m_file;
    std::mutex m_mutex;
};

// ═══════════════════════════════════════════════════════════
// MemoryFileSource — буфер в памяти
// ═══════════════════════════════════════════════════════════

class IR_API MemoryFileSource : public FileSource {
public:
    MemoryFileSource(std::string name, std::string mimeType, std::vector<uint8_t> data)
        : m_name(std::move(name)), m_mimeType(std::move(mimeType)), m_data(std::move(data)) {}

    std::string name() const override { return m_name; }
    std::string mimeType() const override { return m_mimeType; }
    int64_t size() const override { return static_cast<int64_t>(m_data.size()); }
    std::optional<std::vector<uint8_t>> readSlice(int64_t offset, size_t length) override;

    const std::vector<uint8_t>& data() const { return m_data; }

private:
    std::string m_name;
    std::string m_mimeType;
    std::vector<uint8_t> m_data;
};

} // namespace Innerocket
