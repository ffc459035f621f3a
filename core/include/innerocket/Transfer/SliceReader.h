// SliceReader.h — Фоновое чтение слайсов файла для отправителя

#pragma once

#include "../export.h"
#include "../FileSource.h"
#include <memory>
#include <future>
#include <optional>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace Innerocket {

using SliceResult = std::optional<std::vector<uint8_t>>;

/// Один рабочий поток, выполняющий FileSource::readSlice по очереди.
/// Сессии отправляют запрос и забирают результат через std::future,
/// поэтому медленный диск не блокирует поток отправки.
class IR_API SliceReader {
public:
    SliceReader();
    ~SliceReader();

    // Запрет копирования
    SliceReader(const SliceReader&) = delete;
    SliceReader& operator=(const SliceReader&) = delete;

    /// Поставить чтение в очередь
    /// @return future с байтами или nullopt (ошибка чтения / reader остановлен)
    std::future<SliceResult> requestSlice(std::shared_ptr<FileSource> source,
                                          int64_t offset, size_t length);

    /// Остановить поток; невыполненные запросы завершаются с nullopt
    void stop();

    bool isRunning() const;
    size_t pendingCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Innerocket
