// AdaptiveRateController.h — Подбор размера chunk'а по измеренной скорости

#pragma once

#include "../export.h"
#include "../Types.h"
#include "../TransferConfig.h"
#include <deque>
#include <cstdint>
#include <cstddef>

namespace Innerocket {

/// Окно последних замеров пропускной способности (MB/s).
/// Среднее выше fastThreshold — chunk растёт ×1.5, ниже slowThreshold —
/// уменьшается ÷1.5; результат всегда в [minChunkSize, maxChunkSize].
///
/// Не потокобезопасен: принадлежит одной TransferSession.
class IR_API AdaptiveRateController {
public:
    explicit AdaptiveRateController(const TransferConfig& config = TransferConfig{});

    /// Учесть замер и вернуть размер следующего chunk'а
    /// @param current Текущий размер chunk'а
    /// @param lastChunkBytes Байт в последнем chunk'е
    /// @param lastChunkElapsedMs Время отправки; при <= 0 замер игнорируется
    size_t nextChunkSize(size_t current, size_t lastChunkBytes, double lastChunkElapsedMs);

    /// Стартовый размер chunk'а для файла
    size_t initialChunkSize(int64_t fileSize) const;

    /// Пауза между chunk'ами (мс) с учётом размера файла и качества связи
    int64_t pacingDelay(int64_t fileSize) const;

    ConnectionQuality connectionQuality() const { return m_quality; }

    /// Средняя скорость по окну, байт/сек (0 если замеров нет)
    double smoothedBytesPerSecond() const;

    size_t sampleCount() const { return m_samples.size(); }
    void reset();

private:
    size_t clamp(size_t size) const;

    size_t m_minChunkSize;
    size_t m_maxChunkSize;
    size_t m_defaultChunkSize;
    double m_fastThreshold;
    double m_slowThreshold;
    size_t m_window;

    std::deque<double> m_samples;   // MB/s
    ConnectionQuality m_quality = ConnectionQuality::Medium;
};

} // namespace Innerocket
