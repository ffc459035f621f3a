// AdaptiveRateController.cpp — Throughput-driven chunk sizing

#include "innerocket/Transfer/AdaptiveRateController.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <numeric>

namespace Innerocket {

namespace {

constexpr double BYTES_PER_MB = 1024.0 * 1024.0;
constexpr double GROWTH_FACTOR = 1.5;
constexpr int64_t LARGE_FILE_THRESHOLD = 100LL * 1024 * 1024;

} // anonymous namespace

AdaptiveRateController::AdaptiveRateController(const TransferConfig& config)
    : m_minChunkSize(config.minChunkSize)
    , m_maxChunkSize(std::max(config.maxChunkSize, config.minChunkSize))
    , m_defaultChunkSize(config.defaultChunkSize)
    , m_fastThreshold(config.fastThresholdMBps)
    , m_slowThreshold(config.slowThresholdMBps)
    , m_window(std::max<size_t>(config.rateWindow, 1)) {
}

size_t AdaptiveRateController::clamp(size_t size) const {
    return std::clamp(size, m_minChunkSize, m_maxChunkSize);
}

size_t AdaptiveRateController::nextChunkSize(size_t current, size_t lastChunkBytes,
                                             double lastChunkElapsedMs) {
    if (!(lastChunkElapsedMs > 0.0)) {
        return clamp(current);
    }

    double mbps = (lastChunkBytes / BYTES_PER_MB) / (lastChunkElapsedMs / 1000.0);
    m_samples.push_back(mbps);
    while (m_samples.size() > m_window) {
        m_samples.pop_front();
    }

    double average = std::accumulate(m_samples.begin(), m_samples.end(), 0.0) /
                     static_cast<double>(m_samples.size());

    size_t next = current;
    if (average > m_fastThreshold) {
        m_quality = ConnectionQuality::Fast;
        next = static_cast<size_t>(static_cast<double>(current) * GROWTH_FACTOR);
    } else if (average < m_slowThreshold) {
        m_quality = ConnectionQuality::Slow;
        next = static_cast<size_t>(static_cast<double>(current) / GROWTH_FACTOR);
    } else {
        m_quality = ConnectionQuality::Medium;
    }

    next = clamp(next);
    if (next != current) {
        spdlog::debug("RateController: {:.2f} MB/s avg, chunk {} -> {}", average, current, next);
    }
    return next;
}

size_t AdaptiveRateController::initialChunkSize(int64_t fileSize) const {
    if (fileSize < static_cast<int64_t>(DEFAULT_CHUNK_SIZE)) {
        return m_minChunkSize;
    }
    return clamp(m_defaultChunkSize);
}

int64_t AdaptiveRateController::pacingDelay(int64_t fileSize) const {
    bool slow = m_quality == ConnectionQuality::Slow;
    if (fileSize > LARGE_FILE_THRESHOLD) {
        return slow ? 50 : 10;
    }
    return slow ? 25 : 0;
}

double AdaptiveRateController::smoothedBytesPerSecond() const {
    if (m_samples.empty()) return 0.0;
    double average = std::accumulate(m_samples.begin(), m_samples.end(), 0.0) /
                     static_cast<double>(m_samples.size());
    return average * BYTES_PER_MB;
}

void AdaptiveRateController::reset() {
    m_samples.clear();
    m_quality = ConnectionQuality::Medium;
}

} // namespace Innerocket
