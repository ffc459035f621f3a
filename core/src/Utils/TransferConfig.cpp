// TransferConfig.cpp — Transfer engine configuration

#include "innerocket/TransferConfig.h"
#include "innerocket/Network/TransferProtocol.h"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace Innerocket {

using json = nlohmann::json;

void TransferConfig::validate() const {
    if (minChunkSize == 0) {
        throw std::invalid_argument("minChunkSize must be positive");
    }
    if (minChunkSize > maxChunkSize) {
        throw std::invalid_argument("minChunkSize exceeds maxChunkSize");
    }
    if (defaultChunkSize < minChunkSize || defaultChunkSize > maxChunkSize) {
        throw std::invalid_argument("defaultChunkSize outside [minChunkSize, maxChunkSize]");
    }
    if (maxChunkSize > MAX_CHUNK_PAYLOAD_SIZE) {
        throw std::invalid_argument("maxChunkSize does not fit in a protocol frame");
    }
    if (slowThresholdMBps <= 0.0 || fastThresholdMBps <= slowThresholdMBps) {
        throw std::invalid_argument("rate thresholds must satisfy 0 < slow < fast");
    }
    if (rateWindow == 0) {
        throw std::invalid_argument("rateWindow must be positive");
    }
    if (fecBlockChunks == 0 || fecBlockChunks > MAX_FEC_BLOCK_CHUNKS) {
        throw std::invalid_argument("fecBlockChunks must be in [1, 64]");
    }
    // Block geometry travels as u32 in the chunk header
    if (static_cast<uint64_t>(fecBlockChunks) * maxChunkSize > UINT32_MAX) {
        throw std::invalid_argument("fecBlockChunks * maxChunkSize exceeds 4 GiB");
    }
    if (defaultParityRatio < 0.0 || defaultParityRatio > 1.0) {
        throw std::invalid_argument("defaultParityRatio must be in [0, 1]");
    }
    if (maxFileSize <= 0) {
        throw std::invalid_argument("maxFileSize must be positive");
    }
    if (!(maxCompressionRatio > 0.0) || maxCompressionRatio > 1.0) {
        throw std::invalid_argument("maxCompressionRatio must be in (0, 1]");
    }
    if (idleTimeoutMs < 0) {
        throw std::invalid_argument("idleTimeoutMs must not be negative");
    }
}

std::string TransferConfig::toJson() const {
    json j = {
        {"defaultChunkSize", defaultChunkSize},
        {"minChunkSize", minChunkSize},
        {"maxChunkSize", maxChunkSize},
        {"adaptiveChunkSize", adaptiveChunkSize},
        {"fastThresholdMBps", fastThresholdMBps},
        {"slowThresholdMBps", slowThresholdMBps},
        {"rateWindow", rateWindow},
        {"useFEC", useFEC},
        {"defaultParityRatio", defaultParityRatio},
        {"fecBlockChunks", fecBlockChunks},
        {"enableCompression", enableCompression},
        {"compressionMinSize", compressionMinSize},
        {"maxCompressionRatio", maxCompressionRatio},
        {"maxFileSize", maxFileSize},
        {"maxBufferedBytes", maxBufferedBytes},
        {"progressIntervalMs", progressIntervalMs},
        {"idleTimeoutMs", idleTimeoutMs},
        {"logLevel", logLevel}
    };
    return j.dump();
}

std::optional<TransferConfig> TransferConfig::fromJson(const std::string& jsonStr) {
    try {
        auto j = json::parse(jsonStr);
        TransferConfig c;
        c.defaultChunkSize = j.value("defaultChunkSize", c.defaultChunkSize);
        c.minChunkSize = j.value("minChunkSize", c.minChunkSize);
        c.maxChunkSize = j.value("maxChunkSize", c.maxChunkSize);
        c.adaptiveChunkSize = j.value("adaptiveChunkSize", c.adaptiveChunkSize);
        c.fastThresholdMBps = j.value("fastThresholdMBps", c.fastThresholdMBps);
        c.slowThresholdMBps = j.value("slowThresholdMBps", c.slowThresholdMBps);
        c.rateWindow = j.value("rateWindow", c.rateWindow);
        c.useFEC = j.value("useFEC", c.useFEC);
        c.defaultParityRatio = j.value("defaultParityRatio", c.defaultParityRatio);
        c.fecBlockChunks = j.value("fecBlockChunks", c.fecBlockChunks);
        c.enableCompression = j.value("enableCompression", c.enableCompression);
        c.compressionMinSize = j.value("compressionMinSize", c.compressionMinSize);
        c.maxCompressionRatio = j.value("maxCompressionRatio", c.maxCompressionRatio);
        c.maxFileSize = j.value("maxFileSize", c.maxFileSize);
        c.maxBufferedBytes = j.value("maxBufferedBytes", c.maxBufferedBytes);
        c.progressIntervalMs = j.value("progressIntervalMs", c.progressIntervalMs);
        c.idleTimeoutMs = j.value("idleTimeoutMs", c.idleTimeoutMs);
        c.logLevel = j.value("logLevel", c.logLevel);
        c.validate();
        return c;
    } catch (const std::exception& e) {
        spdlog::warn("TransferConfig: Invalid configuration: {}", e.what());
        return std::nullopt;
    }
}

std::optional<TransferConfig> TransferConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        spdlog::warn("TransferConfig: Cannot open {}", path);
        return std::nullopt;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return fromJson(ss.str());
}

} // namespace Innerocket
