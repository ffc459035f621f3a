// ChunkCompressor.cpp — Per-chunk deflate/inflate

#include "innerocket/Transfer/ChunkCompressor.h"
#include <spdlog/spdlog.h>
#include <zlib.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <unordered_set>

namespace Innerocket {

namespace {

const std::unordered_set<std::string> COMPRESSIBLE_MIME_TYPES = {
    "text/plain",
    "text/html",
    "text/css",
    "text/javascript",
    "text/xml",
    "application/json",
    "application/xml",
    "application/javascript",
    "application/x-javascript",
    "application/svg+xml",
    "application/x-httpd-php",
    "application/x-sh",
};

// Already compressed containers and media
const std::unordered_set<std::string> INCOMPRESSIBLE_EXTENSIONS = {
    "zip", "rar", "7z", "gz", "bz2", "tar",
    "jpg", "jpeg", "png", "gif", "webp",
    "mp3", "mp4", "avi", "mov", "mkv", "webm",
    "pdf", "doc", "docx", "xls", "xlsx",
};

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // anonymous namespace

bool ChunkCompressor::shouldCompress(const std::string& fileName, const std::string& mimeType,
                                     int64_t fileSize, const TransferConfig& config) {
    if (!config.enableCompression || fileSize < static_cast<int64_t>(config.compressionMinSize)) {
        return false;
    }

    auto dot = fileName.find_last_of('.');
    if (dot != std::string::npos &&
        INCOMPRESSIBLE_EXTENSIONS.count(toLower(fileName.substr(dot + 1)))) {
        return false;
    }

    std::string mime = toLower(mimeType);
    return COMPRESSIBLE_MIME_TYPES.count(mime) > 0 || mime.rfind("text/", 0) == 0;
}

int ChunkCompressor::levelFor(ConnectionQuality quality) {
    switch (quality) {
        case ConnectionQuality::Fast: return 9;
        case ConnectionQuality::Slow: return 3;
        case ConnectionQuality::Medium:
        default: return 6;
    }
}

std::optional<std::vector<uint8_t>> ChunkCompressor::compress(const uint8_t* data, size_t size,
                                                              int level,
                                                              const TransferConfig& config) {
    if (!data || size == 0 || size < config.compressionMinSize ||
        size > std::numeric_limits<uLong>::max()) {
        return std::nullopt;
    }

    uLongf compressedSize = compressBound(static_cast<uLong>(size));
    std::vector<uint8_t> out(compressedSize);
    int rc = compress2(out.data(), &compressedSize, data, static_cast<uLong>(size),
                       std::clamp(level, Z_BEST_SPEED, Z_BEST_COMPRESSION));
    if (rc != Z_OK) {
        spdlog::warn("ChunkCompressor: deflate of {} bytes failed ({})", size, rc);
        return std::nullopt;
    }

    double ratio = static_cast<double>(compressedSize) / static_cast<double>(size);
    if (ratio >= config.maxCompressionRatio) {
        return std::nullopt;
    }

    out.resize(compressedSize);
    return out;
}

std::optional<std::vector<uint8_t>> ChunkCompressor::decompress(const uint8_t* data, size_t size,
                                                                size_t originalSize) {
    if (!data || size == 0 || originalSize == 0 ||
        size > std::numeric_limits<uLong>::max() ||
        originalSize > std::numeric_limits<uLong>::max()) {
        return std::nullopt;
    }

    std::vector<uint8_t> out(originalSize);
    uLongf outSize = static_cast<uLongf>(originalSize);
    int rc = uncompress(out.data(), &outSize, data, static_cast<uLong>(size));
    if (rc != Z_OK || outSize != originalSize) {
        spdlog::warn("ChunkCompressor: inflate failed ({}), {} of {} bytes",
                     rc, outSize, originalSize);
        return std::nullopt;
    }
    return out;
}

CompressionSavings ChunkCompressor::savings(int64_t originalBytes, int64_t compressedBytes) {
    CompressionSavings result;
    if (originalBytes <= 0) {
        return result;
    }
    result.savedBytes = originalBytes - compressedBytes;
    double percentage = static_cast<double>(result.savedBytes) * 100.0 /
                        static_cast<double>(originalBytes);
    result.savedPercentage = std::round(percentage * 100.0) / 100.0;
    return result;
}

} // namespace Innerocket
