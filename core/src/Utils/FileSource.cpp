// FileSource.cpp — Stock FileSource adapters

#include "innerocket/FileSource.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_map>

namespace Innerocket {

namespace fs = std::filesystem;

// ═══════════════════════════════════════════════════════════
// Таблица расширений -> MIME
// ═══════════════════════════════════════════════════════════

static const std::unordered_map<std::string, std::string> EXTENSION_TO_MIME = {
    // Images
    {"jpg", "image/jpeg"},
    {"jpeg", "image/jpeg"},
    {"png", "image/png"},
    {"gif", "image/gif"},
    {"webp", "image/webp"},
    {"svg", "image/svg+xml"},
    {"heic", "image/heic"},

    // Video
    {"mp4", "video/mp4"},
    {"mkv", "video/x-matroska"},
    {"mov", "video/quicktime"},
    {"webm", "video/webm"},

    // Audio
    {"mp3", "audio/mpeg"},
    {"wav", "audio/wav"},
    {"ogg", "audio/ogg"},
    {"flac", "audio/flac"},

    // Documents
    {"pdf", "application/pdf"},
    {"docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
    {"xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
    {"txt", "text/plain"},
    {"csv", "text/csv"},
    {"md", "text/markdown"},
    {"html", "text/html"},
    {"json", "application/json"},
    {"xml", "application/xml"},

    // Archives
    {"zip", "application/zip"},
    {"7z", "application/x-7z-compressed"},
    {"tar", "application/x-tar"},
    {"gz", "application/gzip"},
};

// ═══════════════════════════════════════════════════════════
// LocalFileSource
// ═══════════════════════════════════════════════════════════

LocalFileSource::LocalFileSource(const std::string& path, const std::string& mimeType)
    : m_path(path)
    , m_name(fs::path(path).filename().string())
    , m_mimeType(mimeType.empty() ? guessMimeType(m_name) : mimeType) {

    m_file.open(path, std::ios::binary | std::ios::ate);
    if (!m_file.is_open()) {
        spdlog::error("LocalFileSource: Failed to open {}", path);
        return;
    }
    m_size = static_cast<int64_t>(m_file.tellg());
    if (m_size < 0) m_size = 0;
}

bool LocalFileSource::isOpen() const {
    return m_file.is_open() && m_size > 0;
}

std::optional<std::vector<uint8_t>> LocalFileSource::readSlice(int64_t offset, size_t length) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_file.is_open() || offset < 0 || offset > m_size) {
        return std::nullopt;
    }

    size_t toRead = static_cast<size_t>(std::min<int64_t>(length, m_size - offset));
    std::vector<uint8_t> buffer(toRead);
    if (toRead == 0) return buffer;

    m_file.clear();
    m_file.seekg(offset);
    m_file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(toRead));
    size_t actualRead = static_cast<size_t>(m_file.gcount());
    if (actualRead != toRead) {
        spdlog::error("LocalFileSource: Short read on {} at {} ({} of {} bytes)",
                      m_path, offset, actualRead, toRead);
        return std::nullopt;
    }
    return buffer;
}

std::string LocalFileSource::guessMimeType(const std::string& fileName) {
    auto dotPos = fileName.rfind('.');
    if (dotPos == std::string::npos || dotPos + 1 >= fileName.size()) {
        return "application/octet-stream";
    }

    std::string ext = fileName.substr(dotPos + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    auto it = EXTENSION_TO_MIME.find(ext);
    return it != EXTENSION_TO_MIME.end() ? it->second : "application/octet-stream";
}

// ═══════════════════════════════════════════════════════════
// MemoryFileSource
// ═══════════════════════════════════════════════════════════

std::optional<std::vector<uint8_t>> MemoryFileSource::readSlice(int64_t offset, size_t length) {
    if (offset < 0 || offset > size()) {
        return std::nullopt;
    }
    size_t toRead = static_cast<size_t>(std::min<int64_t>(length, size() - offset));
    auto begin = m_data.begin() + offset;
    return std::vector<uint8_t>(begin, begin + static_cast<std::ptrdiff_t>(toRead));
}

} // namespace Innerocket
