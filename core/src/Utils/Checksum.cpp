// Checksum.cpp — SHA-256 / CRC32 helpers

#include "innerocket/Checksum.h"
#include "innerocket/FileSource.h"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace Innerocket {

// ═══════════════════════════════════════════════════════════
// Sha256Hasher
// ═══════════════════════════════════════════════════════════

struct Sha256Hasher::Impl {
    EVP_MD_CTX* ctx = nullptr;
    bool valid = false;

    Impl() {
        ctx = EVP_MD_CTX_new();
        if (!ctx) return;
        valid = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1;
    }

    ~Impl() {
        if (ctx) EVP_MD_CTX_free(ctx);
    }
};

Sha256Hasher::Sha256Hasher() : m_impl(std::make_unique<Impl>()) {}
Sha256Hasher::~Sha256Hasher() = default;

bool Sha256Hasher::update(const uint8_t* data, size_t size) {
    if (!m_impl->valid) return false;
    if (size == 0) return true;
    if (EVP_DigestUpdate(m_impl->ctx, data, size) != 1) {
        m_impl->valid = false;
        return false;
    }
    return true;
}

std::string Sha256Hasher::finalizeHex() {
    if (!m_impl->valid) return "";

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    m_impl->valid = false;  // One-shot
    if (EVP_DigestFinal_ex(m_impl->ctx, hash, &length) != 1) {
        return "";
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return oss.str();
}

bool Sha256Hasher::isValid() const {
    return m_impl->valid;
}

// ═══════════════════════════════════════════════════════════
// One-shot helpers
// ═══════════════════════════════════════════════════════════

std::string computeChecksum(const uint8_t* data, size_t size) {
    Sha256Hasher hasher;
    if (!hasher.update(data, size)) return "";
    return hasher.finalizeHex();
}

std::string computeChecksum(const std::vector<uint8_t>& data) {
    return computeChecksum(data.data(), data.size());
}

std::string computeChecksum(FileSource& source, size_t sliceSize) {
    Sha256Hasher hasher;
    const int64_t total = source.size();
    int64_t offset = 0;

    while (offset < total) {
        size_t toRead = static_cast<size_t>(std::min<int64_t>(sliceSize, total - offset));
        auto slice = source.readSlice(offset, toRead);
        if (!slice || slice->empty()) {
            spdlog::error("Checksum: Failed to read {} at offset {}", source.name(), offset);
            return "";
        }
        if (!hasher.update(*slice)) return "";
        offset += static_cast<int64_t>(slice->size());
    }

    return hasher.finalizeHex();
}

// ═══════════════════════════════════════════════════════════
// CRC32
// ═══════════════════════════════════════════════════════════

static std::array<uint32_t, 256> makeCrc32Table() {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; i++) {
        uint32_t crc = i;
        for (int j = 0; j < 8; j++) {
            if (crc & 1) {
                crc = (crc >> 1) ^ 0xEDB88320UL;
            } else {
                crc >>= 1;
            }
        }
        table[i] = crc;
    }
    return table;
}

uint32_t crc32(const uint8_t* data, size_t size) {
    static const std::array<uint32_t, 256> table = makeCrc32Table();

    uint32_t crc = 0xFFFFFFFFUL;
    for (size_t i = 0; i < size; ++i) {
        crc = (crc >> 8) ^ table[(crc ^ data[i]) & 0xFF];
    }
    return crc ^ 0xFFFFFFFFUL;
}

// ═══════════════════════════════════════════════════════════
// generateTransferId
// ═══════════════════════════════════════════════════════════

std::string generateTransferId() {
    uint8_t bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("Failed to generate random bytes");
    }

    // Version 4, variant 10xx
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    char buf[37];
    snprintf(buf, sizeof(buf),
             "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
             bytes[0], bytes[1], bytes[2], bytes[3],
             bytes[4], bytes[5], bytes[6], bytes[7],
             bytes[8], bytes[9], bytes[10], bytes[11],
             bytes[12], bytes[13], bytes[14], bytes[15]);
    return buf;
}

} // namespace Innerocket
