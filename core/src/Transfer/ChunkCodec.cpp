// ChunkCodec.cpp — Block planning, XOR parity, chunk assembly

#include "innerocket/Transfer/ChunkCodec.h"
#include "innerocket/Checksum.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <cstring>

namespace Innerocket {

// ═══════════════════════════════════════════════════════════
// BlockLayout
// ═══════════════════════════════════════════════════════════

int64_t BlockLayout::chunkOffset(uint32_t slot) const {
    return blockOffset + static_cast<int64_t>(slot) * chunkSize;
}

uint32_t BlockLayout::chunkLength(uint32_t slot) const {
    uint64_t start = static_cast<uint64_t>(slot) * chunkSize;
    if (slot >= chunkCount || start >= blockSize) {
        return 0;
    }
    return static_cast<uint32_t>(std::min<uint64_t>(chunkSize, blockSize - start));
}

uint32_t BlockLayout::parityLength(uint32_t parityIndex) const {
    if (parityIndex >= parityCount) return 0;

    uint32_t longest = 0;
    for (uint32_t slot = parityIndex; slot < chunkCount; slot += parityCount) {
        longest = std::max(longest, chunkLength(slot));
    }
    return longest;
}

uint64_t BlockLayout::dataMask() const {
    if (chunkCount >= 64) return ~0ULL;
    return (1ULL << chunkCount) - 1;
}

uint64_t BlockLayout::parityCoverage(uint32_t parityIndex) const {
    uint64_t mask = 0;
    if (parityIndex >= parityCount) return mask;

    for (uint32_t slot = parityIndex; slot < chunkCount; slot += parityCount) {
        mask |= (1ULL << slot);
    }
    return mask;
}

bool BlockLayout::operator==(const BlockLayout& other) const {
    return blockOffset == other.blockOffset &&
           blockSize == other.blockSize &&
           firstIndex == other.firstIndex &&
           chunkCount == other.chunkCount &&
           chunkSize == other.chunkSize &&
           parityCount == other.parityCount;
}

// ═══════════════════════════════════════════════════════════
// ChunkMessage
// ═══════════════════════════════════════════════════════════

BlockLayout ChunkMessage::layout() const {
    BlockLayout l;
    l.blockOffset = blockOffset;
    l.blockSize = blockSize;
    l.firstIndex = blockFirstIndex;
    l.chunkCount = blockChunkCount;
    l.chunkSize = blockChunkSize;
    l.parityCount = totalParityChunks;
    return l;
}

ChunkMessage ChunkMessage::fromDescriptor(const std::string& transferId,
                                          const ChunkDescriptor& desc,
                                          uint32_t totalChunks,
                                          std::vector<uint8_t> payload) {
    ChunkMessage msg;
    msg.transferId = transferId;
    msg.index = desc.index;
    msg.totalChunks = totalChunks;
    msg.isParityChunk = desc.isParity;
    msg.parityIndex = desc.parityIndex;
    msg.totalParityChunks = desc.block.parityCount;
    msg.blockOffset = desc.block.blockOffset;
    msg.blockSize = desc.block.blockSize;
    msg.chunkMap = desc.chunkMap;
    msg.offset = desc.offset;
    msg.blockFirstIndex = desc.block.firstIndex;
    msg.blockChunkCount = desc.block.chunkCount;
    msg.blockChunkSize = desc.block.chunkSize;
    msg.crc32 = Innerocket::crc32(payload.data(), payload.size());
    msg.payload = std::move(payload);
    return msg;
}

// ═══════════════════════════════════════════════════════════
// BlockState
// ═══════════════════════════════════════════════════════════

const char* blockStatusName(BlockStatus status) {
    switch (status) {
        case BlockStatus::Incomplete: return "Incomplete";
        case BlockStatus::Complete: return "Complete";
        case BlockStatus::Reconstructed: return "Reconstructed";
        case BlockStatus::Unrecoverable: return "Unrecoverable";
        default: return "Unknown";
    }
}

uint32_t BlockState::missingCount() const {
    return layout.chunkCount - static_cast<uint32_t>(present.count());
}

// ═══════════════════════════════════════════════════════════
// ChunkCodec — planning
// ═══════════════════════════════════════════════════════════

uint32_t ChunkCodec::parityCountFor(uint32_t dataChunks, double parityRatio) {
    if (dataChunks == 0 || !(parityRatio > 0.0)) {
        return 0;
    }
    double ratio = std::min(parityRatio, 1.0);
    auto count = static_cast<uint32_t>(std::ceil(ratio * dataChunks - 1e-9));
    return std::clamp<uint32_t>(count, 1, dataChunks);
}

BlockLayout ChunkCodec::planBlock(int64_t fileSize, int64_t blockOffset, uint32_t firstIndex,
                                  size_t chunkSize, size_t maxBlockChunks, double parityRatio) {
    BlockLayout layout;
    layout.blockOffset = blockOffset;
    layout.firstIndex = firstIndex;
    layout.chunkSize = static_cast<uint32_t>(chunkSize);

    int64_t remaining = fileSize - blockOffset;
    if (remaining <= 0 || chunkSize == 0) {
        return layout;
    }

    size_t limit = std::clamp<size_t>(maxBlockChunks, 1, MAX_FEC_BLOCK_CHUNKS);
    auto needed = static_cast<uint64_t>((remaining + static_cast<int64_t>(chunkSize) - 1) /
                                        static_cast<int64_t>(chunkSize));

    layout.chunkCount = static_cast<uint32_t>(std::min<uint64_t>(needed, limit));
    layout.blockSize = static_cast<uint32_t>(
        std::min<int64_t>(remaining, static_cast<int64_t>(layout.chunkCount) * chunkSize));
    layout.parityCount = parityCountFor(layout.chunkCount, parityRatio);
    return layout;
}

std::vector<ChunkDescriptor> ChunkCodec::describeBlock(const BlockLayout& layout) {
    std::vector<ChunkDescriptor> result;
    result.reserve(layout.chunkCount + layout.parityCount);

    for (uint32_t slot = 0; slot < layout.chunkCount; ++slot) {
        ChunkDescriptor d;
        d.block = layout;
        d.index = layout.firstIndex + slot;
        d.offset = layout.chunkOffset(slot);
        d.length = layout.chunkLength(slot);
        d.chunkMap = layout.dataMask();
        result.push_back(d);
    }

    for (uint32_t p = 0; p < layout.parityCount; ++p) {
        ChunkDescriptor d;
        d.block = layout;
        d.index = layout.firstIndex;
        d.isParity = true;
        d.parityIndex = p;
        d.offset = layout.blockOffset;
        d.length = layout.parityLength(p);
        d.chunkMap = layout.parityCoverage(p);
        result.push_back(d);
    }

    return result;
}

std::vector<ChunkDescriptor> ChunkCodec::encode(int64_t sourceLength, size_t chunkSize,
                                                double parityRatio, size_t blockChunks) {
    std::vector<ChunkDescriptor> result;
    if (sourceLength <= 0 || chunkSize == 0) {
        return result;
    }

    int64_t offset = 0;
    uint32_t index = 0;
    while (offset < sourceLength) {
        BlockLayout layout = planBlock(sourceLength, offset, index, chunkSize,
                                       blockChunks, parityRatio);
        auto block = describeBlock(layout);
        result.insert(result.end(), block.begin(), block.end());

        offset = layout.endOffset();
        index += layout.chunkCount;
    }

    return result;
}

uint32_t ChunkCodec::estimateTotalChunks(int64_t fileSize, int64_t offset,
                                         uint32_t nextIndex, size_t chunkSize) {
    int64_t remaining = std::max<int64_t>(0, fileSize - offset);
    if (chunkSize == 0) return nextIndex;
    auto rest = static_cast<uint32_t>((remaining + static_cast<int64_t>(chunkSize) - 1) /
                                      static_cast<int64_t>(chunkSize));
    return nextIndex + rest;
}

// ═══════════════════════════════════════════════════════════
// ChunkCodec — receive side
// ═══════════════════════════════════════════════════════════

namespace {

// Parity is only needed until the block is whole
void releaseParity(BlockState& state) {
    for (auto& parity : state.parity) {
        parity.reset();
    }
}

} // anonymous namespace

ChunkDecodeResult ChunkCodec::decodeChunk(BlockState& state, const ChunkMessage& chunk,
                                          std::vector<uint8_t>& assembly) {
    ChunkDecodeResult result;
    const BlockLayout& layout = state.layout;

    if (chunk.layout() != layout) {
        spdlog::debug("ChunkCodec: Chunk {} does not match block at {}", chunk.index,
                      layout.blockOffset);
        return result;
    }

    // Late chunks of a finished block carry nothing new
    if (state.finalized) {
        result.status = ChunkDecodeStatus::Duplicate;
        return result;
    }

    if (Innerocket::crc32(chunk.payload.data(), chunk.payload.size()) != chunk.crc32) {
        spdlog::warn("ChunkCodec: CRC mismatch on {} chunk {} (parity={}), treating as lost",
                     chunk.transferId, chunk.index, chunk.isParityChunk);
        result.status = ChunkDecodeStatus::Corrupt;
        return result;
    }

    if (chunk.isParityChunk) {
        uint32_t p = chunk.parityIndex;
        if (p >= layout.parityCount ||
            chunk.payload.size() != layout.parityLength(p) ||
            chunk.chunkMap != layout.parityCoverage(p)) {
            return result;
        }
        if (state.parity[p]) {
            result.status = ChunkDecodeStatus::Duplicate;
            return result;
        }
        state.parity[p] = chunk.payload;
        result.status = ChunkDecodeStatus::Accepted;
        return result;
    }

    if (chunk.index < layout.firstIndex) {
        return result;
    }
    uint32_t slot = chunk.index - layout.firstIndex;
    if (slot >= layout.chunkCount ||
        chunk.offset != layout.chunkOffset(slot) ||
        chunk.payload.size() != layout.chunkLength(slot) ||
        chunk.chunkMap != layout.dataMask()) {
        return result;
    }

    int64_t end = chunk.offset + static_cast<int64_t>(chunk.payload.size());
    if (chunk.offset < 0 || end > static_cast<int64_t>(assembly.size())) {
        return result;
    }

    if (state.present.test(slot)) {
        result.status = ChunkDecodeStatus::Duplicate;
        return result;
    }

    if (!chunk.payload.empty()) {
        memcpy(assembly.data() + chunk.offset, chunk.payload.data(), chunk.payload.size());
    }
    state.present.set(slot);

    result.status = ChunkDecodeStatus::Accepted;
    result.newBytes = static_cast<uint32_t>(chunk.payload.size());
    return result;
}

BlockFinalizeResult ChunkCodec::finalizeBlock(BlockState& state, std::vector<uint8_t>& assembly) {
    BlockFinalizeResult result;
    const BlockLayout& layout = state.layout;

    if (state.allDataPresent()) {
        state.finalized = true;
        releaseParity(state);
        result.status = BlockStatus::Complete;
        return result;
    }

    if (layout.endOffset() > static_cast<int64_t>(assembly.size())) {
        result.status = state.closed ? BlockStatus::Unrecoverable : BlockStatus::Incomplete;
        return result;
    }

    for (uint32_t p = 0; p < layout.parityCount; ++p) {
        if (!state.parity[p]) continue;

        std::vector<uint32_t> missing;
        for (uint32_t slot = p; slot < layout.chunkCount; slot += layout.parityCount) {
            if (!state.present.test(slot)) missing.push_back(slot);
        }
        if (missing.size() != 1) continue;

        // parity XOR (all present slots of the group) = the missing slot
        std::vector<uint8_t> rebuilt = *state.parity[p];
        for (uint32_t slot = p; slot < layout.chunkCount; slot += layout.parityCount) {
            if (slot == missing[0]) continue;
            const uint8_t* src = assembly.data() + layout.chunkOffset(slot);
            uint32_t len = std::min<uint32_t>(layout.chunkLength(slot),
                                              static_cast<uint32_t>(rebuilt.size()));
            for (uint32_t i = 0; i < len; ++i) {
                rebuilt[i] ^= src[i];
            }
        }

        uint32_t slot = missing[0];
        uint32_t len = std::min<uint32_t>(layout.chunkLength(slot),
                                          static_cast<uint32_t>(rebuilt.size()));
        memcpy(assembly.data() + layout.chunkOffset(slot), rebuilt.data(), len);
        state.present.set(slot);

        result.reconstructedSlots.push_back(layout.firstIndex + slot);
        result.reconstructedBytes += len;
    }

    if (state.allDataPresent()) {
        state.finalized = true;
        releaseParity(state);
        result.status = BlockStatus::Reconstructed;
        spdlog::info("ChunkCodec: Reconstructed {} chunk(s) in block at offset {}",
                     result.reconstructedSlots.size(), layout.blockOffset);
        return result;
    }

    result.status = state.closed ? BlockStatus::Unrecoverable : BlockStatus::Incomplete;
    return result;
}

// ═══════════════════════════════════════════════════════════
// BlockEncoder
// ═══════════════════════════════════════════════════════════

BlockEncoder::BlockEncoder(const BlockLayout& layout)
    : m_layout(layout) {
    m_parity.reserve(layout.parityCount);
    for (uint32_t p = 0; p < layout.parityCount; ++p) {
        m_parity.emplace_back(layout.parityLength(p), 0);
    }
}

void BlockEncoder::addDataChunk(uint32_t slot, const uint8_t* data, size_t size) {
    if (m_layout.parityCount == 0 || slot >= m_layout.chunkCount) {
        return;
    }

    auto& parity = m_parity[m_layout.groupOf(slot)];
    size_t len = std::min(size, parity.size());
    for (size_t i = 0; i < len; ++i) {
        parity[i] ^= data[i];
    }
}

const std::vector<uint8_t>& BlockEncoder::parityChunk(uint32_t parityIndex) const {
    static const std::vector<uint8_t> empty;
    if (parityIndex >= m_parity.size()) return empty;
    return m_parity[parityIndex];
}

} // namespace Innerocket
