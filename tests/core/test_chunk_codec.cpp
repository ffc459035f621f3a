// test_chunk_codec.cpp — Тесты разбиения на chunk'и, XOR parity и сборки блоков

#include <gtest/gtest.h>
#include "innerocket/Transfer/ChunkCodec.h"
#include "innerocket/Checksum.h"
#include <map>
#include <set>

using namespace Innerocket;

namespace {

std::vector<uint8_t> makeData(size_t size, uint32_t seed = 7) {
    std::vector<uint8_t> data(size);
    uint32_t state = seed;
    for (auto& b : data) {
        state = state * 1103515245u + 12345u;
        b = static_cast<uint8_t>(state >> 16);
    }
    return data;
}

// Build wire messages for every descriptor, computing parity like a sender would
std::vector<ChunkMessage> buildMessages(const std::vector<uint8_t>& data,
                                        const std::vector<ChunkDescriptor>& plan) {
    std::vector<ChunkMessage> messages;
    std::map<int64_t, BlockEncoder> encoders;

    for (const auto& d : plan) {
        auto it = encoders.find(d.block.blockOffset);
        if (it == encoders.end()) {
            it = encoders.emplace(d.block.blockOffset, BlockEncoder(d.block)).first;
        }
        if (d.isParity) {
            messages.push_back(ChunkMessage::fromDescriptor("t-1", d, 0,
                                                            it->second.parityChunk(d.parityIndex)));
        } else {
            std::vector<uint8_t> payload(data.begin() + d.offset,
                                         data.begin() + d.offset + d.length);
            it->second.addDataChunk(d.index - d.block.firstIndex, payload);
            messages.push_back(ChunkMessage::fromDescriptor("t-1", d, 0, std::move(payload)));
        }
    }
    return messages;
}

struct Assembly {
    std::vector<uint8_t> bytes;
    std::map<int64_t, BlockState> blocks;

    explicit Assembly(size_t size) : bytes(size, 0) {}

    ChunkDecodeResult feed(const ChunkMessage& msg) {
        auto it = blocks.find(msg.blockOffset);
        if (it == blocks.end()) {
            it = blocks.emplace(msg.blockOffset, BlockState(msg.layout())).first;
        }
        return ChunkCodec::decodeChunk(it->second, msg, bytes);
    }

    std::vector<BlockStatus> finalizeAll() {
        std::vector<BlockStatus> statuses;
        for (auto& [offset, state] : blocks) {
            state.closed = true;
            statuses.push_back(ChunkCodec::finalizeBlock(state, bytes).status);
        }
        return statuses;
    }
};

} // namespace

// ═══════════════════════════════════════════════════════════
// Planning
// ═══════════════════════════════════════════════════════════

TEST(ChunkCodecTest, ParityCountFor) {
    EXPECT_EQ(ChunkCodec::parityCountFor(10, 0.0), 0u);
    EXPECT_EQ(ChunkCodec::parityCountFor(10, -1.0), 0u);
    EXPECT_EQ(ChunkCodec::parityCountFor(10, 0.2), 2u);
    EXPECT_EQ(ChunkCodec::parityCountFor(5, 0.2), 1u);
    EXPECT_EQ(ChunkCodec::parityCountFor(3, 0.1), 1u);
    EXPECT_EQ(ChunkCodec::parityCountFor(4, 1.0), 4u);
    EXPECT_EQ(ChunkCodec::parityCountFor(4, 5.0), 4u);
    EXPECT_EQ(ChunkCodec::parityCountFor(0, 0.5), 0u);
}

TEST(ChunkCodecTest, PlanBlockShortLastChunk) {
    auto layout = ChunkCodec::planBlock(2500, 0, 0, 1000, 10, 0.5);
    EXPECT_EQ(layout.chunkCount, 3u);
    EXPECT_EQ(layout.blockSize, 2500u);
    EXPECT_EQ(layout.parityCount, 2u);
    EXPECT_EQ(layout.chunkLength(0), 1000u);
    EXPECT_EQ(layout.chunkLength(2), 500u);
    EXPECT_EQ(layout.chunkLength(3), 0u);
    EXPECT_EQ(layout.chunkOffset(2), 2000);
    // Group 0 = slots {0, 2}, group 1 = slot {1}
    EXPECT_EQ(layout.parityCoverage(0), 0b101u);
    EXPECT_EQ(layout.parityCoverage(1), 0b010u);
    EXPECT_EQ(layout.parityLength(0), 1000u);
    EXPECT_EQ(layout.dataMask(), 0b111u);
}

TEST(ChunkCodecTest, PlanBlockPastEndIsEmpty) {
    auto layout = ChunkCodec::planBlock(1000, 1000, 1, 256, 10, 0.2);
    EXPECT_EQ(layout.chunkCount, 0u);
    EXPECT_EQ(layout.blockSize, 0u);
}

TEST(ChunkCodecTest, PlanBlockCapsAtSixtyFour) {
    auto layout = ChunkCodec::planBlock(1000000, 0, 0, 100, 500, 0.0);
    EXPECT_EQ(layout.chunkCount, MAX_FEC_BLOCK_CHUNKS);
    EXPECT_EQ(layout.dataMask(), ~0ULL);
}

TEST(ChunkCodecTest, EncodeWithoutParityCoversFile) {
    const int64_t size = 10 * 1024 + 17;
    auto plan = ChunkCodec::encode(size, 1024, 0.0);

    ASSERT_EQ(plan.size(), 11u);
    int64_t total = 0;
    for (size_t i = 0; i < plan.size(); ++i) {
        EXPECT_FALSE(plan[i].isParity);
        EXPECT_EQ(plan[i].index, i);
        EXPECT_EQ(plan[i].offset, total);
        total += plan[i].length;
    }
    EXPECT_EQ(total, size);
    EXPECT_EQ(plan.back().length, 17u);
}

TEST(ChunkCodecTest, EncodeEmptySource) {
    EXPECT_TRUE(ChunkCodec::encode(0, 1024, 0.2).empty());
    EXPECT_TRUE(ChunkCodec::encode(100, 0, 0.2).empty());
}

TEST(ChunkCodecTest, EncodeParityFollowsEachBlock) {
    // 25 chunks, blocks of 10 -> 10 + 10 + 5; ratio 0.2 -> 2, 2, 1 parity
    auto plan = ChunkCodec::encode(25 * 100, 100, 0.2, 10);
    ASSERT_EQ(plan.size(), 25u + 5u);

    std::vector<bool> parityPattern;
    for (const auto& d : plan) parityPattern.push_back(d.isParity);

    size_t pos = 0;
    for (uint32_t blockData : {10u, 10u, 5u}) {
        uint32_t blockParity = blockData == 10 ? 2 : 1;
        for (uint32_t i = 0; i < blockData; ++i) EXPECT_FALSE(parityPattern[pos++]);
        for (uint32_t i = 0; i < blockParity; ++i) {
            EXPECT_TRUE(parityPattern[pos]);
            EXPECT_EQ(plan[pos].index, plan[pos].block.firstIndex);
            ++pos;
        }
    }

    int64_t dataBytes = 0;
    for (const auto& d : plan) {
        if (!d.isParity) dataBytes += d.length;
    }
    EXPECT_EQ(dataBytes, 2500);
}

TEST(ChunkCodecTest, EstimateTotalChunks) {
    EXPECT_EQ(ChunkCodec::estimateTotalChunks(1000, 0, 0, 100), 10u);
    EXPECT_EQ(ChunkCodec::estimateTotalChunks(1000, 300, 3, 200), 7u);
    EXPECT_EQ(ChunkCodec::estimateTotalChunks(1000, 1000, 10, 200), 10u);
}

// ═══════════════════════════════════════════════════════════
// Assembly and reconstruction
// ═══════════════════════════════════════════════════════════

TEST(ChunkCodecTest, ReassemblesAllChunks) {
    auto data = makeData(5000);
    auto messages = buildMessages(data, ChunkCodec::encode(5000, 512, 0.2, 10));

    Assembly a(data.size());
    for (const auto& m : messages) {
        EXPECT_EQ(a.feed(m).status, ChunkDecodeStatus::Accepted);
    }
    for (auto status : a.finalizeAll()) {
        EXPECT_EQ(status, BlockStatus::Complete);
    }
    EXPECT_EQ(a.bytes, data);
}

TEST(ChunkCodecTest, NewBytesCountsOnlyData) {
    auto data = makeData(1000);
    auto messages = buildMessages(data, ChunkCodec::encode(1000, 300, 0.5, 10));

    Assembly a(data.size());
    uint64_t total = 0;
    for (const auto& m : messages) {
        auto r = a.feed(m);
        if (m.isParityChunk) EXPECT_EQ(r.newBytes, 0u);
        total += r.newBytes;
    }
    EXPECT_EQ(total, 1000u);
}

TEST(ChunkCodecTest, DuplicateChunkIgnored) {
    auto data = makeData(1000);
    auto messages = buildMessages(data, ChunkCodec::encode(1000, 250, 0.25, 10));

    Assembly a(data.size());
    EXPECT_EQ(a.feed(messages[0]).status, ChunkDecodeStatus::Accepted);
    auto dup = a.feed(messages[0]);
    EXPECT_EQ(dup.status, ChunkDecodeStatus::Duplicate);
    EXPECT_EQ(dup.newBytes, 0u);

    const auto& parity = messages.back();
    ASSERT_TRUE(parity.isParityChunk);
    EXPECT_EQ(a.feed(parity).status, ChunkDecodeStatus::Accepted);
    EXPECT_EQ(a.feed(parity).status, ChunkDecodeStatus::Duplicate);
}

TEST(ChunkCodecTest, ReconstructsOneLostChunkPerGroup) {
    // 10 chunks, 2 parity groups: {0,2,4,6,8} and {1,3,5,7,9}
    auto data = makeData(10 * 100 - 37);
    auto messages = buildMessages(data, ChunkCodec::encode(data.size(), 100, 0.2, 10));
    ASSERT_EQ(messages.size(), 12u);

    Assembly a(data.size());
    for (const auto& m : messages) {
        if (!m.isParityChunk && (m.index == 2 || m.index == 9)) continue;
        a.feed(m);
    }

    auto& state = a.blocks.begin()->second;
    state.closed = true;
    auto result = ChunkCodec::finalizeBlock(state, a.bytes);
    EXPECT_EQ(result.status, BlockStatus::Reconstructed);
    EXPECT_EQ(std::set<uint32_t>(result.reconstructedSlots.begin(), result.reconstructedSlots.end()),
              (std::set<uint32_t>{2, 9}));
    EXPECT_EQ(result.reconstructedBytes, 100u + 63u);
    EXPECT_EQ(a.bytes, data);
}

TEST(ChunkCodecTest, LostParityChunkIsHarmless) {
    auto data = makeData(800);
    auto messages = buildMessages(data, ChunkCodec::encode(800, 100, 0.25, 10));

    Assembly a(data.size());
    bool droppedParity = false;
    for (const auto& m : messages) {
        if (m.isParityChunk && !droppedParity) {
            droppedParity = true;
            continue;
        }
        a.feed(m);
    }
    for (auto status : a.finalizeAll()) {
        EXPECT_EQ(status, BlockStatus::Complete);
    }
    EXPECT_EQ(a.bytes, data);
}

TEST(ChunkCodecTest, TwoLossesInOneGroupUnrecoverable) {
    auto data = makeData(500);
    auto messages = buildMessages(data, ChunkCodec::encode(500, 100, 0.2, 10));
    ASSERT_EQ(messages.size(), 6u);   // 5 data + 1 parity

    Assembly a(data.size());
    for (const auto& m : messages) {
        if (!m.isParityChunk && (m.index == 1 || m.index == 3)) continue;
        a.feed(m);
    }

    auto& state = a.blocks.begin()->second;
    auto open = ChunkCodec::finalizeBlock(state, a.bytes);
    EXPECT_EQ(open.status, BlockStatus::Incomplete);

    state.closed = true;
    auto closed = ChunkCodec::finalizeBlock(state, a.bytes);
    EXPECT_EQ(closed.status, BlockStatus::Unrecoverable);
    EXPECT_EQ(state.missingCount(), 2u);
}

TEST(ChunkCodecTest, FinalizedBlockDropsParityPayloads) {
    auto data = makeData(1000);
    auto messages = buildMessages(data, ChunkCodec::encode(1000, 100, 0.3, 10));
    ASSERT_EQ(messages.size(), 13u);   // 10 data + 3 parity

    Assembly a(data.size());
    for (const auto& m : messages) {
        if (!m.isParityChunk && m.index == 5) continue;
        a.feed(m);
    }

    auto& state = a.blocks.begin()->second;
    size_t held = 0;
    for (const auto& p : state.parity) held += p ? 1 : 0;
    EXPECT_EQ(held, 3u);

    state.closed = true;
    EXPECT_EQ(ChunkCodec::finalizeBlock(state, a.bytes).status, BlockStatus::Reconstructed);
    EXPECT_EQ(a.bytes, data);
    ASSERT_EQ(state.parity.size(), 3u);
    for (const auto& p : state.parity) {
        EXPECT_FALSE(p.has_value());
    }

    // A parity chunk arriving late is not stored again
    EXPECT_EQ(a.feed(messages.back()).status, ChunkDecodeStatus::Duplicate);
    EXPECT_FALSE(state.parity.back().has_value());
}

TEST(ChunkCodecTest, CompleteBlockDropsParityPayloads) {
    auto data = makeData(400);
    auto messages = buildMessages(data, ChunkCodec::encode(400, 100, 0.5, 10));

    Assembly a(data.size());
    for (const auto& m : messages) a.feed(m);

    auto& state = a.blocks.begin()->second;
    EXPECT_EQ(ChunkCodec::finalizeBlock(state, a.bytes).status, BlockStatus::Complete);
    for (const auto& p : state.parity) {
        EXPECT_FALSE(p.has_value());
    }
}

TEST(ChunkCodecTest, LossesInDifferentBlocksRecoverIndependently) {
    auto data = makeData(2000);
    auto messages = buildMessages(data, ChunkCodec::encode(2000, 100, 0.1, 10));

    Assembly a(data.size());
    for (const auto& m : messages) {
        // One loss in each block of 10
        if (!m.isParityChunk && (m.index == 4 || m.index == 15)) continue;
        a.feed(m);
    }
    for (auto status : a.finalizeAll()) {
        EXPECT_EQ(status, BlockStatus::Reconstructed);
    }
    EXPECT_EQ(a.bytes, data);
}

TEST(ChunkCodecTest, CorruptChunkTreatedAsLost) {
    auto data = makeData(500);
    auto messages = buildMessages(data, ChunkCodec::encode(500, 100, 0.2, 10));

    Assembly a(data.size());
    for (auto m : messages) {
        if (!m.isParityChunk && m.index == 2) {
            m.payload[5] ^= 0xFF;
            EXPECT_EQ(a.feed(m).status, ChunkDecodeStatus::Corrupt);
            continue;
        }
        a.feed(m);
    }
    EXPECT_EQ(a.finalizeAll().front(), BlockStatus::Reconstructed);
    EXPECT_EQ(a.bytes, data);
}

TEST(ChunkCodecTest, MismatchedHeaderRejected) {
    auto data = makeData(500);
    auto messages = buildMessages(data, ChunkCodec::encode(500, 100, 0.2, 10));

    Assembly a(data.size());

    auto wrongOffset = messages[1];
    wrongOffset.offset += 1;
    EXPECT_EQ(a.feed(wrongOffset).status, ChunkDecodeStatus::Invalid);

    auto wrongMap = messages[1];
    wrongMap.chunkMap = 0b1;
    EXPECT_EQ(a.feed(wrongMap).status, ChunkDecodeStatus::Invalid);

    auto wrongParity = messages.back();
    wrongParity.parityIndex = 3;
    EXPECT_EQ(a.feed(wrongParity).status, ChunkDecodeStatus::Invalid);

    // Same block offset, different geometry
    BlockState state(messages[0].layout());
    auto otherLayout = messages[0];
    otherLayout.blockChunkSize = 50;
    EXPECT_EQ(ChunkCodec::decodeChunk(state, otherLayout, a.bytes).status,
              ChunkDecodeStatus::Invalid);
}

TEST(ChunkCodecTest, ChunkBeyondBufferRejected) {
    auto data = makeData(500);
    auto messages = buildMessages(data, ChunkCodec::encode(500, 100, 0.0, 10));

    std::vector<uint8_t> small(300, 0);
    BlockState state(messages[4].layout());
    EXPECT_EQ(ChunkCodec::decodeChunk(state, messages[4], small).status,
              ChunkDecodeStatus::Invalid);
}

TEST(ChunkCodecTest, BlockEncoderXorsGroup) {
    BlockLayout layout = ChunkCodec::planBlock(6, 0, 0, 2, 10, 0.5);
    ASSERT_EQ(layout.chunkCount, 3u);
    ASSERT_EQ(layout.parityCount, 2u);

    BlockEncoder encoder(layout);
    std::vector<uint8_t> c0{0x01, 0x02}, c1{0x10, 0x20}, c2{0x0F, 0xF0};
    encoder.addDataChunk(0, c0);
    encoder.addDataChunk(1, c1);
    encoder.addDataChunk(2, c2);

    EXPECT_EQ(encoder.parityChunk(0), (std::vector<uint8_t>{0x0E, 0xF2}));
    EXPECT_EQ(encoder.parityChunk(1), c1);
    EXPECT_TRUE(encoder.parityChunk(5).empty());
}

TEST(ChunkCodecTest, FromDescriptorComputesCrc) {
    auto plan = ChunkCodec::encode(10, 10, 0.0);
    ASSERT_EQ(plan.size(), 1u);
    std::vector<uint8_t> payload{1, 2, 3, 4, 5, 6, 7, 8, 9, 10};

    auto msg = ChunkMessage::fromDescriptor("abc", plan[0], 1, payload);
    EXPECT_EQ(msg.transferId, "abc");
    EXPECT_EQ(msg.totalChunks, 1u);
    EXPECT_EQ(msg.crc32, crc32(payload.data(), payload.size()));
    EXPECT_EQ(msg.layout(), plan[0].block);
}

TEST(ChunkCodecTest, BlockStatusNames) {
    EXPECT_STREQ(blockStatusName(BlockStatus::Complete), "Complete");
    EXPECT_STREQ(blockStatusName(BlockStatus::Unrecoverable), "Unrecoverable");
}
