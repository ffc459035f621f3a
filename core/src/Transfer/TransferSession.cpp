// TransferSession.cpp — Sender and receiver state machine

#include "innerocket/Transfer/TransferSession.h"
#include "innerocket/Transfer/AdaptiveRateController.h"
#include "innerocket/Transfer/ChunkCompressor.h"
#include "innerocket/Transfer/SliceReader.h"
#include "innerocket/Checksum.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <future>
#include <map>
#include <mutex>

namespace Innerocket {

using Clock = std::chrono::steady_clock;

namespace {

int64_t unixTimeMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

int64_t elapsedMs(Clock::time_point from, Clock::time_point to) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count();
}

struct Notice {
    bool fire = false;
    bool statusChanged = false;
    TransferRecord record;
};

// Bad deflate data counts as a lost chunk
std::optional<ChunkMessage> inflateChunk(const ChunkMessage& chunk) {
    if (chunk.originalSize == 0 || chunk.originalSize > chunk.blockChunkSize) {
        spdlog::warn("TransferSession: {} chunk {} claims {} bytes uncompressed (chunk size {})",
                     chunk.transferId, chunk.index, chunk.originalSize, chunk.blockChunkSize);
        return std::nullopt;
    }

    auto plain = ChunkCompressor::decompress(chunk.payload.data(), chunk.payload.size(),
                                             chunk.originalSize);
    if (!plain) {
        return std::nullopt;
    }

    ChunkMessage result = chunk;
    result.payload = std::move(*plain);
    result.isCompressed = false;
    result.originalSize = 0;
    return result;
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════
// TransferSession::Impl
// ═══════════════════════════════════════════════════════════

class TransferSession::Impl {
public:
    Impl(TransferDirection dir, const FileMetadata& meta,
         const std::string& peer, const TransferConfig& cfg)
        : direction(dir)
        , id(meta.id)
        , peerId(peer)
        , config(cfg)
        , metadata(meta)
        , createdAt(unixTimeMs())
        , rate(cfg) {
        chunkSize = rate.initialChunkSize(meta.size);
        nextChunkSize = chunkSize;
    }

    const TransferDirection direction;
    const std::string id;
    const std::string peerId;
    const TransferConfig config;

    mutable std::mutex mutex;
    FileMetadata metadata;
    TransferStatus status = TransferStatus::Pending;
    TransferErrorKind errorKind = TransferErrorKind::None;
    std::string error;
    int64_t createdAt = 0;
    int64_t bytesTransferred = 0;
    int32_t progress = 0;
    std::atomic<bool> cancelled{false};
    Clock::time_point lastActivityAt = Clock::now();

    // Progress throttling
    bool statusDirty = false;
    int32_t lastReportedProgress = 0;
    int64_t lastReportedBytes = 0;
    Clock::time_point lastReportAt = Clock::now();

    std::mutex callbackMutex;
    EventCallback onEvent;

    // ───────────────────────────────────────────────────────
    // Sender state
    // ───────────────────────────────────────────────────────

    std::shared_ptr<FileSource> source;
    SliceReader* reader = nullptr;
    Sha256Hasher hasher;
    AdaptiveRateController rate;
    size_t chunkSize = DEFAULT_CHUNK_SIZE;
    size_t nextChunkSize = DEFAULT_CHUNK_SIZE;

    std::optional<BlockLayout> block;
    std::unique_ptr<BlockEncoder> encoder;
    uint32_t nextSlot = 0;
    uint32_t nextParity = 0;
    int64_t nextOffset = 0;             // Начало следующего блока
    uint32_t nextIndex = 0;             // Индекс первого chunk'а следующего блока
    std::deque<std::pair<uint32_t, std::future<SliceResult>>> reads;
    Clock::time_point nextSendAt = Clock::now();
    Clock::time_point lastChunkAt = Clock::now();
    bool compress = false;
    int64_t compressedOriginalBytes = 0;   // Только chunk'и, ушедшие сжатыми
    int64_t compressedWireBytes = 0;

    // ───────────────────────────────────────────────────────
    // Receiver state
    // ───────────────────────────────────────────────────────

    std::vector<uint8_t> buffer;
    bool bufferAllocated = false;
    std::map<int64_t, BlockState> blocks;
    uint32_t lastChunkSize = 0;
    Clock::time_point firstChunkAt;
    Clock::time_point lastReceiveAt;
    CompressionSavings peerSavings;     // Из file-complete

    // ═══════════════════════════════════════════════════════
    // Helpers (mutex held)
    // ═══════════════════════════════════════════════════════

    bool fecEnabled() const {
        return metadata.useFEC && metadata.fecParityRatio > 0.0;
    }

    TransferRecord recordLocked() const {
        TransferRecord r;
        r.id = id;
        r.fileName = metadata.name;
        r.fileSize = metadata.size;
        r.fileType = metadata.mimeType;
        r.sender = direction == TransferDirection::Send ? "" : peerId;
        r.receiver = direction == TransferDirection::Send ? peerId : "";
        r.progress = progress;
        r.status = status;
        r.direction = direction;
        r.createdAt = createdAt;
        r.checksum = metadata.checksum;
        r.bytesTransferred = bytesTransferred;
        r.useFEC = metadata.useFEC;
        r.errorKind = errorKind;
        r.error = error;

        if (direction == TransferDirection::Send) {
            r.transferSpeed = rate.smoothedBytesPerSecond();
            r.chunkSize = static_cast<int64_t>(chunkSize);
            r.compressionSavings = ChunkCompressor::savings(compressedOriginalBytes,
                                                            compressedWireBytes);
        } else {
            r.compressionSavings = peerSavings;
            int64_t ms = elapsedMs(firstChunkAt, lastReceiveAt);
            r.transferSpeed = ms > 0 ? bytesTransferred * 1000.0 / ms : 0.0;
            r.chunkSize = lastChunkSize;
        }
        return r;
    }

    void setStatusLocked(TransferStatus next) {
        if (status == next) return;
        spdlog::debug("TransferSession: {} {} -> {}", id,
                      transferStatusToString(status), transferStatusToString(next));
        status = next;
        statusDirty = true;
    }

    void updateProgressLocked() {
        if (metadata.size <= 0) return;
        auto p = static_cast<int32_t>(std::min<int64_t>(bytesTransferred, metadata.size) * 100 /
                                      metadata.size);
        progress = std::max(progress, p);
    }

    void releaseBuffersLocked(bool keepReceived) {
        reads.clear();
        encoder.reset();
        block.reset();
        blocks.clear();
        if (!keepReceived) {
            std::vector<uint8_t>().swap(buffer);
            bufferAllocated = false;
        }
    }

    bool failLocked(TransferErrorKind kind, const std::string& message) {
        if (isTerminalStatus(status)) return false;

        errorKind = kind;
        error = message;
        bool integrity = kind == TransferErrorKind::Integrity;
        releaseBuffersLocked(integrity && direction == TransferDirection::Receive);
        setStatusLocked(integrity ? TransferStatus::IntegrityError : TransferStatus::Failed);

        if (kind == TransferErrorKind::Cancelled) {
            spdlog::info("TransferSession: {} cancelled", id);
        } else {
            spdlog::warn("TransferSession: {} failed ({}): {}", id,
                         transferErrorKindToString(kind), message);
        }
        return true;
    }

    Notice takeNoticeLocked() {
        Notice n;
        auto now = Clock::now();

        if (statusDirty) {
            n.fire = true;
            n.statusChanged = true;
        } else if (status == TransferStatus::Transferring &&
                   bytesTransferred != lastReportedBytes &&
                   (progress > lastReportedProgress ||
                    elapsedMs(lastReportAt, now) >= config.progressIntervalMs)) {
            n.fire = true;
        }

        if (n.fire) {
            statusDirty = false;
            lastReportedProgress = progress;
            lastReportedBytes = bytesTransferred;
            lastReportAt = now;
            n.record = recordLocked();
        }
        return n;
    }

    void notify(const Notice& n) {
        if (!n.fire) return;

        EventCallback callback;
        {
            std::lock_guard<std::mutex> lock(callbackMutex);
            callback = onEvent;
        }
        if (callback) {
            callback(n.record, n.statusChanged);
        }
    }

    // ═══════════════════════════════════════════════════════
    // Sender helpers
    // ═══════════════════════════════════════════════════════

    void planNextBlockLocked() {
        size_t blockChunks = fecEnabled() ? config.fecBlockChunks : 1;
        double ratio = fecEnabled() ? metadata.fecParityRatio : 0.0;

        chunkSize = nextChunkSize;
        block = ChunkCodec::planBlock(metadata.size, nextOffset, nextIndex,
                                      chunkSize, blockChunks, ratio);
        encoder = std::make_unique<BlockEncoder>(*block);
        nextSlot = 0;
        nextParity = 0;
    }

    std::future<SliceResult> requestRead(int64_t offset, size_t length) {
        if (reader) {
            return reader->requestSlice(source, offset, length);
        }

        std::promise<SliceResult> promise;
        promise.set_value(source ? source->readSlice(offset, length) : std::nullopt);
        return promise.get_future();
    }

    // Current slot plus one slice of read-ahead, never past the block end
    void issueReadsLocked() {
        uint32_t want = std::min<uint32_t>(nextSlot + 2, block->chunkCount);
        uint32_t slot = reads.empty() ? nextSlot : reads.back().first + 1;
        for (; slot < want; ++slot) {
            reads.emplace_back(slot, requestRead(block->chunkOffset(slot),
                                                 block->chunkLength(slot)));
        }
    }

    void advanceBlockIfDoneLocked() {
        if (!block) return;
        if (nextSlot < block->chunkCount || nextParity < block->parityCount) return;

        nextOffset = block->endOffset();
        nextIndex = block->firstIndex + block->chunkCount;
        block.reset();
        encoder.reset();
    }

    // ═══════════════════════════════════════════════════════
    // Receiver helpers
    // ═══════════════════════════════════════════════════════

    bool chunkInBoundsLocked(const ChunkMessage& chunk) const {
        BlockLayout l = chunk.layout();
        if (l.chunkCount == 0 || l.chunkCount > MAX_FEC_BLOCK_CHUNKS ||
            l.chunkSize == 0 || l.blockSize == 0 || l.parityCount > l.chunkCount) {
            return false;
        }
        if (l.blockOffset < 0 || l.endOffset() > metadata.size) {
            return false;
        }

        // Every declared slot must hold at least one byte
        uint64_t capacity = static_cast<uint64_t>(l.chunkCount) * l.chunkSize;
        if (l.blockSize > capacity || l.blockSize <= capacity - l.chunkSize) {
            return false;
        }

        if (!chunk.isParityChunk) {
            int64_t end = chunk.offset + static_cast<int64_t>(chunk.payload.size());
            if (chunk.offset < l.blockOffset || end > l.endOffset()) {
                return false;
            }
        }
        return true;
    }

    bool ensureBufferLocked() {
        if (bufferAllocated) return true;
        try {
            buffer.assign(static_cast<size_t>(metadata.size), 0);
            bufferAllocated = true;
        } catch (const std::bad_alloc&) {
            spdlog::error("TransferSession: {} cannot allocate {} bytes", id, metadata.size);
            return false;
        }
        return true;
    }

    BlockState* blockForLocked(const BlockLayout& layout) {
        auto it = blocks.find(layout.blockOffset);
        if (it != blocks.end()) {
            return it->second.layout == layout ? &it->second : nullptr;
        }

        auto next = blocks.lower_bound(layout.blockOffset);
        if (next != blocks.end() && next->first < layout.endOffset()) {
            return nullptr;
        }
        if (next != blocks.begin()) {
            auto prev = std::prev(next);
            if (prev->second.layout.endOffset() > layout.blockOffset) {
                return nullptr;
            }
        }

        auto inserted = blocks.emplace(layout.blockOffset, BlockState(layout));
        return &inserted.first->second;
    }

    // Finalize (closing first when requested) every block before `limit`.
    // Returns false once a block turns out unrecoverable; the session is failed then.
    bool finalizeBlocksLocked(int64_t limit) {
        int64_t lostAt = -1;
        uint32_t missing = 0;
        uint32_t parity = 0;

        for (auto& [offset, state] : blocks) {
            if (offset >= limit) break;
            if (state.finalized) continue;

            state.closed = true;
            auto result = ChunkCodec::finalizeBlock(state, buffer);
            if (result.status == BlockStatus::Reconstructed) {
                bytesTransferred += static_cast<int64_t>(result.reconstructedBytes);
            } else if (result.status == BlockStatus::Unrecoverable) {
                lostAt = offset;
                missing = state.missingCount();
                parity = state.layout.parityCount;
                break;
            }
        }

        if (lostAt >= 0) {
            failLocked(TransferErrorKind::Integrity,
                       fmt::format("Block at offset {} lost {} chunk(s), parity covers {}",
                                   lostAt, missing, parity));
            return false;
        }
        return true;
    }

    // Offset of the first byte no block covers, or size when blocks tile the file
    int64_t firstGapLocked() const {
        int64_t expected = 0;
        for (const auto& [offset, state] : blocks) {
            if (offset != expected) return expected;
            expected = state.layout.endOffset();
        }
        return expected;
    }
};

// ═══════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════

TransferSession::TransferSession(TransferDirection direction, const FileMetadata& metadata,
                                 const std::string& peerId, const TransferConfig& config)
    : m_impl(std::make_unique<Impl>(direction, metadata, peerId, config)) {
}

TransferSession::~TransferSession() = default;

std::shared_ptr<TransferSession> TransferSession::createSender(const FileMetadata& metadata,
                                                               const std::string& peerId,
                                                               std::shared_ptr<FileSource> source,
                                                               SliceReader* reader,
                                                               const TransferConfig& config) {
    std::shared_ptr<TransferSession> session(
        new TransferSession(TransferDirection::Send, metadata, peerId, config));
    session->m_impl->source = std::move(source);
    session->m_impl->reader = reader;
    session->m_impl->compress = ChunkCompressor::shouldCompress(metadata.name, metadata.mimeType,
                                                               metadata.size, config);
    return session;
}

std::shared_ptr<TransferSession> TransferSession::createReceiver(const FileMetadata& metadata,
                                                                 const std::string& peerId,
                                                                 const TransferConfig& config) {
    return std::shared_ptr<TransferSession>(
        new TransferSession(TransferDirection::Receive, metadata, peerId, config));
}

void TransferSession::setEventCallback(EventCallback callback) {
    std::lock_guard<std::mutex> lock(m_impl->callbackMutex);
    m_impl->onEvent = std::move(callback);
}

// ═══════════════════════════════════════════════════════════
// Accessors
// ═══════════════════════════════════════════════════════════

const std::string& TransferSession::id() const {
    return m_impl->id;
}

const std::string& TransferSession::peerId() const {
    return m_impl->peerId;
}

TransferDirection TransferSession::direction() const {
    return m_impl->direction;
}

TransferStatus TransferSession::status() const {
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    return m_impl->status;
}

bool TransferSession::isTerminal() const {
    return isTerminalStatus(status());
}

TransferRecord TransferSession::record() const {
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    return m_impl->recordLocked();
}

FileMetadata TransferSession::metadata() const {
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    return m_impl->metadata;
}

// ═══════════════════════════════════════════════════════════
// Sender
// ═══════════════════════════════════════════════════════════

bool TransferSession::start() {
    Notice notice;
    {
        std::lock_guard<std::mutex> lock(m_impl->mutex);
        if (m_impl->direction != TransferDirection::Send ||
            m_impl->status != TransferStatus::Pending) {
            return false;
        }

        auto now = Clock::now();
        m_impl->lastChunkAt = now;
        m_impl->nextSendAt = now;
        m_impl->setStatusLocked(TransferStatus::Transferring);
        notice = m_impl->takeNoticeLocked();

        spdlog::info("TransferSession: Sending {} ({} bytes, chunk {}, FEC {})",
                     m_impl->metadata.name, m_impl->metadata.size, m_impl->chunkSize,
                     m_impl->fecEnabled() ? m_impl->metadata.fecParityRatio : 0.0);
    }
    m_impl->notify(notice);
    return true;
}

bool TransferSession::markRejected() {
    Notice notice;
    {
        std::lock_guard<std::mutex> lock(m_impl->mutex);
        if (m_impl->status != TransferStatus::Pending) {
            spdlog::debug("TransferSession: Ignoring reject for {} in state {}",
                          m_impl->id, transferStatusToString(m_impl->status));
            return false;
        }
        m_impl->releaseBuffersLocked(false);
        m_impl->setStatusLocked(TransferStatus::Rejected);
        notice = m_impl->takeNoticeLocked();
    }
    m_impl->notify(notice);
    return true;
}

int64_t TransferSession::pacingDelayMs() const {
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    return m_impl->rate.pacingDelay(m_impl->metadata.size);
}

PumpResult TransferSession::pump(const SendFunction& send) {
    enum class Step { Data, Parity, Complete };

    PumpResult result;
    std::optional<ProtocolMessage> outgoing;
    Step step = Step::Data;
    size_t payloadBytes = 0;
    int compressionLevel = 0;
    Notice notice;

    {
        std::lock_guard<std::mutex> lock(m_impl->mutex);
        auto& s = *m_impl;
        if (s.direction != TransferDirection::Send ||
            s.status != TransferStatus::Transferring || s.cancelled) {
            return result;
        }

        auto now = Clock::now();
        if (now < s.nextSendAt) {
            result.status = PumpStatus::Waiting;
            result.waitMs = std::max<int64_t>(1, elapsedMs(now, s.nextSendAt));
            return result;
        }

        if (!s.block && s.nextOffset < s.metadata.size) {
            s.planNextBlockLocked();
        }
        if (s.compress) {
            compressionLevel = ChunkCompressor::levelFor(s.rate.connectionQuality());
        }

        if (s.block && s.nextSlot < s.block->chunkCount) {
            s.issueReadsLocked();
            auto& pending = s.reads.front();
            if (pending.second.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
                result.status = PumpStatus::Waiting;
                result.waitMs = 1;
                return result;
            }

            SliceResult slice = pending.second.get();
            s.reads.pop_front();

            uint32_t length = s.block->chunkLength(s.nextSlot);
            if (!slice || slice->size() != length) {
                s.failLocked(TransferErrorKind::Transport,
                             fmt::format("Failed to read {} bytes at offset {}",
                                         length, s.block->chunkOffset(s.nextSlot)));
                notice = s.takeNoticeLocked();
                result.status = PumpStatus::Failed;
            } else if (!s.hasher.update(*slice)) {
                s.failLocked(TransferErrorKind::Integrity, "Failed to hash file data");
                notice = s.takeNoticeLocked();
                result.status = PumpStatus::Failed;
            } else {
                s.encoder->addDataChunk(s.nextSlot, *slice);

                ChunkDescriptor desc;
                desc.block = *s.block;
                desc.index = s.block->firstIndex + s.nextSlot;
                desc.offset = s.block->chunkOffset(s.nextSlot);
                desc.length = length;
                desc.chunkMap = s.block->dataMask();

                uint32_t total = ChunkCodec::estimateTotalChunks(
                    s.metadata.size, desc.offset + length, desc.index + 1, s.nextChunkSize);
                outgoing = ChunkMessage::fromDescriptor(s.id, desc, total, std::move(*slice));
                payloadBytes = length;
                step = Step::Data;
            }
        } else if (s.block && s.nextParity < s.block->parityCount) {
            ChunkDescriptor desc;
            desc.block = *s.block;
            desc.index = s.block->firstIndex;
            desc.isParity = true;
            desc.parityIndex = s.nextParity;
            desc.offset = s.block->blockOffset;
            desc.length = s.block->parityLength(s.nextParity);
            desc.chunkMap = s.block->parityCoverage(s.nextParity);

            uint32_t total = ChunkCodec::estimateTotalChunks(
                s.metadata.size, s.block->endOffset(),
                s.block->firstIndex + s.block->chunkCount, s.nextChunkSize);
            outgoing = ChunkMessage::fromDescriptor(s.id, desc, total,
                                                    s.encoder->parityChunk(s.nextParity));
            step = Step::Parity;
        } else if (!s.block) {
            std::string checksum = s.hasher.finalizeHex();
            if (checksum.empty()) {
                s.failLocked(TransferErrorKind::Integrity, "Failed to compute checksum");
                notice = s.takeNoticeLocked();
                result.status = PumpStatus::Failed;
            } else {
                s.metadata.checksum = checksum;
                FileCompletePayload complete;
                complete.transferId = s.id;
                complete.checksum = checksum;
                complete.compressionSavings = ChunkCompressor::savings(s.compressedOriginalBytes,
                                                                       s.compressedWireBytes);
                outgoing = complete;
                step = Step::Complete;
            }
        } else {
            s.advanceBlockIfDoneLocked();
            result.status = PumpStatus::Waiting;
            return result;
        }
    }

    if (!outgoing) {
        m_impl->notify(notice);
        return result;
    }

    // Deflate and send without the session lock held; CRC stays over the plain bytes
    int64_t plainBytes = 0;
    int64_t wireBytes = 0;
    if (compressionLevel > 0) {
        if (auto chunk = std::get_if<ChunkMessage>(&*outgoing)) {
            if (auto packed = ChunkCompressor::compress(chunk->payload, compressionLevel,
                                                        m_impl->config)) {
                plainBytes = static_cast<int64_t>(chunk->payload.size());
                wireBytes = static_cast<int64_t>(packed->size());
                chunk->originalSize = static_cast<uint32_t>(chunk->payload.size());
                chunk->isCompressed = true;
                chunk->payload = std::move(*packed);
            }
        }
    }

    if (m_impl->cancelled) {
        return result;
    }
    bool sent = send(*outgoing);
    auto sentAt = Clock::now();

    {
        std::lock_guard<std::mutex> lock(m_impl->mutex);
        auto& s = *m_impl;
        if (s.status != TransferStatus::Transferring) {
            return result;
        }
        if (sent && plainBytes > 0) {
            s.compressedOriginalBytes += plainBytes;
            s.compressedWireBytes += wireBytes;
        }

        if (!sent) {
            s.failLocked(TransferErrorKind::Transport, "Peer refused frame");
            result.status = PumpStatus::Failed;
        } else if (step == Step::Data) {
            double elapsed = std::chrono::duration<double, std::milli>(sentAt - s.lastChunkAt).count();
            s.lastChunkAt = sentAt;

            size_t suggested = s.rate.nextChunkSize(s.nextChunkSize, payloadBytes, elapsed);
            if (s.config.adaptiveChunkSize) {
                s.nextChunkSize = suggested;
            }

            s.bytesTransferred += static_cast<int64_t>(payloadBytes);
            s.nextSlot++;
            s.advanceBlockIfDoneLocked();
            s.updateProgressLocked();
            s.nextSendAt = sentAt + std::chrono::milliseconds(s.rate.pacingDelay(s.metadata.size));

            result.status = PumpStatus::Sent;
            result.bytesSent = payloadBytes;
        } else if (step == Step::Parity) {
            s.nextParity++;
            s.advanceBlockIfDoneLocked();
            result.status = PumpStatus::Sent;
        } else {
            s.bytesTransferred = s.metadata.size;
            s.progress = 100;
            s.source.reset();
            s.setStatusLocked(TransferStatus::Completed);
            result.status = PumpStatus::Finished;

            spdlog::info("TransferSession: Sent {} ({} bytes, sha256 {}, compression saved {} bytes)",
                         s.metadata.name, s.metadata.size, s.metadata.checksum.value_or(""),
                         s.compressedOriginalBytes - s.compressedWireBytes);
        }
        notice = s.takeNoticeLocked();
    }

    m_impl->notify(notice);
    return result;
}

// ═══════════════════════════════════════════════════════════
// Receiver
// ═══════════════════════════════════════════════════════════

bool TransferSession::handleChunk(const ChunkMessage& chunk) {
    if (chunk.isCompressed) {
        auto plain = inflateChunk(chunk);
        return plain ? handleChunk(*plain) : false;
    }

    bool counted = false;
    Notice notice;
    {
        std::lock_guard<std::mutex> lock(m_impl->mutex);
        auto& s = *m_impl;
        if (s.direction != TransferDirection::Receive || s.cancelled ||
            isTerminalStatus(s.status) || s.status == TransferStatus::Verifying) {
            return false;
        }

        if (!s.chunkInBoundsLocked(chunk)) {
            spdlog::warn("TransferSession: {} dropping out-of-range chunk {} (block {}+{})",
                         s.id, chunk.index, chunk.blockOffset, chunk.blockSize);
            return false;
        }

        if (!s.ensureBufferLocked()) {
            s.failLocked(TransferErrorKind::Capacity, "Cannot allocate receive buffer");
            notice = s.takeNoticeLocked();
        } else {
            auto now = Clock::now();
            if (s.status == TransferStatus::Pending) {
                s.firstChunkAt = now;
                s.setStatusLocked(TransferStatus::Transferring);
            }
            s.lastReceiveAt = now;
            s.lastActivityAt = now;

            BlockLayout layout = chunk.layout();
            BlockState* state = s.blockForLocked(layout);
            if (!state) {
                spdlog::warn("TransferSession: {} chunk {} overlaps a different block layout",
                             s.id, chunk.index);
            } else if (s.finalizeBlocksLocked(layout.blockOffset)) {
                auto decoded = ChunkCodec::decodeChunk(*state, chunk, s.buffer);
                switch (decoded.status) {
                    case ChunkDecodeStatus::Accepted:
                        s.bytesTransferred += decoded.newBytes;
                        counted = true;
                        break;
                    case ChunkDecodeStatus::Duplicate:
                        spdlog::debug("TransferSession: {} duplicate chunk {}", s.id, chunk.index);
                        break;
                    case ChunkDecodeStatus::Corrupt:
                        break;
                    case ChunkDecodeStatus::Invalid:
                        spdlog::warn("TransferSession: {} chunk {} does not fit its block",
                                     s.id, chunk.index);
                        break;
                }

                if (counted && !state->finalized) {
                    auto finalized = ChunkCodec::finalizeBlock(*state, s.buffer);
                    if (finalized.status == BlockStatus::Reconstructed) {
                        s.bytesTransferred += static_cast<int64_t>(finalized.reconstructedBytes);
                    }
                }

                s.lastChunkSize = chunk.blockChunkSize;
                s.updateProgressLocked();
            }
            notice = s.takeNoticeLocked();
        }
    }

    m_impl->notify(notice);
    return counted;
}

bool TransferSession::handleComplete(const FileCompletePayload& payload) {
    Notice notice;
    {
        std::lock_guard<std::mutex> lock(m_impl->mutex);
        auto& s = *m_impl;
        if (s.direction != TransferDirection::Receive || s.cancelled ||
            isTerminalStatus(s.status) || s.status == TransferStatus::Verifying) {
            return false;
        }
        if (!payload.checksum.empty()) {
            s.metadata.checksum = payload.checksum;
        }
        s.peerSavings = payload.compressionSavings;
        s.lastActivityAt = Clock::now();
        s.setStatusLocked(TransferStatus::Verifying);
        notice = s.takeNoticeLocked();
    }
    m_impl->notify(notice);

    {
        std::lock_guard<std::mutex> lock(m_impl->mutex);
        auto& s = *m_impl;
        if (s.status != TransferStatus::Verifying) {
            return false;
        }

        if (!s.ensureBufferLocked()) {
            s.failLocked(TransferErrorKind::Capacity, "Cannot allocate receive buffer");
        } else if (s.finalizeBlocksLocked(s.metadata.size)) {
            int64_t gap = s.firstGapLocked();
            if (gap != s.metadata.size) {
                s.failLocked(TransferErrorKind::Integrity,
                             fmt::format("No chunks received for data at offset {}", gap));
            } else {
                std::string actual = computeChecksum(s.buffer);
                if (actual.empty()) {
                    s.failLocked(TransferErrorKind::Integrity, "Failed to compute checksum");
                } else if (actual != payload.checksum) {
                    s.failLocked(TransferErrorKind::Integrity,
                                 fmt::format("Checksum mismatch: expected {}, got {}",
                                             payload.checksum, actual));
                } else {
                    s.bytesTransferred = s.metadata.size;
                    s.progress = 100;
                    s.blocks.clear();
                    s.setStatusLocked(TransferStatus::Completed);
                    spdlog::info("TransferSession: Received {} ({} bytes), checksum verified",
                                 s.metadata.name, s.metadata.size);
                }
            }
        }
        notice = s.takeNoticeLocked();
    }

    m_impl->notify(notice);
    return true;
}

std::optional<std::vector<uint8_t>> TransferSession::takeReceivedBytes() {
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    auto& s = *m_impl;
    if (s.direction != TransferDirection::Receive || !s.bufferAllocated) {
        return std::nullopt;
    }
    if (s.status != TransferStatus::Completed && s.status != TransferStatus::IntegrityError) {
        return std::nullopt;
    }

    std::vector<uint8_t> data = std::move(s.buffer);
    s.buffer.clear();
    s.bufferAllocated = false;
    return data;
}

int64_t TransferSession::idleMs() const {
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    return elapsedMs(m_impl->lastActivityAt, Clock::now());
}

// ═══════════════════════════════════════════════════════════
// Cancel / fail
// ═══════════════════════════════════════════════════════════

bool TransferSession::cancel() {
    Notice notice;
    {
        std::lock_guard<std::mutex> lock(m_impl->mutex);
        if (isTerminalStatus(m_impl->status)) {
            return false;
        }
        m_impl->cancelled = true;
        m_impl->failLocked(TransferErrorKind::Cancelled, "Transfer cancelled");
        notice = m_impl->takeNoticeLocked();
    }
    m_impl->notify(notice);
    return true;
}

bool TransferSession::fail(TransferErrorKind kind, const std::string& message) {
    Notice notice;
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(m_impl->mutex);
        changed = m_impl->failLocked(kind, message);
        notice = m_impl->takeNoticeLocked();
    }
    m_impl->notify(notice);
    return changed;
}

} // namespace Innerocket
