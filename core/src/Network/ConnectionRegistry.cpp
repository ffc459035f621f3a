// ConnectionRegistry.cpp — Peer map, inbound dispatch, outbound pump

#include "innerocket/Network/ConnectionRegistry.h"
#include "innerocket/Transfer/TransferSession.h"
#include "innerocket/Transfer/SliceReader.h"
#include "innerocket/Checksum.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <limits>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace Innerocket {

namespace {

constexpr int64_t PUMP_IDLE_WAIT_MS = 50;
constexpr int64_t BACKPRESSURE_WAIT_MS = 5;
constexpr int64_t IDLE_CHECK_INTERVAL_MS = 100;

int64_t unixTimeMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

struct IncomingRequest {
    std::string peerId;
    FileMetadata metadata;
};

struct OutgoingRequest {
    std::string peerId;
    FileMetadata metadata;
    bool accepted = false;
};

} // anonymous namespace

// ═══════════════════════════════════════════════════════════
// ConnectionRegistry::Impl
// ═══════════════════════════════════════════════════════════

class ConnectionRegistry::Impl {
public:
    Impl(std::shared_ptr<PeerTransport> transport, const TransferConfig& config)
        : m_transport(std::move(transport))
        , m_config(config) {
        if (!m_transport) {
            throw std::invalid_argument("ConnectionRegistry requires a transport");
        }
        m_config.validate();

        m_running = true;
        m_pumpThread = std::thread([this]() { pumpLoop(); });
        spdlog::info("ConnectionRegistry: Started (chunk {}..{}, FEC {})",
                     m_config.minChunkSize, m_config.maxChunkSize, m_config.useFEC);
    }

    ~Impl() {
        shutdown();
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(m_pumpMutex);
            if (!m_running) return;
            m_running = false;
        }
        m_pumpCv.notify_all();
        if (m_pumpThread.joinable()) {
            m_pumpThread.join();
        }
        m_reader.stop();
        spdlog::info("ConnectionRegistry: Stopped");
    }

    const TransferConfig& config() const { return m_config; }

    void setLocalIdentity(const std::string& id, const std::string& name) {
        std::lock_guard<std::mutex> lock(m_peersMutex);
        m_local.id = id;
        m_local.name = name;
    }

    // ═══════════════════════════════════════════════════════════
    // Connections
    // ═══════════════════════════════════════════════════════════

    bool connect(const std::string& peerId) {
        if (peerId.empty()) return false;
        if (isConnected(peerId)) {
            return true;
        }

        try {
            return m_transport->connect(peerId);
        } catch (const std::exception& e) {
            spdlog::error("ConnectionRegistry: connect({}) failed: {}", peerId, e.what());
            return false;
        }
    }

    void disconnect(const std::string& peerId) {
        if (!isConnected(peerId)) {
            return;
        }

        try {
            m_transport->disconnect(peerId);
        } catch (const std::exception& e) {
            spdlog::warn("ConnectionRegistry: disconnect({}) failed: {}", peerId, e.what());
        }
        handlePeerDisconnected(peerId);
    }

    bool isConnected(const std::string& peerId) const {
        std::lock_guard<std::mutex> lock(m_peersMutex);
        return m_peers.count(peerId) > 0;
    }

    std::vector<PeerInfo> getConnectedPeers() const {
        std::lock_guard<std::mutex> lock(m_peersMutex);
        std::vector<PeerInfo> result;
        result.reserve(m_peers.size());
        for (const auto& [id, info] : m_peers) {
            result.push_back(info);
        }
        return result;
    }

    void handlePeerConnected(const std::string& peerId, const std::string& name) {
        if (peerId.empty()) return;

        PeerInfo info;
        {
            std::lock_guard<std::mutex> lock(m_peersMutex);
            auto it = m_peers.find(peerId);
            if (it != m_peers.end()) {
                if (!name.empty()) it->second.name = name;
                return;
            }
            info.id = peerId;
            info.name = name;
            info.connectedAt = unixTimeMs();
            m_peers[peerId] = info;
        }

        spdlog::info("ConnectionRegistry: Peer {} connected", peerId);

        PeerCallback callback;
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            callback = m_onPeerConnected;
        }
        if (callback) callback(info);
    }

    void handlePeerDisconnected(const std::string& peerId) {
        PeerInfo info;
        {
            std::lock_guard<std::mutex> lock(m_peersMutex);
            auto it = m_peers.find(peerId);
            if (it == m_peers.end()) return;
            info = it->second;
            m_peers.erase(it);
        }

        std::vector<std::shared_ptr<TransferSession>> affected;
        {
            std::lock_guard<std::mutex> lock(m_sessionsMutex);
            for (const auto& [id, session] : m_sessions) {
                if (session->peerId() == peerId && !session->isTerminal()) {
                    affected.push_back(session);
                }
            }
            for (auto it = m_incoming.begin(); it != m_incoming.end();) {
                it = it->second.peerId == peerId ? m_incoming.erase(it) : std::next(it);
            }
            for (auto it = m_outgoing.begin(); it != m_outgoing.end();) {
                it = it->second.peerId == peerId ? m_outgoing.erase(it) : std::next(it);
            }
        }

        spdlog::info("ConnectionRegistry: Peer {} disconnected ({} active transfers failed)",
                     peerId, affected.size());

        for (auto& session : affected) {
            session->fail(TransferErrorKind::Transport, "Peer disconnected");
        }

        PeerCallback callback;
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            callback = m_onPeerDisconnected;
        }
        if (callback) callback(info);
    }

    // ═══════════════════════════════════════════════════════════
    // Messaging
    // ═══════════════════════════════════════════════════════════

    bool send(const std::string& peerId, const ProtocolMessage& message) {
        if (!isConnected(peerId)) {
            spdlog::debug("ConnectionRegistry: Not connected to {}, dropping {}",
                          peerId, messageKindName(messageKindOf(message)));
            return false;
        }

        try {
            auto frame = ProtocolCodec::encode(message);
            if (frame.size() > MAX_MESSAGE_SIZE) {
                spdlog::error("ConnectionRegistry: Frame of {} bytes exceeds limit", frame.size());
                return false;
            }
            return m_transport->send(peerId, frame);
        } catch (const std::exception& e) {
            spdlog::error("ConnectionRegistry: Send to {} failed: {}", peerId, e.what());
            return false;
        }
    }

    bool handleInbound(const std::string& peerId, const uint8_t* data, size_t size) {
        if (!isConnected(peerId)) {
            spdlog::warn("ConnectionRegistry: Frame from unknown peer {} dropped", peerId);
            return false;
        }

        auto message = ProtocolCodec::decode(data, size);
        if (!message) {
            return false;
        }
        return std::visit(InboundVisitor{*this, peerId}, *message);
    }

    // ═══════════════════════════════════════════════════════════
    // Inbound handlers
    // ═══════════════════════════════════════════════════════════

    struct InboundVisitor {
        Impl& self;
        const std::string& peerId;

        bool operator()(const FileRequestPayload& p) const { return self.onFileRequest(peerId, p); }
        bool operator()(const FileAcceptPayload& p) const { return self.onFileAccept(peerId, p); }
        bool operator()(const FileRejectPayload& p) const { return self.onFileReject(peerId, p); }
        bool operator()(const ChunkMessage& c) const { return self.onFileChunk(peerId, c); }
        bool operator()(const FileCompletePayload& p) const { return self.onFileComplete(peerId, p); }
    };

    bool onFileRequest(const std::string& peerId, const FileRequestPayload& payload) {
        const FileMetadata& metadata = payload.metadata;

        std::string reason;
        if (metadata.size <= 0) {
            reason = "empty file";
        } else if (metadata.size > m_config.maxFileSize) {
            reason = fmt::format("size {} exceeds limit {}", metadata.size, m_config.maxFileSize);
        } else if (metadata.fecParityRatio < 0.0 || metadata.fecParityRatio > 1.0) {
            reason = fmt::format("invalid parity ratio {}", metadata.fecParityRatio);
        } else {
            std::lock_guard<std::mutex> lock(m_sessionsMutex);
            if (m_sessions.count(metadata.id) || m_incoming.count(metadata.id) ||
                m_outgoing.count(metadata.id)) {
                reason = REJECT_REASON_DUPLICATE;
            } else {
                m_incoming[metadata.id] = IncomingRequest{peerId, metadata};
            }
        }

        if (!reason.empty()) {
            spdlog::warn("ConnectionRegistry: Rejecting {} from {}: {}", metadata.id, peerId, reason);
            FileRejectPayload reject;
            reject.metadata = metadata;
            reject.reason = reason;
            if (!send(peerId, reject)) {
                spdlog::debug("ConnectionRegistry: file-reject {} to {} not delivered",
                              metadata.id, peerId);
            }
            return false;
        }

        FileTransferRequest request;
        request.metadata = metadata;
        {
            std::lock_guard<std::mutex> lock(m_peersMutex);
            auto it = m_peers.find(peerId);
            if (it != m_peers.end()) request.from = it->second;
        }
        request.from.id = peerId;
        if (request.from.name.empty()) request.from.name = payload.from.name;

        spdlog::info("ConnectionRegistry: File request {} ({}, {} bytes) from {}",
                     metadata.id, metadata.name, metadata.size, peerId);

        RequestCallback callback;
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            callback = m_onTransferRequest;
        }
        if (callback) callback(request);
        return true;
    }

    bool onFileAccept(const std::string& peerId, const FileAcceptPayload& payload) {
        std::shared_ptr<TransferSession> session;
        FileMetadata metadata;
        bool known = true;
        {
            std::lock_guard<std::mutex> lock(m_sessionsMutex);
            auto it = m_outgoing.find(payload.metadata.id);
            if (it == m_outgoing.end() || it->second.peerId != peerId) {
                known = false;
            } else if (it->second.accepted) {
                return false;
            } else {
                it->second.accepted = true;
                metadata = it->second.metadata;

                auto sit = m_sessions.find(metadata.id);
                if (sit != m_sessions.end()) session = sit->second;
            }
        }

        if (!known) {
            // Request was withdrawn: the peer's receive session must not wait for chunks
            spdlog::warn("ConnectionRegistry: file-accept {} from {} has no open request",
                         payload.metadata.id, peerId);
            FileRejectPayload reject;
            reject.metadata = payload.metadata;
            reject.reason = REJECT_REASON_WITHDRAWN;
            if (!send(peerId, reject)) {
                spdlog::debug("ConnectionRegistry: file-reject {} to {} not delivered",
                              payload.metadata.id, peerId);
            }
            return false;
        }

        spdlog::info("ConnectionRegistry: {} accepted {}", peerId, metadata.id);
        if (session && session->start()) {
            wakePump();
        }

        ResponseCallback callback;
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            callback = m_onTransferAccepted;
        }
        if (callback) callback(peerId, metadata);
        return true;
    }

    bool onFileReject(const std::string& peerId, const FileRejectPayload& payload) {
        const std::string& id = payload.metadata.id;
        if (payload.reason == REJECT_REASON_DUPLICATE) {
            // The peer already holds this id; our first request stands
            spdlog::debug("ConnectionRegistry: {} refused a repeated request {}", peerId, id);
            return false;
        }

        std::shared_ptr<TransferSession> session;
        bool rejectedRequest = false;
        std::optional<IncomingRequest> withdrawn;
        FileMetadata metadata = payload.metadata;
        {
            std::lock_guard<std::mutex> lock(m_sessionsMutex);
            auto iit = m_incoming.find(id);
            if (iit != m_incoming.end() && iit->second.peerId == peerId) {
                withdrawn = iit->second;
                m_incoming.erase(iit);
            }

            auto sit = m_sessions.find(id);
            if (sit != m_sessions.end() && sit->second->peerId() == peerId) {
                session = sit->second;
            }

            auto it = m_outgoing.find(id);
            if (it != m_outgoing.end() && it->second.peerId == peerId) {
                if (it->second.accepted) {
                    spdlog::debug("ConnectionRegistry: Ignoring reject for accepted {}", id);
                    return false;
                }
                metadata = it->second.metadata;
                m_outgoing.erase(it);
                rejectedRequest = true;
            }
        }

        if (withdrawn) {
            spdlog::info("ConnectionRegistry: {} withdrew request {}", peerId, id);
            ResponseCallback callback;
            {
                std::lock_guard<std::mutex> lock(m_callbackMutex);
                callback = m_onTransferWithdrawn;
            }
            if (callback) callback(peerId, withdrawn->metadata);
            return true;
        }

        if (session && session->direction() == TransferDirection::Receive) {
            // Sender gave up on a stream we are receiving
            return session->fail(TransferErrorKind::Cancelled, "Cancelled by sender");
        }

        if (!rejectedRequest) {
            spdlog::debug("ConnectionRegistry: Unexpected file-reject {} from {}", id, peerId);
            return false;
        }

        spdlog::info("ConnectionRegistry: {} rejected {}", peerId, id);
        if (session) {
            session->markRejected();
        }

        ResponseCallback callback;
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            callback = m_onTransferRejected;
        }
        if (callback) callback(peerId, metadata);
        return true;
    }

    bool onFileChunk(const std::string& peerId, const ChunkMessage& chunk) {
        auto session = receiveSession(peerId, chunk.transferId);
        if (!session) {
            spdlog::debug("ConnectionRegistry: Chunk {} for unknown transfer {} dropped",
                          chunk.index, chunk.transferId);
            return false;
        }
        return session->handleChunk(chunk);
    }

    bool onFileComplete(const std::string& peerId, const FileCompletePayload& payload) {
        auto session = receiveSession(peerId, payload.transferId);
        if (!session) {
            spdlog::debug("ConnectionRegistry: file-complete for unknown transfer {} dropped",
                          payload.transferId);
            return false;
        }
        return session->handleComplete(payload);
    }

    std::shared_ptr<TransferSession> receiveSession(const std::string& peerId,
                                                    const std::string& transferId) {
        std::lock_guard<std::mutex> lock(m_sessionsMutex);
        auto it = m_sessions.find(transferId);
        if (it == m_sessions.end() ||
            it->second->direction() != TransferDirection::Receive ||
            it->second->peerId() != peerId) {
            return nullptr;
        }
        return it->second;
    }

    // ═══════════════════════════════════════════════════════════
    // Transfers
    // ═══════════════════════════════════════════════════════════

    std::optional<FileMetadata> sendFileRequest(const std::string& peerId,
                                                std::shared_ptr<FileSource> file,
                                                bool useFEC, double parityRatio) {
        if (!file) return std::nullopt;

        if (!isConnected(peerId)) {
            spdlog::warn("ConnectionRegistry: Cannot request transfer, {} not connected", peerId);
            return std::nullopt;
        }

        int64_t size = file->size();
        if (size <= 0 || size > m_config.maxFileSize) {
            spdlog::warn("ConnectionRegistry: {} has unsupported size {}", file->name(), size);
            return std::nullopt;
        }

        FileMetadata metadata;
        try {
            metadata.id = generateTransferId();
        } catch (const std::exception& e) {
            spdlog::error("ConnectionRegistry: {}", e.what());
            return std::nullopt;
        }
        metadata.name = file->name();
        metadata.size = size;
        metadata.mimeType = file->mimeType();
        metadata.useFEC = useFEC && parityRatio > 0.0;
        metadata.fecParityRatio = metadata.useFEC ? std::clamp(parityRatio, 0.0, 1.0) : 0.0;

        {
            std::lock_guard<std::mutex> lock(m_sessionsMutex);
            m_outgoing[metadata.id] = OutgoingRequest{peerId, metadata, false};
        }

        FileRequestPayload request;
        request.metadata = metadata;
        {
            std::lock_guard<std::mutex> lock(m_peersMutex);
            request.from = m_local;
        }

        if (!send(peerId, request)) {
            std::lock_guard<std::mutex> lock(m_sessionsMutex);
            m_outgoing.erase(metadata.id);
            return std::nullopt;
        }

        spdlog::info("ConnectionRegistry: Requested transfer {} of {} to {}",
                     metadata.id, metadata.name, peerId);
        return metadata;
    }

    bool sendFile(const std::string& peerId, std::shared_ptr<FileSource> file,
                  const FileMetadata& metadata) {
        if (!file || file->size() != metadata.size) {
            spdlog::warn("ConnectionRegistry: File for {} does not match its metadata", metadata.id);
            return false;
        }

        std::shared_ptr<TransferSession> session;
        bool accepted = false;
        {
            std::lock_guard<std::mutex> lock(m_sessionsMutex);
            auto it = m_outgoing.find(metadata.id);
            if (it == m_outgoing.end() || it->second.peerId != peerId) {
                spdlog::warn("ConnectionRegistry: No open request {} to {}", metadata.id, peerId);
                return false;
            }
            if (m_sessions.count(metadata.id)) {
                return false;
            }

            session = TransferSession::createSender(it->second.metadata, peerId, std::move(file),
                                                    &m_reader, m_config);
            attach(session);
            m_sessions[metadata.id] = session;
            accepted = it->second.accepted;
        }

        if (accepted && session->start()) {
            wakePump();
        }
        return true;
    }

    bool acceptFileTransfer(const std::string& peerId, const FileMetadata& metadata) {
        std::shared_ptr<TransferSession> session;
        {
            std::lock_guard<std::mutex> lock(m_sessionsMutex);
            auto it = m_incoming.find(metadata.id);
            if (it == m_incoming.end() || it->second.peerId != peerId) {
                spdlog::warn("ConnectionRegistry: No pending request {} from {}", metadata.id, peerId);
                return false;
            }

            session = TransferSession::createReceiver(it->second.metadata, peerId, m_config);
            attach(session);
            m_sessions[metadata.id] = session;
            m_incoming.erase(it);
        }

        FileAcceptPayload accept;
        accept.metadata = session->metadata();
        if (!send(peerId, accept)) {
            session->fail(TransferErrorKind::Transport, "Failed to send file-accept");
            return false;
        }

        spdlog::info("ConnectionRegistry: Accepted {} from {}", metadata.id, peerId);
        return true;
    }

    bool rejectFileTransfer(const std::string& peerId, const FileMetadata& metadata) {
        FileRejectPayload reject;
        {
            std::lock_guard<std::mutex> lock(m_sessionsMutex);
            auto it = m_incoming.find(metadata.id);
            if (it == m_incoming.end() || it->second.peerId != peerId) {
                return false;
            }
            reject.metadata = it->second.metadata;
            m_incoming.erase(it);
        }

        spdlog::info("ConnectionRegistry: Rejected {} from {}", metadata.id, peerId);
        return send(peerId, reject);
    }

    bool cancelTransfer(const std::string& transferId) {
        std::shared_ptr<TransferSession> session;
        std::optional<IncomingRequest> incoming;
        std::optional<OutgoingRequest> outgoing;
        {
            std::lock_guard<std::mutex> lock(m_sessionsMutex);
            auto sit = m_sessions.find(transferId);
            auto oit = m_outgoing.find(transferId);
            if (sit != m_sessions.end()) {
                session = sit->second;
            } else if (oit != m_outgoing.end()) {
                outgoing = oit->second;
                m_outgoing.erase(oit);
            } else {
                auto it = m_incoming.find(transferId);
                if (it == m_incoming.end()) return false;
                incoming = it->second;
            }
        }

        if (incoming) {
            return rejectFileTransfer(incoming->peerId, incoming->metadata);
        }

        FileRejectPayload notice;
        notice.reason = REJECT_REASON_WITHDRAWN;
        std::string peerId;
        if (outgoing) {
            spdlog::info("ConnectionRegistry: Withdrew request {} to {}", transferId, outgoing->peerId);
            notice.metadata = outgoing->metadata;
            peerId = outgoing->peerId;
        } else {
            if (!session->cancel()) {
                return false;
            }
            if (session->direction() == TransferDirection::Receive) {
                return true;
            }
            {
                // A late file-accept is answered with file-reject from now on
                std::lock_guard<std::mutex> lock(m_sessionsMutex);
                m_outgoing.erase(transferId);
            }
            notice.metadata = session->metadata();
            peerId = session->peerId();
        }

        // The receiver drops its request or fails its session
        if (!send(peerId, notice)) {
            spdlog::debug("ConnectionRegistry: Cancel notice {} to {} not delivered",
                          transferId, peerId);
        }
        return true;
    }

    std::vector<TransferRecord> getActiveTransfers() const {
        std::vector<TransferRecord> result;
        {
            std::lock_guard<std::mutex> lock(m_sessionsMutex);
            result.reserve(m_sessions.size());
            for (const auto& [id, session] : m_sessions) {
                result.push_back(session->record());
            }
        }
        std::stable_sort(result.begin(), result.end(),
                         [](const TransferRecord& a, const TransferRecord& b) {
                             return a.createdAt < b.createdAt;
                         });
        return result;
    }

    std::optional<TransferRecord> getTransfer(const std::string& transferId) const {
        std::lock_guard<std::mutex> lock(m_sessionsMutex);
        auto it = m_sessions.find(transferId);
        if (it == m_sessions.end()) return std::nullopt;
        return it->second->record();
    }

    size_t clearFinishedTransfers() {
        std::lock_guard<std::mutex> lock(m_sessionsMutex);
        size_t removed = 0;
        for (auto it = m_sessions.begin(); it != m_sessions.end();) {
            if (it->second->isTerminal()) {
                m_outgoing.erase(it->first);
                it = m_sessions.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    std::optional<std::vector<uint8_t>> takeReceivedFile(const std::string& transferId) {
        std::shared_ptr<TransferSession> session;
        {
            std::lock_guard<std::mutex> lock(m_sessionsMutex);
            auto it = m_sessions.find(transferId);
            if (it == m_sessions.end()) return std::nullopt;
            session = it->second;
        }
        return session->takeReceivedBytes();
    }

    // ═══════════════════════════════════════════════════════════
    // Callbacks
    // ═══════════════════════════════════════════════════════════

    std::mutex m_callbackMutex;
    PeerCallback m_onPeerConnected;
    PeerCallback m_onPeerDisconnected;
    RequestCallback m_onTransferRequest;
    TransferCallback m_onTransferProgress;
    TransferCallback m_onTransferCompleted;
    TransferCallback m_onTransferFailed;
    ResponseCallback m_onTransferAccepted;
    ResponseCallback m_onTransferRejected;
    ResponseCallback m_onTransferWithdrawn;

private:
    std::shared_ptr<PeerTransport> m_transport;
    TransferConfig m_config;
    SliceReader m_reader;

    mutable std::mutex m_peersMutex;
    std::map<std::string, PeerInfo> m_peers;
    PeerInfo m_local;

    mutable std::mutex m_sessionsMutex;
    std::map<std::string, std::shared_ptr<TransferSession>> m_sessions;
    std::map<std::string, IncomingRequest> m_incoming;
    std::map<std::string, OutgoingRequest> m_outgoing;

    std::thread m_pumpThread;
    std::mutex m_pumpMutex;
    std::condition_variable m_pumpCv;
    bool m_running = false;
    bool m_pumpWake = false;

    void attach(const std::shared_ptr<TransferSession>& session) {
        session->setEventCallback([this](const TransferRecord& record, bool statusChanged) {
            onSessionEvent(record, statusChanged);
        });
    }

    void onSessionEvent(const TransferRecord& record, bool statusChanged) {
        TransferCallback progress;
        TransferCallback terminal;
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            progress = m_onTransferProgress;
            if (statusChanged && record.status == TransferStatus::Completed) {
                terminal = m_onTransferCompleted;
            } else if (statusChanged && (record.status == TransferStatus::Failed ||
                                         record.status == TransferStatus::IntegrityError)) {
                terminal = m_onTransferFailed;
            }
        }

        if (progress) progress(record);
        if (terminal) terminal(record);
    }

    void wakePump() {
        {
            std::lock_guard<std::mutex> lock(m_pumpMutex);
            m_pumpWake = true;
        }
        m_pumpCv.notify_one();
    }

    bool isRunning() {
        std::lock_guard<std::mutex> lock(m_pumpMutex);
        return m_running;
    }

    // Receive sessions that got nothing from the sender for idleTimeoutMs
    void expireIdleReceivers() {
        if (m_config.idleTimeoutMs <= 0) return;

        std::vector<std::shared_ptr<TransferSession>> expired;
        {
            std::lock_guard<std::mutex> lock(m_sessionsMutex);
            for (const auto& [id, session] : m_sessions) {
                if (session->direction() == TransferDirection::Receive &&
                    !session->isTerminal() &&
                    session->idleMs() >= m_config.idleTimeoutMs) {
                    expired.push_back(session);
                }
            }
        }

        for (auto& session : expired) {
            session->fail(TransferErrorKind::Timeout,
                          fmt::format("No data from {} for {} ms", session->peerId(),
                                      m_config.idleTimeoutMs));
        }
    }

    void pumpLoop() {
        auto lastIdleCheck = std::chrono::steady_clock::now();
        while (isRunning()) {
            auto now = std::chrono::steady_clock::now();
            if (now - lastIdleCheck >= std::chrono::milliseconds(IDLE_CHECK_INTERVAL_MS)) {
                lastIdleCheck = now;
                expireIdleReceivers();
            }

            std::vector<std::shared_ptr<TransferSession>> senders;
            {
                std::lock_guard<std::mutex> lock(m_sessionsMutex);
                for (const auto& [id, session] : m_sessions) {
                    if (session->direction() == TransferDirection::Send &&
                        session->status() == TransferStatus::Transferring) {
                        senders.push_back(session);
                    }
                }
            }

            bool progressed = false;
            int64_t waitMs = PUMP_IDLE_WAIT_MS;

            // One chunk per session per round
            for (auto& session : senders) {
                const std::string& peerId = session->peerId();
                if (m_transport->pendingBytes(peerId) > m_config.maxBufferedBytes) {
                    waitMs = std::min(waitMs, BACKPRESSURE_WAIT_MS);
                    continue;
                }

                auto result = session->pump([this, &peerId](const ProtocolMessage& message) {
                    return send(peerId, message);
                });

                switch (result.status) {
                    case PumpStatus::Sent:
                    case PumpStatus::Finished:
                    case PumpStatus::Failed:
                        progressed = true;
                        break;
                    case PumpStatus::Waiting:
                        waitMs = std::min(waitMs, std::max<int64_t>(result.waitMs, 1));
                        break;
                    case PumpStatus::Idle:
                        break;
                }
            }

            if (progressed) continue;

            std::unique_lock<std::mutex> lock(m_pumpMutex);
            m_pumpCv.wait_for(lock, std::chrono::milliseconds(waitMs), [this]() {
                return m_pumpWake || !m_running;
            });
            m_pumpWake = false;
        }
    }
};

// ═══════════════════════════════════════════════════════════
// ConnectionRegistry
// ═══════════════════════════════════════════════════════════

ConnectionRegistry::ConnectionRegistry(std::shared_ptr<PeerTransport> transport,
                                       const TransferConfig& config)
    : m_impl(std::make_unique<Impl>(std::move(transport), config)) {
}

ConnectionRegistry::~ConnectionRegistry() = default;

const TransferConfig& ConnectionRegistry::config() const {
    return m_impl->config();
}

void ConnectionRegistry::setLocalIdentity(const std::string& id, const std::string& name) {
    m_impl->setLocalIdentity(id, name);
}

void ConnectionRegistry::shutdown() {
    m_impl->shutdown();
}

bool ConnectionRegistry::connect(const std::string& peerId) {
    return m_impl->connect(peerId);
}

void ConnectionRegistry::disconnect(const std::string& peerId) {
    m_impl->disconnect(peerId);
}

bool ConnectionRegistry::isConnected(const std::string& peerId) const {
    return m_impl->isConnected(peerId);
}

std::vector<PeerInfo> ConnectionRegistry::getConnectedPeers() const {
    return m_impl->getConnectedPeers();
}

void ConnectionRegistry::handlePeerConnected(const std::string& peerId, const std::string& name) {
    m_impl->handlePeerConnected(peerId, name);
}

void ConnectionRegistry::handlePeerDisconnected(const std::string& peerId) {
    m_impl->handlePeerDisconnected(peerId);
}

bool ConnectionRegistry::handleInbound(const std::string& peerId, const uint8_t* data, size_t size) {
    return m_impl->handleInbound(peerId, data, size);
}

bool ConnectionRegistry::send(const std::string& peerId, const ProtocolMessage& message) {
    return m_impl->send(peerId, message);
}

std::optional<FileMetadata> ConnectionRegistry::sendFileRequest(const std::string& peerId,
                                                                std::shared_ptr<FileSource> file) {
    const auto& cfg = m_impl->config();
    return m_impl->sendFileRequest(peerId, std::move(file), cfg.useFEC, cfg.defaultParityRatio);
}

std::optional<FileMetadata> ConnectionRegistry::sendFileRequest(const std::string& peerId,
                                                                std::shared_ptr<FileSource> file,
                                                                bool useFEC, double fecParityRatio) {
    return m_impl->sendFileRequest(peerId, std::move(file), useFEC, fecParityRatio);
}

bool ConnectionRegistry::sendFile(const std::string& peerId, std::shared_ptr<FileSource> file,
                                  const FileMetadata& metadata) {
    return m_impl->sendFile(peerId, std::move(file), metadata);
}

bool ConnectionRegistry::acceptFileTransfer(const std::string& peerId, const FileMetadata& metadata) {
    return m_impl->acceptFileTransfer(peerId, metadata);
}

bool ConnectionRegistry::rejectFileTransfer(const std::string& peerId, const FileMetadata& metadata) {
    return m_impl->rejectFileTransfer(peerId, metadata);
}

bool ConnectionRegistry::cancelTransfer(const std::string& transferId) {
    return m_impl->cancelTransfer(transferId);
}

std::vector<TransferRecord> ConnectionRegistry::getActiveTransfers() const {
    return m_impl->getActiveTransfers();
}

std::optional<TransferRecord> ConnectionRegistry::getTransfer(const std::string& transferId) const {
    return m_impl->getTransfer(transferId);
}

size_t ConnectionRegistry::clearFinishedTransfers() {
    return m_impl->clearFinishedTransfers();
}

std::optional<std::vector<uint8_t>> ConnectionRegistry::takeReceivedFile(const std::string& transferId) {
    return m_impl->takeReceivedFile(transferId);
}

void ConnectionRegistry::onPeerConnected(PeerCallback callback) {
    std::lock_guard<std::mutex> lock(m_impl->m_callbackMutex);
    m_impl->m_onPeerConnected = std::move(callback);
}

void ConnectionRegistry::onPeerDisconnected(PeerCallback callback) {
    std::lock_guard<std::mutex> lock(m_impl->m_callbackMutex);
    m_impl->m_onPeerDisconnected = std::move(callback);
}

void ConnectionRegistry::onTransferRequest(RequestCallback callback) {
    std::lock_guard<std::mutex> lock(m_impl->m_callbackMutex);
    m_impl->m_onTransferRequest = std::move(callback);
}

void ConnectionRegistry::onTransferProgress(TransferCallback callback) {
    std::lock_guard<std::mutex> lock(m_impl->m_callbackMutex);
    m_impl->m_onTransferProgress = std::move(callback);
}

void ConnectionRegistry::onTransferCompleted(TransferCallback callback) {
    std::lock_guard<std::mutex> lock(m_impl->m_callbackMutex);
    m_impl->m_onTransferCompleted = std::move(callback);
}

void ConnectionRegistry::onTransferFailed(TransferCallback callback) {
    std::lock_guard<std::mutex> lock(m_impl->m_callbackMutex);
    m_impl->m_onTransferFailed = std::move(callback);
}

void ConnectionRegistry::onTransferAccepted(ResponseCallback callback) {
    std::lock_guard<std::mutex> lock(m_impl->m_callbackMutex);
    m_impl->m_onTransferAccepted = std::move(callback);
}

void ConnectionRegistry::onTransferRejected(ResponseCallback callback) {
    std::lock_guard<std::mutex> lock(m_impl->m_callbackMutex);
    m_impl->m_onTransferRejected = std::move(callback);
}

void ConnectionRegistry::onTransferWithdrawn(ResponseCallback callback) {
    std::lock_guard<std::mutex> lock(m_impl->m_callbackMutex);
    m_impl->m_onTransferWithdrawn = std::move(callback);
}

} // namespace Innerocket
