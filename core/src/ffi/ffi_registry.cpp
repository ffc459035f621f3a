// ffi_registry.cpp — C API for ConnectionRegistry

#include "innerocket/innerocket_c.h"
#include "innerocket/Network/ConnectionRegistry.h"
#include "innerocket/Network/PeerTransport.h"
#include "innerocket/Network/TransferProtocol.h"
#include "innerocket/FileSource.h"
#include "innerocket/TransferConfig.h"
#include "ffi_internal.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

using namespace Innerocket;
using json = nlohmann::json;

namespace {

enum class RegistryEvent : int32_t {
    PeerConnected = 0,
    PeerDisconnected = 1,
    TransferRequest = 2,
    TransferProgress = 3,
    TransferCompleted = 4,
    TransferFailed = 5,
    TransferAccepted = 6,
    TransferRejected = 7,
    TransferWithdrawn = 8
};

// ═══════════════════════════════════════════════════════════
// HostTransport — PeerTransport over host callbacks
// ═══════════════════════════════════════════════════════════

class HostTransport : public PeerTransport {
public:
    HostTransport(IRSendCallback send, IRConnectCallback connect, void* userData)
        : m_send(send), m_connect(connect), m_userData(userData) {}

    bool connect(const std::string& peerId) override {
        if (!m_connect) {
            spdlog::warn("FFI: No connect callback, cannot connect to {}", peerId);
            return false;
        }
        return m_connect(peerId.c_str(), 1, m_userData) != 0;
    }

    void disconnect(const std::string& peerId) override {
        if (m_connect) {
            m_connect(peerId.c_str(), 0, m_userData);
        }
    }

    bool send(const std::string& peerId, const std::vector<uint8_t>& frame) override {
        return m_send(peerId.c_str(), frame.data(), frame.size(), m_userData) != 0;
    }

private:
    IRSendCallback m_send;
    IRConnectCallback m_connect;
    void* m_userData;
};

// ═══════════════════════════════════════════════════════════
// JSON helpers
// ═══════════════════════════════════════════════════════════

json peerInfoToJson(const PeerInfo& peer) {
    return {
        {"id", peer.id},
        {"name", peer.name},
        {"connectedAt", peer.connectedAt}
    };
}

json transferRecordToJson(const TransferRecord& r) {
    json j = {
        {"id", r.id},
        {"fileName", r.fileName},
        {"fileSize", r.fileSize},
        {"fileType", r.fileType},
        {"sender", r.sender},
        {"receiver", r.receiver},
        {"progress", r.progress},
        {"status", transferStatusToString(r.status)},
        {"direction", transferDirectionToString(r.direction)},
        {"createdAt", r.createdAt},
        {"transferSpeed", r.transferSpeed},
        {"chunkSize", r.chunkSize},
        {"bytesTransferred", r.bytesTransferred},
        {"useFEC", r.useFEC},
        {"compressionSavings", {
            {"savedBytes", r.compressionSavings.savedBytes},
            {"savedPercentage", r.compressionSavings.savedPercentage}
        }}
    };
    j["checksum"] = r.checksum ? json(*r.checksum) : json(nullptr);
    if (r.errorKind != TransferErrorKind::None) {
        j["errorKind"] = transferErrorKindToString(r.errorKind);
        j["error"] = r.error;
    }
    return j;
}

json metadataJson(const FileMetadata& metadata) {
    return json::parse(fileMetadataToJson(metadata));
}

// Heap-allocated; host must call ir_free_string after reading
const char* allocEventJson(const std::string& data) {
    return ir_strdup(data.c_str());
}

// ═══════════════════════════════════════════════════════════
// RegistryWrapper
// ═══════════════════════════════════════════════════════════

struct RegistryWrapper {
    std::unique_ptr<ConnectionRegistry> registry;
    std::mutex callbackMutex;
    IREventCallback callback = nullptr;
    void* userData = nullptr;

    void emit(RegistryEvent event, const json& data) {
        IREventCallback cb;
        void* ud;
        {
            std::lock_guard<std::mutex> lock(callbackMutex);
            cb = callback;
            ud = userData;
        }
        if (cb) {
            cb(static_cast<int32_t>(event), allocEventJson(data.dump()), ud);
        }
    }

    void installCallbacks() {
        registry->onPeerConnected([this](const PeerInfo& peer) {
            emit(RegistryEvent::PeerConnected, peerInfoToJson(peer));
        });
        registry->onPeerDisconnected([this](const PeerInfo& peer) {
            emit(RegistryEvent::PeerDisconnected, peerInfoToJson(peer));
        });
        registry->onTransferRequest([this](const FileTransferRequest& request) {
            emit(RegistryEvent::TransferRequest, {
                {"metadata", metadataJson(request.metadata)},
                {"from", peerInfoToJson(request.from)}
            });
        });
        registry->onTransferProgress([this](const TransferRecord& record) {
            emit(RegistryEvent::TransferProgress, transferRecordToJson(record));
        });
        registry->onTransferCompleted([this](const TransferRecord& record) {
            emit(RegistryEvent::TransferCompleted, transferRecordToJson(record));
        });
        registry->onTransferFailed([this](const TransferRecord& record) {
            emit(RegistryEvent::TransferFailed, transferRecordToJson(record));
        });
        registry->onTransferAccepted([this](const std::string& peerId, const FileMetadata& metadata) {
            emit(RegistryEvent::TransferAccepted, {
                {"peerId", peerId},
                {"metadata", metadataJson(metadata)}
            });
        });
        registry->onTransferRejected([this](const std::string& peerId, const FileMetadata& metadata) {
            emit(RegistryEvent::TransferRejected, {
                {"peerId", peerId},
                {"metadata", metadataJson(metadata)}
            });
        });
        registry->onTransferWithdrawn([this](const std::string& peerId, const FileMetadata& metadata) {
            emit(RegistryEvent::TransferWithdrawn, {
                {"peerId", peerId},
                {"metadata", metadataJson(metadata)}
            });
        });
    }
};

RegistryWrapper* toWrapper(IRRegistry registry) {
    return reinterpret_cast<RegistryWrapper*>(registry);
}

std::optional<FileMetadata> parseMetadataArg(const char* metadataJson) {
    if (!requireArg(metadataJson, "metadata_json")) {
        return std::nullopt;
    }
    auto metadata = fileMetadataFromJson(metadataJson);
    if (!metadata) {
        setLastError(IR_ERROR_INVALID_ARGUMENT, "Invalid metadata JSON");
    }
    return metadata;
}

} // namespace

// ═══════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════

IRRegistry ir_registry_create(const char* config_json,
                              IRSendCallback send_cb,
                              IRConnectCallback connect_cb,
                              void* user_data) {
    clearLastError();

    if (!send_cb) {
        setLastError(IR_ERROR_INVALID_ARGUMENT, "Send callback is null");
        return nullptr;
    }

    TransferConfig config;
    if (config_json && *config_json) {
        auto parsed = TransferConfig::fromJson(config_json);
        if (!parsed) {
            setLastError(IR_ERROR_INVALID_ARGUMENT, "Invalid config JSON");
            return nullptr;
        }
        config = *parsed;
    }

    try {
        spdlog::set_level(spdlog::level::from_str(config.logLevel));

        auto transport = std::make_shared<HostTransport>(send_cb, connect_cb, user_data);
        auto wrapper = std::make_unique<RegistryWrapper>();
        wrapper->registry = std::make_unique<ConnectionRegistry>(transport, config);
        wrapper->installCallbacks();

        spdlog::debug("FFI: ConnectionRegistry created");
        return reinterpret_cast<IRRegistry>(wrapper.release());
    } catch (const std::invalid_argument& e) {
        setLastError(IR_ERROR_INVALID_ARGUMENT, e.what());
        return nullptr;
    } catch (const std::exception& e) {
        setLastError(IR_ERROR_INTERNAL, e.what());
        return nullptr;
    }
}

void ir_registry_destroy(IRRegistry registry) {
    if (!registry) return;

    auto* wrapper = toWrapper(registry);
    // Stop worker threads before the wrapper (captured by callbacks) goes away
    wrapper->registry->shutdown();
    wrapper->registry.reset();
    delete wrapper;
    spdlog::debug("FFI: ConnectionRegistry destroyed");
}

IRError ir_registry_set_event_callback(IRRegistry registry,
                                       IREventCallback callback,
                                       void* user_data) {
    clearLastError();
    if (!registry) {
        setLastError(IR_ERROR_INVALID_ARGUMENT, "Registry is null");
        return IR_ERROR_INVALID_ARGUMENT;
    }

    auto* wrapper = toWrapper(registry);
    std::lock_guard<std::mutex> lock(wrapper->callbackMutex);
    wrapper->callback = callback;
    wrapper->userData = user_data;
    return IR_OK;
}

IRError ir_registry_set_local_identity(IRRegistry registry,
                                       const char* peer_id, const char* name) {
    clearLastError();
    if (!registry) {
        setLastError(IR_ERROR_INVALID_ARGUMENT, "Registry is null");
        return IR_ERROR_INVALID_ARGUMENT;
    }
    if (!requireArg(peer_id, "peer_id")) {
        return IR_ERROR_INVALID_ARGUMENT;
    }

    toWrapper(registry)->registry->setLocalIdentity(peer_id, name ? name : "");
    return IR_OK;
}

// ═══════════════════════════════════════════════════════════
// Transport entry points
// ═══════════════════════════════════════════════════════════

IRError ir_peer_connected(IRRegistry registry, const char* peer_id, const char* name) {
    clearLastError();
    if (!registry) {
        setLastError(IR_ERROR_INVALID_ARGUMENT, "Registry is null");
        return IR_ERROR_INVALID_ARGUMENT;
    }
    if (!requireArg(peer_id, "peer_id")) {
        return IR_ERROR_INVALID_ARGUMENT;
    }

    try {
        toWrapper(registry)->registry->handlePeerConnected(peer_id, name ? name : "");
        return IR_OK;
    } catch (const std::exception& e) {
        setLastError(IR_ERROR_INTERNAL, e.what());
        return IR_ERROR_INTERNAL;
    }
}

IRError ir_peer_disconnected(IRRegistry registry, const char* peer_id) {
    clearLastError();
    if (!registry) {
        setLastError(IR_ERROR_INVALID_ARGUMENT, "Registry is null");
        return IR_ERROR_INVALID_ARGUMENT;
    }
    if (!requireArg(peer_id, "peer_id")) {
        return IR_ERROR_INVALID_ARGUMENT;
    }

    try {
        toWrapper(registry)->registry->handlePeerDisconnected(peer_id);
        return IR_OK;
    } catch (const std::exception& e) {
        setLastError(IR_ERROR_INTERNAL, e.what());
        return IR_ERROR_INTERNAL;
    }
}

IRError ir_deliver_frame(IRRegistry registry, const char* peer_id,
                         const uint8_t* data, size_t size) {
    clearLastError();
    if (!registry || !data || size == 0) {
        setLastError(IR_ERROR_INVALID_ARGUMENT, "Registry or frame is null");
        return IR_ERROR_INVALID_ARGUMENT;
    }
    if (!requireArg(peer_id, "peer_id")) {
        return IR_ERROR_INVALID_ARGUMENT;
    }

    try {
        if (!toWrapper(registry)->registry->handleInbound(peer_id, data, size)) {
            setLastError(IR_ERROR_INVALID_ARGUMENT, "Frame dropped");
            return IR_ERROR_INVALID_ARGUMENT;
        }
        return IR_OK;
    } catch (const std::exception& e) {
        setLastError(IR_ERROR_INTERNAL, e.what());
        return IR_ERROR_INTERNAL;
    }
}

// ═══════════════════════════════════════════════════════════
// Connections
// ═══════════════════════════════════════════════════════════

IRError ir_connect(IRRegistry registry, const char* peer_id) {
    clearLastError();
    if (!registry) {
        setLastError(IR_ERROR_INVALID_ARGUMENT, "Registry is null");
        return IR_ERROR_INVALID_ARGUMENT;
    }
    if (!requireArg(peer_id, "peer_id")) {
        return IR_ERROR_INVALID_ARGUMENT;
    }

    try {
        if (!toWrapper(registry)->registry->connect(peer_id)) {
            setLastError(IR_ERROR_NETWORK, std::string("Failed to connect to ") + peer_id);
            return IR_ERROR_NETWORK;
        }
        return IR_OK;
    } catch (const std::exception& e) {
        setLastError(IR_ERROR_INTERNAL, e.what());
        return IR_ERROR_INTERNAL;
    }
}

IRError ir_disconnect(IRRegistry registry, const char* peer_id) {
    clearLastError();
    if (!registry) {
        setLastError(IR_ERROR_INVALID_ARGUMENT, "Registry is null");
        return IR_ERROR_INVALID_ARGUMENT;
    }
    if (!requireArg(peer_id, "peer_id")) {
        return IR_ERROR_INVALID_ARGUMENT;
    }

    try {
        toWrapper(registry)->registry->disconnect(peer_id);
        return IR_OK;
    } catch (const std::exception& e) {
        setLastError(IR_ERROR_INTERNAL, e.what());
        return IR_ERROR_INTERNAL;
    }
}

int32_t ir_is_connected(IRRegistry registry, const char* peer_id) {
    if (!registry || !peer_id) return 0;
    return toWrapper(registry)->registry->isConnected(peer_id) ? 1 : 0;
}

char* ir_get_connected_peers(IRRegistry registry) {
    clearLastError();
    if (!registry) {
        setLastError(IR_ERROR_INVALID_ARGUMENT, "Registry is null");
        return nullptr;
    }

    try {
        json arr = json::array();
        for (const auto& peer : toWrapper(registry)->registry->getConnectedPeers()) {
            arr.push_back(peerInfoToJson(peer));
        }
        return alloc_string(arr.dump());
    } catch (const std::exception& e) {
        setLastError(IR_ERROR_INTERNAL, e.what());
        return nullptr;
    }
}

// ═══════════════════════════════════════════════════════════
// Transfers
// ═══════════════════════════════════════════════════════════

char* ir_send_file_request(IRRegistry registry, const char* peer_id, const char* path,
                           int32_t use_fec, double parity_ratio) {
    clearLastError();
    if (!registry) {
        setLastError(IR_ERROR_INVALID_ARGUMENT, "Registry is null");
        return nullptr;
    }
    if (!requireArg(peer_id, "peer_id") || !requireArg(path, "path")) {
        return nullptr;
    }

    try {
        auto* wrapper = toWrapper(registry);
        auto file = std::make_shared<LocalFileSource>(path);
        if (!file->isOpen()) {
            setLastError(IR_ERROR_IO, std::string("Cannot open file: ") + path);
            return nullptr;
        }
        if (!wrapper->registry->isConnected(peer_id)) {
            setLastError(IR_ERROR_NETWORK, std::string("Peer not connected: ") + peer_id);
            return nullptr;
        }

        std::optional<FileMetadata> metadata;
        if (use_fec < 0) {
            metadata = wrapper->registry->sendFileRequest(peer_id, file);
        } else {
            metadata = wrapper->registry->sendFileRequest(peer_id, file, use_fec != 0, parity_ratio);
        }
        if (!metadata) {
            setLastError(IR_ERROR_NETWORK, "Failed to send file request");
            return nullptr;
        }
        return alloc_string(fileMetadataToJson(*metadata));
    } catch (const std::exception& e) {
        setLastError(IR_ERROR_INTERNAL, e.what());
        return nullptr;
    }
}

IRError ir_send_file(IRRegistry registry, const char* peer_id, const char* path,
                     const char* metadata_json) {
    clearLastError();
    if (!registry) {
        setLastError(IR_ERROR_INVALID_ARGUMENT, "Registry is null");
        return IR_ERROR_INVALID_ARGUMENT;
    }
    if (!requireArg(peer_id, "peer_id") || !requireArg(path, "path")) {
        return IR_ERROR_INVALID_ARGUMENT;
    }
    auto metadata = parseMetadataArg(metadata_json);
    if (!metadata) {
        return IR_ERROR_INVALID_ARGUMENT;
    }

    try {
        auto file = std::make_shared<LocalFileSource>(path);
        if (!file->isOpen() || file->size() != metadata->size) {
            setLastError(IR_ERROR_IO, std::string("File missing or changed: ") + path);
            return IR_ERROR_IO;
        }
        if (!toWrapper(registry)->registry->sendFile(peer_id, file, *metadata)) {
            setLastError(IR_ERROR_NOT_FOUND, "No pending request for transfer " + metadata->id);
            return IR_ERROR_NOT_FOUND;
        }
        return IR_OK;
    } catch (const std::exception& e) {
        setLastError(IR_ERROR_INTERNAL, e.what());
        return IR_ERROR_INTERNAL;
    }
}

IRError ir_accept_transfer(IRRegistry registry, const char* peer_id,
                           const char* metadata_json) {
    clearLastError();
    if (!registry) {
        setLastError(IR_ERROR_INVALID_ARGUMENT, "Registry is null");
        return IR_ERROR_INVALID_ARGUMENT;
    }
    if (!requireArg(peer_id, "peer_id")) {
        return IR_ERROR_INVALID_ARGUMENT;
    }
    auto metadata = parseMetadataArg(metadata_json);
    if (!metadata) {
        return IR_ERROR_INVALID_ARGUMENT;
    }

    try {
        if (!toWrapper(registry)->registry->acceptFileTransfer(peer_id, *metadata)) {
            setLastError(IR_ERROR_NOT_FOUND, "No incoming request " + metadata->id);
            return IR_ERROR_NOT_FOUND;
        }
        return IR_OK;
    } catch (const std::exception& e) {
        setLastError(IR_ERROR_INTERNAL, e.what());
        return IR_ERROR_INTERNAL;
    }
}

IRError ir_reject_transfer(IRRegistry registry, const char* peer_id,
                           const char* metadata_json) {
    clearLastError();
    if (!registry) {
        setLastError(IR_ERROR_INVALID_ARGUMENT, "Registry is null");
        return IR_ERROR_INVALID_ARGUMENT;
    }
    if (!requireArg(peer_id, "peer_id")) {
        return IR_ERROR_INVALID_ARGUMENT;
    }
    auto metadata = parseMetadataArg(metadata_json);
    if (!metadata) {
        return IR_ERROR_INVALID_ARGUMENT;
    }

    try {
        if (!toWrapper(registry)->registry->rejectFileTransfer(peer_id, *metadata)) {
            setLastError(IR_ERROR_NETWORK, "Failed to send file reject");
            return IR_ERROR_NETWORK;
        }
        return IR_OK;
    } catch (const std::exception& e) {
        setLastError(IR_ERROR_INTERNAL, e.what());
        return IR_ERROR_INTERNAL;
    }
}

IRError ir_cancel_transfer(IRRegistry registry, const char* transfer_id) {
    clearLastError();
    if (!registry) {
        setLastError(IR_ERROR_INVALID_ARGUMENT, "Registry is null");
        return IR_ERROR_INVALID_ARGUMENT;
    }
    if (!requireArg(transfer_id, "transfer_id")) {
        return IR_ERROR_INVALID_ARGUMENT;
    }

    try {
        if (!toWrapper(registry)->registry->cancelTransfer(transfer_id)) {
            setLastError(IR_ERROR_NOT_FOUND, std::string("Transfer not found: ") + transfer_id);
            return IR_ERROR_NOT_FOUND;
        }
        return IR_OK;
    } catch (const std::exception& e) {
        setLastError(IR_ERROR_INTERNAL, e.what());
        return IR_ERROR_INTERNAL;
    }
}

char* ir_get_active_transfers(IRRegistry registry) {
    clearLastError();
    if (!registry) {
        setLastError(IR_ERROR_INVALID_ARGUMENT, "Registry is null");
        return nullptr;
    }

    try {
        json arr = json::array();
        for (const auto& record : toWrapper(registry)->registry->getActiveTransfers()) {
            arr.push_back(transferRecordToJson(record));
        }
        return alloc_string(arr.dump());
    } catch (const std::exception& e) {
        setLastError(IR_ERROR_INTERNAL, e.what());
        return nullptr;
    }
}

char* ir_get_transfer(IRRegistry registry, const char* transfer_id) {
    clearLastError();
    if (!registry) {
        setLastError(IR_ERROR_INVALID_ARGUMENT, "Registry is null");
        return nullptr;
    }
    if (!requireArg(transfer_id, "transfer_id")) {
        return nullptr;
    }

    try {
        auto record = toWrapper(registry)->registry->getTransfer(transfer_id);
        if (!record) {
            setLastError(IR_ERROR_NOT_FOUND, std::string("Transfer not found: ") + transfer_id);
            return alloc_string("");  // Empty string indicates "not found"
        }
        return alloc_string(transferRecordToJson(*record).dump());
    } catch (const std::exception& e) {
        setLastError(IR_ERROR_INTERNAL, e.what());
        return nullptr;
    }
}

int32_t ir_clear_finished_transfers(IRRegistry registry) {
    clearLastError();
    if (!registry) {
        setLastError(IR_ERROR_INVALID_ARGUMENT, "Registry is null");
        return -1;
    }
    return static_cast<int32_t>(toWrapper(registry)->registry->clearFinishedTransfers());
}

IRError ir_save_received_file(IRRegistry registry, const char* transfer_id, const char* path) {
    clearLastError();
    if (!registry) {
        setLastError(IR_ERROR_INVALID_ARGUMENT, "Registry is null");
        return IR_ERROR_INVALID_ARGUMENT;
    }
    if (!requireArg(transfer_id, "transfer_id") || !requireArg(path, "path")) {
        return IR_ERROR_INVALID_ARGUMENT;
    }

    try {
        auto bytes = toWrapper(registry)->registry->takeReceivedFile(transfer_id);
        if (!bytes) {
            setLastError(IR_ERROR_NOT_FOUND, std::string("No received data for ") + transfer_id);
            return IR_ERROR_NOT_FOUND;
        }

        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) {
            setLastError(IR_ERROR_IO, std::string("Cannot open for writing: ") + path);
            return IR_ERROR_IO;
        }
        out.write(reinterpret_cast<const char*>(bytes->data()),
                  static_cast<std::streamsize>(bytes->size()));
        if (!out) {
            setLastError(IR_ERROR_IO, std::string("Write failed: ") + path);
            return IR_ERROR_IO;
        }
        spdlog::info("FFI: Saved transfer {} to {} ({} bytes)", transfer_id, path, bytes->size());
        return IR_OK;
    } catch (const std::exception& e) {
        setLastError(IR_ERROR_INTERNAL, e.what());
        return IR_ERROR_INTERNAL;
    }
}
