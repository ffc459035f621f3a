// ConnectionRegistry.h — Пиры, диспетчеризация сообщений и API передачи файлов

#pragma once

#include "../export.h"
#include "../Models.h"
#include "../TransferConfig.h"
#include "../FileSource.h"
#include "PeerTransport.h"
#include "TransferProtocol.h"
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>

namespace Innerocket {

// ═══════════════════════════════════════════════════════════
// ConnectionRegistry — координатор передач
// ═══════════════════════════════════════════════════════════

/// Владеет всеми TransferSession, знает подключённых пиров,
/// разбирает входящие кадры и отправляет исходящие через PeerTransport.
///
/// Исходящие chunk'и отправляет собственный поток (round-robin по
/// сессиям, один chunk за шаг), чтение файлов в потоке SliceReader.
/// Callbacks вызываются вне внутренних блокировок.
class IR_API ConnectionRegistry {
public:
    /// @param transport Канал до пиров (не может быть nullptr)
    /// @param config Настройки; некорректная конфигурация -> std::invalid_argument
    explicit ConnectionRegistry(std::shared_ptr<PeerTransport> transport,
                                const TransferConfig& config = TransferConfig{});
    ~ConnectionRegistry();

    // Запрет копирования
    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    const TransferConfig& config() const;

    /// Имя/ID этого узла, отправляемые в file-request
    void setLocalIdentity(const std::string& id, const std::string& name);

    /// Остановить поток отправки и чтения (вызывается из деструктора)
    void shutdown();

    // ═══════════════════════════════════════════════════════════
    // Connections
    // ═══════════════════════════════════════════════════════════

    /// Подключиться к пиру (повторный вызов для подключённого ничего не делает)
    /// @return true если пир уже подключён или транспорт начал подключение
    bool connect(const std::string& peerId);

    /// Отключиться от пира (неизвестный пир игнорируется)
    void disconnect(const std::string& peerId);

    bool isConnected(const std::string& peerId) const;
    std::vector<PeerInfo> getConnectedPeers() const;

    // ═══════════════════════════════════════════════════════════
    // Transport entry points
    // ═══════════════════════════════════════════════════════════

    void handlePeerConnected(const std::string& peerId, const std::string& name = "");
    void handlePeerDisconnected(const std::string& peerId);

    /// Обработать входящий кадр
    /// @return true если сообщение разобрано и доставлено
    bool handleInbound(const std::string& peerId, const uint8_t* data, size_t size);
    bool handleInbound(const std::string& peerId, const std::vector<uint8_t>& frame) {
        return handleInbound(peerId, frame.data(), frame.size());
    }

    // ═══════════════════════════════════════════════════════════
    // Messaging
    // ═══════════════════════════════════════════════════════════

    /// Отправить сообщение пиру
    /// @return false если пир не подключён или транспорт отказал (не бросает)
    bool send(const std::string& peerId, const ProtocolMessage& message);

    // ═══════════════════════════════════════════════════════════
    // Transfers
    // ═══════════════════════════════════════════════════════════

    /// Отправить file-request (FEC по настройкам config)
    /// @return метаданные с новым transferId или nullopt
    std::optional<FileMetadata> sendFileRequest(const std::string& peerId,
                                                std::shared_ptr<FileSource> file);
    std::optional<FileMetadata> sendFileRequest(const std::string& peerId,
                                                std::shared_ptr<FileSource> file,
                                                bool useFEC, double fecParityRatio);

    /// Создать сессию отправителя; поток chunk'ов начнётся после file-accept
    bool sendFile(const std::string& peerId, std::shared_ptr<FileSource> file,
                  const FileMetadata& metadata);

    /// Принять входящий запрос: создаёт сессию получателя и отвечает file-accept
    bool acceptFileTransfer(const std::string& peerId, const FileMetadata& metadata);

    /// Отклонить входящий запрос (file-reject)
    bool rejectFileTransfer(const std::string& peerId, const FileMetadata& metadata);

    /// Отменить передачу: → failed (Cancelled).
    /// Отправитель сообщает получателю file-reject; для ещё не принятого
    /// запроса получатель просто забывает его (onTransferWithdrawn).
    bool cancelTransfer(const std::string& transferId);

    /// Все сессии, включая завершённые (до clearFinishedTransfers)
    std::vector<TransferRecord> getActiveTransfers() const;

    std::optional<TransferRecord> getTransfer(const std::string& transferId) const;

    /// Удалить сессии в терминальном состоянии
    /// @return количество удалённых
    size_t clearFinishedTransfers();

    /// Забрать байты принятого файла (completed или integrity_error)
    std::optional<std::vector<uint8_t>> takeReceivedFile(const std::string& transferId);

    // ═══════════════════════════════════════════════════════════
    // Callbacks
    // ═══════════════════════════════════════════════════════════

    using PeerCallback = std::function<void(const PeerInfo&)>;
    using RequestCallback = std::function<void(const FileTransferRequest&)>;
    using TransferCallback = std::function<void(const TransferRecord&)>;
    using ResponseCallback = std::function<void(const std::string& peerId, const FileMetadata&)>;

    void onPeerConnected(PeerCallback callback);
    void onPeerDisconnected(PeerCallback callback);

    /// Входящий file-request, ожидающий accept/reject
    void onTransferRequest(RequestCallback callback);

    /// Прогресс и любые смены статуса
    void onTransferProgress(TransferCallback callback);
    void onTransferCompleted(TransferCallback callback);

    /// failed или integrity_error
    void onTransferFailed(TransferCallback callback);

    /// Пир принял / отклонил наш file-request
    void onTransferAccepted(ResponseCallback callback);
    void onTransferRejected(ResponseCallback callback);

    /// Пир отозвал свой file-request до нашего решения
    void onTransferWithdrawn(ResponseCallback callback);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Innerocket
