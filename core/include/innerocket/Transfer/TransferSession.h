// TransferSession.h — Машина состояний одной передачи (отправитель или получатель)

#pragma once

#include "../export.h"
#include "../Models.h"
#include "../TransferConfig.h"
#include "../FileSource.h"
#include "ChunkCodec.h"
#include "../Network/TransferProtocol.h"
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>

namespace Innerocket {

class SliceReader;

// ═══════════════════════════════════════════════════════════
// Результат одного шага отправки
// ═══════════════════════════════════════════════════════════

enum class PumpStatus {
    Idle,       // Сессия не отправляет (pending / терминальная)
    Sent,       // Отправлен один chunk
    Waiting,    // Ждёт чтения слайса или паузы pacing'а
    Finished,   // Отправлен file-complete
    Failed      // Отправка или чтение провалились
};

struct PumpResult {
    PumpStatus status = PumpStatus::Idle;
    int64_t waitMs = 0;         // Для Waiting: через сколько стоит повторить
    size_t bytesSent = 0;
};

// ═══════════════════════════════════════════════════════════
// TransferSession
// ═══════════════════════════════════════════════════════════

/// pending → transferring → verifying → completed,
/// терминальные альтернативы: failed, rejected, integrity_error.
///
/// Отправитель: pump() отправляет по одному chunk'у за вызов, после
/// последнего блока отправляет file-complete с SHA-256 и переход в completed.
/// Получатель: handleChunk() собирает блоки через ChunkCodec,
/// handleComplete() восстанавливает недостающее и сверяет checksum.
/// Chunk'и текстовых файлов отправляются сжатыми (ChunkCompressor),
/// получатель распаковывает их до ChunkCodec.
///
/// Потокобезопасен. События вызываются вне внутренней блокировки.
class IR_API TransferSession {
public:
    using SendFunction = std::function<bool(const ProtocolMessage&)>;

    /// @param record Снимок состояния
    /// @param statusChanged true при смене статуса, false для progress
    using EventCallback = std::function<void(const TransferRecord& record, bool statusChanged)>;

    /// Сессия отправителя (pending до file-accept)
    static std::shared_ptr<TransferSession> createSender(const FileMetadata& metadata,
                                                         const std::string& peerId,
                                                         std::shared_ptr<FileSource> source,
                                                         SliceReader* reader,
                                                         const TransferConfig& config);

    /// Сессия получателя (pending до первого chunk'а)
    static std::shared_ptr<TransferSession> createReceiver(const FileMetadata& metadata,
                                                           const std::string& peerId,
                                                           const TransferConfig& config);

    ~TransferSession();

    // Запрет копирования
    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    void setEventCallback(EventCallback callback);

    const std::string& id() const;
    const std::string& peerId() const;
    TransferDirection direction() const;

    TransferStatus status() const;
    bool isTerminal() const;
    TransferRecord record() const;
    FileMetadata metadata() const;

    // ═══════════════════════════════════════════════════════════
    // Отправитель
    // ═══════════════════════════════════════════════════════════

    /// Пир принял запрос: pending → transferring
    bool start();

    /// Пир отклонил запрос: pending → rejected (игнорируется после start)
    bool markRejected();

    /// Отправить следующий chunk / parity / file-complete
    PumpResult pump(const SendFunction& send);

    /// Текущая пауза pacing'а (мс)
    int64_t pacingDelayMs() const;

    // ═══════════════════════════════════════════════════════════
    // Получатель
    // ═══════════════════════════════════════════════════════════

    /// Принять chunk
    /// @return true если chunk учтён (не дубликат, не отброшен)
    bool handleChunk(const ChunkMessage& chunk);

    /// file-complete от отправителя: verifying → completed / integrity_error
    bool handleComplete(const FileCompletePayload& payload);

    /// Забрать собранные байты (completed или integrity_error)
    std::optional<std::vector<uint8_t>> takeReceivedBytes();

    /// Миллисекунды с последнего входящего сообщения (или с создания сессии)
    int64_t idleMs() const;

    // ═══════════════════════════════════════════════════════════
    // Общие
    // ═══════════════════════════════════════════════════════════

    /// Отменить: → failed (Cancelled), буферы освобождаются
    bool cancel();

    /// Перевести в failed (или integrity_error для Integrity)
    bool fail(TransferErrorKind kind, const std::string& message);

private:
    TransferSession(TransferDirection direction, const FileMetadata& metadata,
                    const std::string& peerId, const TransferConfig& config);

    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Innerocket
