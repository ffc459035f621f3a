#pragma once

#include "export.h"
#include <cstdint>
#include <string>

namespace Innerocket {

// ═══════════════════════════════════════════════════════════
// Статус передачи файла
// ═══════════════════════════════════════════════════════════

enum class TransferStatus : int32_t {
    Pending = 0,        // Запрос принят, байты ещё не передавались
    Transferring = 1,   // Идёт передача chunk'ов
    Verifying = 2,      // Получатель проверяет контрольную сумму
    Completed = 3,      // Успешно завершена
    Failed = 4,         // Ошибка транспорта или отмена
    Rejected = 5,       // Получатель отклонил запрос
    IntegrityError = 6  // Контрольная сумма не совпала / блок не восстановлен
};

IR_API const char* transferStatusToString(TransferStatus status);
IR_API TransferStatus transferStatusFromString(const std::string& str);

/// Терминальный статус: сессия больше не меняется
IR_API bool isTerminalStatus(TransferStatus status);

// ═══════════════════════════════════════════════════════════
// Направление передачи
// ═══════════════════════════════════════════════════════════

enum class TransferDirection : int32_t {
    Send = 0,
    Receive = 1
};

IR_API const char* transferDirectionToString(TransferDirection direction);

// ═══════════════════════════════════════════════════════════
// Категории ошибок передачи
// ═══════════════════════════════════════════════════════════

enum class TransferErrorKind : int32_t {
    None = 0,
    Transport = 1,  // Пир недоступен / отключился посреди передачи
    Protocol = 2,   // Некорректное или неизвестное сообщение
    Integrity = 3,  // Несовпадение checksum или невосстановимый блок
    Capacity = 4,   // Дубликат transferId или превышен лимит размера
    Cancelled = 5,  // Отменено локально через cancelTransfer
    Timeout = 6     // Получатель слишком долго не получал данных
};

IR_API const char* transferErrorKindToString(TransferErrorKind kind);

// ═══════════════════════════════════════════════════════════
// Качество соединения (по оценке AdaptiveRateController)
// ═══════════════════════════════════════════════════════════

enum class ConnectionQuality : int32_t {
    Slow = 0,
    Medium = 1,
    Fast = 2
};

IR_API const char* connectionQualityToString(ConnectionQuality quality);

} // namespace Innerocket
