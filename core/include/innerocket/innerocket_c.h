// innerocket_c.h — C API для FFI
// Единственная точка входа для хостов, не использующих C++

#ifndef INNEROCKET_C_H
#define INNEROCKET_C_H

#include "export.h"
#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// ═══════════════════════════════════════════════════════════
// Opaque handles
// ═══════════════════════════════════════════════════════════

typedef struct IRRegistry_* IRRegistry;

// ═══════════════════════════════════════════════════════════
// Коды ошибок
// ═══════════════════════════════════════════════════════════

typedef enum {
    IR_OK = 0,
    IR_ERROR_INVALID_ARGUMENT = 1,
    IR_ERROR_IO = 3,
    IR_ERROR_NOT_FOUND = 4,
    IR_ERROR_ALREADY_EXISTS = 5,
    IR_ERROR_NETWORK = 7,
    IR_ERROR_CAPACITY = 9,          // Превышен лимит размера / памяти
    IR_ERROR_INTERNAL = 99
} IRError;

// ═══════════════════════════════════════════════════════════
// Общие функции
// ═══════════════════════════════════════════════════════════

/// Возвращает версию библиотеки
IR_API const char* ir_version(void);

/// Возвращает текстовое описание ошибки
IR_API const char* ir_error_message(IRError error);

/// Получить последнюю ошибку (thread-local)
IR_API IRError ir_last_error(void);

/// Получить сообщение последней ошибки (thread-local)
IR_API const char* ir_last_error_message(void);

/// Очистить состояние ошибки
IR_API void ir_clear_error(void);

/// Освободить строку, выделенную библиотекой
IR_API void ir_free_string(char* str);

/// Установить уровень логирования (trace/debug/info/warn/error/off)
IR_API IRError ir_set_log_level(const char* level);

// ═══════════════════════════════════════════════════════════
// Connection Registry
// ═══════════════════════════════════════════════════════════

/// Отправка кадра пиру (реализуется хостом)
/// @return 1 если кадр принят в очередь транспорта, 0 при ошибке
typedef int32_t (*IRSendCallback)(const char* peer_id, const uint8_t* data, size_t size,
                                  void* user_data);

/// Запрос на подключение (connect = 1) или отключение (connect = 0) пира
/// @return 1 если хост начал операцию
typedef int32_t (*IRConnectCallback)(const char* peer_id, int32_t connect, void* user_data);

/// Callback событий передачи
/// @param event 0=peer_connected, 1=peer_disconnected, 2=transfer_request,
///              3=transfer_progress, 4=transfer_completed, 5=transfer_failed,
///              6=transfer_accepted, 7=transfer_rejected, 8=transfer_withdrawn
/// @param data_json JSON с данными события; хост освобождает через ir_free_string
typedef void (*IREventCallback)(int32_t event, const char* data_json, void* user_data);

/// Создать ConnectionRegistry
/// @param config_json JSON TransferConfig (NULL = настройки по умолчанию)
/// @param send_cb Отправка кадров (обязателен)
/// @param connect_cb Подключение/отключение (может быть NULL)
/// @param user_data User data для send_cb и connect_cb
/// @return handle или NULL (см. ir_last_error)
IR_API IRRegistry ir_registry_create(const char* config_json,
                                     IRSendCallback send_cb,
                                     IRConnectCallback connect_cb,
                                     void* user_data);

/// Уничтожить ConnectionRegistry (останавливает фоновые потоки)
IR_API void ir_registry_destroy(IRRegistry registry);

/// Установить callback событий (NULL = отключить)
IR_API IRError ir_registry_set_event_callback(IRRegistry registry,
                                              IREventCallback callback,
                                              void* user_data);

/// ID и имя этого узла для file-request
IR_API IRError ir_registry_set_local_identity(IRRegistry registry,
                                              const char* peer_id, const char* name);

// ═══════════════════════════════════════════════════════════
// Transport entry points (вызываются хостом)
// ═══════════════════════════════════════════════════════════

/// Соединение с пиром установлено
/// @param name Имя пира (может быть NULL)
IR_API IRError ir_peer_connected(IRRegistry registry, const char* peer_id, const char* name);

/// Соединение с пиром разорвано
IR_API IRError ir_peer_disconnected(IRRegistry registry, const char* peer_id);

/// Доставить входящий кадр
/// @return IR_OK, либо IR_ERROR_INVALID_ARGUMENT для неразобранного кадра
IR_API IRError ir_deliver_frame(IRRegistry registry, const char* peer_id,
                                const uint8_t* data, size_t size);

// ═══════════════════════════════════════════════════════════
// Connections
// ═══════════════════════════════════════════════════════════

IR_API IRError ir_connect(IRRegistry registry, const char* peer_id);
IR_API IRError ir_disconnect(IRRegistry registry, const char* peer_id);
IR_API int32_t ir_is_connected(IRRegistry registry, const char* peer_id);

/// Подключённые пиры (JSON array PeerInfo)
IR_API char* ir_get_connected_peers(IRRegistry registry);

// ═══════════════════════════════════════════════════════════
// Transfers
// ═══════════════════════════════════════════════════════════

/// Отправить file-request для файла на диске
/// @param use_fec -1 = по настройкам, 0/1 = явно
/// @param parity_ratio Доля parity (используется при use_fec = 1)
/// @return JSON FileMetadata с новым id или NULL
IR_API char* ir_send_file_request(IRRegistry registry, const char* peer_id, const char* path,
                                  int32_t use_fec, double parity_ratio);

/// Начать отправку файла (после ir_send_file_request)
/// @param metadata_json JSON, возвращённый ir_send_file_request
IR_API IRError ir_send_file(IRRegistry registry, const char* peer_id, const char* path,
                            const char* metadata_json);

/// Принять входящий запрос (metadata_json из события transfer_request)
IR_API IRError ir_accept_transfer(IRRegistry registry, const char* peer_id,
                                  const char* metadata_json);

/// Отклонить входящий запрос
IR_API IRError ir_reject_transfer(IRRegistry registry, const char* peer_id,
                                  const char* metadata_json);

/// Отменить передачу
IR_API IRError ir_cancel_transfer(IRRegistry registry, const char* transfer_id);

/// Все передачи (JSON array TransferRecord)
IR_API char* ir_get_active_transfers(IRRegistry registry);

/// Передача по ID (JSON TransferRecord)
/// @return JSON, пустая строка если не найдена, NULL при ошибке
IR_API char* ir_get_transfer(IRRegistry registry, const char* transfer_id);

/// Удалить завершённые передачи
/// @return количество удалённых или -1 при ошибке
IR_API int32_t ir_clear_finished_transfers(IRRegistry registry);

/// Записать принятый файл на диск (буфер передачи освобождается)
IR_API IRError ir_save_received_file(IRRegistry registry, const char* transfer_id,
                                     const char* path);

#ifdef __cplusplus
}
#endif

#endif // INNEROCKET_C_H
