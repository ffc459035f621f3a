// PeerTransport.h — Абстракция канала до пира

#pragma once

#include "../export.h"
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace Innerocket {

/// Упорядоченный, надёжный, message-based канал между двумя пирами.
/// Реализуется хостом (WebRTC data channel, TCP, in-memory для тестов).
///
/// Входящие кадры и события жизненного цикла транспорт передаёт в
/// ConnectionRegistry::handleInbound / handlePeerConnected / handlePeerDisconnected.
/// Кадры одного пира должны доставляться в порядке отправки.
class IR_API PeerTransport {
public:
    virtual ~PeerTransport() = default;

    /// Начать установку соединения (результат придёт через handlePeerConnected)
    virtual bool connect(const std::string& peerId) = 0;

    /// Закрыть соединение
    virtual void disconnect(const std::string& peerId) = 0;

    /// Отправить один кадр
    /// @return false если пир недоступен или канал отказал
    virtual bool send(const std::string& peerId, const std::vector<uint8_t>& frame) = 0;

    /// Байт в очереди отправки к пиру (для backpressure); 0 если неизвестно
    virtual size_t pendingBytes(const std::string& peerId) const {
        (void)peerId;
        return 0;
    }
};

} // namespace Innerocket
