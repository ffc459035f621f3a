// core.h — Версия библиотеки и общие константы

#pragma once

namespace Innerocket {

constexpr const char* VERSION = "0.1.0";

/// Версия wire-протокола (file-request / file-chunk / file-complete)
constexpr int PROTOCOL_VERSION = 1;

} // namespace Innerocket
