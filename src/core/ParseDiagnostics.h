#pragma once

#include <QByteArray>

#include "core/JsonPath.h"

namespace ParseDiagnostics {
// Best-effort path of the value that was being read when the byte at offset was
// reached, for JSON that may be broken at that point.
JsonPath pathAtOffset(const QByteArray &bytes, int offset);

// Logs a hex/ASCII window around offset and the estimated path there.
void logParseError(const QByteArray &bytes, int offset);
}
