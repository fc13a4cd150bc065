#pragma once

#include <QString>

#include "core/JsonPath.h"

namespace PathFormatter {
// "$" for the root, then [<index>] or ["<key>"] per segment: $["items"][2]["name"].
QString format(const JsonPath &path);
}
