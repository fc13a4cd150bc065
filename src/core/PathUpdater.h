#pragma once

#include "core/JsonPath.h"
#include "core/JsonValue.h"

namespace PathUpdater {
// Returns a document with the value at path replaced. Only the containers on the way
// from the root to the target are copied; every other subtree is shared with the
// input. Segments that do not fit the document (index out of range, index into an
// object, key into an array, missing intermediate key, scalar on the way) leave that
// branch as it was.
JsonValue update(const JsonValue &document, const JsonPath &path, const JsonValue &newValue);

// Value at path, or null when the path does not resolve.
JsonValue valueAt(const JsonValue &document, const JsonPath &path, bool *found = nullptr);

// True when update() would write the addressed location instead of skipping it.
bool canApply(const JsonValue &document, const JsonPath &path);
}
