#include "core/PathUpdater.h"

namespace PathUpdater {
namespace {
// Copies one container level, lets splice rewrite the copy, and wraps it as a new value.
template <typename Container, typename Splice>
JsonValue withCopiedLevel(const Container &level, Splice splice)
{
    Container copy = level;
    splice(copy);
    return JsonValue(std::move(copy));
}

JsonValue updateAt(const JsonValue &node, const JsonPath &path, int depth,
                   const JsonValue &newValue)
{
    if (depth >= path.size()) {
        return newValue;
    }

    const PathSegment &segment = path.at(depth);
    const bool isTarget = depth + 1 == path.size();

    switch (node.type()) {
    case JsonValue::Type::Array:
        return withCopiedLevel(node.toArray(), [&](JsonArray &array) {
            if (!segment.isIndex()) {
                return;
            }
            int index = segment.index();
            if (index < 0 || index >= array.size()) {
                return;
            }
            array[index] = updateAt(array.at(index), path, depth + 1, newValue);
        });
    case JsonValue::Type::Object:
        return withCopiedLevel(node.toObject(), [&](JsonObject &object) {
            if (!segment.isKey()) {
                return;
            }
            const JsonValue *child = object.find(segment.key());
            if (child) {
                JsonValue updated = updateAt(*child, path, depth + 1, newValue);
                object.insert(segment.key(), updated);
            } else if (isTarget) {
                object.insert(segment.key(), newValue);
            }
        });
    case JsonValue::Type::Null:
    case JsonValue::Type::Bool:
    case JsonValue::Type::Number:
    case JsonValue::Type::String:
        return node;
    }
    return node;
}

const JsonValue *childAt(const JsonValue &node, const PathSegment &segment)
{
    if (node.isArray() && segment.isIndex()) {
        const JsonArray &array = node.toArray();
        if (segment.index() < 0 || segment.index() >= array.size()) {
            return nullptr;
        }
        return &array.at(segment.index());
    }
    if (node.isObject() && segment.isKey()) {
        return node.toObject().find(segment.key());
    }
    return nullptr;
}
}

JsonValue update(const JsonValue &document, const JsonPath &path, const JsonValue &newValue)
{
    return updateAt(document, path, 0, newValue);
}

JsonValue valueAt(const JsonValue &document, const JsonPath &path, bool *found)
{
    const JsonValue *current = &document;
    for (const PathSegment &segment : path) {
        current = childAt(*current, segment);
        if (!current) {
            if (found) {
                *found = false;
            }
            return JsonValue();
        }
    }
    if (found) {
        *found = true;
    }
    return *current;
}

bool canApply(const JsonValue &document, const JsonPath &path)
{
    if (path.isEmpty()) {
        return true;
    }
    bool found = false;
    JsonValue parent = valueAt(document, path.mid(0, path.size() - 1), &found);
    if (!found) {
        return false;
    }
    const PathSegment &target = path.last();
    if (parent.isObject()) {
        return target.isKey();
    }
    return childAt(parent, target) != nullptr;
}
}
