#include "core/ParseDiagnostics.h"

#include "core/PathFormatter.h"

#include <QDebug>
#include <QString>

namespace {
QString toPrintableAscii(const QByteArray &data)
{
    QByteArray out;
    out.reserve(data.size());
    for (unsigned char c : data) {
        if (c >= 32 && c <= 126) {
            out.append(static_cast<char>(c));
        } else {
            out.append('.');
        }
    }
    return QString::fromLatin1(out);
}

struct Frame {
    enum class Type { Object, Array };
    Type type;
    QByteArray pendingKey;
    bool hasPendingKey = false;
    int index = 0;
    bool pushedSegment = false;
};

// Appends the segment under which a new value of the innermost frame lives.
bool pushSegmentFor(Frame &parent, JsonPath &path)
{
    if (parent.type == Frame::Type::Object) {
        if (!parent.hasPendingKey) {
            return false;
        }
        path.append(PathSegment(QString::fromUtf8(parent.pendingKey)));
        parent.hasPendingKey = false;
        parent.pendingKey.clear();
        return true;
    }
    path.append(PathSegment(parent.index));
    return true;
}
}

namespace ParseDiagnostics {
JsonPath pathAtOffset(const QByteArray &bytes, int offset)
{
    QVector<Frame> stack;
    JsonPath path;
    QByteArray currentString;
    QByteArray lastString;
    bool inString = false;
    bool escape = false;
    bool justEndedString = false;

    for (int i = 0; i < bytes.size() && i < offset; ++i) {
        unsigned char c = static_cast<unsigned char>(bytes.at(i));
        if (inString) {
            if (escape) {
                escape = false;
                currentString.append(static_cast<char>(c));
                continue;
            }
            if (c == '\\') {
                escape = true;
                continue;
            }
            if (c == '"') {
                inString = false;
                lastString = currentString;
                currentString.clear();
                justEndedString = true;
                continue;
            }
            currentString.append(static_cast<char>(c));
            continue;
        }

        if (justEndedString && c > ' ') {
            justEndedString = false;
            if (c == ':' && !stack.isEmpty() && stack.last().type == Frame::Type::Object) {
                stack.last().pendingKey = lastString;
                stack.last().hasPendingKey = true;
                continue;
            }
        }

        if (c == '"') {
            inString = true;
            escape = false;
            currentString.clear();
            continue;
        }

        if (c == '{' || c == '[') {
            Frame frame{c == '{' ? Frame::Type::Object : Frame::Type::Array};
            if (!stack.isEmpty()) {
                frame.pushedSegment = pushSegmentFor(stack.last(), path);
            }
            stack.append(frame);
            continue;
        }

        if (c == '}' || c == ']') {
            if (!stack.isEmpty()) {
                Frame frame = stack.takeLast();
                if (frame.pushedSegment && !path.isEmpty()) {
                    path.removeLast();
                }
            }
            continue;
        }

        if (c == ',' && !stack.isEmpty()) {
            Frame &frame = stack.last();
            if (frame.type == Frame::Type::Array) {
                frame.index++;
            } else {
                frame.hasPendingKey = false;
                frame.pendingKey.clear();
            }
        }
    }

    // The offset sits inside a scalar value: name the member or element it belongs to.
    if (!stack.isEmpty()) {
        Frame &innermost = stack.last();
        if (innermost.type == Frame::Type::Object && innermost.hasPendingKey) {
            path.append(PathSegment(QString::fromUtf8(innermost.pendingKey)));
        } else if (innermost.type == Frame::Type::Array) {
            path.append(PathSegment(innermost.index));
        }
    }
    return path;
}

void logParseError(const QByteArray &bytes, int offset)
{
    if (bytes.isEmpty() || offset < 0) {
        return;
    }
    const int window = 48;
    int start = qMax(0, offset - window);
    int end = qMin(static_cast<int>(bytes.size()), offset + window);
    QByteArray slice = bytes.mid(start, end - start);

    qWarning() << "JSON parse error at byte offset" << offset
               << "context bytes" << start << "-" << end;
    qWarning() << "Hex:" << slice.toHex(' ');
    qWarning() << "ASCII:" << toPrintableAscii(slice);
    qWarning() << "Estimated JSON path:" << PathFormatter::format(pathAtOffset(bytes, offset));
}
}
