#include "core/PathFormatter.h"

namespace PathFormatter {
QString format(const JsonPath &path)
{
    QString out = QStringLiteral("$");
    for (const PathSegment &segment : path) {
        if (segment.isIndex()) {
            out += QStringLiteral("[%1]").arg(segment.index());
        } else {
            out += QStringLiteral("[\"%1\"]").arg(segment.key());
        }
    }
    return out;
}
}
