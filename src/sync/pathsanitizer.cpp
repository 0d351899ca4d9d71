#include "pathsanitizer.h"

#include <QByteArray>
#include <QRegularExpression>

namespace Sync {

QString PathSanitizer::sanitize(const QString &name)
{
    QString result = name;
    result.replace(QLatin1String(".."), QLatin1String("_"));

    for (int i = 0; i < result.size(); ++i) {
        const ushort c = result.at(i).unicode();
        if (c == '/' || c == ':' || c == '\\' || c < 0x20 || c == 0x7F) {
            result[i] = QLatin1Char('-');
        }
    }

    static const QRegularExpression repeatedSpaces(QStringLiteral(" {2,}"));
    result.replace(repeatedSpaces, QStringLiteral(" "));

    result = trimWhitespaceAndDots(result);
    result = truncateUtf8(result, MaxFilenameBytes);

    // Truncation may expose a trailing space or dot
    result = trimWhitespaceAndDots(result);

    if (result.isEmpty()) {
        return QStringLiteral("Untitled");
    }
    return result;
}

QString PathSanitizer::resolveConflict(const QString &baseName,
                                       const QString &suffix,
                                       const std::function<bool(const QString &)> &exists)
{
    QString candidate = baseName + suffix;
    int counter = 2;
    while (exists && exists(candidate)) {
        candidate = QString("%1 %2%3").arg(baseName).arg(counter).arg(suffix);
        ++counter;
    }
    return candidate;
}

QString PathSanitizer::trimWhitespaceAndDots(const QString &name)
{
    int start = 0;
    int end = name.size();

    while (start < end && (name.at(start).isSpace() || name.at(start) == QLatin1Char('.'))) {
        ++start;
    }
    while (end > start && (name.at(end - 1).isSpace() || name.at(end - 1) == QLatin1Char('.'))) {
        --end;
    }
    return name.mid(start, end - start);
}

QString PathSanitizer::truncateUtf8(const QString &name, int maxBytes)
{
    const QByteArray utf8 = name.toUtf8();
    if (utf8.size() <= maxBytes) {
        return name;
    }

    // Back up to the lead byte of the code point that would be split
    int cut = maxBytes;
    while (cut > 0 && (static_cast<uchar>(utf8.at(cut)) & 0xC0) == 0x80) {
        --cut;
    }
    return QString::fromUtf8(utf8.left(cut));
}

} // namespace Sync
