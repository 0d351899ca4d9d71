#include "audiovalidator.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QtEndian>
#include <cmath>

namespace Sync {

namespace {

// kbps, indexed by the 4-bit bitrate field; 0 and 15 are invalid
const int kMpeg1Layer3Bitrates[16] = {
    0, 32, 40, 48, 56, 64, 80, 96, 112, 128, 160, 192, 224, 256, 320, 0
};
const int kMpeg2Layer3Bitrates[16] = {
    0, 8, 16, 24, 32, 40, 48, 56, 64, 80, 96, 112, 128, 144, 160, 0
};

const qint64 kFrameSearchWindow = 64 * 1024;

bool isMpegFrameSync(uchar b0, uchar b1)
{
    // 11 sync bits, then a non-reserved layer
    return b0 == 0xFF && (b1 & 0xE0) == 0xE0 && ((b1 >> 1) & 0x03) != 0;
}

bool isAdtsSync(uchar b0, uchar b1)
{
    // 12 sync bits, layer always 00
    return b0 == 0xFF && (b1 & 0xF6) == 0xF0;
}

qint64 id3TagSize(const QByteArray &header)
{
    if (header.size() < 10 || !header.startsWith("ID3")) {
        return 0;
    }
    const auto *h = reinterpret_cast<const uchar *>(header.constData());
    const qint64 size = (qint64(h[6] & 0x7F) << 21) | (qint64(h[7] & 0x7F) << 14)
                      | (qint64(h[8] & 0x7F) << 7) | qint64(h[9] & 0x7F);
    const bool hasFooter = (h[5] & 0x10) != 0;
    return 10 + size + (hasFooter ? 10 : 0);
}

}

const QStringList AudioValidator::StandardExtensions = {
    "mp3", "m4a", "wav", "aac", "aiff"
};

bool AudioValidator::isStandardExtension(const QString &path)
{
    return StandardExtensions.contains(QFileInfo(path).suffix().toLower());
}

QString AudioValidator::formatName(Format format)
{
    switch (format) {
    case Format::Wav:  return "WAV";
    case Format::Mp3:  return "MPEG audio";
    case Format::M4a:  return "MPEG-4 audio";
    case Format::Aac:  return "AAC (ADTS)";
    case Format::Aiff: return "AIFF";
    case Format::Unknown:
        break;
    }
    return "unknown";
}

bool AudioValidator::validate(const QString &path, qint64 expectedSize, QString *error) const
{
    const QFileInfo info(path);
    const QString name = info.fileName();

    if (!info.exists()) {
        if (error) {
            *error = QString("\"%1\" is missing after download").arg(name);
        }
        return false;
    }

    const qint64 actualSize = info.size();
    if (actualSize != expectedSize) {
        qWarning() << "[AudioValidator] Size mismatch for" << name
                   << "expected" << expectedSize << "got" << actualSize;
        if (error) {
            if (expectedSize > 0 && actualSize < expectedSize) {
                const int percent = int(actualSize * 100 / expectedSize);
                *error = QString("\"%1\" was only partially downloaded (%2%)").arg(name).arg(percent);
            } else {
                *error = QString("\"%1\" has unexpected size (expected %2 bytes, got %3)")
                             .arg(name).arg(expectedSize).arg(actualSize);
            }
        }
        return false;
    }

    // Best effort from here on
    const Format format = probeFormat(path);
    if (format == Format::Unknown) {
        if (isStandardExtension(path)) {
            qWarning() << "[AudioValidator] Unrecognized audio header in" << name
                       << "- size is correct, continuing";
        } else {
            qDebug() << "[AudioValidator] No known header in" << name << "- skipping audio check";
        }
    } else {
        qDebug() << "[AudioValidator] Validated" << name << actualSize << "bytes,"
                 << formatName(format);
    }
    return true;
}

AudioValidator::Format AudioValidator::probeFormat(const QString &path) const
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return Format::Unknown;
    }

    const QByteArray header = file.read(12);
    if (header.size() < 4) {
        return Format::Unknown;
    }

    if (header.startsWith("RIFF") && header.mid(8, 4) == "WAVE") {
        return Format::Wav;
    }
    if (header.startsWith("FORM") && (header.mid(8, 4) == "AIFF" || header.mid(8, 4) == "AIFC")) {
        return Format::Aiff;
    }
    if (header.mid(4, 4) == "ftyp") {
        return Format::M4a;
    }
    if (header.startsWith("ID3")) {
        return Format::Mp3;
    }

    const auto b0 = static_cast<uchar>(header.at(0));
    const auto b1 = static_cast<uchar>(header.at(1));
    if (isAdtsSync(b0, b1)) {
        return Format::Aac;
    }
    if (isMpegFrameSync(b0, b1)) {
        return Format::Mp3;
    }
    return Format::Unknown;
}

int AudioValidator::durationSeconds(const QString &path) const
{
    double seconds = 0.0;
    switch (probeFormat(path)) {
    case Format::Wav:
        seconds = wavDuration(path);
        break;
    case Format::Mp3:
        seconds = mpegDuration(path);
        break;
    default:
        break;
    }

    if (seconds <= 0.0) {
        return 0;
    }
    return int(std::lround(seconds));
}

double AudioValidator::wavDuration(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly) || !file.seek(12)) {
        return 0.0;
    }

    quint32 byteRate = 0;
    quint32 dataSize = 0;

    while (!file.atEnd()) {
        const QByteArray chunkHeader = file.read(8);
        if (chunkHeader.size() < 8) {
            break;
        }
        const QByteArray id = chunkHeader.left(4);
        const quint32 size = qFromLittleEndian<quint32>(chunkHeader.constData() + 4);

        if (id == "fmt ") {
            const QByteArray fmt = file.read(qMin<quint32>(size, 16));
            if (fmt.size() < 12) {
                return 0.0;
            }
            byteRate = qFromLittleEndian<quint32>(fmt.constData() + 8);
            file.seek(file.pos() + qint64(size) - fmt.size() + (size & 1));
        } else if (id == "data") {
            dataSize = size;
            break;
        } else {
            // Chunks are word aligned
            if (!file.seek(file.pos() + qint64(size) + (size & 1))) {
                break;
            }
        }
    }

    if (byteRate == 0 || dataSize == 0) {
        return 0.0;
    }
    return double(dataSize) / double(byteRate);
}

double AudioValidator::mpegDuration(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return 0.0;
    }

    const qint64 audioStart = id3TagSize(file.read(10));
    if (!file.seek(audioStart)) {
        return 0.0;
    }

    const QByteArray window = file.read(kFrameSearchWindow);
    const auto *bytes = reinterpret_cast<const uchar *>(window.constData());

    for (int i = 0; i + 3 < window.size(); ++i) {
        if (!isMpegFrameSync(bytes[i], bytes[i + 1])) {
            continue;
        }

        const int version = (bytes[i + 1] >> 3) & 0x03;     // 3 = MPEG-1, 2 = MPEG-2, 0 = MPEG-2.5
        const int layer = (bytes[i + 1] >> 1) & 0x03;       // 1 = Layer III
        const int bitrateIndex = (bytes[i + 2] >> 4) & 0x0F;
        if (version == 1 || layer != 1 || bitrateIndex == 0 || bitrateIndex == 15) {
            continue;
        }

        const int kbps = (version == 3) ? kMpeg1Layer3Bitrates[bitrateIndex]
                                        : kMpeg2Layer3Bitrates[bitrateIndex];
        const qint64 audioBytes = file.size() - audioStart - i;
        return double(audioBytes) * 8.0 / (double(kbps) * 1000.0);
    }

    return 0.0;
}

} // namespace Sync
