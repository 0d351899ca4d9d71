#ifndef AUDIOVALIDATOR_H
#define AUDIOVALIDATOR_H

#include <QString>
#include <QStringList>

namespace Sync {

/**
 * @brief Post-download checks on recording files
 *
 * The byte count is authoritative: a file whose size differs from what
 * the device announced is rejected. Header probing is best effort and
 * only ever logs; recorder files carry a proprietary ".hda" extension
 * over plain MPEG audio, so the extension alone says little.
 */
class AudioValidator
{
public:
    enum class Format {
        Unknown,
        Wav,
        Mp3,
        M4a,
        Aac,
        Aiff
    };

    static const QStringList StandardExtensions;

    static bool isStandardExtension(const QString &path);
    static QString formatName(Format format);

    /**
     * @brief Check @p path against the size the device announced
     *
     * @param error Receives a user-facing message on failure
     */
    bool validate(const QString &path, qint64 expectedSize, QString *error = nullptr) const;

    /**
     * @brief Identify the container from the first bytes of the file
     */
    Format probeFormat(const QString &path) const;

    /**
     * @brief Duration in whole seconds, 0 when it cannot be determined
     *
     * Exact for PCM WAV; estimated from the first frame for constant
     * bitrate MPEG audio.
     */
    int durationSeconds(const QString &path) const;

private:
    static double wavDuration(const QString &path);
    static double mpegDuration(const QString &path);
};

} // namespace Sync

#endif // AUDIOVALIDATOR_H
