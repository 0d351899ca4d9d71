#ifndef PATHSANITIZER_H
#define PATHSANITIZER_H

#include <QString>
#include <functional>

namespace Sync {

/**
 * @brief Filename hygiene for recordings written to local storage
 *
 * Pure functions, safe to call from any thread.
 */
class PathSanitizer
{
public:
    static constexpr int MaxFilenameBytes = 255;

    /**
     * @brief Make @p name safe to use as a single path component
     *
     * - ".." sequences become "_"
     * - "/", ":", "\", NUL and other control characters become "-"
     * - runs of spaces collapse to one
     * - leading and trailing whitespace and dots are removed
     * - the result is cut to 255 UTF-8 bytes on a code point boundary
     * - an empty result becomes "Untitled"
     *
     * sanitize(sanitize(x)) == sanitize(x).
     */
    static QString sanitize(const QString &name);

    /**
     * @brief First free name of the form "base", "base 2", "base 3", ...
     *
     * @param baseName Name without suffix
     * @param suffix Appended after the counter, usually ".ext" or empty
     * @param exists Returns true when a candidate is already taken
     */
    static QString resolveConflict(const QString &baseName,
                                   const QString &suffix,
                                   const std::function<bool(const QString &)> &exists);

private:
    static QString trimWhitespaceAndDots(const QString &name);
    static QString truncateUtf8(const QString &name, int maxBytes);
};

} // namespace Sync

#endif // PATHSANITIZER_H
