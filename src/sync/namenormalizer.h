#ifndef NAMENORMALIZER_H
#define NAMENORMALIZER_H

#include <QString>
#include <QStringList>

namespace Fbo {

/**
 * @brief Canonical comparison key for free-text facility names
 *
 * "Signature Aviation", "signature fbo" and "  SIGNATURE  " all map to
 * "signature". The key is only used for matching; stored names keep
 * their original spelling.
 */
class NameNormalizer
{
public:
    /**
     * @brief Lower-case, strip generic tokens, trim and collapse whitespace
     *
     * Idempotent: normalize(normalize(x)) == normalize(x).
     */
    static QString normalize(const QString &name);

    /**
     * @brief Tokens removed from names before comparison
     */
    static const QStringList &genericTokens();
};

} // namespace Fbo

#endif // NAMENORMALIZER_H
