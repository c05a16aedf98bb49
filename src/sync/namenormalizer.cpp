#include "namenormalizer.h"

namespace Fbo {

const QStringList &NameNormalizer::genericTokens()
{
    static const QStringList tokens = { "aviation", "fbo" };
    return tokens;
}

QString NameNormalizer::normalize(const QString &name)
{
    QString key = name.toLower();

    // Removing one token can join letters into another ("avifboation"),
    // so repeat until nothing changes.
    bool changed = true;
    while (changed) {
        changed = false;
        for (const QString &token : genericTokens()) {
            if (key.contains(token)) {
                key.remove(token);
                changed = true;
            }
        }
    }

    return key.simplified();
}

} // namespace Fbo
