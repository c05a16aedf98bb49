#include "reconciler.h"
#include "deduplicator.h"
#include "fieldmergepolicy.h"
#include "namenormalizer.h"

#include <QMap>
#include <QSet>

namespace Fbo {

FacilityList Reconciler::reconcile(const FacilityList &local,
                                   const FacilityList &incoming)
{
    SyncStats ignored;
    return reconcile(local, incoming, ignored);
}

FacilityList Reconciler::reconcile(const FacilityList &local,
                                   const FacilityList &incoming,
                                   SyncStats &stats)
{
    // Same-tier collisions in the local copy are settled first so the
    // lookup holds exactly one entry per key.
    QMap<QString, FacilityRecord> before;
    for (const FacilityRecord &record : Deduplicator::deduplicate(local)) {
        before.insert(NameNormalizer::normalize(record.name), record);
    }
    QMap<QString, FacilityRecord> lookup = before;

    QSet<QString> created;
    QSet<QString> touched;

    for (const FacilityRecord &record : incoming) {
        const QString key = NameNormalizer::normalize(record.name);
        auto it = lookup.find(key);
        if (it == lookup.end()) {
            lookup.insert(key, record);
            created.insert(key);
        } else {
            it.value() = FieldMergePolicy::mergeFields(it.value(), record);
            touched.insert(key);
        }
    }

    stats.created += static_cast<int>(created.size());
    for (auto it = before.constBegin(); it != before.constEnd(); ++it) {
        if (touched.contains(it.key()) && lookup.value(it.key()) != it.value()) {
            stats.updated++;
        } else {
            stats.unchanged++;
        }
    }

    return Deduplicator::deduplicate(lookup.values());
}

} // namespace Fbo
