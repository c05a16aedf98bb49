#include "deduplicator.h"
#include "namenormalizer.h"

#include <QHash>
#include <algorithm>

namespace Fbo {

bool Deduplicator::isPreferred(const FacilityRecord &candidate, const FacilityRecord &current)
{
    if (candidate.isVerified != current.isVerified) {
        return candidate.isVerified;
    }

    // An invalid timestamp sorts before every valid one
    if (!candidate.lastUpdated.isValid()) {
        return false;
    }
    if (!current.lastUpdated.isValid()) {
        return true;
    }
    return candidate.lastUpdated > current.lastUpdated;
}

void Deduplicator::sortByName(FacilityList &records)
{
    std::stable_sort(records.begin(), records.end(),
        [](const FacilityRecord &a, const FacilityRecord &b) {
            return QString::compare(a.name, b.name, Qt::CaseSensitive) < 0;
        });
}

QList<FacilityList> Deduplicator::groupByKey(const FacilityList &records)
{
    QList<FacilityList> groups;
    QHash<QString, qsizetype> groupIndex;  // normalized name -> index in groups

    for (const FacilityRecord &record : records) {
        const QString key = NameNormalizer::normalize(record.name);
        auto it = groupIndex.constFind(key);
        if (it == groupIndex.constEnd()) {
            groupIndex.insert(key, groups.size());
            groups.append(FacilityList{record});
        } else {
            groups[it.value()].append(record);
        }
    }

    return groups;
}

FacilityList Deduplicator::deduplicate(const FacilityList &records)
{
    FacilityList result;

    for (const FacilityList &group : groupByKey(records)) {
        qsizetype winner = 0;
        for (qsizetype i = 1; i < group.size(); ++i) {
            if (isPreferred(group[i], group[winner])) {
                winner = i;
            }
        }
        result.append(group[winner]);
    }

    sortByName(result);
    return result;
}

QList<FacilityList> Deduplicator::duplicateGroups(const FacilityList &records)
{
    QList<FacilityList> duplicates;

    for (FacilityList group : groupByKey(records)) {
        if (group.size() < 2) {
            continue;
        }

        qsizetype winner = 0;
        for (qsizetype i = 1; i < group.size(); ++i) {
            if (isPreferred(group[i], group[winner])) {
                winner = i;
            }
        }
        if (winner != 0) {
            group.move(winner, 0);
        }
        duplicates.append(group);
    }

    return duplicates;
}

} // namespace Fbo
