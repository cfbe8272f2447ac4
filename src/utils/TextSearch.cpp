#include "utils/TextSearch.h"

namespace TextSearch {

QVector<int> findAll(const QString& text, const QString& query)
{
    QVector<int> matches;
    if (query.isEmpty()) {
        return matches;
    }

    int from = 0;
    while (from <= text.size() - query.size()) {
        const int index = text.indexOf(query, from, Qt::CaseInsensitive);
        if (index < 0) {
            break;
        }
        matches.append(index);
        from = index + query.size();
    }
    return matches;
}

} // namespace TextSearch
