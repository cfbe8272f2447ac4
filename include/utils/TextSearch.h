#ifndef TEXTSEARCH_H
#define TEXTSEARCH_H

#include <QString>
#include <QVector>

namespace TextSearch {

// Start offsets of every non-overlapping, case-insensitive occurrence of
// query in text, scanning left to right. Empty query yields no matches.
QVector<int> findAll(const QString& text, const QString& query);

} // namespace TextSearch

#endif // TEXTSEARCH_H
