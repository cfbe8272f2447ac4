#ifndef TESSERACTTSVPARSER_H
#define TESSERACTTSVPARSER_H

#include <QString>

#include "detection/OCRTypes.h"

/**
 * @brief Parses the TSV report printed by `tesseract <image> stdout tsv`.
 *
 * Columns: level page_num block_num par_num line_num word_num left top
 * width height conf text. Only level-5 rows (words) with non-blank text
 * become blocks. The text joins words with a space, lines with a newline,
 * and separates paragraphs and blocks with an empty line.
 */
class TesseractTsvParser
{
public:
    static constexpr int kWordLevel = 5;

    /**
     * @brief Parse a TSV report.
     * @param tsv Engine stdout
     * @param result Receives text and word blocks
     * @param errorMessage Set when the report is malformed
     * @return false if the header is missing or a row cannot be parsed
     */
    static bool parse(const QString& tsv, OCRResult& result, QString* errorMessage = nullptr);

    // Rebuild text from blocks using their block/paragraph/line numbers
    static QString composeText(const QVector<OCRTextBlock>& blocks);
};

#endif // TESSERACTTSVPARSER_H
