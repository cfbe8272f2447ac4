#include "ocr/TesseractTsvParser.h"

#include <QHash>
#include <QStringList>

#include <algorithm>

namespace {

const QStringList kRequiredColumns = {
    QStringLiteral("level"), QStringLiteral("page_num"), QStringLiteral("block_num"),
    QStringLiteral("par_num"), QStringLiteral("line_num"), QStringLiteral("word_num"),
    QStringLiteral("left"), QStringLiteral("top"), QStringLiteral("width"),
    QStringLiteral("height"), QStringLiteral("conf"), QStringLiteral("text")
};

void setMessage(QString* errorMessage, const QString& message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
}

bool toInt(const QString& field, int* value)
{
    bool ok = false;
    *value = field.trimmed().toInt(&ok);
    return ok;
}

} // namespace

bool TesseractTsvParser::parse(const QString& tsv, OCRResult& result, QString* errorMessage)
{
    result = OCRResult();

    QStringList lines = tsv.split(QLatin1Char('\n'));
    for (QString& line : lines) {
        if (line.endsWith(QLatin1Char('\r'))) {
            line.chop(1);
        }
    }
    while (!lines.isEmpty() && lines.first().trimmed().isEmpty()) {
        lines.removeFirst();
    }
    if (lines.isEmpty()) {
        setMessage(errorMessage, QStringLiteral("Engine produced no output"));
        return false;
    }

    const QStringList header = lines.first().split(QLatin1Char('\t'));
    QHash<QString, int> column;
    for (int i = 0; i < header.size(); ++i) {
        column.insert(header.at(i).trimmed(), i);
    }
    for (const QString& name : kRequiredColumns) {
        if (!column.contains(name)) {
            setMessage(errorMessage,
                       QStringLiteral("Engine output is missing the '%1' column").arg(name));
            return false;
        }
    }

    const int textColumn = column.value(QStringLiteral("text"));
    // The text field is last and may be dropped entirely on non-word rows
    int minFields = 0;
    for (const QString& name : kRequiredColumns) {
        if (name != QLatin1String("text")) {
            minFields = std::max(minFields, column.value(name) + 1);
        }
    }

    for (int row = 1; row < lines.size(); ++row) {
        const QString& line = lines.at(row);
        if (line.trimmed().isEmpty()) {
            continue;
        }

        const QStringList fields = line.split(QLatin1Char('\t'));
        if (fields.size() < minFields) {
            setMessage(errorMessage,
                       QStringLiteral("Malformed engine output at line %1").arg(row + 1));
            return false;
        }

        int level = 0;
        int left = 0;
        int top = 0;
        int width = 0;
        int height = 0;
        OCRTextBlock block;
        if (!toInt(fields.at(column.value(QStringLiteral("level"))), &level)
            || !toInt(fields.at(column.value(QStringLiteral("block_num"))), &block.blockNum)
            || !toInt(fields.at(column.value(QStringLiteral("par_num"))), &block.parNum)
            || !toInt(fields.at(column.value(QStringLiteral("line_num"))), &block.lineNum)
            || !toInt(fields.at(column.value(QStringLiteral("word_num"))), &block.wordNum)
            || !toInt(fields.at(column.value(QStringLiteral("left"))), &left)
            || !toInt(fields.at(column.value(QStringLiteral("top"))), &top)
            || !toInt(fields.at(column.value(QStringLiteral("width"))), &width)
            || !toInt(fields.at(column.value(QStringLiteral("height"))), &height)) {
            setMessage(errorMessage,
                       QStringLiteral("Malformed engine output at line %1").arg(row + 1));
            return false;
        }

        if (level != kWordLevel) {
            continue;
        }

        const QString text = textColumn < fields.size() ? fields.at(textColumn).trimmed() : QString();
        if (text.isEmpty()) {
            continue;
        }

        bool confOk = false;
        const float conf = fields.at(column.value(QStringLiteral("conf"))).trimmed().toFloat(&confOk);

        block.text = text;
        block.boundingRect = QRect(left, top, width, height);
        block.confidence = confOk ? conf : -1.0f;
        result.blocks.append(block);
    }

    result.text = composeText(result.blocks);
    return true;
}

QString TesseractTsvParser::composeText(const QVector<OCRTextBlock>& blocks)
{
    QString text;
    const OCRTextBlock* previous = nullptr;
    for (const OCRTextBlock& block : blocks) {
        if (previous) {
            if (block.blockNum != previous->blockNum || block.parNum != previous->parNum) {
                text += QStringLiteral("\n\n");
            } else if (block.lineNum != previous->lineNum) {
                text += QLatin1Char('\n');
            } else {
                text += QLatin1Char(' ');
            }
        }
        text += block.text;
        previous = &block;
    }
    return text.trimmed();
}
