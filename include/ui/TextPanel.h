#ifndef TEXTPANEL_H
#define TEXTPANEL_H

#include <QWidget>
#include <QString>
#include <QVector>

class QLabel;
class QLineEdit;
class QPlainTextEdit;
class QPushButton;
struct AppError;

/**
 * @brief Read-only view of the extracted text with search, copy and save.
 *
 * The panel keeps the text itself; the view only mirrors it. Search
 * highlights every case-insensitive match of the query.
 */
class TextPanel : public QWidget
{
    Q_OBJECT

public:
    explicit TextPanel(QWidget *parent = nullptr);
    ~TextPanel() override;

    void setText(const QString &text);
    void appendText(const QString &text);
    void clear();
    QString text() const { return m_text; }
    bool isEmpty() const { return m_text.isEmpty(); }

    // Hint shown while the panel is empty
    void setPlaceholderText(const QString &text);
    QString placeholderText() const;

    // Returns false when there is nothing to copy
    bool copyToClipboard();

    // Writes the text verbatim as UTF-8 (atomic replace)
    bool saveToFile(const QString &path, AppError *error = nullptr);

    /**
     * @brief Highlight every match of query and return the match offsets.
     * An empty query clears the highlights.
     */
    QVector<int> search(const QString &query);
    QString searchQuery() const { return m_query; }
    int matchCount() const { return m_matches.size(); }

    // Move keyboard focus to the search field
    void focusSearch();

signals:
    void copyRequested();
    void saveRequested();
    void clearRequested();
    void searchFinished(const QString &query, int matchCount);
    void textChanged(const QString &text);

private:
    void setupUi();
    void refreshView();
    void applyHighlights();
    void updateButtons();

    QString m_text;
    QString m_query;
    QVector<int> m_matches;

    QLabel *m_titleLabel;
    QLineEdit *m_searchEdit;
    QPlainTextEdit *m_textView;
    QPushButton *m_copyButton;
    QPushButton *m_saveButton;
    QPushButton *m_clearButton;
};

#endif // TEXTPANEL_H
