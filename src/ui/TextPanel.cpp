#include "ui/TextPanel.h"

#include "AppError.h"
#include "Constants.h"
#include "utils/TextSaveUtils.h"
#include "utils/TextSearch.h"

#include <QApplication>
#include <QClipboard>
#include <QDebug>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QTextCursor>
#include <QTextEdit>
#include <QVBoxLayout>

TextPanel::TextPanel(QWidget *parent)
    : QWidget(parent)
    , m_titleLabel(nullptr)
    , m_searchEdit(nullptr)
    , m_textView(nullptr)
    , m_copyButton(nullptr)
    , m_saveButton(nullptr)
    , m_clearButton(nullptr)
{
    setupUi();
    updateButtons();
}

TextPanel::~TextPanel() = default;

void TextPanel::setupUi()
{
    auto *mainLayout = new QVBoxLayout(this);
    mainLayout->setContentsMargins(0, 0, 0, 0);
    mainLayout->setSpacing(6);

    // Header: title and search field
    auto *headerLayout = new QHBoxLayout();
    m_titleLabel = new QLabel(tr("Extracted Text"), this);
    QFont titleFont = m_titleLabel->font();
    titleFont.setBold(true);
    m_titleLabel->setFont(titleFont);
    headerLayout->addWidget(m_titleLabel);
    headerLayout->addStretch();

    m_searchEdit = new QLineEdit(this);
    m_searchEdit->setObjectName("searchEdit");
    m_searchEdit->setPlaceholderText(tr("Search"));
    m_searchEdit->setClearButtonEnabled(true);
    m_searchEdit->setMinimumWidth(200);
    connect(m_searchEdit, &QLineEdit::textChanged, this, [this](const QString &query) {
        search(query);
    });
    headerLayout->addWidget(m_searchEdit);
    mainLayout->addLayout(headerLayout);

    m_textView = new QPlainTextEdit(this);
    m_textView->setObjectName("textView");
    m_textView->setReadOnly(true);
    m_textView->setPlaceholderText(tr("Run OCR to extract text from the image."));
    mainLayout->addWidget(m_textView, 1);

    // Button bar
    auto *buttonLayout = new QHBoxLayout();
    buttonLayout->addStretch();

    m_copyButton = new QPushButton(tr("Copy"), this);
    connect(m_copyButton, &QPushButton::clicked, this, &TextPanel::copyRequested);
    buttonLayout->addWidget(m_copyButton);

    m_saveButton = new QPushButton(tr("Save..."), this);
    connect(m_saveButton, &QPushButton::clicked, this, &TextPanel::saveRequested);
    buttonLayout->addWidget(m_saveButton);

    m_clearButton = new QPushButton(tr("Clear"), this);
    connect(m_clearButton, &QPushButton::clicked, this, &TextPanel::clearRequested);
    buttonLayout->addWidget(m_clearButton);

    mainLayout->addLayout(buttonLayout);
}

void TextPanel::setText(const QString &text)
{
    m_text = text;
    refreshView();
}

void TextPanel::appendText(const QString &text)
{
    if (text.isEmpty()) {
        return;
    }
    m_text += text;
    refreshView();
}

void TextPanel::clear()
{
    m_text.clear();
    refreshView();
}

void TextPanel::setPlaceholderText(const QString &text)
{
    m_textView->setPlaceholderText(text);
}

QString TextPanel::placeholderText() const
{
    return m_textView->placeholderText();
}

bool TextPanel::copyToClipboard()
{
    if (m_text.isEmpty()) {
        return false;
    }
    QApplication::clipboard()->setText(m_text);
    return true;
}

bool TextPanel::saveToFile(const QString &path, AppError *error)
{
    if (!TextSaveUtils::saveTextAtomically(m_text, path, error)) {
        return false;
    }
    qDebug() << "TextPanel: Saved" << m_text.size() << "characters to" << path;
    return true;
}

QVector<int> TextPanel::search(const QString &query)
{
    m_query = query;
    m_matches = TextSearch::findAll(m_text, m_query);
    applyHighlights();
    emit searchFinished(m_query, m_matches.size());
    return m_matches;
}

void TextPanel::focusSearch()
{
    m_searchEdit->setFocus(Qt::ShortcutFocusReason);
    m_searchEdit->selectAll();
}

void TextPanel::refreshView()
{
    m_textView->setPlainText(m_text);
    updateButtons();
    emit textChanged(m_text);

    // Matches are stale after a text change
    if (!m_query.isEmpty()) {
        search(m_query);
    } else {
        m_matches.clear();
        applyHighlights();
    }
}

void TextPanel::applyHighlights()
{
    QList<QTextEdit::ExtraSelection> selections;
    selections.reserve(m_matches.size());

    QTextCharFormat format;
    format.setBackground(TextReader::Color::kSearchHighlight);
    format.setForeground(Qt::black);

    for (int start : m_matches) {
        QTextEdit::ExtraSelection selection;
        selection.cursor = QTextCursor(m_textView->document());
        selection.cursor.setPosition(start);
        selection.cursor.setPosition(start + m_query.length(), QTextCursor::KeepAnchor);
        selection.format = format;
        selections.append(selection);
    }
    m_textView->setExtraSelections(selections);
}

void TextPanel::updateButtons()
{
    m_clearButton->setEnabled(!m_text.isEmpty());
}
