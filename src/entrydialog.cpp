#include "entrydialog.h"
#include "definition.h"

#include <QVBoxLayout>
#include <QPlainTextEdit>
#include <QLabel>
#include <QShortcut>
#include <QClipboard>
#include <QGuiApplication>
#include <QFontDatabase>
#include <QMessageBox>
#include <QDebug>

namespace ndoc {

EntryDialog::EntryDialog(CatalogHandle catalog, int catalogIndex, QWidget* parent)
    : QDialog(parent), m_catalog(std::move(catalog))
{
    const Entry& entry = (*m_catalog)[catalogIndex];
    m_pretty = prettyDefinition(entry, *m_catalog);
    m_raw = rawDefinition(entry, *m_catalog);

    setWindowTitle(entry.name());
    resize(600, 420);

    auto* layout = new QVBoxLayout(this);

    m_view = new QPlainTextEdit(m_pretty);
    m_view->setReadOnly(true);
    m_view->setLineWrapMode(QPlainTextEdit::WidgetWidth);
    m_view->setFont(QFontDatabase::systemFont(QFontDatabase::FixedFont));
    layout->addWidget(m_view, 1);

    auto* hint = new QLabel("Enter: copy raw definition    Esc: back");
    layout->addWidget(hint);

    // Shortcuts win over the text view, which would otherwise eat Return
    auto* copyReturn = new QShortcut(QKeySequence(Qt::Key_Return), this);
    auto* copyEnter  = new QShortcut(QKeySequence(Qt::Key_Enter), this);
    connect(copyReturn, &QShortcut::activated, this, &EntryDialog::copyRawDefinition);
    connect(copyEnter,  &QShortcut::activated, this, &EntryDialog::copyRawDefinition);
}

void EntryDialog::copyRawDefinition() {
    QClipboard* clipboard = QGuiApplication::clipboard();
    if (!clipboard) {
        qWarning() << "[Browser] Clipboard unavailable";
        auto* box = new QMessageBox(QMessageBox::Warning, "Clipboard error",
                                    "No clipboard is available on this platform.",
                                    QMessageBox::Ok, this);
        box->setAttribute(Qt::WA_DeleteOnClose);
        box->open();
        return;
    }

    clipboard->setText(m_raw);
    qDebug() << "[Browser] Copied raw definition," << m_raw.size() << "chars";
    emit rawDefinitionCopied(m_raw);

    auto* box = new QMessageBox(QMessageBox::Information, windowTitle(),
                                "Raw definition copied to clipboard",
                                QMessageBox::Ok, this);
    box->setAttribute(Qt::WA_DeleteOnClose);
    box->open();
}

} // namespace ndoc
