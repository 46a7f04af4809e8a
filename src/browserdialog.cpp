#include "browserdialog.h"
#include "entrydialog.h"

#include <QVBoxLayout>
#include <QLineEdit>
#include <QListWidget>
#include <QLabel>
#include <QKeyEvent>
#include <QMessageBox>
#include <QShortcut>
#include <QCoreApplication>
#include <QDebug>

namespace ndoc {

BrowserDialog::BrowserDialog(CatalogHandle catalog, QWidget* parent)
    : QDialog(parent), m_catalog(std::move(catalog))
{
    setWindowTitle("Fuzzy NT Docs");
    resize(640, 520);

    auto* layout = new QVBoxLayout(this);

    layout->addWidget(new QLabel("Search:"));
    m_searchEdit = new QLineEdit;
    m_searchEdit->setPlaceholderText("Type a name (F1 for help)...");
    m_searchEdit->setClearButtonEnabled(true);
    m_searchEdit->installEventFilter(this);
    layout->addWidget(m_searchEdit);

    m_resultList = new QListWidget;
    m_resultList->setUniformItemSizes(true);
    layout->addWidget(m_resultList, 1);

    m_countLabel = new QLabel;
    layout->addWidget(m_countLabel);

    connect(m_searchEdit, &QLineEdit::textChanged, this, &BrowserDialog::filterChanged);
    connect(m_searchEdit, &QLineEdit::returnPressed, this, &BrowserDialog::openCurrent);
    connect(m_resultList, &QListWidget::itemActivated, this, &BrowserDialog::openItem);

    auto* help = new QShortcut(QKeySequence(Qt::Key_F1), this);
    connect(help, &QShortcut::activated, this, &BrowserDialog::showHelp);

    populateList(rankEntries(*m_catalog, QString()));
}

QVector<int> BrowserDialog::listedIndices() const {
    QVector<int> result;
    result.reserve(m_resultList->count());
    for (int i = 0; i < m_resultList->count(); i++)
        result.append(m_resultList->item(i)->data(Qt::UserRole).toInt());
    return result;
}

void BrowserDialog::filterChanged(const QString& text) {
    populateList(rankEntries(*m_catalog, text));
}

void BrowserDialog::populateList(const QVector<ScoredEntry>& hits) {
    m_resultList->clear();
    for (const auto& hit : hits) {
        auto* item = new QListWidgetItem((*m_catalog)[hit.index].name(), m_resultList);
        item->setData(Qt::UserRole, hit.index);
    }
    if (m_resultList->count() > 0)
        m_resultList->setCurrentRow(0);

    m_countLabel->setText(QStringLiteral("%1 of %2 entries")
        .arg(m_resultList->count()).arg(m_catalog->size()));
}

void BrowserDialog::openCurrent() {
    QListWidgetItem* item = m_resultList->currentItem();
    if (!item && m_resultList->count() > 0)
        item = m_resultList->item(0);
    if (item) openItem(item);
}

void BrowserDialog::openItem(QListWidgetItem* item) {
    if (!item) return;
    openEntry(item->data(Qt::UserRole).toInt());
}

void BrowserDialog::openEntry(int catalogIndex) {
    if (catalogIndex < 0 || catalogIndex >= m_catalog->size()) return;
    qDebug() << "[Browser] Opening" << (*m_catalog)[catalogIndex].name();
    emit entryOpened(catalogIndex);

    EntryDialog dlg(m_catalog, catalogIndex, this);
    dlg.exec();
    m_searchEdit->setFocus();
}

void BrowserDialog::showHelp() {
    auto* box = new QMessageBox(QMessageBox::NoIcon, "Help",
        "Use Up/Down to move the selection.\n"
        "Type to filter entries via fuzzy matching.\n"
        "Enter on a name opens its full definition.\n"
        "Enter again on the definition copies the raw C form.\n"
        "Esc backs out of dialogs or quits from the search screen.",
        QMessageBox::Close, this);
    box->setAttribute(Qt::WA_DeleteOnClose);
    box->open();
}

bool BrowserDialog::eventFilter(QObject* obj, QEvent* event) {
    // Keep typing in the search box while steering the result list
    if (obj == m_searchEdit && event->type() == QEvent::KeyPress) {
        auto* key = static_cast<QKeyEvent*>(event);
        switch (key->key()) {
        case Qt::Key_Up:
        case Qt::Key_Down:
        case Qt::Key_PageUp:
        case Qt::Key_PageDown:
            QCoreApplication::sendEvent(m_resultList, event);
            return true;
        default:
            break;
        }
    }
    return QDialog::eventFilter(obj, event);
}

} // namespace ndoc
