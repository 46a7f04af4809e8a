#pragma once

#include "core.h"
#include "search.h"
#include <QDialog>

class QLineEdit;
class QListWidget;
class QListWidgetItem;
class QLabel;

namespace ndoc {

// Search box over the catalog with a live-ranked result list.
class BrowserDialog : public QDialog {
    Q_OBJECT
public:
    explicit BrowserDialog(CatalogHandle catalog, QWidget* parent = nullptr);

    QLineEdit*   searchEdit() const { return m_searchEdit; }
    QListWidget* resultList() const { return m_resultList; }

    // Catalog indices currently listed, top to bottom.
    QVector<int> listedIndices() const;

signals:
    void entryOpened(int catalogIndex);

private slots:
    void filterChanged(const QString& text);
    void openCurrent();
    void openItem(QListWidgetItem* item);
    void showHelp();

protected:
    bool eventFilter(QObject* obj, QEvent* event) override;

private:
    CatalogHandle m_catalog;
    QLineEdit*    m_searchEdit;
    QListWidget*  m_resultList;
    QLabel*       m_countLabel;

    void populateList(const QVector<ScoredEntry>& hits);
    void openEntry(int catalogIndex);
};

} // namespace ndoc
