#pragma once

#include "core.h"
#include <QDialog>

class QPlainTextEdit;

namespace ndoc {

// Pretty definition of one entry. Enter copies the raw definition to the
// clipboard; Esc closes.
class EntryDialog : public QDialog {
    Q_OBJECT
public:
    EntryDialog(CatalogHandle catalog, int catalogIndex, QWidget* parent = nullptr);

    QString prettyText() const { return m_pretty; }
    QString rawText() const { return m_raw; }

public slots:
    void copyRawDefinition();

signals:
    void rawDefinitionCopied(const QString& raw);

private:
    CatalogHandle   m_catalog;
    QString         m_pretty;
    QString         m_raw;
    QPlainTextEdit* m_view;
};

} // namespace ndoc
