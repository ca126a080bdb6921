// Message boxes with the shelf's common setup (plain text, window modal).
#pragma once

#include <QMessageBox>

class QString;
class QWidget;

namespace UiAlerts {
void configure(QMessageBox &box,
               Qt::WindowModality modality = Qt::WindowModal);

void warning(QWidget *parent, const QString &title, const QString &text);

// Yes/No with No as default. True when the user picked Yes.
bool confirm(QWidget *parent, const QString &title, const QString &text);
} // namespace UiAlerts
