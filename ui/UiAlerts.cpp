#include "UiAlerts.hpp"

namespace UiAlerts {

void configure(QMessageBox &box, Qt::WindowModality modality) {
    box.setTextFormat(Qt::PlainText);
    box.setWindowModality(modality);
}

void warning(QWidget *parent, const QString &title, const QString &text) {
    QMessageBox box(parent);
    configure(box);
    box.setIcon(QMessageBox::Warning);
    box.setWindowTitle(title);
    box.setText(text);
    box.setStandardButtons(QMessageBox::Ok);
    box.exec();
}

bool confirm(QWidget *parent, const QString &title, const QString &text) {
    QMessageBox box(parent);
    configure(box);
    box.setIcon(QMessageBox::Question);
    box.setWindowTitle(title);
    box.setText(text);
    box.setStandardButtons(QMessageBox::Yes | QMessageBox::No);
    box.setDefaultButton(QMessageBox::No);
    return box.exec() == QMessageBox::Yes;
}

} // namespace UiAlerts
