// Settings dialog: ingestion, staging and SFTP preferences, plus saved SFTP
// passwords.
#pragma once
#include "IngestSettings.hpp"
#include <QDialog>

class QCheckBox;
class QComboBox;
class QLineEdit;
class QPushButton;
class QSpinBox;
class SecretStore;

class SettingsDialog : public QDialog {
    Q_OBJECT
public:
    SettingsDialog(const IngestSettings &current, SecretStore *secrets,
                   QWidget *parent = nullptr);

    // Values currently shown in the controls (clamped).
    IngestSettings collect() const;

signals:
    // Emitted on Apply after the values were written to QSettings.
    void settingsApplied(const IngestSettings &settings);

private slots:
    void onApply();
    void updateApplyFromControls();
    void savePassword();
    void forgetPassword();

private:
    void load(const IngestSettings &s);

    IngestSettings applied_;
    SecretStore *secrets_ = nullptr; // not owned

    // Ingestion
    QSpinBox *maxConcurrentSpin_ = nullptr;
    QSpinBox *timeoutSpin_ = nullptr;
    QComboBox *orderCombo_ = nullptr;
    QCheckBox *skipDuplicates_ = nullptr;
    // Staging
    QLineEdit *stagingRootEdit_ = nullptr;
    QCheckBox *cleanupOnQuit_ = nullptr;
    // SFTP
    QComboBox *knownHostsCombo_ = nullptr;
    QLineEdit *privateKeyEdit_ = nullptr;
    QLineEdit *credUserEdit_ = nullptr;
    QLineEdit *credHostEdit_ = nullptr;
    QLineEdit *credPasswordEdit_ = nullptr;
    QCheckBox *insecureFallback_ = nullptr; // only without libsecret

    QPushButton *applyBtn_ = nullptr;
    QPushButton *closeBtn_ = nullptr;
};
