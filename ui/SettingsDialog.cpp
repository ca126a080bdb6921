// Implementation of the DropShelf settings dialog.
#include "SettingsDialog.hpp"
#include "SecretStore.hpp"
#include "UiAlerts.hpp"
#include <QCheckBox>
#include <QComboBox>
#include <QDir>
#include <QFileDialog>
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QListWidget>
#include <QMessageBox>
#include <QPushButton>
#include <QSettings>
#include <QSpinBox>
#include <QStackedWidget>
#include <QVBoxLayout>

static bool storedInsecureFallback() {
    QSettings s("DropShelf", "DropShelf");
    return s.value("Security/enableInsecureSecretFallback", false).toBool();
}

SettingsDialog::SettingsDialog(const IngestSettings &current,
                               SecretStore *secrets, QWidget *parent)
    : QDialog(parent), applied_(current), secrets_(secrets) {
    setWindowTitle(tr("Settings"));
    resize(700, 460);
    setMinimumSize(520, 380);

    auto *root = new QVBoxLayout(this);
    root->setContentsMargins(12, 12, 12, 12);
    root->setSpacing(10);

    auto *contentRow = new QHBoxLayout();
    contentRow->setContentsMargins(0, 0, 0, 0);
    contentRow->setSpacing(10);
    root->addLayout(contentRow, 1);

    auto *sectionList = new QListWidget(this);
    sectionList->setSelectionMode(QAbstractItemView::SingleSelection);
    sectionList->setHorizontalScrollBarPolicy(Qt::ScrollBarAlwaysOff);
    sectionList->setFixedWidth(140);
    contentRow->addWidget(sectionList);

    auto *pages = new QStackedWidget(this);
    contentRow->addWidget(pages, 1);

    constexpr int kFieldMinWidth = 280;
    auto createFormPage = [pages, sectionList](const QString &title,
                                               QFormLayout *&outForm) {
        auto *page = new QWidget(pages);
        auto *pageLay = new QVBoxLayout(page);
        pageLay->setContentsMargins(12, 12, 12, 12);
        pageLay->setSpacing(8);
        auto *form = new QFormLayout();
        form->setFieldGrowthPolicy(QFormLayout::AllNonFixedFieldsGrow);
        form->setHorizontalSpacing(8);
        form->setVerticalSpacing(8);
        pageLay->addLayout(form);
        pageLay->addStretch(1);
        pages->addWidget(page);
        sectionList->addItem(title);
        outForm = form;
        return page;
    };
    auto pathRow = [this, kFieldMinWidth](QWidget *parent, QLineEdit *&edit,
                                          const QString &browseTitle,
                                          bool directory) {
        auto *rowWidget = new QWidget(parent);
        auto *row = new QHBoxLayout(rowWidget);
        row->setContentsMargins(0, 0, 0, 0);
        row->setSpacing(6);
        edit = new QLineEdit(parent);
        edit->setMinimumWidth(kFieldMinWidth);
        auto *browse = new QPushButton(tr("Choose…"), parent);
        row->addWidget(edit, 1);
        row->addWidget(browse);
        QLineEdit *target = edit;
        connect(browse, &QPushButton::clicked, this,
                [this, target, browseTitle, directory] {
                    const QString cur = target->text().isEmpty()
                                            ? QDir::homePath()
                                            : target->text();
                    const QString pick =
                        directory
                            ? QFileDialog::getExistingDirectory(
                                  this, browseTitle, cur)
                            : QFileDialog::getOpenFileName(this, browseTitle,
                                                           cur);
                    if (!pick.isEmpty())
                        target->setText(pick);
                });
        return rowWidget;
    };

    // Ingestion
    QFormLayout *ingestForm = nullptr;
    QWidget *ingestPage = createFormPage(tr("Ingestion"), ingestForm);
    maxConcurrentSpin_ = new QSpinBox(ingestPage);
    maxConcurrentSpin_->setRange(1, IngestSettings::kMaxConcurrentLimit);
    maxConcurrentSpin_->setToolTip(
        tr("Files prepared at the same time for one drop."));
    ingestForm->addRow(tr("Simultaneous:"), maxConcurrentSpin_);
    timeoutSpin_ = new QSpinBox(ingestPage);
    timeoutSpin_->setRange(0, IngestSettings::kMaxPromiseTimeoutMs / 1000);
    timeoutSpin_->setSuffix(tr(" s"));
    timeoutSpin_->setSpecialValueText(tr("No limit"));
    timeoutSpin_->setToolTip(
        tr("Give up on a dropped file that takes longer than this."));
    ingestForm->addRow(tr("Per-file timeout:"), timeoutSpin_);
    orderCombo_ = new QComboBox(ingestPage);
    orderCombo_->addItem(tr("Order of completion"), false);
    orderCombo_->addItem(tr("Order of the drop"), true);
    ingestForm->addRow(tr("Stack order:"), orderCombo_);
    skipDuplicates_ =
        new QCheckBox(tr("Skip files that are already on the shelf"), ingestPage);
    ingestForm->addRow(QString(), skipDuplicates_);

    // Staging
    QFormLayout *stagingForm = nullptr;
    QWidget *stagingPage = createFormPage(tr("Staging"), stagingForm);
    stagingForm->addRow(tr("Staging folder:"),
                        pathRow(stagingPage, stagingRootEdit_,
                                tr("Select staging folder"), true));
    stagingRootEdit_->setPlaceholderText(
        QDir::toNativeSeparators(IngestSettings().effectiveStagingRoot()));
    cleanupOnQuit_ = new QCheckBox(
        tr("Delete prepared files when DropShelf quits"), stagingPage);
    stagingForm->addRow(QString(), cleanupOnQuit_);
    auto *stagingHint = new QLabel(
        tr("A new staging folder is used after restarting."), stagingPage);
    stagingHint->setStyleSheet("color: palette(mid);");
    stagingForm->addRow(QString(), stagingHint);

    // SFTP
    QFormLayout *sftpForm = nullptr;
    QWidget *sftpPage = createFormPage(tr("SFTP"), sftpForm);
    knownHostsCombo_ = new QComboBox(sftpPage);
    knownHostsCombo_->addItem(tr("Strict"),
                              int(dropshelf::KnownHostsPolicy::Strict));
    knownHostsCombo_->addItem(tr("Accept new hosts"),
                              int(dropshelf::KnownHostsPolicy::AcceptNew));
    knownHostsCombo_->addItem(tr("No verification (insecure)"),
                              int(dropshelf::KnownHostsPolicy::Off));
    sftpForm->addRow(tr("Host keys:"), knownHostsCombo_);
    sftpForm->addRow(tr("Private key:"),
                     pathRow(sftpPage, privateKeyEdit_,
                             tr("Select private key"), false));

    auto *credGroup = new QGroupBox(tr("Saved password"), sftpPage);
    auto *credForm = new QFormLayout(credGroup);
    credForm->setContentsMargins(12, 10, 12, 10);
    credUserEdit_ = new QLineEdit(credGroup);
    credHostEdit_ = new QLineEdit(credGroup);
    credPasswordEdit_ = new QLineEdit(credGroup);
    credPasswordEdit_->setEchoMode(QLineEdit::Password);
    credForm->addRow(tr("User:"), credUserEdit_);
    credForm->addRow(tr("Host:"), credHostEdit_);
    credForm->addRow(tr("Password:"), credPasswordEdit_);
    auto *credButtons = new QWidget(credGroup);
    auto *credRow = new QHBoxLayout(credButtons);
    credRow->setContentsMargins(0, 0, 0, 0);
    auto *saveBtn = new QPushButton(tr("Save"), credButtons);
    auto *forgetBtn = new QPushButton(tr("Forget"), credButtons);
    saveBtn->setAutoDefault(false);
    forgetBtn->setAutoDefault(false);
    credRow->addStretch(1);
    credRow->addWidget(forgetBtn);
    credRow->addWidget(saveBtn);
    credForm->addRow(QString(), credButtons);
    sftpForm->addRow(QString(), credGroup);
    connect(saveBtn, &QPushButton::clicked, this, &SettingsDialog::savePassword);
    connect(forgetBtn, &QPushButton::clicked, this,
            &SettingsDialog::forgetPassword);

#if !defined(HAVE_LIBSECRET)
    insecureFallback_ = new QCheckBox(
        tr("Allow storing passwords unencrypted (not recommended)"), sftpPage);
    sftpForm->addRow(QString(), insecureFallback_);
    insecureFallback_->setChecked(storedInsecureFallback());
    connect(insecureFallback_, &QCheckBox::toggled, this, [this](bool on) {
        if (on &&
            !UiAlerts::confirm(
                this, tr("Enable insecure fallback"),
                tr("Passwords will be written to disk without encryption "
                   "using QSettings.\nInstalling libsecret (Secret Service) "
                   "is recommended.\n\nEnable the fallback anyway?"))) {
            insecureFallback_->blockSignals(true);
            insecureFallback_->setChecked(false);
            insecureFallback_->blockSignals(false);
        }
        updateApplyFromControls();
    });
#endif

    connect(sectionList, &QListWidget::currentRowChanged, pages,
            &QStackedWidget::setCurrentIndex);
    sectionList->setCurrentRow(0);

    // Buttons row: Close then Apply, right aligned
    auto *btnRow = new QWidget(this);
    auto *hb = new QHBoxLayout(btnRow);
    hb->setContentsMargins(0, 0, 0, 0);
    hb->addStretch();
    closeBtn_ = new QPushButton(tr("Close"), btnRow);
    applyBtn_ = new QPushButton(tr("Apply"), btnRow);
    hb->addWidget(closeBtn_);
    hb->addWidget(applyBtn_);
    root->addWidget(btnRow);
    applyBtn_->setEnabled(false);
    applyBtn_->setAutoDefault(true);
    closeBtn_->setAutoDefault(false);
    connect(applyBtn_, &QPushButton::clicked, this, &SettingsDialog::onApply);
    connect(closeBtn_, &QPushButton::clicked, this, &SettingsDialog::reject);

    load(applied_);

    auto dirty = [this] { updateApplyFromControls(); };
    connect(maxConcurrentSpin_, qOverload<int>(&QSpinBox::valueChanged), this,
            dirty);
    connect(timeoutSpin_, qOverload<int>(&QSpinBox::valueChanged), this, dirty);
    connect(orderCombo_, qOverload<int>(&QComboBox::currentIndexChanged), this,
            dirty);
    connect(skipDuplicates_, &QCheckBox::toggled, this, dirty);
    connect(stagingRootEdit_, &QLineEdit::textChanged, this, dirty);
    connect(cleanupOnQuit_, &QCheckBox::toggled, this, dirty);
    connect(knownHostsCombo_, qOverload<int>(&QComboBox::currentIndexChanged),
            this, dirty);
    connect(privateKeyEdit_, &QLineEdit::textChanged, this, dirty);
    updateApplyFromControls();
}

void SettingsDialog::load(const IngestSettings &s) {
    maxConcurrentSpin_->setValue(s.maxConcurrent);
    timeoutSpin_->setValue(s.promiseTimeoutMs / 1000);
    orderCombo_->setCurrentIndex(s.preserveSubmissionOrder ? 1 : 0);
    skipDuplicates_->setChecked(s.skipDuplicatePaths);
    stagingRootEdit_->setText(s.stagingRoot);
    cleanupOnQuit_->setChecked(s.cleanupOnQuit);
    const int ki = knownHostsCombo_->findData(int(s.knownHostsPolicy));
    knownHostsCombo_->setCurrentIndex(ki >= 0 ? ki : 0);
    privateKeyEdit_->setText(s.privateKeyPath);
}

IngestSettings SettingsDialog::collect() const {
    IngestSettings out = applied_;
    out.maxConcurrent =
        IngestSettings::clampMaxConcurrent(maxConcurrentSpin_->value());
    out.promiseTimeoutMs =
        IngestSettings::clampPromiseTimeout(timeoutSpin_->value() * 1000);
    out.preserveSubmissionOrder = orderCombo_->currentData().toBool();
    out.skipDuplicatePaths = skipDuplicates_->isChecked();
    const QString root = stagingRootEdit_->text().trimmed();
    out.stagingRoot = root.isEmpty() ? QString() : QDir::cleanPath(root);
    out.cleanupOnQuit = cleanupOnQuit_->isChecked();
    out.knownHostsPolicy = static_cast<dropshelf::KnownHostsPolicy>(
        knownHostsCombo_->currentData().toInt());
    out.privateKeyPath = privateKeyEdit_->text().trimmed();
    return out;
}

void SettingsDialog::onApply() {
    const IngestSettings next = collect();
    const bool rootChanged = next.stagingRoot != applied_.stagingRoot;
    next.save();
    if (insecureFallback_) {
        QSettings s("DropShelf", "DropShelf");
        s.setValue("Security/enableInsecureSecretFallback",
                   insecureFallback_->isChecked());
        s.sync();
    }
    applied_ = next;
    emit settingsApplied(applied_);
    if (rootChanged) {
        QMessageBox box(this);
        UiAlerts::configure(box);
        box.setIcon(QMessageBox::Information);
        box.setWindowTitle(tr("Staging folder"));
        box.setText(tr("The new staging folder is used after restarting."));
        box.exec();
    }
    applyBtn_->setEnabled(false);
    applyBtn_->setDefault(false);
}

void SettingsDialog::updateApplyFromControls() {
    bool modified = !(collect() == applied_);
    if (insecureFallback_)
        modified = modified ||
                   insecureFallback_->isChecked() != storedInsecureFallback();
    applyBtn_->setEnabled(modified);
    applyBtn_->setDefault(modified);
}

void SettingsDialog::savePassword() {
    const QString user = credUserEdit_->text().trimmed();
    const QString host = credHostEdit_->text().trimmed();
    const QString pass = credPasswordEdit_->text();
    if (user.isEmpty() || host.isEmpty() || pass.isEmpty()) {
        UiAlerts::warning(this, tr("Saved password"),
                          tr("User, host and password are required."));
        return;
    }
    if (!secrets_)
        return;
    // Saving with the fallback ticked persists the toggle first.
    if (insecureFallback_ && insecureFallback_->isChecked() &&
        !storedInsecureFallback()) {
        QSettings s("DropShelf", "DropShelf");
        s.setValue("Security/enableInsecureSecretFallback", true);
        s.sync();
    }
    const auto res =
        secrets_->setSecret(SecretStore::sftpPasswordKey(user, host), pass);
    if (!res.ok()) {
        const QString why =
            res.status == SecretStore::PersistStatus::Unavailable
                ? tr("No secure password storage is available.")
                : tr("The password could not be stored.");
        UiAlerts::warning(this, tr("Saved password"),
                          res.detail.isEmpty()
                              ? why
                              : QStringLiteral("%1\n%2").arg(why, res.detail));
        return;
    }
    credPasswordEdit_->clear();
    updateApplyFromControls();
}

void SettingsDialog::forgetPassword() {
    const QString user = credUserEdit_->text().trimmed();
    const QString host = credHostEdit_->text().trimmed();
    if (user.isEmpty() || host.isEmpty() || !secrets_)
        return;
    secrets_->removeSecret(SecretStore::sftpPasswordKey(user, host));
    credPasswordEdit_->clear();
}
