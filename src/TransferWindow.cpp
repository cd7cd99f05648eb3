// TransferWindow.cpp
//
// Presentation only: every SSH/archive operation happens in TransferQueue's
// worker (or, for "Test connection", a QtConcurrent task). This file reacts
// to TransferStatus values and never inspects worker state directly.

#include "TransferWindow.h"

#include <QAction>
#include <QApplication>
#include <QButtonGroup>
#include <QCheckBox>
#include <QCloseEvent>
#include <QComboBox>
#include <QDateTime>
#include <QDebug>
#include <QDesktopServices>
#include <QDir>
#include <QDirIterator>
#include <QFileDialog>
#include <QFileInfo>
#include <QFontDatabase>
#include <QFutureWatcher>
#include <QGridLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QInputDialog>
#include <QLabel>
#include <QLineEdit>
#include <QListWidget>
#include <QMenuBar>
#include <QMessageBox>
#include <QPlainTextEdit>
#include <QProgressBar>
#include <QPushButton>
#include <QRadioButton>
#include <QSpinBox>
#include <QUrl>
#include <QVBoxLayout>
#include <QtConcurrent/QtConcurrent>

#include "AppSettings.h"
#include "ConnectionProfile.h"
#include "Logger.h"
#include "ProfileStore.h"
#include "SshSession.h"
#include "TransferQueue.h"

// Total size of a file, or of every regular file below a folder.
static quint64 localSize(const QString& path)
{
    const QFileInfo fi(path);
    if (fi.isFile())
        return (quint64)fi.size();
    if (!fi.isDir())
        return 0;

    quint64 total = 0;
    QDirIterator it(path, QDir::Files | QDir::Hidden | QDir::System | QDir::NoSymLinks,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        it.next();
        total += (quint64)it.fileInfo().size();
    }
    return total;
}

TransferWindow::TransferWindow(ProfileStore* profiles,
                               TransferQueue* queue,
                               const TransferSettings& settings,
                               QWidget* parent)
    : QMainWindow(parent),
      m_profiles(profiles),
      m_queue(queue),
      m_settings(settings)
{
    setupUi();
    setupMenus();

    connect(m_queue, &TransferQueue::transferStatus, this, &TransferWindow::onTransferStatus);
    connect(m_queue, &TransferQueue::finished, this, &TransferWindow::onTransferFinished);

    reloadProfileCombo(AppSettings::lastProfile());
    onAuthMethodChanged();
    updateFileInfo();
    setBusy(false);

    resize(760, 820);
}

TransferWindow::~TransferWindow() = default;

void TransferWindow::setupUi()
{
    auto *central = new QWidget(this);
    setCentralWidget(central);

    auto *outer = new QVBoxLayout(central);
    outer->setContentsMargins(8, 8, 8, 8);
    outer->setSpacing(6);

    // ============================
    // Profile bar
    // ============================
    auto *profileBar = new QWidget(central);
    auto *profileLayout = new QHBoxLayout(profileBar);
    profileLayout->setContentsMargins(0, 0, 0, 0);
    profileLayout->setSpacing(6);

    m_profileCombo = new QComboBox(profileBar);
    m_profileCombo->setMinimumWidth(200);

    m_saveProfileBtn   = new QPushButton(tr("Save as profile…"), profileBar);
    m_deleteProfileBtn = new QPushButton(tr("Delete"), profileBar);
    m_testBtn          = new QPushButton(tr("Test connection"), profileBar);

    profileLayout->addWidget(new QLabel(tr("Profile:"), profileBar));
    profileLayout->addWidget(m_profileCombo, 1);
    profileLayout->addWidget(m_saveProfileBtn);
    profileLayout->addWidget(m_deleteProfileBtn);
    profileLayout->addWidget(m_testBtn);

    // ============================
    // Connection
    // ============================
    auto *connBox = new QGroupBox(tr("SSH connection"), central);
    auto *grid = new QGridLayout(connBox);

    m_hostEdit = new QLineEdit(connBox);
    m_hostEdit->setPlaceholderText(tr("hostname or IP"));

    m_portSpin = new QSpinBox(connBox);
    m_portSpin->setRange(1, 65535);
    m_portSpin->setValue(22);

    m_userEdit = new QLineEdit(connBox);

    m_passwordRadio = new QRadioButton(tr("Password"), connBox);
    m_keyRadio      = new QRadioButton(tr("Private key"), connBox);
    m_passwordRadio->setChecked(true);

    auto *authGroup = new QButtonGroup(this);
    authGroup->addButton(m_passwordRadio);
    authGroup->addButton(m_keyRadio);

    auto *authRow = new QHBoxLayout();
    authRow->addWidget(m_passwordRadio);
    authRow->addWidget(m_keyRadio);
    authRow->addStretch(1);

    m_passwordEdit = new QLineEdit(connBox);
    m_passwordEdit->setEchoMode(QLineEdit::Password);

    m_keyFileEdit = new QLineEdit(connBox);
    m_keyFileEdit->setPlaceholderText(tr("~/.ssh/id_ed25519"));
    m_browseKeyBtn = new QPushButton(tr("Browse…"), connBox);

    auto *keyRow = new QHBoxLayout();
    keyRow->addWidget(m_keyFileEdit, 1);
    keyRow->addWidget(m_browseKeyBtn);

    m_passphraseEdit = new QLineEdit(connBox);
    m_passphraseEdit->setEchoMode(QLineEdit::Password);
    m_passphraseEdit->setPlaceholderText(tr("optional, never saved"));

    grid->addWidget(new QLabel(tr("Host/IP:"), connBox), 0, 0);
    grid->addWidget(m_hostEdit, 0, 1);
    grid->addWidget(new QLabel(tr("Port:"), connBox), 0, 2);
    grid->addWidget(m_portSpin, 0, 3);
    grid->addWidget(new QLabel(tr("Username:"), connBox), 1, 0);
    grid->addWidget(m_userEdit, 1, 1, 1, 3);
    grid->addWidget(new QLabel(tr("Authentication:"), connBox), 2, 0);
    grid->addLayout(authRow, 2, 1, 1, 3);
    grid->addWidget(new QLabel(tr("Password:"), connBox), 3, 0);
    grid->addWidget(m_passwordEdit, 3, 1, 1, 3);
    grid->addWidget(new QLabel(tr("Key file:"), connBox), 4, 0);
    grid->addLayout(keyRow, 4, 1, 1, 3);
    grid->addWidget(new QLabel(tr("Passphrase:"), connBox), 5, 0);
    grid->addWidget(m_passphraseEdit, 5, 1, 1, 3);

    // ============================
    // Files
    // ============================
    auto *filesBox = new QGroupBox(tr("Files to transfer"), central);
    auto *filesLayout = new QVBoxLayout(filesBox);

    auto *fileButtons = new QHBoxLayout();
    auto *addFilesBtn  = new QPushButton(tr("Add files…"), filesBox);
    auto *addFolderBtn = new QPushButton(tr("Add folder…"), filesBox);
    auto *removeBtn    = new QPushButton(tr("Remove selected"), filesBox);
    auto *clearBtn     = new QPushButton(tr("Clear all"), filesBox);
    fileButtons->addWidget(addFilesBtn);
    fileButtons->addWidget(addFolderBtn);
    fileButtons->addWidget(removeBtn);
    fileButtons->addWidget(clearBtn);
    fileButtons->addStretch(1);

    m_fileList = new QListWidget(filesBox);
    m_fileList->setSelectionMode(QAbstractItemView::ExtendedSelection);

    m_fileInfoLabel = new QLabel(filesBox);

    filesLayout->addLayout(fileButtons);
    filesLayout->addWidget(m_fileList, 1);
    filesLayout->addWidget(m_fileInfoLabel);

    // ============================
    // Remote
    // ============================
    auto *remoteBox = new QGroupBox(tr("Remote destination"), central);
    auto *remoteGrid = new QGridLayout(remoteBox);

    m_remotePathEdit = new QLineEdit(remoteBox);
    m_remotePathEdit->setPlaceholderText(tr("/var/www/html or ~/uploads"));

    m_extractCheck = new QCheckBox(tr("Extract archive on the server"), remoteBox);
    m_extractCheck->setChecked(true);

    m_removeArchiveCheck = new QCheckBox(tr("Delete the archive after extraction"), remoteBox);
    m_removeArchiveCheck->setChecked(true);

    remoteGrid->addWidget(new QLabel(tr("Remote path:"), remoteBox), 0, 0);
    remoteGrid->addWidget(m_remotePathEdit, 0, 1);
    remoteGrid->addWidget(m_extractCheck, 1, 1);
    remoteGrid->addWidget(m_removeArchiveCheck, 2, 1);

    // ============================
    // Run + log
    // ============================
    auto *runRow = new QHBoxLayout();
    m_startBtn  = new QPushButton(tr("Start transfer"), central);
    m_cancelBtn = new QPushButton(tr("Cancel"), central);
    m_progress  = new QProgressBar(central);
    m_progress->setRange(0, 100);
    m_progress->setValue(0);
    runRow->addWidget(m_startBtn);
    runRow->addWidget(m_cancelBtn);
    runRow->addWidget(m_progress, 1);

    m_log = new QPlainTextEdit(central);
    m_log->setReadOnly(true);
    m_log->setMaximumBlockCount(5000);
    m_log->setFont(QFontDatabase::systemFont(QFontDatabase::FixedFont));

    outer->addWidget(profileBar);
    outer->addWidget(connBox);
    outer->addWidget(filesBox, 1);
    outer->addWidget(remoteBox);
    outer->addLayout(runRow);
    outer->addWidget(m_log, 1);

    // ============================
    // Wiring
    // ============================
    connect(m_profileCombo, qOverload<int>(&QComboBox::currentIndexChanged),
            this, &TransferWindow::onProfileChanged);
    connect(m_saveProfileBtn, &QPushButton::clicked, this, &TransferWindow::onSaveProfile);
    connect(m_deleteProfileBtn, &QPushButton::clicked, this, &TransferWindow::onDeleteProfile);
    connect(m_testBtn, &QPushButton::clicked, this, &TransferWindow::onTestConnection);

    connect(m_passwordRadio, &QRadioButton::toggled, this, &TransferWindow::onAuthMethodChanged);
    connect(m_browseKeyBtn, &QPushButton::clicked, this, &TransferWindow::onBrowseKeyFile);

    connect(addFilesBtn, &QPushButton::clicked, this, &TransferWindow::onAddFiles);
    connect(addFolderBtn, &QPushButton::clicked, this, &TransferWindow::onAddFolder);
    connect(removeBtn, &QPushButton::clicked, this, &TransferWindow::onRemoveSelected);
    connect(clearBtn, &QPushButton::clicked, this, &TransferWindow::onClearFiles);

    connect(m_extractCheck, &QCheckBox::toggled, m_removeArchiveCheck, &QCheckBox::setEnabled);

    connect(m_startBtn, &QPushButton::clicked, this, &TransferWindow::onStartTransfer);
    connect(m_cancelBtn, &QPushButton::clicked, this, &TransferWindow::onCancelTransfer);
}

void TransferWindow::setupMenus()
{
    QMenu *fileMenu = menuBar()->addMenu(tr("&File"));

    QAction *importAct = fileMenu->addAction(tr("Import profiles…"));
    QAction *exportAct = fileMenu->addAction(tr("Export profiles…"));
    fileMenu->addSeparator();
    QAction *logAct = fileMenu->addAction(tr("Open log file"));
    fileMenu->addSeparator();
    QAction *quitAct = fileMenu->addAction(tr("Quit"));

    connect(importAct, &QAction::triggered, this, &TransferWindow::onImportProfiles);
    connect(exportAct, &QAction::triggered, this, &TransferWindow::onExportProfiles);
    connect(logAct, &QAction::triggered, this, &TransferWindow::onOpenLogFile);
    connect(quitAct, &QAction::triggered, this, &QWidget::close);
}

// =====================================================
// Profiles
// =====================================================

void TransferWindow::reloadProfileCombo(const QString& select)
{
    QSignalBlocker block(m_profileCombo);

    m_profileCombo->clear();
    m_profileCombo->addItem(tr("(no profile)"));
    m_profileCombo->addItems(m_profiles->names());

    const int idx = select.isEmpty() ? 0 : m_profileCombo->findText(select);
    m_profileCombo->setCurrentIndex(idx < 0 ? 0 : idx);

    if (m_profileCombo->currentIndex() > 0)
        onProfileChanged(m_profileCombo->currentIndex());
    else
        m_deleteProfileBtn->setEnabled(false);
}

void TransferWindow::onProfileChanged(int index)
{
    m_deleteProfileBtn->setEnabled(index > 0);
    if (index <= 0)
        return;

    const QString name = m_profileCombo->itemText(index);

    ConnectionProfile p;
    if (!m_profiles->profile(name, &p)) {
        appendLog(tr("[WARN] Profile '%1' no longer exists.").arg(name));
        return;
    }

    m_hostEdit->setText(p.host);
    m_portSpin->setValue(p.port);
    m_userEdit->setText(p.username);
    m_remotePathEdit->setText(p.remotePath);
    m_extractCheck->setChecked(p.extract);
    m_removeArchiveCheck->setChecked(p.removeArchiveAfterExtract);

    if (p.authMethod == AuthMethod::PrivateKey) {
        m_keyRadio->setChecked(true);
        m_keyFileEdit->setText(p.keyFile);
        m_passwordEdit->clear();
    } else {
        m_passwordRadio->setChecked(true);
        m_passwordEdit->setText(p.password);
        m_keyFileEdit->clear();
    }
    m_passphraseEdit->clear();

    AppSettings::setLastProfile(name);
    appendLog(tr("Loaded profile: %1").arg(name));
}

void TransferWindow::onSaveProfile()
{
    const QString suggested = m_profileCombo->currentIndex() > 0
                                  ? m_profileCombo->currentText()
                                  : QString("%1@%2").arg(m_userEdit->text().trimmed(),
                                                         m_hostEdit->text().trimmed());

    bool ok = false;
    const QString name = QInputDialog::getText(this, tr("Save profile"), tr("Profile name:"),
                                               QLineEdit::Normal, suggested, &ok).trimmed();
    if (!ok || name.isEmpty())
        return;

    if (m_profiles->contains(name) && name != m_profileCombo->currentText()) {
        const auto ret = QMessageBox::question(this, tr("Save profile"),
                                               tr("Profile '%1' already exists. Replace it?").arg(name));
        if (ret != QMessageBox::Yes)
            return;
    }

    ConnectionProfile p;
    p.name       = name;
    p.host       = m_hostEdit->text().trimmed();
    p.port       = m_portSpin->value();
    p.username   = m_userEdit->text().trimmed();
    p.authMethod = m_keyRadio->isChecked() ? AuthMethod::PrivateKey : AuthMethod::Password;
    if (p.authMethod == AuthMethod::Password)
        p.password = m_passwordEdit->text();
    else
        p.keyFile = m_keyFileEdit->text().trimmed();
    p.remotePath = m_remotePathEdit->text().trimmed();
    p.extract    = m_extractCheck->isChecked();
    p.removeArchiveAfterExtract = m_removeArchiveCheck->isChecked();

    QString err;
    if (!m_profiles->saveProfile(p, &err)) {
        QMessageBox::warning(this, tr("Save profile"), err);
        return;
    }

    reloadProfileCombo(name);
    appendLog(tr("Profile '%1' saved.").arg(name));
}

void TransferWindow::onDeleteProfile()
{
    const int idx = m_profileCombo->currentIndex();
    if (idx <= 0)
        return;

    const QString name = m_profileCombo->currentText();
    const auto ret = QMessageBox::question(this, tr("Delete profile"),
                                           tr("Delete profile '%1'?").arg(name));
    if (ret != QMessageBox::Yes)
        return;

    QString err;
    if (!m_profiles->deleteProfile(name, &err)) {
        QMessageBox::warning(this, tr("Delete profile"), err);
        return;
    }

    if (AppSettings::lastProfile() == name)
        AppSettings::setLastProfile(QString());

    reloadProfileCombo();
    appendLog(tr("Profile '%1' deleted.").arg(name));
}

void TransferWindow::onImportProfiles()
{
    const QString path = QFileDialog::getOpenFileName(this, tr("Import profiles"), QDir::homePath(),
                                                      tr("Profiles (*.json);;All files (*)"));
    if (path.isEmpty())
        return;

    int count = 0;
    QString err;
    if (!m_profiles->importProfiles(path, &count, &err)) {
        QMessageBox::warning(this, tr("Import profiles"), err);
        return;
    }

    reloadProfileCombo(m_profileCombo->currentText());
    appendLog(tr("Imported %1 profile(s) from %2").arg(count).arg(path));
}

void TransferWindow::onExportProfiles()
{
    const QString path = QFileDialog::getSaveFileName(this, tr("Export profiles"),
                                                      QDir::home().filePath("packdrop-profiles.json"),
                                                      tr("Profiles (*.json)"));
    if (path.isEmpty())
        return;

    QString err;
    if (!m_profiles->exportProfiles(path, &err)) {
        QMessageBox::warning(this, tr("Export profiles"), err);
        return;
    }

    appendLog(tr("Exported profiles to %1 (passwords are not exported)").arg(path));
}

void TransferWindow::onTestConnection()
{
    if (m_testRunning)
        return;

    const TransferRequest req = requestFromForm();

    QString verr;
    TransferRequest probe = req;
    // Only the connection half matters here.
    if (probe.sources.isEmpty()) probe.sources << QDir::homePath();
    if (probe.remoteDir.trimmed().isEmpty()) probe.remoteDir = "~";
    if (!probe.validate(&verr)) {
        QMessageBox::warning(this, tr("Test connection"), verr);
        return;
    }

    struct TestResult {
        bool ok = false;
        TransferError err;
    };

    m_testRunning = true;
    m_testBtn->setEnabled(false);
    appendLog(tr("Testing connection to %1…").arg(req.target()));

    auto *watcher = new QFutureWatcher<TestResult>(this);

    connect(watcher, &QFutureWatcherBase::finished, this, [this, watcher]() {
        const TestResult r = watcher->result();
        watcher->deleteLater();

        m_testRunning = false;
        m_testBtn->setEnabled(true);

        if (r.ok) {
            appendLog(tr("Connection OK."));
            QMessageBox::information(this, tr("Test connection"), tr("Connection successful."));
        } else {
            appendLog(tr("Connection failed (%1): %2")
                          .arg(errorKindToString(r.err.kind), r.err.message));
            QMessageBox::warning(this, tr("Test connection"), r.err.message);
        }
    });

    const TransferSettings settings = m_settings;
    watcher->setFuture(QtConcurrent::run([req, settings]() -> TestResult {
        TestResult r;
        r.ok = SshSession::testConnection(req, settings, &r.err);
        return r;
    }));
}

// =====================================================
// Connection form
// =====================================================

void TransferWindow::onAuthMethodChanged()
{
    const bool pw = m_passwordRadio->isChecked();
    m_passwordEdit->setEnabled(pw);
    m_keyFileEdit->setEnabled(!pw);
    m_browseKeyBtn->setEnabled(!pw);
    m_passphraseEdit->setEnabled(!pw);
}

void TransferWindow::onBrowseKeyFile()
{
    const QString start = QDir::home().filePath(".ssh");
    const QString path = QFileDialog::getOpenFileName(this, tr("Select private key"), start,
                                                      tr("All files (*)"));
    if (!path.isEmpty())
        m_keyFileEdit->setText(path);
}

TransferRequest TransferWindow::requestFromForm() const
{
    TransferRequest r;
    r.host     = m_hostEdit->text().trimmed();
    r.port     = m_portSpin->value();
    r.username = m_userEdit->text().trimmed();

    if (m_keyRadio->isChecked()) {
        r.credential.method     = AuthMethod::PrivateKey;
        r.credential.keyFile    = m_keyFileEdit->text().trimmed();
        r.credential.passphrase = m_passphraseEdit->text();
    } else {
        r.credential.method   = AuthMethod::Password;
        r.credential.password = m_passwordEdit->text();
    }

    r.sources   = m_sources;
    r.remoteDir = m_remotePathEdit->text().trimmed();
    r.extract   = m_extractCheck->isChecked();
    r.removeArchiveAfterExtract = m_removeArchiveCheck->isChecked();
    return r;
}

// =====================================================
// File list
// =====================================================

void TransferWindow::addSource(const QString& path)
{
    const QString clean = QDir::cleanPath(path);
    if (clean.isEmpty() || m_sources.contains(clean))
        return;

    m_sources << clean;

    const QFileInfo fi(clean);
    auto *item = new QListWidgetItem(
        fi.isDir() ? tr("[DIR] %1").arg(fi.fileName()) : fi.fileName(), m_fileList);
    item->setData(Qt::UserRole, clean);
    item->setToolTip(clean);
}

void TransferWindow::onAddFiles()
{
    const QStringList files = QFileDialog::getOpenFileNames(this, tr("Select files to transfer"));
    for (const QString& f : files)
        addSource(f);
    updateFileInfo();
}

void TransferWindow::onAddFolder()
{
    const QString dir = QFileDialog::getExistingDirectory(this, tr("Select folder to transfer"));
    if (!dir.isEmpty())
        addSource(dir);
    updateFileInfo();
}

void TransferWindow::onRemoveSelected()
{
    const auto selected = m_fileList->selectedItems();
    if (selected.isEmpty()) {
        QMessageBox::information(this, tr("Remove"), tr("Please select files to remove."));
        return;
    }

    for (QListWidgetItem* item : selected) {
        m_sources.removeAll(item->data(Qt::UserRole).toString());
        delete item;
    }
    updateFileInfo();
}

void TransferWindow::onClearFiles()
{
    m_sources.clear();
    m_fileList->clear();
    updateFileInfo();
}

void TransferWindow::updateFileInfo()
{
    if (m_sources.isEmpty()) {
        m_fileInfoLabel->setText(tr("No files selected"));
        return;
    }

    quint64 total = 0;
    for (const QString& p : m_sources)
        total += localSize(p);

    m_fileInfoLabel->setText(tr("%n item(s) selected • %1", nullptr, m_sources.size())
                                 .arg(prettySize(total)));
}

// =====================================================
// Transfer
// =====================================================

void TransferWindow::setBusy(bool busy)
{
    m_startBtn->setEnabled(!busy);
    m_cancelBtn->setEnabled(busy);
    m_progress->setVisible(busy);
}

void TransferWindow::onStartTransfer()
{
    const TransferRequest req = requestFromForm();

    QString err;
    if (!req.validate(&err)) {
        QMessageBox::warning(this, tr("Validation error"), err);
        return;
    }

    m_log->clear();
    m_progress->setRange(0, 100);
    m_progress->setValue(0);
    setBusy(true);

    m_currentId = m_queue->enqueue(req);
}

void TransferWindow::onCancelTransfer()
{
    if (m_currentId.isEmpty())
        return;

    if (m_queue->cancel(m_currentId)) {
        m_cancelBtn->setEnabled(false);
        appendLog(tr("Cancelling… the current step will finish first."));
    }
}

void TransferWindow::onTransferStatus(const TransferStatus& s)
{
    if (s.transferId != m_currentId)
        return;

    switch (s.kind) {
        case TransferStatus::Kind::Started:
            appendLog(tr("Starting file transfer to %1").arg(s.message));
            break;
        case TransferStatus::Kind::Archiving:
            m_progress->setRange(0, 0);
            appendLog(s.message);
            break;
        case TransferStatus::Kind::Connecting:
            appendLog(s.message);
            break;
        case TransferStatus::Kind::Uploading:
            m_progress->setRange(0, 100);
            if (s.bytesTotal > 0)
                m_progress->setValue(int((s.bytesDone * 100) / s.bytesTotal));
            else
                m_progress->setValue(100);
            if (s.bytesDone == 0)
                appendLog(tr("Uploading %1…").arg(prettySize(s.bytesTotal)));
            break;
        case TransferStatus::Kind::Extracting:
            m_progress->setRange(0, 0);
            appendLog(s.message);
            break;
        case TransferStatus::Kind::Completed:
            m_progress->setRange(0, 100);
            m_progress->setValue(100);
            appendLog(s.message);
            break;
        case TransferStatus::Kind::Failed:
            appendLog(tr("Error (%1): %2").arg(errorKindToString(s.errorKind), s.message));
            break;
    }
}

void TransferWindow::onTransferFinished(const QString& transferId, const TransferStatus& terminal)
{
    if (transferId != m_currentId)
        return;

    m_currentId.clear();
    setBusy(false);

    if (terminal.kind == TransferStatus::Kind::Completed) {
        QMessageBox::information(this, tr("Success"), tr("File transfer completed successfully!"));
    } else if (terminal.errorKind == TransferErrorKind::Canceled) {
        QMessageBox::information(this, tr("Transfer"), terminal.message);
    } else {
        QMessageBox::critical(this, tr("Transfer error"), tr("Transfer failed: %1").arg(terminal.message));
    }
}

// =====================================================
// Misc
// =====================================================

void TransferWindow::appendLog(const QString& line)
{
    const QString ts = QDateTime::currentDateTime().toString("HH:mm:ss");
    m_log->appendPlainText(QString("[%1] %2").arg(ts, line));
}

void TransferWindow::onOpenLogFile()
{
    const QString path = Logger::logFilePath();
    if (path.isEmpty() || !QFileInfo::exists(path)) {
        QMessageBox::information(this, tr("Log file"), tr("No log file is open."));
        return;
    }
    QDesktopServices::openUrl(QUrl::fromLocalFile(path));
}

void TransferWindow::closeEvent(QCloseEvent* e)
{
    if (m_queue->isBusy()) {
        const auto ret = QMessageBox::question(
            this, tr("Quit"),
            tr("A transfer is still running. Cancel it and quit?\n"
               "The current step has to finish before the window closes."));
        if (ret != QMessageBox::Yes) {
            e->ignore();
            return;
        }
        m_queue->cancelAll();
    }
    e->accept();
}
