#ifndef TRANSFERWINDOW_H
#define TRANSFERWINDOW_H

#include <QMainWindow>
#include <QString>
#include <QStringList>

#include "AppSettings.h"
#include "TransferRequest.h"
#include "TransferStatus.h"

// Forward declarations (Qt / app)
class QCheckBox;
class QComboBox;
class QLabel;
class QLineEdit;
class QListWidget;
class QPlainTextEdit;
class QProgressBar;
class QPushButton;
class QRadioButton;
class QSpinBox;

class ProfileStore;
class TransferQueue;

// Single-window front end. Collects a TransferRequest, hands it to the
// TransferQueue and renders the statuses it gets back. No SSH here.
class TransferWindow : public QMainWindow
{
    Q_OBJECT

public:
    TransferWindow(ProfileStore* profiles,
                   TransferQueue* queue,
                   const TransferSettings& settings,
                   QWidget* parent = nullptr);
    ~TransferWindow() override;

private slots:
    void onProfileChanged(int index);
    void onSaveProfile();
    void onDeleteProfile();
    void onImportProfiles();
    void onExportProfiles();
    void onTestConnection();

    void onAuthMethodChanged();
    void onBrowseKeyFile();

    void onAddFiles();
    void onAddFolder();
    void onRemoveSelected();
    void onClearFiles();

    void onStartTransfer();
    void onCancelTransfer();

    void onTransferStatus(const TransferStatus& status);
    void onTransferFinished(const QString& transferId, const TransferStatus& terminal);

    void onOpenLogFile();

protected:
    void closeEvent(QCloseEvent* e) override;

private:
    void setupUi();
    void setupMenus();

    void reloadProfileCombo(const QString& select = QString());

    // Form -> request (sources included). Never validates.
    TransferRequest requestFromForm() const;

    void addSource(const QString& path);
    void updateFileInfo();
    void setBusy(bool busy);

    void appendLog(const QString& line);

    ProfileStore*  m_profiles = nullptr;
    TransferQueue* m_queue    = nullptr;
    TransferSettings m_settings;

    QStringList m_sources;
    QString     m_currentId;
    bool        m_testRunning = false;

    // Profile bar
    QComboBox*   m_profileCombo   = nullptr;
    QPushButton* m_saveProfileBtn = nullptr;
    QPushButton* m_deleteProfileBtn = nullptr;
    QPushButton* m_testBtn        = nullptr;

    // Connection
    QLineEdit*    m_hostEdit     = nullptr;
    QSpinBox*     m_portSpin     = nullptr;
    QLineEdit*    m_userEdit     = nullptr;
    QRadioButton* m_passwordRadio = nullptr;
    QRadioButton* m_keyRadio     = nullptr;
    QLineEdit*    m_passwordEdit = nullptr;
    QLineEdit*    m_keyFileEdit  = nullptr;
    QPushButton*  m_browseKeyBtn = nullptr;
    QLineEdit*    m_passphraseEdit = nullptr;

    // Files
    QListWidget* m_fileList     = nullptr;
    QLabel*      m_fileInfoLabel = nullptr;

    // Remote
    QLineEdit* m_remotePathEdit = nullptr;
    QCheckBox* m_extractCheck   = nullptr;
    QCheckBox* m_removeArchiveCheck = nullptr;

    // Run
    QPushButton*    m_startBtn  = nullptr;
    QPushButton*    m_cancelBtn = nullptr;
    QProgressBar*   m_progress  = nullptr;
    QPlainTextEdit* m_log       = nullptr;
};

#endif // TRANSFERWINDOW_H
