/**
 * @file uploadpanel.h
 * @brief Main panel: destination folder, file selection, queue and progress.
 */

#ifndef UPLOADPANEL_H
#define UPLOADPANEL_H

#include <QCheckBox>
#include <QLabel>
#include <QLineEdit>
#include <QListView>
#include <QListWidget>
#include <QPointer>
#include <QPushButton>
#include <QTabWidget>
#include <QTimer>
#include <QWidget>

#include "models/pendingitem.h"
#include "services/hfsapiclient.h"

class QMessageBox;
class UploadIntake;
class UploadProgressWidget;
class UploadQueue;

/**
 * @brief Widget the user drops files on and watches uploads from.
 *
 * The "Folder" tab lists the destination and offers the pickers; the
 * "Uploads" tab holds the files being prepared, the queue and the progress
 * bar. The queue treats the Uploads tab as its transfer UI.
 */
class UploadPanel : public QWidget
{
    Q_OBJECT

public:
    UploadPanel(UploadQueue *queue, UploadIntake *intake, HfsApiClient *api,
                QWidget *parent = nullptr);
    ~UploadPanel() override;

    [[nodiscard]] QString destination() const;
    void setDestination(const QString &destination);

    void refreshListing();

signals:
    void statusMessage(const QString &message, int timeout = 0);
    void destinationChanged(const QString &destination);

protected:
    void dragEnterEvent(QDragEnterEvent *event) override;
    void dropEvent(QDropEvent *event) override;
    void showEvent(QShowEvent *event) override;
    void hideEvent(QHideEvent *event) override;

private slots:
    void onPickFiles();
    void onPickFolder();
    void onCreateFolder();
    void onSend();
    void onClearAdding();
    void onRemoveAdding();
    void onEditComment(QListWidgetItem *item);
    void onRemoveQueued();
    void onAddingChanged();
    void onFileListReceived(const QString &uri, const QList<RemoteEntry> &entries,
                            const FolderProps &props);
    void onFolderCreated(const QString &uri, const QString &name);
    void onRemoteRefreshRequested(const QString &destination);
    void onResumeConfirmationNeeded(const QString &fileName, qint64 offset,
                                    qint64 totalSize, qint64 timeoutMs);
    void onResumeConfirmationDismissed();
    void onResumeCountdown();
    void onPauseNoticeNeeded();
    void onTabChanged(int index);

private:
    void setupUi();
    void setupConnections();
    void updateTransferUiVisibility();
    void updateResumeText();
    void closeResumePrompt();

    // Dependencies (not owned)
    UploadQueue *queue_ = nullptr;
    UploadIntake *intake_ = nullptr;
    HfsApiClient *api_ = nullptr;

    // Folder tab
    QTabWidget *tabs_ = nullptr;
    QLineEdit *destinationEdit_ = nullptr;
    QPushButton *refreshButton_ = nullptr;
    QListWidget *remoteList_ = nullptr;
    QLabel *permissionLabel_ = nullptr;
    QPushButton *pickFilesButton_ = nullptr;
    QPushButton *pickFolderButton_ = nullptr;
    QPushButton *createFolderButton_ = nullptr;
    QCheckBox *skipExistingCheck_ = nullptr;

    // Uploads tab
    QWidget *uploadsTab_ = nullptr;
    QListWidget *addingList_ = nullptr;
    QLabel *addingLabel_ = nullptr;
    QPushButton *sendButton_ = nullptr;
    QPushButton *clearAddingButton_ = nullptr;
    QPushButton *removeAddingButton_ = nullptr;
    QListView *queueView_ = nullptr;
    QPushButton *removeQueuedButton_ = nullptr;
    UploadProgressWidget *progressWidget_ = nullptr;

    // Resume prompt
    QPointer<QMessageBox> resumeBox_;
    QTimer *resumeCountdown_ = nullptr;
    QString resumeFileName_;
    qint64 resumeOffset_ = 0;
    qint64 resumeTotal_ = 0;
    qint64 resumeDeadlineMs_ = 0;
    bool canUpload_ = true;
};

#endif // UPLOADPANEL_H
