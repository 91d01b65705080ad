#include "uploadpanel.h"
#include "uploadprogresswidget.h"
#include "models/uploadqueue.h"
#include "models/uploadstate.h"
#include "services/acceptpolicy.h"
#include "services/conflictnegotiator.h"
#include "services/uploadintake.h"
#include "services/uploadsettings.h"
#include "utils/transferformat.h"

#include <QDateTime>
#include <QDebug>
#include <QDragEnterEvent>
#include <QDropEvent>
#include <QFileDialog>
#include <QHBoxLayout>
#include <QInputDialog>
#include <QMessageBox>
#include <QMimeData>
#include <QVBoxLayout>

namespace {
constexpr int RelativePathDataRole = Qt::UserRole + 1;
}

UploadPanel::UploadPanel(UploadQueue *queue, UploadIntake *intake, HfsApiClient *api,
                         QWidget *parent)
    : QWidget(parent)
    , queue_(queue)
    , intake_(intake)
    , api_(api)
{
    setAcceptDrops(true);

    resumeCountdown_ = new QTimer(this);
    resumeCountdown_->setInterval(1000);
    connect(resumeCountdown_, &QTimer::timeout, this, &UploadPanel::onResumeCountdown);

    setupUi();
    setupConnections();
    onAddingChanged();
}

UploadPanel::~UploadPanel()
{
    disconnect(queue_, nullptr, this, nullptr);
    disconnect(queue_->negotiator(), nullptr, this, nullptr);
}

void UploadPanel::setupUi()
{
    auto *layout = new QVBoxLayout(this);
    layout->setContentsMargins(4, 4, 4, 4);

    tabs_ = new QTabWidget();
    layout->addWidget(tabs_, 1);

    // Folder tab
    auto *folderTab = new QWidget();
    auto *folderLayout = new QVBoxLayout(folderTab);

    auto *pathRow = new QHBoxLayout();
    pathRow->addWidget(new QLabel(tr("Folder:")));
    destinationEdit_ = new QLineEdit(UploadSettings::DefaultDestination);
    pathRow->addWidget(destinationEdit_, 1);
    refreshButton_ = new QPushButton(tr("Refresh"));
    pathRow->addWidget(refreshButton_);
    folderLayout->addLayout(pathRow);

    remoteList_ = new QListWidget();
    folderLayout->addWidget(remoteList_, 1);

    permissionLabel_ = new QLabel(tr("No upload permission for the current folder"));
    permissionLabel_->setVisible(false);
    folderLayout->addWidget(permissionLabel_);

    auto *pickRow = new QHBoxLayout();
    pickFilesButton_ = new QPushButton(tr("Pick files"));
    pickRow->addWidget(pickFilesButton_);
    pickFolderButton_ = new QPushButton(tr("Pick folder"));
    pickRow->addWidget(pickFolderButton_);
    createFolderButton_ = new QPushButton(tr("Create folder"));
    pickRow->addWidget(createFolderButton_);
    skipExistingCheck_ = new QCheckBox(tr("Skip existing files"));
    pickRow->addWidget(skipExistingCheck_);
    pickRow->addStretch();
    folderLayout->addLayout(pickRow);

    auto *hint = new QLabel(tr("You can also drop files and folders on this window"));
    hint->setEnabled(false);
    folderLayout->addWidget(hint);

    tabs_->addTab(folderTab, tr("Folder"));

    // Uploads tab
    uploadsTab_ = new QWidget();
    auto *uploadsLayout = new QVBoxLayout(uploadsTab_);

    addingLabel_ = new QLabel();
    uploadsLayout->addWidget(addingLabel_);

    addingList_ = new QListWidget();
    addingList_->setToolTip(tr("Double-click a file to add a comment"));
    uploadsLayout->addWidget(addingList_, 1);

    auto *addingRow = new QHBoxLayout();
    sendButton_ = new QPushButton(tr("Send"));
    addingRow->addWidget(sendButton_);
    removeAddingButton_ = new QPushButton(tr("Remove"));
    addingRow->addWidget(removeAddingButton_);
    clearAddingButton_ = new QPushButton(tr("Clear"));
    addingRow->addWidget(clearAddingButton_);
    addingRow->addStretch();
    uploadsLayout->addLayout(addingRow);

    uploadsLayout->addWidget(new QLabel(tr("Queue")));
    queueView_ = new QListView();
    queueView_->setModel(queue_);
    queueView_->setSelectionMode(QAbstractItemView::SingleSelection);
    uploadsLayout->addWidget(queueView_, 1);

    auto *queueRow = new QHBoxLayout();
    removeQueuedButton_ = new QPushButton(tr("Remove from queue"));
    queueRow->addWidget(removeQueuedButton_);
    queueRow->addStretch();
    uploadsLayout->addLayout(queueRow);

    progressWidget_ = new UploadProgressWidget();
    progressWidget_->setUploadQueue(queue_);
    uploadsLayout->addWidget(progressWidget_);

    tabs_->addTab(uploadsTab_, tr("Uploads"));
}

void UploadPanel::setupConnections()
{
    connect(tabs_, &QTabWidget::currentChanged, this, &UploadPanel::onTabChanged);
    connect(refreshButton_, &QPushButton::clicked, this, &UploadPanel::refreshListing);
    connect(destinationEdit_, &QLineEdit::editingFinished, this, [this]() {
        setDestination(destinationEdit_->text());
    });

    connect(pickFilesButton_, &QPushButton::clicked, this, &UploadPanel::onPickFiles);
    connect(pickFolderButton_, &QPushButton::clicked, this, &UploadPanel::onPickFolder);
    connect(createFolderButton_, &QPushButton::clicked, this, &UploadPanel::onCreateFolder);
    connect(skipExistingCheck_, &QCheckBox::toggled, queue_, &UploadQueue::setSkipExisting);
    connect(queue_->state(), &UploadState::skipExistingChanged,
            skipExistingCheck_, &QCheckBox::setChecked);
    skipExistingCheck_->setChecked(queue_->state()->skipExisting());

    connect(sendButton_, &QPushButton::clicked, this, &UploadPanel::onSend);
    connect(clearAddingButton_, &QPushButton::clicked, this, &UploadPanel::onClearAdding);
    connect(removeAddingButton_, &QPushButton::clicked, this, &UploadPanel::onRemoveAdding);
    connect(addingList_, &QListWidget::itemDoubleClicked, this, &UploadPanel::onEditComment);
    connect(removeQueuedButton_, &QPushButton::clicked, this, &UploadPanel::onRemoveQueued);

    connect(queue_->state(), &UploadState::addingChanged, this, &UploadPanel::onAddingChanged);
    connect(queue_, &UploadQueue::remoteRefreshRequested,
            this, &UploadPanel::onRemoteRefreshRequested);
    connect(queue_, &UploadQueue::pauseNoticeNeeded, this, &UploadPanel::onPauseNoticeNeeded);
    connect(queue_, &UploadQueue::transferStarted, this,
            [this](const QString &, const QString &relativePath, qint64 resumeOffset) {
                if (resumeOffset > 0) {
                    emit statusMessage(tr("Resuming %1 from %2")
                                           .arg(relativePath, TransferFormat::bytes(resumeOffset)), 3000);
                }
            });

    connect(queue_->negotiator(), &ConflictNegotiator::resumeConfirmationNeeded,
            this, &UploadPanel::onResumeConfirmationNeeded);
    connect(queue_->negotiator(), &ConflictNegotiator::resumeConfirmationDismissed,
            this, &UploadPanel::onResumeConfirmationDismissed);

    connect(api_, &HfsApiClient::fileListReceived, this, &UploadPanel::onFileListReceived);
    connect(api_, &HfsApiClient::folderCreated, this, &UploadPanel::onFolderCreated);
}

QString UploadPanel::destination() const
{
    return UploadSettings::normalizeDestination(destinationEdit_->text());
}

void UploadPanel::setDestination(const QString &destination)
{
    QString normalized = UploadSettings::normalizeDestination(destination);
    destinationEdit_->setText(normalized);
    emit destinationChanged(normalized);
    refreshListing();
}

void UploadPanel::refreshListing()
{
    api_->getFileList(destination());
}

void UploadPanel::dragEnterEvent(QDragEnterEvent *event)
{
    if (canUpload_ && UploadIntake::canAccept(event->mimeData())) {
        event->acceptProposedAction();
    }
}

void UploadPanel::dropEvent(QDropEvent *event)
{
    int added = intake_->addFromMimeData(event->mimeData());
    event->acceptProposedAction();
    if (added > 0) {
        tabs_->setCurrentWidget(uploadsTab_);
    }
}

void UploadPanel::showEvent(QShowEvent *event)
{
    QWidget::showEvent(event);
    updateTransferUiVisibility();
}

void UploadPanel::hideEvent(QHideEvent *event)
{
    QWidget::hideEvent(event);
    updateTransferUiVisibility();
}

void UploadPanel::onTabChanged(int index)
{
    Q_UNUSED(index)
    updateTransferUiVisibility();
}

void UploadPanel::updateTransferUiVisibility()
{
    queue_->setTransferUiVisible(isVisible() && tabs_->currentWidget() == uploadsTab_);
}

void UploadPanel::onPickFiles()
{
    QStringList filters;
    const AcceptPolicy &policy = intake_->acceptPolicy();
    if (!policy.acceptsAll() && !policy.nameFilters().isEmpty()) {
        filters << tr("Accepted files (%1)").arg(policy.nameFilters().join(' '));
    }
    filters << tr("All files (*)");

    QStringList files = QFileDialog::getOpenFileNames(this, tr("Pick files"), QString(),
                                                      filters.join(QStringLiteral(";;")));
    if (files.isEmpty()) {
        return;
    }
    if (intake_->addFiles(files) > 0) {
        tabs_->setCurrentWidget(uploadsTab_);
    }
}

void UploadPanel::onPickFolder()
{
    QString dir = QFileDialog::getExistingDirectory(this, tr("Pick folder"));
    if (dir.isEmpty()) {
        return;
    }
    if (intake_->addFolder(dir) > 0) {
        tabs_->setCurrentWidget(uploadsTab_);
    }
}

void UploadPanel::onCreateFolder()
{
    bool ok = false;
    QString name = QInputDialog::getText(this, tr("Create folder"), tr("Enter folder name"),
                                         QLineEdit::Normal, QString(), &ok);
    if (!ok || name.trimmed().isEmpty()) {
        return;
    }
    api_->createFolder(destination(), name.trimmed());
}

void UploadPanel::onFolderCreated(const QString &uri, const QString &name)
{
    emit statusMessage(tr("Successfully created %1").arg(name), 3000);
    if (UploadSettings::normalizeDestination(uri) == destination()) {
        refreshListing();
    }
}

void UploadPanel::onSend()
{
    int queued = queue_->commitAdding(destination());
    if (queued > 0) {
        emit statusMessage(tr("%n file(s) queued", nullptr, queued), 3000);
    }
}

void UploadPanel::onClearAdding()
{
    intake_->clear();
}

void UploadPanel::onRemoveAdding()
{
    const QList<QListWidgetItem *> selected = addingList_->selectedItems();
    for (QListWidgetItem *item : selected) {
        intake_->remove(item->data(RelativePathDataRole).toString());
    }
}

void UploadPanel::onEditComment(QListWidgetItem *item)
{
    QString relativePath = item->data(RelativePathDataRole).toString();
    QString current;
    for (const PendingItem &pending : queue_->state()->adding()) {
        if (pending.relativePath == relativePath) {
            current = pending.comment;
            break;
        }
    }

    bool ok = false;
    QString comment = QInputDialog::getText(this, tr("Comment"), relativePath,
                                            QLineEdit::Normal, current, &ok);
    if (ok) {
        intake_->setComment(relativePath, comment);
    }
}

void UploadPanel::onRemoveQueued()
{
    QModelIndex index = queueView_->currentIndex();
    if (!index.isValid()) {
        return;
    }
    queue_->removeFromQueue(index.data(UploadQueue::DestinationRole).toString(),
                            index.data(UploadQueue::RelativePathRole).toString());
}

void UploadPanel::onAddingChanged()
{
    const QList<PendingItem> &adding = queue_->state()->adding();

    addingList_->clear();
    for (const PendingItem &pending : adding) {
        QString text = QString("%1  (%2)").arg(pending.relativePath, TransferFormat::bytes(pending.size));
        if (!pending.comment.isEmpty()) {
            text += QString("  - %1").arg(pending.comment);
        }
        auto *item = new QListWidgetItem(text, addingList_);
        item->setData(RelativePathDataRole, pending.relativePath);
    }

    addingLabel_->setText(adding.isEmpty()
        ? tr("No files selected")
        : tr("%n file(s), %1", nullptr, adding.size())
              .arg(TransferFormat::bytes(queue_->state()->addingBytes())));

    sendButton_->setEnabled(!adding.isEmpty() && canUpload_);
    clearAddingButton_->setEnabled(!adding.isEmpty());
    removeAddingButton_->setEnabled(!adding.isEmpty());
}

void UploadPanel::onFileListReceived(const QString &uri, const QList<RemoteEntry> &entries,
                                     const FolderProps &props)
{
    if (UploadSettings::normalizeDestination(uri) != destination()) {
        return;
    }

    remoteList_->clear();
    for (const RemoteEntry &entry : entries) {
        QString text = entry.size >= 0
            ? QString("%1  (%2)").arg(entry.name, TransferFormat::bytes(entry.size))
            : entry.name;
        remoteList_->addItem(text);
    }

    canUpload_ = props.canUpload;
    permissionLabel_->setVisible(!canUpload_);
    pickFilesButton_->setEnabled(canUpload_);
    pickFolderButton_->setEnabled(canUpload_);

    AcceptPolicy policy(props.accept);
    intake_->setAcceptPolicy(policy);
    queue_->setAcceptPolicy(policy);
    onAddingChanged();
}

void UploadPanel::onRemoteRefreshRequested(const QString &destination)
{
    if (UploadSettings::normalizeDestination(destination) == this->destination()) {
        refreshListing();
    }
}

void UploadPanel::onResumeConfirmationNeeded(const QString &fileName, qint64 offset,
                                             qint64 totalSize, qint64 timeoutMs)
{
    closeResumePrompt();

    resumeFileName_ = fileName;
    resumeOffset_ = offset;
    resumeTotal_ = totalSize;
    resumeDeadlineMs_ = timeoutMs > 0 ? QDateTime::currentMSecsSinceEpoch() + timeoutMs : 0;

    // Use the top-level window as parent so the prompt shows on any tab
    resumeBox_ = new QMessageBox(window());
    resumeBox_->setAttribute(Qt::WA_DeleteOnClose);
    resumeBox_->setWindowTitle(tr("Resume upload"));
    resumeBox_->setIcon(QMessageBox::Question);
    resumeBox_->setStandardButtons(QMessageBox::Yes | QMessageBox::No);
    resumeBox_->setDefaultButton(QMessageBox::Yes);
    updateResumeText();

    QMessageBox *box = resumeBox_;
    connect(box, &QMessageBox::finished, this, [this, box](int result) {
        if (resumeBox_ != box) {
            return;
        }
        resumeCountdown_->stop();
        resumeBox_ = nullptr;
        queue_->negotiator()->respondToResume(result == QMessageBox::Yes);
    });

    if (resumeDeadlineMs_ > 0) {
        resumeCountdown_->start();
    }
    resumeBox_->open();
}

void UploadPanel::updateResumeText()
{
    if (!resumeBox_) {
        return;
    }

    double fraction = resumeTotal_ > 0 ? static_cast<double>(resumeOffset_) / resumeTotal_ : 0.0;
    QString text = tr("%1 was partially uploaded before.\n\nResume from %2 (%3)?")
        .arg(resumeFileName_, TransferFormat::percent(fraction), TransferFormat::bytes(resumeOffset_));

    if (resumeDeadlineMs_ > 0) {
        qint64 left = qMax<qint64>(0, (resumeDeadlineMs_ - QDateTime::currentMSecsSinceEpoch() + 999) / 1000);
        text += QStringLiteral("\n\n") + tr("Offer expires in %1").arg(TransferFormat::duration(left));
    }
    resumeBox_->setText(text);
}

void UploadPanel::onResumeCountdown()
{
    updateResumeText();
}

void UploadPanel::onResumeConfirmationDismissed()
{
    closeResumePrompt();
}

void UploadPanel::closeResumePrompt()
{
    resumeCountdown_->stop();
    if (!resumeBox_) {
        return;
    }
    // Detach first so closing does not answer the negotiator
    QMessageBox *box = resumeBox_;
    resumeBox_ = nullptr;
    box->close();
}

void UploadPanel::onPauseNoticeNeeded()
{
    QMessageBox::information(window(), tr("Paused"),
                             tr("The queue is paused. The file being uploaded will still complete."));
}
