#include "mainwindow.h"
#include "models/uploadqueue.h"
#include "models/uploadstate.h"
#include "services/errorhandler.h"
#include "services/hfsapiclient.h"
#include "services/httpuploadtransport.h"
#include "services/ssenotificationchannel.h"
#include "services/uploadintake.h"
#include "ui/uploadpanel.h"
#include "utils/transferformat.h"

#include <QApplication>
#include <QCloseEvent>
#include <QDebug>
#include <QInputDialog>
#include <QMenuBar>
#include <QMessageBox>
#include <QStatusBar>
#include <QUrl>

MainWindow::MainWindow(const UploadSettings &settings, QWidget *parent)
    : QMainWindow(parent)
    , settings_(settings)
{
    state_ = new UploadState(this);
    transport_ = new HttpUploadTransport(this);
    channel_ = new SseNotificationChannel(this);
    queue_ = new UploadQueue(state_, transport_, channel_, this);
    intake_ = new UploadIntake(state_, this);
    api_ = new HfsApiClient(this);
    errorHandler_ = new ErrorHandler(this, this);

    applyServerUrl(settings_.serverUrl());
    queue_->setSkipExisting(settings_.skipExisting());

    setupUi();
    setupMenus();
    setupConnections();

    panel_->setDestination(settings_.lastDestination());
    updateWindowTitle();
    resize(800, 600);
}

MainWindow::~MainWindow()
{
    // The panel talks to the queue from its destructor
    delete panel_;
    panel_ = nullptr;
}

void MainWindow::setupUi()
{
    panel_ = new UploadPanel(queue_, intake_, api_, this);
    setCentralWidget(panel_);

    serverLabel_ = new QLabel();
    statusBar()->addPermanentWidget(serverLabel_);
    statusBar()->showMessage(tr("Ready"));
}

void MainWindow::setupMenus()
{
    QMenu *fileMenu = menuBar()->addMenu(tr("&File"));

    QAction *serverAction = fileMenu->addAction(tr("&Server..."));
    connect(serverAction, &QAction::triggered, this, &MainWindow::onServerChanged);

    QAction *refreshAction = fileMenu->addAction(tr("&Refresh"));
    refreshAction->setShortcut(QKeySequence::Refresh);
    connect(refreshAction, &QAction::triggered, panel_, &UploadPanel::refreshListing);

    fileMenu->addSeparator();

    QAction *quitAction = fileMenu->addAction(tr("&Quit"));
    quitAction->setShortcut(QKeySequence::Quit);
    connect(quitAction, &QAction::triggered, this, &QWidget::close);
}

void MainWindow::setupConnections()
{
    connect(errorHandler_, &ErrorHandler::statusMessage, this, &MainWindow::onStatusMessage);
    connect(panel_, &UploadPanel::statusMessage, this, &MainWindow::onStatusMessage);

    connect(intake_, &UploadIntake::filesRejected,
            errorHandler_, &ErrorHandler::handleFilesRejected);
    connect(queue_, &UploadQueue::filesRejected,
            errorHandler_, &ErrorHandler::handleFilesRejected);
    connect(queue_, &UploadQueue::uploadFailed,
            errorHandler_, &ErrorHandler::handleUploadFailed);
    connect(queue_, &UploadQueue::uploadConcluded, this, &MainWindow::onUploadConcluded);
    connect(queue_, &UploadQueue::transferStarted, this, &MainWindow::updateWindowTitle);
    connect(queue_, &UploadQueue::queueDrained, this, &MainWindow::updateWindowTitle);

    connect(api_, &HfsApiClient::connectionError,
            errorHandler_, &ErrorHandler::handleConnectionError);
    connect(api_, &HfsApiClient::folderExists,
            errorHandler_, &ErrorHandler::handleFolderExists);
    connect(api_, &HfsApiClient::operationFailed,
            errorHandler_, &ErrorHandler::handleOperationFailed);

    connect(state_, &UploadState::skipExistingChanged, this, [this](bool skip) {
        settings_.setSkipExisting(skip);
        settings_.save();
    });
    connect(panel_, &UploadPanel::destinationChanged, this, [this](const QString &destination) {
        settings_.setLastDestination(destination);
        settings_.save();
    });
}

void MainWindow::applyServerUrl(const QString &url)
{
    api_->setBaseUrl(url);
    QUrl baseUrl(api_->baseUrl());
    transport_->setBaseUrl(baseUrl);
    channel_->setBaseUrl(baseUrl);
    settings_.setServerUrl(api_->baseUrl());
    if (serverLabel_) {
        serverLabel_->setText(api_->baseUrl());
    }
}

void MainWindow::onServerChanged()
{
    if (queue_->hasPendingUploads()) {
        QMessageBox::information(this, tr("Server"),
                                 tr("Wait for the current uploads to finish before changing server."));
        return;
    }

    bool ok = false;
    QString url = QInputDialog::getText(this, tr("Server"), tr("Server address:"),
                                        QLineEdit::Normal, settings_.serverUrl(), &ok);
    if (!ok || url.trimmed().isEmpty()) {
        return;
    }

    applyServerUrl(url.trimmed());
    settings_.save();
    panel_->refreshListing();
}

void MainWindow::onStatusMessage(const QString &message, int timeout)
{
    statusBar()->showMessage(message, timeout);
}

void MainWindow::onUploadConcluded(const UploadSummary &summary)
{
    if (!summary.isEmpty()) {
        QString text = tr("%n file(s) uploaded, %1", nullptr, summary.doneCount)
            .arg(TransferFormat::bytes(summary.doneBytes));
        if (summary.errorCount > 0) {
            text += QStringLiteral("\n") + tr("%n error(s)", nullptr, summary.errorCount);
        }
        QMessageBox::information(this, tr("Upload completed"), text);
    }
    queue_->acknowledgeSummary();
}

void MainWindow::updateWindowTitle()
{
    QString title = QApplication::applicationName();
    if (state_->hasActive()) {
        title = tr("%1 - uploading %2").arg(title, state_->active()->fileName());
    }
    setWindowTitle(title);
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    if (queue_->hasPendingUploads()) {
        auto answer = QMessageBox::question(this, tr("Uploads in progress"),
                                            tr("Some files are still being uploaded. Quit anyway?"),
                                            QMessageBox::Yes | QMessageBox::No, QMessageBox::No);
        if (answer != QMessageBox::Yes) {
            event->ignore();
            return;
        }
        qDebug() << "MainWindow: Quitting with" << state_->queuedItemCount() << "files pending";
        queue_->clear();
    }

    settings_.save();
    event->accept();
}
