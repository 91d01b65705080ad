#include <QApplication>
#include <QCommandLineParser>
#include <QFileInfo>
#include "mainwindow.h"
#include "services/uploadintake.h"
#include "services/uploadsettings.h"
#include "utils/logging.h"
#include "version.h"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    app.setApplicationName("hfsupload");
    app.setApplicationVersion(HFSUPLOAD_VERSION);
    app.setOrganizationName("hfsupload");
    app.setOrganizationDomain("example.com");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription("Resumable file uploader for HTTP file servers");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption verboseOption(
        QStringList() << "V" << "verbose",
        "Enable verbose logging output");
    parser.addOption(verboseOption);

    QCommandLineOption serverOption(
        QStringList() << "server",
        "Server base URL", "url");
    parser.addOption(serverOption);

    QCommandLineOption destinationOption(
        QStringList() << "destination",
        "Destination folder on the server", "path");
    parser.addOption(destinationOption);

    parser.addPositionalArgument("files", "Files or folders to prepare for upload", "[files...]");

    parser.process(app);

    hfsupload::verboseLogging = parser.isSet(verboseOption);

    if (hfsupload::verboseLogging) {
        qDebug() << "Verbose logging enabled";
    }

    UploadSettings settings;
    settings.load();
    if (parser.isSet(serverOption)) {
        settings.setServerUrl(parser.value(serverOption));
    }
    if (parser.isSet(destinationOption)) {
        settings.setLastDestination(parser.value(destinationOption));
    }
    settings.save();

    MainWindow window(settings);

    QStringList files;
    const QStringList positional = parser.positionalArguments();
    for (const QString &path : positional) {
        QFileInfo info(path);
        if (info.isDir()) {
            window.intake()->addFolder(path);
        } else if (info.isFile()) {
            files << path;
        } else {
            qWarning() << "Ignoring missing path:" << path;
        }
    }
    if (!files.isEmpty()) {
        window.intake()->addFiles(files);
    }

    window.show();

    return app.exec();
}
