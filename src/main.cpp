#include <QCoreApplication>
#include <QDateTime>
#include <QDebug>
#include <QLoggingCategory>
#include <QTextStream>

#include <cstdio>
#include <cstdlib>

#include "batchscanner.h"
#include "ignorelist.h"
#include "scanconfig.h"
#include "typodictionary.h"

// Custom message handler to add timestamps
void customMessageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    Q_UNUSED(context);
    QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
    QString formattedMsg = QString("[%1] %2").arg(timestamp, msg);

    QByteArray localMsg = formattedMsg.toLocal8Bit();
    switch (type) {
    case QtDebugMsg:
        fprintf(stderr, "%s\n", localMsg.constData());
        break;
    case QtInfoMsg:
        fprintf(stderr, "%s\n", localMsg.constData());
        break;
    case QtWarningMsg:
        fprintf(stderr, "Warning: %s\n", localMsg.constData());
        break;
    case QtCriticalMsg:
        fprintf(stderr, "Critical: %s\n", localMsg.constData());
        break;
    case QtFatalMsg:
        fprintf(stderr, "Fatal: %s\n", localMsg.constData());
        abort();
    }
}

int main(int argc, char *argv[])
{
    qInstallMessageHandler(customMessageHandler);
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("typoscan");
    QCoreApplication::setApplicationVersion(TYPOSCAN_VERSION);

    ScanConfig config;
    QString error;
    switch (ScanConfigParser::parseCommandLine(app.arguments(), &config, &error)) {
    case ScanConfigParser::Result::Error:
        fprintf(stderr, "Error: %s\n\n%s", qPrintable(error), qPrintable(ScanConfigParser::helpText()));
        return 1;
    case ScanConfigParser::Result::HelpRequested:
        fprintf(stderr, "%s", qPrintable(ScanConfigParser::helpText()));
        return 0;
    case ScanConfigParser::Result::VersionRequested:
        fprintf(stdout, "%s %s\n", qPrintable(QCoreApplication::applicationName()),
                qPrintable(QCoreApplication::applicationVersion()));
        return 0;
    case ScanConfigParser::Result::Ok:
        break;
    }

    if (!config.verbose) {
        QLoggingCategory::setFilterRules("*.debug=false");
    }
    qDebug() << "[Main] Started with" << config.paths.size() << "paths";

    // Loaded once, then shared read-only by everything that scans.
    TypoDictionary dictionary;
    if (!dictionary.loadFromFile(config.dictionaryPath, &error)) {
        qCritical().noquote() << error;
        return 1;
    }

    IgnoreList ignoreList;
    bool haveIgnoreList = false;
    if (!config.ignoreWordsFile.isEmpty()) {
        haveIgnoreList = ignoreList.loadFromFile(config.ignoreWordsFile, &error);
        if (!haveIgnoreList) {
            qWarning().noquote() << error;
        }
    }

    QTextStream out(stdout);
    BatchScanner scanner(dictionary, config, out);
    if (haveIgnoreList) {
        scanner.setIgnoreList(&ignoreList);
    }

    const int findings = scanner.run(config.paths);
    qDebug() << "[Main] Finished with" << findings << "possible typos";

    // The exit status reports how many typos were printed.
    return qMin(findings, 255);
}
