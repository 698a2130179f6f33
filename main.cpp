#include "archiversettings.h"
#include "backupengine.h"
#include "consoleprompter.h"
#include "devicemanager.h"
#include "interruptguard.h"
#include <QCoreApplication>
#include <QCommandLineParser>
#include <QTextStream>
#include <QDebug>
#include <cstdio>
#include <cstdlib>

static bool verboseLogging = false;

void myMessageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    if (type == QtDebugMsg && !verboseLogging)
        return;

    QByteArray localMsg = msg.toLocal8Bit();
    const char *file = context.file ? context.file : "";
    const char *function = context.function ? context.function : "";
    FILE *output = stderr;
    switch (type) {
    case QtDebugMsg:
        fprintf(output, "Debug: %s (%s:%u, %s)\n", localMsg.constData(), file, context.line, function);
        break;
    case QtInfoMsg:
        if (verboseLogging)
            fprintf(output, "Info: %s (%s:%u, %s)\n", localMsg.constData(), file, context.line, function);
        break;
    case QtWarningMsg:
        fprintf(output, "Warning: %s\n", localMsg.constData());
        break;
    case QtCriticalMsg:
        fprintf(output, "Critical: %s (%s:%u, %s)\n", localMsg.constData(), file, context.line, function);
        break;
    case QtFatalMsg:
        fprintf(output, "Fatal: %s (%s:%u, %s)\n", localMsg.constData(), file, context.line, function);
        fflush(output);
        abort();
    }
    fflush(output);
}

int main(int argc, char *argv[])
{
    qInstallMessageHandler(myMessageHandler);
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("android-archiver");
    QCoreApplication::setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Copia de seguridad del almacenamiento de un dispositivo Android mediante ADB.");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption("config", "Fichero de configuración.", "file");
    QCommandLineOption adbOption("adb", "Ruta del ejecutable adb.", "path");
    QCommandLineOption verboseOption("verbose", "Mensajes de depuración.");
    parser.addOption(configOption);
    parser.addOption(adbOption);
    parser.addOption(verboseOption);
    parser.process(app);

    verboseLogging = parser.isSet(verboseOption);
    qDebug() << "Argumentos recibidos:" << app.arguments();

    QTextStream input(stdin);
    QTextStream output(stdout);

    ArchiverSettings settings;
    if (!settings.load(parser.value(configOption))) {
        qCritical() << "No se pudo leer la configuración" << settings.configPath();
        return 1;
    }

    InterruptGuard::install();

    DeviceManager deviceManager;
    QString adbPath = parser.isSet(adbOption) ? parser.value(adbOption) : settings.adbPath();
    if (!adbPath.isEmpty() && !deviceManager.setupAdb(adbPath)) {
        qWarning() << "La ruta de adb indicada no es válida:" << adbPath;
    }

    ConsolePrompter prompter(input, output);
    prompter.printBanner(deviceManager.isAdbAvailable() ? deviceManager.bridgeVersion() : QString());

    BackupEngine engine(&deviceManager);
    engine.setSampleIntervalMs(settings.progressIntervalMs());
    prompter.attach(&engine);

    BackupOutcome outcome = engine.run(prompter, settings.backupLocation());
    prompter.printOutcome(outcome);

    qDebug() << "Finalizado con código de salida:" << outcome.exitCode();
    return outcome.exitCode();
}
