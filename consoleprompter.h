#ifndef CONSOLEPROMPTER_H
#define CONSOLEPROMPTER_H

#include <QObject>
#include <QTextStream>
#include "backupprompter.h"
#include "backupengine.h"

/**
 * @brief Interfaz de consola: preguntas al usuario y presentación del progreso
 *
 * Una línea vacía al elegir el destino acepta la ubicación por defecto.
 * Fin de entrada o Ctrl+C durante una pregunta cancelan la operación.
 */
class ConsolePrompter : public QObject, public BackupPrompter
{
    Q_OBJECT
public:
    ConsolePrompter(QTextStream &input, QTextStream &output, QObject *parent = nullptr);

    int chooseDevice(const QList<DeviceInfo> &devices) override;
    QString chooseDestination(const QString &defaultPath) override;
    bool confirmNetworkDestination(const PathValidation &validation) override;
    SourceScope chooseScope(const QStringList &folders, bool *ok) override;
    qint64 estimateSizeBytes() override;
    bool confirmDiskSpace(const DiskSpaceReport &report) override;
    ConflictChoice chooseConflictAction(const QString &path, int existingEntries) override;

    void attach(BackupEngine *engine);
    void printBanner(const QString &adbVersion);
    void printOutcome(const BackupOutcome &outcome);

public slots:
    void onDeviceProbed(const ProbeResult &result);
    void onStatusMessage(const QString &message);
    void onTransferStarted(const QString &source, const QString &destination);
    void onProgressUpdated(const ProgressSnapshot &snapshot);
    void onEntrySkipped(const QString &path);

private:
    // Devuelve una cadena nula si se terminó la entrada o hubo interrupción
    QString ask(const QString &question);
    bool askYesNo(const QString &question);
    // Número entre 1 y max, 0 si se cancela; con defaultChoice > 0 una línea vacía lo elige
    int askChoice(const QString &question, int max, int defaultChoice = 0);
    void endProgressLine();

    QTextStream &in;
    QTextStream &out;
    bool progressLineOpen;
};

#endif // CONSOLEPROMPTER_H
