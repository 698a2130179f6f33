#include "consoleprompter.h"
#include "transferstatistics.h"
#include "interruptguard.h"
#include <QtNumeric>
#include <QDebug>
#include <limits>

ConsolePrompter::ConsolePrompter(QTextStream &input, QTextStream &output, QObject *parent)
    : QObject(parent)
    , in(input)
    , out(output)
    , progressLineOpen(false)
{
}

void ConsolePrompter::attach(BackupEngine *engine)
{
    connect(engine, &BackupEngine::deviceProbed, this, &ConsolePrompter::onDeviceProbed);
    connect(engine, &BackupEngine::statusMessage, this, &ConsolePrompter::onStatusMessage);
    connect(engine, &BackupEngine::transferStarted, this, &ConsolePrompter::onTransferStarted);
    connect(engine, &BackupEngine::progressUpdated, this, &ConsolePrompter::onProgressUpdated);
    connect(engine, &BackupEngine::entrySkipped, this, &ConsolePrompter::onEntrySkipped);
}

QString ConsolePrompter::ask(const QString &question)
{
    endProgressLine();
    out << question << " " << Qt::flush;

    QString answer = in.readLine();
    if (answer.isNull() || InterruptGuard::isInterrupted()) {
        out << "\n" << Qt::flush;
        return QString();
    }
    return answer.trimmed();
}

bool ConsolePrompter::askYesNo(const QString &question)
{
    while (true) {
        QString answer = ask(question + " (s/n):");
        if (answer.isNull()) return false;

        QString lower = answer.toLower();
        if (lower == "s" || lower == "si" || lower == "sí" || lower == "y" || lower == "yes") return true;
        if (lower == "n" || lower == "no") return false;
        out << "Respuesta no válida.\n";
    }
}

int ConsolePrompter::askChoice(const QString &question, int max, int defaultChoice)
{
    while (true) {
        QString answer = ask(question);
        if (answer.isNull()) return 0;
        if (answer.isEmpty() && defaultChoice > 0) return defaultChoice;

        bool ok = false;
        int value = answer.toInt(&ok);
        if (ok && value >= 1 && value <= max) return value;
        out << QString("Introduzca un número entre 1 y %1.\n").arg(max);
    }
}

int ConsolePrompter::chooseDevice(const QList<DeviceInfo> &devices)
{
    out << "Se encontraron varios dispositivos:\n";
    for (int i = 0; i < devices.size(); ++i) {
        out << QString("  %1. %2 (%3)\n").arg(i + 1).arg(devices.at(i).serialNumber, devices.at(i).state);
    }
    return askChoice("Seleccione un dispositivo:", devices.size()) - 1;
}

QString ConsolePrompter::chooseDestination(const QString &defaultPath)
{
    out << "\nUbicación de la copia:\n";
    out << "  1. Ubicación por defecto: " << defaultPath << "\n";
    out << "  2. Otra ubicación\n";

    int choice = askChoice("Opción [1-2, Intro = 1]:", 2, 1);
    if (choice == 0) return QString();
    if (choice == 1) return defaultPath;

    while (true) {
        QString path = ask("Ruta de destino:");
        if (path.isNull()) return QString();
        if (!path.isEmpty()) return path;
    }
}

bool ConsolePrompter::confirmNetworkDestination(const PathValidation &validation)
{
    out << "\nAVISO: " << validation.reason << "\n";
    out << "Las unidades de red pueden ser lentas o desconectarse durante la copia.\n";
    return askYesNo("¿Continuar de todos modos?");
}

SourceScope ConsolePrompter::chooseScope(const QStringList &folders, bool *ok)
{
    *ok = false;
    out << "\nQué copiar:\n";
    out << "  1. Copia completa (" << kDeviceStorageRoot << ")\n";
    out << "  2. Copia parcial (una carpeta)\n";

    int choice = askChoice("Opción [1-2]:", 2);
    if (choice == 0) return SourceScope();
    if (choice == 1) {
        *ok = true;
        return SourceScope::fullDevice();
    }

    if (folders.isEmpty()) {
        QString name = ask("No se pudieron listar las carpetas. Nombre de la carpeta:");
        if (name.isNull() || name.isEmpty()) return SourceScope();
        *ok = true;
        return SourceScope::subfolder(name);
    }

    out << "Carpetas disponibles:\n";
    for (int i = 0; i < folders.size(); ++i) {
        out << QString("  %1. %2\n").arg(i + 1).arg(folders.at(i));
    }
    int folder = askChoice("Seleccione la carpeta:", folders.size());
    if (folder == 0) return SourceScope();

    *ok = true;
    return SourceScope::subfolder(folders.at(folder - 1));
}

qint64 ConsolePrompter::estimateSizeBytes()
{
    const double bytesPerGb = 1024.0 * 1024.0 * 1024.0;
    while (true) {
        QString answer = ask("\nTamaño estimado de los datos en GB (ver Ajustes > Almacenamiento):");
        if (answer.isNull()) return -1;

        // Límite para que la conversión a bytes no desborde qint64
        const double maxGigabytes = static_cast<double>(std::numeric_limits<qint64>::max()) / bytesPerGb;

        bool ok = false;
        double gigabytes = answer.replace(',', '.').toDouble(&ok);
        if (ok && qIsFinite(gigabytes) && gigabytes > 0 && gigabytes < maxGigabytes) {
            return static_cast<qint64>(gigabytes * bytesPerGb);
        }
        out << "Introduzca un número positivo y realista de GB.\n";
    }
}

bool ConsolePrompter::confirmDiskSpace(const DiskSpaceReport &report)
{
    out << "\nAVISO: " << CapacityChecker::verdictDescription(report) << "\n";
    return askYesNo("¿Continuar de todos modos?");
}

ConflictChoice ConsolePrompter::chooseConflictAction(const QString &path, int existingEntries)
{
    out << QString("\nEl destino %1 ya contiene %2 elementos.\n").arg(path).arg(existingEntries);
    out << "  1. Fusionar (conservar lo existente, sobrescribir si coincide el nombre)\n";
    out << "  2. Reemplazar (borrar el contenido actual)\n";
    out << "  3. Cancelar\n";

    int choice = askChoice("Opción [1-3]:", 3);
    if (choice == 1) return ConflictChoice::Merge;
    if (choice == 2) {
        QString confirm = ask("Se borrará todo el contenido. Escriba 'yes' para confirmar:");
        if (!confirm.isNull() && confirm == "yes") return ConflictChoice::Replace;
        out << "Reemplazo no confirmado.\n";
    }
    return ConflictChoice::Cancel;
}

void ConsolePrompter::printBanner(const QString &adbVersion)
{
    out << "=== Android Archiver ===\n";
    if (!adbVersion.isEmpty()) {
        out << "ADB " << adbVersion << "\n";
    }
    out << Qt::flush;
}

void ConsolePrompter::onDeviceProbed(const ProbeResult &result)
{
    if (result.status != ProbeResult::Connected) {
        out << "ERROR: " << result.message << "\n" << Qt::flush;
        return;
    }

    const DeviceInfo &device = result.device;
    out << "\nDispositivo conectado:\n";
    out << "  Serie:      " << device.serialNumber << "\n";
    out << "  Fabricante: " << device.manufacturer << "\n";
    out << "  Modelo:     " << device.model << "\n";
    out << "  Android:    " << device.androidVersion << "\n";
    out << "  Build:      " << device.buildNumber << "\n" << Qt::flush;
}

void ConsolePrompter::onStatusMessage(const QString &message)
{
    endProgressLine();
    out << message << "\n" << Qt::flush;
}

void ConsolePrompter::onTransferStarted(const QString &source, const QString &destination)
{
    out << "Iniciando copia de " << source << " a " << destination << "\n";
    out << "Pulse Ctrl+C para cancelar.\n" << Qt::flush;
}

void ConsolePrompter::onProgressUpdated(const ProgressSnapshot &snapshot)
{
    out << "\r" << TransferStatistics::progressLine(snapshot) << Qt::flush;
    progressLineOpen = true;
    if (snapshot.finished) {
        endProgressLine();
    }
}

void ConsolePrompter::onEntrySkipped(const QString &path)
{
    qDebug() << "Entrada omitida:" << path;
}

void ConsolePrompter::endProgressLine()
{
    if (progressLineOpen) {
        out << "\n" << Qt::flush;
        progressLineOpen = false;
    }
}

void ConsolePrompter::printOutcome(const BackupOutcome &outcome)
{
    endProgressLine();

    switch (outcome.result) {
    case BackupOutcome::Completed:
        out << "\nCopia completada.\n" << outcome.summary << "\n";
        break;
    case BackupOutcome::Cancelled:
        out << "\nOperación cancelada (" << failureCategoryName(outcome.category) << ")";
        if (!outcome.message.isEmpty())
            out << ": " << outcome.message;
        out << "\n";
        break;
    case BackupOutcome::Failed:
        out << "\nERROR: " << failureCategoryName(outcome.category);
        if (!outcome.message.isEmpty())
            out << ": " << outcome.message;
        out << "\n";
        break;
    }

    switch (outcome.cleanup) {
    case CleanupSupervisor::Removed:
        out << "Se eliminó la copia incompleta.\n";
        break;
    case CleanupSupervisor::Preserved:
        out << "El directorio de destino ya existía y no se ha modificado: " << outcome.session.destinationPath() << "\n";
        break;
    case CleanupSupervisor::RemovalFailed:
        out << "No se pudo eliminar la copia incompleta: " << outcome.session.destinationPath() << "\n";
        break;
    case CleanupSupervisor::NotRequired:
        break;
    }
    out << Qt::flush;
}
