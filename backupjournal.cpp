#include "backupjournal.h"
#include "transferstatistics.h"
#include <QDir>
#include <QFile>
#include <QTextStream>
#include <QDateTime>
#include <QDebug>

const char BackupJournal::kErrorLogName[] = "backup_errors.log";
const char BackupJournal::kCompletionMarkerName[] = "backup_completed.txt";

BackupJournal::BackupJournal(const QString &destinationPath)
    : m_destinationPath(destinationPath)
    , m_errorCount(0)
{
}

bool BackupJournal::isJournalLine(const QString &line)
{
    QString lower = line.toLower();
    return lower.contains("permission denied")
           || lower.contains("failed")
           || lower.contains("cannot")
           || lower.contains("error");
}

bool BackupJournal::isJournalFile(const QString &fileName)
{
    return fileName == QLatin1String(kErrorLogName)
           || fileName == QLatin1String(kCompletionMarkerName);
}

QString BackupJournal::errorLogPath() const
{
    return QDir(m_destinationPath).filePath(QString::fromLatin1(kErrorLogName));
}

QString BackupJournal::completionMarkerPath() const
{
    return QDir(m_destinationPath).filePath(QString::fromLatin1(kCompletionMarkerName));
}

bool BackupJournal::appendError(const QString &line)
{
    QString trimmed = line.trimmed();
    if (trimmed.isEmpty() || !isJournalLine(trimmed))
        return false;

    // Si el destino ya no existe (p.ej. tras la limpieza) no se recrea
    if (!QDir(m_destinationPath).exists())
        return false;

    QFile file(errorLogPath());
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        qWarning() << "No se pudo abrir el registro de errores:" << file.errorString();
        return false;
    }

    QTextStream out(&file);
    out << "[" << QTime::currentTime().toString("HH:mm:ss") << "] " << trimmed << "\n";
    ++m_errorCount;
    return true;
}

bool BackupJournal::writeCompletionMarker(const TransferSession &session, const QString &deviceSerial,
                                          qint64 elapsedMs) const
{
    if (session.state() != TransferSession::Completed) {
        qWarning() << "Marcador de finalización solicitado para una sesión no completada";
        return false;
    }

    QFile file(completionMarkerPath());
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        qWarning() << "No se pudo escribir el marcador de finalización:" << file.errorString();
        return false;
    }

    QTextStream out(&file);
    out << "Backup completed: " << QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss") << "\n";
    out << "Device: " << deviceSerial << "\n";
    out << "Source: " << session.target().sourceScope.devicePath() << "\n";
    out << "Files: " << session.filesTransferred() << "\n";
    out << "Size: " << TransferStatistics::formatSize(session.bytesTransferred()) << "\n";
    out << "Elapsed: " << TransferStatistics::formatTime(elapsedMs / 1000) << "\n";
    out << "Skipped entries: " << session.skippedEntries() << "\n";
    if (session.target().sourceScope.kind == SourceScope::FullDevice) {
        out << "Note: full device storage was copied\n";
    }
    return true;
}
