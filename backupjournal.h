#ifndef BACKUPJOURNAL_H
#define BACKUPJOURNAL_H

#include <QString>
#include "transfersession.h"

/**
 * @brief Ficheros de registro que se dejan en el directorio destino
 *
 * backup_errors.log recoge, con marca de hora, las líneas de adb que hablan
 * de permisos denegados o errores. backup_completed.txt solo se escribe
 * cuando la sesión termina Completed.
 */
class BackupJournal
{
public:
    static const char kErrorLogName[];
    static const char kCompletionMarkerName[];

    explicit BackupJournal(const QString &destinationPath);

    // true si la línea merece quedar en el registro de errores
    static bool isJournalLine(const QString &line);
    static bool isJournalFile(const QString &fileName);

    bool appendError(const QString &line);
    int errorCount() const { return m_errorCount; }

    bool writeCompletionMarker(const TransferSession &session, const QString &deviceSerial,
                               qint64 elapsedMs) const;

    QString errorLogPath() const;
    QString completionMarkerPath() const;

private:
    QString m_destinationPath;
    int m_errorCount;
};

#endif // BACKUPJOURNAL_H
