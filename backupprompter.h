#ifndef BACKUPPROMPTER_H
#define BACKUPPROMPTER_H

#include <QList>
#include <QString>
#include <QStringList>
#include "devicemanager.h"
#include "pathsafetyvalidator.h"
#include "capacitychecker.h"
#include "conflictresolver.h"
#include "transfersession.h"

/**
 * @brief Decisiones que el motor necesita pedir al usuario
 *
 * La consola implementa esta interfaz; las pruebas usan respuestas fijas.
 */
class BackupPrompter
{
public:
    virtual ~BackupPrompter() {}

    // Índice del dispositivo elegido, -1 para cancelar
    virtual int chooseDevice(const QList<DeviceInfo> &devices) = 0;

    // Ruta de destino; una cadena nula cancela
    virtual QString chooseDestination(const QString &defaultPath) = 0;

    virtual bool confirmNetworkDestination(const PathValidation &validation) = 0;

    // folders puede estar vacío si no se pudo listar el almacenamiento
    virtual SourceScope chooseScope(const QStringList &folders, bool *ok) = 0;

    // Tamaño estimado en bytes, -1 para cancelar
    virtual qint64 estimateSizeBytes() = 0;

    virtual bool confirmDiskSpace(const DiskSpaceReport &report) = 0;

    virtual ConflictChoice chooseConflictAction(const QString &path, int existingEntries) = 0;
};

#endif // BACKUPPROMPTER_H
