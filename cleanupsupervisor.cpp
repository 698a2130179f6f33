#include "cleanupsupervisor.h"
#include <QDir>
#include <QDebug>

CleanupSupervisor::Outcome CleanupSupervisor::onAbnormalExit(const TransferSession &session) const
{
    if (session.state() != TransferSession::Failed && session.state() != TransferSession::Cancelled) {
        qDebug() << "Limpieza no necesaria, estado de la sesión:" << TransferSession::stateName(session.state());
        return NotRequired;
    }

    const QString destination = session.destinationPath();

    if (!session.createdDestinationDir()) {
        qInfo() << "El directorio de copia no se limpia (puede contener archivos previos):" << destination;
        return Preserved;
    }

    QDir dir(destination);
    if (!dir.exists()) {
        return Removed;
    }

    qInfo() << "Limpiando copia interrumpida:" << destination;
    if (!dir.removeRecursively()) {
        qWarning() << "Fallo al eliminar el directorio de copia:" << destination;
        return RemovalFailed;
    }

    qInfo() << "Limpieza completada.";
    return Removed;
}
