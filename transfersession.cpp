#include "transfersession.h"
#include <QDebug>

const char kDeviceStorageRoot[] = "/sdcard";

SourceScope SourceScope::fullDevice()
{
    return SourceScope();
}

SourceScope SourceScope::subfolder(const QString &folderName)
{
    SourceScope scope;
    scope.kind = Subfolder;
    scope.folder = folderName;
    return scope;
}

QString SourceScope::devicePath() const
{
    if (kind == Subfolder && !folder.isEmpty()) {
        return QString::fromLatin1(kDeviceStorageRoot) + "/" + folder;
    }
    return QString::fromLatin1(kDeviceStorageRoot);
}

QString SourceScope::description() const
{
    if (kind == Subfolder) {
        return QString("Copia parcial (%1)").arg(devicePath());
    }
    return QString("Copia completa (%1)").arg(devicePath());
}

QString failureCauseDescription(FailureCause cause)
{
    switch (cause) {
    case FailureCause::None:
        return QString();
    case FailureCause::DeviceDisconnected:
        return "El dispositivo se desconectó durante la transferencia";
    case FailureCause::DestinationWriteError:
        return "Error de escritura en el destino (¿disco lleno o sin permisos?)";
    case FailureCause::BridgeError:
        return "Error de adb durante la transferencia";
    case FailureCause::PermissionDenied:
        return "Permiso denegado en el dispositivo";
    }
    return QString();
}

TransferSession::TransferSession()
    : m_createdDestinationDir(false),
    m_state(Pending),
    m_bytesTransferred(0),
    m_filesTransferred(0),
    m_failureCause(FailureCause::None)
{
}

TransferSession::TransferSession(const BackupTarget &target, bool createdDestinationDir)
    : m_target(target),
    m_createdDestinationDir(createdDestinationDir),
    m_state(Pending),
    m_bytesTransferred(0),
    m_filesTransferred(0),
    m_failureCause(FailureCause::None)
{
}

bool TransferSession::isTerminal() const
{
    return m_state == Completed || m_state == Failed || m_state == Cancelled;
}

bool TransferSession::markRunning()
{
    if (!transitionTo(Running))
        return false;

    m_startTime = QDateTime::currentDateTime();
    return true;
}

bool TransferSession::markCompleted()
{
    return transitionTo(Completed);
}

bool TransferSession::markFailed(FailureCause cause, const QString &message)
{
    if (!transitionTo(Failed))
        return false;

    m_failureCause = cause;
    m_failureMessage = message.isEmpty() ? failureCauseDescription(cause) : message;
    return true;
}

bool TransferSession::markCancelled()
{
    return transitionTo(Cancelled);
}

void TransferSession::setBytesTransferred(qint64 bytes)
{
    m_bytesTransferred = qMax<qint64>(0, bytes);
}

void TransferSession::setFilesTransferred(int files)
{
    m_filesTransferred = qMax(0, files);
}

void TransferSession::recordSkippedEntry(const QString &path)
{
    m_skippedPaths.append(path);
}

bool TransferSession::transitionTo(State next)
{
    bool allowed = false;

    switch (m_state) {
    case Pending:
        // Completed solo es alcanzable pasando por Running
        allowed = (next == Running || next == Failed || next == Cancelled);
        break;
    case Running:
        allowed = (next == Completed || next == Failed || next == Cancelled);
        break;
    case Completed:
    case Failed:
    case Cancelled:
        allowed = false;
        break;
    }

    if (!allowed) {
        qWarning() << "Transición de sesión no permitida:" << stateName(m_state) << "->" << stateName(next);
        return false;
    }

    qDebug() << "Sesión:" << stateName(m_state) << "->" << stateName(next);
    m_state = next;
    return true;
}

QString TransferSession::stateName(State state)
{
    switch (state) {
    case Pending:
        return "Pending";
    case Running:
        return "Running";
    case Completed:
        return "Completed";
    case Failed:
        return "Failed";
    case Cancelled:
        return "Cancelled";
    default:
        return "Unknown";
    }
}
