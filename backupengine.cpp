#include "backupengine.h"
#include "transferdriver.h"
#include "transferstatistics.h"
#include "backupjournal.h"
#include "interruptguard.h"
#include <QElapsedTimer>
#include <QMutexLocker>
#include <QDebug>

QString failureCategoryName(FailureCategory category)
{
    switch (category) {
    case FailureCategory::None: return "Ninguno";
    case FailureCategory::BridgeUnavailable: return "ADB no disponible";
    case FailureCategory::NotConnected: return "Dispositivo no conectado";
    case FailureCategory::Unauthorized: return "Dispositivo no autorizado";
    case FailureCategory::DeviceDisconnected: return "Dispositivo desconectado";
    case FailureCategory::RejectedDestination: return "Destino rechazado";
    case FailureCategory::NetworkDrive: return "Unidad de red";
    case FailureCategory::InsufficientSpace: return "Espacio insuficiente";
    case FailureCategory::MarginalSpace: return "Espacio justo";
    case FailureCategory::UnknownSpace: return "Espacio libre desconocido";
    case FailureCategory::SourceMissing: return "Origen inexistente";
    case FailureCategory::DestinationWriteError: return "Error de escritura en destino";
    case FailureCategory::BridgeError: return "Error de ADB";
    case FailureCategory::UserCancelled: return "Cancelado por el usuario";
    case FailureCategory::Interrupted: return "Interrumpido";
    case FailureCategory::AlreadyRunning: return "Copia ya en curso";
    }
    return QString();
}

FailureCategory declinedSpaceCategory(DiskSpaceReport::Verdict verdict)
{
    switch (verdict) {
    case DiskSpaceReport::Insufficient: return FailureCategory::InsufficientSpace;
    case DiskSpaceReport::Unknown: return FailureCategory::UnknownSpace;
    case DiskSpaceReport::Marginal:
    case DiskSpaceReport::OK:
        break;
    }
    return FailureCategory::MarginalSpace;
}

int BackupOutcome::exitCode() const
{
    switch (result) {
    case Completed: return 0;
    case Cancelled: return 2;
    case Failed: break;
    }
    return 1;
}

namespace {

FailureCategory categoryForCause(FailureCause cause)
{
    switch (cause) {
    case FailureCause::DeviceDisconnected: return FailureCategory::DeviceDisconnected;
    case FailureCause::DestinationWriteError: return FailureCategory::DestinationWriteError;
    case FailureCause::BridgeError:
    case FailureCause::PermissionDenied:
    case FailureCause::None:
        break;
    }
    return FailureCategory::BridgeError;
}

FailureCategory categoryForProbe(ProbeResult::Status status)
{
    switch (status) {
    case ProbeResult::BridgeUnavailable: return FailureCategory::BridgeUnavailable;
    case ProbeResult::Unauthorized: return FailureCategory::Unauthorized;
    case ProbeResult::NotConnected:
    case ProbeResult::Connected:
        break;
    }
    return FailureCategory::NotConnected;
}

} // namespace

BackupEngine::BackupEngine(DeviceManager *deviceManager, QObject *parent)
    : QObject(parent)
    , m_deviceManager(deviceManager)
    , m_driver(new TransferDriver(deviceManager, this))
    , m_running(false)
{
    qRegisterMetaType<BackupOutcome>("BackupOutcome");
    qRegisterMetaType<ProgressSnapshot>("ProgressSnapshot");

    connect(m_driver, &TransferDriver::transferStarted, this, &BackupEngine::transferStarted);
    connect(m_driver, &TransferDriver::statusMessage, this, &BackupEngine::statusMessage);

    if (m_deviceManager) {
        connect(m_deviceManager, &DeviceManager::serverRestarting, this, [this]() {
            emit statusMessage("No se encontraron dispositivos. Reiniciando el servidor de ADB...");
        });
        connect(m_deviceManager, &DeviceManager::error, this, &BackupEngine::statusMessage);
    }
}

BackupEngine::~BackupEngine()
{
}

bool BackupEngine::isRunning() const
{
    QMutexLocker locker(&m_runMutex);
    return m_running;
}

void BackupEngine::cancel()
{
    m_driver->cancelTransfer();
}

void BackupEngine::setSampleIntervalMs(int msecs)
{
    m_driver->setSampleIntervalMs(msecs);
}

bool BackupEngine::interrupted() const
{
    return InterruptGuard::isInterrupted();
}

BackupOutcome BackupEngine::run(BackupPrompter &prompter, const QString &defaultDestination)
{
    {
        QMutexLocker locker(&m_runMutex);
        if (m_running) {
            qWarning() << "Ya hay una copia en curso.";
            BackupOutcome refused;
            refused.result = BackupOutcome::Failed;
            refused.category = FailureCategory::AlreadyRunning;
            refused.message = "Ya hay una copia en curso";
            return refused;
        }
        m_running = true;
    }

    BackupOutcome outcome = execute(prompter, defaultDestination);

    {
        QMutexLocker locker(&m_runMutex);
        m_running = false;
    }

    emit sessionFinished(outcome);
    return outcome;
}

BackupOutcome BackupEngine::stopBeforeTransfer(BackupOutcome::Result result, FailureCategory category,
                                               const QString &message)
{
    if (result == BackupOutcome::Failed)
        qWarning() << failureCategoryName(category) << "-" << message;
    else
        qInfo() << failureCategoryName(category) << "-" << message;

    BackupOutcome outcome;
    outcome.result = result;
    outcome.category = category;
    outcome.message = message;
    return outcome;
}

BackupOutcome BackupEngine::abortSession(TransferSession &session, FailureCategory category,
                                         const QString &message)
{
    if (category == FailureCategory::UserCancelled || category == FailureCategory::Interrupted)
        session.markCancelled();
    else
        session.markFailed(category == FailureCategory::DeviceDisconnected ? FailureCause::DeviceDisconnected
                                                                          : FailureCause::BridgeError,
                           message);

    BackupOutcome outcome = stopBeforeTransfer(session.state() == TransferSession::Cancelled
                                                   ? BackupOutcome::Cancelled
                                                   : BackupOutcome::Failed,
                                               category, message);
    outcome.session = session;
    outcome.cleanup = m_cleanupSupervisor.onAbnormalExit(session);
    return outcome;
}

BackupOutcome BackupEngine::execute(BackupPrompter &prompter, const QString &defaultDestination)
{
    // 1. Dispositivo
    if (!m_deviceManager || !m_deviceManager->isAdbAvailable()) {
        ProbeResult unavailable;
        unavailable.status = ProbeResult::BridgeUnavailable;
        unavailable.message = "ADB no encontrado. Coloque platform-tools junto al ejecutable o indique la ruta de adb.";
        emit deviceProbed(unavailable);
        return stopBeforeTransfer(BackupOutcome::Failed, FailureCategory::BridgeUnavailable, unavailable.message);
    }

    emit statusMessage("Buscando dispositivos...");
    QList<DeviceInfo> devices = m_deviceManager->enumerateDevices();
    if (devices.isEmpty()) {
        ProbeResult none;
        none.status = ProbeResult::NotConnected;
        none.message = "No se encontró ningún dispositivo Android. Conecte el dispositivo y active la depuración USB.";
        emit deviceProbed(none);
        return stopBeforeTransfer(BackupOutcome::Failed, FailureCategory::NotConnected, none.message);
    }

    int index = 0;
    if (devices.size() > 1) {
        index = prompter.chooseDevice(devices);
        if (interrupted())
            return stopBeforeTransfer(BackupOutcome::Cancelled, FailureCategory::Interrupted, "Operación interrumpida");
        if (index < 0 || index >= devices.size())
            return stopBeforeTransfer(BackupOutcome::Cancelled, FailureCategory::UserCancelled, "No se eligió dispositivo");
    }

    ProbeResult probe = m_deviceManager->probeDevice(devices.at(index));
    emit deviceProbed(probe);
    if (probe.status != ProbeResult::Connected) {
        return stopBeforeTransfer(BackupOutcome::Failed, categoryForProbe(probe.status), probe.message);
    }
    const QString serial = probe.device.serialNumber;

    // 2. Destino
    QString destination = prompter.chooseDestination(defaultDestination);
    if (interrupted())
        return stopBeforeTransfer(BackupOutcome::Cancelled, FailureCategory::Interrupted, "Operación interrumpida");
    if (destination.isNull())
        return stopBeforeTransfer(BackupOutcome::Cancelled, FailureCategory::UserCancelled, "No se eligió destino");

    PathValidation validation = m_validator.validate(destination);
    if (validation.isRejected()) {
        return stopBeforeTransfer(BackupOutcome::Failed, FailureCategory::RejectedDestination, validation.reason);
    }
    if (validation.verdict == PathValidation::Warning) {
        bool accepted = prompter.confirmNetworkDestination(validation);
        if (interrupted())
            return stopBeforeTransfer(BackupOutcome::Cancelled, FailureCategory::Interrupted, "Operación interrumpida");
        if (!accepted)
            return stopBeforeTransfer(BackupOutcome::Cancelled, FailureCategory::NetworkDrive, validation.reason);
    }
    destination = validation.normalizedPath;

    // 3. Alcance
    bool listed = false;
    QStringList folders = m_deviceManager->listStorageFolders(serial, &listed);
    if (!listed) {
        qWarning() << "No se pudo listar el almacenamiento del dispositivo";
    }
    bool scopeChosen = false;
    SourceScope scope = prompter.chooseScope(folders, &scopeChosen);
    if (interrupted())
        return stopBeforeTransfer(BackupOutcome::Cancelled, FailureCategory::Interrupted, "Operación interrumpida");
    if (!scopeChosen)
        return stopBeforeTransfer(BackupOutcome::Cancelled, FailureCategory::UserCancelled, "No se eligió qué copiar");

    // 4. Estimación
    qint64 estimate = prompter.estimateSizeBytes();
    if (interrupted())
        return stopBeforeTransfer(BackupOutcome::Cancelled, FailureCategory::Interrupted, "Operación interrumpida");
    if (estimate < 0)
        return stopBeforeTransfer(BackupOutcome::Cancelled, FailureCategory::UserCancelled, "No se indicó el tamaño estimado");

    // 5. Espacio libre
    DiskSpaceReport space = m_capacityChecker.check(destination, estimate);
    emit diskSpaceChecked(space);
    if (space.needsConfirmation()) {
        bool accepted = prompter.confirmDiskSpace(space);
        if (interrupted())
            return stopBeforeTransfer(BackupOutcome::Cancelled, FailureCategory::Interrupted, "Operación interrumpida");
        if (!accepted) {
            return stopBeforeTransfer(BackupOutcome::Cancelled, declinedSpaceCategory(space.verdict),
                                      CapacityChecker::verdictDescription(space));
        }
    }

    // 6. Conflicto con contenido previo
    ConflictResolution resolution = m_conflictResolver.resolve(destination,
        [&prompter](const QString &path, int entries) {
            return prompter.chooseConflictAction(path, entries);
        });
    if (resolution.outcome == ConflictResolution::Failed) {
        return stopBeforeTransfer(BackupOutcome::Failed, FailureCategory::DestinationWriteError, resolution.message);
    }
    if (resolution.outcome == ConflictResolution::Cancelled) {
        FailureCategory category = interrupted() ? FailureCategory::Interrupted : FailureCategory::UserCancelled;
        return stopBeforeTransfer(BackupOutcome::Cancelled, category, resolution.message);
    }

    BackupTarget target;
    target.sourceScope = scope;
    target.destinationPath = destination;
    target.estimatedSizeBytes = estimate;
    TransferSession session(target, resolution.createdNew);

    if (interrupted())
        return abortSession(session, FailureCategory::Interrupted, "Operación interrumpida");

    // 7. Comprobaciones previas a la copia
    if (scope.kind == SourceScope::Subfolder
        && !m_deviceManager->remoteDirectoryExists(serial, scope.devicePath())) {
        return abortSession(session, FailureCategory::SourceMissing,
                            QString("La carpeta %1 no existe en el dispositivo").arg(scope.devicePath()));
    }
    if (!m_deviceManager->isDeviceReady(serial)) {
        return abortSession(session, FailureCategory::DeviceDisconnected,
                            "El dispositivo se ha desconectado antes de iniciar la copia");
    }

    return transfer(session, serial);
}

BackupOutcome BackupEngine::transfer(TransferSession &session, const QString &serial)
{
    BackupJournal journal(session.destinationPath());
    ProgressTracker tracker(session.totalBytesEstimate());

    QMetaObject::Connection eventConnection =
        connect(m_driver, &TransferDriver::transferEvent, this, [this, &tracker](const TransferEvent &event) {
            if (event.type == TransferEvent::EntrySkipped) {
                emit entrySkipped(event.detail);
            }
            emit progressUpdated(tracker.onEvent(event));
        });
    QMetaObject::Connection diagnosticConnection =
        connect(m_driver, &TransferDriver::diagnosticLine, this, [&journal](const QString &line) {
            journal.appendError(line);
        });

    emit statusMessage(QString("Copiando %1 en %2").arg(session.target().sourceScope.description(),
                                                        session.destinationPath()));

    QElapsedTimer timer;
    timer.start();
    m_driver->start(session, serial);
    qint64 elapsedMs = timer.elapsed();

    disconnect(eventConnection);
    disconnect(diagnosticConnection);

    BackupOutcome outcome;
    outcome.session = session;
    outcome.deviceSerial = serial;
    outcome.elapsedMs = elapsedMs;

    switch (session.state()) {
    case TransferSession::Completed:
        outcome.result = BackupOutcome::Completed;
        journal.writeCompletionMarker(session, serial, elapsedMs);
        outcome.summary = TransferStatistics::buildSummary(session, elapsedMs);
        break;
    case TransferSession::Cancelled:
        outcome.result = BackupOutcome::Cancelled;
        outcome.category = InterruptGuard::isInterrupted() ? FailureCategory::Interrupted
                                                           : FailureCategory::UserCancelled;
        outcome.message = "Copia cancelada";
        outcome.cleanup = m_cleanupSupervisor.onAbnormalExit(session);
        break;
    default:
        outcome.result = BackupOutcome::Failed;
        outcome.category = categoryForCause(session.failureCause());
        outcome.message = failureCauseDescription(session.failureCause());
        outcome.cleanup = m_cleanupSupervisor.onAbnormalExit(session);
        break;
    }

    return outcome;
}
