#ifndef BACKUPENGINE_H
#define BACKUPENGINE_H

#include <QObject>
#include <QMutex>
#include "backupprompter.h"
#include "devicemanager.h"
#include "pathsafetyvalidator.h"
#include "capacitychecker.h"
#include "conflictresolver.h"
#include "cleanupsupervisor.h"
#include "progresstracker.h"
#include "transfersession.h"

class TransferDriver;

// Categoría de error que se muestra al usuario (nunca una línea cruda de adb)
enum class FailureCategory {
    None,
    BridgeUnavailable,
    NotConnected,
    Unauthorized,
    DeviceDisconnected,
    RejectedDestination,
    NetworkDrive,          // Advertencia rechazada por el usuario
    InsufficientSpace,     // Advertencia rechazada por el usuario
    MarginalSpace,         // Advertencia rechazada por el usuario
    UnknownSpace,          // No se pudo consultar el espacio libre y el usuario no siguió
    SourceMissing,
    DestinationWriteError,
    BridgeError,
    UserCancelled,
    Interrupted,
    AlreadyRunning
};

QString failureCategoryName(FailureCategory category);
// Categoría cuando el usuario no acepta el aviso de espacio libre
FailureCategory declinedSpaceCategory(DiskSpaceReport::Verdict verdict);

// Resultado de una ejecución completa del motor
struct BackupOutcome {
    enum Result {
        Completed,
        Failed,
        Cancelled
    };

    Result result = Failed;
    FailureCategory category = FailureCategory::None;
    QString message;
    TransferSession session;
    CleanupSupervisor::Outcome cleanup = CleanupSupervisor::NotRequired;
    QString deviceSerial;
    qint64 elapsedMs = 0;
    QString summary;

    // 0 completada, 1 fallo o rechazo, 2 cancelada
    int exitCode() const;
};

Q_DECLARE_METATYPE(BackupOutcome)

/**
 * @brief Orquesta una copia: sondeo, destino, alcance, espacio, conflicto,
 * transferencia y limpieza
 *
 * Solo hay una sesión activa por motor. La sesión se pasa explícitamente a
 * cada componente y el motor es el único que decide la limpieza.
 */
class BackupEngine : public QObject
{
    Q_OBJECT
public:
    explicit BackupEngine(DeviceManager *deviceManager, QObject *parent = nullptr);
    ~BackupEngine();

    BackupOutcome run(BackupPrompter &prompter, const QString &defaultDestination);

    bool isRunning() const;
    void cancel();

    void setSampleIntervalMs(int msecs);

    PathSafetyValidator &validator() { return m_validator; }

signals:
    void deviceProbed(const ProbeResult &result);
    void statusMessage(const QString &message);
    void diskSpaceChecked(const DiskSpaceReport &report);
    void transferStarted(const QString &source, const QString &destination);
    void progressUpdated(const ProgressSnapshot &snapshot);
    void entrySkipped(const QString &path);
    void sessionFinished(const BackupOutcome &outcome);

private:
    BackupOutcome execute(BackupPrompter &prompter, const QString &defaultDestination);
    BackupOutcome transfer(TransferSession &session, const QString &serial);
    BackupOutcome stopBeforeTransfer(BackupOutcome::Result result, FailureCategory category,
                                     const QString &message);
    BackupOutcome abortSession(TransferSession &session, FailureCategory category,
                               const QString &message);
    bool interrupted() const;

    DeviceManager *m_deviceManager;
    TransferDriver *m_driver;
    PathSafetyValidator m_validator;
    CapacityChecker m_capacityChecker;
    ConflictResolver m_conflictResolver;
    CleanupSupervisor m_cleanupSupervisor;

    mutable QMutex m_runMutex;
    bool m_running;
};

#endif // BACKUPENGINE_H
