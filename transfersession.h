#ifndef TRANSFERSESSION_H
#define TRANSFERSESSION_H

#include <QString>
#include <QStringList>
#include <QDateTime>

// Raíz del almacenamiento compartido en el dispositivo
extern const char kDeviceStorageRoot[];

// Alcance del origen: todo el almacenamiento o una carpeta concreta
struct SourceScope {
    enum Kind {
        FullDevice,
        Subfolder
    };

    Kind kind = FullDevice;
    QString folder;       // Nombre de la carpeta bajo la raíz (solo Subfolder)

    static SourceScope fullDevice();
    static SourceScope subfolder(const QString &folderName);

    // Ruta en el dispositivo que se pasa a "adb pull"
    QString devicePath() const;
    QString description() const;
};

// Destino de la copia elegido por el usuario
struct BackupTarget {
    SourceScope sourceScope;
    QString destinationPath;       // Ruta local absoluta
    qint64 estimatedSizeBytes = 0; // Estimación del usuario, no es un valor exacto
};

// Causa de un fallo durante la transferencia
enum class FailureCause {
    None,
    DeviceDisconnected,
    DestinationWriteError,
    BridgeError,
    PermissionDenied
};

QString failureCauseDescription(FailureCause cause);

/**
 * @brief Estado de una sesión de copia
 *
 * Se pasa explícitamente a cada componente (no hay estado global). Las
 * transiciones son de un solo sentido: Pending -> Running -> {Completed,
 * Failed, Cancelled}. Una sesión también puede terminar Failed o Cancelled
 * sin haber llegado a Running.
 */
class TransferSession
{
public:
    enum State {
        Pending,
        Running,
        Completed,
        Failed,
        Cancelled
    };

    TransferSession();
    TransferSession(const BackupTarget &target, bool createdDestinationDir);

    const BackupTarget &target() const { return m_target; }
    QString destinationPath() const { return m_target.destinationPath; }

    /**
     * @brief true solo si el directorio destino no existía antes de esta sesión
     *
     * Es la única referencia que consulta CleanupSupervisor para decidir si
     * puede borrar el destino.
     */
    bool createdDestinationDir() const { return m_createdDestinationDir; }

    State state() const { return m_state; }
    bool isTerminal() const;
    bool hasRun() const { return m_startTime.isValid(); }

    bool markRunning();
    bool markCompleted();
    bool markFailed(FailureCause cause, const QString &message);
    bool markCancelled();

    QDateTime startTime() const { return m_startTime; }

    qint64 bytesTransferred() const { return m_bytesTransferred; }
    void setBytesTransferred(qint64 bytes);
    qint64 totalBytesEstimate() const { return m_target.estimatedSizeBytes; }

    int filesTransferred() const { return m_filesTransferred; }
    void setFilesTransferred(int files);

    int skippedEntries() const { return m_skippedPaths.size(); }
    QStringList skippedPaths() const { return m_skippedPaths; }
    void recordSkippedEntry(const QString &path);

    FailureCause failureCause() const { return m_failureCause; }
    QString failureMessage() const { return m_failureMessage; }

    static QString stateName(State state);

private:
    bool transitionTo(State next);

    BackupTarget m_target;
    bool m_createdDestinationDir;
    State m_state;
    QDateTime m_startTime;
    qint64 m_bytesTransferred;
    int m_filesTransferred;
    QStringList m_skippedPaths;
    FailureCause m_failureCause;
    QString m_failureMessage;
};

#endif // TRANSFERSESSION_H
