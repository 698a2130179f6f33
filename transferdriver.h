#ifndef TRANSFERDRIVER_H
#define TRANSFERDRIVER_H

#include <QObject>
#include <QString>
#include <QDateTime>
#include <QList>
#include <QSet>
#include <QMutex>
#include <QAtomicInt>
#include "devicemanager.h"
#include "transfersession.h"
#include "transferevent.h"

class QProcess;

/**
 * @brief Ejecuta "adb pull" para una sesión y traduce su salida a eventos
 *
 * El proceso hijo pertenece al driver y nunca se comparte. La salida se lee
 * línea a línea con lecturas bloqueantes acotadas por tiempo y se clasifica
 * con PullOutputParser. Mientras adb no escribe nada se sondea el destino
 * para actualizar el contador de bytes.
 *
 * adb abandona un pull recursivo en la primera entrada que el dispositivo
 * deniega. En ese caso la entrada se registra como omitida y la copia
 * continúa con nuevos procesos para las entradas que quedaban pendientes.
 * Cualquier otro error termina la sesión sin reintentos.
 */
class TransferDriver : public QObject
{
    Q_OBJECT
public:
    static constexpr int kDefaultSampleIntervalMs = 1000;
    static constexpr int kTerminateGraceMs = 2000;

    explicit TransferDriver(DeviceManager *deviceManager, QObject *parent = nullptr);
    ~TransferDriver();

    /**
     * @brief Copia el origen de la sesión al destino (bloqueante)
     * @param session Sesión en estado Pending; se deja en estado terminal
     * @param serial Número de serie del dispositivo
     * @return Estado final de la sesión
     */
    TransferSession::State start(TransferSession &session, const QString &serial);

    // Se puede llamar desde un slot conectado a transferEvent o desde otro hilo
    void cancelTransfer();
    bool isTransferInProgress() const;

    void setSampleIntervalMs(int msecs);
    int sampleIntervalMs() const { return m_sampleIntervalMs; }

    /**
     * @brief Bytes de los ficheros del destino modificados desde @p since
     *
     * Los ficheros de registro propios (backup_errors.log,
     * backup_completed.txt) no cuentan.
     */
    static qint64 measureWrittenBytes(const QString &root, const QDateTime &since, int *fileCount = nullptr);

signals:
    void transferStarted(const QString &source, const QString &destination);
    void transferEvent(const TransferEvent &event);
    // Línea de adb con errores, para el registro de la sesión
    void diagnosticLine(const QString &line);
    void statusMessage(const QString &message);

private:
    struct PullStep;
    struct RunState;

    enum PullResult {
        PullFinished,
        PullDenied,    // Terminó en una entrada denegada
        PullFailed,
        PullCancelled
    };

    PullResult runPull(const PullStep &step, TransferSession &session, const QString &serial, RunState &run);
    bool planResume(const PullStep &step, const QString &serial, RunState &run, QList<PullStep> &steps);

    void handleLine(const QString &line, TransferSession &session, RunState &run, qint64 nowMs);
    void sampleBytes(TransferSession &session, RunState &run, qint64 nowMs);
    void finish(const TransferEvent &event);
    void stopProcess(QProcess &process);
    bool cancellationRequested() const;

    DeviceManager *m_deviceManager;
    mutable QMutex m_transferMutex;
    bool m_isTransferring;
    QAtomicInt m_cancelRequested;
    int m_sampleIntervalMs;
};

#endif // TRANSFERDRIVER_H
