#include "transferdriver.h"
#include "pulloutputparser.h"
#include "backupjournal.h"
#include "interruptguard.h"
#include <QProcess>
#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QElapsedTimer>
#include <QMutexLocker>
#include <QDebug>

// Un "adb pull": origen en el dispositivo y directorio local que lo recibe
struct TransferDriver::PullStep {
    QString source;
    QString targetDir;
};

// Estado de la copia; los campos "pull" se reinician en cada proceso
struct TransferDriver::RunState {
    QElapsedTimer clock;
    QDateTime since;
    qint64 lastSampleMs = 0;
    qint64 bytes = 0;
    int files = 0;
    QSet<QString> resumedFrom;
    bool reportedReconnect = false;

    bool sawSummary = false;
    qint64 summaryBytes = -1;
    int summaryFiles = -1;
    QStringList deniedPaths;
    bool sawDisconnect = false;
    FailureCause fatalCause = FailureCause::None;
    QString fatalMessage;

    void resetPull()
    {
        sawSummary = false;
        summaryBytes = -1;
        summaryFiles = -1;
        deniedPaths.clear();
        sawDisconnect = false;
        fatalCause = FailureCause::None;
        fatalMessage.clear();
    }
};

TransferDriver::TransferDriver(DeviceManager *deviceManager, QObject *parent)
    : QObject(parent)
    , m_deviceManager(deviceManager)
    , m_isTransferring(false)
    , m_cancelRequested(0)
    , m_sampleIntervalMs(kDefaultSampleIntervalMs)
{
    qRegisterMetaType<TransferEvent>("TransferEvent");
}

TransferDriver::~TransferDriver()
{
    if (isTransferInProgress()) {
        cancelTransfer();
    }
}

void TransferDriver::setSampleIntervalMs(int msecs)
{
    m_sampleIntervalMs = msecs > 0 ? msecs : kDefaultSampleIntervalMs;
}

bool TransferDriver::isTransferInProgress() const
{
    QMutexLocker locker(&m_transferMutex);
    return m_isTransferring;
}

void TransferDriver::cancelTransfer()
{
    if (!isTransferInProgress()) return;

    qDebug() << "Cancelando transferencia...";
    m_cancelRequested.storeRelease(1);
}

bool TransferDriver::cancellationRequested() const
{
    return m_cancelRequested.loadAcquire() != 0 || InterruptGuard::isInterrupted();
}

TransferSession::State TransferDriver::start(TransferSession &session, const QString &serial)
{
    QMutexLocker locker(&m_transferMutex);

    if (m_isTransferring) {
        qWarning() << "Transferencia ya en progreso.";
        return session.state();
    }

    if (session.state() != TransferSession::Pending) {
        qWarning() << "La sesión no está pendiente:" << TransferSession::stateName(session.state());
        return session.state();
    }

    m_isTransferring = true;
    m_cancelRequested.storeRelease(0);
    locker.unlock(); // Desbloquear antes de emitir señales

    RunState run;
    run.since = QDateTime::currentDateTime();
    // Los tiempos de modificación pueden tener resolución de segundos
    run.since = run.since.addMSecs(-run.since.time().msec());
    run.clock.start();

    if (!m_deviceManager || !m_deviceManager->isAdbAvailable()) {
        session.markFailed(FailureCause::BridgeError, "ADB no disponible");
        finish(TransferEvent::terminal(TransferEvent::Failed, 0, 0,
                                                     FailureCause::BridgeError, session.failureMessage()));
        return session.state();
    }

    const QString source = session.target().sourceScope.devicePath();
    const QString destination = session.destinationPath();

    if (!session.markRunning()) {
        finish(TransferEvent::terminal(TransferEvent::Failed, 0, 0, FailureCause::BridgeError,
                                                     "Transición de estado no válida"));
        return session.state();
    }

    emit transferStarted(source, destination);
    emit transferEvent(TransferEvent::bytesProgress(0, 0));

    QList<PullStep> steps;
    steps.append(PullStep{source, destination});

    bool cancelled = false;
    FailureCause cause = FailureCause::None;
    QString message;
    // Totales de adb sumados entre procesos; solo valen si todos los dieron
    bool summaryComplete = true;
    qint64 summedBytes = 0;
    int summedFiles = 0;

    while (!steps.isEmpty()) {
        if (cancellationRequested()) {
            cancelled = true;
            break;
        }

        const PullStep step = steps.takeFirst();
        const PullResult result = runPull(step, session, serial, run);

        if (result == PullCancelled) {
            cancelled = true;
            break;
        }
        if (result == PullFailed) {
            cause = run.fatalCause;
            message = run.fatalMessage;
            break;
        }

        if (run.sawSummary && run.summaryBytes >= 0 && run.summaryFiles >= 0) {
            summedBytes += run.summaryBytes;
            summedFiles += run.summaryFiles;
        } else {
            summaryComplete = false;
        }

        if (result == PullDenied && !planResume(step, serial, run, steps)) {
            cause = run.fatalCause != FailureCause::None ? run.fatalCause : FailureCause::BridgeError;
            message = run.fatalMessage.isEmpty() ? QString("No se pudo reanudar la copia tras un acceso denegado")
                                                 : run.fatalMessage;
            break;
        }
    }

    // Totales finales: los resúmenes de adb son exactos, si no, se mide el destino
    int measuredFiles = 0;
    qint64 measuredBytes = measureWrittenBytes(destination, run.since, &measuredFiles);
    const bool useSummary = summaryComplete && cause == FailureCause::None && !cancelled;
    run.bytes = useSummary ? summedBytes : measuredBytes;
    run.files = useSummary ? summedFiles : measuredFiles;
    session.setBytesTransferred(run.bytes);
    session.setFilesTransferred(run.files);

    const qint64 endMs = run.clock.elapsed();

    if (cancelled) {
        qInfo() << "Transferencia cancelada";
        session.markCancelled();
        finish(TransferEvent::terminal(TransferEvent::Cancelled, endMs, run.bytes));
        return session.state();
    }

    if (cause != FailureCause::None) {
        qWarning() << "Transferencia fallida:" << failureCauseDescription(cause) << message;
        session.markFailed(cause, message);
        finish(TransferEvent::terminal(TransferEvent::Failed, endMs, run.bytes, cause, message));
        return session.state();
    }

    qInfo() << "Transferencia completada:" << run.files << "archivos," << run.bytes << "bytes,"
            << session.skippedEntries() << "omitidos";
    session.markCompleted();
    finish(TransferEvent::terminal(TransferEvent::Completed, endMs, run.bytes));
    return session.state();
}

TransferDriver::PullResult TransferDriver::runPull(const PullStep &step, TransferSession &session,
                                                   const QString &serial, RunState &run)
{
    run.resetPull();

    QProcess process;
    process.setProcessChannelMode(QProcess::MergedChannels);
    QStringList args;
    args << "-s" << serial << "pull" << step.source << step.targetDir;

    qDebug() << "Ejecutando:" << m_deviceManager->getAdbPath() << args.join(" ");
    process.start(m_deviceManager->getAdbPath(), args);

    if (!process.waitForStarted(5000)) {
        run.fatalCause = FailureCause::BridgeError;
        run.fatalMessage = "No se pudo iniciar adb: " + process.errorString();
        qWarning() << run.fatalMessage;
        return PullFailed;
    }

    const int pollMs = qMin(200, m_sampleIntervalMs);
    QByteArray pending;
    bool cancelled = false;

    while (true) {
        if (cancellationRequested()) {
            cancelled = true;
            stopProcess(process);
            break;
        }

        bool exited = process.state() == QProcess::NotRunning;
        if (!exited) {
            process.waitForReadyRead(pollMs);
        }

        pending += process.readAll();
        int newline;
        while ((newline = pending.indexOf('\n')) >= 0) {
            QByteArray raw = pending.left(newline);
            pending.remove(0, newline + 1);
            // adb separa las actualizaciones de progreso con '\r' en una misma línea
            for (const QByteArray &part : raw.split('\r')) {
                handleLine(QString::fromUtf8(part), session, run, run.clock.elapsed());
            }
        }

        qint64 now = run.clock.elapsed();
        if (now - run.lastSampleMs >= m_sampleIntervalMs) {
            sampleBytes(session, run, now);
        }

        if (exited) break;
    }

    if (!pending.isEmpty()) {
        for (const QByteArray &part : pending.split('\r')) {
            handleLine(QString::fromUtf8(part), session, run, run.clock.elapsed());
        }
    }

    // Un Ctrl+C en la terminal llega también a adb: si murió por él, es una cancelación
    if (cancelled || cancellationRequested()) {
        stopProcess(process);
        return PullCancelled;
    }

    if (process.exitStatus() == QProcess::CrashExit) {
        run.fatalCause = run.sawDisconnect ? FailureCause::DeviceDisconnected : FailureCause::BridgeError;
        if (run.fatalMessage.isEmpty())
            run.fatalMessage = "adb terminó de forma inesperada";
        return PullFailed;
    }

    if (process.exitCode() != 0) {
        if (run.sawDisconnect) {
            run.fatalCause = FailureCause::DeviceDisconnected;
            return PullFailed;
        }
        if (run.fatalCause != FailureCause::None)
            return PullFailed;
        if (run.deniedPaths.isEmpty()) {
            run.fatalCause = FailureCause::BridgeError;
            run.fatalMessage = QString("adb terminó con código %1").arg(process.exitCode());
            return PullFailed;
        }
        // adb abandona el pull en la primera entrada denegada
        return PullDenied;
    }

    return PullFinished;
}

bool TransferDriver::planResume(const PullStep &step, const QString &serial, RunState &run, QList<PullStep> &steps)
{
    const QString stepRoot = QDir::cleanPath(step.source);
    const QString localRoot = QDir(step.targetDir).filePath(QFileInfo(stepRoot).fileName());

    for (const QString &deniedPath : run.deniedPaths) {
        const QString denied = QDir::cleanPath(deniedPath);
        if (run.resumedFrom.contains(denied))
            continue;
        run.resumedFrom.insert(denied);

        if (denied == stepRoot)
            continue;
        if (!denied.startsWith(stepRoot + '/')) {
            qWarning() << "Entrada denegada fuera del origen:" << denied;
            return false;
        }

        // Se recorre el camino hasta la entrada denegada y en cada nivel se
        // programan las entradas hermanas; la denegada es la única que falta
        const QStringList parts = denied.mid(stepRoot.length() + 1).split('/', Qt::SkipEmptyParts);
        QString remoteDir = stepRoot;
        QString localDir = localRoot;

        for (const QString &part : parts) {
            bool ok = false;
            const QList<RemoteEntry> entries = m_deviceManager->listRemoteDirectory(serial, remoteDir, &ok);
            if (!ok) {
                run.fatalCause = FailureCause::BridgeError;
                run.fatalMessage = QString("No se pudo listar %1 para continuar la copia").arg(remoteDir);
                return false;
            }

            if (!QDir().mkpath(localDir)) {
                run.fatalCause = FailureCause::DestinationWriteError;
                run.fatalMessage = QString("No se pudo crear %1").arg(localDir);
                return false;
            }

            for (const RemoteEntry &entry : entries) {
                if (entry.name == part)
                    continue;
                // Ficheros ya copiados en esta sesión
                QFileInfo local(QDir(localDir).filePath(entry.name));
                if (!entry.isDirectory && local.isFile() && local.lastModified() >= run.since)
                    continue;
                steps.append(PullStep{remoteDir + '/' + entry.name, localDir});
            }

            remoteDir += '/' + part;
            localDir = QDir(localDir).filePath(part);
        }
    }

    qDebug() << "Reanudando la copia con" << steps.size() << "entradas pendientes";
    return true;
}

void TransferDriver::handleLine(const QString &line, TransferSession &session, RunState &run, qint64 nowMs)
{
    PullOutputLine parsed = PullOutputParser::parseLine(line);

    if (parsed.kind == PullOutputLine::Ignored)
        return;

    if (parsed.kind == PullOutputLine::Progress) {
        if (nowMs - run.lastSampleMs >= m_sampleIntervalMs) {
            sampleBytes(session, run, nowMs);
        }
        return;
    }

    if (parsed.kind == PullOutputLine::Summary) {
        run.sawSummary = true;
        run.summaryBytes = parsed.bytes;
        run.summaryFiles = parsed.filesPulled;
        return;
    }

    if (!parsed.isFatal()) {
        // Entrada omitida: la copia sigue con el resto
        QString path = parsed.path.isEmpty() ? parsed.text : parsed.path;
        if (parsed.kind == PullOutputLine::PermissionDenied) {
            run.deniedPaths.append(path);
        }
        if (session.skippedPaths().contains(path))
            return;
        session.recordSkippedEntry(path);
        if (parsed.isError())
            qWarning() << "adb:" << parsed.text;
        emit diagnosticLine(parsed.text);
        emit transferEvent(TransferEvent::entrySkipped(nowMs, path));
        return;
    }

    if (parsed.kind == PullOutputLine::DeviceDisconnected) {
        run.sawDisconnect = true;
        run.fatalMessage = parsed.text;
        if (!run.reportedReconnect) {
            run.reportedReconnect = true;
            emit statusMessage("Se perdió la conexión con el dispositivo. adb está intentando reconectar...");
        }
    } else if (run.fatalCause == FailureCause::None) {
        run.fatalCause = parsed.kind == PullOutputLine::DestinationWriteError
                             ? FailureCause::DestinationWriteError
                             : FailureCause::BridgeError;
        if (run.fatalMessage.isEmpty())
            run.fatalMessage = parsed.text;
    }

    qWarning() << "adb:" << parsed.text;
    emit diagnosticLine(parsed.text);
}

void TransferDriver::sampleBytes(TransferSession &session, RunState &run, qint64 nowMs)
{
    int files = 0;
    qint64 bytes = measureWrittenBytes(session.destinationPath(), run.since, &files);
    // El contador acumulado nunca retrocede
    if (bytes > run.bytes) {
        run.bytes = bytes;
    }
    run.files = files;
    run.lastSampleMs = nowMs;
    session.setBytesTransferred(run.bytes);
    emit transferEvent(TransferEvent::bytesProgress(nowMs, run.bytes));
}

void TransferDriver::finish(const TransferEvent &event)
{
    {
        QMutexLocker locker(&m_transferMutex);
        m_isTransferring = false;
        m_cancelRequested.storeRelease(0);
    }

    emit transferEvent(event);
}

void TransferDriver::stopProcess(QProcess &process)
{
    if (process.state() == QProcess::NotRunning) return;

    process.terminate();
    if (!process.waitForFinished(kTerminateGraceMs)) {
        qWarning() << "adb no terminó a tiempo, forzando cierre";
        process.kill();
        process.waitForFinished(1000);
    }
}

qint64 TransferDriver::measureWrittenBytes(const QString &root, const QDateTime &since, int *fileCount)
{
    qint64 total = 0;
    int files = 0;

    QFileInfo rootInfo(root);
    const QString rootPath = rootInfo.absoluteFilePath();
    if (rootInfo.exists() && rootInfo.isDir()) {
        QDirIterator it(root, QDir::Files | QDir::Hidden | QDir::System | QDir::NoSymLinks,
                        QDirIterator::Subdirectories);
        while (it.hasNext()) {
            it.next();
            QFileInfo info = it.fileInfo();
            if (info.absolutePath() == rootPath && BackupJournal::isJournalFile(info.fileName()))
                continue;
            if (info.lastModified() < since)
                continue;
            total += info.size();
            ++files;
        }
    }

    if (fileCount)
        *fileCount = files;
    return total;
}
