#include "transferstatistics.h"
#include "progresstracker.h"

QString TransferStatistics::formatSize(qint64 bytes)
{
    const qint64 kb = 1024;
    const qint64 mb = 1024 * kb;
    const qint64 gb = 1024 * mb;

    if (bytes < kb) {
        return QString::number(bytes) + " B";
    } else if (bytes < mb) {
        return QString::number(bytes / static_cast<double>(kb), 'f', 2) + " KB";
    } else if (bytes < gb) {
        return QString::number(bytes / static_cast<double>(mb), 'f', 2) + " MB";
    } else {
        return QString::number(bytes / static_cast<double>(gb), 'f', 2) + " GB";
    }
}

QString TransferStatistics::formatTime(qint64 totalSeconds)
{
    if (totalSeconds < 0) return "--:--:--";
    qint64 seconds = totalSeconds % 60;
    qint64 totalMinutes = totalSeconds / 60;
    qint64 minutes = totalMinutes % 60;
    qint64 hours = totalMinutes / 60;
    return QStringLiteral("%1:%2:%3")
        .arg(hours, 2, 10, QLatin1Char('0'))
        .arg(minutes, 2, 10, QLatin1Char('0'))
        .arg(seconds, 2, 10, QLatin1Char('0'));
}

QString TransferStatistics::formatRate(double bytesPerSecond)
{
    if (bytesPerSecond <= 0.0) return formatSize(0) + "/s";
    return formatSize(static_cast<qint64>(bytesPerSecond)) + "/s";
}

QString TransferStatistics::progressBar(double fraction, int width)
{
    double bounded = qBound(0.0, fraction, 1.0);
    int filled = static_cast<int>(width * bounded);
    QString bar = QString(filled, QChar(0x2588)) + QString(width - filled, QChar(0x2591));
    return QString("[%1] %2%").arg(bar).arg(bounded * 100.0, 0, 'f', 1);
}

QString TransferStatistics::progressLine(const ProgressSnapshot &snapshot)
{
    QString bar = snapshot.percentKnown ? progressBar(snapshot.percent)
                                        : QString("[%1] --.-%").arg(QString(30, QChar(0x2591)));
    QString eta = snapshot.etaKnown() ? formatTime(snapshot.etaSeconds) : formatTime(-1);

    return QString("%1 %2/%3 [%4] ETA: %5")
        .arg(bar)
        .arg(formatSize(snapshot.bytesTransferred))
        .arg(formatSize(snapshot.totalBytesEstimate))
        .arg(formatRate(snapshot.rateBytesPerSec))
        .arg(eta);
}

QString TransferStatistics::buildSummary(const TransferSession &session, qint64 elapsedMs)
{
    qint64 elapsedSeconds = elapsedMs / 1000;
    QString summary = "Resumen:\n";
    summary += QString(" - Archivos copiados: %1 (%2)\n")
                   .arg(session.filesTransferred())
                   .arg(formatSize(session.bytesTransferred()));
    summary += QString(" - Tiempo total: %1\n").arg(formatTime(elapsedSeconds));
    if (elapsedMs > 0) {
        double rate = session.bytesTransferred() * 1000.0 / elapsedMs;
        summary += QString(" - Velocidad media: %1\n").arg(formatRate(rate));
    }
    if (session.skippedEntries() > 0) {
        summary += QString(" - Entradas omitidas por permisos: %1 (ver backup_errors.log)\n")
                       .arg(session.skippedEntries());
    }
    summary += QString(" - Ubicación: %1").arg(session.destinationPath());
    return summary;
}
