#include "capacitychecker.h"
#include "pathsafetyvalidator.h"
#include "transferstatistics.h"
#include <QStorageInfo>
#include <QDebug>

const double CapacityChecker::kMarginalHeadroom = 0.05;

DiskSpaceReport CapacityChecker::check(const QString &destinationPath, qint64 estimatedBytes) const
{
    DiskSpaceReport report;
    report.requiredBytes = qMax<qint64>(0, estimatedBytes);

    // El destino puede no existir todavía: consultar el volumen del ancestro más cercano
    QString existing = PathSafetyValidator::nearestExistingAncestor(destinationPath);
    if (existing.isEmpty()) {
        qWarning() << "No se pudo determinar el volumen de" << destinationPath;
        return report;
    }

    QStorageInfo storage(existing);
    if (!storage.isValid() || !storage.isReady()) {
        qWarning() << "No se pudo verificar el espacio libre en" << existing;
        return report;
    }

    report = classify(storage.bytesAvailable(), report.requiredBytes);
    report.volumeRoot = storage.rootPath();

    qDebug() << "Espacio libre en" << report.volumeRoot << ":" << report.availableBytes
             << "bytes, requeridos:" << report.requiredBytes;
    return report;
}

DiskSpaceReport CapacityChecker::classify(qint64 availableBytes, qint64 requiredBytes)
{
    DiskSpaceReport report;
    report.availableBytes = availableBytes;
    report.requiredBytes = qMax<qint64>(0, requiredBytes);

    if (availableBytes < 0) {
        report.verdict = DiskSpaceReport::Unknown;
    } else if (availableBytes < report.requiredBytes) {
        report.verdict = DiskSpaceReport::Insufficient;
    } else if (report.requiredBytes > 0 &&
               static_cast<double>(availableBytes) < static_cast<double>(report.requiredBytes) * (1.0 + kMarginalHeadroom)) {
        report.verdict = DiskSpaceReport::Marginal;
    } else {
        report.verdict = DiskSpaceReport::OK;
    }

    return report;
}

QString CapacityChecker::verdictDescription(const DiskSpaceReport &report)
{
    switch (report.verdict) {
    case DiskSpaceReport::OK:
        return QString("Espacio suficiente (%1 libres).")
            .arg(TransferStatistics::formatSize(report.availableBytes));
    case DiskSpaceReport::Insufficient:
        return QString("Espacio insuficiente: %1 libres, se estiman %2.")
            .arg(TransferStatistics::formatSize(report.availableBytes))
            .arg(TransferStatistics::formatSize(report.requiredBytes));
    case DiskSpaceReport::Marginal:
        return QString("Espacio justo: %1 libres para %2 estimados (margen inferior al 5%).")
            .arg(TransferStatistics::formatSize(report.availableBytes))
            .arg(TransferStatistics::formatSize(report.requiredBytes));
    case DiskSpaceReport::Unknown:
        return "No se pudo verificar el espacio libre en el destino.";
    }
    return QString();
}
