#ifndef CAPACITYCHECKER_H
#define CAPACITYCHECKER_H

#include <QString>

// Informe de espacio libre, se recalcula en cada comprobación
struct DiskSpaceReport {
    enum Verdict {
        OK,
        Insufficient,
        Marginal,
        Unknown   // No se pudo consultar el volumen
    };

    qint64 availableBytes = -1;
    qint64 requiredBytes = 0;
    Verdict verdict = Unknown;
    QString volumeRoot;

    bool needsConfirmation() const { return verdict != OK; }
};

class CapacityChecker
{
public:
    // Margen de seguridad sobre la estimación (5%)
    static const double kMarginalHeadroom;

    DiskSpaceReport check(const QString &destinationPath, qint64 estimatedBytes) const;

    static DiskSpaceReport classify(qint64 availableBytes, qint64 requiredBytes);
    static QString verdictDescription(const DiskSpaceReport &report);
};

#endif // CAPACITYCHECKER_H
