#ifndef TRANSFERSTATISTICS_H
#define TRANSFERSTATISTICS_H

#include <QString>
#include "transfersession.h"

struct ProgressSnapshot;

// Funciones de ayuda para presentar estadísticas de la transferencia
class TransferStatistics
{
public:
    static QString formatSize(qint64 bytes);
    static QString formatTime(qint64 totalSeconds);
    static QString formatRate(double bytesPerSecond);
    static QString progressBar(double fraction, int width = 30);

    // Línea de progreso: barra, bytes/estimación, velocidad y tiempo restante
    static QString progressLine(const ProgressSnapshot &snapshot);

    // Resumen final de la sesión
    static QString buildSummary(const TransferSession &session, qint64 elapsedMs);
};

#endif // TRANSFERSTATISTICS_H
