#ifndef PROGRESSTRACKER_H
#define PROGRESSTRACKER_H

#include <QQueue>
#include "transferevent.h"

// Muestra (instante, bytes acumulados) para el cálculo de velocidad
struct ProgressSample {
    qint64 timestampMs;
    qint64 bytes;
};

// Estado del progreso que se entrega a la capa de presentación
struct ProgressSnapshot {
    double percent = 0.0;          // Fracción [0, 1]
    bool percentKnown = false;     // false si la estimación es 0
    double rateBytesPerSec = 0.0;
    qint64 etaSeconds = -1;        // -1 = indeterminado
    qint64 bytesTransferred = 0;
    qint64 totalBytesEstimate = 0;
    bool finished = false;

    bool etaKnown() const { return etaSeconds >= 0; }
};

Q_DECLARE_METATYPE(ProgressSnapshot)

/**
 * @brief Calcula porcentaje, velocidad suavizada y tiempo restante
 *
 * Conserva como máximo kMaxSamples muestras. La velocidad es la diferencia de
 * bytes respecto a la muestra más antigua dividida por el tiempo transcurrido
 * desde ella (media móvil). La estimación de tamaño la da el usuario, así que
 * el porcentaje se limita a kPercentCap hasta que llega Completed.
 */
class ProgressTracker
{
public:
    static constexpr int kMaxSamples = 5;
    static const double kPercentCap;
    static const double kMinimumRate;   // Bytes/s por debajo de los cuales el ETA es indeterminado

    explicit ProgressTracker(qint64 totalBytesEstimate = 0);

    void reset(qint64 totalBytesEstimate);

    /**
     * @brief Procesa un evento del driver y devuelve el estado resultante
     * @param event Evento de transferencia
     * @return Una instantánea por evento
     */
    ProgressSnapshot onEvent(const TransferEvent &event);

    ProgressSnapshot snapshot() const;
    int sampleCount() const { return m_samples.size(); }

private:
    void addSample(qint64 timestampMs, qint64 bytes);
    double computeRate() const;

    QQueue<ProgressSample> m_samples;
    qint64 m_totalBytesEstimate;
    qint64 m_bytes;
    double m_rate;
    bool m_completed;
    bool m_stopped;
};

#endif // PROGRESSTRACKER_H
