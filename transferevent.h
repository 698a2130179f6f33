#ifndef TRANSFEREVENT_H
#define TRANSFEREVENT_H

#include <QString>
#include <QMetaType>
#include "transfersession.h"

// Evento emitido por TransferDriver y consumido por ProgressTracker
struct TransferEvent {
    enum Type {
        BytesProgress,  // bytes = total acumulado escrito en destino
        EntrySkipped,   // detail = ruta omitida (permiso denegado)
        Completed,
        Failed,         // cause + detail
        Cancelled
    };

    Type type = BytesProgress;
    qint64 timestampMs = 0;   // Milisegundos desde el inicio de la transferencia
    qint64 bytes = 0;
    FailureCause cause = FailureCause::None;
    QString detail;

    static TransferEvent bytesProgress(qint64 timestampMs, qint64 bytes)
    {
        TransferEvent event;
        event.type = BytesProgress;
        event.timestampMs = timestampMs;
        event.bytes = bytes;
        return event;
    }

    static TransferEvent entrySkipped(qint64 timestampMs, const QString &path)
    {
        TransferEvent event;
        event.type = EntrySkipped;
        event.timestampMs = timestampMs;
        event.detail = path;
        return event;
    }

    static TransferEvent terminal(Type type, qint64 timestampMs, qint64 bytes,
                                  FailureCause cause = FailureCause::None,
                                  const QString &detail = QString())
    {
        TransferEvent event;
        event.type = type;
        event.timestampMs = timestampMs;
        event.bytes = bytes;
        event.cause = cause;
        event.detail = detail;
        return event;
    }

    bool isTerminal() const { return type == Completed || type == Failed || type == Cancelled; }
};

Q_DECLARE_METATYPE(TransferEvent)

#endif // TRANSFEREVENT_H
