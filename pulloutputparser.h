#ifndef PULLOUTPUTPARSER_H
#define PULLOUTPUTPARSER_H

#include <QString>

// Resultado de clasificar una línea de salida de "adb pull"
struct PullOutputLine {
    enum Kind {
        Ignored,               // Líneas informativas sin interés
        Progress,              // "[ 45%] /sdcard/DCIM/img.jpg: 30%"
        Summary,               // "/sdcard/: 12 files pulled, 1 skipped. ..."
        Skipped,               // "adb: warning: skipping special file ..."
        PermissionDenied,      // Entrada protegida en el dispositivo (no fatal)
        DeviceDisconnected,
        DestinationWriteError,
        BridgeError
    };

    Kind kind = Ignored;
    QString path;            // Entrada afectada, si la línea la nombra
    qint64 bytes = -1;       // Solo Summary
    int filesPulled = -1;    // Solo Summary
    int filesSkipped = -1;   // Solo Summary
    QString text;            // Línea original recortada

    bool isError() const;
    bool isFatal() const;
};

/**
 * @brief Adaptador único entre la salida textual de adb y los eventos internos
 *
 * El formato de salida de adb no está versionado; cualquier cambio de formato
 * se absorbe aquí. Reconoce los mensajes que imprime file_sync_client de adb
 * ("adb: error: ...", "adb: warning: ...", líneas de progreso y el resumen
 * final) y los mensajes de transporte ("device offline", "no devices/emulators
 * found", ...).
 */
class PullOutputParser
{
public:
    static PullOutputLine parseLine(const QString &line);

private:
    static PullOutputLine classifyError(const QString &line);
    static QString firstQuotedPath(const QString &line);
};

#endif // PULLOUTPUTPARSER_H
