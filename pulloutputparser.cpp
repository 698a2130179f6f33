#include "pulloutputparser.h"
#include <QRegularExpression>
#include <QStringList>

bool PullOutputLine::isError() const
{
    return kind == PermissionDenied || kind == DeviceDisconnected ||
           kind == DestinationWriteError || kind == BridgeError;
}

bool PullOutputLine::isFatal() const
{
    return kind == DeviceDisconnected || kind == DestinationWriteError || kind == BridgeError;
}

PullOutputLine PullOutputParser::parseLine(const QString &rawLine)
{
    PullOutputLine result;
    result.text = rawLine.trimmed();

    if (result.text.isEmpty())
        return result;

    // Progreso: "[ 45%] /sdcard/DCIM/a.jpg: 30%", "[   ?] /sdcard/x: 1024/?"
    static const QRegularExpression progressRe("^\\[\\s*(?:\\d{1,3}%|\\?)\\]\\s+(.+?)(?::\\s+(?:\\d{1,3}%|\\d+/\\?))?$");
    QRegularExpressionMatch progressMatch = progressRe.match(result.text);
    if (progressMatch.hasMatch()) {
        result.kind = PullOutputLine::Progress;
        result.path = progressMatch.captured(1);
        return result;
    }

    // Resumen final, formato antiguo y nuevo:
    //   "/sdcard/: 3 files pulled. 0 files skipped. 4.1 MB/s (123 bytes in 0.1s)"
    //   "/sdcard/: 3 files pulled, 0 skipped. 4.1 MB/s (123 bytes in 0.100s)"
    static const QRegularExpression summaryRe("(\\d+) files? pulled[.,]\\s+(\\d+) (?:files? )?skipped\\.");
    QRegularExpressionMatch summaryMatch = summaryRe.match(result.text);
    if (summaryMatch.hasMatch()) {
        result.kind = PullOutputLine::Summary;
        result.filesPulled = summaryMatch.captured(1).toInt();
        result.filesSkipped = summaryMatch.captured(2).toInt();

        static const QRegularExpression bytesRe("\\((\\d+) bytes in [\\d.]+s\\)");
        QRegularExpressionMatch bytesMatch = bytesRe.match(result.text);
        if (bytesMatch.hasMatch()) {
            result.bytes = bytesMatch.captured(1).toLongLong();
        }

        int colon = result.text.indexOf(": ");
        if (colon > 0 && colon < summaryMatch.capturedStart(0)) {
            result.path = result.text.left(colon);
        }
        return result;
    }

    if (result.text.startsWith("adb: warning:")) {
        if (result.text.contains("skipping", Qt::CaseInsensitive)) {
            result.kind = PullOutputLine::Skipped;
            result.path = firstQuotedPath(result.text);
        }
        return result;
    }

    if (result.text.startsWith("adb: error:") || result.text.startsWith("error:") ||
        result.text.startsWith("adb: failed") || result.text.contains("Permission denied", Qt::CaseInsensitive)) {
        PullOutputLine error = classifyError(result.text);
        error.text = result.text;
        return error;
    }

    return result;
}

PullOutputLine PullOutputParser::classifyError(const QString &line)
{
    PullOutputLine result;
    result.path = firstQuotedPath(line);
    const QString lower = line.toLower();

    // Errores locales primero: "cannot create '<local>': Permission denied" es un
    // problema del destino, no de una entrada del dispositivo.
    static const QStringList destinationMarkers = {
        "no space left on device",
        "disk full",
        "cannot create '",
        "cannot write '",
        "cannot create file/directory",
        "failed to create directory",
        "read-only file system",
        "file too large",
        "target '"
    };
    for (const QString &marker : destinationMarkers) {
        if (lower.contains(marker)) {
            result.kind = PullOutputLine::DestinationWriteError;
            return result;
        }
    }

    if (lower.contains("permission denied")) {
        result.kind = PullOutputLine::PermissionDenied;
        return result;
    }

    static const QStringList deviceMarkers = {
        "no devices/emulators found",
        "device offline",
        "device unauthorized",
        "protocol fault",
        "connection reset",
        "couldn't read from device",
        "failed to read copy response",
        "no response",
        "transport",
        "closed"
    };
    static const QRegularExpression deviceNotFoundRe("device '[^']*' not found");
    if (deviceNotFoundRe.match(lower).hasMatch()) {
        result.kind = PullOutputLine::DeviceDisconnected;
        return result;
    }
    for (const QString &marker : deviceMarkers) {
        if (lower.contains(marker)) {
            result.kind = PullOutputLine::DeviceDisconnected;
            return result;
        }
    }

    result.kind = PullOutputLine::BridgeError;
    return result;
}

QString PullOutputParser::firstQuotedPath(const QString &line)
{
    static const QRegularExpression quotedRe("'([^']+)'");
    QRegularExpressionMatch match = quotedRe.match(line);
    return match.hasMatch() ? match.captured(1) : QString();
}
