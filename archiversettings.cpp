#include "archiversettings.h"
#include <QCoreApplication>
#include <QSettings>
#include <QFile>
#include <QTextStream>
#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>
#include <QStandardPaths>
#include <QDebug>

const char ArchiverSettings::kFileName[] = "android_archiver.cfg";

namespace {

// Valor de una clave en [General] o, si falta, en [DEFAULT]
QString readKey(QSettings &settings, const QString &key)
{
    QString value = settings.value(key).toString();
    if (value.isEmpty()) {
        value = settings.value(QStringLiteral("DEFAULT/") + key).toString();
    }
    return value.trimmed();
}

// Valor tal como aparece en el fichero. QSettings trata '\' como escape y
// convierte "C:\Users\me" en "C:Usersme"
QString readRawKey(const QString &configPath, const QString &key)
{
    QFile file(configPath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
        return QString();

    const QRegularExpression keyLine(
        QStringLiteral("^\\s*%1\\s*=\\s*(.*)$").arg(QRegularExpression::escape(key)));

    QString section;
    QString general;
    QString legacy;
    QTextStream in(&file);
    while (!in.atEnd()) {
        const QString line = in.readLine();
        const QString trimmed = line.trimmed();
        if (trimmed.startsWith('[') && trimmed.endsWith(']')) {
            section = trimmed.mid(1, trimmed.size() - 2);
            continue;
        }

        QRegularExpressionMatch match = keyLine.match(line);
        if (!match.hasMatch())
            continue;

        QString value = match.captured(1).trimmed();
        if (value.size() >= 2 && value.startsWith('"') && value.endsWith('"'))
            value = value.mid(1, value.size() - 2);

        if (section.isEmpty() || section == "General") {
            if (general.isEmpty())
                general = value;
        } else if (section == "DEFAULT" && legacy.isEmpty()) {
            legacy = value;
        }
    }
    return general.isEmpty() ? legacy : general;
}

// Las rutas con '\' solo pueden venir de un fichero escrito a mano
QString readPathKey(QSettings &settings, const QString &configPath, const QString &key)
{
    const QString raw = readRawKey(configPath, key);
    if (raw.contains('\\'))
        return raw;
    return readKey(settings, key);
}

QString normalizePath(const QString &path)
{
    QString result = path;
    result.replace('\\', '/');
    return QDir::cleanPath(result);
}

} // namespace

ArchiverSettings::ArchiverSettings()
    : m_backupLocation(defaultBackupLocation())
    , m_progressIntervalMs(kDefaultProgressIntervalMs)
{
}

QString ArchiverSettings::defaultConfigPath()
{
    return QDir(QCoreApplication::applicationDirPath()).filePath(QString::fromLatin1(kFileName));
}

QString ArchiverSettings::defaultBackupLocation()
{
    QString documents = QStandardPaths::writableLocation(QStandardPaths::DocumentsLocation);
    if (documents.isEmpty()) {
        documents = QDir::home().filePath("Documents");
    }
    return QDir(documents).filePath("AndroidBackup");
}

bool ArchiverSettings::load(const QString &configPath)
{
    m_configPath = configPath.isEmpty() ? defaultConfigPath() : configPath;

    if (!QFileInfo::exists(m_configPath)) {
        qInfo() << "Creando configuración por defecto en" << m_configPath;
        if (!writeDefaults()) {
            qWarning() << "No se pudo crear el fichero de configuración" << m_configPath;
        }
    }

    QSettings settings(m_configPath, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        qWarning() << "Error leyendo la configuración" << m_configPath;
        return false;
    }

    QString location = readPathKey(settings, m_configPath, "backup_location");
    m_backupLocation = location.isEmpty()
        ? defaultBackupLocation()
        : normalizePath(expandEnvironmentVariables(location));

    QString adb = readPathKey(settings, m_configPath, "adb_path");
    m_adbPath = adb.isEmpty() ? QString() : normalizePath(expandEnvironmentVariables(adb));

    QString interval = readKey(settings, "progress_interval_ms");
    m_progressIntervalMs = kDefaultProgressIntervalMs;
    if (!interval.isEmpty()) {
        bool ok = false;
        int parsed = interval.toInt(&ok);
        if (ok && parsed > 0) {
            m_progressIntervalMs = parsed;
        } else {
            qWarning() << "progress_interval_ms no válido:" << interval << "- se usa" << kDefaultProgressIntervalMs;
        }
    }

    qDebug() << "Configuración cargada. Destino:" << m_backupLocation
             << "adb:" << (m_adbPath.isEmpty() ? QStringLiteral("(auto)") : m_adbPath)
             << "Intervalo:" << m_progressIntervalMs;
    return true;
}

bool ArchiverSettings::writeDefaults() const
{
    QSettings settings(m_configPath, QSettings::IniFormat);
    settings.setValue("backup_location", defaultBackupLocation());
    settings.setValue("adb_path", QString());
    settings.setValue("progress_interval_ms", kDefaultProgressIntervalMs);
    settings.sync();
    return settings.status() == QSettings::NoError;
}

QString ArchiverSettings::expandEnvironmentVariables(const QString &value)
{
    QString result = value;

    static const QRegularExpression windowsStyle(QStringLiteral("%([A-Za-z_][A-Za-z0-9_]*)%"));
    static const QRegularExpression unixStyle(QStringLiteral("\\$\\{([A-Za-z_][A-Za-z0-9_]*)\\}|\\$([A-Za-z_][A-Za-z0-9_]*)"));

    // Las variables que no existen se dejan tal cual
    for (const QRegularExpression *pattern : {&windowsStyle, &unixStyle}) {
        QString expanded;
        int last = 0;
        QRegularExpressionMatchIterator it = pattern->globalMatch(result);
        while (it.hasNext()) {
            QRegularExpressionMatch match = it.next();
            QString name = match.captured(1).isEmpty() ? match.captured(2) : match.captured(1);
            expanded += result.mid(last, match.capturedStart() - last);
            if (qEnvironmentVariableIsSet(name.toLocal8Bit().constData())) {
                expanded += qEnvironmentVariable(name.toLocal8Bit().constData());
            } else {
                expanded += match.captured(0);
            }
            last = match.capturedEnd();
        }
        expanded += result.mid(last);
        result = expanded;
    }

    if (result == "~" || result.startsWith("~/") || result.startsWith("~\\")) {
        result = QDir::homePath() + result.mid(1);
    }

    return result;
}
