#ifndef ARCHIVERSETTINGS_H
#define ARCHIVERSETTINGS_H

#include <QString>

/**
 * @brief Configuración persistente de la herramienta (android_archiver.cfg)
 *
 * Fichero INI junto al ejecutable. Si no existe, load() lo crea con los
 * valores por defecto. Las claves se buscan primero en [General] y después
 * en la sección heredada [DEFAULT].
 */
class ArchiverSettings
{
public:
    static const char kFileName[];
    static constexpr int kDefaultProgressIntervalMs = 1000;

    ArchiverSettings();

    // Carga desde configPath (vacío = junto al ejecutable)
    bool load(const QString &configPath = QString());

    QString configPath() const { return m_configPath; }
    QString backupLocation() const { return m_backupLocation; }
    QString adbPath() const { return m_adbPath; }
    int progressIntervalMs() const { return m_progressIntervalMs; }

    static QString defaultConfigPath();
    static QString defaultBackupLocation();

    // Expande %VAR%, $VAR, ${VAR} y "~" al inicio
    static QString expandEnvironmentVariables(const QString &value);

private:
    bool writeDefaults() const;

    QString m_configPath;
    QString m_backupLocation;
    QString m_adbPath;
    int m_progressIntervalMs;
};

#endif // ARCHIVERSETTINGS_H
