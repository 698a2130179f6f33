#include "devicemanager.h"
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>
#include <QDebug>
#include <QProcess>
#include <QRegularExpression>
#include <QCoreApplication>
#include <QSysInfo>
#include "transfersession.h"

const char DeviceManager::kUnknownValue[] = "unknown";

DeviceManager::DeviceManager(QObject *parent) : QObject(parent),
    scanTimeout(10000), // Enumeración: hasta 10 segundos
    propertyTimeout(5000)
{
    // Buscar ruta de adb
    adbPath = findAdbPath();
}

DeviceManager::~DeviceManager()
{
}

bool DeviceManager::runAdb(const QStringList &arguments, int timeout, QString *output, QString *errorText)
{
    if (!isAdbAvailable()) {
        if (errorText)
            *errorText = "ADB no encontrado";
        return false;
    }

    QProcess process;
    process.start(adbPath, arguments);

    if (!process.waitForStarted(timeout)) {
        qWarning() << "No se pudo iniciar adb" << arguments << ":" << process.errorString();
        if (errorText)
            *errorText = process.errorString();
        return false;
    }

    if (!process.waitForFinished(timeout)) {
        qWarning() << "Timeout ejecutando adb" << arguments.join(" ");
        process.kill();
        process.waitForFinished(1000);
        if (errorText)
            *errorText = "Tiempo de espera agotado";
        return false;
    }

    if (output)
        *output = QString::fromUtf8(process.readAllStandardOutput());

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        QString stderrText = QString::fromUtf8(process.readAllStandardError()).trimmed();
        qDebug() << "adb" << arguments.join(" ") << "terminó con código" << process.exitCode() << stderrText;
        if (errorText)
            *errorText = stderrText;
        return false;
    }

    return true;
}

QString DeviceManager::bridgeVersion()
{
    QString output;
    if (!runAdb(QStringList() << "version", scanTimeout, &output)) {
        return QString();
    }

    QRegularExpression versionRe("Version (\\d+\\.\\d+\\.\\d+)");
    QRegularExpressionMatch match = versionRe.match(output);
    if (!match.hasMatch()) {
        qWarning() << "Formato de versión de adb no reconocido:" << output.trimmed();
        return QString();
    }

    qDebug() << "Versión de ADB:" << match.captured(1);
    return match.captured(1);
}

QList<DeviceInfo> DeviceManager::listDevices(bool *ok)
{
    QString output;
    QStringList arguments;
    arguments << "devices" << "-l";

    *ok = runAdb(arguments, scanTimeout, &output);
    if (!*ok) {
        return QList<DeviceInfo>();
    }

    return parseDeviceList(output);
}

QList<DeviceInfo> DeviceManager::enumerateDevices()
{
    bool ok = false;
    QList<DeviceInfo> devices = listDevices(&ok);
    if (!devices.isEmpty())
        return devices;

    // Ningún dispositivo: reiniciar el servidor de adb y volver a intentar una vez
    qDebug() << "No se encontraron dispositivos. Reiniciando el servidor de ADB...";
    emit serverRestarting();

    runAdb(QStringList() << "kill-server", scanTimeout, nullptr);
    if (!runAdb(QStringList() << "start-server", scanTimeout, nullptr)) {
        qWarning() << "No se pudo reiniciar el servidor de ADB";
    }

    return listDevices(&ok);
}

QList<DeviceInfo> DeviceManager::parseDeviceList(const QString &output)
{
    QList<DeviceInfo> devices;
    QStringList lines = output.split('\n', Qt::SkipEmptyParts);

    for (const QString &rawLine : lines) {
        QString line = rawLine.trimmed();
        if (line.isEmpty() || line.startsWith("List of devices attached") || line.startsWith("*"))
            continue;

        // Formato típico:
        // XXXXXXXX       device product:modelo model:nombre_modelo device:nombre
        QRegularExpression re("^([^\\s]+)\\s+([\\w-]+)(.*)$");
        QRegularExpressionMatch match = re.match(line);
        if (!match.hasMatch())
            continue;

        DeviceInfo device;
        device.serialNumber = match.captured(1);
        device.state = match.captured(2);

        QRegularExpression modelRe("model:([^\\s]+)");
        QRegularExpressionMatch modelMatch = modelRe.match(match.captured(3));
        if (modelMatch.hasMatch()) {
            // adb sustituye los espacios del modelo por '_'
            device.model = modelMatch.captured(1).replace('_', ' ');
        }

        devices.append(device);
    }

    return devices;
}

ProbeResult DeviceManager::probe()
{
    ProbeResult result;

    if (!isAdbAvailable()) {
        result.status = ProbeResult::BridgeUnavailable;
        result.message = "ADB no encontrado. Coloque platform-tools junto al ejecutable o indique la ruta de adb.";
        return result;
    }

    QList<DeviceInfo> devices = enumerateDevices();
    if (devices.isEmpty()) {
        result.status = ProbeResult::NotConnected;
        result.message = "No se encontró ningún dispositivo Android.";
        return result;
    }

    return probeDevice(devices.first());
}

ProbeResult DeviceManager::probeDevice(const DeviceInfo &device)
{
    ProbeResult result;
    result.device = device;

    if (device.state == "unauthorized") {
        result.status = ProbeResult::Unauthorized;
        result.message = "Por favor, desbloquee su dispositivo Android y acepte el diálogo de 'Permitir depuración USB'.";
        return result;
    }

    if (!device.isAuthorized() || !isDeviceReady(device.serialNumber)) {
        result.status = ProbeResult::NotConnected;
        result.message = QString("El dispositivo %1 no está listo (estado: %2).")
                             .arg(device.serialNumber)
                             .arg(device.state);
        return result;
    }

    // Una propiedad ausente no invalida el sondeo, se muestra como "unknown"
    result.device.manufacturer = getDeviceProperty(device.serialNumber, "ro.product.manufacturer");
    result.device.model = getDeviceProperty(device.serialNumber, "ro.product.model");
    result.device.androidVersion = getDeviceProperty(device.serialNumber, "ro.build.version.release");
    result.device.buildNumber = getDeviceProperty(device.serialNumber, "ro.build.display.id");
    result.status = ProbeResult::Connected;

    qDebug() << "Dispositivo sondeado:" << result.device.serialNumber << result.device.manufacturer
             << result.device.model << "Android" << result.device.androidVersion;
    return result;
}

QString DeviceManager::getDeviceProperty(const QString &serial, const QString &property)
{
    QString output;
    QStringList arguments;
    arguments << "-s" << serial << "shell" << QString("getprop %1").arg(property);

    if (!runAdb(arguments, propertyTimeout, &output)) {
        qWarning() << "No se pudo leer la propiedad" << property << "del dispositivo" << serial;
        return QString::fromLatin1(kUnknownValue);
    }

    QString value = output.trimmed();
    return value.isEmpty() ? QString::fromLatin1(kUnknownValue) : value;
}

bool DeviceManager::isDeviceReady(const QString &serial)
{
    QString output;
    QStringList arguments;
    arguments << "-s" << serial << "get-state";

    if (!runAdb(arguments, scanTimeout, &output))
        return false;

    return output.trimmed() == "device";
}

QStringList DeviceManager::listStorageFolders(const QString &serial, bool *ok)
{
    QString output;
    QStringList arguments;
    arguments << "-s" << serial << "shell" << QString("ls -1 %1").arg(QString::fromLatin1(kDeviceStorageRoot));

    bool success = runAdb(arguments, scanTimeout, &output);
    if (ok)
        *ok = success;
    if (!success) {
        emit error("No se pudo listar el almacenamiento del dispositivo.");
        return QStringList();
    }

    QStringList folders;
    const QStringList lines = output.split('\n', Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        QString name = line.trimmed();
        if (name.isEmpty() || name.startsWith('.') || name.startsWith("Android"))
            continue;
        folders.append(name);
    }
    return folders;
}

bool DeviceManager::remoteDirectoryExists(const QString &serial, const QString &devicePath)
{
    QString output;
    QStringList arguments;
    arguments << "-s" << serial << "shell"
              << QString("test -d %1 && echo exists").arg(shellQuote(devicePath));

    if (!runAdb(arguments, propertyTimeout, &output))
        return false;

    return output.contains("exists");
}

QList<RemoteEntry> DeviceManager::listRemoteDirectory(const QString &serial, const QString &devicePath, bool *ok)
{
    QString output;
    QString errorText;
    QStringList arguments;
    // -p marca los directorios con '/' final
    arguments << "-s" << serial << "shell" << QString("ls -1Ap %1").arg(shellQuote(devicePath));

    bool success = runAdb(arguments, scanTimeout, &output, &errorText);
    if (ok)
        *ok = success;
    if (!success) {
        qWarning() << "No se pudo listar" << devicePath << ":" << errorText;
        return QList<RemoteEntry>();
    }

    QList<RemoteEntry> entries;
    const QStringList lines = output.split('\n', Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        QString name = line;
        name.remove('\r');
        if (name.isEmpty() || name == "./" || name == "../")
            continue;
        RemoteEntry entry;
        entry.isDirectory = name.endsWith('/');
        if (entry.isDirectory)
            name.chop(1);
        entry.name = name;
        entries.append(entry);
    }
    return entries;
}

QString DeviceManager::shellQuote(const QString &value)
{
    QString escaped = value;
    escaped.replace("'", "'\\''");
    return "'" + escaped + "'";
}

QString DeviceManager::findAdbPath()
{
    QString executable = "adb";
    if (QSysInfo::productType() == "windows") {
        executable += ".exe";
    }

    // Buscar en el directorio de la aplicación y en el del proyecto
    const QStringList baseDirs = {
        QCoreApplication::applicationDirPath(),
        QDir::currentPath()
    };
    const QStringList subDirs = {
        "/platform-tools/",
        "/tools/adb/"
    };

    for (const QString &baseDir : baseDirs) {
        if (baseDir.isEmpty())
            continue;
        for (const QString &subDir : subDirs) {
            QString candidate = QDir::cleanPath(baseDir + subDir + executable);
            if (QFileInfo::exists(candidate)) {
                qDebug() << "ADB encontrado:" << candidate;
                return candidate;
            }
        }
    }

    // Por último, el PATH del sistema
    QString systemAdb = QStandardPaths::findExecutable("adb");
    if (!systemAdb.isEmpty()) {
        qDebug() << "ADB encontrado en el PATH:" << systemAdb;
        return systemAdb;
    }

    qWarning() << "ADB no encontrado (esperado en platform-tools/ junto al ejecutable o en el PATH)";
    return QString();
}

bool DeviceManager::isAdbAvailable() const
{
    return !adbPath.isEmpty();
}

QString DeviceManager::getAdbPath() const
{
    return adbPath;
}

bool DeviceManager::setupAdb(const QString &customPath)
{
    if (!customPath.isEmpty()) {
        QFileInfo fileInfo(customPath);
        if (fileInfo.exists() && fileInfo.isExecutable()) {
            adbPath = fileInfo.absoluteFilePath();
            emit adbPathChanged(adbPath);
            return true;
        }
        qWarning() << "Ruta de adb no válida:" << customPath;
        return false;
    }

    // Intentar buscar automáticamente
    QString foundPath = findAdbPath();
    if (!foundPath.isEmpty()) {
        adbPath = foundPath;
        emit adbPathChanged(adbPath);
        return true;
    }

    return false;
}
