#ifndef DEVICEMANAGER_H
#define DEVICEMANAGER_H

#include <QObject>
#include <QList>
#include <QString>
#include <QStringList>

// Estructura para almacenar información de un dispositivo
struct DeviceInfo {
    QString serialNumber;    // Identificador reportado por adb
    QString state;           // "device", "unauthorized", "offline"...
    QString manufacturer;    // ro.product.manufacturer
    QString model;           // ro.product.model
    QString androidVersion;  // ro.build.version.release
    QString buildNumber;     // ro.build.display.id

    bool isAuthorized() const { return state == "device"; }
};

// Resultado de sondear el dispositivo conectado
struct ProbeResult {
    enum Status {
        Connected,
        NotConnected,
        Unauthorized,
        BridgeUnavailable  // adb no encontrado o no se pudo ejecutar
    };

    Status status = NotConnected;
    DeviceInfo device;
    QString message;
};

// Entrada de un directorio del dispositivo
struct RemoteEntry {
    QString name;
    bool isDirectory = false;
};

class DeviceManager : public QObject
{
    Q_OBJECT
public:
    // Valor que se muestra cuando una propiedad no está disponible
    static const char kUnknownValue[];

    explicit DeviceManager(QObject *parent = nullptr);
    ~DeviceManager();

    // Estado de ADB
    bool isAdbAvailable() const;
    QString getAdbPath() const;
    bool setupAdb(const QString &customPath = "");

    // Versión de adb ("34.0.5"), vacía si no se pudo determinar
    QString bridgeVersion();

    // Enumerar dispositivos; reinicia el servidor de adb una vez si no hay ninguno
    QList<DeviceInfo> enumerateDevices();

    // Sondeo completo: enumera y consulta el primer dispositivo
    ProbeResult probe();
    // Consulta las propiedades de un dispositivo ya enumerado
    ProbeResult probeDevice(const DeviceInfo &device);

    QString getDeviceProperty(const QString &serial, const QString &property);
    bool isDeviceReady(const QString &serial);

    // Carpetas de primer nivel del almacenamiento (sin ocultas ni "Android")
    QStringList listStorageFolders(const QString &serial, bool *ok = nullptr);
    bool remoteDirectoryExists(const QString &serial, const QString &devicePath);
    // Contenido de un directorio del dispositivo, incluidas las entradas ocultas
    QList<RemoteEntry> listRemoteDirectory(const QString &serial, const QString &devicePath, bool *ok = nullptr);

    static QList<DeviceInfo> parseDeviceList(const QString &output);

signals:
    void adbPathChanged(const QString &path);
    void serverRestarting();
    void error(const QString &message);

private:
    QString findAdbPath();
    QList<DeviceInfo> listDevices(bool *ok);
    bool runAdb(const QStringList &arguments, int timeout, QString *output, QString *errorText = nullptr);
    static QString shellQuote(const QString &value);

    QString adbPath;
    int scanTimeout;
    int propertyTimeout;
};

#endif // DEVICEMANAGER_H
