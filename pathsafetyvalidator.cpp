#include "pathsafetyvalidator.h"
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>
#include <QStorageInfo>
#include <QRegularExpression>
#include <QSysInfo>
#include <QDebug>

PathSafetyValidator::PathSafetyValidator()
    : m_caseSensitivity(QSysInfo::productType() == "windows" ? Qt::CaseInsensitive : Qt::CaseSensitive)
{
    loadDefaultDirectories();
}

void PathSafetyValidator::loadDefaultDirectories()
{
    // Carpetas personales: se protege la carpeta en sí, no sus subcarpetas
    addProtectedDirectory(QDir::homePath(), false);
    const QList<QStandardPaths::StandardLocation> userLocations = {
        QStandardPaths::DocumentsLocation,
        QStandardPaths::DownloadLocation,
        QStandardPaths::DesktopLocation,
        QStandardPaths::PicturesLocation
    };
    for (QStandardPaths::StandardLocation location : userLocations) {
        addProtectedDirectory(QStandardPaths::writableLocation(location), false);
    }

    // Directorios del sistema operativo y todo su contenido
    const QStringList unixSystemTrees = {
        "/bin", "/boot", "/dev", "/etc", "/lib", "/lib32", "/lib64",
        "/proc", "/run", "/sbin", "/sys", "/usr", "/var", "/System", "/Library"
    };
    for (const QString &dir : unixSystemTrees) {
        addProtectedDirectory(dir, true);
    }

    const QStringList unixSystemRoots = {
        "/tmp", "/opt", "/home", "/root", "/mnt", "/media", "/Users", "/Applications"
    };
    for (const QString &dir : unixSystemRoots) {
        addProtectedDirectory(dir, false);
    }

    // Directorios de Windows, si las variables existen
    const char *windowsTrees[] = {
        "SystemRoot", "ProgramFiles", "ProgramFiles(x86)", "ProgramData", "LocalAppData", "AppData"
    };
    for (const char *variable : windowsTrees) {
        QString value = qEnvironmentVariable(variable);
        if (!value.isEmpty()) {
            addProtectedDirectory(value, true);
        }
    }
}

void PathSafetyValidator::addProtectedDirectory(const QString &path, bool includeChildren)
{
    if (path.trimmed().isEmpty())
        return;

    QString clean = normalize(path);
    QStringList &list = includeChildren ? m_treePaths : m_exactPaths;
    if (!list.contains(clean, m_caseSensitivity)) {
        list.append(clean);
    }
}

PathValidation PathSafetyValidator::validate(const QString &path) const
{
    PathValidation result;
    QString trimmed = path.trimmed();

    if (trimmed.isEmpty()) {
        result.reason = "La ruta de destino está vacía.";
        return result;
    }

    const bool unc = isUncPath(trimmed);
    if (!unc && QDir::isRelativePath(QDir::fromNativeSeparators(trimmed))) {
        result.reason = QString("La ruta '%1' no es absoluta.").arg(trimmed);
        return result;
    }

    result.normalizedPath = normalize(trimmed);

    QString reason;
    if (isReserved(result.normalizedPath, &reason)) {
        result.verdict = PathValidation::Rejected;
        result.reason = reason;
        qWarning() << "Destino rechazado:" << result.normalizedPath << "-" << reason;
        return result;
    }

    if (isOnNetworkVolume(trimmed, result.normalizedPath)) {
        result.verdict = PathValidation::Warning;
        result.reason = "El destino está en una unidad de red. El rendimiento puede ser menor.";
        return result;
    }

    result.verdict = PathValidation::Accepted;
    return result;
}

bool PathSafetyValidator::isReserved(const QString &cleanPath, QString *reason) const
{
    if (isFileSystemRoot(cleanPath)) {
        *reason = "No se puede usar la raíz del sistema de archivos como destino.";
        return true;
    }

    // Resolver enlaces simbólicos si la ruta (o un ancestro) existe
    QStringList candidates;
    candidates << cleanPath;
    QString ancestor = nearestExistingAncestor(cleanPath);
    if (!ancestor.isEmpty()) {
        QString canonicalAncestor = QFileInfo(ancestor).canonicalFilePath();
        if (!canonicalAncestor.isEmpty() && canonicalAncestor != ancestor) {
            candidates << QDir::cleanPath(canonicalAncestor + cleanPath.mid(ancestor.length()));
        }
    }

    for (const QString &candidate : candidates) {
        if (isFileSystemRoot(candidate)) {
            *reason = "No se puede usar la raíz del sistema de archivos como destino.";
            return true;
        }
        for (const QString &protectedPath : m_exactPaths) {
            if (samePath(candidate, protectedPath)) {
                *reason = QString("No se puede usar un directorio crítico como destino (%1).").arg(protectedPath);
                return true;
            }
        }
        for (const QString &protectedTree : m_treePaths) {
            if (samePath(candidate, protectedTree) || isInside(candidate, protectedTree)) {
                *reason = QString("No se puede usar un directorio del sistema como destino (%1).").arg(protectedTree);
                return true;
            }
        }
    }

    return false;
}

bool PathSafetyValidator::isOnNetworkVolume(const QString &originalPath, const QString &cleanPath) const
{
    if (isUncPath(originalPath))
        return true;

    QString ancestor = nearestExistingAncestor(cleanPath);
    if (ancestor.isEmpty())
        return false;

    QStorageInfo storage(ancestor);
    if (!storage.isValid())
        return false;

    return isNetworkFileSystem(storage.fileSystemType());
}

bool PathSafetyValidator::isNetworkFileSystem(const QByteArray &fileSystemType)
{
    static const QList<QByteArray> networkTypes = {
        "nfs", "nfs4", "cifs", "smb", "smbfs", "smb2", "smb3", "afs", "9p",
        "ncpfs", "davfs", "fuse.davfs2", "fuse.sshfs", "sshfs", "fuse.rclone"
    };

    QByteArray type = fileSystemType.toLower();
    return networkTypes.contains(type);
}

bool PathSafetyValidator::isUncPath(const QString &path)
{
    return path.startsWith("\\\\") || path.startsWith("//");
}

QString PathSafetyValidator::nearestExistingAncestor(const QString &path)
{
    if (path.isEmpty())
        return QString();

    QString current = QDir::cleanPath(QDir::fromNativeSeparators(path));
    while (!current.isEmpty()) {
        if (QFileInfo::exists(current))
            return current;

        QString parent = QFileInfo(current).path();
        if (parent == current)
            break;
        current = parent;
    }
    return QString();
}

bool PathSafetyValidator::isFileSystemRoot(const QString &cleanPath)
{
    static const QRegularExpression driveRootRe("^[A-Za-z]:/?$");
    return cleanPath == "/" || driveRootRe.match(cleanPath).hasMatch();
}

QString PathSafetyValidator::normalize(const QString &path) const
{
    QString clean = QDir::cleanPath(QDir::fromNativeSeparators(path.trimmed()));
    // "C:" se trata igual que "C:/"
    if (clean.length() > 1 && clean.endsWith('/') && !isFileSystemRoot(clean)) {
        clean.chop(1);
    }
    return clean;
}

bool PathSafetyValidator::samePath(const QString &a, const QString &b) const
{
    return QString::compare(a, b, m_caseSensitivity) == 0;
}

bool PathSafetyValidator::isInside(const QString &child, const QString &parent) const
{
    QString prefix = parent.endsWith('/') ? parent : parent + '/';
    return child.startsWith(prefix, m_caseSensitivity);
}
