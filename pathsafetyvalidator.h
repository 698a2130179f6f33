#ifndef PATHSAFETYVALIDATOR_H
#define PATHSAFETYVALIDATOR_H

#include <QString>
#include <QStringList>
#include <QByteArray>

// Resultado de validar una ruta de destino
struct PathValidation {
    enum Verdict {
        Accepted,
        Warning,   // Unidad de red: solo advertencia, se puede continuar
        Rejected   // Directorio del sistema o crítico: sin posibilidad de continuar
    };

    Verdict verdict = Rejected;
    QString normalizedPath;
    QString reason;

    bool isAccepted() const { return verdict == Accepted; }
    bool isRejected() const { return verdict == Rejected; }
};

/**
 * @brief Clasifica una ruta de destino antes de cualquier escritura
 *
 * Las comprobaciones se aplican en orden y gana la primera que coincide:
 * ubicaciones reservadas (rechazo sin excepción), volúmenes de red
 * (advertencia) y, en otro caso, aceptada.
 */
class PathSafetyValidator
{
public:
    PathSafetyValidator();

    PathValidation validate(const QString &path) const;

    /**
     * @brief Añade una ubicación protegida
     * @param path Ruta a proteger
     * @param includeChildren true para proteger también todo lo que cuelga de ella
     */
    void addProtectedDirectory(const QString &path, bool includeChildren);

    static bool isNetworkFileSystem(const QByteArray &fileSystemType);
    static bool isUncPath(const QString &path);

    // Ancestro existente más cercano (el propio path si existe)
    static QString nearestExistingAncestor(const QString &path);

private:
    void loadDefaultDirectories();
    bool isReserved(const QString &cleanPath, QString *reason) const;
    bool isOnNetworkVolume(const QString &originalPath, const QString &cleanPath) const;
    static bool isFileSystemRoot(const QString &cleanPath);
    QString normalize(const QString &path) const;
    bool samePath(const QString &a, const QString &b) const;
    bool isInside(const QString &child, const QString &parent) const;

    QStringList m_exactPaths;  // Solo la ruta exacta
    QStringList m_treePaths;   // La ruta y todo su contenido
    Qt::CaseSensitivity m_caseSensitivity;
};

#endif // PATHSAFETYVALIDATOR_H
