#ifndef CONFLICTRESOLVER_H
#define CONFLICTRESOLVER_H

#include <QString>
#include <functional>

// Decisión del usuario cuando el destino ya tiene contenido
enum class ConflictChoice {
    Merge,    // Conservar lo existente; adb sobrescribe si coincide el nombre
    Replace,  // Vaciar el destino antes de copiar
    Cancel    // Abortar sin tocar nada
};

struct ConflictResolution {
    enum Outcome {
        Proceed,
        Cancelled,
        Failed
    };

    Outcome outcome = Failed;
    bool createdNew = false;      // El directorio no existía y se ha creado ahora
    int existingEntries = 0;      // Entradas encontradas antes de resolver
    QString message;
};

/**
 * @brief Prepara el directorio destino según su contenido previo
 *
 * Si el destino no existe lo crea; si existe vacío lo usa tal cual; si tiene
 * contenido pide una decisión (fusionar, reemplazar o cancelar) y aplica el
 * paso previo correspondiente. Con Replace se borra el contenido pero el
 * directorio se conserva, de modo que createdNew sigue siendo false.
 */
class ConflictResolver
{
public:
    typedef std::function<ConflictChoice(const QString &path, int existingEntries)> ChoiceCallback;

    ConflictResolution resolve(const QString &destinationPath, const ChoiceCallback &chooseAction) const;

    static int countEntries(const QString &directoryPath);
    static bool clearDirectoryContents(const QString &directoryPath, QString *errorMessage);
};

#endif // CONFLICTRESOLVER_H
