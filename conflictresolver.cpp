#include "conflictresolver.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QDebug>

ConflictResolution ConflictResolver::resolve(const QString &destinationPath, const ChoiceCallback &chooseAction) const
{
    ConflictResolution result;
    QFileInfo info(destinationPath);

    if (!info.exists()) {
        QDir dir;
        if (!dir.mkpath(destinationPath)) {
            result.message = QString("No se pudo crear el directorio destino: %1").arg(destinationPath);
            qWarning() << result.message;
            return result;
        }
        qDebug() << "Directorio destino creado:" << destinationPath;
        result.outcome = ConflictResolution::Proceed;
        result.createdNew = true;
        return result;
    }

    if (!info.isDir()) {
        result.message = QString("El destino existe y no es un directorio: %1").arg(destinationPath);
        qWarning() << result.message;
        return result;
    }

    result.existingEntries = countEntries(destinationPath);
    if (result.existingEntries == 0) {
        result.outcome = ConflictResolution::Proceed;
        return result;
    }

    ConflictChoice choice = chooseAction ? chooseAction(destinationPath, result.existingEntries)
                                         : ConflictChoice::Cancel;

    switch (choice) {
    case ConflictChoice::Merge:
        qDebug() << "Se fusionará con el contenido existente en" << destinationPath;
        result.outcome = ConflictResolution::Proceed;
        break;
    case ConflictChoice::Replace: {
        QString error;
        if (!clearDirectoryContents(destinationPath, &error)) {
            result.message = error;
            return result;
        }
        qDebug() << "Contenido existente eliminado en" << destinationPath;
        result.outcome = ConflictResolution::Proceed;
        break;
    }
    case ConflictChoice::Cancel:
        result.outcome = ConflictResolution::Cancelled;
        result.message = "Copia cancelada: el destino ya contiene archivos.";
        break;
    }

    return result;
}

int ConflictResolver::countEntries(const QString &directoryPath)
{
    QDir dir(directoryPath);
    return dir.entryList(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System).size();
}

bool ConflictResolver::clearDirectoryContents(const QString &directoryPath, QString *errorMessage)
{
    QDir dir(directoryPath);
    const QFileInfoList entries = dir.entryInfoList(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System);

    for (const QFileInfo &entry : entries) {
        bool removed = false;
        // Los enlaces se eliminan sin seguirlos
        if (entry.isDir() && !entry.isSymLink()) {
            removed = QDir(entry.absoluteFilePath()).removeRecursively();
        } else {
            removed = QFile::remove(entry.absoluteFilePath());
        }

        if (!removed) {
            if (errorMessage)
                *errorMessage = QString("No se pudo eliminar %1").arg(entry.absoluteFilePath());
            qWarning() << "Fallo al vaciar el destino:" << entry.absoluteFilePath();
            return false;
        }
    }

    return true;
}
