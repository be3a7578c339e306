#include "deleter.h"
#include "logging.h"

#include <QDir>
#include <QFile>
#include <QRegularExpression>

namespace QuickCleaner {

namespace {

const QDir::Filters kEntryFilters =
    QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System;

bool isCancelled(const std::atomic<bool>* cancel)
{
    return cancel && cancel->load();
}

// Shortcuts (.lnk) are ordinary files here, only real links are skipped
bool isLink(const QFileInfo& entry)
{
    return entry.isSymbolicLink() || entry.isJunction();
}

} // namespace

DeleteResult& DeleteResult::operator+=(const DeleteResult& other)
{
    bytesFreed += other.bytesFreed;
    deleted += other.deleted;
    failed += other.failed;
    errors << other.errors;
    return *this;
}

DeleteResult Deleter::deleteContents(const QString& root, const DeleteOptions& options,
                                     const std::atomic<bool>* cancel)
{
    DeleteResult result;

    QFileInfo fi(root);
    if (!fi.exists() || !fi.isDir() || isLink(fi)) {
        return result;
    }

    cleanDirectory(fi.absoluteFilePath(), options, cancel, result);
    return result;
}

bool Deleter::removeRoot(const QString& root, QString* reason)
{
    QFileInfo fi(root);
    if (!fi.exists()) return true;
    return removeDirectory(fi.absoluteFilePath(), reason);
}

void Deleter::cleanDirectory(const QString& path, const DeleteOptions& options,
                             const std::atomic<bool>* cancel, DeleteResult& result)
{
    QDir dir(path);
    const QFileInfoList entries = dir.entryInfoList(kEntryFilters, QDir::Name | QDir::DirsLast);

    for (const QFileInfo& entry : entries) {
        if (isCancelled(cancel)) return;

        if (isLink(entry)) {
            continue;
        }

        if (entry.isDir()) {
            if (!options.recursive) continue;

            const QString subPath = entry.absoluteFilePath();
            cleanDirectory(subPath, options, cancel, result);
            if (isCancelled(cancel)) return;

            // Directories still holding failed or filtered entries stay
            if (!QDir(subPath).isEmpty(kEntryFilters)) continue;

            QString reason;
            if (!removeDirectory(subPath, &reason)) {
                qCWarning(lcEngine) << "Cannot remove directory" << subPath << "-" << reason;
                result.failed++;
                result.errors.append({ subPath, reason });
            }
            continue;
        }

        if (!entry.isFile()) continue;
        if (!matchesFilters(entry.fileName(), options.nameFilters)) continue;

        deleteFile(entry, result);
    }
}

void Deleter::deleteFile(QFileInfo file, DeleteResult& result)
{
    // Size at the time of deletion, not at listing time
    file.refresh();
    const qint64 size = file.exists() ? file.size() : 0;

    QString reason;
    if (removeFile(file, &reason)) {
        result.deleted++;
        result.bytesFreed += static_cast<quint64>(qMax<qint64>(0, size));
        return;
    }

    if (reason.isEmpty()) {
        reason = QStringLiteral("Unknown error");
    }
    qCWarning(lcEngine) << "Failed to delete" << file.absoluteFilePath() << "-" << reason;

    result.failed++;
    result.errors.append({ file.absoluteFilePath(), reason });
}

bool Deleter::matchesFilters(const QString& fileName, const QStringList& filters) const
{
    if (filters.isEmpty()) return true;

    for (const QString& pattern : filters) {
        QRegularExpression rx(QRegularExpression::wildcardToRegularExpression(pattern),
                              QRegularExpression::CaseInsensitiveOption);
        if (rx.match(fileName).hasMatch()) {
            return true;
        }
    }
    return false;
}

bool Deleter::removeFile(const QFileInfo& file, QString* reason)
{
    QFile f(file.absoluteFilePath());
    if (!f.exists()) return true;

    // Read-only files cannot be removed on Windows
    if (!file.isWritable()) {
        if (!f.setPermissions(f.permissions() | QFileDevice::WriteOwner | QFileDevice::WriteUser)) {
            qCDebug(lcEngine) << "Cannot clear read-only flag of" << file.absoluteFilePath();
        }
    }

    if (f.remove()) {
        return true;
    }

    if (reason) *reason = f.errorString();
    return false;
}

bool Deleter::removeDirectory(const QString& path, QString* reason)
{
    QDir dir(path);
    if (dir.rmdir(path)) {
        return true;
    }

    if (reason) *reason = QStringLiteral("Cannot remove directory");
    return false;
}

} // namespace QuickCleaner
