#pragma once

#include "cleanertypes.h"

#include <QFileInfo>
#include <atomic>

namespace QuickCleaner {

/**
 * @brief Options for one scoped deletion
 */
struct DeleteOptions {
    bool recursive{true};       // Descend into sub directories and remove them
    QStringList nameFilters;    // Wildcards matched against file names, empty = all
};

/**
 * @brief Accounting of one scoped deletion
 */
struct DeleteResult {
    quint64 bytesFreed{0};
    quint32 deleted{0};         // Files removed
    quint32 failed{0};          // Files or emptied directories that stayed
    QList<CleanError> errors;

    DeleteResult& operator+=(const DeleteResult& other);
};

/**
 * @brief Scoped delete-with-accounting primitive
 *
 * Enumerates the contents of a root and deletes them entry by entry.
 * A failing entry is recorded and the enumeration continues. Sizes are
 * measured right before each deletion.
 *
 * removeFile() and removeDirectory() are the only calls that modify the
 * file system; override them to simulate locked files.
 */
class Deleter
{
public:
    Deleter() = default;
    virtual ~Deleter() = default;

    Deleter(const Deleter&) = delete;
    Deleter& operator=(const Deleter&) = delete;

    /// Delete the contents of root, keeping root itself.
    /// A missing root yields an empty result. Stops between entries once
    /// cancel is set.
    DeleteResult deleteContents(const QString& root, const DeleteOptions& options,
                                const std::atomic<bool>* cancel = nullptr);

    /// Remove a now-empty root directory, false with reason on failure
    bool removeRoot(const QString& root, QString* reason);

protected:
    /// Delete one regular file. On failure fill reason and return false.
    virtual bool removeFile(const QFileInfo& file, QString* reason);

    /// Remove one empty directory. On failure fill reason and return false.
    virtual bool removeDirectory(const QString& path, QString* reason);

private:
    void cleanDirectory(const QString& path, const DeleteOptions& options,
                        const std::atomic<bool>* cancel, DeleteResult& result);
    void deleteFile(QFileInfo file, DeleteResult& result);
    bool matchesFilters(const QString& fileName, const QStringList& filters) const;
};

} // namespace QuickCleaner
