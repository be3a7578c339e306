#pragma once

#include <QString>
#include <QtGlobal>
#include <memory>
#include <optional>

namespace QuickCleaner {

/**
 * @brief Size and item count reported by the shell
 */
struct RecycleBinInfo {
    quint64 sizeBytes{0};
    quint64 itemCount{0};
};

/**
 * @brief Shell Recycle Bin, emptied as a whole instead of path by path
 */
class RecycleBin
{
public:
    virtual ~RecycleBin() = default;

    /// Contents of all drives' bins, nullopt if the shell cannot tell
    virtual std::optional<RecycleBinInfo> query() = 0;

    /// Empty the bin without confirmation, progress UI or sound
    virtual bool empty(QString* reason) = 0;
};

/// Recycle Bin of the running platform
std::unique_ptr<RecycleBin> createSystemRecycleBin();

} // namespace QuickCleaner
