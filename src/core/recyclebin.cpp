#include "recyclebin.h"

#ifdef _WIN32
#include <Windows.h>
#include <ShlObj.h>
#include <shellapi.h>
#pragma comment(lib, "shell32.lib")
#endif

namespace QuickCleaner {

namespace {

#ifdef _WIN32

class ShellRecycleBin : public RecycleBin
{
public:
    std::optional<RecycleBinInfo> query() override
    {
        SHQUERYRBINFO info{};
        info.cbSize = sizeof(info);

        HRESULT hr = SHQueryRecycleBinW(nullptr, &info);
        if (FAILED(hr)) {
            return std::nullopt;
        }

        RecycleBinInfo result;
        result.sizeBytes = static_cast<quint64>(qMax<__int64>(0, info.i64Size));
        result.itemCount = static_cast<quint64>(qMax<__int64>(0, info.i64NumItems));
        return result;
    }

    bool empty(QString* reason) override
    {
        HRESULT hr = SHEmptyRecycleBinW(nullptr, nullptr,
            SHERB_NOCONFIRMATION | SHERB_NOPROGRESSUI | SHERB_NOSOUND);

        // S_FALSE means already empty
        if (SUCCEEDED(hr) || hr == S_FALSE) {
            return true;
        }

        if (reason) {
            *reason = QStringLiteral("SHEmptyRecycleBin failed (0x%1)")
                          .arg(static_cast<quint32>(hr), 8, 16, QLatin1Char('0'));
        }
        return false;
    }
};

#else

// No shell Recycle Bin: nothing to report, nothing to empty
class NoRecycleBin : public RecycleBin
{
public:
    std::optional<RecycleBinInfo> query() override { return std::nullopt; }
    bool empty(QString*) override { return true; }
};

#endif

} // namespace

std::unique_ptr<RecycleBin> createSystemRecycleBin()
{
#ifdef _WIN32
    return std::make_unique<ShellRecycleBin>();
#else
    return std::make_unique<NoRecycleBin>();
#endif
}

} // namespace QuickCleaner
