#include "core/deleter.h"
#include "testutils.h"

#include <gtest/gtest.h>

using namespace QuickCleaner;
using namespace QuickCleaner::Test;

namespace {

class DeleterTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
        m_root = m_dir.filePath("root");
        ASSERT_TRUE(makeDir(m_root));
    }

    QString file(const QString& relative) const { return m_root + "/" + relative; }

    QTemporaryDir m_dir;
    QString m_root;
};

} // namespace

TEST_F(DeleterTest, MissingRootYieldsEmptyResult)
{
    Deleter deleter;
    const DeleteResult result = deleter.deleteContents(m_dir.filePath("does-not-exist"), DeleteOptions());

    EXPECT_EQ(result.bytesFreed, 0u);
    EXPECT_EQ(result.deleted, 0u);
    EXPECT_EQ(result.failed, 0u);
    EXPECT_TRUE(result.errors.isEmpty());
}

TEST_F(DeleterTest, RecursiveDeletionKeepsRoot)
{
    ASSERT_TRUE(writeFile(file("a.tmp"), 100));
    ASSERT_TRUE(writeFile(file("sub/b.tmp"), 250));

    Deleter deleter;
    const DeleteResult result = deleter.deleteContents(m_root, DeleteOptions());

    EXPECT_EQ(result.bytesFreed, 350u);
    EXPECT_EQ(result.deleted, 2u);
    EXPECT_EQ(result.failed, 0u);
    EXPECT_TRUE(result.errors.isEmpty());

    EXPECT_TRUE(exists(m_root));
    EXPECT_FALSE(exists(file("sub")));
    EXPECT_TRUE(QDir(m_root).isEmpty());
}

TEST_F(DeleterTest, NonRecursiveLeavesSubdirectories)
{
    ASSERT_TRUE(writeFile(file("a.tmp"), 10));
    ASSERT_TRUE(writeFile(file("sub/b.tmp"), 20));

    DeleteOptions options;
    options.recursive = false;

    Deleter deleter;
    const DeleteResult result = deleter.deleteContents(m_root, options);

    EXPECT_EQ(result.bytesFreed, 10u);
    EXPECT_EQ(result.deleted, 1u);
    EXPECT_FALSE(exists(file("a.tmp")));
    EXPECT_TRUE(exists(file("sub/b.tmp")));
}

TEST_F(DeleterTest, NameFiltersSelectFiles)
{
    ASSERT_TRUE(writeFile(file("thumbcache_256.db"), 40));
    ASSERT_TRUE(writeFile(file("IconCache_idx.db"), 8));
    ASSERT_TRUE(writeFile(file("explorer.log"), 5));

    DeleteOptions options;
    options.recursive = false;
    options.nameFilters = QStringList{ "thumbcache*.db", "iconcache*.db" };

    Deleter deleter;
    const DeleteResult result = deleter.deleteContents(m_root, options);

    EXPECT_EQ(result.bytesFreed, 48u);
    EXPECT_EQ(result.deleted, 2u);
    EXPECT_TRUE(exists(file("explorer.log")));
}

TEST_F(DeleterTest, LockedFileIsRecordedAndOthersDeleted)
{
    ASSERT_TRUE(writeFile(file("a.tmp"), 100));
    ASSERT_TRUE(writeFile(file("b.tmp"), 200));
    ASSERT_TRUE(writeFile(file("c.tmp"), 300));

    LockingDeleter deleter({ "b.tmp" });
    const DeleteResult result = deleter.deleteContents(m_root, DeleteOptions());

    EXPECT_EQ(result.deleted, 2u);
    EXPECT_EQ(result.failed, 1u);
    EXPECT_EQ(result.bytesFreed, 400u);

    ASSERT_EQ(result.errors.size(), 1);
    EXPECT_TRUE(result.errors.first().path.endsWith("b.tmp"));
    EXPECT_FALSE(result.errors.first().reason.isEmpty());
    EXPECT_TRUE(exists(file("b.tmp")));
}

TEST_F(DeleterTest, DirectoryWithLockedFileStays)
{
    ASSERT_TRUE(writeFile(file("sub/locked.tmp"), 10));
    ASSERT_TRUE(writeFile(file("sub/free.tmp"), 10));

    LockingDeleter deleter({ "locked.tmp" });
    const DeleteResult result = deleter.deleteContents(m_root, DeleteOptions());

    EXPECT_EQ(result.deleted, 1u);
    EXPECT_EQ(result.failed, 1u);
    EXPECT_TRUE(exists(file("sub/locked.tmp")));
    EXPECT_EQ(result.errors.size(), 1);
}

TEST_F(DeleterTest, DirectoryRemovalFailureIsCounted)
{
    ASSERT_TRUE(writeFile(file("busy/a.tmp"), 10));
    ASSERT_TRUE(writeFile(file("other/b.tmp"), 20));

    LockingDeleter deleter({ "busy" });
    const DeleteResult result = deleter.deleteContents(m_root, DeleteOptions());

    EXPECT_EQ(result.deleted, 2u);
    EXPECT_EQ(result.failed, 1u);
    EXPECT_EQ(result.bytesFreed, 30u);
    ASSERT_EQ(result.errors.size(), 1);
    EXPECT_TRUE(result.errors.first().path.endsWith("busy"));
    EXPECT_TRUE(exists(file("busy")));
    EXPECT_FALSE(exists(file("other")));
}

TEST_F(DeleterTest, EveryFileIsEitherDeletedOrFailed)
{
    const QStringList names = { "1.tmp", "2.tmp", "x/3.tmp", "x/y/4.tmp", "x/y/5.log", "z/6.tmp" };
    for (const QString& name : names) {
        ASSERT_TRUE(writeFile(file(name), 16));
    }

    LockingDeleter deleter({ "2.tmp", "5.log" });
    const DeleteResult result = deleter.deleteContents(m_root, DeleteOptions());

    EXPECT_EQ(result.deleted + result.failed, static_cast<quint32>(names.size()));
    EXPECT_EQ(result.bytesFreed, 16u * result.deleted);
}

TEST_F(DeleterTest, CancelledBeforeStartDeletesNothing)
{
    ASSERT_TRUE(writeFile(file("a.tmp"), 10));
    ASSERT_TRUE(writeFile(file("b.tmp"), 10));

    std::atomic<bool> cancel{true};
    Deleter deleter;
    const DeleteResult result = deleter.deleteContents(m_root, DeleteOptions(), &cancel);

    EXPECT_EQ(result.deleted, 0u);
    EXPECT_TRUE(exists(file("a.tmp")));
    EXPECT_TRUE(exists(file("b.tmp")));
}

TEST_F(DeleterTest, CancelStopsBetweenEntries)
{
    ASSERT_TRUE(writeFile(file("a.tmp"), 10));
    ASSERT_TRUE(writeFile(file("b.tmp"), 10));
    ASSERT_TRUE(writeFile(file("c.tmp"), 10));

    std::atomic<bool> cancel{false};
    LockingDeleter deleter;
    deleter.beforeRemove = [&cancel](const QFileInfo&) { cancel = true; };

    const DeleteResult result = deleter.deleteContents(m_root, DeleteOptions(), &cancel);

    // The entry in progress completes, nothing after it
    EXPECT_EQ(result.deleted, 1u);
    EXPECT_EQ(result.bytesFreed, 10u);
    EXPECT_EQ(QDir(m_root).entryList(QDir::Files).size(), 2);
}

TEST_F(DeleterTest, SymbolicLinksAreNotFollowed)
{
    const QString outside = m_dir.filePath("outside");
    ASSERT_TRUE(writeFile(outside + "/keep.dat", 64));

    if (!QFile::link(outside, file("link"))) {
        GTEST_SKIP() << "Cannot create symbolic links here";
    }

    Deleter deleter;
    const DeleteResult result = deleter.deleteContents(m_root, DeleteOptions());

    EXPECT_EQ(result.deleted, 0u);
    EXPECT_TRUE(exists(outside + "/keep.dat"));
}

TEST_F(DeleterTest, RemoveRootAfterContents)
{
    ASSERT_TRUE(writeFile(file("sub/a.tmp"), 10));

    Deleter deleter;
    deleter.deleteContents(m_root, DeleteOptions());

    QString reason;
    EXPECT_TRUE(deleter.removeRoot(m_root, &reason)) << reason.toStdString();
    EXPECT_FALSE(exists(m_root));

    // Already gone
    EXPECT_TRUE(deleter.removeRoot(m_root, &reason));
}

TEST(DeleteResultTest, Accumulates)
{
    DeleteResult total;
    DeleteResult part;
    part.bytesFreed = 10;
    part.deleted = 2;
    part.failed = 1;
    part.errors.append({ "C:/Temp/locked.tmp", "Access is denied" });

    total += part;
    total += part;

    EXPECT_EQ(total.bytesFreed, 20u);
    EXPECT_EQ(total.deleted, 4u);
    EXPECT_EQ(total.failed, 2u);
    EXPECT_EQ(total.errors.size(), 2);
}
