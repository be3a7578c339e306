#include "core/cleanertypes.h"

#include <gtest/gtest.h>

using namespace QuickCleaner;

TEST(CleanerTypesTest, CategoryIdsParseBack)
{
    const CleanCategory all[] = {
        CleanCategory::RecycleBin, CleanCategory::UserTemp, CleanCategory::SystemTemp,
        CleanCategory::RecentItems, CleanCategory::Thumbnails, CleanCategory::ChromeCache,
        CleanCategory::EdgeCache, CleanCategory::BraveCache, CleanCategory::VivaldiCache,
        CleanCategory::OperaCache, CleanCategory::FirefoxCache
    };

    for (CleanCategory category : all) {
        CleanCategory parsed = CleanCategory::RecycleBin;
        ASSERT_TRUE(parseCategory(categoryId(category), parsed)) << categoryId(category).toStdString();
        EXPECT_EQ(parsed, category);
    }
}

TEST(CleanerTypesTest, ParseCategoryIgnoresCaseAndSpaces)
{
    CleanCategory category = CleanCategory::RecycleBin;
    EXPECT_TRUE(parseCategory(" Chrome-Cache ", category));
    EXPECT_EQ(category, CleanCategory::ChromeCache);
}

TEST(CleanerTypesTest, ParseCategoryRejectsUnknownIds)
{
    CleanCategory category = CleanCategory::UserTemp;
    EXPECT_FALSE(parseCategory("windows-update", category));
    EXPECT_FALSE(parseCategory("", category));
    EXPECT_EQ(category, CleanCategory::UserTemp);
}

TEST(CleanerTypesTest, BrowserCategories)
{
    EXPECT_TRUE(isBrowserCategory(CleanCategory::FirefoxCache));
    EXPECT_TRUE(isBrowserCategory(CleanCategory::OperaCache));
    EXPECT_FALSE(isBrowserCategory(CleanCategory::UserTemp));
    EXPECT_FALSE(isBrowserCategory(CleanCategory::RecycleBin));
}

TEST(CleanerTypesTest, ProgressFraction)
{
    ProgressEvent event;
    event.taskIndex = 1;
    event.taskCount = 4;
    EXPECT_DOUBLE_EQ(event.fraction(), 0.5);

    event.kind = ProgressEvent::Kind::RunFinished;
    event.taskIndex = 2;
    EXPECT_DOUBLE_EQ(event.fraction(), 1.0);

    ProgressEvent empty;
    EXPECT_DOUBLE_EQ(empty.fraction(), 1.0);
}
