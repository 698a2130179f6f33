#include "conflictresolver.h"
#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include <gtest/gtest.h>

namespace {

bool writeFile(const QString &path, const QByteArray &content)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly))
        return false;
    return file.write(content) == content.size();
}

ConflictResolver::ChoiceCallback always(ConflictChoice choice, int *calls = nullptr)
{
    return [choice, calls](const QString &, int) {
        if (calls) ++*calls;
        return choice;
    };
}

} // namespace

TEST(ConflictResolverTest, CreatesMissingDestination)
{
    QTemporaryDir root;
    ASSERT_TRUE(root.isValid());
    const QString target = root.path() + "/new/backup";

    int calls = 0;
    ConflictResolution result = ConflictResolver().resolve(target, always(ConflictChoice::Cancel, &calls));

    EXPECT_EQ(result.outcome, ConflictResolution::Proceed);
    EXPECT_TRUE(result.createdNew);
    EXPECT_TRUE(QDir(target).exists());
    EXPECT_EQ(calls, 0);
}

TEST(ConflictResolverTest, EmptyDirectoryNeedsNoDecision)
{
    QTemporaryDir root;
    ASSERT_TRUE(root.isValid());

    int calls = 0;
    ConflictResolution result = ConflictResolver().resolve(root.path(), always(ConflictChoice::Cancel, &calls));
    EXPECT_EQ(result.outcome, ConflictResolution::Proceed);
    EXPECT_FALSE(result.createdNew);
    EXPECT_EQ(calls, 0);
}

TEST(ConflictResolverTest, MergeKeepsExistingFiles)
{
    QTemporaryDir root;
    ASSERT_TRUE(root.isValid());
    ASSERT_TRUE(writeFile(root.path() + "/old.jpg", "old"));

    ConflictResolver resolver;
    for (int i = 0; i < 2; ++i) {
        ConflictResolution result = resolver.resolve(root.path(), always(ConflictChoice::Merge));
        EXPECT_EQ(result.outcome, ConflictResolution::Proceed);
        EXPECT_FALSE(result.createdNew);
        EXPECT_EQ(result.existingEntries, 1);
        EXPECT_TRUE(QFile::exists(root.path() + "/old.jpg"));
    }
}

TEST(ConflictResolverTest, ReplaceClearsContentsButKeepsDirectory)
{
    QTemporaryDir root;
    ASSERT_TRUE(root.isValid());
    ASSERT_TRUE(QDir(root.path()).mkpath("DCIM/Camera"));
    ASSERT_TRUE(writeFile(root.path() + "/DCIM/Camera/a.jpg", "a"));
    ASSERT_TRUE(writeFile(root.path() + "/notes.txt", "n"));
    ASSERT_TRUE(writeFile(root.path() + "/.hidden", "h"));

    ConflictResolution result = ConflictResolver().resolve(root.path(), always(ConflictChoice::Replace));

    EXPECT_EQ(result.outcome, ConflictResolution::Proceed);
    EXPECT_FALSE(result.createdNew);
    EXPECT_TRUE(QDir(root.path()).exists());
    EXPECT_EQ(ConflictResolver::countEntries(root.path()), 0);
}

TEST(ConflictResolverTest, ReplaceDoesNotFollowSymlinks)
{
    QTemporaryDir root;
    QTemporaryDir outside;
    ASSERT_TRUE(root.isValid());
    ASSERT_TRUE(outside.isValid());
    ASSERT_TRUE(writeFile(outside.path() + "/keep.txt", "keep"));
    ASSERT_TRUE(QFile::link(outside.path(), root.path() + "/link"));

    ConflictResolution result = ConflictResolver().resolve(root.path(), always(ConflictChoice::Replace));

    EXPECT_EQ(result.outcome, ConflictResolution::Proceed);
    EXPECT_TRUE(QFile::exists(outside.path() + "/keep.txt"));
}

TEST(ConflictResolverTest, CancelLeavesEverythingUntouched)
{
    QTemporaryDir root;
    ASSERT_TRUE(root.isValid());
    ASSERT_TRUE(writeFile(root.path() + "/old.jpg", "old"));

    ConflictResolution result = ConflictResolver().resolve(root.path(), always(ConflictChoice::Cancel));
    EXPECT_EQ(result.outcome, ConflictResolution::Cancelled);
    EXPECT_TRUE(QFile::exists(root.path() + "/old.jpg"));
}

TEST(ConflictResolverTest, MissingCallbackCancels)
{
    QTemporaryDir root;
    ASSERT_TRUE(root.isValid());
    ASSERT_TRUE(writeFile(root.path() + "/old.jpg", "old"));

    ConflictResolution result = ConflictResolver().resolve(root.path(), ConflictResolver::ChoiceCallback());
    EXPECT_EQ(result.outcome, ConflictResolution::Cancelled);
}

TEST(ConflictResolverTest, RegularFileIsAFailure)
{
    QTemporaryDir root;
    ASSERT_TRUE(root.isValid());
    const QString file = root.path() + "/file";
    ASSERT_TRUE(writeFile(file, "x"));

    ConflictResolution result = ConflictResolver().resolve(file, always(ConflictChoice::Merge));
    EXPECT_EQ(result.outcome, ConflictResolution::Failed);
    EXPECT_FALSE(result.message.isEmpty());
}
