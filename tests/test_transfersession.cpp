#include "transfersession.h"
#include <gtest/gtest.h>

namespace {

TransferSession makeSession(bool created = true)
{
    BackupTarget target;
    target.sourceScope = SourceScope::subfolder("DCIM");
    target.destinationPath = "/backups/phone";
    target.estimatedSizeBytes = 1000;
    return TransferSession(target, created);
}

} // namespace

TEST(SourceScopeTest, DevicePaths)
{
    EXPECT_EQ(SourceScope::fullDevice().devicePath(), QString("/sdcard"));
    EXPECT_EQ(SourceScope::subfolder("DCIM").devicePath(), QString("/sdcard/DCIM"));
}

TEST(TransferSessionTest, StartsPending)
{
    TransferSession session = makeSession();
    EXPECT_EQ(session.state(), TransferSession::Pending);
    EXPECT_FALSE(session.isTerminal());
    EXPECT_FALSE(session.hasRun());
    EXPECT_TRUE(session.createdDestinationDir());
    EXPECT_EQ(session.totalBytesEstimate(), 1000);
}

TEST(TransferSessionTest, RunningThenCompleted)
{
    TransferSession session = makeSession();
    ASSERT_TRUE(session.markRunning());
    EXPECT_TRUE(session.hasRun());
    EXPECT_TRUE(session.startTime().isValid());
    ASSERT_TRUE(session.markCompleted());
    EXPECT_TRUE(session.isTerminal());
}

TEST(TransferSessionTest, CannotCompleteWithoutRunning)
{
    TransferSession session = makeSession();
    EXPECT_FALSE(session.markCompleted());
    EXPECT_EQ(session.state(), TransferSession::Pending);
}

TEST(TransferSessionTest, CancelBeforeRunning)
{
    TransferSession session = makeSession();
    EXPECT_TRUE(session.markCancelled());
    EXPECT_EQ(session.state(), TransferSession::Cancelled);
    EXPECT_FALSE(session.hasRun());
}

TEST(TransferSessionTest, TerminalStatesAreFinal)
{
    TransferSession session = makeSession();
    ASSERT_TRUE(session.markRunning());
    ASSERT_TRUE(session.markFailed(FailureCause::DeviceDisconnected, QString()));

    EXPECT_FALSE(session.markRunning());
    EXPECT_FALSE(session.markCompleted());
    EXPECT_FALSE(session.markCancelled());
    EXPECT_EQ(session.state(), TransferSession::Failed);
    EXPECT_EQ(session.failureCause(), FailureCause::DeviceDisconnected);
    EXPECT_FALSE(session.failureMessage().isEmpty());
}

TEST(TransferSessionTest, SkippedEntriesAreCounted)
{
    TransferSession session = makeSession();
    session.recordSkippedEntry("/sdcard/Android/data/a");
    session.recordSkippedEntry("/sdcard/Android/data/b");
    EXPECT_EQ(session.skippedEntries(), 2);
    EXPECT_EQ(session.skippedPaths().first(), QString("/sdcard/Android/data/a"));
}

TEST(TransferSessionTest, CountersNeverNegative)
{
    TransferSession session = makeSession();
    session.setBytesTransferred(-5);
    session.setFilesTransferred(-1);
    EXPECT_EQ(session.bytesTransferred(), 0);
    EXPECT_EQ(session.filesTransferred(), 0);
}
