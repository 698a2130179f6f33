#include "backupengine.h"
#include "backupjournal.h"
#include "fakeadb.h"
#include "interruptguard.h"
#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include <gtest/gtest.h>

namespace {

// Respuestas fijas para el motor
class ScriptedPrompter : public BackupPrompter
{
public:
    int deviceIndex = 0;
    QString destination;
    bool acceptNetwork = false;
    SourceScope scope = SourceScope::subfolder("DCIM");
    bool scopeChosen = true;
    qint64 estimate = 10000;
    bool acceptDiskSpace = false;
    ConflictChoice conflictChoice = ConflictChoice::Merge;

    int deviceCalls = 0;
    int networkCalls = 0;
    int scopeCalls = 0;
    int diskCalls = 0;
    int conflictCalls = 0;
    QStringList offeredFolders;
    DiskSpaceReport lastReport;

    int chooseDevice(const QList<DeviceInfo> &) override
    {
        ++deviceCalls;
        return deviceIndex;
    }

    QString chooseDestination(const QString &defaultPath) override
    {
        return destination.isNull() ? defaultPath : destination;
    }

    bool confirmNetworkDestination(const PathValidation &) override
    {
        ++networkCalls;
        return acceptNetwork;
    }

    SourceScope chooseScope(const QStringList &folders, bool *ok) override
    {
        ++scopeCalls;
        offeredFolders = folders;
        *ok = scopeChosen;
        return scope;
    }

    qint64 estimateSizeBytes() override { return estimate; }

    bool confirmDiskSpace(const DiskSpaceReport &report) override
    {
        ++diskCalls;
        lastReport = report;
        return acceptDiskSpace;
    }

    ConflictChoice chooseConflictAction(const QString &, int) override
    {
        ++conflictCalls;
        return conflictChoice;
    }
};

const char kCopyTwoFiles[] =
    "mkdir -p \"$dest/DCIM/Camera\"\n"
    "head -c 3000 /dev/zero > \"$dest/DCIM/Camera/a.jpg\"\n"
    "echo \"[ 60%] $src/Camera/a.jpg: 100%\"\n"
    "head -c 2000 /dev/zero > \"$dest/DCIM/Camera/b.jpg\"\n"
    "echo \"$src/: 2 files pulled, 0 skipped. 2.0 MB/s (5000 bytes in 0.002s)\"\n"
    "exit 0";

bool touch(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly))
        return false;
    file.write("previous");
    return true;
}

} // namespace

class BackupEngineTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        InterruptGuard::reset();
        ASSERT_TRUE(adb.isValid());
        ASSERT_TRUE(root.isValid());
        ASSERT_TRUE(manager.setupAdb(adb.path()));
        adb.setupConnectedDevice();
        adb.setPullScript(kCopyTwoFiles);

        engine.reset(new BackupEngine(&manager));
        engine->setSampleIntervalMs(50);
        prompter.destination = root.path() + "/backup";
    }

    void TearDown() override
    {
        InterruptGuard::reset();
    }

    bool pullInvoked() const
    {
        return adb.wasInvoked(QString("-s %1 pull").arg(QString::fromLatin1(FakeAdb::kSerial)));
    }

    FakeAdb adb;
    QTemporaryDir root;
    DeviceManager manager;
    QScopedPointer<BackupEngine> engine;
    ScriptedPrompter prompter;
};

TEST_F(BackupEngineTest, NewDestinationCompletes)
{
    BackupOutcome outcome = engine->run(prompter, QString());

    EXPECT_EQ(outcome.result, BackupOutcome::Completed);
    EXPECT_EQ(outcome.exitCode(), 0);
    EXPECT_TRUE(outcome.session.createdDestinationDir());
    EXPECT_EQ(outcome.session.state(), TransferSession::Completed);
    EXPECT_EQ(outcome.session.bytesTransferred(), 5000);
    EXPECT_EQ(outcome.cleanup, CleanupSupervisor::NotRequired);
    EXPECT_EQ(prompter.conflictCalls, 0);
    EXPECT_EQ(outcome.deviceSerial, QString(FakeAdb::kSerial));
    EXPECT_FALSE(outcome.summary.isEmpty());

    const QString dest = prompter.destination;
    EXPECT_TRUE(QFile::exists(dest + "/DCIM/Camera/a.jpg"));
    EXPECT_TRUE(QFile::exists(dest + "/" + BackupJournal::kCompletionMarkerName));
}

TEST_F(BackupEngineTest, StorageFoldersAreOffered)
{
    engine->run(prompter, QString());
    EXPECT_EQ(prompter.offeredFolders, QStringList() << "DCIM" << "Download" << "Music");
}

TEST_F(BackupEngineTest, ProgressReachesCompletion)
{
    QList<ProgressSnapshot> snapshots;
    QObject::connect(engine.data(), &BackupEngine::progressUpdated,
                     [&snapshots](const ProgressSnapshot &snapshot) { snapshots.append(snapshot); });

    engine->run(prompter, QString());

    ASSERT_FALSE(snapshots.isEmpty());
    for (const ProgressSnapshot &snapshot : snapshots) {
        EXPECT_GE(snapshot.rateBytesPerSec, 0.0);
        EXPECT_GE(snapshot.percent, 0.0);
        EXPECT_LE(snapshot.percent, 1.0);
    }
    EXPECT_TRUE(snapshots.last().finished);
    EXPECT_DOUBLE_EQ(snapshots.last().percent, 1.0);
}

TEST_F(BackupEngineTest, CancelOnConflictLeavesDestinationUntouched)
{
    const QString dest = prompter.destination;
    ASSERT_TRUE(QDir().mkpath(dest));
    ASSERT_TRUE(touch(dest + "/keep.jpg"));
    prompter.conflictChoice = ConflictChoice::Cancel;

    BackupOutcome outcome = engine->run(prompter, QString());

    EXPECT_EQ(outcome.result, BackupOutcome::Cancelled);
    EXPECT_EQ(outcome.exitCode(), 2);
    EXPECT_EQ(prompter.conflictCalls, 1);
    EXPECT_FALSE(pullInvoked());
    EXPECT_EQ(QDir(dest).entryList(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden),
              QStringList() << "keep.jpg");
}

TEST_F(BackupEngineTest, DecliningLowDiskSpaceNeverStartsTransfer)
{
    prompter.estimate = Q_INT64_C(1) << 60;
    prompter.acceptDiskSpace = false;

    BackupOutcome outcome = engine->run(prompter, QString());

    EXPECT_EQ(prompter.diskCalls, 1);
    EXPECT_EQ(prompter.lastReport.verdict, DiskSpaceReport::Insufficient);
    EXPECT_EQ(outcome.result, BackupOutcome::Cancelled);
    EXPECT_EQ(outcome.category, FailureCategory::InsufficientSpace);
    EXPECT_FALSE(outcome.session.hasRun());
    EXPECT_FALSE(pullInvoked());
    EXPECT_FALSE(QDir(prompter.destination).exists());
}

TEST_F(BackupEngineTest, InterruptRemovesFreshDestination)
{
    adb.setPullScript(
        "mkdir -p \"$dest/DCIM\"\n"
        "head -c 4096 /dev/zero > \"$dest/DCIM/a.jpg\"\n"
        "echo \"[ 10%] $src/a.jpg: 100%\"\n"
        "exec sleep 30");

    QObject::connect(engine.data(), &BackupEngine::progressUpdated, [](const ProgressSnapshot &snapshot) {
        if (snapshot.bytesTransferred > 0)
            InterruptGuard::raiseForTesting();
    });

    BackupOutcome outcome = engine->run(prompter, QString());

    EXPECT_EQ(outcome.result, BackupOutcome::Cancelled);
    EXPECT_EQ(outcome.category, FailureCategory::Interrupted);
    EXPECT_TRUE(outcome.session.hasRun());
    EXPECT_EQ(outcome.cleanup, CleanupSupervisor::Removed);
    EXPECT_FALSE(QDir(prompter.destination).exists());
}

TEST_F(BackupEngineTest, FailureKeepsPreexistingDestination)
{
    const QString dest = prompter.destination;
    ASSERT_TRUE(QDir().mkpath(dest));
    ASSERT_TRUE(touch(dest + "/keep.jpg"));
    prompter.conflictChoice = ConflictChoice::Merge;
    adb.setPullScript(
        "head -c 100 /dev/zero > \"$dest/partial.bin\"\n"
        "echo \"adb: error: device offline\"\n"
        "exit 1");

    QStringList statuses;
    QObject::connect(engine.data(), &BackupEngine::statusMessage,
                     [&statuses](const QString &message) { statuses.append(message); });

    BackupOutcome outcome = engine->run(prompter, QString());

    EXPECT_EQ(outcome.result, BackupOutcome::Failed);
    EXPECT_EQ(outcome.category, FailureCategory::DeviceDisconnected);
    EXPECT_EQ(outcome.exitCode(), 1);
    EXPECT_FALSE(statuses.filter("reconectar").isEmpty());
    EXPECT_EQ(outcome.cleanup, CleanupSupervisor::Preserved);
    EXPECT_TRUE(QFile::exists(dest + "/keep.jpg"));
    EXPECT_TRUE(QFile::exists(dest + "/" + BackupJournal::kErrorLogName));
}

TEST_F(BackupEngineTest, PermissionDeniedEntryIsSkipped)
{
    adb.clearPullScript();
    adb.addDeviceFile("/sdcard/DCIM/Camera/a.jpg", QByteArray(100, 'a'));
    adb.addDeviceFile("/sdcard/DCIM/Camera/secret.jpg", QByteArray(100, 's'));
    adb.addDeviceFile("/sdcard/DCIM/Camera/z.jpg", QByteArray(100, 'z'));
    adb.addDeviceFile("/sdcard/DCIM/Screenshots/shot.png", QByteArray(100, 'p'));
    adb.denyDeviceEntry("/sdcard/DCIM/Camera/secret.jpg");

    QStringList skipped;
    QObject::connect(engine.data(), &BackupEngine::entrySkipped,
                     [&skipped](const QString &path) { skipped.append(path); });

    BackupOutcome outcome = engine->run(prompter, QString());

    EXPECT_EQ(outcome.result, BackupOutcome::Completed);
    EXPECT_EQ(outcome.session.state(), TransferSession::Completed);
    EXPECT_EQ(outcome.session.skippedEntries(), 1);
    EXPECT_EQ(skipped, QStringList() << "/sdcard/DCIM/Camera/secret.jpg");
    EXPECT_EQ(outcome.session.filesTransferred(), 3);

    // Las entradas posteriores a la denegada también se copian
    const QString dest = prompter.destination;
    EXPECT_TRUE(QFile::exists(dest + "/DCIM/Camera/a.jpg"));
    EXPECT_TRUE(QFile::exists(dest + "/DCIM/Camera/z.jpg"));
    EXPECT_TRUE(QFile::exists(dest + "/DCIM/Screenshots/shot.png"));
    EXPECT_FALSE(QFile::exists(dest + "/DCIM/Camera/secret.jpg"));
    EXPECT_TRUE(QFile::exists(dest + "/" + BackupJournal::kCompletionMarkerName));

    QFile log(dest + "/" + BackupJournal::kErrorLogName);
    ASSERT_TRUE(log.open(QIODevice::ReadOnly));
    EXPECT_TRUE(log.readAll().contains("Permission denied"));
}

TEST_F(BackupEngineTest, RejectedDestinationIsNeverWritten)
{
    prompter.destination = "/etc/android-backup";

    BackupOutcome outcome = engine->run(prompter, QString());

    EXPECT_EQ(outcome.result, BackupOutcome::Failed);
    EXPECT_EQ(outcome.category, FailureCategory::RejectedDestination);
    EXPECT_EQ(outcome.exitCode(), 1);
    EXPECT_EQ(prompter.scopeCalls, 0);
    EXPECT_FALSE(pullInvoked());
    EXPECT_FALSE(QDir("/etc/android-backup").exists());
}

TEST_F(BackupEngineTest, DecliningNetworkDestinationCancels)
{
    prompter.destination = "//nas/share/phone";
    prompter.acceptNetwork = false;

    BackupOutcome outcome = engine->run(prompter, QString());

    EXPECT_EQ(prompter.networkCalls, 1);
    EXPECT_EQ(outcome.result, BackupOutcome::Cancelled);
    EXPECT_EQ(outcome.category, FailureCategory::NetworkDrive);
    EXPECT_EQ(prompter.scopeCalls, 0);
}

TEST_F(BackupEngineTest, ReplaceClearsPreviousBackup)
{
    const QString dest = prompter.destination;
    ASSERT_TRUE(QDir().mkpath(dest));
    ASSERT_TRUE(touch(dest + "/stale.jpg"));
    prompter.conflictChoice = ConflictChoice::Replace;

    BackupOutcome outcome = engine->run(prompter, QString());

    EXPECT_EQ(outcome.result, BackupOutcome::Completed);
    EXPECT_FALSE(outcome.session.createdDestinationDir());
    EXPECT_FALSE(QFile::exists(dest + "/stale.jpg"));
    EXPECT_TRUE(QFile::exists(dest + "/DCIM/Camera/b.jpg"));
}

TEST_F(BackupEngineTest, MissingSourceFolderFailsAndCleansUp)
{
    prompter.scope = SourceScope::subfolder("Movies");

    BackupOutcome outcome = engine->run(prompter, QString());

    EXPECT_EQ(outcome.result, BackupOutcome::Failed);
    EXPECT_EQ(outcome.category, FailureCategory::SourceMissing);
    EXPECT_FALSE(outcome.session.hasRun());
    EXPECT_EQ(outcome.cleanup, CleanupSupervisor::Removed);
    EXPECT_FALSE(pullInvoked());
}

TEST_F(BackupEngineTest, UnauthorizedDeviceStopsEarly)
{
    adb.setDevices(QStringList() << "ABC123\tunauthorized usb:1-1 transport_id:2");

    BackupOutcome outcome = engine->run(prompter, QString());

    EXPECT_EQ(outcome.result, BackupOutcome::Failed);
    EXPECT_EQ(outcome.category, FailureCategory::Unauthorized);
    EXPECT_FALSE(QDir(prompter.destination).exists());
}

TEST_F(BackupEngineTest, NoDeviceConnected)
{
    adb.setDevices(QStringList());

    QStringList statuses;
    QObject::connect(engine.data(), &BackupEngine::statusMessage,
                     [&statuses](const QString &message) { statuses.append(message); });

    BackupOutcome outcome = engine->run(prompter, QString());
    EXPECT_EQ(outcome.category, FailureCategory::NotConnected);
    EXPECT_EQ(outcome.exitCode(), 1);
    EXPECT_TRUE(adb.wasInvoked("kill-server"));
    EXPECT_FALSE(statuses.filter("Reiniciando el servidor de ADB").isEmpty());
}

TEST(BackupEngineSpaceTest, DeclinedVerdictKeepsItsOwnCategory)
{
    EXPECT_EQ(declinedSpaceCategory(DiskSpaceReport::Insufficient), FailureCategory::InsufficientSpace);
    EXPECT_EQ(declinedSpaceCategory(DiskSpaceReport::Marginal), FailureCategory::MarginalSpace);
    EXPECT_EQ(declinedSpaceCategory(DiskSpaceReport::Unknown), FailureCategory::UnknownSpace);
    EXPECT_NE(failureCategoryName(FailureCategory::UnknownSpace),
              failureCategoryName(FailureCategory::MarginalSpace));
}

TEST_F(BackupEngineTest, SeveralDevicesAskForChoice)
{
    adb.setDevices(QStringList()
                   << QString("%1\tdevice model:Pixel_7").arg(QString(FakeAdb::kSerial))
                   << "emulator-5554\tdevice model:sdk_gphone64");
    prompter.deviceIndex = -1;

    BackupOutcome outcome = engine->run(prompter, QString());

    EXPECT_EQ(prompter.deviceCalls, 1);
    EXPECT_EQ(outcome.result, BackupOutcome::Cancelled);
    EXPECT_EQ(outcome.category, FailureCategory::UserCancelled);
}

TEST_F(BackupEngineTest, SecondRunIsRefusedWhileActive)
{
    BackupOutcome nested;
    bool attempted = false;
    BackupEngine *rawEngine = engine.data();
    ScriptedPrompter *rawPrompter = &prompter;
    QObject::connect(rawEngine, &BackupEngine::progressUpdated,
                     [rawEngine, rawPrompter, &nested, &attempted](const ProgressSnapshot &) {
        if (!attempted) {
            attempted = true;
            nested = rawEngine->run(*rawPrompter, QString());
        }
    });

    BackupOutcome outcome = engine->run(prompter, QString());

    EXPECT_TRUE(attempted);
    EXPECT_EQ(nested.category, FailureCategory::AlreadyRunning);
    EXPECT_EQ(outcome.result, BackupOutcome::Completed);
    EXPECT_FALSE(engine->isRunning());
}

TEST(BackupEngineWithoutAdbTest, BridgeUnavailable)
{
    BackupEngine engine(nullptr);
    ScriptedPrompter prompter;

    BackupOutcome outcome = engine.run(prompter, "/tmp/unused");
    EXPECT_EQ(outcome.result, BackupOutcome::Failed);
    EXPECT_EQ(outcome.category, FailureCategory::BridgeUnavailable);
}
