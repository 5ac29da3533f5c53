#include "supervisor/ProcessSupervisor.h"
#include "supervisor/ExecutableResolver.h"
#include "TestUtils.h"

#include <QFileInfo>
#include <QTemporaryDir>
#include <gtest/gtest.h>

namespace {

// Hands out a path as is, without checking it
class FixedResolver : public ExecutableResolver
{
public:
    explicit FixedResolver(const QString &path) : m_path(path) {}

    QString resolve(const QString &name, QString &errorMsg) const override
    {
        Q_UNUSED(name);
        Q_UNUSED(errorMsg);
        return m_path;
    }

private:
    QString m_path;
};

class ProcessSupervisorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
    }

    QString dir() const { return m_dir.path(); }

    EnvironmentOverrides modeFlag() const
    {
        EnvironmentOverrides env;
        env.insert("TAURI", "1");
        return env;
    }

    QTemporaryDir m_dir;
};

} // namespace

TEST_F(ProcessSupervisorTest, StartedWorkerIsAlive)
{
    writeScript(dir(), "worker", "exec sleep 30");
    SidecarResolver resolver(dir());
    ProcessSupervisor supervisor(&resolver);

    LaunchResult result = supervisor.start("worker", modeFlag(), 51423);

    ASSERT_TRUE(result.success) << result.errorMessage.toStdString();
    EXPECT_EQ(result.error, LaunchError::None);
    EXPECT_GT(result.worker.pid, 0);
    EXPECT_EQ(result.worker.port, 51423);
    EXPECT_EQ(result.worker.state, WorkerState::Running);
    EXPECT_TRUE(processExists(result.worker.pid));
    EXPECT_TRUE(supervisor.isRunning(result.worker.pid));
    EXPECT_EQ(supervisor.runningCount(), 1);
}

TEST_F(ProcessSupervisorTest, RecordsEnvironmentMarker)
{
    writeScript(dir(), "worker", "exec sleep 30");
    SidecarResolver resolver(dir());
    ProcessSupervisor supervisor(&resolver);
    supervisor.setMarkerVariable("TAURI");

    LaunchResult result = supervisor.start("worker", modeFlag());

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.worker.environmentMarker, QString("TAURI=1"));
}

TEST_F(ProcessSupervisorTest, MissingExecutableFailsWithoutProcess)
{
    SidecarResolver resolver(dir());
    ProcessSupervisor supervisor(&resolver);

    LaunchResult result = supervisor.start("does-not-exist", modeFlag());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, LaunchError::SpawnFailed);
    EXPECT_FALSE(result.errorMessage.isEmpty());
    EXPECT_EQ(result.worker.pid, 0);
    EXPECT_EQ(supervisor.runningCount(), 0);
}

TEST_F(ProcessSupervisorTest, NonExecutableFileFails)
{
    writeScript(dir(), "worker", "exec sleep 30", false);
    SidecarResolver resolver(dir());
    ProcessSupervisor supervisor(&resolver);

    LaunchResult result = supervisor.start("worker", modeFlag());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, LaunchError::SpawnFailed);
    EXPECT_EQ(supervisor.runningCount(), 0);
}

TEST_F(ProcessSupervisorTest, OsSpawnErrorCarriesErrorText)
{
    FixedResolver resolver(dir() + "/missing/worker");
    ProcessSupervisor supervisor(&resolver);

    LaunchResult result = supervisor.start("worker", modeFlag());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, LaunchError::SpawnFailed);
    EXPECT_TRUE(result.errorMessage.startsWith("Failed to start"));
    EXPECT_EQ(supervisor.runningCount(), 0);
}

TEST_F(ProcessSupervisorTest, NoResolverFails)
{
    ProcessSupervisor supervisor(nullptr);

    LaunchResult result = supervisor.start("worker", modeFlag());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, LaunchError::SpawnFailed);
}

TEST_F(ProcessSupervisorTest, ModeFlagOverridesInheritedValue)
{
    writeScript(dir(), "worker",
                "printf '%s' \"$TAURI\" > env.tmp && mv env.tmp env.out\n"
                "exec sleep 30");
    SidecarResolver resolver(dir());
    ProcessSupervisor supervisor(&resolver);

    qputenv("TAURI", "0");
    LaunchResult result = supervisor.start("worker", modeFlag());
    qunsetenv("TAURI");

    ASSERT_TRUE(result.success);
    const QString envFile = dir() + "/env.out";
    ASSERT_TRUE(waitUntil([&]() { return QFile::exists(envFile); }));
    EXPECT_EQ(readFile(envFile), QByteArray("1"));
}

TEST_F(ProcessSupervisorTest, InheritsCallerEnvironment)
{
    writeScript(dir(), "worker",
                "printf '%s' \"$SHELL_TEST_INHERITED\" > env.tmp && mv env.tmp env.out\n"
                "exec sleep 30");
    SidecarResolver resolver(dir());
    ProcessSupervisor supervisor(&resolver);

    qputenv("SHELL_TEST_INHERITED", "inherited");
    LaunchResult result = supervisor.start("worker", modeFlag());
    qunsetenv("SHELL_TEST_INHERITED");

    ASSERT_TRUE(result.success);
    const QString envFile = dir() + "/env.out";
    ASSERT_TRUE(waitUntil([&]() { return QFile::exists(envFile); }));
    EXPECT_EQ(readFile(envFile), QByteArray("inherited"));
}

TEST_F(ProcessSupervisorTest, RunsInExecutableDirectory)
{
    writeScript(dir(), "worker", "pwd -P > cwd.tmp && mv cwd.tmp cwd.out\nexec sleep 30");
    SidecarResolver resolver(dir());
    ProcessSupervisor supervisor(&resolver);

    ASSERT_TRUE(supervisor.start("worker", modeFlag()).success);

    const QString cwdFile = dir() + "/cwd.out";
    ASSERT_TRUE(waitUntil([&]() { return QFile::exists(cwdFile); }));
    EXPECT_EQ(QString::fromUtf8(readFile(cwdFile)).trimmed(), QFileInfo(dir()).canonicalFilePath());
}

TEST_F(ProcessSupervisorTest, ReapsExitedWorker)
{
    writeScript(dir(), "worker", "exit 0");
    SidecarResolver resolver(dir());
    ProcessSupervisor supervisor(&resolver);

    qint64 reapedPid = 0;
    QObject::connect(&supervisor, &ProcessSupervisor::workerReaped, [&reapedPid](qint64 pid) {
        reapedPid = pid;
    });

    LaunchResult result = supervisor.start("worker", modeFlag());
    ASSERT_TRUE(result.success);

    ASSERT_TRUE(waitUntil([&]() { return reapedPid != 0; }));
    EXPECT_EQ(reapedPid, result.worker.pid);
    EXPECT_EQ(supervisor.runningCount(), 0);
    EXPECT_FALSE(supervisor.isRunning(result.worker.pid));
    // Reaped, so not even a zombie is left
    EXPECT_TRUE(waitUntil([&]() { return !processExists(result.worker.pid); }));
}

TEST_F(ProcessSupervisorTest, ReapsCrashedWorker)
{
    writeScript(dir(), "worker", "kill -9 $$");
    SidecarResolver resolver(dir());
    ProcessSupervisor supervisor(&resolver);

    bool reaped = false;
    QObject::connect(&supervisor, &ProcessSupervisor::workerReaped, [&reaped](qint64) {
        reaped = true;
    });

    ASSERT_TRUE(supervisor.start("worker", modeFlag()).success);
    ASSERT_TRUE(waitUntil([&]() { return reaped; }));
    EXPECT_EQ(supervisor.runningCount(), 0);
}

TEST_F(ProcessSupervisorTest, ReapsWorkerKilledFromOutside)
{
    writeScript(dir(), "worker", "exec sleep 30");
    SidecarResolver resolver(dir());
    ProcessSupervisor supervisor(&resolver);

    LaunchResult result = supervisor.start("worker", modeFlag());
    ASSERT_TRUE(result.success);

    ::kill(static_cast<pid_t>(result.worker.pid), SIGTERM);

    ASSERT_TRUE(waitUntil([&]() { return supervisor.runningCount() == 0; }));
    EXPECT_TRUE(waitUntil([&]() { return !processExists(result.worker.pid); }));
}

TEST_F(ProcessSupervisorTest, StartDoesNotWaitForWorker)
{
    writeScript(dir(), "worker", "sleep 2\nexit 0");
    SidecarResolver resolver(dir());
    ProcessSupervisor supervisor(&resolver);

    QElapsedTimer timer;
    timer.start();
    LaunchResult result = supervisor.start("worker", modeFlag());
    const qint64 elapsed = timer.elapsed();

    ASSERT_TRUE(result.success);
    EXPECT_LT(elapsed, 1000);
    EXPECT_EQ(supervisor.runningCount(), 1);
}

TEST_F(ProcessSupervisorTest, StopAllTerminatesWorkers)
{
    writeScript(dir(), "worker", "exec sleep 30");
    SidecarResolver resolver(dir());
    ProcessSupervisor supervisor(&resolver);

    LaunchResult first = supervisor.start("worker", modeFlag());
    LaunchResult second = supervisor.start("worker", modeFlag());
    ASSERT_TRUE(first.success);
    ASSERT_TRUE(second.success);

    supervisor.stopAll(2000);

    EXPECT_EQ(supervisor.runningCount(), 0);
    EXPECT_FALSE(processExists(first.worker.pid));
    EXPECT_FALSE(processExists(second.worker.pid));
}

TEST_F(ProcessSupervisorTest, DestructorStopsRunningWorkers)
{
    writeScript(dir(), "worker", "exec sleep 30");
    SidecarResolver resolver(dir());
    qint64 pid = 0;
    {
        ProcessSupervisor supervisor(&resolver);
        LaunchResult result = supervisor.start("worker", modeFlag());
        ASSERT_TRUE(result.success);
        pid = result.worker.pid;
    }
    EXPECT_FALSE(processExists(pid));
}

TEST(ProcessSupervisorEnvironmentTest, OverridesWinOverSystemEnvironment)
{
    qputenv("SHELL_TEST_MERGE", "system");
    EnvironmentOverrides overrides;
    overrides.insert("SHELL_TEST_MERGE", "override");
    overrides.insert("SHELL_TEST_ADDED", "added");

    QProcessEnvironment env = ProcessSupervisor::mergedEnvironment(overrides);
    qunsetenv("SHELL_TEST_MERGE");

    EXPECT_EQ(env.value("SHELL_TEST_MERGE"), QString("override"));
    EXPECT_EQ(env.value("SHELL_TEST_ADDED"), QString("added"));
    EXPECT_TRUE(env.contains("PATH"));
}
