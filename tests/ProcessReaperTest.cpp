#include "FakeHost.h"
#include "ProcessReaper.h"
#include <csignal>
#include <gtest/gtest.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

// Signals go to an in-memory process table instead of the kernel.
class TableReaper : public ProcessReaper {
public:
    TableReaper(CommandRunner& runner, const Timings& timings, const std::string& proc_root)
        : ProcessReaper(runner, timings, proc_root) {}

    std::set<pid_t> alive;
    std::set<pid_t> ignores_term;
    std::set<pid_t> unkillable;
    std::vector<std::pair<pid_t, int>> signals;

protected:
    bool is_alive(pid_t pid) override { return alive.count(pid) != 0; }

    bool send_signal(pid_t pid, int signal_number) override {
        signals.emplace_back(pid, signal_number);
        if (unkillable.count(pid) != 0) {
            return false;
        }
        if (signal_number == SIGKILL || ignores_term.count(pid) == 0) {
            alive.erase(pid);
        }
        return true;
    }
};

class ProcessReaperTest : public ::testing::Test {
protected:
    ProcessReaperTest() : proc(scratch.mkdir("proc")), reaper(runner, timings, proc) {}

    void add_process(pid_t pid, const std::string& root, const std::string& comm) {
        const std::string dir = scratch.mkdir("proc/" + std::to_string(pid));
        fs::create_directory_symlink(root, dir + "/root");
        scratch.write("proc/" + std::to_string(pid) + "/comm", comm + "\n");
    }

    ScratchDir scratch;
    Timings timings = instant_timings();
    FakeCommandRunner runner;
    std::string proc;
    TableReaper reaper;
};

} // namespace

TEST(ProcessReaperParseTest, StripsAccessModeSuffixes) {
    const std::vector<pid_t> expected = {1234, 5678, 42};
    EXPECT_EQ(ProcessReaper::parse_pid_list(" 1234c 5678m\n42\n"), expected);
    EXPECT_TRUE(ProcessReaper::parse_pid_list("/mnt/chroot: \n").empty());
    EXPECT_TRUE(ProcessReaper::parse_pid_list("").empty());
}

TEST_F(ProcessReaperTest, FindsProcessesChrootedBelowRoot) {
    const std::string root = fs::weakly_canonical(scratch.mkdir("root")).string();
    scratch.mkdir("root/srv");
    scratch.mkdir("rootfs");
    add_process(900001, root, "bash");
    add_process(900002, root + "/srv", "nginx");
    add_process(900003, "/", "systemd");
    add_process(900004, fs::weakly_canonical(scratch.sub("rootfs")).string(), "sshd");
    scratch.mkdir("proc/self");
    scratch.write("proc/uptime", "1.0 1.0\n");

    auto processes = reaper.find_chroot_processes(root + "/");

    ASSERT_EQ(processes.size(), 2u);
    EXPECT_EQ(processes[0].pid, 900001);
    EXPECT_EQ(processes[0].command, "bash");
    EXPECT_EQ(processes[1].pid, 900002);
    EXPECT_EQ(processes[1].command, "nginx");
}

TEST_F(ProcessReaperTest, SkipsCallingProcess) {
    const std::string root = fs::weakly_canonical(scratch.mkdir("root")).string();
    add_process(getpid(), root, "chroot-tool");
    EXPECT_TRUE(reaper.find_chroot_processes(root).empty());
}

TEST_F(ProcessReaperTest, MergesFuserAndLsof) {
    runner.script("fuser -m /mnt/chroot", command_ok(" 900001c 900002m"));
    runner.script("lsof -t +D /mnt/chroot", command_ok("900002\n900003\n"));
    reaper.alive = {900001, 900002, 900003};
    scratch.write("proc/900003/comm", "vim\n");

    auto users = reaper.find_users("/mnt/chroot");

    ASSERT_EQ(users.size(), 3u);
    EXPECT_EQ(users[0].pid, 900001);
    EXPECT_EQ(users[0].command, "unknown");
    EXPECT_EQ(users[2].pid, 900003);
    EXPECT_EQ(users[2].command, "vim");
}

TEST_F(ProcessReaperTest, IgnoresDeadAndOwnPids) {
    runner.script("fuser -m /mnt/chroot", command_ok(std::to_string(getpid()) + " 900001 900005"));
    runner.missing_tools.insert("lsof");
    reaper.alive = {getpid(), 900001};

    auto users = reaper.find_users("/mnt/chroot");

    ASSERT_EQ(users.size(), 1u);
    EXPECT_EQ(users[0].pid, 900001);
}

TEST_F(ProcessReaperTest, WithoutToolsNothingIsFound) {
    runner.missing_tools = {"fuser", "lsof"};
    EXPECT_TRUE(reaper.find_users("/mnt/chroot").empty());
    EXPECT_TRUE(runner.calls.empty());
}

TEST_F(ProcessReaperTest, TermThenKillForSurvivors) {
    runner.script("fuser -m /mnt/chroot/home", command_ok("900001 900002"));
    runner.missing_tools.insert("lsof");
    reaper.alive = {900001, 900002};
    reaper.ignores_term = {900002};

    EXPECT_TRUE(reaper.evict_users("/mnt/chroot/home"));

    const std::vector<std::pair<pid_t, int>> expected = {
        {900001, SIGTERM}, {900002, SIGTERM}, {900002, SIGKILL}};
    EXPECT_EQ(reaper.signals, expected);
    EXPECT_TRUE(reaper.alive.empty());
}

TEST_F(ProcessReaperTest, ReportsProcessesThatCannotBeKilled) {
    const std::string root = fs::weakly_canonical(scratch.mkdir("root")).string();
    add_process(900001, root, "bash");
    reaper.alive = {900001};
    reaper.unkillable = {900001};

    EXPECT_FALSE(reaper.evict_chroot_processes(root));
}

TEST_F(ProcessReaperTest, NothingToEvict) {
    runner.missing_tools.insert("lsof");
    EXPECT_TRUE(reaper.evict_users("/mnt/chroot"));
    EXPECT_TRUE(reaper.signals.empty());
}
