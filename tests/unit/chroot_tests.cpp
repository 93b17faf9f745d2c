#include <doctest/doctest.h>
#include <katsu/chroot.hpp>

#include "support/recording_runner.hpp"
#include "support/temp_dir.hpp"

#include <set>

namespace fs = std::filesystem;
using namespace katsu;
using katsu::test::RecordingRunner;
using katsu::test::TempDir;
using katsu::test::joined_args;
using katsu::test::write_file;
using katsu::test::slurp;

namespace {

// Tracks the set of live mount targets from the recorded mount/umount calls
struct MountTracker {
    std::set<std::string> live;

    void attach(RecordingRunner& runner) {
        runner.handler = [this](const Command& cmd) -> std::optional<RecordingRunner::Reply> {
            if (cmd.program == "mount") live.insert(cmd.args.back());
            if (cmd.program == "umount") live.erase(cmd.args.back());
            return std::nullopt;
        };
    }
};

HostPaths host_with_resolv(const TempDir& tmp) {
    HostPaths host;
    host.resolv_conf = tmp.sub("host/resolv.conf");
    write_file(host.resolv_conf, "nameserver 192.0.2.53\n");
    return host;
}

} // namespace

TEST_CASE("prepare mounts proc, sys, dev and dev/pts in order") {
    TempDir tmp;
    RecordingRunner runner;
    BuildContext ctx{runner, Workspace{tmp.path()}, host_with_resolv(tmp)};
    std::string root = tmp.sub("chroot");

    ChrootScope scope(ctx, root);
    REQUIRE(scope.prepare().ok);

    auto mounts = runner.with_program("mount");
    REQUIRE(mounts.size() == 4);
    CHECK(joined_args(mounts[0]) == "-t proc proc " + root + "/proc");
    CHECK(joined_args(mounts[1]) == "-t sysfs sysfs " + root + "/sys");
    CHECK(joined_args(mounts[2]) == "--bind /dev " + root + "/dev");
    CHECK(joined_args(mounts[3]) == "--bind /dev/pts " + root + "/dev/pts");
    CHECK(scope.mounted().size() == 4);

    CHECK(slurp(root + "/etc/resolv.conf") == "nameserver 192.0.2.53\n");

    REQUIRE(scope.teardown().ok);
    auto umounts = runner.with_program("umount");
    REQUIRE(umounts.size() == 4);
    CHECK(joined_args(umounts[0]) == root + "/dev/pts");
    CHECK(joined_args(umounts[3]) == root + "/proc");
    CHECK(scope.mounted().empty());
}

TEST_CASE("with_chroot mounts during the body and releases afterwards") {
    TempDir tmp;
    RecordingRunner runner;
    MountTracker tracker;
    tracker.attach(runner);
    BuildContext ctx{runner, Workspace{tmp.path()}, host_with_resolv(tmp)};
    std::string root = tmp.sub("chroot");

    SUBCASE("body succeeds") {
        size_t during = 0;
        Status s = with_chroot(ctx, root, [&]() {
            during = tracker.live.size();
            return ok_status();
        });
        CHECK(s.ok);
        CHECK(during == 4);
        CHECK(tracker.live.empty());
    }

    SUBCASE("body fails") {
        Status s = with_chroot(ctx, root, [&]() {
            return make_error(ErrorKind::ExternalFailure, "dnf exploded");
        });
        CHECK_FALSE(s.ok);
        CHECK(s.error == "dnf exploded");
        CHECK(tracker.live.empty());
    }
}

TEST_CASE("teardown failure does not mask the body's error") {
    TempDir tmp;
    RecordingRunner runner;
    runner.reply("umount", 32, "", "target is busy");
    BuildContext ctx{runner, Workspace{tmp.path()}, host_with_resolv(tmp)};

    Status failed_body = with_chroot(ctx, tmp.sub("chroot"), [&]() {
        return make_error(ErrorKind::ExternalFailure, "install failed");
    });
    CHECK(failed_body.error == "install failed");
    // every mount is still attempted
    CHECK(runner.count("umount") == 4);

    Status ok_body = with_chroot(ctx, tmp.sub("chroot"), [&]() { return ok_status(); });
    CHECK_FALSE(ok_body.ok);
    CHECK(ok_body.kind == ErrorKind::IoFailure);
}

TEST_CASE("a failed mount unwinds the mounts already made") {
    TempDir tmp;
    RecordingRunner runner;
    MountTracker tracker;
    runner.handler = [&](const Command& cmd) -> std::optional<RecordingRunner::Reply> {
        if (cmd.program == "mount" && cmd.args.back().find("/dev/pts") != std::string::npos) {
            return RecordingRunner::Reply{32, "", "no pts"};
        }
        if (cmd.program == "mount") tracker.live.insert(cmd.args.back());
        if (cmd.program == "umount") tracker.live.erase(cmd.args.back());
        return std::nullopt;
    };
    BuildContext ctx{runner, Workspace{tmp.path()}, host_with_resolv(tmp)};

    bool ran = false;
    Status s = with_chroot(ctx, tmp.sub("chroot"), [&]() {
        ran = true;
        return ok_status();
    });
    CHECK_FALSE(s.ok);
    CHECK(s.kind == ErrorKind::IoFailure);
    CHECK_FALSE(ran);
    CHECK(tracker.live.empty());
}

TEST_CASE("destructor tears down a prepared scope") {
    TempDir tmp;
    RecordingRunner runner;
    BuildContext ctx{runner, Workspace{tmp.path()}, host_with_resolv(tmp)};
    {
        ChrootScope scope(ctx, tmp.sub("chroot"));
        REQUIRE(scope.prepare().ok);
    }
    CHECK(runner.count("umount") == 4);
}

TEST_CASE("missing host resolv.conf is tolerated") {
    TempDir tmp;
    RecordingRunner runner;
    HostPaths host;
    host.resolv_conf = tmp.sub("nope/resolv.conf");
    BuildContext ctx{runner, Workspace{tmp.path()}, host};

    ChrootScope scope(ctx, tmp.sub("chroot"));
    CHECK(scope.prepare().ok);
    CHECK_FALSE(fs::exists(tmp.sub("chroot/etc/resolv.conf")));
}

TEST_CASE("unshare_args") {
    auto args = unshare_args("/w/chroot", "useradd", {"-m", "demo"});
    REQUIRE(args.size() == 5);
    CHECK(args[0] == "-R");
    CHECK(args[1] == "/w/chroot");
    CHECK(args[2] == "useradd");
    CHECK(args[4] == "demo");
}
