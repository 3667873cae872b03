#include "test_common.hpp"
#include "git_utils.hpp"

using namespace autodeploy::test_support;

TEST_CASE("Git helpers on a non-repository") {
    git::GitInitGuard guard;
    TempDir dir("git_utils_plain");
    REQUIRE_FALSE(git::is_git_repo(dir.path));
    std::string err;
    REQUIRE_FALSE(git::get_local_hash(dir.path, &err));
    REQUIRE_FALSE(err.empty());
    REQUIRE_FALSE(git::get_current_branch(dir.path));
}

TEST_CASE("short_hash keeps seven characters") {
    REQUIRE(git::short_hash("0123456789abcdef") == "0123456");
    REQUIRE(git::short_hash("abc") == "abc");
}

TEST_CASE("Git helpers read hashes, branch and summary") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    TempDir dir("git_utils_real");
    fs::path remote = dir.path / "remote.git";
    fs::path seed = dir.path / "seed";
    make_remote(remote, seed);
    fs::path repo = dir.path / "app";
    REQUIRE(std::system(("git clone --branch main " + remote.string() + " " + repo.string() +
                         REDIR)
                            .c_str()) == 0);

    REQUIRE(git::is_git_repo(repo));
    auto branch = git::get_current_branch(repo);
    REQUIRE(branch);
    REQUIRE(*branch == "main");

    auto local = git::get_local_hash(repo);
    auto tracking = git::get_tracking_hash(repo, "origin", "main");
    REQUIRE(local);
    REQUIRE(tracking);
    REQUIRE(*local == *tracking);
    REQUIRE(local->size() == 40);

    std::string err;
    auto summary = git::get_commit_summary(repo, *local, &err);
    REQUIRE(summary);
    REQUIRE(*summary == "update");

    REQUIRE_FALSE(git::get_tracking_hash(repo, "origin", "no-such-branch", &err));
    REQUIRE_FALSE(git::get_commit_summary(repo, "not-a-hash", &err));

    REQUIRE(git_cmd(repo, "checkout --detach") == 0);
    err.clear();
    REQUIRE_FALSE(git::get_current_branch(repo, &err));
    REQUIRE(err == "HEAD is detached");
}
