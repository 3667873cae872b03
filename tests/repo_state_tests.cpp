#include "test_common.hpp"
#include "repo_state.hpp"

using namespace autodeploy::test_support;

TEST_CASE("classify_path distinguishes absent, empty and populated") {
    TempDir dir("classify_path");
    REQUIRE(deploy::classify_path(dir.path / "missing") == deploy::PathState::Absent);
    REQUIRE(deploy::classify_path(dir.path) == deploy::PathState::Empty);
    REQUIRE(deploy::is_absent_or_empty(dir.path));
    REQUIRE(deploy::is_absent_or_empty(dir.path / "missing"));

    std::ofstream(dir.path / ".hidden") << "x";
    REQUIRE(deploy::classify_path(dir.path) == deploy::PathState::Populated);
    REQUIRE_FALSE(deploy::is_absent_or_empty(dir.path));
    // A regular file is not something clone can use.
    REQUIRE(deploy::classify_path(dir.path / ".hidden") == deploy::PathState::Populated);
}

TEST_CASE("clone_repository runs git clone with the configured branch") {
    QuietLogger quiet;
    TempDir dir("clone_cmd");
    auto target = make_target(dir.path / "app");
    ScriptedRunner runner;
    deploy::clone_repository(runner.runner(), target);
    REQUIRE(runner.lines() ==
            std::vector<std::string>{"git clone --branch main https://example.invalid/app.git " +
                                     (dir.path / "app").string()});
    REQUIRE(runner.calls.front().cwd.empty());
}

TEST_CASE("clone_repository propagates clone failures") {
    QuietLogger quiet;
    TempDir dir("clone_fail");
    ScriptedRunner runner;
    runner.handler = [](const procutil::Command& cmd) -> std::string {
        throw CommandFailed(cmd.program, cmd.args, 128, "fatal: repository not found");
    };
    REQUIRE_THROWS_AS(deploy::clone_repository(runner.runner(), make_target(dir.path / "app")),
                      CommandFailed);
}

TEST_CASE("detect_changes reports a missing repository without running git") {
    QuietLogger quiet;
    TempDir dir("detect_missing");
    ScriptedRunner runner;
    auto decision = deploy::detect_changes(runner.runner(), make_target(dir.path / "gone"));
    REQUIRE(decision == deploy::ChangeDecision::RepositoryMissing);
    REQUIRE(runner.calls.empty());
    REQUIRE(std::string(deploy::change_decision_name(decision)) == "repository-missing");
}

TEST_CASE("detect_changes fetches then diffs against the tracking ref") {
    git::GitInitGuard guard;
    QuietLogger quiet;
    TempDir dir("detect_scripted");
    auto target = make_target(dir.path);
    ScriptedRunner runner;
    std::string diff_output;
    runner.handler = [&](const procutil::Command& cmd) {
        return cmd.args.front() == "diff" ? diff_output : std::string();
    };

    SECTION("empty diff") {
        REQUIRE(deploy::detect_changes(runner.runner(), target) ==
                deploy::ChangeDecision::NoChanges);
    }
    SECTION("non-empty diff") {
        diff_output = "diff --git a/index.js b/index.js";
        REQUIRE(deploy::detect_changes(runner.runner(), target) ==
                deploy::ChangeDecision::ChangesDetected);
    }
    REQUIRE(runner.lines() ==
            std::vector<std::string>{"git fetch origin main", "git diff HEAD origin/main"});
    for (const auto& c : runner.calls)
        REQUIRE(c.cwd == dir.path);
}

TEST_CASE("detect_changes propagates fetch failures") {
    QuietLogger quiet;
    TempDir dir("detect_fetch_fail");
    ScriptedRunner runner;
    runner.handler = [](const procutil::Command& cmd) -> std::string {
        if (cmd.args.front() == "fetch")
            throw CommandFailed(cmd.program, cmd.args, 128, "fatal: unable to access remote");
        return "";
    };
    REQUIRE_THROWS_AS(deploy::detect_changes(runner.runner(), make_target(dir.path)),
                      CommandFailed);
    REQUIRE(runner.count("diff") == 0);
}

TEST_CASE("detect_changes against a real remote") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    QuietLogger quiet;
    TempDir dir("detect_real");
    fs::path remote = dir.path / "remote.git";
    fs::path seed = dir.path / "seed";
    make_remote(remote, seed);

    auto target = make_target(dir.path / "app");
    target.remote_url = remote.string();
    auto run = procutil::process_runner();
    deploy::clone_repository(run, target);
    REQUIRE(git::is_git_repo(target.repo_path));
    REQUIRE(deploy::detect_changes(run, target) == deploy::ChangeDecision::NoChanges);

    commit_and_push(seed, "index.js", "console.log(1);\n");
    REQUIRE(deploy::detect_changes(run, target) == deploy::ChangeDecision::ChangesDetected);

    run({"git", {"pull"}, target.repo_path});
    REQUIRE(deploy::detect_changes(run, target) == deploy::ChangeDecision::NoChanges);
}
