#include "test_common.hpp"
#include <algorithm>
#include "divergence.hpp"

using namespace gitsight;
using gitsight::test_support::commit_file;
using gitsight::test_support::git_in;
using gitsight::test_support::git_out;
using gitsight::test_support::make_repo;

static bool contains(const std::vector<CommitRef>& list, const CommitRef& c) {
    return std::find(list.begin(), list.end(), c) != list.end();
}

TEST_CASE("ahead_behind of a commit with itself is empty") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path repo = make_repo("gitsight_div_same");
    commit_file(repo, "a.txt", "1\n", "one");
    auto opened = Repository::open(repo);
    CommitRef head = opened.resolve_ref("HEAD");
    auto set = ahead_behind(opened, head, head);
    REQUIRE(set.ahead.empty());
    REQUIRE(set.behind.empty());
    REQUIRE(set.in_sync());
    REQUIRE(classify_divergence(set) == Relation::UpToDate);
    FS_REMOVE_ALL(repo);
}

TEST_CASE("ahead_behind splits diverged branches newest first") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path repo = make_repo("gitsight_div_split");
    commit_file(repo, "a.txt", "base\n", "base");
    std::string base_hex = git_out(repo, "rev-parse HEAD");
    REQUIRE(git_in(repo, "checkout -b feature") == 0);
    commit_file(repo, "f.txt", "1\n", "feature one");
    commit_file(repo, "f.txt", "2\n", "feature two");
    REQUIRE(git_in(repo, "checkout main") == 0);
    commit_file(repo, "m.txt", "1\n", "main one");

    auto opened = Repository::open(repo);
    CommitRef local = opened.resolve_ref("feature");
    CommitRef remote = opened.resolve_ref("main");
    auto set = ahead_behind(opened, local, remote);

    REQUIRE(set.merge_base);
    REQUIRE(set.merge_base->hex() == base_hex);
    REQUIRE(set.ahead.size() == 2);
    REQUIRE(set.behind.size() == 1);
    REQUIRE(set.ahead[0] == local);
    REQUIRE(opened.read_commit(set.ahead[1]).summary == "feature one");
    REQUIRE(set.behind[0] == remote);
    for (const auto& c : set.ahead)
        REQUIRE_FALSE(contains(set.behind, c));
    REQUIRE(classify_divergence(set) == Relation::Diverged);

    auto reversed = ahead_behind(opened, remote, local);
    REQUIRE(reversed.ahead == set.behind);
    REQUIRE(reversed.behind == set.ahead);
    FS_REMOVE_ALL(repo);
}

TEST_CASE("ahead_behind keeps criss-cross merges disjoint") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path repo = make_repo("gitsight_div_crisscross");
    commit_file(repo, "a.txt", "base\n", "base");
    REQUIRE(git_in(repo, "checkout -b feature") == 0);
    commit_file(repo, "f.txt", "1\n", "feature one");
    REQUIRE(git_in(repo, "checkout main") == 0);
    commit_file(repo, "m.txt", "1\n", "main one");
    std::string main_one = git_out(repo, "rev-parse HEAD");
    REQUIRE(git_in(repo, "merge --no-ff -m merge-feature feature") == 0);
    REQUIRE(git_in(repo, "checkout feature") == 0);
    REQUIRE(git_in(repo, "merge --no-ff -m merge-main " + main_one) == 0);
    commit_file(repo, "f.txt", "2\n", "feature two");
    REQUIRE(git_in(repo, "checkout main") == 0);
    commit_file(repo, "m.txt", "2\n", "main two");

    auto opened = Repository::open(repo);
    auto set = ahead_behind(opened, opened.resolve_ref("feature"), opened.resolve_ref("main"));
    REQUIRE(set.merge_base);
    REQUIRE(set.ahead.size() == 2);
    REQUIRE(set.behind.size() == 2);
    for (const auto& c : set.ahead)
        REQUIRE_FALSE(contains(set.behind, c));
    REQUIRE(opened.read_commit(set.ahead[0]).summary == "feature two");
    REQUIRE(opened.read_commit(set.ahead[1]).summary == "merge-main");
    REQUIRE(opened.read_commit(set.behind[0]).summary == "main two");
    REQUIRE(opened.read_commit(set.behind[1]).summary == "merge-feature");
    REQUIRE(classify_divergence(set) == Relation::Diverged);
    FS_REMOVE_ALL(repo);
}

TEST_CASE("ahead_behind classifies fast-forwardable histories") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path repo = make_repo("gitsight_div_ff");
    commit_file(repo, "a.txt", "1\n", "one");
    std::string old_hex = git_out(repo, "rev-parse HEAD");
    commit_file(repo, "a.txt", "2\n", "two");

    auto opened = Repository::open(repo);
    CommitRef old_tip = *CommitRef::from_hex(old_hex);
    CommitRef new_tip = opened.resolve_ref("HEAD");
    auto ahead = ahead_behind(opened, new_tip, old_tip);
    REQUIRE(ahead.ahead.size() == 1);
    REQUIRE(ahead.behind.empty());
    REQUIRE(classify_divergence(ahead) == Relation::Ahead);

    auto behind = ahead_behind(opened, old_tip, new_tip);
    REQUIRE(behind.ahead.empty());
    REQUIRE(behind.behind.size() == 1);
    REQUIRE(classify_divergence(behind) == Relation::Behind);
    REQUIRE(std::string(relation_name(Relation::Behind)) == "behind");
    FS_REMOVE_ALL(repo);
}

TEST_CASE("ahead_behind fails on unrelated histories") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path repo = make_repo("gitsight_div_unrelated");
    commit_file(repo, "a.txt", "1\n", "one");
    REQUIRE(git_in(repo, "checkout --orphan other") == 0);
    REQUIRE(git_in(repo, "rm -rf --cached .") == 0);
    commit_file(repo, "b.txt", "2\n", "unrelated root");

    auto opened = Repository::open(repo);
    try {
        ahead_behind(opened, opened.resolve_ref("main"), opened.resolve_ref("other"));
        FAIL("expected unrelated history");
    } catch (const Error& e) {
        REQUIRE(e.kind() == ErrorKind::UnrelatedHistory);
    }
    FS_REMOVE_ALL(repo);
}

TEST_CASE("ahead_behind reports missing commits as not found") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path repo = make_repo("gitsight_div_missing");
    commit_file(repo, "a.txt", "1\n", "one");
    auto opened = Repository::open(repo);
    CommitRef ghost = *CommitRef::from_hex("0123456789abcdef0123456789abcdef01234567");
    try {
        ahead_behind(opened, opened.resolve_ref("HEAD"), ghost);
        FAIL("expected not found");
    } catch (const Error& e) {
        REQUIRE(e.kind() == ErrorKind::NotFound);
    }
    try {
        ahead_behind(opened, ghost, ghost);
        FAIL("expected not found for the same missing commit");
    } catch (const Error& e) {
        REQUIRE(e.kind() == ErrorKind::NotFound);
    }
    REQUIRE_THROWS_AS(opened.resolve_ref("no-such-branch"), Error);
    FS_REMOVE_ALL(repo);
}

TEST_CASE("upstream_divergence follows the configured upstream") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path remote, local;
    gitsight::test_support::make_remote_pair("gitsight_div_upstream", remote, local);
    commit_file(local, "file.txt", "local change\n", "local work");

    auto opened = Repository::open(local);
    auto state = upstream_divergence(opened);
    REQUIRE(state);
    REQUIRE(state->local_ref == "refs/heads/main");
    REQUIRE(state->upstream_ref == "refs/remotes/origin/main");
    REQUIRE(state->remote_name == "origin");
    REQUIRE(state->divergence.ahead.size() == 1);
    REQUIRE(state->divergence.behind.empty());

    REQUIRE(git_in(local, "checkout -b topic") == 0);
    REQUIRE_FALSE(upstream_divergence(Repository::open(local)));

    FS_REMOVE_ALL(local);
    FS_REMOVE_ALL(remote);
}
