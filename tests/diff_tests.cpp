#include "test_common.hpp"
#include "diff.hpp"

using namespace gitsight;
using gitsight::test_support::commit_file;
using gitsight::test_support::git_in;
using gitsight::test_support::git_out;
using gitsight::test_support::make_repo;
using gitsight::test_support::write_file;

static std::vector<PatchLine> collect(const Diff& diff) {
    std::vector<PatchLine> out;
    PatchStream stream = diff.lines();
    while (auto line = stream.next())
        out.push_back(*line);
    return out;
}

TEST_CASE("diff_commits counts insertions and deletions") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path repo = make_repo("gitsight_diff_commits");
    commit_file(repo, "a.txt", "one\ntwo\nthree\n", "base");
    std::string base_hex = git_out(repo, "rev-parse HEAD");
    commit_file(repo, "a.txt", "one\n2\nthree\nfour\n", "edit");

    auto opened = Repository::open(repo);
    CommitRef base = *CommitRef::from_hex(base_hex);
    CommitRef target = opened.resolve_ref("HEAD");
    Diff diff = diff_commits(opened, base, target);
    REQUIRE(diff.num_files() == 1);

    DiffStats stats = diff.stats();
    REQUIRE(stats.insertions == 2);
    REQUIRE(stats.deletions == 1);
    REQUIRE(stats.files.size() == 1);
    REQUIRE(stats.files[0].new_path == "a.txt");
    REQUIRE(stats.files[0].status == DeltaStatus::Modified);

    auto lines = collect(diff);
    REQUIRE(lines.size() >= 3);
    REQUIRE(lines[0].origin == LineOrigin::FileHeader);
    REQUIRE(lines[0].content == "a.txt");
    REQUIRE(lines[1].origin == LineOrigin::HunkHeader);
    REQUIRE(lines[1].content.rfind("@@", 0) == 0);
    std::size_t adds = 0, dels = 0;
    for (const auto& l : lines) {
        if (l.origin == LineOrigin::Addition)
            ++adds;
        if (l.origin == LineOrigin::Deletion) {
            ++dels;
            REQUIRE(l.content == "two");
        }
    }
    REQUIRE(adds == stats.insertions);
    REQUIRE(dels == stats.deletions);
    FS_REMOVE_ALL(repo);
}

TEST_CASE("diff output is identical when recomputed") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path repo = make_repo("gitsight_diff_repeat");
    commit_file(repo, "a.txt", "1\n2\n3\n", "base");
    std::string base_hex = git_out(repo, "rev-parse HEAD");
    commit_file(repo, "b.txt", "new\n", "add b");
    commit_file(repo, "a.txt", "1\n3\n", "drop 2");

    auto opened = Repository::open(repo);
    CommitRef base = *CommitRef::from_hex(base_hex);
    CommitRef target = opened.resolve_ref("HEAD");
    Diff first = diff_commits(opened, base, target);
    Diff second = diff_commits(opened, base, target);
    REQUIRE(first.stats().insertions == second.stats().insertions);
    REQUIRE(first.stats().deletions == second.stats().deletions);
    auto a = collect(first);
    auto b = collect(second);
    REQUIRE(a.size() == b.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        REQUIRE(a[i].origin == b[i].origin);
        REQUIRE(a[i].content == b[i].content);
    }
    // A fresh stream restarts from the first file.
    REQUIRE(collect(first).size() == a.size());
    FS_REMOVE_ALL(repo);
}

TEST_CASE("diff selections split staged and unstaged work") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path repo = make_repo("gitsight_diff_worktree");
    commit_file(repo, "a.txt", "one\n", "base");
    write_file(repo / "a.txt", "one\nstaged\n");
    REQUIRE(git_in(repo, "add a.txt") == 0);
    write_file(repo / "a.txt", "one\nstaged\nunstaged\n");
    write_file(repo / "new.txt", "untracked\n");

    auto opened = Repository::open(repo);
    DiffStats staged = diff_staged(opened).stats();
    REQUIRE(staged.files.size() == 1);
    REQUIRE(staged.insertions == 1);

    DiffStats unstaged = diff_unstaged(opened).stats();
    REQUIRE(unstaged.files.size() == 2);
    REQUIRE(unstaged.insertions == 2);

    DiffStats all = diff_head_to_workdir(opened).stats();
    REQUIRE(all.insertions == 3);

    DiffOptions tracked_only;
    tracked_only.include_untracked = false;
    REQUIRE(diff_head_to_workdir(opened, tracked_only).stats().files.size() == 1);

    DiffOptions scoped;
    scoped.pathspec = {"new.txt"};
    DiffStats only_new = diff_unstaged(opened, scoped).stats();
    REQUIRE(only_new.files.size() == 1);
    REQUIRE(only_new.files[0].status == DeltaStatus::Untracked);
    FS_REMOVE_ALL(repo);
}

TEST_CASE("diff whitespace handling") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path repo = make_repo("gitsight_diff_ws");
    commit_file(repo, "a.txt", "a b\n", "base");
    write_file(repo / "a.txt", "a  b\n");

    auto opened = Repository::open(repo);
    DiffOptions exact;
    exact.whitespace = Whitespace::Exact;
    DiffStats strict = diff_unstaged(opened, exact).stats();
    REQUIRE(strict.insertions == 1);
    REQUIRE(strict.deletions == 1);

    DiffOptions ignore;
    ignore.whitespace = Whitespace::IgnoreChange;
    DiffStats relaxed = diff_unstaged(opened, ignore).stats();
    REQUIRE(relaxed.insertions == 0);
    REQUIRE(relaxed.deletions == 0);
    FS_REMOVE_ALL(repo);
}

TEST_CASE("diff_commits detects renames") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path repo = make_repo("gitsight_diff_rename");
    std::string body;
    for (int i = 0; i < 20; ++i)
        body += "row " + std::to_string(i) + "\n";
    commit_file(repo, "before.txt", body, "base");
    std::string base_hex = git_out(repo, "rev-parse HEAD");
    REQUIRE(git_in(repo, "mv before.txt after.txt") == 0);
    REQUIRE(git_in(repo, "commit -m move") == 0);

    auto opened = Repository::open(repo);
    Diff diff = diff_commits(opened, *CommitRef::from_hex(base_hex), opened.resolve_ref("HEAD"));
    DiffStats stats = diff.stats();
    REQUIRE(stats.files.size() == 1);
    REQUIRE(stats.files[0].status == DeltaStatus::Renamed);
    REQUIRE(stats.files[0].old_path == "before.txt");
    REQUIRE(stats.files[0].new_path == "after.txt");
    REQUIRE(std::string(delta_status_name(stats.files[0].status)) == "renamed");
    auto lines = collect(diff);
    REQUIRE(lines[0].content == "before.txt -> after.txt");
    FS_REMOVE_ALL(repo);
}
