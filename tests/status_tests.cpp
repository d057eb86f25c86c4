#include "test_common.hpp"
#include "status.hpp"

using namespace gitsight;
using gitsight::test_support::commit_file;
using gitsight::test_support::git_in;
using gitsight::test_support::make_repo;
using gitsight::test_support::write_file;

static const StatusEntry* find_entry(const std::vector<StatusEntry>& entries,
                                     const std::string& path, Location loc) {
    for (const auto& e : entries) {
        if (e.path == path && e.location == loc)
            return &e;
    }
    return nullptr;
}

TEST_CASE("classify reports nothing for a clean checkout") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path repo = make_repo("gitsight_status_clean");
    commit_file(repo, "a.txt", "one\n", "init");
    auto opened = Repository::open(repo);
    REQUIRE(classify(opened).empty());
    REQUIRE(is_clean(opened));
    // Same answer on a second run against the unchanged store.
    REQUIRE(classify(opened).empty());
    FS_REMOVE_ALL(repo);
}

TEST_CASE("classify splits staged and unstaged changes of one path") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path repo = make_repo("gitsight_status_both");
    commit_file(repo, "a.txt", "one\n", "init");
    write_file(repo / "b.txt", "new file\n");
    REQUIRE(git_in(repo, "add b.txt") == 0);
    write_file(repo / "b.txt", "new file\nedited after staging\n");
    write_file(repo / "a.txt", "one\ntwo\n");

    auto entries = classify(Repository::open(repo));
    REQUIRE(entries.size() == 3);
    // Staged entries come first.
    REQUIRE(entries[0].location == Location::Index);
    REQUIRE(entries[0].path == "b.txt");
    REQUIRE(entries[0].change == Change::New);

    auto wt_a = find_entry(entries, "a.txt", Location::WorkingTree);
    REQUIRE(wt_a);
    REQUIRE(wt_a->change == Change::Modified);
    auto wt_b = find_entry(entries, "b.txt", Location::WorkingTree);
    REQUIRE(wt_b);
    REQUIRE(wt_b->change == Change::Modified);
    REQUIRE(entries[1].path == "a.txt");
    REQUIRE(entries[2].path == "b.txt");
    FS_REMOVE_ALL(repo);
}

TEST_CASE("classify reports a staged rename as one entry") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path repo = make_repo("gitsight_status_rename");
    std::string body;
    for (int i = 0; i < 20; ++i)
        body += "line " + std::to_string(i) + "\n";
    commit_file(repo, "old.txt", body, "init");
    REQUIRE(git_in(repo, "mv old.txt new.txt") == 0);

    auto entries = classify(Repository::open(repo));
    REQUIRE(entries.size() == 1);
    REQUIRE(entries[0].change == Change::Renamed);
    REQUIRE(entries[0].location == Location::Index);
    REQUIRE(entries[0].path == "new.txt");
    REQUIRE(entries[0].old_path);
    REQUIRE(*entries[0].old_path == "old.txt");

    StatusOptions no_renames;
    no_renames.detect_renames = false;
    auto split = classify(Repository::open(repo), no_renames);
    REQUIRE(split.size() == 2);
    REQUIRE(find_entry(split, "new.txt", Location::Index)->change == Change::New);
    REQUIRE(find_entry(split, "old.txt", Location::Index)->change == Change::Deleted);
    FS_REMOVE_ALL(repo);
}

TEST_CASE("classify expands untracked directories and honours ignore options") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path repo = make_repo("gitsight_status_untracked");
    commit_file(repo, ".gitignore", "*.log\n", "ignore logs");
    write_file(repo / "dir" / "one.txt", "1\n");
    write_file(repo / "dir" / "sub" / "two.txt", "2\n");
    write_file(repo / "build.log", "noise\n");
    auto opened = Repository::open(repo);

    auto entries = classify(opened);
    REQUIRE(entries.size() == 2);
    REQUIRE(entries[0].path == "dir/one.txt");
    REQUIRE(entries[1].path == "dir/sub/two.txt");
    REQUIRE(entries[0].change == Change::New);
    REQUIRE(entries[0].location == Location::WorkingTree);

    StatusOptions with_ignored;
    with_ignored.include_ignored = true;
    auto all = classify(opened, with_ignored);
    auto ignored = find_entry(all, "build.log", Location::WorkingTree);
    REQUIRE(ignored);
    REQUIRE(ignored->change == Change::Ignored);

    StatusOptions tracked_only;
    tracked_only.include_untracked = false;
    REQUIRE(classify(opened, tracked_only).empty());

    StatusOptions scoped;
    scoped.pathspec = {"dir/sub"};
    auto sub = classify(opened, scoped);
    REQUIRE(sub.size() == 1);
    REQUIRE(sub[0].path == "dir/sub/two.txt");
    FS_REMOVE_ALL(repo);
}

TEST_CASE("classify reports deletions in the working tree") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path repo = make_repo("gitsight_status_deleted");
    commit_file(repo, "gone.txt", "bye\n", "init");
    fs::remove(repo / "gone.txt");
    auto entries = classify(Repository::open(repo));
    REQUIRE(entries.size() == 1);
    REQUIRE(entries[0].change == Change::Deleted);
    REQUIRE(entries[0].location == Location::WorkingTree);
    REQUIRE(std::string(change_name(entries[0].change)) == "deleted");
    REQUIRE(std::string(location_name(entries[0].location)) == "worktree");
    FS_REMOVE_ALL(repo);
}

TEST_CASE("classify rejects paths that are not UTF-8") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path repo = make_repo("gitsight_status_latin1");
    commit_file(repo, "a.txt", "one\n", "init");
    write_file(repo / std::string("bad\xff.txt"), "x\n");
    auto opened = Repository::open(repo);
    try {
        classify(opened);
        FAIL("expected malformed state");
    } catch (const Error& e) {
        REQUIRE(e.kind() == ErrorKind::MalformedState);
    }

    StatusOptions tracked_only;
    tracked_only.include_untracked = false;
    REQUIRE(classify(opened, tracked_only).empty());
    FS_REMOVE_ALL(repo);
}

TEST_CASE("classify reports a file replaced by a symlink as a type change") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path repo = make_repo("gitsight_status_typechange");
    REQUIRE(git_in(repo, "config core.symlinks true") == 0);
    commit_file(repo, "a.txt", "target\n", "init");
    commit_file(repo, "link.txt", "plain\n", "plain file");
    fs::remove(repo / "link.txt");
    fs::create_symlink("a.txt", repo / "link.txt");

    auto entries = classify(Repository::open(repo));
    REQUIRE(entries.size() == 1);
    REQUIRE(entries[0].path == "link.txt");
    REQUIRE(entries[0].location == Location::WorkingTree);
    REQUIRE(entries[0].change == Change::TypeChanged);
    REQUIRE(std::string(change_name(entries[0].change)) == "typechange");
    FS_REMOVE_ALL(repo);
}
