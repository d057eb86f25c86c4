#include <cstdlib>
#include <string>
#include <vector>
#include "test_common.hpp"
#include "progress.hpp"
#include "remote.hpp"

using namespace gitsight;
using gitsight::test_support::clone_of;
using gitsight::test_support::commit_file;
using gitsight::test_support::git_in;
using gitsight::test_support::git_out;
using gitsight::test_support::make_remote_pair;
using gitsight::test_support::read_file;
using gitsight::test_support::write_file;

/// Commit @p content to file.txt in a second clone and publish it.
static std::string publish_from_other(const fs::path& remote, const std::string& name,
                                      const std::string& content) {
    fs::path other = clone_of(remote, name);
    commit_file(other, "file.txt", content, "from other");
    REQUIRE(git_in(other, "push origin main") == 0);
    std::string hex = git_out(other, "rev-parse HEAD");
    FS_REMOVE_ALL(other);
    return hex;
}

/// Sets an environment variable for the lifetime of the guard.
struct EnvGuard {
    std::string name;
    EnvGuard(const std::string& n, const std::string& value) : name(n) {
        setenv(name.c_str(), value.c_str(), 1);
    }
    ~EnvGuard() { unsetenv(name.c_str()); }
};

TEST_CASE("credential_cb offers each credential once per transfer") {
    git::GitInitGuard guard;
    EnvGuard user("GIT_USERNAME", "alice");
    EnvGuard pass("GIT_PASSWORD", "wrong");
    git::CredentialAttempts attempts;
    git_credential* cred = nullptr;

    const unsigned int userpass = GIT_CREDENTIAL_USERPASS_PLAINTEXT;
    REQUIRE(git::credential_cb(&cred, "https://example.invalid/r.git", nullptr, userpass,
                               &attempts) == 0);
    REQUIRE(cred != nullptr);
    REQUIRE(git_credential_get_username(cred) == std::string("alice"));
    git_credential_free(cred);
    cred = nullptr;

    // The server refused the password; asking again must not loop.
    REQUIRE(git::credential_cb(&cred, "https://example.invalid/r.git", nullptr, userpass,
                               &attempts) == GIT_EAUTH);
    REQUIRE(cred == nullptr);

    git::CredentialAttempts with_default;
    const unsigned int both = userpass | GIT_CREDENTIAL_DEFAULT;
    REQUIRE(git::credential_cb(&cred, "https://example.invalid/r.git", nullptr, both,
                               &with_default) == 0);
    git_credential_free(cred);
    cred = nullptr;
    REQUIRE(git::credential_cb(&cred, "https://example.invalid/r.git", nullptr, both,
                               &with_default) == 0);
    REQUIRE(git_credential_has_username(cred) == 0);
    git_credential_free(cred);
    cred = nullptr;
    REQUIRE(git::credential_cb(&cred, "https://example.invalid/r.git", nullptr, both,
                               &with_default) == GIT_EAUTH);

    git::CredentialAttempts ssh;
    REQUIRE(git::credential_cb(&cred, "ssh://example.invalid/r.git", "git",
                               GIT_CREDENTIAL_USERNAME, &ssh) == 0);
    git_credential_free(cred);
    cred = nullptr;
    REQUIRE(git::credential_cb(&cred, "ssh://example.invalid/r.git", "git",
                               GIT_CREDENTIAL_USERNAME, &ssh) == GIT_EAUTH);
}

TEST_CASE("fetch_remote updates remote-tracking refs") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path remote, local;
    make_remote_pair("gitsight_fetch", remote, local);
    std::string pushed = publish_from_other(remote, "gitsight_fetch_other", "other\n");
    REQUIRE(git_out(local, "rev-parse origin/main") != pushed);

    ProgressChannel channel;
    auto repo = Repository::open(local);
    FetchResult result = fetch_remote(repo, "origin", &channel);
    channel.close();
    REQUIRE(result.remote == "origin");
    REQUIRE(git_out(local, "rev-parse origin/main") == pushed);

    std::vector<ProgressEvent> events;
    while (auto ev = channel.receive())
        events.push_back(*ev);
    REQUIRE_FALSE(events.empty());
    REQUIRE(events.back().stage == ProgressStage::Done);

    REQUIRE_THROWS_AS(fetch_remote(repo, "nowhere"), Error);
    FS_REMOVE_ALL(local);
    FS_REMOVE_ALL(remote);
}

TEST_CASE("pull_fast_forward outcomes") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path remote, local;
    make_remote_pair("gitsight_pull", remote, local);

    SECTION("up to date") {
        auto result = pull_fast_forward(Repository::open(local), false);
        REQUIRE(result.outcome == PullOutcome::UpToDate);
        REQUIRE(std::string(pull_outcome_text(result.outcome)) == "Already up to date");
    }

    SECTION("fast-forwards when only the remote moved") {
        std::string pushed = publish_from_other(remote, "gitsight_pull_other", "newer\n");
        auto result = pull_fast_forward(Repository::open(local), false);
        REQUIRE(result.outcome == PullOutcome::FastForwarded);
        REQUIRE(result.state.local.hex() == pushed);
        REQUIRE(result.state.divergence.in_sync());
        REQUIRE(git_out(local, "rev-parse HEAD") == pushed);
        REQUIRE(read_file(local / "file.txt") == "newer\n");
    }

    SECTION("local changes block the fast-forward unless forced") {
        std::string pushed = publish_from_other(remote, "gitsight_pull_dirty", "newer\n");
        write_file(local / "file.txt", "edited\n");
        auto blocked = pull_fast_forward(Repository::open(local), false);
        REQUIRE(blocked.outcome == PullOutcome::LocalChanges);
        REQUIRE(read_file(local / "file.txt") == "edited\n");

        auto forced = pull_fast_forward(Repository::open(local), true);
        REQUIRE(forced.outcome == PullOutcome::FastForwarded);
        REQUIRE(git_out(local, "rev-parse HEAD") == pushed);
        REQUIRE(read_file(local / "file.txt") == "newer\n");
    }

    SECTION("ahead and diverged branches are left alone") {
        commit_file(local, "mine.txt", "1\n", "local work");
        std::string head = git_out(local, "rev-parse HEAD");
        auto ahead = pull_fast_forward(Repository::open(local), false);
        REQUIRE(ahead.outcome == PullOutcome::Ahead);
        REQUIRE(ahead.state.divergence.ahead.size() == 1);

        publish_from_other(remote, "gitsight_pull_diverged", "theirs\n");
        auto diverged = pull_fast_forward(Repository::open(local), true);
        REQUIRE(diverged.outcome == PullOutcome::Diverged);
        REQUIRE(diverged.state.divergence.behind.size() == 1);
        REQUIRE(git_out(local, "rev-parse HEAD") == head);
    }

    SECTION("branches without upstream cannot pull") {
        REQUIRE(git_in(local, "checkout -b loose") == 0);
        try {
            pull_fast_forward(Repository::open(local), false);
            FAIL("expected not found");
        } catch (const Error& e) {
            REQUIRE(e.kind() == ErrorKind::NotFound);
        }
    }

    FS_REMOVE_ALL(local);
    FS_REMOVE_ALL(remote);
}

TEST_CASE("plan_push targets the upstream branch") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path remote, local;
    make_remote_pair("gitsight_plan", remote, local);
    std::string tracked = git_out(local, "rev-parse origin/main");

    auto repo = Repository::open(local);
    PushPlan plan = plan_push(repo, "", false);
    REQUIRE(plan.remote == "origin");
    REQUIRE(plan.refspec == "refs/heads/main:refs/heads/main");
    REQUIRE(plan.expected);
    REQUIRE(plan.expected->hex() == tracked);

    REQUIRE(plan_push(repo, "", true).refspec == "+refs/heads/main:refs/heads/main");

    REQUIRE(git_in(local, "checkout -b topic") == 0);
    PushPlan topic = plan_push(Repository::open(local), "backup", false);
    REQUIRE(topic.remote == "backup");
    REQUIRE(topic.refspec == "refs/heads/topic:refs/heads/topic");
    REQUIRE_FALSE(topic.expected);

    REQUIRE(git_in(local, "checkout --detach") == 0);
    REQUIRE_THROWS_AS(plan_push(Repository::open(local), "", false), Error);
    FS_REMOVE_ALL(local);
    FS_REMOVE_ALL(remote);
}

TEST_CASE("push_branch publishes the branch") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path remote, local;
    make_remote_pair("gitsight_push", remote, local);
    commit_file(local, "file.txt", "pushed\n", "to publish");
    std::string head = git_out(local, "rev-parse HEAD");

    auto repo = Repository::open(local);
    PushPlan plan = plan_push(repo, "", false);
    ProgressChannel channel;
    PushResult result = push_branch(repo, plan.remote, plan.refspec, plan.expected, &channel);
    channel.close();
    REQUIRE(result.remote == "origin");
    REQUIRE(result.refspec == plan.refspec);
    REQUIRE(git_out(remote, "rev-parse main") == head);

    std::optional<ProgressEvent> last;
    while (auto ev = channel.receive())
        last = ev;
    REQUIRE(last);
    REQUIRE(last->stage == ProgressStage::Done);
    FS_REMOVE_ALL(local);
    FS_REMOVE_ALL(remote);
}

TEST_CASE("push_branch refuses when the remote moved since the last fetch") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path remote, local;
    make_remote_pair("gitsight_push_stale", remote, local);
    std::string theirs = publish_from_other(remote, "gitsight_push_stale_other", "theirs\n");
    commit_file(local, "mine.txt", "mine\n", "mine");

    // The tracking ref still names the old tip, so even a forced push must stop.
    auto repo = Repository::open(local);
    PushPlan plan = plan_push(repo, "", true);
    REQUIRE(plan.refspec == "+refs/heads/main:refs/heads/main");
    try {
        push_branch(repo, plan.remote, plan.refspec, plan.expected);
        FAIL("expected negotiation rejection");
    } catch (const Error& e) {
        REQUIRE(e.kind() == ErrorKind::NegotiationRejected);
        REQUIRE(std::string(e.what()).find("remote ref moved since last fetch") !=
                std::string::npos);
    }
    REQUIRE(git_out(remote, "rev-parse main") == theirs);

    CommitRef ghost = *CommitRef::from_hex("0123456789abcdef0123456789abcdef01234567");
    REQUIRE_THROWS_AS(push_branch(repo, plan.remote, plan.refspec, ghost), Error);
    REQUIRE(git_out(remote, "rev-parse main") == theirs);
    FS_REMOVE_ALL(local);
    FS_REMOVE_ALL(remote);
}
