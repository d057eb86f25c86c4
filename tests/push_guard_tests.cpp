#include "test_common.hpp"
#include "push_guard.hpp"

using namespace gitsight;

static CommitRef ref(const std::string& hex) { return *CommitRef::from_hex(hex); }

static PushUpdate update(const CommitRef& src, const CommitRef& dst) {
    return PushUpdate{"refs/heads/main", "refs/heads/main", src, dst};
}

TEST_CASE("push negotiation passes when the remote is where we expect") {
    CommitRef x = ref("1111111111111111111111111111111111111111");
    CommitRef y = ref("2222222222222222222222222222222222222222");
    std::string reason;
    REQUIRE(check_push_negotiation(x, {update(x, y)}, &reason));
    REQUIRE(reason.empty());
    REQUIRE_NOTHROW(require_push_negotiation(x, {update(x, y)}));
}

TEST_CASE("push negotiation rejects a moved remote tip") {
    CommitRef x = ref("1111111111111111111111111111111111111111");
    CommitRef y = ref("2222222222222222222222222222222222222222");
    CommitRef z = ref("3333333333333333333333333333333333333333");
    std::string reason;
    REQUIRE_FALSE(check_push_negotiation(x, {update(z, y)}, &reason));
    REQUIRE(reason.find("1111111") != std::string::npos);
    REQUIRE(reason.find("3333333") != std::string::npos);
    try {
        require_push_negotiation(x, {update(z, y)});
        FAIL("expected rejection");
    } catch (const Error& e) {
        REQUIRE(e.kind() == ErrorKind::NegotiationRejected);
    }
}

TEST_CASE("push negotiation allows creating a ref that does not exist yet") {
    CommitRef x = ref("1111111111111111111111111111111111111111");
    CommitRef y = ref("2222222222222222222222222222222222222222");
    REQUIRE(check_push_negotiation(x, {update(CommitRef(), y)}));
}

TEST_CASE("push negotiation without an expectation accepts anything") {
    CommitRef y = ref("2222222222222222222222222222222222222222");
    CommitRef z = ref("3333333333333333333333333333333333333333");
    REQUIRE(check_push_negotiation(std::nullopt, {update(z, y)}));
}

TEST_CASE("push negotiation matches any of several updates") {
    CommitRef x = ref("1111111111111111111111111111111111111111");
    CommitRef y = ref("2222222222222222222222222222222222222222");
    CommitRef z = ref("3333333333333333333333333333333333333333");
    REQUIRE(check_push_negotiation(x, {update(z, y), update(x, y)}));
    REQUIRE_FALSE(check_push_negotiation(x, {update(z, y), update(CommitRef(), y)}));
}
