#include "push_guard.hpp"
#include <algorithm>
#include "errors.hpp"
#include "logger.hpp"

namespace gitsight {

bool check_push_negotiation(const std::optional<CommitRef>& expected,
                            const std::vector<PushUpdate>& updates, std::string* reason) {
    if (!expected)
        return true;
    bool matched = std::any_of(updates.begin(), updates.end(),
                               [&](const PushUpdate& u) { return u.src == *expected; });
    if (matched)
        return true;
    bool creating = std::all_of(updates.begin(), updates.end(),
                                [](const PushUpdate& u) { return u.src.is_zero(); });
    if (creating)
        return true;
    if (reason) {
        *reason = "remote ref moved since last fetch: expected " + expected->short_hex();
        for (const auto& u : updates)
            *reason += ", " + u.dst_refname + " is at " + u.src.short_hex();
    }
    log_warning("push negotiation rejected", {{"expected", expected->hex()},
                                              {"updates", std::to_string(updates.size())}});
    return false;
}

void require_push_negotiation(const std::optional<CommitRef>& expected,
                              const std::vector<PushUpdate>& updates) {
    std::string reason;
    if (!check_push_negotiation(expected, updates, &reason))
        throw Error(ErrorKind::NegotiationRejected, reason);
}

} // namespace gitsight
