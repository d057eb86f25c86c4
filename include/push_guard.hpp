#ifndef PUSH_GUARD_HPP
#define PUSH_GUARD_HPP

#include <optional>
#include <string>
#include <vector>
#include "object_store.hpp"

namespace gitsight {

/**
 * @brief A ref update proposed during push negotiation.
 *
 * `src` is the id the remote currently has for the ref (zero when the ref
 * does not exist there yet), `dst` the id that would replace it.
 */
struct PushUpdate {
    std::string src_refname;
    std::string dst_refname;
    CommitRef src;
    CommitRef dst;
};

/**
 * @brief Decide whether a push may overwrite the remote refs.
 *
 * Accepts when @a expected is empty, when any update's `src` equals
 * @a expected, or when every update's `src` is zero (pure creation). An
 * empty update list is accepted because nothing would be overwritten.
 *
 * @param expected Remote tip the caller last observed.
 * @param updates  Updates offered by the transport.
 * @param reason   Optional output receiving why the push was refused.
 * @return `true` when the push may proceed.
 */
bool check_push_negotiation(const std::optional<CommitRef>& expected,
                            const std::vector<PushUpdate>& updates, std::string* reason = nullptr);

/**
 * @brief Same as @ref check_push_negotiation but throws
 *        `Error{NegotiationRejected}` on refusal.
 */
void require_push_negotiation(const std::optional<CommitRef>& expected,
                              const std::vector<PushUpdate>& updates);

} // namespace gitsight

#endif // PUSH_GUARD_HPP
