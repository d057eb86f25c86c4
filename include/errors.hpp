#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace gitsight {

/**
 * @brief Failure categories surfaced by the analysis core.
 *
 * Every kind propagates unchanged to the command layer; nothing in the core
 * retries an operation.
 */
enum class ErrorKind {
    NotFound,            ///< Reference or object missing from the store
    UnrelatedHistory,    ///< Two commits share no common ancestor
    MalformedState,      ///< On-disk state or a path could not be decoded
    NegotiationRejected, ///< Push target moved since it was last observed
    Git                  ///< Any other libgit2 failure
};

/**
 * @brief Exception carrying an @ref ErrorKind alongside the message.
 */
class Error : public std::runtime_error {
  public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

  private:
    ErrorKind kind_;
};

/** @return Lower-case identifier for @a kind, e.g. `"not-found"`. */
const char* error_kind_name(ErrorKind kind);

/**
 * @brief Process exit status used by the command line for @a kind.
 *
 * `2` not-found, `3` unrelated history, `4` malformed state, `5` push
 * rejected and `1` for anything else.
 */
int exit_code_for(ErrorKind kind);

} // namespace gitsight

#endif // ERRORS_HPP
