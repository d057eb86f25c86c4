#ifndef OBJECT_STORE_HPP
#define OBJECT_STORE_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "git_utils.hpp"

namespace gitsight {
namespace fs = std::filesystem;

/**
 * @brief Content hash naming a commit.
 *
 * Holds only the object id; metadata is re-read from the store through
 * @ref Repository::read_commit when needed.
 */
class CommitRef {
  public:
    /// Zero id, used as the "does not exist yet" marker.
    CommitRef();
    explicit CommitRef(const git_oid& oid);

    /**
     * @brief Parse a full or abbreviated hexadecimal id.
     *
     * Abbreviated ids are zero padded. Inputs shorter than 4 or longer than
     * the full hex length, or containing non-hex characters, yield
     * `std::nullopt`.
     */
    static std::optional<CommitRef> from_hex(const std::string& hex);

    const git_oid& oid() const { return oid_; }
    bool is_zero() const;
    std::string hex() const;
    std::string short_hex(std::size_t len = 7) const;

    bool operator==(const CommitRef& o) const;
    bool operator!=(const CommitRef& o) const { return !(*this == o); }
    bool operator<(const CommitRef& o) const;

  private:
    git_oid oid_;
};

struct CommitRefHash {
    std::size_t operator()(const CommitRef& c) const;
};

/**
 * @brief Commit metadata read lazily from the object store.
 */
struct CommitMeta {
    CommitRef id;
    std::vector<CommitRef> parents;
    std::string author_name;
    std::string author_email;
    std::int64_t time = 0;  ///< Seconds since the epoch
    int offset_minutes = 0; ///< Author's UTC offset
    std::string message;
    std::string summary;
    std::optional<std::string> signature; ///< Detached `gpgsig` blob

    bool is_signed() const { return signature.has_value(); }
};

/**
 * @brief Named pointer into history, direct or symbolic.
 */
struct Reference {
    std::string name;
    std::optional<CommitRef> target; ///< Set for direct references
    std::string symbolic_target;     ///< Set for symbolic references
};

enum class HeadKind { Branch, Detached, Unborn };

struct HeadInfo {
    HeadKind kind = HeadKind::Unborn;
    std::string refname;   ///< e.g. `refs/heads/main`; empty when detached
    std::string shorthand; ///< e.g. `main`
    std::optional<CommitRef> target;
};

/**
 * @brief Read-only capability surface over a libgit2 repository.
 *
 * Owns the underlying `git_repository` handle. Missing objects and references
 * are reported as `Error{NotFound}`; other libgit2 failures as `Error{Git}`.
 */
class Repository {
  public:
    /**
     * @brief Open the repository containing @a path.
     *
     * Searches parent directories the same way `git` does.
     */
    static Repository open(const fs::path& path);

    explicit Repository(git::repo_ptr repo);
    Repository(Repository&&) = default;
    Repository& operator=(Repository&&) = default;

    git_repository* raw() const { return repo_.get(); }

    /// Working directory, empty for bare repositories.
    fs::path workdir() const;
    /// The `.git` directory.
    fs::path gitdir() const;

    /**
     * @brief Resolve a revision expression (`HEAD`, `main`, `abc123`, ...) to
     *        the commit it names.
     */
    CommitRef resolve_ref(const std::string& spec) const;

    /** @return The reference or `std::nullopt` when it does not exist. */
    std::optional<Reference> lookup_reference(const std::string& name) const;

    HeadInfo head() const;

    /**
     * @brief Name of the remote-tracking ref configured as upstream of
     *        @a refname, e.g. `refs/remotes/origin/main`.
     */
    std::optional<std::string> upstream_of(const std::string& refname) const;

    /** @brief Name of the remote that @a refname tracks, e.g. `origin`. */
    std::optional<std::string> upstream_remote_of(const std::string& refname) const;

    CommitMeta read_commit(const CommitRef& id) const;

    /** @return Root tree of commit @a id. */
    git::tree_ptr read_tree(const CommitRef& id) const;

    /** @return Tree of `HEAD`, or an empty handle when HEAD is unborn. */
    git::tree_ptr head_tree() const;

    /**
     * @brief Commits reachable from @a tip, newest first in topological order.
     *
     * When @a pruned_from is set, history reachable from it is excluded. Each
     * commit appears once.
     */
    std::vector<CommitRef> walk(const CommitRef& tip,
                                const std::optional<CommitRef>& pruned_from = std::nullopt) const;

    /** @brief Up to @a limit commits from @a tip with their metadata. */
    std::vector<CommitMeta> log(const CommitRef& tip, std::size_t limit) const;

    /**
     * @brief Best common ancestor of @a a and @a b.
     *
     * @return `std::nullopt` when the histories are unrelated.
     */
    std::optional<CommitRef> merge_base(const CommitRef& a, const CommitRef& b) const;

  private:
    git::repo_ptr repo_;
};

} // namespace gitsight

#endif // OBJECT_STORE_HPP
