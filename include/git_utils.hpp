#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <string>
#include <vector>

namespace git {

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * Instantiate once for the lifetime of the application to ensure all libgit2
 * operations are performed after initialization and before shutdown.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
    GitInitGuard(const GitInitGuard&) = delete;
    GitInitGuard& operator=(const GitInitGuard&) = delete;
};

/**
 * @brief Configure the global libgit2 network timeout in seconds.
 *
 * A value of `0` keeps the library default.
 */
void set_libgit_timeout(unsigned int seconds);

/**
 * @brief Route fetch and push traffic through @a url (empty clears it).
 */
void set_proxy(const std::string& url);

/** @return Proxy URL configured with @ref set_proxy. */
const std::string& proxy_url();

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    ~GitHandle() { reset(); }
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    GitHandle(GitHandle&& o) noexcept : h(o.release()) {}
    GitHandle& operator=(GitHandle&& o) noexcept {
        if (this != &o)
            reset(o.release());
        return *this;
    }
    T* get() const { return h; }
    T* release() {
        T* out = h;
        h = nullptr;
        return out;
    }
    void reset(T* next = nullptr) {
        if (h)
            Free(h);
        h = next;
    }
    explicit operator bool() const { return h != nullptr; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using remote_ptr = GitHandle<git_remote, git_remote_free>;
using object_ptr = GitHandle<git_object, git_object_free>;
using reference_ptr = GitHandle<git_reference, git_reference_free>;
using status_list_ptr = GitHandle<git_status_list, git_status_list_free>;
using commit_ptr = GitHandle<git_commit, git_commit_free>;
using tree_ptr = GitHandle<git_tree, git_tree_free>;
using index_ptr = GitHandle<git_index, git_index_free>;
using revwalk_ptr = GitHandle<git_revwalk, git_revwalk_free>;
using diff_ptr = GitHandle<git_diff, git_diff_free>;
using patch_ptr = GitHandle<git_patch, git_patch_free>;

/**
 * @brief Owning wrapper around a libgit2 `git_buf`.
 */
struct Buffer {
    git_buf buf = GIT_BUF_INIT;
    Buffer() = default;
    ~Buffer() { git_buf_dispose(&buf); }
    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;
    std::string str() const { return buf.ptr ? std::string(buf.ptr, buf.size) : std::string(); }
};

/**
 * @brief Borrowed `git_strarray` view over a list of strings.
 *
 * The referenced strings must outlive the view.
 */
class StrArray {
  public:
    explicit StrArray(const std::vector<std::string>& items);
    git_strarray* get() { return &array_; }

  private:
    std::vector<char*> ptrs_;
    git_strarray array_{};
};

// The utility functions below assume libgit2 is already initialized.

/**
 * @brief Text of the most recent libgit2 error on this thread.
 */
std::string last_error_message();

/**
 * @brief Throw a `gitsight::Error` when @a rc signals a libgit2 failure.
 *
 * `GIT_ENOTFOUND` maps to `ErrorKind::NotFound`; every other negative code
 * maps to `ErrorKind::Git`. The message is prefixed with @a what.
 *
 * @param rc   Return code of a libgit2 call.
 * @param what Short description of the attempted operation.
 */
void check(int rc, const std::string& what);

/**
 * @brief Convert a libgit2 object ID to a hexadecimal string.
 */
std::string oid_to_hex(const git_oid& oid);

/** Credential kinds already handed out during one transfer. */
struct CredentialAttempts {
    unsigned int tried = 0;
};

/**
 * @brief libgit2 credential callback used for fetch and push.
 *
 * Credentials are chosen in the following order:
 *  1. Username only, when the transport asks for it.
 *  2. SSH agent.
 *  3. Username/password from `GIT_USERNAME`/`GIT_PASSWORD`.
 *  4. Default credential helper, when the transport allows it.
 *
 * @param payload Optional `CredentialAttempts`. When given, each kind is
 *        offered once and a repeated request fails with `GIT_EAUTH`.
 */
int credential_cb(git_credential** out, const char* url, const char* username_from_url,
                  unsigned int allowed_types, void* payload);

} // namespace git

#endif // GIT_UTILS_HPP
