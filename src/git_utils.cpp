#include "git_utils.hpp"
#include <cstdlib>
#include <optional>
#include "errors.hpp"

using namespace std;

namespace git {

static unsigned int g_libgit_timeout = 0;
static std::string g_proxy_url; // NOLINT(runtime/string)

/**
 * @brief Configure the global libgit2 network timeout.
 *
 * libgit2 1.7 and newer apply it to both connecting and reading from the
 * server; older versions ignore it.
 *
 * @param seconds Timeout value in seconds.
 */
void set_libgit_timeout(unsigned int seconds) {
    g_libgit_timeout = seconds;
#if LIBGIT2_VER_MAJOR > 1 || (LIBGIT2_VER_MAJOR == 1 && LIBGIT2_VER_MINOR >= 7)
    if (g_libgit_timeout > 0) {
        int ms = static_cast<int>(g_libgit_timeout * 1000);
        git_libgit2_opts(GIT_OPT_SET_SERVER_CONNECT_TIMEOUT, ms);
        git_libgit2_opts(GIT_OPT_SET_SERVER_TIMEOUT, ms);
    }
#endif
}

void set_proxy(const std::string& url) { g_proxy_url = url; }

const std::string& proxy_url() { return g_proxy_url; }

static optional<string> safe_getenv(const char* name) {
    const char* v = std::getenv(name);
    if (v)
        return string(v);
    return nullopt;
}

int credential_cb(git_credential** out, const char* url, const char* username_from_url,
                  unsigned int allowed_types, void* payload) {
    auto* attempts = static_cast<CredentialAttempts*>(payload);
    auto first_try = [attempts](unsigned int type) {
        if (!attempts)
            return true;
        if (attempts->tried & type)
            return false;
        attempts->tried |= type;
        return true;
    };
    auto env_user = safe_getenv("GIT_USERNAME");
    auto env_pass = safe_getenv("GIT_PASSWORD");
    const char* user =
        username_from_url ? username_from_url : (env_user ? env_user->c_str() : nullptr);
    if ((allowed_types & GIT_CREDENTIAL_USERNAME) && user && first_try(GIT_CREDENTIAL_USERNAME)) {
        if (git_credential_username_new(out, user) == 0)
            return 0;
    }
    if ((allowed_types & GIT_CREDENTIAL_SSH_KEY) && user && first_try(GIT_CREDENTIAL_SSH_KEY)) {
        if (git_credential_ssh_key_from_agent(out, user) == 0)
            return 0;
    }
    if ((allowed_types & GIT_CREDENTIAL_USERPASS_PLAINTEXT) && env_user && env_pass &&
        first_try(GIT_CREDENTIAL_USERPASS_PLAINTEXT))
        return git_credential_userpass_plaintext_new(out, env_user->c_str(), env_pass->c_str());
    if ((allowed_types & GIT_CREDENTIAL_DEFAULT) && first_try(GIT_CREDENTIAL_DEFAULT))
        return git_credential_default_new(out); // fall back to system credential helper
    string msg = string("no more credentials to try for ") + (url ? url : "remote");
    git_error_set_str(GIT_ERROR_NET, msg.c_str());
    return GIT_EAUTH;
}

/**
 * @brief Construct the RAII guard and initialize libgit2.
 */
GitInitGuard::GitInitGuard() {
    git_libgit2_init();
    if (g_libgit_timeout > 0)
        set_libgit_timeout(g_libgit_timeout);
}

/**
 * @brief Destroy the RAII guard and shutdown libgit2.
 */
GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

StrArray::StrArray(const std::vector<std::string>& items) {
    ptrs_.reserve(items.size());
    for (const auto& s : items)
        ptrs_.push_back(const_cast<char*>(s.c_str()));
    array_.strings = ptrs_.empty() ? nullptr : ptrs_.data();
    array_.count = ptrs_.size();
}

string oid_to_hex(const git_oid& oid) {
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), &oid);
    return string(buf);
}

string last_error_message() {
    const git_error* e = git_error_last();
    if (e && e->message)
        return e->message;
    return "Unknown libgit2 error";
}

void check(int rc, const std::string& what) {
    if (rc >= 0)
        return;
    string msg = what + ": " + last_error_message();
    if (rc == GIT_ENOTFOUND)
        throw gitsight::Error(gitsight::ErrorKind::NotFound, msg);
    throw gitsight::Error(gitsight::ErrorKind::Git, msg);
}

} // namespace git
