#include "object_store.hpp"
#include <cctype>
#include <cstring>
#include <unordered_set>
#include "errors.hpp"
#include "logger.hpp"

namespace gitsight {

CommitRef::CommitRef() : oid_{} {}

CommitRef::CommitRef(const git_oid& oid) : oid_(oid) {}

std::optional<CommitRef> CommitRef::from_hex(const std::string& hex) {
    if (hex.size() < 4 || hex.size() > GIT_OID_HEXSZ)
        return std::nullopt;
    for (char c : hex) {
        if (!std::isxdigit(static_cast<unsigned char>(c)))
            return std::nullopt;
    }
    git_oid oid;
    if (git_oid_fromstrn(&oid, hex.c_str(), hex.size()) != 0)
        return std::nullopt;
    return CommitRef(oid);
}

bool CommitRef::is_zero() const { return git_oid_is_zero(&oid_) == 1; }

std::string CommitRef::hex() const { return git::oid_to_hex(oid_); }

std::string CommitRef::short_hex(std::size_t len) const { return hex().substr(0, len); }

bool CommitRef::operator==(const CommitRef& o) const { return git_oid_cmp(&oid_, &o.oid_) == 0; }

bool CommitRef::operator<(const CommitRef& o) const { return git_oid_cmp(&oid_, &o.oid_) < 0; }

std::size_t CommitRefHash::operator()(const CommitRef& c) const {
    std::size_t h = 0;
    std::memcpy(&h, c.oid().id, sizeof(h));
    return h;
}

Repository Repository::open(const fs::path& path) {
    git_repository* raw = nullptr;
    git::check(git_repository_open_ext(&raw, path.string().c_str(), 0, nullptr),
               "open repository " + path.string());
    return Repository(git::repo_ptr(raw));
}

Repository::Repository(git::repo_ptr repo) : repo_(std::move(repo)) {}

fs::path Repository::workdir() const {
    const char* wd = git_repository_workdir(repo_.get());
    return wd ? fs::path(wd) : fs::path();
}

fs::path Repository::gitdir() const { return fs::path(git_repository_path(repo_.get())); }

CommitRef Repository::resolve_ref(const std::string& spec) const {
    git_object* raw = nullptr;
    git::check(git_revparse_single(&raw, repo_.get(), spec.c_str()), "resolve " + spec);
    git::object_ptr obj(raw);
    git_object* peeled_raw = nullptr;
    git::check(git_object_peel(&peeled_raw, obj.get(), GIT_OBJECT_COMMIT),
               spec + " does not name a commit");
    git::object_ptr peeled(peeled_raw);
    return CommitRef(*git_object_id(peeled.get()));
}

std::optional<Reference> Repository::lookup_reference(const std::string& name) const {
    git_reference* raw = nullptr;
    int rc = git_reference_lookup(&raw, repo_.get(), name.c_str());
    if (rc == GIT_ENOTFOUND)
        return std::nullopt;
    git::check(rc, "lookup reference " + name);
    git::reference_ptr ref(raw);
    Reference out;
    out.name = git_reference_name(ref.get());
    if (git_reference_type(ref.get()) == GIT_REFERENCE_SYMBOLIC) {
        out.symbolic_target = git_reference_symbolic_target(ref.get());
    } else if (const git_oid* oid = git_reference_target(ref.get())) {
        out.target = CommitRef(*oid);
    }
    return out;
}

HeadInfo Repository::head() const {
    HeadInfo info;
    int unborn = git_repository_head_unborn(repo_.get());
    git::check(unborn, "read HEAD");
    if (unborn == 1) {
        info.kind = HeadKind::Unborn;
        auto head_ref = lookup_reference("HEAD");
        if (head_ref && !head_ref->symbolic_target.empty()) {
            info.refname = head_ref->symbolic_target;
            const std::string prefix = "refs/heads/";
            info.shorthand = info.refname.rfind(prefix, 0) == 0
                                 ? info.refname.substr(prefix.size())
                                 : info.refname;
        }
        return info;
    }
    int detached = git_repository_head_detached(repo_.get());
    git::check(detached, "read HEAD");
    git_reference* raw = nullptr;
    git::check(git_repository_head(&raw, repo_.get()), "resolve HEAD");
    git::reference_ptr ref(raw);
    if (const git_oid* oid = git_reference_target(ref.get()))
        info.target = CommitRef(*oid);
    if (detached == 1) {
        info.kind = HeadKind::Detached;
        if (info.target)
            info.shorthand = info.target->short_hex();
    } else {
        info.kind = HeadKind::Branch;
        info.refname = git_reference_name(ref.get());
        info.shorthand = git_reference_shorthand(ref.get());
    }
    return info;
}

std::optional<std::string> Repository::upstream_of(const std::string& refname) const {
    git::Buffer buf;
    int rc = git_branch_upstream_name(&buf.buf, repo_.get(), refname.c_str());
    if (rc == GIT_ENOTFOUND)
        return std::nullopt;
    git::check(rc, "read upstream of " + refname);
    return buf.str();
}

std::optional<std::string> Repository::upstream_remote_of(const std::string& refname) const {
    git::Buffer buf;
    int rc = git_branch_upstream_remote(&buf.buf, repo_.get(), refname.c_str());
    if (rc == GIT_ENOTFOUND)
        return std::nullopt;
    git::check(rc, "read upstream remote of " + refname);
    return buf.str();
}

CommitMeta Repository::read_commit(const CommitRef& id) const {
    git_commit* raw = nullptr;
    git::check(git_commit_lookup(&raw, repo_.get(), &id.oid()), "read commit " + id.hex());
    git::commit_ptr commit(raw);
    CommitMeta meta;
    meta.id = id;
    unsigned int n = git_commit_parentcount(commit.get());
    for (unsigned int i = 0; i < n; ++i)
        meta.parents.emplace_back(*git_commit_parent_id(commit.get(), i));
    if (const git_signature* author = git_commit_author(commit.get())) {
        meta.author_name = author->name ? author->name : "";
        meta.author_email = author->email ? author->email : "";
        meta.time = static_cast<std::int64_t>(author->when.time);
        meta.offset_minutes = author->when.offset;
    }
    const char* msg = git_commit_message(commit.get());
    meta.message = msg ? msg : "";
    const char* summary = git_commit_summary(commit.get());
    meta.summary = summary ? summary : "";
    git::Buffer sig;
    int rc = git_commit_header_field(&sig.buf, commit.get(), "gpgsig");
    if (rc == 0)
        meta.signature = sig.str();
    else if (rc != GIT_ENOTFOUND)
        git::check(rc, "read signature of " + id.hex());
    return meta;
}

git::tree_ptr Repository::read_tree(const CommitRef& id) const {
    git_commit* raw = nullptr;
    git::check(git_commit_lookup(&raw, repo_.get(), &id.oid()), "read commit " + id.hex());
    git::commit_ptr commit(raw);
    git_tree* tree = nullptr;
    git::check(git_commit_tree(&tree, commit.get()), "read tree of " + id.hex());
    return git::tree_ptr(tree);
}

git::tree_ptr Repository::head_tree() const {
    HeadInfo h = head();
    if (h.kind == HeadKind::Unborn || !h.target)
        return git::tree_ptr();
    return read_tree(*h.target);
}

static git::revwalk_ptr start_walk(git_repository* repo, const CommitRef& tip,
                                   const std::optional<CommitRef>& pruned_from) {
    git_revwalk* raw = nullptr;
    git::check(git_revwalk_new(&raw, repo), "create revision walk");
    git::revwalk_ptr walk(raw);
    git::check(git_revwalk_sorting(walk.get(), GIT_SORT_TOPOLOGICAL | GIT_SORT_TIME),
               "sort revision walk");
    git::check(git_revwalk_push(walk.get(), &tip.oid()), "walk from " + tip.hex());
    if (pruned_from)
        git::check(git_revwalk_hide(walk.get(), &pruned_from->oid()),
                   "prune walk at " + pruned_from->hex());
    return walk;
}

std::vector<CommitRef> Repository::walk(const CommitRef& tip,
                                        const std::optional<CommitRef>& pruned_from) const {
    git::revwalk_ptr walk = start_walk(repo_.get(), tip, pruned_from);
    std::vector<CommitRef> out;
    std::unordered_set<CommitRef, CommitRefHash> seen;
    git_oid oid;
    int rc = 0;
    while ((rc = git_revwalk_next(&oid, walk.get())) == 0) {
        CommitRef c(oid);
        if (seen.insert(c).second)
            out.push_back(c);
    }
    if (rc != GIT_ITEROVER)
        git::check(rc, "walk from " + tip.hex());
    log_debug("revision walk finished", {{"tip", tip.short_hex()},
                                         {"pruned", pruned_from ? pruned_from->short_hex() : ""},
                                         {"commits", std::to_string(out.size())}});
    return out;
}

std::vector<CommitMeta> Repository::log(const CommitRef& tip, std::size_t limit) const {
    git::revwalk_ptr walk = start_walk(repo_.get(), tip, std::nullopt);
    std::vector<CommitMeta> out;
    git_oid oid;
    int rc = 0;
    while (out.size() < limit && (rc = git_revwalk_next(&oid, walk.get())) == 0)
        out.push_back(read_commit(CommitRef(oid)));
    if (rc != 0 && rc != GIT_ITEROVER)
        git::check(rc, "walk from " + tip.hex());
    return out;
}

std::optional<CommitRef> Repository::merge_base(const CommitRef& a, const CommitRef& b) const {
    // Look both sides up first so a missing object is not mistaken for
    // unrelated history.
    for (const CommitRef* c : {&a, &b}) {
        git_commit* raw = nullptr;
        git::check(git_commit_lookup(&raw, repo_.get(), &c->oid()), "read commit " + c->hex());
        git::commit_ptr keep(raw);
    }
    git_oid out;
    int rc = git_merge_base(&out, repo_.get(), &a.oid(), &b.oid());
    if (rc == GIT_ENOTFOUND)
        return std::nullopt;
    git::check(rc, "merge base of " + a.hex() + " and " + b.hex());
    return CommitRef(out);
}

} // namespace gitsight
