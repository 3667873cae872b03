#include "git_utils.hpp"

using namespace std;

namespace git {

/**
 * @brief Construct the RAII guard and initialize libgit2.
 */
GitInitGuard::GitInitGuard() { git_libgit2_init(); }

/**
 * @brief Destroy the RAII guard and shutdown libgit2.
 */
GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

bool is_git_repo(const fs::path& p) {
    std::error_code ec;
    return fs::is_directory(p / ".git", ec);
}

/**
 * @brief Convert a libgit2 object ID to a hexadecimal string.
 */
static string oid_to_hex(const git_oid& oid) {
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), &oid);
    return string(buf);
}

/**
 * @brief Populate an error string with the last libgit2 error message.
 */
static void set_error(string* error) {
    if (!error)
        return;
    const git_error* e = git_error_last();
    if (e && e->message)
        *error = e->message;
    else
        *error = "Unknown libgit2 error";
}

static git_repository* open_repo(const fs::path& repo, string* error) {
    git_repository* raw = nullptr;
    if (git_repository_open(&raw, repo.string().c_str()) != 0) {
        set_error(error);
        return nullptr;
    }
    return raw;
}

static optional<string> resolve_ref(const fs::path& repo, const string& refname, string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return nullopt;
    git_oid oid;
    if (git_reference_name_to_id(&oid, r.get(), refname.c_str()) != 0) {
        set_error(error);
        return nullopt;
    }
    return oid_to_hex(oid);
}

optional<string> get_local_hash(const fs::path& repo, string* error) {
    return resolve_ref(repo, "HEAD", error);
}

optional<string> get_tracking_hash(const fs::path& repo, const string& remote, const string& branch,
                                   string* error) {
    return resolve_ref(repo, "refs/remotes/" + remote + "/" + branch, error);
}

optional<string> get_current_branch(const fs::path& repo, string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return nullopt;
    if (git_repository_head_detached(r.get()) == 1) {
        if (error)
            *error = "HEAD is detached";
        return nullopt;
    }
    git_reference* head = nullptr;
    if (git_repository_head(&head, r.get()) != 0) {
        set_error(error);
        return nullopt;
    }
    reference_ptr ref(head);
    const char* name = git_reference_shorthand(ref.get());
    string branch = name ? name : "";
    if (branch.empty()) {
        set_error(error);
        return nullopt;
    }
    return branch;
}

optional<string> get_commit_summary(const fs::path& repo, const string& hash, string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return nullopt;
    git_oid oid;
    if (git_oid_fromstr(&oid, hash.c_str()) != 0) {
        set_error(error);
        return nullopt;
    }
    git_commit* raw = nullptr;
    if (git_commit_lookup(&raw, r.get(), &oid) != 0) {
        set_error(error);
        return nullopt;
    }
    commit_ptr commit(raw);
    const char* summary = git_commit_summary(commit.get());
    return string(summary ? summary : "");
}

string short_hash(const string& hash) { return hash.substr(0, 7); }

} // namespace git
