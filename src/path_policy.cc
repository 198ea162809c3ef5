#include <algorithm>
#include <bbrunner/concat_tostr.hh>
#include <bbrunner/errmsg.hh>
#include <bbrunner/macros/throw.hh>
#include <bbrunner/path_policy.hh>
#include <bbrunner/run_error.hh>
#include <bbrunner/string_transform.hh>
#include <cerrno>
#include <cstdlib>
#include <memory>
#include <optional>
#include <sys/stat.h>
#include <vector>

using std::optional;
using std::string;
using std::string_view;
using std::vector;

namespace {

// Splits @p path into components resolving "." and ".." lexically. Returns std::nullopt if ".."
// steps above the beginning of the path, unless @p is_absolute is true ("/.." is "/").
optional<vector<string_view>> normalize_components(string_view path, bool is_absolute) {
    vector<string_view> comps;
    while (!path.empty()) {
        auto comp = path.substr(0, path.find('/'));
        path.remove_prefix(std::min(path.size(), comp.size() + 1));
        if (comp.empty() || comp == ".") {
            continue;
        }
        if (comp == "..") {
            if (!comps.empty()) {
                comps.pop_back();
            } else if (!is_absolute) {
                return std::nullopt;
            }
            continue;
        }
        comps.emplace_back(comp);
    }
    return comps;
}

void append_component(string& path, string_view comp) {
    if (path != "/") {
        path += '/';
    }
    path += comp;
}

string join_absolute(const vector<string_view>& comps) {
    string res = "/";
    for (auto comp : comps) {
        append_component(res, comp);
    }
    return res;
}

// On failure returns std::nullopt and sets errno
optional<string> canonical_path(const string& path) {
    std::unique_ptr<char, decltype(&std::free)> res{realpath(path.c_str(), nullptr), &std::free};
    if (!res) {
        return std::nullopt;
    }
    return string{res.get()};
}

bool is_inside(string_view root, string_view path) noexcept {
    return path == root ||
        (has_prefix(path, root) && (root == "/" || path[root.size()] == '/'));
}

} // namespace

namespace bbrunner {

PathPolicy::PathPolicy(string_view root) {
    if (root.empty() || root.front() != '/') {
        THROW("root has to be an absolute path: ", root);
    }
    auto lexical_root = join_absolute(*normalize_components(root, true));
    root_ = canonical_path(lexical_root).value_or(lexical_root);
}

bool PathPolicy::contains(string_view path) const noexcept { return is_inside(root_, path); }

string PathPolicy::resolve(string_view relative) const {
    if (!relative.empty() && relative.front() == '/') {
        throw RunError(RunError::Code::INVALID_ARGUMENT, "path has to be relative: ", relative);
    }
    auto comps = normalize_components(relative, false);
    if (!comps) {
        throw RunError(
            RunError::Code::INVALID_ARGUMENT, "path escapes ", root_, ": ", relative
        );
    }

    // Find the longest existing prefix
    string existing = root_;
    size_t existing_comps = 0;
    for (; existing_comps < comps->size(); ++existing_comps) {
        auto candidate = existing;
        append_component(candidate, (*comps)[existing_comps]);
        struct stat64 st;
        if (lstat64(candidate.c_str(), &st)) {
            break;
        }
        existing = std::move(candidate);
    }

    auto canonical = canonical_path(existing);
    if (!canonical) {
        int errnum = errno;
        if (errnum == ENOENT && existing_comps == 0) {
            canonical = root_; // the root does not exist
        } else if (errnum == ENOENT) {
            throw RunError(
                RunError::Code::INVALID_ARGUMENT, "path contains a dangling symlink: ", relative
            );
        } else {
            throw RunError(
                RunError::Code::INVALID_ARGUMENT, "cannot resolve ", existing, errmsg(errnum)
            );
        }
    }
    if (!contains(*canonical)) {
        throw RunError(
            RunError::Code::INVALID_ARGUMENT, "path escapes ", root_, ": ", relative
        );
    }

    string res = std::move(*canonical);
    for (size_t i = existing_comps; i < comps->size(); ++i) {
        append_component(res, (*comps)[i]);
    }
    return res;
}

string PathPolicy::resolve_absolute_or_relative(string_view path) const {
    if (path.empty() || path.front() != '/') {
        return resolve(path);
    }
    auto lexical = join_absolute(*normalize_components(path, true));
    if (!contains(lexical)) {
        throw RunError(
            RunError::Code::INVALID_ARGUMENT, "path lies outside ", root_, ": ", path
        );
    }
    auto relative = string_view{lexical}.substr(root_.size());
    while (!relative.empty() && relative.front() == '/') {
        relative.remove_prefix(1);
    }
    return resolve(relative);
}

} // namespace bbrunner
