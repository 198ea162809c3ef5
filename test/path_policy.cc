#include <bbrunner/concat_tostr.hh>
#include <bbrunner/file_manip.hh>
#include <bbrunner/path_policy.hh>
#include <bbrunner/run_error.hh>
#include <bbrunner/temporary_directory.hh>
#include <gtest/gtest.h>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

using bbrunner::PathPolicy;
using bbrunner::RunError;
using std::string;

namespace {

void expect_invalid_argument(const PathPolicy& policy, std::string_view path) {
    try {
        (void)policy.resolve(path);
        ADD_FAILURE() << "resolved: " << path;
    } catch (const RunError& e) {
        EXPECT_EQ(e.code(), RunError::Code::INVALID_ARGUMENT) << path << ": " << e.what();
    }
}

} // namespace

// NOLINTNEXTLINE
TEST(path_policy, root_has_to_be_absolute) {
    EXPECT_THROW(PathPolicy{"relative/dir"}, std::runtime_error);
    EXPECT_THROW(PathPolicy{""}, std::runtime_error);
}

// NOLINTNEXTLINE
TEST(path_policy, resolves_paths_inside_root) {
    TemporaryDirectory tmp_dir{"/tmp/bbrunner-path-policy.XXXXXX"};
    PathPolicy policy{tmp_dir.path()};
    const auto& root = policy.root();
    ASSERT_EQ(mkdir_r(concat_tostr(root, "/a/b")), 0);

    EXPECT_EQ(policy.resolve(""), root);
    EXPECT_EQ(policy.resolve("."), root);
    EXPECT_EQ(policy.resolve("a"), concat_tostr(root, "/a"));
    EXPECT_EQ(policy.resolve("a/b/"), concat_tostr(root, "/a/b"));
    EXPECT_EQ(policy.resolve("a/./b/../b"), concat_tostr(root, "/a/b"));
    EXPECT_EQ(policy.resolve("a/../a"), concat_tostr(root, "/a"));
    // Missing components are allowed
    EXPECT_EQ(policy.resolve("a/missing/file"), concat_tostr(root, "/a/missing/file"));
    EXPECT_EQ(policy.resolve("missing/../a"), concat_tostr(root, "/a"));
}

// NOLINTNEXTLINE
TEST(path_policy, rejects_escaping_paths) {
    TemporaryDirectory tmp_dir{"/tmp/bbrunner-path-policy.XXXXXX"};
    PathPolicy policy{tmp_dir.path()};
    ASSERT_EQ(mkdir_r(concat_tostr(policy.root(), "/a")), 0);

    expect_invalid_argument(policy, "/etc/passwd");
    expect_invalid_argument(policy, "..");
    expect_invalid_argument(policy, "../etc");
    expect_invalid_argument(policy, "a/../../etc");
    expect_invalid_argument(policy, "a/../../../../../../etc/passwd");
}

// NOLINTNEXTLINE
TEST(path_policy, follows_symlinks_of_the_existing_part) {
    TemporaryDirectory tmp_dir{"/tmp/bbrunner-path-policy.XXXXXX"};
    PathPolicy policy{tmp_dir.path()};
    const auto& root = policy.root();
    ASSERT_EQ(mkdir_r(concat_tostr(root, "/dir")), 0);
    ASSERT_EQ(symlink("dir", concat_tostr(root, "/inside").c_str()), 0);
    ASSERT_EQ(symlink("/etc", concat_tostr(root, "/outside").c_str()), 0);
    ASSERT_EQ(symlink("..", concat_tostr(root, "/dir/up").c_str()), 0);
    ASSERT_EQ(symlink("../..", concat_tostr(root, "/dir/up2").c_str()), 0);
    ASSERT_EQ(symlink("nonexistent", concat_tostr(root, "/dangling").c_str()), 0);

    EXPECT_EQ(policy.resolve("inside"), concat_tostr(root, "/dir"));
    EXPECT_EQ(policy.resolve("inside/file"), concat_tostr(root, "/dir/file"));
    EXPECT_EQ(policy.resolve("dir/up"), root);
    expect_invalid_argument(policy, "outside");
    expect_invalid_argument(policy, "outside/passwd");
    expect_invalid_argument(policy, "dir/up2");
    expect_invalid_argument(policy, "dir/up2/etc");
    expect_invalid_argument(policy, "dangling");
    expect_invalid_argument(policy, "dangling/file");
}

// NOLINTNEXTLINE
TEST(path_policy, resolve_absolute_or_relative) {
    TemporaryDirectory tmp_dir{"/tmp/bbrunner-path-policy.XXXXXX"};
    PathPolicy policy{tmp_dir.path()};
    const auto& root = policy.root();
    ASSERT_EQ(mkdir_r(concat_tostr(root, "/x/y")), 0);

    EXPECT_EQ(policy.resolve_absolute_or_relative("x"), concat_tostr(root, "/x"));
    EXPECT_EQ(
        policy.resolve_absolute_or_relative(concat_tostr(root, "/x/y")), concat_tostr(root, "/x/y")
    );
    EXPECT_EQ(policy.resolve_absolute_or_relative(root), root);
    EXPECT_THROW((void)policy.resolve_absolute_or_relative("/etc"), RunError);
    EXPECT_THROW(
        (void)policy.resolve_absolute_or_relative(concat_tostr(root, "/../etc")), RunError
    );
    // A sibling sharing the prefix of the root is outside of it
    EXPECT_THROW(
        (void)policy.resolve_absolute_or_relative(concat_tostr(root, "-sibling")), RunError
    );
}

// NOLINTNEXTLINE
TEST(path_policy, contains) {
    PathPolicy policy{"/nonexistent/build/root/"};
    EXPECT_EQ(policy.root(), "/nonexistent/build/root");
    EXPECT_TRUE(policy.contains("/nonexistent/build/root"));
    EXPECT_TRUE(policy.contains("/nonexistent/build/root/a"));
    EXPECT_FALSE(policy.contains("/nonexistent/build/rootx"));
    EXPECT_FALSE(policy.contains("/nonexistent/build"));
    EXPECT_TRUE(PathPolicy{"/"}.contains("/anything"));
}
