#include <bbrunner/errmsg.hh>
#include <bbrunner/file_manip.hh>
#include <bbrunner/logger.hh>
#include <bbrunner/macros/throw.hh>
#include <bbrunner/string_transform.hh>
#include <bbrunner/temporary_directory.hh>
#include <cstdlib>
#include <utility>

TemporaryDirectory::TemporaryDirectory(FilePath templ) {
    std::string_view templ_str{templ.data(), templ.size()};
    if (templ_str.empty() || templ_str.front() != '/' || !has_suffix(templ_str, "XXXXXX")) {
        THROW("invalid temporary directory template: ", templ);
    }
    std::string name{templ_str};
    if (mkdtemp(name.data()) == nullptr) {
        THROW("mkdtemp()", errmsg());
    }
    path_ = std::move(name);
}

// NOLINTNEXTLINE(performance-noexcept-move-constructor): it throws
TemporaryDirectory& TemporaryDirectory::operator=(TemporaryDirectory&& other) {
    if (exists() && remove_r(path_) == -1) {
        THROW("remove_r()", errmsg());
    }
    path_ = std::exchange(other.path_, std::string{});
    return *this;
}

TemporaryDirectory::~TemporaryDirectory() {
    if (exists() && remove_r(path_) == -1) {
        errlog("Error: remove_r(", path_, ")", errmsg());
    }
}
