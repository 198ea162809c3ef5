#include <array>
#include <bbrunner/errmsg.hh>
#include <bbrunner/file_contents.hh>
#include <bbrunner/file_descriptor.hh>
#include <bbrunner/macros/throw.hh>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

using std::string;

size_t write_all(int fd, const void* data, size_t len) noexcept {
    const auto* ptr = static_cast<const char*>(data);
    size_t pos = 0;
    int saved_errno = errno;
    while (pos < len) {
        ssize_t rc = write(fd, ptr + pos, len - pos);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            return pos; // errno is set
        }
        pos += static_cast<size_t>(rc);
    }
    errno = saved_errno;
    return pos;
}

string get_file_contents(int fd) {
    string res;
    std::array<char, 65536> buff;
    for (;;) {
        ssize_t rc = read(fd, buff.data(), buff.size());
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            THROW("read()", errmsg());
        }
        if (rc == 0) {
            return res;
        }
        res.append(buff.data(), static_cast<size_t>(rc));
    }
}

string get_file_contents(FilePath path) { return get_file_contents_at(AT_FDCWD, path); }

string get_file_contents_at(int dirfd, FilePath path) {
    FileDescriptor fd{openat(dirfd, path, O_RDONLY | O_CLOEXEC)};
    if (!fd.is_open()) {
        THROW("open(", path, ")", errmsg());
    }
    return get_file_contents(fd);
}

void put_file_contents(FilePath path, std::string_view data, mode_t mode) {
    FileDescriptor fd{path, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode};
    if (!fd.is_open()) {
        THROW("open(", path, ")", errmsg());
    }
    if (write_all(fd, data) != data.size()) {
        THROW("write(", path, ")", errmsg());
    }
    if (fd.close()) {
        THROW("close(", path, ")", errmsg());
    }
}
