#include <bbrunner/file_manip.hh>
#include <cerrno>
#include <dirent.h>
#include <fcntl.h>
#include <linux/limits.h>
#include <sys/stat.h>
#include <unistd.h>

using std::string;

int mkdir_r(string path, mode_t mode) noexcept {
    if (path.size() >= PATH_MAX) {
        errno = ENAMETOOLONG;
        return -1;
    }
    if (path.empty() || path.back() != '/') {
        path += '/';
    }

    size_t end = 1; // leading slash is skipped
    while (end < path.size()) {
        while (path[end] != '/') {
            ++end;
        }
        path[end] = '\0';
        if (mkdir(path.data(), mode) == -1 && errno != EEXIST) {
            return -1;
        }
        path[end++] = '/';
    }
    return 0;
}

int remove_r_at(int dirfd, FilePath path) noexcept {
    int fd = openat(dirfd, path, O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC);
    if (fd == -1) {
        return unlinkat(dirfd, path, 0);
    }

    DIR* dir = fdopendir(fd);
    if (dir == nullptr) {
        int ec = errno;
        (void)close(fd);
        errno = ec;
        return -1;
    }

    int ec = 0;
    for (;;) {
        errno = 0;
        dirent* file = readdir(dir);
        if (file == nullptr) {
            ec = errno;
            break;
        }
        if (file->d_name[0] == '.' &&
            (file->d_name[1] == '\0' || (file->d_name[1] == '.' && file->d_name[2] == '\0')))
        {
            continue;
        }
        int rc = file->d_type == DT_DIR || file->d_type == DT_UNKNOWN
            ? remove_r_at(fd, file->d_name)
            : unlinkat(fd, file->d_name, 0);
        if (rc) {
            ec = errno;
            break;
        }
    }
    (void)closedir(dir);

    if (ec != 0) {
        errno = ec;
        return -1;
    }
    return unlinkat(dirfd, path, AT_REMOVEDIR);
}

bool path_exists(FilePath path) noexcept {
    struct stat64 st = {};
    return lstat64(path, &st) == 0;
}

bool is_directory(FilePath path) noexcept {
    struct stat64 st = {};
    return stat64(path, &st) == 0 && S_ISDIR(st.st_mode);
}
