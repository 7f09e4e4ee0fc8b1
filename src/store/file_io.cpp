#include "cop/store/file_io.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <utility>

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace cop::store {
    using namespace cop::core;

    namespace {
        Status io_error(int err) noexcept {
            return make_status(StatusDomain::Store, StatusCode::Io, static_cast<u32>(err));
        }

        Status write_all(int fd, BufferView data) noexcept {
            u32 written = 0;
            while (written < data.len) {
                const ssize_t n = ::write(fd, data.data + written, data.len - written);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    return io_error(errno);
                }
                written += static_cast<u32>(n);
            }
            return ok_status();
        }
    } // namespace

    Status create_directories(const std::string& dir, u32 mode) noexcept {
        if (dir.empty()) {
            return make_status(StatusDomain::Store, StatusCode::Invalid);
        }
        if (::mkdir(dir.c_str(), static_cast<mode_t>(mode)) == 0 || errno == EEXIST) {
            return ok_status();
        }
        if (errno != ENOENT) {
            return io_error(errno);
        }

        const std::size_t slash = dir.find_last_of('/');
        if (slash == std::string::npos || slash == 0) {
            return io_error(ENOENT);
        }
        const Status s = create_directories(dir.substr(0, slash), mode);
        if (!is_ok(s)) {
            return s;
        }
        if (::mkdir(dir.c_str(), static_cast<mode_t>(mode)) != 0 && errno != EEXIST) {
            return io_error(errno);
        }
        return ok_status();
    }

    Status read_file(const std::string& path, Bytes* out) noexcept {
        if (out == nullptr || path.empty()) {
            return make_status(StatusDomain::Store, StatusCode::Invalid);
        }
        const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            if (errno == ENOENT) {
                return make_status(StatusDomain::Store, StatusCode::NotFound);
            }
            return io_error(errno);
        }

        Bytes data;
        u8 chunk[8192];
        for (;;) {
            const ssize_t n = ::read(fd, chunk, sizeof(chunk));
            if (n < 0) {
                if (errno == EINTR) continue;
                const int err = errno;
                ::close(fd);
                return io_error(err);
            }
            if (n == 0) break;
            data.insert(data.end(), chunk, chunk + n);
        }
        ::close(fd);

        *out = std::move(data);
        return ok_status();
    }

    Status write_file(const std::string& path, BufferView data, u32 mode, bool exclusive) noexcept {
        if (path.empty() || !buffer_ok(data)) {
            return make_status(StatusDomain::Store, StatusCode::Invalid);
        }
        if (exclusive && ::access(path.c_str(), F_OK) == 0) {
            return make_status(StatusDomain::Store, StatusCode::Conflict);
        }

        const std::string tmp = path + ".tmp";
        const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, static_cast<mode_t>(mode));
        if (fd < 0) {
            return io_error(errno);
        }
        // Exact mode, independent of the umask.
        if (::fchmod(fd, static_cast<mode_t>(mode)) != 0) {
            const int err = errno;
            ::close(fd);
            ::unlink(tmp.c_str());
            return io_error(err);
        }

        Status s = write_all(fd, data);
        if (is_ok(s) && ::fsync(fd) != 0) {
            s = io_error(errno);
        }
        ::close(fd);
        if (!is_ok(s)) {
            ::unlink(tmp.c_str());
            return s;
        }

        if (::rename(tmp.c_str(), path.c_str()) != 0) {
            const int err = errno;
            ::unlink(tmp.c_str());
            return io_error(err);
        }
        return ok_status();
    }

    Status list_files(const std::string& dir, const std::string& suffix, std::vector<std::string>* stems) noexcept {
        if (stems == nullptr) {
            return make_status(StatusDomain::Store, StatusCode::Invalid);
        }
        DIR* d = ::opendir(dir.c_str());
        if (d == nullptr) {
            if (errno == ENOENT) {
                stems->clear();
                return ok_status();
            }
            return io_error(errno);
        }

        std::vector<std::string> out;
        while (const dirent* e = ::readdir(d)) {
            const std::string name(e->d_name);
            if (name.size() <= suffix.size() || name.front() == '.') {
                continue;
            }
            if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
                continue;
            }
            const std::string full = dir + "/" + name;
            struct stat st{};
            if (::stat(full.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
                continue;
            }
            out.push_back(name.substr(0, name.size() - suffix.size()));
        }
        ::closedir(d);

        std::sort(out.begin(), out.end());
        *stems = std::move(out);
        return ok_status();
    }
} // namespace cop::store
