#include "platform.hpp"
#include <core/constants.hpp>
#include <cerrno>
#include <cstdlib>
#include <system_error>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#  include <io.h>
#  include <cstdio>
#  include <fstream>
#else
#  include <fcntl.h>
#  include <sys/stat.h>
#  include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace platform {

static std::string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
}

fs::path home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (!home) home = std::getenv("HOME");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path config_base_dir() {
#if defined(_WIN32)
    std::string appdata = env_or_empty(ENV_APPDATA);
    if (!appdata.empty()) return fs::path(appdata);
    return home_dir();
#elif defined(__APPLE__)
    return home_dir() / "Library" / "Application Support";
#else
    std::string xdg = env_or_empty(ENV_XDG_CONFIG_HOME);
    if (!xdg.empty()) return fs::path(xdg);
    return home_dir() / ".config";
#endif
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

#ifdef _WIN32

// GetTempFileName only takes a three character prefix
fs::path write_temp_file(const fs::path& dir, const std::string& /*prefix*/,
                         const std::string& data) {
    wchar_t fname[MAX_PATH];
    if (GetTempFileNameW(dir.wstring().c_str(), L"ais", 0, fname) == 0) {
        throw std::system_error(static_cast<int>(GetLastError()), std::system_category(),
                                "cannot create temporary file in " + dir.string());
    }
    fs::path tmp(fname);
    std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
    f.write(data.data(), static_cast<std::streamsize>(data.size()));
    f.flush();
    if (!f) {
        f.close();
        std::error_code ec;
        fs::remove(tmp, ec);
        throw std::system_error(EIO, std::generic_category(),
                                "cannot write " + tmp.string());
    }
    f.close();
    return tmp;
}

void replace_file(const fs::path& source, const fs::path& target) {
    if (!MoveFileExW(source.wstring().c_str(), target.wstring().c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        throw std::system_error(static_cast<int>(GetLastError()), std::system_category(),
                                "cannot replace " + target.string());
    }
}

bool stdin_is_tty() {
    return _isatty(_fileno(stdin)) != 0;
}

// Windows ACLs, not mode bits, guard %APPDATA%
bool create_private_directory(const fs::path& dir) {
    std::error_code ec;
    bool created = fs::create_directory(dir, ec);
    if (ec) {
        throw std::system_error(ec, "cannot create " + dir.string());
    }
    return created;
}

bool append_owner_only(const fs::path& path, const std::string& data) {
    std::ofstream out(path, std::ios::binary | std::ios::app);
    if (!out) return false;
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    return static_cast<bool>(out);
}

#else // Unix

static bool write_all(int fd, const char* p, size_t left) {
    while (left > 0) {
        ssize_t n = write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    return true;
}

fs::path write_temp_file(const fs::path& dir, const std::string& prefix,
                         const std::string& data) {
    std::string tmpl = (dir / (prefix + ".XXXXXX")).string();
    // mkstemp creates the file with mode 0600
    int fd = mkstemp(tmpl.data());
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(),
                                "cannot create temporary file in " + dir.string());
    }

    auto fail = [&](const std::string& what) {
        int err = errno;
        close(fd);
        unlink(tmpl.c_str());
        throw std::system_error(err, std::generic_category(), what + " " + tmpl);
    };

    if (fchmod(fd, static_cast<mode_t>(CREDENTIALS_FILE_MODE)) != 0) fail("cannot chmod");

    if (!write_all(fd, data.data(), data.size())) fail("cannot write");
    if (fsync(fd) != 0) fail("cannot sync");
    if (close(fd) != 0) {
        int err = errno;
        unlink(tmpl.c_str());
        throw std::system_error(err, std::generic_category(), "cannot close " + tmpl);
    }
    return fs::path(tmpl);
}

void replace_file(const fs::path& source, const fs::path& target) {
    // rename(2) replaces target atomically on the same filesystem
    fs::rename(source, target);
}

bool stdin_is_tty() {
    return isatty(STDIN_FILENO) != 0;
}

bool create_private_directory(const fs::path& dir) {
    // umask can only narrow 0700, never widen it
    if (mkdir(dir.c_str(), static_cast<mode_t>(CREDENTIALS_DIR_MODE)) == 0) return true;
    if (errno == EEXIST) return false;
    throw std::system_error(errno, std::generic_category(), "cannot create " + dir.string());
}

bool append_owner_only(const fs::path& path, const std::string& data) {
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_NOFOLLOW | O_CLOEXEC,
                  static_cast<mode_t>(CREDENTIALS_FILE_MODE));
    if (fd < 0) return false;
    bool ok = fchmod(fd, static_cast<mode_t>(CREDENTIALS_FILE_MODE)) == 0 &&
              write_all(fd, data.data(), data.size());
    if (close(fd) != 0) ok = false;
    return ok;
}

#endif

void atomic_write_file(const fs::path& target, const std::string& data) {
    fs::path dir = target.parent_path();
    if (dir.empty()) dir = ".";
    fs::path tmp = write_temp_file(dir, "." + target.filename().string() + ".tmp", data);
    try {
        replace_file(tmp, target);
    } catch (...) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw;
    }
}

} // namespace platform
