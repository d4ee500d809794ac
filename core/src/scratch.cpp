#include "capsule/scratch.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <vector>

#ifndef _WIN32
  #include <fcntl.h>
  #include <stdlib.h>
  #include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace capsule {

ScratchDir::ScratchDir() {
#ifdef _WIN32
    error_ = "scratch directories are not supported on Windows";
#else
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec) base = "/tmp";
    std::string tmpl = (base / "capsule-XXXXXX").string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (!mkdtemp(buf.data())) {
        error_ = std::string("mkdtemp failed: ") + std::strerror(errno);
        return;
    }
    path_ = buf.data();
#endif
}

ScratchDir::~ScratchDir() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove_all(path_, ec);
}

bool ScratchDir::write_file(const std::string& name, const std::string& contents, std::string* error) {
#ifdef _WIN32
    (void)name; (void)contents;
    if (error) *error = "not supported";
    return false;
#else
    if (path_.empty()) {
        if (error) *error = "scratch directory unavailable";
        return false;
    }
    if (name.empty() || name.find('/') != std::string::npos || name == "." || name == "..") {
        if (error) *error = "invalid file name";
        return false;
    }
    std::string p = file_path(name);
    int fd = open(p.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC | O_NOFOLLOW, 0600);
    if (fd < 0) {
        if (error) *error = "open " + name + ": " + std::strerror(errno);
        return false;
    }
    size_t off = 0;
    while (off < contents.size()) {
        ssize_t n = write(fd, contents.data() + off, contents.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (error) *error = "write " + name + ": " + std::strerror(errno);
            close(fd);
            return false;
        }
        off += (size_t)n;
    }
    if (close(fd) != 0) {
        if (error) *error = "close " + name + ": " + std::strerror(errno);
        return false;
    }
    return true;
#endif
}

} // namespace capsule
