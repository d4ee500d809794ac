#pragma once

#include <string>

namespace capsule {

// Private working directory for one isolated execution: created with
// mkdtemp (mode 0700) under the system temp dir and removed with all its
// contents on destruction.
class ScratchDir {
public:
    ScratchDir();
    ~ScratchDir();

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    bool ok() const { return !path_.empty(); }
    const std::string& path() const { return path_; }
    const std::string& error() const { return error_; }

    // Writes `name` (a plain file name) inside the directory with mode 0600.
    bool write_file(const std::string& name, const std::string& contents, std::string* error);
    std::string file_path(const std::string& name) const { return path_ + "/" + name; }

private:
    std::string path_;
    std::string error_;
};

} // namespace capsule
