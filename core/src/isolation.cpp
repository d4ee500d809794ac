#include "capsule/isolation.h"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <filesystem>
#include <system_error>

#ifndef _WIN32
  #include <sys/stat.h>
  #include <unistd.h>
extern char** environ;
#endif

namespace fs = std::filesystem;

namespace capsule {

static const char* const kCredentialMarkers[] = {
    "KEY", "TOKEN", "SECRET", "PASSWORD", "CREDENTIAL", "API",
};

static const char* const kLoaderVars[] = {
    "LD_PRELOAD", "LD_LIBRARY_PATH", "LD_AUDIT",
};

static const char* const kPinnedVars[] = {
    "PATH", "HOME", "TMPDIR", "TMP", "TEMP",
};

bool is_credential_name(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return (char)std::toupper(c); });
    for (const char* m : kCredentialMarkers) {
        if (upper.find(m) != std::string::npos) return true;
    }
    return false;
}

static bool in_list(const std::string& name, const char* const* list, size_t n) {
    for (size_t i = 0; i < n; i++) {
        if (name == list[i]) return true;
    }
    return false;
}

std::vector<std::string> build_child_environment(const std::vector<std::string>& parent,
                                                 const std::string& scratch) {
    std::vector<std::string> env;
    env.reserve(parent.size() + 5);
    for (const auto& entry : parent) {
        size_t eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        std::string name = entry.substr(0, eq);
        if (is_credential_name(name)) continue;
        if (in_list(name, kLoaderVars, std::size(kLoaderVars))) continue;
        if (in_list(name, kPinnedVars, std::size(kPinnedVars))) continue;
        env.push_back(entry);
    }
    env.push_back("PATH=");
    env.push_back("HOME=" + scratch);
    env.push_back("TMPDIR=" + scratch);
    env.push_back("TMP=" + scratch);
    env.push_back("TEMP=" + scratch);
    return env;
}

std::vector<std::string> current_environment() {
    std::vector<std::string> out;
#ifndef _WIN32
    for (char** e = environ; e && *e; e++) out.emplace_back(*e);
#endif
    return out;
}

std::string default_childhost_path() {
    std::error_code ec;
    fs::path self = fs::read_symlink("/proc/self/exe", ec);
    if (ec || self.empty()) return "";
    return (self.parent_path() / "capsule_childhost").string();
}

bool childhost_usable(const std::string& path) {
#ifdef _WIN32
    (void)path;
    return false;
#else
    if (path.empty()) return false;
    struct stat st;
    if (stat(path.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    return access(path.c_str(), X_OK) == 0;
#endif
}

} // namespace capsule
