#pragma once

#include <string>
#include <vector>

namespace capsule {

// Names containing KEY, TOKEN, SECRET, PASSWORD, CREDENTIAL or API
// (case-insensitive).
bool is_credential_name(const std::string& name);

// Environment handed to the child host: `parent` ("NAME=value" entries)
// minus credential-like and loader-injection variables, with PATH emptied
// and HOME/TMPDIR/TMP/TEMP pointing at `scratch`.
std::vector<std::string> build_child_environment(const std::vector<std::string>& parent,
                                                 const std::string& scratch);

// The calling process's environment as "NAME=value" entries.
std::vector<std::string> current_environment();

// capsule_childhost next to the running executable, or "" if the
// executable path cannot be determined.
std::string default_childhost_path();

// Regular file with execute permission.
bool childhost_usable(const std::string& path);

} // namespace capsule
