// capsule_childhost: runs one snippet inside the isolated child process.
//
// The parent stages the snippet and its context in the scratch directory
// and reads back exactly one JSON line from stdout.

#include "capsule/engine.h"
#include "capsule/outcome.h"
#include "capsule/runtime.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

using namespace capsule;

static bool read_capped(const char* path, size_t max_bytes, std::string* out, std::string* error) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        *error = std::string("cannot open ") + path;
        return false;
    }
    std::string data;
    char buf[8192];
    while (in.read(buf, sizeof(buf)) || in.gcount() > 0) {
        data.append(buf, static_cast<size_t>(in.gcount()));
        if (data.size() > max_bytes) {
            *error = std::string(path) + " exceeds " + std::to_string(max_bytes) + " bytes";
            return false;
        }
    }
    *out = std::move(data);
    return true;
}

static int emit(const ExecutionOutcome& out) {
    if (out.succeeded) {
        std::cout << child_success_json(out.result_json.value_or("null"), out.captured_output) << "\n";
    } else {
        // The parent re-adds the "<Kind>: " prefix.
        std::string msg = out.error.value_or("");
        std::string prefix = std::string(error_kind_name(out.error_kind)) + ": ";
        if (msg.compare(0, prefix.size(), prefix) == 0) msg.erase(0, prefix.size());
        std::cout << child_failure_json(out.error_kind, msg) << "\n";
    }
    std::cout.flush();
    return out.succeeded ? 0 : 1;
}

int main(int argc, char** argv) {
    if (argc != 5 || std::strcmp(argv[1], "--timeout") != 0) {
        std::cerr << "usage:\n  capsule_childhost --timeout <seconds> <code_file> <context_file>\n";
        return 2;
    }

    char* end = nullptr;
    errno = 0;
    double timeout = std::strtod(argv[2], &end);
    if (errno != 0 || end == argv[2] || *end != '\0' || timeout < 0) {
        std::cerr << "capsule_childhost: invalid --timeout value\n";
        return 2;
    }

    std::string code, context, err;
    if (!read_capped(argv[3], kMaxCodeBytes, &code, &err) ||
        !read_capped(argv[4], kMaxContextBytes, &context, &err)) {
        return emit(make_failure(ErrorKind::RESOURCE, err));
    }

    try {
        return emit(run_snippet(code, context, timeout));
    } catch (const std::exception& e) {
        return emit(make_failure(ErrorKind::RUNTIME, e.what()));
    }
}
