#include "capsule/config.h"
#include "capsule/engine.h"
#include "capsule/log.h"
#include "capsule/outcome.h"
#include "capsule/validator.h"

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace capsule;

// Same cap the engine applies to contexts; code files are checked by the
// engine itself.
static constexpr size_t MAX_INPUT_BYTES = kMaxContextBytes + 1;

static bool read_file(const std::string& path, std::string* out) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        std::cerr << "cannot open " << path << "\n";
        return false;
    }
    std::string data;
    char buf[8192];
    while (in.read(buf, sizeof(buf)) || in.gcount() > 0) {
        data.append(buf, (size_t)in.gcount());
        if (data.size() > MAX_INPUT_BYTES) break;
    }
    *out = std::move(data);
    return true;
}

static int cmd_exec(int argc, char** argv, const EngineConfig& cfg) {
    if (argc < 3 || argc > 4) {
        std::cerr << "usage: capsule_cli exec <code_file> [context_file]\n";
        return 2;
    }
    std::string code, context;
    if (!read_file(argv[2], &code)) return 2;
    if (argc == 4 && !read_file(argv[3], &context)) return 2;

    Engine engine(cfg);
    ExecutionOutcome out = engine.execute(code, context);
    std::cout << outcome_to_json(out) << "\n";
    return out.succeeded ? 0 : 1;
}

static int cmd_check(int argc, char** argv) {
    if (argc != 3) {
        std::cerr << "usage: capsule_cli check <code_file>\n";
        return 2;
    }
    std::string code;
    if (!read_file(argv[2], &code)) return 2;
    std::string err;
    if (code.size() > kMaxCodeBytes) {
        err = "code exceeds " + std::to_string(kMaxCodeBytes) + " bytes";
    } else if (validate_source(code, &err)) {
        std::cout << "OK\n";
        return 0;
    }
    std::cout << format_error(ErrorKind::VALIDATION, err) << "\n";
    return 1;
}

static int cmd_info(const EngineConfig& cfg, Profile profile) {
    Engine engine(cfg);
    const ResourceLimits& lim = cfg.limits;
    std::cout << "profile:        " << profile_name(profile) << "\n"
              << "isolation:      " << isolation_mode_name(cfg.isolation) << "\n"
              << "strategy:       " << engine.strategy_name() << "\n"
              << "seccomp:        " << (cfg.enable_seccomp ? "on" : "off") << "\n"
              << "timeout_sec:    " << lim.timeout_seconds << "\n"
              << "memory_bytes:   " << lim.memory_bytes << "\n"
              << "max_file_bytes: " << lim.max_file_bytes << "\n"
              << "max_open_files: " << lim.max_open_files << "\n"
              << "audit_log:      " << (cfg.audit_log_path.empty() ? "-" : cfg.audit_log_path) << "\n";
    return 0;
}

static int cmd_verify_log(int argc, char** argv) {
    if (argc != 3) {
        std::cerr << "usage: capsule_cli verify_log <audit_log>\n";
        return 2;
    }
    std::string err;
    if (!verify_audit_chain(argv[2], &err)) {
        std::cout << "CHAIN BROKEN: " << err << "\n";
        return 1;
    }
    std::cout << "CHAIN OK\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "capsule_cli <exec|check|info|verify_log> ...\n";
        return 2;
    }
    const Profile profile = detect_profile();
    apply_profile_defaults(profile);
    const EngineConfig cfg = load_engine_config();

    std::string cmd = argv[1];
    if (cmd == "exec") return cmd_exec(argc, argv, cfg);
    if (cmd == "check") return cmd_check(argc, argv);
    if (cmd == "info") return cmd_info(cfg, profile);
    if (cmd == "verify_log") return cmd_verify_log(argc, argv);

    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
