#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>

struct json_object;

namespace capsule {

struct ExecutionOutcome;

// Metadata of one execution. Never carries code or context contents.
struct AuditEvent {
    std::string strategy;
    std::string code_sha256;
    size_t code_bytes{0};
    size_t context_bytes{0};
    bool succeeded{false};
    std::string error_kind;
    size_t output_bytes{0};
    int64_t duration_ms{0};
};

AuditEvent make_audit_event(const std::string& strategy, const std::string& code,
                            const std::string& context_json, const ExecutionOutcome& out,
                            int64_t duration_ms);

// Append-only JSONL audit trail. Each line is canonical JSON (sorted keys)
// chained with chain_hash = sha256(chain_prev || record). Opening an
// existing log continues its chain from the last line.
class AuditLog {
public:
    explicit AuditLog(const std::string& path);

    bool ok() const { return out_.is_open() && out_.good(); }
    void record(const AuditEvent& ev);

    const std::string& path() const { return path_; }
    const std::string& last_hash() const { return chain_prev_; }
    uint64_t seq() const { return seq_; }

private:
    std::string path_;
    std::ofstream out_;
    std::string chain_prev_;
    uint64_t seq_{0};
};

// Canonical (sorted-key) rendering of a json-c value.
std::string canonical_json(json_object* obj);

// Re-hashes every line of a log written by AuditLog. False plus a reason
// (line number included) on the first broken link.
bool verify_audit_chain(const std::string& path, std::string* error);

} // namespace capsule
