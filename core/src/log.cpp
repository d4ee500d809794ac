#include "capsule/log.h"
#include "capsule/hash.h"
#include "capsule/json_util.h"
#include "capsule/outcome.h"

#include <json-c/json.h>

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace capsule {

static const std::string kGenesisHash(64, '0');

static std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

static void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            json_object* ks = json_object_new_string_len(keys[i].c_str(), static_cast<int>(keys[i].size()));
            out << json_object_to_json_string_ext(ks, JSON_C_TO_STRING_PLAIN);
            json_object_put(ks);
            out << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_serialize(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
        break;
    }
}

std::string canonical_json(json_object* obj) {
    std::ostringstream out;
    canonical_serialize(obj, out);
    return out.str();
}

AuditEvent make_audit_event(const std::string& strategy, const std::string& code,
                            const std::string& context_json, const ExecutionOutcome& out,
                            int64_t duration_ms) {
    AuditEvent ev;
    ev.strategy = strategy;
    ev.code_sha256 = hash::sha256_hex(code);
    ev.code_bytes = code.size();
    ev.context_bytes = context_json.size();
    ev.succeeded = out.succeeded;
    ev.error_kind = error_kind_name(out.error_kind);
    ev.output_bytes = out.captured_output.size();
    ev.duration_ms = duration_ms;
    return ev;
}

AuditLog::AuditLog(const std::string& path) : path_(path), chain_prev_(kGenesisHash) {
    {
        std::ifstream in(path);
        std::string line;
        while (in && std::getline(in, line)) {
            if (line.empty()) continue;
            json_util::Doc d = json_util::parse(line);
            auto h = json_util::get_string(d.root, "chain_hash");
            if (!h) continue;
            chain_prev_ = *h;
            seq_++;
        }
    }
    out_.open(path, std::ios::out | std::ios::app);
}

void AuditLog::record(const AuditEvent& ev) {
    if (!ok()) return;

    json_object* payload = json_object_new_object();
    json_util::put_string(payload, "code_sha256", ev.code_sha256);
    json_object_object_add(payload, "code_bytes", json_object_new_int64(static_cast<int64_t>(ev.code_bytes)));
    json_object_object_add(payload, "context_bytes", json_object_new_int64(static_cast<int64_t>(ev.context_bytes)));
    json_object_object_add(payload, "duration_ms", json_object_new_int64(ev.duration_ms));
    json_util::put_string(payload, "error_kind", ev.error_kind);
    json_object_object_add(payload, "output_bytes", json_object_new_int64(static_cast<int64_t>(ev.output_bytes)));
    json_util::put_string(payload, "strategy", ev.strategy);
    json_object_object_add(payload, "succeeded", json_object_new_boolean(ev.succeeded ? 1 : 0));

    json_object* rec = json_object_new_object();
    json_object_object_add(rec, "event", json_object_new_string("execute"));
    json_object_object_add(rec, "payload", payload);
    json_object_object_add(rec, "seq", json_object_new_int64(static_cast<int64_t>(seq_)));
    json_util::put_string(rec, "ts", iso_now());

    std::string record = canonical_json(rec);
    std::string chain_hash = hash::sha256_hex(chain_prev_ + record);

    // The written line is the record plus the two chain fields.
    json_util::put_string(rec, "chain_hash", chain_hash);
    json_util::put_string(rec, "chain_prev", chain_prev_);
    out_ << canonical_json(rec) << "\n";
    out_.flush();
    json_object_put(rec);

    chain_prev_ = chain_hash;
    seq_++;
}

bool verify_audit_chain(const std::string& path, std::string* error) {
    std::ifstream in(path);
    if (!in) {
        if (error) *error = "cannot open " + path;
        return false;
    }
    std::string prev = kGenesisHash;
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        lineno++;
        if (line.empty()) continue;
        std::string perr;
        json_util::Doc d = json_util::parse(line, &perr);
        if (!json_util::is_object(d)) {
            if (error) *error = "line " + std::to_string(lineno) + ": not a JSON object";
            return false;
        }
        auto hash_field = json_util::get_string(d.root, "chain_hash");
        auto prev_field = json_util::get_string(d.root, "chain_prev");
        if (!hash_field || !prev_field) {
            if (error) *error = "line " + std::to_string(lineno) + ": missing chain fields";
            return false;
        }
        if (*prev_field != prev) {
            if (error) *error = "line " + std::to_string(lineno) + ": chain_prev mismatch";
            return false;
        }
        json_object_object_del(d.root, "chain_hash");
        json_object_object_del(d.root, "chain_prev");
        if (hash::sha256_hex(prev + canonical_json(d.root)) != *hash_field) {
            if (error) *error = "line " + std::to_string(lineno) + ": chain_hash mismatch";
            return false;
        }
        prev = *hash_field;
    }
    return true;
}

} // namespace capsule
