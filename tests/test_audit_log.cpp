#include "test_common.h"
#include "capsule/hash.h"
#include "capsule/json_util.h"
#include "capsule/log.h"
#include "capsule/outcome.h"

#include <array>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

using namespace capsule;

static std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string l;
    while (std::getline(in, l)) lines.push_back(l);
    return lines;
}

static void write_lines(const std::string& path, const std::vector<std::string>& lines) {
    std::ofstream out(path, std::ios::trunc);
    for (const auto& l : lines) out << l << "\n";
}

static std::string replace_once(std::string s, const std::string& from, const std::string& to) {
    size_t at = s.find(from);
    if (at == std::string::npos) die("pattern not found: " + from);
    return s.replace(at, from.size(), to);
}

int main() {
    // Test 1: SHA-256 known answers, one-shot and incremental
    expect_eq_str(hash::sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855", "sha256 empty");
    expect_eq_str(hash::sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", "sha256 abc");
    {
        std::string msg = "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";
        hash::Sha256 h;
        for (char c : msg) {
            uint8_t b = static_cast<uint8_t>(c);
            h.update(&b, 1);
        }
        std::array<uint8_t, 32> digest = h.finish();
        std::string hex;
        char two[3];
        for (uint8_t b : digest) {
            std::snprintf(two, sizeof(two), "%02x", b);
            hex += two;
        }
        expect_eq_str(hex, hash::sha256_hex(msg), "incremental matches one-shot");
        expect_eq_str(hex, "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1",
                      "sha256 two-block message, byte at a time");
    }

    // Test 2: Canonical JSON sorts keys at every level
    {
        json_util::Doc d = json_util::parse("{\"b\":1,\"a\":{\"d\":2,\"c\":[3,{\"z\":null,\"y\":true}]}}");
        expect_true(json_util::is_object(d), "canonical input parses");
        expect_eq_str(canonical_json(d.root), "{\"a\":{\"c\":[3,{\"y\":true,\"z\":null}],\"d\":2},\"b\":1}",
                      "canonical rendering");
    }

    char tmpl[] = "/tmp/capsule-audit-XXXXXX";
    int fd = mkstemp(tmpl);
    expect_true(fd >= 0, "mkstemp");
    close(fd);
    const std::string path = tmpl;
    std::remove(path.c_str());

    const std::string secret_code = "result = 'CAPSULE_AUDIT_CANARY'";
    const std::string secret_ctx = "{\"CAPSULE_CTX_CANARY\": 1}";

    // Test 3: Records chain from the genesis hash
    {
        AuditLog log(path);
        expect_true(log.ok(), "log opens");
        expect_eq_str(log.last_hash(), std::string(64, '0'), "genesis hash");
        ExecutionOutcome ok = make_success("\"CAPSULE_AUDIT_CANARY\"", "");
        ExecutionOutcome bad = make_failure(ErrorKind::TIMEOUT, "execution exceeded 5s limit");
        log.record(make_audit_event("inprocess", secret_code, secret_ctx, ok, 3));
        log.record(make_audit_event("process", secret_code, "", bad, 5000));
        log.record(make_audit_event("process", "result = 2", "", ok, 12));
        expect_eq_ll((long long)log.seq(), 3, "three records");
    }
    std::string err;
    expect_true(verify_audit_chain(path, &err), "fresh log verifies: " + err);

    // Test 4: Contents are metadata only
    {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        std::string all = ss.str();
        expect_true(all.find("CAPSULE_AUDIT_CANARY") == std::string::npos, "code never logged");
        expect_true(all.find("CAPSULE_CTX_CANARY") == std::string::npos, "context never logged");
        expect_contains(all, hash::sha256_hex(secret_code), "code digest logged");
        expect_contains(all, "\"error_kind\":\"Timeout\"", "failure kind logged");
        expect_contains(all, "\"strategy\":\"inprocess\"", "strategy logged");
        expect_contains(all, "\"context_bytes\":" + std::to_string(secret_ctx.size()), "context size logged");
    }

    // Test 5: Reopening continues the chain
    {
        AuditLog log(path);
        expect_eq_ll((long long)log.seq(), 3, "seq resumes");
        expect_true(log.last_hash() != std::string(64, '0'), "chain resumes from last hash");
        log.record(make_audit_event("process", "result = 3", "", make_success("3", ""), 7));
    }
    expect_true(verify_audit_chain(path, &err), "reopened log verifies: " + err);
    std::vector<std::string> lines = read_lines(path);
    expect_eq_ll((long long)lines.size(), 4, "four lines");
    expect_contains(lines[3], "\"seq\":3", "fourth record has seq 3");

    // Test 6: Tampering is detected
    {
        std::vector<std::string> t = lines;
        t[1] = replace_once(t[1], "\"duration_ms\":5000", "\"duration_ms\":5");
        write_lines(path, t);
        expect_true(!verify_audit_chain(path, &err), "edited payload detected");
        expect_contains(err, "line 2: chain_hash mismatch", "edited line reported");

        t = lines;
        t.erase(t.begin() + 1);
        write_lines(path, t);
        expect_true(!verify_audit_chain(path, &err), "removed record detected");
        expect_contains(err, "line 2: chain_prev mismatch", "gap reported");

        t = lines;
        t[2] = "not json";
        write_lines(path, t);
        expect_true(!verify_audit_chain(path, &err), "garbage line detected");
        expect_contains(err, "line 3: not a JSON object", "garbage line reported");
    }

    std::remove(path.c_str());
    expect_true(!verify_audit_chain(path, &err), "missing log fails verification");
    expect_contains(err, "cannot open", "missing log reason");

    std::cerr << "test_audit_log: ALL PASSED" << std::endl;
    return 0;
}
