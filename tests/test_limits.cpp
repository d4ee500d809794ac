#include "test_common.h"
#include "capsule/errors.h"
#include "capsule/limits.h"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <string>
#include <sys/resource.h>
#include <unistd.h>

using namespace capsule;

static bool same(const RlimitPair& a, const RlimitPair& b) {
    return a.soft == b.soft && a.hard == b.hard;
}

int main() {
    if (!limits_supported()) {
        std::cerr << "test_limits: SKIPPED (no rlimits)" << std::endl;
        return 0;
    }

    // Test 1: Soft limits are lowered inside the scope and restored after
    const LimitSnapshot before = current_limits();
    {
        ResourceLimits lim;
        lim.memory_bytes = 512ull * 1024 * 1024;
        lim.max_file_bytes = 4096;
        lim.max_open_files = 8;
        ScopedResourceLimits scoped(lim);

        LimitSnapshot inside = current_limits();
        expect_true(inside.fsize.soft <= 4096, "fsize soft limit lowered");
        expect_true(inside.nofile.soft <= 8, "nofile soft limit lowered");
        expect_true(inside.data.soft <= 512ull * 1024 * 1024, "data soft limit lowered");
        expect_true(inside.fsize.hard == before.fsize.hard, "fsize hard limit untouched");
        expect_true(inside.nofile.hard == before.nofile.hard, "nofile hard limit untouched");
    }
    LimitSnapshot after = current_limits();
    expect_true(same(after.data, before.data), "data limit restored");
    expect_true(same(after.fsize, before.fsize), "fsize limit restored");
    expect_true(same(after.nofile, before.nofile), "nofile limit restored");

    // Test 2: The file-size ceiling is actually enforced
    {
        char path[] = "/tmp/capsule-limits-XXXXXX";
        int fd = mkstemp(path);
        expect_true(fd >= 0, "mkstemp");
        struct sigaction old_sa;
        struct sigaction ign;
        std::memset(&ign, 0, sizeof(ign));
        ign.sa_handler = SIG_IGN;
        sigaction(SIGXFSZ, &ign, &old_sa);
        {
            ResourceLimits lim;
            lim.max_file_bytes = 1024;
            ScopedResourceLimits scoped(lim);
            std::string block(4096, 'x');
            ssize_t n = write(fd, block.data(), block.size());
            expect_true(n >= 0 && n <= 1024, "write past RLIMIT_FSIZE is cut short");
            ssize_t again = write(fd, block.data(), block.size());
            expect_true(again < 0 && errno == EFBIG, "further writes fail with EFBIG");
        }
        sigaction(SIGXFSZ, &old_sa, nullptr);
        close(fd);
        unlink(path);
    }

    // Test 3: Zero means "leave that limit alone"
    {
        ResourceLimits lim;
        lim.memory_bytes = 0;
        lim.max_file_bytes = 0;
        lim.max_open_files = 0;
        ScopedResourceLimits scoped(lim);
        LimitSnapshot inside = current_limits();
        expect_true(same(inside.data, before.data), "zero data limit is a no-op");
        expect_true(same(inside.nofile, before.nofile), "zero nofile limit is a no-op");
    }

    // Test 4: A limit above the current soft value never raises it
    {
        ResourceLimits lim;
        lim.max_open_files = before.nofile.soft == kUnlimited ? kUnlimited : before.nofile.soft + 100;
        ScopedResourceLimits scoped(lim);
        expect_true(current_limits().nofile.soft == before.nofile.soft, "soft limit never raised");
    }

    // Test 5: Back-to-back scopes each restore cleanly
    for (int i = 0; i < 3; i++) {
        ResourceLimits lim;
        lim.max_open_files = 6 + static_cast<uint64_t>(i);
        ScopedResourceLimits scoped(lim);
        expect_true(current_limits().nofile.soft <= lim.max_open_files, "nested-run nofile lowered");
    }
    expect_true(same(current_limits().nofile, before.nofile), "nofile restored after repeated scopes");

    std::cerr << "test_limits: ALL PASSED" << std::endl;
    return 0;
}
