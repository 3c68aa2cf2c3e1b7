#include "build/build_identity.hpp"

#include <atomic>

#include <unistd.h>

namespace simforge::build {

static std::atomic<uint64_t> g_build_sequence{0};

/// Writes `value` as exactly `width` base-26 letters, most significant first.
/// Values that do not fit wrap around; the widths are chosen so pids and any
/// realistic build count fit.
static void append_letters(std::string& out, uint64_t value, size_t width) {
    std::string digits(width, 'a');
    for (size_t i = width; i > 0; --i) {
        digits[i - 1] = static_cast<char>('a' + (value % 26));
        value /= 26;
    }
    out += digits;
}

BuildIdentity BuildIdentity::from_parts(uint64_t pid, uint64_t sequence) {
    std::string token = PREFIX;
    token.reserve(TOKEN_LENGTH);
    append_letters(token, pid, PID_LETTERS);
    append_letters(token, sequence, COUNTER_LETTERS);
    return BuildIdentity(std::move(token));
}

BuildIdentity BuildIdentity::next() {
    uint64_t seq = g_build_sequence.fetch_add(1, std::memory_order_relaxed);
    return from_parts(static_cast<uint64_t>(getpid()), seq);
}

} // namespace simforge::build
