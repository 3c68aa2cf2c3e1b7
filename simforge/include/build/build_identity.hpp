//! # Build Identity
//!
//! Every ephemeral build names its files `<work_dir>/<token>.*`, where the
//! token is `_fn_` followed by 15 lowercase letters. The letters encode the
//! process id and a process-wide counter in base 26, so two builds never
//! share a token, whether they run on different threads or in different
//! processes sharing one work directory.

#ifndef SIMFORGE_BUILD_BUILD_IDENTITY_HPP
#define SIMFORGE_BUILD_BUILD_IDENTITY_HPP

#include <cstdint>
#include <filesystem>
#include <string>

namespace simforge::build {

class BuildIdentity {
public:
    static constexpr const char* PREFIX = "_fn_";
    static constexpr size_t PID_LETTERS = 7;
    static constexpr size_t COUNTER_LETTERS = 8;
    static constexpr size_t TOKEN_LENGTH = 4 + PID_LETTERS + COUNTER_LETTERS;

    /// Creates the next identity for this process.
    static BuildIdentity next();

    /// Identity from explicit components (used by tests).
    static BuildIdentity from_parts(uint64_t pid, uint64_t sequence);

    const std::string& token() const {
        return token_;
    }

    /// File prefix in `dir`; the janitor removes everything starting with it.
    std::filesystem::path prefix_in(const std::filesystem::path& dir) const {
        return dir / token_;
    }

private:
    explicit BuildIdentity(std::string token) : token_(std::move(token)) {}

    std::string token_;
};

} // namespace simforge::build

#endif // SIMFORGE_BUILD_BUILD_IDENTITY_HPP
