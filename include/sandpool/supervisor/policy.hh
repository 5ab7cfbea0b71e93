#pragma once

#include <cerrno>
#include <cstdint>
#include <sandpool/sandbox_config.hh>
#include <unordered_map>

namespace sandpool::supervisor {

struct Verdict {
    enum class Kind : uint8_t {
        ALLOW,
        DENY,
    };

    Kind kind;
    int errnum = 0;

    static constexpr Verdict allow() noexcept { return {.kind = Kind::ALLOW, .errnum = 0}; }

    static constexpr Verdict deny(int errnum) noexcept { return {.kind = Kind::DENY, .errnum = errnum}; }

    friend bool operator==(const Verdict&, const Verdict&) = default;
};

// Maps syscall numbers to verdicts for notified syscalls
class PolicyTable {
    std::unordered_map<int, Verdict> rules_;
    Verdict default_verdict_;

public:
    explicit PolicyTable(Verdict default_verdict = Verdict::deny(EACCES)) noexcept
    : default_verdict_{default_verdict} {}

    void allow(int syscall_nr) { rules_.insert_or_assign(syscall_nr, Verdict::allow()); }

    void deny(int syscall_nr, int errnum) {
        rules_.insert_or_assign(syscall_nr, Verdict::deny(errnum));
    }

    [[nodiscard]] Verdict decide(int syscall_nr) const noexcept {
        auto it = rules_.find(syscall_nr);
        return it == rules_.end() ? default_verdict_ : it->second;
    }

    [[nodiscard]] size_t rules_num() const noexcept { return rules_.size(); }

    // Allows the syscalls named in supervisor_allow, throws ConfigError upon unknown names
    [[nodiscard]] static PolicyTable from_config(const SandboxConfig& config);
};

} // namespace sandpool::supervisor
