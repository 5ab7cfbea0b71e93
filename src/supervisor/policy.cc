#include <sandpool/errors.hh>
#include <sandpool/isolation/bpf_builder.hh>
#include <sandpool/macros/throw.hh>
#include <sandpool/supervisor/policy.hh>

namespace sandpool::supervisor {

PolicyTable PolicyTable::from_config(const SandboxConfig& config) {
    PolicyTable policy;
    for (const auto& name : config.supervisor_allow) {
        auto nr = seccomp::resolve_syscall(name.c_str());
        if (!nr) {
            THROW_AS(ConfigError, "supervisor_allow: unknown syscall: ", name);
        }
        policy.allow(*nr);
    }
    return policy;
}

} // namespace sandpool::supervisor
