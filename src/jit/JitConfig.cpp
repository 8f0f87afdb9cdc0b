//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/jit/JitConfig.cpp
// Purpose: Defaulting, environment overrides and validation for JitConfig.
// Key invariants: Environment parsing never throws; unknown or malformed
//                 values leave the field untouched.
// Ownership/Lifetime: Stateless helpers operating on caller-owned configs.
// Links: docs/dev/jit.md
//
//===----------------------------------------------------------------------===//

#include "jit/JitConfig.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>
#include <thread>

namespace kiln::jit
{
namespace
{

/// @brief Lowercase copy of an environment value.
std::string lowered(const char *raw)
{
    std::string v{raw};
    std::transform(v.begin(),
                   v.end(),
                   v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v;
}

/// @brief Parse an unsigned decimal environment variable.
/// @return Parsed value, or std::nullopt when unset or not entirely numeric.
std::optional<unsigned long long> readUnsigned(const char *name)
{
    const char *env = std::getenv(name);
    if (!env || *env == '\0')
        return std::nullopt;
    char *end = nullptr;
    unsigned long long n = std::strtoull(env, &end, 10);
    if (!end || *end != '\0')
        return std::nullopt;
    return n;
}

/// @brief Parse a boolean flag; accepts 1/true/on and 0/false/off.
std::optional<bool> readFlag(const char *name)
{
    const char *env = std::getenv(name);
    if (!env)
        return std::nullopt;
    const std::string v = lowered(env);
    if (v == "1" || v == "true" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "off")
        return false;
    return std::nullopt;
}

} // namespace

std::string_view toString(CompileMode mode)
{
    switch (mode)
    {
        case CompileMode::Background:
            return "background";
        case CompileMode::Synchronous:
            return "sync";
    }
    return "unknown";
}

unsigned effectiveWorkerCount(const JitConfig &cfg)
{
    if (cfg.mode == CompileMode::Synchronous)
        return 0;
    if (cfg.workerCount != 0)
        return cfg.workerCount;
    const unsigned hw = std::thread::hardware_concurrency();
    return std::max(1u, hw / 2);
}

void applyEnvironmentOverrides(JitConfig &cfg)
{
    if (const char *modeEnv = std::getenv("KILN_JIT_MODE"))
    {
        const std::string mode = lowered(modeEnv);
        if (mode == "background" || mode == "async")
            cfg.mode = CompileMode::Background;
        else if (mode == "sync" || mode == "synchronous")
            cfg.mode = CompileMode::Synchronous;
    }
    if (auto n = readUnsigned("KILN_JIT_THREADS"))
        cfg.workerCount = static_cast<unsigned>(*n);
    if (auto n = readUnsigned("KILN_JIT_QUEUE_CAPACITY"))
        cfg.queueCapacity = static_cast<std::size_t>(*n);
    if (auto n = readUnsigned("KILN_JIT_CALL_THRESHOLD"))
        cfg.callThreshold = *n;
    if (auto n = readUnsigned("KILN_JIT_LOOP_THRESHOLD"))
        cfg.loopThreshold = *n;
    if (auto on = readFlag("KILN_TRACE_COMPILATION"))
        cfg.trace.compilation = *on;
    if (auto on = readFlag("KILN_TRACE_INVALIDATION"))
        cfg.trace.invalidation = *on;
}

support::Expected<void> validate(const JitConfig &cfg)
{
    using support::ErrorKind;
    using support::makeError;
    if (cfg.callThreshold == 0)
        return makeError(ErrorKind::InvalidConfig, "call threshold must be positive");
    if (cfg.loopThreshold == 0)
        return makeError(ErrorKind::InvalidConfig, "loop threshold must be positive");
    if (cfg.maxSpeculationFailures == 0)
        return makeError(ErrorKind::InvalidConfig, "speculation failure limit must be positive");
    if (cfg.defaultDeadline.count() < 0)
        return makeError(ErrorKind::InvalidConfig, "default deadline must not be negative");
    return {};
}

} // namespace kiln::jit
