#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace nanoflow::core {

// Exported to every child so nested invocations see the active context
inline constexpr const char* kContextEnvVar = "NANOFLOW_CONTEXT";

// An isolated execution environment (e.g. a conda environment prefix).
// Contexts listed in conflicts_with must never be active together.
struct RuntimeContext {
    std::string id;                                  // "nanopore", "m6anet"
    std::optional<std::filesystem::path> prefix;     // Environment prefix, contributes prefix/bin
    std::vector<std::filesystem::path> search_paths; // Extra executable directories
    std::map<std::string, std::string> env;          // Variable overrides
    std::vector<std::string> conflicts_with;
    std::vector<std::string> stderr_filters;         // Noise dropped from diagnostics

    // Directories searched for executables, in order
    std::vector<std::filesystem::path> bin_dirs() const;

    nlohmann::json to_json() const;
    static RuntimeContext from_json(const nlohmann::json& j);
};

// Ready-to-exec invocation produced by the resolver
struct ExecutionPlan {
    std::string context_id;
    std::filesystem::path executable_path;
    std::map<std::string, std::string> env;          // Complete child environment
    std::filesystem::path cwd;
    std::optional<std::filesystem::path> stdout_path; // Redirect stdout to this file

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["context"] = context_id;
        j["executable"] = executable_path.string();
        j["cwd"] = cwd.string();
        if (stdout_path) {
            j["stdout"] = stdout_path->string();
        }
        return j;
    }
};

// Maps a context id to an ExecutionPlan and tracks which contexts are active
class RuntimeContextResolver {
public:
    // Uses the current process environment as the base
    explicit RuntimeContextResolver(std::vector<RuntimeContext> contexts);

    RuntimeContextResolver(std::vector<RuntimeContext> contexts,
                           std::map<std::string, std::string> base_env);

    // Build a plan for running executable inside the context.
    // Throws ContextNotFoundError, ContextConflictError or ExecutableNotFoundError.
    ExecutionPlan resolve(const std::string& context_id,
                          const std::string& executable,
                          const std::filesystem::path& cwd) const;

    // Same as resolve but keeps the bare executable name when it cannot be located
    ExecutionPlan describe(const std::string& context_id,
                           const std::string& executable,
                           const std::filesystem::path& cwd) const;

    // Throws ContextNotFoundError
    const RuntimeContext& context(const std::string& context_id) const;

    bool has_context(const std::string& context_id) const;

    // Symmetric conflict relation
    bool conflicts(const std::string& a, const std::string& b) const;

    // Throws ContextConflictError if context_id conflicts with an active context
    void check_conflicts(const std::string& context_id) const;

    // Contexts currently active in this process tree
    const std::vector<std::string>& active() const { return active_; }

    std::vector<std::string> context_ids() const;

private:
    friend class ContextGuard;

    std::map<std::string, RuntimeContext> contexts_;
    std::map<std::string, std::string> base_env_;
    std::vector<std::string> active_;

    std::optional<std::filesystem::path> locate(const RuntimeContext& ctx,
                                                const std::string& executable,
                                                const std::filesystem::path& cwd) const;

    std::map<std::string, std::string> build_environment(const RuntimeContext& ctx) const;

    // Inherited PATH entries minus the bin directories of conflicting contexts
    std::vector<std::string> inherited_path(const RuntimeContext& ctx) const;

    // True if path is the prefix of a context that conflicts with ctx
    bool is_conflicting_prefix(const RuntimeContext& ctx, const std::filesystem::path& path) const;
};

// Marks a context active for its lifetime; the previous active set is
// restored on every exit path.
class ContextGuard {
public:
    ContextGuard(RuntimeContextResolver& resolver, const std::string& context_id);
    ~ContextGuard();

    ContextGuard(const ContextGuard&) = delete;
    ContextGuard& operator=(const ContextGuard&) = delete;

private:
    RuntimeContextResolver& resolver_;
    std::vector<std::string> previous_;
};

// Current process environment as a map
std::map<std::string, std::string> current_environment();

} // namespace nanoflow::core
