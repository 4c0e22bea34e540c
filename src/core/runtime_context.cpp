#include "runtime_context.h"
#include "errors.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <unistd.h>

extern char** environ;

namespace nanoflow::core {

namespace {

bool is_executable_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return false;
    }
    return ::access(path.c_str(), X_OK) == 0;
}

// "/opt/env/bin/" and "/opt/env/bin" name the same directory
std::string normalized(const std::filesystem::path& path) {
    auto s = path.lexically_normal().string();
    while (s.size() > 1 && s.back() == '/') {
        s.pop_back();
    }
    return s;
}

} // anonymous namespace

std::map<std::string, std::string> current_environment() {
    std::map<std::string, std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string kv(*entry);
        auto pos = kv.find('=');
        if (pos == std::string::npos || pos == 0) {
            continue;
        }
        env[kv.substr(0, pos)] = kv.substr(pos + 1);
    }
    return env;
}

// RuntimeContext

std::vector<std::filesystem::path> RuntimeContext::bin_dirs() const {
    std::vector<std::filesystem::path> dirs;
    if (prefix) {
        dirs.push_back(*prefix / "bin");
    }
    dirs.insert(dirs.end(), search_paths.begin(), search_paths.end());
    return dirs;
}

nlohmann::json RuntimeContext::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    if (prefix) {
        j["prefix"] = prefix->string();
    }
    j["search_paths"] = nlohmann::json::array();
    for (const auto& p : search_paths) {
        j["search_paths"].push_back(p.string());
    }
    j["env"] = env;
    j["conflicts_with"] = conflicts_with;
    if (!stderr_filters.empty()) {
        j["stderr_filters"] = stderr_filters;
    }
    return j;
}

RuntimeContext RuntimeContext::from_json(const nlohmann::json& j) {
    RuntimeContext ctx;
    ctx.id = j.at("id").get<std::string>();
    if (j.contains("prefix") && !j.at("prefix").is_null()) {
        ctx.prefix = std::filesystem::path(j.at("prefix").get<std::string>());
    }
    if (j.contains("search_paths")) {
        for (const auto& p : j.at("search_paths")) {
            ctx.search_paths.emplace_back(p.get<std::string>());
        }
    }
    if (j.contains("env")) {
        ctx.env = j.at("env").get<std::map<std::string, std::string>>();
    }
    if (j.contains("conflicts_with")) {
        ctx.conflicts_with = j.at("conflicts_with").get<std::vector<std::string>>();
    }
    if (j.contains("stderr_filters")) {
        ctx.stderr_filters = j.at("stderr_filters").get<std::vector<std::string>>();
    }
    return ctx;
}

// RuntimeContextResolver

RuntimeContextResolver::RuntimeContextResolver(std::vector<RuntimeContext> contexts)
    : RuntimeContextResolver(std::move(contexts), current_environment()) {
}

RuntimeContextResolver::RuntimeContextResolver(std::vector<RuntimeContext> contexts,
                                               std::map<std::string, std::string> base_env)
    : base_env_(std::move(base_env)) {
    for (auto& ctx : contexts) {
        if (ctx.id.empty()) {
            throw ConfigurationError("Runtime context with empty id");
        }
        auto id = ctx.id;
        if (!contexts_.emplace(id, std::move(ctx)).second) {
            throw ConfigurationError("Duplicate runtime context: " + id);
        }
    }

    // A parent nanoflow process exported the context it runs under
    auto it = base_env_.find(kContextEnvVar);
    if (it != base_env_.end() && !it->second.empty()) {
        active_.push_back(it->second);
    }
}

bool RuntimeContextResolver::has_context(const std::string& context_id) const {
    return contexts_.find(context_id) != contexts_.end();
}

const RuntimeContext& RuntimeContextResolver::context(const std::string& context_id) const {
    auto it = contexts_.find(context_id);
    if (it == contexts_.end()) {
        throw ContextNotFoundError(context_id);
    }
    return it->second;
}

std::vector<std::string> RuntimeContextResolver::context_ids() const {
    std::vector<std::string> ids;
    for (const auto& [id, _] : contexts_) {
        ids.push_back(id);
    }
    return ids;
}

bool RuntimeContextResolver::conflicts(const std::string& a, const std::string& b) const {
    if (a == b) {
        return false;
    }
    auto declares = [this](const std::string& from, const std::string& to) {
        auto it = contexts_.find(from);
        if (it == contexts_.end()) {
            return false;
        }
        const auto& list = it->second.conflicts_with;
        return std::find(list.begin(), list.end(), to) != list.end();
    };
    return declares(a, b) || declares(b, a);
}

void RuntimeContextResolver::check_conflicts(const std::string& context_id) const {
    for (const auto& active : active_) {
        if (conflicts(context_id, active)) {
            throw ContextConflictError(context_id, active);
        }
    }
}

std::optional<std::filesystem::path> RuntimeContextResolver::locate(
    const RuntimeContext& ctx,
    const std::string& executable,
    const std::filesystem::path& cwd) const {
    std::filesystem::path exe_path(executable);

    // Explicit path: absolute, or relative to the working directory
    if (executable.find('/') != std::string::npos) {
        if (exe_path.is_relative() && !cwd.empty()) {
            exe_path = cwd / exe_path;
        }
        if (is_executable_file(exe_path)) {
            return std::filesystem::absolute(exe_path);
        }
        return std::nullopt;
    }

    // Context directories first, then the inherited PATH
    for (const auto& dir : ctx.bin_dirs()) {
        auto candidate = dir / executable;
        if (is_executable_file(candidate)) {
            return candidate;
        }
    }

    for (const auto& dir : inherited_path(ctx)) {
        auto candidate = std::filesystem::path(dir) / executable;
        if (is_executable_file(candidate)) {
            return candidate;
        }
    }

    return std::nullopt;
}

std::vector<std::string> RuntimeContextResolver::inherited_path(const RuntimeContext& ctx) const {
    std::vector<std::string> excluded;
    for (const auto& [id, other] : contexts_) {
        if (!conflicts(ctx.id, id)) continue;
        for (const auto& dir : other.bin_dirs()) {
            excluded.push_back(normalized(dir));
        }
    }

    std::vector<std::string> dirs;
    auto path_it = base_env_.find("PATH");
    if (path_it == base_env_.end()) {
        return dirs;
    }
    for (const auto& dir : utils::split(path_it->second, ':')) {
        if (dir.empty()) continue;
        if (std::find(excluded.begin(), excluded.end(), normalized(dir)) != excluded.end()) {
            continue;
        }
        dirs.push_back(dir);
    }
    return dirs;
}

bool RuntimeContextResolver::is_conflicting_prefix(const RuntimeContext& ctx,
                                                   const std::filesystem::path& path) const {
    for (const auto& [id, other] : contexts_) {
        if (other.prefix && conflicts(ctx.id, id) && normalized(*other.prefix) == normalized(path)) {
            return true;
        }
    }
    return false;
}

std::map<std::string, std::string> RuntimeContextResolver::build_environment(
    const RuntimeContext& ctx) const {
    auto env = base_env_;

    std::vector<std::string> path_parts;
    for (const auto& dir : ctx.bin_dirs()) {
        path_parts.push_back(dir.string());
    }
    for (auto& dir : inherited_path(ctx)) {
        path_parts.push_back(std::move(dir));
    }
    if (!path_parts.empty()) {
        env["PATH"] = utils::join(path_parts, ":");
    } else {
        env.erase("PATH");
    }

    // An environment activated in the calling shell must not leak into a conflicting one
    auto conda_it = env.find("CONDA_PREFIX");
    if (conda_it != env.end() && is_conflicting_prefix(ctx, conda_it->second)) {
        env.erase("CONDA_PREFIX");
        env.erase("CONDA_DEFAULT_ENV");
    }

    if (ctx.prefix) {
        env["CONDA_PREFIX"] = ctx.prefix->string();
        env["CONDA_DEFAULT_ENV"] = ctx.prefix->filename().string();
    }

    for (const auto& [key, value] : ctx.env) {
        env[key] = value;
    }

    env[kContextEnvVar] = ctx.id;
    return env;
}

ExecutionPlan RuntimeContextResolver::resolve(const std::string& context_id,
                                              const std::string& executable,
                                              const std::filesystem::path& cwd) const {
    const auto& ctx = context(context_id);
    check_conflicts(context_id);

    auto exe = locate(ctx, executable, cwd);
    if (!exe) {
        throw ExecutableNotFoundError(executable, context_id);
    }

    ExecutionPlan plan;
    plan.context_id = context_id;
    plan.executable_path = *exe;
    plan.env = build_environment(ctx);
    plan.cwd = cwd;
    return plan;
}

ExecutionPlan RuntimeContextResolver::describe(const std::string& context_id,
                                               const std::string& executable,
                                               const std::filesystem::path& cwd) const {
    const auto& ctx = context(context_id);

    ExecutionPlan plan;
    plan.context_id = context_id;
    plan.executable_path = locate(ctx, executable, cwd).value_or(executable);
    plan.env = build_environment(ctx);
    plan.cwd = cwd;
    return plan;
}

// ContextGuard

ContextGuard::ContextGuard(RuntimeContextResolver& resolver, const std::string& context_id)
    : resolver_(resolver)
    , previous_(resolver.active_) {
    resolver_.context(context_id);
    resolver_.check_conflicts(context_id);
    resolver_.active_.push_back(context_id);
}

ContextGuard::~ContextGuard() {
    resolver_.active_ = std::move(previous_);
}

} // namespace nanoflow::core
