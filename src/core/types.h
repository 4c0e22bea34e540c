#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace nanoflow::core {

// Overall run status
enum class RunStatus {
    Pending,
    Running,
    Succeeded,
    Failed,
    PartiallyCompleted
};

inline std::string run_status_to_string(RunStatus status) {
    switch (status) {
        case RunStatus::Pending: return "pending";
        case RunStatus::Running: return "running";
        case RunStatus::Succeeded: return "succeeded";
        case RunStatus::Failed: return "failed";
        case RunStatus::PartiallyCompleted: return "partially_completed";
    }
    return "unknown";
}

inline std::optional<RunStatus> run_status_from_string(const std::string& s) {
    if (s == "pending") return RunStatus::Pending;
    if (s == "running") return RunStatus::Running;
    if (s == "succeeded") return RunStatus::Succeeded;
    if (s == "failed") return RunStatus::Failed;
    if (s == "partially_completed") return RunStatus::PartiallyCompleted;
    return std::nullopt;
}

// Outcome of a single stage attempt
enum class AttemptOutcome {
    Succeeded,
    ProcessFailure,      // Non-zero exit or timeout
    ValidationFailure,   // Zero exit but declared outputs missing/empty/malformed
    ConfigurationError,  // Unknown/conflicting context, missing executable or input
    Canceled
};

inline std::string attempt_outcome_to_string(AttemptOutcome outcome) {
    switch (outcome) {
        case AttemptOutcome::Succeeded: return "succeeded";
        case AttemptOutcome::ProcessFailure: return "process_failure";
        case AttemptOutcome::ValidationFailure: return "validation_failure";
        case AttemptOutcome::ConfigurationError: return "configuration_error";
        case AttemptOutcome::Canceled: return "canceled";
    }
    return "unknown";
}

inline std::optional<AttemptOutcome> attempt_outcome_from_string(const std::string& s) {
    if (s == "succeeded") return AttemptOutcome::Succeeded;
    if (s == "process_failure") return AttemptOutcome::ProcessFailure;
    if (s == "validation_failure") return AttemptOutcome::ValidationFailure;
    if (s == "configuration_error") return AttemptOutcome::ConfigurationError;
    if (s == "canceled") return AttemptOutcome::Canceled;
    return std::nullopt;
}

// Artifact kind
enum class ArtifactKind {
    File,
    Directory
};

inline std::string artifact_kind_to_string(ArtifactKind kind) {
    switch (kind) {
        case ArtifactKind::File: return "file";
        case ArtifactKind::Directory: return "directory";
    }
    return "unknown";
}

inline std::optional<ArtifactKind> artifact_kind_from_string(const std::string& s) {
    if (s == "file") return ArtifactKind::File;
    if (s == "directory" || s == "dir") return ArtifactKind::Directory;
    return std::nullopt;
}

// Structural check applied to an artifact after its producing stage
enum class FormatCheck {
    None,
    FastxRecords,    // Text read file with at least one FASTQ/FASTA record
    IndexOf,         // Index must not be older than the artifact it indexes
    DelimitedTable   // Header plus at least one consistent data row
};

inline std::string format_check_to_string(FormatCheck check) {
    switch (check) {
        case FormatCheck::None: return "none";
        case FormatCheck::FastxRecords: return "fastx_records";
        case FormatCheck::IndexOf: return "index_of";
        case FormatCheck::DelimitedTable: return "delimited_table";
    }
    return "unknown";
}

inline std::optional<FormatCheck> format_check_from_string(const std::string& s) {
    if (s == "none") return FormatCheck::None;
    if (s == "fastx_records") return FormatCheck::FastxRecords;
    if (s == "index_of") return FormatCheck::IndexOf;
    if (s == "delimited_table") return FormatCheck::DelimitedTable;
    return std::nullopt;
}

// A file or directory produced by one stage and consumed by later ones.
// Paths are fixed at run start; refs are coordinates, never mutated.
struct ArtifactRef {
    std::string name;                       // "sorted_bam", "reads_fastq"
    std::filesystem::path path;             // Absolute
    ArtifactKind kind = ArtifactKind::File;
    FormatCheck check = FormatCheck::None;
    std::string check_arg;                  // IndexOf: indexed artifact; DelimitedTable: required column
    std::uintmax_t min_size = 0;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["name"] = name;
        j["path"] = path.string();
        j["kind"] = artifact_kind_to_string(kind);
        j["check"] = format_check_to_string(check);
        if (!check_arg.empty()) {
            j["check_arg"] = check_arg;
        }
        if (min_size > 0) {
            j["min_size"] = min_size;
        }
        return j;
    }
};

// Command template for one external tool invocation
struct CommandTemplate {
    std::string tool;                           // Tool key: "dorado", "samtools"
    std::vector<std::string> args;              // May contain {placeholder} tokens
    std::optional<std::string> stdout_artifact; // Artifact receiving stdout, if any

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["tool"] = tool;
        j["args"] = args;
        if (stdout_artifact) {
            j["stdout"] = *stdout_artifact;
        }
        return j;
    }
};

} // namespace nanoflow::core
