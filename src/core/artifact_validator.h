#pragma once

#include "stage_registry.h"
#include <string>
#include <nlohmann/json.hpp>

namespace nanoflow::core {

enum class ValidationStatus {
    Ok,
    MissingArtifact,
    EmptyArtifact,
    FormatError
};

inline std::string validation_status_to_string(ValidationStatus status) {
    switch (status) {
        case ValidationStatus::Ok: return "ok";
        case ValidationStatus::MissingArtifact: return "missing_artifact";
        case ValidationStatus::EmptyArtifact: return "empty_artifact";
        case ValidationStatus::FormatError: return "format_error";
    }
    return "unknown";
}

// Result of checking a stage's declared artifacts. Stops at the first defect.
struct ValidationOutcome {
    ValidationStatus status = ValidationStatus::Ok;
    std::string artifact;       // Offending artifact name
    std::string path;
    std::string detail;

    bool ok() const { return status == ValidationStatus::Ok; }

    // "empty_artifact: reads_fastq (/out/02_basecall/reads.fastq): file is empty"
    std::string describe() const;

    nlohmann::json to_json() const;
    static ValidationOutcome from_json(const nlohmann::json& j);

    static ValidationOutcome success() { return {}; }
    static ValidationOutcome missing(const ArtifactRef& ref, std::string detail) {
        return {ValidationStatus::MissingArtifact, ref.name, ref.path.string(), std::move(detail)};
    }
    static ValidationOutcome empty(const ArtifactRef& ref, std::string detail) {
        return {ValidationStatus::EmptyArtifact, ref.name, ref.path.string(), std::move(detail)};
    }
    static ValidationOutcome format_error(const ArtifactRef& ref, std::string detail) {
        return {ValidationStatus::FormatError, ref.name, ref.path.string(), std::move(detail)};
    }
};

// Output contract checks. Read-only filesystem inspection.
class ArtifactValidator {
public:
    explicit ArtifactValidator(const StageRegistry& registry);

    // Existence, size and structural check of every declared output
    ValidationOutcome validate(const StageDescriptor& stage) const;

    // Existence and size of every declared input
    ValidationOutcome validate_inputs(const StageDescriptor& stage) const;

    // Full check of a single artifact
    ValidationOutcome check_artifact(const ArtifactRef& ref) const;

private:
    const StageRegistry& registry_;

    ValidationOutcome check_presence(const ArtifactRef& ref) const;
    ValidationOutcome check_format(const ArtifactRef& ref) const;
};

} // namespace nanoflow::core
