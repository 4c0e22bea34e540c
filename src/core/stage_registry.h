#pragma once

#include "stage_descriptor.h"
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace nanoflow::core {

// Stage names of the default workflow, in execution order
inline constexpr const char* kStageConvert = "convert-format";
inline constexpr const char* kStageBasecall = "basecall";
inline constexpr const char* kStageAlign = "align";
inline constexpr const char* kStageRealign = "realign-signal";
inline constexpr const char* kStageInfer = "infer-modification";

// Default runtime contexts
inline constexpr const char* kNanoporeContext = "nanopore";
inline constexpr const char* kM6anetContext = "m6anet";

// Run parameters substituted into command templates
using RunParameters = std::map<std::string, std::string>;

// Ordered, validated set of stage descriptors plus the artifacts they exchange.
// Construction fails with ConfigurationError on any structural defect, so a
// registry that exists is always consistent.
class StageRegistry {
public:
    StageRegistry(std::vector<ArtifactRef> artifacts,
                  std::vector<StageDescriptor> stages,
                  std::set<std::string> parameter_names);

    // Stages in declared order
    const std::vector<StageDescriptor>& get_ordered_stages() const { return stages_; }

    const StageDescriptor* find_stage(const std::string& name) const;
    std::vector<std::string> stage_names() const;

    // Throws ConfigurationError for an unknown name
    const ArtifactRef& artifact(const std::string& name) const;
    const std::vector<ArtifactRef>& artifacts() const { return artifacts_; }

    std::vector<ArtifactRef> inputs_of(const StageDescriptor& stage) const;
    std::vector<ArtifactRef> outputs_of(const StageDescriptor& stage) const;

    // Artifacts no stage produces (signal directory, reference)
    std::vector<ArtifactRef> run_inputs() const;

    // Name of the stage producing an artifact, nullopt for run inputs
    std::optional<std::string> producer_of(const std::string& artifact) const;

    // Stage indices in dependency order (Kahn), ties broken by ordinal
    std::vector<size_t> execution_order() const;

    // Substitute {placeholders} with artifact paths and run parameters.
    // Throws ConfigurationError for a placeholder with no value.
    std::vector<std::string> render(const CommandTemplate& step, const RunParameters& params) const;

    // Redirect target of a step, if it writes its product to stdout
    std::optional<std::filesystem::path> stdout_path(const CommandTemplate& step) const;

    const std::set<std::string>& parameter_names() const { return parameter_names_; }

    // Placeholder names in one argument, in order of appearance
    static std::vector<std::string> placeholders(const std::string& arg);

private:
    std::vector<ArtifactRef> artifacts_;
    std::vector<StageDescriptor> stages_;
    std::set<std::string> parameter_names_;
    std::map<std::string, size_t> artifact_index_;
    std::map<std::string, size_t> producer_;    // Artifact -> stage index

    void validate_and_normalize();
};

// Output layout of the default workflow. All paths are derived once from
// output_root; relative arguments are made absolute.
struct ArtifactLayout {
    std::filesystem::path signal_dir;
    std::filesystem::path reference;
    std::filesystem::path output_root;

    std::vector<ArtifactRef> artifacts() const;
};

// Parameters the default command templates accept
std::set<std::string> default_parameter_names();

// The five-stage nanopore modification workflow. stage_contexts overrides the
// context of individual stages; an unknown stage name is a ConfigurationError.
StageRegistry make_default_registry(const ArtifactLayout& layout,
                                    const std::map<std::string, std::string>& stage_contexts = {});

} // namespace nanoflow::core
