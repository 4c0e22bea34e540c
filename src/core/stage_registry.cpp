#include "stage_registry.h"
#include "errors.h"
#include <algorithm>
#include <cctype>
#include <functional>
#include <queue>

namespace nanoflow::core {

namespace {

bool is_placeholder_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Calls fn(name, begin, end) for every {name} token in arg.
// Braces not enclosing an identifier are literal text.
template <typename Fn>
void scan_placeholders(const std::string& arg, Fn&& fn) {
    size_t pos = 0;
    while ((pos = arg.find('{', pos)) != std::string::npos) {
        auto close = arg.find('}', pos + 1);
        if (close == std::string::npos) {
            return;
        }
        auto name = arg.substr(pos + 1, close - pos - 1);
        if (!name.empty() && std::all_of(name.begin(), name.end(), is_placeholder_char)) {
            fn(name, pos, close + 1);
            pos = close + 1;
        } else {
            ++pos;
        }
    }
}

bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

} // anonymous namespace

StageRegistry::StageRegistry(std::vector<ArtifactRef> artifacts,
                             std::vector<StageDescriptor> stages,
                             std::set<std::string> parameter_names)
    : artifacts_(std::move(artifacts))
    , stages_(std::move(stages))
    , parameter_names_(std::move(parameter_names)) {
    validate_and_normalize();
}

void StageRegistry::validate_and_normalize() {
    if (stages_.empty()) {
        throw ConfigurationError("Pipeline defines no stages");
    }

    for (size_t i = 0; i < artifacts_.size(); ++i) {
        const auto& ref = artifacts_[i];
        if (ref.name.empty()) {
            throw ConfigurationError("Artifact with empty name");
        }
        if (ref.path.empty() || ref.path.is_relative()) {
            throw ConfigurationError("Artifact '" + ref.name + "' must have an absolute path");
        }
        if (!artifact_index_.emplace(ref.name, i).second) {
            throw ConfigurationError("Duplicate artifact: " + ref.name);
        }
        if (parameter_names_.count(ref.name)) {
            throw ConfigurationError("Artifact '" + ref.name + "' shadows a run parameter");
        }
    }

    for (const auto& ref : artifacts_) {
        if (ref.check == FormatCheck::IndexOf) {
            if (ref.check_arg.empty() || ref.check_arg == ref.name ||
                !artifact_index_.count(ref.check_arg)) {
                throw ConfigurationError("Artifact '" + ref.name +
                                         "' is an index of unknown artifact '" + ref.check_arg + "'");
            }
        }
    }

    // Names, contexts and producers
    std::set<std::string> seen_stages;
    for (size_t i = 0; i < stages_.size(); ++i) {
        auto& stage = stages_[i];
        stage.ordinal = i;

        if (stage.name.empty()) {
            throw ConfigurationError("Stage with empty name at position " + std::to_string(i));
        }
        if (!seen_stages.insert(stage.name).second) {
            throw ConfigurationError("Duplicate stage: " + stage.name);
        }
        if (stage.context_id.empty()) {
            throw ConfigurationError("Stage '" + stage.name + "' has no runtime context");
        }
        if (stage.steps.empty()) {
            throw ConfigurationError("Stage '" + stage.name + "' has no command steps");
        }
        for (const auto& step : stage.steps) {
            if (step.tool.empty()) {
                throw ConfigurationError("Stage '" + stage.name + "' has a step without a tool");
            }
        }

        for (const auto& out : stage.outputs) {
            if (!artifact_index_.count(out)) {
                throw ConfigurationError("Stage '" + stage.name + "' produces undeclared artifact '" + out + "'");
            }
            auto [it, inserted] = producer_.emplace(out, i);
            if (!inserted) {
                throw ConfigurationError("Artifact '" + out + "' is produced by both '" +
                                         stages_[it->second].name + "' and '" + stage.name + "'");
            }
        }
    }

    // Inputs and command references: nothing may point forward
    for (size_t i = 0; i < stages_.size(); ++i) {
        auto& stage = stages_[i];

        auto check_visible = [&](const std::string& name, const std::string& what) {
            auto it = producer_.find(name);
            if (it != producer_.end() && it->second > i) {
                throw ConfigurationError("Stage '" + stage.name + "' " + what + " '" + name +
                                         "' produced by later stage '" + stages_[it->second].name + "'");
            }
        };

        for (const auto& in : stage.inputs) {
            if (!artifact_index_.count(in)) {
                throw ConfigurationError("Stage '" + stage.name + "' consumes undeclared artifact '" + in + "'");
            }
            if (contains(stage.outputs, in)) {
                throw ConfigurationError("Stage '" + stage.name + "' consumes its own output '" + in + "'");
            }
            check_visible(in, "consumes");
        }

        for (const auto& step : stage.steps) {
            for (const auto& arg : step.args) {
                scan_placeholders(arg, [&](const std::string& name, size_t, size_t) {
                    if (parameter_names_.count(name)) {
                        return;
                    }
                    if (!artifact_index_.count(name)) {
                        throw ConfigurationError("Stage '" + stage.name +
                                                 "' references unknown placeholder '{" + name + "}'");
                    }
                    check_visible(name, "references");
                    // Earlier artifacts used by a command are inputs even if undeclared
                    if (!contains(stage.outputs, name) && !contains(stage.inputs, name)) {
                        stage.inputs.push_back(name);
                    }
                });
            }

            if (step.stdout_artifact && !contains(stage.outputs, *step.stdout_artifact)) {
                throw ConfigurationError("Stage '" + stage.name + "' redirects stdout to '" +
                                         *step.stdout_artifact + "' which it does not produce");
            }
        }
    }
}

const StageDescriptor* StageRegistry::find_stage(const std::string& name) const {
    for (const auto& stage : stages_) {
        if (stage.name == name) {
            return &stage;
        }
    }
    return nullptr;
}

std::vector<std::string> StageRegistry::stage_names() const {
    std::vector<std::string> names;
    for (const auto& stage : stages_) {
        names.push_back(stage.name);
    }
    return names;
}

const ArtifactRef& StageRegistry::artifact(const std::string& name) const {
    auto it = artifact_index_.find(name);
    if (it == artifact_index_.end()) {
        throw ConfigurationError("Unknown artifact: " + name);
    }
    return artifacts_[it->second];
}

std::vector<ArtifactRef> StageRegistry::inputs_of(const StageDescriptor& stage) const {
    std::vector<ArtifactRef> refs;
    for (const auto& name : stage.inputs) {
        refs.push_back(artifact(name));
    }
    return refs;
}

std::vector<ArtifactRef> StageRegistry::outputs_of(const StageDescriptor& stage) const {
    std::vector<ArtifactRef> refs;
    for (const auto& name : stage.outputs) {
        refs.push_back(artifact(name));
    }
    return refs;
}

std::vector<ArtifactRef> StageRegistry::run_inputs() const {
    std::vector<ArtifactRef> refs;
    for (const auto& ref : artifacts_) {
        if (!producer_.count(ref.name)) {
            refs.push_back(ref);
        }
    }
    return refs;
}

std::optional<std::string> StageRegistry::producer_of(const std::string& artifact) const {
    auto it = producer_.find(artifact);
    if (it == producer_.end()) {
        return std::nullopt;
    }
    return stages_[it->second].name;
}

std::vector<size_t> StageRegistry::execution_order() const {
    // Topological sort using Kahn's algorithm
    std::vector<std::set<size_t>> consumers(stages_.size());
    std::vector<size_t> in_degree(stages_.size(), 0);

    for (const auto& stage : stages_) {
        std::set<size_t> deps;
        for (const auto& in : stage.inputs) {
            auto it = producer_.find(in);
            if (it != producer_.end()) {
                deps.insert(it->second);
            }
        }
        in_degree[stage.ordinal] = deps.size();
        for (size_t dep : deps) {
            consumers[dep].insert(stage.ordinal);
        }
    }

    // Min-heap on ordinal keeps declared order among ready stages
    std::priority_queue<size_t, std::vector<size_t>, std::greater<size_t>> ready;
    for (size_t i = 0; i < stages_.size(); ++i) {
        if (in_degree[i] == 0) {
            ready.push(i);
        }
    }

    std::vector<size_t> order;
    while (!ready.empty()) {
        size_t current = ready.top();
        ready.pop();
        order.push_back(current);

        for (size_t consumer : consumers[current]) {
            if (--in_degree[consumer] == 0) {
                ready.push(consumer);
            }
        }
    }

    if (order.size() != stages_.size()) {
        throw ConfigurationError("Stage dependencies contain a cycle");
    }
    return order;
}

std::vector<std::string> StageRegistry::render(const CommandTemplate& step,
                                               const RunParameters& params) const {
    std::vector<std::string> rendered;
    rendered.reserve(step.args.size());

    for (const auto& arg : step.args) {
        std::string out;
        size_t copied = 0;
        scan_placeholders(arg, [&](const std::string& name, size_t begin, size_t end) {
            out.append(arg, copied, begin - copied);
            auto pit = params.find(name);
            if (pit != params.end()) {
                out += pit->second;
            } else if (artifact_index_.count(name)) {
                out += artifact(name).path.string();
            } else {
                throw ConfigurationError("No value for placeholder '{" + name + "}' in " + step.tool + " command");
            }
            copied = end;
        });
        out.append(arg, copied, std::string::npos);
        rendered.push_back(std::move(out));
    }
    return rendered;
}

std::optional<std::filesystem::path> StageRegistry::stdout_path(const CommandTemplate& step) const {
    if (!step.stdout_artifact) {
        return std::nullopt;
    }
    return artifact(*step.stdout_artifact).path;
}

std::vector<std::string> StageRegistry::placeholders(const std::string& arg) {
    std::vector<std::string> names;
    scan_placeholders(arg, [&](const std::string& name, size_t, size_t) {
        names.push_back(name);
    });
    return names;
}

// Default workflow

std::vector<ArtifactRef> ArtifactLayout::artifacts() const {
    auto root = std::filesystem::absolute(output_root).lexically_normal();
    auto convert_dir = root / "01_convert";
    auto basecall_dir = root / "02_basecall";
    auto align_dir = root / "03_align";
    auto realign_dir = root / "04_realign";
    auto infer_dir = root / "05_infer";

    auto file = [](std::string name, std::filesystem::path path,
                   FormatCheck check = FormatCheck::None, std::string arg = {}) {
        ArtifactRef ref;
        ref.name = std::move(name);
        ref.path = std::move(path);
        ref.kind = ArtifactKind::File;
        ref.check = check;
        ref.check_arg = std::move(arg);
        ref.min_size = 1;
        return ref;
    };
    auto dir = [](std::string name, std::filesystem::path path) {
        ArtifactRef ref;
        ref.name = std::move(name);
        ref.path = std::move(path);
        ref.kind = ArtifactKind::Directory;
        return ref;
    };

    return {
        dir("signal_dir", std::filesystem::absolute(signal_dir).lexically_normal()),
        file("reference", std::filesystem::absolute(reference).lexically_normal()),
        file("signal_file", convert_dir / "reads.pod5"),
        file("calls_bam", basecall_dir / "calls.bam"),
        file("reads_fastq", basecall_dir / "reads.fastq", FormatCheck::FastxRecords),
        file("reads_index", basecall_dir / "reads.fastq.index", FormatCheck::IndexOf, "reads_fastq"),
        file("aligned_sam", align_dir / "aligned.sam"),
        file("sorted_bam", align_dir / "aligned.sorted.bam"),
        file("bam_index", align_dir / "aligned.sorted.bam.bai", FormatCheck::IndexOf, "sorted_bam"),
        file("eventalign_table", realign_dir / "eventalign.txt", FormatCheck::DelimitedTable, "read_index"),
        file("eventalign_summary", realign_dir / "summary.txt"),
        dir("dataprep_dir", infer_dir / "dataprep"),
        dir("inference_dir", infer_dir / "inference"),
        file("site_probabilities", infer_dir / "inference" / "data.site_proba.csv",
             FormatCheck::DelimitedTable, "probability_modified"),
    };
}

std::set<std::string> default_parameter_names() {
    return {"threads", "basecall_model", "modification_profile"};
}

StageRegistry make_default_registry(const ArtifactLayout& layout,
                                    const std::map<std::string, std::string>& stage_contexts) {
    auto step = [](std::string tool, std::vector<std::string> args,
                   std::optional<std::string> stdout_artifact = std::nullopt) {
        return CommandTemplate{std::move(tool), std::move(args), std::move(stdout_artifact)};
    };

    std::vector<StageDescriptor> stages;

    StageDescriptor convert;
    convert.name = kStageConvert;
    convert.context_id = kNanoporeContext;
    convert.inputs = {"signal_dir"};
    convert.outputs = {"signal_file"};
    convert.steps = {
        step("pod5", {"convert", "fast5", "{signal_dir}", "--recursive", "--output", "{signal_file}",
                      "--threads", "{threads}", "--force-overwrite"}),
    };
    stages.push_back(std::move(convert));

    StageDescriptor basecall;
    basecall.name = kStageBasecall;
    basecall.context_id = kNanoporeContext;
    basecall.inputs = {"signal_file"};
    basecall.outputs = {"calls_bam", "reads_fastq"};
    basecall.steps = {
        step("dorado", {"basecaller", "{basecall_model}", "{signal_file}",
                        "--modified-bases", "{modification_profile}"}, "calls_bam"),
        step("samtools", {"fastq", "-T", "MM,ML", "{calls_bam}"}, "reads_fastq"),
    };
    stages.push_back(std::move(basecall));

    StageDescriptor align;
    align.name = kStageAlign;
    align.context_id = kNanoporeContext;
    align.inputs = {"reads_fastq", "reference"};
    align.outputs = {"aligned_sam", "sorted_bam", "bam_index"};
    align.steps = {
        step("minimap2", {"-ax", "map-ont", "-t", "{threads}", "-o", "{aligned_sam}",
                          "{reference}", "{reads_fastq}"}),
        step("samtools", {"sort", "-@", "{threads}", "-o", "{sorted_bam}", "{aligned_sam}"}),
        step("samtools", {"index", "{sorted_bam}"}),
    };
    stages.push_back(std::move(align));

    StageDescriptor realign;
    realign.name = kStageRealign;
    realign.context_id = kNanoporeContext;
    realign.inputs = {"signal_dir", "reads_fastq", "sorted_bam", "bam_index", "reference"};
    realign.outputs = {"reads_index", "eventalign_table", "eventalign_summary"};
    realign.steps = {
        step("nanopolish", {"index", "-d", "{signal_dir}", "{reads_fastq}"}),
        step("nanopolish", {"eventalign", "--reads", "{reads_fastq}", "--bam", "{sorted_bam}",
                            "--genome", "{reference}", "--scale-events", "--signal-index",
                            "--summary", "{eventalign_summary}", "--threads", "{threads}"},
             "eventalign_table"),
    };
    stages.push_back(std::move(realign));

    StageDescriptor infer;
    infer.name = kStageInfer;
    infer.context_id = kM6anetContext;
    infer.inputs = {"eventalign_table"};
    infer.outputs = {"dataprep_dir", "inference_dir", "site_probabilities"};
    infer.steps = {
        step("m6anet", {"dataprep", "--eventalign", "{eventalign_table}", "--out_dir", "{dataprep_dir}",
                        "--n_processes", "{threads}"}),
        step("m6anet", {"inference", "--input_dir", "{dataprep_dir}", "--out_dir", "{inference_dir}",
                        "--n_processes", "{threads}"}),
    };
    stages.push_back(std::move(infer));

    for (const auto& [stage_name, context_id] : stage_contexts) {
        auto it = std::find_if(stages.begin(), stages.end(),
                               [&](const StageDescriptor& s) { return s.name == stage_name; });
        if (it == stages.end()) {
            throw ConfigurationError("Unknown stage in stage_contexts: " + stage_name);
        }
        if (context_id.empty()) {
            throw ConfigurationError("Empty runtime context for stage: " + stage_name);
        }
        it->context_id = context_id;
    }

    return StageRegistry(layout.artifacts(), std::move(stages), default_parameter_names());
}

} // namespace nanoflow::core
