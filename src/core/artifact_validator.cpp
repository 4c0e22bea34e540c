#include "artifact_validator.h"
#include "utils/file_utils.h"
#include "utils/string_utils.h"
#include <algorithm>

namespace nanoflow::core {

namespace {

// Lines read when looking for the first record or table row
constexpr size_t kHeadLines = 64;

std::vector<std::string> non_blank(std::vector<std::string> lines) {
    lines.erase(std::remove_if(lines.begin(), lines.end(),
                               [](const std::string& l) { return utils::trim(l).empty(); }),
                lines.end());
    return lines;
}

char detect_delimiter(const std::string& header) {
    if (header.find('\t') != std::string::npos) return '\t';
    if (header.find(',') != std::string::npos) return ',';
    return '\t';
}

} // anonymous namespace

std::string ValidationOutcome::describe() const {
    if (ok()) {
        return "ok";
    }
    std::string s = validation_status_to_string(status) + ": " + artifact;
    if (!path.empty()) {
        s += " (" + path + ")";
    }
    if (!detail.empty()) {
        s += ": " + detail;
    }
    return s;
}

nlohmann::json ValidationOutcome::to_json() const {
    nlohmann::json j;
    j["status"] = validation_status_to_string(status);
    if (!ok()) {
        j["artifact"] = artifact;
        j["path"] = path;
        j["detail"] = detail;
    }
    return j;
}

ValidationOutcome ValidationOutcome::from_json(const nlohmann::json& j) {
    ValidationOutcome v;
    auto status = j.value("status", "ok");
    if (status == "missing_artifact") v.status = ValidationStatus::MissingArtifact;
    else if (status == "empty_artifact") v.status = ValidationStatus::EmptyArtifact;
    else if (status == "format_error") v.status = ValidationStatus::FormatError;
    v.artifact = j.value("artifact", "");
    v.path = j.value("path", "");
    v.detail = j.value("detail", "");
    return v;
}

ArtifactValidator::ArtifactValidator(const StageRegistry& registry)
    : registry_(registry) {
}

ValidationOutcome ArtifactValidator::validate(const StageDescriptor& stage) const {
    for (const auto& ref : registry_.outputs_of(stage)) {
        auto result = check_artifact(ref);
        if (!result.ok()) {
            return result;
        }
    }
    return ValidationOutcome::success();
}

ValidationOutcome ArtifactValidator::validate_inputs(const StageDescriptor& stage) const {
    for (const auto& ref : registry_.inputs_of(stage)) {
        auto result = check_presence(ref);
        if (!result.ok()) {
            return result;
        }
    }
    return ValidationOutcome::success();
}

ValidationOutcome ArtifactValidator::check_artifact(const ArtifactRef& ref) const {
    auto result = check_presence(ref);
    if (!result.ok()) {
        return result;
    }
    return check_format(ref);
}

ValidationOutcome ArtifactValidator::check_presence(const ArtifactRef& ref) const {
    std::error_code ec;
    auto status = std::filesystem::status(ref.path, ec);
    if (ec || !std::filesystem::exists(status)) {
        return ValidationOutcome::missing(ref, "does not exist");
    }

    if (ref.kind == ArtifactKind::Directory) {
        if (!std::filesystem::is_directory(status)) {
            return ValidationOutcome::format_error(ref, "expected a directory");
        }
        if (!utils::is_nonempty_directory(ref.path)) {
            return ValidationOutcome::empty(ref, "directory is empty");
        }
        return ValidationOutcome::success();
    }

    if (!std::filesystem::is_regular_file(status)) {
        return ValidationOutcome::format_error(ref, "expected a regular file");
    }
    auto size = utils::file_size(ref.path);
    if (!size) {
        return ValidationOutcome::missing(ref, "cannot read file size");
    }
    if (*size == 0) {
        return ValidationOutcome::empty(ref, "file is empty");
    }
    if (*size < ref.min_size) {
        return ValidationOutcome::empty(ref, "file is " + std::to_string(*size) +
                                             " bytes, expected at least " + std::to_string(ref.min_size));
    }
    return ValidationOutcome::success();
}

ValidationOutcome ArtifactValidator::check_format(const ArtifactRef& ref) const {
    switch (ref.check) {
        case FormatCheck::None:
            return ValidationOutcome::success();

        case FormatCheck::FastxRecords: {
            auto lines = non_blank(utils::read_head_lines(ref.path, kHeadLines));
            if (lines.empty()) {
                return ValidationOutcome::format_error(ref, "no records");
            }
            const auto& header = lines[0];
            if (header[0] == '>') {
                if (lines.size() < 2 || lines[1][0] == '>') {
                    return ValidationOutcome::format_error(ref, "FASTA record without sequence");
                }
                return ValidationOutcome::success();
            }
            if (header[0] == '@') {
                if (lines.size() < 4) {
                    return ValidationOutcome::format_error(ref, "truncated FASTQ record");
                }
                if (lines[2][0] != '+') {
                    return ValidationOutcome::format_error(ref, "FASTQ separator line missing");
                }
                if (lines[1].size() != lines[3].size()) {
                    return ValidationOutcome::format_error(ref, "FASTQ sequence and quality lengths differ");
                }
                return ValidationOutcome::success();
            }
            return ValidationOutcome::format_error(ref, "not a FASTQ or FASTA file");
        }

        case FormatCheck::IndexOf: {
            const auto& target = registry_.artifact(ref.check_arg);
            std::error_code ec;
            auto target_time = std::filesystem::last_write_time(target.path, ec);
            if (ec) {
                return ValidationOutcome::format_error(ref, "indexed artifact '" + target.name + "' is missing");
            }
            auto index_time = std::filesystem::last_write_time(ref.path, ec);
            if (ec) {
                return ValidationOutcome::missing(ref, "cannot read modification time");
            }
            if (index_time < target_time) {
                return ValidationOutcome::format_error(ref, "index is older than " + target.path.string());
            }
            return ValidationOutcome::success();
        }

        case FormatCheck::DelimitedTable: {
            auto lines = non_blank(utils::read_head_lines(ref.path, kHeadLines));
            if (lines.empty()) {
                return ValidationOutcome::format_error(ref, "missing header");
            }
            char delim = detect_delimiter(lines[0]);
            auto columns = utils::split(lines[0], delim);
            for (auto& c : columns) {
                c = utils::trim(c);
            }

            if (!ref.check_arg.empty() &&
                std::find(columns.begin(), columns.end(), ref.check_arg) == columns.end()) {
                return ValidationOutcome::format_error(ref, "missing column '" + ref.check_arg + "'");
            }
            if (lines.size() < 2) {
                return ValidationOutcome::format_error(ref, "header without data rows");
            }
            auto row = utils::split(lines[1], delim);
            if (row.size() != columns.size()) {
                return ValidationOutcome::format_error(ref, "first row has " + std::to_string(row.size()) +
                                                            " columns, header has " + std::to_string(columns.size()));
            }
            return ValidationOutcome::success();
        }
    }
    return ValidationOutcome::success();
}

} // namespace nanoflow::core
