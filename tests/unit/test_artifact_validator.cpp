#include <gtest/gtest.h>
#include "core/artifact_validator.h"
#include <fstream>
#include <unistd.h>

using namespace nanoflow::core;
namespace fs = std::filesystem;

class ArtifactValidatorTest : public ::testing::Test {
protected:
    fs::path dir_;
    std::unique_ptr<StageRegistry> registry_;

    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("nanoflow_validator_" + std::to_string(getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_ / "fast5");
        registry_ = std::make_unique<StageRegistry>(make_default_registry(
            ArtifactLayout{dir_ / "fast5", dir_ / "ref.fa", dir_ / "out"}));
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    const ArtifactRef& ref(const std::string& name) { return registry_->artifact(name); }

    void write(const std::string& artifact, const std::string& content) {
        const auto& path = ref(artifact).path;
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    const StageDescriptor& stage(const std::string& name) { return *registry_->find_stage(name); }

    void write_align_outputs() {
        write("aligned_sam", "@HD\tVN:1.6\n");
        write("sorted_bam", "BAM\1");
        write("bam_index", "BAI\1");
        auto now = fs::file_time_type::clock::now();
        fs::last_write_time(ref("sorted_bam").path, now - std::chrono::seconds(10));
        fs::last_write_time(ref("bam_index").path, now);
    }
};

TEST_F(ArtifactValidatorTest, MissingOutput) {
    ArtifactValidator validator(*registry_);
    auto result = validator.validate(stage("convert-format"));

    EXPECT_EQ(result.status, ValidationStatus::MissingArtifact);
    EXPECT_EQ(result.artifact, "signal_file");
    EXPECT_EQ(result.path, ref("signal_file").path.string());
}

TEST_F(ArtifactValidatorTest, EmptyFileIsReportedEvenAfterCleanExit) {
    write("signal_file", "");
    ArtifactValidator validator(*registry_);
    auto result = validator.validate(stage("convert-format"));

    EXPECT_EQ(result.status, ValidationStatus::EmptyArtifact);
    EXPECT_EQ(result.artifact, "signal_file");
    EXPECT_NE(result.describe().find("empty_artifact: signal_file"), std::string::npos);
}

TEST_F(ArtifactValidatorTest, ValidFastq) {
    write("calls_bam", "BAM\1");
    write("reads_fastq", "@read1\nACGUACGU\n+\nIIIIIIII\n");
    ArtifactValidator validator(*registry_);
    EXPECT_TRUE(validator.validate(stage("basecall")).ok());
}

TEST_F(ArtifactValidatorTest, FastaAccepted) {
    write("reads_fastq", ">read1\nACGU\n");
    ArtifactValidator validator(*registry_);
    EXPECT_TRUE(validator.check_artifact(ref("reads_fastq")).ok());
}

TEST_F(ArtifactValidatorTest, MalformedFastq) {
    ArtifactValidator validator(*registry_);

    write("reads_fastq", "@read1\nACGU\n+\nII\n");
    EXPECT_EQ(validator.check_artifact(ref("reads_fastq")).status, ValidationStatus::FormatError);

    write("reads_fastq", "@read1\nACGU\n");
    EXPECT_EQ(validator.check_artifact(ref("reads_fastq")).status, ValidationStatus::FormatError);

    write("reads_fastq", "[E] model not found\n");
    EXPECT_EQ(validator.check_artifact(ref("reads_fastq")).status, ValidationStatus::FormatError);

    write("reads_fastq", ">read1\n>read2\n");
    EXPECT_EQ(validator.check_artifact(ref("reads_fastq")).status, ValidationStatus::FormatError);
}

TEST_F(ArtifactValidatorTest, FreshIndexAccepted) {
    write_align_outputs();
    ArtifactValidator validator(*registry_);
    EXPECT_TRUE(validator.validate(stage("align")).ok());
}

TEST_F(ArtifactValidatorTest, StaleIndexRejected) {
    write_align_outputs();
    auto now = fs::file_time_type::clock::now();
    fs::last_write_time(ref("bam_index").path, now - std::chrono::seconds(60));

    ArtifactValidator validator(*registry_);
    auto result = validator.validate(stage("align"));
    EXPECT_EQ(result.status, ValidationStatus::FormatError);
    EXPECT_EQ(result.artifact, "bam_index");
}

TEST_F(ArtifactValidatorTest, EventalignTable) {
    ArtifactValidator validator(*registry_);

    write("eventalign_table", "contig\tposition\treference_kmer\tread_index\n"
                              "tx1\t10\tGGACT\t0\n");
    EXPECT_TRUE(validator.check_artifact(ref("eventalign_table")).ok());

    // Header only
    write("eventalign_table", "contig\tposition\treference_kmer\tread_index\n");
    EXPECT_EQ(validator.check_artifact(ref("eventalign_table")).status, ValidationStatus::FormatError);

    write("eventalign_table", "contig\tposition\n tx1\t10\n");
    auto missing_column = validator.check_artifact(ref("eventalign_table"));
    EXPECT_EQ(missing_column.status, ValidationStatus::FormatError);
    EXPECT_NE(missing_column.detail.find("read_index"), std::string::npos);

    write("eventalign_table", "contig\tposition\treference_kmer\tread_index\ntx1\t10\n");
    EXPECT_EQ(validator.check_artifact(ref("eventalign_table")).status, ValidationStatus::FormatError);
}

TEST_F(ArtifactValidatorTest, SiteProbabilitiesCsv) {
    fs::create_directories(ref("dataprep_dir").path);
    write("site_probabilities", "transcript_id,transcript_position,n_reads,probability_modified\n"
                                "ENST0001,1234,25,0.91\n");
    {
        std::ofstream(ref("dataprep_dir").path / "data.json") << "{}";
    }

    ArtifactValidator validator(*registry_);
    EXPECT_TRUE(validator.validate(stage("infer-modification")).ok());
}

TEST_F(ArtifactValidatorTest, EmptyDirectory) {
    fs::create_directories(ref("dataprep_dir").path);
    ArtifactValidator validator(*registry_);
    auto result = validator.check_artifact(ref("dataprep_dir"));
    EXPECT_EQ(result.status, ValidationStatus::EmptyArtifact);
}

TEST_F(ArtifactValidatorTest, WrongKind) {
    fs::create_directories(ref("signal_file").path);
    std::ofstream(ref("signal_file").path / "x") << "x";
    ArtifactValidator validator(*registry_);
    EXPECT_EQ(validator.check_artifact(ref("signal_file")).status, ValidationStatus::FormatError);
}

TEST_F(ArtifactValidatorTest, InputsPresence) {
    ArtifactValidator validator(*registry_);

    auto empty_dir = validator.validate_inputs(stage("convert-format"));
    EXPECT_EQ(empty_dir.status, ValidationStatus::EmptyArtifact);
    EXPECT_EQ(empty_dir.artifact, "signal_dir");

    std::ofstream(dir_ / "fast5" / "batch0.fast5") << "HDF";
    EXPECT_TRUE(validator.validate_inputs(stage("convert-format")).ok());

    auto missing_ref = validator.validate_inputs(stage("align"));
    EXPECT_EQ(missing_ref.status, ValidationStatus::MissingArtifact);
}

TEST_F(ArtifactValidatorTest, OutcomeJson) {
    auto outcome = ValidationOutcome::empty(ref("reads_fastq"), "file is empty");
    auto restored = ValidationOutcome::from_json(outcome.to_json());

    EXPECT_EQ(restored.status, ValidationStatus::EmptyArtifact);
    EXPECT_EQ(restored.artifact, "reads_fastq");
    EXPECT_EQ(restored.detail, "file is empty");

    EXPECT_EQ(ValidationOutcome::success().to_json()["status"], "ok");
}
