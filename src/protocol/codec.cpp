#include "protocol/codec.h"
#include <cstring>

namespace testsieve {
namespace wire {

void write(ByteWriter& w, bool value) { w.u8(value ? 1 : 0); }
void write(ByteWriter& w, int32_t value) { w.u32(static_cast<uint32_t>(value)); }
void write(ByteWriter& w, int64_t value) { w.u64(static_cast<uint64_t>(value)); }

void write(ByteWriter& w, double value) {
    uint64_t bits = 0;
    static_assert(sizeof(bits) == sizeof(value));
    std::memcpy(&bits, &value, sizeof(bits));
    w.u64(bits);
}

void write(ByteWriter& w, const std::string& value) { w.bytes(value); }

void read(ByteReader& r, bool& value) { value = r.u8() != 0; }
void read(ByteReader& r, int32_t& value) { value = static_cast<int32_t>(r.u32()); }
void read(ByteReader& r, int64_t& value) { value = static_cast<int64_t>(r.u64()); }

void read(ByteReader& r, double& value) {
    uint64_t bits = r.u64();
    std::memcpy(&value, &bits, sizeof(value));
}

void read(ByteReader& r, std::string& value) { value = r.bytes(); }

void write(ByteWriter& w, const FileDependency& value) {
    write(w, value.filename);
    write(w, value.sha);
}

void read(ByteReader& r, FileDependency& value) {
    read(r, value.filename);
    read(r, value.sha);
}

void write(ByteWriter& w, const FileFingerprint& value) {
    write(w, value.filename);
    write(w, value.fsha);
    write(w, value.mtime);
    write(w, value.checksums);
}

void read(ByteReader& r, FileFingerprint& value) {
    read(r, value.filename);
    read(r, value.fsha);
    read(r, value.mtime);
    read(r, value.checksums);
}

void write(ByteWriter& w, const TestRecord& value) {
    write(w, value.duration);
    write(w, value.failed);
    write(w, value.forced);
    write(w, value.fingerprints);
    write(w, value.file_deps);
    write(w, value.external_deps);
}

void read(ByteReader& r, TestRecord& value) {
    read(r, value.duration);
    read(r, value.failed);
    read(r, value.forced);
    read(r, value.fingerprints);
    read(r, value.file_deps);
    read(r, value.external_deps);
}

void write(ByteWriter& w, const TestExecutionInfo& value) {
    write(w, value.duration);
    write(w, value.failed);
    write(w, value.forced);
}

void read(ByteReader& r, TestExecutionInfo& value) {
    read(r, value.duration);
    read(r, value.failed);
    read(r, value.forced);
}

void write(ByteWriter& w, const InitiateResult& value) {
    write(w, value.exec_id);
    write(w, value.filenames);
    write(w, value.packages_changed);
    write(w, value.changed_packages);
}

void read(ByteReader& r, InitiateResult& value) {
    read(r, value.exec_id);
    read(r, value.filenames);
    read(r, value.packages_changed);
    read(r, value.changed_packages);
}

void write(ByteWriter& w, const DetermineResult& value) {
    write(w, value.affected);
    write(w, value.failing);
}

void read(ByteReader& r, DetermineResult& value) {
    read(r, value.affected);
    read(r, value.failing);
}

void write(ByteWriter& w, const FingerprintRow& value) {
    write(w, value.id);
    write(w, value.filename);
    write(w, value.fsha);
    write(w, value.mtime);
    write(w, value.checksums);
}

void read(ByteReader& r, FingerprintRow& value) {
    read(r, value.id);
    read(r, value.filename);
    read(r, value.fsha);
    read(r, value.mtime);
    read(r, value.checksums);
}

void write(ByteWriter& w, const MtimeUpdate& value) {
    write(w, value.fingerprint_id);
    write(w, value.mtime);
    write(w, value.fsha);
}

void read(ByteReader& r, MtimeUpdate& value) {
    read(r, value.fingerprint_id);
    read(r, value.mtime);
    read(r, value.fsha);
}

void write(ByteWriter& w, const ChangedFileData& value) {
    write(w, value.filename);
    write(w, value.test_name);
    write(w, value.checksums);
    write(w, value.fingerprint_id);
    write(w, value.failed);
    write(w, value.duration);
}

void read(ByteReader& r, ChangedFileData& value) {
    read(r, value.filename);
    read(r, value.test_name);
    read(r, value.checksums);
    read(r, value.fingerprint_id);
    read(r, value.failed);
    read(r, value.duration);
}

void write(ByteWriter& w, const SavingStats& value) {
    write(w, value.run_saved_time);
    write(w, value.run_all_time);
    write(w, value.run_saved_tests);
    write(w, value.run_all_tests);
    write(w, value.total_saved_time);
    write(w, value.total_all_time);
    write(w, value.total_saved_tests);
    write(w, value.total_all_tests);
}

void read(ByteReader& r, SavingStats& value) {
    read(r, value.run_saved_time);
    read(r, value.run_all_time);
    read(r, value.run_saved_tests);
    read(r, value.run_all_tests);
    read(r, value.total_saved_time);
    read(r, value.total_all_time);
    read(r, value.total_saved_tests);
    read(r, value.total_all_tests);
}

void write(ByteWriter& w, const RunSummary& value) {
    write(w, value.environment);
    write(w, value.run_id);
    write(w, value.created);
    write(w, value.tests);
    write(w, value.files);
    write(w, value.saved_tests);
    write(w, value.saved_time);
    write(w, value.all_time);
}

void read(ByteReader& r, RunSummary& value) {
    read(r, value.environment);
    read(r, value.run_id);
    read(r, value.created);
    read(r, value.tests);
    read(r, value.files);
    read(r, value.saved_tests);
    read(r, value.saved_time);
    read(r, value.all_time);
}

void write(ByteWriter& w, const FileTest& value) {
    write(w, value.test_name);
    write(w, value.duration);
    write(w, value.failed);
    write(w, value.checksums);
}

void read(ByteReader& r, FileTest& value) {
    read(r, value.test_name);
    read(r, value.duration);
    read(r, value.failed);
    read(r, value.checksums);
}

void write(ByteWriter& w, const TestDetail& value) {
    write(w, value.test_name);
    write(w, value.duration);
    write(w, value.failed);
    write(w, value.forced);
    write(w, value.fingerprints);
    write(w, value.file_deps);
    write(w, value.packages);
}

void read(ByteReader& r, TestDetail& value) {
    read(r, value.test_name);
    read(r, value.duration);
    read(r, value.failed);
    read(r, value.forced);
    read(r, value.fingerprints);
    read(r, value.file_deps);
    read(r, value.packages);
}

void write(ByteWriter& w, const CodependencyEdge& value) {
    write(w, value.file_a);
    write(w, value.file_b);
    write(w, value.shared_tests);
}

void read(ByteReader& r, CodependencyEdge& value) {
    read(r, value.file_a);
    read(r, value.file_b);
    read(r, value.shared_tests);
}

void write(ByteWriter& w, const FileCoverage& value) {
    write(w, value.filename);
    write(w, value.test_count);
    write(w, value.fingerprint_count);
}

void read(ByteReader& r, FileCoverage& value) {
    read(r, value.filename);
    read(r, value.test_count);
    read(r, value.fingerprint_count);
}

void write(ByteWriter& w, const CoverageQuery& value) {
    write(w, value.descending);
    write(w, value.limit);
    write(w, value.min_tests);
    write(w, value.max_tests);
    write(w, value.pattern);
}

void read(ByteReader& r, CoverageQuery& value) {
    read(r, value.descending);
    read(r, value.limit);
    read(r, value.min_tests);
    read(r, value.max_tests);
    read(r, value.pattern);
}

void write(ByteWriter& w, const CoverageAnalysis& value) {
    write(w, value.total_files);
    write(w, value.total_tests);
    write(w, value.files);
}

void read(ByteReader& r, CoverageAnalysis& value) {
    read(r, value.total_files);
    read(r, value.total_tests);
    read(r, value.files);
}

void write(ByteWriter& w, const FileTestList& value) {
    write(w, value.tests);
    write(w, value.total_count);
}

void read(ByteReader& r, FileTestList& value) {
    read(r, value.tests);
    read(r, value.total_count);
}

void write(ByteWriter& w, const ImpactEstimate& value) {
    write(w, value.affected);
    write(w, value.failing);
}

void read(ByteReader& r, ImpactEstimate& value) {
    read(r, value.affected);
    read(r, value.failing);
}

}  // namespace wire
}  // namespace testsieve
