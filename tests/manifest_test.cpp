#include "inventory.hpp"
#include "manifest.hpp"
#include "manifest_reconciler.hpp"
#include "test_runner_utils.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using audit::test::LogCapture;
using audit::test::ScratchDir;
using audit::test::read_file;
using audit::test::write_file;

const std::string kDigestA(64, 'a');
const std::string kDigestB(64, 'b');
const std::string kDigestC(64, 'c');

FileRecord make_file(const fs::path& path, std::optional<std::string> checksum) {
  FileRecord file;
  file.path = path;
  file.checksum = std::move(checksum);
  return file;
}

ManifestReconciler make_reconciler(LogCapture& logs, bool read_only = false) {
  auto logger = std::make_shared<Logger>("reconcile");
  logs.attach(logger);
  ManifestReconciler::Options options;
  options.algorithm = DigestAlgorithm::Sha256;
  options.read_only = read_only;
  return ManifestReconciler(options, nullptr, logger);
}

bool test_file_names(LogCapture&) {
  return Manifest::file_name(DigestAlgorithm::Sha512) == "sha512sums" &&
         Manifest::file_name(DigestAlgorithm::Md5) == "md5sums" &&
         Manifest::is_manifest_name("sha1sums") &&
         Manifest::is_manifest_name("sha224sums") &&
         Manifest::temp_file_name("sha256sums") == ".sha256sums.tmp" &&
         Manifest::is_manifest_name(".sha384sums.tmp") &&
         !Manifest::is_manifest_name("sha512sums.bak") &&
         !Manifest::is_manifest_name(".notes.tmp") &&
         !Manifest::is_manifest_name("sums") &&
         Manifest::is_recordable_name("photo.jpg") &&
         !Manifest::is_recordable_name("holiday photo.jpg") &&
         !Manifest::is_recordable_name("tab\tname");
}

bool test_parse_reads_first_and_last_token(LogCapture&) {
  std::istringstream in(
    kDigestA + "  alpha.txt\n"
    "\n"
    "lonely-token\n" +
    kDigestB + "  extra fields gamma.txt\r\n" +
    kDigestC + "\tbeta.txt\n");
  std::vector<std::string> malformed;
  auto manifest = Manifest::parse(in, &malformed);
  return manifest.size() == 3 &&
         manifest.get("alpha.txt") == kDigestA &&
         manifest.get("gamma.txt") == kDigestB &&
         manifest.get("beta.txt") == kDigestC &&
         !manifest.contains("extra") &&
         malformed == std::vector<std::string>{"lonely-token"};
}

bool test_serialize_is_sorted_by_name(LogCapture&) {
  Manifest manifest;
  manifest.set("zeta", kDigestA);
  manifest.set("Alpha", kDigestB);
  manifest.set("beta", kDigestC);
  return manifest.serialize() ==
         kDigestB + "  Alpha\n" + kDigestC + "  beta\n" + kDigestA + "  zeta\n";
}

bool test_save_and_load(LogCapture&) {
  ScratchDir scratch("manifest_save");
  Manifest manifest;
  manifest.set("one.txt", kDigestA);
  manifest.set("two.txt", kDigestB);
  std::string error;
  if(!manifest.save(scratch / "sha256sums", error)) return false;
  if(fs::exists(scratch / ".sha256sums.tmp")) return false;
  auto loaded = Manifest::load(scratch / "sha256sums", error);
  return loaded && *loaded == manifest && error.empty() &&
         read_file(scratch / "sha256sums") == manifest.serialize();
}

bool test_load_absent_is_not_an_error(LogCapture&) {
  ScratchDir scratch("manifest_absent");
  std::string error = "stale";
  auto loaded = Manifest::load(scratch / "sha256sums", error);
  return !loaded && error.empty();
}

bool test_erase_reports_presence(LogCapture&) {
  Manifest manifest;
  manifest.set("a", kDigestA);
  return manifest.erase("a") && !manifest.erase("a") && manifest.empty();
}

bool test_new_directory_gets_manifest(LogCapture& logs) {
  ScratchDir scratch("reconcile_new");
  write_file(scratch / "a.txt", "a");
  write_file(scratch / "b.txt", "b");
  DirectoryRecord dir;
  dir.path = scratch.path();
  dir.files.push_back(make_file(scratch / "a.txt", kDigestA));
  dir.files.push_back(make_file(scratch / "b.txt", kDigestB));

  auto outcome = make_reconciler(logs).reconcile(dir);
  return outcome.new_entries == 2 && outcome.manifest_written && !outcome.skipped &&
         read_file(scratch / "sha256sums") == kDigestA + "  a.txt\n" + kDigestB + "  b.txt\n" &&
         logs.count_containing("File checksum first recorded", spdlog::level::info) == 2 &&
         logs.count(spdlog::level::warn) == 0;
}

bool test_empty_directory_gets_no_manifest(LogCapture& logs) {
  ScratchDir scratch("reconcile_empty");
  DirectoryRecord dir;
  dir.path = scratch.path();
  auto outcome = make_reconciler(logs).reconcile(dir);
  return !outcome.manifest_written && !fs::exists(scratch / "sha256sums");
}

bool test_matching_checksums_leave_manifest_alone(LogCapture& logs) {
  ScratchDir scratch("reconcile_match");
  write_file(scratch / "a.txt", "a");
  const std::string content = kDigestA + "  a.txt\n";
  write_file(scratch / "sha256sums", content);
  DirectoryRecord dir;
  dir.path = scratch.path();
  dir.files.push_back(make_file(scratch / "a.txt", kDigestA));

  auto outcome = make_reconciler(logs).reconcile(dir);
  return outcome.matched == 1 && !outcome.manifest_written &&
         read_file(scratch / "sha256sums") == content &&
         logs.count(spdlog::level::warn) == 0;
}

bool test_drift_is_reported_and_recorded(LogCapture& logs) {
  ScratchDir scratch("reconcile_drift");
  write_file(scratch / "a.txt", "a");
  write_file(scratch / "b.txt", "b");
  write_file(scratch / "sha256sums", kDigestA + "  a.txt\n" + kDigestB + "  b.txt\n");
  DirectoryRecord dir;
  dir.path = scratch.path();
  dir.files.push_back(make_file(scratch / "a.txt", kDigestA));
  dir.files.push_back(make_file(scratch / "b.txt", kDigestC));

  auto outcome = make_reconciler(logs).reconcile(dir);
  return outcome.changed == 1 && outcome.matched == 1 && outcome.manifest_written &&
         read_file(scratch / "sha256sums") == kDigestA + "  a.txt\n" + kDigestC + "  b.txt\n" &&
         logs.count_containing("File checksum differs from stored checksum", spdlog::level::warn) == 1 &&
         logs.count_containing("b.txt last modified", spdlog::level::warn) == 1;
}

bool test_new_file_joins_existing_manifest(LogCapture& logs) {
  ScratchDir scratch("reconcile_added");
  write_file(scratch / "a.txt", "a");
  write_file(scratch / "c.txt", "c");
  write_file(scratch / "sha256sums", kDigestA + "  a.txt\n");
  DirectoryRecord dir;
  dir.path = scratch.path();
  dir.files.push_back(make_file(scratch / "a.txt", kDigestA));
  dir.files.push_back(make_file(scratch / "c.txt", kDigestC));

  auto outcome = make_reconciler(logs).reconcile(dir);
  return outcome.new_entries == 1 && outcome.matched == 1 && outcome.manifest_written &&
         read_file(scratch / "sha256sums") == kDigestA + "  a.txt\n" + kDigestC + "  c.txt\n" &&
         logs.count_containing("File checksum first recorded", spdlog::level::info) == 1;
}

bool test_stale_entries_are_dropped(LogCapture& logs) {
  ScratchDir scratch("reconcile_stale");
  write_file(scratch / "a.txt", "a");
  write_file(scratch / "sha256sums",
             kDigestA + "  a.txt\n" + kDigestB + "  gone.txt\n" + kDigestC + "  md5sums\n");
  DirectoryRecord dir;
  dir.path = scratch.path();
  dir.files.push_back(make_file(scratch / "a.txt", kDigestA));

  auto outcome = make_reconciler(logs).reconcile(dir);
  return outcome.stale == 2 && outcome.manifest_written &&
         read_file(scratch / "sha256sums") == kDigestA + "  a.txt\n" &&
         logs.count_containing("contains checksum for non-existent file: gone.txt", spdlog::level::warn) == 1;
}

bool test_excluded_files_on_disk_keep_their_entries(LogCapture& logs) {
  ScratchDir scratch("reconcile_excluded");
  write_file(scratch / "a.txt", "a");
  write_file(scratch / "skip.tmp", "t");
  const std::string content = kDigestA + "  a.txt\n" + kDigestB + "  skip.tmp\n";
  write_file(scratch / "sha256sums", content);
  DirectoryRecord dir;
  dir.path = scratch.path();
  dir.files.push_back(make_file(scratch / "a.txt", kDigestA));

  auto outcome = make_reconciler(logs).reconcile(dir);
  return outcome.stale == 0 && !outcome.manifest_written &&
         read_file(scratch / "sha256sums") == content;
}

bool test_unhashed_file_keeps_stored_entry(LogCapture& logs) {
  ScratchDir scratch("reconcile_unhashed");
  write_file(scratch / "a.txt", "a");
  const std::string content = kDigestA + "  a.txt\n";
  write_file(scratch / "sha256sums", content);
  DirectoryRecord dir;
  dir.path = scratch.path();
  dir.files.push_back(make_file(scratch / "a.txt", std::nullopt));

  auto outcome = make_reconciler(logs).reconcile(dir);
  return outcome.unhashed == 1 && outcome.changed == 0 && !outcome.manifest_written &&
         read_file(scratch / "sha256sums") == content;
}

bool test_vanished_file_is_removed(LogCapture& logs) {
  ScratchDir scratch("reconcile_vanished");
  write_file(scratch / "a.txt", "a");
  write_file(scratch / "sha256sums", kDigestA + "  a.txt\n" + kDigestB + "  b.txt\n");
  DirectoryRecord dir;
  dir.path = scratch.path();
  dir.files.push_back(make_file(scratch / "a.txt", kDigestA));
  dir.files.push_back(make_file(scratch / "b.txt", kDigestB));

  auto outcome = make_reconciler(logs).reconcile(dir);
  return outcome.matched == 1 && outcome.manifest_written &&
         read_file(scratch / "sha256sums") == kDigestA + "  a.txt\n" &&
         logs.count_containing("non-existent file: b.txt", spdlog::level::warn) == 1;
}

bool test_read_only_never_writes(LogCapture& logs) {
  ScratchDir scratch("reconcile_read_only");
  write_file(scratch / "a.txt", "a");
  write_file(scratch / "new.txt", "n");
  const std::string content = kDigestA + "  a.txt\n" + kDigestB + "  gone.txt\n";
  write_file(scratch / "sha256sums", content);
  DirectoryRecord dir;
  dir.path = scratch.path();
  dir.files.push_back(make_file(scratch / "a.txt", kDigestC));
  dir.files.push_back(make_file(scratch / "new.txt", kDigestB));

  auto outcome = make_reconciler(logs, true).reconcile(dir);
  return outcome.changed == 1 && outcome.new_entries == 1 && outcome.stale == 1 &&
         !outcome.manifest_written &&
         read_file(scratch / "sha256sums") == content &&
         logs.count_containing("File checksum differs from stored checksum", spdlog::level::warn) == 1;
}

bool test_read_only_skips_directory_without_manifest(LogCapture& logs) {
  ScratchDir scratch("reconcile_read_only_new");
  write_file(scratch / "a.txt", "a");
  DirectoryRecord dir;
  dir.path = scratch.path();
  dir.files.push_back(make_file(scratch / "a.txt", kDigestA));

  auto outcome = make_reconciler(logs, true).reconcile(dir);
  return outcome.skipped && !outcome.manifest_written && !fs::exists(scratch / "sha256sums");
}

bool test_write_failure_is_reported(LogCapture& logs) {
  ScratchDir scratch("reconcile_write_fail");
  write_file(scratch / "a.txt", "a");
  fs::create_directories(scratch / ".sha256sums.tmp" / "occupied");
  DirectoryRecord dir;
  dir.path = scratch.path();
  dir.files.push_back(make_file(scratch / "a.txt", kDigestA));

  auto outcome = make_reconciler(logs).reconcile(dir);
  return outcome.write_failed && !outcome.manifest_written &&
         logs.count_containing("Cannot write checksum file", spdlog::level::err) == 1 &&
         !fs::exists(scratch / "sha256sums");
}

bool test_unusable_manifest_skips_directory(LogCapture& logs) {
  ScratchDir scratch("reconcile_unusable");
  write_file(scratch / "a.txt", "a");
  fs::create_directories(scratch / "sha256sums" / "occupied");
  DirectoryRecord dir;
  dir.path = scratch.path();
  dir.files.push_back(make_file(scratch / "a.txt", kDigestA));

  auto outcome = make_reconciler(logs).reconcile(dir);
  return outcome.skipped && !outcome.manifest_written && !outcome.write_failed &&
         outcome.new_entries == 0 &&
         fs::is_directory(scratch / "sha256sums" / "occupied") &&
         logs.count_containing("Cannot read checksum file", spdlog::level::err) == 1 &&
         logs.count_containing("Skipping directory", spdlog::level::warn) == 1;
}

bool test_unreadable_manifest_is_never_overwritten(LogCapture& logs) {
  if(::geteuid() == 0) return true;  // root reads regardless of permission bits
  ScratchDir scratch("reconcile_unreadable");
  write_file(scratch / "a.txt", "a");
  const std::string content = kDigestB + "  a.txt\n";
  write_file(scratch / "sha256sums", content);
  ::chmod((scratch / "sha256sums").c_str(), 0);
  DirectoryRecord dir;
  dir.path = scratch.path();
  dir.files.push_back(make_file(scratch / "a.txt", kDigestA));

  auto outcome = make_reconciler(logs).reconcile(dir);
  ::chmod((scratch / "sha256sums").c_str(), S_IRUSR | S_IWUSR);
  return outcome.skipped && !outcome.manifest_written && outcome.changed == 0 &&
         read_file(scratch / "sha256sums") == content &&
         logs.count_containing("Cannot read checksum file", spdlog::level::err) == 1;
}

bool test_malformed_lines_are_cleaned_once(LogCapture& logs) {
  ScratchDir scratch("reconcile_malformed");
  write_file(scratch / "a.txt", "a");
  write_file(scratch / "sha256sums", kDigestA + "  a.txt\ngarbage\n");
  DirectoryRecord dir;
  dir.path = scratch.path();
  dir.files.push_back(make_file(scratch / "a.txt", kDigestA));

  auto first = make_reconciler(logs).reconcile(dir);
  const bool cleaned = first.manifest_written && first.matched == 1 &&
                       read_file(scratch / "sha256sums") == kDigestA + "  a.txt\n" &&
                       logs.count_containing("Ignoring malformed line", spdlog::level::warn) == 1;
  logs.clear();
  auto second = make_reconciler(logs).reconcile(dir);
  return cleaned && !second.manifest_written && logs.count(spdlog::level::warn) == 0;
}

bool test_names_with_whitespace_are_not_recorded(LogCapture& logs) {
  ScratchDir scratch("reconcile_whitespace");
  write_file(scratch / "a.txt", "a");
  write_file(scratch / "holiday photo.jpg", "p");
  DirectoryRecord dir;
  dir.path = scratch.path();
  dir.files.push_back(make_file(scratch / "a.txt", kDigestA));
  dir.files.push_back(make_file(scratch / "holiday photo.jpg", kDigestB));

  auto first = make_reconciler(logs).reconcile(dir);
  const bool recorded = first.new_entries == 1 && first.unrecordable == 1 &&
                        read_file(scratch / "sha256sums") == kDigestA + "  a.txt\n";
  logs.clear();
  auto second = make_reconciler(logs).reconcile(dir);
  return recorded && second.matched == 1 && second.unrecordable == 1 && second.stale == 0 &&
         !second.manifest_written &&
         logs.count_containing("cannot be recorded in checksum file", spdlog::level::warn) == 1;
}

bool test_removed_directory_is_skipped(LogCapture& logs) {
  ScratchDir scratch("reconcile_gone");
  DirectoryRecord dir;
  dir.path = scratch / "removed";
  auto outcome = make_reconciler(logs).reconcile(dir);
  return outcome.skipped && logs.count_containing("Directory no longer exists", spdlog::level::warn) == 1;
}

bool test_cancelled_reconcile_throws(LogCapture&) {
  ScratchDir scratch("reconcile_cancel");
  auto cancel = std::make_shared<CancellationToken>();
  cancel->cancel();
  ManifestReconciler reconciler(ManifestReconciler::Options{}, cancel, nullptr);
  DirectoryRecord dir;
  dir.path = scratch.path();
  try {
    reconciler.reconcile(dir);
  } catch(const AuditCancelled&) {
    return !fs::exists(scratch / "sha512sums");
  }
  return false;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<audit::test::TestCase> tests = {
    {"file_names", test_file_names},
    {"parse_reads_first_and_last_token", test_parse_reads_first_and_last_token},
    {"serialize_is_sorted_by_name", test_serialize_is_sorted_by_name},
    {"save_and_load", test_save_and_load},
    {"load_absent_is_not_an_error", test_load_absent_is_not_an_error},
    {"erase_reports_presence", test_erase_reports_presence},
    {"new_directory_gets_manifest", test_new_directory_gets_manifest},
    {"empty_directory_gets_no_manifest", test_empty_directory_gets_no_manifest},
    {"matching_checksums_leave_manifest_alone", test_matching_checksums_leave_manifest_alone},
    {"drift_is_reported_and_recorded", test_drift_is_reported_and_recorded},
    {"new_file_joins_existing_manifest", test_new_file_joins_existing_manifest},
    {"stale_entries_are_dropped", test_stale_entries_are_dropped},
    {"excluded_files_on_disk_keep_their_entries", test_excluded_files_on_disk_keep_their_entries},
    {"unhashed_file_keeps_stored_entry", test_unhashed_file_keeps_stored_entry},
    {"vanished_file_is_removed", test_vanished_file_is_removed},
    {"read_only_never_writes", test_read_only_never_writes},
    {"read_only_skips_directory_without_manifest", test_read_only_skips_directory_without_manifest},
    {"write_failure_is_reported", test_write_failure_is_reported},
    {"unusable_manifest_skips_directory", test_unusable_manifest_skips_directory},
    {"unreadable_manifest_is_never_overwritten", test_unreadable_manifest_is_never_overwritten},
    {"malformed_lines_are_cleaned_once", test_malformed_lines_are_cleaned_once},
    {"names_with_whitespace_are_not_recorded", test_names_with_whitespace_are_not_recorded},
    {"removed_directory_is_skipped", test_removed_directory_is_skipped},
    {"cancelled_reconcile_throws", test_cancelled_reconcile_throws},
  };
  return audit::test::run_tests("manifest", argc, argv, tests);
}
