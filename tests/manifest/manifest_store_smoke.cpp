#include "manifest/manifest_store.hpp"

#include "../common/assertions.hpp"
#include "../common/manifest_fixtures.hpp"
#include "../common/temp_dir.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
namespace common = fim::tests::common;

using common::Assert;
using common::Fail;

int main() {
  const fs::path temp_root = common::CreateUniqueTempDir("fim-manifest-store-smoke");
  const fs::path manifest_path = temp_root / "nested" / "manifest.jsonl";
  std::string error;

  // Missing manifest loads as empty.
  {
    fim::manifest::ManifestIndex index;
    fim::manifest::LoadStats stats;
    if (!fim::manifest::LoadManifest(manifest_path, index, stats, error)) {
      Fail("loading a missing manifest should succeed: " + error);
    }
    Assert(index.Empty(), "missing manifest should load as empty");
    Assert(!stats.file_present, "missing manifest reported as present");
  }

  // Appends create parent directories and write one line per call.
  const auto first = common::MakeRecord("data/a.txt", common::kMd5Abc, 3);
  const auto second = common::MakeRecord("data/b.txt", common::kMd5Empty, 0);
  const auto first_updated = common::MakeRecord("data/a.txt", common::kMd5HelloWorldNewline, 12);
  for (const auto& record : {first, second, first_updated}) {
    if (!fim::manifest::AppendRecord(record, manifest_path, error)) {
      Fail("append failed: " + error);
    }
  }
  const std::vector<std::string> lines = common::ReadNonEmptyLines(manifest_path);
  Assert(lines.size() == 3U, "expected three appended lines");
  Assert(lines[2] == fim::manifest::ToJson(first_updated), "third line mismatch");

  // Loading folds to the last record per path.
  {
    fim::manifest::ManifestIndex index;
    fim::manifest::LoadStats stats;
    if (!fim::manifest::LoadManifest(manifest_path, index, stats, error)) {
      Fail("load failed: " + error);
    }
    Assert(stats.file_present, "manifest should be reported present");
    Assert(stats.records_parsed == 3U, "records_parsed mismatch");
    Assert(stats.superseded_records == 1U, "superseded_records mismatch");
    Assert(index.Size() == 2U, "index should hold two paths");
    const auto* latest = index.Find("data/a.txt");
    Assert(latest != nullptr, "data/a.txt missing from index");
    Assert(latest->md5 == common::kMd5HelloWorldNewline, "latest md5 should win");
    Assert(latest->size == 12U, "latest size should win");
  }

  // Blank lines are skipped; CRLF endings parse.
  {
    const fs::path padded_path = temp_root / "padded.jsonl";
    common::WriteFixtureFile(padded_path, fim::manifest::ToJson(first) + "\r\n\n   \n" +
                                              fim::manifest::ToJson(second) + "\n");
    fim::manifest::ManifestIndex index;
    fim::manifest::LoadStats stats;
    if (!fim::manifest::LoadManifest(padded_path, index, stats, error)) {
      Fail("padded manifest should load: " + error);
    }
    Assert(index.Size() == 2U, "padded manifest should hold two paths");
    Assert(stats.blank_lines == 2U, "blank line count mismatch");
  }

  // A malformed line fails the load and names its line number.
  {
    const fs::path corrupt_path = temp_root / "corrupt.jsonl";
    common::WriteFixtureFile(corrupt_path,
                             fim::manifest::ToJson(first) + "\n{\"file\":\"x\",\"md5\":\n");
    fim::manifest::ManifestIndex index;
    fim::manifest::LoadStats stats;
    if (fim::manifest::LoadManifest(corrupt_path, index, stats, error)) {
      Fail("corrupt manifest should fail to load");
    }
    Assert(stats.malformed_line == 2U, "malformed line number mismatch");
    common::AssertContains(error, "line 2");
    common::AssertContains(error, "corrupt.jsonl");
  }

  // WriteManifest replaces the whole file and leaves no temp siblings.
  {
    if (!fim::manifest::WriteManifest({second}, manifest_path, error)) {
      Fail("rewrite failed: " + error);
    }
    const auto records = common::ReadManifestRecordsOrFail(manifest_path);
    Assert(records.size() == 1U, "rewrite should leave exactly one record");
    Assert(records.front() == second, "rewritten record mismatch");

    for (const auto& entry : fs::directory_iterator(manifest_path.parent_path())) {
      if (entry.path().filename().string().find(".tmp.") != std::string::npos) {
        Fail("temp file left behind: " + entry.path().string());
      }
    }
  }

  common::RemovePathBestEffort(temp_root);
  std::cout << "manifest_store_smoke: ok\n";
  return 0;
}
