#include "internal/daemon/file_access.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using planner::daemon::kMaxFileReadSize;
using planner::daemon::SessionFileAccess;

std::filesystem::path TestDir(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "planner_file_access_tests" / test_name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir / "sessions");
  return dir;
}

void WriteFile(const std::filesystem::path& path, const std::string& content) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary);
  out << content;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestTraversalIsRejected() {
  const auto        dir = TestDir("traversal");
  SessionFileAccess files(dir / "sessions");
  WriteFile(dir / "sessions" / "s1" / "plan.md", "# plan\n");
  WriteFile(dir / "secret.txt", "nope");

  assert(Throws<planner::util::PermissionDenied>([&] { files.Read("s1", "../../etc/passwd"); }));
  assert(Throws<planner::util::PermissionDenied>([&] { files.Read("s1", "../secret.txt"); }));
  assert(Throws<planner::util::PermissionDenied>([&] { files.Read("s1", "a/b"); }));
  assert(Throws<planner::util::PermissionDenied>([&] { files.Read("s1", ".."); }));
  assert(Throws<planner::util::PermissionDenied>([&] { files.Read("s1", ""); }));
  assert(Throws<planner::util::PermissionDenied>([&] { files.List("../sessions"); }));

  assert(files.Read("s1", "plan.md").content() == "# plan\n");
}

void TestSymlinkOutsideSessionIsRejected() {
  const auto        dir = TestDir("symlink");
  SessionFileAccess files(dir / "sessions");
  WriteFile(dir / "outside.txt", "secret");
  WriteFile(dir / "sessions" / "s1" / "inside.txt", "fine");
  std::filesystem::create_symlink(dir / "outside.txt", dir / "sessions" / "s1" / "escape.txt");
  std::filesystem::create_symlink(dir / "sessions" / "s1" / "inside.txt", dir / "sessions" / "s1" / "alias.txt");

  assert(Throws<planner::util::PermissionDenied>([&] { files.Read("s1", "escape.txt"); }));
  assert(files.Read("s1", "alias.txt").content() == "fine");
}

void TestMissingFilesAndSessions() {
  const auto        dir = TestDir("missing");
  SessionFileAccess files(dir / "sessions");
  std::filesystem::create_directories(dir / "sessions" / "s1");

  assert(Throws<planner::util::FileNotFound>([&] { files.Read("s1", "absent.md"); }));
  assert(Throws<planner::util::SessionNotFound>([&] { files.Read("s2", "plan.md"); }));
  assert(Throws<planner::util::SessionNotFound>([&] { files.List("s2"); }));
}

void TestLargeFileIsTruncatedOnCharacterBoundary() {
  const auto        dir = TestDir("truncate");
  SessionFileAccess files(dir / "sessions");

  // the two-byte character straddles the cap
  const std::string text = std::string(kMaxFileReadSize - 1, 'a') + "\xC3\xA9" + "bbb";
  WriteFile(dir / "sessions" / "s1" / "big.log", text);

  const auto content = files.Read("s1", "big.log");
  assert(content.truncated());
  assert(content.total_size() == text.size());
  assert(content.content().size() == kMaxFileReadSize - 1);

  WriteFile(dir / "sessions" / "s1" / "exact.log", std::string(kMaxFileReadSize, 'x'));
  const auto exact = files.Read("s1", "exact.log");
  assert(!exact.truncated());
  assert(exact.content().size() == kMaxFileReadSize);
}

void TestBinaryContentIsIoError() {
  const auto        dir = TestDir("binary");
  SessionFileAccess files(dir / "sessions");
  WriteFile(dir / "sessions" / "s1" / "blob.bin", std::string("\xFF\xFE\x00\x01", 4));
  std::filesystem::create_directories(dir / "sessions" / "s1" / "nested");

  assert(Throws<planner::util::IoError>([&] { files.Read("s1", "blob.bin"); }));
  assert(Throws<planner::util::IoError>([&] { files.Read("s1", "nested"); }));
}

void TestListingPutsDirectoriesFirst() {
  const auto        dir = TestDir("listing");
  SessionFileAccess files(dir / "sessions");
  WriteFile(dir / "sessions" / "s1" / "b.md", "bb");
  WriteFile(dir / "sessions" / "s1" / "a.md", "a");
  std::filesystem::create_directories(dir / "sessions" / "s1" / "zlogs");

  const auto entries = files.List("s1");
  assert(entries.size() == 3);
  assert(entries[0].name() == "zlogs" && entries[0].is_dir());
  assert(entries[1].name() == "a.md" && entries[1].size() == 1);
  assert(entries[2].name() == "b.md" && entries[2].size() == 2);
}

void TestUtf8Helpers() {
  using planner::daemon::IsValidUtf8;
  using planner::daemon::Utf8BoundaryBefore;

  assert(IsValidUtf8("plain"));
  assert(IsValidUtf8("caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80"));
  assert(!IsValidUtf8("\xC3"));
  assert(!IsValidUtf8("\xC0\xAF"));
  assert(!IsValidUtf8("\xED\xA0\x80"));

  const std::string euro = "ab\xE2\x82\xAC";
  assert(Utf8BoundaryBefore(euro, 3) == 2);
  assert(Utf8BoundaryBefore(euro, 4) == 2);
  assert(Utf8BoundaryBefore(euro, 5) == 5);
  assert(Utf8BoundaryBefore(euro, 2) == 2);
}

} // namespace

int main() {
  TestTraversalIsRejected();
  TestSymlinkOutsideSessionIsRejected();
  TestMissingFilesAndSessions();
  TestLargeFileIsTruncatedOnCharacterBoundary();
  TestBinaryContentIsIoError();
  TestListingPutsDirectoriesFirst();
  TestUtf8Helpers();

  std::cout << "planner_unit_file_access: pass\n";
  return 0;
}
