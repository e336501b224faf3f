#include "tracker/artifact_store.hpp"

#include "core/errors.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

const std::string test_tmpdir = "/tmp/codebox_testdir";

// NOLINTNEXTLINE
TEST(ArtifactStore, PrepareListFetch) {
  util::TempDir tmp(test_tmpdir);
  tracker::ArtifactStore store(util::File::JoinPath(tmp.Path(), "store"));
  std::string dir = store.Prepare("req1");
  EXPECT_EQ(dir, util::File::JoinPath(store.Root(), "req1"));
  EXPECT_THAT(store.List("req1"), IsEmpty());

  util::File::WriteAll(util::File::JoinPath(dir, "b.txt"), "b");
  util::File::WriteAll(util::File::JoinPath(dir, "plots/a.png"), "png");
  EXPECT_THAT(store.List("req1"), ElementsAre("b.txt", "plots/a.png"));
  EXPECT_EQ(store.Fetch("req1", "plots/a.png"), "png");
  EXPECT_THAT(store.List("other"), IsEmpty());

  // Preparing again starts from scratch.
  store.Prepare("req1");
  EXPECT_THAT(store.List("req1"), IsEmpty());
}

// NOLINTNEXTLINE
TEST(ArtifactStore, RejectsEscapes) {
  util::TempDir tmp(test_tmpdir);
  tracker::ArtifactStore store(tmp.Path());
  store.Prepare("req");
  util::File::WriteAll(util::File::JoinPath(tmp.Path(), "secret"), "x");
  EXPECT_THROW(store.Fetch("req", "../secret"),  // NOLINT
               core::validation_error);
  EXPECT_THROW(store.Fetch("req", "/etc/passwd"),  // NOLINT
               core::validation_error);
  EXPECT_THROW(store.Fetch("req", std::string("a\0b", 3)),  // NOLINT
               core::validation_error);
  EXPECT_THROW(store.Fetch("req", "missing"),  // NOLINT
               core::artifact_not_found);
  EXPECT_THROW(store.Fetch("..", "secret"),  // NOLINT
               core::request_not_found);
}

// NOLINTNEXTLINE
TEST(ArtifactStore, RemoveAndSweep) {
  util::TempDir tmp(test_tmpdir);
  tracker::ArtifactStore store(tmp.Path());
  store.Prepare("old");
  store.Prepare("new");
  store.Remove("old");
  store.Remove("old");
  EXPECT_FALSE(util::File::Exists(util::File::JoinPath(tmp.Path(), "old")));

  auto now = std::chrono::system_clock::now();
  EXPECT_EQ(store.Sweep(now - std::chrono::hours(1)), 0u);
  EXPECT_EQ(store.Sweep(now + std::chrono::hours(1)), 1u);
  EXPECT_FALSE(util::File::Exists(util::File::JoinPath(tmp.Path(), "new")));
}

}  // namespace
