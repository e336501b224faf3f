#include "backend/resource_limits.hpp"
#include "core/errors.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAreArray;

// NOLINTNEXTLINE
TEST(ResourceLimits, Defaults) {
  auto limits = backend::ApplyDefaults(backend::ResourceLimits(),
                                       backend::DefaultLimits());
  EXPECT_EQ(limits.memory, "512m");
  EXPECT_EQ(limits.cpus, "1");
  EXPECT_EQ(limits.pids, 100);
  EXPECT_FALSE(limits.network_disabled);
  EXPECT_THAT(backend::ToEngineFlags(limits),
              ElementsAreArray({"--memory", "512m", "--memory-swap", "512m",
                                "--cpus", "1", "--pids-limit", "100"}));
}

// NOLINTNEXTLINE
TEST(ResourceLimits, RequestedValuesWin) {
  backend::ResourceLimits requested;
  requested.memory = "2G";
  requested.cpus = "0.5";
  requested.network_disabled = true;
  auto limits = backend::ApplyDefaults(requested, backend::DefaultLimits());
  auto flags = backend::ToEngineFlags(limits);
  EXPECT_THAT(flags, ElementsAreArray({"--memory", "2G", "--memory-swap", "2G",
                                       "--cpus", "0.5", "--pids-limit", "100",
                                       "--network", "none"}));
}

// NOLINTNEXTLINE
TEST(ResourceLimits, CheckLimits) {
  backend::ResourceLimits limits;
  EXPECT_NO_THROW(backend::CheckLimits(limits));  // NOLINT
  for (const char* memory : {"2G", "512m", "1048576", "64k"}) {
    limits.memory = memory;
    EXPECT_NO_THROW(backend::CheckLimits(limits)) << memory;  // NOLINT
  }
  for (const char* memory : {"G", "2GB", "-1", "1.5g", "2 G"}) {
    limits.memory = memory;
    EXPECT_THROW(backend::CheckLimits(limits),  // NOLINT
                 core::validation_error)
        << memory;
  }
  limits.memory = "";
  for (const char* cpus : {"0", "abc", "1.2.3", "."}) {
    limits.cpus = cpus;
    EXPECT_THROW(backend::CheckLimits(limits),  // NOLINT
                 core::validation_error)
        << cpus;
  }
  limits.cpus = "1.5";
  limits.pids = -1;
  EXPECT_THROW(backend::CheckLimits(limits), core::validation_error);  // NOLINT
}

}  // namespace
