#include "modules/covmark/mark_registry.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <thread>

using namespace testing;

namespace covmark {

TEST(mark_registry_test, empty) {
  mark_registry reg;
  EXPECT_EQ(0, reg.size());
  EXPECT_FALSE(reg.is_registered("fast-path"));
  EXPECT_THAT(reg.names(), IsEmpty());
  EXPECT_FALSE(mark_handle().valid());
}

TEST(mark_registry_test, register_is_idempotent) {
  mark_registry reg;
  mark_handle first = reg.register_mark("fast-path");
  mark_handle second = reg.register_mark(std::string("fast") + "-path");

  EXPECT_TRUE(first.valid());
  EXPECT_EQ(first, second);
  EXPECT_EQ("fast-path", second.name());
  EXPECT_EQ(1, reg.size());
  EXPECT_TRUE(reg.is_registered("fast-path"));
}

TEST(mark_registry_test, distinct_names) {
  mark_registry reg;
  mark_handle a = reg.register_mark("wrong dashes");
  mark_handle b = reg.register_mark("short date");

  EXPECT_NE(a, b);
  EXPECT_THAT(reg.names(), ElementsAre("short date", "wrong dashes"));
}

TEST(mark_registry_test, names_are_not_shared_between_registries) {
  mark_registry reg1;
  mark_registry reg2;
  reg1.register_mark("fast-path");

  EXPECT_TRUE(reg1.is_registered("fast-path"));
  EXPECT_FALSE(reg2.is_registered("fast-path"));
  EXPECT_NE(reg1.register_mark("fast-path"), reg2.register_mark("fast-path"));
}

TEST(mark_registry_test, concurrent_first_use) {
  mark_registry reg;
  constexpr int k_threads = 16;
  constexpr int k_names = 100;

  std::vector<std::vector<mark_handle>> handles(k_threads);
  std::vector<std::thread> threads;
  for (int t = 0; t < k_threads; ++t) {
    threads.emplace_back([&reg, &handles, t]() {
      for (int i = 0; i < k_names; ++i) {
        handles[t].push_back(reg.register_mark("mark " + std::to_string(i)));
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(k_names, reg.size());
  for (int t = 1; t < k_threads; ++t) {
    EXPECT_THAT(handles[t], ContainerEq(handles[0])) << "thread " << t;
  }
}

}  // namespace covmark
