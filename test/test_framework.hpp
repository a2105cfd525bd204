#pragma once

#include <cstdio>
#include <cstdlib>
#include <functional>
#include <string>
#include <vector>

#include "blendlink/errors.hpp"

struct TestCase {
  std::string name;
  std::function<void()> fn;
};

inline std::vector<TestCase>& GetTests() {
  static std::vector<TestCase> tests;
  return tests;
}

struct TestRegistrar {
  TestRegistrar(const char* name, std::function<void()> fn) {
    GetTests().push_back({name, std::move(fn)});
  }
};

#define TEST(name)                                           \
  static void test_##name();                                 \
  static TestRegistrar registrar_##name(#name, test_##name); \
  static void test_##name()

#define ASSERT_TRUE(expr)                                              \
  do {                                                                 \
    if (!(expr)) {                                                     \
      fprintf(stderr, "FAIL: %s:%d: %s\n", __FILE__, __LINE__, #expr); \
      exit(1);                                                         \
    }                                                                  \
  } while (0)

#define ASSERT_FALSE(expr) ASSERT_TRUE(!(expr))
#define ASSERT_EQ(a, b) ASSERT_TRUE((a) == (b))
#define ASSERT_NE(a, b) ASSERT_TRUE((a) != (b))

// Evaluate stmt and require a BridgeError of the given kind.
#define ASSERT_BRIDGE_ERROR(stmt, expected_kind)                            \
  do {                                                                      \
    bool caught_ = false;                                                   \
    try {                                                                   \
      stmt;                                                                 \
    } catch (const blendlink::BridgeError& e_) {                            \
      caught_ = true;                                                       \
      if (e_.kind() != (expected_kind)) {                                   \
        fprintf(stderr, "FAIL: %s:%d: got %s (%s)\n", __FILE__, __LINE__,   \
                blendlink::error_kind_name(e_.kind()), e_.what());          \
        exit(1);                                                            \
      }                                                                     \
    }                                                                       \
    if (!caught_) {                                                         \
      fprintf(stderr, "FAIL: %s:%d: %s did not throw\n", __FILE__, __LINE__, \
              #stmt);                                                       \
      exit(1);                                                              \
    }                                                                       \
  } while (0)
