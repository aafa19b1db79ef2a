#pragma once
#include <cstdlib>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace mini {

struct TestCase { std::string name; std::function<void()> fn; };
inline std::vector<TestCase>& registry() { static std::vector<TestCase> r; return r; }

struct Registrar {
  Registrar(const std::string& name, std::function<void()> fn) { registry().push_back({name, std::move(fn)}); }
};

struct AssertionError : public std::runtime_error { using std::runtime_error::runtime_error; };

// Runs every registered test; a filter argument keeps only names containing it.
inline int run_all(const char* filter = nullptr) {
  int failed = 0; int passed = 0;
  for (auto& t : registry()) {
    if (filter && t.name.find(filter) == std::string::npos) continue;
    try {
      t.fn();
      ++passed;
      std::cout << "[PASS] " << t.name << "\n";
    } catch (const std::exception& e) {
      ++failed;
      std::cerr << "[FAIL] " << t.name << ": " << e.what() << "\n";
    } catch (...) {
      ++failed;
      std::cerr << "[FAIL] " << t.name << ": unknown exception\n";
    }
  }
  std::cout << "\n" << passed << " passed, " << failed << " failed\n";
  return failed == 0 ? 0 : 1;
}

} // namespace mini

#define TEST(name) \
  static void name(); \
  static ::mini::Registrar name##_registrar{#name, name}; \
  static void name()

#define ASSERT_TRUE(expr) do { if(!(expr)) throw ::mini::AssertionError(std::string("ASSERT_TRUE failed: ") + #expr); } while(0)
#define ASSERT_FALSE(expr) do { if((expr)) throw ::mini::AssertionError(std::string("ASSERT_FALSE failed: ") + #expr); } while(0)
#define ASSERT_EQ(a,b) do { if(!((a)==(b))) { throw ::mini::AssertionError(std::string("ASSERT_EQ failed: ") + #a " == " #b); } } while(0)
#define ASSERT_NE(a,b) do { if(!((a)!=(b))) { throw ::mini::AssertionError(std::string("ASSERT_NE failed: ") + #a " != " #b); } } while(0)
