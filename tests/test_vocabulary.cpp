#include "ewsb/vocabulary.hpp"

#include <catch2/catch_test_macros.hpp>
#include <string>

using namespace ewsb;

// ============================================================================
// expected<V, E>
// ============================================================================

TEST_CASE("expected - success carries value", "[vocabulary]") {
  auto result = expected<int, ErrorCode>::success(42);
  REQUIRE(result.has_value());
  REQUIRE(static_cast<bool>(result));
  REQUIRE(result.value() == 42);
}

TEST_CASE("expected - error carries code", "[vocabulary]") {
  auto result = expected<int, ErrorCode>::error(ErrorCode::kNoSlot);
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == ErrorCode::kNoSlot);
  REQUIRE(result.value_or(7) == 7);
}

TEST_CASE("expected - owns non-trivial value", "[vocabulary]") {
  auto original = expected<std::string, ErrorCode>::success(std::string("http#0"));
  auto copy = original;
  auto moved = static_cast<expected<std::string, ErrorCode>&&>(original);
  REQUIRE(copy.value() == "http#0");
  REQUIRE(moved.value() == "http#0");

  copy = expected<std::string, ErrorCode>::error(ErrorCode::kSocketError);
  REQUIRE(!copy.has_value());
  REQUIRE(copy.get_error() == ErrorCode::kSocketError);
}

TEST_CASE("expected<void> - success and error", "[vocabulary]") {
  auto ok = expected<void, ErrorCode>::success();
  auto err = expected<void, ErrorCode>::error(ErrorCode::kMaxStreamsExceeded);
  REQUIRE(ok.has_value());
  REQUIRE(!err.has_value());
  REQUIRE(err.get_error() == ErrorCode::kMaxStreamsExceeded);
}

TEST_CASE("error_name - every code has a name", "[vocabulary]") {
  REQUIRE(std::string(error_name(ErrorCode::kOk)) == "ok");
  REQUIRE(std::string(error_name(ErrorCode::kInvalidConfig)) == "invalid config");
  REQUIRE(std::string(error_name(ErrorCode::kNoSlot)) == "no slot");
  REQUIRE(std::string(error_name(ErrorCode::kDuplicateCorrelation)) == "duplicate correlation");
  REQUIRE(std::string(error_name(ErrorCode::kMaxStreamsExceeded)) == "max streams exceeded");
  REQUIRE(std::string(error_name(ErrorCode::kSocketError)) == "socket error");
  REQUIRE(std::string(error_name(ErrorCode::kBufferFull)) == "buffer full");
  REQUIRE(std::string(error_name(static_cast<ErrorCode>(200))) == "unknown");
}

// ============================================================================
// optional<T>
// ============================================================================

TEST_CASE("optional - empty and engaged", "[vocabulary]") {
  optional<int> empty;
  optional<int> full(10);
  REQUIRE(!empty.has_value());
  REQUIRE(full.has_value());
  REQUIRE(empty.value_or(99) == 99);
  REQUIRE(full.value_or(99) == 10);
}

TEST_CASE("optional - arrow access and reset", "[vocabulary]") {
  optional<std::string> opt(std::string("chat"));
  REQUIRE(opt->size() == 4);
  opt.reset();
  REQUIRE(!opt.has_value());
}

TEST_CASE("optional - assignment from value", "[vocabulary]") {
  optional<uint8_t> flags;
  flags = static_cast<uint8_t>(0x81);
  REQUIRE(flags.has_value());
  REQUIRE(flags.value() == 0x81);
}

TEST_CASE("optional - moved string survives", "[vocabulary]") {
  optional<std::string> a(std::string("superchat"));
  optional<std::string> b = static_cast<optional<std::string>&&>(a);
  REQUIRE(b.has_value());
  REQUIRE(b.value() == "superchat");
}

// ============================================================================
// FixedVector<T, N>
// ============================================================================

TEST_CASE("FixedVector - push_back until full", "[vocabulary]") {
  FixedVector<int, 2> v;
  REQUIRE(v.empty());
  REQUIRE(v.capacity() == 2);
  REQUIRE(v.push_back(1));
  REQUIRE(v.push_back(2));
  REQUIRE(v.full());
  REQUIRE(!v.push_back(3));
  REQUIRE(v.size() == 2);
}

TEST_CASE("FixedVector - aggregate emplace and iteration", "[vocabulary]") {
  struct Pair {
    int a;
    int b;
  };
  FixedVector<Pair, 4> v;
  REQUIRE(v.emplace_back(1, 2));
  REQUIRE(v.emplace_back(3, 4));

  int sum = 0;
  for (const Pair& p : v) {
    sum += p.a + p.b;
  }
  REQUIRE(sum == 10);
}

TEST_CASE("FixedVector - copy and clear", "[vocabulary]") {
  FixedVector<std::string, 4> a;
  a.push_back("upgrade");
  a.push_back("connection");
  FixedVector<std::string, 4> b = a;
  a.clear();
  REQUIRE(a.empty());
  REQUIRE(b.size() == 2);
  REQUIRE(b[1] == "connection");
}

// ============================================================================
// FixedFunction
// ============================================================================

TEST_CASE("FixedFunction - empty and nullptr", "[vocabulary]") {
  FixedFunction<void()> a;
  FixedFunction<void()> b(nullptr);
  REQUIRE(!static_cast<bool>(a));
  REQUIRE(!static_cast<bool>(b));
}

TEST_CASE("FixedFunction - invokes captured state", "[vocabulary]") {
  int calls = 0;
  FixedFunction<int(int)> fn([&calls](int x) {
    ++calls;
    return x * 2;
  });
  REQUIRE(fn(21) == 42);
  REQUIRE(calls == 1);
}

TEST_CASE("FixedFunction - move leaves source empty", "[vocabulary]") {
  int called = 0;
  FixedFunction<void()> fn1([&called]() { ++called; });
  FixedFunction<void()> fn2 = static_cast<FixedFunction<void()>&&>(fn1);
  REQUIRE(!static_cast<bool>(fn1));
  fn2();
  REQUIRE(called == 1);

  FixedFunction<void()> fn3;
  fn3 = static_cast<FixedFunction<void()>&&>(fn2);
  REQUIRE(!static_cast<bool>(fn2));
  fn3();
  REQUIRE(called == 2);
}

TEST_CASE("FixedFunction - clearing from inside the call", "[vocabulary]") {
  FixedFunction<void()> fn;
  int called = 0;
  fn = FixedFunction<void()>([&fn, &called]() {
    ++called;
    fn = nullptr;
  });
  fn();
  REQUIRE(called == 1);
  REQUIRE(!static_cast<bool>(fn));
}

TEST_CASE("kCacheLine constant", "[vocabulary]") {
  REQUIRE(kCacheLine == 64);
}
