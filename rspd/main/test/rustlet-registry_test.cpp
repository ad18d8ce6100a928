#include "rspd/rustlet-registry.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

#include "rspd/errors.hpp"
#include "rspd/request-context.hpp"
#include "rspd/rustlet.hpp"

namespace rspd {

namespace {
RustletPtr Noop() {
  return MakeRustlet([](RequestContext&) {});
}
}  // namespace

TEST(RustletRegistry, ExactMapping) {
  RustletRegistry registry;
  registry.registerRustlet("/echo", Noop());
  EXPECT_NE(registry.resolve("/echo"), nullptr);
  EXPECT_EQ(registry.resolve("/echo/"), nullptr);
  EXPECT_EQ(registry.resolve("/echoes"), nullptr);
  EXPECT_EQ(registry.resolve("/"), nullptr);
  EXPECT_EQ(registry.nbRustlets(), 1U);
  EXPECT_EQ(registry.nbMappings(), 1U);
}

TEST(RustletRegistry, NamedRustletMappedTwice) {
  RustletRegistry registry;
  auto rustlet = Noop();
  registry.addRustlet("header", rustlet);
  registry.addMapping("/h1", "header");
  registry.addMapping("/h2", "header");
  EXPECT_EQ(registry.resolve("/h1"), rustlet.get());
  EXPECT_EQ(registry.resolve("/h2"), rustlet.get());
  EXPECT_EQ(registry.findByName("header"), rustlet.get());
  EXPECT_EQ(registry.findByName("footer"), nullptr);
}

TEST(RustletRegistry, PrefixMappingLongestWins) {
  RustletRegistry registry;
  auto all = Noop();
  auto api = Noop();
  auto apiV2 = Noop();
  registry.registerRustlet("/*", all);
  registry.registerRustlet("/api/*", api);
  registry.registerRustlet("/api/v2/*", apiV2);

  EXPECT_EQ(registry.resolve("/index.html"), all.get());
  EXPECT_EQ(registry.resolve("/api"), api.get());
  EXPECT_EQ(registry.resolve("/api/users"), api.get());
  EXPECT_EQ(registry.resolve("/apis"), all.get());
  EXPECT_EQ(registry.resolve("/api/v2"), apiV2.get());
  EXPECT_EQ(registry.resolve("/api/v2/a/b"), apiV2.get());
}

TEST(RustletRegistry, ExactBeatsPrefix) {
  RustletRegistry registry;
  auto prefix = Noop();
  auto exact = Noop();
  registry.registerRustlet("/static/*", prefix);
  registry.registerRustlet("/static/special", exact);
  EXPECT_EQ(registry.resolve("/static/special"), exact.get());
  EXPECT_EQ(registry.resolve("/static/other"), prefix.get());
}

TEST(RustletRegistry, DuplicateNameRejected) {
  RustletRegistry registry;
  registry.addRustlet("a", Noop());
  EXPECT_THROW(registry.addRustlet("a", Noop()), DuplicateMapping);
}

TEST(RustletRegistry, DuplicatePatternRejected) {
  RustletRegistry registry;
  registry.addRustlet("a", Noop());
  registry.addRustlet("b", Noop());
  registry.addMapping("/x", "a");
  EXPECT_THROW(registry.addMapping("/x", "b"), DuplicateMapping);
  registry.addMapping("/y/*", "a");
  EXPECT_THROW(registry.addMapping("/y/*", "b"), DuplicateMapping);
  EXPECT_EQ(registry.nbMappings(), 2U);
}

TEST(RustletRegistry, MappingToUnknownRustlet) {
  RustletRegistry registry;
  try {
    registry.addMapping("/x", "ghost");
    FAIL() << "expected UnknownRustlet";
  } catch (const UnknownRustlet& ex) {
    EXPECT_EQ(ex.name(), "ghost");
  }
}

TEST(RustletRegistry, InvalidArguments) {
  RustletRegistry registry;
  EXPECT_THROW(registry.addRustlet("", Noop()), std::invalid_argument);
  EXPECT_THROW(registry.addRustlet("null", nullptr), std::invalid_argument);
  registry.addRustlet("a", Noop());
  EXPECT_THROW(registry.addMapping("noslash", "a"), std::invalid_argument);
  EXPECT_THROW(registry.addMapping("/a*b", "a"), std::invalid_argument);
  EXPECT_THROW(registry.addMapping("/a/*/b", "a"), std::invalid_argument);
}

TEST(RustletRegistry, FrozenRejectsRegistration) {
  RustletRegistry registry;
  registry.registerRustlet("/a", Noop());
  registry.freeze();
  EXPECT_TRUE(registry.isFrozen());
  EXPECT_THROW(registry.registerRustlet("/b", Noop()), std::logic_error);
  EXPECT_THROW(registry.addMapping("/c", "/a"), std::logic_error);
  EXPECT_NE(registry.resolve("/a"), nullptr);
}

}  // namespace rspd
