#include <archlens/symbol_table.h>

#include <gtest/gtest.h>

#include "test_support/metadata_builders.h"

namespace archlens {
namespace {

TEST(SymbolTableTest, ResolvesAnalyzedTypesAndPackages) {
  const SymbolTable symbols(
      {test::Type("com.shop.Order"),
       test::Type("com.shop.api.Gateway", TypeKind::kInterface)},
      DefaultVocabulary());

  EXPECT_TRUE(symbols.IsKnown("com.shop.Order"));
  EXPECT_FALSE(symbols.IsKnown("com.shop.Missing"));
  ASSERT_NE(symbols.Find("com.shop.api.Gateway"), nullptr);
  EXPECT_EQ(symbols.Find("com.shop.api.Gateway")->package, "com.shop.api");
  EXPECT_EQ(symbols.Find("com.shop.api.Gateway")->kind, TypeKind::kInterface);
  EXPECT_EQ(symbols.size(), 2u);
}

TEST(SymbolTableTest, MatchesPlatformNamespacesOnSegmentBoundaries) {
  const SymbolTable symbols({}, DefaultVocabulary());

  EXPECT_TRUE(symbols.IsPlatform("java.util.List"));
  EXPECT_TRUE(symbols.IsPlatform("javax.inject.Inject"));
  EXPECT_TRUE(symbols.IsPlatform("com.sun.net.Handler"));
  EXPECT_FALSE(symbols.IsPlatform("javafx2.scene.Node"));
  EXPECT_FALSE(symbols.IsPlatform("com.shop.Order"));
  EXPECT_TRUE(symbols.IsPlatformRoot("java.lang.Object"));
}

TEST(SymbolTableTest, ClassifiesPrimitiveValueAndContainerTypes) {
  const SymbolTable symbols({}, DefaultVocabulary());

  EXPECT_TRUE(symbols.IsPrimitive("int"));
  EXPECT_FALSE(symbols.IsPrimitive("java.lang.Integer"));
  EXPECT_TRUE(symbols.IsValueType("java.lang.String"));
  EXPECT_TRUE(symbols.IsValueType("java.time.Instant"));
  EXPECT_TRUE(symbols.IsValueType("java.math.BigDecimal"));
  EXPECT_FALSE(symbols.IsValueType("com.shop.Money"));
  EXPECT_TRUE(symbols.IsContainer("java.util.List"));
  EXPECT_FALSE(symbols.IsContainer("com.shop.OrderList"));
}

TEST(SymbolTableTest, MatchesInjectionMarkersByQualifiedOrSimpleName) {
  auto vocabulary = DefaultVocabulary();
  vocabulary.injection_markers.push_back("Wired");
  const SymbolTable symbols({}, vocabulary);

  EXPECT_TRUE(symbols.IsInjectionMarker(
      "org.springframework.beans.factory.annotation.Autowired"));
  EXPECT_TRUE(symbols.IsInjectionMarker("Autowired"));
  EXPECT_TRUE(symbols.IsInjectionMarker("com.acme.di.Wired"));
  EXPECT_FALSE(symbols.IsInjectionMarker("com.acme.di.Autowired"));
  EXPECT_FALSE(symbols.IsInjectionMarker("Deprecated"));
}

TEST(SymbolTableTest, DerivesPackagesAndArrayElements) {
  EXPECT_EQ(PackageOf("com.shop.Order"), "com.shop");
  EXPECT_EQ(PackageOf("com.shop.Order$Line"), "com.shop");
  EXPECT_EQ(PackageOf("com.shop.Order[]"), "com.shop");
  EXPECT_EQ(PackageOf("Standalone"), "(default)");
  EXPECT_EQ(StripArray("com.shop.Order[][]"), "com.shop.Order");
  EXPECT_TRUE(IsArrayType("int[]"));
  EXPECT_FALSE(IsArrayType("int"));
  EXPECT_EQ(SimpleNameOf("com.shop.Order"), "Order");
}

} // namespace
} // namespace archlens
