#include <gtest/gtest.h>

#include <chrono>
#include <ctime>

#include "DestinationKeyResolver.hpp"

namespace {

// 2024-03-05T23:59:59Z
std::chrono::system_clock::time_point march_fifth() {
    return std::chrono::system_clock::from_time_t(1709683199);
}

}  // namespace

TEST(DestinationKeyResolverTest, KeywordMatchUsesCanonicalSuffix) {
    DestinationKeyResolver resolver("raw");
    EXPECT_EQ(resolver.ResolveSuffix("https://data.example.ae/open/Transactions?id=7"),
              "transactions.csv");
    EXPECT_EQ(resolver.ResolveSuffix("https://data.example.ae/export/UNITS.zip"), "units.csv");
    EXPECT_EQ(resolver.ResolveSuffix("https://x.example/developers"), "developers.csv");
}

TEST(DestinationKeyResolverTest, OverlappingKeywordsResolveByTableOrder) {
    DestinationKeyResolver resolver("raw");
    // both "rent_contracts" and "transactions" occur; the earlier table entry wins
    EXPECT_EQ(resolver.ResolveSuffix("https://x.example/transactions/rent_contracts.csv"),
              "rent_contracts.csv");
    // "units" precedes "buildings" although "buildings" appears first in the URL
    EXPECT_EQ(resolver.ResolveSuffix("https://x.example/buildings_units.csv"), "units.csv");
}

TEST(DestinationKeyResolverTest, CustomTableOrderIsHonoured) {
    DestinationKeyResolver resolver("raw", {{"units", "u.csv"}, {"unit", "single.csv"}});
    EXPECT_EQ(resolver.ResolveSuffix("https://x.example/units"), "u.csv");
    EXPECT_EQ(resolver.ResolveSuffix("https://x.example/unit"), "single.csv");
}

TEST(DestinationKeyResolverTest, FallsBackToPathBaseName) {
    DestinationKeyResolver resolver("raw");
    EXPECT_EQ(resolver.ResolveSuffix("https://x.example/files/land_registry.csv?sig=abc"),
              "land_registry.csv");
}

TEST(DestinationKeyResolverTest, FallsBackToDefaultName) {
    DestinationKeyResolver resolver("raw");
    EXPECT_EQ(resolver.ResolveSuffix("https://x.example/files/"), "data.csv");
    EXPECT_EQ(resolver.ResolveSuffix("https://x.example"), "data.csv");
    EXPECT_EQ(resolver.ResolveSuffix("not a url at all"), "data.csv");
}

TEST(DestinationKeyResolverTest, KeyIsDatePartitioned) {
    DestinationKeyResolver resolver("raw");
    EXPECT_EQ(resolver.Resolve("https://x.example/projects.csv", march_fifth()),
              "raw/2024/03/05/projects.csv");
}

TEST(DestinationKeyResolverTest, TrailingSlashInPrefixIsIgnored) {
    DestinationKeyResolver resolver("landing/raw/");
    EXPECT_EQ(resolver.Resolve("https://x.example/projects.csv", march_fifth()),
              "landing/raw/2024/03/05/projects.csv");
}

TEST(DestinationKeyResolverTest, SameDaySameKey) {
    DestinationKeyResolver resolver("raw");
    const auto t = march_fifth();
    const std::string url = "https://x.example/export?dataset=rent_contracts";
    const auto first = resolver.Resolve(url, t);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(resolver.Resolve(url, t - std::chrono::hours(i)), first);
    }
    EXPECT_NE(resolver.Resolve(url, t + std::chrono::seconds(1)), first);
}
