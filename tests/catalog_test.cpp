//! # Resource Catalog Unit Tests
//!
//! Tests for ResourceCatalog: insertion and validation, lookups, the
//! six-line description, reverse lookups, and dangling references.

#include "catalog/resource_catalog.hpp"
#include "test_catalogs.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace reqtree;
using namespace reqtree::catalog;
using graph::ErrorKind;

// ============================================================================
// Insertion and Validation
// ============================================================================

class CatalogAddTest : public ::testing::Test {
protected:
    ResourceCatalog catalog;

    static ResourceEntry make(const std::string& id, std::vector<std::string> reqs = {}) {
        ResourceEntry entry;
        entry.id = id;
        entry.requirements = std::move(reqs);
        return entry;
    }
};

TEST_F(CatalogAddTest, AddReturnsStoredEntry) {
    auto added = catalog.add(make("a"));
    ASSERT_TRUE(is_ok(added));
    EXPECT_EQ(unwrap(added)->id, "a");
    EXPECT_EQ(catalog.size(), 1u);
    EXPECT_TRUE(catalog.contains("a"));
    EXPECT_FALSE(catalog.empty());
}

TEST_F(CatalogAddTest, DuplicateIdRejected) {
    ASSERT_TRUE(is_ok(catalog.add(make("a"))));

    auto again = catalog.add(make("a", {"b"}));
    ASSERT_TRUE(is_err(again));
    EXPECT_EQ(unwrap_err(again).kind, ErrorKind::DuplicateResource);
    EXPECT_EQ(unwrap_err(again).resource, "a");

    // The first definition is kept
    EXPECT_EQ(catalog.size(), 1u);
    EXPECT_TRUE(catalog.get("a")->is_leaf());
}

TEST_F(CatalogAddTest, EmptyIdRejected) {
    auto added = catalog.add(make(""));
    ASSERT_TRUE(is_err(added));
    EXPECT_EQ(unwrap_err(added).kind, ErrorKind::InvalidResource);
    EXPECT_EQ(unwrap_err(added).message, "Invalid resource <unnamed>: empty identifier");
    EXPECT_TRUE(catalog.empty());
}

TEST_F(CatalogAddTest, EmptyRequirementRejected) {
    auto added = catalog.add(make("a", {"b", ""}));
    ASSERT_TRUE(is_err(added));
    EXPECT_EQ(unwrap_err(added).kind, ErrorKind::InvalidResource);
    EXPECT_EQ(unwrap_err(added).resource, "a");
    EXPECT_FALSE(catalog.contains("a"));
}

TEST_F(CatalogAddTest, ForwardReferencesAllowed) {
    // Requirements may name resources added later
    ASSERT_TRUE(is_ok(catalog.add(make("b", {"a"}))));
    ASSERT_TRUE(is_ok(catalog.add(make("a"))));
    EXPECT_TRUE(catalog.dangling_references().empty());
}

TEST_F(CatalogAddTest, IdsKeepInsertionOrder) {
    ASSERT_TRUE(is_ok(catalog.add(make("zeta"))));
    ASSERT_TRUE(is_ok(catalog.add(make("alpha"))));
    ASSERT_TRUE(is_ok(catalog.add(make("mu"))));

    EXPECT_EQ(catalog.ids(), (std::vector<std::string>{"zeta", "alpha", "mu"}));
}

// ============================================================================
// Lookups
// ============================================================================

class CatalogLookupTest : public ::testing::Test {
protected:
    ResourceCatalog catalog = test::alphabet_catalog();
};

TEST_F(CatalogLookupTest, GetKnownAndUnknown) {
    ASSERT_NE(catalog.get("m"), nullptr);
    EXPECT_EQ(catalog.get("m")->name, "M");
    EXPECT_EQ(catalog.get("missing"), nullptr);
}

TEST_F(CatalogLookupTest, LookupUnknownFails) {
    auto found = catalog.lookup("nope");
    ASSERT_TRUE(is_err(found));
    EXPECT_EQ(unwrap_err(found).kind, ErrorKind::UnknownResource);
    EXPECT_EQ(unwrap_err(found).message, "Unknown resource: nope");
}

TEST_F(CatalogLookupTest, DirectRequirements) {
    auto reqs = catalog.direct_requirements("c");
    ASSERT_TRUE(is_ok(reqs));
    EXPECT_EQ(unwrap(reqs), (std::vector<std::string>{"b"}));

    auto leaf = catalog.direct_requirements("a");
    ASSERT_TRUE(is_ok(leaf));
    EXPECT_TRUE(unwrap(leaf).empty());

    auto unknown = catalog.direct_requirements("A");
    ASSERT_TRUE(is_err(unknown));
    EXPECT_EQ(unwrap_err(unknown).kind, ErrorKind::UnknownResource);
}

TEST_F(CatalogLookupTest, IdentifiersAreCaseSensitive) {
    EXPECT_TRUE(catalog.contains("a"));
    EXPECT_FALSE(catalog.contains("A"));
}

// ============================================================================
// Describe
// ============================================================================

TEST_F(CatalogLookupTest, DescribeLeaf) {
    auto text = catalog.describe("a");
    ASSERT_TRUE(is_ok(text));
    EXPECT_EQ(unwrap(text), "Resource: a\n"
                            "Name: A\n"
                            "Short Description: Resource A\n"
                            "Long Description: The first resource in the alphabetical order\n"
                            "Category: example\n"
                            "Requirements: []\n");
}

TEST_F(CatalogLookupTest, DescribeWithRequirement) {
    auto text = catalog.describe("z");
    ASSERT_TRUE(is_ok(text));
    EXPECT_EQ(unwrap(text), "Resource: z\n"
                            "Name: Z\n"
                            "Short Description: Resource Z\n"
                            "Long Description: The twenty-sixth resource, dependent on Y\n"
                            "Category: example\n"
                            "Requirements: [y]\n");
}

TEST(CatalogDescribeTest, MultipleRequirementsCommaJoined) {
    ResourceCatalog catalog;
    test::add_resource(catalog, "app", {"libc", "zlib", "ssl"});

    auto text = catalog.describe("app");
    ASSERT_TRUE(is_ok(text));
    EXPECT_NE(unwrap(text).find("Requirements: [libc, zlib, ssl]\n"), std::string::npos);
}

TEST(CatalogDescribeTest, EmptyFieldsStillRendered) {
    ResourceCatalog catalog;
    ResourceEntry entry;
    entry.id = "bare";
    ASSERT_TRUE(is_ok(catalog.add(entry)));

    auto text = catalog.describe("bare");
    ASSERT_TRUE(is_ok(text));
    EXPECT_EQ(unwrap(text), "Resource: bare\n"
                            "Name: \n"
                            "Short Description: \n"
                            "Long Description: \n"
                            "Category: \n"
                            "Requirements: []\n");
}

TEST_F(CatalogLookupTest, DescribeUnknownFails) {
    auto text = catalog.describe("unknown");
    ASSERT_TRUE(is_err(text));
    EXPECT_EQ(unwrap_err(text).kind, ErrorKind::UnknownResource);
    EXPECT_EQ(unwrap_err(text).to_string(), "error[UnknownResource]: Unknown resource: unknown");
}

// ============================================================================
// Reverse Lookups and Validation
// ============================================================================

TEST(CatalogReverseTest, RequiredByInCatalogOrder) {
    auto catalog = test::diamond_catalog();

    EXPECT_EQ(catalog.required_by("base"), (std::vector<std::string>{"left", "right"}));
    EXPECT_EQ(catalog.required_by("left"), (std::vector<std::string>{"top"}));
    EXPECT_TRUE(catalog.required_by("top").empty());
    EXPECT_TRUE(catalog.required_by("absent").empty());
}

TEST(CatalogReverseTest, DanglingReferences) {
    ResourceCatalog catalog;
    test::add_resource(catalog, "a", {"ghost"});
    test::add_resource(catalog, "b", {"a", "phantom", "ghost"});

    auto dangling = catalog.dangling_references();
    ASSERT_EQ(dangling.size(), 3u);
    EXPECT_EQ(dangling[0], (DanglingReference{"a", "ghost"}));
    EXPECT_EQ(dangling[1], (DanglingReference{"b", "phantom"}));
    EXPECT_EQ(dangling[2], (DanglingReference{"b", "ghost"}));
}

TEST(CatalogReverseTest, JoinIds) {
    EXPECT_EQ(join_ids({}, ", "), "");
    EXPECT_EQ(join_ids({"a"}, ", "), "a");
    EXPECT_EQ(join_ids({"c", "b", "a"}, " <- "), "c <- b <- a");
}
