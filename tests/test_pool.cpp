/**
 * @file test_pool.cpp
 * @brief Tests for Credential construction and Pool validation.
 *
 * Validates:
 *  - Per-record rules (non-empty secret, positive finite weight)
 *  - Pool rules (non-empty, finite total, distinct display names) and their check order
 *  - Error context (index/label) and operator-facing messages
 *  - Cached total weight and legacy single-secret normalization
 */

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include "keypool/selection/credential.hpp"
#include "keypool/selection/pool.hpp"

using keypool::selection::Credential;
using keypool::selection::CredentialSpec;
using keypool::selection::Pool;
using keypool::selection::ValidationErrc;
using keypool::selection::ValidationError;

// --------------------------- Credential ------------------------------------

TEST(Credential, Create_Defaults) {
  auto c = Credential::create("sk-test-0001");
  ASSERT_TRUE(c);
  EXPECT_EQ(c->secret(), "sk-test-0001");
  EXPECT_DOUBLE_EQ(c->weight(), 1.0);
  EXPECT_FALSE(c->has_label());
}

TEST(Credential, Create_RejectsNonPositiveWeight) {
  for (double w : {0.0, -1.0, -0.0001}) {
    auto c = Credential::create("sk", w, "lbl");
    ASSERT_FALSE(c) << "weight " << w;
    EXPECT_EQ(c.error().code, ValidationErrc::InvalidWeight);
    EXPECT_EQ(c.error().label, "lbl");
  }
}

TEST(Credential, Create_RejectsNonFiniteWeight) {
  EXPECT_FALSE(Credential::create("sk", std::numeric_limits<double>::quiet_NaN()));
  EXPECT_FALSE(Credential::create("sk", std::numeric_limits<double>::infinity()));
  EXPECT_FALSE(Credential::create("sk", -std::numeric_limits<double>::infinity()));
}

TEST(Credential, Create_RejectsEmptySecret) {
  auto c = Credential::create("", 2.0);
  ASSERT_FALSE(c);
  EXPECT_EQ(c.error().code, ValidationErrc::EmptySecret);
}

TEST(Credential, MaskedPreview) {
  EXPECT_EQ(keypool::selection::masked_preview("abcdefghijkl"), "abcdefgh...");
  EXPECT_EQ(keypool::selection::masked_preview("abcdefgh"), "abcdefgh");
  EXPECT_EQ(keypool::selection::masked_preview("short"), "short");
}

// --------------------------- Pool: happy path -------------------------------

/**
 * @test Pool_TotalWeight_321
 * @brief Weights {3,2,1} cache a total of 6 and keep input order.
 */
TEST(Pool, Pool_TotalWeight_321) {
  const std::vector<CredentialSpec> specs{
    {.secret = "k1", .weight = 3.0, .label = "primary"},
    {.secret = "k2", .weight = 2.0, .label = "secondary"},
    {.secret = "k3", .weight = 1.0, .label = "backup"},
  };
  auto pool = Pool::create(specs);
  ASSERT_TRUE(pool);
  EXPECT_EQ(pool->size(), 3u);
  EXPECT_DOUBLE_EQ(pool->total_weight(), 6.0);
  EXPECT_EQ((*pool)[0].label(), "primary");
  EXPECT_EQ((*pool)[1].label(), "secondary");
  EXPECT_EQ((*pool)[2].label(), "backup");
}

TEST(Pool, Pool_UnlabeledEntriesNeverCollide) {
  const std::vector<CredentialSpec> specs{
    {.secret = "k1"}, {.secret = "k2"}, {.secret = "k3", .weight = 1.0, .label = "named"},
  };
  auto pool = Pool::create(specs);
  ASSERT_TRUE(pool);
  EXPECT_EQ(pool->size(), 3u);
  EXPECT_FALSE(pool->find_label(""));
  ASSERT_TRUE(pool->find_label("named"));
  EXPECT_EQ(*pool->find_label("named"), 2u);
}

TEST(Pool, Pool_LabelsAreCaseSensitive) {
  const std::vector<CredentialSpec> specs{
    {.secret = "k1", .weight = 1.0, .label = "Primary"},
    {.secret = "k2", .weight = 1.0, .label = "primary"},
  };
  EXPECT_TRUE(Pool::create(specs));
}

TEST(Pool, Pool_FromLegacy_OneDefaultRecord) {
  auto pool = Pool::from_legacy("legacy-secret");
  ASSERT_TRUE(pool);
  ASSERT_EQ(pool->size(), 1u);
  EXPECT_EQ((*pool)[0].secret(), "legacy-secret");
  EXPECT_DOUBLE_EQ((*pool)[0].weight(), 1.0);
  EXPECT_DOUBLE_EQ(pool->total_weight(), 1.0);
  EXPECT_FALSE((*pool)[0].has_label());
}

// --------------------------- Pool: rejections -------------------------------

TEST(Pool, Reject_EmptyPool) {
  const std::vector<CredentialSpec> none;
  auto pool = Pool::create(none);
  ASSERT_FALSE(pool);
  EXPECT_EQ(pool.error().code, ValidationErrc::EmptyPool);
}

TEST(Pool, Reject_LegacyEmptySecret) {
  auto pool = Pool::from_legacy("");
  ASSERT_FALSE(pool);
  EXPECT_EQ(pool.error().code, ValidationErrc::EmptySecret);
}

/**
 * @test Reject_InvalidWeight_IdentifiesEntry
 * @brief The error carries the index and label of the offending entry.
 */
TEST(Pool, Reject_InvalidWeight_IdentifiesEntry) {
  const std::vector<CredentialSpec> specs{
    {.secret = "k1", .weight = 1.0, .label = "a"},
    {.secret = "k2", .weight = 1.0, .label = "b"},
    {.secret = "k3", .weight = -2.0, .label = "c"},
  };
  auto pool = Pool::create(specs);
  ASSERT_FALSE(pool);
  EXPECT_EQ(pool.error().code, ValidationErrc::InvalidWeight);
  EXPECT_EQ(pool.error().index, 2u);
  EXPECT_EQ(pool.error().label, "c");
  EXPECT_EQ(pool.error().to_string(), "InvalidWeight: entry #3 (label 'c')");
}

TEST(Pool, Reject_DuplicateLabel) {
  const std::vector<CredentialSpec> specs{
    {.secret = "k1", .weight = 1.0, .label = "dup"},
    {.secret = "k2", .weight = 1.0, .label = "other"},
    {.secret = "k3", .weight = 1.0, .label = "dup"},
  };
  auto pool = Pool::create(specs);
  ASSERT_FALSE(pool);
  EXPECT_EQ(pool.error().code, ValidationErrc::DuplicateLabel);
  EXPECT_EQ(pool.error().index, 2u);   // second occurrence
  EXPECT_EQ(pool.error().label, "dup");
  EXPECT_EQ(pool.error().to_string(), "DuplicateLabel: entry #3 reuses label 'dup'");
}

/**
 * @test Reject_WeightSumOverflow
 * @brief Finite weights whose sum overflows are rejected at the entry that
 *        pushes the total past the largest double.
 */
TEST(Pool, Reject_WeightSumOverflow) {
  const std::vector<CredentialSpec> specs{
    {.secret = "k1", .weight = 1e308, .label = "a"},
    {.secret = "k2", .weight = 1e308, .label = "b"},
  };
  auto pool = Pool::create(specs);
  ASSERT_FALSE(pool);
  EXPECT_EQ(pool.error().code, ValidationErrc::InvalidWeight);
  EXPECT_EQ(pool.error().index, 1u);
  EXPECT_EQ(pool.error().label, "b");
}

TEST(Pool, Pool_LargeFiniteTotalAccepted) {
  const std::vector<CredentialSpec> specs{
    {.secret = "k1", .weight = 1e307, .label = "a"},
    {.secret = "k2", .weight = 1e307, .label = "b"},
  };
  auto pool = Pool::create(specs);
  ASSERT_TRUE(pool);
  EXPECT_TRUE(std::isfinite(pool->total_weight()));
}

/**
 * @test Reject_ExplicitLabelShadowsDefaultName
 * @brief An unlabeled entry displays as key_<n>; an explicit label with the
 *        same text is a duplicate, whichever comes first.
 */
TEST(Pool, Reject_ExplicitLabelShadowsDefaultName) {
  const std::vector<CredentialSpec> explicit_first{
    {.secret = "s1", .weight = 1.0, .label = "key_2"},
    {.secret = "s2", .weight = 1.0, .label = ""},
  };
  auto a = Pool::create(explicit_first);
  ASSERT_FALSE(a);
  EXPECT_EQ(a.error().code, ValidationErrc::DuplicateLabel);
  EXPECT_EQ(a.error().index, 1u);
  EXPECT_EQ(a.error().label, "key_2");

  const std::vector<CredentialSpec> default_first{
    {.secret = "s1", .weight = 1.0, .label = ""},
    {.secret = "s2", .weight = 1.0, .label = "key_1"},
  };
  auto b = Pool::create(default_first);
  ASSERT_FALSE(b);
  EXPECT_EQ(b.error().code, ValidationErrc::DuplicateLabel);
  EXPECT_EQ(b.error().index, 1u);
  EXPECT_EQ(b.error().to_string(), "DuplicateLabel: entry #2 reuses label 'key_1'");
}

TEST(Pool, Pool_ExplicitDefaultStyleLabelWithoutClash) {
  const std::vector<CredentialSpec> specs{
    {.secret = "s1", .weight = 1.0, .label = "key_1"},
    {.secret = "s2", .weight = 1.0, .label = ""},
  };
  EXPECT_TRUE(Pool::create(specs));
}

/**
 * @test Reject_CheckOrder_WeightBeforeLabels
 * @brief Per-record checks run before the label check, even when the
 *        duplicate label appears earlier in the list.
 */
TEST(Pool, Reject_CheckOrder_WeightBeforeLabels) {
  const std::vector<CredentialSpec> specs{
    {.secret = "k1", .weight = 1.0, .label = "dup"},
    {.secret = "k2", .weight = 1.0, .label = "dup"},
    {.secret = "k3", .weight = 0.0, .label = "zero"},
  };
  auto pool = Pool::create(specs);
  ASSERT_FALSE(pool);
  EXPECT_EQ(pool.error().code, ValidationErrc::InvalidWeight);
  EXPECT_EQ(pool.error().index, 2u);
}

TEST(Pool, Reject_CheckOrder_FirstBadRecordWins) {
  const std::vector<CredentialSpec> specs{
    {.secret = "k1", .weight = 1.0},
    {.secret = "",   .weight = 1.0},
    {.secret = "k3", .weight = -1.0},
  };
  auto pool = Pool::create(specs);
  ASSERT_FALSE(pool);
  EXPECT_EQ(pool.error().code, ValidationErrc::EmptySecret);
  EXPECT_EQ(pool.error().index, 1u);
  EXPECT_EQ(pool.error().to_string(), "EmptySecret: entry #2");
}

TEST(Pool, Validate_IsPoolCreate) {
  const std::vector<CredentialSpec> specs{{.secret = "k1"}};
  auto a = keypool::selection::validate(specs);
  auto b = Pool::create(specs);
  ASSERT_TRUE(a);
  ASSERT_TRUE(b);
  EXPECT_EQ((*a)[0], (*b)[0]);
}
