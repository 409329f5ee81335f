#include "pluralize.hpp"

#include <gtest/gtest.h>

using namespace keyreg;

TEST(pluralize, word_ending_in_s_is_unchanged) {
  EXPECT_EQ(pluralize("bus"), "bus");
  EXPECT_EQ(pluralize("buses"), "buses");
  EXPECT_EQ(pluralize("status"), "status");
}

TEST(pluralize, consonant_y_becomes_ies) {
  EXPECT_EQ(pluralize("category"), "categories");
  EXPECT_EQ(pluralize("baby"), "babies");
}

TEST(pluralize, vowel_y_gets_s) {
  EXPECT_EQ(pluralize("key"), "keys");
  EXPECT_EQ(pluralize("day"), "days");
  EXPECT_EQ(pluralize("bOy"), "bOys");
}

TEST(pluralize, sibilant_endings_get_es) {
  EXPECT_EQ(pluralize("box"), "boxes");
  EXPECT_EQ(pluralize("brush"), "brushes");
  EXPECT_EQ(pluralize("match"), "matches");
  EXPECT_EQ(pluralize("quiz"), "quizes");
}

TEST(pluralize, anything_else_gets_s) {
  EXPECT_EQ(pluralize("id"), "ids");
  EXPECT_EQ(pluralize("name"), "names");
  EXPECT_EQ(pluralize("age"), "ages");
}

TEST(pluralize, single_y_is_not_preceded_by_consonant) {
  EXPECT_EQ(pluralize("y"), "ys");
}
