/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "collections/tree_map.hpp"
#include "testutil/collections/base_collection_test.hpp"

using strata::collections::TreeMap;

struct TreeMapTest : public test::BaseCollection_Test {
  using Map = TreeMap<uint32_t, std::string>;

  static std::vector<uint32_t> keys(const Map::Range &range) {
    std::vector<uint32_t> keys;
    for (auto [key, value] : range) {
      keys.push_back(key);
    }
    return keys;
  }

  /// Map with keys 10, 20, 30, 40
  void fillTens(Map &map) {
    for (uint32_t key = 10; key <= 40; key += 10) {
      map.insert(key, std::to_string(key));
    }
  }
};

/**
 * @given keys [5, 1, 4, 1, 5, 9] inserted in that order
 * @when the map is iterated
 * @then distinct keys go in ascending order with the last inserted values
 */
TEST_F(TreeMapTest, IterationIsOrdered) {
  Map map{env, prefix("t")};
  std::vector<uint32_t> inserted{5, 1, 4, 1, 5, 9};
  for (size_t i = 0; i < inserted.size(); ++i) {
    map.insert(inserted[i], std::to_string(i));
  }

  EXPECT_EQ(map.len(), 4);
  EXPECT_EQ(keys(map.iter()), (std::vector<uint32_t>{1, 4, 5, 9}));
  EXPECT_EQ(keys(map.iterRev()), (std::vector<uint32_t>{9, 5, 4, 1}));
  EXPECT_EQ(*map.get(1), "3");
  EXPECT_EQ(*map.get(5), "4");
  EXPECT_OUTCOME_SUCCESS(map.checkInvariants());
}

/**
 * @given map with keys 10, 20, 30, 40
 * @when neighbour queries are made
 * @then they return closest keys in the requested direction
 */
TEST_F(TreeMapTest, NeighbourQueries) {
  Map map{env, prefix("t")};
  fillTens(map);

  EXPECT_EQ(map.min()->first, 10);
  EXPECT_EQ(map.max()->first, 40);
  EXPECT_EQ(map.max()->second, "40");

  EXPECT_EQ(map.floor(25)->first, 20);
  EXPECT_EQ(map.floor(20)->first, 20);
  EXPECT_FALSE(map.floor(5).has_value());

  EXPECT_EQ(map.ceiling(25)->first, 30);
  EXPECT_EQ(map.ceiling(30)->first, 30);
  EXPECT_FALSE(map.ceiling(45).has_value());

  EXPECT_EQ(map.lower(20)->first, 10);
  EXPECT_FALSE(map.lower(10).has_value());
  EXPECT_EQ(map.higher(20)->first, 30);
  EXPECT_FALSE(map.higher(40).has_value());
}

/**
 * @given map with keys 10, 20, 30, 40
 * @when ranges are requested
 * @then keys of half-open range are walked in both directions
 */
TEST_F(TreeMapTest, Ranges) {
  Map map{env, prefix("t")};
  fillTens(map);

  EXPECT_EQ(keys(map.range(15, 35)), (std::vector<uint32_t>{20, 30}));
  EXPECT_EQ(keys(map.range(20, 40)), (std::vector<uint32_t>{20, 30}));
  EXPECT_EQ(keys(map.range(0, 100)), (std::vector<uint32_t>{10, 20, 30, 40}));
  EXPECT_TRUE(keys(map.range(21, 29)).empty());
  EXPECT_TRUE(keys(map.range(30, 30)).empty());

  EXPECT_EQ(keys(map.rangeRev(15, 35)), (std::vector<uint32_t>{30, 20}));
  EXPECT_EQ(keys(map.rangeRev(10, 40)), (std::vector<uint32_t>{30, 20, 10}));
}

/**
 * @given empty map
 * @when ordered queries are made
 * @then nothing is found
 */
TEST_F(TreeMapTest, EmptyMap) {
  Map map{env, prefix("t")};
  EXPECT_TRUE(map.isEmpty());
  EXPECT_FALSE(map.min().has_value());
  EXPECT_FALSE(map.max().has_value());
  EXPECT_FALSE(map.floor(1).has_value());
  EXPECT_TRUE(keys(map.iter()).empty());
  EXPECT_OUTCOME_SUCCESS(map.checkInvariants());
}

/**
 * @given map persisted in one scope with some keys removed
 * @when it is attached again
 * @then ordered content is preserved and the tree is valid
 */
TEST_F(TreeMapTest, PersistenceAndRemoval) {
  {
    Map map{env, prefix("t")};
    for (uint32_t key = 0; key < 64; ++key) {
      map.insert(key, std::to_string(key));
    }
    for (uint32_t key = 0; key < 64; key += 4) {
      EXPECT_EQ(map.remove(key), std::to_string(key));
    }
    EXPECT_EQ(map.remove(0), std::nullopt);
  }

  Map map{env, prefix("t")};
  EXPECT_EQ(map.len(), 48);
  EXPECT_OUTCOME_SUCCESS(map.checkInvariants());
  EXPECT_FALSE(map.contains(4));
  EXPECT_EQ(map.floor(4)->first, 3);
  EXPECT_EQ(map.ceiling(4)->first, 5);

  uint32_t count = 0;
  std::optional<uint32_t> prev;
  for (auto [key, value] : map.iter()) {
    EXPECT_NE(key % 4, 0);
    EXPECT_EQ(value, std::to_string(key));
    if (prev.has_value()) {
      EXPECT_LT(*prev, key);
    }
    prev = key;
    ++count;
  }
  EXPECT_EQ(count, 48);
}

/**
 * @given map with values
 * @when a value is replaced via insert, set and getMut
 * @then the key stays in the tree once and len doesn't change
 */
TEST_F(TreeMapTest, ValueUpdate) {
  Map map{env, prefix("t")};
  fillTens(map);

  EXPECT_EQ(map.insert(20, "twenty"), "20");
  EXPECT_EQ(map.set(20, "XX"), "twenty");
  *map.getMut(20) += "!";
  EXPECT_EQ(*map.get(20), "XX!");
  EXPECT_EQ(map.len(), 4);

  EXPECT_EQ(map.set(20, std::nullopt), "XX!");
  EXPECT_EQ(keys(map.iter()), (std::vector<uint32_t>{10, 30, 40}));
}

/**
 * @given persisted map
 * @when it is cleared
 * @then nothing is left but lengths, and the map is usable again
 */
TEST_F(TreeMapTest, Clear) {
  {
    Map map{env, prefix("t")};
    fillTens(map);
  }
  {
    Map map{env, prefix("t")};
    map.clear();
    EXPECT_TRUE(map.isEmpty());
    EXPECT_FALSE(map.contains(10));
  }
  // length of the node slot vector
  EXPECT_EQ(memory->size(), 1);

  Map map{env, prefix("t")};
  map.insert(7, "7");
  EXPECT_EQ(keys(map.iter()), (std::vector<uint32_t>{7}));
  EXPECT_OUTCOME_SUCCESS(map.checkInvariants());
}

/**
 * @given map with reversed order of keys
 * @when it is iterated
 * @then keys go in descending order
 */
TEST_F(TreeMapTest, CustomOrder) {
  TreeMap<uint32_t, std::string, strata::collections::Sha256, std::greater<>>
      map{env, prefix("t")};
  for (uint32_t key = 1; key <= 5; ++key) {
    map.insert(key, std::to_string(key));
  }
  std::vector<uint32_t> result;
  for (auto [key, value] : map.iter()) {
    result.push_back(key);
  }
  EXPECT_EQ(result, (std::vector<uint32_t>{5, 4, 3, 2, 1}));
  EXPECT_EQ(map.min()->first, 5);
}

/**
 * @given map ordered by comparator whose direction is chosen at runtime
 * @when ranges are walked
 * @then bounds are applied in the order of the map's own comparator
 */
TEST_F(TreeMapTest, StatefulComparator) {
  struct DirectedLess {
    bool descending = false;
    bool operator()(uint32_t a, uint32_t b) const {
      return descending ? b < a : a < b;
    }
  };
  using Descending =
      TreeMap<uint32_t, std::string, strata::collections::Sha256, DirectedLess>;
  Descending map{env, prefix("t"), DirectedLess{.descending = true}};
  for (uint32_t key = 1; key <= 5; ++key) {
    map.insert(key, std::to_string(key));
  }
  auto collect = [](const Descending::Range &range) {
    std::vector<uint32_t> keys;
    for (auto [key, value] : range) {
      keys.push_back(key);
    }
    return keys;
  };

  EXPECT_EQ(collect(map.iter()), (std::vector<uint32_t>{5, 4, 3, 2, 1}));
  EXPECT_EQ(collect(map.range(4, 1)), (std::vector<uint32_t>{4, 3, 2}));
  EXPECT_EQ(collect(map.rangeRev(4, 1)), (std::vector<uint32_t>{2, 3, 4}));
  EXPECT_TRUE(collect(map.range(1, 4)).empty());
  EXPECT_OUTCOME_SUCCESS(map.checkInvariants());
}

/**
 * @given map with keys 10, 20, 30, 40
 * @when values are bound and updated through entries
 * @then new keys take their place in order and present values are modified
 */
TEST_F(TreeMapTest, Entry) {
  Map map{env, prefix("t")};
  fillTens(map);

  map.entry(20).orInsert("x") += "!";
  map.entry(25).orInsert("25");
  map.entry(30).andModify([](std::string &value) { value = "thirty"; });
  map.entry(35).andModify([](std::string &value) { value = "never"; });
  EXPECT_EQ(map.entry(5).orDefault(), "");

  EXPECT_EQ(*map.get(20), "20!");
  EXPECT_EQ(*map.get(30), "thirty");
  EXPECT_FALSE(map.contains(35));
  EXPECT_EQ(keys(map.iter()), (std::vector<uint32_t>{5, 10, 20, 25, 30, 40}));

  EXPECT_EQ(map.entry(10).remove(), "10");
  EXPECT_EQ(keys(map.iter()), (std::vector<uint32_t>{5, 20, 25, 30, 40}));
  EXPECT_OUTCOME_SUCCESS(map.checkInvariants());
}

/**
 * @given persisted map with keys 10, 20, 30, 40
 * @when values are changed through mutable iteration and mutable range
 * @then keys and values views show new values and they are persisted
 */
TEST_F(TreeMapTest, MutableIteration) {
  {
    Map map{env, prefix("t")};
    fillTens(map);
  }
  {
    Map map{env, prefix("t")};
    for (auto [key, value] : map.iterMut()) {
      value += "a";
    }
    for (auto [key, value] : map.rangeMut(20, 40)) {
      value += "b";
    }

    std::vector<uint32_t> keys;
    for (const auto &key : map.keys()) {
      keys.push_back(key);
    }
    std::vector<std::string> values;
    for (const auto &value : map.values()) {
      values.push_back(value);
    }
    EXPECT_EQ(keys, (std::vector<uint32_t>{10, 20, 30, 40}));
    EXPECT_EQ(values,
              (std::vector<std::string>{"10a", "20ab", "30ab", "40a"}));
  }
  Map map{env, prefix("t")};
  EXPECT_EQ(*map.get(20), "20ab");
  EXPECT_EQ(*map.get(40), "40a");
}
