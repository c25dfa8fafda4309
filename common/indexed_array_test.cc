#include "common/indexed_array.hh"

#include <vector>

#include "gtest/gtest.h"

namespace rps {
namespace {
WISE_ENUM_CLASS(TestEnum, VALUE1, VALUE2, VALUE3);
}  // namespace

TEST(IndexedArrayTest, list_initialization_test) {
    // Setup
    const IndexedArray<int, TestEnum> idx_arr{{
        {TestEnum::VALUE1, 10},
        {TestEnum::VALUE2, 20},
        {TestEnum::VALUE3, 30},
    }};

    // Action + Verification
    EXPECT_EQ(idx_arr[TestEnum::VALUE1], 10);
    EXPECT_EQ(idx_arr[TestEnum::VALUE2], 20);
    EXPECT_EQ(idx_arr[TestEnum::VALUE3], 30);
}

TEST(IndexedArrayTest, value_initialization_test) {
    // Setup
    const IndexedArray<int, TestEnum> idx_arr{100};

    // Action + Verification
    EXPECT_EQ(idx_arr.size(), 3);
    EXPECT_EQ(idx_arr[TestEnum::VALUE1], 100);
    EXPECT_EQ(idx_arr[TestEnum::VALUE2], 100);
    EXPECT_EQ(idx_arr[TestEnum::VALUE3], 100);
}

TEST(IndexedArrayTest, counting_and_iteration_follow_enum_order) {
    // Setup
    IndexedArray<int, TestEnum> counts{0};
    for (const auto value : {TestEnum::VALUE3, TestEnum::VALUE1, TestEnum::VALUE3}) {
        counts[value]++;
    }

    // Action
    std::vector<TestEnum> keys;
    std::vector<int> values;
    for (const auto &[key, value] : counts) {
        keys.push_back(key);
        values.push_back(value);
    }

    // Verification
    EXPECT_EQ(keys, (std::vector{TestEnum::VALUE1, TestEnum::VALUE2, TestEnum::VALUE3}));
    EXPECT_EQ(values, (std::vector{1, 0, 2}));
}
}  // namespace rps
