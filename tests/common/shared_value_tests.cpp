#include <gtest/gtest.h>
#include "modpipe/common/shared_value.hpp"
#include "modpipe/common/shared_value.inline.hpp"
#include <string>
#include <thread>

using namespace modpipe;

// =============================================================================
// SharedValue Basic Functionality Tests
// =============================================================================

TEST(SharedValueTests, DefaultConstructed_IsEmpty)
{
    SharedValue value;
    EXPECT_FALSE(value.has_value());
    EXPECT_EQ(value.type(), std::type_index{typeid(void)});
}

TEST(SharedValueTests, Of_StoresValueAndType)
{
    auto value = SharedValue::of(42);
    EXPECT_TRUE(value.has_value());
    EXPECT_TRUE(value.has_type<int>());
    EXPECT_FALSE(value.has_type<double>());
    EXPECT_EQ(value.as<int>(), 42);
}

TEST(SharedValueTests, Make_ConstructsInPlace)
{
    auto value = SharedValue::make<std::string>(5, 'x');
    EXPECT_TRUE(value.has_type<std::string>());
    EXPECT_EQ(value.as<std::string>(), "xxxxx");
}

TEST(SharedValueTests, TypeDecay_ConstIsStripped)
{
    const int x = 7;
    auto value = SharedValue::of(x);
    EXPECT_TRUE(value.has_type<int>());
}

TEST(SharedValueTests, TryAs_ReturnsPointerOnMatch)
{
    auto value = SharedValue::of(std::string("abc"));
    const std::string* ptr = value.try_as<std::string>();
    ASSERT_NE(ptr, nullptr);
    EXPECT_EQ(*ptr, "abc");
}

TEST(SharedValueTests, TryAs_ReturnsNullptrOnMismatchOrEmpty)
{
    auto value = SharedValue::of(42);
    EXPECT_EQ(value.try_as<double>(), nullptr);
    EXPECT_EQ(SharedValue{}.try_as<int>(), nullptr);
}

TEST(SharedValueTests, Get_SharesOwnership)
{
    auto value = SharedValue::of(42);
    auto p1 = value.get<int>();
    auto p2 = value.get<int>();
    ASSERT_NE(p1, nullptr);
    EXPECT_EQ(p1, p2);
    EXPECT_EQ(value.get<double>(), nullptr);
}

TEST(SharedValueTests, Reset_ClearsValue)
{
    auto value = SharedValue::of(42);
    value.reset();
    EXPECT_FALSE(value.has_value());
    EXPECT_EQ(value.type(), std::type_index{typeid(void)});
}

// =============================================================================
// SharedValue Exception Tests
// =============================================================================

TEST(SharedValueTests, As_ThrowsOnEmpty)
{
    SharedValue value;
    EXPECT_THROW((void)value.as<int>(), SharedValueEmptyError);
}

TEST(SharedValueTests, As_ThrowsOnTypeMismatch)
{
    auto value = SharedValue::of(42);
    EXPECT_THROW((void)value.as<double>(), SharedValueTypeError);
}

// =============================================================================
// SharedValue Identity Tests
// =============================================================================

TEST(SharedValueTests, Copy_IsSameObject)
{
    auto value = SharedValue::of(std::string("shared"));
    SharedValue copy = value;
    EXPECT_TRUE(value.same_object(copy));
    EXPECT_EQ(&value.as<std::string>(), &copy.as<std::string>());
}

TEST(SharedValueTests, EqualContent_IsNotSameObject)
{
    auto a = SharedValue::of(1);
    auto b = SharedValue::of(1);
    EXPECT_FALSE(a.same_object(b));
}

TEST(SharedValueTests, EmptyValues_AreNotSameObject)
{
    SharedValue a;
    SharedValue b;
    EXPECT_FALSE(a.same_object(b));
}

TEST(SharedValueTests, ConcurrentReads_SeeSameValue)
{
    auto value = SharedValue::of(std::vector<int>{1, 2, 3});
    std::vector<std::thread> threads;
    std::atomic<int> total{0};
    for (int i = 0; i < 4; ++i)
    {
        threads.emplace_back([value, &total]() {
            for (int n : value.as<std::vector<int>>())
            {
                total += n;
            }
        });
    }
    for (auto& t : threads)
    {
        t.join();
    }
    EXPECT_EQ(total.load(), 24);
}
