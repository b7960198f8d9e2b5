#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "lx_object_store.hpp"
#include "lx_table.hpp"

using namespace loxvm;

class TableTest : public ::testing::Test {
protected:
    ObjectStore store;
    Table table;

    TableKey key(const std::string& name) {
        return store.key_of(store.intern(name));
    }
};

TEST_F(TableTest, InsertThenGet) {
    EXPECT_TRUE(table.set(key("test"), Value::from_number(1)));

    auto value = table.get(key("test"));
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value->as_number(), 1);
    EXPECT_EQ(table.count(), 1u);
    EXPECT_EQ(table.capacity(), Table::kInitialCapacity);
}

TEST_F(TableTest, GetMissingKeyOnEmptyTable) {
    EXPECT_FALSE(table.get(key("absent")).has_value());
    EXPECT_FALSE(table.remove(key("absent")));
}

TEST_F(TableTest, ReinsertOverwritesAndIsNotNew) {
    EXPECT_TRUE(table.set(key("test"), Value::from_number(1)));
    EXPECT_FALSE(table.set(key("test"), Value::from_number(2)));

    EXPECT_EQ(table.get(key("test"))->as_number(), 2);
    EXPECT_EQ(table.count(), 1u);
}

TEST_F(TableTest, RemoveThenGet) {
    table.set(key("test"), Value::from_bool(true));
    EXPECT_TRUE(table.remove(key("test")));
    EXPECT_FALSE(table.get(key("test")).has_value());
    EXPECT_FALSE(table.remove(key("test")));
}

TEST_F(TableTest, GrowthPreservesEntries) {
    for (int i = 0; i < 128; i++) {
        EXPECT_TRUE(table.set(key(std::to_string(i)), Value::from_number(i)));
    }

    EXPECT_EQ(table.count(), 128u);
    EXPECT_EQ(table.capacity(), 256u);
    for (int i = 0; i < 128; i++) {
        auto value = table.get(key(std::to_string(i)));
        ASSERT_TRUE(value.has_value()) << "key " << i;
        EXPECT_EQ(value->as_number(), i);
    }
}

TEST_F(TableTest, TombstoneKeepsProbingIntact) {
    for (int i = 0; i < 128; i++) {
        table.set(key(std::to_string(i)), Value::from_number(i));
    }

    EXPECT_TRUE(table.remove(key("32")));
    EXPECT_FALSE(table.get(key("32")).has_value());
    // Tombstones still count towards the load
    EXPECT_EQ(table.count(), 128u);

    for (int i = 0; i < 128; i++) {
        if (i == 32) continue;
        ASSERT_TRUE(table.get(key(std::to_string(i))).has_value()) << "key " << i;
    }

    // Reinserting reuses the tombstone without growing the count
    EXPECT_TRUE(table.set(key("32"), Value::from_number(-32)));
    EXPECT_EQ(table.count(), 128u);
    EXPECT_EQ(table.get(key("32"))->as_number(), -32);
}

TEST_F(TableTest, CollidingKeysSurviveRemovalOfEarlierEntry) {
    // Same hash forces the second key to probe past the first
    ObjRef a = store.intern("a");
    ObjRef b = store.intern("b");
    TableKey ka{a, 7};
    TableKey kb{b, 7};

    table.set(ka, Value::from_number(1));
    table.set(kb, Value::from_number(2));
    table.remove(ka);

    auto value = table.get(kb);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value->as_number(), 2);
}

TEST_F(TableTest, AddAllCopiesEveryEntry) {
    Table other;
    table.set(key("x"), Value::from_number(1));
    table.set(key("y"), Value::from_number(2));
    other.set(key("y"), Value::from_number(20));

    other.add_all(table);
    EXPECT_EQ(other.get(key("x"))->as_number(), 1);
    EXPECT_EQ(other.get(key("y"))->as_number(), 2);
}

TEST_F(TableTest, FindStringComparesContent) {
    ObjRef hello = store.intern("hello");
    Table strings;
    strings.set(store.key_of(hello), Value::nil());

    uint32_t hash = ObjectStore::hash_string("hello");
    EXPECT_EQ(strings.find_string(store, "hello", hash), hello);
    EXPECT_TRUE(strings.find_string(store, "world", ObjectStore::hash_string("world")).is_null());
}
