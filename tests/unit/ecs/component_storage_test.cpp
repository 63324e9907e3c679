#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "pacsim/ecs/component_storage.hpp"

using namespace pacsim::ecs;

// ── Test component types ────────────────────────────────────────────────────

struct Cell {
    int x = 0;
    int y = 0;
};

struct Label {
    std::string text;
};

// ===========================================================================
// ComponentStorage: Set / Find
// ===========================================================================

TEST(ComponentStorageTest, StartsEmpty) {
    ComponentStorage<Cell> storage;
    EXPECT_TRUE(storage.Empty());
    EXPECT_EQ(storage.Size(), 0u);
    EXPECT_EQ(storage.Find(Entity(0)), nullptr);
}

TEST(ComponentStorageTest, SetAndFind) {
    ComponentStorage<Cell> storage;
    storage.Set(Entity(3), Cell{1, 2});

    ASSERT_TRUE(storage.Has(Entity(3)));
    auto* cell = storage.Find(Entity(3));
    ASSERT_NE(cell, nullptr);
    EXPECT_EQ(cell->x, 1);
    EXPECT_EQ(cell->y, 2);
    EXPECT_EQ(storage.Size(), 1u);
}

TEST(ComponentStorageTest, SetReplacesExisting) {
    ComponentStorage<Label> storage;
    storage.Set(Entity(0), Label{"first"});
    storage.Set(Entity(0), Label{"second"});

    EXPECT_EQ(storage.Size(), 1u);
    EXPECT_EQ(storage.Find(Entity(0))->text, "second");
}

TEST(ComponentStorageTest, SetReturnsStoredReference) {
    ComponentStorage<Cell> storage;
    Cell& stored = storage.Set(Entity(1), Cell{5, 5});
    stored.x = 9;
    EXPECT_EQ(storage.Find(Entity(1))->x, 9);
}

TEST(ComponentStorageTest, InvalidEntityIsNeverPresent) {
    ComponentStorage<Cell> storage;
    EXPECT_FALSE(storage.Has(Entity::invalid()));
    EXPECT_EQ(storage.Find(Entity::invalid()), nullptr);
}

// ===========================================================================
// ComponentStorage: Remove
// ===========================================================================

TEST(ComponentStorageTest, RemoveKeepsOtherEntitiesIntact) {
    ComponentStorage<Cell> storage;
    storage.Set(Entity(0), Cell{0, 0});
    storage.Set(Entity(1), Cell{1, 1});
    storage.Set(Entity(2), Cell{2, 2});

    storage.Remove(Entity(0));

    EXPECT_FALSE(storage.Has(Entity(0)));
    EXPECT_EQ(storage.Size(), 2u);
    EXPECT_EQ(storage.Find(Entity(1))->x, 1);
    EXPECT_EQ(storage.Find(Entity(2))->x, 2);
}

TEST(ComponentStorageTest, RemoveMissingIsNoOp) {
    ComponentStorage<Cell> storage;
    storage.Set(Entity(0), Cell{});
    storage.Remove(Entity(7));
    storage.Remove(Entity::invalid());
    EXPECT_EQ(storage.Size(), 1u);
}

TEST(ComponentStorageTest, ClearDropsEverything) {
    ComponentStorage<Cell> storage;
    storage.Set(Entity(0), Cell{});
    storage.Set(Entity(4), Cell{});

    storage.Clear();
    EXPECT_TRUE(storage.Empty());
    EXPECT_FALSE(storage.Has(Entity(4)));
}

// ===========================================================================
// ComponentStorage: Dense iteration
// ===========================================================================

TEST(ComponentStorageTest, EntityAtMatchesDenseOrder) {
    ComponentStorage<Cell> storage;
    storage.Set(Entity(10), Cell{10, 0});
    storage.Set(Entity(20), Cell{20, 0});

    std::vector<int> xs;
    for (const auto& cell : storage) {
        xs.push_back(cell.x);
    }
    ASSERT_EQ(xs.size(), 2u);
    EXPECT_EQ(storage.EntityAt(0), Entity(10));
    EXPECT_EQ(storage.EntityAt(1), Entity(20));
    EXPECT_EQ(xs[0], 10);
    EXPECT_EQ(xs[1], 20);
}

TEST(ComponentStorageTest, SwapRemoveUpdatesEntityMapping) {
    ComponentStorage<Cell> storage;
    storage.Set(Entity(1), Cell{1, 0});
    storage.Set(Entity(2), Cell{2, 0});
    storage.Set(Entity(3), Cell{3, 0});

    storage.Remove(Entity(1));

    ASSERT_EQ(storage.Size(), 2u);
    EXPECT_EQ(storage.EntityAt(0), Entity(3));
    EXPECT_EQ(storage.Find(Entity(3))->x, 3);
}
