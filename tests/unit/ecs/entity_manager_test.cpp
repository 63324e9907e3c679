#include <gtest/gtest.h>

#include <algorithm>
#include <unordered_set>
#include <vector>

#include "pacsim/ecs/entity_manager.hpp"

using namespace pacsim::ecs;

// ===========================================================================
// EntityManager: Basic creation
// ===========================================================================

TEST(EntityManagerTest, CreateReturnsValidEntity) {
    EntityManager mgr;
    Entity e = mgr.Create();
    EXPECT_TRUE(e.isValid());
    EXPECT_TRUE(mgr.IsAlive(e));
}

TEST(EntityManagerTest, CreateReturnsUniqueEntities) {
    EntityManager mgr;
    Entity a = mgr.Create();
    Entity b = mgr.Create();
    Entity c = mgr.Create();

    EXPECT_NE(a, b);
    EXPECT_NE(b, c);
    EXPECT_NE(a, c);
}

TEST(EntityManagerTest, CreateIncrementsCount) {
    EntityManager mgr;
    EXPECT_EQ(mgr.Count(), 0u);

    [[maybe_unused]] auto e1 = mgr.Create();
    EXPECT_EQ(mgr.Count(), 1u);

    [[maybe_unused]] auto e2 = mgr.Create();
    EXPECT_EQ(mgr.Count(), 2u);
}

TEST(EntityManagerTest, IdentifiersAreSequentialFromZero) {
    EntityManager mgr;
    for (uint32_t i = 0; i < 10; ++i) {
        EXPECT_EQ(mgr.Create().id(), i);
    }
}

// ===========================================================================
// EntityManager: Destruction
// ===========================================================================

TEST(EntityManagerTest, DestroyMarksEntityDead) {
    EntityManager mgr;
    Entity e = mgr.Create();

    EXPECT_TRUE(mgr.Destroy(e));
    EXPECT_FALSE(mgr.IsAlive(e));
    EXPECT_EQ(mgr.Count(), 0u);
}

TEST(EntityManagerTest, DoubleDestroyIsNoOp) {
    EntityManager mgr;
    Entity e = mgr.Create();
    [[maybe_unused]] auto other = mgr.Create();

    EXPECT_TRUE(mgr.Destroy(e));
    EXPECT_FALSE(mgr.Destroy(e));
    EXPECT_EQ(mgr.Count(), 1u);
}

TEST(EntityManagerTest, DestroyUnknownEntityIsNoOp) {
    EntityManager mgr;
    [[maybe_unused]] auto e = mgr.Create();

    EXPECT_FALSE(mgr.Destroy(Entity(999)));
    EXPECT_FALSE(mgr.Destroy(Entity::invalid()));
    EXPECT_EQ(mgr.Count(), 1u);
}

TEST(EntityManagerTest, IdentifiersAreNeverReused) {
    EntityManager mgr;
    Entity a = mgr.Create();
    mgr.Destroy(a);

    Entity b = mgr.Create();
    EXPECT_NE(a, b);
    EXPECT_FALSE(mgr.IsAlive(a));
    EXPECT_TRUE(mgr.IsAlive(b));
}

TEST(EntityManagerTest, InvalidEntityIsNeverAlive) {
    EntityManager mgr;
    EXPECT_FALSE(mgr.IsAlive(Entity::invalid()));
    EXPECT_FALSE(Entity{}.isValid());
}

// ===========================================================================
// EntityManager: Enumeration and clear
// ===========================================================================

TEST(EntityManagerTest, AllEntitiesListsLiveInCreationOrder) {
    EntityManager mgr;
    Entity a = mgr.Create();
    Entity b = mgr.Create();
    Entity c = mgr.Create();
    mgr.Destroy(b);

    auto all = mgr.AllEntities();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0], a);
    EXPECT_EQ(all[1], c);
}

TEST(EntityManagerTest, ClearKillsEverythingButKeepsCounter) {
    EntityManager mgr;
    Entity a = mgr.Create();
    Entity b = mgr.Create();

    mgr.Clear();
    EXPECT_EQ(mgr.Count(), 0u);
    EXPECT_FALSE(mgr.IsAlive(a));
    EXPECT_FALSE(mgr.IsAlive(b));
    EXPECT_TRUE(mgr.AllEntities().empty());

    Entity c = mgr.Create();
    EXPECT_EQ(c.id(), 2u);
}

TEST(EntityManagerTest, EntitiesHashDistinctly) {
    EntityManager mgr;
    std::unordered_set<Entity> seen;
    for (int i = 0; i < 100; ++i) {
        seen.insert(mgr.Create());
    }
    EXPECT_EQ(seen.size(), 100u);
}
