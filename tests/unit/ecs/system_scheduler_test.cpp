#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

#include "pacsim/ecs/system_scheduler.hpp"

using namespace pacsim::ecs;
using pacsim::foundation::ErrorCode;

// ── Test context and systems ────────────────────────────────────────────────

/// Context handed to every system; records execution order.
struct TickLog {
    std::vector<std::string> calls;
};

class RecordingSystem : public ISystem<TickLog> {
public:
    RecordingSystem(std::string name, SystemStage stage) : name_(std::move(name)), stage_(stage) {}

    void Execute(TickLog& log) override { log.calls.push_back(name_); }

    [[nodiscard]] SystemStage GetStage() const override { return stage_; }
    [[nodiscard]] std::string_view GetName() const override { return name_; }

private:
    std::string name_;
    SystemStage stage_;
};

class InputSys : public RecordingSystem {
public:
    InputSys() : RecordingSystem("Input", SystemStage::PreUpdate) {}
};

class AiSys : public RecordingSystem {
public:
    AiSys() : RecordingSystem("AI", SystemStage::Update) {}
};

class MoveSys : public RecordingSystem {
public:
    MoveSys() : RecordingSystem("Move", SystemStage::Update) {}
};

class EatSys : public RecordingSystem {
public:
    EatSys() : RecordingSystem("Eat", SystemStage::Update) {}
};

class CollideSys : public RecordingSystem {
public:
    CollideSys() : RecordingSystem("Collide", SystemStage::PostUpdate) {}
};

// ===========================================================================
// Registration
// ===========================================================================

TEST(SystemSchedulerTest, RegisterReturnsSameInstanceForSameType) {
    SystemScheduler<TickLog> scheduler;
    auto& first = scheduler.Register<AiSys>();
    auto& second = scheduler.Register<AiSys>();

    EXPECT_EQ(&first, &second);
    EXPECT_EQ(scheduler.SystemCount(), 1u);
    EXPECT_EQ(scheduler.GetSystem<AiSys>(), &first);
    EXPECT_EQ(scheduler.GetSystem<MoveSys>(), nullptr);
}

// ===========================================================================
// Ordering
// ===========================================================================

TEST(SystemSchedulerTest, StagesRunPreUpdateUpdatePostUpdate) {
    SystemScheduler<TickLog> scheduler;
    scheduler.Register<CollideSys>();
    scheduler.Register<AiSys>();
    scheduler.Register<InputSys>();

    TickLog log;
    scheduler.Execute(log);

    EXPECT_EQ(log.calls, (std::vector<std::string>{"Input", "AI", "Collide"}));
}

TEST(SystemSchedulerTest, IndependentSystemsKeepRegistrationOrder) {
    SystemScheduler<TickLog> scheduler;
    scheduler.Register<MoveSys>();
    scheduler.Register<AiSys>();
    scheduler.Register<EatSys>();

    TickLog log;
    scheduler.Execute(log);

    EXPECT_EQ(log.calls, (std::vector<std::string>{"Move", "AI", "Eat"}));
}

TEST(SystemSchedulerTest, DependenciesOverrideRegistrationOrder) {
    SystemScheduler<TickLog> scheduler;
    scheduler.Register<EatSys>();
    scheduler.Register<MoveSys>();
    scheduler.Register<AiSys>();
    EXPECT_TRUE((scheduler.AddDependency<AiSys, MoveSys>()));
    EXPECT_TRUE((scheduler.AddDependency<MoveSys, EatSys>()));

    ASSERT_TRUE(scheduler.Build().hasValue());

    TickLog log;
    scheduler.Execute(log);
    EXPECT_EQ(log.calls, (std::vector<std::string>{"AI", "Move", "Eat"}));
}

TEST(SystemSchedulerTest, CrossStageDependencyIsRejected) {
    SystemScheduler<TickLog> scheduler;
    scheduler.Register<InputSys>();
    scheduler.Register<AiSys>();
    EXPECT_FALSE((scheduler.AddDependency<AiSys, InputSys>()));
}

TEST(SystemSchedulerTest, CycleFailsBuildAndRunsNothing) {
    SystemScheduler<TickLog> scheduler;
    scheduler.Register<AiSys>();
    scheduler.Register<MoveSys>();
    scheduler.AddDependency<AiSys, MoveSys>();
    scheduler.AddDependency<MoveSys, AiSys>();

    auto built = scheduler.Build();
    ASSERT_TRUE(built.hasError());
    EXPECT_EQ(built.error().code(), ErrorCode::CircularDependency);
    EXPECT_NE(built.error().message().find("AI"), std::string_view::npos);
    EXPECT_NE(built.error().message().find("Move"), std::string_view::npos);

    TickLog log;
    scheduler.Execute(log);
    EXPECT_TRUE(log.calls.empty());
}

// ===========================================================================
// Introspection
// ===========================================================================

TEST(SystemSchedulerTest, ExecutionOrderIsQueryable) {
    SystemScheduler<TickLog> scheduler;
    scheduler.Register<MoveSys>();
    scheduler.Register<AiSys>();
    scheduler.AddDependency<AiSys, MoveSys>();
    ASSERT_TRUE(scheduler.Build().hasValue());

    const auto& order = scheduler.GetExecutionOrder(SystemStage::Update);
    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], SystemType<AiSys>::Id());
    EXPECT_EQ(order[1], SystemType<MoveSys>::Id());
    EXPECT_TRUE(scheduler.GetExecutionOrder(SystemStage::PostUpdate).empty());
}
