#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "pecs/ecs/entity.hpp"
#include "pecs/ecs/event_bus.hpp"

using namespace pecs::ecs;

namespace {

struct RecordedEvent {
    std::string type;
    EventData data;
};

/// Subscribes to the entity event types and records deliveries in order.
class EventRecorder {
public:
    explicit EventRecorder(EventBus& bus) {
        for (const char* type : {"componentAdded", "componentRemoved", "tagAdded",
                                 "tagRemoved", "entityActivated", "entityDeactivated",
                                 "entityReset", "entityDestroyed"}) {
            std::string name(type);
            bus.On(name, [this, name](const EventData& e, double) {
                events.push_back({name, e});
            });
        }
    }

    std::vector<RecordedEvent> events;
};

/// Counts observer callbacks.
class CountingObserver : public EntityObserver {
public:
    void onComponentAdded(Entity&, std::string_view kind) override {
        added.emplace_back(kind);
    }
    void onComponentRemoved(Entity&, std::string_view kind) override {
        removed.emplace_back(kind);
    }
    void onTagAdded(Entity&, std::string_view tag) override { tags.emplace_back(tag); }
    void onReset(Entity&, const TagSet& oldTags, const ComponentSet& oldComponents) override {
        resetTags = oldTags;
        resetComponents = oldComponents;
    }

    std::vector<std::string> added;
    std::vector<std::string> removed;
    std::vector<std::string> tags;
    TagSet resetTags;
    ComponentSet resetComponents;
};

}  // namespace

// ===========================================================================
// Entity: components and tags
// ===========================================================================

TEST(EntityTest, NewEntityIsActiveAndEmpty) {
    auto e = std::make_shared<Entity>(EntityId(7));
    EXPECT_EQ(e->Id(), EntityId(7));
    EXPECT_TRUE(e->IsActive());
    EXPECT_TRUE(e->Components().empty());
    EXPECT_TRUE(e->Tags().empty());
    EXPECT_FALSE(e->IsAttached());
}

TEST(EntityTest, AddComponentStoresACopy) {
    auto e = std::make_shared<Entity>(EntityId(1));
    ComponentData data{{"x", 5}};
    e->AddComponent("position", data);
    data["x"] = 99;

    ASSERT_TRUE(e->HasComponent("position"));
    EXPECT_DOUBLE_EQ(getNumber(*e->GetComponent("position"), "x"), 5.0);
}

TEST(EntityTest, AddComponentReplacesPreviousRecord) {
    auto e = std::make_shared<Entity>(EntityId(1));
    e->AddComponent("position", {{"x", 1}, {"y", 2}});
    e->AddComponent("position", {{"x", 3}});

    const auto* position = e->GetComponent("position");
    ASSERT_NE(position, nullptr);
    EXPECT_DOUBLE_EQ(getNumber(*position, "x"), 3.0);
    EXPECT_FALSE(hasField(*position, "y"));
}

TEST(EntityTest, GetComponentAllowsInPlaceEdits) {
    auto e = std::make_shared<Entity>(EntityId(1));
    e->AddComponent("physics", {{"velocityX", 0}});
    setField(*e->GetComponent("physics"), "velocityX", 12);
    EXPECT_DOUBLE_EQ(getNumber(*e->GetComponent("physics"), "velocityX"), 12.0);
}

TEST(EntityTest, MissingComponentIsNull) {
    auto e = std::make_shared<Entity>(EntityId(1));
    EXPECT_EQ(e->GetComponent("collider"), nullptr);
    EXPECT_FALSE(e->HasComponent("collider"));
}

TEST(EntityTest, HasComponentsRequiresAll) {
    auto e = std::make_shared<Entity>(EntityId(1));
    e->AddComponent("transform").AddComponent("physics");
    EXPECT_TRUE(e->HasComponents({"transform", "physics"}));
    EXPECT_FALSE(e->HasComponents({"transform", "collider"}));
    EXPECT_TRUE(e->HasComponents({}));
}

TEST(EntityTest, RemoveAbsentComponentIsNoOp) {
    auto e = std::make_shared<Entity>(EntityId(1));
    EXPECT_NO_THROW(e->RemoveComponent("nothing"));
}

TEST(EntityTest, TagsAreASet) {
    auto e = std::make_shared<Entity>(EntityId(1));
    e->AddTag("enemy").AddTag("enemy").AddTag("flying");
    EXPECT_EQ(e->Tags().size(), 2u);
    EXPECT_TRUE(e->HasTag("flying"));

    e->RemoveTag("enemy");
    EXPECT_FALSE(e->HasTag("enemy"));
}

TEST(EntityTest, DetachedEntityEmitsNothing) {
    EventBus bus;
    EventRecorder recorder(bus);
    auto e = std::make_shared<Entity>(EntityId(1));
    e->AddComponent("position").AddTag("player").Deactivate();
    bus.ProcessEvents();
    EXPECT_TRUE(recorder.events.empty());
}

// ===========================================================================
// Entity: events when attached
// ===========================================================================

TEST(EntityEventTest, ComponentAddedCarriesOldAndNewRecord) {
    EventBus bus;
    EventRecorder recorder(bus);
    auto e = std::make_shared<Entity>(EntityId(1));
    e->Attach(&bus, nullptr);

    e->AddComponent("position", {{"x", 1}});
    e->AddComponent("position", {{"x", 2}});
    bus.ProcessEvents();

    ASSERT_EQ(recorder.events.size(), 2u);
    const auto& first = recorder.events[0].data;
    EXPECT_EQ(first.entity, e);
    EXPECT_EQ(first.field("componentType")->asString(), "position");
    EXPECT_TRUE(first.field("oldComponent")->isNull());

    const auto& second = recorder.events[1].data;
    EXPECT_EQ(*second.field("oldComponent"), Value(ComponentData{{"x", 1}}));
    EXPECT_EQ(*second.field("component"), Value(ComponentData{{"x", 2}}));
}

TEST(EntityEventTest, RemoveComponentEmitsOnlyWhenPresent) {
    EventBus bus;
    EventRecorder recorder(bus);
    auto e = std::make_shared<Entity>(EntityId(1));
    e->Attach(&bus, nullptr);

    e->RemoveComponent("position");
    e->AddComponent("position", {{"x", 4}});
    e->RemoveComponent("position");
    bus.ProcessEvents();

    ASSERT_EQ(recorder.events.size(), 2u);
    EXPECT_EQ(recorder.events[1].type, "componentRemoved");
    EXPECT_EQ(*recorder.events[1].data.field("component"), Value(ComponentData{{"x", 4}}));
}

TEST(EntityEventTest, TagEventsOnlyOnChange) {
    EventBus bus;
    EventRecorder recorder(bus);
    auto e = std::make_shared<Entity>(EntityId(1));
    e->Attach(&bus, nullptr);

    e->AddTag("coin").AddTag("coin").RemoveTag("coin").RemoveTag("coin");
    bus.ProcessEvents();

    ASSERT_EQ(recorder.events.size(), 2u);
    EXPECT_EQ(recorder.events[0].type, "tagAdded");
    EXPECT_EQ(recorder.events[1].type, "tagRemoved");
    EXPECT_EQ(recorder.events[1].data.field("tag")->asString(), "coin");
}

TEST(EntityEventTest, ActivationEventsOnlyOnStateChange) {
    EventBus bus;
    EventRecorder recorder(bus);
    auto e = std::make_shared<Entity>(EntityId(1));
    e->Attach(&bus, nullptr);

    e->Activate();
    e->Deactivate();
    e->Deactivate();
    e->Activate();
    bus.ProcessEvents();

    ASSERT_EQ(recorder.events.size(), 2u);
    EXPECT_EQ(recorder.events[0].type, "entityDeactivated");
    EXPECT_EQ(recorder.events[1].type, "entityActivated");
}

TEST(EntityEventTest, DestroyDeactivatesThenAnnounces) {
    EventBus bus;
    EventRecorder recorder(bus);
    auto e = std::make_shared<Entity>(EntityId(1));
    e->Attach(&bus, nullptr);

    e->Destroy();
    EXPECT_FALSE(e->IsActive());
    bus.ProcessEvents();

    ASSERT_EQ(recorder.events.size(), 2u);
    EXPECT_EQ(recorder.events[0].type, "entityDeactivated");
    EXPECT_EQ(recorder.events[1].type, "entityDestroyed");
}

TEST(EntityEventTest, ResetClearsAndReportsPreviousState) {
    EventBus bus;
    EventRecorder recorder(bus);
    CountingObserver observer;
    auto e = std::make_shared<Entity>(EntityId(1));
    e->AddComponent("position", {{"x", 1}}).AddTag("bullet").Deactivate();
    e->Attach(&bus, &observer);

    e->Reset();
    EXPECT_TRUE(e->IsActive());
    EXPECT_TRUE(e->Components().empty());
    EXPECT_TRUE(e->Tags().empty());
    EXPECT_TRUE(observer.resetTags.contains("bullet"));
    EXPECT_TRUE(observer.resetComponents.contains("position"));

    bus.ProcessEvents();
    ASSERT_EQ(recorder.events.size(), 1u);
    EXPECT_EQ(recorder.events[0].type, "entityReset");
    const auto* oldTags = recorder.events[0].data.field("oldTags")->asList();
    ASSERT_NE(oldTags, nullptr);
    ASSERT_EQ(oldTags->size(), 1u);
    EXPECT_EQ((*oldTags)[0].asString(), "bullet");
}

TEST(EntityEventTest, ObserverSeesStructuralChanges) {
    EventBus bus;
    CountingObserver observer;
    auto e = std::make_shared<Entity>(EntityId(1));
    e->Attach(&bus, &observer);

    e->AddComponent("position").RemoveComponent("position").AddTag("a");
    EXPECT_EQ(observer.added, std::vector<std::string>{"position"});
    EXPECT_EQ(observer.removed, std::vector<std::string>{"position"});
    EXPECT_EQ(observer.tags, std::vector<std::string>{"a"});

    e->Detach();
    e->AddComponent("transform");
    EXPECT_EQ(observer.added.size(), 1u);
}

// ===========================================================================
// Entity: capabilities
// ===========================================================================

namespace {

class CountingDrawable : public Drawable {
public:
    void Draw(const Entity&) override { ++draws; }
    int draws = 0;
};

}  // namespace

TEST(EntityCapabilityTest, DrawableSlot) {
    auto e = std::make_shared<Entity>(EntityId(1));
    EXPECT_EQ(e->GetDrawable(), nullptr);

    auto drawable = std::make_shared<CountingDrawable>();
    e->SetDrawable(drawable);
    e->GetDrawable()->Draw(*e);
    EXPECT_EQ(drawable->draws, 1);
    EXPECT_EQ(e->GetCollisionHandler(), nullptr);
}
