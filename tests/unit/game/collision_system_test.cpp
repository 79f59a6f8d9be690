#include <gtest/gtest.h>

#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "pecs/ecs/entity_manager.hpp"
#include "pecs/ecs/event_bus.hpp"
#include "pecs/game/collision_system.hpp"

using namespace pecs::ecs;
using namespace pecs::game;

namespace {

struct BoxSpec {
    double x = 0.0;
    double y = 0.0;
    double w = 10.0;
    double h = 10.0;
    std::string layer = "default";
    std::vector<std::string> collidesWith = {"default"};
};

EntityPtr makeBox(EntityManager& mgr, const BoxSpec& spec) {
    auto e = mgr.CreateEntity();
    e->AddComponent("transform", Transform{spec.x, spec.y, spec.w, spec.h}.ToData());
    Collider collider;
    collider.layer = spec.layer;
    collider.collidesWithLayers = spec.collidesWith;
    e->AddComponent("collider", collider.ToData());
    return e;
}

/// Records every contact reported to an entity.
class RecordingHandler : public CollisionHandler {
public:
    void OnCollision(Entity& self, Entity& other, const CollisionData& data) override {
        contacts.push_back({self.Id(), other.Id(), data});
    }

    struct Contact {
        EntityId self;
        EntityId other;
        CollisionData data;
    };
    std::vector<Contact> contacts;
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Narrow phase
// ═══════════════════════════════════════════════════════════════════════════

TEST(ComputeCollisionTest, LandingOnAPlatform) {
    const Aabb player{0.0, 0.0, 32.0, 48.0};
    const Aabb platform{0.0, 40.0, 100.0, 20.0};

    auto contact = ComputeCollision(player, platform);
    ASSERT_TRUE(contact.has_value());
    EXPECT_EQ(contact->normal, Vector2(0.0, -1.0));
    EXPECT_DOUBLE_EQ(contact->penetration.x, 0.0);
    EXPECT_DOUBLE_EQ(contact->penetration.y, -8.0);
    EXPECT_EQ(contact->point, Vector2(32.0, 48.0));
    EXPECT_TRUE(contact->fromAbove);
}

TEST(ComputeCollisionTest, FlippedSeesTheOtherSide) {
    auto contact = ComputeCollision({0.0, 0.0, 32.0, 48.0}, {0.0, 40.0, 100.0, 20.0});
    ASSERT_TRUE(contact.has_value());

    auto flipped = contact->Flipped();
    EXPECT_EQ(flipped.normal, Vector2(0.0, 1.0));
    EXPECT_DOUBLE_EQ(flipped.penetration.y, 8.0);
    EXPECT_EQ(flipped.point, contact->point);
    EXPECT_FALSE(flipped.fromAbove);
}

TEST(ComputeCollisionTest, HorizontalContact) {
    auto contact = ComputeCollision({0.0, 0.0, 10.0, 10.0}, {8.0, 0.0, 10.0, 10.0});
    ASSERT_TRUE(contact.has_value());
    EXPECT_EQ(contact->normal, Vector2(-1.0, 0.0));
    EXPECT_DOUBLE_EQ(contact->penetration.x, -2.0);
    EXPECT_FALSE(contact->fromAbove);
}

TEST(ComputeCollisionTest, TouchingEdgesDoNotCollide) {
    EXPECT_FALSE(ComputeCollision({0.0, 0.0, 10.0, 10.0}, {10.0, 0.0, 10.0, 10.0}).has_value());
    EXPECT_FALSE(ComputeCollision({0.0, 0.0, 10.0, 10.0}, {0.0, 10.0, 10.0, 10.0}).has_value());
}

TEST(ComputeCollisionTest, EqualPenetrationResolvesVertically) {
    auto contact = ComputeCollision({0.0, 0.0, 10.0, 10.0}, {5.0, 5.0, 10.0, 10.0});
    ASSERT_TRUE(contact.has_value());
    EXPECT_DOUBLE_EQ(contact->normal.x, 0.0);
    EXPECT_DOUBLE_EQ(contact->normal.y, -1.0);
}

TEST(ColliderBoxTest, FallsBackToTransformSizeAndAppliesOffset) {
    Transform transform{100.0, 50.0, 32.0, 16.0};
    Collider collider;
    collider.offsetX = 4.0;
    collider.offsetY = -2.0;

    auto box = ColliderBox(transform, collider);
    EXPECT_DOUBLE_EQ(box.x, 104.0);
    EXPECT_DOUBLE_EQ(box.y, 48.0);
    EXPECT_DOUBLE_EQ(box.width, 32.0);
    EXPECT_DOUBLE_EQ(box.height, 16.0);

    collider.width = 8.0;
    EXPECT_DOUBLE_EQ(ColliderBox(transform, collider).width, 8.0);
}

TEST(LayerTest, EitherSideMayListTheOther) {
    Collider player;
    player.layer = "player";
    player.collidesWithLayers = {"coin"};
    Collider coin;
    coin.layer = "coin";
    Collider wall;
    wall.layer = "wall";

    EXPECT_TRUE(LayersCompatible(player, coin));
    EXPECT_TRUE(LayersCompatible(coin, player));
    EXPECT_FALSE(LayersCompatible(coin, wall));
}

// ═══════════════════════════════════════════════════════════════════════════
// CollisionSystem dispatch
// ═══════════════════════════════════════════════════════════════════════════

class CollisionSystemTest : public ::testing::Test {
protected:
    EventBus bus_;
    EntityManager mgr_{&bus_};
    CollisionSystem collisions_;
};

TEST_F(CollisionSystemTest, IdentityAndPriority) {
    EXPECT_EQ(collisions_.GetName(), "CollisionSystem");
    EXPECT_EQ(collisions_.GetPriority(), 10);
}

TEST_F(CollisionSystemTest, EmitsThreeEventNamesPerContact) {
    auto player = makeBox(mgr_, {0.0, 0.0});
    player->AddComponent("type", {{"name", "player"}});
    auto coin = makeBox(mgr_, {5.0, 5.0});
    coin->AddComponent("type", {{"name", "coin"}});

    std::vector<std::string> seen;
    for (const char* name : {"collision", "collision:player", "collision:player:coin",
                             "collision:coin"}) {
        std::string type(name);
        bus_.On(type, [&seen, type, player, coin](const EventData& e, double) {
            seen.push_back(type);
            EXPECT_EQ(e.entity, player);
            EXPECT_EQ(e.other, coin);
            EXPECT_EQ(e.field("typeB")->asString(), "coin");
            ASSERT_NE(e.contextAs<CollisionData>(), nullptr);
        });
    }

    collisions_.Update(0.016, mgr_);
    EXPECT_TRUE(seen.empty());
    bus_.ProcessEvents();
    EXPECT_EQ(seen, (std::vector<std::string>{"collision", "collision:player",
                                              "collision:player:coin"}));
}

TEST_F(CollisionSystemTest, UntypedEntitiesUseEntityName) {
    makeBox(mgr_, {0.0, 0.0});
    makeBox(mgr_, {5.0, 5.0});

    int hits = 0;
    bus_.On("collision:entity:entity", [&](const EventData&, double) { ++hits; });
    collisions_.Update(0.016, mgr_);
    bus_.ProcessEvents();
    EXPECT_EQ(hits, 1);
}

TEST_F(CollisionSystemTest, HandlersReceiveOwnPerspective) {
    auto player = makeBox(mgr_, {0.0, 0.0, 32.0, 48.0});
    auto platform = makeBox(mgr_, {0.0, 40.0, 100.0, 20.0});
    auto playerHandler = std::make_shared<RecordingHandler>();
    auto platformHandler = std::make_shared<RecordingHandler>();
    player->SetCollisionHandler(playerHandler);
    platform->SetCollisionHandler(platformHandler);

    collisions_.Update(0.016, mgr_);

    ASSERT_EQ(playerHandler->contacts.size(), 1u);
    EXPECT_EQ(playerHandler->contacts[0].other, platform->Id());
    EXPECT_TRUE(playerHandler->contacts[0].data.fromAbove);

    ASSERT_EQ(platformHandler->contacts.size(), 1u);
    EXPECT_EQ(platformHandler->contacts[0].other, player->Id());
    EXPECT_EQ(platformHandler->contacts[0].data.normal, Vector2(0.0, 1.0));
    EXPECT_FALSE(platformHandler->contacts[0].data.fromAbove);
}

TEST_F(CollisionSystemTest, IncompatibleLayersAreSkipped) {
    makeBox(mgr_, {0.0, 0.0, 10.0, 10.0, "ghost", {}});
    makeBox(mgr_, {5.0, 5.0, 10.0, 10.0, "wall", {}});

    collisions_.Update(0.016, mgr_);
    EXPECT_EQ(collisions_.LastStats().pairsTested, 1u);
    EXPECT_EQ(collisions_.LastStats().contacts, 0u);
}

TEST_F(CollisionSystemTest, PersistentOverlapReportsEveryFrame) {
    makeBox(mgr_, {0.0, 0.0});
    makeBox(mgr_, {5.0, 5.0});

    int hits = 0;
    bus_.On("collision", [&](const EventData&, double) { ++hits; });
    for (int frame = 0; frame < 3; ++frame) {
        collisions_.Update(0.016, mgr_);
        bus_.ProcessEvents();
    }
    EXPECT_EQ(hits, 3);
}

TEST_F(CollisionSystemTest, HandlerDeactivatingOtherStopsLaterPairs) {
    auto a = makeBox(mgr_, {0.0, 0.0});
    auto b = makeBox(mgr_, {2.0, 2.0});
    auto c = makeBox(mgr_, {4.0, 4.0});

    class Consume : public CollisionHandler {
    public:
        void OnCollision(Entity&, Entity& other, const CollisionData&) override {
            other.Deactivate();
        }
    };
    a->SetCollisionHandler(std::make_shared<Consume>());

    collisions_.Update(0.016, mgr_);
    // (a, b) consumes b; (a, c) consumes c; (b, c) is skipped.
    EXPECT_FALSE(b->IsActive());
    EXPECT_FALSE(c->IsActive());
    EXPECT_EQ(collisions_.LastStats().contacts, 2u);
}

// ═══════════════════════════════════════════════════════════════════════════
// Grounding
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(CollisionSystemTest, RestingOnSolidGrounds) {
    auto player = makeBox(mgr_, {0.0, 0.0, 32.0, 48.0});
    player->AddComponent("physics", {{"velocityY", 120}});
    makeBox(mgr_, {0.0, 40.0, 100.0, 20.0});

    collisions_.Update(0.016, mgr_);
    const auto* physics = player->GetComponent("physics");
    EXPECT_TRUE(getBool(*physics, "isGrounded"));
    EXPECT_DOUBLE_EQ(getNumber(*physics, "velocityY"), 0.0);
}

TEST_F(CollisionSystemTest, UpwardVelocityIsKeptWhenGrounded) {
    auto player = makeBox(mgr_, {0.0, 0.0, 32.0, 48.0});
    player->AddComponent("physics", {{"velocityY", -50}});
    makeBox(mgr_, {0.0, 40.0, 100.0, 20.0});

    collisions_.Update(0.016, mgr_);
    EXPECT_DOUBLE_EQ(getNumber(*player->GetComponent("physics"), "velocityY"), -50.0);
}

TEST_F(CollisionSystemTest, TriggersAndNonSolidsDoNotGround) {
    auto player = makeBox(mgr_, {0.0, 0.0, 32.0, 48.0});
    player->AddComponent("physics", {{"velocityY", 10}});
    auto zone = makeBox(mgr_, {0.0, 40.0, 100.0, 20.0});
    setField(*zone->GetComponent("collider"), "isTrigger", true);

    collisions_.Update(0.016, mgr_);
    EXPECT_FALSE(getBool(*player->GetComponent("physics"), "isGrounded"));

    setField(*zone->GetComponent("collider"), "isTrigger", false);
    setField(*zone->GetComponent("collider"), "isSolid", false);
    collisions_.Update(0.016, mgr_);
    EXPECT_FALSE(getBool(*player->GetComponent("physics"), "isGrounded"));
}

TEST_F(CollisionSystemTest, GroundingCanBeDisabled) {
    collisions_.SetSettings(CollisionSettings{.resolveGrounding = false});
    auto player = makeBox(mgr_, {0.0, 0.0, 32.0, 48.0});
    player->AddComponent("physics", {{"velocityY", 10}});
    makeBox(mgr_, {0.0, 40.0, 100.0, 20.0});

    collisions_.Update(0.016, mgr_);
    EXPECT_FALSE(getBool(*player->GetComponent("physics"), "isGrounded"));
}

// ═══════════════════════════════════════════════════════════════════════════
// Broad phase
// ═══════════════════════════════════════════════════════════════════════════

TEST(CollisionBroadPhaseTest, GridMatchesBruteForce) {
    std::mt19937 rng(1234);
    std::uniform_real_distribution<double> pos(0.0, 900.0);
    std::uniform_real_distribution<double> size(4.0, 90.0);

    std::vector<BoxSpec> specs;
    for (int i = 0; i < 120; ++i) {
        specs.push_back({pos(rng), pos(rng), size(rng), size(rng)});
    }

    auto collect = [&specs](bool useGrid) {
        EventBus bus;
        EntityManager mgr(&bus);
        for (const auto& spec : specs) {
            makeBox(mgr, spec);
        }
        CollisionSettings settings;
        settings.useSpatialGrid = useGrid;
        settings.cellSize = 50.0;
        settings.bounds = {0.0, 0.0, 1000.0, 1000.0};
        CollisionSystem system(settings);

        std::vector<std::pair<uint64_t, uint64_t>> contacts;
        bus.On("collision", [&](const EventData& e, double) {
            contacts.emplace_back(e.entity->Id().value(), e.other->Id().value());
        });
        system.Update(0.016, mgr);
        bus.ProcessEvents();
        return contacts;
    };

    const auto brute = collect(false);
    const auto grid = collect(true);
    EXPECT_FALSE(brute.empty());
    EXPECT_EQ(grid, brute);
}

TEST(CollisionBroadPhaseTest, InvalidGridFallsBackToAllPairs) {
    EventBus bus;
    EntityManager mgr(&bus);
    makeBox(mgr, {0.0, 0.0});
    makeBox(mgr, {5.0, 5.0});

    CollisionSettings settings;
    settings.useSpatialGrid = true;
    settings.cellSize = 0.0;
    CollisionSystem system(settings);
    system.Update(0.016, mgr);
    EXPECT_EQ(system.LastStats().contacts, 1u);
}
