#include <gtest/gtest.h>

#include "pecs/ecs/entity_manager.hpp"
#include "pecs/game/components.hpp"
#include "pecs/game/physics_system.hpp"

using namespace pecs::ecs;
using namespace pecs::game;

namespace {

EntityPtr makeBody(EntityManager& mgr, ComponentData physics, double x = 0.0, double y = 0.0) {
    auto e = mgr.CreateEntity();
    e->AddComponent("transform", {{"x", x}, {"y", y}, {"width", 16}, {"height", 16}});
    e->AddComponent("physics", std::move(physics));
    return e;
}

double field(const EntityPtr& e, std::string_view kind, std::string_view name) {
    return getNumber(*e->GetComponent(kind), name);
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Component views
// ═══════════════════════════════════════════════════════════════════════════

TEST(ComponentViewTest, PhysicsOptionalFieldsStayAbsent) {
    auto physics = Physics::FromData({{"velocityX", 3}});
    EXPECT_DOUBLE_EQ(physics.velocityX, 3.0);
    EXPECT_FALSE(physics.gravity.has_value());
    EXPECT_FALSE(physics.affectedByGravity);

    auto data = physics.ToData();
    EXPECT_FALSE(hasField(data, "gravity"));
    EXPECT_FALSE(hasField(data, "friction"));
    EXPECT_TRUE(hasField(data, "isGrounded"));
}

TEST(ComponentViewTest, WriteToKeepsUnknownFields) {
    ComponentData data{{"x", 1}, {"label", "spawn"}};
    auto transform = Transform::FromData(data);
    transform.x = 9.0;
    transform.WriteTo(data);
    EXPECT_DOUBLE_EQ(getNumber(data, "x"), 9.0);
    EXPECT_EQ(getString(data, "label"), "spawn");
}

TEST(ComponentViewTest, ColliderDefaults) {
    auto collider = Collider::FromData({{"layer", "player"},
                                        {"collidesWithLayers", Value::List{Value("enemy"), Value(3)}}});
    EXPECT_TRUE(collider.isSolid);
    EXPECT_FALSE(collider.isTrigger);
    EXPECT_TRUE(collider.CollidesWith("enemy"));
    // Non-string entries are skipped.
    EXPECT_EQ(collider.collidesWithLayers.size(), 1u);
}

TEST(ComponentViewTest, TypeAndRendererDefaults) {
    EXPECT_EQ(TypeInfo::FromData({}).name, "entity");
    auto renderer = Renderer::FromData({});
    EXPECT_DOUBLE_EQ(renderer.layer, 0.0);
    EXPECT_TRUE(renderer.visible);
}

// ═══════════════════════════════════════════════════════════════════════════
// PhysicsSystem integration
// ═══════════════════════════════════════════════════════════════════════════

TEST(PhysicsSystemTest, IdentityAndPriority) {
    PhysicsSystem physics;
    EXPECT_EQ(physics.GetName(), "PhysicsSystem");
    EXPECT_EQ(physics.GetPriority(), 20);
    EXPECT_EQ(physics.RequiredComponents(), (std::vector<std::string>{"transform", "physics"}));
}

TEST(PhysicsSystemTest, VelocityMovesTransform) {
    EntityManager mgr;
    PhysicsSystem physics;
    auto e = makeBody(mgr, {{"velocityX", 10}, {"velocityY", -4}}, 100.0, 100.0);

    physics.Update(0.5, mgr);
    EXPECT_DOUBLE_EQ(field(e, "transform", "x"), 105.0);
    EXPECT_DOUBLE_EQ(field(e, "transform", "y"), 98.0);
}

TEST(PhysicsSystemTest, GravityOnlyWhenAffected) {
    EntityManager mgr;
    PhysicsSystem physics;
    auto floating = makeBody(mgr, {});
    auto falling = makeBody(mgr, {{"affectedByGravity", true}});

    physics.Update(0.5, mgr);
    EXPECT_DOUBLE_EQ(field(floating, "physics", "velocityY"), 0.0);
    EXPECT_DOUBLE_EQ(field(falling, "physics", "velocityY"), 200.0);
    EXPECT_DOUBLE_EQ(field(falling, "transform", "y"), 100.0);
}

TEST(PhysicsSystemTest, PerEntityGravityOverridesSetting) {
    EntityManager mgr;
    PhysicsSystem physics(PhysicsSettings{.gravity = 1000.0});
    auto e = makeBody(mgr, {{"affectedByGravity", true}, {"gravity", 10}});

    physics.Update(1.0, mgr);
    EXPECT_DOUBLE_EQ(field(e, "physics", "velocityY"), 10.0);
}

TEST(PhysicsSystemTest, TerminalVelocityCapsFalling) {
    EntityManager mgr;
    PhysicsSystem physics;
    auto e = makeBody(mgr, {{"affectedByGravity", true}, {"velocityY", 990}});

    physics.Update(0.1, mgr);
    EXPECT_DOUBLE_EQ(field(e, "physics", "velocityY"), 1000.0);
    EXPECT_DOUBLE_EQ(field(e, "transform", "y"), 100.0);
}

TEST(PhysicsSystemTest, GroundFrictionSlowsAndSnaps) {
    EntityManager mgr;
    PhysicsSystem physics;
    auto sliding = makeBody(mgr, {{"velocityX", 100}, {"friction", 0.5}, {"isGrounded", true}});
    auto creeping = makeBody(mgr, {{"velocityX", 0.15}, {"friction", 0.5}, {"isGrounded", true}});

    physics.Update(1.0, mgr);
    EXPECT_DOUBLE_EQ(field(sliding, "physics", "velocityX"), 50.0);
    EXPECT_DOUBLE_EQ(field(sliding, "transform", "x"), 50.0);
    EXPECT_DOUBLE_EQ(field(creeping, "physics", "velocityX"), 0.0);
}

TEST(PhysicsSystemTest, AirResistanceOnlyWhileAirborne) {
    EntityManager mgr;
    PhysicsSystem physics;
    auto airborne = makeBody(mgr, {{"velocityX", 100}, {"airResistance", 0.1}});
    auto grounded =
        makeBody(mgr, {{"velocityX", 100}, {"airResistance", 0.1}, {"isGrounded", true}});

    physics.Update(1.0, mgr);
    EXPECT_DOUBLE_EQ(field(airborne, "physics", "velocityX"), 90.0);
    EXPECT_DOUBLE_EQ(field(grounded, "physics", "velocityX"), 100.0);
}

TEST(PhysicsSystemTest, GroundedFlagIsClearedEachStep) {
    EntityManager mgr;
    PhysicsSystem physics;
    auto e = makeBody(mgr, {{"isGrounded", true}});

    physics.Update(0.016, mgr);
    EXPECT_FALSE(getBool(*e->GetComponent("physics"), "isGrounded", true));
}

TEST(PhysicsSystemTest, DampeningAppliesAfterMovement) {
    EntityManager mgr;
    PhysicsSystem physics;
    auto e = makeBody(mgr, {{"velocityX", 10}, {"velocityY", 20}, {"dampening", 0.5}});

    physics.Update(1.0, mgr);
    EXPECT_DOUBLE_EQ(field(e, "transform", "x"), 10.0);
    EXPECT_DOUBLE_EQ(field(e, "physics", "velocityX"), 5.0);
    EXPECT_DOUBLE_EQ(field(e, "physics", "velocityY"), 10.0);
}

TEST(PhysicsSystemTest, DefaultDampeningFromSettings) {
    EntityManager mgr;
    PhysicsSettings settings;
    settings.dampening = 0.9;
    PhysicsSystem physics(settings);
    auto e = makeBody(mgr, {{"velocityX", 10}});

    physics.Update(1.0, mgr);
    EXPECT_DOUBLE_EQ(field(e, "physics", "velocityX"), 9.0);
}

TEST(PhysicsSystemTest, DisabledBodyIsUntouched) {
    EntityManager mgr;
    PhysicsSystem physics;
    auto e = makeBody(mgr, {{"velocityX", 10}, {"affectedByGravity", true}, {"disabled", true}});

    physics.Update(1.0, mgr);
    EXPECT_DOUBLE_EQ(field(e, "transform", "x"), 0.0);
    EXPECT_DOUBLE_EQ(field(e, "physics", "velocityY"), 0.0);
}

TEST(PhysicsSystemTest, EntitiesWithoutTransformAreIgnored) {
    EntityManager mgr;
    PhysicsSystem physics;
    auto e = mgr.CreateEntity();
    e->AddComponent("physics", {{"velocityX", 10}, {"affectedByGravity", true}});

    physics.Update(1.0, mgr);
    EXPECT_DOUBLE_EQ(field(e, "physics", "velocityY"), 0.0);
}

TEST(PhysicsSystemTest, UnknownPhysicsFieldsSurvive) {
    EntityManager mgr;
    PhysicsSystem physics;
    auto e = makeBody(mgr, {{"velocityX", 1}, {"mass", 70}});

    physics.Update(1.0, mgr);
    EXPECT_DOUBLE_EQ(field(e, "physics", "mass"), 70.0);
}
