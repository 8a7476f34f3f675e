#undef NDEBUG

#include <archon/archon.hpp>
#include <archon/integration/glm.hpp>

#include <cassert>
#include <cstdio>

using namespace archon;

static constexpr ComponentId POSITION = component_id("Position");
static constexpr ComponentId VELOCITY = component_id("Velocity");

void test_value_casts() {
    Vec3 v{1, 2, 3};
    glm::vec3& g = to_glm(v);
    g.y = 20.0f;
    assert(v.y == 20.0f);
    assert(from_glm(glm::vec3(4, 5, 6)) == (Vec3{4, 5, 6}));
    std::printf("  value casts: OK\n");
}

void test_column_view() {
    World w;
    for (int i = 0; i < 40; ++i)
        w.create_with(with(POSITION, Vec3{float(i), 0, 0}), with(VELOCITY, Vec3{1, 2, 3}));
    Entity still = w.create_with(with(POSITION, Vec3{0, 0, 0}));

    w.for_each_archetype([](Archetype& arch) { integrate(arch, POSITION, VELOCITY, 0.5f); });

    size_t ordinal = w.find_archetype(signature_of(make_component_set({POSITION, VELOCITY})));
    assert(ordinal != NO_ARCHETYPE);
    Archetype& arch = w.archetype(ordinal);
    glm::vec3* pos = column_as_glm(arch, POSITION);
    assert(pos != nullptr);
    for (size_t i = 0; i < arch.count(); ++i) {
        const Vec3& p = arch.read<Vec3>(i, POSITION);
        assert(p.y == 1.0f && p.z == 1.5f);
        assert(pos[i].x == p.x);
    }
    assert(w.get<Vec3>(still, POSITION) == (Vec3{0, 0, 0}));
    assert(column_as_glm(w.archetype(w.archetype_of(still)), VELOCITY) == nullptr);
    std::printf("  column view: OK\n");
}

int main() {
    std::printf("Running archon glm integration tests...\n");
    test_value_casts();
    test_column_view();
    std::printf("All tests passed!\n");
    return 0;
}
