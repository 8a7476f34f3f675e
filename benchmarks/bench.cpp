#include <archon/archon.hpp>

#include <chrono>
#include <cstdio>
#include <vector>

using namespace archon;

// Simple benchmark components
struct Acc {
    float ax, ay, az;
};
struct Mass {
    float value;
};

static constexpr ComponentId POS = component_id("Pos");
static constexpr ComponentId VEL = component_id("Vel");
static constexpr ComponentId ACC = component_id("Acc");
static constexpr ComponentId MASS = component_id("Mass");
static constexpr ComponentId TAG = component_id("Tag");

// Timer utility
struct Timer {
    using Clock = std::chrono::high_resolution_clock;
    Clock::time_point start;

    Timer() : start(Clock::now()) {}

    double elapsed_ms() const {
        auto end = Clock::now();
        return std::chrono::duration<double, std::milli>(end - start).count();
    }
};

static void bench_entity_creation_empty(size_t n) {
    World w;
    Timer t;
    for (size_t i = 0; i < n; ++i)
        w.create();
    double ms = t.elapsed_ms();
    std::printf("  create (empty)          %zu entities: %.2f ms (%.0f ent/ms)\n", n, ms, n / ms);
}

static void bench_entity_creation_1comp(size_t n) {
    World w;
    Timer t;
    for (size_t i = 0; i < n; ++i)
        w.create_with(with(POS, Vec3{1.0f, 2.0f, 3.0f}));
    double ms = t.elapsed_ms();
    std::printf("  create (1 component)    %zu entities: %.2f ms (%.0f ent/ms)\n", n, ms, n / ms);
}

static void bench_entity_creation_5comp(size_t n) {
    World w;
    Timer t;
    for (size_t i = 0; i < n; ++i)
        w.create_with(with(POS, Vec3{1, 2, 3}), with(VEL, Vec3{4, 5, 6}), with(ACC, Acc{7, 8, 9}),
                      with(MASS, Mass{10}), with(TAG, 0));
    double ms = t.elapsed_ms();
    std::printf("  create (5 components)   %zu entities: %.2f ms (%.0f ent/ms)\n", n, ms, n / ms);
}

static void bench_iteration_2comp(size_t n) {
    World w;
    for (size_t i = 0; i < n; ++i)
        w.create_with(with(POS, Vec3{0, 0, 0}), with(VEL, Vec3{1, 1, 1}));

    Timer t;
    w.for_each_archetype([](Archetype& arch) {
        if (!arch.matches({POS, VEL}))
            return;
        Vec3* p = arch.column_data<Vec3>(POS);
        Vec3* v = arch.column_data<Vec3>(VEL);
        for (size_t i = 0, count = arch.count(); i < count; ++i) {
            p[i].x += v[i].x;
            p[i].y += v[i].y;
            p[i].z += v[i].z;
        }
    });
    double ms = t.elapsed_ms();
    std::printf("  iterate (2 comp)        %zu entities: %.2f ms (%.0f ent/ms)\n", n, ms, n / ms);
}

static void bench_lookup(size_t n) {
    World w;
    std::vector<Entity> entities;
    entities.reserve(n);
    for (size_t i = 0; i < n; ++i)
        entities.push_back(w.create_with(with(POS, Vec3{1, 2, 3})));

    Timer t;
    float sum = 0.0f;
    for (auto e : entities)
        sum += w.get<Vec3>(e, POS).x;
    double ms = t.elapsed_ms();
    std::printf("  get (per entity)        %zu entities: %.2f ms (%.0f ent/ms) [%g]\n", n, ms,
                n / ms, sum);
}

static void bench_migration(size_t n) {
    World w;
    std::vector<Entity> entities;
    entities.reserve(n);
    for (size_t i = 0; i < n; ++i)
        entities.push_back(w.create_with(with(POS, Vec3{1, 2, 3})));

    Timer t;
    for (auto e : entities)
        w.add_component(e, VEL, Vec3{0, 0, 0});
    double ms = t.elapsed_ms();
    std::printf("  migration (add 1 comp)  %zu entities: %.2f ms (%.0f ent/ms)\n", n, ms, n / ms);

    t = Timer();
    for (auto e : entities)
        w.remove_component(e, VEL);
    ms = t.elapsed_ms();
    std::printf("  migration (remove 1)    %zu entities: %.2f ms (%.0f ent/ms)\n", n, ms, n / ms);
}

static void bench_destroy(size_t n) {
    World w;
    std::vector<Entity> entities;
    entities.reserve(n);
    for (size_t i = 0; i < n; ++i)
        entities.push_back(w.create_with(with(POS, Vec3{1, 2, 3}), with(VEL, Vec3{4, 5, 6})));

    Timer t;
    for (auto e : entities)
        w.destroy(e);
    double ms = t.elapsed_ms();
    std::printf("  destroy (2 comp)        %zu entities: %.2f ms (%.0f ent/ms)\n", n, ms, n / ms);
}

int main() {
    constexpr size_t N_SMALL = 100'000;
    constexpr size_t N_LARGE = 1'000'000;

    std::printf("=== archon Benchmarks ===\n\n");

    std::printf("Entity Creation:\n");
    bench_entity_creation_empty(N_SMALL);
    bench_entity_creation_1comp(N_SMALL);
    bench_entity_creation_5comp(N_SMALL);

    std::printf("\nAccess:\n");
    bench_iteration_2comp(N_LARGE);
    bench_lookup(N_SMALL);

    std::printf("\nArchetype Migration:\n");
    bench_migration(N_SMALL);

    std::printf("\nDestruction:\n");
    bench_destroy(N_SMALL);

    std::printf("\nDone.\n");
    return 0;
}
