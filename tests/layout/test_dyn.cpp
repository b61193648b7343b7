// loom_layout DynLayout tests

#include <catch2/catch_test_macros.hpp>
#include <loom/layout/dyn.hpp>
#include <loom/layout/memory_window.hpp>

using namespace loom_layout;

TEST_CASE("DynLayout anchoring", "[layout][dyn]") {
    MemoryWindowSystem windows;
    ControlHandle window = windows.create("Window", "window", {}, {}, Size{200, 100});
    ControlHandle ok = windows.create("Button", "ok", window, Point{150, 10}, Size{40, 20});
    ControlHandle edit = windows.create("TextInput", "edit", window, Point{10, 40}, Size{50, 20});
    ControlHandle label = windows.create("Label", "label", window, Point{10, 10}, Size{30, 20});

    DynLayout dyn;
    REQUIRE(DynLayout::builder()
                .window_system(&windows)
                .parent(window)
                .child(ok, DynRatio{100, 0}, DynRatio{0, 0})
                .child(edit, DynRatio{0, 0}, DynRatio{50, 0})
                .child(label, DynRatio{0, 0}, DynRatio{0, 0})
                .build(dyn)
                .is_ok());

    SECTION("build keeps the current geometry") {
        REQUIRE(windows.position(ok) == Point{150, 10});
        REQUIRE(windows.size(edit) == Size{50, 20});
    }

    SECTION("baseline subtracts the scaled parent size") {
        const auto& item = dyn.children()[0];
        REQUIRE(item.pos_init == Point{-50, 10});
        REQUIRE(dyn.children()[1].width_init == -50);
    }

    SECTION("moving child follows the right edge") {
        windows.resize(window, 300, 100);
        REQUIRE(windows.position(ok) == Point{250, 10});
        REQUIRE(windows.size(ok) == Size{40, 20});
    }

    SECTION("stretching child grows by half the width") {
        windows.resize(window, 300, 100);
        REQUIRE(windows.position(edit) == Point{10, 40});
        REQUIRE(windows.size(edit) == Size{100, 20});
    }

    SECTION("zero ratios stay fixed") {
        windows.resize(window, 800, 600);
        REQUIRE(windows.position(label) == Point{10, 10});
        REQUIRE(windows.size(label) == Size{30, 20});
    }

    SECTION("shrinking clamps sizes at zero") {
        dyn.compute(0, 100);
        REQUIRE(windows.position(ok) == Point{-50, 10});
        REQUIRE(windows.size(edit).width == 0);
    }
}

TEST_CASE("DynLayout children", "[layout][dyn]") {
    MemoryWindowSystem windows;
    ControlHandle window = windows.create("Window", "window", {}, {}, Size{200, 100});
    ControlHandle a = windows.create("Button", "a", window, Point{0, 80}, Size{20, 20});

    SECTION("adding needs a bound layout") {
        DynLayout dyn;
        auto r = dyn.add_child(a, DynRatio{0, 100}, DynRatio{});
        REQUIRE(r.is_err());
        REQUIRE(r.error().as<loom_core::LayoutError>()->kind == loom_core::LayoutError::Kind::MissingParent);
    }

    SECTION("children must be live controls") {
        DynLayout dyn;
        auto r = DynLayout::builder().window_system(&windows).parent(window).child(ControlHandle{99}, {}, {}).build(dyn);
        REQUIRE(r.is_err());
        REQUIRE(r.error().as<loom_core::LayoutError>()->kind == loom_core::LayoutError::Kind::BackendFailure);
    }

    SECTION("add, remove and clear") {
        DynLayout dyn;
        REQUIRE(DynLayout::builder().window_system(&windows).parent(window).build(dyn).is_ok());
        REQUIRE(dyn.add_child(a, DynRatio{0, 100}, DynRatio{}).is_ok());
        REQUIRE(dyn.has_child(a));

        windows.resize(window, 200, 150);
        REQUIRE(windows.position(a) == Point{0, 130});

        REQUIRE(dyn.remove_child(a).is_ok());
        REQUIRE(dyn.remove_child(a).is_err());

        REQUIRE(dyn.add_child(a, DynRatio{}, DynRatio{}).is_ok());
        dyn.clear();
        REQUIRE(dyn.children().empty());
    }
}
