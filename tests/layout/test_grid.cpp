// loom_layout GridLayout tests

#include <catch2/catch_test_macros.hpp>
#include <loom/layout/grid.hpp>
#include <loom/layout/memory_window.hpp>

using namespace loom_layout;

namespace {

struct GridFixture {
    MemoryWindowSystem windows;
    ControlHandle window;
    ControlHandle a;
    ControlHandle b;
    ControlHandle c;

    explicit GridFixture(Size client = {300, 100}) {
        window = windows.create("Window", "window", {}, {}, client);
        a = windows.create("Button", "a", window);
        b = windows.create("Button", "b", window);
        c = windows.create("Button", "c", window);
    }

    GridLayoutBuilder builder() {
        return GridLayout::builder().window_system(&windows).parent(window);
    }
};

/// Two physical pixels per logical unit
class DoubleScaleWindowSystem : public MemoryWindowSystem {
public:
    [[nodiscard]] std::int32_t physical_to_logical(std::int32_t value) const override { return value / 2; }
    [[nodiscard]] std::int32_t logical_to_physical(std::int32_t value) const override { return value * 2; }

    void set_position(ControlHandle handle, std::int32_t x, std::int32_t y) override {
        MemoryWindowSystem::set_position(handle, logical_to_physical(x), logical_to_physical(y));
    }

    void set_size(ControlHandle handle, std::uint32_t width, std::uint32_t height) override {
        MemoryWindowSystem::set_size(handle, static_cast<std::uint32_t>(logical_to_physical(static_cast<std::int32_t>(width))),
                                     static_cast<std::uint32_t>(logical_to_physical(static_cast<std::int32_t>(height))));
    }
};

} // anonymous namespace

// =============================================================================
// Geometry
// =============================================================================

TEST_CASE("GridLayout two columns", "[layout][grid]") {
    GridFixture f;
    GridLayout grid;
    REQUIRE(f.builder().child(0, 0, f.a).child(1, 0, f.b).build(grid).is_ok());

    REQUIRE(grid.column_count() == 2);
    REQUIRE(grid.row_count() == 1);

    SECTION("cells split the client area") {
        REQUIRE(f.windows.position(f.a) == Point{10, 10});
        REQUIRE(f.windows.position(f.b) == Point{155, 10});
        REQUIRE(f.windows.size(f.a) == Size{135, 80});
        REQUIRE(f.windows.size(f.b) == Size{135, 80});
    }

    SECTION("computing again gives the same rectangles") {
        grid.compute(300, 100);
        grid.compute(300, 100);
        REQUIRE(f.windows.position(f.b) == Point{155, 10});
        REQUIRE(f.windows.size(f.b) == Size{135, 80});
        REQUIRE(grid.compute_count() == 3);
    }

    SECTION("children stay inside the margins") {
        for (auto handle : {f.a, f.b}) {
            Point p = f.windows.position(handle);
            Size s = f.windows.size(handle);
            REQUIRE(p.x >= 5);
            REQUIRE(p.y >= 5);
            REQUIRE(static_cast<std::uint32_t>(p.x) + s.width <= 295);
            REQUIRE(static_cast<std::uint32_t>(p.y) + s.height <= 95);
        }
    }

    SECTION("parent resize moves the children") {
        f.windows.resize(f.window, 600, 200);
        REQUIRE(f.windows.position(f.b) == Point{305, 10});
        REQUIRE(f.windows.size(f.b) == Size{285, 180});
    }
}

TEST_CASE("GridLayout on a scaled display", "[layout][grid]") {
    DoubleScaleWindowSystem windows;
    ControlHandle window = windows.create("Window", "window", {}, {}, {400, 200});
    ControlHandle a = windows.create("Button", "a", window);
    ControlHandle b = windows.create("Button", "b", window);

    GridLayout grid;
    REQUIRE(GridLayout::builder().window_system(&windows).parent(window).child(0, 0, a).child(1, 0, b).build(grid).is_ok());

    // Logical client 200x100: cells of 85x80, stored back at twice the size
    SECTION("initial fit works in logical units") {
        REQUIRE(windows.position(b) == Point{210, 20});
        REQUIRE(windows.size(b) == Size{170, 160});
    }

    SECTION("resize notification at the same size changes nothing") {
        windows.resize(window, 400, 200);
        REQUIRE(grid.compute_count() == 2);
        REQUIRE(windows.position(a) == Point{20, 20});
        REQUIRE(windows.position(b) == Point{210, 20});
        REQUIRE(windows.size(b) == Size{170, 160});
    }

    SECTION("fit matches the resize path") {
        windows.resize(window, 600, 200);
        Size resized = windows.size(b);
        grid.fit();
        REQUIRE(windows.size(b) == resized);
    }
}

TEST_CASE("GridLayout remainder and spans", "[layout][grid]") {
    GridFixture f({330, 100});
    GridLayout grid;
    REQUIRE(f.builder()
                .child_item(GridLayoutItem(f.a, 0, 0, 2, 1))
                .child(2, 0, f.b)
                .child(0, 1, f.c)
                .build(grid)
                .is_ok());

    // 330 - 10 - 30 = 290 split 97 / 97 / 96
    SECTION("spanning child covers two cells and the spacing between them") {
        REQUIRE(f.windows.position(f.a) == Point{10, 10});
        REQUIRE(f.windows.size(f.a).width == 204);
    }

    SECTION("last column takes the short cell") {
        REQUIRE(f.windows.position(f.b).x == 224);
        REQUIRE(f.windows.size(f.b).width == 96);
    }

    SECTION("rows split the height") {
        // 100 - 10 - 20 = 70 split 35 / 35
        REQUIRE(f.windows.size(f.a).height == 35);
        REQUIRE(f.windows.position(f.c) == Point{10, 55});
    }
}

TEST_CASE("GridLayout span widths", "[layout][grid]") {
    GridFixture f({310, 100});
    GridLayout grid;
    REQUIRE(f.builder()
                .max_column(3)
                .child_item(GridLayoutItem(f.a, 0, 0, 1, 1))
                .child_item(GridLayoutItem(f.b, 1, 0, 2, 1))
                .build(grid)
                .is_ok());

    // 310 - 10 - 30 = 270 split 90 / 90 / 90
    SECTION("span of one is a single cell") {
        REQUIRE(f.windows.position(f.a) == Point{10, 10});
        REQUIRE(f.windows.size(f.a).width == 90);
    }

    SECTION("span of two adds the spacing between the cells") {
        REQUIRE(f.windows.position(f.b).x == 110);
        REQUIRE(f.windows.size(f.b).width == 190);
    }
}

TEST_CASE("GridLayout undersized parent", "[layout][grid]") {
    GridFixture f({30, 100});
    f.windows.set_position(f.a, 1, 2);
    f.windows.set_size(f.a, 3, 4);

    GridLayout grid;
    REQUIRE(f.builder().child(0, 0, f.a).child(1, 0, f.b).build(grid).is_ok());

    SECTION("exactly the reserved width leaves children untouched") {
        REQUIRE(f.windows.position(f.a) == Point{1, 2});
        REQUIRE(f.windows.size(f.a) == Size{3, 4});
    }

    SECTION("one more pixel places them") {
        grid.compute(32, 100);
        REQUIRE(f.windows.size(f.a).width == 1);
        REQUIRE(f.windows.size(f.b).width == 1);
    }
}

TEST_CASE("GridLayout undersized height", "[layout][grid]") {
    GridFixture f({300, 20});
    f.windows.set_position(f.a, 1, 2);
    f.windows.set_size(f.a, 3, 4);

    GridLayout grid;
    REQUIRE(f.builder().child(0, 0, f.a).build(grid).is_ok());

    SECTION("exactly the reserved height leaves children untouched") {
        REQUIRE(f.windows.position(f.a) == Point{1, 2});
        REQUIRE(f.windows.size(f.a) == Size{3, 4});
    }

    SECTION("smaller than the reserved height is also skipped") {
        grid.compute(300, 5);
        REQUIRE(f.windows.size(f.a) == Size{3, 4});
    }

    SECTION("one more pixel places them") {
        grid.compute(300, 21);
        REQUIRE(f.windows.position(f.a) == Point{10, 10});
        REQUIRE(f.windows.size(f.a) == Size{280, 1});
    }
}

TEST_CASE("GridLayout size bounds", "[layout][grid]") {
    GridFixture f;
    GridLayout grid;
    REQUIRE(f.builder().min_size({400, 100}).max_size({1000, 120}).child(0, 0, f.a).build(grid).is_ok());

    SECTION("width raised to the minimum") {
        REQUIRE(f.windows.size(f.a).width == 380);
    }

    SECTION("height capped at the maximum") {
        grid.compute(500, 300);
        REQUIRE(f.windows.size(f.a) == Size{480, 100});
    }
}

TEST_CASE("GridLayout fixed dimensions", "[layout][grid]") {
    GridFixture f;
    GridLayout grid;
    REQUIRE(f.builder().max_column(4).max_row(2).child(0, 0, f.a).build(grid).is_ok());
    REQUIRE(grid.column_count() == 4);
    REQUIRE(grid.row_count() == 2);

    SECTION("cell beyond max_column") {
        auto r = grid.add_child(4, 0, f.b);
        REQUIRE(r.is_err());
        REQUIRE(r.error().as<loom_core::LayoutError>()->kind == loom_core::LayoutError::Kind::InvalidCell);
        REQUIRE_FALSE(grid.has_child(f.b));
    }

    SECTION("span beyond max_row") {
        REQUIRE(grid.add_child_item(GridLayoutItem(f.b, 0, 1, 1, 2)).is_err());
    }
}

// =============================================================================
// Children
// =============================================================================

TEST_CASE("GridLayout child operations", "[layout][grid]") {
    GridFixture f;
    GridLayout grid;
    REQUIRE(f.builder().child(0, 0, f.a).build(grid).is_ok());

    SECTION("add refits") {
        REQUIRE(grid.add_child(1, 0, f.b).is_ok());
        REQUIRE(grid.has_child(f.b));
        REQUIRE(grid.compute_count() == 2);
        REQUIRE(f.windows.position(f.b) == Point{155, 10});
    }

    SECTION("remove by handle") {
        REQUIRE(grid.add_child(1, 0, f.b).is_ok());
        REQUIRE(grid.remove_child(f.b).is_ok());
        REQUIRE_FALSE(grid.has_child(f.b));
        REQUIRE(grid.column_count() == 1);
        REQUIRE(f.windows.size(f.a) == Size{280, 80});
    }

    SECTION("remove by position") {
        REQUIRE(grid.add_child(1, 0, f.b).is_ok());
        REQUIRE(grid.remove_child_by_pos(0, 0).is_ok());
        REQUIRE_FALSE(grid.has_child(f.a));
        REQUIRE(grid.children().size() == 1);
    }

    SECTION("move") {
        REQUIRE(grid.add_child(1, 0, f.b).is_ok());
        REQUIRE(grid.move_child(f.a, 0, 1).is_ok());
        REQUIRE(grid.row_count() == 2);
        REQUIRE(grid.move_child_by_pos(1, 0, 1, 1).is_ok());
        REQUIRE(grid.children()[1].row == 1);
    }

    SECTION("unknown child") {
        auto r = grid.remove_child(f.c);
        REQUIRE(r.is_err());
        REQUIRE(r.error().as<loom_core::LayoutError>()->kind == loom_core::LayoutError::Kind::ChildNotFound);
        REQUIRE(grid.remove_child_by_pos(3, 3).is_err());
        REQUIRE(grid.move_child(f.c, 0, 0).is_err());
        REQUIRE(grid.move_child_by_pos(5, 5, 0, 0).is_err());
    }

    SECTION("setters refit") {
        grid.set_margin({0, 0, 0, 0});
        grid.set_spacing(0);
        REQUIRE(f.windows.position(f.a) == Point{0, 0});
        REQUIRE(f.windows.size(f.a) == Size{300, 100});
    }
}

TEST_CASE("GridLayout builder validation", "[layout][grid]") {
    GridFixture f;
    GridLayout grid;

    SECTION("zero span") {
        auto r = f.builder().child_item(GridLayoutItem(f.a, 0, 0, 0, 1)).build(grid);
        REQUIRE(r.is_err());
        REQUIRE_FALSE(grid.is_bound());
    }

    SECTION("null control") {
        REQUIRE(f.builder().child(0, 0, ControlHandle{}).build(grid).is_err());
    }

    SECTION("cell outside max_column") {
        REQUIRE(f.builder().max_column(1).child(1, 0, f.a).build(grid).is_err());
    }

    SECTION("empty grid binds without moving anything") {
        REQUIRE(f.builder().build(grid).is_ok());
        REQUIRE(grid.is_bound());
        REQUIRE(f.windows.geometry_updates() == 0);
    }
}
