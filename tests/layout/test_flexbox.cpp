// loom_layout FlexboxLayout tests

#include <catch2/catch_test_macros.hpp>
#include <loom/layout/flexbox.hpp>
#include <loom/layout/memory_window.hpp>

#include <cmath>

using namespace loom_layout;

namespace {

struct FlexFixture {
    MemoryWindowSystem windows;
    ControlHandle window;
    ControlHandle a;
    ControlHandle b;
    ControlHandle c;

    FlexFixture() {
        window = windows.create("Window", "window", {}, {}, Size{330, 100});
        a = windows.create("Button", "a", window);
        b = windows.create("Button", "b", window);
        c = windows.create("Button", "c", window);
    }

    FlexboxLayoutBuilder builder() {
        return FlexboxLayout::builder().window_system(&windows).parent(window);
    }
};

bool is_third(const Dimension& d) {
    return d.unit == Dimension::Unit::Percent && std::fabs(d.value - 100.0f / 3.0f) < 0.001f;
}

} // anonymous namespace

// =============================================================================
// Build-time conveniences
// =============================================================================

TEST_CASE("FlexboxLayout auto-size", "[layout][flexbox]") {
    FlexFixture f;

    SECTION("row children share the width") {
        FlexboxLayout flex;
        REQUIRE(f.builder().child(f.a).child(f.b).child(f.c).build(flex).is_ok());
        REQUIRE(flex.auto_size());
        for (const auto& item : flex.children()) {
            REQUIRE(is_third(item.style().size.width));
            REQUIRE(item.style().size.height == Dimension::automatic());
        }
    }

    SECTION("column children share the height") {
        FlexboxLayout flex;
        REQUIRE(f.builder().flex_direction(FlexDirection::Column).child(f.a).child(f.b).child(f.c).build(flex).is_ok());
        const FlexStyle* style = flex.child_style(f.b);
        REQUIRE(style != nullptr);
        REQUIRE(style->size.width == Dimension::automatic());
        REQUIRE(is_third(style->size.height));
    }

    SECTION("any explicit size turns it off for every child") {
        FlexboxLayout flex;
        REQUIRE(f.builder()
                    .child(f.a)
                    .child(f.b)
                    .child_flex_grow(1.0f)
                    .child(f.c)
                    .build(flex)
                    .is_ok());
        REQUIRE_FALSE(flex.auto_size());
        REQUIRE(flex.child_style(f.a)->size.width.is_undefined());
        REQUIRE(flex.child_style(f.b)->flex_grow == 1.0f);
    }

    SECTION("disabled explicitly") {
        FlexboxLayout flex;
        REQUIRE(f.builder().auto_size(false).child(f.a).build(flex).is_ok());
        REQUIRE_FALSE(flex.auto_size());
        REQUIRE(flex.child_style(f.a)->size.width.is_undefined());
    }
}

TEST_CASE("FlexboxLayout auto-spacing", "[layout][flexbox]") {
    FlexFixture f;

    SECTION("padding and margins default to five points") {
        FlexboxLayout flex;
        REQUIRE(f.builder().child(f.a).child(f.b).build(flex).is_ok());
        REQUIRE(flex.auto_spacing() == std::optional<std::uint32_t>(5));
        REQUIRE(flex.style().padding == DimensionRect::uniform(Dimension::points(5.0f)));
        REQUIRE(flex.child_style(f.a)->margin == DimensionRect::uniform(Dimension::points(5.0f)));
    }

    SECTION("custom value") {
        FlexboxLayout flex;
        REQUIRE(f.builder().auto_spacing(8).child(f.a).build(flex).is_ok());
        REQUIRE(flex.style().padding.left == Dimension::points(8.0f));
    }

    SECTION("explicit padding turns it off") {
        FlexboxLayout flex;
        REQUIRE(f.builder().padding(DimensionRect::uniform(Dimension::points(2.0f))).child(f.a).build(flex).is_ok());
        REQUIRE_FALSE(flex.auto_spacing().has_value());
        REQUIRE(flex.style().padding.top == Dimension::points(2.0f));
        REQUIRE(flex.child_style(f.a)->margin.top.is_undefined());
    }

    SECTION("explicit child margin turns it off") {
        FlexboxLayout flex;
        REQUIRE(f.builder()
                    .child(f.a)
                    .child_margin(DimensionRect::uniform(Dimension::points(1.0f)))
                    .child(f.b)
                    .build(flex)
                    .is_ok());
        REQUIRE_FALSE(flex.auto_spacing().has_value());
        REQUIRE(flex.child_style(f.b)->margin.left.is_undefined());
        REQUIRE(flex.auto_size());
    }
}

// =============================================================================
// Solving
// =============================================================================

TEST_CASE("FlexboxLayout positions", "[layout][flexbox]") {
    FlexFixture f;
    FlexboxLayout flex;
    REQUIRE(f.builder().auto_spacing(std::nullopt).child(f.a).child(f.b).child(f.c).build(flex).is_ok());

    SECTION("equal shares along the row") {
        REQUIRE(f.windows.position(f.a).x == 0);
        REQUIRE(f.windows.position(f.b).x == 110);
        REQUIRE(f.windows.position(f.c).x == 220);
        REQUIRE(f.windows.size(f.b).width == 110);
    }

    SECTION("stretched on the cross axis") {
        REQUIRE(f.windows.size(f.a).height == 100);
        REQUIRE(f.windows.position(f.a).y == 0);
    }

    SECTION("parent resize") {
        f.windows.resize(f.window, 660, 50);
        REQUIRE(f.windows.position(f.c).x == 440);
        REQUIRE(f.windows.size(f.c).height == 50);
    }
}

TEST_CASE("FlexboxLayout explicit styles", "[layout][flexbox]") {
    FlexFixture f;
    FlexboxLayout flex;
    REQUIRE(f.builder()
                .auto_spacing(std::nullopt)
                .child(f.a)
                .child_size({Dimension::points(50.0f), Dimension::points(20.0f)})
                .child(f.b)
                .child_flex_grow(1.0f)
                .build(flex)
                .is_ok());

    SECTION("fixed child keeps its size") {
        REQUIRE(f.windows.size(f.a) == Size{50, 20});
    }

    SECTION("growing child takes the rest") {
        REQUIRE(f.windows.position(f.b).x == 50);
        REQUIRE(f.windows.size(f.b).width == 280);
    }
}

TEST_CASE("FlexboxLayout children", "[layout][flexbox]") {
    FlexFixture f;
    FlexboxLayout flex;
    REQUIRE(f.builder().child(f.a).build(flex).is_ok());

    SECTION("add uses the style as given") {
        FlexStyle style;
        style.size = {Dimension::points(10.0f), Dimension::points(10.0f)};
        style.flex_shrink = 0.0f;
        REQUIRE(flex.add_child(f.b, style).is_ok());
        REQUIRE(flex.has_child(f.b));
        REQUIRE(flex.child_style(f.b)->margin.top.is_undefined());
        REQUIRE(f.windows.size(f.b) == Size{10, 10});
    }

    SECTION("null child") {
        REQUIRE(flex.add_child(ControlHandle{}, FlexStyle{}).is_err());
    }

    SECTION("remove") {
        REQUIRE(flex.remove_child(f.a).is_ok());
        REQUIRE_FALSE(flex.has_child(f.a));
        auto r = flex.remove_child(f.a);
        REQUIRE(r.is_err());
        REQUIRE(r.error().as<loom_core::LayoutError>()->kind == loom_core::LayoutError::Kind::ChildNotFound);
    }

    SECTION("replace a child style") {
        FlexStyle style;
        style.size = {Dimension::points(30.0f), Dimension::points(30.0f)};
        REQUIRE(flex.set_child_style(f.a, style).is_ok());
        REQUIRE(f.windows.size(f.a) == Size{30, 30});
        REQUIRE(flex.set_child_style(f.c, style).is_err());
    }
}

TEST_CASE("FlexboxLayout builder errors", "[layout][flexbox]") {
    FlexFixture f;
    FlexboxLayout flex;

    SECTION("child setter before any child") {
        auto r = f.builder().child_flex_grow(1.0f).child(f.a).build(flex);
        REQUIRE(r.is_err());
        REQUIRE(r.error().as<loom_core::LayoutError>()->kind == loom_core::LayoutError::Kind::InvalidStyle);
        REQUIRE(r.error().message().find("child_flex_grow") != std::string::npos);
    }

    SECTION("null child") {
        REQUIRE(f.builder().child(ControlHandle{}).build(flex).is_err());
        REQUIRE_FALSE(flex.is_bound());
    }

    SECTION("missing parent") {
        auto r = FlexboxLayout::builder().window_system(&f.windows).child(f.a).build(flex);
        REQUIRE(r.is_err());
        REQUIRE(r.error().as<loom_core::LayoutError>()->kind == loom_core::LayoutError::Kind::MissingParent);
    }
}

TEST_CASE("Flexbox style names", "[layout][flexbox]") {
    REQUIRE(parse_flex_direction("Column") == FlexDirection::Column);
    REQUIRE(parse_flex_wrap("Wrap") == FlexWrap::Wrap);
    REQUIRE(parse_justify_content("SpaceBetween") == JustifyContent::SpaceBetween);
    REQUIRE(parse_align_items("Center") == AlignItems::Center);
    REQUIRE(parse_align_self("Auto") == AlignSelf::Auto);
    REQUIRE(parse_position_type("Absolute") == PositionType::Absolute);
    REQUIRE_FALSE(parse_flex_direction("Diagonal").has_value());

    REQUIRE(Dimension::points(50.0f).to_string().find("Points(50") == 0);
    REQUIRE(Dimension::automatic().to_string() == "Auto");
}
