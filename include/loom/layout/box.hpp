#pragma once

/// @file box.hpp
/// @brief Single-axis box layout engine

#include "layout.hpp"

#include <limits>
#include <optional>
#include <vector>

namespace loom_layout {

enum class BoxLayoutType : std::uint8_t {
    Horizontal,  ///< Cells run left to right
    Vertical,    ///< Cells run top to bottom
};

[[nodiscard]] const char* box_layout_type_name(BoxLayoutType type) noexcept;

/// Control placed in a range of box cells
struct BoxLayoutItem {
    ControlHandle control;
    std::uint32_t cell = 0;
    std::uint32_t cell_span = 1;

    BoxLayoutItem() = default;
    BoxLayoutItem(ControlHandle c, std::uint32_t index, std::uint32_t span = 1)
        : control(c), cell(index), cell_span(span) {}
};

// =============================================================================
// BoxLayout
// =============================================================================

/// @brief Grid math on a single axis
///
/// Cells share the main axis the way grid columns do. On the cross axis every
/// child takes the whole area inside the margins and spacing.
class BoxLayout : public Layout {
public:
    BoxLayout() : Layout("BoxLayout") {}
    ~BoxLayout() override;

    [[nodiscard]] static BoxLayoutBuilder builder();

    [[nodiscard]] loom_core::Result<void> add_child(std::uint32_t cell, ControlHandle control);
    [[nodiscard]] loom_core::Result<void> add_child_item(BoxLayoutItem item);
    [[nodiscard]] loom_core::Result<void> remove_child(ControlHandle control);
    [[nodiscard]] loom_core::Result<void> move_child(ControlHandle control, std::uint32_t cell);

    [[nodiscard]] bool has_child(ControlHandle control) const;
    [[nodiscard]] const std::vector<BoxLayoutItem>& children() const noexcept { return m_children; }

    [[nodiscard]] BoxLayoutType layout_type() const noexcept { return m_type; }
    void set_layout_type(BoxLayoutType type);

    [[nodiscard]] const Margin& margin() const noexcept { return m_margin; }
    void set_margin(const Margin& margin);

    [[nodiscard]] std::uint32_t spacing() const noexcept { return m_spacing; }
    void set_spacing(std::uint32_t spacing);

    [[nodiscard]] Size min_size() const noexcept { return m_min_size; }
    void set_min_size(Size size);

    [[nodiscard]] Size max_size() const noexcept { return m_max_size; }
    void set_max_size(Size size);

    [[nodiscard]] std::optional<std::uint32_t> max_cell() const noexcept { return m_max_cell; }
    void set_max_cell(std::optional<std::uint32_t> count);

    [[nodiscard]] std::uint32_t cell_count() const;

protected:
    void do_compute(std::uint32_t width, std::uint32_t height) override;
    [[nodiscard]] std::size_t child_count() const noexcept override { return m_children.size(); }

private:
    friend class BoxLayoutBuilder;

    [[nodiscard]] loom_core::Result<void> check_item(const BoxLayoutItem& item) const;

    std::vector<BoxLayoutItem> m_children;
    BoxLayoutType m_type = BoxLayoutType::Horizontal;
    Margin m_margin{k_default_margin, k_default_margin, k_default_margin, k_default_margin};
    std::uint32_t m_spacing = k_default_spacing;
    Size m_min_size{0, 0};
    Size m_max_size{std::numeric_limits<std::uint32_t>::max(), std::numeric_limits<std::uint32_t>::max()};
    std::optional<std::uint32_t> m_max_cell;
};

// =============================================================================
// BoxLayoutBuilder
// =============================================================================

class BoxLayoutBuilder {
public:
    BoxLayoutBuilder& parent(ControlHandle parent) { m_parent = parent; return *this; }
    BoxLayoutBuilder& window_system(IWindowSystem* system) { m_system = system; return *this; }
    BoxLayoutBuilder& layout_type(BoxLayoutType type) { m_type = type; return *this; }
    BoxLayoutBuilder& margin(const Margin& margin) { m_margin = margin; return *this; }
    BoxLayoutBuilder& spacing(std::uint32_t spacing) { m_spacing = spacing; return *this; }
    BoxLayoutBuilder& min_size(Size size) { m_min_size = size; return *this; }
    BoxLayoutBuilder& max_size(Size size) { m_max_size = size; return *this; }
    BoxLayoutBuilder& max_cell(std::uint32_t count) { m_max_cell = count; return *this; }

    BoxLayoutBuilder& child(std::uint32_t cell, ControlHandle control) {
        m_children.emplace_back(control, cell);
        return *this;
    }

    BoxLayoutBuilder& child_item(BoxLayoutItem item) {
        m_children.push_back(item);
        return *this;
    }

    [[nodiscard]] loom_core::Result<void> build(BoxLayout& layout);

private:
    ControlHandle m_parent;
    IWindowSystem* m_system = nullptr;
    BoxLayoutType m_type = BoxLayoutType::Horizontal;
    Margin m_margin{k_default_margin, k_default_margin, k_default_margin, k_default_margin};
    std::uint32_t m_spacing = k_default_spacing;
    Size m_min_size{0, 0};
    Size m_max_size{std::numeric_limits<std::uint32_t>::max(), std::numeric_limits<std::uint32_t>::max()};
    std::optional<std::uint32_t> m_max_cell;
    std::vector<BoxLayoutItem> m_children;
};

} // namespace loom_layout
