#pragma once

/// @file executor.hpp
/// @brief Run-time interpretation of construction plans
///
/// The executor performs the statements a generated builder function would
/// perform: create resources and controls through factories, wire event
/// handlers by name, build layouts with the loom_layout engines and recurse
/// into partials. The first failing step aborts construction.

#include "config.hpp"
#include "plan.hpp"
#include "types.hpp"

#include <loom/core/error.hpp>
#include <loom/layout/layout.hpp>
#include <loom/layout/memory_window.hpp>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace loom_derive {

using loom_layout::ControlHandle;

// =============================================================================
// Factories
// =============================================================================

/// Creates the native control of a Control step
class IControlFactory {
public:
    virtual ~IControlFactory() = default;

    /// @param name Field path of the control, partial fields as `outer.inner`
    [[nodiscard]] virtual loom_core::Result<ControlHandle> create(const std::string& type, const std::string& name,
                                                                  const ParameterList& params,
                                                                  ControlHandle parent) = 0;
};

/// Creates the object of a Resource step
class IResourceFactory {
public:
    virtual ~IResourceFactory() = default;

    [[nodiscard]] virtual loom_core::Result<void> create(const std::string& type, const std::string& name,
                                                         const ParameterList& params) = 0;
};

/// @brief IControlFactory registering controls in a MemoryWindowSystem
///
/// `position: (x, y)` and `size: (w, h)` parameters give the initial
/// geometry.
class MemoryControlFactory : public IControlFactory {
public:
    explicit MemoryControlFactory(loom_layout::MemoryWindowSystem& windows) : m_windows(windows) {}

    [[nodiscard]] loom_core::Result<ControlHandle> create(const std::string& type, const std::string& name,
                                                          const ParameterList& params,
                                                          ControlHandle parent) override;

private:
    loom_layout::MemoryWindowSystem& m_windows;
};

// =============================================================================
// Events
// =============================================================================

struct EventArgs {
    std::string control;
    std::string event;
};

using EventHandler = std::function<void(const EventArgs&)>;

/// Handler callbacks by the name written in `events` annotations
class HandlerRegistry {
public:
    void add(std::string name, EventHandler handler);

    /// Exact name first, then the last `::` segment
    [[nodiscard]] const EventHandler* find(const std::string& name) const;

    [[nodiscard]] bool contains(const std::string& name) const { return find(name) != nullptr; }
    [[nodiscard]] std::size_t size() const noexcept { return m_handlers.size(); }

private:
    std::map<std::string, EventHandler> m_handlers;
};

// =============================================================================
// UiInstance
// =============================================================================

/// Event handler wired to a control
struct BoundEvent {
    std::string control;
    std::string event;
    std::string handler;
    EventHandler callback;
};

/// @brief Controls, resources and layouts created for one UI struct
///
/// Owns the layouts. Controls belong to the window system; the instance only
/// stores their handles.
class UiInstance {
public:
    UiInstance() = default;
    UiInstance(UiInstance&&) = default;
    UiInstance& operator=(UiInstance&&) = default;
    UiInstance(const UiInstance&) = delete;
    UiInstance& operator=(const UiInstance&) = delete;

    /// Handle of a control by field path; null when unknown
    [[nodiscard]] ControlHandle handle(const std::string& name) const;
    [[nodiscard]] bool contains(const std::string& name) const { return m_handles.count(name) != 0; }

    [[nodiscard]] loom_layout::Layout* layout(const std::string& name) const;

    template<typename T>
    [[nodiscard]] T* layout_as(const std::string& name) const {
        return dynamic_cast<T*>(layout(name));
    }

    [[nodiscard]] const std::map<std::string, ControlHandle>& handles() const noexcept { return m_handles; }
    [[nodiscard]] const std::vector<std::string>& resources() const noexcept { return m_resources; }
    [[nodiscard]] const std::vector<BoundEvent>& events() const noexcept { return m_events; }
    [[nodiscard]] std::size_t layout_count() const noexcept { return m_layouts.size(); }

    /// Invoke the handlers bound to `event` on `control`; returns how many ran
    std::size_t dispatch(const std::string& control, const std::string& event) const;

private:
    friend class PlanExecutor;

    std::map<std::string, ControlHandle> m_handles;
    std::vector<std::string> m_resources;
    std::vector<BoundEvent> m_events;
    std::map<std::string, std::unique_ptr<loom_layout::Layout>> m_layouts;
};

// =============================================================================
// PlanExecutor
// =============================================================================

class PlanExecutor {
public:
    PlanExecutor(IControlFactory& controls, loom_layout::IWindowSystem& windows, const HandlerRegistry& handlers,
                 DeriveConfig config = {});

    void set_resource_factory(IResourceFactory* factory) noexcept { m_resources = factory; }

    /// Make a partial struct available to Partial steps naming its type
    void register_partial(StructDecl decl);

    [[nodiscard]] bool has_partial(const std::string& type) const { return m_partials.count(type) != 0; }

    /// Compile `decl` and execute its plan
    [[nodiscard]] loom_core::Result<UiInstance> build(const StructDecl& decl) const;

    /// Execute `plan` into `instance`
    ///
    /// @param partial_parent Handle used for the partial parent sentinel
    /// @param prefix Prepended to every slot name, for nested partials
    [[nodiscard]] loom_core::Result<void> execute(const ConstructionPlan& plan, UiInstance& instance,
                                                  ControlHandle partial_parent = {},
                                                  const std::string& prefix = {}) const;

private:
    [[nodiscard]] loom_core::Result<ControlHandle> resolve_parent(const ConstructionStep& step,
                                                                  const UiInstance& instance,
                                                                  ControlHandle partial_parent,
                                                                  const std::string& prefix) const;

    [[nodiscard]] loom_core::Result<void> run_resource(const ConstructionStep& step, UiInstance& instance,
                                                       const std::string& prefix) const;
    [[nodiscard]] loom_core::Result<void> run_control(const ConstructionStep& step, UiInstance& instance,
                                                      ControlHandle partial_parent, const std::string& prefix) const;
    [[nodiscard]] loom_core::Result<void> run_events(const ConstructionStep& step, UiInstance& instance,
                                                     const std::string& prefix) const;
    [[nodiscard]] loom_core::Result<void> run_layout(const ConstructionStep& step, UiInstance& instance,
                                                     ControlHandle partial_parent, const std::string& prefix) const;
    [[nodiscard]] loom_core::Result<void> run_partial(const ConstructionStep& step, UiInstance& instance,
                                                      ControlHandle partial_parent, const std::string& prefix) const;

    IControlFactory& m_controls;
    IResourceFactory* m_resources = nullptr;
    loom_layout::IWindowSystem& m_windows;
    const HandlerRegistry& m_handlers;
    DeriveConfig m_config;
    std::map<std::string, StructDecl> m_partials;
};

} // namespace loom_derive
