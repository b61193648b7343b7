/// @file compiler.cpp
/// @brief UI graph compiler pipeline

#include <loom/derive/compiler.hpp>
#include <loom/derive/binder.hpp>
#include <loom/derive/classifier.hpp>
#include <loom/derive/emitter.hpp>
#include <loom/derive/flags.hpp>
#include <loom/derive/printer.hpp>
#include <loom/derive/resolver.hpp>

#include <loom/core/log.hpp>

namespace loom_derive {

loom_core::Result<UiGraph> UiCompiler::analyze(const StructDecl& decl) const {
    LOOM_LOG_SCOPE("analyze " + decl.name, "loom.derive");

    UiGraph graph;
    graph.name = decl.name;
    graph.partial = decl.partial;

    FieldClassifier classifier(m_config);
    FlagExpander flags(m_config);

    for (std::size_t i = 0; i < decl.fields.size(); ++i) {
        auto classified = classifier.classify(decl.fields[i], i);
        if (!classified) {
            return classified.error().with_context("struct", decl.name);
        }
        Entity& entity = classified.value();

        switch (entity.role) {
            case Role::Plain:
                break;
            case Role::Control: {
                auto expanded = flags.apply(entity.name, entity.type, entity.params);
                if (!expanded) {
                    return expanded.error().with_context("struct", decl.name);
                }
                qualify_enum_params(m_config, entity.params);
                ControlEntity control;
                static_cast<Entity&>(control) = std::move(entity);
                graph.controls.push_back(std::move(control));
                break;
            }
            case Role::Resource: {
                qualify_enum_params(m_config, entity.params);
                ResourceEntity resource;
                static_cast<Entity&>(resource) = std::move(entity);
                graph.resources.push_back(std::move(resource));
                break;
            }
            case Role::Layout: {
                qualify_enum_params(m_config, entity.params);
                LayoutEntity layout;
                static_cast<Entity&>(layout) = std::move(entity);
                graph.layouts.push_back(std::move(layout));
                break;
            }
            case Role::Partial: {
                PartialEntity partial;
                static_cast<Entity&>(partial) = std::move(entity);
                graph.partials.push_back(std::move(partial));
                break;
            }
        }
    }

    ParentResolver resolver(m_config);
    LayoutBinder binder(m_config);

    auto parents = resolver.assign_parents(graph);
    if (!parents) {
        return parents.error().with_context("struct", decl.name);
    }

    // Binding records children in declaration order, so it runs before the sort
    auto bound = binder.bind(graph);
    if (!bound) {
        return bound.error().with_context("struct", decl.name);
    }

    auto sorted = resolver.sort_by_weight(graph);
    if (!sorted) {
        return sorted.error().with_context("struct", decl.name);
    }

    loom_core::derive_logger()->debug("{}: {} resources, {} controls, {} layouts, {} partials",
                                      graph.name, graph.resources.size(), graph.controls.size(),
                                      graph.layouts.size(), graph.partials.size());
    return graph;
}

loom_core::Result<ConstructionPlan> UiCompiler::compile(const StructDecl& decl) const {
    auto graph = analyze(decl);
    if (!graph) {
        return graph.error();
    }

    CodeEmitter emitter;
    auto plan = emitter.emit(graph.value());
    if (!plan) {
        return plan.error().with_context("struct", decl.name);
    }
    return plan;
}

loom_core::Result<std::string> UiCompiler::generate(const UiDocument& doc) const {
    CodePrinter printer(m_config);
    std::string out;

    for (const auto& partial : doc.partials) {
        auto plan = compile(partial);
        if (!plan) {
            return plan.error();
        }
        out += printer.print(plan.value());
        out += "\n";
    }

    auto plan = compile(doc.root);
    if (!plan) {
        return plan.error();
    }

    for (const auto& step : plan.value().steps) {
        if (step.kind == StepKind::Partial && !doc.find_partial(step.target_type)) {
            loom_core::derive_logger()->warn("{}: partial '{}' uses {} which is not declared in this document",
                                             doc.root.name, step.target_slot, step.target_type);
        }
    }

    out += printer.print(plan.value());
    return out;
}

} // namespace loom_derive
