/// @file main.cpp
/// @brief Layout Demo
///
/// Builds the UI described in basic.json on the headless window system,
/// prints the computed geometry, resizes the window and fires a few events.

#include <loom/core/core.hpp>
#include <loom/derive/executor.hpp>
#include <loom/derive/frontend.hpp>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <string>
#include <vector>

namespace {

/// Locate basic.json relative to the working directory
std::filesystem::path get_document_path() {
    std::vector<std::filesystem::path> candidates = {
        "basic.json",
        "layout_demo/basic.json",
        "examples/layout_demo/basic.json",
        "../examples/layout_demo/basic.json",
        "../../examples/layout_demo/basic.json",
    };

    for (const auto& path : candidates) {
        if (std::filesystem::exists(path)) {
            return std::filesystem::absolute(path);
        }
    }
    return std::filesystem::current_path() / "basic.json";
}

void print_geometry(const loom_layout::MemoryWindowSystem& windows) {
    for (const auto& handle : windows.creation_order()) {
        const auto* control = windows.find(handle);
        if (!control) {
            continue;
        }
        spdlog::info("  {:<16} {:<10} at ({:>4}, {:>4}) size {}x{}", control->name, control->type,
                     control->position.x, control->position.y, control->size.width, control->size.height);
    }
}

} // anonymous namespace

int main(int argc, char** argv) {
    loom_core::init_logging();

    std::filesystem::path document_path = argc > 1 ? std::filesystem::path(argv[1]) : get_document_path();
    spdlog::info("Loading UI description: {}", document_path.string());

    auto doc = loom_derive::UiDocument::load(document_path);
    if (!doc) {
        LOOM_LOG_ERROR("{}", loom_core::build_error_chain(doc.error()));
        return 1;
    }

    loom_layout::MemoryWindowSystem windows;
    loom_derive::MemoryControlFactory factory(windows);

    loom_derive::HandlerRegistry handlers;
    handlers.add("say_hello", [](const loom_derive::EventArgs& args) {
        spdlog::info("Hello from {} ({})", args.control, args.event);
    });
    handlers.add("say_goodbye", [](const loom_derive::EventArgs&) { spdlog::info("Goodbye"); });
    handlers.add("clear", [](const loom_derive::EventArgs& args) { spdlog::info("{} cleared the status", args.control); });

    loom_derive::PlanExecutor executor(factory, windows, handlers);
    for (const auto& partial : doc.value().partials) {
        executor.register_partial(partial);
    }

    auto ui = executor.build(doc.value().root);
    if (!ui) {
        LOOM_LOG_ERROR("{}", loom_core::build_error_chain(ui.error()));
        return 1;
    }

    spdlog::info("=== {} controls, {} layouts ===", ui.value().handles().size(), ui.value().layout_count());
    print_geometry(windows);

    loom_layout::ControlHandle window = ui.value().handle("window");
    spdlog::info("=== Resized to 640x320 ===");
    windows.resize(window, 640, 320);
    print_geometry(windows);

    spdlog::info("=== Events ===");
    ui.value().dispatch("hello_button", "OnButtonClick");
    ui.value().dispatch("status.clear", "OnButtonClick");
    ui.value().dispatch("window", "OnWindowClose");

    loom_core::shutdown_logging();
    return 0;
}
