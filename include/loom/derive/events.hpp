#pragma once

/// @file events.hpp
/// @brief Event table annotations

#include "types.hpp"

#include <loom/core/error.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace loom_derive {

/// @brief Parse an event table payload
///
/// `(OnButtonClick: [App::say_hello], OnInit: App::init)` binds handlers to
/// the annotated field. A `(field, EventName)` key binds to an inner field of
/// a partial.
[[nodiscard]] loom_core::Result<std::vector<EventBinding>> parse_events(std::string_view payload,
                                                                        const std::string& field);

} // namespace loom_derive
