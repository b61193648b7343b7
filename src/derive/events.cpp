/// @file events.cpp
/// @brief Event table annotations

#include <loom/derive/events.hpp>
#include <loom/derive/parameters.hpp>

namespace loom_derive {

loom_core::Result<std::vector<EventBinding>> parse_events(std::string_view payload,
                                                          const std::string& field) {
    ParameterParser parser(payload, field);
    auto entries = parser.parse_entries();
    if (!entries) {
        return entries.error();
    }

    std::vector<EventBinding> bindings;
    for (auto& entry : entries.value()) {
        EventBinding binding;

        if (entry.key.is_path()) {
            binding.event = entry.key.last_segment();
        } else if (entry.key.is(ExprKind::Tuple) && entry.key.items.size() == 2 &&
                   entry.key.items[0].is_path() && entry.key.items[1].is_path()) {
            binding.target = entry.key.items[0].last_segment();
            binding.event = entry.key.items[1].last_segment();
        } else {
            return loom_core::Error(loom_core::DeriveError::parse(
                field, "event key must be `Event` or `(field, Event)`, found `" + entry.key.text + "`"));
        }

        if (entry.value.is(ExprKind::Array)) {
            binding.handlers = std::move(entry.value.items);
        } else {
            binding.handlers.push_back(std::move(entry.value));
        }

        bindings.push_back(std::move(binding));
    }
    return bindings;
}

} // namespace loom_derive
