/// @file flags.cpp
/// @brief Flag expansion and enum qualification

#include <loom/derive/flags.hpp>

#include <cctype>

namespace loom_derive {

namespace {

std::string trim(const std::string& s) {
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

bool is_identifier(const std::string& s) {
    if (s.empty()) return false;
    if (!std::isalpha(static_cast<unsigned char>(s[0])) && s[0] != '_') return false;
    for (char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
    }
    return true;
}

} // anonymous namespace

// =============================================================================
// FlagExpander
// =============================================================================

Expr FlagExpander::member(const std::string& type, const std::string& symbol) const {
    std::vector<std::string> segments;
    if (!m_config.library_namespace.empty()) {
        segments.push_back(m_config.library_namespace);
    }
    segments.push_back(flags_type(type));
    segments.push_back(symbol);
    return Expr::path(std::move(segments));
}

loom_core::Result<Expr> FlagExpander::expand(const std::string& field,
                                             const std::string& type,
                                             const Expr& flags) const {
    if (flags.is_bare_ident()) {
        return member(type, flags.segments.front());
    }

    if (flags.is(ExprKind::BitOr)) {
        for (const auto& operand : flags.items) {
            if (!operand.is_bare_ident()) {
                return flags;
            }
        }
        std::vector<Expr> expanded;
        for (const auto& operand : flags.items) {
            expanded.push_back(member(type, operand.segments.front()));
        }
        return Expr::bit_or(std::move(expanded));
    }

    if (flags.is(ExprKind::String)) {
        std::vector<Expr> expanded;
        std::size_t start = 0;
        const std::string& value = flags.string_value;
        while (start <= value.size()) {
            std::size_t bar = value.find('|', start);
            if (bar == std::string::npos) bar = value.size();
            std::string symbol = trim(value.substr(start, bar - start));
            if (!is_identifier(symbol)) {
                return loom_core::Error(loom_core::DeriveError::parse(
                    field, "invalid flag '" + symbol + "' in \"" + value + "\""));
            }
            expanded.push_back(member(type, symbol));
            start = bar + 1;
        }
        if (expanded.size() == 1) {
            return std::move(expanded.front());
        }
        return Expr::bit_or(std::move(expanded));
    }

    return flags;
}

loom_core::Result<void> FlagExpander::apply(const std::string& field,
                                            const std::string& type,
                                            ParameterList& params) const {
    Expr* flags = params.find("flags");
    if (!flags) {
        return loom_core::Ok();
    }

    auto expanded = expand(field, type, *flags);
    if (!expanded) {
        return expanded.error();
    }
    *flags = std::move(expanded.value());
    return loom_core::Ok();
}

// =============================================================================
// Enum Qualification
// =============================================================================

void qualify_enum_params(const DeriveConfig& config, ParameterList& params) {
    if (config.library_namespace.empty()) {
        return;
    }

    for (auto& param : params) {
        if (config.qualified_enum_params.count(param.name) == 0) {
            continue;
        }
        Expr& value = param.value;
        if (!value.is_path() || value.segments.front() == config.library_namespace) {
            continue;
        }
        std::vector<std::string> segments;
        segments.reserve(value.segments.size() + 1);
        segments.push_back(config.library_namespace);
        segments.insert(segments.end(), value.segments.begin(), value.segments.end());
        value = Expr::path(std::move(segments));
    }
}

} // namespace loom_derive
