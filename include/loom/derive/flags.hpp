#pragma once

/// @file flags.hpp
/// @brief Flag expansion and enum qualification of control parameters

#include "config.hpp"
#include "types.hpp"

#include <loom/core/error.hpp>

#include <string>

namespace loom_derive {

/// @brief Expands compressed `flags` values into qualified flag paths
///
/// `VISIBLE | DISABLED`, `VISIBLE` and `"VISIBLE|DISABLED"` on a Button all
/// become `loom::ButtonFlags::VISIBLE | loom::ButtonFlags::DISABLED`. Any other
/// shape is returned unchanged.
class FlagExpander {
public:
    explicit FlagExpander(const DeriveConfig& config) : m_config(config) {}

    [[nodiscard]] loom_core::Result<Expr> expand(const std::string& field,
                                                 const std::string& type,
                                                 const Expr& flags) const;

    /// Expand the first `flags` parameter in place
    [[nodiscard]] loom_core::Result<void> apply(const std::string& field,
                                                const std::string& type,
                                                ParameterList& params) const;

    /// `ButtonFlags` for `Button`
    [[nodiscard]] std::string flags_type(const std::string& type) const {
        return type + m_config.flags_suffix;
    }

private:
    [[nodiscard]] Expr member(const std::string& type, const std::string& symbol) const;

    const DeriveConfig& m_config;
};

/// Prefix path values of the configured enum parameters with the library namespace
void qualify_enum_params(const DeriveConfig& config, ParameterList& params);

} // namespace loom_derive
