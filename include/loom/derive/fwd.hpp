#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for loom_derive module

#include <cstdint>

namespace loom_derive {

// Syntax
struct SourceLocation;
struct Token;
class Lexer;
struct Expr;
struct Param;
class ParameterList;
class ParameterParser;

// Declarations
struct Attribute;
struct FieldDecl;
struct StructDecl;

// Graph
enum class Role : std::uint8_t;
struct ParentRef;
struct Weight;
struct Entity;
struct ControlEntity;
struct ResourceEntity;
struct LayoutEntity;
struct PartialEntity;
struct EventBinding;
struct UiGraph;

// Output
enum class StepKind : std::uint8_t;
struct ConstructionStep;
struct ConstructionPlan;

// Pipeline
struct DeriveConfig;
class UiCompiler;
class PlanExecutor;

} // namespace loom_derive
