#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for arbor_tree module

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace arbor_tree {

// =============================================================================
// Values
// =============================================================================

class Value;
class Sequence;
class Mapping;
struct Opaque;

using SequencePtr = std::shared_ptr<Sequence>;
using MappingPtr = std::shared_ptr<Mapping>;

/// One step of a path: a mapping key or a sequence index
using PathSegment = std::variant<std::string, std::size_t>;

/// Ordered sequence of keys from a root value
using Path = std::vector<PathSegment>;

// =============================================================================
// Drafts
// =============================================================================

class DraftState;
class Draft;
class DraftFactory;

using DraftRef = std::shared_ptr<DraftState>;

// =============================================================================
// Scopes, Finalizer, Patches
// =============================================================================

class Scope;
class ScopeManager;
class Finalizer;
struct Patch;
class PatchEngine;

// =============================================================================
// Entry Point
// =============================================================================

struct ProducerConfig;
class Producer;

} // namespace arbor_tree
