#pragma once

/// @file tree.hpp
/// @brief Main include for arbor_tree module
///
/// arbor_tree produces new immutable value trees by letting code mutate a
/// draft of the current one. It provides:
/// - Copy-on-write drafts with structural sharing of untouched subtrees
/// - Scoped draft lifetimes with rollback on failure
/// - Optional freezing of results
/// - Forward and inverse patch generation and replay
/// - JSON conversion for values and patches
///
/// @example Basic usage:
/// @code
/// #include <arbor/tree/tree.hpp>
///
/// using namespace arbor_tree;
///
/// int main() {
///     Producer producer;
///
///     Value state = Value::mapping({
///         {"user", Value::mapping({{"name", "ada"}})},
///         {"todos", Value::empty_sequence()}
///     });
///
///     Value next = producer.produce(state, [](Draft& draft) {
///         draft.child("todos").push_back("write tests");
///     });
///
///     // state["user"] and next["user"] are the same node
/// }
/// @endcode
///
/// @example Recording and replaying patches:
/// @code
/// std::vector<Patch> forward;
/// std::vector<Patch> inverse;
///
/// Value next = producer.produce(state, [](Draft& draft) {
///     draft.child("user").set("name", "grace");
/// }, [&](const std::vector<Patch>& p, const std::vector<Patch>& inv) {
///     forward = p;
///     inverse = inv;
/// });
///
/// Value undone = producer.apply_patches(next, inverse);   // equals state
/// @endcode

#include "fwd.hpp"
#include "value.hpp"
#include "draft_state.hpp"
#include "draft.hpp"
#include "patch.hpp"
#include "scope.hpp"
#include "finalizer.hpp"
#include "config.hpp"
#include "serialization.hpp"
#include "producer.hpp"
