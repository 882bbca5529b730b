/// @file patch.cpp
/// @brief Patch generation and application

#include <arbor/tree/patch.hpp>
#include <arbor/tree/draft.hpp>
#include <arbor/tree/draft_state.hpp>
#include <arbor/core/error.hpp>
#include <algorithm>

namespace arbor_tree {

using arbor_core::PatchError;

// =============================================================================
// PatchOp
// =============================================================================

const char* patch_op_name(PatchOp op) noexcept {
    switch (op) {
        case PatchOp::Add: return "add";
        case PatchOp::Replace: return "replace";
        case PatchOp::Remove: return "remove";
        default: return "unknown";
    }
}

std::optional<PatchOp> parse_patch_op(std::string_view name) noexcept {
    if (name == "add") return PatchOp::Add;
    if (name == "replace") return PatchOp::Replace;
    if (name == "remove") return PatchOp::Remove;
    return std::nullopt;
}

// =============================================================================
// Patch
// =============================================================================

bool Patch::operator==(const Patch& other) const {
    return op == other.op && path == other.path && value == other.value;
}

std::string to_string(const Patch& patch) {
    std::string result = patch_op_name(patch.op);
    result += ' ';
    result += path_to_string(patch.path);
    if (patch.value) {
        result += " = ";
        result += to_string(*patch.value);
    }
    return result;
}

// =============================================================================
// PatchEngine - Generation
// =============================================================================

namespace {

Path child_path(const Path& base, PathSegment key) {
    Path path = base;
    path.push_back(std::move(key));
    return path;
}

} // anonymous namespace

void PatchEngine::generate(const DraftState& state, const Path& base_path,
                           std::vector<Patch>& patches, std::vector<Patch>& inverse_patches) {
    if (state.kind() == NodeKind::Sequence) {
        generate_sequence(state, base_path, patches, inverse_patches);
    } else {
        generate_mapping(state, base_path, patches, inverse_patches);
    }
}

void PatchEngine::generate_sequence(const DraftState& state, const Path& base_path,
                                    std::vector<Patch>& patches, std::vector<Patch>& inverse_patches) {
    const auto& base = state.base().as_sequence();
    const auto& copy = state.copy().as_sequence();
    std::size_t old_size = base.size();
    std::size_t new_size = copy.size();
    std::size_t overlap = std::min(old_size, new_size);

    for (std::size_t i = 0; i < overlap; ++i) {
        if (state.assigned(i) == true && !same_value(base[i], copy[i])) {
            patches.push_back(Patch::replace(child_path(base_path, i), copy[i]));
            inverse_patches.push_back(Patch::replace(child_path(base_path, i), base[i]));
        }
    }

    if (new_size > old_size) {
        for (std::size_t i = old_size; i < new_size; ++i) {
            patches.push_back(Patch::add(child_path(base_path, i), copy[i]));
        }
        for (std::size_t i = new_size; i-- > old_size;) {
            inverse_patches.push_back(Patch::remove(child_path(base_path, i)));
        }
    } else if (new_size < old_size) {
        for (std::size_t i = old_size; i-- > new_size;) {
            patches.push_back(Patch::remove(child_path(base_path, i)));
        }
        for (std::size_t i = new_size; i < old_size; ++i) {
            inverse_patches.push_back(Patch::add(child_path(base_path, i), base[i]));
        }
    }
}

void PatchEngine::generate_mapping(const DraftState& state, const Path& base_path,
                                   std::vector<Patch>& patches, std::vector<Patch>& inverse_patches) {
    const auto& base = state.base().as_mapping();
    const auto& copy = state.copy().as_mapping();

    for (const auto& key : state.assigned_keys()) {
        const auto& name = std::get<std::string>(key);
        const Value* original = base.find(name);
        bool assigned = state.assigned(key).value_or(false);

        if (!assigned) {
            if (!original) {
                continue;
            }
            patches.push_back(Patch::remove(child_path(base_path, key)));
            inverse_patches.push_back(Patch::add(child_path(base_path, key), *original));
            continue;
        }

        const Value* current = copy.find(name);
        if (!current) {
            continue;
        }

        if (!original) {
            patches.push_back(Patch::add(child_path(base_path, key), *current));
            inverse_patches.push_back(Patch::remove(child_path(base_path, key)));
        } else if (!same_value(*original, *current)) {
            patches.push_back(Patch::replace(child_path(base_path, key), *current));
            inverse_patches.push_back(Patch::replace(child_path(base_path, key), *original));
        }
    }
}

void PatchEngine::generate_replacement(const Value& base, const Value& replacement,
                                       std::vector<Patch>& patches, std::vector<Patch>& inverse_patches) {
    patches.push_back(Patch::replace({}, replacement));
    inverse_patches.push_back(Patch::replace({}, base));
}

// =============================================================================
// PatchEngine - Application
// =============================================================================

namespace {

// Normalize a segment for the container it addresses
PathSegment resolve_segment(const Draft& target, const PathSegment& segment, const Path& path,
                            bool allow_append) {
    if (target.is_mapping()) {
        if (const auto* index = std::get_if<std::size_t>(&segment)) {
            return std::to_string(*index);
        }
        return segment;
    }

    if (const auto* name = std::get_if<std::string>(&segment)) {
        if (allow_append && *name == PatchEngine::append_segment) {
            return target.size();
        }
        arbor_core::raise(PatchError::invalid_path(path_to_string(path),
            "'" + *name + "' does not address a sequence element"));
    }
    return segment;
}

} // anonymous namespace

void PatchEngine::apply(const Draft& draft, const std::vector<Patch>& patches, std::size_t first) {
    for (std::size_t i = first; i < patches.size(); ++i) {
        apply_one(draft, patches[i]);
    }
}

void PatchEngine::apply_one(const Draft& draft, const Patch& patch) {
    const Path& path = patch.path;
    std::string rendered = path_to_string(path);

    if (path.empty()) {
        arbor_core::raise(PatchError::invalid_path(rendered, "the root cannot be patched in place"));
    }

    Draft target = draft;
    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        PathSegment segment = resolve_segment(target, path[i], path, false);
        Value next = DraftFactory::read(target.state(), segment);
        if (!next.is_draft()) {
            arbor_core::raise(PatchError::invalid_path(rendered,
                "segment '" + to_string(segment) + "' is not a container"));
        }
        target = Draft(next.draft_ref());
    }

    PathSegment key = resolve_segment(target, path.back(), path, patch.op == PatchOp::Add);

    switch (patch.op) {
        case PatchOp::Add:
            if (!patch.value) {
                arbor_core::raise(PatchError::missing_value(rendered));
            }
            if (target.is_sequence()) {
                std::size_t index = std::get<std::size_t>(key);
                if (index > target.size()) {
                    arbor_core::raise(PatchError::invalid_path(rendered, "index past the end"));
                }
                target.insert(index, *patch.value);
            } else {
                DraftFactory::write(target.state(), key, *patch.value);
            }
            break;

        case PatchOp::Replace:
            if (!patch.value) {
                arbor_core::raise(PatchError::missing_value(rendered));
            }
            if (target.is_sequence() && std::get<std::size_t>(key) >= target.size()) {
                arbor_core::raise(PatchError::invalid_path(rendered, "index out of range"));
            }
            DraftFactory::write(target.state(), key, *patch.value);
            break;

        case PatchOp::Remove:
            if (!DraftFactory::has(target.state(), key)) {
                arbor_core::raise(PatchError::invalid_path(rendered, "nothing to remove"));
            }
            DraftFactory::remove(target.state(), key);
            break;

        default:
            arbor_core::raise(PatchError::unknown_op(
                std::to_string(static_cast<int>(patch.op))));
    }
}

} // namespace arbor_tree
