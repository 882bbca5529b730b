#pragma once

/// @file producer.hpp
/// @brief Entry points: produce, drafts with manual lifetime, patch replay

#include "fwd.hpp"
#include "value.hpp"
#include "draft.hpp"
#include "scope.hpp"
#include "config.hpp"
#include <arbor/core/error.hpp>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace arbor_tree {

namespace detail {

template<typename T>
struct is_future : std::false_type {};

template<typename T>
struct is_future<std::future<T>> : std::true_type {};

template<typename T>
struct is_std_function : std::false_type {};

template<typename Sig>
struct is_std_function<std::function<Sig>> : std::true_type {};

/// First parameter type of a non-generic callable, void when unknown
template<typename T>
struct member_first_arg { using type = void; };

template<typename R, typename C, typename A, typename... Rest>
struct member_first_arg<R (C::*)(A, Rest...)> { using type = A; };

template<typename R, typename C, typename A, typename... Rest>
struct member_first_arg<R (C::*)(A, Rest...) const> { using type = A; };

template<typename F, typename = void>
struct first_arg { using type = void; };

template<typename F>
struct first_arg<F, std::void_t<decltype(&F::operator())>> : member_first_arg<decltype(&F::operator())> {};

template<typename R, typename A, typename... Rest>
struct first_arg<R (*)(A, Rest...), void> { using type = A; };

/// Recipes declared on a plain Value rather than a Draft
template<typename F>
inline constexpr bool takes_value_v =
    std::is_same_v<std::remove_cvref_t<typename first_arg<std::decay_t<F>>::type>, Value>;

/// Normalize a recipe result: nullopt means "no replacement"
template<typename R>
std::optional<Value> to_replacement(R&& result) {
    using T = std::decay_t<R>;
    if constexpr (std::is_same_v<T, std::optional<Value>>) {
        return std::forward<R>(result);
    } else {
        return std::optional<Value>(Value(std::forward<R>(result)));
    }
}

template<typename Recipe, typename... Args>
std::optional<Value> invoke_recipe(Recipe& recipe, Args&&... args) {
    using R = std::invoke_result_t<Recipe&, Args...>;
    if constexpr (std::is_void_v<R>) {
        std::invoke(recipe, std::forward<Args>(args)...);
        return std::nullopt;
    } else {
        return to_replacement(std::invoke(recipe, std::forward<Args>(args)...));
    }
}

/// Wait for a recipe future and normalize its result
template<typename T>
std::optional<Value> settle(std::future<T>& pending) {
    if constexpr (std::is_void_v<T>) {
        pending.get();
        return std::nullopt;
    } else {
        return to_replacement(pending.get());
    }
}

} // namespace detail

// =============================================================================
// Producer
// =============================================================================

/// Runs recipes against drafts and turns the outcome into new values
///
/// Each producing call opens a scope, lets the recipe mutate a draft of the
/// base, then finalizes: unchanged subtrees are shared with the base, changed
/// nodes are fresh (and frozen when auto_freeze is on). The base is never
/// mutated. Any failure revokes the scope before the exception propagates.
///
/// Not thread-safe; use one Producer per thread.
///
/// @code
/// arbor_tree::Producer producer;
/// auto next = producer.produce(state, [](arbor_tree::Draft& draft) {
///     draft.child("todos").push_back(arbor_tree::Value::mapping({{"done", false}}));
/// });
/// @endcode
class Producer {
public:
    Producer();
    explicit Producer(ProducerConfig config);

    Producer(const Producer&) = delete;
    Producer& operator=(const Producer&) = delete;

    // -------------------------------------------------------------------------
    // Configuration
    // -------------------------------------------------------------------------

    [[nodiscard]] const ProducerConfig& config() const noexcept { return m_config; }
    [[nodiscard]] ProducerConfig& config() noexcept { return m_config; }

    void set_auto_freeze(bool enabled) noexcept { m_config.auto_freeze = enabled; }

    [[nodiscard]] ScopeManager& scopes() noexcept { return m_scopes; }

    // -------------------------------------------------------------------------
    // produce
    // -------------------------------------------------------------------------

    /// Run recipe against a draft of base and return the next value
    ///
    /// The recipe returns void, a Value or std::optional<Value>. Returning the
    /// draft itself or nullopt keeps the drafted result; any other value
    /// replaces it, which is only allowed when the draft was left untouched.
    /// A non-draftable base is handed to the recipe as a const Value&.
    ///
    /// @param listener Receives forward and inverse patches on success
    template<typename Recipe>
    Value produce(const Value& base, Recipe&& recipe, PatchListener listener = {}) {
        check_recipe(recipe);
        Value resolved = resolve_base(base);

        if (!resolved.is_draftable()) {
            if constexpr (detail::takes_value_v<Recipe>) {
                auto replacement = detail::invoke_recipe(recipe, static_cast<const Value&>(resolved));
                return replacement ? *replacement : resolved;
            } else {
                reject_base(resolved);
            }
        }

        if constexpr (std::is_invocable_v<Recipe&, Draft&>) {
            auto scope = m_scopes.enter();
            Draft root = begin(*scope, resolved);
            auto result = guarded(*scope, [&] { return detail::invoke_recipe(recipe, root); });
            m_scopes.leave(*scope);
            ScopeManager::attach_patch_recording(*scope, std::move(listener));
            return process_result(std::move(result), *scope);
        } else {
            reject_base(resolved);
        }
    }

    /// produce, with library failures returned instead of thrown
    template<typename Recipe>
    arbor_core::Result<Value> try_produce(const Value& base, Recipe&& recipe, PatchListener listener = {}) {
        try {
            return arbor_core::Ok(produce(base, std::forward<Recipe>(recipe), std::move(listener)));
        } catch (const arbor_core::Exception& e) {
            return arbor_core::Err<Value>(e.error());
        }
    }

    /// Run a recipe that finishes later
    ///
    /// The recipe returns a std::future; the scope stays open until it is
    /// ready. Finalization runs when the returned future is waited on, so
    /// the Producer must outlive it.
    template<typename Recipe>
    std::future<Value> produce_async(const Value& base, Recipe recipe, PatchListener listener = {}) {
        using Pending = std::invoke_result_t<Recipe&, Draft&>;
        static_assert(detail::is_future<Pending>::value, "async recipes must return a std::future");

        check_recipe(recipe);
        Value resolved = resolve_base(base);
        if (!resolved.is_draftable()) {
            reject_base(resolved);
        }

        auto scope = m_scopes.enter();
        Draft root = begin(*scope, resolved);
        Pending pending = guarded(*scope, [&] { return std::invoke(recipe, root); });
        m_scopes.leave(*scope);

        return std::async(std::launch::deferred,
            [this, scope, pending = std::move(pending), listener = std::move(listener)]() mutable {
                auto result = guarded(*scope, [&] { return detail::settle(pending); });
                ScopeManager::attach_patch_recording(*scope, std::move(listener));
                return process_result(std::move(result), *scope);
            });
    }

    /// Bind a recipe; the returned callable takes (base, extra...) and
    /// forwards extra arguments to the recipe after the draft
    template<typename Recipe>
    auto curry(Recipe recipe) {
        return [this, recipe = std::move(recipe)](const Value& base, auto&&... extra) -> Value {
            return produce(base, [&](Draft& draft) {
                return std::invoke(recipe, draft, extra...);
            });
        };
    }

    // -------------------------------------------------------------------------
    // Drafts with manual lifetime
    // -------------------------------------------------------------------------

    /// Draft base outside of a recipe; pair with finish_draft
    ///
    /// The producer keeps the draft's scope until finish_draft. Scopes whose
    /// root draft is no longer held outside the producer are released on the
    /// next create_draft.
    [[nodiscard]] Draft create_draft(const Value& base);

    /// Drafts from create_draft still awaiting finish_draft
    [[nodiscard]] std::size_t pending_drafts() const noexcept { return m_detached.size(); }

    /// Finalize a draft from create_draft (once)
    Value finish_draft(const Draft& draft, PatchListener listener = {});

    // -------------------------------------------------------------------------
    // Patches
    // -------------------------------------------------------------------------

    /// Replay patches; a draft base is mutated in place and returned
    Value apply_patches(const Value& base, const std::vector<Patch>& patches);

    [[nodiscard]] arbor_core::Result<Value> try_apply_patches(const Value& base, const std::vector<Patch>& patches);

private:
    template<typename Recipe>
    static void check_recipe(const Recipe& recipe) {
        if constexpr (detail::is_std_function<std::decay_t<Recipe>>::value) {
            if (!recipe) {
                arbor_core::raise(arbor_core::DraftError::invalid_argument("recipe is empty"));
            }
        }
    }

    /// Run fn; on any failure revoke scope and rethrow
    template<typename F>
    auto guarded(Scope& scope, F&& fn) -> decltype(fn()) {
        try {
            return fn();
        } catch (const arbor_core::Exception& e) {
            abort_scope(scope, &e.error());
            throw;
        } catch (...) {
            abort_scope(scope, nullptr);
            throw;
        }
    }

    [[noreturn]] static void reject_base(const Value& base);
    [[nodiscard]] static Value resolve_base(const Value& base);

    Draft begin(Scope& scope, const Value& base);
    void release_abandoned_drafts();
    Value process_result(std::optional<Value> result, Scope& scope);
    void abort_scope(Scope& scope, const arbor_core::Error* error) noexcept;

    ProducerConfig m_config;
    ScopeManager m_scopes;
    std::unordered_map<const DraftState*, std::shared_ptr<Scope>> m_detached;
};

} // namespace arbor_tree
