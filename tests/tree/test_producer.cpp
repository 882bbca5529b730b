// arbor_tree Producer tests

#include <catch2/catch_test_macros.hpp>
#include <arbor/tree/tree.hpp>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <future>
#include <limits>
#include <stdexcept>

using namespace arbor_tree;

namespace {

struct Recorded {
    std::vector<Patch> patches;
    std::vector<Patch> inverse;
    int calls = 0;

    PatchListener listener() {
        return [this](const std::vector<Patch>& p, const std::vector<Patch>& inv) {
            patches = p;
            inverse = inv;
            ++calls;
        };
    }
};

Path path(std::initializer_list<PathSegment> segments) {
    return Path(segments);
}

Value deep_state() {
    return Value::mapping({
        {"left", Value::mapping({{"deep", Value::mapping({{"x", 1}})}, {"other", Value::sequence({1, 2})}})},
        {"right", Value::mapping({{"y", 2}})},
        {"items", Value::sequence({Value::mapping({{"id", 1}}), Value::mapping({{"id", 2}})})}
    });
}

} // namespace

// =============================================================================
// Core behavior
// =============================================================================

TEST_CASE("Producer scenario: nested replace", "[tree][producer]") {
    Producer producer;
    Recorded rec;
    Value base = Value::mapping({{"a", 1}, {"b", Value::mapping({{"c", 2}})}});

    Value result = producer.produce(base, [](Draft& draft) {
        draft.child("b").set("c", 3);
    }, rec.listener());

    REQUIRE(result == Value::mapping({{"a", 1}, {"b", Value::mapping({{"c", 3}})}}));
    REQUIRE(result["b"].identity() != base["b"].identity());
    REQUIRE(base["b"]["c"].as_int() == 2);

    REQUIRE(rec.calls == 1);
    REQUIRE(rec.patches == std::vector<Patch>{Patch::replace(path({std::string("b"), std::string("c")}), 3)});
    REQUIRE(rec.inverse == std::vector<Patch>{Patch::replace(path({std::string("b"), std::string("c")}), 2)});
}

TEST_CASE("Producer scenario: sequence truncation", "[tree][producer]") {
    Producer producer;
    Recorded rec;
    Value base = Value::sequence({1, 2, 3});

    Value result = producer.produce(base, [](Draft& draft) {
        draft.pop_back();
    }, rec.listener());

    REQUIRE(result == Value::sequence({1, 2}));
    REQUIRE(rec.patches == std::vector<Patch>{Patch::remove(path({std::size_t{2}}))});
    REQUIRE(rec.inverse == std::vector<Patch>{Patch::add(path({std::size_t{2}}), 3)});

    Value replayed = producer.apply_patches(base, rec.patches);
    REQUIRE(replayed == result);
    REQUIRE(producer.apply_patches(replayed, rec.inverse) == base);
}

TEST_CASE("Producer structural sharing", "[tree][producer]") {
    Producer producer;
    Value base = deep_state();

    SECTION("no mutation returns the base itself") {
        Value result = producer.produce(base, [](Draft& draft) {
            (void)draft.child("left").child("deep").get("x");
            draft.child("right").set("y", 2);
        });
        REQUIRE(result.identity() == base.identity());
    }

    SECTION("only the mutated path is copied") {
        Value result = producer.produce(base, [](Draft& draft) {
            draft.child("left").child("deep").set("x", 5);
        });

        REQUIRE(result.identity() != base.identity());
        REQUIRE(result["left"].identity() != base["left"].identity());
        REQUIRE(result["left"]["deep"].identity() != base["left"]["deep"].identity());
        REQUIRE(result["left"]["other"].identity() == base["left"]["other"].identity());
        REQUIRE(result["right"].identity() == base["right"].identity());
        REQUIRE(result["items"].identity() == base["items"].identity());
    }

    SECTION("sequence elements are shared too") {
        Value result = producer.produce(base, [](Draft& draft) {
            draft.child("items").child(1).set("id", 3);
        });

        REQUIRE(result["items"][0].identity() == base["items"][0].identity());
        REQUIRE(result["items"][1]["id"].as_int() == 3);
    }
}

TEST_CASE("Producer no-op assignment rules", "[tree][producer]") {
    Producer producer;
    Recorded rec;
    const double nan = std::numeric_limits<double>::quiet_NaN();
    Value base = Value::mapping({{"n", nan}, {"z", 0.0}});

    SECTION("NaN over NaN is not a change") {
        Value result = producer.produce(base, [&](Draft& draft) {
            draft.set("n", nan);
            REQUIRE_FALSE(draft.state().modified());
        }, rec.listener());

        REQUIRE(result.identity() == base.identity());
        REQUIRE(rec.patches.empty());
    }

    SECTION("-0 over +0 is a change") {
        Value result = producer.produce(base, [](Draft& draft) {
            draft.set("z", -0.0);
        }, rec.listener());

        REQUIRE(result.identity() != base.identity());
        REQUIRE(std::signbit(result["z"].as_float()));
        REQUIRE(rec.patches.size() == 1);
    }
}

TEST_CASE("Producer freezing", "[tree][producer]") {
    Value base = Value::mapping({{"list", Value::sequence({1})}});

    SECTION("results are frozen by default") {
        Producer producer;
        Value result = producer.produce(base, [](Draft& draft) {
            draft.child("list").push_back(2);
        });
        REQUIRE(result.is_frozen());
        REQUIRE(result["list"].is_frozen());
        REQUIRE_THROWS_AS(result["list"].sequence_ptr()->push_back(3), arbor_core::Exception);
    }

    SECTION("frozen results can be the next base") {
        Producer producer;
        Value first = producer.produce(base, [](Draft& draft) { draft.set("v", 1); });
        Value second = producer.produce(first, [](Draft& draft) { draft.set("v", 2); });

        REQUIRE(first["v"].as_int() == 1);
        REQUIRE(second["v"].as_int() == 2);
        REQUIRE(second["list"].identity() == first["list"].identity());
    }

    SECTION("auto freeze disabled") {
        Producer producer;
        producer.set_auto_freeze(false);
        Value result = producer.produce(base, [](Draft& draft) { draft.set("v", 1); });
        REQUIRE_FALSE(result.is_frozen());
    }
}

// =============================================================================
// Return values
// =============================================================================

TEST_CASE("Producer recipe results", "[tree][producer]") {
    Producer producer;
    Value base = Value::mapping({{"a", 1}});

    SECTION("returning the draft keeps the drafted result") {
        Value result = producer.produce(base, [](Draft& draft) {
            draft.set("a", 2);
            return draft;
        });
        REQUIRE(result["a"].as_int() == 2);
    }

    SECTION("returning nullopt keeps the drafted result") {
        Value result = producer.produce(base, [](Draft& draft) -> std::optional<Value> {
            draft.set("a", 3);
            return std::nullopt;
        });
        REQUIRE(result["a"].as_int() == 3);
    }

    SECTION("replacement from an untouched draft") {
        Value result = producer.produce(base, [](Draft&) { return Value(42); });
        REQUIRE(result.as_int() == 42);
    }

    SECTION("replacement may embed drafts") {
        Value result = producer.produce(deep_state(), [](Draft& draft) {
            return Value::sequence({draft.get("right")});
        });
        REQUIRE(result[0] == Value::mapping({{"y", 2}}));
        REQUIRE_FALSE(result[0].is_draft());
    }

    SECTION("mutating and replacing is a double return") {
        try {
            (void)producer.produce(base, [](Draft& draft) {
                draft.set("a", 2);
                return Value::empty_mapping();
            });
            FAIL("expected a double return error");
        } catch (const arbor_core::Exception& e) {
            REQUIRE(e.error().is_draft_error(arbor_core::DraftError::Kind::DoubleReturn));
        }
        REQUIRE(producer.scopes().current() == nullptr);
    }
}

// =============================================================================
// Failures
// =============================================================================

TEST_CASE("Producer rollback", "[tree][producer]") {
    Producer producer;
    Value base = deep_state();
    Draft leaked;

    SECTION("recipe exception revokes the scope") {
        REQUIRE_THROWS_AS(producer.produce(base, [&](Draft& draft) {
            leaked = draft;
            draft.set("right", 0);
            throw std::runtime_error("recipe failed");
        }), std::runtime_error);

        REQUIRE(producer.scopes().current() == nullptr);
        REQUIRE(leaked.state().revoked());
        REQUIRE_THROWS_AS(leaked.get("right"), arbor_core::Exception);
        REQUIRE(base["right"]["y"].as_int() == 2);
    }

    SECTION("drafts are revoked after success too") {
        (void)producer.produce(base, [&](Draft& draft) { leaked = draft; });
        REQUIRE_THROWS_AS(leaked.set("x", 1), arbor_core::Exception);
    }

    SECTION("self assignment is rejected") {
        auto result = producer.try_produce(base, [](Draft& draft) {
            draft.set("me", draft);
        });
        REQUIRE(result.is_err());
        REQUIRE(result.error().is_draft_error(arbor_core::DraftError::Kind::CyclicReference));
    }

    SECTION("assigning the root below itself is rejected") {
        auto result = producer.try_produce(base, [](Draft& draft) {
            draft.child("left").child("deep").set("up", draft);
        });
        REQUIRE(result.is_err());
        REQUIRE(result.error().is_draft_error(arbor_core::DraftError::Kind::CyclicReference));
        REQUIRE(producer.scopes().current() == nullptr);
        REQUIRE_FALSE(base["left"]["deep"].as_mapping().contains("up"));
    }

    SECTION("try_produce passes success through") {
        auto result = producer.try_produce(base, [](Draft& draft) { draft.set("n", 1); });
        REQUIRE(result.is_ok());
        REQUIRE(result.value()["n"].as_int() == 1);
    }

    SECTION("empty recipe") {
        std::function<void(Draft&)> recipe;
        auto result = producer.try_produce(base, recipe);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == arbor_core::ErrorCode::InvalidArgument);
    }

    SECTION("failures are counted") {
        arbor_core::debug::reset_error_stats();
        (void)producer.try_produce(base, [](Draft& draft) { draft.set("me", draft); });
        REQUIRE(arbor_core::debug::total_error_count() == 1);
    }
}

TEST_CASE("Producer non-draftable bases", "[tree][producer]") {
    Producer producer;

    SECTION("value recipes see the raw value") {
        Value result = producer.produce(Value(2), [](const Value& v) { return Value(v.as_int() * 10); });
        REQUIRE(result.as_int() == 20);
    }

    SECTION("void value recipe returns the base") {
        Value result = producer.produce(Value("s"), [](const Value&) {});
        REQUIRE(result.as_string() == "s");
    }

    SECTION("draft recipes reject scalars") {
        REQUIRE_THROWS_AS(producer.produce(Value(1), [](Draft&) {}), arbor_core::Exception);
    }
}

TEST_CASE("Producer nesting", "[tree][producer]") {
    Producer producer;
    Value base = deep_state();

    Value result = producer.produce(base, [&](Draft& draft) {
        Value right = producer.produce(base["right"], [](Draft& inner) {
            inner.set("y", 20);
        });
        REQUIRE(producer.scopes().depth() == 1);
        draft.set("right", right);
    });

    REQUIRE(result["right"]["y"].as_int() == 20);
    REQUIRE(result.is_frozen());
    REQUIRE(producer.scopes().current() == nullptr);
}

// =============================================================================
// Manual drafts
// =============================================================================

TEST_CASE("create_draft and finish_draft", "[tree][producer]") {
    Producer producer;
    Value base = Value::mapping({{"count", 0}});

    SECTION("two-phase update") {
        Recorded rec;
        Draft draft = producer.create_draft(base);
        REQUIRE(producer.scopes().current() == nullptr);

        draft.set("count", 1);
        Value result = producer.finish_draft(draft, rec.listener());

        REQUIRE(result["count"].as_int() == 1);
        REQUIRE(rec.patches == std::vector<Patch>{Patch::replace(path({std::string("count")}), 1)});
        REQUIRE(draft.state().revoked());
    }

    SECTION("finishing twice") {
        Draft draft = producer.create_draft(base);
        (void)producer.finish_draft(draft);
        try {
            (void)producer.finish_draft(draft);
            FAIL("expected an already finalized error");
        } catch (const arbor_core::Exception& e) {
            REQUIRE(e.error().is_draft_error(arbor_core::DraftError::Kind::AlreadyFinalized));
        }
    }

    SECTION("finishing a draft not from create_draft") {
        Draft draft = producer.create_draft(base);
        (void)producer.produce(base, [&](Draft& other) {
            REQUIRE_THROWS_AS(producer.finish_draft(other), arbor_core::Exception);
        });
        REQUIRE_THROWS_AS(producer.finish_draft(Draft()), arbor_core::Exception);
        (void)producer.finish_draft(draft);
    }

    SECTION("abandoned drafts are released") {
        {
            Draft dropped = producer.create_draft(base);
            dropped.set("count", 5);
        }
        Draft kept = producer.create_draft(base);
        REQUIRE(producer.pending_drafts() == 1);

        Draft held = producer.create_draft(base);
        REQUIRE(producer.pending_drafts() == 2);
        REQUIRE(producer.finish_draft(kept)["count"].as_int() == 0);
        REQUIRE(producer.pending_drafts() == 1);
        (void)producer.finish_draft(held);
    }

    SECTION("drafting a scalar") {
        REQUIRE_THROWS_AS(producer.create_draft(Value(3)), arbor_core::Exception);
    }

    SECTION("independent drafts") {
        Draft a = producer.create_draft(base);
        Draft b = producer.create_draft(base);
        a.set("count", 1);
        b.set("count", 2);
        REQUIRE(producer.finish_draft(b)["count"].as_int() == 2);
        REQUIRE(producer.finish_draft(a)["count"].as_int() == 1);
    }
}

// =============================================================================
// Async and curried recipes
// =============================================================================

TEST_CASE("produce_async", "[tree][producer][async]") {
    Producer producer;
    Value base = Value::mapping({{"status", "idle"}});

    SECTION("finalizes when the recipe future settles") {
        Recorded rec;
        std::promise<void> gate;

        auto pending = producer.produce_async(base, [&](Draft& draft) {
            draft.set("status", "loading");
            return gate.get_future();
        }, rec.listener());

        REQUIRE(producer.scopes().current() == nullptr);
        REQUIRE(rec.calls == 0);

        gate.set_value();
        Value result = pending.get();

        REQUIRE(result["status"].as_string() == "loading");
        REQUIRE(rec.calls == 1);
    }

    SECTION("recipe futures may mutate later") {
        auto pending = producer.produce_async(base, [](Draft& draft) {
            return std::async(std::launch::deferred, [draft]() mutable {
                draft.set("status", "done");
            });
        });
        REQUIRE(pending.get()["status"].as_string() == "done");
    }

    SECTION("a failed future revokes and rethrows") {
        Draft leaked;
        auto pending = producer.produce_async(base, [&](Draft& draft) {
            leaked = draft;
            return std::async(std::launch::deferred, []() -> std::optional<Value> {
                throw std::runtime_error("load failed");
            });
        });

        REQUIRE_THROWS_AS(pending.get(), std::runtime_error);
        REQUIRE(leaked.state().revoked());
    }

    SECTION("library errors surface through the future") {
        auto pending = producer.produce_async(base, [](Draft& draft) {
            draft.set("status", "x");
            std::promise<Value> replacement;
            replacement.set_value(Value(1));
            return replacement.get_future();
        });

        try {
            (void)pending.get();
            FAIL("expected a double return error");
        } catch (const arbor_core::Exception& e) {
            REQUIRE(e.error().is_draft_error(arbor_core::DraftError::Kind::DoubleReturn));
        }
    }
}

TEST_CASE("curry", "[tree][producer]") {
    Producer producer;
    auto increment = producer.curry([](Draft& draft, std::int64_t amount) {
        draft.set("count", draft.get("count").as_int() + amount);
    });

    Value base = Value::mapping({{"count", 1}});
    Value once = increment(base, std::int64_t{2});
    Value twice = increment(once, std::int64_t{3});

    REQUIRE(once["count"].as_int() == 3);
    REQUIRE(twice["count"].as_int() == 6);
    REQUIRE(base["count"].as_int() == 1);
}

// =============================================================================
// Configuration
// =============================================================================

TEST_CASE("Producer hooks", "[tree][producer]") {
    int assigned = 0;
    int deleted = 0;
    int copied = 0;

    ProducerConfig config;
    config.on_assign = [&](const DraftState&, const PathSegment&, const Value&) { ++assigned; };
    config.on_delete = [&](const DraftState&, const PathSegment&) { ++deleted; };
    config.on_copy = [&](const DraftState&) { ++copied; };

    Producer producer(std::move(config));
    (void)producer.produce(deep_state(), [](Draft& draft) {
        draft.child("right").remove("y");
        draft.set("added", 1);
    });

    REQUIRE(assigned == 2);   // "right" and "added"
    REQUIRE(deleted == 1);
    REQUIRE(copied == 2);
}

TEST_CASE("ProducerConfig from JSON", "[tree][producer][config]") {
    SECTION("fields are read") {
        auto result = ProducerConfig::from_json(nlohmann::json::parse(R"({"auto_freeze": false, "log_level": "debug", "extra": 1})"));
        REQUIRE(result.is_ok());
        REQUIRE_FALSE(result.value().auto_freeze);
        REQUIRE(result.value().log_level == spdlog::level::debug);
    }

    SECTION("defaults") {
        auto result = ProducerConfig::from_json(nlohmann::json::object());
        REQUIRE(result.value().auto_freeze);
        REQUIRE_FALSE(result.value().log_level.has_value());
    }

    SECTION("wrong types") {
        auto result = ProducerConfig::from_json(nlohmann::json::parse(R"({"auto_freeze": "yes"})"));
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == arbor_core::ErrorCode::ParseError);
        REQUIRE(*result.error().get_context("key") == "auto_freeze");
    }

    SECTION("unknown log level") {
        auto result = ProducerConfig::from_json(nlohmann::json::parse(R"({"log_level": "loud"})"));
        REQUIRE(result.is_err());
    }
}

TEST_CASE("ProducerConfig files", "[tree][producer][config]") {
    auto dir = std::filesystem::temp_directory_path();

    SECTION("missing file") {
        auto result = load_config_file((dir / "arbor_missing_config.json").string());
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == arbor_core::ErrorCode::IOError);
    }

    SECTION("malformed file") {
        auto file = dir / "arbor_bad_config.json";
        std::ofstream(file) << "{ not json";
        auto result = load_config_file(file.string());
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == arbor_core::ErrorCode::ParseError);
        std::filesystem::remove(file);
    }

    SECTION("valid file") {
        auto file = dir / "arbor_good_config.json";
        std::ofstream(file) << R"({"auto_freeze": false})";
        auto result = load_config_file(file.string());
        REQUIRE(result.is_ok());
        REQUIRE_FALSE(result.value().auto_freeze);
        std::filesystem::remove(file);
    }
}
