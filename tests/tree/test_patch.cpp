// arbor_tree Patch tests

#include <catch2/catch_test_macros.hpp>
#include <arbor/tree/tree.hpp>
#include <limits>
#include <vector>

using namespace arbor_tree;

namespace {

struct Recorded {
    std::vector<Patch> patches;
    std::vector<Patch> inverse;

    PatchListener listener() {
        return [this](const std::vector<Patch>& p, const std::vector<Patch>& inv) {
            patches = p;
            inverse = inv;
        };
    }
};

Path path(std::initializer_list<PathSegment> segments) {
    return Path(segments);
}

} // namespace

// =============================================================================
// Patch records
// =============================================================================

TEST_CASE("Patch construction", "[tree][patch]") {
    SECTION("factories") {
        auto add = Patch::add(path({std::string("a")}), 1);
        auto remove = Patch::remove(path({std::size_t{2}}));

        REQUIRE(add.op == PatchOp::Add);
        REQUIRE(add.value.has_value());
        REQUIRE(remove.op == PatchOp::Remove);
        REQUIRE_FALSE(remove.value.has_value());
    }

    SECTION("op names") {
        REQUIRE(std::string(patch_op_name(PatchOp::Replace)) == "replace");
        REQUIRE(parse_patch_op("add") == PatchOp::Add);
        REQUIRE_FALSE(parse_patch_op("move").has_value());
    }

    SECTION("rendering") {
        auto patch = Patch::replace(path({std::string("list"), std::size_t{0}}), 3);
        REQUIRE(to_string(patch) == "replace /list/0 = 3");
    }
}

// =============================================================================
// Generation
// =============================================================================

TEST_CASE("Mapping patches", "[tree][patch]") {
    Producer producer;
    Recorded rec;
    Value base = Value::mapping({{"a", 1}, {"b", 2}, {"c", Value::mapping({{"d", 1}})}});

    SECTION("add, replace and remove") {
        (void)producer.produce(base, [](Draft& draft) {
            draft.set("a", 10);
            draft.remove("b");
            draft.set("e", 5);
        }, rec.listener());

        REQUIRE(rec.patches == std::vector<Patch>{
            Patch::replace(path({std::string("a")}), 10),
            Patch::remove(path({std::string("b")})),
            Patch::add(path({std::string("e")}), 5)
        });
        REQUIRE(rec.inverse == std::vector<Patch>{
            Patch::replace(path({std::string("a")}), 1),
            Patch::add(path({std::string("b")}), 2),
            Patch::remove(path({std::string("e")}))
        });
    }

    SECTION("nested changes carry the full path") {
        (void)producer.produce(base, [](Draft& draft) {
            draft.child("c").set("d", 2);
        }, rec.listener());

        REQUIRE(rec.patches == std::vector<Patch>{
            Patch::replace(path({std::string("c"), std::string("d")}), 2)
        });
    }

    SECTION("restoring the original value emits nothing") {
        (void)producer.produce(base, [](Draft& draft) {
            draft.set("a", 99);
            draft.set("a", 1);
        }, rec.listener());

        REQUIRE(rec.patches.empty());
        REQUIRE(rec.inverse.empty());
    }

    SECTION("assigning a whole subtree emits one patch for it") {
        (void)producer.produce(base, [](Draft& draft) {
            draft.child("c").set("d", 7);
            draft.set("c", Value::mapping({{"z", 0}}));
        }, rec.listener());

        REQUIRE(rec.patches.size() == 1);
        REQUIRE(rec.patches[0].path == path({std::string("c")}));
        REQUIRE(*rec.patches[0].value == Value::mapping({{"z", 0}}));
    }
}

TEST_CASE("Sequence patches", "[tree][patch]") {
    Producer producer;
    Recorded rec;
    Value base = Value::mapping({{"list", Value::sequence({1, 2, 3})}});

    SECTION("growth adds ascending, inverse removes descending") {
        (void)producer.produce(base, [](Draft& draft) {
            Draft list = draft.child("list");
            list.push_back(4);
            list.push_back(5);
        }, rec.listener());

        REQUIRE(rec.patches == std::vector<Patch>{
            Patch::add(path({std::string("list"), std::size_t{3}}), 4),
            Patch::add(path({std::string("list"), std::size_t{4}}), 5)
        });
        REQUIRE(rec.inverse == std::vector<Patch>{
            Patch::remove(path({std::string("list"), std::size_t{4}})),
            Patch::remove(path({std::string("list"), std::size_t{3}}))
        });
    }

    SECTION("shrink by one removes the last index") {
        (void)producer.produce(base, [](Draft& draft) {
            draft.child("list").pop_back();
        }, rec.listener());

        REQUIRE(rec.patches == std::vector<Patch>{
            Patch::remove(path({std::string("list"), std::size_t{2}}))
        });
        REQUIRE(rec.inverse == std::vector<Patch>{
            Patch::add(path({std::string("list"), std::size_t{2}}), 3)
        });
    }

    SECTION("splice replaces shifted elements then removes the tail") {
        (void)producer.produce(base, [](Draft& draft) {
            draft.child("list").remove(std::size_t{0});
        }, rec.listener());

        REQUIRE(rec.patches == std::vector<Patch>{
            Patch::replace(path({std::string("list"), std::size_t{0}}), 2),
            Patch::replace(path({std::string("list"), std::size_t{1}}), 3),
            Patch::remove(path({std::string("list"), std::size_t{2}}))
        });
    }
}

TEST_CASE("Whole-value replacement patches", "[tree][patch]") {
    Producer producer;
    Recorded rec;
    Value base = Value::mapping({{"a", 1}});
    Value replacement = Value::sequence({1});

    Value result = producer.produce(base, [&](Draft&) { return replacement; }, rec.listener());

    REQUIRE(result.identity() == replacement.identity());
    REQUIRE(rec.patches == std::vector<Patch>{Patch::replace({}, replacement)});
    REQUIRE(rec.inverse == std::vector<Patch>{Patch::replace({}, base)});
}

// =============================================================================
// Application
// =============================================================================

TEST_CASE("Applying patches", "[tree][patch]") {
    Producer producer;
    Value base = Value::mapping({
        {"a", 1},
        {"list", Value::sequence({1, 2, 3})},
        {"nested", Value::mapping({{"x", 1}})}
    });

    SECTION("forward then inverse round-trips") {
        Recorded rec;
        Value next = producer.produce(base, [](Draft& draft) {
            draft.set("a", 2);
            draft.child("list").remove(std::size_t{1});
            draft.child("list").push_back(9);
            draft.child("nested").remove("x");
            draft.set("added", Value::sequence({true}));
        }, rec.listener());

        REQUIRE(producer.apply_patches(base, rec.patches) == next);
        REQUIRE(producer.apply_patches(next, rec.inverse) == base);
    }

    SECTION("untouched subtrees stay shared") {
        Value next = producer.apply_patches(base, {Patch::replace(path({std::string("a")}), 5)});
        REQUIRE(next["a"].as_int() == 5);
        REQUIRE(next["list"].identity() == base["list"].identity());
        REQUIRE(base["a"].as_int() == 1);
    }

    SECTION("append segment") {
        Value next = producer.apply_patches(base, {
            Patch::add(path({std::string("list"), std::string("-")}), 4)
        });
        REQUIRE(next["list"] == Value::sequence({1, 2, 3, 4}));
    }

    SECTION("root replacement") {
        Value next = producer.apply_patches(base, {
            Patch::replace({}, Value::mapping({{"b", 1}})),
            Patch::add(path({std::string("c")}), 2)
        });
        REQUIRE(next == Value::mapping({{"b", 1}, {"c", 2}}));
    }

    SECTION("empty list returns the base") {
        REQUIRE(producer.apply_patches(base, {}).identity() == base.identity());
    }

    SECTION("draft base is mutated in place") {
        Value next = producer.produce(base, [&](Draft& draft) {
            Value same = producer.apply_patches(draft, {Patch::replace(path({std::string("a")}), 3)});
            REQUIRE(same.draft_ref() == draft.ref());
            REQUIRE(draft.get("a").as_int() == 3);
        });
        REQUIRE(next["a"].as_int() == 3);
    }
}

TEST_CASE("Applying bad patches", "[tree][patch]") {
    Producer producer;
    Value base = Value::mapping({{"a", 1}, {"list", Value::sequence({1})}});

    SECTION("unknown op") {
        Patch bad{static_cast<PatchOp>(42), path({std::string("a")}), Value(1)};
        try {
            (void)producer.apply_patches(base, {bad});
            FAIL("expected an unknown op error");
        } catch (const arbor_core::Exception& e) {
            REQUIRE(e.error().is_patch_error(arbor_core::PatchError::Kind::UnknownOp));
            REQUIRE(e.error().message().find("42") != std::string::npos);
        }
    }

    SECTION("path through a scalar") {
        auto result = producer.try_apply_patches(base, {Patch::replace(path({std::string("a"), std::string("b")}), 1)});
        REQUIRE(result.is_err());
        REQUIRE(result.error().is_patch_error(arbor_core::PatchError::Kind::InvalidPath));
    }

    SECTION("missing value") {
        auto result = producer.try_apply_patches(base, {Patch{PatchOp::Add, path({std::string("b")}), std::nullopt}});
        REQUIRE(result.error().is_patch_error(arbor_core::PatchError::Kind::MissingValue));
    }

    SECTION("index out of range") {
        auto result = producer.try_apply_patches(base, {Patch::replace(path({std::string("list"), std::size_t{3}}), 1)});
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == arbor_core::ErrorCode::NotFound);
    }

    SECTION("failed application leaves no open scope") {
        (void)producer.try_apply_patches(base, {Patch::remove(path({std::string("zzz")}))});
        REQUIRE(producer.scopes().current() == nullptr);
    }
}

// =============================================================================
// JSON wire format
// =============================================================================

TEST_CASE("Patch JSON", "[tree][patch][json]") {
    SECTION("to json") {
        Json j = patch_to_json(Patch::add(path({std::string("list"), std::size_t{1}}), "x"));
        REQUIRE(j.dump() == R"({"op":"add","path":["list",1],"value":"x"})");

        Json removal = patch_to_json(Patch::remove(path({std::string("a")})));
        REQUIRE_FALSE(removal.contains("value"));
    }

    SECTION("from json") {
        Patch patch = patch_from_json(Json::parse(R"({"op":"replace","path":["a",0],"value":{"k":1}})"));
        REQUIRE(patch.op == PatchOp::Replace);
        REQUIRE(patch.path == path({std::string("a"), std::size_t{0}}));
        REQUIRE(*patch.value == Value::mapping({{"k", 1}}));
    }

    SECTION("unknown op is rejected") {
        try {
            (void)patch_from_json(Json::parse(R"({"op":"move","path":[]})"));
            FAIL("expected an unknown op error");
        } catch (const arbor_core::Exception& e) {
            REQUIRE(e.error().is_patch_error(arbor_core::PatchError::Kind::UnknownOp));
        }
    }

    SECTION("bad path is a parse error") {
        try {
            (void)patch_from_json(Json::parse(R"({"op":"add","path":[-1],"value":1})"));
            FAIL("expected a parse error");
        } catch (const arbor_core::Exception& e) {
            REQUIRE(e.code() == arbor_core::ErrorCode::ParseError);
        }
    }

    SECTION("patch lists survive the wire") {
        std::vector<Patch> patches{
            Patch::replace(path({std::string("a")}), 1.5),
            Patch::remove(path({std::string("b"), std::size_t{0}}))
        };
        REQUIRE(patches_from_json(Json::parse(patches_to_json(patches).dump())) == patches);
    }

    SECTION("a NaN assignment cannot be sent as null") {
        Producer producer;
        Recorded rec;
        Value base = Value::mapping({{"x", 1}});
        (void)producer.produce(base, [](Draft& draft) {
            draft.set("x", std::numeric_limits<double>::quiet_NaN());
        }, rec.listener());

        REQUIRE(rec.patches.size() == 1);
        try {
            (void)patches_to_json(rec.patches);
            FAIL("expected an invalid argument error");
        } catch (const arbor_core::Exception& e) {
            REQUIRE(e.code() == arbor_core::ErrorCode::InvalidArgument);
        }
        // The inverse carries only finite values
        REQUIRE(patches_to_json(rec.inverse).dump() == R"([{"op":"replace","path":["x"],"value":1}])");
    }
}
