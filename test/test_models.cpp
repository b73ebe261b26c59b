#include <catch2/catch_all.hpp>
#include <memory>
#include <sstream>
#include <mk/modelkit.h>

using namespace mk;

static ModelClassPtr make_person(ModelBuilder builder = ModelBuilder("Person")) {
    return builder.field("name", std::make_shared<StringField>())
                .field("age", std::make_shared<IntegralField>(Bounds{0, Dictionary::null()}))
                .field("siblings", std::make_shared<ListField>(std::make_shared<StringField>()))
                .build();
}

static Dictionary person_data() {
    return Dictionary{{"name", "Joe Shmoe"},
                      {"age", 21},
                      {"siblings", std::vector<std::string>{"Dick Shmoe", "Jane Shmoe"}}};
}

TEST_CASE("non-field declarations are kept as class attributes", "[model][schema]") {
    auto foo = ModelBuilder("Foo").attribute("unrelated", 2).attribute("notafield", 3).build();

    REQUIRE(foo->attribute("unrelated").has_value());
    REQUIRE(foo->attribute("unrelated")->asInt() == 2);
    REQUIRE(foo->attribute("notafield")->asInt() == 3);
    REQUIRE_FALSE(foo->attribute("missing").has_value());
    REQUIRE_FALSE(foo->hasField("unrelated"));
    REQUIRE(foo->fields().empty());
}

TEST_CASE("declared fields land in the field table", "[model][schema]") {
    auto field1 = std::make_shared<StringField>();
    auto foo = ModelBuilder("Foo")
                           .field("field1", field1)
                           .field("field2", std::make_shared<IntegralField>())
                           .attribute("unrelated", "string")
                           .build();

    REQUIRE(foo->name() == "Foo");
    REQUIRE(foo->fieldNames() == std::vector<std::string>{"field1", "field2"});
    REQUIRE(foo->field("field1") == field1);
    REQUIRE(foo->field("field1")->kind() == "StringField");
    REQUIRE(foo->field("field2")->kind() == "IntegralField");
    REQUIRE_FALSE(foo->hasField("unrelated"));

    // fields learn the name they were declared under
    REQUIRE(field1->name() == "field1");
    REQUIRE(foo->field("field2")->name() == "field2");

    REQUIRE_THROWS_AS(foo->field("field3"), std::out_of_range);
}

TEST_CASE("an empty model is valid", "[model][schema]") {
    auto foo = ModelBuilder("Foo").build();
    REQUIRE(foo->fields().empty());
    Model f = foo->construct();
    REQUIRE(f.toDict().empty());
    REQUIRE_NOTHROW(f.validate());
    REQUIRE(f.repr() == "Foo()");
}

TEST_CASE("builder rejects malformed declarations", "[model][schema]") {
    REQUIRE_THROWS_AS(ModelBuilder(""), std::invalid_argument);
    ModelBuilder b("Foo");
    REQUIRE_THROWS_AS(b.field("", std::make_shared<StringField>()), std::invalid_argument);
    REQUIRE_THROWS_AS(b.field("x", nullptr), std::invalid_argument);
    REQUIRE_THROWS_AS(b.inherits(nullptr), std::invalid_argument);
    REQUIRE_THROWS_AS(b.attribute("allow_unknown_data", "no"), std::invalid_argument);
}

TEST_CASE("a field object is declared under one name only", "[model][schema]") {
    auto tags = std::make_shared<ListField>(std::make_shared<IntegralField>());
    auto a = ModelBuilder("A").field("tags", tags).build();

    // the same name in another class is fine
    auto c = ModelBuilder("C").field("tags", tags).build();
    REQUIRE(c->field("tags") == a->field("tags"));

    REQUIRE_THROWS_AS(ModelBuilder("B").field("labels", tags).build(), std::invalid_argument);
    REQUIRE(tags->name() == "tags");

    Model m = a->fromDict({{"tags", "nope"}});
    try {
        m.validate();
        FAIL("expected TypeMismatch");
    } catch (const TypeMismatch& e) {
        REQUIRE(e.field() == "tags");
    }
    m.set("tags", Dictionary::array({1, "x"}));
    try {
        m.validate();
        FAIL("expected TypeMismatch");
    } catch (const TypeMismatch& e) {
        REQUIRE(e.field() == "tags[]");
    }
}

TEST_CASE("redeclaring an own field keeps the last declaration", "[model][schema]") {
    auto foo = ModelBuilder("Foo")
                           .field("a", std::make_shared<StringField>())
                           .field("b", std::make_shared<StringField>())
                           .field("a", std::make_shared<IntegralField>())
                           .build();
    REQUIRE(foo->fieldNames() == std::vector<std::string>{"a", "b"});
    REQUIRE(foo->field("a")->kind() == "IntegralField");
}

TEST_CASE("construct initializes every declared field", "[model][construct]") {
    auto person = make_person();

    Model p = person->construct(person_data());
    REQUIRE(p.get("name").asString() == "Joe Shmoe");
    REQUIRE(p.get("age").asInt() == 21);
    REQUIRE(p.get("siblings").size() == 2);

    Model partial(person, {{"name", "Ann"}});
    REQUIRE(partial.get("name").asString() == "Ann");
    REQUIRE(partial.get("age").isNull());
    REQUIRE(partial.get("siblings").isNull());

    Model empty(person);
    for (auto const& n : person->fieldNames()) REQUIRE(empty.get(n).isNull());
}

TEST_CASE("construct rejects undeclared keywords", "[model][construct]") {
    auto person = make_person();
    try {
        person->construct({{"name", "Ann"}, {"nickname", "A"}});
        FAIL("expected UnexpectedKeyword");
    } catch (const UnexpectedKeyword& e) {
        REQUIRE(e.field() == "nickname");
        REQUIRE(e.kind() == FailureKind::UnexpectedKeyword);
    }

    // even when the class allows unknown data
    auto lenient = make_person(ModelBuilder("Lenient").allowUnknownData(true));
    REQUIRE_THROWS_AS(lenient->construct({{"extra", 1}}), UnexpectedKeyword);
    REQUIRE_THROWS_AS(Model(person, Dictionary::array({1})), std::invalid_argument);
}

TEST_CASE("construct does not validate", "[model][construct]") {
    auto person = make_person();
    Model p = person->construct({{"age", "lots"}});
    REQUIRE(p.get("age").asString() == "lots");
    REQUIRE_THROWS_AS(p.validate(), ValidationFailure);
}

TEST_CASE("fromDict copies data verbatim", "[model][fromdict]") {
    auto person = make_person();

    SECTION("data coincides with fields") {
        Model p1 = person->fromDict(person_data());
        REQUIRE(p1.get("name").asString() == "Joe Shmoe");
        REQUIRE(p1.get("age").asInt() == 21);
        REQUIRE(p1.get("siblings") == Dictionary(std::vector<std::string>{"Dick Shmoe", "Jane Shmoe"}));
    }
    SECTION("data does not coincide with fields") {
        Model p2 = person->fromDict({{"notaname", 2}, {"age", "lots"}});
        REQUIRE(p2.get("notaname").asInt() == 2);
        REQUIRE(p2.get("age").asString() == "lots");
        REQUIRE(p2.get("name").isNull());
        REQUIRE(p2.get("siblings").isNull());
    }
    SECTION("no data at all") {
        Model p3 = person->fromDict(Dictionary());
        REQUIRE(p3.get("name").isNull());
        REQUIRE(p3.get("age").isNull());
        REQUIRE(p3.get("siblings").isNull());
    }
    SECTION("a strict class still imports unknown data") {
        auto strict = make_person(ModelBuilder("Strict").allowUnknownData(false));
        Model p4 = strict->fromDict({{"chocolate", "chips"}});
        REQUIRE(p4.has("chocolate"));
    }
    SECTION("only objects can be imported") {
        REQUIRE_THROWS_AS(person->fromDict("Joe"), std::invalid_argument);
        REQUIRE_THROWS_AS(Model::fromDict(person, Dictionary::null()), std::invalid_argument);
    }
}

TEST_CASE("toDict returns declared and unknown attributes", "[model][todict]") {
    auto person = make_person();

    Dictionary data1 = person_data();
    Model p1 = person->construct(data1);
    REQUIRE(p1.toDict() == data1);

    // round trip through fromDict
    REQUIRE(person->fromDict(data1).toDict() == data1);

    // defined but unset fields are present as null
    Model p2 = person->fromDict({{"notaname", 2}, {"age", "lots"}});
    Dictionary expected = {{"notaname", 2}, {"age", "lots"}, {"name", Dictionary::null()},
                           {"siblings", Dictionary::null()}};
    REQUIRE(p2.toDict() == expected);

    // a snapshot, not a view
    Dictionary snapshot = p1.toDict();
    p1.set("age", 22);
    REQUIRE(snapshot.at("age").asInt() == 21);
}

TEST_CASE("validate checks each field", "[model][validate]") {
    auto person = make_person();

    Model p1 = person->construct(person_data());
    REQUIRE_NOTHROW(p1.validate());

    SECTION("null in a non-nullable field") {
        p1.set("name", Dictionary::null());
        try {
            p1.validate();
            FAIL("expected NullNotAllowed");
        } catch (const NullNotAllowed& e) {
            REQUIRE(e.field() == "name");
        }
    }
    SECTION("wrong type") {
        p1.set("age", "lots");
        try {
            p1.validate();
            FAIL("expected TypeMismatch");
        } catch (const TypeMismatch& e) {
            REQUIRE(e.field() == "age");
            REQUIRE(e.expected() == "integer");
            REQUIRE(e.actual() == "string");
        }
    }
    SECTION("out of bounds") {
        p1["age"] = -1;
        REQUIRE_THROWS_AS(p1.validate(), OutOfBounds);
    }
    SECTION("bad list element") {
        p1["siblings"] = Dictionary::array({"Dick Shmoe", 7});
        try {
            p1.validate();
            FAIL("expected TypeMismatch");
        } catch (const TypeMismatch& e) {
            REQUIRE(e.field() == "siblings[]");
        }
    }
}

TEST_CASE("validate stops at the first failing field", "[model][validate]") {
    auto pair = ModelBuilder("Pair")
                            .field("first", std::make_shared<StringField>())
                            .field("second", std::make_shared<StringField>())
                            .build();
    Model p = pair->construct({{"first", 1}, {"second", 2}});
    try {
        p.validate();
        FAIL("expected TypeMismatch");
    } catch (const TypeMismatch& e) {
        REQUIRE(e.field() == "first");
    }
}

TEST_CASE("validate is repeatable and side-effect free", "[model][validate]") {
    auto person = make_person();
    Model p = person->fromDict(person_data());
    Dictionary before = p.toDict();
    REQUIRE_NOTHROW(p.validate());
    REQUIRE_NOTHROW(p.validate());
    REQUIRE(p.toDict() == before);
}

TEST_CASE("unknown attributes follow the unknown-data policy", "[model][unknown]") {
    auto person = make_person();
    Dictionary data2 = person_data();
    data2["chocolate"] = "chips";

    Model p2 = person->fromDict(data2);
    REQUIRE_NOTHROW(p2.validate());
    REQUIRE_NOTHROW(p2.validate(true));
    try {
        p2.validate(false);
        FAIL("expected UnknownAttribute");
    } catch (const UnknownAttribute& e) {
        REQUIRE(e.field() == "chocolate");
    }

    SECTION("the class attribute sets the default") {
        auto strict = make_person(ModelBuilder("Person2").allowUnknownData(false));
        REQUIRE_FALSE(strict->allowUnknownData());
        Model p3 = strict->fromDict(data2);
        REQUIRE_THROWS_AS(p3.validate(), UnknownAttribute);
        // an explicit argument overrides the class default
        REQUIRE_NOTHROW(p3.validate(true));
    }
    SECTION("unknown data is reported before field failures") {
        p2.set("age", "lots");
        REQUIRE_THROWS_AS(p2.validate(false), UnknownAttribute);
        REQUIRE_THROWS_AS(p2.validate(), TypeMismatch);
    }
    SECTION("the default policy allows unknown data") {
        REQUIRE(person->allowUnknownData());
    }
}

TEST_CASE("a single-field model reports the extra attribute", "[model][unknown]") {
    auto named = ModelBuilder("Named").field("name", std::make_shared<StringField>()).build();
    Model m = named->fromDict({{"name", "x"}, {"extra", 1}});
    REQUIRE_NOTHROW(m.validate());
    try {
        m.validate(false);
        FAIL("expected UnknownAttribute");
    } catch (const UnknownAttribute& e) {
        REQUIRE(e.field() == "extra");
    }
}

TEST_CASE("assign honours the unknown-data policy", "[model][assign]") {
    auto person = make_person();
    Model p = person->construct();

    p.assign({{"name", "Ann"}, {"mood", "happy"}});
    REQUIRE(p.get("mood").asString() == "happy");

    Model q = person->construct();
    REQUIRE_THROWS_AS(q.assign({{"name", "Ann"}, {"mood", "happy"}}, false), UnknownAttribute);
    // nothing was copied
    REQUIRE(q.get("name").isNull());
    REQUIRE_FALSE(q.has("mood"));

    auto strict = make_person(ModelBuilder("Strict").allowUnknownData(false));
    Model s = strict->construct();
    REQUIRE_THROWS_AS(s.assign({{"mood", "happy"}}), UnknownAttribute);
    REQUIRE_NOTHROW(s.assign({{"mood", "happy"}}, true));
    REQUIRE_NOTHROW(s.assign({{"name", "Ann"}}));
    REQUIRE(s.get("name").asString() == "Ann");
}

TEST_CASE("repr lists declared fields", "[model][repr]") {
    auto person = make_person();
    Model p = person->construct({{"name", "Ann"}, {"age", 3}});
    p.set("mood", "happy");
    REQUIRE(p.repr() == R"(Person(name = "Ann", age = 3, siblings = null))");

    std::ostringstream ss;
    ss << p;
    REQUIRE(ss.str() == p.repr());
}

TEST_CASE("model classes describe their schema", "[model][schema]") {
    auto person = make_person();
    REQUIRE(person->describe() ==
            "Person { name: StringField, age: IntegralField(bounds=[0, null]), siblings: ListField(of=StringField) }");
    REQUIRE(ModelBuilder("Empty").build()->describe() == "Empty {}");
}
