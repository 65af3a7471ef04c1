#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "TestCases.h"

namespace TsonTest {
    namespace {
        using TSON::JsonValue;

        std::string randomString(std::mt19937& rng) {
            static const std::vector<std::string> pieces = {
                "a", "Z", "0", " ", "_", "\"", "\\", "/", "\n", "\t", "\r", "\b", "\f",
                std::string(1, '\x01'), std::string(1, '\x1F'), "\xC2\xA9", "\xE2\x82\xAC", "\xF0\x9F\x98\x80"
            };
            std::uniform_int_distribution<size_t> length(0, 8);
            std::uniform_int_distribution<size_t> pick(0, pieces.size() - 1);
            std::string out;
            for (size_t i = length(rng); i > 0; --i) {
                out += pieces[pick(rng)];
            }
            return out;
        }

        double randomNumber(std::mt19937& rng) {
            switch (std::uniform_int_distribution<int>(0, 3)(rng)) {
            case 0: return static_cast<double>(std::uniform_int_distribution<int>(-1000000, 1000000)(rng));
            case 1: return std::uniform_real_distribution<double>(-1.0, 1.0)(rng);
            case 2: return std::uniform_real_distribution<double>(-1e12, 1e12)(rng);
            default: return std::uniform_real_distribution<double>(-1e-12, 1e-12)(rng);
            }
        }

        JsonValue randomTree(std::mt19937& rng, int depth) {
            int maxKind = depth > 0 ? 5 : 3;
            switch (std::uniform_int_distribution<int>(0, maxKind)(rng)) {
            case 0: return JsonValue::Null();
            case 1: return JsonValue::Bool(std::uniform_int_distribution<int>(0, 1)(rng) == 1);
            case 2: return JsonValue::Number(randomNumber(rng));
            case 3: return JsonValue::String(randomString(rng));
            case 4: {
                JsonValue::array_t elements;
                for (int i = std::uniform_int_distribution<int>(0, 4)(rng); i > 0; --i) {
                    elements.push_back(randomTree(rng, depth - 1));
                }
                return JsonValue::Array(std::move(elements));
            }
            default: {
                JsonValue::object_t members;
                for (int i = std::uniform_int_distribution<int>(0, 4)(rng); i > 0; --i) {
                    members.insert_or_assign(randomString(rng), randomTree(rng, depth - 1));
                }
                return JsonValue::Object(std::move(members));
            }
            }
        }

        template <typename Fn>
        bool throwsLogicError(Fn&& fn) {
            try {
                fn();
            }
            catch (const std::out_of_range&) {
                return false;
            }
            catch (const std::logic_error&) {
                return true;
            }
            return false;
        }

        template <typename Fn>
        bool throwsOutOfRange(Fn&& fn) {
            try {
                fn();
            }
            catch (const std::out_of_range&) {
                return true;
            }
            return false;
        }
    }

    std::vector<TestCase> ValueTests() {
        return {
            { "value/accessors", [](Failures& failures) {
                auto doc = TSON::parse<JsonValue>(R"({"list": [1, "two", false], "nested": {"k": null}})");
                if (!doc) {
                    failures.push_back(doc.error().toString());
                    return;
                }
                const JsonValue& root = *doc;
                Check(failures, root.isObject() && root.size() == 2, "root is a two member object");
                Check(failures, root.contains("list") && !root.contains("missing"), "contains");
                Check(failures, root["list"].isArray() && root["list"].size() == 3, "list");
                Check(failures, root["list"][0].asNumber() == 1.0, "list[0]");
                Check(failures, root["list"][1].asString() == "two", "list[1]");
                Check(failures, root["list"][2].isBool() && !root["list"][2].asBool(), "list[2]");
                Check(failures, root["nested"]["k"].isNull(), "nested null");
                Check(failures, std::string(root["list"].typeName()) == "Array", "type name");
            } },
            { "value/accessor errors", [](Failures& failures) {
                const JsonValue number = JsonValue::Number(1);
                const JsonValue array = JsonValue::Array({ JsonValue::Null() });
                const JsonValue object = JsonValue::Object({ { "a", JsonValue::Null() } });
                Check(failures, throwsLogicError([&] { (void)number.asString(); }), "asString on a number");
                Check(failures, throwsLogicError([&] { (void)array.asObject(); }), "asObject on an array");
                Check(failures, throwsLogicError([&] { (void)number.size(); }), "size on a number");
                Check(failures, throwsLogicError([&] { (void)object[0]; }), "index into an object");
                Check(failures, throwsOutOfRange([&] { (void)array[1]; }), "index past the end");
                Check(failures, throwsOutOfRange([&] { (void)object["b"]; }), "missing key");
            } },
            { "value/equality", [](Failures& failures) {
                auto a = TSON::parse<JsonValue>(R"({"x": 1, "y": [true, null]})");
                auto b = TSON::parse<JsonValue>(R"({"y": [true, null], "x": 1})");
                auto c = TSON::parse<JsonValue>(R"({"y": [null, true], "x": 1})");
                if (!a || !b || !c) {
                    failures.push_back("fixture documents must parse");
                    return;
                }
                Check(failures, *a == *b, "object equality ignores member order");
                Check(failures, *a != *c, "array equality respects element order");
                Check(failures, JsonValue::Number(0) != JsonValue::Bool(false), "different types are never equal");
            } },
            { "value/copy and move", [](Failures& failures) {
                auto doc = TSON::parse<JsonValue>(R"({"inner": {"k": [1, {"deep": true}]}, "n": 2})");
                if (!doc) {
                    failures.push_back(doc.error().toString());
                    return;
                }

                JsonValue copy = *doc;
                copy.asObject().erase("n");
                copy.asObject()["inner"].asObject()["extra"] = JsonValue::Null();
                Check(failures, doc->contains("n") && doc->size() == 2, "copy does not share the outer object");
                Check(failures, !(*doc)["inner"].contains("extra"), "copy does not share nested objects");

                JsonValue assigned;
                assigned = *doc;
                Check(failures, assigned == *doc, "copy assignment is equal to its source");

                JsonValue moved = std::move(copy);
                Check(failures, moved.isObject() && moved.size() == 1, "move keeps the object");
                Check(failures, copy.isNull(), "moved-from value is null");

                // Replace a tree by one of its own children
                moved = std::move(moved.asObject()["inner"]);
                Check(failures, moved.isObject() && moved.contains("k") && moved.contains("extra"),
                    "assigning from a child keeps the child");
                moved = moved["k"];
                Check(failures, moved.isArray() && moved.size() == 2 && moved[1]["deep"].asBool(),
                    "copy assigning from a child keeps the child");
            } },
            { "value/dump compact", [](Failures& failures) {
                auto doc = TSON::parse<JsonValue>(R"({"b": [1, 2.5, -3e-7], "a": {"z": null, "y": true}, "c": "q\"\\\n\u0001"})");
                if (!doc) {
                    failures.push_back(doc.error().toString());
                    return;
                }
                auto text = TSON::dump(*doc);
                const std::string expected = R"({"a":{"y":true,"z":null},"b":[1,2.5,-3e-07],"c":"q\"\\\n\u0001"})";
                Check(failures, text == expected, "compact dump is " + Quote(text));
            } },
            { "value/dump pretty", [](Failures& failures) {
                auto doc = TSON::parse<JsonValue>(R"({"k": [1, {}], "e": []})");
                if (!doc) {
                    failures.push_back(doc.error().toString());
                    return;
                }
                auto text = TSON::dump(*doc, 2);
                const std::string expected =
                    "{\n"
                    "  \"e\": [],\n"
                    "  \"k\": [\n"
                    "    1,\n"
                    "    {}\n"
                    "  ]\n"
                    "}";
                Check(failures, text == expected, "pretty dump is " + Quote(text));
            } },
            { "value/escape", [](Failures& failures) {
                Check(failures, TSON::escape("plain") == "\"plain\"", "plain text");
                Check(failures, TSON::escape("\b\f\r\t") == "\"\\b\\f\\r\\t\"", "short escapes");
                Check(failures, TSON::escape(std::string(1, '\x1F')) == "\"\\u001F\"", "control characters");
                Check(failures, TSON::escape(std::string(1, '\0')) == "\"\\u0000\"", "nul");
                Check(failures, TSON::escape("\"\\/\x7F") == "\"\\\"\\\\/\x7F\"", "quote, backslash, solidus and DEL");
                Check(failures, TSON::escape("\xC2\xA9") == "\"\xC2\xA9\"", "UTF-8 is written as is");
            } },
            { "value/random round trip", [](Failures& failures) {
                std::mt19937 rng(20240229);
                for (int i = 0; i < 200; ++i) {
                    auto tree = randomTree(rng, 4);
                    for (int indent : { -1, 0, 3 }) {
                        auto text = TSON::dump(tree, indent);
                        auto parsed = TSON::parse<JsonValue>(text);
                        if (!parsed) {
                            failures.push_back("iteration " + std::to_string(i) + ": " + parsed.error().toString());
                            return;
                        }
                        if (*parsed != tree) {
                            failures.push_back("iteration " + std::to_string(i) + ": round trip changed " + Quote(text));
                            return;
                        }
                    }
                }
            } },
        };
    }
}
