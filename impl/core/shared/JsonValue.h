#pragma once

#ifndef JSON_VALUE_H
#define JSON_VALUE_H

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace TSON {
    // Untyped JSON tree. Children are owned by the containers, so the
    // tree never shares nodes.
    class JsonValue {
    public:
        using array_t  = std::vector<JsonValue>;
        // unordered, last key wins. Held through a pointer: the map may only
        // be instantiated once JsonValue is complete.
        using object_t = std::unordered_map<std::string, JsonValue>;

        enum class Type { Null, Bool, Number, String, Array, Object };

        JsonValue() = default;
        JsonValue(const JsonValue& other);
        JsonValue(JsonValue&& other) noexcept;
        JsonValue& operator=(const JsonValue& other);
        // A moved-from value is Null
        JsonValue& operator=(JsonValue&& other) noexcept;
        ~JsonValue();

        static JsonValue Null()                 { return {}; }
        static JsonValue Bool(bool v)           { JsonValue x; x.type = Type::Bool;   x.b = v; return x; }
        static JsonValue Number(double v)       { JsonValue x; x.type = Type::Number; x.n = v; return x; }
        static JsonValue String(std::string v)  { JsonValue x; x.type = Type::String; x.s = std::move(v); return x; }
        static JsonValue Array(array_t v)       { JsonValue x; x.type = Type::Array;  x.a = std::move(v); return x; }
        static JsonValue Object(object_t v);

        Type getType() const { return type; }

        bool isNull()   const { return type == Type::Null; }
        bool isBool()   const { return type == Type::Bool; }
        bool isNumber() const { return type == Type::Number; }
        bool isString() const { return type == Type::String; }
        bool isArray()  const { return type == Type::Array; }
        bool isObject() const { return type == Type::Object; }

        // Typed access. Throws std::logic_error when the value holds another type.
        bool asBool() const;
        double asNumber() const;
        const std::string& asString() const;
        const array_t& asArray() const;
        array_t& asArray();
        const object_t& asObject() const;
        object_t& asObject();

        // Array indexing throws std::out_of_range if idx >= size().
        // Object indexing throws std::out_of_range if the key is not present.
        const JsonValue& operator[](std::size_t idx) const;
        const JsonValue& operator[](std::string_view key) const;

        // Requires Array or Object.
        std::size_t size() const;
        // Requires Object.
        bool contains(std::string_view key) const;

        static const char* typeName(Type t) noexcept;
        const char* typeName() const noexcept { return typeName(type); }

        bool operator==(const JsonValue& other) const;
        bool operator!=(const JsonValue& other) const { return !(*this == other); }

    protected:
        Type        type = Type::Null;
        bool        b    = false;
        double      n    = 0.0;
        std::string s;
        array_t     a;
        std::unique_ptr<object_t> o;
    };

    // Quote and escape a string for JSON output.
    std::string escape(std::string_view s);

    // Render a tree as JSON text. Compact when indent < 0, otherwise one
    // member per line indented by `indent` spaces per level. Object keys are
    // written in sorted order.
    std::string dump(const JsonValue& v, int indent = -1);
};

#endif
