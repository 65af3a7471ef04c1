#include <algorithm>
#include <charconv>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>
#include "JsonValue.h"

namespace TSON {
    JsonValue::JsonValue(const JsonValue& other)
        : type(other.type), b(other.b), n(other.n), s(other.s), a(other.a),
          o(other.o ? std::make_unique<object_t>(*other.o) : nullptr) {}

    JsonValue::JsonValue(JsonValue&& other) noexcept
        : type(other.type), b(other.b), n(other.n), s(std::move(other.s)), a(std::move(other.a)),
          o(std::move(other.o)) {
        other.type = Type::Null;
    }

    JsonValue& JsonValue::operator=(JsonValue&& other) noexcept {
        // `other` may live inside this tree, so the old contents are released
        // only after it has been taken.
        JsonValue taken(std::move(other));
        type = taken.type;
        b = taken.b;
        n = taken.n;
        s.swap(taken.s);
        a.swap(taken.a);
        o.swap(taken.o);
        return *this;
    }

    JsonValue& JsonValue::operator=(const JsonValue& other) {
        if (this != &other) {
            JsonValue copy(other);
            *this = std::move(copy);
        }
        return *this;
    }

    JsonValue::~JsonValue() = default;

    JsonValue JsonValue::Object(object_t v) {
        JsonValue x;
        x.type = Type::Object;
        x.o = std::make_unique<object_t>(std::move(v));
        return x;
    }

    const char* JsonValue::typeName(Type t) noexcept {
        switch (t) {
        case Type::Null:   return "Null";
        case Type::Bool:   return "Bool";
        case Type::Number: return "Number";
        case Type::String: return "String";
        case Type::Array:  return "Array";
        case Type::Object: return "Object";
        }
        return "?";
    }

    bool JsonValue::asBool() const {
        if (!isBool()) throw std::logic_error(std::string("TSON::JsonValue: asBool() requires Bool, got ") + typeName());
        return b;
    }

    double JsonValue::asNumber() const {
        if (!isNumber()) throw std::logic_error(std::string("TSON::JsonValue: asNumber() requires Number, got ") + typeName());
        return n;
    }

    const std::string& JsonValue::asString() const {
        if (!isString()) throw std::logic_error(std::string("TSON::JsonValue: asString() requires String, got ") + typeName());
        return s;
    }

    const JsonValue::array_t& JsonValue::asArray() const {
        if (!isArray()) throw std::logic_error(std::string("TSON::JsonValue: asArray() requires Array, got ") + typeName());
        return a;
    }

    JsonValue::array_t& JsonValue::asArray() {
        if (!isArray()) throw std::logic_error(std::string("TSON::JsonValue: asArray() requires Array, got ") + typeName());
        return a;
    }

    const JsonValue::object_t& JsonValue::asObject() const {
        if (!isObject()) throw std::logic_error(std::string("TSON::JsonValue: asObject() requires Object, got ") + typeName());
        return *o;
    }

    JsonValue::object_t& JsonValue::asObject() {
        if (!isObject()) throw std::logic_error(std::string("TSON::JsonValue: asObject() requires Object, got ") + typeName());
        return *o;
    }

    const JsonValue& JsonValue::operator[](std::size_t idx) const {
        if (!isArray()) {
            throw std::logic_error(std::string("TSON::JsonValue: operator[](size_t) requires Array, got ")
                                   + typeName());
        }
        if (idx >= a.size()) {
            throw std::out_of_range("TSON::JsonValue: array index out of range");
        }
        return a[idx];
    }

    const JsonValue& JsonValue::operator[](std::string_view key) const {
        if (!isObject()) {
            throw std::logic_error(std::string("TSON::JsonValue: operator[](string_view) requires Object, got ")
                                   + typeName());
        }
        auto it = o->find(std::string(key));
        if (it == o->end()) {
            throw std::out_of_range("TSON::JsonValue: key not found");
        }
        return it->second;
    }

    std::size_t JsonValue::size() const {
        if (isArray())  return a.size();
        if (isObject()) return o->size();
        throw std::logic_error(std::string("TSON::JsonValue: size() requires Array or Object, got ")
                               + typeName());
    }

    bool JsonValue::contains(std::string_view key) const {
        if (!isObject()) {
            throw std::logic_error(std::string("TSON::JsonValue: contains() requires Object, got ")
                                   + typeName());
        }
        return o->find(std::string(key)) != o->end();
    }

    bool JsonValue::operator==(const JsonValue& other) const {
        if (type != other.type) return false;
        switch (type) {
        case Type::Null:   return true;
        case Type::Bool:   return b == other.b;
        case Type::Number: return n == other.n;
        case Type::String: return s == other.s;
        case Type::Array:  return a == other.a;
        case Type::Object: return *o == *other.o;
        }
        return false;
    }

    namespace {
        // Two character escape for c, or nullptr if it has none.
        const char* shortEscape(unsigned char c) {
            switch (c) {
            case '"':  return "\\\"";
            case '\\': return "\\\\";
            case '\b': return "\\b";
            case '\f': return "\\f";
            case '\n': return "\\n";
            case '\r': return "\\r";
            case '\t': return "\\t";
            default:   return nullptr;
            }
        }

        void escapeString(std::string& out, std::string_view s) {
            constexpr const char* HEX = "0123456789ABCDEF";

            out.push_back('"');
            for (unsigned char c : s) {
                if (const char* escaped = shortEscape(c)) {
                    out += escaped;
                }
                else if (c < 0x20) {
                    out += "\\u00";
                    out.push_back(HEX[c >> 4]);
                    out.push_back(HEX[c & 0x0F]);
                }
                else {
                    out.push_back(static_cast<char>(c));
                }
            }
            out.push_back('"');
        }

        // Shortest text that reads back to the same double.
        void emitNumber(double d, std::string& out) {
            char buf[32];
            auto res = std::to_chars(buf, buf + sizeof(buf), d);
            if (res.ec != std::errc()) {
                throw std::logic_error("TSON::dump: number cannot be rendered");
            }
            out.append(buf, res.ptr);
        }

        void newline(std::string& out, int indent, int depth) {
            if (indent < 0) return;
            out.push_back('\n');
            out.append(static_cast<std::size_t>(indent) * static_cast<std::size_t>(depth), ' ');
        }

        void dumpImpl(const JsonValue& v, std::string& out, int indent, int depth) {
            switch (v.getType()) {
            case JsonValue::Type::Null:   out += "null"; break;
            case JsonValue::Type::Bool:   out += (v.asBool() ? "true" : "false"); break;
            case JsonValue::Type::Number: emitNumber(v.asNumber(), out); break;
            case JsonValue::Type::String: escapeString(out, v.asString()); break;
            case JsonValue::Type::Array: {
                const auto& arr = v.asArray();
                out.push_back('[');
                for (std::size_t i = 0; i < arr.size(); ++i) {
                    if (i) out.push_back(',');
                    newline(out, indent, depth + 1);
                    dumpImpl(arr[i], out, indent, depth + 1);
                }
                if (!arr.empty()) newline(out, indent, depth);
                out.push_back(']');
            } break;
            case JsonValue::Type::Object: {
                const auto& obj = v.asObject();
                std::vector<const JsonValue::object_t::value_type*> members;
                members.reserve(obj.size());
                for (const auto& member : obj) members.push_back(&member);
                std::sort(members.begin(), members.end(), [](const auto* lhs, const auto* rhs) {
                    return lhs->first < rhs->first;
                });
                out.push_back('{');
                for (std::size_t i = 0; i < members.size(); ++i) {
                    if (i) out.push_back(',');
                    newline(out, indent, depth + 1);
                    escapeString(out, members[i]->first);
                    out.push_back(':');
                    if (indent >= 0) out.push_back(' ');
                    dumpImpl(members[i]->second, out, indent, depth + 1);
                }
                if (!members.empty()) newline(out, indent, depth);
                out.push_back('}');
            } break;
            }
        }
    }

    std::string escape(std::string_view s) {
        std::string out;
        escapeString(out, s);
        return out;
    }

    std::string dump(const JsonValue& v, int indent) {
        std::string out;
        out.reserve(128);
        dumpImpl(v, out, indent, 0);
        return out;
    }
}
