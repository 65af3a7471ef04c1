#pragma once

#ifndef TSON_RECORD_H
#define TSON_RECORD_H

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include "../shared/Token.h"
#include "../shared/ParserErr.h"
#include "TsonParser.h"

// Record binding. A record type opts in by specializing TSON::Schema with its
// field list, in declaration order:
//
//     template <>
//     struct TSON::Schema<Person> {
//         static constexpr auto fields = TSON::Fields(
//             TSON_FIELD(Person, name),
//             TSON_FIELD(Person, age));
//     };
//
// Every listed field is required. A std::optional member accepts null but the
// key itself must still be present. Records must be default constructible.
// TSON_FIELD_AS binds a member to a key spelled differently from the member.
#define TSON_FIELD(Record, member) ::TSON::MakeField(#member, &Record::member)
#define TSON_FIELD_AS(Record, member, key) ::TSON::MakeField(key, &Record::member)

namespace TSON {
    template <typename T>
    Result<T> parseValue(TSONParser::Parser& parser);

    template <typename Record, typename Member>
    struct Field {
        using record_type = Record;
        using member_type = Member;

        std::string_view name;
        Member Record::* member;
    };

    template <typename Record, typename Member>
    constexpr Field<Record, Member> MakeField(std::string_view name, Member Record::* member) {
        return Field<Record, Member>{ name, member };
    }

    template <typename... Fs>
    constexpr std::tuple<Fs...> Fields(Fs... fields) {
        return std::tuple<Fs...>(fields...);
    }

    template <typename T>
    struct Schema {};

    template <typename T>
    inline constexpr bool IsRecord = requires { Schema<T>::fields; };

    namespace RecordImpl {
        template <typename T>
        using FieldsOf = std::remove_cv_t<decltype(Schema<T>::fields)>;

        template <typename T>
        inline constexpr std::size_t FieldCount = std::tuple_size_v<FieldsOf<T>>;

        template <typename Tuple>
        struct PresenceSlots;

        template <typename... Fs>
        struct PresenceSlots<std::tuple<Fs...>> {
            using type = std::tuple<std::optional<typename Fs::member_type>...>;
        };

        // One unset slot per field until its key has been parsed
        template <typename T>
        using PresenceSlotsOf = typename PresenceSlots<FieldsOf<T>>::type;

        // Parses the value for `key` into its slot if the key names a field.
        // A repeated key overwrites the earlier value.
        template <typename T, std::size_t I = 0>
        std::optional<ParserErr> assignField(TSONParser::Parser& parser, std::string_view key,
                                             PresenceSlotsOf<T>& slots, bool& matched) {
            if constexpr (I < FieldCount<T>) {
                const auto& field = std::get<I>(Schema<T>::fields);
                if (field.name != key) {
                    return assignField<T, I + 1>(parser, key, slots, matched);
                }

                matched = true;
                using Member = typename std::tuple_element_t<I, FieldsOf<T>>::member_type;
                auto value = parseValue<Member>(parser);
                if (!value) return value.error();

                std::get<I>(slots).emplace(std::move(value).value());
                return std::nullopt;
            }
            else {
                return std::nullopt;
            }
        }

        template <typename T, std::size_t I = 0>
        std::optional<std::string_view> firstMissing(const PresenceSlotsOf<T>& slots) {
            if constexpr (I < FieldCount<T>) {
                if (!std::get<I>(slots).has_value()) {
                    return std::get<I>(Schema<T>::fields).name;
                }
                return firstMissing<T, I + 1>(slots);
            }
            else {
                return std::nullopt;
            }
        }

        template <typename T, std::size_t... I>
        T buildRecord(PresenceSlotsOf<T>& slots, std::index_sequence<I...>) {
            T record{};
            ((record.*(std::get<I>(Schema<T>::fields).member) = std::move(*std::get<I>(slots))), ...);
            return record;
        }
    }

    template <typename T>
    Result<T> parseRecord(TSONParser::Parser& parser) {
        static_assert(std::is_default_constructible_v<T>, "TSON record types must be default constructible");

        auto open = parser.consume(Token::Kind::LBrace);
        if (!open) return open.error();

        RecordImpl::PresenceSlotsOf<T> slots;

        auto err = parser.parseDelimited(Token::Kind::RBrace, [&]() -> std::optional<ParserErr> {
            auto key = parser.memberKey();
            if (!key) return key.error();

            bool matched = false;
            if (auto fieldErr = RecordImpl::assignField<T>(parser, key->decoded, slots, matched)) {
                return fieldErr;
            }
            if (!matched) {
                return parser.makeErrFromToken(ErrorCode::UnknownProperty, *key);
            }
            return std::nullopt;
        });
        if (err) return *err;

        // No better position than the opening brace for a field that never appeared
        if (auto missing = RecordImpl::firstMissing<T>(slots)) {
            return parser.makeErrFromToken(ParserErrKind::MissingProperty(std::string(*missing)), *open);
        }

        return RecordImpl::buildRecord<T>(slots, std::make_index_sequence<RecordImpl::FieldCount<T>>{});
    }
};

#endif
