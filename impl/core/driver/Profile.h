#pragma once

#ifndef PROFILE_H
#define PROFILE_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "../shared/Components.h"

// Sample record family bound with TSON::Schema, read by `tson --profile`.
namespace Profile {
    struct Address {
        std::string street;
        std::string city;
        std::string zipcode;
        std::string country;
    };

    struct Contact {
        std::string email;
        std::string phone;
        Address address;
    };

    struct Notifications {
        bool email = false;
        bool sms = false;
    };

    struct Preferences {
        Notifications notifications;
        std::string theme;
        std::string language;
    };

    struct History {
        std::string login;
        std::string ip;
        bool success = false;
    };

    struct Numbers {
        int64_t intValue = 0;
        double floatValue = 0;
        double scientific = 0;
        double scientificNoDecimal = 0;
        int64_t negative = 0;
        double negativeScientific = 0;
    };

    struct Root {
        std::string name;
        uint32_t age = 0;
        bool isVerified = false;
        double balance = 0;
        std::optional<std::string> nickname;
        Contact contact;
        Preferences preferences;
        std::vector<std::string> tags;
        std::vector<History> history;
        std::string unicodeExample;
        Numbers numbers;
    };
};

namespace TSON {
    template <>
    struct Schema<Profile::Address> {
        static constexpr auto fields = Fields(
            TSON_FIELD(Profile::Address, street),
            TSON_FIELD(Profile::Address, city),
            TSON_FIELD(Profile::Address, zipcode),
            TSON_FIELD(Profile::Address, country));
    };

    template <>
    struct Schema<Profile::Contact> {
        static constexpr auto fields = Fields(
            TSON_FIELD(Profile::Contact, email),
            TSON_FIELD(Profile::Contact, phone),
            TSON_FIELD(Profile::Contact, address));
    };

    template <>
    struct Schema<Profile::Notifications> {
        static constexpr auto fields = Fields(
            TSON_FIELD(Profile::Notifications, email),
            TSON_FIELD(Profile::Notifications, sms));
    };

    template <>
    struct Schema<Profile::Preferences> {
        static constexpr auto fields = Fields(
            TSON_FIELD(Profile::Preferences, notifications),
            TSON_FIELD(Profile::Preferences, theme),
            TSON_FIELD(Profile::Preferences, language));
    };

    template <>
    struct Schema<Profile::History> {
        static constexpr auto fields = Fields(
            TSON_FIELD(Profile::History, login),
            TSON_FIELD(Profile::History, ip),
            TSON_FIELD(Profile::History, success));
    };

    template <>
    struct Schema<Profile::Numbers> {
        static constexpr auto fields = Fields(
            TSON_FIELD_AS(Profile::Numbers, intValue, "int"),
            TSON_FIELD_AS(Profile::Numbers, floatValue, "float"),
            TSON_FIELD(Profile::Numbers, scientific),
            TSON_FIELD_AS(Profile::Numbers, scientificNoDecimal, "scientific_no_decimal"),
            TSON_FIELD(Profile::Numbers, negative),
            TSON_FIELD_AS(Profile::Numbers, negativeScientific, "negative_scientific"));
    };

    template <>
    struct Schema<Profile::Root> {
        static constexpr auto fields = Fields(
            TSON_FIELD(Profile::Root, name),
            TSON_FIELD(Profile::Root, age),
            TSON_FIELD_AS(Profile::Root, isVerified, "is_verified"),
            TSON_FIELD(Profile::Root, balance),
            TSON_FIELD(Profile::Root, nickname),
            TSON_FIELD(Profile::Root, contact),
            TSON_FIELD(Profile::Root, preferences),
            TSON_FIELD(Profile::Root, tags),
            TSON_FIELD(Profile::Root, history),
            TSON_FIELD_AS(Profile::Root, unicodeExample, "unicode_example"),
            TSON_FIELD(Profile::Root, numbers));
    };
};

#endif
