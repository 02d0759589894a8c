/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Date.hpp"
#include "glpost/decimal/decimal.hpp"

#include <rapidjson/document.h>

#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <string>

//-------------------------------------------------------------------------

namespace glpost::json
{

//-------------------------------------------------------------------------

inline constexpr uint32_t kMaxDecimalPlaces = 8;

//-------------------------------------------------------------------------

struct IndentOptions
{
    char indentChar = ' ';
    uint8_t indentCharCount = 4;
};

struct FormatOptions
{
    std::optional<IndentOptions> indent = {};
    uint32_t decimals = kMaxDecimalPlaces;
};

[[nodiscard]] std::string json2str(
    const rapidjson::Value& json, const FormatOptions& formatOptions = {});

[[nodiscard]] rapidjson::Document str2json(const std::string& str);

[[nodiscard]] rapidjson::Document loadJson(const std::filesystem::path& path);

// Accepts a decimal string ("11800.00"), a packed DPD uint64 or a double.
[[nodiscard]] decimal_t getDecimal(const rapidjson::Value& json);

[[nodiscard]] decimal_t getDecimalMember(
    const rapidjson::Value& json, const char* key, decimal_t fallback = {});

[[nodiscard]] std::string getStringMember(
    const rapidjson::Value& json, const char* key, const std::string& fallback = {});

[[nodiscard]] bool getBoolMember(const rapidjson::Value& json, const char* key, bool fallback = false);

[[nodiscard]] std::optional<Date> getOptionalDateMember(const rapidjson::Value& json, const char* key);

void setStringMember(rapidjson::Document& json, const char* key, const std::string& value);

// Amounts are written as strings so that no binary floating point round trip occurs.
void setDecimalMember(rapidjson::Document& json, const char* key, decimal_t value);

void setBoolMember(rapidjson::Document& json, const char* key, bool value);

void setDateMember(rapidjson::Document& json, const char* key, std::optional<Date> value);

void serializeHelper(
    rapidjson::Document& json,
    const std::string& key,
    std::function<void(rapidjson::Document&)> serializer);

//-------------------------------------------------------------------------

}  // namespace glpost::json

//-------------------------------------------------------------------------
