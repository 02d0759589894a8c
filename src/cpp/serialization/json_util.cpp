/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "json_util.hpp"

#include <rapidjson/istreamwrapper.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <source_location>
#include <sstream>

//-------------------------------------------------------------------------

namespace glpost::json
{

//-------------------------------------------------------------------------

std::string json2str(const rapidjson::Value& json, const FormatOptions& formatOptions)
{
    const auto& [indent, decimals] = formatOptions;
    rapidjson::StringBuffer buffer;
    if (indent.has_value()) {
        const auto& opts = indent.value();
        rapidjson::PrettyWriter writer{buffer};
        writer.SetIndent(opts.indentChar, opts.indentCharCount);
        writer.SetMaxDecimalPlaces(decimals);
        json.Accept(writer);
    } else {
        rapidjson::Writer writer{buffer};
        writer.SetMaxDecimalPlaces(decimals);
        json.Accept(writer);
    }
    return buffer.GetString();
}

//-------------------------------------------------------------------------

rapidjson::Document str2json(const std::string& str)
{
    rapidjson::Document json;
    if (json.Parse(str.c_str()).HasParseError()) {
        static constexpr size_t maxCharsShown = 200uz;
        std::string_view facade{str.data(), std::min(maxCharsShown, str.size())};
        throw std::invalid_argument{fmt::format(
            "{}: Error parsing Json string: {}{}",
            std::source_location::current().function_name(),
            facade,
            facade.size() < str.size() ? "..." : "")};
    }
    return json;
}

//-------------------------------------------------------------------------

rapidjson::Document loadJson(const std::filesystem::path& path)
{
    static constexpr auto ctx = std::source_location::current().function_name();
    if (!std::filesystem::exists(path)) {
        throw std::invalid_argument{fmt::format("{}: No such file '{}'", ctx, path.c_str())};
    }
    std::ifstream ifs{path};
    rapidjson::IStreamWrapper isw{ifs};
    rapidjson::Document json;
    if (json.ParseStream(isw).HasParseError()) {
        throw std::invalid_argument{fmt::format(
            "{}: Unable to parse Json data from '{}'", ctx, path.c_str())};
    }
    return json;
}

//-------------------------------------------------------------------------

decimal_t getDecimal(const rapidjson::Value& json)
{
    static constexpr auto ctx = std::source_location::current().function_name();
    if (json.IsString()) [[likely]] {
        if (auto parsed = util::parseDecimal(json.GetString())) {
            return *parsed;
        }
        throw std::invalid_argument{fmt::format(
            "{}: Ill-formed decimal string '{}'", ctx, json.GetString())};
    } else if (json.IsUint64()) {
        return util::unpackDecimal(json.GetUint64());
    } else if (json.IsNumber()) [[unlikely]] {
        return decimal_t{json.GetDouble()};
    }
    throw std::invalid_argument{fmt::format(
        "{}: Ill-formed Json value to form a decimal with: {}", ctx, json2str(json))};
}

//-------------------------------------------------------------------------

decimal_t getDecimalMember(const rapidjson::Value& json, const char* key, decimal_t fallback)
{
    if (!json.HasMember(key) || json[key].IsNull()) return fallback;
    return getDecimal(json[key]);
}

//-------------------------------------------------------------------------

std::string getStringMember(
    const rapidjson::Value& json, const char* key, const std::string& fallback)
{
    if (!json.HasMember(key) || json[key].IsNull()) return fallback;
    if (!json[key].IsString()) {
        throw std::invalid_argument{fmt::format(
            "{}: Member '{}' should be a string, was {}",
            std::source_location::current().function_name(),
            key,
            json2str(json[key]))};
    }
    return json[key].GetString();
}

//-------------------------------------------------------------------------

bool getBoolMember(const rapidjson::Value& json, const char* key, bool fallback)
{
    if (!json.HasMember(key) || json[key].IsNull()) return fallback;
    return json[key].GetBool();
}

//-------------------------------------------------------------------------

std::optional<Date> getOptionalDateMember(const rapidjson::Value& json, const char* key)
{
    if (!json.HasMember(key) || json[key].IsNull()) return std::nullopt;
    return util::parseDate(json[key].GetString());
}

//-------------------------------------------------------------------------

void setStringMember(rapidjson::Document& json, const char* key, const std::string& value)
{
    auto& allocator = json.GetAllocator();
    json.AddMember(
        rapidjson::Value{key, allocator},
        rapidjson::Value{value.c_str(), allocator},
        allocator);
}

//-------------------------------------------------------------------------

void setDecimalMember(rapidjson::Document& json, const char* key, decimal_t value)
{
    std::ostringstream oss;
    oss << value;
    setStringMember(json, key, oss.str());
}

//-------------------------------------------------------------------------

void setBoolMember(rapidjson::Document& json, const char* key, bool value)
{
    auto& allocator = json.GetAllocator();
    json.AddMember(rapidjson::Value{key, allocator}, rapidjson::Value{value}, allocator);
}

//-------------------------------------------------------------------------

void setDateMember(rapidjson::Document& json, const char* key, std::optional<Date> value)
{
    auto& allocator = json.GetAllocator();
    rapidjson::Value member;
    if (value.has_value()) {
        member.SetString(util::formatDate(*value).c_str(), allocator);
    }
    json.AddMember(rapidjson::Value{key, allocator}, member, allocator);
}

//-------------------------------------------------------------------------

void serializeHelper(
    rapidjson::Document& json,
    const std::string& key,
    std::function<void(rapidjson::Document&)> serializer)
{
    if (key.empty()) return serializer(json);
    auto& allocator = json.GetAllocator();
    rapidjson::Document subJson{&allocator};
    serializer(subJson);
    json.AddMember(rapidjson::Value{key.c_str(), allocator}, subJson, allocator);
}

//-------------------------------------------------------------------------

}  // namespace glpost::json

//-------------------------------------------------------------------------
