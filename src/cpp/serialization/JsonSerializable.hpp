/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "json_util.hpp"

//-------------------------------------------------------------------------

namespace glpost::json
{

//-------------------------------------------------------------------------

template<typename T>
concept IsJsonSerializable = requires (const T& t, rapidjson::Document& json, const std::string& key) {
    { t.jsonSerialize(json, key) };
};

// Compact text of anything that writes itself into a document.
[[nodiscard]] std::string jsonSerializable2str(
    const IsJsonSerializable auto& serializable, const FormatOptions& formatOptions = {})
{
    rapidjson::Document json;
    serializable.jsonSerialize(json);
    return json2str(json, formatOptions);
}

//-------------------------------------------------------------------------

}  // namespace glpost::json

//-------------------------------------------------------------------------
