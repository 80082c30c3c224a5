// jsonhelper.hpp

#pragma once

// Centralize all necessary RapidJSON headers
#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
#include "rapidjson/istreamwrapper.h"

#include <string>
#include <fstream>
#include <type_traits>
#include "lib.hpp"

namespace json = rapidjson;
using jdoc = json::Document;
using jval = json::Value;


// A namespace to keep our helper functions organized
namespace jhlp {

    // Parses a JSON file; on failure returns false and fills @p err.
    inline bool parse_file(const std::string& file_path, jdoc& document, std::string& err) {
        std::ifstream ifs(file_path);
        if (!ifs.is_open()) {
            err = "Failed to open file: " + file_path;
            return false;
        }
        rapidjson::IStreamWrapper isw(ifs);
        document.ParseStream(isw);
        if (document.HasParseError()) {
            err = "JSON Parse Error in file " + file_path + ": "
                + rapidjson::GetParseError_En(document.GetParseError())
                + " at offset " + std::to_string(document.GetErrorOffset());
            return false;
        }
        return true;
    }

    inline bool has(const jval& parent, const std::string& key) {
        return parent.IsObject() && parent.HasMember(key.c_str());
    }

    // Nested object member, nullptr when missing or not an object.
    inline const jval* object(const jval& parent, const std::string& key) {
        if (!has(parent, key)) return nullptr;
        const jval& val = parent.FindMember(key.c_str())->value;
        return val.IsObject() ? &val : nullptr;
    }

    // Typed member lookup; THROWs when the member exists with the wrong type,
    // returns @p default_value when it is missing.
    template<typename T>
    inline T get(const jval& parent, const std::string& key, const T& default_value = T()) {
        if (!has(parent, key)) return default_value;
        const jval& val = parent.FindMember(key.c_str())->value;
        if constexpr (std::is_same_v<T, std::string>) {
            if (val.IsString()) return val.GetString();
        } else if constexpr (std::is_same_v<T, int>) {
            if (val.IsInt()) return val.GetInt();
        } else if constexpr (std::is_same_v<T, int64_t>) {
            if (val.IsInt64()) return val.GetInt64();
        } else if constexpr (std::is_same_v<T, bool>) {
            if (val.IsBool()) return val.GetBool();
        }
        THROW("JSON member '%s' has the wrong type", key.c_str());
    }

} // namespace jhlp
