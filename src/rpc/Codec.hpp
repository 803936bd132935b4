#pragma once

#include "utils/Json.hpp"

#include <cstdint>
#include <format>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include <yyjson.h>

namespace wv::rpc
{

// Raised when a JSON value does not fit the C++ type it is decoded into.
class DecodeError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

// A param or result passed through as verbatim JSON text. An empty text
// encodes as null.
struct RawJson
{
    std::string text;
};

inline char const *json_kind(yyjson_val *value) noexcept
{
    switch (yyjson_get_type(value))
    {
    case YYJSON_TYPE_NULL:
        return "null";
    case YYJSON_TYPE_BOOL:
        return "bool";
    case YYJSON_TYPE_NUM:
        return "number";
    case YYJSON_TYPE_STR:
        return "string";
    case YYJSON_TYPE_ARR:
        return "array";
    case YYJSON_TYPE_OBJ:
        return "object";
    default:
        return "value";
    }
}

[[noreturn]] inline void throw_mismatch(yyjson_val *value, char const *target)
{
    throw DecodeError(
        std::format("cannot decode {} into {}", json_kind(value), target));
}

// Codec<T> converts between one C++ type and yyjson values. Specialise it
// to use an application type as a bound parameter or result:
//
//   template <> struct wv::rpc::Codec<Point>
//   {
//       static Point decode(yyjson_val *value);
//       static yyjson_mut_val *encode(yyjson_mut_doc *doc, Point const &p);
//   };
//
// decode() never sees a JSON null unless the codec opts in through
// DecodesNull; decode_value() turns null into a value-initialised T.
template <typename T, typename Enable = void> struct Codec;

template <typename T> struct DecodesNull : std::false_type
{
};

template <> struct DecodesNull<RawJson> : std::true_type
{
};

template <typename T> T decode_value(yyjson_val *value)
{
    if constexpr (!DecodesNull<T>::value)
    {
        if (value == nullptr || yyjson_is_null(value))
        {
            return T{};
        }
    }
    return Codec<T>::decode(value);
}

template <typename T>
yyjson_mut_val *encode_value(yyjson_mut_doc *doc, T const &value)
{
    return Codec<T>::encode(doc, value);
}

template <> struct Codec<bool>
{
    static bool decode(yyjson_val *value)
    {
        if (!yyjson_is_bool(value))
        {
            throw_mismatch(value, "bool");
        }
        return yyjson_get_bool(value);
    }

    static yyjson_mut_val *encode(yyjson_mut_doc *doc, bool value)
    {
        return yyjson_mut_bool(doc, value);
    }
};

template <typename T>
struct Codec<T, std::enable_if_t<std::is_integral_v<T> &&
                                 !std::is_same_v<T, bool>>>
{
    static T decode(yyjson_val *value)
    {
        if (yyjson_is_uint(value))
        {
            auto raw = yyjson_get_uint(value);
            if (raw > static_cast<std::uint64_t>(std::numeric_limits<T>::max()))
            {
                throw DecodeError(
                    std::format("number {} overflows integer", raw));
            }
            return static_cast<T>(raw);
        }
        if (yyjson_is_sint(value))
        {
            auto raw = yyjson_get_sint(value);
            if constexpr (std::is_unsigned_v<T>)
            {
                if (raw < 0 || static_cast<std::uint64_t>(raw) >
                                   static_cast<std::uint64_t>(
                                       std::numeric_limits<T>::max()))
                {
                    throw DecodeError(std::format(
                        "number {} overflows unsigned integer", raw));
                }
            }
            else
            {
                if (raw < static_cast<std::int64_t>(
                              std::numeric_limits<T>::min()) ||
                    raw > static_cast<std::int64_t>(
                              std::numeric_limits<T>::max()))
                {
                    throw DecodeError(
                        std::format("number {} overflows integer", raw));
                }
            }
            return static_cast<T>(raw);
        }
        throw_mismatch(value, "integer");
    }

    static yyjson_mut_val *encode(yyjson_mut_doc *doc, T value)
    {
        if constexpr (std::is_signed_v<T>)
        {
            return yyjson_mut_sint(doc, static_cast<std::int64_t>(value));
        }
        else
        {
            return yyjson_mut_uint(doc, static_cast<std::uint64_t>(value));
        }
    }
};

template <typename T>
struct Codec<T, std::enable_if_t<std::is_floating_point_v<T>>>
{
    static T decode(yyjson_val *value)
    {
        if (!yyjson_is_num(value))
        {
            throw_mismatch(value, "number");
        }
        return static_cast<T>(yyjson_get_num(value));
    }

    static yyjson_mut_val *encode(yyjson_mut_doc *doc, T value)
    {
        return yyjson_mut_real(doc, static_cast<double>(value));
    }
};

template <> struct Codec<std::string>
{
    static std::string decode(yyjson_val *value)
    {
        if (!yyjson_is_str(value))
        {
            throw_mismatch(value, "string");
        }
        return std::string(yyjson_get_str(value), yyjson_get_len(value));
    }

    static yyjson_mut_val *encode(yyjson_mut_doc *doc, std::string const &value)
    {
        return yyjson_mut_strncpy(doc, value.data(), value.size());
    }
};

template <> struct Codec<RawJson>
{
    static RawJson decode(yyjson_val *value)
    {
        if (value == nullptr)
        {
            return RawJson{"null"};
        }
        return RawJson{wv::json::write_value(value)};
    }

    static yyjson_mut_val *encode(yyjson_mut_doc *doc, RawJson const &value)
    {
        if (value.text.empty())
        {
            return yyjson_mut_null(doc);
        }
        return yyjson_mut_rawncpy(doc, value.text.data(), value.text.size());
    }
};

template <typename T> struct Codec<std::optional<T>>
{
    static std::optional<T> decode(yyjson_val *value)
    {
        return Codec<T>::decode(value);
    }

    static yyjson_mut_val *encode(yyjson_mut_doc *doc,
                                  std::optional<T> const &value)
    {
        if (!value)
        {
            return yyjson_mut_null(doc);
        }
        return encode_value<T>(doc, *value);
    }
};

template <typename T> struct Codec<std::vector<T>>
{
    static std::vector<T> decode(yyjson_val *value)
    {
        if (!yyjson_is_arr(value))
        {
            throw_mismatch(value, "array");
        }
        std::vector<T> result;
        result.reserve(yyjson_arr_size(value));
        size_t idx, limit;
        yyjson_val *item = nullptr;
        yyjson_arr_foreach(value, idx, limit, item)
        {
            try
            {
                result.push_back(decode_value<T>(item));
            }
            catch (DecodeError const &ex)
            {
                throw DecodeError(std::format("[{}]: {}", idx, ex.what()));
            }
        }
        return result;
    }

    static yyjson_mut_val *encode(yyjson_mut_doc *doc,
                                  std::vector<T> const &values)
    {
        auto *array = yyjson_mut_arr(doc);
        for (auto const &item : values)
        {
            yyjson_mut_arr_append(array, encode_value<T>(doc, item));
        }
        return array;
    }
};

template <typename Map> struct ObjectCodec
{
    using mapped_type = typename Map::mapped_type;

    static Map decode(yyjson_val *value)
    {
        if (!yyjson_is_obj(value))
        {
            throw_mismatch(value, "object");
        }
        Map result;
        size_t idx, limit;
        yyjson_val *key = nullptr;
        yyjson_val *item = nullptr;
        yyjson_obj_foreach(value, idx, limit, key, item)
        {
            std::string name(yyjson_get_str(key), yyjson_get_len(key));
            try
            {
                result.insert_or_assign(name, decode_value<mapped_type>(item));
            }
            catch (DecodeError const &ex)
            {
                throw DecodeError(std::format("{}: {}", name, ex.what()));
            }
        }
        return result;
    }

    static yyjson_mut_val *encode(yyjson_mut_doc *doc, Map const &values)
    {
        auto *object = yyjson_mut_obj(doc);
        for (auto const &[name, item] : values)
        {
            yyjson_mut_obj_add(object,
                               yyjson_mut_strncpy(doc, name.data(), name.size()),
                               encode_value<mapped_type>(doc, item));
        }
        return object;
    }
};

template <typename T>
struct Codec<std::map<std::string, T>> : ObjectCodec<std::map<std::string, T>>
{
};

template <typename T>
struct Codec<std::unordered_map<std::string, T>>
    : ObjectCodec<std::unordered_map<std::string, T>>
{
};

} // namespace wv::rpc
