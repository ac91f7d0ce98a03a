#include "value.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>

namespace extraction_eval {

std::string to_text(const Value& v)
{
    if (v.is_string()) {
        return v.get<std::string>();
    }
    return v.dump();
}

std::string normalize_string(const std::string& s, bool fuzzy)
{
    if (!fuzzy) {
        return s;
    }
    std::string out;
    out.reserve(s.size());
    bool pending_space = false;
    for (char c : s) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isspace(uc)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out += static_cast<char>(std::tolower(uc));
    }
    return out;
}

bool is_truthy(const Value& v)
{
    switch (v.type()) {
    case Value::value_t::null:
    case Value::value_t::discarded:
        return false;
    case Value::value_t::boolean:
        return v.get<bool>();
    case Value::value_t::number_integer:
        return v.get<std::int64_t>() != 0;
    case Value::value_t::number_unsigned:
        return v.get<std::uint64_t>() != 0;
    case Value::value_t::number_float:
        return v.get<double>() != 0.0;
    case Value::value_t::string:
        return !v.get_ref<const std::string&>().empty();
    case Value::value_t::binary:
        return !v.get_binary().empty();
    case Value::value_t::array:
    case Value::value_t::object:
        return !v.empty();
    }
    return false;
}

bool is_empty_answer(const Value& v)
{
    if (v.is_null()) {
        return true;
    }
    if (v.is_string()) {
        return v.get_ref<const std::string&>().empty();
    }
    return v.is_array() && v.empty();
}

std::optional<double> as_number(const Value& v)
{
    if (v.is_number()) {
        return v.get<double>();
    }
    if (v.is_boolean()) {
        return v.get<bool>() ? 1.0 : 0.0;
    }
    if (v.is_string()) {
        const std::string& s = v.get_ref<const std::string&>();
        const char* begin = s.c_str();
        char* end = nullptr;
        const double d = std::strtod(begin, &end);
        if (end == begin) {
            return std::nullopt;
        }
        // trailing whitespace is accepted, anything else is not a number
        while (*end != '\0' && std::isspace(static_cast<unsigned char>(*end))) {
            ++end;
        }
        if (*end != '\0' || std::isnan(d)) {
            return std::nullopt;
        }
        return d;
    }
    return std::nullopt;
}

std::set<std::string> union_of_keys(const Value& a, const Value& b)
{
    std::set<std::string> keys;
    for (const Value* side : { &a, &b }) {
        if (side->is_object()) {
            for (const auto& item : side->items()) {
                keys.insert(item.key());
            }
        }
    }
    return keys;
}

const Value& field_or_null(const Value& v, const std::string& key)
{
    static const Value null_value;
    if (!v.is_object()) {
        return null_value;
    }
    const auto it = v.find(key);
    return it == v.end() ? null_value : *it;
}

} // namespace extraction_eval
