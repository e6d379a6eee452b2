#pragma once

#include "bufobj/bbo.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace bufobj::easy {

// Short builders for literal documents:
//   object({{"a", num(1)}, {"tags", array({str("x"), null()})}})
inline Value num(double d) { return Value::make_number(d); }

inline Value boolean(bool b) { return Value::make_boolean(b); }

inline Value str(std::string s) { return Value::make_string(std::move(s)); }

inline Value null() { return Value::make_null(); }

// Later duplicates replace earlier ones, keeping the first position.
inline Value object(std::initializer_list<std::pair<std::string, Value>> members) {
    Value out = Value::make_object();
    for (const auto& kv : members) out.set(kv.first, kv.second);
    return out;
}

inline Value array(std::initializer_list<Value> items) {
    return Value::make_array(Value::Array(items));
}

template <typename T>
inline Value numbers(const std::vector<T>& v) {
    Value out = Value::make_array();
    out.as_array().reserve(v.size());
    for (const auto& x : v) out.push(Value::make_number(static_cast<double>(x)));
    return out;
}

inline void set(Value& root, std::string key, Value v) {
    root.set(std::move(key), std::move(v));
}

} // namespace bufobj::easy
