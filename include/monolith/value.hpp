#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace monolith {

// Immutable context tree a template is rendered against.
// Arrays and objects share their storage, so copying a Value is cheap and a
// derived scope never aliases mutable state of its parent.
class Value {
public:
    enum Kind { Null, Bool, Integer, Float, String, Array, Object };

    using ArrayT = std::vector<Value>;
    using ObjectT = std::map<std::string, Value>;

    Value() = default;

    // Static constructors
    static Value null();
    static Value boolean(bool b);
    static Value integer(std::int64_t i);
    static Value number(double d);
    static Value string(std::string s);
    static Value array(ArrayT items);
    static Value object(ObjectT members);

    Kind kind() const { return kind_; }
    bool is_null() const { return kind_ == Null; }
    bool is_array() const { return kind_ == Array; }
    bool is_object() const { return kind_ == Object; }

    bool as_bool() const { return bool_; }
    std::int64_t as_integer() const { return int_; }
    double as_float() const { return float_; }
    const std::string& as_string() const { return str_; }
    const ArrayT& items() const;
    const ObjectT& members() const;

    // Object member lookup; nullptr when not an object or key is missing
    const Value* find(const std::string& key) const;

    // Array element lookup; nullptr when not an array or out of range
    const Value* at(size_t index) const;

    size_t size() const;

    // Numeric view used by comparisons: numbers as-is, booleans as 1/0,
    // strings only when the trimmed text is entirely a number.
    std::optional<double> as_number() const;

    // Null, false, zero, "" and empty containers are falsy
    bool truthy() const;

    // Text substituted for a {{ variable }} directive
    std::string to_display() const;

    static const char* kind_name(Kind k);

private:
    Kind kind_ = Null;
    bool bool_ = false;
    std::int64_t int_ = 0;
    double float_ = 0.0;
    std::string str_;
    std::shared_ptr<const ArrayT> array_;
    std::shared_ptr<const ObjectT> object_;
};

bool operator==(const Value& a, const Value& b);
inline bool operator!=(const Value& a, const Value& b) { return !(a == b); }

} // namespace monolith
