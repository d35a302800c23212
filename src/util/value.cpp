#include <monolith/value.hpp>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>

namespace monolith {

// ---------------------------------------------------------------------------
// Static constructors
// ---------------------------------------------------------------------------

Value Value::null() {
    return Value();
}

Value Value::boolean(bool b) {
    Value v;
    v.kind_ = Bool;
    v.bool_ = b;
    return v;
}

Value Value::integer(std::int64_t i) {
    Value v;
    v.kind_ = Integer;
    v.int_ = i;
    return v;
}

Value Value::number(double d) {
    Value v;
    v.kind_ = Float;
    v.float_ = d;
    return v;
}

Value Value::string(std::string s) {
    Value v;
    v.kind_ = String;
    v.str_ = std::move(s);
    return v;
}

Value Value::array(ArrayT items) {
    Value v;
    v.kind_ = Array;
    v.array_ = std::make_shared<const ArrayT>(std::move(items));
    return v;
}

Value Value::object(ObjectT members) {
    Value v;
    v.kind_ = Object;
    v.object_ = std::make_shared<const ObjectT>(std::move(members));
    return v;
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------

const Value::ArrayT& Value::items() const {
    static const ArrayT empty;
    return array_ ? *array_ : empty;
}

const Value::ObjectT& Value::members() const {
    static const ObjectT empty;
    return object_ ? *object_ : empty;
}

const Value* Value::find(const std::string& key) const {
    if (kind_ != Object || !object_) return nullptr;
    auto it = object_->find(key);
    if (it == object_->end()) return nullptr;
    return &it->second;
}

const Value* Value::at(size_t index) const {
    if (kind_ != Array || !array_) return nullptr;
    if (index >= array_->size()) return nullptr;
    return &(*array_)[index];
}

size_t Value::size() const {
    switch (kind_) {
    case Array:  return items().size();
    case Object: return members().size();
    case String: return str_.size();
    default:     return 0;
    }
}

const char* Value::kind_name(Kind k) {
    switch (k) {
    case Null:    return "null";
    case Bool:    return "bool";
    case Integer: return "integer";
    case Float:   return "float";
    case String:  return "string";
    case Array:   return "array";
    case Object:  return "object";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Coercions
// ---------------------------------------------------------------------------

static std::string trim_copy(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::optional<double> Value::as_number() const {
    switch (kind_) {
    case Bool:
        return bool_ ? 1.0 : 0.0;
    case Integer:
        return static_cast<double>(int_);
    case Float:
        return float_;
    case String: {
        std::string t = trim_copy(str_);
        if (t.empty()) return std::nullopt;
        // strtod accepts hex floats; decimal, inf and nan text only
        if (t.find_first_of("xX") != std::string::npos) return std::nullopt;
        const char* begin = t.c_str();
        char* end = nullptr;
        double d = std::strtod(begin, &end);
        if (end != begin + t.size()) return std::nullopt;
        return d;
    }
    default:
        return std::nullopt;
    }
}

bool Value::truthy() const {
    switch (kind_) {
    case Null:    return false;
    case Bool:    return bool_;
    case Integer: return int_ != 0;
    case Float:   return float_ != 0.0;
    case String:  return !str_.empty();
    case Array:   return !items().empty();
    case Object:  return !members().empty();
    }
    return false;
}

// ---------------------------------------------------------------------------
// Display
// ---------------------------------------------------------------------------

static std::string format_float(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d < 0 ? "-inf" : "inf";

    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), d);
    std::string s(buf, res.ptr);
    // Keep floats visibly distinct from integers: 3.0 stays "3.0"
    if (s.find_first_of(".e") == std::string::npos) {
        s += ".0";
    }
    return s;
}

static void append_display(std::string& out, const Value& v, bool nested) {
    switch (v.kind()) {
    case Value::Null:
        if (nested) out += "null";
        break;
    case Value::Bool:
        out += v.as_bool() ? "true" : "false";
        break;
    case Value::Integer:
        out += std::to_string(v.as_integer());
        break;
    case Value::Float:
        out += format_float(v.as_float());
        break;
    case Value::String:
        if (nested) {
            out += '"';
            out += v.as_string();
            out += '"';
        } else {
            out += v.as_string();
        }
        break;
    case Value::Array: {
        out += '[';
        bool first = true;
        for (const auto& item : v.items()) {
            if (!first) out += ", ";
            first = false;
            append_display(out, item, true);
        }
        out += ']';
        break;
    }
    case Value::Object: {
        out += '{';
        bool first = true;
        for (const auto& [key, member] : v.members()) {
            if (!first) out += ", ";
            first = false;
            out += '"';
            out += key;
            out += "\": ";
            append_display(out, member, true);
        }
        out += '}';
        break;
    }
    }
}

std::string Value::to_display() const {
    std::string out;
    append_display(out, *this, false);
    return out;
}

bool operator==(const Value& a, const Value& b) {
    if (a.kind() != b.kind()) return false;
    switch (a.kind()) {
    case Value::Null:    return true;
    case Value::Bool:    return a.as_bool() == b.as_bool();
    case Value::Integer: return a.as_integer() == b.as_integer();
    case Value::Float:   return a.as_float() == b.as_float();
    case Value::String:  return a.as_string() == b.as_string();
    case Value::Array:   return a.items() == b.items();
    case Value::Object:  return a.members() == b.members();
    }
    return false;
}

} // namespace monolith
