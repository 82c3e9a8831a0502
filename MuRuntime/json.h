#ifndef _MuRuntime_json_h_
#define _MuRuntime_json_h_

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace MuRuntime {

// Minimal JSON document used by the worker envelope protocol.
// Numbers are stored as double; integral values print without a fraction.
class Json {
public:
    using Array = std::vector<Json>;
    using Object = std::map<std::string, Json>;

    enum class Type { NUL, BOOL, NUMBER, STRING, ARRAY, OBJECT };

    Json() : v(std::monostate{}) {}
    Json(std::nullptr_t) : v(std::monostate{}) {}
    Json(bool b) : v(b) {}
    Json(int n) : v(static_cast<double>(n)) {}
    Json(long n) : v(static_cast<double>(n)) {}
    Json(long long n) : v(static_cast<double>(n)) {}
    Json(unsigned n) : v(static_cast<double>(n)) {}
    Json(unsigned long n) : v(static_cast<double>(n)) {}
    Json(double d) : v(d) {}
    Json(const char* s) : v(std::string(s)) {}
    Json(std::string s) : v(std::move(s)) {}
    Json(Array a) : v(std::move(a)) {}
    Json(Object o) : v(std::move(o)) {}

    static Json array() { return Json(Array{}); }
    static Json object() { return Json(Object{}); }

    Type type() const;
    bool is_null() const { return std::holds_alternative<std::monostate>(v); }
    bool is_bool() const { return std::holds_alternative<bool>(v); }
    bool is_number() const { return std::holds_alternative<double>(v); }
    bool is_string() const { return std::holds_alternative<std::string>(v); }
    bool is_array() const { return std::holds_alternative<Array>(v); }
    bool is_object() const { return std::holds_alternative<Object>(v); }

    bool as_bool(bool fallback = false) const;
    double as_number(double fallback = 0.0) const;
    int64_t as_int(int64_t fallback = 0) const;
    std::string as_string(const std::string& fallback = {}) const;
    const Array& as_array() const;
    const Object& as_object() const;

    bool has(const std::string& key) const;
    const Json& operator[](const std::string& key) const;
    Json& operator[](const std::string& key);
    void push_back(Json item);
    size_t size() const;

    std::string dump() const;
    static std::optional<Json> parse(const std::string& text, std::string* error = nullptr);

    bool operator==(const Json& other) const { return v == other.v; }
    bool operator!=(const Json& other) const { return !(*this == other); }

private:
    std::variant<std::monostate, bool, double, std::string, Array, Object> v;
};

std::string json_escape(const std::string& s);

} // namespace MuRuntime

#endif
