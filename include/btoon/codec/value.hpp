#pragma once

#include <concepts>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace btoon::codec {

/**
 * @brief Dynamic value handled by the codec
 *
 * Closed union of the kinds the wire format can represent. Containers hold
 * their children by value, so a Value is always acyclic. Map entries keep
 * insertion order and keys may be of any kind.
 */
class Value {
public:
    using Nil = std::monostate;
    using Bytes = std::vector<uint8_t>;
    using List = std::vector<Value>;
    using Map = std::vector<std::pair<Value, Value>>;

    // Order matches the alternatives of Storage.
    enum class Kind { Nil, Bool, Int, Float, Text, Bytes, List, Map };

    using Storage = std::variant<Nil, bool, int64_t, double, std::string, Bytes,
                                 List, Map>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : storage_(b) {}

    template <std::integral T>
        requires(!std::same_as<T, bool>)
    Value(T n) : storage_(static_cast<int64_t>(n)) {}

    template <std::floating_point T>
    Value(T d) : storage_(static_cast<double>(d)) {}

    Value(const char* text) : storage_(std::string(text)) {}
    Value(std::string_view text) : storage_(std::string(text)) {}
    Value(std::string text) : storage_(std::move(text)) {}
    Value(Bytes bytes) : storage_(std::move(bytes)) {}
    Value(List list) : storage_(std::move(list)) {}
    Value(Map map) : storage_(std::move(map)) {}

    Kind kind() const { return static_cast<Kind>(storage_.index()); }

    bool is_nil() const { return kind() == Kind::Nil; }
    bool is_bool() const { return kind() == Kind::Bool; }
    bool is_int() const { return kind() == Kind::Int; }
    bool is_float() const { return kind() == Kind::Float; }
    bool is_text() const { return kind() == Kind::Text; }
    bool is_bytes() const { return kind() == Kind::Bytes; }
    bool is_list() const { return kind() == Kind::List; }
    bool is_map() const { return kind() == Kind::Map; }

    // Checked accessors, throw std::bad_variant_access on kind mismatch.
    bool as_bool() const { return std::get<bool>(storage_); }
    int64_t as_int() const { return std::get<int64_t>(storage_); }
    double as_float() const { return std::get<double>(storage_); }
    const std::string& as_text() const { return std::get<std::string>(storage_); }
    const Bytes& as_bytes() const { return std::get<Bytes>(storage_); }
    const List& as_list() const { return std::get<List>(storage_); }
    List& as_list() { return std::get<List>(storage_); }
    const Map& as_map() const { return std::get<Map>(storage_); }
    Map& as_map() { return std::get<Map>(storage_); }

    // Number of children for List and Map, 0 otherwise.
    std::size_t size() const;

    // First value whose key equals `key`, or nullptr.
    const Value* find(const Value& key) const;

    template <typename Visitor>
    decltype(auto) visit(Visitor&& visitor) const {
        return std::visit(std::forward<Visitor>(visitor), storage_);
    }

    const Storage& storage() const { return storage_; }

    friend bool operator==(const Value& lhs, const Value& rhs);

private:
    Storage storage_;
};

const char* kind_name(Value::Kind kind);

// Debug rendering, e.g. {"id": 7, "raw": <0a ff>, "tags": [nil, true]}
std::ostream& operator<<(std::ostream& os, const Value& value);

}  // namespace btoon::codec
