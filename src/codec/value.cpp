#include "btoon/codec/value.hpp"

#include <iomanip>
#include <ostream>

namespace btoon::codec {

std::size_t Value::size() const {
    switch (kind()) {
        case Kind::List:
            return as_list().size();
        case Kind::Map:
            return as_map().size();
        default:
            return 0;
    }
}

const Value* Value::find(const Value& key) const {
    if (!is_map()) {
        return nullptr;
    }
    for (const auto& [entry_key, entry_value] : as_map()) {
        if (entry_key == key) {
            return &entry_value;
        }
    }
    return nullptr;
}

bool operator==(const Value& lhs, const Value& rhs) {
    if (lhs.kind() != rhs.kind()) {
        return false;
    }

    switch (lhs.kind()) {
        case Value::Kind::Nil:
            return true;
        case Value::Kind::Bool:
            return lhs.as_bool() == rhs.as_bool();
        case Value::Kind::Int:
            return lhs.as_int() == rhs.as_int();
        case Value::Kind::Float:
            return lhs.as_float() == rhs.as_float();
        case Value::Kind::Text:
            return lhs.as_text() == rhs.as_text();
        case Value::Kind::Bytes:
            return lhs.as_bytes() == rhs.as_bytes();
        case Value::Kind::List: {
            const auto& a = lhs.as_list();
            const auto& b = rhs.as_list();
            if (a.size() != b.size()) {
                return false;
            }
            for (std::size_t i = 0; i < a.size(); ++i) {
                if (!(a[i] == b[i])) {
                    return false;
                }
            }
            return true;
        }
        case Value::Kind::Map: {
            const auto& a = lhs.as_map();
            const auto& b = rhs.as_map();
            if (a.size() != b.size()) {
                return false;
            }
            for (std::size_t i = 0; i < a.size(); ++i) {
                if (!(a[i].first == b[i].first) ||
                    !(a[i].second == b[i].second)) {
                    return false;
                }
            }
            return true;
        }
    }
    return false;
}

const char* kind_name(Value::Kind kind) {
    switch (kind) {
        case Value::Kind::Nil:
            return "nil";
        case Value::Kind::Bool:
            return "bool";
        case Value::Kind::Int:
            return "int";
        case Value::Kind::Float:
            return "float";
        case Value::Kind::Text:
            return "text";
        case Value::Kind::Bytes:
            return "bytes";
        case Value::Kind::List:
            return "list";
        case Value::Kind::Map:
            return "map";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
    switch (value.kind()) {
        case Value::Kind::Nil:
            return os << "nil";
        case Value::Kind::Bool:
            return os << (value.as_bool() ? "true" : "false");
        case Value::Kind::Int:
            return os << value.as_int();
        case Value::Kind::Float:
            return os << value.as_float();
        case Value::Kind::Text:
            return os << std::quoted(value.as_text());
        case Value::Kind::Bytes: {
            os << '<';
            const auto flags = os.flags();
            const auto fill = os.fill();
            const auto& bytes = value.as_bytes();
            for (std::size_t i = 0; i < bytes.size(); ++i) {
                if (i > 0) os << ' ';
                os << std::hex << std::setw(2) << std::setfill('0')
                   << static_cast<int>(bytes[i]);
            }
            os.flags(flags);
            os.fill(fill);
            return os << '>';
        }
        case Value::Kind::List: {
            os << '[';
            const auto& list = value.as_list();
            for (std::size_t i = 0; i < list.size(); ++i) {
                if (i > 0) os << ", ";
                os << list[i];
            }
            return os << ']';
        }
        case Value::Kind::Map: {
            os << '{';
            const auto& map = value.as_map();
            for (std::size_t i = 0; i < map.size(); ++i) {
                if (i > 0) os << ", ";
                os << map[i].first << ": " << map[i].second;
            }
            return os << '}';
        }
    }
    return os;
}

}  // namespace btoon::codec
