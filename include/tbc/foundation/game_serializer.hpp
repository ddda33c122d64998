#pragma once

/// @file game_serializer.hpp
/// @brief GameSerializer providing schema-versioned JSON encoding with
///        compile-time field registration via TBC_SERIALIZABLE.
///
/// Template-heavy header: the encode/decode loops operate on registered
/// types through SerializableTraits. Token-level helpers live in
/// game_serializer.cpp.

#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

#include "tbc/foundation/game_result.hpp"

namespace tbc::foundation {

// ── Forward declarations ────────────────────────────────────────────────────

/// Specialization point for compile-time field registration.
/// Users specialize this via the TBC_SERIALIZABLE macro.
template <typename T>
struct SerializableTraits {
    static constexpr bool is_serializable = false;
};

// ── Field descriptor ────────────────────────────────────────────────────────

/// Describes a single serializable field: its name and pointer-to-member.
template <typename T, typename M>
struct FieldDescriptor {
    const char* name;
    M T::*pointer;
};

/// Create a FieldDescriptor from a name and pointer-to-member.
template <typename T, typename M>
constexpr FieldDescriptor<T, M> field(const char* name, M T::*ptr) {
    return {name, ptr};
}

// ── detail:: implementation helpers ─────────────────────────────────────────

namespace detail {

template <typename T, typename = void>
struct is_serializable : std::false_type {};

template <typename T>
struct is_serializable<
    T, std::void_t<decltype(SerializableTraits<T>::schema_version)>>
    : std::true_type {};

template <typename T>
inline constexpr bool is_serializable_v = is_serializable<T>::value;

template <typename Tuple, typename Func, std::size_t... Is>
void forEachFieldImpl(const Tuple& t, Func&& f, std::index_sequence<Is...>) {
    (f(std::get<Is>(t)), ...);
}

template <typename Tuple, typename Func>
void forEachField(const Tuple& t, Func&& f) {
    forEachFieldImpl(
        t, std::forward<Func>(f),
        std::make_index_sequence<std::tuple_size_v<Tuple>>{});
}

/// Escape a string for inclusion inside JSON quotes.
std::string escapeJson(std::string_view sv);

/// Scalar parsers; each returns false when the raw token does not fit.
bool parseBool(std::string_view raw, bool& out);
bool parseSigned(std::string_view raw, int64_t& out);
bool parseUnsigned(std::string_view raw, uint64_t& out);
bool parseDouble(std::string_view raw, double& out);

/// Cursor over a flat JSON object: string keys mapped to scalar values.
class JsonReader {
public:
    explicit JsonReader(std::string_view data) : data_(data) {}

    bool expect(char c);
    [[nodiscard]] bool peek(char c);
    [[nodiscard]] bool atEnd();
    bool readQuotedString(std::string& out);

    /// Read a scalar token. Strings are unescaped; other tokens are raw.
    /// Sets @p quoted to whether the token was a JSON string.
    bool readScalar(std::string& out, bool& quoted);

private:
    void skipWhitespace();

    std::string_view data_;
    std::size_t pos_ = 0;
};

template <typename T>
void writeJsonValue(std::ostringstream& out, const T& val) {
    if constexpr (std::is_same_v<T, bool>) {
        out << (val ? "true" : "false");
    } else if constexpr (std::is_same_v<T, std::string>) {
        out << '"' << escapeJson(val) << '"';
    } else if constexpr (std::is_floating_point_v<T>) {
        out << val;
    } else if constexpr (std::is_signed_v<T>) {
        out << static_cast<int64_t>(val);
    } else {
        out << static_cast<uint64_t>(val);
    }
}

template <typename T>
bool readJsonValue(const std::string& raw, bool quoted, T& val) {
    if constexpr (std::is_same_v<T, std::string>) {
        if (!quoted) return false;
        val = raw;
        return true;
    } else {
        if (quoted) return false;
        if constexpr (std::is_same_v<T, bool>) {
            return parseBool(raw, val);
        } else if constexpr (std::is_floating_point_v<T>) {
            double d = 0.0;
            if (!parseDouble(raw, d)) return false;
            val = static_cast<T>(d);
            return true;
        } else if constexpr (std::is_signed_v<T>) {
            int64_t v = 0;
            if (!parseSigned(raw, v)) return false;
            val = static_cast<T>(v);
            return true;
        } else {
            uint64_t v = 0;
            if (!parseUnsigned(raw, v)) return false;
            val = static_cast<T>(v);
            return true;
        }
    }
}

}  // namespace detail

// ── GameSerializer ──────────────────────────────────────────────────────────

/// JSON serializer with schema versioning.
///
/// Types must be registered with TBC_SERIALIZABLE before use. Objects are
/// flat: every registered field is a bool, integer, floating-point or
/// string. Unknown keys are skipped and missing keys keep their default
/// value, so older documents load into newer structs. A known key whose
/// value does not parse as the field type is rejected.
///
/// Example:
/// @code
///   struct RngState {
///       uint64_t seed = 0;
///       std::string engine;
///       uint64_t draws = 0;
///   };
///   TBC_SERIALIZABLE(RngState, 1,
///       field("seed", &RngState::seed),
///       field("engine", &RngState::engine),
///       field("draws", &RngState::draws)
///   );
///
///   auto json = GameSerializer::instance().serializeJson(state);
///   auto restored = GameSerializer::instance().deserializeJson<RngState>(json);
/// @endcode
class GameSerializer {
public:
    GameSerializer();
    ~GameSerializer();

    GameSerializer(const GameSerializer&) = delete;
    GameSerializer& operator=(const GameSerializer&) = delete;
    GameSerializer(GameSerializer&&) noexcept;
    GameSerializer& operator=(GameSerializer&&) noexcept;

    /// Serialize an object to a JSON string carrying its schema version.
    template <typename T>
    [[nodiscard]] std::string serializeJson(const T& obj) const {
        static_assert(detail::is_serializable_v<T>,
                      "Type must be registered with TBC_SERIALIZABLE");

        std::ostringstream out;
        out << "{\"__v\":" << SerializableTraits<T>::schema_version;
        detail::forEachField(SerializableTraits<T>::fields(), [&](const auto& fd) {
            out << ",\"" << fd.name << "\":";
            detail::writeJsonValue(out, obj.*(fd.pointer));
        });
        out << '}';
        return out.str();
    }

    /// Deserialize an object from a JSON string.
    template <typename T>
    [[nodiscard]] GameResult<T> deserializeJson(std::string_view json) const {
        static_assert(detail::is_serializable_v<T>,
                      "Type must be registered with TBC_SERIALIZABLE");

        auto fail = [](const std::string& why) {
            return GameResult<T>::err(GameError(ErrorCode::InvalidJsonData, why));
        };

        detail::JsonReader reader(json);
        if (!reader.expect('{')) {
            return fail("expected '{'");
        }

        T obj{};
        bool first = true;
        while (!reader.peek('}')) {
            if (reader.atEnd()) {
                return fail("unexpected end of JSON");
            }
            if (!first && !reader.expect(',')) {
                return fail("expected ','");
            }
            first = false;

            std::string key;
            if (!reader.readQuotedString(key)) {
                return fail("expected key string");
            }
            if (!reader.expect(':')) {
                return fail("expected ':'");
            }

            std::string raw;
            bool quoted = false;
            if (!reader.readScalar(raw, quoted)) {
                return fail("bad value for key: " + key);
            }

            bool typeError = false;
            detail::forEachField(SerializableTraits<T>::fields(), [&](const auto& fd) {
                if (key != fd.name) return;
                using FieldType =
                    std::remove_reference_t<decltype(obj.*(fd.pointer))>;
                FieldType val{};
                if (detail::readJsonValue(raw, quoted, val)) {
                    obj.*(fd.pointer) = std::move(val);
                } else {
                    typeError = true;
                }
            });
            if (typeError) {
                return fail("type mismatch for key: " + key);
            }
        }
        reader.expect('}');
        return GameResult<T>::ok(std::move(obj));
    }

    /// Access the global GameSerializer instance.
    static GameSerializer& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace tbc::foundation

// ── TBC_SERIALIZABLE macro ──────────────────────────────────────────────────
/// Register a type for serialization with field descriptors and version.
///
/// @param Type     The struct/class type to register (fully qualified).
/// @param Version  Schema version number (uint32_t).
/// @param ...      field("name", &Type::member) descriptors.
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define TBC_SERIALIZABLE(Type, Version, ...)                                   \
    template <>                                                                \
    struct tbc::foundation::SerializableTraits<Type> {                         \
        static constexpr bool is_serializable = true;                          \
        static constexpr uint32_t schema_version = Version;                    \
        static constexpr auto fields() {                                       \
            using tbc::foundation::field;                                      \
            return std::make_tuple(__VA_ARGS__);                               \
        }                                                                      \
    }
