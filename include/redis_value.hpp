#pragma once
#include <expected>
#include <format>
#include <hiredis/hiredis.h>
#include <string>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

#include "bridge_error.hpp"

namespace redis_bridge {

/**
 * RedisValue
 *
 * Owned copy of a server reply. Built from a hiredis reply tree on the
 * connection strand, or directly through the named constructors (fakes,
 * tests, EXEC unpacking).
 */
struct RedisValue {
    enum class Type : int {
        Nil = REDIS_REPLY_NIL,
        String = REDIS_REPLY_STRING,
        Error = REDIS_REPLY_ERROR,
        Integer = REDIS_REPLY_INTEGER,
        Status = REDIS_REPLY_STATUS,
        Double = REDIS_REPLY_DOUBLE,
        Bool = REDIS_REPLY_BOOL,
        Array = REDIS_REPLY_ARRAY,
        Push = REDIS_REPLY_PUSH,
        Map = REDIS_REPLY_MAP,
        Set = REDIS_REPLY_SET,
        Attr = REDIS_REPLY_ATTR,
        Bignum = REDIS_REPLY_BIGNUM,
        Verb = REDIS_REPLY_VERB
    } type{Type::Nil};

    using Array = std::vector<RedisValue>;
    using KVList = std::vector<std::pair<std::string, RedisValue>>;

    std::variant<
        std::monostate,
        std::string,
        bool,
        long long,
        double,
        Array,
        KVList>
        payload{};

    static RedisValue fromRaw(const redisReply *r);

    static RedisValue nil() { return {}; }
    static RedisValue string(std::string s) { return {Type::String, std::move(s)}; }
    static RedisValue status(std::string s) { return {Type::Status, std::move(s)}; }
    static RedisValue error(std::string s) { return {Type::Error, std::move(s)}; }
    static RedisValue integer(long long n) { return {Type::Integer, n}; }
    static RedisValue array(Array a) { return {Type::Array, std::move(a)}; }

    bool is_nil() const noexcept { return type == Type::Nil; }
    bool is_error() const noexcept { return type == Type::Error; }
    bool is_array() const noexcept { return type == Type::Array || type == Type::Set || type == Type::Push; }

    // Error text for Type::Error, empty otherwise.
    std::string error_message() const;

    // Elements of an Array/Set/Push reply, empty for scalars.
    const Array &elements() const noexcept;

    std::string toString() const;

    operator std::string() const { return toString(); }

    bool operator==(const RedisValue &) const = default;
};

inline std::expected<std::string, std::error_code> string_like(const RedisValue &rv) {
    using T = RedisValue::Type;
    if (rv.type == T::String || rv.type == T::Status || rv.type == T::Bignum || rv.type == T::Verb) {
        if (auto p = std::get_if<std::string>(&rv.payload))
            return *p;
    }
    return std::unexpected(protocol_error());
}

inline std::expected<long long, std::error_code> as_integer(const RedisValue &rv) {
    if (rv.type == RedisValue::Type::Integer) {
        if (auto p = std::get_if<long long>(&rv.payload))
            return *p;
    }
    return std::unexpected(protocol_error());
}

} // namespace redis_bridge

template <>
struct std::formatter<redis_bridge::RedisValue> : std::formatter<std::string> {
    template <typename FormatContext>
    auto format(redis_bridge::RedisValue const &rv, FormatContext &ctx) const {
        return std::formatter<std::string>::format(rv.toString(), ctx);
    }
};
