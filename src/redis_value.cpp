#include "redis_value.hpp"

#include <sstream>

namespace redis_bridge {

RedisValue RedisValue::fromRaw(const redisReply *r) {
    RedisValue v;
    if (!r)
        return v;
    switch (r->type) {
    case REDIS_REPLY_STRING:
    case REDIS_REPLY_STATUS:
    case REDIS_REPLY_ERROR:
    case REDIS_REPLY_BIGNUM:
    case REDIS_REPLY_VERB:
        v.type = static_cast<Type>(r->type);
        v.payload = std::string(r->str, r->len);
        break;
    case REDIS_REPLY_INTEGER:
        v.type = Type::Integer;
        v.payload = static_cast<long long>(r->integer);
        break;
    case REDIS_REPLY_NIL:
        break;
    case REDIS_REPLY_DOUBLE:
        v.type = Type::Double;
        v.payload = r->dval;
        break;
    case REDIS_REPLY_BOOL:
        v.type = Type::Bool;
        v.payload = (r->integer != 0);
        break;
    case REDIS_REPLY_ARRAY:
    case REDIS_REPLY_PUSH:
    case REDIS_REPLY_SET: {
        v.type = static_cast<Type>(r->type);
        Array a;
        a.reserve(r->elements);
        for (size_t i = 0; i < r->elements; ++i)
            a.push_back(fromRaw(r->element[i]));
        v.payload = std::move(a);
        break;
    }
    case REDIS_REPLY_MAP:
    case REDIS_REPLY_ATTR: {
        v.type = static_cast<Type>(r->type);
        KVList m;
        m.reserve(r->elements / 2);
        for (size_t i = 0; i + 1 < r->elements; i += 2) {
            const redisReply *k = r->element[i];
            std::string key = (k && k->str) ? std::string(k->str, k->len) : fromRaw(k).toString();
            m.emplace_back(std::move(key), fromRaw(r->element[i + 1]));
        }
        v.payload = std::move(m);
        break;
    }
    default:
        break;
    }
    return v;
}

std::string RedisValue::error_message() const {
    if (type != Type::Error)
        return {};
    if (auto p = std::get_if<std::string>(&payload))
        return *p;
    return {};
}

const RedisValue::Array &RedisValue::elements() const noexcept {
    static const Array empty;
    if (auto p = std::get_if<Array>(&payload))
        return *p;
    return empty;
}

std::string RedisValue::toString() const {
    return std::visit([&](auto &&x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>)
            return "nil";
        else if constexpr (std::is_same_v<T, std::string>) {
            switch (type) {
            case Type::Status:
                return "<status:" + x + ">";
            case Type::Error:
                return "<error:" + x + ">";
            case Type::Bignum:
                return "<bignum:" + x + ">";
            default:
                return x;
            }
        } else if constexpr (std::is_same_v<T, bool>)
            return x ? "true" : "false";
        else if constexpr (std::is_same_v<T, long long>)
            return std::to_string(x);
        else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream ss;
            ss << x;
            return ss.str();
        } else if constexpr (std::is_same_v<T, Array>) {
            std::string out = "[";
            for (size_t i = 0; i < x.size(); ++i) {
                if (i)
                    out += ", ";
                out += x[i].toString();
            }
            return out + ']';
        } else {
            std::string out = "{";
            for (size_t i = 0; i < x.size(); ++i) {
                if (i)
                    out += ", ";
                out += x[i].first + ':' + x[i].second.toString();
            }
            return out + '}';
        }
    },
                      payload);
}

} // namespace redis_bridge
