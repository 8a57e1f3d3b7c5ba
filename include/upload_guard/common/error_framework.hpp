#pragma once

#include <string>
#include <map>
#include <unordered_map>
#include <optional>
#include <utility>

namespace upload_guard {
namespace common {

template<typename EnumType>
struct ErrorInfo {
    EnumType code;
    const char* code_str;
    const char* default_message;
};

struct ErrorContext {
    std::string component;
    std::map<std::string, std::string> details;
};

template<typename EnumType>
class ErrorRegistry {
public:
    static const ErrorInfo<EnumType>& getInfo(EnumType code) {
        const auto& map = getInfoMap();
        auto it = map.find(code);
        if (it != map.end()) {
            return it->second;
        }
        static ErrorInfo<EnumType> fallback{EnumType{}, "UNKNOWN", "Unknown error"};
        return fallback;
    }

    static const char* toString(EnumType code) {
        return getInfo(code).code_str;
    }

    static const char* getMessage(EnumType code) {
        return getInfo(code).default_message;
    }

protected:
    static const std::unordered_map<EnumType, ErrorInfo<EnumType>>& getInfoMap();
};

// Result of a single pipeline stage: either a value or an error code with a
// rendered message. Stages return these instead of throwing.
template<typename T, typename CodeType>
struct Outcome {
    std::optional<T> value;
    std::optional<CodeType> code;
    std::string message;
    ErrorContext context;

    bool ok() const { return value.has_value(); }

    static Outcome success(T v) {
        Outcome out;
        out.value = std::move(v);
        return out;
    }

    static Outcome failure(CodeType c, std::string msg, ErrorContext ctx = {}) {
        Outcome out;
        out.code = c;
        out.message = std::move(msg);
        out.context = std::move(ctx);
        return out;
    }
};

inline std::string formatContext(const ErrorContext& ctx) {
    std::string result;
    for (const auto& [key, value] : ctx.details) {
        if (!result.empty()) {
            result += " | ";
        }
        result += key + "=" + value;
    }
    return result;
}

}}
