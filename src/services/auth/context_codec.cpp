/// @file context_codec.cpp
/// @brief Minimal flat-object JSON codec for SecurityContext.
///
/// Only the shapes encodeContext() emits are accepted: one object of
/// string, integer and boolean members without nesting.

#include "ssg/service/context_codec.hpp"

#include <charconv>
#include <cstdint>
#include <map>
#include <sstream>
#include <variant>

namespace ssg::service {

using foundation::ErrorCode;
using foundation::kGenericAuthFailure;
using foundation::ServiceError;
using foundation::ServiceResult;

namespace {

using JsonScalar = std::variant<std::string, int64_t, bool>;

std::string jsonEscape(std::string_view s) {
    static constexpr char hexChars[] = "0123456789abcdef";
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out.push_back(hexChars[(c >> 4) & 0x0F]);
                    out.push_back(hexChars[c & 0x0F]);
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
    return out;
}

/// Cursor over the input; every parse step returns false on malformed input.
class FlatObjectParser {
public:
    explicit FlatObjectParser(std::string_view json) : json_(json) {}

    bool parse(std::map<std::string, JsonScalar>& out) {
        skipSpace();
        if (!consume('{')) {
            return false;
        }
        skipSpace();
        if (consume('}')) {
            return atEnd();
        }
        while (true) {
            std::string key;
            JsonScalar value;
            skipSpace();
            if (!parseString(key)) {
                return false;
            }
            skipSpace();
            if (!consume(':')) {
                return false;
            }
            skipSpace();
            if (!parseValue(value)) {
                return false;
            }
            out[std::move(key)] = std::move(value);
            skipSpace();
            if (consume(',')) {
                continue;
            }
            if (consume('}')) {
                return atEnd();
            }
            return false;
        }
    }

private:
    bool atEnd() {
        skipSpace();
        return pos_ == json_.size();
    }

    void skipSpace() {
        while (pos_ < json_.size() &&
               (json_[pos_] == ' ' || json_[pos_] == '\t' || json_[pos_] == '\n' ||
                json_[pos_] == '\r')) {
            ++pos_;
        }
    }

    bool consume(char c) {
        if (pos_ < json_.size() && json_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool consumeLiteral(std::string_view lit) {
        if (json_.substr(pos_, lit.size()) == lit) {
            pos_ += lit.size();
            return true;
        }
        return false;
    }

    bool parseValue(JsonScalar& value) {
        if (pos_ >= json_.size()) {
            return false;
        }
        char c = json_[pos_];
        if (c == '"') {
            std::string s;
            if (!parseString(s)) {
                return false;
            }
            value = std::move(s);
            return true;
        }
        if (consumeLiteral("true")) {
            value = true;
            return true;
        }
        if (consumeLiteral("false")) {
            value = false;
            return true;
        }
        int64_t n = 0;
        auto [ptr, ec] = std::from_chars(json_.data() + pos_, json_.data() + json_.size(), n);
        if (ec != std::errc{}) {
            return false;
        }
        pos_ = static_cast<std::size_t>(ptr - json_.data());
        value = n;
        return true;
    }

    bool parseString(std::string& out) {
        if (!consume('"')) {
            return false;
        }
        while (pos_ < json_.size()) {
            char c = json_[pos_++];
            if (c == '"') {
                return true;
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (pos_ >= json_.size()) {
                return false;
            }
            char esc = json_[pos_++];
            switch (esc) {
                case '"':
                case '\\':
                case '/':
                    out.push_back(esc);
                    break;
                case 'n':
                    out.push_back('\n');
                    break;
                case 'r':
                    out.push_back('\r');
                    break;
                case 't':
                    out.push_back('\t');
                    break;
                case 'u': {
                    // Only the control-character escapes emitted by jsonEscape.
                    if (pos_ + 4 > json_.size() || json_.substr(pos_, 2) != "00") {
                        return false;
                    }
                    unsigned int code = 0;
                    auto [ptr, ec] = std::from_chars(json_.data() + pos_ + 2,
                                                     json_.data() + pos_ + 4, code, 16);
                    if (ec != std::errc{} || ptr != json_.data() + pos_ + 4) {
                        return false;
                    }
                    out.push_back(static_cast<char>(code));
                    pos_ += 4;
                    break;
                }
                default:
                    return false;
            }
        }
        return false;
    }

    std::string_view json_;
    std::size_t pos_ = 0;
};

template <typename T>
const T* member(const std::map<std::string, JsonScalar>& obj, const std::string& key) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return nullptr;
    }
    return std::get_if<T>(&it->second);
}

ServiceResult<SecurityContext> malformed() {
    return ServiceResult<SecurityContext>::err(
        ServiceError(ErrorCode::IntegrityError, std::string(kGenericAuthFailure)));
}

}  // namespace

std::string encodeContext(const SecurityContext& ctx) {
    auto lastActivityMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                              ctx.lastActivity.time_since_epoch())
                              .count();

    std::ostringstream out;
    out << "{\"user_id\":" << jsonEscape(ctx.userId)
        << ",\"session_id\":" << jsonEscape(ctx.sessionId)
        << ",\"ip_address\":" << jsonEscape(ctx.ipAddress)
        << ",\"user_agent\":" << jsonEscape(ctx.userAgent)
        << ",\"security_clearance\":" << ctx.securityClearance
        << ",\"mfa_verified\":" << (ctx.mfaVerified ? "true" : "false")
        << ",\"last_activity\":" << lastActivityMs << "}";
    return out.str();
}

ServiceResult<SecurityContext> decodeContext(std::string_view json) {
    std::map<std::string, JsonScalar> obj;
    FlatObjectParser parser(json);
    if (!parser.parse(obj)) {
        return malformed();
    }

    const auto* userId = member<std::string>(obj, "user_id");
    const auto* sessionId = member<std::string>(obj, "session_id");
    const auto* ip = member<std::string>(obj, "ip_address");
    const auto* userAgent = member<std::string>(obj, "user_agent");
    const auto* clearance = member<int64_t>(obj, "security_clearance");
    const auto* mfa = member<bool>(obj, "mfa_verified");
    const auto* lastActivity = member<int64_t>(obj, "last_activity");
    if (!userId || !sessionId || !ip || !userAgent || !clearance || !mfa || !lastActivity ||
        *clearance < 0 || *clearance > UINT32_MAX) {
        return malformed();
    }

    SecurityContext ctx;
    ctx.userId = *userId;
    ctx.sessionId = *sessionId;
    ctx.ipAddress = *ip;
    ctx.userAgent = *userAgent;
    ctx.securityClearance = static_cast<uint32_t>(*clearance);
    ctx.mfaVerified = *mfa;
    ctx.lastActivity = TimePoint(std::chrono::duration_cast<TimePoint::duration>(
        std::chrono::milliseconds{*lastActivity}));
    return ServiceResult<SecurityContext>::ok(std::move(ctx));
}

}  // namespace ssg::service
