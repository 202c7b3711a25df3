#pragma once

#include "codec/verb.hpp"
#include <optional>
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace vgauge {

enum class AccessCode : uint8_t
{
    // master -> gauge
    READ = 0,
    WRITE = 2,
    FACTORY_DEFAULT = 4,
    BINARY = 8,
    // gauge -> master only
    STREAMING = 6,
    ERROR = 7
};

std::optional<AccessCode> access_code_from_int(int value);

// Replies answer with request + 1; STREAMING and ERROR are terminal.
AccessCode reply_code(AccessCode request);

enum class ErrorMessage
{
    NO_DEF,
    LOGIC,
    RANGE,
    SENSOR_ERROR,
    SYNTAX,
    LENGTH,
    CD_RE,
    EP_RE,
    UNSUPPORTED_DATA,
    SENSOR_DISABLED
};

std::optional<ErrorMessage> parse_error_message(const std::string& text);
const char* error_message_text(ErrorMessage message);
const char* describe(ErrorMessage message);

// Mnemonic + access code -> operation; UNKNOWN when the pair has no meaning.
Verb resolve_verb_b(AccessCode access_code, const std::string& verb);

// Two-character mnemonic for a verb, empty for UNKNOWN.
std::string verb_mnemonic(Verb verb);

class ProtocolBCommand
{
public:
    ProtocolBCommand() = default;
    ProtocolBCommand(AccessCode access_code, const std::string& verb, const std::string& data = "");

    AccessCode access_code() const { return access_code_; }
    int function_code() const { return static_cast<int>(access_code_); }
    const std::string& verb() const { return verb_; }
    Verb kind() const { return resolve_verb_b(access_code_, verb_); }

    const std::string& data() const { return data_; }
    void set_data(const std::string& data);
    size_t length() const { return data_.size(); }

    bool is_error() const { return access_code_ == AccessCode::ERROR; }
    std::optional<ErrorMessage> error_message() const;

private:
    AccessCode access_code_ = AccessCode::READ;
    std::string verb_;
    std::string data_;
};

/*
 * <access 1><verb 2><length 2 decimal><data>
 *
 * A CLIENT decodes replies: the access digit is decremented to recover the
 * request code, except for STREAMING (6) and ERROR (7). A SERVER decodes
 * requests and takes the digit as sent.
 */
class ProtocolBCodec
{
public:
    enum class Role
    {
        CLIENT,
        SERVER
    };

    explicit ProtocolBCodec(Role role = Role::CLIENT) : role_(role) {}

    Role role() const { return role_; }

    std::optional<ProtocolBCommand> decode(const uint8_t* raw, size_t len) const;
    std::optional<ProtocolBCommand> decode(const std::vector<uint8_t>& raw) const
    {
        return decode(raw.data(), raw.size());
    }

    static std::vector<uint8_t> encode(const ProtocolBCommand& command);

private:
    Role role_;
};

} // namespace vgauge
