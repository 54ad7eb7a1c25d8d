#pragma once

#include "task.h"
#include <string>
#include <json/json.h>

namespace neurax {

// Transport channel message kinds, keyed on the wire by "type"/"action"
enum class MessageType {
    PUBLIC_KEY,         // key_exchange / send_public_key
    SESSION_KEY,        // key_exchange / send_aes_key
    SESSION_KEY_ACK,    // key_exchange / aes_key_received
    ENCRYPTED_TASK,
    ENCRYPTED_RESULT
};

struct ChannelMessage {
    MessageType type = MessageType::PUBLIC_KEY;
    std::string public_key;          // PUBLIC_KEY
    std::string encrypted_aes_key;   // SESSION_KEY
    std::string encrypted_data;      // ENCRYPTED_TASK / ENCRYPTED_RESULT

    static ChannelMessage make_public_key(const std::string& pem);
    static ChannelMessage make_session_key(const std::string& encrypted_key);
    static ChannelMessage make_session_key_ack();
    static ChannelMessage make_encrypted_task(const std::string& sealed);
    static ChannelMessage make_encrypted_result(const std::string& sealed);
};

struct IceCandidate {
    std::string candidate;
    std::string sdp_mid;
    int sdp_mline_index = 0;
};

// Signaling event exchanged with the relay: {"event": name, "data": {...}}
struct RelayEvent {
    std::string name;
    Json::Value data{Json::objectValue};

    std::string session_id() const;
};

// Relay event names
namespace relay_events {
constexpr const char* CREATE_SESSION = "create_session";
constexpr const char* SESSION_CREATED = "session_created";
constexpr const char* OFFER = "offer";
constexpr const char* ANSWER = "answer";
constexpr const char* ICE_CANDIDATE = "ice_candidate";
constexpr const char* CHANNEL_MESSAGE = "channel_message";
constexpr const char* CHANNEL_CLOSE = "channel_close";
constexpr const char* REGISTER_COMPUTE_NODE = "register_compute_node";
constexpr const char* REGISTERED = "registered";
constexpr const char* ERROR = "error";
} // namespace relay_events

// JSON encoding for everything that crosses the channel or the relay.
// Decoders throw DecodeError on malformed input.
class MessageCodec {
public:
    static std::string encode(const ChannelMessage& message);
    static ChannelMessage decode_channel_message(const std::string& raw);

    // Sealed plaintexts
    static std::string encode_task(const Task& task);
    static Task decode_task(const std::string& raw);
    static std::string encode_result(const ExecutionResult& result);
    static ExecutionResult decode_result(const std::string& raw);

    static std::string encode_relay_event(const RelayEvent& event);
    static RelayEvent decode_relay_event(const std::string& line);

    static RelayEvent create_session(const std::string& session_id);
    static RelayEvent offer(const std::string& session_id, const std::string& offer);
    static RelayEvent answer(const std::string& session_id, const std::string& answer);
    static RelayEvent ice_candidate(const std::string& session_id, const IceCandidate& candidate);
    static RelayEvent channel_message(const std::string& session_id, const std::string& payload);
    static RelayEvent channel_close(const std::string& session_id);
    static IceCandidate decode_ice_candidate(const RelayEvent& event);

    // Compact single-line JSON
    static std::string write(const Json::Value& value);
    static Json::Value parse(const std::string& raw);
};

} // namespace neurax
