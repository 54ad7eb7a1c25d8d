#include "protocol.h"
#include "errors.h"
#include <memory>
#include <sstream>

namespace neurax {

namespace {

constexpr const char* KEY_EXCHANGE = "key_exchange";
constexpr const char* ACTION_PUBLIC_KEY = "send_public_key";
constexpr const char* ACTION_SESSION_KEY = "send_aes_key";
constexpr const char* ACTION_SESSION_KEY_ACK = "aes_key_received";
constexpr const char* ENCRYPTED_TASK = "encrypted_task";
constexpr const char* ENCRYPTED_RESULT = "encrypted_result";

std::string require_string(const Json::Value& object, const char* key) {
    const Json::Value& value = object[key];
    if (!value.isString()) {
        throw DecodeError(std::string("missing or non-string field '") + key + "'");
    }
    return value.asString();
}

std::string optional_string(const Json::Value& object, const char* key,
                            const std::string& fallback) {
    if (!object.isMember(key) || object[key].isNull()) {
        return fallback;
    }
    if (!object[key].isString()) {
        throw DecodeError(std::string("non-string field '") + key + "'");
    }
    return object[key].asString();
}

Json::Value require_object(const std::string& raw, const char* what) {
    Json::Value root = MessageCodec::parse(raw);
    if (!root.isObject()) {
        throw DecodeError(std::string(what) + " is not a JSON object");
    }
    return root;
}

} // namespace

ChannelMessage ChannelMessage::make_public_key(const std::string& pem) {
    ChannelMessage message;
    message.type = MessageType::PUBLIC_KEY;
    message.public_key = pem;
    return message;
}

ChannelMessage ChannelMessage::make_session_key(const std::string& encrypted_key) {
    ChannelMessage message;
    message.type = MessageType::SESSION_KEY;
    message.encrypted_aes_key = encrypted_key;
    return message;
}

ChannelMessage ChannelMessage::make_session_key_ack() {
    ChannelMessage message;
    message.type = MessageType::SESSION_KEY_ACK;
    return message;
}

ChannelMessage ChannelMessage::make_encrypted_task(const std::string& sealed) {
    ChannelMessage message;
    message.type = MessageType::ENCRYPTED_TASK;
    message.encrypted_data = sealed;
    return message;
}

ChannelMessage ChannelMessage::make_encrypted_result(const std::string& sealed) {
    ChannelMessage message;
    message.type = MessageType::ENCRYPTED_RESULT;
    message.encrypted_data = sealed;
    return message;
}

std::string RelayEvent::session_id() const {
    if (data.isObject() && data["session_id"].isString()) {
        return data["session_id"].asString();
    }
    return "";
}

std::string MessageCodec::write(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

Json::Value MessageCodec::parse(const std::string& raw) {
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    try {
        if (!reader->parse(raw.data(), raw.data() + raw.size(), &root, &errors)) {
            throw DecodeError("invalid JSON: " + errors);
        }
    } catch (const Json::Exception& e) {
        // Nesting beyond the reader's stack limit throws instead of failing
        throw DecodeError(std::string("invalid JSON: ") + e.what());
    }
    return root;
}

std::string MessageCodec::encode(const ChannelMessage& message) {
    Json::Value json;
    switch (message.type) {
        case MessageType::PUBLIC_KEY:
            json["type"] = KEY_EXCHANGE;
            json["action"] = ACTION_PUBLIC_KEY;
            json["public_key"] = message.public_key;
            break;
        case MessageType::SESSION_KEY:
            json["type"] = KEY_EXCHANGE;
            json["action"] = ACTION_SESSION_KEY;
            json["encrypted_aes_key"] = message.encrypted_aes_key;
            break;
        case MessageType::SESSION_KEY_ACK:
            json["type"] = KEY_EXCHANGE;
            json["action"] = ACTION_SESSION_KEY_ACK;
            break;
        case MessageType::ENCRYPTED_TASK:
            json["type"] = ENCRYPTED_TASK;
            json["encrypted_data"] = message.encrypted_data;
            break;
        case MessageType::ENCRYPTED_RESULT:
            json["type"] = ENCRYPTED_RESULT;
            json["encrypted_data"] = message.encrypted_data;
            break;
    }
    return write(json);
}

ChannelMessage MessageCodec::decode_channel_message(const std::string& raw) {
    Json::Value root = require_object(raw, "channel message");
    std::string type = require_string(root, "type");

    ChannelMessage message;
    if (type == KEY_EXCHANGE) {
        std::string action = require_string(root, "action");
        if (action == ACTION_PUBLIC_KEY) {
            message.type = MessageType::PUBLIC_KEY;
            message.public_key = require_string(root, "public_key");
        } else if (action == ACTION_SESSION_KEY) {
            message.type = MessageType::SESSION_KEY;
            message.encrypted_aes_key = require_string(root, "encrypted_aes_key");
        } else if (action == ACTION_SESSION_KEY_ACK) {
            message.type = MessageType::SESSION_KEY_ACK;
        } else {
            throw DecodeError("unknown key_exchange action '" + action + "'");
        }
    } else if (type == ENCRYPTED_TASK) {
        message.type = MessageType::ENCRYPTED_TASK;
        message.encrypted_data = require_string(root, "encrypted_data");
    } else if (type == ENCRYPTED_RESULT) {
        message.type = MessageType::ENCRYPTED_RESULT;
        message.encrypted_data = require_string(root, "encrypted_data");
    } else {
        throw DecodeError("unknown message type '" + type + "'");
    }
    return message;
}

std::string MessageCodec::encode_task(const Task& task) {
    Json::Value json;
    json["code"] = task.code;
    json["type"] = task.kind;
    return write(json);
}

Task MessageCodec::decode_task(const std::string& raw) {
    Json::Value root = require_object(raw, "task");
    Task task;
    task.code = require_string(root, "code");
    task.kind = optional_string(root, "type", TASK_KIND_PYTHON);
    return task;
}

std::string MessageCodec::encode_result(const ExecutionResult& result) {
    Json::Value json;
    json["exit_code"] = result.exit_code;
    json["stdout"] = result.stdout_output;
    json["stderr"] = result.stderr_output;
    json["execution_time"] = result.execution_time;
    return write(json);
}

ExecutionResult MessageCodec::decode_result(const std::string& raw) {
    Json::Value root = require_object(raw, "result");

    const Json::Value& exit_code = root["exit_code"];
    if (!exit_code.isInt()) {
        throw DecodeError("missing or non-integer field 'exit_code'");
    }

    ExecutionResult result;
    result.exit_code = exit_code.asInt();
    result.stdout_output = optional_string(root, "stdout", "");
    result.stderr_output = optional_string(root, "stderr", "");

    const Json::Value& elapsed = root["execution_time"];
    if (elapsed.isNumeric()) {
        result.execution_time = elapsed.asDouble();
    } else if (!elapsed.isNull()) {
        throw DecodeError("non-numeric field 'execution_time'");
    }
    return result;
}

std::string MessageCodec::encode_relay_event(const RelayEvent& event) {
    Json::Value json;
    json["event"] = event.name;
    json["data"] = event.data;
    return write(json);
}

RelayEvent MessageCodec::decode_relay_event(const std::string& line) {
    Json::Value root = require_object(line, "relay event");

    RelayEvent event;
    event.name = require_string(root, "event");
    if (root.isMember("data")) {
        event.data = root["data"];
    }
    return event;
}

RelayEvent MessageCodec::create_session(const std::string& session_id) {
    RelayEvent event;
    event.name = relay_events::CREATE_SESSION;
    event.data["session_id"] = session_id;
    return event;
}

RelayEvent MessageCodec::offer(const std::string& session_id, const std::string& offer) {
    RelayEvent event;
    event.name = relay_events::OFFER;
    event.data["session_id"] = session_id;
    event.data["offer"] = offer;
    return event;
}

RelayEvent MessageCodec::answer(const std::string& session_id, const std::string& answer) {
    RelayEvent event;
    event.name = relay_events::ANSWER;
    event.data["session_id"] = session_id;
    event.data["answer"] = answer;
    return event;
}

RelayEvent MessageCodec::ice_candidate(const std::string& session_id, const IceCandidate& candidate) {
    RelayEvent event;
    event.name = relay_events::ICE_CANDIDATE;
    event.data["session_id"] = session_id;
    Json::Value inner;
    inner["candidate"] = candidate.candidate;
    inner["sdpMid"] = candidate.sdp_mid;
    inner["sdpMLineIndex"] = candidate.sdp_mline_index;
    event.data["candidate"] = inner;
    return event;
}

RelayEvent MessageCodec::channel_message(const std::string& session_id, const std::string& payload) {
    RelayEvent event;
    event.name = relay_events::CHANNEL_MESSAGE;
    event.data["session_id"] = session_id;
    event.data["payload"] = payload;
    return event;
}

RelayEvent MessageCodec::channel_close(const std::string& session_id) {
    RelayEvent event;
    event.name = relay_events::CHANNEL_CLOSE;
    event.data["session_id"] = session_id;
    return event;
}

IceCandidate MessageCodec::decode_ice_candidate(const RelayEvent& event) {
    const Json::Value& inner = event.data["candidate"];
    if (!inner.isObject()) {
        throw DecodeError("ice_candidate without candidate object");
    }

    IceCandidate candidate;
    candidate.candidate = require_string(inner, "candidate");
    candidate.sdp_mid = optional_string(inner, "sdpMid", "");
    if (inner["sdpMLineIndex"].isInt()) {
        candidate.sdp_mline_index = inner["sdpMLineIndex"].asInt();
    }
    return candidate;
}

} // namespace neurax
