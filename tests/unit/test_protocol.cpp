#include <gtest/gtest.h>
#include "protocol.h"
#include "errors.h"

namespace neurax {
namespace {

class ProtocolTest : public ::testing::Test {};

TEST_F(ProtocolTest, PublicKeyWireShape) {
    // Given: A public key message
    ChannelMessage message = ChannelMessage::make_public_key("PEM");

    // When: Encoded
    Json::Value json = MessageCodec::parse(MessageCodec::encode(message));

    // Then: It uses the key_exchange envelope
    EXPECT_EQ(json["type"].asString(), "key_exchange");
    EXPECT_EQ(json["action"].asString(), "send_public_key");
    EXPECT_EQ(json["public_key"].asString(), "PEM");
}

TEST_F(ProtocolTest, SessionKeyAndAckWireShape) {
    Json::Value key = MessageCodec::parse(MessageCodec::encode(ChannelMessage::make_session_key("abc")));
    EXPECT_EQ(key["action"].asString(), "send_aes_key");
    EXPECT_EQ(key["encrypted_aes_key"].asString(), "abc");

    Json::Value ack = MessageCodec::parse(MessageCodec::encode(ChannelMessage::make_session_key_ack()));
    EXPECT_EQ(ack["type"].asString(), "key_exchange");
    EXPECT_EQ(ack["action"].asString(), "aes_key_received");
}

TEST_F(ProtocolTest, EncodedMessagesAreSingleLine) {
    std::string encoded = MessageCodec::encode(ChannelMessage::make_public_key("line1\nline2\n"));
    EXPECT_EQ(encoded.find('\n'), std::string::npos);
}

TEST_F(ProtocolTest, DecodesEveryMessageType) {
    EXPECT_EQ(MessageCodec::decode_channel_message(
                  R"({"type":"encrypted_task","encrypted_data":"x"})").type,
              MessageType::ENCRYPTED_TASK);
    EXPECT_EQ(MessageCodec::decode_channel_message(
                  R"({"type":"encrypted_result","encrypted_data":"y"})").encrypted_data,
              "y");
    EXPECT_EQ(MessageCodec::decode_channel_message(
                  R"({"type":"key_exchange","action":"aes_key_received"})").type,
              MessageType::SESSION_KEY_ACK);
}

TEST_F(ProtocolTest, RejectsMalformedMessages) {
    EXPECT_THROW(MessageCodec::decode_channel_message("not json"), DecodeError);
    EXPECT_THROW(MessageCodec::decode_channel_message("[1,2]"), DecodeError);
    EXPECT_THROW(MessageCodec::decode_channel_message(R"({"type":"unknown"})"), DecodeError);
    EXPECT_THROW(MessageCodec::decode_channel_message(R"({"type":"key_exchange","action":"x"})"),
                 DecodeError);
    EXPECT_THROW(MessageCodec::decode_channel_message(R"({"type":"encrypted_task"})"), DecodeError);
    EXPECT_THROW(MessageCodec::decode_channel_message(
                     R"({"type":"key_exchange","action":"send_public_key","public_key":7})"),
                 DecodeError);
}

TEST_F(ProtocolTest, DeeplyNestedInputIsDecodeError) {
    std::string nested(2000, '[');
    EXPECT_THROW(MessageCodec::decode_channel_message(nested), DecodeError);
    EXPECT_THROW(MessageCodec::decode_relay_event(nested), DecodeError);
    EXPECT_THROW(MessageCodec::decode_result(nested + std::string(2000, ']')), DecodeError);
}

TEST_F(ProtocolTest, TaskDefaultsToPythonCode) {
    Task task = MessageCodec::decode_task(R"j({"code":"print(1)"})j");
    EXPECT_EQ(task.code, "print(1)");
    EXPECT_EQ(task.kind, TASK_KIND_PYTHON);

    EXPECT_THROW(MessageCodec::decode_task(R"({"type":"python_code"})"), DecodeError);
}

TEST_F(ProtocolTest, TaskKeepsKindAndCode) {
    Task task;
    task.code = "echo \"hi\"\n";
    task.kind = TASK_KIND_SHELL;
    Task decoded = MessageCodec::decode_task(MessageCodec::encode_task(task));
    EXPECT_EQ(decoded.code, task.code);
    EXPECT_EQ(decoded.kind, TASK_KIND_SHELL);
}

TEST_F(ProtocolTest, ResultWireFields) {
    // Given: A result with every field set
    ExecutionResult result;
    result.exit_code = 1;
    result.stdout_output = "out";
    result.stderr_output = "Traceback";
    result.execution_time = 1.5;
    result.isolated = true;

    // When: Encoded
    Json::Value json = MessageCodec::parse(MessageCodec::encode_result(result));

    // Then: Only the wire fields are present
    EXPECT_EQ(json["exit_code"].asInt(), 1);
    EXPECT_EQ(json["stdout"].asString(), "out");
    EXPECT_EQ(json["stderr"].asString(), "Traceback");
    EXPECT_DOUBLE_EQ(json["execution_time"].asDouble(), 1.5);
    EXPECT_FALSE(json.isMember("isolated"));
}

TEST_F(ProtocolTest, ResultOutputIsCarriedAsUtf8Text) {
    // Given: Output with valid multi-byte UTF-8 and one stray binary byte
    ExecutionResult result;
    result.stdout_output = "caf\xc3\xa9 \xe2\x9c\x93\n";
    result.stderr_output = "bad \xff byte";

    // When: Sent through the wire format
    ExecutionResult decoded = MessageCodec::decode_result(MessageCodec::encode_result(result));

    // Then: Text survives exactly, the invalid byte becomes U+FFFD
    EXPECT_EQ(decoded.stdout_output, result.stdout_output);
    EXPECT_EQ(decoded.stderr_output, "bad \xef\xbf\xbd byte");
}

TEST_F(ProtocolTest, ResultRequiresIntegerExitCode) {
    EXPECT_THROW(MessageCodec::decode_result(R"({"stdout":"x"})"), DecodeError);
    EXPECT_THROW(MessageCodec::decode_result(R"({"exit_code":"0"})"), DecodeError);

    ExecutionResult minimal = MessageCodec::decode_result(R"({"exit_code":-1})");
    EXPECT_EQ(minimal.exit_code, -1);
    EXPECT_EQ(minimal.stdout_output, "");
}

TEST_F(ProtocolTest, RelayEventEnvelope) {
    RelayEvent event = MessageCodec::channel_message("s1", "{\"type\":\"x\"}");
    std::string line = MessageCodec::encode_relay_event(event);

    RelayEvent decoded = MessageCodec::decode_relay_event(line);
    EXPECT_EQ(decoded.name, "channel_message");
    EXPECT_EQ(decoded.session_id(), "s1");
    EXPECT_EQ(decoded.data["payload"].asString(), "{\"type\":\"x\"}");

    EXPECT_THROW(MessageCodec::decode_relay_event(R"({"data":{}})"), DecodeError);
}

TEST_F(ProtocolTest, IceCandidateFields) {
    IceCandidate candidate;
    candidate.candidate = "candidate:1 1 udp 2122260223 10.0.0.2 54321 typ host";
    candidate.sdp_mid = "0";
    candidate.sdp_mline_index = 0;

    RelayEvent event = MessageCodec::ice_candidate("s2", candidate);
    EXPECT_EQ(event.data["candidate"]["sdpMid"].asString(), "0");

    IceCandidate decoded = MessageCodec::decode_ice_candidate(
        MessageCodec::decode_relay_event(MessageCodec::encode_relay_event(event)));
    EXPECT_EQ(decoded.candidate, candidate.candidate);
    EXPECT_EQ(decoded.sdp_mid, "0");

    RelayEvent bare;
    bare.name = "ice_candidate";
    EXPECT_THROW(MessageCodec::decode_ice_candidate(bare), DecodeError);
}

TEST_F(ProtocolTest, SessionIdMissingIsEmpty) {
    RelayEvent event;
    event.name = "registered";
    EXPECT_EQ(event.session_id(), "");
}

} // namespace
} // namespace neurax
