#include <gtest/gtest.h>
#include "mcp_echo/codec.hpp"
#include "mcp_echo/error.hpp"

using namespace mcp_echo;

// ---- Parse tests ----

TEST(CodecParse, ValidRequest) {
    auto req = Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})");
    ASSERT_TRUE(req.id.has_value());
    EXPECT_EQ(std::get<int64_t>(*req.id), 1);
    EXPECT_EQ(req.method, "ping");
    ASSERT_TRUE(req.params.has_value());
    EXPECT_TRUE(req.params->is_object());
}

TEST(CodecParse, ValidRequestStringId) {
    auto req = Codec::parse(R"({"jsonrpc":"2.0","id":"abc-123","method":"tools/list"})");
    EXPECT_EQ(std::get<std::string>(*req.id), "abc-123");
    EXPECT_EQ(req.method, "tools/list");
    EXPECT_FALSE(req.params.has_value());
}

TEST(CodecParse, NullIdIsKept) {
    auto req = Codec::parse(R"({"jsonrpc":"2.0","id":null,"method":"ping"})");
    ASSERT_TRUE(req.id.has_value());
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(*req.id));
}

TEST(CodecParse, MissingIdIsAbsent) {
    auto req = Codec::parse(R"({"jsonrpc":"2.0","method":"ping"})");
    EXPECT_FALSE(req.id.has_value());
}

TEST(CodecParse, FractionalAndHugeIds) {
    auto frac = Codec::parse(R"({"id":1.5,"method":"ping"})");
    EXPECT_DOUBLE_EQ(std::get<double>(*frac.id), 1.5);

    auto huge = Codec::parse(R"({"id":18446744073709551615,"method":"ping"})");
    EXPECT_EQ(std::get<uint64_t>(*huge.id), 18446744073709551615ULL);

    auto negative = Codec::parse(R"({"id":-7,"method":"ping"})");
    EXPECT_EQ(std::get<int64_t>(*negative.id), -7);
}

TEST(CodecParse, JsonrpcFieldIsOptional) {
    auto req = Codec::parse(R"({"id":1,"method":"initialize","params":{}})");
    EXPECT_EQ(req.method, "initialize");
}

TEST(CodecParse, WrongJsonrpcVersionStillParses) {
    auto req = Codec::parse(R"({"jsonrpc":"1.0","id":1,"method":"ping"})");
    EXPECT_EQ(req.method, "ping");
}

TEST(CodecParse, InvalidJson) {
    EXPECT_THROW(Codec::parse("{invalid json"), ParseError);
}

TEST(CodecParse, TrailingContent) {
    EXPECT_THROW(Codec::parse(R"({"id":1,"method":"ping"} {"id":2})"), ParseError);
}

TEST(CodecParse, EmptyInput) {
    EXPECT_THROW(Codec::parse(""), ParseError);
}

TEST(CodecParse, NotAnObject) {
    EXPECT_THROW(Codec::parse("[1,2,3]"), ParseError);
    EXPECT_THROW(Codec::parse("42"), ParseError);
    EXPECT_THROW(Codec::parse(R"("ping")"), ParseError);
}

TEST(CodecParse, MissingMethod) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1})"), ParseError);
}

TEST(CodecParse, NonStringMethod) {
    EXPECT_THROW(Codec::parse(R"({"id":1,"method":7})"), ParseError);
}

TEST(CodecParse, IdOfWrongType) {
    EXPECT_THROW(Codec::parse(R"({"id":true,"method":"ping"})"), ParseError);
    EXPECT_THROW(Codec::parse(R"({"id":{"a":1},"method":"ping"})"), ParseError);
    EXPECT_THROW(Codec::parse(R"({"id":[1],"method":"ping"})"), ParseError);
}

TEST(CodecParse, RequestWithParams) {
    auto req = Codec::parse(
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"echo","arguments":{"message":"hello"}}})");
    ASSERT_TRUE(req.params.has_value());
    EXPECT_EQ(req.params->at("name"), "echo");
    EXPECT_EQ(req.params->at("arguments").at("message"), "hello");
}

TEST(CodecParse, UnicodeEscapesAreDecoded) {
    auto req = Codec::parse(R"({"id":1,"method":"x","params":{"s":"a\nbé"}})");
    EXPECT_EQ(req.params->at("s").get<std::string>(), "a\nb\xc3\xa9");
}

TEST(CodecParse, InvalidUtf8IsRejected) {
    std::string raw = "{\"id\":1,\"method\":\"\xff\xfe\"}";
    EXPECT_THROW(Codec::parse(raw), ParseError);
}

// ---- Serialize tests ----

TEST(CodecSerialize, SuccessResponse) {
    auto resp = JsonRpcResponse::success(RequestId{int64_t{1}}, nlohmann::json{{"ok", true}});
    EXPECT_EQ(Codec::serialize(resp), R"({"id":1,"jsonrpc":"2.0","result":{"ok":true}})");
}

TEST(CodecSerialize, ErrorResponse) {
    auto resp = JsonRpcResponse::failure(RequestId{std::string("a")},
                                         JsonRpcError{error::InternalError, "boom"});
    auto j = nlohmann::json::parse(Codec::serialize(resp));
    EXPECT_EQ(j["id"], "a");
    EXPECT_EQ(j["error"]["code"], -32603);
    EXPECT_EQ(j["error"]["message"], "boom");
    EXPECT_FALSE(j.contains("result"));
}

TEST(CodecSerialize, SingleLineWithEmbeddedNewlines) {
    auto resp = JsonRpcResponse::success(RequestId{int64_t{1}},
                                         nlohmann::json{{"text", "line1\nline2\r\n"}});
    std::string out = Codec::serialize(resp);
    EXPECT_EQ(out.find('\n'), std::string::npos);
    EXPECT_EQ(out.find('\r'), std::string::npos);
}

TEST(CodecSerialize, NonAsciiStaysUtf8) {
    auto resp = JsonRpcResponse::success(RequestId{int64_t{1}},
                                         nlohmann::json{{"text", "\xe4\xbd\xa0\xe5\xa5\xbd"}});
    std::string out = Codec::serialize(resp);
    EXPECT_NE(out.find("\xe4\xbd\xa0\xe5\xa5\xbd"), std::string::npos);
    EXPECT_EQ(out.find("\\u"), std::string::npos);
}

TEST(CodecSerialize, RequestLine) {
    JsonRpcRequest req;
    req.id = RequestId{int64_t{3}};
    req.method = "tools/list";
    auto parsed = Codec::parse(Codec::serialize(req));
    EXPECT_EQ(parsed, req);
}
