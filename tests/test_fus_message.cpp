#include <gtest/gtest.h>

#include <libfusfetch/FUSMessage.hpp>
#include <libfusfetch/FUSException.hpp>

using namespace tihmstar::libfusfetch;

TEST(FUSMessage, BuildEnvelope) {
    std::string xml = buildFUSMessage({
        {"ACCESS_MODE", "2"},
        {"CLIENT_PRODUCT", "Smart Switch"},
    });
    EXPECT_NE(xml.find("<FUSMsg><FUSHdr><ProtoVer>1.0</ProtoVer></FUSHdr><FUSBody><Put>"), std::string::npos);
    EXPECT_NE(xml.find("<ACCESS_MODE><Data>2</Data></ACCESS_MODE>"), std::string::npos);
    EXPECT_NE(xml.find("<CLIENT_PRODUCT><Data>Smart Switch</Data></CLIENT_PRODUCT>"), std::string::npos);
    EXPECT_LT(xml.find("ACCESS_MODE"), xml.find("CLIENT_PRODUCT"));
}

TEST(FUSMessage, BuildEscapesValues) {
    std::string xml = buildFUSMessage({{"NAME", "a<b&c"}});
    EXPECT_NE(xml.find("<Data>a&lt;b&amp;c</Data>"), std::string::npos);
}

TEST(FUSMessage, ParseRoundTripsPutFields) {
    FUSMessage msg = FUSMessage::parse(buildFUSMessage({{"BINARY_NAME", "a.zip.enc4"}}));
    ASSERT_NE(msg.field(FUSMessage::kSectionPut, "BINARY_NAME"), nullptr);
    EXPECT_EQ(*msg.field(FUSMessage::kSectionPut, "BINARY_NAME"), "a.zip.enc4");
    EXPECT_FALSE(msg.hasStatus());
    EXPECT_THROW(msg.status(), ProtocolError);
}

TEST(FUSMessage, ParseStatusAndResults) {
    FUSMessage msg = FUSMessage::parse(
        "<FUSMsg><FUSHdr><ProtoVer>1.0</ProtoVer><SessionID>42</SessionID></FUSHdr>"
        "<FUSBody><Results><Status> 408 </Status><LATEST_FW_VERSION><Data>X/Y/Z/X</Data></LATEST_FW_VERSION></Results>"
        "<Put><EMPTY><Data></Data></EMPTY><PLAIN>value</PLAIN></Put></FUSBody></FUSMsg>");
    EXPECT_TRUE(msg.hasStatus());
    EXPECT_EQ(msg.status(), 408);
    EXPECT_EQ(msg.field(FUSMessage::kSectionPut, "EMPTY"), nullptr);
    ASSERT_NE(msg.field(FUSMessage::kSectionPut, "PLAIN"), nullptr);
    EXPECT_EQ(*msg.field(FUSMessage::kSectionPut, "PLAIN"), "value");
    EXPECT_EQ(msg.field(FUSMessage::kSectionPut, "LATEST_FW_VERSION"), nullptr);
    ASSERT_NE(msg.field(FUSMessage::kSectionResults, "LATEST_FW_VERSION"), nullptr);
}

TEST(FUSMessage, StatusWithDataElement) {
    FUSMessage msg = FUSMessage::parse("<FUSMsg><FUSBody><Results><Status><Data>200</Data></Status></Results></FUSBody></FUSMsg>");
    EXPECT_EQ(msg.status(), 200);
}

TEST(FUSMessage, NonNumericStatus) {
    FUSMessage msg = FUSMessage::parse("<FUSMsg><FUSBody><Results><Status>OK</Status></Results></FUSBody></FUSMsg>");
    EXPECT_THROW(msg.status(), ProtocolError);
}

TEST(FUSMessage, FirstOfFollowsOrder) {
    FUSMessage msg = FUSMessage::parse(
        "<FUSMsg><FUSBody><Results><Status>200</Status><LV><Data>results</Data></LV></Results>"
        "<Put><LV><Data></Data></LV><ADD><Data>put-add</Data></ADD></Put></FUSBody></FUSMsg>");
    using F = FUSMessage::FieldRef;
    const std::string *v = msg.firstOf({F{FUSMessage::kSectionPut, "LV"}, F{FUSMessage::kSectionResults, "LV"}});
    ASSERT_NE(v, nullptr);
    EXPECT_EQ(*v, "results");
    v = msg.firstOf({F{FUSMessage::kSectionPut, "ADD"}, F{FUSMessage::kSectionResults, "LV"}});
    ASSERT_NE(v, nullptr);
    EXPECT_EQ(*v, "put-add");
    EXPECT_EQ(msg.firstOf({F{FUSMessage::kSectionPut, "NOPE"}}), nullptr);
}

TEST(FUSMessage, ParseRejectsGarbage) {
    EXPECT_THROW(FUSMessage::parse(""), ProtocolError);
    EXPECT_THROW(FUSMessage::parse("<html><body>502</body></html>"), ProtocolError);
    EXPECT_THROW(FUSMessage::parse("<FUSMsg><FUSBody>"), ProtocolError);
}
