#include <gtest/gtest.h>

#include <libfusfetch/HTTPTransport.hpp>
#include <libfusfetch/FUSException.hpp>

#include <curl/curl.h>

using namespace tihmstar::libfusfetch;

static HTTPRequest getRequest(){
    HTTPRequest ret = {};
    ret.method = "GET";
    ret.url = "http://cloud-neofussvr.samsungmobile.com/NF_DownloadBinaryForMass.do";
    return ret;
}

TEST(TransferResult, SuccessDoesNotThrow) {
    EXPECT_NO_THROW(checkTransferResult(CURLE_OK, getRequest()));
}

TEST(TransferResult, TimeoutMapsToTimeoutError) {
    EXPECT_THROW(checkTransferResult(CURLE_OPERATION_TIMEDOUT, getRequest()), TimeoutError);
    EXPECT_THROW(checkTransferResult(CURLE_OPERATION_TIMEDOUT, getRequest()), TransportError);
}

TEST(TransferResult, OtherFailuresMapToUnreachable) {
    for (CURLcode code : {CURLE_COULDNT_CONNECT, CURLE_COULDNT_RESOLVE_HOST, CURLE_RECV_ERROR, CURLE_SSL_CONNECT_ERROR}) {
        try {
            checkTransferResult(code, getRequest());
            FAIL() << "expected UnreachableError for " << code;
        } catch (UnreachableError &e) {
            EXPECT_NE(std::string(e.what()).find("NF_DownloadBinaryForMass.do"), std::string::npos) << e.what();
        }
    }
}

TEST(TransferResult, HeaderLookupIgnoresCase) {
    HTTPResponse resp = {};
    resp.headers["content-length"] = "42";
    resp.cookies["JSESSIONID"] = "S1";
    ASSERT_NE(resp.header("Content-Length"), nullptr);
    EXPECT_EQ(*resp.header("CONTENT-LENGTH"), "42");
    EXPECT_EQ(resp.header("Content-Range"), nullptr);
    ASSERT_NE(resp.cookie("JSESSIONID"), nullptr);
    EXPECT_EQ(resp.cookie("jsessionid"), nullptr);
}
