//
//  CurlTransport.cpp
//  libfusfetch
//
//  Created by tihmstar on 03.06.25.
//

#include "../include/libfusfetch/HTTPTransport.hpp"

#include <curl/curl.h>

#include <libgeneral/macros.h>
#include "FUSMacros.hpp"

#include <ctype.h>
#include <exception>
#include <stdlib.h>
#include <string.h>

using namespace tihmstar;
using namespace tihmstar::libfusfetch;

namespace {
    struct TransferState{
        HTTPResponse head;
        bool headDelivered;
        bool cancelled;
        std::exception_ptr exc;
        StreamHeadCallback *onHead;
        StreamDataCallback *onData;
    };
}

#pragma mark private
static std::string trimmed(const char *buf, size_t size){
    while (size && isspace((unsigned char)*buf)) buf++, size--;
    while (size && isspace((unsigned char)buf[size-1])) size--;
    return {buf, size};
}

static size_t headerFunction(char *buf, size_t size, size_t nmemb, TransferState *s){
    size_t len = size*nmemb;
    std::string line = trimmed(buf, len);

    if (line.compare(0, 5, "HTTP/") == 0) {
        //a new response starts (redirect or 100-continue), forget the previous one
        size_t sp = line.find(' ');
        s->head.headers.clear();
        s->head.cookies.clear();
        s->head.status = (sp != std::string::npos) ? atol(line.c_str()+sp+1) : 0;
        return len;
    }

    size_t colon = line.find(':');
    if (colon == std::string::npos) return len;

    std::string name = line.substr(0,colon);
    std::string value = trimmed(line.c_str()+colon+1, line.size()-colon-1);
    for (auto &c : name) c = (char)tolower((unsigned char)c);

    if (name == "set-cookie") {
        std::string cookie = value.substr(0, value.find(';'));
        size_t eq = cookie.find('=');
        if (eq != std::string::npos) {
            s->head.cookies[trimmed(cookie.c_str(), eq)] = trimmed(cookie.c_str()+eq+1, cookie.size()-eq-1);
        }
    }
    s->head.headers[name] = value;
    return len;
}

static size_t bufferFunction(char *buf, size_t size, size_t nmemb, std::string *data){
    data->append(buf, size*nmemb);
    return size*nmemb;
}

static bool deliverHead(TransferState *s){
    s->headDelivered = true;
    if (!(*s->onHead)(s->head)) {
        s->cancelled = true;
        return false;
    }
    return true;
}

static size_t streamFunction(char *buf, size_t size, size_t nmemb, TransferState *s){
    size_t len = size*nmemb;
    try {
        if (!s->headDelivered && !deliverHead(s)) return 0;
        if (!(*s->onData)(buf, len)) {
            s->cancelled = true;
            return 0;
        }
    } catch (...) {
        //exceptions must not cross libcurl, rethrown once curl_easy_perform returns
        s->exc = std::current_exception();
        return 0;
    }
    return len;
}

static void setupRequest(CURL *mc, const HTTPRequest &request, curl_slist **headers, long connectTimeout){
    curl_easy_setopt(mc, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(mc, CURLOPT_CONNECTTIMEOUT, connectTimeout);
    curl_easy_setopt(mc, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(mc, CURLOPT_NOSIGNAL, 1L);

    for (auto &h : request.headers) {
        std::string line = h.first + ": " + h.second;
        curl_slist *n = NULL;
        assure(n = curl_slist_append(*headers, line.c_str()));
        *headers = n;
    }
    curl_easy_setopt(mc, CURLOPT_HTTPHEADER, *headers);

    if (request.cookies.size()) {
        std::string cookies;
        for (auto &c : request.cookies) {
            if (cookies.size()) cookies += "; ";
            cookies += c.first + "=" + c.second;
        }
        curl_easy_setopt(mc, CURLOPT_COOKIE, cookies.c_str());
    }

    if (request.method == "POST") {
        curl_easy_setopt(mc, CURLOPT_POST, 1L);
        curl_easy_setopt(mc, CURLOPT_POSTFIELDSIZE, (long)request.body.size());
        curl_easy_setopt(mc, CURLOPT_COPYPOSTFIELDS, request.body.c_str());
    }else{
        retassure(request.method == "GET", "Unsupported HTTP method '%s'",request.method.c_str());
        curl_easy_setopt(mc, CURLOPT_HTTPGET, 1L);
    }
}

#pragma mark public
LIBFUSFETCH_API void libfusfetch::checkTransferResult(int curlCode, const HTTPRequest &request){
    CURLcode res = (CURLcode)curlCode;
    if (res == CURLE_OK) return;
    retcustomassure(libfusfetch::TimeoutError, res != CURLE_OPERATION_TIMEDOUT, "%s %s timed out",request.method.c_str(),request.url.c_str());
    retcustomerror(libfusfetch::UnreachableError, "%s %s failed: %s",request.method.c_str(),request.url.c_str(),curl_easy_strerror(res));
}

#pragma mark HTTPResponse
const std::string *HTTPResponse::header(const std::string &name) const{
    std::string lname = name;
    for (auto &c : lname) c = (char)tolower((unsigned char)c);
    auto it = headers.find(lname);
    return (it != headers.end()) ? &it->second : NULL;
}

const std::string *HTTPResponse::cookie(const std::string &name) const{
    auto it = cookies.find(name);
    return (it != cookies.end()) ? &it->second : NULL;
}

#pragma mark CurlTransport
CurlTransport::CurlTransport(long connectTimeout, long requestTimeout, long stallTimeout, long chunkSize)
: _connectTimeout(connectTimeout), _requestTimeout(requestTimeout), _stallTimeout(stallTimeout), _chunkSize(chunkSize)
{
    retassure(curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK, "Failed to init libcurl");
}

CurlTransport::~CurlTransport(){
    curl_global_cleanup();
}

HTTPResponse CurlTransport::perform(const HTTPRequest &request){
    CURL *mc = NULL;
    curl_slist *headers = NULL;
    cleanup([&]{
        safeFreeCustom(headers, curl_slist_free_all);
        safeFreeCustom(mc, curl_easy_cleanup);
    });
    TransferState s = {};
    CURLcode res = CURLE_OK;

    assure(mc = curl_easy_init());
    setupRequest(mc, request, &headers, _connectTimeout);
    curl_easy_setopt(mc, CURLOPT_TIMEOUT, _requestTimeout);

    curl_easy_setopt(mc, CURLOPT_HEADERFUNCTION, &headerFunction);
    curl_easy_setopt(mc, CURLOPT_HEADERDATA, &s);
    curl_easy_setopt(mc, CURLOPT_WRITEFUNCTION, &bufferFunction);
    curl_easy_setopt(mc, CURLOPT_WRITEDATA, &s.head.body);

    res = curl_easy_perform(mc);
    checkTransferResult(res, request);
    curl_easy_getinfo(mc, CURLINFO_RESPONSE_CODE, &s.head.status);
    return s.head;
}

StreamResult CurlTransport::stream(const HTTPRequest &request, StreamHeadCallback onHead, StreamDataCallback onData){
    CURL *mc = NULL;
    curl_slist *headers = NULL;
    cleanup([&]{
        safeFreeCustom(headers, curl_slist_free_all);
        safeFreeCustom(mc, curl_easy_cleanup);
    });
    TransferState s = {};
    CURLcode res = CURLE_OK;
    s.onHead = &onHead;
    s.onData = &onData;

    assure(mc = curl_easy_init());
    setupRequest(mc, request, &headers, _connectTimeout);
    //a download may legitimately take hours, only abort on stalls
    curl_easy_setopt(mc, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(mc, CURLOPT_LOW_SPEED_TIME, _stallTimeout);
    curl_easy_setopt(mc, CURLOPT_BUFFERSIZE, _chunkSize);

    curl_easy_setopt(mc, CURLOPT_HEADERFUNCTION, &headerFunction);
    curl_easy_setopt(mc, CURLOPT_HEADERDATA, &s);
    curl_easy_setopt(mc, CURLOPT_WRITEFUNCTION, &streamFunction);
    curl_easy_setopt(mc, CURLOPT_WRITEDATA, &s);

    res = curl_easy_perform(mc);
    if (s.exc) std::rethrow_exception(s.exc);
    if (s.cancelled) return {s.head.status, true};
    checkTransferResult(res, request);

    if (!s.headDelivered && !deliverHead(&s)) return {s.head.status, true};
    return {s.head.status, false};
}
