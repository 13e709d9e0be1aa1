//
//  FUSSession.cpp
//  libfusfetch
//
//  Created by tihmstar on 04.06.25.
//

#include "../include/libfusfetch/FUSSession.hpp"

#include <libgeneral/macros.h>
#include "FUSMacros.hpp"

using namespace tihmstar;
using namespace tihmstar::libfusfetch;

#define FUS_NONCE_HEADER    "NONCE"
#define FUS_SESSION_COOKIE  "JSESSIONID"

#pragma mark public
LIBFUSFETCH_API std::string libfusfetch::authorizationHeader(const std::string &rawNonce, const std::string &signature){
    return "FUS nonce=\"" + rawNonce + "\", signature=\"" + signature + "\", nc=\"\", type=\"\", realm=\"\", newauth=\"1\"";
}

#pragma mark FUSSession
FUSSession::FUSSession(HTTPTransport &transport, const SessionCrypto &crypto, const FUSConfig &config)
: _transport(transport), _crypto(crypto), _config(config), _session{}
{
    //
}

void FUSSession::applyNonce(const std::string &rawNonce){
    Session s = _session;
    s.rawNonce = rawNonce;
    s.decodedNonce = _crypto.decodeNonce(rawNonce);
    s.signature = _crypto.deriveSignature(s.decodedNonce);
    _session = s;
    debug("session nonce updated to '%s'",rawNonce.c_str());
}

FUSSession FUSSession::acquire(HTTPTransport &transport, const SessionCrypto &crypto, const FUSConfig &config){
    FUSSession ret(transport, crypto, config);
    HTTPRequest req = {};
    HTTPResponse resp = {};
    const std::string *nonce = NULL;

    req.method = "POST";
    req.url = config.nonceURL;
    req.headers.push_back({"Authorization", authorizationHeader("", "")});
    req.headers.push_back({"User-Agent", config.userAgent});

    resp = transport.perform(req);
    if (resp.status != 200) retcodeerror(ServerRejectedError, resp.status, "Nonce request rejected");
    if (!(nonce = resp.header(FUS_NONCE_HEADER))) retcodeerror(ServerRejectedError, resp.status, "Nonce response lacks NONCE header");

    ret.applyNonce(*nonce);
    if (const std::string *sid = resp.cookie(FUS_SESSION_COOKIE)) ret._session.sessionIdentifier = *sid;
    return ret;
}

std::string FUSSession::logicCheck(const std::string &input) const{
    return _crypto.logicCheck(_session.decodedNonce, input);
}

std::vector<uint8_t> FUSSession::deriveFileKey(const KeyMaterial &material) const{
    return _crypto.deriveFileKey(material);
}

void FUSSession::refresh(const HTTPResponse &response){
    if (const std::string *nonce = response.header(FUS_NONCE_HEADER)) {
        if (*nonce != _session.rawNonce) applyNonce(*nonce);
    }
    if (const std::string *sid = response.cookie(FUS_SESSION_COOKIE)) {
        _session.sessionIdentifier = *sid;
    }
}

HTTPRequest FUSSession::authorize(HTTPRequest request) const{
    request.headers.push_back({"Authorization", authorizationHeader(_session.rawNonce, _session.signature)});
    request.headers.push_back({"User-Agent", _config.userAgent});
    request.cookies[FUS_SESSION_COOKIE] = _session.sessionIdentifier;
    return request;
}

HTTPResponse FUSSession::post(const std::string &url, const FUSFields &put){
    HTTPRequest req = {};
    HTTPResponse resp = {};
    req.method = "POST";
    req.url = url;
    req.body = buildFUSMessage(put);

    resp = _transport.perform(authorize(req));
    retcustomassure(libfusfetch::UnauthorizedError, resp.status != 401, "Session was not accepted by %s",url.c_str());
    refresh(resp);
    return resp;
}
