//
//  MockTransport.hpp
//  libfusfetch
//
//  Created by tihmstar on 10.06.25.
//

#ifndef MockTransport_hpp
#define MockTransport_hpp

#include <libfusfetch/FUSException.hpp>
#include <libfusfetch/HTTPTransport.hpp>
#include <libfusfetch/SessionCrypto.hpp>

#include <algorithm>
#include <ctype.h>
#include <deque>
#include <map>
#include <string>
#include <vector>

namespace fusfetch_test {
    using namespace tihmstar::libfusfetch;

    inline HTTPResponse makeResponse(long status, std::string body = "", std::map<std::string, std::string> headers = {}, std::map<std::string, std::string> cookies = {}){
        HTTPResponse ret = {};
        ret.status = status;
        ret.body = body;
        for (auto &h : headers) {
            std::string k = h.first;
            std::transform(k.begin(), k.end(), k.begin(), ::tolower);
            ret.headers[k] = h.second;
        }
        ret.cookies = cookies;
        return ret;
    }

    inline std::string fusResponse(int status, const std::vector<std::pair<std::string, std::string>> &put = {}){
        std::string ret = "<FUSMsg><FUSHdr><ProtoVer>1.0</ProtoVer><SessionID>0</SessionID></FUSHdr><FUSBody>";
        ret += "<Results><Status>" + std::to_string(status) + "</Status></Results><Put>";
        for (auto &p : put) {
            ret += "<" + p.first + "><Data>" + p.second + "</Data></" + p.first + ">";
        }
        ret += "</Put></FUSBody></FUSMsg>";
        return ret;
    }

    inline HTTPResponse nonceResponse(const std::string &nonce = "N1", const std::string &sessionID = "S1"){
        return makeResponse(200, "", {{"NONCE", nonce}}, {{"JSESSIONID", sessionID}});
    }

    /*
        Serves scripted responses per URL (query string ignored).
        Responses are consumed in order, the last one repeats once the queue runs dry.
     */
    class MockTransport : public HTTPTransport{
        std::map<std::string, std::deque<HTTPResponse>> _responses;

        static std::string base(const std::string &url){
            return url.substr(0, url.find('?'));
        }

        HTTPResponse next(const HTTPRequest &request){
            requests.push_back(request);
            auto it = _responses.find(base(request.url));
            if (it == _responses.end() || it->second.empty()) return makeResponse(404);
            HTTPResponse ret = it->second.front();
            if (it->second.size() > 1) it->second.pop_front();
            return ret;
        }

    public:
        std::vector<HTTPRequest> requests;
        size_t streamChunkSize = 7;
        size_t failAfter = 0; //stream throws TransportError once this many body bytes were delivered, 0 never

        void on(const std::string &url, HTTPResponse response){
            _responses[url].push_back(response);
        }

        size_t count(const std::string &url) const{
            return std::count_if(requests.begin(), requests.end(), [&](const HTTPRequest &r){
                return base(r.url) == url;
            });
        }

        const std::string *header(const HTTPRequest &request, const std::string &name) const{
            for (auto &h : request.headers) {
                if (h.first == name) return &h.second;
            }
            return nullptr;
        }

        HTTPResponse perform(const HTTPRequest &request) override{
            return next(request);
        }

        StreamResult stream(const HTTPRequest &request, StreamHeadCallback onHead, StreamDataCallback onData) override{
            HTTPResponse resp = next(request);
            HTTPResponse head = resp;
            head.body.clear();
            if (!onHead(head)) return {resp.status, true};
            for (size_t off = 0; off < resp.body.size(); off += streamChunkSize) {
                size_t len = std::min(streamChunkSize, resp.body.size() - off);
                if (failAfter && off + len > failAfter) {
                    //hand over what arrived before the connection dropped
                    if (failAfter > off && !onData(resp.body.data() + off, failAfter - off)) return {resp.status, true};
                    throw TransportError("0", "0", __LINE__, __FILE__, "connection reset after %zu bytes", failAfter);
                }
                if (!onData(resp.body.data() + off, len)) return {resp.status, true};
            }
            return {resp.status, false};
        }
    };

    //readable, deterministic stand-in for the vendor transforms
    class StubCrypto : public SessionCrypto{
    public:
        std::string decodeNonce(const std::string &rawNonce) const override{
            return "decoded-" + rawNonce;
        }
        std::string deriveSignature(const std::string &decodedNonce) const override{
            return "sig-" + decodedNonce;
        }
        std::string logicCheck(const std::string &decodedNonce, const std::string &input) const override{
            return "lc-" + input;
        }
        std::vector<uint8_t> deriveFileKey(const KeyMaterial &material) const override{
            std::vector<uint8_t> ret(16, (uint8_t)material.encryptionVersion);
            if (material.encryptionVersion == 4) ret[0] = (uint8_t)material.logicValueFactory.size();
            return ret;
        }
    };
}

#endif /* MockTransport_hpp */
