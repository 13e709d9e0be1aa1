//
//  HTTPTransport.hpp
//  libfusfetch
//
//  Created by tihmstar on 03.06.25.
//

#ifndef HTTPTransport_hpp
#define HTTPTransport_hpp

#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

#ifndef LIBFUSFETCH_API
#   define LIBFUSFETCH_API
#endif

namespace tihmstar {
    namespace libfusfetch {
        struct HTTPRequest{
            std::string method; //"GET" or "POST"
            std::string url;
            std::vector<std::pair<std::string, std::string>> headers;
            std::map<std::string, std::string> cookies;
            std::string body;
        };

        struct HTTPResponse{
            long status;
            std::map<std::string, std::string> headers; //keys are lowercase
            std::map<std::string, std::string> cookies;
            std::string body;

            const std::string *header(const std::string &name) const;
            const std::string *cookie(const std::string &name) const;
        };

        struct StreamResult{
            long status;
            bool cancelled;
        };

        /*
            onHead is called once with status and headers (body empty) before the first onData call.
            Returning false from either callback aborts the transfer and releases the connection.
         */
        using StreamHeadCallback = std::function<bool(const HTTPResponse &head)>;
        using StreamDataCallback = std::function<bool(const char *buf, size_t size)>;

        class HTTPTransport{
        public:
            virtual ~HTTPTransport() = default;

            virtual HTTPResponse perform(const HTTPRequest &request) = 0;
            virtual StreamResult stream(const HTTPRequest &request, StreamHeadCallback onHead, StreamDataCallback onData) = 0;
        };

        class LIBFUSFETCH_API CurlTransport : public HTTPTransport{
            long _connectTimeout;
            long _requestTimeout;
            long _stallTimeout;
            long _chunkSize;
        public:
            CurlTransport(long connectTimeout, long requestTimeout, long stallTimeout, long chunkSize);
            ~CurlTransport();

            HTTPResponse perform(const HTTPRequest &request) override;
            StreamResult stream(const HTTPRequest &request, StreamHeadCallback onHead, StreamDataCallback onData) override;
        };

        /*
            Maps a libcurl result code of a finished transfer to an exception.
            CURLE_OK returns, CURLE_OPERATION_TIMEDOUT throws TimeoutError,
            anything else throws UnreachableError.
         */
        LIBFUSFETCH_API void checkTransferResult(int curlCode, const HTTPRequest &request);
    }
}

#endif /* HTTPTransport_hpp */
