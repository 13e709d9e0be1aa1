//
//  DownloadPipeline.hpp
//  libfusfetch
//
//  Created by tihmstar on 07.06.25.
//

#ifndef DownloadPipeline_hpp
#define DownloadPipeline_hpp

#include <libfusfetch/FUSSession.hpp>

#include <stdint.h>

#ifndef LIBFUSFETCH_API
#   define LIBFUSFETCH_API
#endif

namespace tihmstar {
    namespace libfusfetch {
        //inclusive offsets, end == 0 means open-ended, (-1,-1) means unparseable
        struct DownloadRange{
            int64_t start;
            int64_t end;
        };

        struct DownloadHeaders{
            long status;
            std::string contentDisposition;
            std::string contentType;
            std::string acceptRanges;
            std::string contentLength; //empty when unknown or withheld
            std::string contentRange;  //empty when upstream sent none
        };

        class DownloadSink{
        public:
            virtual ~DownloadSink() = default;
            //return false to stop the download and release the upstream connection
            virtual bool onHeaders(const DownloadHeaders &headers) = 0;
            virtual bool onData(const uint8_t *buf, size_t size) = 0;
        };

        struct DownloadRequest{
            std::string filename;               //remote binary name
            std::vector<uint8_t> decryptionKey; //empty downloads the encrypted binary
            std::string rangeHeader;            //empty downloads from the start
            std::string customFilename;
        };

        struct FileHandle{
            std::string filename;
            std::string path;
        };

        class LIBFUSFETCH_API DownloadPipeline{
            FUSSession &_session;
        public:
            DownloadPipeline(FUSSession &session);

            //throws InvalidRangeError, never touches the network
            static DownloadRange validate(const DownloadRequest &request);

            FileHandle prepare(const std::string &filename);
            //returns false if the sink stopped the download
            bool open(const FileHandle &file, const DownloadRequest &request, DownloadSink &sink);
            bool run(const DownloadRequest &request, DownloadSink &sink);
        };

        LIBFUSFETCH_API DownloadRange parseRangeHeader(const std::string &header);
        LIBFUSFETCH_API void validateRange(const DownloadRange &range, bool decrypt);
        LIBFUSFETCH_API std::string joinPath(const std::vector<std::string> &components);
        LIBFUSFETCH_API std::string downloadFilename(const std::string &remoteFilename, const std::string &customFilename, bool decrypt);
    }
}

#endif /* DownloadPipeline_hpp */
