//
//  libfusfetch.hpp
//  libfusfetch
//
//  Created by tihmstar on 01.06.25.
//

#ifndef libfusfetch_hpp
#define libfusfetch_hpp

#include <libfusfetch/BinaryInfoRetriever.hpp>
#include <libfusfetch/DeviceIdentity.hpp>
#include <libfusfetch/DownloadPipeline.hpp>
#include <libfusfetch/FUSConfig.hpp>
#include <libfusfetch/FUSException.hpp>
#include <libfusfetch/FirmwareCatalog.hpp>
#include <libfusfetch/FirmwareVersion.hpp>

#include <memory>

#ifndef LIBFUSFETCH_API
#   define LIBFUSFETCH_API
#endif

namespace tihmstar {
    namespace libfusfetch {
        /*
            Entry point bundling config, transport and session crypto.
            Results holding a FUSSession reference this client and must not outlive it.
         */
        class LIBFUSFETCH_API FUSClient{
            FUSConfig _config;
            std::unique_ptr<HTTPTransport> _transport;
            std::unique_ptr<SessionCrypto> _crypto;
            TacTable _tacs;
        public:
            FUSClient(FUSConfig config = FUSConfig::defaults());
            FUSClient(FUSConfig config, std::unique_ptr<HTTPTransport> transport, std::unique_ptr<SessionCrypto> crypto);
            FUSClient(const FUSClient &) = delete;
            FUSClient &operator=(const FUSClient &) = delete;
            ~FUSClient();

            const FUSConfig &config() const {return _config;}
            void setTacTable(TacTable tacs);

            std::vector<CatalogEntry> listFirmware(std::string region, std::string model);
            FirmwareVersion latestFirmware(std::string region, std::string model);

            //firmware may be "latest", imei may be empty to generate one from the TAC table
            BinaryInfoResult getBinaryInfo(std::string region, std::string model, std::string firmware, std::string imei = "");

            bool download(const DownloadRequest &request, DownloadSink &sink);
            //reuses the session of a successful lookup, filename defaults to the looked up binary
            bool download(BinaryInfoResult &binary, DownloadRequest request, DownloadSink &sink);
        };

        LIBFUSFETCH_API const char *version();
    }
}

#endif /* libfusfetch_hpp */
