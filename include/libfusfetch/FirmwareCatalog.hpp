//
//  FirmwareCatalog.hpp
//  libfusfetch
//
//  Created by tihmstar on 05.06.25.
//

#ifndef FirmwareCatalog_hpp
#define FirmwareCatalog_hpp

#include <libfusfetch/FUSConfig.hpp>
#include <libfusfetch/FirmwareVersion.hpp>
#include <libfusfetch/HTTPTransport.hpp>

#include <vector>

#ifndef LIBFUSFETCH_API
#   define LIBFUSFETCH_API
#endif

namespace tihmstar {
    namespace libfusfetch {
        struct CatalogEntry{
            FirmwareVersion firmware;
            BuildInfo buildInfo;
            bool isLatest;
        };

        class LIBFUSFETCH_API FirmwareCatalog{
            HTTPTransport &_transport;
            const FUSConfig &_config;
        public:
            FirmwareCatalog(HTTPTransport &transport, const FUSConfig &config);

            //latest first, then alternates in manifest order
            std::vector<CatalogEntry> listVersions(const std::string &region, const std::string &model);
            FirmwareVersion latest(const std::string &region, const std::string &model);
        };

        LIBFUSFETCH_API std::vector<CatalogEntry> parseCatalog(const std::string &xml);
    }
}

#endif /* FirmwareCatalog_hpp */
