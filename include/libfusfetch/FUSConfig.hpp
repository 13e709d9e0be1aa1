//
//  FUSConfig.hpp
//  libfusfetch
//
//  Created by tihmstar on 04.06.25.
//

#ifndef FUSConfig_hpp
#define FUSConfig_hpp

#include <string>

#ifndef LIBFUSFETCH_API
#   define LIBFUSFETCH_API
#endif

namespace tihmstar {
    namespace libfusfetch {
        struct FUSConfig{
            std::string nonceURL;
            std::string binaryInformURL;
            std::string binaryInitURL;
            std::string downloadURL;
            std::string catalogURLTemplate; //region, model
            std::string clientVersion;
            std::string userAgent;
            std::string filePathPrefix;

            long connectTimeout;  //seconds
            long requestTimeout;  //seconds
            long stallTimeout;    //seconds below 1 byte/s before a download is aborted
            long chunkSize;       //bytes
            int maxAttempts;

            static FUSConfig defaults();
            std::string catalogURL(const std::string &region, const std::string &model) const;
        };
    }
}

#endif /* FUSConfig_hpp */
