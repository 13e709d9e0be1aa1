//
//  FUSConfig.cpp
//  libfusfetch
//
//  Created by tihmstar on 04.06.25.
//

#include "../include/libfusfetch/FUSConfig.hpp"

#include <libgeneral/macros.h>

#include <stdio.h>

using namespace tihmstar;
using namespace tihmstar::libfusfetch;

#ifndef FUS_NONCE_URL
#   define FUS_NONCE_URL "https://neofussvr.sslcs.cdngc.net/NF_DownloadGenerateNonce.do"
#endif
#ifndef FUS_BINARY_INFORM_URL
#   define FUS_BINARY_INFORM_URL "https://neofussvr.sslcs.cdngc.net/NF_DownloadBinaryInform.do"
#endif
#ifndef FUS_BINARY_INIT_URL
#   define FUS_BINARY_INIT_URL "https://neofussvr.sslcs.cdngc.net/NF_DownloadBinaryInitForMass.do"
#endif
#ifndef FUS_DOWNLOAD_URL
#   define FUS_DOWNLOAD_URL "http://cloud-neofussvr.samsungmobile.com/NF_DownloadBinaryForMass.do"
#endif
#ifndef FUS_CATALOG_URL_TEMPLATE
#   define FUS_CATALOG_URL_TEMPLATE "http://fota-cloud-dn.ospserver.net/firmware/%s/%s/version.xml"
#endif
#ifndef FUS_CLIENT_VERSION
#   define FUS_CLIENT_VERSION "4.3.23123_1"
#endif
#ifndef FUS_USER_AGENT
#   define FUS_USER_AGENT "Kies2.0_FUS"
#endif
#ifndef FUS_FILE_PATH_PREFIX
#   define FUS_FILE_PATH_PREFIX "/neofus/910/"
#endif

FUSConfig FUSConfig::defaults(){
    FUSConfig ret = {};
    ret.nonceURL = FUS_NONCE_URL;
    ret.binaryInformURL = FUS_BINARY_INFORM_URL;
    ret.binaryInitURL = FUS_BINARY_INIT_URL;
    ret.downloadURL = FUS_DOWNLOAD_URL;
    ret.catalogURLTemplate = FUS_CATALOG_URL_TEMPLATE;
    ret.clientVersion = FUS_CLIENT_VERSION;
    ret.userAgent = FUS_USER_AGENT;
    ret.filePathPrefix = FUS_FILE_PATH_PREFIX;
    ret.connectTimeout = 30;
    ret.requestTimeout = 60;
    ret.stallTimeout = 60;
    ret.chunkSize = 64*1024;
    ret.maxAttempts = 5;
    return ret;
}

std::string FUSConfig::catalogURL(const std::string &region, const std::string &model) const{
    std::string ret;
    int len = 0;
    retassure((len = snprintf(NULL, 0, catalogURLTemplate.c_str(), region.c_str(), model.c_str())) >= 0, "Bad catalog URL template '%s'",catalogURLTemplate.c_str());
    ret.resize(len+1);
    snprintf(&ret[0], ret.size(), catalogURLTemplate.c_str(), region.c_str(), model.c_str());
    ret.resize(len);
    return ret;
}
