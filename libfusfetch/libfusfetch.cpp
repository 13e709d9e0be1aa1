//
//  libfusfetch.cpp
//  libfusfetch
//
//  Created by tihmstar on 01.06.25.
//

#ifndef LIBFUSFETCH_API
#   ifdef WIN32
#       define LIBFUSFETCH_API __declspec(dllimport)
#   elif __GNUC__ >=4
#       define LIBFUSFETCH_API __attribute__((visibility("default")))
#   else
#       define LIBFUSFETCH_API
#   endif
#endif

#include "../include/libfusfetch/libfusfetch.hpp"
#include "../include/libfusfetch/FUSCrypto.hpp"

#include <libgeneral/macros.h>
#include "FUSMacros.hpp"

#include <memory>

#ifndef VERSION_STRING
#   define VERSION_STRING "libfusfetch version not set"
#endif

using namespace tihmstar;
using namespace tihmstar::libfusfetch;

#define LATEST_FIRMWARE "latest"

#pragma mark FUSClient
FUSClient::FUSClient(FUSConfig config)
: FUSClient(config,
            std::make_unique<CurlTransport>(config.connectTimeout, config.requestTimeout, config.stallTimeout, config.chunkSize),
            std::make_unique<FUSCrypto>())
{
    //
}

FUSClient::FUSClient(FUSConfig config, std::unique_ptr<HTTPTransport> transport, std::unique_ptr<SessionCrypto> crypto)
: _config(config), _transport(std::move(transport)), _crypto(std::move(crypto))
{
    assure(_transport);
    assure(_crypto);
    retassure(_config.maxAttempts > 0, "maxAttempts must be positive");
}

FUSClient::~FUSClient(){
    //
}

void FUSClient::setTacTable(TacTable tacs){
    _tacs = std::move(tacs);
}

std::vector<CatalogEntry> FUSClient::listFirmware(std::string region, std::string model){
    return FirmwareCatalog(*_transport, _config).listVersions(region, model);
}

FirmwareVersion FUSClient::latestFirmware(std::string region, std::string model){
    return FirmwareCatalog(*_transport, _config).latest(region, model);
}

BinaryInfoResult FUSClient::getBinaryInfo(std::string region, std::string model, std::string firmware, std::string imei){
    IdentitySource identity = {};
    identity.imei = imei;
    if (imei.empty()) {
        if (const std::string *tac = _tacs.tacForModel(model)) identity.tac = *tac;
    }

    if (firmware == LATEST_FIRMWARE) {
        FirmwareVersion latest = latestFirmware(region, model);
        debug("resolved latest firmware of %s/%s to %s",region.c_str(),model.c_str(),latest.str().c_str());
        return BinaryInfoRetriever(*_transport, *_crypto, _config).retrieve(region, model, latest, identity);
    }
    return BinaryInfoRetriever(*_transport, *_crypto, _config).retrieve(region, model, FirmwareVersion(firmware), identity);
}

bool FUSClient::download(const DownloadRequest &request, DownloadSink &sink){
    retassure(request.filename.size(), "No filename to download");
    DownloadPipeline::validate(request);

    FUSSession session = FUSSession::acquire(*_transport, *_crypto, _config);
    return DownloadPipeline(session).run(request, sink);
}

bool FUSClient::download(BinaryInfoResult &binary, DownloadRequest request, DownloadSink &sink){
    if (request.filename.empty()) request.filename = binary.metadata.filename;
    return DownloadPipeline(binary.session).run(request, sink);
}

#pragma mark public
LIBFUSFETCH_API const char *libfusfetch::version(){
    return VERSION_STRING;
}
