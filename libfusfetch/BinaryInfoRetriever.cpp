//
//  BinaryInfoRetriever.cpp
//  libfusfetch
//
//  Created by tihmstar on 06.06.25.
//

#include "../include/libfusfetch/BinaryInfoRetriever.hpp"

#include <libgeneral/macros.h>
#include "FUSMacros.hpp"

#include <stdio.h>
#include <stdlib.h>

using namespace tihmstar;
using namespace tihmstar::libfusfetch;

#define FUS_STATUS_OK               200
#define FUS_STATUS_UNAUTHORIZED     401
#define FUS_STATUS_IDENTITY_REJECTED 408

using F = FUSMessage::FieldRef;

#pragma mark private
static const std::string &requiredField(const FUSMessage &msg, const char *name){
    const std::string *v = msg.field(FUSMessage::kSectionPut, name);
    retcustomassure(libfusfetch::ProtocolError, v, "Binary info response lacks %s",name);
    return *v;
}

static std::string optionalField(const std::string *v){
    return v ? *v : "";
}

static uint64_t numberField(const std::string &v, const char *name){
    char *end = NULL;
    unsigned long long ret = strtoull(v.c_str(), &end, 10);
    retcustomassure(libfusfetch::ProtocolError, v.size() && end && *end == '\0', "Binary info field %s is not a number: '%s'",name,v.c_str());
    return ret;
}

static std::string spacedOSVersion(std::string v){
    for (size_t pos = v.find('('); pos != std::string::npos; pos = v.find('(', pos+2)) {
        v.insert(pos, " ");
    }
    return v;
}

static std::string nextIdentity(const IdentitySource &identity){
    if (identity.imei.size()) return identity.imei;
    return generateIMEI(identity.tac, identity.rng);
}

#pragma mark BinaryMetadata
std::string BinaryMetadata::sizeReadable() const{
    char buf[0x40] = {};
    snprintf(buf, sizeof(buf), "%.2f GB", (double)size / 1024 / 1024 / 1024);
    return buf;
}

#pragma mark public
LIBFUSFETCH_API int libfusfetch::encryptionVersionForFilename(const std::string &filename){
    return (filename.size() && filename.back() == '4') ? 4 : 2;
}

LIBFUSFETCH_API FUSFields libfusfetch::binaryInformFields(const std::string &firmware, const std::string &region, const std::string &model, const std::string &imei, const std::string &logicCheck, const std::string &clientVersion){
    return {
        {"ACCESS_MODE", "2"},
        {"BINARY_NATURE", "1"},
        {"CLIENT_PRODUCT", "Smart Switch"},
        {"DEVICE_FW_VERSION", firmware},
        {"DEVICE_LOCAL_CODE", region},
        {"DEVICE_MODEL_NAME", model},
        {"DEVICE_IMEI_PUSH", imei},
        {"CLIENT_VERSION", clientVersion},
        {"LOGIC_CHECK", logicCheck},
    };
}

LIBFUSFETCH_API BinaryMetadata libfusfetch::parseBinaryMetadata(const FUSMessage &msg){
    BinaryMetadata ret = {};
    ret.filename = requiredField(msg, "BINARY_NAME");
    ret.path = requiredField(msg, "MODEL_PATH");
    ret.size = numberField(requiredField(msg, "BINARY_BYTE_SIZE"), "BINARY_BYTE_SIZE");
    ret.encryptionVersion = encryptionVersionForFilename(ret.filename);

    ret.crc = optionalField(msg.field(FUSMessage::kSectionPut, "BINARY_CRC"));
    if (const std::string *lm = msg.field(FUSMessage::kSectionPut, "LAST_MODIFIED")) {
        ret.lastModified = numberField(*lm, "LAST_MODIFIED");
    }
    ret.displayName = optionalField(msg.field(FUSMessage::kSectionPut, "DEVICE_MODEL_DISPLAYNAME"));
    ret.osVersion = spacedOSVersion(optionalField(msg.field(FUSMessage::kSectionPut, "CURRENT_OS_VERSION")));
    ret.platform = optionalField(msg.field(FUSMessage::kSectionPut, "DEVICE_PLATFORM"));
    ret.changelogURL = optionalField(msg.firstOf({
        F{FUSMessage::kSectionPut, "DESCRIPTION"},
        F{FUSMessage::kSectionPut, "ADD_DESCRIPTION"},
    }));
    ret.latestFirmwareVersion = optionalField(msg.firstOf({
        F{FUSMessage::kSectionPut, "LATEST_FW_VERSION"},
        F{FUSMessage::kSectionPut, "ADD_LATEST_FW_VERSION"},
        F{FUSMessage::kSectionResults, "LATEST_FW_VERSION"},
    }));
    ret.logicValueFactory = optionalField(msg.firstOf({
        F{FUSMessage::kSectionPut, "LOGIC_VALUE_FACTORY"},
        F{FUSMessage::kSectionResults, "LOGIC_VALUE_FACTORY"},
    }));

    if (ret.encryptionVersion == 4) {
        retcustomassure(libfusfetch::ProtocolError, ret.latestFirmwareVersion.size() && ret.logicValueFactory.size(), "Binary info for '%s' lacks version 4 key material",ret.filename.c_str());
    }
    return ret;
}

#pragma mark BinaryInfoRetriever
BinaryInfoRetriever::BinaryInfoRetriever(HTTPTransport &transport, const SessionCrypto &crypto, const FUSConfig &config)
: _transport(transport), _crypto(crypto), _config(config)
{
    //
}

BinaryInfoResult BinaryInfoRetriever::retrieve(const std::string &region, const std::string &model, const FirmwareVersion &firmware, const IdentitySource &identity){
    std::string fw = firmware.str();
    retassure(identity.imei.size() || identity.tac.size(), "No IMEI given and no TAC known for model '%s'",model.c_str());

    for (int attempt = 1; attempt <= _config.maxAttempts; attempt++) {
        std::string imei = nextIdentity(identity);
        FUSSession session = FUSSession::acquire(_transport, _crypto, _config);

        HTTPResponse resp = session.post(_config.binaryInformURL, binaryInformFields(fw, region, model, imei, session.logicCheck(fw), _config.clientVersion));

        FUSMessage msg = [&]{
            try {
                return FUSMessage::parse(resp.body);
            } catch (ProtocolError &e) {
                if (resp.status != 200) retcodeerror(ServerRejectedError, resp.status, "Binary info request rejected");
                throw;
            }
        }();

        int status = msg.status();
        debug("attempt %d: IMEI %s FUS status %d",attempt,imei.c_str(),status);

        switch (status) {
            case FUS_STATUS_OK:
            {
                BinaryMetadata meta = parseBinaryMetadata(msg);
                KeyMaterial km = {};
                km.encryptionVersion = meta.encryptionVersion;
                km.firmware = fw;
                km.model = model;
                km.region = region;
                km.latestFirmwareVersion = meta.latestFirmwareVersion;
                km.logicValueFactory = meta.logicValueFactory;
                std::vector<uint8_t> key = session.deriveFileKey(km);
                info("Attempt %d: valid IMEI found: %s",attempt,imei.c_str());
                return {meta, key, imei, fw, attempt, std::move(session)};
            }
            case FUS_STATUS_IDENTITY_REJECTED:
                info("Attempt %d: IMEI %s is invalid. FUS returned: %d",attempt,imei.c_str(),status);
                continue;
            case FUS_STATUS_UNAUTHORIZED:
                retcustomerror(libfusfetch::UnauthorizedError, "FUS rejected binary info request for %s/%s (status=%d)",region.c_str(),model.c_str(),status);
            default:
                retcodeerror(UnknownStatusError, status, "FUS returned unexpected binary info status");
        }
    }
    retcodeerror(MaxAttemptsExceededError, _config.maxAttempts, "No IMEI was accepted");
}
