//
//  FirmwareVersion.cpp
//  libfusfetch
//
//  Created by tihmstar on 02.06.25.
//

#include "../include/libfusfetch/FirmwareVersion.hpp"
#include <libgeneral/macros.h>
#include "FUSMacros.hpp"

#include <string.h>

using namespace tihmstar;
using namespace tihmstar::libfusfetch;

#define REVISION_ALPHABET "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ"

#pragma mark private
static std::string trim(const std::string &s){
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e-b+1);
}

static std::vector<std::string> splitComponents(const std::string &raw){
    std::vector<std::string> ret;
    size_t pos = 0;
    while (true) {
        size_t nxt = raw.find('/', pos);
        if (nxt == std::string::npos) {
            ret.push_back(trim(raw.substr(pos)));
            break;
        }
        ret.push_back(trim(raw.substr(pos, nxt-pos)));
        pos = nxt+1;
    }
    return ret;
}

static int revisionIndex(char c, const std::string &firmware){
    const char *p = NULL;
    retcustomassure(libfusfetch::InvalidFirmwareError, c && (p = strchr(REVISION_ALPHABET, c)), "Invalid revision character '%c' in firmware '%s'",c,firmware.c_str());
    return (int)(p - REVISION_ALPHABET);
}

#pragma mark BuildInfo
std::string BuildInfo::bl() const{
    return bootloaderClass;
}

std::string BuildInfo::date() const{
    return std::to_string(year) + "." + std::to_string(month);
}

std::string BuildInfo::it() const{
    if (index < 0) return "";
    return std::to_string(index) + "." + std::to_string(revision);
}

bool BuildInfo::operator==(const BuildInfo &o) const{
    return bootloaderClass == o.bootloaderClass
        && index == o.index
        && year == o.year
        && month == o.month
        && revision == o.revision;
}

#pragma mark FirmwareVersion
FirmwareVersion::FirmwareVersion(std::string raw)
: _components(splitComponents(normalizeFirmware(raw)))
{
    //
}

const std::string &FirmwareVersion::component(size_t i) const{
    assure(i < _components.size());
    return _components[i];
}

std::string FirmwareVersion::str() const{
    return _components[0] + "/" + _components[1] + "/" + _components[2] + "/" + _components[3];
}

BuildInfo FirmwareVersion::buildInfo() const{
    return decodeBuildInfo(str());
}

#pragma mark public
LIBFUSFETCH_API std::string libfusfetch::normalizeFirmware(std::string raw){
    retcustomassure(libfusfetch::InvalidFirmwareError, trim(raw).size(), "Empty firmware string");
    std::vector<std::string> components = splitComponents(raw);
    retcustomassure(libfusfetch::InvalidFirmwareError, components.size() == 3 || components.size() == 4, "Invalid firmware format '%s' (expected 3 or 4 components, got %zu)",raw.c_str(),components.size());
    if (components.size() == 3) components.push_back(components[0]);
    if (components[2].empty()) components[2] = components[0];

    return components[0] + "/" + components[1] + "/" + components[2] + "/" + components[3];
}

LIBFUSFETCH_API BuildInfo libfusfetch::decodeBuildInfo(std::string firmware){
    std::vector<std::string> components = splitComponents(firmware);
    retcustomassure(libfusfetch::InvalidFirmwareError, components.size() == 4, "Invalid firmware format '%s' (expected 4 components)",firmware.c_str());

    std::string pda = components[0];
    if (pda.size() > 6) pda = pda.substr(pda.size()-6);
    retcustomassure(libfusfetch::InvalidFirmwareError, pda.size() >= 3, "Firmware '%s' is too short to carry build info",firmware.c_str());

    BuildInfo ret = {};
    if (pda[0] == 'U' || pda[0] == 'S') {
        retcustomassure(libfusfetch::InvalidFirmwareError, pda.size() == 6, "Firmware '%s' is too short to carry build info",firmware.c_str());
        ret.bootloaderClass = pda.substr(0,2);
        ret.index = pda[2] - 'A';
        ret.year = (pda[3] - 'R') + 2018;
        ret.month = pda[4] - 'A';
        ret.revision = revisionIndex(pda[5], firmware);
    }else{
        size_t s = pda.size();
        ret.index = -1;
        ret.year = (pda[s-3] - 'R') + 2018;
        ret.month = pda[s-2] - 'A';
        ret.revision = revisionIndex(pda[s-1], firmware);
    }
    return ret;
}
