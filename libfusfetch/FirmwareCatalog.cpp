//
//  FirmwareCatalog.cpp
//  libfusfetch
//
//  Created by tihmstar on 05.06.25.
//

#include "../include/libfusfetch/FirmwareCatalog.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>

#include <libgeneral/macros.h>
#include "FUSMacros.hpp"

#include <algorithm>

using namespace tihmstar;
using namespace tihmstar::libfusfetch;

#pragma mark private
static xmlNodePtr childNamed(xmlNodePtr node, const char *name){
    if (!node) return NULL;
    for (xmlNodePtr c = node->children; c; c = c->next) {
        if (c->type == XML_ELEMENT_NODE && xmlStrcmp(c->name, (const xmlChar*)name) == 0) return c;
    }
    return NULL;
}

static std::string textOf(xmlNodePtr node){
    xmlChar *content = NULL;
    cleanup([&]{
        safeFreeCustom(content, xmlFree);
    });
    if (!node || !(content = xmlNodeGetContent(node))) return "";
    return (const char*)content;
}

static CatalogEntry makeEntry(const std::string &raw, bool isLatest){
    FirmwareVersion fw(raw);
    return {fw, fw.buildInfo(), isLatest};
}

#pragma mark public
LIBFUSFETCH_API std::vector<CatalogEntry> libfusfetch::parseCatalog(const std::string &xml){
    xmlDocPtr doc = NULL;
    cleanup([&]{
        safeFreeCustom(doc, xmlFreeDoc);
    });
    std::vector<CatalogEntry> ret;
    xmlNodePtr root = NULL;
    xmlNodePtr versions = NULL;
    std::string latest;

    retcustomassure(libfusfetch::CatalogUnparseableError, doc = xmlReadMemory(xml.data(), (int)xml.size(), "version.xml", NULL, XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING), "Failed to parse firmware manifest");

    root = xmlDocGetRootElement(doc);
    retcustomassure(libfusfetch::CatalogEmptyError, root && xmlStrcmp(root->name, (const xmlChar*)"versioninfo") == 0, "Firmware manifest has no versioninfo section");
    retcustomassure(libfusfetch::CatalogEmptyError, versions = childNamed(childNamed(root, "firmware"), "version"), "Firmware manifest has no version section");

    latest = textOf(childNamed(versions, "latest"));
    try {
        ret.push_back(makeEntry(latest, true));
    } catch (InvalidFirmwareError &e) {
        retcustomerror(libfusfetch::CatalogUnparseableError, "Failed to parse latest firmware '%s': %s",latest.c_str(),e.what());
    }

    //<upgrade> holds zero, one or many <value> elements
    if (xmlNodePtr upgrade = childNamed(versions, "upgrade")) {
        for (xmlNodePtr c = upgrade->children; c; c = c->next) {
            if (c->type != XML_ELEMENT_NODE || xmlStrcmp(c->name, (const xmlChar*)"value") != 0) continue;
            std::string v = textOf(c);
            //placeholders like "G960FXXU1ASCD" don't name a full firmware
            if (std::count(v.begin(), v.end(), '/') < 2) continue;
            ret.push_back(makeEntry(v, false));
        }
    }
    return ret;
}

#pragma mark FirmwareCatalog
FirmwareCatalog::FirmwareCatalog(HTTPTransport &transport, const FUSConfig &config)
: _transport(transport), _config(config)
{
    //
}

std::vector<CatalogEntry> FirmwareCatalog::listVersions(const std::string &region, const std::string &model){
    HTTPRequest req = {};
    HTTPResponse resp = {};
    req.method = "GET";
    req.url = _config.catalogURL(region, model);

    resp = _transport.perform(req);
    if (resp.status != 200) retcodeerror(ServerRejectedError, resp.status, "Firmware manifest not found");
    return parseCatalog(resp.body);
}

FirmwareVersion FirmwareCatalog::latest(const std::string &region, const std::string &model){
    return listVersions(region, model).front().firmware;
}
