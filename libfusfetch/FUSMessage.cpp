//
//  FUSMessage.cpp
//  libfusfetch
//
//  Created by tihmstar on 04.06.25.
//

#include "../include/libfusfetch/FUSMessage.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>

#include <libgeneral/macros.h>
#include "FUSMacros.hpp"

#include <stdlib.h>
#include <string.h>

using namespace tihmstar;
using namespace tihmstar::libfusfetch;

#define FUS_PROTO_VERSION "1.0"

#pragma mark private
static const xmlChar *X(const char *s){
    return (const xmlChar*)s;
}

static xmlNodePtr childNamed(xmlNodePtr node, const char *name){
    if (!node) return NULL;
    for (xmlNodePtr c = node->children; c; c = c->next) {
        if (c->type == XML_ELEMENT_NODE && xmlStrcmp(c->name, X(name)) == 0) return c;
    }
    return NULL;
}

static std::string textOf(xmlNodePtr node){
    xmlChar *content = NULL;
    cleanup([&]{
        safeFreeCustom(content, xmlFree);
    });
    if (!node) return "";
    if (!(content = xmlNodeGetContent(node))) return "";
    std::string ret = (const char*)content;
    size_t b = ret.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    return ret.substr(b, ret.find_last_not_of(" \t\r\n") - b + 1);
}

//fields come either as <NAME><Data>v</Data></NAME> or as plain <NAME>v</NAME>
static std::string fieldValue(xmlNodePtr node){
    xmlNodePtr data = childNamed(node, "Data");
    return textOf(data ? data : node);
}

static void collectFields(xmlNodePtr section, std::map<std::string, std::string> &out){
    if (!section) return;
    for (xmlNodePtr c = section->children; c; c = c->next) {
        if (c->type != XML_ELEMENT_NODE) continue;
        std::string v = fieldValue(c);
        if (v.size()) out[(const char*)c->name] = v;
    }
}

#pragma mark public
LIBFUSFETCH_API std::string libfusfetch::buildFUSMessage(const FUSFields &put){
    xmlDocPtr doc = NULL;
    xmlBufferPtr buf = NULL;
    cleanup([&]{
        safeFreeCustom(buf, xmlBufferFree);
        safeFreeCustom(doc, xmlFreeDoc);
    });
    xmlNodePtr root = NULL;
    xmlNodePtr hdr = NULL;
    xmlNodePtr body = NULL;
    xmlNodePtr putNode = NULL;

    assure(doc = xmlNewDoc(X("1.0")));
    assure(root = xmlNewNode(NULL, X("FUSMsg")));
    xmlDocSetRootElement(doc, root);

    assure(hdr = xmlNewChild(root, NULL, X("FUSHdr"), NULL));
    assure(xmlNewTextChild(hdr, NULL, X("ProtoVer"), X(FUS_PROTO_VERSION)));
    assure(body = xmlNewChild(root, NULL, X("FUSBody"), NULL));
    assure(putNode = xmlNewChild(body, NULL, X("Put"), NULL));

    for (auto &f : put) {
        xmlNodePtr field = NULL;
        assure(field = xmlNewChild(putNode, NULL, X(f.first.c_str()), NULL));
        assure(xmlNewTextChild(field, NULL, X("Data"), X(f.second.c_str())));
    }

    assure(buf = xmlBufferCreate());
    assure(xmlNodeDump(buf, doc, root, 0, 0) >= 0);
    return (const char*)xmlBufferContent(buf);
}

#pragma mark FUSMessage
FUSMessage FUSMessage::parse(const std::string &xml){
    xmlDocPtr doc = NULL;
    cleanup([&]{
        safeFreeCustom(doc, xmlFreeDoc);
    });
    FUSMessage ret;
    xmlNodePtr root = NULL;
    xmlNodePtr body = NULL;

    retcustomassure(libfusfetch::ProtocolError, doc = xmlReadMemory(xml.data(), (int)xml.size(), "fus.xml", NULL, XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING), "Failed to parse FUS response");
    retcustomassure(libfusfetch::ProtocolError, (root = xmlDocGetRootElement(doc)) && xmlStrcmp(root->name, X("FUSMsg")) == 0, "FUS response lacks FUSMsg root");

    body = childNamed(root, "FUSBody");
    ret._status = fieldValue(childNamed(childNamed(body, "Results"), "Status"));
    collectFields(childNamed(body, "Put"), ret._put);
    collectFields(childNamed(body, "Results"), ret._results);
    return ret;
}

int FUSMessage::status() const{
    char *end = NULL;
    long v = 0;
    retcustomassure(libfusfetch::ProtocolError, _status.size(), "FUS response lacks Results.Status");
    v = strtol(_status.c_str(), &end, 10);
    retcustomassure(libfusfetch::ProtocolError, end && *end == '\0', "FUS response has non-numeric status '%s'",_status.c_str());
    return (int)v;
}

const std::string *FUSMessage::field(Section section, const std::string &name) const{
    const std::map<std::string, std::string> &m = (section == kSectionPut) ? _put : _results;
    auto it = m.find(name);
    return (it != m.end()) ? &it->second : NULL;
}

const std::string *FUSMessage::firstOf(std::initializer_list<FieldRef> refs) const{
    for (auto &r : refs) {
        if (const std::string *v = field(r.section, r.name)) return v;
    }
    return NULL;
}
