//
//  DownloadPipeline.cpp
//  libfusfetch
//
//  Created by tihmstar on 07.06.25.
//

#include "../include/libfusfetch/DownloadPipeline.hpp"
#include "../include/libfusfetch/StreamDecryptor.hpp"

#include <libgeneral/macros.h>
#include "FUSMacros.hpp"

#include <ctype.h>
#include <errno.h>
#include <memory>
#include <stdlib.h>

using namespace tihmstar;
using namespace tihmstar::libfusfetch;

#pragma mark private
static std::string trim(const std::string &s){
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    return s.substr(b, s.find_last_not_of(" \t\r\n") - b + 1);
}

static bool parseOffset(const std::string &s, int64_t &out){
    if (s.empty()) {
        out = 0;
        return true;
    }
    for (char c : s) {
        if (!isdigit((unsigned char)c)) return false;
    }
    errno = 0;
    out = strtoll(s.c_str(), NULL, 10);
    return errno != ERANGE;
}

static std::string replaceAll(std::string s, const std::string &what, const std::string &with){
    for (size_t pos = s.find(what); pos != std::string::npos; pos = s.find(what, pos + with.size())) {
        s.replace(pos, what.size(), with);
    }
    return s;
}

static void checkFUSStatus(const HTTPResponse &resp){
    if (resp.status != 200) retcodeerror(ServerRejectedError, resp.status, "File registration rejected");
    FUSMessage msg = FUSMessage::parse(resp.body);
    int status = msg.status();
    if (status == 200) return;
    retcustomassure(libfusfetch::UnauthorizedError, status != 401, "FUS rejected file registration (status=%d)",status);
    retcodeerror(UnknownStatusError, status, "FUS returned unexpected file registration status");
}

#pragma mark public
LIBFUSFETCH_API DownloadRange libfusfetch::parseRangeHeader(const std::string &header){
    std::string h = trim(header);
    if (h.compare(0, 6, "bytes=") == 0) h = h.substr(6);

    size_t dash = h.find('-');
    if (dash == std::string::npos) return {-1,-1};

    DownloadRange ret = {};
    if (!parseOffset(trim(h.substr(0,dash)), ret.start) || !parseOffset(trim(h.substr(dash+1)), ret.end)) return {-1,-1};
    return ret;
}

LIBFUSFETCH_API void libfusfetch::validateRange(const DownloadRange &range, bool decrypt){
    retcustomassure(libfusfetch::InvalidRangeError, range.start >= 0 && range.end >= 0, "Unparseable range");
    if (decrypt) {
        //ECB can only restart on a block boundary and padding is only known at the end of the file
        retcustomassure(libfusfetch::InvalidRangeError, range.end == 0, "Decryption requires an open-ended range, got end=%lld",(long long)range.end);
        retcustomassure(libfusfetch::InvalidRangeError, (range.start % StreamDecryptor::kBlockSize) == 0, "Decryption requires a range starting on a %zu byte boundary, got start=%lld",StreamDecryptor::kBlockSize,(long long)range.start);
    }else{
        retcustomassure(libfusfetch::InvalidRangeError, range.end == 0 || range.end >= range.start, "Range end %lld before start %lld",(long long)range.end,(long long)range.start);
    }
}

LIBFUSFETCH_API std::string libfusfetch::joinPath(const std::vector<std::string> &components){
    std::string ret;
    for (auto &c : components) {
        std::string cur;
        for (char ch : c) {
            if (ch == '/' || ch == '\\' || isspace((unsigned char)ch)) {
                if (cur.size()) ret += "/" + cur;
                cur.clear();
            }else{
                cur += ch;
            }
        }
        if (cur.size()) ret += "/" + cur;
    }
    return ret.size() ? ret : "/";
}

LIBFUSFETCH_API std::string libfusfetch::downloadFilename(const std::string &remoteFilename, const std::string &customFilename, bool decrypt){
    if (customFilename.size()) {
        std::string ret = customFilename;
        if (ret.size() >= 4 && ret.compare(ret.size()-4, 4, ".zip") == 0) ret.resize(ret.size()-4);
        return ret + ".zip";
    }
    if (!decrypt) return remoteFilename;
    return replaceAll(replaceAll(remoteFilename, ".enc4", ""), ".enc2", "");
}

#pragma mark DownloadPipeline
DownloadPipeline::DownloadPipeline(FUSSession &session)
: _session(session)
{
    //
}

DownloadRange DownloadPipeline::validate(const DownloadRequest &request){
    DownloadRange ret = parseRangeHeader(request.rangeHeader.size() ? request.rangeHeader : "bytes=0-");
    validateRange(ret, request.decryptionKey.size() > 0);
    return ret;
}

FileHandle DownloadPipeline::prepare(const std::string &filename){
    FileHandle ret = {};
    std::string stem = filename.substr(0, filename.find('.'));
    if (stem.size() > 16) stem = stem.substr(stem.size()-16);

    ret.filename = filename;
    ret.path = joinPath({_session.config().filePathPrefix, filename});

    HTTPResponse resp = _session.post(_session.config().binaryInitURL, {
        {"BINARY_FILE_NAME", filename},
        {"LOGIC_CHECK", _session.logicCheck(stem)},
    });
    checkFUSStatus(resp);
    return ret;
}

bool DownloadPipeline::open(const FileHandle &file, const DownloadRequest &request, DownloadSink &sink){
    bool decrypt = request.decryptionKey.size() > 0;
    std::unique_ptr<StreamDecryptor> decryptor;
    HTTPRequest req = {};
    long upstreamStatus = 0;
    StreamResult res = {};

    validate(request);
    if (decrypt) decryptor.reset(new StreamDecryptor(request.decryptionKey));

    req.method = "GET";
    req.url = _session.config().downloadURL + "?file=" + file.path;
    if (request.rangeHeader.size()) req.headers.push_back({"Range", request.rangeHeader});
    req = _session.authorize(req);

    StreamDecryptor::Emit emit = [&sink](const uint8_t *buf, size_t size){
        return sink.onData(buf, size);
    };

    res = _session.transport().stream(req, [&](const HTTPResponse &head)->bool{
        upstreamStatus = head.status;
        if (head.status != 200 && head.status != 206) return false;

        DownloadHeaders h = {};
        h.status = head.status;
        h.contentDisposition = "attachment; filename=\"" + downloadFilename(file.filename, request.customFilename, decrypt) + "\"";
        h.contentType = decrypt ? "application/zip" : "application/octet-stream";
        h.acceptRanges = "bytes";
        //decrypted output is shorter than the ciphertext by the padding
        if (!decrypt) {
            if (const std::string *cl = head.header("Content-Length")) h.contentLength = *cl;
        }
        if (const std::string *cr = head.header("Content-Range")) h.contentRange = *cr;
        return sink.onHeaders(h);
    }, [&](const char *buf, size_t size)->bool{
        if (decryptor) return decryptor->update((const uint8_t*)buf, size, emit);
        return sink.onData((const uint8_t*)buf, size);
    });

    upstreamStatus = res.status ? res.status : upstreamStatus;
    if (upstreamStatus != 200 && upstreamStatus != 206) {
        retcodeerror(UpstreamRejectedError, upstreamStatus, "Download request rejected");
    }
    if (res.cancelled) return false;
    if (decryptor) return decryptor->finalize(emit);
    return true;
}

bool DownloadPipeline::run(const DownloadRequest &request, DownloadSink &sink){
    validate(request);
    return open(prepare(request.filename), request, sink);
}
