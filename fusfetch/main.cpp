//
//  main.cpp
//  fusfetch
//
//  Created by tihmstar on 09.06.25.
//

#include <libfusfetch/libfusfetch.hpp>
#include <libfusfetch/FUSCrypto.hpp>

#include <libgeneral/macros.h>

#include <getopt.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

using namespace tihmstar::libfusfetch;

static struct option longopts[] = {
    { "help",           no_argument,        NULL, 'h' },
    { "version",        no_argument,        NULL, 'v' },
    { "imei",           required_argument,  NULL, 'i' },
    { "tac-file",       required_argument,  NULL, 't' },
    { "output",         required_argument,  NULL, 'o' },
    { "key",            required_argument,  NULL, 'k' },
    { "range",          required_argument,  NULL, 'r' },
    { "filename",       required_argument,  NULL, 'f' },
    { "no-decrypt",     no_argument,        NULL, 'n' },
    { "timeout",        required_argument,  NULL, 'T' },
    { "chunk-size",     required_argument,  NULL, 'c' },
    { "attempts",       required_argument,  NULL, 'a' },
    { NULL, 0, NULL, 0 }
};

namespace {
    class FileSink : public DownloadSink{
        std::string _path;
        FILE *_f;
        uint64_t _written;
    public:
        FileSink(std::string path) : _path(path), _f(NULL), _written(0) {}
        ~FileSink(){
            safeFreeCustom(_f, fclose);
        }

        bool onHeaders(const DownloadHeaders &headers) override{
            info("Status: %ld",headers.status);
            info("Content-Disposition: %s",headers.contentDisposition.c_str());
            if (headers.contentLength.size()) info("Content-Length: %s",headers.contentLength.c_str());
            if (headers.contentRange.size()) info("Content-Range: %s",headers.contentRange.c_str());
            if (_path.empty()) {
                //attachment; filename="<name>"
                size_t b = headers.contentDisposition.find("filename=\"");
                retassure(b != std::string::npos, "No filename in Content-Disposition");
                b += strlen("filename=\"");
                _path = headers.contentDisposition.substr(b, headers.contentDisposition.size()-b-1);
            }
            retassure(_f = fopen(_path.c_str(), "wb"), "Failed to open '%s' for writing",_path.c_str());
            info("Writing to %s",_path.c_str());
            return true;
        }

        bool onData(const uint8_t *buf, size_t size) override{
            retassure(fwrite(buf, 1, size, _f) == size, "Failed to write to '%s'",_path.c_str());
            _written += size;
            return true;
        }

        void close(){
            if (_f) {
                retassure(fclose(_f) == 0, "Failed to close '%s'",_path.c_str());
                _f = NULL;
            }
        }

        void discard(){
            safeFreeCustom(_f, fclose);
            if (_path.size()) remove(_path.c_str());
        }

        uint64_t written() const {return _written;}
        const std::string &path() const {return _path;}
    };
}

static void cmd_help(){
    printf("Usage: fusfetch [OPTIONS] <command> [ARGS]\n");
    printf("Retrieve firmware images from the FUS firmware distribution service.\n\n");
    printf("Commands:\n");
    printf("  list <region> <model>                         List available firmware versions\n");
    printf("  latest <region> <model>                       Print the latest firmware version\n");
    printf("  info <region> <model> <firmware|latest>       Print binary details and decryption key\n");
    printf("  download <region> <model> <firmware|latest>   Look up and download (decrypted) binary\n");
    printf("  fetch <binary name>                           Download a binary by name\n\n");
    printf("Options:\n");
    printf("  -h, --help                 prints usage information\n");
    printf("  -v, --version              prints version information\n");
    printf("  -i, --imei IMEI            use this IMEI instead of generating one\n");
    printf("  -t, --tac-file PATH        CSV with TAC,model rows to generate IMEIs from\n");
    printf("  -o, --output PATH          output file (default: name from server)\n");
    printf("  -k, --key HEX              decryption key for fetch\n");
    printf("  -r, --range RANGE          byte range, e.g. \"bytes=0-\"\n");
    printf("  -f, --filename NAME        custom output filename (.zip is appended)\n");
    printf("  -n, --no-decrypt           keep the binary encrypted\n");
    printf("  -T, --timeout SEC          per request timeout\n");
    printf("  -c, --chunk-size BYTES     download chunk size\n");
    printf("  -a, --attempts N           maximum IMEI attempts\n");
    printf("\n");
}

static void printBinaryInfo(const BinaryInfoResult &res){
    const BinaryMetadata &m = res.metadata;
    BuildInfo bi = FirmwareVersion(res.firmware).buildInfo();
    printf("display_name: %s\n",m.displayName.c_str());
    printf("firmware: %s\n",res.firmware.c_str());
    printf("version: %s\n",m.osVersion.c_str());
    printf("platform: %s\n",m.platform.c_str());
    printf("filename: %s\n",m.filename.c_str());
    printf("path: %s\n",m.path.c_str());
    printf("size: %llu (%s)\n",(unsigned long long)m.size,m.sizeReadable().c_str());
    printf("crc: %s\n",m.crc.c_str());
    printf("last_modified: %llu\n",(unsigned long long)m.lastModified);
    printf("encrypt_version: %d\n",m.encryptionVersion);
    printf("decrypt_key: %s\n",hexEncode(res.decryptionKey).c_str());
    printf("changelog: %s\n",m.changelogURL.c_str());
    printf("pda: bl=%s date=%s it=%s\n",bi.bl().c_str(),bi.date().c_str(),bi.it().c_str());
    printf("imei: %s\n",res.imei.c_str());
}

static int runDownload(FileSink &sink, std::function<bool()> f){
    bool complete = false;
    try {
        complete = f();
        sink.close();
    } catch (...) {
        sink.discard();
        throw;
    }
    if (!complete) {
        sink.discard();
        reterror("Download was cancelled");
    }
    info("Wrote %llu bytes to %s",(unsigned long long)sink.written(),sink.path().c_str());
    return 0;
}

int main_r(int argc, const char * argv[]) {
    info("%s",version());

    FUSConfig config = FUSConfig::defaults();
    const char *imei = NULL;
    const char *tacFile = NULL;
    const char *outFile = NULL;
    const char *keyStr = NULL;
    const char *range = NULL;
    const char *customFilename = NULL;
    bool noDecrypt = false;
    int opt = 0;
    int optindex = 0;

    while ((opt = getopt_long(argc, (char* const *)argv, "hvi:t:o:k:r:f:nT:c:a:", longopts, &optindex)) > 0) {
        switch (opt) {
            case 'h':
                cmd_help();
                return 0;
            case 'v':
                return 0;
            case 'i':
                imei = optarg;
                break;
            case 't':
                tacFile = optarg;
                break;
            case 'o':
                outFile = optarg;
                break;
            case 'k':
                keyStr = optarg;
                break;
            case 'r':
                range = optarg;
                break;
            case 'f':
                customFilename = optarg;
                break;
            case 'n':
                noDecrypt = true;
                break;
            case 'T':
                config.requestTimeout = atol(optarg);
                break;
            case 'c':
                config.chunkSize = atol(optarg);
                break;
            case 'a':
                config.maxAttempts = atoi(optarg);
                break;
            default:
                cmd_help();
                return 1;
        }
    }
    argc -= optind;
    argv += optind;

    if (argc < 1) {
        cmd_help();
        return 1;
    }
    std::string cmd = argv[0];

    FUSClient client(config);
    if (tacFile) client.setTacTable(TacTable::fromCSV(tacFile));

    DownloadRequest req = {};
    if (range) req.rangeHeader = range;
    if (customFilename) req.customFilename = customFilename;

    if (cmd == "list") {
        retassure(argc == 3, "Usage: list <region> <model>");
        for (auto &e : client.listFirmware(argv[1], argv[2])) {
            printf("%s%s bl=%s date=%s it=%s\n",e.firmware.str().c_str(),e.isLatest ? " (latest)" : "",
                   e.buildInfo.bl().c_str(),e.buildInfo.date().c_str(),e.buildInfo.it().c_str());
        }
        return 0;
    } else if (cmd == "latest") {
        retassure(argc == 3, "Usage: latest <region> <model>");
        printf("%s\n",client.latestFirmware(argv[1], argv[2]).str().c_str());
        return 0;
    } else if (cmd == "info") {
        retassure(argc == 4, "Usage: info <region> <model> <firmware|latest>");
        printBinaryInfo(client.getBinaryInfo(argv[1], argv[2], argv[3], imei ? imei : ""));
        return 0;
    } else if (cmd == "download") {
        retassure(argc == 4, "Usage: download <region> <model> <firmware|latest>");
        BinaryInfoResult res = client.getBinaryInfo(argv[1], argv[2], argv[3], imei ? imei : "");
        printBinaryInfo(res);
        if (!noDecrypt) req.decryptionKey = res.decryptionKey;
        DownloadPipeline::validate(req);
        FileSink sink(outFile ? outFile : "");
        return runDownload(sink, [&]{
            return client.download(res, req, sink);
        });
    } else if (cmd == "fetch") {
        retassure(argc == 2, "Usage: fetch <binary name>");
        req.filename = argv[1];
        if (keyStr && !noDecrypt) req.decryptionKey = hexDecode(keyStr);
        FileSink sink(outFile ? outFile : "");
        return runDownload(sink, [&]{
            return client.download(req, sink);
        });
    }

    error("Unknown command '%s'",cmd.c_str());
    cmd_help();
    return 1;
}

int main(int argc, const char * argv[]) {
#ifdef DEBUG
    return main_r(argc, argv);
#else
    try {
        return main_r(argc, argv);
    } catch (tihmstar::exception &e) {
        error("%s",e.what());
        return 1;
    }
#endif
}
