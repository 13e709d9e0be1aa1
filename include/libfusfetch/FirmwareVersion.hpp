//
//  FirmwareVersion.hpp
//  libfusfetch
//
//  Created by tihmstar on 02.06.25.
//

#ifndef FirmwareVersion_hpp
#define FirmwareVersion_hpp

#include <string>
#include <vector>

#ifndef LIBFUSFETCH_API
#   define LIBFUSFETCH_API
#endif

namespace tihmstar {
    namespace libfusfetch {
        /*
            Build metadata encoded in the last 6 characters of the first
            firmware component, e.g. "U1ASCD":
                class "U1", index 'A'-'A', year 'S'-'R'+2018, month 'C'-'A', revision "0-9A-Z".index('D')
            Codes not starting with 'U' or 'S' only carry year/month/revision in their last 3 characters.
         */
        struct BuildInfo{
            std::string bootloaderClass; //empty for suffix form
            int index;                   //-1 for suffix form
            int year;
            int month;
            int revision;

            std::string bl() const;
            std::string date() const;
            std::string it() const;
            bool operator==(const BuildInfo &o) const;
        };

        class LIBFUSFETCH_API FirmwareVersion{
            std::vector<std::string> _components;
        public:
            FirmwareVersion(std::string raw);

            const std::string &component(size_t i) const;
            std::string str() const;
            BuildInfo buildInfo() const;

            bool operator==(const FirmwareVersion &o) const {return _components == o._components;}
            bool operator!=(const FirmwareVersion &o) const {return !(*this == o);}
        };

        LIBFUSFETCH_API std::string normalizeFirmware(std::string raw);
        LIBFUSFETCH_API BuildInfo decodeBuildInfo(std::string firmware);
    }
}

#endif /* FirmwareVersion_hpp */
