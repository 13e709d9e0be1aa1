//
//  FUSMessage.hpp
//  libfusfetch
//
//  Created by tihmstar on 04.06.25.
//

#ifndef FUSMessage_hpp
#define FUSMessage_hpp

#include <initializer_list>
#include <map>
#include <string>
#include <utility>
#include <vector>

#ifndef LIBFUSFETCH_API
#   define LIBFUSFETCH_API
#endif

namespace tihmstar {
    namespace libfusfetch {
        using FUSFields = std::vector<std::pair<std::string, std::string>>;

        /*
            <FUSMsg>
                <FUSHdr><ProtoVer>1.0</ProtoVer></FUSHdr>
                <FUSBody><Put><NAME><Data>value</Data></NAME>...</Put></FUSBody>
            </FUSMsg>
         */
        LIBFUSFETCH_API std::string buildFUSMessage(const FUSFields &put);

        class LIBFUSFETCH_API FUSMessage{
        public:
            enum Section{
                kSectionPut,
                kSectionResults
            };
            struct FieldRef{
                Section section;
                const char *name;
            };
        private:
            std::string _status;
            std::map<std::string, std::string> _put;
            std::map<std::string, std::string> _results;

            FUSMessage() = default;
        public:
            static FUSMessage parse(const std::string &xml);

            bool hasStatus() const {return _status.size() > 0;}
            int status() const;

            //empty fields count as absent
            const std::string *field(Section section, const std::string &name) const;
            //first present field in the given order
            const std::string *firstOf(std::initializer_list<FieldRef> refs) const;
        };
    }
}

#endif /* FUSMessage_hpp */
