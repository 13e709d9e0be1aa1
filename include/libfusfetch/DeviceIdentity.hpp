//
//  DeviceIdentity.hpp
//  libfusfetch
//
//  Created by tihmstar on 05.06.25.
//

#ifndef DeviceIdentity_hpp
#define DeviceIdentity_hpp

#include <functional>
#include <map>
#include <string>

#ifndef LIBFUSFETCH_API
#   define LIBFUSFETCH_API
#endif

namespace tihmstar {
    namespace libfusfetch {
        //returns a uniformly distributed digit 0-9
        using DigitSource = std::function<int()>;

        LIBFUSFETCH_API int luhnCheckDigit(const std::string &digits);
        LIBFUSFETCH_API std::string generateIMEI(const std::string &tac, DigitSource rng = {});

        /*
            TAC lookup loaded from a CSV where each row is "<tac>,<model>[,<model>...]".
         */
        class LIBFUSFETCH_API TacTable{
            std::map<std::string, std::string> _tacForModel;
        public:
            static TacTable fromCSV(const std::string &path);
            static TacTable fromCSVString(const std::string &csv);

            void add(const std::string &tac, const std::string &model);
            const std::string *tacForModel(const std::string &model) const;
            size_t size() const {return _tacForModel.size();}
        };
    }
}

#endif /* DeviceIdentity_hpp */
