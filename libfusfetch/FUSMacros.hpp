//
//  FUSMacros.hpp
//  libfusfetch
//
//  Created by tihmstar on 02.06.25.
//

#ifndef FUSMacros_hpp
#define FUSMacros_hpp

#include <libfusfetch/FUSException.hpp>

//throws an error carrying a numeric code (HTTP/FUS status, attempt count)
//next to its message, everything else goes through retcustomerror/retcustomassure
#define retcodeerror(fus_except, code, what) do{ throw tihmstar::libfusfetch::fus_except(VERSION_COMMIT_COUNT, VERSION_COMMIT_SHA, __LINE__, LOCAL_FILENAME, (int)(code), what); } while(0)

#endif /* FUSMacros_hpp */
