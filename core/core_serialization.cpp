#ifdef __GNUC__
#pragma GCC diagnostic ignored "-Wsign-compare"
#endif

#include "core_serialization.h"
#include "core_archive.h"

#include <boost/serialization/serialization.hpp>
#include <boost/serialization/string.hpp>

//
// 1. first include std stuff and the headers for
// files with serializeation support
//

#include "utctime_utilities.h"
#include "fixed_time_zone.h"

//
// 2. Then implement each class serialization support
//

using namespace boost::serialization;
using namespace fixzone::core;

//-- utctime_utilities.h

template<class Archive>
void fixzone::core::zone_offset::serialize(Archive & ar, const unsigned int version) {
    ar
    & core_nvp("std_offset", std_offset)
    & core_nvp("dst_offset", dst_offset)
    ;
}

//-- fixed_time_zone.h

template<class Archive>
void fixzone::core::time_zone::fixed_time_zone::serialize(Archive & ar, const unsigned int version) {
    ar
    & core_nvp("tz_name", tz_name)
    & core_nvp("tz_offset", tz_offset)
    ;
    if (Archive::is_loading::value)
        check_name(tz_name);
}


//-- export utctime_utilities
x_serialize_implement(fixzone::core::zone_offset);

//-- export fixed time zone
x_serialize_implement(fixzone::core::time_zone::fixed_time_zone);

//
// 3. Then include the archive supported
//
// repeat template instance for each archive class

x_arch(fixzone::core::zone_offset);
x_arch(fixzone::core::time_zone::fixed_time_zone);
