#include "core_pch.h"
#include "fixed_time_zone.h"
#include <ostream>
#include <boost/date_time/local_time/local_time.hpp>

namespace fixzone {
    namespace core {
        namespace time_zone {
            using namespace std;

            void fixed_time_zone::check_name(const string& name) {
                if(name.size()>name_capacity)
                    throw length_error(string("time zone name '")+name+string("' exceeds 15 characters"));
            }

            static inline const string& checked_name(const string& name) {
                fixed_time_zone::check_name(name);
                return name;
            }

            static inline utctimespan whole_seconds(const boost::posix_time::time_duration& d) {
                return utctimespan(d.ticks()/d.ticks_per_second());
            }

            const size_t fixed_time_zone::name_capacity;

            fixed_time_zone::fixed_time_zone(const string& name, const zone_offset& offset)
                :tz_name(checked_name(name)),tz_offset(offset) {}

            fixed_time_zone::fixed_time_zone(const string& name,
                                             const boost::posix_time::time_duration& std_offset,
                                             const boost::posix_time::time_duration& dst_offset)
                :fixed_time_zone(name,zone_offset(whole_seconds(std_offset),whole_seconds(dst_offset))) {}

            fixed_time_zone::fixed_time_zone(const string& text) {
                if(text=="Z") {
                    *this=utc_zero();
                    return;
                }
                auto spec=parse_fixed_offset(text);
                tz_name=spec.name;
                tz_offset=zone_offset(spec.offset);
            }

            boost::local_time::time_zone_ptr fixed_time_zone::to_boost_time_zone() const {
                using namespace boost::local_time;
                using boost::posix_time::seconds;
                using boost::posix_time::hours;
                time_zone_names names(tz_name,tz_name,"","");
                dst_adjustment_offsets no_dst(hours(0),hours(0),hours(0));
                return time_zone_ptr(new custom_time_zone(names,seconds(tz_offset.total()),no_dst,boost::shared_ptr<dst_calc_rule>()));
            }

            ostream& operator<<(ostream& os, const fixed_time_zone& tz) {
                os << tz.tz_name;
                return os;
            }

            const fixed_time_zone& utc_zero() {
                static const fixed_time_zone z("Z",zone_offset(0,0));
                return z;
            }

            zone_order compare(const fixed_time_zone& a, const fixed_time_zone& b) {
                if(a<b) return zone_order::less;
                if(b<a) return zone_order::greater;
                return zone_order::equal;
            }
        }
    } // core
} // fixzone
