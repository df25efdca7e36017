#pragma once

#include <string>
#include <stdexcept>
#include <iosfwd>

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/date_time/local_time/local_time_types.hpp>

#include "core_pch.h"
#include "utctime_utilities.h"
#include "fixed_offset_parser.h"

namespace fixzone {
    namespace core {
        namespace time_zone {
            using namespace std;

            /** \brief result of the chronological comparison of two time zones */
            enum class zone_order {
                less=-1,
                equal=0,
                greater=1
            };

            /** \brief fixed_time_zone, a named time zone with a constant offset for all of time
             *
             * It satisfies the time zone concept used by the rest of the library,
             * name(), base_offset(), utc_offset(t) and is_dst(t), with answers that
             * do not depend on t.
             *
             * Values are immutable, rename() returns a new value.
             *
             * Ordering is chronological, not numeric: a < b if b.offset() < a.offset().
             * E.g. 10:00 local time in UTC-05:00 is an earlier moment than 10:00 local time
             * in UTC-08:00, so UTC-05:00 < UTC-08:00, and UTC+02:00 < UTC-01:00.
             * Two zones with equal total offset are equivalent under this ordering
             * regardless of their names, while operator== compares both name and offset.
             */
            class fixed_time_zone {
              public:
                static const size_t name_capacity=15;///< max number of characters in the name
                ///< throws std::length_error if name exceeds name_capacity
                static void check_name(const string& name);

                fixed_time_zone():tz_name("Z") {}// serialization
                /**\brief construct from name and offset
                 * \throw std::length_error if name is longer than name_capacity
                 */
                fixed_time_zone(const string& name, const zone_offset& offset);
                /**\brief construct from name, standard offset and dst offset in seconds */
                fixed_time_zone(const string& name, utctimespan std_offset, utctimespan dst_offset=utctimespan(0))
                    :fixed_time_zone(name,zone_offset(std_offset,dst_offset)) {}
                /**\brief construct from name, standard offset and dst offset as boost durations, truncated to whole seconds */
                fixed_time_zone(const string& name,
                                const boost::posix_time::time_duration& std_offset,
                                const boost::posix_time::time_duration& dst_offset=boost::posix_time::seconds(0));
                /**\brief construct from a fixed offset text like Z, UTC, UTC+6, -1330, 15:45:21
                 *
                 * Z gives the utc_zero() zone, anything else gets the canonical name
                 * UTC, UTC+hh:mm or UTC+hh:mm:ss, \sa parse_fixed_offset.
                 * \throw unrecognized_time_zone if text is not a fixed offset
                 */
                explicit fixed_time_zone(const string& text);

                const string& name() const {return tz_name;}
                const zone_offset& offset() const {return tz_offset;}

                ///< returns a new zone with the same offset and the supplied name
                fixed_time_zone rename(const string& new_name) const {return fixed_time_zone(new_name,tz_offset);}

                // time zone concept
                utctimespan base_offset() const {return tz_offset.std_offset;}
                utctimespan utc_offset(utctime) const {return tz_offset.total();}
                bool is_dst(utctime) const {return tz_offset.dst_offset!=utctimespan(0);}

                string to_string() const {return tz_name;}

                /**\brief boost::local_time zone with the same name and effective offset
                 *
                 * The boost zone has no dst rule, so base_utc_offset() is the total
                 * offset (std + dst), dst_offset() is zero and has_dst() is false.
                 * Suitable for boost::local_time::local_date_time.
                 */
                boost::local_time::time_zone_ptr to_boost_time_zone() const;

                bool operator==(const fixed_time_zone& o) const {return tz_name==o.tz_name && tz_offset==o.tz_offset;}
                bool operator!=(const fixed_time_zone& o) const {return !operator==(o);}
                ///< chronological order, mirror of the offset order
                bool operator< (const fixed_time_zone& o) const {return o.tz_offset < tz_offset;}
                bool operator> (const fixed_time_zone& o) const {return o.operator<(*this);}
                bool operator<=(const fixed_time_zone& o) const {return !o.operator<(*this);}
                bool operator>=(const fixed_time_zone& o) const {return !operator<(o);}

                friend ostream& operator<<(ostream& os, const fixed_time_zone& tz);
              private:
                string tz_name;
                zone_offset tz_offset;
                x_serialize_decl();
            };

            /**\brief the canonical zero offset zone, named Z
             * \note a single shared immutable instance
             */
            const fixed_time_zone& utc_zero();

            /**\brief chronological three way compare, \sa fixed_time_zone::operator< */
            zone_order compare(const fixed_time_zone& a, const fixed_time_zone& b);
        }
    }
}
//-- serialization support: expose class keys
x_serialize_export_key(fixzone::core::time_zone::fixed_time_zone);
