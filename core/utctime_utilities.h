#pragma once

#include <string>
#include <stdexcept>
#include <iosfwd>

#include "core_pch.h"
namespace fixzone {
	namespace core {
        /** \brief utctime
         * basic types for time handling
		 * we use linear time, i.e. time is just a number
		 * on the timeaxis, utc. Timeaxis zero is at 1970-01-01 00:00:00 (unix time).
		 * resolution is 1 second, integer.
         */

		#ifdef _WIN32
		typedef long long utctime;          /// time_t is typedef'd as a __time64_t, which is an __int64.
		typedef long long utctimespan;      /// utctimespan is typdedef'd as a utctime (thus __int64)

		#else
				typedef long utctime;       /// 64 bit on the supported unix targets
				typedef long utctimespan;   /// utctimespan is typdedef'd as a utctime
		#endif

        /** \brief deltahours
         * \param n number of hours
         * \return utctimespan representing number of hours specified
         */
		inline utctimespan deltahours(int n) { return n*utctimespan(3600); }

        /** \brief deltaminutes
         * \param n number of minutes
         * \return utctimespan representing number of minutes specified
         */
		inline utctimespan deltaminutes(int n) { return n*utctimespan(60); }

		inline utctimespan deltaseconds(int n) { return utctimespan(n); }

        /** \brief zone_offset is the signed distance from utc to local time
         *
         * It is split into a standard component and a dst component, both in seconds,
         * positive for zones east of Greenwich.
         * The effective offset is the sum of the two.
         *
         * Ordering is by the effective (total) offset, so +01:00/+01:00 sorts equal to
         * +02:00/+00:00, while equality requires both components to be equal.
         */
        struct zone_offset {
            utctimespan std_offset;///< standard offset, seconds
            utctimespan dst_offset;///< daylight saving adjustment, seconds

            zone_offset():std_offset(0),dst_offset(0) {}
            explicit zone_offset(utctimespan std_offset,utctimespan dst_offset=utctimespan(0)):std_offset(std_offset),dst_offset(dst_offset) {}

            utctimespan total() const {return std_offset + dst_offset;}

            bool operator==(const zone_offset& o) const {return std_offset==o.std_offset && dst_offset==o.dst_offset;}
            bool operator!=(const zone_offset& o) const {return !operator==(o);}
            bool operator< (const zone_offset& o) const {return total() <  o.total();}
            bool operator> (const zone_offset& o) const {return o.operator<(*this);}
            bool operator<=(const zone_offset& o) const {return !o.operator<(*this);}
            bool operator>=(const zone_offset& o) const {return !operator<(o);}

            ///< iso style text of the total offset, +hh:mm, or +hh:mm:ss if seconds are present
            std::string to_string() const;
            friend std::ostream& operator<<(std::ostream& os, const zone_offset& o);
            x_serialize_decl();
        };

	}
}
//-- serialization support: expose class keys
x_serialize_export_key(fixzone::core::zone_offset);
