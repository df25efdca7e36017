#pragma once

#include <string>
#include <stdexcept>

#include "core_pch.h"
#include "utctime_utilities.h"

namespace fixzone {
    namespace core {
        namespace time_zone {
            using namespace std;

            /** \brief thrown when a text can not be interpreted as a fixed offset time zone
             *
             * The offending text is kept for diagnostics, \sa text()
             */
            struct unrecognized_time_zone : runtime_error {
                explicit unrecognized_time_zone(const string& tz_text)
                    :runtime_error(string("Unrecognized time zone: ") + tz_text), tz_text(tz_text) {}
                const string& text() const {return tz_text;}
              private:
                string tz_text;
            };

            /** \brief the grammar branch that matched a fixed offset text */
            enum class offset_form {
                zulu,           ///< Z
                utc_prefix,     ///< UTC, UTC+6, UTC-12
                signed_hour,    ///< +05, -11
                colon_separated,///< [UTC]+hh:mm, hh:mm:ss etc.
                concatenated    ///< [UTC]+hhmm, hhmm
            };

            /** \brief the raw fields captured from a fixed offset text
             *
             * Absent fields are zero, and the has_xxx flags tell which groups
             * that was present. A second is only present if a minute is, and a
             * minute is only present if an hour is.
             */
            struct offset_fields {
                offset_form form=offset_form::zulu;
                char sign='+';
                bool has_hour=false;
                bool has_minute=false;
                bool has_second=false;
                int hour=0;
                int minute=0;
                int second=0;

                int coefficient() const {return sign=='-'?-1:1;}
                ///< signed total offset in seconds
                utctimespan total() const {return coefficient()*(deltahours(hour)+deltaminutes(minute)+deltaseconds(second));}
                bool is_zero() const {return hour==0 && minute==0 && second==0;}
            };

            /** \brief canonical name and offset of a parsed fixed offset text */
            struct fixed_offset_spec {
                string name;
                utctimespan offset=0;
            };

            /** \brief match text against the fixed offset grammar
             *
             * The whole text must match, one of:
             * -# Z
             * -# UTC, optionally followed by sign and a one or two digit hour
             * -# sign followed by a two digit hour
             * -# optional UTC (only when followed by a sign), optional sign, two digit hour, then
             *    either :mm with optional :ss, or mm directly
             *
             * Minutes and seconds above 59 do not match.
             * \param text to match
             * \param f receives the captured fields if the text matches
             * \return true if the text matched
             */
            bool match_fixed_offset(const string& text, offset_fields& f);

            /** \brief canonical display name for the fields
             * UTC when zero, otherwise UTC+hh:mm, or UTC+hh:mm:ss when seconds are present.
             * The Z form keeps the name Z.
             */
            string canonical_name(const offset_fields& f);

            /** \brief parse text into canonical name and offset in seconds
             * \throw unrecognized_time_zone if the text does not match the grammar
             */
            fixed_offset_spec parse_fixed_offset(const string& text);
        }
    }
}
