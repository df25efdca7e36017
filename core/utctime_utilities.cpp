#include "core_pch.h"
#include "utctime_utilities.h"
#include <ostream>
#include <cstdio>

namespace fixzone {
    namespace core {
        using namespace std;

        std::ostream& operator<<(std::ostream& os, const zone_offset& o) {
            os << o.to_string();
            return os;
        }

        string zone_offset::to_string() const {
            auto t = total();
            char sgn = t < 0 ? '-' : '+';
            auto a = t < 0 ? -t : t;
            auto h = int(a / deltahours(1));
            auto m = int((a - h*deltahours(1)) / deltaminutes(1));
            auto s = int(a % deltaminutes(1));
            char r[32];
            if (s)
                snprintf(r, sizeof(r), "%c%02d:%02d:%02d", sgn, h, m, s);
            else
                snprintf(r, sizeof(r), "%c%02d:%02d", sgn, h, m);
            return string(r);
        }

    } // core
} // fixzone
