#include "core_pch.h"
#include "fixed_offset_parser.h"
#include <cstdio>
#include <cstring>

namespace fixzone {
    namespace core {
        namespace time_zone {
            using namespace std;

            namespace {
                /** minimal forward only scanner over the text, each grammar branch
                 * starts with a fresh scanner, so a failed branch leaves no trace
                 */
                struct scanner {
                    const string& s;
                    size_t pos;
                    explicit scanner(const string& s):s(s),pos(0) {}

                    bool at_end() const {return pos==s.size();}
                    bool is_digit(size_t i) const {return i<s.size() && s[i]>='0' && s[i]<='9';}
                    bool is_sign(size_t i) const {return i<s.size() && (s[i]=='+' || s[i]=='-');}

                    bool literal(const char* l) {
                        size_t n=strlen(l);
                        if(s.compare(pos,n,l)!=0) return false;
                        pos+=n;
                        return true;
                    }
                    bool sign(char& c) {
                        if(!is_sign(pos)) return false;
                        c=s[pos++];
                        return true;
                    }
                    ///< consume exactly n digits into v
                    bool digits(size_t n,int& v) {
                        for(size_t i=0;i<n;++i)
                            if(!is_digit(pos+i)) return false;
                        v=0;
                        for(size_t i=0;i<n;++i)
                            v= v*10 + (s[pos++]-'0');
                        return true;
                    }
                    ///< number of consecutive digits from current position
                    size_t digit_run() const {
                        size_t n=0;
                        while(is_digit(pos+n)) ++n;
                        return n;
                    }
                };

                // UTC[(+|-)h{1,2}]
                bool match_utc_prefix(const string& text, offset_fields& f) {
                    scanner sc(text);
                    if(!sc.literal("UTC")) return false;
                    f=offset_fields();
                    f.form=offset_form::utc_prefix;
                    if(sc.at_end()) return true;
                    if(!sc.sign(f.sign)) return false;
                    auto n=sc.digit_run();
                    if(n<1 || n>2 || !sc.digits(n,f.hour)) return false;
                    f.has_hour=true;
                    return sc.at_end();
                }

                // (+|-)hh
                bool match_signed_hour(const string& text, offset_fields& f) {
                    scanner sc(text);
                    f=offset_fields();
                    f.form=offset_form::signed_hour;
                    if(!sc.sign(f.sign)) return false;
                    if(!sc.digits(2,f.hour)) return false;
                    f.has_hour=true;
                    return sc.at_end();
                }

                // [UTC(+|-)][+|-]hh(:mm[:ss]|mm)
                bool match_hour_minute(const string& text, offset_fields& f) {
                    scanner sc(text);
                    f=offset_fields();
                    if(text.compare(0,3,"UTC")==0) {
                        if(!sc.is_sign(3)) return false;
                        sc.pos+=3;
                    }
                    sc.sign(f.sign);// optional, defaults to +
                    if(!sc.digits(2,f.hour)) return false;
                    f.has_hour=true;
                    if(sc.literal(":")) {
                        f.form=offset_form::colon_separated;
                        if(!sc.digits(2,f.minute)) return false;
                        f.has_minute=true;
                        if(sc.literal(":")) {
                            if(!sc.digits(2,f.second)) return false;
                            f.has_second=true;
                        }
                    } else {
                        f.form=offset_form::concatenated;
                        if(!sc.digits(2,f.minute)) return false;
                        f.has_minute=true;
                    }
                    return sc.at_end();
                }
            }

            bool match_fixed_offset(const string& text, offset_fields& f) {
                if(text=="Z") {
                    f=offset_fields();
                    return true;
                }
                offset_fields r;
                bool matched= match_utc_prefix(text,r)
                            || match_signed_hour(text,r)
                            || match_hour_minute(text,r);
                if(!matched || r.minute>59 || r.second>59)
                    return false;
                f=r;
                return true;
            }

            string canonical_name(const offset_fields& f) {
                if(f.form==offset_form::zulu) return string("Z");
                if(f.is_zero()) return string("UTC");
                char s[32];
                char sig= f.coefficient()<0?'-':'+';
                if(f.second==0)
                    snprintf(s,sizeof(s),"UTC%c%02d:%02d",sig,f.hour,f.minute);
                else
                    snprintf(s,sizeof(s),"UTC%c%02d:%02d:%02d",sig,f.hour,f.minute,f.second);
                return string(s);
            }

            fixed_offset_spec parse_fixed_offset(const string& text) {
                offset_fields f;
                if(!match_fixed_offset(text,f))
                    throw unrecognized_time_zone(text);
                fixed_offset_spec r;
                r.name=canonical_name(f);
                r.offset=f.total();
                return r;
            }
        }
    } // core
} // fixzone
