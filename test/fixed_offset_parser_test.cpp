#include "test_pch.h"
#include "core/fixed_offset_parser.h"

using namespace std;
using namespace fixzone;
using namespace fixzone::core;
using namespace fixzone::core::time_zone;

namespace {
    offset_fields must_match(const string& s) {
        offset_fields f;
        f.hour=-1;// make sure match overwrites
        bool ok=match_fixed_offset(s,f);
        CHECK_MESSAGE(ok,"expected match for: "<<s);
        return f;
    }
}

TEST_SUITE("fixed_offset_parser") {

TEST_CASE("test_zulu") {
    auto f=must_match("Z");
    TS_ASSERT(f.form==offset_form::zulu);
    TS_ASSERT(!f.has_hour);
    TS_ASSERT_EQUALS(f.total(),utctimespan(0));
    auto s=parse_fixed_offset("Z");
    TS_ASSERT_EQUALS(s.name,string("Z"));
    TS_ASSERT_EQUALS(s.offset,utctimespan(0));
}

TEST_CASE("test_utc_prefix_form") {
    auto f=must_match("UTC");
    TS_ASSERT(f.form==offset_form::utc_prefix);
    TS_ASSERT(!f.has_hour);
    TS_ASSERT_EQUALS(f.sign,'+');
    TS_ASSERT_EQUALS(canonical_name(f),string("UTC"));

    f=must_match("UTC+6");
    TS_ASSERT(f.form==offset_form::utc_prefix);
    TS_ASSERT(f.has_hour && !f.has_minute && !f.has_second);
    TS_ASSERT_EQUALS(f.hour,6);
    TS_ASSERT_EQUALS(f.total(),deltahours(6));

    f=must_match("UTC-12");
    TS_ASSERT(f.form==offset_form::utc_prefix);
    TS_ASSERT_EQUALS(f.sign,'-');
    TS_ASSERT_EQUALS(f.coefficient(),-1);
    TS_ASSERT_EQUALS(f.total(),deltahours(-12));

    auto s=parse_fixed_offset("UTC+6");
    TS_ASSERT_EQUALS(s.name,string("UTC+06:00"));
    TS_ASSERT_EQUALS(s.offset,deltahours(6));
    s=parse_fixed_offset("UTC-12");
    TS_ASSERT_EQUALS(s.name,string("UTC-12:00"));
    TS_ASSERT_EQUALS(s.offset,deltahours(-12));
}

TEST_CASE("test_signed_hour_form") {
    auto f=must_match("+05");
    TS_ASSERT(f.form==offset_form::signed_hour);
    TS_ASSERT_EQUALS(f.hour,5);
    TS_ASSERT(!f.has_minute);
    auto s=parse_fixed_offset("-11");
    TS_ASSERT_EQUALS(s.name,string("UTC-11:00"));
    TS_ASSERT_EQUALS(s.offset,deltahours(-11));
}

TEST_CASE("test_hour_minute_forms") {
    auto f=must_match("-1330");
    TS_ASSERT(f.form==offset_form::concatenated);
    TS_ASSERT(f.has_minute && !f.has_second);
    TS_ASSERT_EQUALS(f.hour,13);
    TS_ASSERT_EQUALS(f.minute,30);

    f=must_match("15:45:21");
    TS_ASSERT(f.form==offset_form::colon_separated);
    TS_ASSERT(f.has_hour && f.has_minute && f.has_second);
    TS_ASSERT_EQUALS(f.sign,'+');
    TS_ASSERT_EQUALS(f.second,21);

    f=must_match("UTC+05:30");
    TS_ASSERT(f.form==offset_form::colon_separated);
    TS_ASSERT_EQUALS(f.total(),deltahours(5)+deltaminutes(30));

    f=must_match("UTC-0930");
    TS_ASSERT(f.form==offset_form::concatenated);
    TS_ASSERT_EQUALS(f.total(),-(deltahours(9)+deltaminutes(30)));

    auto s=parse_fixed_offset("-1330");
    TS_ASSERT_EQUALS(s.name,string("UTC-13:30"));
    TS_ASSERT_EQUALS(s.offset,-(deltahours(13)+deltaminutes(30)));
    s=parse_fixed_offset("15:45:21");
    TS_ASSERT_EQUALS(s.name,string("UTC+15:45:21"));
    TS_ASSERT_EQUALS(s.offset,deltahours(15)+deltaminutes(45)+deltaseconds(21));
    s=parse_fixed_offset("1545");
    TS_ASSERT_EQUALS(s.name,string("UTC+15:45"));
    s=parse_fixed_offset("-05:00:07");
    TS_ASSERT_EQUALS(s.name,string("UTC-05:00:07"));
    TS_ASSERT_EQUALS(s.offset,utctimespan(-18007));
}

TEST_CASE("test_equivalent_texts_normalize") {
    const char* texts[]={"+0530","+05:30","UTC+05:30","UTC+0530","0530","05:30","05:30:00"};
    for(auto t:texts) {
        auto s=parse_fixed_offset(t);
        TS_ASSERT_EQUALS(s.name,string("UTC+05:30"));
        TS_ASSERT_EQUALS(s.offset,deltahours(5)+deltaminutes(30));
    }
}

TEST_CASE("test_zero_forms") {
    const char* texts[]={"UTC","UTC+0","UTC-0","UTC+00","+00","-00","00:00","-0000","UTC-00:00:00"};
    for(auto t:texts) {
        auto s=parse_fixed_offset(t);
        TS_ASSERT_EQUALS(s.name,string("UTC"));
        TS_ASSERT_EQUALS(s.offset,utctimespan(0));
    }
}

TEST_CASE("test_canonical_names_reparse") {
    const char* names[]={"UTC","UTC+06:00","UTC-13:30","UTC+15:45:21"};
    for(auto n:names) {
        auto s1=parse_fixed_offset(n);
        TS_ASSERT_EQUALS(s1.name,string(n));
        auto s2=parse_fixed_offset(s1.name);
        TS_ASSERT_EQUALS(s2.name,s1.name);
        TS_ASSERT_EQUALS(s2.offset,s1.offset);
    }
}

TEST_CASE("test_rejections") {
    const char* bad[]={
        "",         // empty
        "z",        // case sensitive
        "utc",
        "GMT",
        "UTC+",     // sign without hour
        "UTC+123",  // hour too long, no minute
        "UTC05:30", // UTC only allowed before a sign
        "UTC0530",
        "UTC+5:30", // one digit hour outside the UTC+h form
        "+5",       // bare sign needs two digits
        "05",       // unsigned hour needs a minute
        "5",
        "+05:3",    // minute needs two digits
        "+05:",
        "+0530:21", // no seconds in the concatenated form
        "+053021",
        "::21",     // second without minute
        "+05::21",
        "05:30:2",
        "05:30:",
        "+aa:bb",   // non digit groups
        "+05:3x",
        "+05:60",   // minute and second out of range
        "05:30:60",
        "+05:99",
        " +05:30",  // anchored
        "+05:30 ",
        "ZZ",
        "Z+01",
        "++05",
        "+-05"
    };
    for(auto t:bad) {
        offset_fields f;
        CHECK_MESSAGE(!match_fixed_offset(t,f),"expected no match for: '"<<t<<"'");
        TS_ASSERT_THROWS(parse_fixed_offset(t),unrecognized_time_zone);
    }
}

TEST_CASE("test_unrecognized_time_zone_carries_text") {
    try {
        parse_fixed_offset("+05:3x");
        FAIL("expected throw");
    } catch(const unrecognized_time_zone& e) {
        TS_ASSERT_EQUALS(e.text(),string("+05:3x"));
        TS_ASSERT_EQUALS(string(e.what()),string("Unrecognized time zone: +05:3x"));
    }
    TS_ASSERT_THROWS(parse_fixed_offset("nope"),std::runtime_error);
}

TEST_CASE("test_max_fields") {
    auto s=parse_fixed_offset("-99:59:59");
    TS_ASSERT_EQUALS(s.name,string("UTC-99:59:59"));
    TS_ASSERT_EQUALS(s.offset,-(deltahours(99)+deltaminutes(59)+deltaseconds(59)));
    s=parse_fixed_offset("UTC+99");
    TS_ASSERT_EQUALS(s.offset,deltahours(99));
}

}
