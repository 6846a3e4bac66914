/*------------------------------------------------------------------------------
* gnss_rinex unit test driver : fixed-column numeric decoder
*-----------------------------------------------------------------------------*/
#include "gtest/gtest.h"
#include <cmath>
#include <string>
#include "gnss_rinex/rinex_numeric.hpp"

using namespace gnss_rinex;

/* str2num() exponent markers */
TEST(TEST_RINEX_NUMERIC, test_exponent_markers)
{
    const char *tokens[] = {
        "  -0.123456789012D-04", "  -0.123456789012d-04",
        "  -0.123456789012E-04", "  -0.123456789012e-04"
    };
    double ref, v;
    int stat;

    stat = str2num(tokens[2], 0, 21, &ref);
        EXPECT_EQ(stat, NUM_OK);
        EXPECT_DOUBLE_EQ(ref, -0.123456789012E-04);

    for (int i = 0; i < 4; i++) {
        stat = str2num(tokens[i], 0, 21, &v);
            EXPECT_EQ(stat, NUM_OK) << tokens[i];
            EXPECT_EQ(v, ref) << tokens[i];
    }
    stat = str2num("1.5D3", 0, 5, &v);
        EXPECT_EQ(stat, NUM_OK);
        EXPECT_DOUBLE_EQ(v, 1500.0);
    stat = str2num("  2E+2", 0, 6, &v);
        EXPECT_EQ(stat, NUM_OK);
        EXPECT_DOUBLE_EQ(v, 200.0);
    stat = str2num(".5d-1", 0, 5, &v);
        EXPECT_EQ(stat, NUM_OK);
        EXPECT_DOUBLE_EQ(v, 0.05);
}

/* str2num() numbers without decimal point */
TEST(TEST_RINEX_NUMERIC, test_no_decimal_point)
{
    double v;

    EXPECT_EQ(str2num("   42", 0, 5, &v), NUM_OK);
        EXPECT_DOUBLE_EQ(v, 42.0);
    EXPECT_EQ(str2num("  7", 0, 3, &v, FIELD_INT), NUM_OK);
        EXPECT_DOUBLE_EQ(v, 7.0);
    EXPECT_EQ(str2num(" -3", 0, 3, &v, FIELD_INT), NUM_OK);
        EXPECT_DOUBLE_EQ(v, -3.0);
    EXPECT_EQ(str2num("12.", 0, 3, &v), NUM_OK);
        EXPECT_DOUBLE_EQ(v, 12.0);
}

/* str2num() blank fields are absent, not zero */
TEST(TEST_RINEX_NUMERIC, test_blank_is_absent)
{
    std::string line = "G01  20000000.000                ";
    double v = 0.0;

    EXPECT_EQ(str2num(line, 18, 14, &v), NUM_BLANK);
        EXPECT_TRUE(std::isnan(v));
    v = 0.0;
    EXPECT_EQ(str2num(line, 60, 14, &v), NUM_BLANK);    /* past end of line */
        EXPECT_TRUE(std::isnan(v));
    v = 0.0;
    EXPECT_EQ(str2num("", 0, 19, &v), NUM_BLANK);
        EXPECT_TRUE(std::isnan(v));

    /* field cut by the end of the line */
    EXPECT_EQ(str2num("    12", 2, 10, &v), NUM_OK);
        EXPECT_DOUBLE_EQ(v, 12.0);

    EXPECT_EQ(str2num("0.000", 0, 5, &v), NUM_OK);
        EXPECT_FALSE(std::isnan(v));
        EXPECT_EQ(v, 0.0);
}

/* str2num() malformed tokens are never coerced */
TEST(TEST_RINEX_NUMERIC, test_malformed_tokens)
{
    const char *tokens[] = {
        "1.2.3", "abc", "1 2", "inf", "nan", "0x10", "1e", "+", ".", "1.0D", "--1", "1.5-3",
        "12X", "D+02"
    };
    double v;

    for (size_t i = 0; i < sizeof(tokens)/sizeof(tokens[0]); i++) {
        v = 0.0;
        EXPECT_EQ(str2num(tokens[i], 0, 19, &v), NUM_BAD) << tokens[i];
            EXPECT_TRUE(std::isnan(v)) << tokens[i];
    }
    EXPECT_EQ(str2num("1.5", 0, 3, &v, FIELD_INT), NUM_BAD);
    EXPECT_EQ(str2num("1E2", 0, 3, &v, FIELD_INT), NUM_BAD);
}

/* decode_num() error position */
TEST(TEST_RINEX_NUMERIC, test_decode_num_error_position)
{
    std::string buff = "  12345 x.yz 99";
    RinexError err;
    double v;

    EXPECT_TRUE(decode_num(buff, 17, 2, 5, FIELD_INT, &v, &err));
        EXPECT_DOUBLE_EQ(v, 12345.0);

    EXPECT_FALSE(decode_num(buff, 17, 8, 4, FIELD_FLOAT, &v, &err));
        EXPECT_EQ(err.code, RNX_ERR_MALFORMED_NUMERIC);
        EXPECT_EQ(err.line, 17);
        EXPECT_EQ(err.col, 9);
        EXPECT_EQ(err.width, 4);
        EXPECT_NE(err.msg.find("x.yz"), std::string::npos);
}

/* decode_fields() reports the field name */
TEST(TEST_RINEX_NUMERIC, test_decode_fields)
{
    static const FieldDesc desc[] = {
        {0, 4, FIELD_INT,   "year"},
        {4, 4, FIELD_INT,   "month"},
        {8, 6, FIELD_FLOAT, "sec"}
    };
    RinexError err;
    double v[3];

    EXPECT_TRUE(decode_fields("2021   3", 5, desc, 3, v, &err));
        EXPECT_DOUBLE_EQ(v[0], 2021.0);
        EXPECT_DOUBLE_EQ(v[1], 3.0);
        EXPECT_TRUE(std::isnan(v[2]));

    EXPECT_FALSE(decode_fields("2021  x3  30.0", 5, desc, 3, v, &err));
        EXPECT_EQ(err.code, RNX_ERR_MALFORMED_NUMERIC);
        EXPECT_EQ(err.line, 5);
        EXPECT_EQ(err.col, 5);
        EXPECT_EQ(err.width, 4);
        EXPECT_NE(err.msg.find("(month)"), std::string::npos);
}

TEST(TEST_RINEX_NUMERIC, test_column_helpers)
{
    EXPECT_EQ(col_field("G1", 0, 3), "G1 ");
    EXPECT_EQ(col_field("ab", 5, 2), "  ");
    EXPECT_EQ(col_field("G01C05", 3, 3), "C05");
    EXPECT_TRUE(field_blank("G01   ", 3, 3));
    EXPECT_TRUE(field_blank("G01", 3, 10));
    EXPECT_FALSE(field_blank(" 1 21", 0, 3));
}

TEST(TEST_RINEX_NUMERIC, test_condition_names)
{
    EXPECT_STREQ(rnx_errmsg(RNX_ERR_MALFORMED_NUMERIC), "MalformedNumericField");
    EXPECT_STREQ(rnx_errmsg(RNX_ERR_TRUNCATED_RECORD), "TruncatedRecord");
    EXPECT_STREQ(rnx_warnmsg(RNX_WARN_DUPLICATE_RECORD), "DuplicateRecordWarning");
    EXPECT_STREQ(rnx_warnmsg(RNX_WARN_UNKNOWN_OBS_SET), "UnknownConstellationObservationSet");
}
