/*------------------------------------------------------------------------------
* gnss_rinex unit test driver : ver.2 observation grammar
*-----------------------------------------------------------------------------*/
#include "gtest/gtest.h"
#include <cmath>
#include "rinex_test_util.hpp"

using namespace gnss_rinex;
using namespace rinex_test;

static std::string obs2_header(char sys, const std::vector<std::string> &types)
{
    return version_line(2.11, 'O', sys) + obs_types2(types) + end_of_header();
}

static std::string obs2_body()
{
    return epoch2(21, 3, 15, 0, 0, 0.0, 0, {"G01", "G02"}) +
           obs(20000000.0) + obs(105000000.0, 0, 7) + obs(45.0) + "\n" +
           obs(21000000.5) + blank_obs() + obs(40.25) + "\n" +
           epoch2(21, 3, 15, 0, 0, 30.0, 0, {"G02", "G03"}) +
           obs(21000100.0) + obs(110000000.0, 1, 6) + obs(41.0) + "\n" +
           obs(22000000.0) + obs(115000000.0) + obs(38.5) + "\n";
}

/* readrnx() ver.2 observation epochs */
TEST(TEST_RINEX_OBS2, test_epochs)
{
    std::string text = obs2_header('G', {"C1", "L1", "S1"}) + obs2_body();
    gtime_t t0 = ep2t(2021, 3, 15, 0, 0, 0), t1 = ep2t(2021, 3, 15, 0, 0, 30);
    RinexDataset data;
    RinexError err;

    EXPECT_TRUE(decode(text, data, &err));
        EXPECT_EQ(err.code, RNX_OK);
        EXPECT_EQ(data.type, RINEX_TYPE_OBS);
        ASSERT_EQ(data.time.size(), 2u);
        EXPECT_EQ(data.time[0].time, t0.time);
        EXPECT_EQ(data.time[1].time, t1.time);
        ASSERT_EQ(data.sat.size(), 3u);
        EXPECT_EQ(data.sat[0], "G01");
        EXPECT_EQ(data.sat[1], "G02");
        EXPECT_EQ(data.sat[2], "G03");
        ASSERT_EQ(data.fields.size(), 3u);
        EXPECT_EQ(data.fields[0], "C1");
        EXPECT_EQ(data.data["C1"].rows(), 2);
        EXPECT_EQ(data.data["C1"].cols(), 3);

        EXPECT_DOUBLE_EQ(value(data, "C1", t0, "G01"), 20000000.0);
        EXPECT_DOUBLE_EQ(value(data, "L1", t0, "G01"), 105000000.0);
        EXPECT_DOUBLE_EQ(value(data, "C1", t0, "G02"), 21000000.5);
        EXPECT_TRUE(std::isnan(value(data, "L1", t0, "G02")));     /* blank */
        EXPECT_DOUBLE_EQ(value(data, "S1", t0, "G02"), 40.25);
        EXPECT_TRUE(std::isnan(value(data, "C1", t1, "G01")));     /* not observed */
        EXPECT_DOUBLE_EQ(value(data, "S1", t1, "G03"), 38.5);

        EXPECT_EQ(data.flags[0], EPOCH_OK);
        EXPECT_TRUE(std::isnan(data.clk_off[0]));
        EXPECT_DOUBLE_EQ(data.interval, 30.0);
        EXPECT_TRUE(data.events.empty());
        EXPECT_TRUE(data.warnings.empty());
        EXPECT_TRUE(data.data.find("L1lli") == data.data.end());
}

/* readrnx() loss of lock and signal strength variables */
TEST(TEST_RINEX_OBS2, test_indicators)
{
    std::string text = obs2_header('G', {"C1", "L1", "S1"}) + obs2_body();
    gtime_t t0 = ep2t(2021, 3, 15, 0, 0, 0), t1 = ep2t(2021, 3, 15, 0, 0, 30);
    RinexDataset data;
    RinexError err;
    RnxOpt opt;

    init_rnxopt(opt);
    opt.indicators = true;

    EXPECT_TRUE(decode(text, data, &err, &opt));
        EXPECT_EQ(data.fields.size(), 7u);
        EXPECT_TRUE(data.data.find("C1lli") == data.data.end());
        EXPECT_TRUE(data.data.find("S1lli") == data.data.end());
        EXPECT_TRUE(data.data.find("C1ssi") != data.data.end());
        EXPECT_DOUBLE_EQ(value(data, "L1lli", t0, "G01"), 0.0);
        EXPECT_DOUBLE_EQ(value(data, "L1ssi", t0, "G01"), 7.0);
        EXPECT_TRUE(std::isnan(value(data, "C1lli", t0, "G01")));
        EXPECT_DOUBLE_EQ(value(data, "L1lli", t1, "G02"), 1.0);
        EXPECT_DOUBLE_EQ(value(data, "L1ssi", t1, "G02"), 6.0);
        EXPECT_TRUE(std::isnan(value(data, "L1ssi", t1, "G03")));
}

/* readrnx() satellite list continuation and obs continuation lines */
TEST(TEST_RINEX_OBS2, test_continuation_lines)
{
    const char *types[] = {"C1", "L1", "L2", "P2", "S1", "S2", "D1"};
    std::vector<std::string> sats;
    std::string text;
    int prn;

    for (prn = 1; prn <= 14; prn++) sats.push_back(fmt("G%02d", prn));

    text = obs2_header('G', std::vector<std::string>(types, types + 7)) +
           epoch2(21, 3, 15, 12, 30, 15.0, 0, sats, 0.000123456);
    for (prn = 1; prn <= 14; prn++) {
        text += obs(2E7 + prn) + obs(1E8 + prn) + obs(8E7 + prn) + obs(2E7 + prn + 0.5) + obs(40.0 + prn) + "\n";
        text += obs(30.0 + prn) + obs(-100.0 - prn) + "\n";
    }
    gtime_t t = ep2t(2021, 3, 15, 12, 30, 15);
    RinexDataset data;
    RinexError err;

    EXPECT_TRUE(decode(text, data, &err));
        ASSERT_EQ(data.time.size(), 1u);
        ASSERT_EQ(data.sat.size(), 14u);
        EXPECT_EQ(data.sat[12], "G13");
        EXPECT_EQ(data.sat[13], "G14");
        EXPECT_DOUBLE_EQ(value(data, "C1", t, "G14"), 2E7 + 14);
        EXPECT_DOUBLE_EQ(value(data, "P2", t, "G01"), 2E7 + 1.5);
        EXPECT_DOUBLE_EQ(value(data, "S2", t, "G07"), 37.0);
        EXPECT_DOUBLE_EQ(value(data, "D1", t, "G13"), -113.0);
        EXPECT_NEAR(data.clk_off[0], 0.000123456, 1E-12);
        EXPECT_TRUE(std::isnan(data.interval));
        EXPECT_TRUE(data.warnings.empty());
}

/* expand_year() and two-digit epoch years */
TEST(TEST_RINEX_OBS2, test_two_digit_year)
{
    RinexDataset data;
    RinexError err;

    EXPECT_EQ(expand_year(79), 2079);
    EXPECT_EQ(expand_year(80), 1980);
    EXPECT_EQ(expand_year(0), 2000);
    EXPECT_EQ(expand_year(99), 1999);
    EXPECT_EQ(expand_year(2021), 2021);

    EXPECT_TRUE(decode(obs2_header('G', {"C1"}) + epoch2(80, 1, 6, 0, 0, 0.0, 0, {"G01"}) +
                       obs(20000000.0) + "\n", data, &err));
        ASSERT_EQ(data.time.size(), 1u);
        EXPECT_EQ(data.time[0].time, ep2t(1980, 1, 6, 0, 0, 0).time);

    EXPECT_TRUE(decode(obs2_header('G', {"C1"}) + epoch2(79, 1, 6, 0, 0, 0.0, 0, {"G01"}) +
                       obs(20000000.0) + "\n", data, &err));
        ASSERT_EQ(data.time.size(), 1u);
        EXPECT_EQ(data.time[0].time, ep2t(2079, 1, 6, 0, 0, 0).time);
}

/* readrnx() special records of epoch flags 2-5 are skipped */
TEST(TEST_RINEX_OBS2, test_event_records)
{
    std::string text =
        obs2_header('G', {"C1"}) +
        epoch2(21, 3, 15, 0, 0, 0.0, 0, {"G01"}) + obs(20000000.0) + "\n" +
        event2(EPOCH_HEADER, 2) +
        hline("ANTENNA CHANGED", "COMMENT") +
        hline("ALGO2", "MARKER NAME") +
        epoch2(21, 3, 15, 0, 0, 30.0, 0, {"G01"}) + obs(20000100.0) + "\n";
    RinexDataset data;
    RinexError err;

    EXPECT_TRUE(decode(text, data, &err));
        EXPECT_EQ(data.time.size(), 2u);
        ASSERT_EQ(data.events.size(), 1u);
        EXPECT_EQ(data.events[0].flag, EPOCH_HEADER);
        EXPECT_EQ(data.events[0].nrec, 2);
        EXPECT_EQ(data.events[0].line, 6);
        EXPECT_TRUE(time_zero(data.events[0].time));
        EXPECT_TRUE(data.warnings.empty());
        EXPECT_DOUBLE_EQ(value(data, "C1", ep2t(2021, 3, 15, 0, 0, 30), "G01"), 20000100.0);
}

/* readrnx() cycle slip epochs are consumed but not assembled */
TEST(TEST_RINEX_OBS2, test_cycle_slip_epoch)
{
    std::string text =
        obs2_header('G', {"C1", "L1"}) +
        epoch2(21, 3, 15, 0, 0, 0.0, 0, {"G01"}) + obs(20000000.0) + obs(105000000.0) + "\n" +
        epoch2(21, 3, 15, 0, 0, 15.0, EPOCH_SLIP, {"G01"}) + blank_obs() + obs(3.0) + "\n" +
        epoch2(21, 3, 15, 0, 0, 30.0, 0, {"G01"}) + obs(20000100.0) + obs(105000500.0) + "\n";
    RinexDataset data;
    RinexError err;

    EXPECT_TRUE(decode(text, data, &err));
        EXPECT_EQ(data.time.size(), 2u);
        EXPECT_EQ(dataset_time_index(data, ep2t(2021, 3, 15, 0, 0, 15)), -1);
        ASSERT_EQ(data.events.size(), 1u);
        EXPECT_EQ(data.events[0].flag, EPOCH_SLIP);
        EXPECT_EQ(data.events[0].time.time, ep2t(2021, 3, 15, 0, 0, 15).time);
}

/* readrnx() power failure epochs are kept with their flag */
TEST(TEST_RINEX_OBS2, test_power_failure_epoch)
{
    std::string text = obs2_header('G', {"C1"}) +
                       epoch2(21, 3, 15, 0, 0, 0.0, EPOCH_PWRFAIL, {"G01"}) + obs(20000000.0) + "\n";
    RinexDataset data;
    RinexError err;

    EXPECT_TRUE(decode(text, data, &err));
        ASSERT_EQ(data.flags.size(), 1u);
        EXPECT_EQ(data.flags[0], EPOCH_PWRFAIL);
        EXPECT_DOUBLE_EQ(data.data["C1"](0, 0), 20000000.0);
}

/* readrnx() input ending inside an epoch */
TEST(TEST_RINEX_OBS2, test_truncated_epoch)
{
    RinexDataset data;
    RinexError err;

    EXPECT_FALSE(decode(obs2_header('G', {"C1", "L1"}) +
                        epoch2(21, 3, 15, 0, 0, 0.0, 0, {"G01", "G02"}) +
                        obs(20000000.0) + obs(105000000.0) + "\n", data, &err));
        EXPECT_EQ(err.code, RNX_ERR_TRUNCATED_RECORD);
        EXPECT_EQ(err.line, 6);

    /* satellite list continuation missing */
    std::vector<std::string> sats;
    for (int prn = 1; prn <= 13; prn++) sats.push_back(fmt("G%02d", prn));
    std::string epoch = epoch2(21, 3, 15, 0, 0, 0.0, 0, sats);
    epoch = epoch.substr(0, epoch.find('\n') + 1);

    EXPECT_FALSE(decode(obs2_header('G', {"C1"}) + epoch, data, &err));
        EXPECT_EQ(err.code, RNX_ERR_TRUNCATED_RECORD);

    /* special records missing */
    EXPECT_FALSE(decode(obs2_header('G', {"C1"}) + event2(EPOCH_NEWSITE, 3) +
                        hline("NEW SITE", "COMMENT"), data, &err));
        EXPECT_EQ(err.code, RNX_ERR_TRUNCATED_RECORD);
}

/* readrnx() malformed observation value */
TEST(TEST_RINEX_OBS2, test_malformed_observation)
{
    RinexDataset data;
    RinexError err;

    EXPECT_FALSE(decode(obs2_header('G', {"C1", "L1"}) +
                        epoch2(21, 3, 15, 0, 0, 0.0, 0, {"G01"}) +
                        "  2000000x.000  " + obs(105000000.0) + "\n", data, &err));
        EXPECT_EQ(err.code, RNX_ERR_MALFORMED_NUMERIC);
        EXPECT_EQ(err.line, 5);
        EXPECT_EQ(err.col, 1);
        EXPECT_EQ(err.width, 14);
}

/* readrnx() satellites of other systems in a single system file */
TEST(TEST_RINEX_OBS2, test_undeclared_system)
{
    RinexDataset data;
    RinexError err;

    EXPECT_TRUE(decode(obs2_header('G', {"C1"}) +
                       epoch2(21, 3, 15, 0, 0, 0.0, 0, {"G01", "R05", "G03"}) +
                       obs(20000000.0) + "\n" + obs(21000000.0) + "\n" + obs(22000000.0) + "\n",
                       data, &err));
        ASSERT_EQ(data.sat.size(), 2u);
        EXPECT_EQ(data.sat[0], "G01");
        EXPECT_EQ(data.sat[1], "G03");
        EXPECT_DOUBLE_EQ(data.data["C1"](0, 1), 22000000.0);
        EXPECT_EQ(count_warnings(data, RNX_WARN_UNKNOWN_SYSTEM), 1);

    EXPECT_TRUE(decode(obs2_header('M', {"C1"}) +
                       epoch2(21, 3, 15, 0, 0, 0.0, 0, {"G01", "R05", "X07"}) +
                       obs(20000000.0) + "\n" + obs(21000000.0) + "\n" + obs(22000000.0) + "\n",
                       data, &err));
        ASSERT_EQ(data.sat.size(), 2u);
        EXPECT_EQ(data.sat[1], "R05");
        EXPECT_EQ(count_warnings(data, RNX_WARN_UNKNOWN_SYSTEM), 1);
}

/* readrnx() blank system letter and blank prn digit */
TEST(TEST_RINEX_OBS2, test_satellite_id_forms)
{
    RinexDataset data;
    RinexError err;

    EXPECT_TRUE(decode(obs2_header('G', {"C1"}) +
                       epoch2(21, 3, 15, 0, 0, 0.0, 0, {" 07", "G 8"}) +
                       obs(20000000.0) + "\n" + obs(21000000.0) + "\n", data, &err));
        ASSERT_EQ(data.sat.size(), 2u);
        EXPECT_EQ(data.sat[0], "G07");
        EXPECT_EQ(data.sat[1], "G08");

    EXPECT_TRUE(decode(obs2_header('R', {"C1"}) +
                       epoch2(21, 3, 15, 0, 0, 0.0, 0, {" 12"}) + obs(20000000.0) + "\n", data, &err));
        ASSERT_EQ(data.sat.size(), 1u);
        EXPECT_EQ(data.sat[0], "R12");
}

/* readrnx() invalid epoch line is skipped with a warning */
TEST(TEST_RINEX_OBS2, test_invalid_epoch_line)
{
    RinexDataset data;
    RinexError err;

    EXPECT_TRUE(decode(obs2_header('G', {"C1"}) +
                       epoch2(21, 13, 15, 0, 0, 0.0, 0, {}) +
                       epoch2(21, 3, 15, 0, 0, 30.0, 0, {"G01"}) + obs(20000000.0) + "\n",
                       data, &err));
        EXPECT_EQ(data.time.size(), 1u);
        EXPECT_EQ(count_warnings(data, RNX_WARN_BAD_EPOCH), 1);

    /* invalid month, its satellite data lines are skipped with it */
    EXPECT_TRUE(decode(obs2_header('G', {"C1"}) +
                       epoch2(21, 13, 15, 0, 0, 0.0, 0, {"G01", "G02"}) +
                       obs(20000000.0) + "\n" + obs(21000000.0) + "\n" +
                       epoch2(21, 3, 15, 0, 0, 30.0, 0, {"G01"}) + obs(20000100.0) + "\n",
                       data, &err));
        ASSERT_EQ(data.time.size(), 1u);
        EXPECT_EQ(count_warnings(data, RNX_WARN_BAD_EPOCH), 1);
        EXPECT_DOUBLE_EQ(value(data, "C1", ep2t(2021, 3, 15, 0, 0, 30), "G01"), 20000100.0);

    /* unknown epoch flag 7 */
    EXPECT_TRUE(decode(obs2_header('G', {"C1"}) +
                       epoch2(21, 3, 15, 0, 0, 0.0, 7, {"G01"}) + obs(20000000.0) + "\n" +
                       epoch2(21, 3, 15, 0, 0, 30.0, 0, {"G01"}) + obs(20000100.0) + "\n",
                       data, &err));
        EXPECT_EQ(data.time.size(), 1u);
        EXPECT_EQ(count_warnings(data, RNX_WARN_BAD_EPOCH), 1);
}

/* readrnx() invalid epoch with satellite list and obs continuation lines */
TEST(TEST_RINEX_OBS2, test_invalid_epoch_continuation)
{
    const char *types[] = {"C1", "L1", "D1", "S1", "P2", "L2", "S2"};
    std::vector<std::string> sats;
    std::string text = obs2_header('G', std::vector<std::string>(types, types + 7));
    RinexDataset data;
    RinexError err;

    for (int i = 1; i <= 14; i++) sats.push_back(fmt("G%02d", i));
    text += epoch2(21, 3, 32, 0, 0, 0.0, 0, sats);
    for (int i = 0; i < 14; i++) {
        text += obs(2E7 + i) + obs(1E8) + obs(-100.0) + obs(45.0) + obs(2E7 + i) + "\n" +
                obs(8E7) + obs(40.0) + "\n";
    }
    text += epoch2(21, 3, 15, 0, 0, 30.0, 0, {"G03"}) +
            obs(20000300.0) + obs(1E8) + obs(-100.0) + obs(45.0) + obs(20000300.0) + "\n" +
            obs(8E7) + obs(40.0) + "\n";

    EXPECT_TRUE(decode(text, data, &err));
        ASSERT_EQ(data.time.size(), 1u);
        ASSERT_EQ(data.sat.size(), 1u);
        EXPECT_EQ(count_warnings(data, RNX_WARN_BAD_EPOCH), 1);
        EXPECT_DOUBLE_EQ(value(data, "C1", ep2t(2021, 3, 15, 0, 0, 30), "G03"), 20000300.0);
        EXPECT_DOUBLE_EQ(value(data, "S2", ep2t(2021, 3, 15, 0, 0, 30), "G03"), 40.0);

    /* input ends inside the skipped epoch */
    EXPECT_FALSE(decode(obs2_header('G', {"C1"}) +
                        epoch2(21, 13, 15, 0, 0, 0.0, 0, {"G01", "G02"}) + obs(20000000.0) + "\n",
                        data, &err));
        EXPECT_EQ(err.code, RNX_ERR_TRUNCATED_RECORD);
}

/* readrnx() N epochs give N times and the union of satellites */
TEST(TEST_RINEX_OBS2, test_axes_union)
{
    const char *lists[4][3] = {
        {"G01", "G02", "G05"}, {"G02", "G07", "G01"}, {"G09", "G05", "G02"}, {"G01", "G10", "G11"}
    };
    std::string text = obs2_header('G', {"C1"});

    for (int i = 0; i < 4; i++) {
        text += epoch2(21, 3, 15, 1, i, 0.0, 0, std::vector<std::string>(lists[i], lists[i] + 3));
        for (int j = 0; j < 3; j++) text += obs(2E7 + 100*i + j) + "\n";
    }
    RinexDataset data;
    RinexError err;

    EXPECT_TRUE(decode(text, data, &err));
        EXPECT_EQ(data.time.size(), 4u);
        ASSERT_EQ(data.sat.size(), 7u);
        const char *order[] = {"G01", "G02", "G05", "G07", "G09", "G10", "G11"};
        for (int i = 0; i < 7; i++) EXPECT_EQ(data.sat[i], order[i]);
        EXPECT_DOUBLE_EQ(value(data, "C1", ep2t(2021, 3, 15, 1, 3, 0), "G11"), 2E7 + 302);
        EXPECT_DOUBLE_EQ(data.interval, 60.0);
}
