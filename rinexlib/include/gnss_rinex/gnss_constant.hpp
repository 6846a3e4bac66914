/**
* This file is part of gnss_rinex.
*
* Copyright (C) 2021 Aerial Robotics Group, Hong Kong University of Science and Technology
* Author: CAO Shaozu (shaozu.cao@gmail.com)
*
* gnss_rinex is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* gnss_rinex is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with gnss_rinex. If not, see <http://www.gnu.org/licenses/>.
*
* As most of the GNSS-related constants are adapted from RTKLIB,
* the license for those part of code is claimed as follows:
*
* The RTKLIB software package is distributed under the following BSD 2-clause
* license (http://opensource.org/licenses/BSD-2-Clause) and additional two
* exclusive clauses. Users are permitted to develop, produce or sell their own
* non-commercial or commercial products utilizing, linking or including RTKLIB as
* long as they comply with the license.
*
*         Copyright (c) 2007-2020, T. Takasu, All rights reserved.
*/

#ifndef GNSS_CONSTANT_HPP_
#define GNSS_CONSTANT_HPP_

#include <vector>
#include <map>
#include <string>
#include <limits>
#include <ctime>
#include <eigen3/Eigen/Dense>

namespace gnss_rinex
{
    #define SYS_NONE    0x00                /* navigation system: none */
    #define SYS_GPS     0x01                /* navigation system: GPS */
    #define SYS_SBS     0x02                /* navigation system: SBAS */
    #define SYS_GLO     0x04                /* navigation system: GLONASS */
    #define SYS_GAL     0x08                /* navigation system: Galileo */
    #define SYS_QZS     0x10                /* navigation system: QZSS */
    #define SYS_BDS     0x20                /* navigation system: BeiDou */
    #define SYS_IRN     0x40                /* navigation system: IRNSS */

    #define NSATLINE_OBS2   12              /* satellite ids per ver.2 epoch line */
    #define NOBSLINE_OBS2   5               /* observations per ver.2 data line */
    #define NTYPELINE_OBS2  9               /* obs types per ver.2 header line */
    #define NTYPELINE_OBS3  13              /* obs types per ver.3 header line */
    #define OBS_FIELD_LEN   16              /* F14.3,I1,I1 */
    #define NAV_FIELD_LEN   19              /* D19.12 */
    #define NAV_NFIELD_LINE 4               /* orbit values per nav line */
    #define YEAR_PIVOT      80              /* two-digit year pivot */

    #define EPOCH_OK        0               /* epoch flag: ok */
    #define EPOCH_PWRFAIL   1               /* epoch flag: power failure since previous epoch */
    #define EPOCH_MOVING    2               /* epoch flag: start moving antenna */
    #define EPOCH_NEWSITE   3               /* epoch flag: new site occupation */
    #define EPOCH_HEADER    4               /* epoch flag: header information follows */
    #define EPOCH_EXTEVENT  5               /* epoch flag: external event */
    #define EPOCH_SLIP      6               /* epoch flag: cycle slip records follow */

    /* RINEX file type enumeration */
    enum RinexFileType {
        RINEX_TYPE_OBS = 0,        /* observation data */
        RINEX_TYPE_NAV = 1,        /* navigation data */
        RINEX_TYPE_UNKNOWN = -1    /* unknown type */
    };

    /* fatal decode errors, the whole file is abandoned */
    enum RinexErrorCode {
        RNX_OK = 0,
        RNX_ERR_MALFORMED_NUMERIC,      /* non-blank field that is not a number */
        RNX_ERR_MISSING_VERSION,        /* no RINEX VERSION / TYPE before END OF HEADER */
        RNX_ERR_UNSUPPORTED_VERSION,    /* version outside 2.x/3.x */
        RNX_ERR_UNSUPPORTED_TYPE,       /* file type other than OBS/NAV */
        RNX_ERR_TRUNCATED_RECORD,       /* fixed-size record not fully present */
        RNX_ERR_FILE_OPEN               /* input could not be opened */
    };

    /* recoverable conditions, accumulated on the dataset */
    enum RinexWarningCode {
        RNX_WARN_UNKNOWN_OBS_SET = 1,   /* constellation has no obs type list */
        RNX_WARN_DUPLICATE_RECORD,      /* (time,satellite) seen twice, later kept */
        RNX_WARN_UNKNOWN_SYSTEM,        /* unknown or undeclared constellation letter */
        RNX_WARN_TIME_ORDER,            /* epoch earlier than its predecessor */
        RNX_WARN_BAD_EPOCH,             /* garbage where an epoch line was expected */
        RNX_WARN_OBS_TYPE_COUNT         /* obs type list shorter than declared */
    };

    struct gtime_t
    {
        time_t time;            /* time (s) expressed by standard time_t */
        double sec;             /* fraction of second under 1 s */
    };

    struct RinexError
    {
        int code;               /* RNX_ERR_??? */
        int line;               /* line number (1-based, 0: none) */
        int col;                /* first column (1-based, 0: none) */
        int width;              /* number of columns */
        std::string msg;
    };

    struct RinexWarning
    {
        int code;               /* RNX_WARN_??? */
        int line;               /* line number (1-based) */
        std::string sat;        /* satellite id if any */
        std::string msg;
    };

    /* header metadata, immutable once decoded */
    struct RinexHeader
    {
        double version;                     /* format version (0: not given) */
        int type;                           /* RINEX_TYPE_??? */
        char type_char;                     /* file type letter (O,N,G,H,...) */
        char sys_char;                      /* satellite system letter (G,R,E,M,...) */
        std::string time_sys;               /* time system (GPS,GLO,GAL,QZS,BDT,IRN,UTC) */
        std::string pgm, run_by, date;
        std::string marker_name, marker_number, marker_type;
        std::string observer, agency;
        std::string recsno, rectype, recver;    /* receiver serial/type/firmware */
        std::string antsno, antdes;             /* antenna serial/descriptor */
        Eigen::Vector3d pos;                /* approx position (ecef) (m) (NaN: none) */
        Eigen::Vector3d pos_llh;            /* approx position {lat,lon,h} (rad,m) */
        Eigen::Vector3d ant_delta;          /* antenna delta h/e/n (m) */
        int leap_sec;                       /* leap seconds (-1: not given) */
        double interval;                    /* observation interval (s) (NaN: none) */
        gtime_t first_obs, last_obs;        /* time of first/last obs (0: none) */
        int rcv_clk_applied;                /* receiver clock offset applied (-1: unknown) */
        int nobs_declared;                  /* ver.2 declared number of obs types */
        std::vector<std::string> obs_types;                 /* ver.2 global obs types */
        std::map<char, std::vector<std::string>> sys_obs_types; /* ver.3 obs types per system */
        std::map<char, int> sys_nobs_declared;              /* ver.3 declared counts */
        std::map<std::string, std::vector<double>> iono_corr;   /* GPSA,GPSB,GAL,... */
        std::map<std::string, std::vector<double>> time_corr;   /* GPUT,GLUT,GAUT,... */
        std::map<std::string, int> glo_fcn;     /* GLONASS frequency number per slot */
        std::vector<std::string> comments;
        std::map<std::string, std::string> extra;   /* pass-through labels */
        int nline;                          /* number of header lines */
    };

    /* one observation value with its indicators */
    struct ObsValue
    {
        double val;             /* observation */
        int lli;                /* loss of lock indicator (-1: blank) */
        int ssi;                /* signal strength indicator (-1: blank) */
    };

    struct ObsRecord                            /* observations of one satellite */
    {
        std::string sat;                        /* satellite id (G01,...) */
        std::map<std::string, ObsValue> meas;   /* obs code -> value, absent if blank */
    };

    struct ObsEpoch
    {
        gtime_t time;                           /* epoch time */
        int flag;                               /* epoch flag (EPOCH_???) */
        double clk_off;                         /* receiver clock offset (s) (NaN: none) */
        int line;                               /* line number of epoch record */
        std::vector<ObsRecord> recs;
    };

    /* layout of one broadcast record, field names include the 3 clock terms */
    struct NavLayout
    {
        char sys;                               /* system code */
        int nline;                              /* number of continuation lines */
        std::vector<std::string> fields;
    };

    struct NavRecord
    {
        std::string sat;                        /* satellite id */
        gtime_t toc;                            /* epoch of applicability */
        double clk[3];                          /* clock bias, drift, drift-rate (GLO: -TauN,GammaN,tk) */
        std::vector<double> orbit;              /* broadcast orbit values (NaN: blank) */
        const NavLayout *layout;
        int line;
    };

    /* special epoch that is consumed but not assembled */
    struct EpochEvent
    {
        gtime_t time;                           /* event time (0: not given) */
        int flag;                               /* EPOCH_??? */
        int nrec;                               /* number of special records */
        int line;
    };

    /* decode options -----------------------------------------------------------------------
    * the zero time/interval and empty filters select everything
    *---------------------------------------------------------------------------------------*/
    struct RnxOpt
    {
        gtime_t ts, te;                         /* time window (0: open) */
        double ti;                              /* decimation interval (s) (0: all) */
        std::string sys;                        /* systems to keep (G,R,...) ("": all) */
        std::vector<std::string> meas;          /* obs code prefixes to keep (empty: all) */
        bool indicators;                        /* output <code>lli/<code>ssi variables */
    };

    /* decoded file as labeled arrays, (time x satellite) per variable */
    struct RinexDataset
    {
        int type;                               /* RINEX_TYPE_??? */
        RinexHeader header;                     /* attributes */
        std::vector<gtime_t> time;              /* time axis (chronological) */
        std::vector<std::string> sat;           /* satellite axis (first-seen) */
        std::vector<std::string> fields;        /* variable names (first-seen) */
        std::map<std::string, Eigen::MatrixXd> data;    /* NaN: absent */
        std::vector<double> clk_off;            /* receiver clock offset per time (OBS) */
        std::vector<int> flags;                 /* epoch flag per time (OBS) */
        std::vector<EpochEvent> events;
        std::vector<RinexWarning> warnings;
        double interval;                        /* sampling interval (s) (NaN: unknown) */
    };

    const double RNX_NAN = std::numeric_limits<double>::quiet_NaN();

}   // namespace gnss_rinex

#endif
