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
* Header decoding for RINEX 2.x/3.x observation and navigation files.
*/

#include "gnss_rinex/rinex_header.hpp"
#include "gnss_rinex/rinex_numeric.hpp"
#include "gnss_rinex/gnss_utility.hpp"
#include <cmath>
#include <cstdio>
#include <cstring>
#include <glog/logging.h>

namespace gnss_rinex
{
    static const FieldDesc xyz_desc[] = {           /* 3F14.4 */
        { 0, 14, FIELD_FLOAT, "X"},
        {14, 14, FIELD_FLOAT, "Y"},
        {28, 14, FIELD_FLOAT, "Z"}
    };
    static const FieldDesc hen_desc[] = {           /* 3F14.4 */
        { 0, 14, FIELD_FLOAT, "H"},
        {14, 14, FIELD_FLOAT, "E"},
        {28, 14, FIELD_FLOAT, "N"}
    };
    static const FieldDesc tobs_desc[] = {          /* 5I6,F13.7 */
        { 0,  6, FIELD_INT,   "year"},
        { 6,  6, FIELD_INT,   "month"},
        {12,  6, FIELD_INT,   "day"},
        {18,  6, FIELD_INT,   "hour"},
        {24,  6, FIELD_INT,   "min"},
        {30, 13, FIELD_FLOAT, "sec"}
    };
    static const FieldDesc utc2_desc[] = {          /* 3X,2D19.12,2I9 */
        { 3, 19, FIELD_FLOAT, "A0"},
        {22, 19, FIELD_FLOAT, "A1"},
        {41,  9, FIELD_INT,   "T"},
        {50,  9, FIELD_INT,   "W"}
    };
    static const FieldDesc tcorr3_desc[] = {        /* A4,1X,D17.10,D16.9,I7,I5 */
        { 5, 17, FIELD_FLOAT, "a0"},
        {22, 16, FIELD_FLOAT, "a1"},
        {38,  7, FIELD_INT,   "T"},
        {45,  5, FIELD_INT,   "W"}
    };

    /* label state carried across header lines */
    struct HeaderState
    {
        bool has_version;
        char obs_sys;           /* system of the last SYS / # / OBS TYPES line */
        int glo_nslot;          /* declared GLONASS slots */
    };

    void init_header(RinexHeader &hdr)
    {
        hdr = RinexHeader();
        hdr.version = 0.0;
        hdr.type = RINEX_TYPE_UNKNOWN;
        hdr.type_char = ' ';
        hdr.sys_char = ' ';
        hdr.pos = Eigen::Vector3d::Constant(RNX_NAN);
        hdr.pos_llh = Eigen::Vector3d::Constant(RNX_NAN);
        hdr.ant_delta = Eigen::Vector3d::Constant(RNX_NAN);
        hdr.leap_sec = -1;
        hdr.interval = RNX_NAN;
        hdr.first_obs.time = 0; hdr.first_obs.sec = 0.0;
        hdr.last_obs.time = 0;  hdr.last_obs.sec = 0.0;
        hdr.rcv_clk_applied = -1;
        hdr.nobs_declared = 0;
        hdr.nline = 0;
    }

    int rnx_filetype(char type_char)
    {
        switch (type_char) {
            case 'O': return RINEX_TYPE_OBS;
            case 'N':           /* gps or mixed nav */
            case 'G':           /* ver.2 glonass nav */
            case 'H':           /* ver.2 sbas nav */
            case 'L':           /* ver.2 galileo nav */
            case 'J':           /* ver.2 qzss nav */
                return RINEX_TYPE_NAV;
            default:
                return RINEX_TYPE_UNKNOWN;
        }
    }

    static std::string default_time_sys(const RinexHeader &hdr)
    {
        char sys = hdr.sys_char;

        if (hdr.type == RINEX_TYPE_NAV && hdr.version < 3.0) {
            sys = hdr.type_char == 'G' ? 'R' : (hdr.type_char == 'L' ? 'E' : 'G');
        }
        switch (sys) {
            case 'R': return "GLO";
            case 'E': return "GAL";
            case 'J': return "QZS";
            case 'C': return "BDT";
            case 'I': return "IRN";
            default:  return "GPS";
        }
    }

    static bool decode_time(const std::string &buff, int line, gtime_t *t, RinexError *err)
    {
        double ep[6];

        if (!decode_fields(buff, line, tobs_desc, 6, ep, err)) return false;
        for (int i = 0; i < 6; i++) {
            if (std::isnan(ep[i])) return true;     /* not given */
        }
        *t = epoch2time(ep);
        return true;
    }

    static bool decode_corr(const std::string &buff, int line, int col, int n,
                            std::vector<double> &val, RinexError *err)
    {
        val.assign(n, RNX_NAN);
        for (int i = 0; i < n; i++) {
            if (!decode_num(buff, line, col + i*12, 12, FIELD_FLOAT, &val[i], err)) return false;
        }
        return true;
    }

    /* Decode one header record ---------------------------------------------------------------
    * args   : const std::string &buff    I   header line
    *          int line                   I   line number
    *          RinexHeader &hdr           IO  header
    *          HeaderState &st            IO  label state
    *          std::vector<RinexWarning> &warns IO warnings
    *          RinexError *err            O   error
    * return : bool - false on malformed numeric field
    *---------------------------------------------------------------------------------------*/
    static bool decode_rnxh(const std::string &buff, int line, RinexHeader &hdr, HeaderState &st,
                            std::vector<RinexWarning> &warns, RinexError *err)
    {
        std::string label = trim(col_field(buff, 60, 20));
        double val[6];
        int i, n;

        if (label.find("RINEX VERSION / TYPE") != std::string::npos) {
            if (!decode_num(buff, line, 0, 9, FIELD_FLOAT, &hdr.version, err)) return false;
            if (std::isnan(hdr.version)) {
                hdr.version = 0.0;
                return true;
            }
            hdr.type_char = col_field(buff, 20, 1)[0];
            hdr.sys_char = col_field(buff, 40, 1)[0];
            hdr.type = rnx_filetype(hdr.type_char);
            st.has_version = true;
        }
        else if (label.find("PGM / RUN BY / DATE") != std::string::npos) {
            hdr.pgm = trim(col_field(buff, 0, 20));
            hdr.run_by = trim(col_field(buff, 20, 20));
            hdr.date = trim(col_field(buff, 40, 20));
        }
        else if (label.find("COMMENT") != std::string::npos) {
            hdr.comments.push_back(trim(col_field(buff, 0, 60)));
        }
        else if (label.find("MARKER NAME") != std::string::npos) {
            hdr.marker_name = trim(col_field(buff, 0, 60));
        }
        else if (label.find("MARKER NUMBER") != std::string::npos) {
            hdr.marker_number = trim(col_field(buff, 0, 20));
        }
        else if (label.find("MARKER TYPE") != std::string::npos) {
            hdr.marker_type = trim(col_field(buff, 0, 20));
        }
        else if (label.find("OBSERVER / AGENCY") != std::string::npos) {
            hdr.observer = trim(col_field(buff, 0, 20));
            hdr.agency = trim(col_field(buff, 20, 40));
        }
        else if (label.find("REC # / TYPE / VERS") != std::string::npos) {
            hdr.recsno = trim(col_field(buff, 0, 20));
            hdr.rectype = trim(col_field(buff, 20, 20));
            hdr.recver = trim(col_field(buff, 40, 20));
        }
        else if (label.find("ANT # / TYPE") != std::string::npos) {
            hdr.antsno = trim(col_field(buff, 0, 20));
            hdr.antdes = trim(col_field(buff, 20, 20));
        }
        else if (label.find("APPROX POSITION XYZ") != std::string::npos) {
            if (!decode_fields(buff, line, xyz_desc, 3, val, err)) return false;
            hdr.pos = Eigen::Vector3d(val[0], val[1], val[2]);
            if (hdr.pos.allFinite() && hdr.pos.norm() > 0.0) hdr.pos_llh = ecef2geo(hdr.pos);
        }
        else if (label.find("ANTENNA: DELTA H/E/N") != std::string::npos) {
            if (!decode_fields(buff, line, hen_desc, 3, val, err)) return false;
            hdr.ant_delta = Eigen::Vector3d(val[0], val[1], val[2]);
        }
        else if (label.find("# / TYPES OF OBSERV") != std::string::npos) { /* ver.2 */
            if (!decode_num(buff, line, 0, 6, FIELD_INT, val, err)) return false;
            if (!std::isnan(val[0])) hdr.nobs_declared = (int)val[0];
            for (i = 0; i < NTYPELINE_OBS2; i++) {
                std::string code = trim(col_field(buff, 6 + 6*i, 6));
                if (!code.empty()) hdr.obs_types.push_back(code);
            }
        }
        else if (label.find("SYS / # / OBS TYPES") != std::string::npos) { /* ver.3 */
            if (buff[0] != ' ') {
                st.obs_sys = buff[0];
                if (!decode_num(buff, line, 3, 3, FIELD_INT, val, err)) return false;
                hdr.sys_nobs_declared[st.obs_sys] = std::isnan(val[0]) ? 0 : (int)val[0];
                hdr.sys_obs_types[st.obs_sys].clear();
            }
            else if (!st.obs_sys) {
                add_warning(warns, RNX_WARN_OBS_TYPE_COUNT, line, "",
                            "obs type continuation line without system");
                return true;
            }
            for (i = 0; i < NTYPELINE_OBS3; i++) {
                std::string code = trim(col_field(buff, 7 + 4*i, 3));
                if (!code.empty()) hdr.sys_obs_types[st.obs_sys].push_back(code);
            }
        }
        else if (label.find("INTERVAL") != std::string::npos) {
            if (!decode_num(buff, line, 0, 10, FIELD_FLOAT, &hdr.interval, err)) return false;
        }
        else if (label.find("TIME OF FIRST OBS") != std::string::npos) {
            if (!decode_time(buff, line, &hdr.first_obs, err)) return false;
            std::string ts = trim(col_field(buff, 48, 3));
            if (!ts.empty()) hdr.time_sys = ts;
        }
        else if (label.find("TIME OF LAST OBS") != std::string::npos) {
            if (!decode_time(buff, line, &hdr.last_obs, err)) return false;
        }
        else if (label.find("RCV CLOCK OFFS APPL") != std::string::npos) {
            if (!decode_num(buff, line, 0, 6, FIELD_INT, val, err)) return false;
            if (!std::isnan(val[0])) hdr.rcv_clk_applied = (int)val[0];
        }
        else if (label.find("LEAP SECONDS") != std::string::npos) {
            if (!decode_num(buff, line, 0, 6, FIELD_INT, val, err)) return false;
            if (!std::isnan(val[0])) hdr.leap_sec = (int)val[0];
        }
        else if (label.find("GLONASS SLOT / FRQ #") != std::string::npos) { /* ver.3.02 */
            if (!decode_num(buff, line, 0, 3, FIELD_INT, val, err)) return false;
            if (!std::isnan(val[0])) st.glo_nslot = (int)val[0];
            for (i = 0; i < 8; i++) {
                std::string sat, slot = col_field(buff, 4 + 7*i, 3);
                if (trim(slot).empty()) continue;
                if (!decode_num(buff, line, 8 + 7*i, 2, FIELD_INT, val, err)) return false;
                if (std::isnan(val[0]) || !satid_norm(slot, 'R', sat, NULL)) continue;
                hdr.glo_fcn[sat] = (int)val[0];
            }
        }
        else if (label.find("ION ALPHA") != std::string::npos) { /* ver.2 */
            if (!decode_corr(buff, line, 2, 4, hdr.iono_corr["GPSA"], err)) return false;
        }
        else if (label.find("ION BETA") != std::string::npos) { /* ver.2 */
            if (!decode_corr(buff, line, 2, 4, hdr.iono_corr["GPSB"], err)) return false;
        }
        else if (label.find("DELTA-UTC: A0,A1,T,W") != std::string::npos) { /* ver.2 */
            if (!decode_fields(buff, line, utc2_desc, 4, val, err)) return false;
            hdr.time_corr["GPUT"].assign(val, val + 4);
        }
        else if (label.find("CORR TO SYSTEM TIME") != std::string::npos) { /* ver.2 glonass */
            if (!decode_num(buff, line, 21, 19, FIELD_FLOAT, val, err)) return false;
            hdr.time_corr["GLUT"].assign(1, val[0]);
        }
        else if (label.find("IONOSPHERIC CORR") != std::string::npos) { /* ver.3 */
            std::string key = trim(col_field(buff, 0, 4));
            if (!decode_corr(buff, line, 5, 4, hdr.iono_corr[key], err)) return false;
        }
        else if (label.find("TIME SYSTEM CORR") != std::string::npos) { /* ver.3 */
            std::string key = trim(col_field(buff, 0, 4));
            if (!decode_fields(buff, line, tcorr3_desc, 4, val, err)) return false;
            hdr.time_corr[key].assign(val, val + 4);
        }
        else if (!label.empty()) {
            std::string &s = hdr.extra[label];
            n = (int)s.size();
            s += (n ? " " : "") + trim(col_field(buff, 0, 60));
        }
        return true;
    }

    static void check_obs_types(const RinexHeader &hdr, int line, std::vector<RinexWarning> &warns)
    {
        char msg[128];

        if (hdr.type != RINEX_TYPE_OBS) return;

        if (hdr.version < 3.0) {
            if ((int)hdr.obs_types.size() != hdr.nobs_declared) {
                snprintf(msg, sizeof(msg), "declared %d obs types, found %d",
                         hdr.nobs_declared, (int)hdr.obs_types.size());
                add_warning(warns, RNX_WARN_OBS_TYPE_COUNT, line, "", msg);
            }
            return;
        }
        for (std::map<char, int>::const_iterator it = hdr.sys_nobs_declared.begin();
             it != hdr.sys_nobs_declared.end(); ++it) {
            int n = (int)hdr.sys_obs_types.at(it->first).size();
            if (n == it->second) continue;
            snprintf(msg, sizeof(msg), "sys=%c declared %d obs types, found %d",
                     it->first, it->second, n);
            add_warning(warns, RNX_WARN_OBS_TYPE_COUNT, line, "", msg);
        }
    }

    bool readrnxh(RinexLineReader &rd, RinexHeader &hdr, std::vector<RinexWarning> &warns,
                  RinexError *err)
    {
        HeaderState st;
        std::string buff;

        st.has_version = false;
        st.obs_sys = 0;
        st.glo_nslot = 0;
        init_header(hdr);

        while (rd.next(buff)) {
            if (col_field(buff, 60, 20).find("END OF HEADER") != std::string::npos) {
                if (!st.has_version) {
                    set_error(err, RNX_ERR_MISSING_VERSION, rd.lineno(), 0, 0,
                              "no RINEX VERSION / TYPE before END OF HEADER");
                    return false;
                }
                hdr.nline = rd.lineno();
                if (hdr.time_sys.empty()) hdr.time_sys = default_time_sys(hdr);
                if (st.glo_nslot > 0 && (int)hdr.glo_fcn.size() != st.glo_nslot) {
                    LOG(WARNING) << "readrnxh: GLONASS SLOT / FRQ # declared " << st.glo_nslot
                                 << " slots, found " << hdr.glo_fcn.size();
                }
                check_obs_types(hdr, hdr.nline, warns);

                LOG(INFO) << "readrnxh: ver=" << hdr.version << " type=" << hdr.type_char
                          << " sys=" << hdr.sys_char << " time_sys=" << hdr.time_sys
                          << " nline=" << hdr.nline;
                return true;
            }
            if (!decode_rnxh(buff, rd.lineno(), hdr, st, warns, err)) {
                if (err) err->msg += " in header label '" + trim(col_field(buff, 60, 20)) + "'";
                return false;
            }
        }
        if (!st.has_version) {
            set_error(err, RNX_ERR_MISSING_VERSION, rd.lineno(), 0, 0,
                      "input ended without RINEX VERSION / TYPE");
        }
        else {
            set_error(err, RNX_ERR_TRUNCATED_RECORD, rd.lineno(), 0, 0,
                      "input ended inside the header");
        }
        return false;
    }

}   // namespace gnss_rinex
