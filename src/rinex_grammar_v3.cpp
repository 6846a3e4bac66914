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
* RINEX 3.x observation and navigation body grammars.
*/

#include "gnss_rinex/rinex_grammar.hpp"
#include "gnss_rinex/rinex_numeric.hpp"
#include "gnss_rinex/gnss_utility.hpp"
#include <cmath>
#include <cstdio>
#include <glog/logging.h>

namespace gnss_rinex
{
    /* epoch line: A1,1X,I4,4(1X,I2.2),F11.7,2X,I1,I3,6X,F15.12 */
    static const FieldDesc epoch3_desc[] = {
        { 2,  4, FIELD_INT,   "year"},
        { 6,  3, FIELD_INT,   "month"},
        { 9,  3, FIELD_INT,   "day"},
        {12,  3, FIELD_INT,   "hour"},
        {15,  3, FIELD_INT,   "min"},
        {18, 11, FIELD_FLOAT, "sec"},
        {31,  1, FIELD_INT,   "flag"},
        {32,  3, FIELD_INT,   "nsat"},
        {41, 15, FIELD_FLOAT, "clkoff"}
    };
    enum { E3_FLAG = 6, E3_NSAT = 7, E3_CLK = 8, E3_NFIELD = 9 };

    /* nav record head line: A1,I2.2,1X,I4,5(1X,I2.2),3D19.12 */
    static const FieldDesc nav3_desc[] = {
        { 4,  4, FIELD_INT,   "year"},
        { 8,  3, FIELD_INT,   "month"},
        {11,  3, FIELD_INT,   "day"},
        {14,  3, FIELD_INT,   "hour"},
        {17,  3, FIELD_INT,   "min"},
        {20,  3, FIELD_INT,   "sec"},
        {23, 19, FIELD_FLOAT, "clkbias"},
        {42, 19, FIELD_FLOAT, "clkdrift"},
        {61, 19, FIELD_FLOAT, "clkrate"}
    };
    enum { N3_NFIELD = 9 };

    static bool decode_time3(const double *v, gtime_t *t)
    {
        for (int i = 0; i < 6; i++) {
            if (std::isnan(v[i])) return false;
        }
        if (!epoch_valid(v)) return false;
        *t = epoch2time(v);
        return true;
    }

    RinexObs3Grammar::RinexObs3Grammar(const ObsTypeTable &tbl)
        : tbl_(tbl)
    {
    }

    bool RinexObs3Grammar::parse_header(const RinexHeader &hdr, std::vector<RinexWarning> &warns,
                                        RinexError *err)
    {
        unknown_sys_.clear();
        if (tbl_.sys.empty()) {
            add_warning(warns, RNX_WARN_UNKNOWN_OBS_SET, hdr.nline, "", "no SYS / # / OBS TYPES");
        }
        for (std::map<char, std::vector<std::string>>::const_iterator it = tbl_.sys.begin();
             it != tbl_.sys.end(); ++it) {
            LOG(INFO) << "obs3: sys=" << it->first << " ntype=" << it->second.size();
        }
        return true;
    }

    /* decode one satellite line, records of unknown systems are dropped with a warning */
    bool RinexObs3Grammar::decode_sat(const std::string &buff, int line, DatasetBuilder &builder,
                                      std::vector<ObsRecord> &recs, RinexError *err)
    {
        const std::vector<std::string> *types;
        double val, lli, ssi;
        ObsRecord rec;

        if (!satid_norm(col_field(buff, 0, 3), ' ', rec.sat, NULL)) {
            builder.warn(RNX_WARN_UNKNOWN_SYSTEM, line, rec.sat, "invalid satellite id, record skipped");
            return true;
        }
        if (!(types = tbl_.lookup(rec.sat[0]))) {
            if (unknown_sys_.insert(rec.sat[0]).second) {
                builder.warn(RNX_WARN_UNKNOWN_OBS_SET, line, rec.sat,
                             std::string("no obs types for system ") + rec.sat[0]);
            }
            recs.push_back(rec);
            return true;
        }
        for (size_t j = 0; j < types->size(); j++) {
            int col = 3 + (int)j*OBS_FIELD_LEN;
            if (!decode_num(buff, line, col,      14, FIELD_FLOAT, &val, err) ||
                !decode_num(buff, line, col + 14,  1, FIELD_INT,   &lli, err) ||
                !decode_num(buff, line, col + 15,  1, FIELD_INT,   &ssi, err)) return false;
            if (std::isnan(val)) continue;

            ObsValue &obs = rec.meas[(*types)[j]];
            obs.val = val;
            obs.lli = std::isnan(lli) ? -1 : (int)lli;
            obs.ssi = std::isnan(ssi) ? -1 : (int)ssi;
        }
        recs.push_back(rec);
        return true;
    }

    /* Decode ver.3 observation body -----------------------------------------------------------
    * notes  : text outside epochs is skipped with a warning. an epoch line where a
    *          satellite line is expected truncates the record.
    *---------------------------------------------------------------------------------------*/
    bool RinexObs3Grammar::parse_body(RinexLineReader &rd, DatasetBuilder &builder, RinexError *err)
    {
        std::string buff;
        ObsEpoch epoch;
        EpochEvent event;
        double v[E3_NFIELD];
        char msg[128];
        int nsat, flag, i;

        while (rd.next(buff)) {
            if (trim(buff).empty()) continue;
            if (buff[0] != '>') {
                builder.warn(RNX_WARN_BAD_EPOCH, rd.lineno(), "", "line outside epoch skipped: " + buff);
                continue;
            }
            if (!decode_fields(buff, rd.lineno(), epoch3_desc, E3_NFIELD, v, err)) return false;

            flag = std::isnan(v[E3_FLAG]) ? EPOCH_OK : (int)v[E3_FLAG];
            nsat = std::isnan(v[E3_NSAT]) ? 0 : (int)v[E3_NSAT];

            if (EPOCH_MOVING <= flag && flag <= EPOCH_EXTEVENT) {
                event.flag = flag;
                event.nrec = nsat;
                event.line = rd.lineno();
                if (!decode_time3(v, &event.time)) {
                    event.time.time = 0;
                    event.time.sec = 0.0;
                }
                for (i = 0; i < nsat; i++) {
                    if (rd.next(buff)) continue;
                    set_error(err, RNX_ERR_TRUNCATED_RECORD, rd.lineno() + 1, 0, 0,
                              "input ended inside special records of epoch flag " + std::to_string(flag));
                    return false;
                }
                builder.add_event(event);
                continue;
            }
            if (flag > EPOCH_SLIP || !decode_time3(v, &epoch.time)) {
                builder.warn(RNX_WARN_BAD_EPOCH, rd.lineno(), "", "invalid epoch line skipped: " + buff);
                continue;
            }
            epoch.flag = flag;
            epoch.clk_off = v[E3_CLK];
            epoch.line = rd.lineno();
            epoch.recs.clear();

            for (i = 0; i < nsat; i++) {
                bool ok = rd.next(buff);
                if (ok && !buff.empty() && buff[0] == '>') {
                    rd.unread();
                    ok = false;
                }
                if (!ok) {
                    snprintf(msg, sizeof(msg), "epoch of line %d has %d of %d satellite lines",
                             epoch.line, i, nsat);
                    set_error(err, RNX_ERR_TRUNCATED_RECORD, rd.lineno() + 1, 0, 0, msg);
                    return false;
                }
                if (!decode_sat(buff, rd.lineno(), builder, epoch.recs, err)) return false;
            }
            if (flag == EPOCH_SLIP) {
                event.time = epoch.time;
                event.flag = flag;
                event.nrec = nsat;
                event.line = epoch.line;
                builder.add_event(event);
                continue;
            }
            builder.add_obs_epoch(epoch);
        }
        return true;
    }

    RinexNav3Grammar::RinexNav3Grammar()
        : ver_(3.0)
    {
    }

    bool RinexNav3Grammar::parse_header(const RinexHeader &hdr, std::vector<RinexWarning> &warns,
                                        RinexError *err)
    {
        ver_ = hdr.version;
        LOG(INFO) << "nav3: ver=" << ver_ << " sys=" << hdr.sys_char;
        return true;
    }

    /* skip orbit lines of a record that is not decoded */
    static void skip_orbit_lines(RinexLineReader &rd)
    {
        std::string buff;

        while (rd.next(buff)) {
            if (buff.empty() || buff[0] == ' ') continue;
            rd.unread();
            break;
        }
    }

    /* Decode ver.3 navigation body ------------------------------------------------------------
    * notes  : the number of orbit lines depends on the system letter of each record
    *---------------------------------------------------------------------------------------*/
    bool RinexNav3Grammar::parse_body(RinexLineReader &rd, DatasetBuilder &builder, RinexError *err)
    {
        std::string buff;
        NavRecord rec;
        double v[N3_NFIELD];
        bool valid;

        while (rd.next(buff)) {
            if (trim(buff).empty()) continue;
            if (buff[0] == ' ') {
                builder.warn(RNX_WARN_BAD_EPOCH, rd.lineno(), "", "orbit line without record head skipped");
                continue;
            }
            rec.line = rd.lineno();
            rec.layout = nav_layout(buff[0], ver_);

            if (!satid_norm(col_field(buff, 0, 3), ' ', rec.sat, NULL) || !rec.layout) {
                builder.warn(RNX_WARN_UNKNOWN_SYSTEM, rec.line, rec.sat, "unsupported satellite, record skipped");
                skip_orbit_lines(rd);
                continue;
            }
            if (!decode_fields(buff, rec.line, nav3_desc, N3_NFIELD, v, err)) return false;

            valid = decode_time3(v, &rec.toc);
            for (int i = 0; i < 3; i++) rec.clk[i] = v[6+i];

            if (!read_orbit_lines(rd, 4, rec, err)) return false;

            if (!valid) {
                builder.warn(RNX_WARN_BAD_EPOCH, rec.line, rec.sat, "invalid toc, record skipped");
                continue;
            }
            builder.add_nav_record(rec);
        }
        return true;
    }

}   // namespace gnss_rinex
