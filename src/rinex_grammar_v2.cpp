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
* RINEX 2.x observation and navigation body grammars.
*/

#include "gnss_rinex/rinex_grammar.hpp"
#include "gnss_rinex/rinex_numeric.hpp"
#include "gnss_rinex/gnss_utility.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <glog/logging.h>

namespace gnss_rinex
{
    /* epoch line: 1X,I2.2,4(1X,I2),F11.7,2X,I1,I3,12(A1,I2.2),F12.9 */
    static const FieldDesc epoch2_desc[] = {
        { 0,  3, FIELD_INT,   "year"},
        { 3,  3, FIELD_INT,   "month"},
        { 6,  3, FIELD_INT,   "day"},
        { 9,  3, FIELD_INT,   "hour"},
        {12,  3, FIELD_INT,   "min"},
        {15, 11, FIELD_FLOAT, "sec"},
        {28,  1, FIELD_INT,   "flag"},
        {29,  3, FIELD_INT,   "nsat"},
        {68, 12, FIELD_FLOAT, "clkoff"}
    };
    enum { E2_FLAG = 6, E2_NSAT = 7, E2_CLK = 8, E2_NFIELD = 9 };

    /* nav record head line: I2,5I3,F5.1,3D19.12 */
    static const FieldDesc nav2_desc[] = {
        { 0,  2, FIELD_INT,   "prn"},
        { 2,  3, FIELD_INT,   "year"},
        { 5,  3, FIELD_INT,   "month"},
        { 8,  3, FIELD_INT,   "day"},
        {11,  3, FIELD_INT,   "hour"},
        {14,  3, FIELD_INT,   "min"},
        {17,  5, FIELD_FLOAT, "sec"},
        {22, 19, FIELD_FLOAT, "clkbias"},
        {41, 19, FIELD_FLOAT, "clkdrift"},
        {60, 19, FIELD_FLOAT, "clkrate"}
    };
    enum { N2_NFIELD = 10 };

    /* decoded two-digit year,month,day,hour,min,sec to time, false if absent or invalid */
    static bool decode_time2(const double *v, gtime_t *t)
    {
        double ep[6];

        for (int i = 0; i < 6; i++) {
            if (std::isnan(v[i])) return false;
            ep[i] = v[i];
        }
        ep[0] = expand_year((int)ep[0]);
        if (!epoch_valid(ep)) return false;
        *t = epoch2time(ep);
        return true;
    }

    enum Obs2State {
        AWAIT_EPOCH = 0,        /* epoch line expected */
        CONT_SAT_LIST,          /* satellite list continues on next line */
        READ_SAT_DATA,          /* first data line of a satellite */
        CONT_OBS_LINE           /* continuation data line of a satellite */
    };

    RinexObs2Grammar::RinexObs2Grammar(const ObsTypeTable &tbl)
        : tbl_(tbl), defsys_('G'), filesys_(0)
    {
    }

    bool RinexObs2Grammar::parse_header(const RinexHeader &hdr, std::vector<RinexWarning> &warns,
                                        RinexError *err)
    {
        char sys = hdr.sys_char;

        filesys_ = (sys == ' ' || sys == 'M') ? 0 : sys;
        if (filesys_ && code2sys(filesys_) == SYS_NONE) {
            add_warning(warns, RNX_WARN_UNKNOWN_SYSTEM, hdr.nline, "",
                        std::string("unknown file system ") + filesys_ + ", read as mixed");
            filesys_ = 0;
        }
        defsys_ = filesys_ ? filesys_ : 'G';

        if (tbl_.global.empty()) {
            add_warning(warns, RNX_WARN_UNKNOWN_OBS_SET, hdr.nline, "", "no # / TYPES OF OBSERV");
        }
        return true;
    }

    bool RinexObs2Grammar::decode_obs(const std::string &buff, int line, int i0, int n,
                                      ObsRecord &rec, RinexError *err) const
    {
        double val, lli, ssi;

        for (int j = 0; j < n; j++) {
            int col = j*OBS_FIELD_LEN;
            if (!decode_num(buff, line, col,      14, FIELD_FLOAT, &val, err) ||
                !decode_num(buff, line, col + 14,  1, FIELD_INT,   &lli, err) ||
                !decode_num(buff, line, col + 15,  1, FIELD_INT,   &ssi, err)) return false;
            if (std::isnan(val)) continue;

            ObsValue &obs = rec.meas[tbl_.global[i0+j]];
            obs.val = val;
            obs.lli = std::isnan(lli) ? -1 : (int)lli;
            obs.ssi = std::isnan(ssi) ? -1 : (int)ssi;
        }
        return true;
    }

    bool RinexObs2Grammar::check_sat(const std::string &field, int line, DatasetBuilder &builder,
                                     std::string &sat) const
    {
        if (!satid_norm(field, defsys_, sat, NULL)) {
            builder.warn(RNX_WARN_UNKNOWN_SYSTEM, line, sat, "invalid satellite id, record skipped");
            return false;
        }
        if (filesys_ && sat[0] != filesys_) {
            builder.warn(RNX_WARN_UNKNOWN_SYSTEM, line, sat,
                         std::string("satellite of undeclared system in ") + filesys_ + " file, record skipped");
            return false;
        }
        return true;
    }

    /* Decode ver.2 observation body -----------------------------------------------------------
    * notes  : epoch flags 2-5 are followed by nsat special records which are skipped,
    *          flag 6 records are read like normal data and kept as events only
    *---------------------------------------------------------------------------------------*/
    bool RinexObs2Grammar::parse_body(RinexLineReader &rd, DatasetBuilder &builder, RinexError *err)
    {
        const int ntype = (int)tbl_.global.size();
        const int nline_sat = (ntype + NOBSLINE_OBS2 - 1)/NOBSLINE_OBS2;
        Obs2State state = AWAIT_EPOCH;
        std::vector<std::string> satids;
        std::string buff;
        ObsEpoch epoch;
        ObsRecord rec;
        EpochEvent event;
        double v[E2_NFIELD];
        int nsat = 0, isat = 0, iobs = 0, nskip, flag, i;
        bool sat_done;

        while (rd.next(buff)) {
            sat_done = false;

            switch (state) {
                case AWAIT_EPOCH:
                    if (trim(buff).empty()) break;
                    if (!decode_fields(buff, rd.lineno(), epoch2_desc, E2_NFIELD, v, err)) return false;

                    flag = std::isnan(v[E2_FLAG]) ? EPOCH_OK : (int)v[E2_FLAG];
                    nsat = std::isnan(v[E2_NSAT]) ? 0 : (int)v[E2_NSAT];

                    if (EPOCH_MOVING <= flag && flag <= EPOCH_EXTEVENT) {
                        event.flag = flag;
                        event.nrec = nsat;
                        event.line = rd.lineno();
                        if (!decode_time2(v, &event.time)) {
                            event.time.time = 0;
                            event.time.sec = 0.0;
                        }
                        for (i = 0; i < nsat; i++) {
                            if (rd.next(buff)) continue;
                            set_error(err, RNX_ERR_TRUNCATED_RECORD, rd.lineno() + 1, 0, 0,
                                      "input ended inside special records of epoch flag " +
                                      std::to_string(flag));
                            return false;
                        }
                        builder.add_event(event);
                        break;
                    }
                    if (flag > EPOCH_SLIP || !decode_time2(v, &epoch.time)) {
                        builder.warn(RNX_WARN_BAD_EPOCH, rd.lineno(), "", "invalid epoch line skipped: " + buff);

                        /* skip its satellite list continuation and data lines */
                        nskip = nsat > 0 ? (nsat - 1)/NSATLINE_OBS2 + nsat*nline_sat : 0;
                        for (i = 0; i < nskip; i++) {
                            if (rd.next(buff)) continue;
                            set_error(err, RNX_ERR_TRUNCATED_RECORD, rd.lineno() + 1, 0, 0,
                                      "input ended inside skipped epoch");
                            return false;
                        }
                        break;
                    }
                    epoch.flag = flag;
                    epoch.clk_off = v[E2_CLK];
                    epoch.line = rd.lineno();
                    epoch.recs.clear();

                    satids.clear();
                    for (i = 0; i < nsat && i < NSATLINE_OBS2; i++) {
                        satids.push_back(col_field(buff, 32 + 3*i, 3));
                    }
                    isat = 0;
                    state = nsat > NSATLINE_OBS2 ? CONT_SAT_LIST : READ_SAT_DATA;
                    break;

                case CONT_SAT_LIST:
                    for (i = 0; i < NSATLINE_OBS2 && (int)satids.size() < nsat; i++) {
                        satids.push_back(col_field(buff, 32 + 3*i, 3));
                    }
                    if ((int)satids.size() >= nsat) state = READ_SAT_DATA;
                    break;

                case READ_SAT_DATA:
                    rec.meas.clear();
                    iobs = std::min(NOBSLINE_OBS2, ntype);
                    if (!decode_obs(buff, rd.lineno(), 0, iobs, rec, err)) return false;
                    if (iobs < ntype) state = CONT_OBS_LINE;
                    else sat_done = true;
                    break;

                case CONT_OBS_LINE:
                    i = std::min(NOBSLINE_OBS2, ntype - iobs);
                    if (!decode_obs(buff, rd.lineno(), iobs, i, rec, err)) return false;
                    if ((iobs += i) >= ntype) {
                        state = READ_SAT_DATA;
                        sat_done = true;
                    }
                    break;
            }
            if (sat_done) {
                if (check_sat(satids[isat], rd.lineno(), builder, rec.sat)) epoch.recs.push_back(rec);
                isat++;
            }
            if (state != READ_SAT_DATA || (isat < nsat && nline_sat > 0)) continue;

            /* all satellites of the epoch read */
            for (; isat < nsat; isat++) {
                rec.meas.clear();
                if (check_sat(satids[isat], epoch.line, builder, rec.sat)) epoch.recs.push_back(rec);
            }
            if (epoch.flag == EPOCH_SLIP) {
                event.time = epoch.time;
                event.flag = epoch.flag;
                event.nrec = nsat;
                event.line = epoch.line;
                builder.add_event(event);
            }
            else {
                builder.add_obs_epoch(epoch);
            }
            state = AWAIT_EPOCH;
        }
        if (state != AWAIT_EPOCH) {
            char msg[128];
            snprintf(msg, sizeof(msg), "input ended inside epoch of line %d (%d of %d satellites)",
                     epoch.line, isat, nsat);
            set_error(err, RNX_ERR_TRUNCATED_RECORD, rd.lineno() + 1, 0, 0, msg);
            return false;
        }
        return true;
    }

    RinexNav2Grammar::RinexNav2Grammar()
        : sys_(0), layout_(NULL)
    {
    }

    bool RinexNav2Grammar::parse_header(const RinexHeader &hdr, std::vector<RinexWarning> &warns,
                                        RinexError *err)
    {
        sys_ = nav2_sys(hdr.type_char);
        if (!(layout_ = nav_layout(sys_, hdr.version))) {
            set_error(err, RNX_ERR_UNSUPPORTED_TYPE, 1, 21, 1,
                      std::string("no ver.2 nav layout for file type ") + hdr.type_char);
            return false;
        }
        LOG(INFO) << "nav2: type=" << hdr.type_char << " sys=" << sys_ << " nline=" << layout_->nline;
        return true;
    }

    /* Decode ver.2 navigation body ------------------------------------------------------------
    * notes  : a record is a head line with prn and toc followed by a fixed number of
    *          orbit lines starting with 3 blanks
    *---------------------------------------------------------------------------------------*/
    bool RinexNav2Grammar::parse_body(RinexLineReader &rd, DatasetBuilder &builder, RinexError *err)
    {
        std::string buff;
        NavRecord rec;
        double v[N2_NFIELD];
        bool valid;

        while (rd.next(buff)) {
            if (trim(buff).empty()) continue;
            if (field_blank(buff, 0, 3)) {
                builder.warn(RNX_WARN_BAD_EPOCH, rd.lineno(), "", "orbit line without record head skipped");
                continue;
            }
            if (!decode_fields(buff, rd.lineno(), nav2_desc, N2_NFIELD, v, err)) return false;

            rec.line = rd.lineno();
            rec.layout = layout_;
            valid = decode_time2(v + 1, &rec.toc);
            for (int i = 0; i < 3; i++) rec.clk[i] = v[7+i];
            satid_norm(std::string(1, sys_) + col_field(buff, 0, 2), sys_, rec.sat, NULL);

            if (!read_orbit_lines(rd, 3, rec, err)) return false;

            if (!valid) {
                builder.warn(RNX_WARN_BAD_EPOCH, rec.line, rec.sat, "invalid toc, record skipped");
                continue;
            }
            builder.add_nav_record(rec);
        }
        return true;
    }

}   // namespace gnss_rinex
