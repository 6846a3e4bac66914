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
* Broadcast orbit layouts: 3 clock terms followed by 4 parameters per
* continuation line. spare slots are decoded but not stored.
*/

#include "gnss_rinex/rinex_grammar.hpp"
#include "gnss_rinex/rinex_numeric.hpp"
#include "gnss_rinex/gnss_utility.hpp"
#include <cstdio>

namespace gnss_rinex
{
    static const NavLayout gps_layout = {'G', 7, {
        "SVclockBias", "SVclockDrift", "SVclockDriftRate",
        "IODE", "Crs", "DeltaN", "M0",
        "Cuc", "Eccentricity", "Cus", "sqrtA",
        "Toe", "Cic", "Omega0", "Cis",
        "Io", "Crc", "omega", "OmegaDot",
        "IDOT", "CodesL2", "GPSWeek", "L2Pflag",
        "SVacc", "health", "TGD", "IODC",
        "TransTime", "FitIntvl", "spare0", "spare1"}};

    static const NavLayout qzs_layout = {'J', 7, gps_layout.fields};

    static const NavLayout gal_layout = {'E', 7, {
        "SVclockBias", "SVclockDrift", "SVclockDriftRate",
        "IODnav", "Crs", "DeltaN", "M0",
        "Cuc", "Eccentricity", "Cus", "sqrtA",
        "Toe", "Cic", "Omega0", "Cis",
        "Io", "Crc", "omega", "OmegaDot",
        "IDOT", "DataSrc", "GALWeek", "spare0",
        "SISA", "health", "BGDe5a", "BGDe5b",
        "TransTime", "spare1", "spare2", "spare3"}};

    static const NavLayout bds_layout = {'C', 7, {
        "SVclockBias", "SVclockDrift", "SVclockDriftRate",
        "AODE", "Crs", "DeltaN", "M0",
        "Cuc", "Eccentricity", "Cus", "sqrtA",
        "Toe", "Cic", "Omega0", "Cis",
        "Io", "Crc", "omega", "OmegaDot",
        "IDOT", "spare0", "BDTWeek", "spare1",
        "SVacc", "SatH1", "TGD1", "TGD2",
        "TransTime", "AODC", "spare2", "spare3"}};

    static const NavLayout irn_layout = {'I', 7, {
        "SVclockBias", "SVclockDrift", "SVclockDriftRate",
        "IODEC", "Crs", "DeltaN", "M0",
        "Cuc", "Eccentricity", "Cus", "sqrtA",
        "Toe", "Cic", "Omega0", "Cis",
        "Io", "Crc", "omega", "OmegaDot",
        "IDOT", "spare0", "IRNWeek", "spare1",
        "URA", "health", "TGD", "spare2",
        "TransTime", "spare3", "spare4", "spare5"}};

    /* clock terms are -TauN, +GammaN, message frame time */
    static const NavLayout glo_layout = {'R', 3, {
        "SVclockBias", "SVrelFreqBias", "MessageFrameTime",
        "X", "dX", "dX2", "health",
        "Y", "dY", "dY2", "FreqNum",
        "Z", "dZ", "dZ2", "AgeOpInfo"}};

    /* ver.3.05 adds a 4th line */
    static const NavLayout glo305_layout = {'R', 4, {
        "SVclockBias", "SVrelFreqBias", "MessageFrameTime",
        "X", "dX", "dX2", "health",
        "Y", "dY", "dY2", "FreqNum",
        "Z", "dZ", "dZ2", "AgeOpInfo",
        "StatusFlags", "DelayDiff", "URAI", "HealthFlags"}};

    static const NavLayout sbs_layout = {'S', 3, {
        "SVclockBias", "SVrelFreqBias", "MessageFrameTime",
        "X", "dX", "dX2", "health",
        "Y", "dY", "dY2", "URA",
        "Z", "dZ", "dZ2", "IODN"}};

    const NavLayout *nav_layout(char sys, double ver)
    {
        switch (sys) {
            case 'G': return &gps_layout;
            case 'J': return &qzs_layout;
            case 'E': return &gal_layout;
            case 'C': return &bds_layout;
            case 'I': return &irn_layout;
            case 'R': return ver >= 3.05 - 1E-6 ? &glo305_layout : &glo_layout;
            case 'S': return &sbs_layout;
            default:  return NULL;
        }
    }

    char nav2_sys(char type_char)
    {
        switch (type_char) {
            case 'N': return 'G';
            case 'G': return 'R';
            case 'H': return 'S';
            case 'L': return 'E';
            case 'J': return 'J';
            default:  return 0;
        }
    }

    bool read_orbit_lines(RinexLineReader &rd, int col0, NavRecord &rec, RinexError *err)
    {
        std::string buff;
        char msg[128];
        int i, k, nline = rec.layout->nline;
        bool ok;

        rec.orbit.assign(nline*NAV_NFIELD_LINE, RNX_NAN);

        for (i = 0; i < nline; i++) {
            /* a new record head or an empty line where a continuation line is expected */
            if ((ok = rd.next(buff)) && (trim(buff).empty() || !field_blank(buff, 0, col0))) {
                rd.unread();
                ok = false;
            }
            if (!ok) {
                snprintf(msg, sizeof(msg), "%s record of line %d has %d of %d orbit lines",
                         rec.sat.c_str(), rec.line, i, nline);
                set_error(err, RNX_ERR_TRUNCATED_RECORD, rd.lineno() + 1, 0, 0, msg);
                return false;
            }
            for (k = 0; k < NAV_NFIELD_LINE; k++) {
                if (!decode_num(buff, rd.lineno(), col0 + k*NAV_FIELD_LEN, NAV_FIELD_LEN, FIELD_FLOAT,
                                &rec.orbit[i*NAV_NFIELD_LINE + k], err)) return false;
            }
        }
        return true;
    }

}   // namespace gnss_rinex
