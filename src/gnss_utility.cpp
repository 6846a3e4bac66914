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
* As many of the utility functions are adapted from RTKLIB,
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

#include "gnss_rinex/gnss_utility.hpp"
#include <cmath>
#include <cstdio>
#include <cstring>
#include <cctype>

namespace gnss_rinex
{
    gtime_t epoch2time(const double *ep)
    {
        const int doy[] = {1, 32, 60, 91, 121, 152, 182, 213, 244, 274, 305, 335};
        gtime_t time = {0, 0};
        int days, sec, year = (int)ep[0], mon = (int)ep[1], day = (int)ep[2];

        if (year < 1970 || 2099 < year || mon < 1 || 12 < mon) return time;

        /* leap year if year%4==0 in 1901-2099 */
        days = (year-1970)*365 + (year-1969)/4 + doy[mon-1] + day - 2 + (year%4==0&&mon>=3?1:0);
        sec = (int)floor(ep[5]);
        time.time = (time_t)days*86400 + (int)ep[3]*3600 + (int)ep[4]*60 + sec;
        time.sec = ep[5] - sec;
        return time;
    }

    void time2epoch(gtime_t t, double *ep)
    {
        const int mday[] = { /* # of days in a month */
            31,28,31,30,31,30,31,31,30,31,30,31,31,28,31,30,31,30,31,31,30,31,30,31,
            31,29,31,30,31,30,31,31,30,31,30,31,31,28,31,30,31,30,31,31,30,31,30,31
        };
        int days, sec, mon, day;

        /* leap year if year%4==0 in 1901-2099 */
        days = (int)(t.time/86400);
        sec = (int)(t.time - (time_t)days*86400);
        for (day = days%1461, mon = 0; mon < 48; mon++) {
            if (day >= mday[mon]) day -= mday[mon]; else break;
        }
        ep[0] = 1970 + days/1461*4 + mon/12;
        ep[1] = mon%12 + 1;
        ep[2] = day + 1;
        ep[3] = sec/3600;
        ep[4] = sec%3600/60;
        ep[5] = sec%60 + t.sec;
    }

    gtime_t time_add(gtime_t t, double sec)
    {
        double tt;
        t.sec += sec;
        tt = floor(t.sec);
        t.time += (time_t)tt;
        t.sec -= tt;
        return t;
    }

    double time_diff(gtime_t t1, gtime_t t2)
    {
        return difftime(t1.time, t2.time) + t1.sec - t2.sec;
    }

    bool time_zero(gtime_t t)
    {
        return t.time == 0 && t.sec == 0.0;
    }

    bool epoch_valid(const double *ep)
    {
        if (ep[0] < 1970 || ep[0] > 2099) return false;
        if (ep[1] < 1 || ep[1] > 12) return false;
        if (ep[2] < 1 || ep[2] > 31) return false;
        if (ep[3] < 0 || ep[3] > 24) return false;
        if (ep[4] < 0 || ep[4] > 59) return false;
        if (ep[5] < 0.0 || ep[5] >= 61.0) return false;
        return true;
    }

    int expand_year(int year)
    {
        if (year >= 100) return year;
        return year < YEAR_PIVOT ? year + 2000 : year + 1900;
    }

    std::string time_str(gtime_t t, int n)
    {
        double ep[6];
        char buff[64];

        if (n < 0) n = 0; else if (n > 12) n = 12;
        if (1.0 - t.sec < 0.5/pow(10.0, n)) {
            t.time++;
            t.sec = 0.0;
        }
        time2epoch(t, ep);
        snprintf(buff, sizeof(buff), "%04.0f/%02.0f/%02.0f %02.0f:%02.0f:%0*.*f",
                 ep[0], ep[1], ep[2], ep[3], ep[4], n <= 0 ? 2 : n + 3, n <= 0 ? 0 : n, ep[5]);
        return std::string(buff);
    }

    int code2sys(char code)
    {
        switch (code) {
            case 'G': return SYS_GPS;
            case 'R': return SYS_GLO;
            case 'E': return SYS_GAL;
            case 'S': return SYS_SBS;
            case 'J': return SYS_QZS;
            case 'C': return SYS_BDS;
            case 'I': return SYS_IRN;
            default:  return SYS_NONE;
        }
    }

    bool satid_norm(const std::string &field, char defsys, std::string &sat, int *prn)
    {
        std::string f = field;
        char sys;
        char buff[8];
        int num = 0, ndigit = 0;

        if (prn) *prn = -1;
        f.resize(3, ' ');
        sys = f[0] == ' ' ? defsys : f[0];

        for (size_t i = 1; i < 3; i++) {
            if (f[i] == ' ') continue;
            if (!isdigit((unsigned char)f[i])) {
                sat = f;
                return false;
            }
            num = num*10 + (f[i] - '0');
            ndigit++;
        }
        if (!ndigit) {
            sat = f;
            return false;
        }
        snprintf(buff, sizeof(buff), "%c%02d", sys, num);
        sat = buff;
        if (prn) *prn = num;
        return code2sys(sys) != SYS_NONE;
    }

    /* iterative ecef to geodetic conversion */
    Eigen::Vector3d ecef2geo(const Eigen::Vector3d &xyz)
    {
        const double RE_WGS84 = 6378137.0;
        const double FE_WGS84 = 1.0/298.257223563;
        double e2 = FE_WGS84*(2.0-FE_WGS84), r2 = xyz(0)*xyz(0) + xyz(1)*xyz(1), z, zk, v = RE_WGS84, sinp;
        Eigen::Vector3d llh;

        for (z = xyz(2), zk = 0.0; fabs(z-zk) >= 1E-4;) {
            zk = z;
            sinp = z/sqrt(r2+z*z);
            v = RE_WGS84/sqrt(1.0-e2*sinp*sinp);
            z = xyz(2) + v*e2*sinp;
        }
        llh(0) = r2 > 1E-12 ? atan(z/sqrt(r2)) : (xyz(2) > 0.0 ? M_PI/2.0 : -M_PI/2.0);
        llh(1) = r2 > 1E-12 ? atan2(xyz(1), xyz(0)) : 0.0;
        llh(2) = sqrt(r2+z*z) - v;
        return llh;
    }

    std::string trim(const std::string &s)
    {
        size_t start = s.find_first_not_of(" \t");
        size_t end = s.find_last_not_of(" \t");
        if (start == std::string::npos) return "";
        return s.substr(start, end - start + 1);
    }

}   // namespace gnss_rinex
