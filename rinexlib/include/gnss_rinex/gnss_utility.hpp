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
*/

#ifndef GNSS_UTILITY_HPP_
#define GNSS_UTILITY_HPP_

#include <string>
#include "gnss_constant.hpp"

namespace gnss_rinex
{
    /* convert calendar day/time to gtime_t ------------------------------------------------
    * args   : const double *ep             I   day/time {year,month,day,hour,min,sec}
    * return : gtime_t struct (zero time if the date is out of range)
    *---------------------------------------------------------------------------------------*/
    gtime_t epoch2time(const double *ep);

    /* convert gtime_t to calendar day/time ------------------------------------------------
    * args   : gtime_t t                    I   gtime_t struct
    *          double *ep                   O   day/time {year,month,day,hour,min,sec}
    * return : none
    *---------------------------------------------------------------------------------------*/
    void time2epoch(gtime_t t, double *ep);

    gtime_t time_add(gtime_t t, double sec);
    double time_diff(gtime_t t1, gtime_t t2);

    /* true if t is the zero time used for "not given" */
    bool time_zero(gtime_t t);

    /* check calendar fields of a decoded epoch ---------------------------------------------
    * args   : const double *ep             I   day/time {year,month,day,hour,min,sec}
    * return : true if every field is inside its calendar range
    *---------------------------------------------------------------------------------------*/
    bool epoch_valid(const double *ep);

    /* expand two-digit year: yy<80 -> 20yy, else 19yy, four-digit years unchanged */
    int expand_year(int year);

    /* time to string "yyyy/mm/dd hh:mm:ss.sss" with n decimals */
    std::string time_str(gtime_t t, int n);

    /* satellite system code (G,R,...) to SYS_??? (SYS_NONE if unknown) */
    int code2sys(char code);

    /* normalize satellite id field ----------------------------------------------------------
    * args   : const std::string &field     I   3-column satellite field ("G01","G 1"," 1")
    *          char defsys                  I   system used for a blank system letter
    *          std::string &sat             O   normalized id ("G01")
    *          int *prn                     O   prn number (-1 if not numeric)
    * return : true if the system letter is known and the prn is numeric
    *---------------------------------------------------------------------------------------*/
    bool satid_norm(const std::string &field, char defsys, std::string &sat, int *prn);

    /* transform ecef position to geodetic {lat,lon,h} (rad,m), WGS84 */
    Eigen::Vector3d ecef2geo(const Eigen::Vector3d &xyz);

    /* trim leading and trailing spaces */
    std::string trim(const std::string &s);

}   // namespace gnss_rinex

#endif
