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
* This file provides the fixed-column numeric decoder shared by the
* header parser and the epoch/record grammars.
*/

#ifndef RINEX_NUMERIC_HPP_
#define RINEX_NUMERIC_HPP_

#include <string>
#include <vector>
#include "gnss_constant.hpp"

namespace gnss_rinex
{
    enum NumStat {
        NUM_OK = 0,         /* valid number */
        NUM_BLANK = 1,      /* blank or beyond end of line: absent */
        NUM_BAD = 2         /* non-blank and not a number */
    };

    enum FieldKind {
        FIELD_FLOAT = 0,    /* Fortran F/E/D edit descriptor */
        FIELD_INT = 1       /* Fortran I edit descriptor */
    };

    /* one fixed-width field of a record layout */
    struct FieldDesc
    {
        int col;            /* start column (0-index) */
        int width;          /* number of columns */
        int kind;           /* FIELD_??? */
        const char *name;
    };

    /* String to number conversion ----------------------------------------------------------
    * args   : const std::string &s       I   line
    *          int i                      I   start position (0-index)
    *          int n                      I   number of characters
    *          double *value              O   converted number (NaN unless NUM_OK)
    *          int kind                   I   FIELD_FLOAT or FIELD_INT
    * return : int - NUM_OK, NUM_BLANK or NUM_BAD
    * notes  : exponent markers D,d,E,e are equivalent, exponent sign is optional and the
    *          decimal point may be omitted. columns past the end of the line are blank.
    *---------------------------------------------------------------------------------------*/
    int str2num(const std::string &s, int i, int n, double *value, int kind = FIELD_FLOAT);

    /* Decode one numeric field reporting malformed input ------------------------------------
    * args   : const std::string &buff    I   line
    *          int line                   I   line number (1-based)
    *          int i,n                    I   start position (0-index), width
    *          int kind                   I   FIELD_???
    *          double *value              O   value (NaN if blank)
    *          RinexError *err            O   error (RNX_ERR_MALFORMED_NUMERIC)
    * return : bool - false if the field is malformed
    *---------------------------------------------------------------------------------------*/
    bool decode_num(const std::string &buff, int line, int i, int n, int kind,
                    double *value, RinexError *err);

    /* Decode a record layout ----------------------------------------------------------------
    * args   : const std::string &buff    I   line
    *          int line                   I   line number (1-based)
    *          const FieldDesc *desc      I   field layout
    *          int n                      I   number of fields
    *          double *value              O   values in layout order (NaN if blank)
    *          RinexError *err            O   error of the first malformed field
    * return : bool - false if a field is malformed
    *---------------------------------------------------------------------------------------*/
    bool decode_fields(const std::string &buff, int line, const FieldDesc *desc, int n,
                       double *value, RinexError *err);

    /* true if columns i..i+n-1 hold only spaces or lie past the end of the line */
    bool field_blank(const std::string &s, int i, int n);

    /* columns i..i+n-1 of a line, padded with spaces past the end of the line */
    std::string col_field(const std::string &s, int i, int n);

    /* fill error struct and log it, err may be NULL */
    void set_error(RinexError *err, int code, int line, int col, int width, const std::string &msg);

    /* append a recoverable condition to the warning list and log it */
    void add_warning(std::vector<RinexWarning> &warns, int code, int line, const std::string &sat,
                     const std::string &msg);

    const char *rnx_errmsg(int code);
    const char *rnx_warnmsg(int code);

}   // namespace gnss_rinex

#endif
