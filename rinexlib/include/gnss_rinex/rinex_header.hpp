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

#ifndef RINEX_HEADER_HPP_
#define RINEX_HEADER_HPP_

#include <vector>
#include "gnss_constant.hpp"
#include "rinex_stream.hpp"

namespace gnss_rinex
{
    /* set every header field to its "not given" value */
    void init_header(RinexHeader &hdr);

    /* file type letter of RINEX VERSION / TYPE to RINEX_TYPE_??? */
    int rnx_filetype(char type_char);

    /* Read RINEX header ---------------------------------------------------------------------
    * args   : RinexLineReader &rd        IO  line cursor, left after END OF HEADER
    *          RinexHeader &hdr           O   header metadata
    *          std::vector<RinexWarning> &warns IO recoverable header conditions
    *          RinexError *err            O   fatal error
    * return : bool - false on fatal error (missing version line, malformed header field,
    *          input ending inside the header)
    * notes  : records are dispatched on the label in columns 61-80, not on line order.
    *          labels without a decoder are kept in hdr.extra.
    *---------------------------------------------------------------------------------------*/
    bool readrnxh(RinexLineReader &rd, RinexHeader &hdr, std::vector<RinexWarning> &warns,
                  RinexError *err);

}   // namespace gnss_rinex

#endif
