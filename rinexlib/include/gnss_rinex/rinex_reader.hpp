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
* This file provides the decode entry points for RINEX 2.x/3.x observation
* and navigation files.
*/

#ifndef RINEX_READER_HPP_
#define RINEX_READER_HPP_

#include <istream>
#include <vector>
#include <string>
#include "gnss_constant.hpp"
#include "rinex_assembler.hpp"

namespace gnss_rinex
{
    /* set options that select everything */
    void init_rnxopt(RnxOpt &opt);

    /* Parse option string ---------------------------------------------------------------------
    * args   : const std::string &str     I   options separated by spaces
    *                                         -SYS=GRE      systems to keep
    *                                         -MEAS=C1,L1C  obs code prefixes to keep
    *                                         -TS=y/m/d,h:m:s, -TE=y/m/d,h:m:s time window
    *                                         -TINT=30      decimation interval (s)
    *                                         -IND          output lli/ssi variables
    *          RnxOpt &opt                IO  options
    * return : bool - false if an option value is invalid
    * notes  : unknown options are ignored with a warning
    *---------------------------------------------------------------------------------------*/
    bool parse_rnxopt(const std::string &str, RnxOpt &opt);

    /* Read RINEX file from a stream -----------------------------------------------------------
    * args   : std::istream &is           I   decompressed RINEX text
    *          const RnxOpt &opt          I   options
    *          RinexDataset &data         O   dataset
    *          RinexError *err            O   fatal error (code RNX_OK on success)
    * return : bool - true if success
    * notes  : header -> grammar selection -> body -> dataset, the file is abandoned on the
    *          first fatal error. recoverable conditions are listed in data.warnings.
    *---------------------------------------------------------------------------------------*/
    bool readrnx(std::istream &is, const RnxOpt &opt, RinexDataset &data, RinexError *err);

    /* read RINEX file by path, see readrnx() */
    bool readrnxfile(const std::string &file, const RnxOpt &opt, RinexDataset &data, RinexError *err);

    /* Read RINEX files in parallel ------------------------------------------------------------
    * args   : const std::vector<std::string> &files  I   file paths
    *          const RnxOpt &opt          I   options
    *          int nthread                I   number of workers (0: hardware concurrency)
    *          std::vector<RinexDataset> &datas   O   dataset per file
    *          std::vector<RinexError> &errs      O   error per file
    * return : bool - true if every file was decoded
    * notes  : each file is decoded by one worker with its own cursor and builder
    *---------------------------------------------------------------------------------------*/
    bool readrnxfiles(const std::vector<std::string> &files, const RnxOpt &opt, int nthread,
                      std::vector<RinexDataset> &datas, std::vector<RinexError> &errs);

    /* read header only, the body is not decoded */
    bool readrnxh_only(std::istream &is, RinexHeader &hdr, RinexError *err);
    bool readrnxh_only(const std::string &file, RinexHeader &hdr, RinexError *err);

}   // namespace gnss_rinex

#endif
