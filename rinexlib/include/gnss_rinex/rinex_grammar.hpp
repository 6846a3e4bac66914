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
* Epoch/record grammars of the four RINEX variants and the dispatcher
* selecting one of them from the decoded header.
*/

#ifndef RINEX_GRAMMAR_HPP_
#define RINEX_GRAMMAR_HPP_

#include <memory>
#include <set>
#include "gnss_constant.hpp"
#include "rinex_stream.hpp"
#include "rinex_assembler.hpp"

namespace gnss_rinex
{
    enum RinexGrammarKind {
        GRAMMAR_V2_NAV = 0,
        GRAMMAR_V2_OBS,
        GRAMMAR_V3_NAV,
        GRAMMAR_V3_OBS
    };

    /* observation types resolved from the header */
    struct ObsTypeTable
    {
        std::vector<std::string> global;                    /* ver.2 */
        std::map<char, std::vector<std::string>> sys;       /* ver.3 */

        /* type list for a system, NULL if the system has none */
        const std::vector<std::string> *lookup(char sys) const;
    };

    /* build the obs type table of an observation header */
    void resolve_obs_types(const RinexHeader &hdr, ObsTypeTable &tbl);

    /* broadcast orbit layout of a system, NULL if unsupported */
    const NavLayout *nav_layout(char sys, double ver);

    /* satellite system of a ver.2 nav file from its type letter (N,G,H,L,J) */
    char nav2_sys(char type_char);

    /* Read broadcast orbit lines of a nav record ------------------------------------------------
    * args   : RinexLineReader &rd        IO  line cursor, after the record head line
    *          int col0                   I   column of the first value (ver.2: 3, ver.3: 4)
    *          NavRecord &rec             IO  record with layout set, orbit values filled
    *          RinexError *err            O   error
    * return : bool - false if a line is missing (RNX_ERR_TRUNCATED_RECORD) or malformed
    *-------------------------------------------------------------------------------------------*/
    bool read_orbit_lines(RinexLineReader &rd, int col0, NavRecord &rec, RinexError *err);

    class RinexGrammar
    {
    public:
        virtual ~RinexGrammar() {}

        virtual int kind() const = 0;

        /* variant specific checks and defaults taken from the header --------------------------
        * args   : const RinexHeader &hdr    I   decoded header
        *          std::vector<RinexWarning> &warns IO warnings
        *          RinexError *err            O   error
        * return : bool - false on fatal error
        *-------------------------------------------------------------------------------------*/
        virtual bool parse_header(const RinexHeader &hdr, std::vector<RinexWarning> &warns,
                                  RinexError *err) = 0;

        /* decode the body after END OF HEADER ---------------------------------------------------
        * args   : RinexLineReader &rd        IO  line cursor
        *          DatasetBuilder &builder    IO  dataset builder
        *          RinexError *err            O   error
        * return : bool - false on fatal error, the file is abandoned
        *-------------------------------------------------------------------------------------*/
        virtual bool parse_body(RinexLineReader &rd, DatasetBuilder &builder, RinexError *err) = 0;
    };
    typedef std::shared_ptr<RinexGrammar> RinexGrammarPtr;

    class RinexObs2Grammar : public RinexGrammar
    {
    public:
        explicit RinexObs2Grammar(const ObsTypeTable &tbl);
        int kind() const { return GRAMMAR_V2_OBS; }
        bool parse_header(const RinexHeader &hdr, std::vector<RinexWarning> &warns, RinexError *err);
        bool parse_body(RinexLineReader &rd, DatasetBuilder &builder, RinexError *err);

    private:
        bool decode_obs(const std::string &buff, int line, int i0, int n, ObsRecord &rec,
                        RinexError *err) const;
        bool check_sat(const std::string &field, int line, DatasetBuilder &builder,
                       std::string &sat) const;

        ObsTypeTable tbl_;
        char defsys_;           /* system of a blank satellite letter */
        char filesys_;          /* single system of the file, 0: mixed */
    };

    class RinexNav2Grammar : public RinexGrammar
    {
    public:
        RinexNav2Grammar();
        int kind() const { return GRAMMAR_V2_NAV; }
        bool parse_header(const RinexHeader &hdr, std::vector<RinexWarning> &warns, RinexError *err);
        bool parse_body(RinexLineReader &rd, DatasetBuilder &builder, RinexError *err);

    private:
        char sys_;
        const NavLayout *layout_;
    };

    class RinexObs3Grammar : public RinexGrammar
    {
    public:
        explicit RinexObs3Grammar(const ObsTypeTable &tbl);
        int kind() const { return GRAMMAR_V3_OBS; }
        bool parse_header(const RinexHeader &hdr, std::vector<RinexWarning> &warns, RinexError *err);
        bool parse_body(RinexLineReader &rd, DatasetBuilder &builder, RinexError *err);

    private:
        bool decode_sat(const std::string &buff, int line, DatasetBuilder &builder,
                        std::vector<ObsRecord> &recs, RinexError *err);

        ObsTypeTable tbl_;
        std::set<char> unknown_sys_;    /* systems already reported without type list */
    };

    class RinexNav3Grammar : public RinexGrammar
    {
    public:
        RinexNav3Grammar();
        int kind() const { return GRAMMAR_V3_NAV; }
        bool parse_header(const RinexHeader &hdr, std::vector<RinexWarning> &warns, RinexError *err);
        bool parse_body(RinexLineReader &rd, DatasetBuilder &builder, RinexError *err);

    private:
        double ver_;
    };

    /* Select epoch/record grammar ---------------------------------------------------------------
    * args   : const RinexHeader &hdr     I   decoded header
    *          RinexError *err            O   error (RNX_ERR_UNSUPPORTED_VERSION/TYPE)
    * return : RinexGrammarPtr - grammar variant, nullptr on error
    * notes  : depends on the header only, observation grammars carry the resolved type table
    *-------------------------------------------------------------------------------------------*/
    RinexGrammarPtr select_grammar(const RinexHeader &hdr, RinexError *err);

}   // namespace gnss_rinex

#endif
