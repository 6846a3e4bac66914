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
* Observation type tables and grammar selection.
*/

#include "gnss_rinex/rinex_grammar.hpp"
#include "gnss_rinex/rinex_numeric.hpp"
#include <cstdio>
#include <memory>

namespace gnss_rinex
{
    const std::vector<std::string> *ObsTypeTable::lookup(char s) const
    {
        if (!global.empty()) return &global;

        std::map<char, std::vector<std::string>>::const_iterator it = sys.find(s);
        if (it == sys.end() || it->second.empty()) return NULL;
        return &it->second;
    }

    void resolve_obs_types(const RinexHeader &hdr, ObsTypeTable &tbl)
    {
        tbl.global.clear();
        tbl.sys.clear();
        if (hdr.version < 3.0) tbl.global = hdr.obs_types;
        else tbl.sys = hdr.sys_obs_types;
    }

    RinexGrammarPtr select_grammar(const RinexHeader &hdr, RinexError *err)
    {
        ObsTypeTable tbl;
        char msg[64];

        if (hdr.version < 2.0 || hdr.version >= 4.0) {
            snprintf(msg, sizeof(msg), "version %.2f not supported", hdr.version);
            set_error(err, RNX_ERR_UNSUPPORTED_VERSION, 0, 1, 9, msg);
            return RinexGrammarPtr();
        }
        switch (hdr.type) {
            case RINEX_TYPE_OBS:
                resolve_obs_types(hdr, tbl);
                if (hdr.version < 3.0) return std::make_shared<RinexObs2Grammar>(tbl);
                return std::make_shared<RinexObs3Grammar>(tbl);
            case RINEX_TYPE_NAV:
                if (hdr.version < 3.0) return std::make_shared<RinexNav2Grammar>();
                return std::make_shared<RinexNav3Grammar>();
            default:
                snprintf(msg, sizeof(msg), "file type '%c' not supported", hdr.type_char);
                set_error(err, RNX_ERR_UNSUPPORTED_TYPE, 0, 21, 1, msg);
                return RinexGrammarPtr();
        }
    }

}   // namespace gnss_rinex
