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

#include "gnss_rinex/rinex_stream.hpp"

namespace gnss_rinex
{
    RinexLineReader::RinexLineReader(std::istream &is)
        : is_(is), pushed_(false), lineno_(0)
    {
    }

    bool RinexLineReader::next(std::string &line)
    {
        if (pushed_) {
            pushed_ = false;
            line = last_;
            lineno_++;
            return true;
        }
        if (!std::getline(is_, last_)) return false;

        /* dos line terminator */
        if (!last_.empty() && last_[last_.size()-1] == '\r') last_.erase(last_.size()-1);
        line = last_;
        lineno_++;
        return true;
    }

    void RinexLineReader::unread()
    {
        if (pushed_ || lineno_ == 0) return;
        pushed_ = true;
        lineno_--;
    }

}   // namespace gnss_rinex
