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

#ifndef RINEX_STREAM_HPP_
#define RINEX_STREAM_HPP_

#include <istream>
#include <string>

namespace gnss_rinex
{
    /* sequential line cursor over decompressed RINEX text with one line of pushback */
    class RinexLineReader
    {
    public:
        explicit RinexLineReader(std::istream &is);

        /* read next line without line terminator, false at end of input */
        bool next(std::string &line);
        /* push the last line back, it is returned again by the next call of next() */
        void unread();
        /* number of the last line returned (1-based) */
        int lineno() const { return lineno_; }

    private:
        std::istream &is_;
        std::string last_;
        bool pushed_;
        int lineno_;
    };

}   // namespace gnss_rinex

#endif
