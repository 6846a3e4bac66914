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

#ifndef RINEX_ASSEMBLER_HPP_
#define RINEX_ASSEMBLER_HPP_

#include <map>
#include <utility>
#include "gnss_constant.hpp"

namespace gnss_rinex
{
    /* Dataset builder ----------------------------------------------------------------------------
    * accumulates decoded epochs/records into growing time, satellite and variable index tables
    * with values keyed by (time index, satellite index). finalize() turns the store into the
    * (time x satellite) matrices of a RinexDataset, time axis in chronological order.
    *-------------------------------------------------------------------------------------------*/
    class DatasetBuilder
    {
    public:
        DatasetBuilder(const RinexHeader &hdr, const RnxOpt &opt);

        /* add an observation epoch (flag 0/1), returns false if screened out by time */
        bool add_obs_epoch(const ObsEpoch &epoch);
        /* add a broadcast record, returns false if screened out by time or system */
        bool add_nav_record(const NavRecord &rec);
        void add_event(const EpochEvent &event);

        void warn(int code, int line, const std::string &sat, const std::string &msg);
        void add_warnings(const std::vector<RinexWarning> &warns);
        const std::vector<RinexWarning> &warnings() const { return warnings_; }

        /* true if a satellite system passes the system filter */
        bool use_sys(char sys) const;

        int ntime() const { return (int)times_.size(); }
        int nsat() const { return (int)sats_.size(); }

        /* build the dataset, the builder is left empty */
        void finalize(RinexDataset &data);

    private:
        typedef std::pair<long long, long long> TimeKey;    /* (s, 1e-8 s) */

        int time_index(gtime_t t, bool add);
        int sat_index(const std::string &sat);
        int field_index(const std::string &name);
        bool use_meas(const std::string &code) const;
        /* open the cell of (time, satellite), clearing a duplicate */
        std::map<int, double> &open_cell(int ti, int si, int line);

        const RinexHeader &hdr_;
        RnxOpt opt_;

        std::vector<gtime_t> times_;
        std::map<TimeKey, int> time_map_;
        std::vector<std::string> sats_;
        std::map<std::string, int> sat_map_;
        std::vector<std::string> fields_;
        std::map<std::string, int> field_map_;
        std::map<std::pair<int, int>, std::map<int, double>> cells_;   /* field index -> value */
        std::vector<double> clk_off_;
        std::vector<int> flags_;
        std::vector<EpochEvent> events_;
        std::vector<RinexWarning> warnings_;

        gtime_t last_time_;     /* last accepted epoch for decimation */
        gtime_t prev_time_;     /* previous epoch in file order */
        bool has_prev_;
    };

    /* index of a time on the dataset time axis, -1 if none */
    int dataset_time_index(const RinexDataset &data, gtime_t t);
    /* index of a satellite on the dataset satellite axis, -1 if none */
    int dataset_sat_index(const RinexDataset &data, const std::string &sat);
    /* value of a variable at (time, satellite), NaN if absent */
    double dataset_value(const RinexDataset &data, const std::string &field, gtime_t t,
                         const std::string &sat);

}   // namespace gnss_rinex

#endif
