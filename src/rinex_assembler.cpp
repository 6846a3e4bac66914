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

#include "gnss_rinex/rinex_assembler.hpp"
#include "gnss_rinex/rinex_numeric.hpp"
#include "gnss_rinex/gnss_utility.hpp"
#include <algorithm>
#include <cmath>
#include <glog/logging.h>

namespace gnss_rinex
{
    static std::pair<long long, long long> time_key(gtime_t t)
    {
        long long s = (long long)t.time, f = llround(t.sec*1E8);
        if (f >= 100000000LL) {
            s++;
            f -= 100000000LL;
        }
        return std::make_pair(s, f);
    }

    /* Screen time by window and interval -----------------------------------------------------
    * args   : gtime_t time               I   epoch time
    *          gtime_t ts,te              I   time start, end (0: all)
    *          double ti                  I   time interval (0: all)
    *          const gtime_t *last_time   I   last accepted time (0: none)
    * return : bool - true if time passes screening
    *---------------------------------------------------------------------------------------*/
    /* loss of lock indicator is kept for L1/L2 carrier phase only */
    static bool has_lli(const std::string &code)
    {
        return code.compare(0, 2, "L1") == 0 || code.compare(0, 2, "L2") == 0;
    }

    static bool screent(gtime_t time, gtime_t ts, gtime_t te, double ti, const gtime_t *last_time)
    {
        if (!time_zero(ts) && time_diff(time, ts) < 0.0) return false;
        if (!time_zero(te) && time_diff(time, te) > 0.0) return false;

        if (ti > 0.0 && !time_zero(*last_time)) {
            if (time_diff(time, *last_time) < ti - 1E-9) return false;
        }
        return true;
    }

    DatasetBuilder::DatasetBuilder(const RinexHeader &hdr, const RnxOpt &opt)
        : hdr_(hdr), opt_(opt), has_prev_(false)
    {
        last_time_.time = 0; last_time_.sec = 0.0;
        prev_time_ = last_time_;

        if (hdr_.type != RINEX_TYPE_OBS) return;

        /* variables of the declared obs types in header order */
        std::vector<std::string> codes = hdr_.obs_types;
        for (std::map<char, std::vector<std::string>>::const_iterator it = hdr_.sys_obs_types.begin();
             it != hdr_.sys_obs_types.end(); ++it) {
            if (!use_sys(it->first)) continue;
            codes.insert(codes.end(), it->second.begin(), it->second.end());
        }
        for (size_t i = 0; i < codes.size(); i++) {
            if (!use_meas(codes[i])) continue;
            field_index(codes[i]);
            if (opt_.indicators) {
                if (has_lli(codes[i])) field_index(codes[i] + "lli");
                field_index(codes[i] + "ssi");
            }
        }
    }

    bool DatasetBuilder::use_sys(char sys) const
    {
        return opt_.sys.empty() || opt_.sys.find(sys) != std::string::npos;
    }

    bool DatasetBuilder::use_meas(const std::string &code) const
    {
        if (opt_.meas.empty()) return true;
        for (size_t i = 0; i < opt_.meas.size(); i++) {
            if (!code.compare(0, opt_.meas[i].size(), opt_.meas[i])) return true;
        }
        return false;
    }

    int DatasetBuilder::time_index(gtime_t t, bool add)
    {
        TimeKey key = time_key(t);
        std::map<TimeKey, int>::const_iterator it = time_map_.find(key);

        if (it != time_map_.end()) return it->second;
        if (!add) return -1;

        time_map_[key] = (int)times_.size();
        times_.push_back(t);
        clk_off_.push_back(RNX_NAN);
        flags_.push_back(EPOCH_OK);
        return (int)times_.size() - 1;
    }

    int DatasetBuilder::sat_index(const std::string &sat)
    {
        std::map<std::string, int>::const_iterator it = sat_map_.find(sat);

        if (it != sat_map_.end()) return it->second;
        sat_map_[sat] = (int)sats_.size();
        sats_.push_back(sat);
        return (int)sats_.size() - 1;
    }

    int DatasetBuilder::field_index(const std::string &name)
    {
        std::map<std::string, int>::const_iterator it = field_map_.find(name);

        if (it != field_map_.end()) return it->second;
        field_map_[name] = (int)fields_.size();
        fields_.push_back(name);
        return (int)fields_.size() - 1;
    }

    std::map<int, double> &DatasetBuilder::open_cell(int ti, int si, int line)
    {
        std::pair<int, int> key(ti, si);
        std::map<std::pair<int, int>, std::map<int, double>>::iterator it = cells_.find(key);

        if (it == cells_.end()) return cells_[key];

        /* later record replaces the earlier one entirely */
        warn(RNX_WARN_DUPLICATE_RECORD, line, sats_[si], "duplicate record at " + time_str(times_[ti], 3));
        it->second.clear();
        return it->second;
    }

    void DatasetBuilder::warn(int code, int line, const std::string &sat, const std::string &msg)
    {
        add_warning(warnings_, code, line, sat, msg);
    }

    void DatasetBuilder::add_warnings(const std::vector<RinexWarning> &warns)
    {
        warnings_.insert(warnings_.end(), warns.begin(), warns.end());
    }

    void DatasetBuilder::add_event(const EpochEvent &event)
    {
        events_.push_back(event);
    }

    bool DatasetBuilder::add_obs_epoch(const ObsEpoch &epoch)
    {
        int ti, si;

        if (has_prev_ && time_diff(epoch.time, prev_time_) < 0.0) {
            warn(RNX_WARN_TIME_ORDER, epoch.line, "", "epoch " + time_str(epoch.time, 3) +
                 " earlier than " + time_str(prev_time_, 3));
        }
        prev_time_ = epoch.time;
        has_prev_ = true;

        if ((ti = time_index(epoch.time, false)) < 0) {
            if (!screent(epoch.time, opt_.ts, opt_.te, opt_.ti, &last_time_)) return false;
            ti = time_index(epoch.time, true);
            last_time_ = epoch.time;
        }
        clk_off_[ti] = epoch.clk_off;
        flags_[ti] = epoch.flag;

        for (size_t i = 0; i < epoch.recs.size(); i++) {
            const ObsRecord &rec = epoch.recs[i];
            if (!use_sys(rec.sat[0])) continue;

            si = sat_index(rec.sat);
            std::map<int, double> &cell = open_cell(ti, si, epoch.line);

            for (std::map<std::string, ObsValue>::const_iterator it = rec.meas.begin();
                 it != rec.meas.end(); ++it) {
                if (!use_meas(it->first)) continue;
                if (!std::isnan(it->second.val)) cell[field_index(it->first)] = it->second.val;
                if (!opt_.indicators) continue;
                if (it->second.lli >= 0 && has_lli(it->first)) {
                    cell[field_index(it->first + "lli")] = it->second.lli;
                }
                if (it->second.ssi >= 0) cell[field_index(it->first + "ssi")] = it->second.ssi;
            }
        }
        return true;
    }

    bool DatasetBuilder::add_nav_record(const NavRecord &rec)
    {
        const NavLayout *layout = rec.layout;
        double val;

        if (!use_sys(rec.sat[0])) return false;
        if (!screent(rec.toc, opt_.ts, opt_.te, 0.0, &last_time_)) return false;

        int ti = time_index(rec.toc, true);
        int si = sat_index(rec.sat);
        std::map<int, double> &cell = open_cell(ti, si, rec.line);

        for (size_t k = 0; k < layout->fields.size(); k++) {
            const std::string &name = layout->fields[k];
            if (!name.compare(0, 5, "spare")) continue;

            if (k < 3) val = rec.clk[k];
            else val = k - 3 < rec.orbit.size() ? rec.orbit[k-3] : RNX_NAN;

            int fi = field_index(name);
            if (!std::isnan(val)) cell[fi] = val;
        }
        return true;
    }

    static double median_interval(const std::vector<gtime_t> &times)
    {
        std::vector<double> dt;

        for (size_t i = 1; i < times.size(); i++) dt.push_back(time_diff(times[i], times[i-1]));
        if (dt.empty()) return RNX_NAN;

        size_t n = dt.size()/2;
        std::nth_element(dt.begin(), dt.begin() + n, dt.end());
        if (dt.size() % 2) return dt[n];

        double upper = dt[n];
        std::nth_element(dt.begin(), dt.begin() + n - 1, dt.end());
        return 0.5*(dt[n-1] + upper);
    }

    void DatasetBuilder::finalize(RinexDataset &data)
    {
        int nt = (int)times_.size(), ns = (int)sats_.size(), k;
        std::vector<int> order(nt), rank(nt);
        const std::vector<gtime_t> &times = times_;

        for (k = 0; k < nt; k++) order[k] = k;
        std::stable_sort(order.begin(), order.end(), [&times](int a, int b) {
            return time_diff(times[a], times[b]) < 0.0;
        });
        for (k = 0; k < nt; k++) rank[order[k]] = k;

        data = RinexDataset();
        data.type = hdr_.type;
        data.header = hdr_;
        data.sat = sats_;
        data.fields = fields_;
        data.time.resize(nt);
        for (k = 0; k < nt; k++) data.time[k] = times_[order[k]];

        if (hdr_.type == RINEX_TYPE_OBS) {
            data.clk_off.resize(nt);
            data.flags.resize(nt);
            for (k = 0; k < nt; k++) {
                data.clk_off[k] = clk_off_[order[k]];
                data.flags[k] = flags_[order[k]];
            }
        }

        std::vector<Eigen::MatrixXd *> mats(fields_.size());
        for (size_t i = 0; i < fields_.size(); i++) {
            Eigen::MatrixXd &m = data.data[fields_[i]];
            m = Eigen::MatrixXd::Constant(nt, ns, RNX_NAN);
            mats[i] = &m;
        }
        for (std::map<std::pair<int, int>, std::map<int, double>>::const_iterator it = cells_.begin();
             it != cells_.end(); ++it) {
            int row = rank[it->first.first], col = it->first.second;
            for (std::map<int, double>::const_iterator jt = it->second.begin(); jt != it->second.end(); ++jt) {
                (*mats[jt->first])(row, col) = jt->second;
            }
        }
        data.events = events_;
        data.warnings = warnings_;

        if (!std::isnan(hdr_.interval) && hdr_.interval > 0.0) data.interval = hdr_.interval;
        else if (hdr_.type == RINEX_TYPE_OBS) data.interval = median_interval(data.time);
        else data.interval = RNX_NAN;

        LOG(INFO) << "finalize: ntime=" << nt << " nsat=" << ns << " nfield=" << fields_.size()
                  << " nevent=" << events_.size() << " nwarn=" << warnings_.size();

        times_.clear(); time_map_.clear();
        sats_.clear(); sat_map_.clear();
        fields_.clear(); field_map_.clear();
        cells_.clear(); clk_off_.clear(); flags_.clear();
        events_.clear(); warnings_.clear();
    }

    int dataset_time_index(const RinexDataset &data, gtime_t t)
    {
        std::pair<long long, long long> key = time_key(t);

        for (size_t i = 0; i < data.time.size(); i++) {
            if (time_key(data.time[i]) == key) return (int)i;
        }
        return -1;
    }

    int dataset_sat_index(const RinexDataset &data, const std::string &sat)
    {
        std::vector<std::string>::const_iterator it = std::find(data.sat.begin(), data.sat.end(), sat);
        return it == data.sat.end() ? -1 : (int)(it - data.sat.begin());
    }

    double dataset_value(const RinexDataset &data, const std::string &field, gtime_t t,
                         const std::string &sat)
    {
        std::map<std::string, Eigen::MatrixXd>::const_iterator it = data.data.find(field);
        int ti = dataset_time_index(data, t), si = dataset_sat_index(data, sat);

        if (it == data.data.end() || ti < 0 || si < 0) return RNX_NAN;
        return it->second(ti, si);
    }

}   // namespace gnss_rinex
