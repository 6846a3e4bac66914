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
* Grammar dispatch and decode entry points.
*/

#include "gnss_rinex/rinex_reader.hpp"
#include "gnss_rinex/rinex_header.hpp"
#include "gnss_rinex/rinex_grammar.hpp"
#include "gnss_rinex/rinex_numeric.hpp"
#include "gnss_rinex/gnss_utility.hpp"
#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <thread>
#include <glog/logging.h>

namespace gnss_rinex
{
    static void set_ok(RinexError *err)
    {
        if (!err) return;
        err->code = RNX_OK;
        err->line = err->col = err->width = 0;
        err->msg.clear();
    }

    void init_rnxopt(RnxOpt &opt)
    {
        opt.ts.time = 0; opt.ts.sec = 0.0;
        opt.te = opt.ts;
        opt.ti = 0.0;
        opt.sys.clear();
        opt.meas.clear();
        opt.indicators = false;
    }

    static bool str2opt_time(const std::string &val, gtime_t *t)
    {
        double ep[6] = {0};

        if (sscanf(val.c_str(), "%lf/%lf/%lf,%lf:%lf:%lf", ep, ep+1, ep+2, ep+3, ep+4, ep+5) < 3) {
            return false;
        }
        if (!epoch_valid(ep)) return false;
        *t = epoch2time(ep);
        return true;
    }

    bool parse_rnxopt(const std::string &str, RnxOpt &opt)
    {
        std::istringstream iss(str);
        std::string tok;
        bool stat = true;

        while (iss >> tok) {
            size_t p = tok.find('=');
            std::string key = tok.substr(0, p), val = p == std::string::npos ? "" : tok.substr(p + 1);

            if (key == "-SYS") {
                opt.sys = val;
            }
            else if (key == "-MEAS") {
                std::istringstream ms(val);
                std::string code;
                opt.meas.clear();
                while (std::getline(ms, code, ',')) {
                    if (!code.empty()) opt.meas.push_back(code);
                }
            }
            else if (key == "-TS" || key == "-TE") {
                if (!str2opt_time(val, key == "-TS" ? &opt.ts : &opt.te)) {
                    LOG(ERROR) << "parse_rnxopt: invalid time " << tok;
                    stat = false;
                }
            }
            else if (key == "-TINT") {
                char *end;
                double ti = strtod(val.c_str(), &end);
                if (val.empty() || *end || ti < 0.0) {
                    LOG(ERROR) << "parse_rnxopt: invalid interval " << tok;
                    stat = false;
                }
                else opt.ti = ti;
            }
            else if (key == "-IND") {
                opt.indicators = true;
            }
            else {
                LOG(WARNING) << "parse_rnxopt: unknown option " << tok;
            }
        }
        return stat;
    }

    bool readrnx(std::istream &is, const RnxOpt &opt, RinexDataset &data, RinexError *err)
    {
        RinexLineReader rd(is);
        RinexHeader hdr;
        std::vector<RinexWarning> warns;
        RinexGrammarPtr grammar;

        set_ok(err);

        if (!readrnxh(rd, hdr, warns, err)) return false;
        if (!(grammar = select_grammar(hdr, err))) return false;
        if (!grammar->parse_header(hdr, warns, err)) return false;

        DatasetBuilder builder(hdr, opt);
        builder.add_warnings(warns);

        if (!grammar->parse_body(rd, builder, err)) return false;

        builder.finalize(data);
        LOG(INFO) << "readrnx: ver=" << hdr.version << " type=" << hdr.type_char
                  << " ntime=" << data.time.size() << " nsat=" << data.sat.size()
                  << " nwarn=" << data.warnings.size();
        return true;
    }

    bool readrnxfile(const std::string &file, const RnxOpt &opt, RinexDataset &data, RinexError *err)
    {
        std::ifstream ifs(file.c_str());

        if (!ifs) {
            set_error(err, RNX_ERR_FILE_OPEN, 0, 0, 0, "cannot open file: " + file);
            return false;
        }
        LOG(INFO) << "readrnxfile: " << file;
        if (!readrnx(ifs, opt, data, err)) {
            if (err) err->msg += " (" + file + ")";
            return false;
        }
        return true;
    }

    bool readrnxfiles(const std::vector<std::string> &files, const RnxOpt &opt, int nthread,
                      std::vector<RinexDataset> &datas, std::vector<RinexError> &errs)
    {
        const size_t n = files.size();
        std::vector<char> stat(n, 0);
        std::vector<std::thread> workers;
        std::atomic<size_t> next(0);

        datas.assign(n, RinexDataset());
        errs.assign(n, RinexError());

        if (nthread <= 0) nthread = (int)std::thread::hardware_concurrency();
        if (nthread <= 0) nthread = 1;
        if ((size_t)nthread > n) nthread = (int)n;

        for (int i = 0; i < nthread; i++) {
            workers.push_back(std::thread([&]() {
                size_t k;
                while ((k = next++) < n) {
                    stat[k] = readrnxfile(files[k], opt, datas[k], &errs[k]) ? 1 : 0;
                }
            }));
        }
        for (size_t i = 0; i < workers.size(); i++) workers[i].join();

        size_t nok = 0;
        for (size_t i = 0; i < n; i++) nok += stat[i];
        LOG(INFO) << "readrnxfiles: nfile=" << n << " ok=" << nok << " nthread=" << workers.size();
        return nok == n;
    }

    bool readrnxh_only(std::istream &is, RinexHeader &hdr, RinexError *err)
    {
        RinexLineReader rd(is);
        std::vector<RinexWarning> warns;

        set_ok(err);
        return readrnxh(rd, hdr, warns, err);
    }

    bool readrnxh_only(const std::string &file, RinexHeader &hdr, RinexError *err)
    {
        std::ifstream ifs(file.c_str());

        if (!ifs) {
            set_error(err, RNX_ERR_FILE_OPEN, 0, 0, 0, "cannot open file: " + file);
            return false;
        }
        return readrnxh_only(ifs, hdr, err);
    }

}   // namespace gnss_rinex
