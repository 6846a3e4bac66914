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

#include "gnss_rinex/rinex_numeric.hpp"
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <algorithm>
#include <glog/logging.h>

namespace gnss_rinex
{
    int str2num(const std::string &s, int i, int n, double *value, int kind)
    {
        char str[256], *p = str;
        int a, b, k, ndigit = 0, nexp = 0;

        *value = RNX_NAN;
        if (i < 0 || n <= 0 || n > (int)sizeof(str) - 2) return NUM_BAD;
        if (i >= (int)s.size()) return NUM_BLANK;

        a = i;
        b = std::min((int)s.size(), i + n);
        while (a < b && isspace((unsigned char)s[a])) a++;
        while (b > a && isspace((unsigned char)s[b-1])) b--;
        if (a == b) return NUM_BLANK;

        k = a;
        if (s[k] == '+' || s[k] == '-') *p++ = s[k++];
        for (; k < b && isdigit((unsigned char)s[k]); k++, ndigit++) *p++ = s[k];
        if (k < b && s[k] == '.') {
            if (kind == FIELD_INT) return NUM_BAD;
            *p++ = s[k++];
            for (; k < b && isdigit((unsigned char)s[k]); k++, ndigit++) *p++ = s[k];
        }
        if (!ndigit) return NUM_BAD;

        if (k < b && strchr("DdEe", s[k])) {
            if (kind == FIELD_INT) return NUM_BAD;
            *p++ = 'E';
            k++;
            if (k < b && (s[k] == '+' || s[k] == '-')) *p++ = s[k++];
            for (; k < b && isdigit((unsigned char)s[k]); k++, nexp++) *p++ = s[k];
            if (!nexp) return NUM_BAD;
        }
        if (k != b) return NUM_BAD;
        *p = '\0';

        *value = strtod(str, NULL);
        return NUM_OK;
    }

    bool field_blank(const std::string &s, int i, int n)
    {
        for (int k = i; k < i + n && k < (int)s.size(); k++) {
            if (!isspace((unsigned char)s[k])) return false;
        }
        return true;
    }

    std::string col_field(const std::string &s, int i, int n)
    {
        std::string f = i < (int)s.size() ? s.substr(i, n) : "";
        f.resize(n, ' ');
        return f;
    }

    void set_error(RinexError *err, int code, int line, int col, int width, const std::string &msg)
    {
        LOG(ERROR) << rnx_errmsg(code) << ": line=" << line << " col=" << col << "-"
                   << col + width - 1 << " " << msg;
        if (!err) return;
        err->code = code;
        err->line = line;
        err->col = col;
        err->width = width;
        err->msg = msg;
    }

    void add_warning(std::vector<RinexWarning> &warns, int code, int line, const std::string &sat,
                     const std::string &msg)
    {
        RinexWarning w;
        w.code = code;
        w.line = line;
        w.sat = sat;
        w.msg = msg;
        LOG(WARNING) << rnx_warnmsg(code) << ": line=" << line << " " << sat << " " << msg;
        warns.push_back(w);
    }

    bool decode_num(const std::string &buff, int line, int i, int n, int kind,
                    double *value, RinexError *err)
    {
        if (str2num(buff, i, n, value, kind) != NUM_BAD) return true;

        std::string token = i < (int)buff.size() ? buff.substr(i, n) : "";
        set_error(err, RNX_ERR_MALFORMED_NUMERIC, line, i + 1, n,
                  "malformed numeric field '" + token + "'");
        return false;
    }

    bool decode_fields(const std::string &buff, int line, const FieldDesc *desc, int n,
                       double *value, RinexError *err)
    {
        for (int k = 0; k < n; k++) {
            if (!decode_num(buff, line, desc[k].col, desc[k].width, desc[k].kind, value + k, err)) {
                if (err) err->msg += std::string(" (") + desc[k].name + ")";
                return false;
            }
        }
        return true;
    }

    const char *rnx_errmsg(int code)
    {
        switch (code) {
            case RNX_OK:                      return "ok";
            case RNX_ERR_MALFORMED_NUMERIC:   return "MalformedNumericField";
            case RNX_ERR_MISSING_VERSION:     return "MissingVersionHeader";
            case RNX_ERR_UNSUPPORTED_VERSION: return "UnsupportedVersion";
            case RNX_ERR_UNSUPPORTED_TYPE:    return "UnsupportedFileType";
            case RNX_ERR_TRUNCATED_RECORD:    return "TruncatedRecord";
            case RNX_ERR_FILE_OPEN:           return "FileOpenError";
            default:                          return "unknown error";
        }
    }

    const char *rnx_warnmsg(int code)
    {
        switch (code) {
            case RNX_WARN_UNKNOWN_OBS_SET:  return "UnknownConstellationObservationSet";
            case RNX_WARN_DUPLICATE_RECORD: return "DuplicateRecordWarning";
            case RNX_WARN_UNKNOWN_SYSTEM:   return "UnknownSatelliteSystem";
            case RNX_WARN_TIME_ORDER:       return "EpochTimeNotIncreasing";
            case RNX_WARN_BAD_EPOCH:        return "InvalidEpochLine";
            case RNX_WARN_OBS_TYPE_COUNT:   return "ObservationTypeCount";
            default:                        return "unknown warning";
        }
    }

}   // namespace gnss_rinex
