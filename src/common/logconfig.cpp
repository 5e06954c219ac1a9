// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

#include <ctype.h>
#include <stdint.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

#include "common/config.h"
#include "common/logging.h"

namespace orcbuf {

static bool logging_initialized = false;

static std::mutex logging_mutex;

static bool iequals(const std::string& a, const std::string& b) {
    size_t sz = a.size();
    if (b.size() != sz) {
        return false;
    }
    for (size_t i = 0; i < sz; ++i) {
        if (tolower(a[i]) != tolower(b[i])) {
            return false;
        }
    }
    return true;
}

static bool parse_log_level(const std::string& loglevel, int32_t* minloglevel) {
    if (iequals(loglevel, "INFO")) {
        *minloglevel = 0;
    } else if (iequals(loglevel, "WARNING")) {
        *minloglevel = 1;
    } else if (iequals(loglevel, "ERROR")) {
        *minloglevel = 2;
    } else if (iequals(loglevel, "FATAL")) {
        *minloglevel = 3;
    } else {
        return false;
    }
    return true;
}

// Same layout as the default glog prefix with a marker in front, eg:
// ConsoleLogger I20240605 15:25:15.677153 1763151 orc_output_buffer.cpp:48] msg...
static void console_prefix(std::ostream& s, const google::LogMessageInfo& l, void* /*arg*/) {
    s << "ConsoleLogger ";
    s << l.severity[0];

    std::tm tm_time = {};
    tm_time.tm_year = l.time.year();
    tm_time.tm_mon = l.time.month();
    tm_time.tm_mday = l.time.day();
    tm_time.tm_hour = l.time.hour();
    tm_time.tm_min = l.time.min();
    tm_time.tm_sec = l.time.sec();

    s << std::put_time(&tm_time, "%Y%m%d %H:%M:%S");
    s << "." << std::setw(6) << std::setfill('0') << l.time.usec();
    s << ' ';
    s << std::setfill(' ') << std::setw(5);
    s << l.thread_id << std::setfill('0');
    s << ' ';
    s << l.filename << ':' << l.line_number << "]";
}

bool init_glog(const char* basename) {
    std::lock_guard<std::mutex> logging_lock(logging_mutex);

    if (logging_initialized) {
        return true;
    }

    bool log_to_console = (getenv("ORCBUF_LOG_TO_STDERR") != nullptr);
    if (log_to_console) {
        FLAGS_logtostderr = true;
    } else {
        // don't log to stderr except fatal level
        FLAGS_stderrthreshold = google::FATAL;
    }

    std::string log_dir = config::sys_log_dir;
    if (log_dir == "") {
        const char* env_log_dir = getenv("LOG_DIR");
        log_dir = env_log_dir != nullptr ? env_log_dir : "";
    }
    FLAGS_log_dir = log_dir;
    // 0 means buffer INFO only
    FLAGS_logbuflevel = 0;
    // buffer log messages for at most this many seconds
    FLAGS_logbufsecs = 30;

    // set log level
    int32_t minloglevel = 0;
    if (!parse_log_level(config::sys_log_level, &minloglevel)) {
        std::cerr << "sys_log_level needs to be INFO, WARNING, ERROR, FATAL" << std::endl;
        return false;
    }
    FLAGS_minloglevel = minloglevel;

    // set log buffer level
    // default is 0
    std::string& logbuflevel = config::log_buffer_level;
    if (iequals(logbuflevel, "-1")) {
        FLAGS_logbuflevel = -1;
    } else if (iequals(logbuflevel, "0")) {
        FLAGS_logbuflevel = 0;
    }

    // set log roll mode
    std::string& rollmode = config::sys_log_roll_mode;
    std::string sizeflag = "SIZE-MB-";
    bool ok = false;
    if (rollmode.substr(0, sizeflag.length()).compare(sizeflag) == 0) {
        std::string sizestr = rollmode.substr(sizeflag.size(), rollmode.size() - sizeflag.size());
        if (sizestr.size() != 0) {
            char* end = nullptr;
            errno = 0;
            const char* sizecstr = sizestr.c_str();
            int64_t ret64 = strtoll(sizecstr, &end, 10);
            if ((errno == 0) && (end == sizecstr + strlen(sizecstr))) {
                int32_t retval = static_cast<int32_t>(ret64);
                if (retval == ret64 && retval > 0) {
                    FLAGS_max_log_size = retval;
                    ok = true;
                }
            }
        }
    }
    if (!ok) {
        std::cerr << "sys_log_roll_mode needs to be SIZE-MB-nnn" << std::endl;
        return false;
    }

    // set verbose modules.
    FLAGS_v = config::sys_log_verbose_flags_v;
    std::vector<std::string>& verbose_modules = config::sys_log_verbose_modules;
    int32_t vlog_level = config::sys_log_verbose_level;
    for (size_t i = 0; i < verbose_modules.size(); i++) {
        if (verbose_modules[i].size() != 0) {
            google::SetVLOGLevel(verbose_modules[i].c_str(), vlog_level);
        }
    }

    if (log_to_console) {
        google::InitGoogleLogging(basename, &console_prefix);
    } else {
        google::InitGoogleLogging(basename);
    }

    logging_initialized = true;

    return true;
}

void shutdown_logging() {
    std::lock_guard<std::mutex> logging_lock(logging_mutex);
    if (!logging_initialized) {
        return;
    }
    google::ShutdownGoogleLogging();
    logging_initialized = false;
}

void update_logging(const std::string& name, const std::string& value) {
    if ("sys_log_level" == name) {
        int32_t minloglevel = 0;
        if (parse_log_level(value, &minloglevel)) {
            FLAGS_minloglevel = minloglevel;
        } else {
            LOG(WARNING) << "update sys_log_level failed, need to be INFO, WARNING, ERROR, FATAL";
        }
    }
}

} // namespace orcbuf
