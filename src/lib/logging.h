/*
 * Copyright (c) 2017-2020, [Ribose Inc](https://www.ribose.com).
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without modification,
 * are permitted provided that the following conditions are met:
 *
 * 1.  Redistributions of source code must retain the above copyright notice,
 *     this list of conditions and the following disclaimer.
 *
 * 2.  Redistributions in binary form must reproduce the above copyright notice,
 *     this list of conditions and the following disclaimer in the documentation
 *     and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND
 * ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER OR CONTRIBUTORS BE LIABLE
 * FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
 * DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
 * SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
 * CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
 * OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF
 * THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef PGPSIG_LOGGING_H_
#define PGPSIG_LOGGING_H_

#include <stdlib.h>
#include <stdint.h>
#include <stdio.h>

/* environment variable name */
static const char PGPSIG_LOG_CONSOLE[] = "PGPSIG_LOG_CONSOLE";

bool pgpsig_log_switch();
void set_pgpsig_log_switch(int8_t);
void pgpsig_log_stop();
void pgpsig_log_continue();

namespace pgpsig {
class LogStop {
    bool stop_;

  public:
    LogStop(bool stop = true) : stop_(stop)
    {
        if (stop_) {
            pgpsig_log_stop();
        }
    }
    ~LogStop()
    {
        if (stop_) {
            pgpsig_log_continue();
        }
    }
};
} // namespace pgpsig

/* remove "src" */
#ifndef SOURCE_PATH_SIZE
#define SOURCE_PATH_SIZE 0
#endif
#define __SOURCE_PATH_FILE__ (&(__FILE__[SOURCE_PATH_SIZE]))

#define PGPSIG_LOG_FD(fd, ...)                                                           \
    do {                                                                                 \
        if (!pgpsig_log_switch())                                                        \
            break;                                                                       \
        (void) fprintf((fd), "[%s() %s:%d] ", __func__, __SOURCE_PATH_FILE__, __LINE__); \
        (void) fprintf((fd), __VA_ARGS__);                                               \
        (void) fprintf((fd), "\n");                                                      \
    } while (0)

#define PGPSIG_LOG(...) PGPSIG_LOG_FD(stderr, __VA_ARGS__)

/* log message with the hex dump of the buffer, msg must contain single %s */
#define PGPSIG_LOG_HEX(msg, buf, len)                                               \
    do {                                                                            \
        if (!pgpsig_log_switch())                                                   \
            break;                                                                  \
        auto _hex = pgpsig::bin_to_hex((buf), (len), pgpsig::HexFormat::Lowercase); \
        PGPSIG_LOG(msg, _hex.c_str());                                              \
    } while (0)

#endif
