/* common.h - prototypes for the common useful functions of nutmon

   Copyright (C) 2026  nutmon developers

   This program is free software; you can redistribute it and/or modify
   it under the terms of the GNU General Public License as published by
   the Free Software Foundation; either version 2 of the License, or
   (at your option) any later version.

   This program is distributed in the hope that it will be useful,
   but WITHOUT ANY WARRANTY; without even the implied warranty of
   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
   GNU General Public License for more details.

   You should have received a copy of the GNU General Public License
   along with this program; if not, write to the Free Software
   Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA 02111-1307 USA
*/

#ifndef NUTMON_COMMON_H_SEEN
#define NUTMON_COMMON_H_SEEN 1

#include <errno.h>
#include <stdio.h>
#include <stdarg.h>
#include <syslog.h>

#ifndef NUTMON_VERSION
# define NUTMON_VERSION "0.1.0"
#endif

/* Use in code to notify the developers and quiesce the compiler that
 * (for this codepath) the argument or variable is unused intentionally.
 */
#define NUT_UNUSED_VARIABLE(x) (void)(x)

/** @brief Default timeout (in seconds) for network operations. */
#define DEFAULT_NETWORK_TIMEOUT		5

/** @brief Default interval (in seconds) between two polls of the devices. */
#define DEFAULT_POLL_INTERVAL		2

/** @brief Directory of nutmon.conf unless NUT_CONFPATH says otherwise. */
#ifndef CONFPATH
# define CONFPATH "/etc/nut"
#endif

/** @brief Default port of upsd. */
#define DEFAULT_UPSD_PORT		3493

/* Buffer sizes used for various functions */
#define SMALLBUF	512
#define LARGEBUF	1024

/* logging flags: bitmask! */
#define UPSLOG_STDERR		0x0001
#define UPSLOG_SYSLOG		0x0002

namespace nutmon
{

extern int nut_debug_level;
extern int nut_log_level;

/* get the syslog ready for us */
void open_syslog(const char *progname);

/* enable writing upslog_with_errno() and upslogx() type messages to
   the syslog */
void syslogbit_set(void);

const char *xbasename(const char *file);

void upslog_with_errno(int priority, const char *fmt, ...)
	__attribute__ ((__format__ (__printf__, 2, 3)));
void upslogx(int priority, const char *fmt, ...)
	__attribute__ ((__format__ (__printf__, 2, 3)));
void upsdebug_with_errno(int level, const char *fmt, ...)
	__attribute__ ((__format__ (__printf__, 2, 3)));
void upsdebugx(int level, const char *fmt, ...)
	__attribute__ ((__format__ (__printf__, 2, 3)));

} /* namespace nutmon */

#endif /* NUTMON_COMMON_H_SEEN */
