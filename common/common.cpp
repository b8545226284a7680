/* common.cpp - common useful functions of nutmon: logging and debugging

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

#include "common.h"

#include <string.h>
#include <sys/time.h>
#include <time.h>
#include <pthread.h>

namespace nutmon
{

int nut_debug_level = 0;
int nut_log_level = 7;

static int upslog_flags = UPSLOG_STDERR;

/* Keeps lines of concurrent threads from interleaving on stderr */
static pthread_mutex_t upslog_mutex = PTHREAD_MUTEX_INITIALIZER;

/* Reference point of the debug timestamps */
static struct timeval upslog_start = { 0, 0 };

void open_syslog(const char *progname)
{
	openlog(progname, LOG_PID | LOG_NDELAY, LOG_DAEMON);

	switch (nut_log_level)
	{
	case 7:
		setlogmask(LOG_UPTO(LOG_DEBUG));
		break;
	case 6:
		setlogmask(LOG_UPTO(LOG_INFO));
		break;
	case 5:
		setlogmask(LOG_UPTO(LOG_NOTICE));
		break;
	case 4:
		setlogmask(LOG_UPTO(LOG_WARNING));
		break;
	case 3:
		setlogmask(LOG_UPTO(LOG_ERR));
		break;
	case 2:
		setlogmask(LOG_UPTO(LOG_CRIT));
		break;
	case 1:
		setlogmask(LOG_UPTO(LOG_ALERT));
		break;
	case 0:
		setlogmask(LOG_UPTO(LOG_EMERG));
		break;
	default:
		upslogx(LOG_INFO, "Changing log level: %d", nut_log_level);
		break;
	}
}

void syslogbit_set(void)
{
	upslog_flags |= UPSLOG_SYSLOG;
}

const char *xbasename(const char *file)
{
	const char *p = strrchr(file, '/');

	if (p == nullptr)
		return file;
	return p + 1;
}

/* Caller holds upslog_mutex */
static void upslog_start_once(void)
{
	if (upslog_start.tv_sec == 0)
		gettimeofday(&upslog_start, nullptr);
}

/* Write one formatted line to the enabled log targets */
static void vupslog(int priority, const char *fmt, va_list va, int use_strerror)
{
	char	buf[LARGEBUF];
	int	ret;
	int	saved_errno = errno;

	ret = vsnprintf(buf, sizeof(buf), fmt, va);

	if ((ret < 0) || (ret >= static_cast<int>(sizeof(buf)))) {
		syslog(LOG_WARNING, "vupslog: vsnprintf needed more than %d bytes",
			static_cast<int>(sizeof(buf)));
	}

	if (use_strerror) {
		size_t len = strlen(buf);
		snprintf(buf + len, sizeof(buf) - len, ": %s", strerror(saved_errno));
	}

	if (upslog_flags & UPSLOG_STDERR) {
		struct timeval now;

		pthread_mutex_lock(&upslog_mutex);
		upslog_start_once();
		gettimeofday(&now, nullptr);

		if (upslog_start.tv_usec > now.tv_usec) {
			now.tv_usec += 1000000;
			now.tv_sec -= 1;
		}

		fprintf(stderr, "%4.0f.%06ld\t%s\n",
			difftime(now.tv_sec, upslog_start.tv_sec),
			static_cast<long>(now.tv_usec - upslog_start.tv_usec), buf);
		fflush(stderr);
		pthread_mutex_unlock(&upslog_mutex);
	}

	if (upslog_flags & UPSLOG_SYSLOG)
		syslog(priority, "%s", buf);

	errno = saved_errno;
}

void upslog_with_errno(int priority, const char *fmt, ...)
{
	va_list va;

	va_start(va, fmt);
	vupslog(priority, fmt, va, 1);
	va_end(va);
}

void upslogx(int priority, const char *fmt, ...)
{
	va_list va;

	va_start(va, fmt);
	vupslog(priority, fmt, va, 0);
	va_end(va);
}

void upsdebug_with_errno(int level, const char *fmt, ...)
{
	va_list va;

	if (nut_debug_level < level)
		return;

	va_start(va, fmt);
	vupslog(LOG_DEBUG, fmt, va, 1);
	va_end(va);
}

void upsdebugx(int level, const char *fmt, ...)
{
	va_list va;

	if (nut_debug_level < level)
		return;

	va_start(va, fmt);
	vupslog(LOG_DEBUG, fmt, va, 0);
	va_end(va);
}

} /* namespace nutmon */
