/* poller.cpp - cancellable device polling over a nutmon client

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

#include "poller.h"

#include <sstream>
#include <stdexcept>

#include <errno.h>
#include <string.h>
#include <time.h>
#include <unistd.h>
#include <sys/select.h>

namespace nutmon
{

/*
 *
 * CancellationToken implementation
 *
 */

CancellationToken::CancellationToken() {
	if (::pipe(m_pipe)) {
		std::stringstream e;

		e << "Failed to create cancellation pipe: " << errno;

		throw std::runtime_error(e.str());
	}
}


void CancellationToken::cancel() {
	if (isCancelled())
		return;

	static const char cmd = 'C';

	// Concurrent cancellations may write more than once,
	// which is harmless: the pipe is never drained
	if (1 != ::write(m_pipe[1], &cmd, 1))
		upslog_with_errno(LOG_ERR, "Failed to signal cancellation");
}


bool CancellationToken::isCancelled() const {
	fd_set rfds;
	struct timeval tv = { 0, 0 };

	FD_ZERO(&rfds);
	FD_SET(m_pipe[0], &rfds);

	return ::select(m_pipe[0] + 1, &rfds, nullptr, nullptr, &tv) > 0;
}


bool CancellationToken::wait(unsigned int seconds) const {
	struct timespec now, deadline;

	::clock_gettime(CLOCK_MONOTONIC, &deadline);
	deadline.tv_sec += seconds;

	for (;;) {
		fd_set rfds;
		FD_ZERO(&rfds);
		FD_SET(m_pipe[0], &rfds);

		::clock_gettime(CLOCK_MONOTONIC, &now);

		long remain_ms =
			(deadline.tv_sec - now.tv_sec) * 1000L +
			(deadline.tv_nsec - now.tv_nsec) / 1000000L;

		if (remain_ms <= 0)
			return isCancelled();

		struct timeval tv;
		tv.tv_sec  = remain_ms / 1000L;
		tv.tv_usec = (remain_ms % 1000L) * 1000L;

		int fdno = ::select(m_pipe[0] + 1, &rfds, nullptr, nullptr, &tv);

		// Interrupted by a signal: wait for the remaining time
		if (-1 == fdno) {
			if (errno == EINTR)
				continue;

			std::stringstream e;

			e << "Poll on cancellation pipe failed: " << errno;

			throw std::runtime_error(e.str());
		}

		return fdno > 0;
	}
}


CancellationToken::~CancellationToken() {
	::close(m_pipe[0]);
	::close(m_pipe[1]);
}


/*
 *
 * Event implementation
 *
 */

Event::Event():
type(FAILURE),
session(0),
client(nullptr),
devices(),
snapshot(),
message(),
error(ERROR_NONE)
{
}

Event::Event(Type t, unsigned long s):
type(t),
session(s),
client(nullptr),
devices(),
snapshot(),
message(),
error(ERROR_NONE)
{
}

Event Event::failure(Type t, unsigned long s, const std::exception& ex)
{
	Event event(t, s);
	event.message = ex.what();
	event.error = classify(ex);
	return event;
}

Event::ErrorKind Event::classify(const std::exception& ex)
{
	if(dynamic_cast<const AuthenticationException*>(&ex))
		return ERROR_AUTH;
	if(dynamic_cast<const ConnectionClosedException*>(&ex))
		return ERROR_CLOSED;
	if(dynamic_cast<const ProtocolException*>(&ex))
		return ERROR_PROTOCOL;
	if(dynamic_cast<const IOException*>(&ex) || dynamic_cast<const SystemException*>(&ex))
		return ERROR_NETWORK;
	return ERROR_OTHER;
}

const char* Event::errorKindName(ErrorKind kind)
{
	switch(kind)
	{
	case ERROR_NONE:     return "none";
	case ERROR_NETWORK:  return "network error";
	case ERROR_CLOSED:   return "connection closed";
	case ERROR_PROTOCOL: return "protocol violation";
	case ERROR_AUTH:     return "authentication failed";
	case ERROR_OTHER:    break;
	}
	return "error";
}


/*
 *
 * EventQueue implementation
 *
 */

EventQueue::EventQueue():
_events()
{
	pthread_condattr_t attr;

	pthread_mutex_init(&_mutex, nullptr);

	/* Timed waits measure against the monotonic clock */
	pthread_condattr_init(&attr);
	pthread_condattr_setclock(&attr, CLOCK_MONOTONIC);
	pthread_cond_init(&_cond, &attr);
	pthread_condattr_destroy(&attr);
}

EventQueue::~EventQueue()
{
	pthread_cond_destroy(&_cond);
	pthread_mutex_destroy(&_mutex);
}

void EventQueue::push(const Event& event)
{
	pthread_mutex_lock(&_mutex);
	_events.push_back(event);
	pthread_cond_signal(&_cond);
	pthread_mutex_unlock(&_mutex);
}

bool EventQueue::pop(Event& event, long timeout)
{
	struct timespec deadline;

	if(timeout >= 0)
	{
		clock_gettime(CLOCK_MONOTONIC, &deadline);
		deadline.tv_sec += timeout / 1000;
		deadline.tv_nsec += (timeout % 1000) * 1000000L;
		if(deadline.tv_nsec >= 1000000000L)
		{
			deadline.tv_sec += 1;
			deadline.tv_nsec -= 1000000000L;
		}
	}

	pthread_mutex_lock(&_mutex);
	while(_events.empty())
	{
		if(timeout < 0)
		{
			pthread_cond_wait(&_cond, &_mutex);
		}
		else if(pthread_cond_timedwait(&_cond, &_mutex, &deadline) == ETIMEDOUT)
		{
			break;
		}
	}

	bool res = !_events.empty();
	if(res)
	{
		event = _events.front();
		_events.pop_front();
	}
	pthread_mutex_unlock(&_mutex);

	return res;
}

bool EventQueue::empty()const
{
	pthread_mutex_lock(&_mutex);
	bool res = _events.empty();
	pthread_mutex_unlock(&_mutex);
	return res;
}


/*
 *
 * PollingLoop implementation
 *
 */

PollingLoop::PollingLoop(Client* client, EventQueue& queue,
	unsigned int interval, unsigned long session):
_client(client),
_queue(queue),
_interval(interval),
_session(session),
_token(),
_thread(),
_started(false)
{
}

PollingLoop::~PollingLoop()
{
	stop();
	_client->disconnect();
	delete _client;
}

void PollingLoop::start()
{
	if (_started)
		throw std::logic_error("Polling loop already started");

	int status = ::pthread_create(&_thread, nullptr, &main, this);

	if (status) {
		std::stringstream e;

		e << "Failed to start the polling thread: " << status;

		throw std::runtime_error(e.str());
	}
	_started = true;
}

void PollingLoop::stop()
{
	_token.cancel();

	if (!_started)
		return;

	int status = ::pthread_join(_thread, nullptr);

	if (status)
		upslogx(LOG_ERR, "Failed to join polling thread: %d", status);

	_started = false;
}

void * PollingLoop::main(void * arg)
{
	reinterpret_cast<PollingLoop *>(arg)->run();
	return nullptr;
}

void PollingLoop::run()
{
	upsdebugx(1, "Polling loop of session %lu started", _session);

	/* Socket waits wake up on cancellation too */
	_client->getTransport().setInterrupt(_token.fd());

	try
	{
		DeviceList devices = _client->listDevices();

		Event event(Event::DEVICES, _session);
		event.devices = devices;
		_queue.push(event);

		upsdebugx(2, "Polling %u device(s) every %u second(s)",
			static_cast<unsigned int>(devices.size()), _interval);

		while(!_token.isCancelled())
		{
			Event tick(Event::SNAPSHOT, _session);

			for(DeviceList::const_iterator it = devices.begin(); it != devices.end(); ++it)
			{
				if(_token.isCancelled())
					throw CancelledException();
				tick.snapshot[it->name] = _client->getDeviceSummary(it->name);
			}

			_queue.push(tick);

			if(_token.wait(_interval))
				break;
		}
		upsdebugx(1, "Polling loop of session %lu cancelled", _session);
	}
	catch(CancelledException&)
	{
		upsdebugx(1, "Polling loop of session %lu cancelled during a request", _session);
	}
	catch(std::exception& ex)
	{
		upslogx(LOG_WARNING, "Polling stopped: %s", ex.what());
		_queue.push(Event::failure(Event::FAILURE, _session, ex));
	}

	/* Release the connection before anyone may reconnect */
	_client->disconnect();
}

} /* namespace nutmon */
