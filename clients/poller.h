/* poller.h - cancellable device polling over a nutmon client

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

#ifndef NUTMON_POLLER_H_SEEN
#define NUTMON_POLLER_H_SEEN

#include "nutmonclient.h"
#include "common.h"

#include <deque>
#include <exception>
#include <string>

#include <pthread.h>

namespace nutmon
{

/**
 *  \brief  One-shot cancellation signal
 *
 *  Implemented as a self-pipe which is written once and never drained:
 *  once cancelled, the read end stays readable for ever.
 *  That way any \c select() based wait (sleeps, socket waits) can
 *  include it and wake up on cancellation.
 *
 *  \c cancel() may be called from any thread, any number of times.
 */
class CancellationToken {
	private:

	/** Self pipe */
	int m_pipe[2];

	/** Not copyable */
	CancellationToken(const CancellationToken & orig);
	CancellationToken & operator = (const CancellationToken & orig);

	public:

	/**
	 *  \brief  Constructor
	 *
	 *  \throw std::runtime_error if the pipe can't be created
	 */
	CancellationToken();

	/** Signal cancellation (idempotent) */
	void cancel();

	/** Cancellation check (doesn't block) */
	bool isCancelled() const;

	/**
	 *  \brief  Sleep unless cancelled
	 *
	 *  \param  seconds  Sleep duration
	 *
	 *  \retval true  if the token was (or got) cancelled
	 *  \retval false if the whole duration elapsed
	 */
	bool wait(unsigned int seconds) const;

	/** Descriptor readable once cancelled */
	int fd() const { return m_pipe[0]; }

	~CancellationToken();

};  // end of class CancellationToken


/**
 * Item of the event channel between the background threads
 * (connect attempts, polling loops) and the consumer.
 */
struct Event
{
	enum Type {
		CONNECTED,      /**< Connect attempt succeeded, \ref client is set */
		CONNECT_FAILED, /**< Connect attempt failed, see \ref message */
		DEVICES,        /**< Device directory of the session */
		SNAPSHOT,       /**< Complete poll of every device */
		FAILURE         /**< Terminal polling error, the loop stopped */
	};

	enum ErrorKind {
		ERROR_NONE = 0,
		ERROR_NETWORK,
		ERROR_CLOSED,
		ERROR_PROTOCOL,
		ERROR_AUTH,
		ERROR_OTHER
	};

	Type type;
	/** Connect attempt the event belongs to */
	unsigned long session;
	/** Connected client, owned by whoever consumes a CONNECTED event */
	Client* client;
	DeviceList devices;
	PollSnapshot snapshot;
	std::string message;
	ErrorKind error;

	Event();
	Event(Type t, unsigned long s);

	/** Error event built from the exception which caused it */
	static Event failure(Type t, unsigned long s, const std::exception& ex);

	static ErrorKind classify(const std::exception& ex);
	static const char* errorKindName(ErrorKind kind);
};


/**
 * Ordered, thread safe event channel.
 * Any number of producers, one consumer.
 */
class EventQueue
{
public:
	EventQueue();
	~EventQueue();

	void push(const Event& event);

	/**
	 * Wait for the next event.
	 * \param event Receives the event.
	 * \param timeout Maximal wait in milliseconds, negative to wait for ever.
	 * \return false on timeout.
	 */
	bool pop(Event& event, long timeout);

	bool empty()const;

private:
	EventQueue(const EventQueue&);
	EventQueue& operator=(const EventQueue&);

	mutable pthread_mutex_t _mutex;
	pthread_cond_t _cond;
	std::deque<Event> _events;
};


/**
 * Polls every device of a client on a fixed interval, on its own thread.
 *
 * The loop lists the devices once, then publishes one SNAPSHOT event per
 * tick. The first error ends the loop with exactly one FAILURE event;
 * cancellation ends it silently. Either way, the client is released
 * (logged out and closed) by the worker thread before it exits.
 */
class PollingLoop
{
public:
	/**
	 * \param client Connected client, the loop takes its ownership.
	 * \param queue Where events are published.
	 * \param interval Seconds between two ticks.
	 * \param session Session tag of the published events.
	 */
	PollingLoop(Client* client, EventQueue& queue,
		unsigned int interval = DEFAULT_POLL_INTERVAL, unsigned long session = 0);

	/** Stops (and joins) the worker */
	~PollingLoop();

	/**
	 * Start the worker thread.
	 * \throw std::logic_error if already started,
	 *        std::runtime_error if the thread can't be created.
	 */
	void start();

	/** Signal cancellation, doesn't wait */
	void cancel() { _token.cancel(); }

	/**
	 * Signal cancellation and join the worker.
	 * The client connection is released when it returns.
	 */
	void stop();

	CancellationToken& getCancellationToken() { return _token; }

	unsigned long getSession()const { return _session; }

private:
	PollingLoop(const PollingLoop&);
	PollingLoop& operator=(const PollingLoop&);

	/** Worker thread routine, \p arg is the loop */
	static void * main(void * arg);

	void run();

	Client* _client;
	EventQueue& _queue;
	unsigned int _interval;
	unsigned long _session;
	CancellationToken _token;
	pthread_t _thread;
	bool _started;
};

} /* namespace nutmon */

#endif	/* NUTMON_POLLER_H_SEEN */
