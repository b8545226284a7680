/* controller.h - connection lifecycle of a nutmon session

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

#ifndef NUTMON_CONTROLLER_H_SEEN
#define NUTMON_CONTROLLER_H_SEEN

#include "poller.h"

#include <list>
#include <string>

#include <pthread.h>

namespace nutmon
{

/**
 * Coordinates connect, poll and disconnect of one upsd session.
 *
 * Connect attempts and polling run on background threads; their results
 * come back through an event queue drained by waitEvent(), which applies
 * the state transitions. Every method is meant to be called from one
 * consumer thread.
 */
class ConnectionController
{
public:
	enum State {
		DISCONNECTED,
		CONNECTING,
		CONNECTED,
		DISCONNECTING
	};

	ConnectionController();
	/** Disconnects, then waits for pending connect attempts */
	~ConnectionController();

	/**
	 * Start a connect attempt in background.
	 * A current session is disconnected first, a pending attempt is superseded.
	 */
	void connect(const ConnectionParameters& params);

	/**
	 * Stop polling and release the connection.
	 * Supersedes a pending connect attempt.
	 */
	void disconnect();

	/**
	 * Signal cancellation to the running loop without waiting for it.
	 * disconnect() is still needed to go back to the disconnected state.
	 */
	void cancel();

	/**
	 * Wait for the next event of the current session and apply it.
	 * Events of superseded sessions are dropped silently.
	 * \param event Receives the event.
	 * \param timeout Maximal wait, per queued event, in milliseconds
	 *        (negative to wait for ever).
	 * \return false on timeout.
	 */
	bool waitEvent(Event& event, long timeout);

	State getState()const{return _state;}
	const std::string& getLastError()const{return _lastError;}
	const DeviceList& getDevices()const{return _devices;}
	const PollSnapshot& getLastSnapshot()const{return _snapshot;}
	bool hasSnapshot()const{return _hasSnapshot;}
	/** Polling ended on an error, the last snapshot is stale */
	bool isStopped()const{return _stopped;}
	unsigned long getSession()const{return _session;}

	static const char* stateName(State state);

private:
	ConnectionController(const ConnectionController&);
	ConnectionController& operator=(const ConnectionController&);

	/** One background connect attempt */
	struct Attempt
	{
		unsigned long session;
		ConnectionParameters params;
		EventQueue* queue;
		CancellationToken token;
		pthread_t thread;

		Attempt(unsigned long s, const ConnectionParameters& p, EventQueue* q):
			session(s), params(p), queue(q), token(), thread() {}
	};

	/** Connect attempt thread routine, \p arg is the attempt */
	static void * attemptMain(void * arg);

	/** Join and forget the attempt of \p session (it already reported) */
	void reapAttempt(unsigned long session);

	/** Cancel every pending attempt */
	void supersedeAttempts();

	/** Apply an event to the state, false if it is stale */
	bool apply(Event& event);

	State _state;
	unsigned long _session;
	ConnectionParameters _params;
	EventQueue _queue;
	PollingLoop* _loop;
	std::list<Attempt*> _attempts;

	std::string _lastError;
	DeviceList _devices;
	PollSnapshot _snapshot;
	bool _hasSnapshot;
	bool _stopped;
};

} /* namespace nutmon */

#endif	/* NUTMON_CONTROLLER_H_SEEN */
