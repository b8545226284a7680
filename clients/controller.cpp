/* controller.cpp - connection lifecycle of a nutmon session

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

#include "controller.h"

#include <sstream>
#include <stdexcept>

namespace nutmon
{

ConnectionController::ConnectionController():
_state(DISCONNECTED),
_session(0),
_params(),
_queue(),
_loop(nullptr),
_attempts(),
_lastError(),
_devices(),
_snapshot(),
_hasSnapshot(false),
_stopped(false)
{
}

ConnectionController::~ConnectionController()
{
	disconnect();
	supersedeAttempts();

	/* Every attempt reports exactly once, stale results get released */
	while(!_attempts.empty())
	{
		Event event;
		if(_queue.pop(event, -1))
			apply(event);
	}
}

const char* ConnectionController::stateName(State state)
{
	switch(state)
	{
	case DISCONNECTED:  return "disconnected";
	case CONNECTING:    return "connecting";
	case CONNECTED:     return "connected";
	case DISCONNECTING: return "disconnecting";
	}
	return "unknown";
}

void * ConnectionController::attemptMain(void * arg)
{
	Attempt* attempt = reinterpret_cast<Attempt*>(arg);

	try
	{
		Client* client = Client::connect(attempt->params, attempt->token.fd());

		Event event(Event::CONNECTED, attempt->session);
		event.client = client;
		attempt->queue->push(event);
	}
	catch(std::exception& ex)
	{
		upsdebugx(1, "Connect attempt %lu failed: %s", attempt->session, ex.what());
		attempt->queue->push(Event::failure(Event::CONNECT_FAILED, attempt->session, ex));
	}

	return nullptr;
}

void ConnectionController::connect(const ConnectionParameters& params)
{
	if(_state == CONNECTED)
		disconnect();

	supersedeAttempts();

	_params = params;
	++_session;
	_state = CONNECTING;
	_lastError.clear();
	_devices.clear();
	_snapshot.clear();
	_hasSnapshot = false;
	_stopped = false;

	upsdebugx(1, "Session %lu: connecting to %s:%u", _session,
		params.host.c_str(), params.port);

	Attempt* attempt = new Attempt(_session, params, &_queue);

	int status = ::pthread_create(&attempt->thread, nullptr, &attemptMain, attempt);

	if (status) {
		delete attempt;

		std::stringstream e;

		e << "Failed to start the connect thread: " << status;

		_state = DISCONNECTED;
		_lastError = e.str();
		throw std::runtime_error(e.str());
	}

	_attempts.push_back(attempt);
}

void ConnectionController::disconnect()
{
	if(_state == CONNECTING)
	{
		supersedeAttempts();
		++_session;
		_state = DISCONNECTED;
		return;
	}

	if(_state != CONNECTED)
		return;

	_state = DISCONNECTING;
	upsdebugx(1, "Session %lu: disconnecting", _session);

	/* Joins the loop: the connection is closed when it returns */
	_loop->stop();
	delete _loop;
	_loop = nullptr;

	/* Events the loop queued before stopping are now stale */
	++_session;
	_state = DISCONNECTED;
}

void ConnectionController::cancel()
{
	if(_loop)
		_loop->cancel();
}

bool ConnectionController::waitEvent(Event& event, long timeout)
{
	while(_queue.pop(event, timeout))
	{
		if(apply(event))
			return true;
	}
	return false;
}

void ConnectionController::supersedeAttempts()
{
	for(std::list<Attempt*>::iterator it = _attempts.begin(); it != _attempts.end(); ++it)
	{
		(*it)->token.cancel();
	}
}

void ConnectionController::reapAttempt(unsigned long session)
{
	for(std::list<Attempt*>::iterator it = _attempts.begin(); it != _attempts.end(); ++it)
	{
		if((*it)->session != session)
			continue;

		int status = ::pthread_join((*it)->thread, nullptr);
		if(status)
			upslogx(LOG_ERR, "Failed to join connect thread: %d", status);

		delete *it;
		_attempts.erase(it);
		return;
	}
}

bool ConnectionController::apply(Event& event)
{
	switch(event.type)
	{
	case Event::CONNECTED:
		reapAttempt(event.session);
		if(event.session != _session || _state != CONNECTING)
		{
			upsdebugx(2, "Dropping superseded connection of session %lu", event.session);
			event.client->disconnect();
			delete event.client;
			event.client = nullptr;
			return false;
		}

		/* The loop owns the client from now on */
		_loop = new PollingLoop(event.client, _queue, _params.pollInterval, _session);
		event.client = nullptr;

		try
		{
			_loop->start();
		}
		catch(std::exception& ex)
		{
			delete _loop;
			_loop = nullptr;
			_state = DISCONNECTED;
			event = Event::failure(Event::CONNECT_FAILED, _session, ex);
			_lastError = event.message;
			return true;
		}

		_state = CONNECTED;
		upsdebugx(1, "Session %lu: connected", _session);
		return true;

	case Event::CONNECT_FAILED:
		reapAttempt(event.session);
		if(event.session != _session || _state != CONNECTING)
			return false;

		_lastError = event.message;
		_state = DISCONNECTED;
		return true;

	case Event::DEVICES:
		if(event.session != _session || _loop == nullptr)
			return false;
		_devices = event.devices;
		return true;

	case Event::SNAPSHOT:
		if(event.session != _session || _loop == nullptr)
			return false;
		_snapshot = event.snapshot;
		_hasSnapshot = true;
		return true;

	case Event::FAILURE:
		if(event.session != _session || _loop == nullptr)
			return false;
		_lastError = event.message;
		_stopped = true;
		return true;
	}

	return false;
}

} /* namespace nutmon */
