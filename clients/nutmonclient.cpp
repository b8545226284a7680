/* nutmonclient.cpp - nutmon upsd client library implementation

   Copyright (C)
	2012	Emilien Kia <emilien.kia@gmail.com>
	2026	nutmon developers

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

#include "nutmonclient.h"
#include "common.h"

#include <sstream>

#include <errno.h>
#include <string.h>
#include <stdio.h>
#include <inttypes.h>

#include <sys/types.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <netdb.h>
#include <netinet/in.h>
#include <fcntl.h>
#include <unistd.h>

namespace nutmon
{

SystemException::SystemException():
NutException(err())
{
}

SystemException::SystemException(const std::string& context):
NutException(context + ": " + err())
{
}

std::string SystemException::err()
{
	if(errno==0)
		return "Undefined system error";
	else
	{
		std::stringstream str;
		str << "System error " << errno << ": " << strerror(errno);
		return str.str();
	}
}

/* Implemented out-of-line to avoid "Weak vtables" warnings and related overheads */
NutException::~NutException() noexcept {}
SystemException::~SystemException() noexcept {}
IOException::~IOException() noexcept {}
UnknownHostException::~UnknownHostException() noexcept {}
NotConnectedException::~NotConnectedException() noexcept {}
TimeoutException::~TimeoutException() noexcept {}
ConnectionClosedException::~ConnectionClosedException() noexcept {}
ProtocolException::~ProtocolException() noexcept {}
AuthenticationException::~AuthenticationException() noexcept {}
CancelledException::~CancelledException() noexcept {}


/*
 *
 * Transport implementation
 *
 */

Transport::Transport():
_sock(-1),
_interrupt(-1),
_debugConnect(false),
_timeout(DEFAULT_NETWORK_TIMEOUT),
_buffer()
{
}

Transport::~Transport()
{
	disconnect();
}

void Transport::setTimeout(time_t timeout)
{
	_timeout = timeout;
}

void Transport::attach(int fd)
{
	disconnect();
	_sock = fd;
}

void Transport::throwResolveError(int error)
{
	switch (error)
	{
	case EAI_NONAME:
		throw UnknownHostException();
	case EAI_MEMORY:
		throw NutException("Out of memory");
	case EAI_SYSTEM:
		throw SystemException("getaddrinfo");
	case EAI_AGAIN:
		throw IOException(std::string("Temporary failure resolving host: ") + gai_strerror(error));
	default:
		throw IOException(std::string("Cannot resolve host: ") + gai_strerror(error));
	}
}

void Transport::connect(const std::string& host, uint16_t port)
{
	int	sock_fd;
	struct addrinfo	hints, *res, *ai;
	char			sport[NI_MAXSERV];
	int			v;
	int			error;
	socklen_t		error_size;
	long			fd_flags;
	int			last_errno = 0;

	disconnect();

	if (host.empty()) {
		if (_debugConnect) upsdebugx(2, "Transport::connect(): host.empty()");
		throw UnknownHostException();
	}

	snprintf(sport, sizeof(sport), "%" PRIuMAX, static_cast<uintmax_t>(port));

	memset(&hints, 0, sizeof(hints));
	hints.ai_family = AF_UNSPEC;
	hints.ai_socktype = SOCK_STREAM;
	hints.ai_protocol = IPPROTO_TCP;

	if (_debugConnect) upsdebugx(2, "Transport::connect(): getaddrinfo(%s, %s, ...)",
		host.c_str(), sport);

	if ((v = getaddrinfo(host.c_str(), sport, &hints, &res)) != 0) {
		if (_debugConnect) upsdebugx(2, "Transport::connect(): "
			"connect not successful: %s", gai_strerror(v));
		throwResolveError(v);
	}

	for (ai = res; ai != nullptr; ai = ai->ai_next) {

		sock_fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
		if (_debugConnect) upsdebugx(2, "Transport::connect(): socket(%d, %d, %d) = %d",
			ai->ai_family, ai->ai_socktype, ai->ai_protocol, sock_fd);

		if (sock_fd < 0) {
			switch (errno)
			{
			case EAFNOSUPPORT:
			case EINVAL:
				break;
			default:
				freeaddrinfo(res);
				throw SystemException("socket");
			}
			continue;
		}

		/* non blocking connect */
		fd_flags = fcntl(sock_fd, F_GETFL);
		fcntl(sock_fd, F_SETFL, fd_flags | O_NONBLOCK);

		while ((v = ::connect(sock_fd, ai->ai_addr, ai->ai_addrlen)) < 0) {
			if (_debugConnect) upsdebug_with_errno(2, "Transport::connect(): connect() < 0");

			if (errno == EINPROGRESS) {
				try
				{
					_sock = sock_fd;
					waitFor(true);
					_sock = -1;
				}
				catch(NutException&)
				{
					/* Timeout or cancellation: no other address is tried */
					_sock = -1;
					::close(sock_fd);
					freeaddrinfo(res);
					throw;
				}

				error_size = sizeof(error);
				getsockopt(sock_fd, SOL_SOCKET, SO_ERROR, &error, &error_size);
				if (error == 0) {
					/* connect successful */
					if (_debugConnect) upsdebugx(2, "Transport::connect(): "
						"connect-select successful");
					v = 0;
					break;
				}
				errno = error;
				if (_debugConnect) upsdebug_with_errno(2, "Transport::connect(): "
					"connect-select not successful");
			}

			if (errno == EINTR || errno == EAGAIN)
				continue;
			break;
		}

		if (v < 0) {
			last_errno = errno;
			::close(sock_fd);
			continue;
		}

		/* switch back to blocking operation */
		fd_flags = fcntl(sock_fd, F_GETFL);
		fcntl(sock_fd, F_SETFL, fd_flags & ~O_NONBLOCK);

		if (_debugConnect) upsdebugx(2, "Transport::connect(): saving sock_fd = %d", sock_fd);
		_sock = sock_fd;
		break;
	}

	freeaddrinfo(res);

	if (_sock < 0) {
		std::stringstream msg;
		msg << "Cannot connect to " << host << ":" << port;
		if (last_errno != 0)
			msg << ": " << strerror(last_errno);
		throw IOException(msg.str());
	}
}

void Transport::disconnect()
{
	if(_sock != -1)
	{
		::close(_sock);
		_sock = -1;
	}
	_buffer.clear();
}

bool Transport::isConnected()const
{
	return _sock!=-1;
}

void Transport::waitFor(bool forWrite)
{
	fd_set rfds, wfds;
	struct timeval tv;
	int maxfd = _sock > _interrupt ? _sock : _interrupt;

	while(true)
	{
		FD_ZERO(&rfds);
		FD_ZERO(&wfds);
		FD_SET(_sock, forWrite ? &wfds : &rfds);
		if(_interrupt != -1)
			FD_SET(_interrupt, &rfds);

		/* select() may update the timeout, give it a fresh copy */
		tv.tv_sec = _timeout;
		tv.tv_usec = 0;

		int ret = select(maxfd+1, &rfds, forWrite ? &wfds : nullptr,
			nullptr, hasTimeout() ? &tv : nullptr);

		if(ret < 0)
		{
			if(errno == EINTR)
				continue;
			throw SystemException("select");
		}
		if(ret == 0)
		{
			throw TimeoutException();
		}
		break;
	}

	if(_interrupt != -1 && FD_ISSET(_interrupt, &rfds))
		throw CancelledException();
}

size_t Transport::read(void* buf, size_t sz)
{
	if(!isConnected())
	{
		throw NotConnectedException();
	}

	waitFor(false);

	ssize_t res;
	do
	{
		res = ::recv(_sock, buf, sz, 0);
	}
	while(res == -1 && errno == EINTR);

	if(res==-1)
	{
		int err = errno;
		disconnect();
		throw IOException(std::string("Error while reading on socket: ") + strerror(err));
	}
	return static_cast<size_t>(res);
}

size_t Transport::write(const void* buf, size_t sz)
{
	if(!isConnected())
	{
		throw NotConnectedException();
	}

	waitFor(true);

	ssize_t res;
	do
	{
		res = ::send(_sock, buf, sz, MSG_NOSIGNAL);
	}
	while(res == -1 && errno == EINTR);

	if(res==-1)
	{
		int err = errno;
		disconnect();
		throw IOException(std::string("Error while writing on socket: ") + strerror(err));
	}
	return static_cast<size_t>(res);
}

std::string Transport::readLine()
{
	char buff[256];

	while(true)
	{
		// Look at already read data in _buffer
		size_t idx = _buffer.find('\n');
		if(idx!=std::string::npos)
		{
			std::string res = _buffer.substr(0, idx);
			_buffer.erase(0, idx+1);
			while(!res.empty() && (res[res.size()-1]=='\r' || res[res.size()-1]=='\n'))
				res.erase(res.size()-1);
			upsdebugx(4, "Transport::readLine(): [%s]", res.c_str());
			return res;
		}

		// Read new buffer
		size_t sz = read(&buff, sizeof(buff));
		if(sz==0)
		{
			disconnect();
			throw ConnectionClosedException();
		}
		_buffer.append(buff, sz);
	}
}

void Transport::sendCommand(const std::string& line)
{
	std::string buff = line + "\n";
	size_t done = 0;

	upsdebugx(4, "Transport::sendCommand(): [%s]", line.c_str());

	while(done < buff.size())
	{
		done += write(buff.c_str() + done, buff.size() - done);
	}
}

void Transport::expectOk()
{
	std::string line = readLine();
	if(line.compare(0, 2, "OK") != 0)
	{
		throw ProtocolException("Expected OK", line);
	}
}


/*
 *
 * Data model implementation
 *
 */

ConnectionParameters::ConnectionParameters():
host("localhost"),
port(DEFAULT_UPSD_PORT),
username(),
password(),
timeout(DEFAULT_NETWORK_TIMEOUT),
pollInterval(DEFAULT_POLL_INTERVAL)
{
}

/* Well-known variables, in DeviceSummary field order */
static const struct {
	const char* key;
	Settable<std::string> DeviceSummary::* field;
} summary_fields[] = {
	{ "ups.status",       &DeviceSummary::status },
	{ "ups.model",        &DeviceSummary::model },
	{ "ups.mfr",          &DeviceSummary::manufacturer },
	{ "ups.serial",       &DeviceSummary::serial },
	{ "ups.type",         &DeviceSummary::upsType },
	{ "ups.load",         &DeviceSummary::loadPercent },
	{ "ups.realpower",    &DeviceSummary::realpowerWatts },
	{ "battery.charge",   &DeviceSummary::batteryChargePercent },
	{ "battery.runtime",  &DeviceSummary::batteryRuntimeSeconds },
	{ "battery.voltage",  &DeviceSummary::batteryVoltage },
	{ "input.voltage",    &DeviceSummary::inputVoltage },
	{ "output.voltage",   &DeviceSummary::outputVoltage },
	{ "input.frequency",  &DeviceSummary::inputFrequencyHz },
	{ "output.frequency", &DeviceSummary::outputFrequencyHz }
};

static const size_t summary_fields_count = sizeof(summary_fields) / sizeof(summary_fields[0]);

DeviceSummary DeviceSummary::fromVariables(const std::string& name, VariableTable vars)
{
	DeviceSummary summary;
	summary.name = name;

	for(size_t idx = 0; idx < summary_fields_count; ++idx)
	{
		VariableTable::iterator it = vars.find(summary_fields[idx].key);
		if(it != vars.end())
		{
			summary.*summary_fields[idx].field = it->second;
			vars.erase(it);
		}
	}

	/* std::map iterates in key order, extra comes out sorted */
	for(VariableTable::const_iterator it = vars.begin(); it != vars.end(); ++it)
	{
		summary.extra.push_back(*it);
	}

	return summary;
}

std::vector<std::pair<std::string, std::string> > DeviceSummary::entries(bool withExtra)const
{
	std::vector<std::pair<std::string, std::string> > res;

	for(size_t idx = 0; idx < summary_fields_count; ++idx)
	{
		const Settable<std::string>& field = this->*summary_fields[idx].field;
		if(field.set())
			res.push_back(std::make_pair(std::string(summary_fields[idx].key), *field));
	}
	if(withExtra)
		res.insert(res.end(), extra.begin(), extra.end());
	return res;
}


/*
 *
 * Client implementation
 *
 */

Client::Client(Transport* transport):
_transport(transport)
{
}

Client::~Client()
{
	delete _transport;
}

Client* Client::connect(const ConnectionParameters& params, int interrupt)
{
	Transport* transport = new Transport;
	transport->setDebugConnect(nut_debug_level >= 2);
	transport->setTimeout(params.timeout);
	transport->setInterrupt(interrupt);

	/* The client owns the transport from here, deleting it on failure */
	Client* client = new Client(transport);
	try
	{
		transport->connect(params.host, params.port);
		upsdebugx(1, "Connected to %s:%u", params.host.c_str(), params.port);

		if(!params.username.empty())
		{
			client->authenticate(params.username, params.password);
		}
		transport->setInterrupt(-1);
	}
	catch(...)
	{
		delete client;
		throw;
	}
	return client;
}

void Client::authenticate(const std::string& user, const std::string& passwd)
{
	if(user.empty())
		return;

	try
	{
		_transport->sendCommand("USERNAME " + user);
		_transport->expectOk();

		if(!passwd.empty())
		{
			_transport->sendCommand("PASSWORD " + passwd);
			_transport->expectOk();
		}
	}
	catch(CancelledException&)
	{
		throw;
	}
	catch(ProtocolException& ex)
	{
		throw AuthenticationException(ex.getLine());
	}
	catch(NutException& ex)
	{
		throw AuthenticationException(ex.str());
	}
	upsdebugx(1, "Authenticated as %s", user.c_str());
}

void Client::logout()
{
	_transport->sendCommand("LOGOUT");
	_transport->readLine();
	_transport->disconnect();
}

void Client::disconnect()
{
	if(!_transport->isConnected())
		return;

	/* Courtesy LOGOUT: the connection is going away whatever the outcome */
	try
	{
		_transport->setInterrupt(-1);
		_transport->sendCommand("LOGOUT");
	}
	catch(NutException& ex)
	{
		upsdebugx(2, "Client::disconnect(): LOGOUT not sent: %s", ex.what());
	}
	_transport->disconnect();
}

bool Client::isConnected()const
{
	return _transport->isConnected();
}

void Client::expectListBegin(const std::string& req)
{
	std::string line = _transport->readLine();
	if(line.compare(0, req.size(), req) != 0)
	{
		throw ProtocolException("Unexpected response to " + req.substr(6), line);
	}
}

bool Client::parseDeviceLine(const std::string& line, DeviceRecord& rec)
{
	if(line.compare(0, 4, "UPS ") != 0)
		return false;

	size_t pos = line.find(' ', 4);
	if(pos == std::string::npos)
	{
		throw ProtocolException("Missing UPS description", line);
	}

	rec.name = line.substr(4, pos - 4);
	rec.description = unquote(line.substr(pos + 1));
	return true;
}

bool Client::parseVariableLine(const std::string& line, const std::string& dev,
	std::string& name, std::string& value)
{
	if(line.compare(0, 4, "VAR ") != 0)
		return false;

	size_t pos = line.find(' ', 4);
	std::string ups = line.substr(4, pos == std::string::npos ? std::string::npos : pos - 4);
	if(ups != dev)
	{
		upsdebugx(3, "Dropping variable of another device: [%s]", line.c_str());
		return false;
	}
	if(pos == std::string::npos)
	{
		throw ProtocolException("Missing variable name", line);
	}

	size_t sep = line.find(' ', pos + 1);
	if(sep == std::string::npos)
	{
		throw ProtocolException("Missing variable value", line);
	}

	name = line.substr(pos + 1, sep - pos - 1);
	value = unquote(line.substr(sep + 1));
	return true;
}

DeviceList Client::listDevices()
{
	DeviceList res;

	_transport->sendCommand("LIST UPS");
	expectListBegin("BEGIN LIST UPS");

	while(true)
	{
		std::string line = _transport->readLine();
		if(line.compare(0, 12, "END LIST UPS") == 0)
			break;

		DeviceRecord rec;
		if(parseDeviceLine(line, rec))
			res.push_back(rec);
	}

	return res;
}

VariableTable Client::listVariables(const std::string& dev)
{
	VariableTable res;

	_transport->sendCommand("LIST VAR " + dev);
	expectListBegin("BEGIN LIST VAR");

	while(true)
	{
		std::string line = _transport->readLine();
		if(line.compare(0, 12, "END LIST VAR") == 0)
			break;

		std::string name, value;
		if(parseVariableLine(line, dev, name, value))
			res[name] = value;
	}

	return res;
}

DeviceSummary Client::getDeviceSummary(const std::string& dev)
{
	return DeviceSummary::fromVariables(dev, listVariables(dev));
}

std::string Client::unquote(const std::string& str)
{
	if(str.size() < 2 || str[0] != '"' || str[str.size()-1] != '"')
		return str;

	std::string res;
	bool escaped = false;

	for(size_t idx = 1; idx < str.size() - 1; ++idx)
	{
		char c = str[idx];
		if(escaped)
		{
			if(c != '\\' && c != '"')
				res += '\\';
			res += c;
			escaped = false;
		}
		else if(c == '\\')
		{
			escaped = true;
		}
		else
		{
			res += c;
		}
	}
	if(escaped)
		res += '\\';

	return res;
}

std::string Client::escape(const std::string& str)
{
	std::string res = "\"";

	for(size_t n=0; n<str.size(); n++)
	{
		char c = str[n];
		if(c=='"')
			res += "\\\"";
		else if(c=='\\')
			res += "\\\\";
		else
			res += c;
	}

	res += '"';
	return res;
}

} /* namespace nutmon */
