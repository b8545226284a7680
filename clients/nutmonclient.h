/* nutmonclient.h - definitions for the nutmon upsd client library

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

#ifndef NUTMON_NUTMONCLIENT_H_SEEN
#define NUTMON_NUTMONCLIENT_H_SEEN

#include <stdint.h>
#include <time.h>

#include <string>
#include <vector>
#include <map>
#include <utility>
#include <exception>

#include "nutmonconf.hpp"

namespace nutmon
{

class Transport;
class Client;

/**
 * Basic nut exception.
 */
class NutException : public std::exception
{
public:
	NutException(const std::string& msg):_msg(msg){}
	NutException(const NutException&) = default;
	NutException& operator=(const NutException& rhs) = default;
	virtual ~NutException() noexcept override;
	virtual const char * what() const noexcept override {return this->_msg.c_str();}
	virtual std::string str() const noexcept {return this->_msg;}
private:
	std::string _msg;
};

/**
 * System error.
 */
class SystemException : public NutException
{
public:
	SystemException();
	/** System error with a context, e.g. the failing call */
	SystemException(const std::string& context);
	SystemException(const SystemException&) = default;
	SystemException& operator=(const SystemException& rhs) = default;
	virtual ~SystemException() noexcept override;
private:
	static std::string err();
};


/**
 * IO oriented nut exception.
 * Any failure of the network transport (connect, read, write).
 */
class IOException : public NutException
{
public:
	IOException(const std::string& msg):NutException(msg){}
	IOException(const IOException&) = default;
	IOException& operator=(const IOException& rhs) = default;
	virtual ~IOException() noexcept override;
};

/**
 * IO oriented nut exception specialized for unknown host
 */
class UnknownHostException : public IOException
{
public:
	UnknownHostException():IOException("Unknown host"){}
	UnknownHostException(const UnknownHostException&) = default;
	UnknownHostException& operator=(const UnknownHostException& rhs) = default;
	virtual ~UnknownHostException() noexcept override;
};

/**
 * IO oriented nut exception when client is not connected
 */
class NotConnectedException : public IOException
{
public:
	NotConnectedException():IOException("Not connected"){}
	NotConnectedException(const NotConnectedException&) = default;
	NotConnectedException& operator=(const NotConnectedException& rhs) = default;
	virtual ~NotConnectedException() noexcept override;
};

/**
 * IO oriented nut exception when there is no response.
 */
class TimeoutException : public IOException
{
public:
	TimeoutException():IOException("Timeout"){}
	TimeoutException(const TimeoutException&) = default;
	TimeoutException& operator=(const TimeoutException& rhs) = default;
	virtual ~TimeoutException() noexcept override;
};

/**
 * IO oriented nut exception when the server closed the connection
 * before a complete response was read.
 */
class ConnectionClosedException : public IOException
{
public:
	ConnectionClosedException():IOException("Server closed connection unexpectedly"){}
	ConnectionClosedException(const ConnectionClosedException&) = default;
	ConnectionClosedException& operator=(const ConnectionClosedException& rhs) = default;
	virtual ~ConnectionClosedException() noexcept override;
};

/**
 * The server response does not match the expected framing.
 * Keeps the offending line as received.
 */
class ProtocolException : public NutException
{
public:
	ProtocolException(const std::string& msg, const std::string& line):
		NutException(msg + ": " + line), _line(line){}
	ProtocolException(const ProtocolException&) = default;
	ProtocolException& operator=(const ProtocolException& rhs) = default;
	virtual ~ProtocolException() noexcept override;

	/** Raw line received from the server */
	const std::string& getLine()const{return _line;}
private:
	std::string _line;
};

/**
 * USERNAME/PASSWORD handshake rejected (or broken) by the server.
 */
class AuthenticationException : public NutException
{
public:
	AuthenticationException(const std::string& msg):NutException("Authentication failed: " + msg){}
	AuthenticationException(const AuthenticationException&) = default;
	AuthenticationException& operator=(const AuthenticationException& rhs) = default;
	virtual ~AuthenticationException() noexcept override;
};

/**
 * A blocking wait was interrupted on purpose (see Transport::setInterrupt()).
 * Not an error condition: the operation was cancelled by its owner.
 */
class CancelledException : public NutException
{
public:
	CancelledException():NutException("Cancelled"){}
	CancelledException(const CancelledException&) = default;
	CancelledException& operator=(const CancelledException& rhs) = default;
	virtual ~CancelledException() noexcept override;
};


/**
 * Line oriented TCP transport to upsd.
 *
 * Frames commands and responses as newline-terminated lines.
 * Exactly one command is outstanding at a time: the protocol is
 * strictly synchronous request/response.
 */
class Transport
{
public:
	Transport();
	~Transport();

	/**
	 * Open a TCP connection.
	 * \param host Server host name or address.
	 * \param port Server port.
	 * \throw IOException (or subclass) on any failure.
	 */
	void connect(const std::string& host, uint16_t port);

	/**
	 * Map a getaddrinfo() failure to the matching exception.
	 * Temporary resolver failures are reported too, the caller
	 * decides whether to try again.
	 */
	static void throwResolveError(int error);

	/**
	 * Adopt an already connected stream socket.
	 * The transport becomes its owner and closes it on disconnect.
	 */
	void attach(int fd);

	void disconnect();
	bool isConnected()const;

	/**
	 * Set the timeout in seconds for connect, read and write,
	 * negative to block operations.
	 */
	void setTimeout(time_t timeout);
	time_t getTimeout()const{return _timeout;}
	bool hasTimeout()const{return _timeout>=0;}

	/**
	 * Set a descriptor which, once readable, aborts any pending
	 * wait with CancelledException. -1 to disable.
	 */
	void setInterrupt(int fd){_interrupt = fd;}

	/**
	 * Send one command line (a newline is appended).
	 */
	void sendCommand(const std::string& line);

	/**
	 * Read one line, without its trailing CR/LF.
	 * \throw ConnectionClosedException when the server closed the connection.
	 */
	std::string readLine();

	/**
	 * Read one line and require it to begin with "OK".
	 * \throw ProtocolException carrying the line otherwise.
	 */
	void expectOk();

	void setDebugConnect(bool d){_debugConnect = d;}

private:
	/** Non-copyable: exclusive owner of the socket */
	Transport(const Transport&);
	Transport& operator=(const Transport&);

	/**
	 * Wait until the socket is ready (for reading or writing).
	 * \throw TimeoutException, CancelledException.
	 */
	void waitFor(bool forWrite);

	size_t read(void* buf, size_t sz);
	size_t write(const void* buf, size_t sz);

	int _sock;
	int _interrupt;
	bool _debugConnect;
	time_t _timeout;
	std::string _buffer; /* Received buffer, string because data should be text only. */
};


/**
 * Connection parameters of one connect attempt.
 */
struct ConnectionParameters
{
	std::string host;
	uint16_t port;
	/** Empty: anonymous session, no USERNAME/PASSWORD sent */
	std::string username;
	/** Empty: no PASSWORD sent */
	std::string password;
	/** Network timeout in seconds, negative blocks */
	time_t timeout;
	/** Seconds between two polls of the devices */
	unsigned int pollInterval;

	ConnectionParameters();
};

/**
 * One device known by upsd, as listed by LIST UPS.
 */
struct DeviceRecord
{
	std::string name;
	std::string description;

	DeviceRecord() {}
	DeviceRecord(const std::string& n, const std::string& d):name(n), description(d) {}

	bool operator==(const DeviceRecord& rec)const
	{
		return name == rec.name && description == rec.description;
	}
};

typedef std::vector<DeviceRecord> DeviceList;

/** Variable values of one device, indexed by variable names */
typedef std::map<std::string, std::string> VariableTable;

/**
 * Structured view of the most common variables of a device.
 * Every field is optional since not every UPS exposes everything.
 * Variables without a dedicated field are kept in extra, sorted by name.
 */
struct DeviceSummary
{
	std::string name;

	/* Common UPS fields */
	Settable<std::string> status;        /* ups.status */
	Settable<std::string> model;         /* ups.model */
	Settable<std::string> manufacturer;  /* ups.mfr */
	Settable<std::string> serial;        /* ups.serial */
	Settable<std::string> upsType;       /* ups.type */

	/* Load / power */
	Settable<std::string> loadPercent;     /* ups.load */
	Settable<std::string> realpowerWatts;  /* ups.realpower */

	/* Battery */
	Settable<std::string> batteryChargePercent;  /* battery.charge */
	Settable<std::string> batteryRuntimeSeconds; /* battery.runtime */
	Settable<std::string> batteryVoltage;        /* battery.voltage */

	/* Input / output electrical info */
	Settable<std::string> inputVoltage;      /* input.voltage */
	Settable<std::string> outputVoltage;     /* output.voltage */
	Settable<std::string> inputFrequencyHz;  /* input.frequency */
	Settable<std::string> outputFrequencyHz; /* output.frequency */

	std::vector<std::pair<std::string, std::string> > extra;

	/**
	 * Project a variable table: well-known keys go to their field,
	 * the remaining ones to extra.
	 */
	static DeviceSummary fromVariables(const std::string& name, VariableTable vars);

	/**
	 * All variables of the summary as (name, value) pairs,
	 * well-known ones first (in field order) then extra.
	 */
	std::vector<std::pair<std::string, std::string> > entries(bool withExtra = true)const;
};

/** Summaries of all devices, indexed by device name, captured at one tick */
typedef std::map<std::string, DeviceSummary> PollSnapshot;


/**
 * A nutmon client is the starting point to dialog to upsd.
 * It exclusively owns one connected Transport: it can't be copied,
 * only handed over by pointer.
 */
class Client
{
public:
	/**
	 * Client over a connected transport, the client takes its ownership.
	 */
	explicit Client(Transport* transport);
	~Client();

	/**
	 * Connect to upsd then authenticate when a username is given.
	 * \param params Connection parameters.
	 * \param interrupt Descriptor aborting the attempt once readable, -1 for none.
	 * \return A new client, to be deleted by the caller.
	 * \throw IOException when the connection fails,
	 *        AuthenticationException when the handshake fails.
	 */
	static Client* connect(const ConnectionParameters& params, int interrupt = -1);

	/**
	 * USERNAME then (if not empty) PASSWORD handshake.
	 * \throw AuthenticationException on any failure.
	 */
	void authenticate(const std::string& user, const std::string& passwd);

	/**
	 * LOGOUT then close the connection.
	 */
	void logout();

	/**
	 * Close the connection, trying to say LOGOUT without waiting for the reply.
	 */
	void disconnect();

	bool isConnected()const;

	/**
	 * LIST UPS: devices in server order.
	 */
	DeviceList listDevices();

	/**
	 * LIST VAR: variable values of a device.
	 */
	VariableTable listVariables(const std::string& dev);

	/**
	 * LIST VAR projected into a DeviceSummary.
	 */
	DeviceSummary getDeviceSummary(const std::string& dev);

	Transport& getTransport(){return *_transport;}

	/**
	 * Protocol helpers
	 * \{
	 */
	/**
	 * Parse a `UPS <name> "<description>"` line.
	 * \return false if the line is not a UPS line.
	 * \throw ProtocolException if name or description is missing.
	 */
	static bool parseDeviceLine(const std::string& line, DeviceRecord& rec);
	/**
	 * Parse a `VAR <dev> <name> "<value>"` line.
	 * \return false if the line is not a VAR line of device \p dev.
	 * \throw ProtocolException if name or value is missing.
	 */
	static bool parseVariableLine(const std::string& line, const std::string& dev,
		std::string& name, std::string& value);
	/** Strip the outer quotes of a quoted field and decode \" and \\ */
	static std::string unquote(const std::string& str);
	/** Quote a string field, escaping " and \ */
	static std::string escape(const std::string& str);
	/** \} */

private:
	/** Non-copyable: exclusive owner of the transport */
	Client(const Client&);
	Client& operator=(const Client&);

	/** Read the BEGIN LIST line of a LIST query */
	void expectListBegin(const std::string& req);

	Transport* _transport;
};

} /* namespace nutmon */

#endif	/* NUTMON_NUTMONCLIENT_H_SEEN */
