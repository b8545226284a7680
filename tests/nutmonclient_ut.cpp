/*
    tests/nutmonclient_ut.cpp - upsd protocol client tests

    Copyright (C)
	2016	Emilien Kia <emilien.kia@gmail.com>
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
#include "fakeupsd.h"
using namespace nutmon;

#include <string>
#include <cerrno>

#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>

extern bool verbose;

#include <cppunit/extensions/HelperMacros.h>

/*
 * Tests talk to the client through the other end of a socket pair:
 * replies are queued in the socket buffer before the call, requests
 * are collected from it after.
 */
class NutmonClientTest : public CppUnit::TestFixture
{
	CPPUNIT_TEST_SUITE( NutmonClientTest );
		CPPUNIT_TEST( testUnquote );
		CPPUNIT_TEST( testEscape );
		CPPUNIT_TEST( testParseDeviceLine );
		CPPUNIT_TEST( testParseVariableLine );
		CPPUNIT_TEST( testReadLine );
		CPPUNIT_TEST( testReadLineClosed );
		CPPUNIT_TEST( testReadLineTimeout );
		CPPUNIT_TEST( testReadLineInterrupted );
		CPPUNIT_TEST( testExpectOk );
		CPPUNIT_TEST( testListDevices );
		CPPUNIT_TEST( testListDevicesErrors );
		CPPUNIT_TEST( testListVariables );
		CPPUNIT_TEST( testListVariablesErrors );
		CPPUNIT_TEST( testDeviceSummary );
		CPPUNIT_TEST( testAuthenticate );
		CPPUNIT_TEST( testAuthenticateRejected );
		CPPUNIT_TEST( testLogout );
		CPPUNIT_TEST( testConnect );
		CPPUNIT_TEST( testConnectFailures );
		CPPUNIT_TEST( testResolveErrors );
	CPPUNIT_TEST_SUITE_END();

public:
	void setUp() override;
	void tearDown() override;

	void testUnquote();
	void testEscape();
	void testParseDeviceLine();
	void testParseVariableLine();
	void testReadLine();
	void testReadLineClosed();
	void testReadLineTimeout();
	void testReadLineInterrupted();
	void testExpectOk();
	void testListDevices();
	void testListDevicesErrors();
	void testListVariables();
	void testListVariablesErrors();
	void testDeviceSummary();
	void testAuthenticate();
	void testAuthenticateRejected();
	void testLogout();
	void testConnect();
	void testConnectFailures();
	void testResolveErrors();

private:
	/** Queue server replies */
	void serve(const std::string& data);
	/** Requests sent by the client so far */
	std::string received();

	int _peer;
	Client* _client;
};

// Registers the fixture into the 'registry'
CPPUNIT_TEST_SUITE_REGISTRATION( NutmonClientTest );


void NutmonClientTest::setUp()
{
	int fds[2];
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Cannot create socket pair", 0, ::socketpair(AF_UNIX, SOCK_STREAM, 0, fds));

	Transport* transport = new Transport;
	transport->attach(fds[0]);
	transport->setTimeout(2);

	_peer = fds[1];
	_client = new Client(transport);
}

void NutmonClientTest::tearDown()
{
	delete _client;
	_client = nullptr;

	if(_peer != -1)
		::close(_peer);
	_peer = -1;
}

void NutmonClientTest::serve(const std::string& data)
{
	size_t done = 0;
	while(done < data.size())
	{
		ssize_t res = ::send(_peer, data.data() + done, data.size() - done, MSG_NOSIGNAL);
		CPPUNIT_ASSERT_MESSAGE("Cannot queue server replies", res > 0 || errno == EINTR);
		if(res > 0)
			done += static_cast<size_t>(res);
	}
}

std::string NutmonClientTest::received()
{
	std::string res;
	char buff[256];

	while(true)
	{
		ssize_t sz = ::recv(_peer, buff, sizeof(buff), MSG_DONTWAIT);
		if(sz <= 0)
			break;
		res.append(buff, static_cast<size_t>(sz));
	}
	return res;
}


void NutmonClientTest::testUnquote()
{
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Outer quotes not stripped",
		std::string("Desc 1"), Client::unquote("\"Desc 1\""));
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Unquoted value must be kept verbatim",
		std::string("OL"), Client::unquote("OL"));
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Unquoted value must not be unescaped",
		std::string("a\\\"b"), Client::unquote("a\\\"b"));
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Escaped quote not decoded",
		std::string("say \"hi\""), Client::unquote("\"say \\\"hi\\\"\""));
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Escaped backslash not decoded",
		std::string("C:\\ups"), Client::unquote("\"C:\\\\ups\""));
	/* x\\\"y on the wire: one backslash then one quote, nothing decoded twice */
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Escapes must be decoded in one pass",
		std::string("x\\\"y"), Client::unquote("\"x\\\\\\\"y\""));
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Escaped backslash followed by n must stay a backslash",
		std::string("\\n"), Client::unquote("\"\\\\n\""));
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Empty quoted value",
		std::string(""), Client::unquote("\"\""));
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Lone quote must be kept",
		std::string("\""), Client::unquote("\""));
}

void NutmonClientTest::testEscape()
{
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad plain escape",
		std::string("\"Back-UPS 650\""), Client::escape("Back-UPS 650"));
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad special chars escape",
		std::string("\"a\\\"b\\\\c\""), Client::escape("a\"b\\c"));

	static const char* values[] = {
		"", "OL", "a\"b", "a\\b", "\\\"", "ends with \\", "\"quoted\"", nullptr
	};
	for(const char** value = values; *value != nullptr; ++value)
	{
		CPPUNIT_ASSERT_EQUAL_MESSAGE("escape/unquote must round-trip",
			std::string(*value), Client::unquote(Client::escape(*value)));
	}
}

void NutmonClientTest::testParseDeviceLine()
{
	DeviceRecord rec;

	CPPUNIT_ASSERT_MESSAGE("UPS line not parsed",
		Client::parseDeviceLine("UPS ups1 \"Desc 1\"", rec));
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad device name", std::string("ups1"), rec.name);
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad device description", std::string("Desc 1"), rec.description);

	CPPUNIT_ASSERT_MESSAGE("Non UPS line must be ignored",
		!Client::parseDeviceLine("VAR ups1 ups.status \"OL\"", rec));
	CPPUNIT_ASSERT_MESSAGE("Non UPS line must be ignored",
		!Client::parseDeviceLine("UPSX ups1 \"Desc\"", rec));

	CPPUNIT_ASSERT_THROW_MESSAGE("UPS line without description must be rejected",
		Client::parseDeviceLine("UPS ups1", rec), ProtocolException);
}

void NutmonClientTest::testParseVariableLine()
{
	std::string name, value;

	CPPUNIT_ASSERT_MESSAGE("VAR line not parsed",
		Client::parseVariableLine("VAR ups1 ups.status \"OL CHRG\"", "ups1", name, value));
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad variable name", std::string("ups.status"), name);
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad variable value", std::string("OL CHRG"), value);

	CPPUNIT_ASSERT_MESSAGE("VAR line of another device must be dropped",
		!Client::parseVariableLine("VAR other.dev x \"1\"", "ups1", name, value));
	CPPUNIT_ASSERT_MESSAGE("Non VAR line must be ignored",
		!Client::parseVariableLine("UPS ups1 \"Desc\"", "ups1", name, value));

	CPPUNIT_ASSERT_THROW_MESSAGE("VAR line without name must be rejected",
		Client::parseVariableLine("VAR ups1", "ups1", name, value), ProtocolException);
	CPPUNIT_ASSERT_THROW_MESSAGE("VAR line without value must be rejected",
		Client::parseVariableLine("VAR ups1 battery.charge", "ups1", name, value), ProtocolException);
}

void NutmonClientTest::testReadLine()
{
	Transport& transport = _client->getTransport();

	serve("OK\r\nfirst line\nsecond");
	CPPUNIT_ASSERT_EQUAL_MESSAGE("CRLF not stripped", std::string("OK"), transport.readLine());
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad 2nd line", std::string("first line"), transport.readLine());

	serve(" line\n");
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Line split over two reads not joined",
		std::string("second line"), transport.readLine());

	transport.sendCommand("LIST UPS");
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Command not newline terminated", std::string("LIST UPS\n"), received());
}

void NutmonClientTest::testReadLineClosed()
{
	serve("partial");
	::close(_peer);
	_peer = -1;

	CPPUNIT_ASSERT_THROW_MESSAGE("Closed peer must be reported",
		_client->getTransport().readLine(), ConnectionClosedException);
	CPPUNIT_ASSERT_MESSAGE("Transport must be closed after EOF", !_client->isConnected());
}

void NutmonClientTest::testReadLineTimeout()
{
	Transport& transport = _client->getTransport();
	transport.setTimeout(1);

	CPPUNIT_ASSERT_THROW_MESSAGE("Silent peer must time out",
		transport.readLine(), TimeoutException);
}

void NutmonClientTest::testReadLineInterrupted()
{
	CancellationToken token;
	Transport& transport = _client->getTransport();

	transport.setTimeout(-1);
	transport.setInterrupt(token.fd());
	token.cancel();

	CPPUNIT_ASSERT_THROW_MESSAGE("Cancelled wait must be interrupted",
		transport.readLine(), CancelledException);

	transport.setInterrupt(-1);
}

void NutmonClientTest::testExpectOk()
{
	Transport& transport = _client->getTransport();

	serve("OK Goodbye\nERR INVALID-PASSWORD\n");
	transport.expectOk();

	try
	{
		transport.expectOk();
		CPPUNIT_FAIL("ERR reply must be rejected");
	}
	catch(ProtocolException& ex)
	{
		CPPUNIT_ASSERT_EQUAL_MESSAGE("Raw line not kept",
			std::string("ERR INVALID-PASSWORD"), ex.getLine());
	}
}

void NutmonClientTest::testListDevices()
{
	serve(
		"BEGIN LIST UPS\n"
		"UPS ups1 \"Desc 1\"\n"
		"UPS ups2 \"Desc 2\"\n"
		"END LIST UPS\n");

	DeviceList devices = _client->listDevices();

	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad request", std::string("LIST UPS\n"), received());
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad device count", static_cast<size_t>(2), devices.size());
	CPPUNIT_ASSERT_MESSAGE("Bad 1st device", devices[0] == DeviceRecord("ups1", "Desc 1"));
	CPPUNIT_ASSERT_MESSAGE("Bad 2nd device", devices[1] == DeviceRecord("ups2", "Desc 2"));

	/* Server order is kept, duplicates and stray lines are not filtered */
	serve(
		"BEGIN LIST UPS\n"
		"UPS zeta \"Z\"\n"
		"this line means nothing\n"
		"UPS alpha \"A \\\"quoted\\\"\"\n"
		"UPS zeta \"Z\"\n"
		"END LIST UPS\n");

	devices = _client->listDevices();

	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad device count", static_cast<size_t>(3), devices.size());
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Order not kept", std::string("zeta"), devices[0].name);
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Order not kept", std::string("alpha"), devices[1].name);
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Description not unquoted", std::string("A \"quoted\""), devices[1].description);
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Duplicate dropped", std::string("zeta"), devices[2].name);

	serve("BEGIN LIST UPS\nEND LIST UPS\n");
	CPPUNIT_ASSERT_MESSAGE("Empty list expected", _client->listDevices().empty());
}

void NutmonClientTest::testListDevicesErrors()
{
	serve("ERR ACCESS-DENIED\n");
	try
	{
		_client->listDevices();
		CPPUNIT_FAIL("ERR reply to LIST UPS must be rejected");
	}
	catch(ProtocolException& ex)
	{
		CPPUNIT_ASSERT_EQUAL_MESSAGE("Raw line not kept",
			std::string("ERR ACCESS-DENIED"), ex.getLine());
	}

	serve(
		"BEGIN LIST UPS\n"
		"UPS lonely\n"
		"END LIST UPS\n");
	CPPUNIT_ASSERT_THROW_MESSAGE("UPS line without description must be rejected",
		_client->listDevices(), ProtocolException);
}

void NutmonClientTest::testListVariables()
{
	serve(
		"BEGIN LIST VAR ups1\n"
		"VAR ups1 ups.status \"OL\"\n"
		"VAR ups1 battery.charge \"100\"\n"
		"VAR other.dev x \"1\"\n"
		"END LIST VAR ups1\n");

	VariableTable vars = _client->listVariables("ups1");

	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad request", std::string("LIST VAR ups1\n"), received());
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad variable count", static_cast<size_t>(2), vars.size());
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad ups.status", std::string("OL"), vars["ups.status"]);
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad battery.charge", std::string("100"), vars["battery.charge"]);
	CPPUNIT_ASSERT_MESSAGE("Variable of another device kept", vars.find("x") == vars.end());
}

void NutmonClientTest::testListVariablesErrors()
{
	serve("ERR UNKNOWN-UPS\n");
	CPPUNIT_ASSERT_THROW_MESSAGE("ERR reply to LIST VAR must be rejected",
		_client->listVariables("nope"), ProtocolException);

	serve(
		"BEGIN LIST VAR ups1\n"
		"VAR ups1 battery.charge\n"
		"END LIST VAR ups1\n");
	CPPUNIT_ASSERT_THROW_MESSAGE("VAR line without value must be rejected",
		_client->listVariables("ups1"), ProtocolException);

	serve("BEGIN LIST VAR ups1\nVAR ups1 ups.status \"OL\"\n");
	::close(_peer);
	_peer = -1;
	CPPUNIT_ASSERT_THROW_MESSAGE("Truncated list must be reported",
		_client->listVariables("ups1"), IOException);
}

void NutmonClientTest::testDeviceSummary()
{
	serve(
		"BEGIN LIST VAR ups1\n"
		"VAR ups1 ups.status \"OL\"\n"
		"VAR ups1 battery.charge \"100\"\n"
		"END LIST VAR ups1\n");

	DeviceSummary summary = _client->getDeviceSummary("ups1");

	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad name", std::string("ups1"), summary.name);
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad status", std::string("OL"), *summary.status);
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad battery charge", std::string("100"), *summary.batteryChargePercent);
	CPPUNIT_ASSERT_MESSAGE("Extra must be empty", summary.extra.empty());
	CPPUNIT_ASSERT_MESSAGE("Model must stay unset", !summary.model.set());

	VariableTable vars;
	vars["ups.status"] = "OB LB";
	vars["ups.mfr"] = "Eaton";
	vars["ups.model"] = "5E";
	vars["ups.serial"] = "G123";
	vars["ups.type"] = "offline";
	vars["ups.load"] = "23";
	vars["ups.realpower"] = "120";
	vars["battery.charge"] = "12";
	vars["battery.runtime"] = "300";
	vars["battery.voltage"] = "12.1";
	vars["input.voltage"] = "0.0";
	vars["output.voltage"] = "230.0";
	vars["input.frequency"] = "50.0";
	vars["output.frequency"] = "49.9";
	vars["ups.beeper.status"] = "enabled";
	vars["driver.name"] = "usbhid-ups";
	vars["device.type"] = "ups";

	summary = DeviceSummary::fromVariables("ups2", vars);

	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad manufacturer", std::string("Eaton"), *summary.manufacturer);
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad model", std::string("5E"), *summary.model);
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad serial", std::string("G123"), *summary.serial);
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad type", std::string("offline"), *summary.upsType);
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad load", std::string("23"), *summary.loadPercent);
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad realpower", std::string("120"), *summary.realpowerWatts);
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad runtime", std::string("300"), *summary.batteryRuntimeSeconds);
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad battery voltage", std::string("12.1"), *summary.batteryVoltage);
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad input voltage", std::string("0.0"), *summary.inputVoltage);
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad output voltage", std::string("230.0"), *summary.outputVoltage);
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad input frequency", std::string("50.0"), *summary.inputFrequencyHz);
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad output frequency", std::string("49.9"), *summary.outputFrequencyHz);

	/* Every variable ends up exactly once in the summary */
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad extra count", static_cast<size_t>(3), summary.extra.size());
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Extra not sorted", std::string("device.type"), summary.extra[0].first);
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Extra not sorted", std::string("driver.name"), summary.extra[1].first);
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Extra not sorted", std::string("ups.beeper.status"), summary.extra[2].first);
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad entry count", vars.size(), summary.entries().size());
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad entry count without extra", vars.size() - 3, summary.entries(false).size());
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Status must come first", std::string("ups.status"), summary.entries()[0].first);
}

void NutmonClientTest::testAuthenticate()
{
	serve("OK\nOK\n");
	_client->authenticate("admin", "secret");
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad handshake",
		std::string("USERNAME admin\nPASSWORD secret\n"), received());

	serve("OK\n");
	_client->authenticate("monuser", "");
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Empty password must not be sent",
		std::string("USERNAME monuser\n"), received());

	_client->authenticate("", "ignored");
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Anonymous session must send nothing",
		std::string(""), received());
}

void NutmonClientTest::testAuthenticateRejected()
{
	serve("OK\nERR ACCESS-DENIED\n");
	try
	{
		_client->authenticate("admin", "wrong");
		CPPUNIT_FAIL("Rejected password must fail authentication");
	}
	catch(AuthenticationException& ex)
	{
		CPPUNIT_ASSERT_MESSAGE("Server reply not kept in the message",
			std::string(ex.what()).find("ERR ACCESS-DENIED") != std::string::npos);
	}

	serve("ERR INVALID-USERNAME\n");
	CPPUNIT_ASSERT_THROW_MESSAGE("Rejected username must fail authentication",
		_client->authenticate("bad user", "x"), AuthenticationException);
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Password must not follow a rejected username",
		std::string("USERNAME admin\nPASSWORD wrong\nUSERNAME bad user\n"), received());

	::close(_peer);
	_peer = -1;
	CPPUNIT_ASSERT_THROW_MESSAGE("Closed connection must fail authentication",
		_client->authenticate("admin", "x"), AuthenticationException);
}

void NutmonClientTest::testLogout()
{
	serve("OK Goodbye\n");
	_client->logout();

	CPPUNIT_ASSERT_EQUAL_MESSAGE("LOGOUT not sent", std::string("LOGOUT\n"), received());
	CPPUNIT_ASSERT_MESSAGE("Connection must be closed", !_client->isConnected());

	CPPUNIT_ASSERT_THROW_MESSAGE("Closed client must not be usable",
		_client->listDevices(), NotConnectedException);
}

void NutmonClientTest::testConnect()
{
	VariableTable vars;
	vars["ups.status"] = "OL";

	FakeUpsd upsd;
	upsd.addDevice("ups1", "Desc 1", vars);
	upsd.setCredentials("admin", "secret");
	uint16_t port = upsd.listen();

	ConnectionParameters params;
	params.host = "127.0.0.1";
	params.port = port;
	params.username = "admin";
	params.password = "secret";

	Client* client = Client::connect(params);
	CPPUNIT_ASSERT_MESSAGE("Client not connected", client->isConnected());

	DeviceList devices = client->listDevices();
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad device count", static_cast<size_t>(1), devices.size());
	CPPUNIT_ASSERT_EQUAL_MESSAGE("Bad status", std::string("OL"), *client->getDeviceSummary("ups1").status);

	client->disconnect();
	CPPUNIT_ASSERT_MESSAGE("Client still connected", !client->isConnected());
	delete client;

	CPPUNIT_ASSERT_MESSAGE("Server did not see the client leave", upsd.waitClosed(1, 5));
	CPPUNIT_ASSERT_EQUAL_MESSAGE("LOGOUT not received", 1u, upsd.logoutCount());
}

void NutmonClientTest::testConnectFailures()
{
	ConnectionParameters params;
	params.host = "127.0.0.1";
	params.port = FakeUpsd::unusedPort();

	CPPUNIT_ASSERT_THROW_MESSAGE("Refused connection must be reported",
		Client::connect(params), IOException);

	params.host = "";
	CPPUNIT_ASSERT_THROW_MESSAGE("Empty host must be reported",
		Client::connect(params), UnknownHostException);

	FakeUpsd upsd;
	upsd.setCredentials("admin", "secret");

	params.host = "127.0.0.1";
	params.port = upsd.listen();
	params.username = "admin";
	params.password = "wrong";

	CPPUNIT_ASSERT_THROW_MESSAGE("Bad password must fail the connection",
		Client::connect(params), AuthenticationException);
	CPPUNIT_ASSERT_MESSAGE("Rejected connection not released", upsd.waitClosed(1, 5));
}

void NutmonClientTest::testResolveErrors()
{
	CPPUNIT_ASSERT_THROW_MESSAGE("Unknown name must be reported",
		Transport::throwResolveError(EAI_NONAME), UnknownHostException);

	/* A flaky resolver must fail the attempt instead of looping */
	bool thrown = false;
	try
	{
		Transport::throwResolveError(EAI_AGAIN);
	}
	catch(const UnknownHostException&)
	{
		CPPUNIT_FAIL("Temporary failure reported as unknown host");
	}
	catch(const IOException& ex)
	{
		thrown = true;
		CPPUNIT_ASSERT_MESSAGE("Temporary failure not in the message",
			ex.str().find("Temporary") != std::string::npos);
	}
	CPPUNIT_ASSERT_MESSAGE("Temporary resolver failure not reported", thrown);

	CPPUNIT_ASSERT_THROW_MESSAGE("Other resolver failures must be reported",
		Transport::throwResolveError(EAI_FAIL), IOException);
	CPPUNIT_ASSERT_THROW_MESSAGE("Resolver out of memory must be reported",
		Transport::throwResolveError(EAI_MEMORY), NutException);
}
