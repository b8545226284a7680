/*
 *  Copyright (C)
 *      2013 - EATON
 *      2026 - nutmon developers
 *
 *  This program is free software; you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program; if not, write to the Free Software
 *  Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA 02111-1307 USA
 */

/*! \file nutmon.cpp
    \brief UPS monitoring terminal client
*/

#include "common.h"
#include "nutmonconf.hpp"
#include "controller.h"

#include <iostream>
#include <list>
#include <map>
#include <sstream>
#include <stdexcept>
#include <cstring>
#include <cstdlib>

#include <signal.h>

using namespace nutmon;

static volatile sig_atomic_t exit_flag = 0;


class Usage {
	private:

	/** Usage text */
	static const char * s_text[];

	/** Private constructor (no instances) */
	Usage() {}

	public:

	/** Print version and usage to stderr */
	static void print(const std::string & bin);

	/** Print version info to stdout */
	static void printVersion(const std::string & bin);

};  // end of class usage


const char * Usage::s_text[] = {
	"    -h  --help                          Display this help and exit",
	"    -V  --version                       Display version info and exit",
	"    -D  --debug                         Raise debugging level (repeatable)",
	"    -s  --syslog                        Also send log messages to syslog",
	"    -c  --config <file>                 Configuration file",
	"                                        (default: $NUT_CONFPATH/nutmon.conf)",
	"    -u  --user <username>               Log in upsd as <username>",
	"    -p  --password <password>           Password of <username>",
	"    -i  --interval <seconds>            Seconds between two polls (default: 2)",
	"    -t  --timeout <seconds>             Network timeout (default: 5)",
	"    -l  --list                          List the devices of upsd and exit",
	"    -1  --once                          Print one poll and exit",
	"    -a  --all                           Show every variable, not only the summary",
	"",
	"<target> is [<upsname>@]<host>[:<port>]; without <upsname> every device is shown.",
	"It may also come from MONITOR, HOST, PORT and DEVICE directives of the",
	"configuration file.",
	"",
};

/**
 * Print version info to stdout
 */
void Usage::printVersion(const std::string & bin) {
	std::cout
		<< "nutmon " << bin
		<< " " << NUTMON_VERSION << std::endl;
}

/**
 * Print help text (including version info) to stderr
 */
void Usage::print(const std::string & bin) {
	std::cerr
		<< "nutmon " << bin
		<< " " << NUTMON_VERSION << std::endl
		<< std::endl
		<< "Usage: " << bin << " [<target>] [OPTIONS]" << std::endl
		<< std::endl
		<< "OPTIONS:" << std::endl;

	for (size_t i = 0; i < sizeof(s_text) / sizeof(char *); ++i) {
		std::cerr << s_text[i] << std::endl;
	}
}


/** Command line options */
class Options {
	public:

	/** Options list */
	typedef std::list<std::string> List;

	/** Option arguments list */
	typedef std::list<std::string> Arguments;

	protected:

	/** Options map */
	typedef std::multimap<std::string, Arguments> Map;

	private:

	/** Option type */
	typedef enum {
		singleDash,  /**< Single-dash prefixed option */
		doubleDash,  /**< Double-dash prefixed option */
	} type_t;

	/** Arguments of the last option processed (\c nullptr means bin. args) */
	Arguments * m_last;

	/** Binary arguments */
	Arguments m_args;

	/** Single-dashed options */
	Map m_single;

	/** Double-dashed options */
	Map m_double;

	/**
	 *  \brief  Add option
	 *
	 *  \param  type  Option type
	 *  \param  opt   Option
	 */
	void add(type_t type, const std::string & opt);

	/**
	 *  \brief  Add argument to the last option
	 *
	 *  \param  arg  Argument
	 */
	inline void addArg(const std::string & arg) {
		Arguments * args = nullptr != m_last ? m_last : &m_args;

		args->push_back(arg);
	}

	/**
	 *  \brief  Get option arguments
	 *
	 *  \param[in]   map    Option map
	 *  \param[in]   opt    Option
	 *  \param[out]  args   Option arguments
	 *  \param[in]   order  Option order (1st by default)
	 *
	 *  \retval true  IFF the option was specified on the command line
	 *  \retval false otherwise
	 */
	bool get(const Map & map, const std::string & opt, Arguments & args, size_t order = 0) const;

	/** Options of \p map, repeated as many times as given */
	void strings(const Map & map, List & list) const;

	public:

	/**
	 *  \brief  Constructor (from \c main routine arguments)
	 *
	 *  \param  argv  Argument list
	 *  \param  argc  Argument count
	 */
	Options(char * const argv[], int argc);

	inline bool getSingle(const std::string & opt, Arguments & args, size_t order = 0) const {
		return get(m_single, opt, args, order);
	}

	inline bool getDouble(const std::string & opt, Arguments & args, size_t order = 0) const {
		return get(m_double, opt, args, order);
	}

	/**
	 *  \brief  Get binary arguments
	 *
	 *  \return Arguments of the binary itself
	 */
	inline const Arguments & get() const { return m_args; }

	inline List stringsSingle() const {
		List list;

		strings(m_single, list);

		return list;
	}

	inline List stringsDouble() const {
		List list;

		strings(m_double, list);

		return list;
	}

};  // end of class Options


void Options::add(Options::type_t type, const std::string & opt) {
	Map * map = (singleDash == type ? &m_single : &m_double);

	Map::iterator entry = map->insert(Map::value_type(opt, Arguments()));

	m_last = &entry->second;
}


bool Options::get(const Options::Map & map, const std::string & opt, Arguments & args, size_t order) const {
	Map::const_iterator entry = map.find(opt);

	if (map.end() == entry)
		return false;

	for (; order; --order) {
		Map::const_iterator next = entry;

		++next;

		if (map.end() == next || next->first != opt)
			return false;

		entry = next;
	}

	args = entry->second;

	return true;
}


void Options::strings(const Map & map, List & list) const {
	for (Map::const_iterator opt = map.begin(); opt != map.end(); ++opt)
		list.push_back(opt->first);
}


Options::Options(char * const argv[], int argc): m_last(nullptr) {
	int i;
	for (i = 1; i < argc; ++i) {
		const std::string arg(argv[i]);

		// Empty string is the current option argument, too
		// '-' alone is also an option argument
		if (arg.empty() || '-' != arg[0] || 1 == arg.size())
			addArg(arg);

		// Single-dashed option
		else if ('-' != arg[1])
			add(singleDash, arg.substr(1));

		// "--" alone is valid as it means that what follows
		// belongs to the binary
		else if (2 == arg.size())
			m_last = nullptr;

		// Double-dashed option
		else if ('-' != arg[2])
			add(doubleDash, arg.substr(2));

		// "---" prefix means an option argument
		else
			addArg(arg);
	}
}


/** nutmon command line options */
class NutmonOptions: public Options {
	private:

	/** Unknown options */
	List m_unknown;

	/** Option specification errors */
	std::list<std::string> m_errors;

	/** Arguments which belong to no option */
	Arguments m_targets;

	/** Long name of a single-dashed option, empty if unknown */
	static std::string longName(const std::string & opt);

	/** Flag option: arguments following it belong to the binary */
	void flag(const std::string & opt, const Arguments & args, bool & value);

	/** Option with one value */
	void value(const std::string & opt, const Arguments & args, std::string & value);

	/** Option with one positive number */
	void number(const std::string & opt, const Arguments & args, Settable<unsigned int> & value);

	/** Process one option occurrence */
	void process(const std::string & opt, const Arguments & args);

	public:

	/** Options are valid */
	bool valid;

	bool help;
	bool version;
	bool syslog;
	bool list;
	bool once;
	bool all;

	/** Debug level (-D count) */
	unsigned int debug;

	std::string config;
	std::string user;
	std::string password;

	Settable<unsigned int> interval;
	Settable<unsigned int> timeout;

	/** [<upsname>@]<host>[:<port>], if given */
	std::string target;

	/** Constructor */
	NutmonOptions(char * const argv[], int argc);

	/**
	 *  \brief  Report invalid options to STDERR
	 *
	 *  BEWARE: throws an exception if options are valid.
	 *  Check that using the \ref valid flag.
	 */
	void reportInvalid() const;

};  // end of class NutmonOptions


std::string NutmonOptions::longName(const std::string & opt) {
	static const char * names[][2] = {
		{ "h", "help" },
		{ "V", "version" },
		{ "D", "debug" },
		{ "s", "syslog" },
		{ "c", "config" },
		{ "u", "user" },
		{ "p", "password" },
		{ "i", "interval" },
		{ "t", "timeout" },
		{ "l", "list" },
		{ "1", "once" },
		{ "a", "all" },
	};

	for (size_t i = 0; i < sizeof(names) / sizeof(names[0]); ++i) {
		if (opt == names[i][0])
			return names[i][1];
	}

	return "";
}


void NutmonOptions::flag(const std::string & opt, const Arguments & args, bool & value) {
	if (value)
		m_errors.push_back("--" + opt + " option specified more than once");

	value = true;

	m_targets.insert(m_targets.end(), args.begin(), args.end());
}


void NutmonOptions::value(const std::string & opt, const Arguments & args, std::string & value) {
	if (!value.empty())
		m_errors.push_back("--" + opt + " option specified more than once");

	else if (args.empty())
		m_errors.push_back("--" + opt + " option requires an argument");

	else {
		value = args.front();

		m_targets.insert(m_targets.end(), ++args.begin(), args.end());
	}
}


void NutmonOptions::number(const std::string & opt, const Arguments & args, Settable<unsigned int> & value) {
	std::string str;

	this->value(opt, args, str);

	if (str.empty())
		return;

	Settable<unsigned int> num = parsePositiveNumber(str);

	if (!num.set())
		m_errors.push_back("--" + opt + " requires a positive number, got \"" + str + "\"");
	else
		value = num;
}


void NutmonOptions::process(const std::string & opt, const Arguments & args) {
	if ("help" == opt)
		flag(opt, args, help);
	else if ("version" == opt)
		flag(opt, args, version);
	else if ("debug" == opt) {
		// Repeatable
		++debug;

		m_targets.insert(m_targets.end(), args.begin(), args.end());
	}
	else if ("syslog" == opt)
		flag(opt, args, syslog);
	else if ("list" == opt)
		flag(opt, args, list);
	else if ("once" == opt)
		flag(opt, args, once);
	else if ("all" == opt)
		flag(opt, args, all);
	else if ("config" == opt)
		value(opt, args, config);
	else if ("user" == opt)
		value(opt, args, user);
	else if ("password" == opt)
		value(opt, args, password);
	else if ("interval" == opt)
		number(opt, args, interval);
	else if ("timeout" == opt)
		number(opt, args, timeout);
	else
		m_unknown.push_back("--" + opt);
}


NutmonOptions::NutmonOptions(char * const argv[], int argc):
	Options(argv, argc),
	valid(true),
	help(false),
	version(false),
	syslog(false),
	list(false),
	once(false),
	all(false),
	debug(0)
{
	std::map<std::string, size_t> order;

	// Single-dashed options
	List opts = stringsSingle();

	for (List::const_iterator opt = opts.begin(); opt != opts.end(); ++opt) {
		std::string name = longName(*opt);

		if (name.empty()) {
			m_unknown.push_back("-" + *opt);

			continue;
		}

		Arguments args;

		getSingle(*opt, args, order["-" + *opt]++);

		process(name, args);
	}

	// Double-dashed options
	opts = stringsDouble();

	for (List::const_iterator opt = opts.begin(); opt != opts.end(); ++opt) {
		Arguments args;

		getDouble(*opt, args, order["--" + *opt]++);

		process(*opt, args);
	}

	// Direct binary arguments come first
	m_targets.insert(m_targets.begin(), get().begin(), get().end());

	if (m_targets.size() > 1)
		m_errors.push_back("Only one <target> may be specified");
	else if (!m_targets.empty())
		target = m_targets.front();

	if (list && once)
		m_errors.push_back("--list and --once options can't both be specified");

	valid = m_unknown.empty() && m_errors.empty();
}


void NutmonOptions::reportInvalid() const {
	if (valid)
		throw std::logic_error("No invalid options to report");

	List::const_iterator unknown_opt = m_unknown.begin();

	for (; unknown_opt != m_unknown.end(); ++unknown_opt) {
		std::cerr << "Unknown option: " << *unknown_opt << std::endl;
	}

	std::list<std::string>::const_iterator error = m_errors.begin();

	for (; error != m_errors.end(); ++error) {
		std::cerr << "Option error: " << *error << std::endl;
	}
}


static void set_exit_flag(int sig)
{
	exit_flag = sig;
}


static void setup_signals(void)
{
	struct sigaction	sa;

	::memset(&sa, 0, sizeof(sa));
	sigemptyset(&sa.sa_mask);
	sa.sa_flags = 0;

	sa.sa_handler = SIG_IGN;
	sigaction(SIGPIPE, &sa, nullptr);

	sa.sa_handler = set_exit_flag;
	sigaction(SIGINT, &sa, nullptr);
	sigaction(SIGTERM, &sa, nullptr);
}


/**
 *  \brief  Print the device directory
 *
 *  \param  devices  Devices listed by upsd
 */
static void printDevices(const DeviceList & devices) {
	DeviceList::const_iterator dev = devices.begin();

	for (; dev != devices.end(); ++dev)
		std::cout << dev->name << ": " << dev->description << std::endl;
}


/**
 *  \brief  Print a snapshot
 *
 *  \param  snapshot  Device summaries
 *  \param  device    Device to show, empty for every device
 *  \param  all       Show the extra variables too
 */
static void printSnapshot(const PollSnapshot & snapshot, const std::string & device, bool all) {
	PollSnapshot::const_iterator summary = snapshot.begin();

	for (; summary != snapshot.end(); ++summary) {
		if (!device.empty() && device != summary->first)
			continue;

		if (device.empty())
			std::cout << "[" << summary->first << "]" << std::endl;

		std::vector<std::pair<std::string, std::string> > entries =
			summary->second.entries(all);

		for (size_t i = 0; i < entries.size(); ++i)
			std::cout << entries[i].first << ": " << entries[i].second << std::endl;

		std::cout << std::endl;
	}

	std::cout << std::flush;
}


/**
 *  \brief  Configuration file to read
 *
 *  \param  options  Options
 *
 *  \return File name, empty if there is none to read
 */
static std::string configFile(const NutmonOptions & options) {
	if (!options.config.empty())
		return options.config;

	const char * confpath = ::getenv("NUT_CONFPATH");

	return std::string(nullptr != confpath ? confpath : CONFPATH) + "/nutmon.conf";
}


/**
 *  \brief  Main routine (exceptions unsafe)
 *
 *  \param  argc  Argument count
 *  \param  argv  Arguments
 *
 *  \return Exit code
 */
static int mainx(int argc, char * const argv[]) {
	const char	*prog = xbasename(argv[0]);

	// Get options
	NutmonOptions options(argv, argc);

	if (options.help) {
		Usage::print(prog);

		return 0;
	}

	if (options.version) {
		Usage::printVersion(prog);

		return 0;
	}

	if (!options.valid) {
		options.reportInvalid();

		Usage::print(prog);

		return 1;
	}

	nut_debug_level = static_cast<int>(options.debug);

	if (options.syslog) {
		open_syslog(prog);
		syslogbit_set();
	}

	// Configuration file (only required if given explicitly)
	MonitorConfiguration config;

	std::string file = configFile(options);

	if (!config.parseFromFile(file) && !options.config.empty()) {
		upslogx(LOG_ERR, "Can't read configuration file %s", file.c_str());

		return 1;
	}

	if (config.debugMin.set() && *config.debugMin > nut_debug_level)
		nut_debug_level = *config.debugMin;

	ConnectionParameters params;
	std::string device = config.device.get("");

	params.host     = config.host.get(params.host);
	params.port     = config.port.get(params.port);
	params.username = config.username.get("");
	params.password = config.password.get("");

	if (config.pollFreq.set())
		params.pollInterval = *config.pollFreq;

	if (config.timeout.set())
		params.timeout = static_cast<time_t>(*config.timeout);

	// Command line overrides the file
	if (!options.target.empty()) {
		std::string hostspec = options.target;

		size_t at = hostspec.find('@');

		if (std::string::npos != at) {
			device   = hostspec.substr(0, at);
			hostspec = hostspec.substr(at + 1);
		}

		Settable<uint16_t> port;

		parseHostSpec(hostspec, params.host, port);

		params.port = port.get(DEFAULT_UPSD_PORT);
	}

	if (!options.user.empty())
		params.username = options.user;

	if (!options.password.empty())
		params.password = options.password;

	if (options.interval.set())
		params.pollInterval = *options.interval;

	if (options.timeout.set())
		params.timeout = static_cast<time_t>(*options.timeout);

	if (params.host.empty()) {
		upslogx(LOG_ERR, "No host to connect to");

		return 1;
	}

	setup_signals();

	ConnectionController controller;

	controller.connect(params);

	while (!exit_flag) {
		Event event;

		if (!controller.waitEvent(event, 250))
			continue;

		switch (event.type) {
			case Event::CONNECTED:
				upsdebugx(1, "Connected to %s:%u", params.host.c_str(), params.port);

				break;

			case Event::CONNECT_FAILED:
				upslogx(LOG_ERR, "Can't connect to %s:%u: %s",
					params.host.c_str(), params.port,
					controller.getLastError().c_str());

				return 1;

			case Event::DEVICES:
				if (options.list) {
					printDevices(event.devices);

					controller.disconnect();

					return 0;
				}

				if (!device.empty()) {
					bool known = false;

					for (size_t i = 0; i < event.devices.size(); ++i)
						known = known || event.devices[i].name == device;

					if (!known) {
						upslogx(LOG_ERR, "Unknown device %s on %s",
							device.c_str(), params.host.c_str());

						controller.disconnect();

						return 1;
					}
				}

				break;

			case Event::SNAPSHOT:
				printSnapshot(event.snapshot, device, options.all);

				if (options.once) {
					controller.disconnect();

					return 0;
				}

				break;

			case Event::FAILURE:
				std::cout << "[stopped: " << Event::errorKindName(event.error)
					<< "]" << std::endl;

				upslogx(LOG_ERR, "Polling %s stopped: %s",
					params.host.c_str(), controller.getLastError().c_str());

				controller.disconnect();

				return 1;
		}
	}

	upsdebugx(1, "Signal %d caught, exiting", static_cast<int>(exit_flag));

	controller.disconnect();

	return 0;
}


/**
 *  \brief  Main routine exception-safe wrapper
 *
 *  Exceptions should never leak...
 *
 *  \param  argc  Argument count
 *  \param  argv  Arguments
 */
int main(int argc, char * const argv[]) {
	try {
		return mainx(argc, argv);
	}
	catch (const std::exception & e) {
		std::cerr
			<< "Error: " << e.what() << std::endl;
	}
	catch (...) {
		std::cerr
			<< "INTERNAL ERROR: exception of unknown origin caught" << std::endl;
	}

	::exit(128);
}
