/*
    nutmonconf.cpp - nutmon.conf configuration file manipulation

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

#include "nutmonconf.hpp"
#include "common.h"

#include <ctype.h>
#include <string.h>
#include <strings.h>

#include <sstream>
#include <fstream>
#include <limits>


namespace nutmon {

/* Trivial implementations out of class declaration to avoid
 * error: 'ClassName' has no out-of-line virtual method definitions; its vtable
 *   will be emitted in every translation unit [-Werror,-Wweak-vtables]
 */
NutParser::~NutParser() {}

//
// Tool functions
//

/**
 * Parse a specified type from a string and set it as Settable if success.
 */
template <typename T>
Settable<T> StringToSettableNumber(const std::string & src)
{
	/* Streams wrap negative numbers into unsigned types */
	if(!std::numeric_limits<T>::is_signed && src.find('-') != std::string::npos)
		return Settable<T>();

	std::stringstream ss(src);
	T result;
	if(ss >> result && ss.eof())
	{
		return Settable<T>(result);
	}
	else
	{
		return Settable<T>();
	}
}

Settable<unsigned int> parsePositiveNumber(const std::string& str)
{
	Settable<unsigned int> num = StringToSettableNumber<unsigned int>(str);
	if(num.set() && *num == 0)
		num.clear();
	return num;
}

void parseHostSpec(const std::string& spec, std::string& host, Settable<uint16_t>& port)
{
	std::string portstr;

	if (!spec.empty() && spec[0] == '[') {
		/* [IPv6]:port */
		size_t end = spec.find(']');
		if (end == std::string::npos)
			throw std::invalid_argument("Unterminated bracket in host specification: " + spec);
		host = spec.substr(1, end - 1);
		if (end + 1 < spec.size()) {
			if (spec[end + 1] != ':')
				throw std::invalid_argument("Invalid host specification: " + spec);
			portstr = spec.substr(end + 2);
		}
	} else {
		size_t colon = spec.find(':');
		/* More than one colon: bare IPv6 address without port */
		if (colon != std::string::npos && spec.find(':', colon + 1) == std::string::npos) {
			host = spec.substr(0, colon);
			portstr = spec.substr(colon + 1);
		} else {
			host = spec;
		}
	}

	if (!portstr.empty()) {
		Settable<unsigned int> num = StringToSettableNumber<unsigned int>(portstr);
		if (!num.set() || *num == 0 || *num > 65535)
			throw std::invalid_argument("Invalid port in host specification: " + spec);
		port = static_cast<uint16_t>(*num);
	}
}


//
// NutParser
//

NutParser::NutParser(const char* buffer, unsigned int options) :
_options(options),
_buffer(buffer != nullptr ? buffer : ""),
_pos(0) {
}

NutParser::NutParser(const std::string& buffer, unsigned int options) :
_options(options),
_buffer(buffer),
_pos(0) {
}

char NutParser::get()
{
	if (_pos >= _buffer.size())
		return 0;
	else
		return _buffer[_pos++];
}

size_t NutParser::getPos()const
{
	return _pos;
}

void NutParser::setPos(size_t pos)
{
	_pos = pos;
}

void NutParser::pushPos()
{
	_stack.push_back(_pos);
}

size_t NutParser::popPos()
{
	size_t pos = _stack.back();
	_stack.pop_back();
	return pos;
}

void NutParser::rewind()
{
	_pos = popPos();
}

void NutParser::back()
{
	if (_pos > 0)
		--_pos;
}

/** Parse a string source for getting the next token, ignoring spaces.
 * \return Token type.
 */
NutParser::Token NutParser::parseToken()
{

	/** Lexical parsing machine state enumeration.*/
	typedef enum {
		LEXPARSING_STATE_DEFAULT,
		LEXPARSING_STATE_QUOTED_STRING,
		LEXPARSING_STATE_STRING,
		LEXPARSING_STATE_COMMENT
	} LEXPARSING_STATE_e;
	LEXPARSING_STATE_e state = LEXPARSING_STATE_DEFAULT;

	Token token;
	bool escaped = false;

	pushPos();

	for (char c = get(); c != 0 /*EOF*/; c = get()) {
		switch (state) {
			case LEXPARSING_STATE_DEFAULT: /* Wait for a non-space char */
			{
				if (c == ' ' || c == '\t') {
					/* Space : do nothing */
				} else if (c == '[') {
					token = Token(Token::TOKEN_BRACKET_OPEN, c);
					popPos();
					return token;
				} else if (c == ']') {
					token = Token(Token::TOKEN_BRACKET_CLOSE, c);
					popPos();
					return token;
				} else if (c == ':' && !hasOptions(OPTION_IGNORE_COLON)) {
					token = Token(Token::TOKEN_COLON, c);
					popPos();
					return token;
				} else if (c == '=') {
					token = Token(Token::TOKEN_EQUAL, c);
					popPos();
					return token;
				} else if (c == '\r' || c == '\n') {
					token = Token(Token::TOKEN_EOL, c);
					popPos();
					return token;
				} else if (c == '#') {
					token.type = Token::TOKEN_COMMENT;
					state = LEXPARSING_STATE_COMMENT;
				} else if (c == '"') {
					/* Begin of QUOTED STRING */
					token.type = Token::TOKEN_QUOTED_STRING;
					state = LEXPARSING_STATE_QUOTED_STRING;
				} else if (c == '\\') {
					/* Begin of STRING with escape */
					token.type = Token::TOKEN_STRING;
					state = LEXPARSING_STATE_STRING;
					escaped = true;
				} else if (isgraph(static_cast<unsigned char>(c))) {
					/* Begin of STRING */
					token.type = Token::TOKEN_STRING;
					state = LEXPARSING_STATE_STRING;
					token.str += c;
				} else {
					rewind();
					return Token(Token::TOKEN_UNKNOWN);
				}
				break;
			}
			case LEXPARSING_STATE_QUOTED_STRING:
			{
				if (escaped) {
					/* Only \" and \\ are escapes, keep anything else as is */
					if (c != '"' && c != '\\')
						token.str += '\\';
					token.str += c;
					escaped = false;
				} else if (c == '"') {
					popPos();
					return token;
				} else if (c == '\\') {
					escaped = true;
				} else if (c == '\r' || c == '\n') /* EOL */{
					/* Unterminated quoted string ends with the line */
					back();
					popPos();
					return token;
				} else {
					token.str += c;
				}
				break;
			}
			case LEXPARSING_STATE_STRING:
			{
				if (c == ' ' || c == '\t' || c == '"' || c == '#' || c == '[' || c == ']'
				||  (c == ':' && !hasOptions(OPTION_IGNORE_COLON))
				||  c == '='
				) {
					if (escaped) {
						escaped = false;
						token.str += c;
					} else {
						back();
						popPos();
						return token;
					}
				} else if (c == '\\') {
					if (escaped) {
						escaped = false;
						token.str += c;
					} else {
						escaped = true;
					}
				} else if (c == '\r' || c == '\n') /* EOL */{
					back();
					popPos();
					return token;
				} else if (isgraph(static_cast<unsigned char>(c))) {
					token.str += c;
				}
				/* Other control characters are dropped */
				break;
			}
			case LEXPARSING_STATE_COMMENT:
			{
				if (c == '\r' || c == '\n') {
					popPos();
					return token;
				} else {
					token.str += c;
				}
				break;
			}
			default:
				/* Must not occur. */
				break;
		}
	}
	popPos();
	return token;
}

std::list<NutParser::Token> NutParser::parseLine()
{
	std::list<NutParser::Token> res;

	while (true) {
		NutParser::Token token = parseToken();

		switch (token.type) {
			case Token::TOKEN_STRING:
			case Token::TOKEN_QUOTED_STRING:
			case Token::TOKEN_BRACKET_OPEN:
			case Token::TOKEN_BRACKET_CLOSE:
			case Token::TOKEN_EQUAL:
			case Token::TOKEN_COLON:
				res.push_back(token);
				break;
			case Token::TOKEN_COMMENT:
				res.push_back(token);
				// Should return (EOL)Token::TOKEN_COMMENT:
				return res;
			case Token::TOKEN_UNKNOWN:
			case Token::TOKEN_NONE:
			case Token::TOKEN_EOL:
			default:
				return res;
		}
	}
}


//
// NutConfigParser
//

NutConfigParser::NutConfigParser(const char* buffer, unsigned int options) :
NutParser(buffer, options)
{
}

NutConfigParser::NutConfigParser(const std::string& buffer, unsigned int options) :
NutParser(buffer, options)
{
}

void NutConfigParser::parseConfig()
{
	onParseBegin();

	enum ConfigParserState {
		CPS_DEFAULT,
		CPS_SECTION_OPENED,
		CPS_SECTION_HAVE_NAME,
		CPS_SECTION_CLOSED,
		CPS_DIRECTIVE_HAVE_NAME,
		CPS_DIRECTIVE_VALUES
	} state = CPS_DEFAULT;

	Token tok;
	std::string name;
	std::list<std::string> values;
	char sep = 0;

	while (1) {
		tok = parseToken();
		if (!tok)
			break;
		switch (state) {
			case CPS_DEFAULT:
				switch (tok.type) {
					case Token::TOKEN_COMMENT:
						onParseComment(tok.str);
						break;
					case Token::TOKEN_BRACKET_OPEN:
						state = CPS_SECTION_OPENED;
						break;
					case Token::TOKEN_STRING:
					case Token::TOKEN_QUOTED_STRING:
						name = tok.str;
						state = CPS_DIRECTIVE_HAVE_NAME;
						break;
					default:
						/* Stray token, skipped */
						break;
				}
				break;
			case CPS_SECTION_OPENED:
			case CPS_SECTION_HAVE_NAME:
			case CPS_SECTION_CLOSED:
				switch (tok.type) {
					case Token::TOKEN_STRING:
					case Token::TOKEN_QUOTED_STRING:
						if (state == CPS_SECTION_OPENED) {
							name = tok.str;
							state = CPS_SECTION_HAVE_NAME;
						}
						break;
					case Token::TOKEN_BRACKET_CLOSE:
						state = CPS_SECTION_CLOSED;
						break;
					case Token::TOKEN_COMMENT:
						/* Closing bracket may be missing */
						onParseSectionName(name, tok.str);
						name.clear();
						state = CPS_DEFAULT;
						break;
					case Token::TOKEN_EOL:
						onParseSectionName(name);
						name.clear();
						state = CPS_DEFAULT;
						break;
					default:
						break;
				}
				break;
			case CPS_DIRECTIVE_HAVE_NAME:
			case CPS_DIRECTIVE_VALUES:
				switch (tok.type) {
					case Token::TOKEN_COMMENT:
						onParseDirective(name, sep, values, tok.str);
						name.clear();
						values.clear();
						sep = 0;
						state = CPS_DEFAULT;
						break;
					case Token::TOKEN_EOL:
						onParseDirective(name, sep, values);
						name.clear();
						values.clear();
						sep = 0;
						state = CPS_DEFAULT;
						break;
					case Token::TOKEN_COLON:
					case Token::TOKEN_EQUAL:
						/* Only right after the directive name */
						if (state == CPS_DIRECTIVE_HAVE_NAME) {
							sep = tok.str[0];
							state = CPS_DIRECTIVE_VALUES;
						}
						break;
					case Token::TOKEN_STRING:
					case Token::TOKEN_QUOTED_STRING:
						values.push_back(tok.str);
						state = CPS_DIRECTIVE_VALUES;
						break;
					default:
						break;
				}
				break;
			default:
				break;
		}
	}

	switch(state)
	{
		case CPS_SECTION_OPENED:
		case CPS_SECTION_HAVE_NAME:
		case CPS_SECTION_CLOSED:
			onParseSectionName(name);
			break;
		case CPS_DIRECTIVE_HAVE_NAME:
		case CPS_DIRECTIVE_VALUES:
			onParseDirective(name, sep, values);
			break;
		case CPS_DEFAULT:
		default:
			break;
	}

	onParseEnd();
}


//
// MonitorConfiguration
//

MonitorConfiguration::MonitorConfiguration()
{
}

void MonitorConfiguration::parseFromString(const std::string& str)
{
	MonitorConfigParser parser(str);
	parser.parseMonitorConfig(this);
}

bool MonitorConfiguration::parseFromFile(const std::string& path)
{
	std::ifstream file(path.c_str());

	if (!file.is_open()) {
		upsdebug_with_errno(1, "Can't open %s", path.c_str());
		return false;
	}

	std::stringstream content;
	content << file.rdbuf();

	if (file.bad()) {
		upslog_with_errno(LOG_ERR, "Can't read %s", path.c_str());
		return false;
	}

	upsdebugx(2, "Parsing configuration file %s", path.c_str());
	parseFromString(content.str());
	return true;
}


//
// MonitorConfigParser
//

MonitorConfigParser::MonitorConfigParser(const char* buffer):
NutConfigParser(buffer, NutParser::OPTION_IGNORE_COLON),
_config(nullptr)
{
}

MonitorConfigParser::MonitorConfigParser(const std::string& buffer):
NutConfigParser(buffer, NutParser::OPTION_IGNORE_COLON),
_config(nullptr)
{
}

void MonitorConfigParser::parseMonitorConfig(MonitorConfiguration* config)
{
	if(config!=nullptr)
	{
		_config = config;
		NutConfigParser::parseConfig();
		_config = nullptr;
	}
}

void MonitorConfigParser::onParseBegin()
{
	// Do nothing
}

void MonitorConfigParser::onParseComment(const std::string& /*comment*/)
{
	// Comments are ignored
}

void MonitorConfigParser::onParseSectionName(const std::string& sectionName, const std::string& /*comment*/)
{
	// There are no sections in nutmon.conf
	upsdebugx(1, "nutmon.conf: ignoring section [%s]", sectionName.c_str());
}

void MonitorConfigParser::onParseDirective(const std::string& directiveName, char /*sep*/, const ConfigParamList& values, const std::string& /*comment*/)
{
	// NOTE: separators are always ignored

	if(!_config)
		return;

	if(values.empty())
	{
		upsdebugx(1, "nutmon.conf: directive %s has no value", directiveName.c_str());
		_config->unknownDirectives.push_back(directiveName);
		return;
	}

	const std::string& value = values.front();

	if(!(::strcasecmp(directiveName.c_str(), "DEBUG_MIN")))
	{
		// NOTE: DEBUG_MIN is accepted in any casing, like in other NUT configs
		_config->debugMin = StringToSettableNumber<int>(value);
	}
	else if(directiveName == "MONITOR")
	{
		// MONITOR [<upsname>@]<host>[:<port>] [<username> [<password>]]
		std::string host, hostspec = value;
		size_t at = hostspec.find('@');
		if(at != std::string::npos)
		{
			_config->device = hostspec.substr(0, at);
			hostspec = hostspec.substr(at + 1);
		}
		parseHostSpec(hostspec, host, _config->port);
		_config->host = host;

		ConfigParamList::const_iterator it = values.begin();
		if(++it != values.end())
		{
			_config->username = *it;
			if(++it != values.end())
				_config->password = *it;
		}
	}
	else if(directiveName == "HOST")
	{
		_config->host = value;
	}
	else if(directiveName == "PORT")
	{
		Settable<unsigned int> num = StringToSettableNumber<unsigned int>(value);
		if(!num.set() || *num == 0 || *num > 65535)
			throw std::invalid_argument("nutmon.conf: invalid PORT " + value);
		_config->port = static_cast<uint16_t>(*num);
	}
	else if(directiveName == "USERNAME")
	{
		_config->username = value;
	}
	else if(directiveName == "PASSWORD")
	{
		_config->password = value;
	}
	else if(directiveName == "DEVICE")
	{
		_config->device = value;
	}
	else if(directiveName == "POLLFREQ")
	{
		_config->pollFreq = parsePositiveNumber(value);
		if(!_config->pollFreq.set())
			throw std::invalid_argument("nutmon.conf: invalid POLLFREQ " + value);
	}
	else if(directiveName == "TIMEOUT")
	{
		_config->timeout = StringToSettableNumber<long>(value);
		/* Zero would fail every read at once, negative means no limit */
		if(!_config->timeout.set() || *_config->timeout == 0)
			throw std::invalid_argument("nutmon.conf: invalid TIMEOUT " + value);
	}
	else
	{
		upsdebugx(1, "nutmon.conf: ignoring unknown directive %s", directiveName.c_str());
		_config->unknownDirectives.push_back(directiveName);
	}
}

void MonitorConfigParser::onParseEnd()
{
	// Do nothing
}

} /* namespace nutmon */
