/*
    nutmonconf.hpp - nutmon.conf configuration file manipulation

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

#ifndef NUTMON_NUTMONCONF_H_SEEN
#define NUTMON_NUTMONCONF_H_SEEN 1

#include <stdint.h>

#include <string>
#include <list>
#include <vector>
#include <stdexcept>

#ifdef __cplusplus

namespace nutmon
{

/**
 * Helper to specify if a variable is set or not.
 * In addition of its value.
 */
template<typename Type>
class Settable
{
protected:
	Type _value;
	bool _set;
	std::string errMsg_ENOTSET()const {
		static const std::string msg =
			"Can not retrieve a Settable value of "
			"an instance that was not assigned yet "
			"(or was last known cleared)";
		return msg;
	}

public:
	Settable():_value(),_set(false){}
	Settable(const Settable<Type>& val):_value(val._value), _set(val._set){}
	Settable(const Type& val):_value(val), _set(true){}

	/* Avoid implicit copy/move operator declarations */
	Settable(Settable&&) = default;
	Settable& operator=(const Settable&) = default;
	Settable& operator=(Settable&&) = default;

	bool set()const{return _set;}
	void clear(){_set = false; _value = Type();}

	const Type& operator *()const
	{
		if (!set())
			throw std::invalid_argument(errMsg_ENOTSET());
		return _value;
	}
	Type& operator *()
	{
		if (!set())
			throw std::invalid_argument(errMsg_ENOTSET());
		return _value;
	}

	/** Value if set, \p dflt otherwise */
	const Type& get(const Type& dflt)const{return _set ? _value : dflt;}

	Settable<Type>& operator=(const Type& val){_value = val; _set = true; return *this;}

	bool operator==(const Settable<Type>& val)const
	{
		if(!set() && !val.set())
			return false;
		else
			return (set() && val.set() && _value==val._value);
	}

	bool operator==(const Type& val)const
	{
		if(!set())
			return false;
		return _value == val;
	}
};


/**
 * NUT config parser.
 * Lexical part: tokenizes one configuration line at a time.
 */
class NutParser
{
public:
	enum ParsingOption
	{
		OPTION_DEFAULT = 0,
		/** Colon character is considered as string character and not as specific token.
			Useful for IPv6 addresses */
		OPTION_IGNORE_COLON = 1
	};

	NutParser(const char* buffer = nullptr, unsigned int options = OPTION_DEFAULT);
	NutParser(const std::string& buffer, unsigned int options = OPTION_DEFAULT);

	virtual ~NutParser();

	/** Parsing configuration functions
	 * \{ */
	void setOptions(unsigned int options){_options = options;}
	unsigned int getOptions()const{return _options;}
	bool hasOptions(unsigned int options)const{return (_options&options) == options;}
	/** \} */

	struct Token
	{
		enum TokenType {
			TOKEN_UNKNOWN = -1,
			TOKEN_NONE    = 0,
			TOKEN_STRING  = 1,
			TOKEN_QUOTED_STRING,
			TOKEN_COMMENT,
			TOKEN_BRACKET_OPEN,
			TOKEN_BRACKET_CLOSE,
			TOKEN_EQUAL,
			TOKEN_COLON,
			TOKEN_EOL
		} type;
		std::string str;

		Token():type(TOKEN_NONE),str(){}
		Token(TokenType type_arg, const std::string& str_arg=""):type(type_arg),str(str_arg){}
		Token(TokenType type_arg, char c):type(type_arg),str(1, c){}
		Token(const Token& tok):type(tok.type),str(tok.str){}

		/* Avoid implicit copy/move operator declarations */
		Token(Token&&) = default;
		Token& operator=(const Token&) = default;
		Token& operator=(Token&&) = default;

		bool is(TokenType type_arg)const{return this->type==type_arg;}

		bool operator==(const Token& tok)const{return tok.type==type && tok.str==str;}

		operator bool()const{return type!=TOKEN_UNKNOWN && type!=TOKEN_NONE;}
	};

	/** Parsing functions
	* \{ */
	Token parseToken();
	std::list<Token> parseLine();
	/** \} */

protected:
	size_t getPos()const;
	void setPos(size_t pos);

	void pushPos();
	size_t popPos();
	void rewind();

	void back();

	char get();

private:
	unsigned int _options;

	std::string _buffer;
	size_t _pos;
	std::vector<size_t> _stack;
};


typedef std::list<std::string> ConfigParamList;

/**
 * Syntactic part: turns tokens into sections and directives,
 * reported to the subclass through the onParse* callbacks.
 */
class NutConfigParser : public NutParser
{
public:
	virtual void parseConfig();

protected:
	NutConfigParser(const char* buffer = nullptr, unsigned int options = OPTION_DEFAULT);
	NutConfigParser(const std::string& buffer, unsigned int options = OPTION_DEFAULT);

	virtual void onParseBegin()=0;
	virtual void onParseComment(const std::string& comment)=0;
	virtual void onParseSectionName(const std::string& sectionName, const std::string& comment = "")=0;
	virtual void onParseDirective(const std::string& directiveName, char sep = 0, const ConfigParamList& values = ConfigParamList(), const std::string& comment = "")=0;
	virtual void onParseEnd()=0;
};


/**
 * Content of nutmon.conf.
 * Every member stays unset unless the file provides it.
 */
class MonitorConfiguration
{
public:
	MonitorConfiguration();

	/** Parse configuration text (file content) */
	void parseFromString(const std::string& str);

	/**
	 * Read and parse a configuration file.
	 * \return false if the file can't be read.
	 */
	bool parseFromFile(const std::string& path);

	Settable<std::string>  host, username, password, device;
	Settable<uint16_t>     port;
	Settable<unsigned int> pollFreq;
	Settable<long>         timeout;
	Settable<int>          debugMin;

	/** Directives the parser did not understand, for diagnostics */
	std::list<std::string> unknownDirectives;
};


class MonitorConfigParser : public NutConfigParser
{
public:
	MonitorConfigParser(const char* buffer = nullptr);
	MonitorConfigParser(const std::string& buffer);

	void parseMonitorConfig(MonitorConfiguration* config);
protected:
	virtual void onParseBegin() override;
	virtual void onParseComment(const std::string& comment) override;
	virtual void onParseSectionName(const std::string& sectionName, const std::string& comment = "") override;
	virtual void onParseDirective(const std::string& directiveName, char sep = 0, const ConfigParamList& values = ConfigParamList(), const std::string& comment = "") override;
	virtual void onParseEnd() override;

	MonitorConfiguration* _config;
};


/**
 * Split a "host[:port]" specification; IPv6 addresses may be
 * given in brackets ("[::1]:3493").
 * \throw std::invalid_argument on a malformed port.
 */
void parseHostSpec(const std::string& spec, std::string& host, Settable<uint16_t>& port);

/** Strictly positive decimal that fits an unsigned int, unset otherwise */
Settable<unsigned int> parsePositiveNumber(const std::string& str);

} /* namespace nutmon */

#endif /* __cplusplus */
#endif	/* NUTMON_NUTMONCONF_H_SEEN */
