
#include "sc_config.hpp"

#include <algorithm>
#include <stdexcept>

#include <cerrno>
#include <climits>
#include <cstdlib>

sc_config::sc_config(const char* id)
	: m_id(id)
{ }

void sc_config::parse(const std::string& config_string)
{
	auto next_it = config_string.begin();

	while (next_it != config_string.end())
	{
		auto it = next_it;
		auto eol_it = std::find(it, config_string.end(), '\n');

		next_it = (eol_it == config_string.end()) ? eol_it : eol_it + 1;

		if (*it == '#')
			continue;

		auto eq_it = std::find(it, eol_it, '=');

		if (eq_it == eol_it)
			continue;

		// Tolerate files saved with CRLF line endings
		auto value_end = eol_it;

		if (value_end != eq_it + 1 && *(value_end - 1) == '\r')
			--value_end;

		m_data[std::string(it, eq_it)] = std::string(eq_it + 1, value_end);
	}
}

const std::string& sc_config::get(const std::string& key) const
{
	auto it = m_data.find(key);

	if (it != m_data.end())
		return it->second;
	else
		throw std::runtime_error(std::string(m_id) + " missing configuration value: " + key);
}

std::string sc_config::get_else(const std::string& key, const char* fallback) const
{
	auto it = m_data.find(key);

	if (it != m_data.end())
		return it->second;
	else
		return fallback;
}

int sc_config::get_int_else(const std::string& key, int fallback) const
{
	auto it = m_data.find(key);

	if (it == m_data.end())
		return fallback;

	const char* str = it->second.c_str();
	char* end = nullptr;

	errno = 0;
	long value = std::strtol(str, &end, 10);

	if (end == str || *end != '\0' || errno == ERANGE || value < INT_MIN || value > INT_MAX)
		throw std::runtime_error(std::string(m_id) + " configuration value " + key + " is not an integer: " + it->second);

	return static_cast<int>(value);
}

