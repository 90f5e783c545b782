#ifndef SC_CONFIG_HPP
#define SC_CONFIG_HPP

#include <string>
#include <unordered_map>

// key=value settings, one per line. Lines starting with '#' are comments
class sc_config
{
	public:
		using data_t = std::unordered_map<std::string, std::string>;

	private:
		const char* m_id;
		data_t m_data;

	public:
		sc_config(const char* id);

		void parse(const std::string& config_string);

		const std::string& get(const std::string& key) const;
		std::string get_else(const std::string& key, const char* fallback) const;
		int get_int_else(const std::string& key, int fallback) const;

		      data_t& data()       { return m_data; }
		const data_t& data() const { return m_data; }
};

#endif // SC_CONFIG_HPP
