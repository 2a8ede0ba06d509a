#ifndef CLI_PARSER_HPP
#define CLI_PARSER_HPP

#include <string>
#include <unordered_map>
#include <vector>

namespace sonicpx {

    // sonicpx <command> --key value --flag
    // A flag with no value reads as "true"; bare words are positionals.
    class CliParser {
    public:
        void parse(int argc, char** argv);
        bool has(const std::string& key) const;
        std::string get(const std::string& key, const std::string& def = "") const;
        // Throws std::invalid_argument if present but not an integer
        int getInt(const std::string& key, int def) const;
        const std::vector<std::string>& positionals() const { return positionals_; }
    private:
        std::unordered_map<std::string, std::string> kv_;
        std::vector<std::string> positionals_;
    };

}

#endif // CLI_PARSER_HPP
